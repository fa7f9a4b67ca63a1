#include "tcd_variable_resolver.h"
#include "tcd_derived_field.h"
#include "tcd_array_source.h"
#include "tcd_unit_system.h"
#include "tcd_coordinate_util.h"
#include "tcd_string_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <map>

namespace
{
enum { unknown_role = 0, lat_role, lon_role, vertical_role };

// --------------------------------------------------------------------------
int classify_dimension(const std::string &dim_name)
{
    std::string name = tcd_string_util::to_lower(dim_name);

    if (name.empty())
        return unknown_role;

    if (tcd_string_util::contains(name, "lat") || (name == "grid_yt") ||
        (name == "yh") || (name == "yq") || (name == "y"))
        return lat_role;

    if (tcd_string_util::contains(name, "lon") || (name == "grid_xt") ||
        (name == "xh") || (name == "xq") || (name == "x"))
        return lon_role;

    if (tcd_string_util::contains(name, "lev") ||
        tcd_string_util::contains(name, "isobaric") ||
        tcd_string_util::contains(name, "depth") ||
        (name == "pfull") || (name == "phalf") || (name == "plev") ||
        (name == "z") || (name == "z_l") || (name == "z_i") ||
        (name == "zl") || (name == "zi") || (name == "zt"))
        return vertical_role;

    return unknown_role;
}
}

// --------------------------------------------------------------------------
tcd_variable_resolver::tcd_variable_resolver(tcd_source_provider &srcs,
    const tcd_unit_system &us) : sources(srcs), units(us), verbose(0),
    latitude_variable("latitude"), longitude_variable("longitude"),
    lat_orientation(-1), z_orientation(-1)
{
}

// --------------------------------------------------------------------------
void tcd_variable_resolver::reset_orientation()
{
    this->lat_orientation = -1;
    this->z_orientation = -1;
    this->lat_orientation_source.clear();
    this->z_orientation_source.clear();
}

// --------------------------------------------------------------------------
int tcd_variable_resolver::assign_axes(const tcd_variable_spec &spec,
    tcd_geo_field &field)
{
    int n_dims = field.get_number_of_dimensions();

    std::vector<std::string> dim_names = field.get_dim_names();
    if (!spec.coords.empty())
    {
        if (int(spec.coords.size()) != n_dims)
        {
            TCD_ERROR("Variable \"" << spec.key << "\" names "
                << spec.coords.size() << " coords (" << spec.coords
                << ") but has " << n_dims << " dimensions")
            return tcd_error::config_error;
        }
        dim_names = spec.coords;
        field.set_dim_names(dim_names);
    }

    int lat_axis = tcd_geo_field::no_axis;
    int lon_axis = tcd_geo_field::no_axis;
    int z_axis = tcd_geo_field::no_axis;

    for (int i = 0; i < n_dims; ++i)
    {
        int role = classify_dimension(dim_names[i]);
        if ((role == lat_role) && (lat_axis == tcd_geo_field::no_axis))
            lat_axis = i;
        else if ((role == lon_role) && (lon_axis == tcd_geo_field::no_axis))
            lon_axis = i;
        else if ((role == vertical_role) && (z_axis == tcd_geo_field::no_axis))
            z_axis = i;
    }

    if (n_dims == 1)
    {
        // 1-D arrays are coordinates or vertical profiles
        if ((lat_axis == tcd_geo_field::no_axis) &&
            (lon_axis == tcd_geo_field::no_axis))
        {
            if (spec.key == this->latitude_variable)
                lat_axis = 0;
            else if (spec.key == this->longitude_variable)
                lon_axis = 0;
            else
                z_axis = 0;
        }
    }
    else if ((lat_axis == tcd_geo_field::no_axis) &&
        (lon_axis == tcd_geo_field::no_axis))
    {
        // positional
        lat_axis = n_dims - 2;
        lon_axis = n_dims - 1;
        if ((n_dims >= 3) && (z_axis == tcd_geo_field::no_axis))
            z_axis = n_dims - 3;
    }
    else if ((n_dims >= 3) && (z_axis == tcd_geo_field::no_axis) &&
        (lat_axis == n_dims - 2) && (lon_axis == n_dims - 1))
    {
        z_axis = n_dims - 3;
    }

    if (n_dims >= 2)
    {
        if ((lat_axis != n_dims - 2) || (lon_axis != n_dims - 1))
        {
            TCD_ERROR("Variable \"" << spec.key << "\" with dimensions ("
                << dim_names << ") must have latitude and longitude as its"
                " last two axes")
            return tcd_error::config_error;
        }

        if ((z_axis != tcd_geo_field::no_axis) && (z_axis > lat_axis))
        {
            TCD_ERROR("Variable \"" << spec.key << "\" with dimensions ("
                << dim_names << ") has its vertical axis after latitude")
            return tcd_error::config_error;
        }
    }

    field.set_lat_axis(lat_axis);
    field.set_lon_axis(lon_axis);
    field.set_vertical_axis(z_axis);

    return 0;
}

// --------------------------------------------------------------------------
int tcd_variable_resolver::check_orientation(const tcd_variable_spec &spec,
    const tcd_geo_field &field)
{
    if (field.get_lat_axis() != tcd_geo_field::no_axis)
    {
        if (this->lat_orientation < 0)
        {
            this->lat_orientation = spec.flip_lat;
            this->lat_orientation_source = spec.key;
        }
        else if (this->lat_orientation != spec.flip_lat)
        {
            TCD_ERROR("Variable \"" << spec.key << "\" sets flip_lat to "
                << spec.flip_lat << " but \"" << this->lat_orientation_source
                << "\" sets it to " << this->lat_orientation
                << ". All fields must share the same latitude orientation")
            return tcd_error::config_error;
        }
    }

    if (field.get_vertical_axis() != tcd_geo_field::no_axis)
    {
        if (this->z_orientation < 0)
        {
            this->z_orientation = spec.flip_z;
            this->z_orientation_source = spec.key;
        }
        else if (this->z_orientation != spec.flip_z)
        {
            TCD_ERROR("Variable \"" << spec.key << "\" sets flip_z to "
                << spec.flip_z << " but \"" << this->z_orientation_source
                << "\" sets it to " << this->z_orientation
                << ". All fields must share the same vertical orientation")
            return tcd_error::config_error;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_variable_resolver::read_levels(tcd_array_source &source,
    tcd_geo_field &field)
{
    int z_axis = field.get_vertical_axis();
    if (z_axis == tcd_geo_field::no_axis)
        return 0;

    const std::string &dim_name = field.get_dim_names()[z_axis];
    if (dim_name.empty() || (dim_name == field.get_name()) ||
        !source.has_variable(dim_name))
        return 0;

    int ierr = 0;
    p_tcd_geo_field levels;
    if ((ierr = source.read(dim_name, levels)))
    {
        TCD_ERROR("Failed to read the vertical coordinate \"" << dim_name
            << "\" from " << source.get_description())
        return ierr;
    }

    if (levels->size() == field.get_number_of_levels())
        field.set_levels(levels->get_values());

    return 0;
}

// --------------------------------------------------------------------------
int tcd_variable_resolver::resolve(const tcd_variable_spec &spec,
    p_tcd_geo_field &field)
{
    if (spec.ncfile.empty() || spec.ncvarname.empty())
    {
        TCD_ERROR("Variable \"" << spec.key << "\" is not read from a file")
        return tcd_error::config_error;
    }

    if (!this->units.is_known(spec.units))
    {
        TCD_ERROR("Variable \"" << spec.key << "\" declares unrecognized"
            " units \"" << spec.units << "\"")
        return tcd_error::unit_error;
    }

    int ierr = 0;
    p_tcd_array_source source;
    if ((ierr = this->sources.get_source(spec.ncfile, source)))
    {
        TCD_ERROR("Failed to open \"" << spec.ncfile << "\" for variable \""
            << spec.key << "\"")
        return ierr;
    }

    if ((ierr = source->read(spec.ncvarname, field)))
    {
        TCD_ERROR("Failed to read \"" << spec.ncvarname << "\" for variable \""
            << spec.key << "\" from " << source->get_description())
        return ierr;
    }

    // mark all missing values with the default fill value
    double fill_value = tcd_array_attributes::default_fill_value();
    unsigned long n = field->size();
    double *p_field = field->data();
    for (unsigned long i = 0; i < n; ++i)
    {
        if (field->is_missing(p_field[i]))
            p_field[i] = fill_value;
    }

    field->set_name(spec.key);
    field->set_attributes(tcd_array_attributes(spec.units, spec.name,
        spec.description, 1, fill_value));

    field->scale(spec.scale_mult, spec.scale_add);

    if (spec.squeeze && field->squeeze(spec.squeeze_axis))
    {
        TCD_ERROR("Variable \"" << spec.key << "\" with shape ["
            << field->get_shape() << "] can't be squeezed along axis "
            << spec.squeeze_axis)
        return tcd_error::config_error;
    }

    if ((ierr = this->assign_axes(spec, *field)) ||
        (ierr = this->check_orientation(spec, *field)) ||
        (ierr = this->read_levels(*source, *field)))
        return ierr;

    if (spec.flip_lat && (field->get_lat_axis() != tcd_geo_field::no_axis))
        field->flip(field->get_lat_axis());

    if (spec.flip_z && (field->get_vertical_axis() != tcd_geo_field::no_axis))
        field->flip(field->get_vertical_axis());

    if (this->verbose)
    {
        TCD_STATUS("Resolved " << *field)
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_variable_resolver::resolve_all(const std::vector<tcd_variable_spec> &specs,
    tcd_field_collection &fields)
{
    this->reset_orientation();

    int ierr_all = 0;
    auto record_error = [&](const std::string &key, int code)
    {
        fields.set_error(key, code);
        if (!ierr_all)
            ierr_all = code;
    };

    // split the specs. derived specs that also name an array get a file
    // sourced companion that feeds their method's first input
    const tcd_variable_spec *lat_spec = nullptr;
    const tcd_variable_spec *lon_spec = nullptr;
    std::vector<tcd_variable_spec> file_specs;
    std::vector<tcd_variable_spec> derived_specs;

    for (const tcd_variable_spec &spec : specs)
    {
        if (spec.is_derived())
        {
            tcd_variable_spec derived = spec;

            if (!spec.ncfile.empty() && !spec.ncvarname.empty())
            {
                tcd_variable_spec companion = spec;
                companion.key = spec.key + "_source";
                companion.source = tcd_variable_spec::file_source;
                companion.method.clear();
                companion.inputs.clear();

                int ierr = 0;
                if ((ierr = tcd_derived_field::get_inputs(spec, derived.inputs)))
                {
                    record_error(spec.key, ierr);
                    continue;
                }
                derived.inputs[0] = companion.key;

                file_specs.push_back(companion);
            }

            derived_specs.push_back(derived);
        }
        else if (spec.key == this->latitude_variable)
        {
            lat_spec = &spec;
        }
        else if (spec.key == this->longitude_variable)
        {
            lon_spec = &spec;
        }
        else
        {
            file_specs.push_back(spec);
        }
    }

    // coordinates
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    if (lat_spec && lon_spec)
    {
        int ierr = 0;
        int lat_ierr = this->resolve(*lat_spec, lat);
        int lon_ierr = this->resolve(*lon_spec, lon);

        if (!lat_ierr && !lon_ierr &&
            ((ierr = this->units.convert(*lat, "degrees")) ||
            (ierr = this->units.convert(*lon, "degrees")) ||
            (ierr = tcd_coordinate_util::broadcast_coordinates(lat, lon) ?
                tcd_error::config_error : 0)))
        {
            TCD_ERROR("Failed to set up the coordinates")
            lat_ierr = ierr;
            lon_ierr = ierr;
        }

        if (lat_ierr || lon_ierr)
        {
            record_error(lat_spec->key, lat_ierr ? lat_ierr : lon_ierr);
            record_error(lon_spec->key, lon_ierr ? lon_ierr : lat_ierr);
            lat = nullptr;
            lon = nullptr;
        }
        else
        {
            fields.set(lat_spec->key, lat);
            fields.set(lon_spec->key, lon);
        }
    }
    else if (lat_spec || lon_spec)
    {
        TCD_ERROR("Both \"" << this->latitude_variable << "\" and \""
            << this->longitude_variable << "\" must be provided")
        record_error(lat_spec ? lat_spec->key : lon_spec->key,
            tcd_error::config_error);
    }

    // attach the coordinates to fields on the same horizontal grid
    auto attach_coordinates = [&](const std::string &key,
        const p_tcd_geo_field &field) -> int
    {
        if (!lat || (field->get_lat_axis() == tcd_geo_field::no_axis) ||
            (field->get_lon_axis() == tcd_geo_field::no_axis))
            return 0;

        if (!field->same_horizontal_grid(*lat))
        {
            TCD_ERROR("Variable \"" << key << "\" with shape ["
                << field->get_shape() << "] is not on the "
                << lat->get_number_of_lat() << " x " << lat->get_number_of_lon()
                << " coordinate grid")
            return tcd_error::config_error;
        }

        field->set_coordinates(lat, lon);
        return 0;
    };

    // file sourced
    for (const tcd_variable_spec &spec : file_specs)
    {
        int ierr = 0;
        p_tcd_geo_field field;
        if ((ierr = this->resolve(spec, field)) ||
            (ierr = attach_coordinates(spec.key, field)))
        {
            record_error(spec.key, ierr);
            continue;
        }
        fields.set(spec.key, field);
    }

    // derived
    std::vector<unsigned long> order;
    std::map<std::string, int> failed;
    tcd_derived_field::sort(derived_specs, fields, order, failed);

    for (const auto &f : failed)
        record_error(f.first, f.second);

    for (unsigned long i : order)
    {
        const tcd_variable_spec &spec = derived_specs[i];

        int ierr = 0;
        p_tcd_geo_field field;
        if ((ierr = tcd_derived_field::evaluate(spec, fields, this->units, field)) ||
            (ierr = attach_coordinates(spec.key, field)))
        {
            record_error(spec.key, ierr);
            continue;
        }

        if (this->verbose)
        {
            TCD_STATUS("Derived " << *field)
        }

        fields.set(spec.key, field);
    }

    return ierr_all;
}
