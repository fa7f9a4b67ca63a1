#include "tcd_derived_field.h"
#include "tcd_derived_field_numerics.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <deque>
#include <set>

namespace
{
using field_vector = std::vector<const_p_tcd_geo_field>;
using method_function = int (*)(const field_vector &, p_tcd_geo_field &);

// --------------------------------------------------------------------------
int check_layered(const tcd_geo_field &f)
{
    if ((f.get_number_of_dimensions() == 3) && (f.get_vertical_axis() == 0) &&
        (f.get_lat_axis() == 1) && (f.get_lon_axis() == 2))
        return 0;

    TCD_ERROR("\"" << f.get_name() << "\" with shape [" << f.get_shape()
        << "] is not laid out [level, lat, lon]")
    return tcd_error::config_error;
}

// --------------------------------------------------------------------------
int check_horizontal(const tcd_geo_field &f, const tcd_geo_field &other)
{
    if (f.same_horizontal_grid(other))
        return 0;

    TCD_ERROR("\"" << f.get_name() << "\" [" << f.get_shape() << "] and \""
        << other.get_name() << "\" [" << other.get_shape()
        << "] are not on the same horizontal grid")
    return tcd_error::config_error;
}

// --------------------------------------------------------------------------
int compute_pressure_from_thickness(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &dp = *in[0];
    const tcd_geo_field &psfc = *in[1];

    int ierr = 0;
    if ((ierr = check_layered(dp)) || (ierr = check_horizontal(dp, psfc)))
        return ierr;

    if (psfc.size() != dp.get_horizontal_size())
    {
        TCD_ERROR("Surface pressure must be a 2-D field")
        return tcd_error::config_error;
    }

    out = tcd_geo_field::New("pressure", dp);

    tcd_derived_field_numerics::pressure_from_thickness(
        dp.get_number_of_levels(), dp.get_horizontal_size(), dp.data(),
        psfc.data(), [&dp](double v) { return dp.is_missing(v); },
        out->get_fill_value(), out->data());

    return 0;
}

// --------------------------------------------------------------------------
int compute_height_from_pressure(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &p = *in[0];

    out = tcd_geo_field::New("height", p);

    tcd_derived_field_numerics::height_from_pressure(p.size(), p.data(),
        [&p](double v) { return p.is_missing(v); }, out->get_fill_value(),
        out->data());

    return 0;
}

// --------------------------------------------------------------------------
int compute_pressure_to_sealevel(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &psfc = *in[0];
    const tcd_geo_field &zsfc = *in[1];
    const tcd_geo_field &t = *in[2];
    const tcd_geo_field &q = *in[3];

    unsigned long n = psfc.get_horizontal_size();

    int ierr = 0;
    if ((ierr = check_horizontal(psfc, zsfc)) ||
        (ierr = check_horizontal(psfc, t)) ||
        (ierr = check_horizontal(psfc, q)))
        return ierr;

    if ((psfc.size() != n) || (zsfc.size() != n))
    {
        TCD_ERROR("Surface pressure and surface height must be 2-D fields")
        return tcd_error::config_error;
    }

    out = tcd_geo_field::New("pslp", psfc);

    // level 0 of 3-D fields is the surface
    tcd_derived_field_numerics::pressure_to_sealevel(n, psfc.data(),
        zsfc.data(), t.data(), q.data(),
        [&psfc](double v) { return psfc.is_missing(v); },
        out->get_fill_value(), out->data());

    return 0;
}

// --------------------------------------------------------------------------
int compute_spfh_to_mxrt(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &q = *in[0];

    out = tcd_geo_field::New("mxrt", q);

    tcd_derived_field_numerics::spfh_to_mxrt(q.size(), q.data(),
        [&q](double v) { return q.is_missing(v); }, out->get_fill_value(),
        out->data());

    return 0;
}

// --------------------------------------------------------------------------
int compute_wind_speed(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &u = *in[0];
    const tcd_geo_field &v = *in[1];

    if (u.get_shape() != v.get_shape())
    {
        TCD_ERROR("Wind components have different shapes [" << u.get_shape()
            << "] and [" << v.get_shape() << "]")
        return tcd_error::config_error;
    }

    out = tcd_geo_field::New("wspd", u);

    tcd_derived_field_numerics::wind_speed(u.size(), u.data(), v.data(),
        [&u](double x) { return u.is_missing(x); }, out->get_fill_value(),
        out->data());

    return 0;
}

// --------------------------------------------------------------------------
int broadcast_depth(const tcd_geo_field &depth, const tcd_geo_field &lat,
    p_tcd_geo_field &out)
{
    if (depth.get_number_of_dimensions() == 3)
    {
        int ierr = 0;
        if ((ierr = check_layered(depth)) || (ierr = check_horizontal(depth, lat)))
            return ierr;

        out = depth.new_copy();
        return 0;
    }

    if ((depth.get_number_of_dimensions() != 1) ||
        (lat.get_number_of_dimensions() != 2))
    {
        TCD_ERROR("Can't broadcast depth [" << depth.get_shape()
            << "] onto latitude [" << lat.get_shape() << "]")
        return tcd_error::config_error;
    }

    unsigned long n_lev = depth.size();
    unsigned long n_lat = lat.get_shape()[0];
    unsigned long n_lon = lat.get_shape()[1];
    unsigned long n_horiz = n_lat*n_lon;

    out = tcd_geo_field::New("depth", {n_lev, n_lat, n_lon});

    std::vector<std::string> dim_names = lat.get_dim_names();
    dim_names.insert(dim_names.begin(), depth.get_dim_names()[0]);
    out->set_dim_names(dim_names);
    out->set_levels(depth.get_values());
    out->set_coordinates(lat.get_latitude(), lat.get_longitude());

    const double *p_depth = depth.data();
    double *p_out = out->data();
    for (unsigned long k = 0; k < n_lev; ++k)
    {
        double d = depth.is_missing(p_depth[k]) ?
            out->get_fill_value() : p_depth[k];

        double *p_out_k = p_out + k*n_horiz;
        for (unsigned long i = 0; i < n_horiz; ++i)
            p_out_k[i] = d;
    }

    return 0;
}

// --------------------------------------------------------------------------
int compute_depth_from_profile(const field_vector &in, p_tcd_geo_field &out)
{
    return broadcast_depth(*in[0], *in[1], out);
}

// --------------------------------------------------------------------------
int compute_seawater_pressure(const field_vector &in, p_tcd_geo_field &out)
{
    const tcd_geo_field &lat = *in[1];

    int ierr = 0;
    p_tcd_geo_field depth;
    if ((ierr = broadcast_depth(*in[0], lat, depth)))
        return ierr;

    if (lat.size() != depth->get_horizontal_size())
    {
        TCD_ERROR("Latitude must be a 2-D field")
        return tcd_error::config_error;
    }

    out = tcd_geo_field::New("pres", *depth);

    unsigned long n_lev = depth->get_number_of_levels();
    unsigned long n_horiz = depth->get_horizontal_size();

    const double *p_depth = depth->data();
    const double *p_lat = lat.data();
    double *p_out = out->data();

    for (unsigned long k = 0; k < n_lev; ++k)
    {
        for (unsigned long i = 0; i < n_horiz; ++i)
        {
            unsigned long q = k*n_horiz + i;
            p_out[q] = (depth->is_missing(p_depth[q]) || lat.is_missing(p_lat[i])) ?
                out->get_fill_value() :
                tcd_derived_field_numerics::seawater_pressure(p_depth[q], p_lat[i]);
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
struct method_t
{
    const char *name;
    std::vector<std::string> inputs;
    std::vector<std::string> input_units;
    const char *output_units;
    method_function function;
};

// --------------------------------------------------------------------------
const std::vector<method_t> &get_methods()
{
    static const std::vector<method_t> methods = {
        {"pressure_from_thickness", {"pressure_thickness", "surface_pressure"},
            {"Pa", "Pa"}, "Pa", compute_pressure_from_thickness},
        {"height_from_pressure", {"pressure"}, {"Pa"}, "m",
            compute_height_from_pressure},
        {"pressure_to_sealevel", {"surface_pressure", "surface_height",
            "temperature", "specific_humidity"}, {"Pa", "m", "K", "kg/kg"},
            "Pa", compute_pressure_to_sealevel},
        {"spfh_to_mxrt", {"specific_humidity"}, {"kg/kg"}, "kg/kg",
            compute_spfh_to_mxrt},
        {"wind_speed", {"uwind", "vwind"}, {"m/s", "m/s"}, "m/s",
            compute_wind_speed},
        {"depth_from_profile", {"depth_profile", "latitude"}, {"m", "degrees"},
            "m", compute_depth_from_profile},
        {"seawater_pressure", {"depth", "latitude"}, {"m", "degrees"}, "Pa",
            compute_seawater_pressure}
    };
    return methods;
}
}

namespace tcd_derived_field
{
// --------------------------------------------------------------------------
int get_method(const std::string &name, int &method)
{
    // alternate names found in existing configurations
    std::string canonical_name = name;
    if (name == "seawater_from_depth")
        canonical_name = "seawater_pressure";

    const std::vector<method_t> &methods = get_methods();
    int n = methods.size();
    for (int i = 0; i < n; ++i)
    {
        if (canonical_name == methods[i].name)
        {
            method = i;
            return 0;
        }
    }

    TCD_ERROR("No derived field method named \"" << name << "\"")
    return tcd_error::config_error;
}

// --------------------------------------------------------------------------
const char *get_method_name(int method)
{
    if ((method < 0) || (method >= number_of_methods))
        return "unknown";
    return get_methods()[method].name;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &get_default_inputs(int method)
{
    return get_methods()[method].inputs;
}

// --------------------------------------------------------------------------
const std::vector<std::string> &get_input_units(int method)
{
    return get_methods()[method].input_units;
}

// --------------------------------------------------------------------------
const char *get_output_units(int method)
{
    return get_methods()[method].output_units;
}

// --------------------------------------------------------------------------
int get_inputs(const tcd_variable_spec &spec, std::vector<std::string> &inputs)
{
    int method = 0;
    int ierr = 0;
    if ((ierr = get_method(spec.method, method)))
    {
        TCD_ERROR("Derived variable \"" << spec.key << "\" is invalid")
        return ierr;
    }

    const std::vector<std::string> &defaults = get_default_inputs(method);

    if (spec.inputs.empty())
    {
        inputs = defaults;
        return 0;
    }

    if (spec.inputs.size() != defaults.size())
    {
        TCD_ERROR("Derived variable \"" << spec.key << "\" names "
            << spec.inputs.size() << " inputs but " << spec.method
            << " requires " << defaults.size() << " (" << defaults << ")")
        return tcd_error::config_error;
    }

    inputs = spec.inputs;
    return 0;
}

// --------------------------------------------------------------------------
int sort(const std::vector<tcd_variable_spec> &specs,
    const tcd_field_collection &resolved, std::vector<unsigned long> &order,
    std::map<std::string, int> &failed)
{
    order.clear();

    unsigned long n_specs = specs.size();

    std::map<std::string, unsigned long> spec_id;
    for (unsigned long i = 0; i < n_specs; ++i)
        spec_id[specs[i].key] = i;

    // build the graph. an edge j -> i means spec i consumes spec j.
    std::vector<std::vector<unsigned long>> consumers(n_specs);
    std::vector<unsigned long> in_degree(n_specs, 0);
    std::vector<int> status(n_specs, 0);

    for (unsigned long i = 0; i < n_specs; ++i)
    {
        std::vector<std::string> inputs;
        int ierr = 0;
        if ((ierr = get_inputs(specs[i], inputs)))
        {
            status[i] = ierr;
            continue;
        }

        for (const std::string &input : inputs)
        {
            if (resolved.has(input))
                continue;

            auto it = spec_id.find(input);
            if (it != spec_id.end())
            {
                consumers[it->second].push_back(i);
                ++in_degree[i];
                continue;
            }

            if (resolved.has_error(input))
            {
                TCD_ERROR("Derived variable \"" << specs[i].key
                    << "\" can't be computed because its input \"" << input
                    << "\" failed with "
                    << tcd_error::get_name(resolved.get_error(input)))
            }
            else
            {
                TCD_ERROR("Derived variable \"" << specs[i].key
                    << "\" depends on \"" << input
                    << "\" which is never resolved")
            }

            status[i] = tcd_error::dependency_error;
        }
    }

    // Kahn's algorithm. failures propagate to consumers as they are popped.
    std::deque<unsigned long> ready;
    for (unsigned long i = 0; i < n_specs; ++i)
    {
        if (in_degree[i] == 0)
            ready.push_back(i);
    }

    std::vector<int> done(n_specs, 0);
    while (!ready.empty())
    {
        unsigned long j = ready.front();
        ready.pop_front();
        done[j] = 1;

        if (status[j] == 0)
            order.push_back(j);

        for (unsigned long i : consumers[j])
        {
            if (status[j] && !status[i])
            {
                TCD_ERROR("Derived variable \"" << specs[i].key
                    << "\" can't be computed because its input \""
                    << specs[j].key << "\" failed")
                status[i] = tcd_error::dependency_error;
            }

            if (--in_degree[i] == 0)
                ready.push_back(i);
        }
    }

    // what remains is in or downstream of a cycle
    std::vector<std::string> cycle;
    for (unsigned long i = 0; i < n_specs; ++i)
    {
        if (!done[i])
            cycle.push_back(specs[i].key);
    }

    if (!cycle.empty())
    {
        TCD_ERROR("Derived variables have a cyclic dependency among "
            << cycle)

        for (unsigned long i = 0; i < n_specs; ++i)
        {
            if (!done[i])
                status[i] = tcd_error::dependency_error;
        }
    }

    int ierr = 0;
    for (unsigned long i = 0; i < n_specs; ++i)
    {
        if (status[i])
        {
            failed[specs[i].key] = status[i];
            ierr = tcd_error::dependency_error;
        }
    }

    return ierr;
}

// --------------------------------------------------------------------------
int evaluate(const tcd_variable_spec &spec, const tcd_field_collection &resolved,
    const tcd_unit_system &units, p_tcd_geo_field &field)
{
    int ierr = 0;
    int method = 0;
    std::vector<std::string> inputs;
    if ((ierr = get_method(spec.method, method)) ||
        (ierr = get_inputs(spec, inputs)))
    {
        TCD_ERROR("Failed to evaluate \"" << spec.key << "\"")
        return ierr;
    }

    if (!units.is_known(spec.units))
    {
        TCD_ERROR("Derived variable \"" << spec.key
            << "\" declares unrecognized units \"" << spec.units << "\"")
        return tcd_error::unit_error;
    }

    // gather the inputs in the units of the method's contract
    const std::vector<std::string> &input_units = get_input_units(method);

    field_vector in_fields;
    unsigned long n_inputs = inputs.size();
    for (unsigned long i = 0; i < n_inputs; ++i)
    {
        const_p_tcd_geo_field in_field = resolved.get(inputs[i]);
        if (!in_field)
        {
            TCD_ERROR("Derived variable \"" << spec.key << "\" depends on \""
                << inputs[i] << "\" which has not been resolved")
            return tcd_error::dependency_error;
        }

        if (in_field->get_units() != input_units[i])
        {
            p_tcd_geo_field tmp = in_field->new_copy();
            if ((ierr = units.convert(*tmp, input_units[i])))
            {
                TCD_ERROR(<< spec.method << " requires \"" << inputs[i]
                    << "\" in " << input_units[i])
                return ierr;
            }
            in_field = tmp;
        }

        in_fields.push_back(in_field);
    }

    if ((ierr = get_methods()[method].function(in_fields, field)))
    {
        TCD_ERROR("Failed to compute \"" << spec.key << "\" with "
            << spec.method)
        return ierr;
    }

    field->set_name(spec.key);
    field->set_units(get_output_units(method));

    tcd_array_attributes atts = field->get_attributes();
    atts.long_name = spec.name;
    atts.description = spec.description;
    field->set_attributes(atts);

    if ((ierr = units.convert(*field, spec.units)))
    {
        TCD_ERROR("Can't express \"" << spec.key << "\" in " << spec.units)
        return ierr;
    }

    return 0;
}
}
