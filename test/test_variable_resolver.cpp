#include "tcd_variable_resolver.h"
#include "tcd_variable_spec.h"
#include "tcd_array_source.h"
#include "tcd_field_collection.h"
#include "tcd_unit_system.h"
#include "tcd_array_attributes.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <string>
#include <vector>

namespace
{
// make an array as a file would hold it
p_tcd_geo_field make_array(const std::string &name,
    const std::vector<unsigned long> &shape,
    const std::vector<std::string> &dims, double fill_value)
{
    p_tcd_geo_field f = tcd_geo_field::New(name, shape);
    f->set_dim_names(dims);
    f->set_attributes(tcd_array_attributes("", name, "", 1, fill_value));
    return f;
}

tcd_variable_spec file_spec(const std::string &key,
    const std::string &var_name, const std::string &units, int flip)
{
    tcd_variable_spec spec;
    spec.key = key;
    spec.name = key;
    spec.ncfile = "analysis.nc";
    spec.ncvarname = var_name;
    spec.units = units;
    spec.flip_lat = flip;
    spec.flip_z = flip;
    return spec;
}

tcd_variable_spec derived_spec(const std::string &key,
    const std::string &method, const std::vector<std::string> &inputs,
    const std::string &units)
{
    tcd_variable_spec spec;
    spec.key = key;
    spec.name = key;
    spec.source = tcd_variable_spec::derived_source;
    spec.method = method;
    spec.inputs = inputs;
    spec.units = units;
    return spec;
}
}

int main(int, char **)
{
    // a 2 level, 3 x 4 grid stored north to south and top down
    unsigned long n_lev = 2;
    unsigned long n_lat = 3;
    unsigned long n_lon = 4;
    double src_fill = -999.0;

    p_tcd_geo_field lat = make_array("lat", {n_lat}, {"lat"}, src_fill);
    p_tcd_geo_field lon = make_array("lon", {n_lon}, {"lon"}, src_fill);
    for (unsigned long j = 0; j < n_lat; ++j)
        (*lat)[j] = 10.0 - 10.0*j;
    for (unsigned long i = 0; i < n_lon; ++i)
        (*lon)[i] = 10.0*i;

    std::vector<std::string> dims = {"pfull", "grid_yt", "grid_xt"};
    p_tcd_geo_field u = make_array("ugrd", {n_lev, n_lat, n_lon}, dims, src_fill);
    p_tcd_geo_field v = make_array("vgrd", {n_lev, n_lat, n_lon}, dims, src_fill);
    for (unsigned long k = 0; k < n_lev; ++k)
    {
        for (unsigned long j = 0; j < n_lat; ++j)
        {
            for (unsigned long i = 0; i < n_lon; ++i)
            {
                unsigned long q = (k*n_lat + j)*n_lon + i;
                (*u)[q] = 100.0*k + 10.0*j + i;
                (*v)[q] = 1.0;
            }
        }
    }
    (*u)[0] = src_fill;

    p_tcd_memory_array_source src = tcd_memory_array_source::New("analysis");
    src->add_variable(lat);
    src->add_variable(lon);
    src->add_variable(u);
    src->add_variable(v);
    src->add_variable("tmp", u);

    tcd_source_provider sources;
    sources.add_source("analysis.nc", src);

    tcd_unit_system units;

    std::vector<tcd_variable_spec> specs;
    specs.push_back(file_spec("latitude", "lat", "degrees", 1));
    specs.push_back(file_spec("longitude", "lon", "degrees", 1));

    tcd_variable_spec uwind = file_spec("uwind", "ugrd", "m/s", 1);
    uwind.scale_mult = 2.0;
    specs.push_back(uwind);

    specs.push_back(file_spec("vwind", "vgrd", "m/s", 1));

    // disagrees with the others on orientation
    specs.push_back(file_spec("temperature", "tmp", "K", 0));

    // not in the file
    specs.push_back(file_spec("specific_humidity", "spfh", "kg/kg", 1));

    // unrecognized units
    specs.push_back(file_spec("height", "vgrd", "furlongs", 1));

    specs.push_back(derived_spec("wspd", "wind_speed", {"uwind", "vwind"}, "m/s"));
    specs.push_back(derived_spec("mxrt", "spfh_to_mxrt", {"specific_humidity"}, "g/kg"));

    tcd_variable_resolver resolver(sources, units);
    tcd_field_collection fields;
    if (!resolver.resolve_all(specs, fields))
    {
        TCD_ERROR("Resolution should have reported the failed variables")
        return -1;
    }

    // the failures
    struct expected_t { const char *key; int code; };
    for (const expected_t &e : {
        expected_t{"temperature", tcd_error::config_error},
        expected_t{"specific_humidity", tcd_error::missing_variable_error},
        expected_t{"height", tcd_error::unit_error},
        expected_t{"mxrt", tcd_error::dependency_error}})
    {
        if (fields.has(e.key) || !fields.has_error(e.key) ||
            (fields.get_error(e.key) != e.code))
        {
            TCD_ERROR("\"" << e.key << "\" should have failed with "
                << tcd_error::get_name(e.code))
            return -1;
        }
    }

    // the successes
    for (const char *key : {"latitude", "longitude", "uwind", "vwind", "wspd"})
    {
        if (!fields.has(key))
        {
            TCD_ERROR("\"" << key << "\" was not resolved")
            return -1;
        }
    }

    // coordinates are broadcast and run south to north after the flip
    const_p_tcd_geo_field rlat = fields.get("latitude");
    if ((rlat->get_number_of_dimensions() != 2) || ((*rlat)[0] != -10.0) ||
        ((*rlat)[(n_lat - 1)*n_lon] != 10.0))
    {
        TCD_ERROR("Latitude was not flipped and broadcast " << *rlat)
        return -1;
    }

    // values are flipped, scaled and carry the fill value
    const_p_tcd_geo_field ru = fields.get("uwind");
    if ((ru->get_latitude() != rlat) || (ru->get_vertical_axis() != 0) ||
        (ru->get_lat_axis() != 1) || (ru->get_lon_axis() != 2))
    {
        TCD_ERROR("uwind axes or coordinates are wrong")
        return -1;
    }

    for (unsigned long k = 0; k < n_lev; ++k)
    {
        for (unsigned long j = 0; j < n_lat; ++j)
        {
            for (unsigned long i = 0; i < n_lon; ++i)
            {
                unsigned long q = (k*n_lat + j)*n_lon + i;
                unsigned long ks = n_lev - 1 - k;
                unsigned long js = n_lat - 1 - j;

                double expect = ((ks == 0) && (js == 0) && (i == 0)) ?
                    tcd_array_attributes::default_fill_value() :
                    2.0*(100.0*ks + 10.0*js + i);

                if ((*ru)[q] != expect)
                {
                    TCD_ERROR("uwind[" << k << ", " << j << ", " << i << "] = "
                        << (*ru)[q] << " expected " << expect)
                    return -1;
                }
            }
        }
    }

    // the derived speed
    const_p_tcd_geo_field rs = fields.get("wspd");
    unsigned long q = n_lat*n_lon + 1;
    double expect = std::sqrt((*ru)[q]*(*ru)[q] + 1.0);
    if (!tcd_test_util::close((*rs)[q], expect, 1e-12) ||
        !rs->is_missing((*rs)[(n_lev*n_lat - 1)*n_lon]))
    {
        TCD_ERROR("Wrong wind speed " << (*rs)[q] << " expected " << expect)
        return -1;
    }

    return 0;
}
