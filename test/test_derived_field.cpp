#include "tcd_derived_field.h"
#include "tcd_variable_spec.h"
#include "tcd_field_collection.h"
#include "tcd_unit_system.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace
{
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
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(-10.0, 10.0, 5, 100.0, 120.0, 5, lat, lon);

    tcd_field_collection resolved;
    resolved.set("latitude", lat);
    resolved.set("longitude", lon);
    resolved.set("uwind", tcd_test_util::make_field("uwind", "knots", 0, lat, lon,
        [](unsigned long, double, double) -> double { return 3.0; }));
    resolved.set("vwind", tcd_test_util::make_field("vwind", "m/s", 0, lat, lon,
        [](unsigned long, double, double) -> double { return 4.0; }));
    resolved.set("specific_humidity", tcd_test_util::make_field(
        "specific_humidity", "g/kg", 0, lat, lon,
        [](unsigned long, double, double) -> double { return 20.0; }));

    tcd_unit_system units;

    // inputs are converted to the method's units and the result to the
    // declared units
    p_tcd_geo_field wspd;
    if (tcd_derived_field::evaluate(derived_spec("wspd", "wind_speed",
        {"uwind", "vwind"}, "knots"), resolved, units, wspd))
    {
        TCD_ERROR("Failed to evaluate the wind speed")
        return -1;
    }

    double u = 3.0*1852.0/3600.0;
    double expect = std::sqrt(u*u + 16.0)*3600.0/1852.0;
    if (!tcd_test_util::close((*wspd)[0], expect, 1e-12) ||
        (wspd->get_units() != "knots") || (wspd->get_name() != "wspd"))
    {
        TCD_ERROR("Wrong wind speed " << (*wspd)[0] << " " << wspd->get_units()
            << " expected " << expect)
        return -1;
    }

    p_tcd_geo_field mxrt;
    if (tcd_derived_field::evaluate(derived_spec("mxrt", "spfh_to_mxrt",
        {"specific_humidity"}, "kg/kg"), resolved, units, mxrt))
    {
        TCD_ERROR("Failed to evaluate the mixing ratio")
        return -1;
    }

    expect = 0.02/(1.0 - 0.02);
    if (!tcd_test_util::close((*mxrt)[0], expect, 1e-12))
    {
        TCD_ERROR("Wrong mixing ratio " << (*mxrt)[0] << " expected " << expect)
        return -1;
    }

    // unknown methods and wrong input counts are configuration errors
    int method = 0;
    std::vector<std::string> inputs;
    if ((tcd_derived_field::get_method("no_such_method", method)
        != tcd_error::config_error) ||
        (tcd_derived_field::get_inputs(derived_spec("x", "wind_speed",
        {"uwind"}, "m/s"), inputs) != tcd_error::config_error))
    {
        TCD_ERROR("Invalid methods were accepted")
        return -1;
    }

    // an input that is never resolved fails its consumer and the consumer's
    // consumers, while independent specs are still ordered
    std::vector<tcd_variable_spec> specs = {
        derived_spec("speed_a", "wind_speed", {"uwind", "vwind"}, "m/s"),
        derived_spec("speed_b", "wind_speed", {"uwind", "vwind_missing"}, "m/s"),
        derived_spec("speed_c", "wind_speed", {"speed_b", "vwind"}, "m/s")};

    std::vector<unsigned long> order;
    std::map<std::string, int> failed;
    if (tcd_derived_field::sort(specs, resolved, order, failed)
        != tcd_error::dependency_error)
    {
        TCD_ERROR("A missing dependency was not reported")
        return -1;
    }

    if ((order.size() != 1) || (order[0] != 0) || (failed.size() != 2) ||
        (failed["speed_b"] != tcd_error::dependency_error) ||
        (failed["speed_c"] != tcd_error::dependency_error))
    {
        TCD_ERROR("Wrong evaluation order " << order)
        return -1;
    }

    // dependencies are evaluated first
    specs = {
        derived_spec("speed_c", "wind_speed", {"speed_a", "vwind"}, "m/s"),
        derived_spec("speed_a", "wind_speed", {"uwind", "vwind"}, "m/s")};

    order.clear();
    failed.clear();
    if (tcd_derived_field::sort(specs, resolved, order, failed) ||
        (order.size() != 2) || (order[0] != 1) || (order[1] != 0))
    {
        TCD_ERROR("Dependencies were not ordered " << order)
        return -1;
    }

    // cycles are detected
    specs = {
        derived_spec("a", "wind_speed", {"b", "vwind"}, "m/s"),
        derived_spec("b", "wind_speed", {"a", "vwind"}, "m/s"),
        derived_spec("c", "wind_speed", {"uwind", "vwind"}, "m/s")};

    order.clear();
    failed.clear();
    if ((tcd_derived_field::sort(specs, resolved, order, failed)
        != tcd_error::dependency_error) || (order.size() != 1) ||
        (order[0] != 2) || !failed.count("a") || !failed.count("b"))
    {
        TCD_ERROR("A cycle was not detected")
        return -1;
    }

    return 0;
}
