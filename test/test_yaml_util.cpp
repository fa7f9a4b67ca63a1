#include "tcd_yaml_util.h"
#include "tcd_config_block.h"
#include "tcd_tc_fix.h"
#include "tcd_error.h"
#include "tcd_common.h"

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

int main(int, char **)
{
    // nested blocks and sequences
    const char *app_text =
        "app_module: tcsteering\n"
        "isolevels: [85000, 70000, 50000]\n"
        "empty:\n"
        "filter:\n"
        "  distance: 1.6e6\n"
        "  ncoeffs: 5\n";

    tcd_config_block doc;
    if (tcd_yaml_util::parse(app_text, doc))
    {
        TCD_ERROR("Failed to parse the application document")
        return -1;
    }

    std::string val;
    std::vector<std::string> levels;
    const tcd_config_block *filter = doc.get_block("filter");
    if (doc.get("app_module", val) || (val != "tcsteering") ||
        doc.get("isolevels", levels) || (levels.size() != 3) ||
        (levels[1] != "70000") || doc.has("empty") || !filter ||
        filter->get("ncoeffs", val) || (val != "5"))
    {
        TCD_ERROR("The parsed document has the wrong contents")
        return -1;
    }

    // environment references
    setenv("TCD_TEST_DATA_DIR", "/data/era5", 1);

    if (tcd_yaml_util::parse("inputs: !ENV ${TCD_TEST_DATA_DIR}/inputs.yaml\n",
        doc) || doc.get("inputs", val) || (val != "/data/era5/inputs.yaml"))
    {
        TCD_ERROR("The environment reference was not expanded. got \""
            << val << "\"")
        return -1;
    }

    unsetenv("TCD_TEST_NOT_SET");
    if (tcd_yaml_util::parse("inputs: !ENV ${TCD_TEST_NOT_SET}/inputs.yaml\n",
        doc) != tcd_error::config_error)
    {
        TCD_ERROR("A reference to an unset variable was accepted")
        return -1;
    }

    // invalid documents
    if ((tcd_yaml_util::parse("a: [1, 2\n", doc) != tcd_error::config_error) ||
        (tcd_yaml_util::parse("- 1\n- 2\n", doc) != tcd_error::config_error))
    {
        TCD_ERROR("An invalid document was accepted")
        return -1;
    }

    // TC fixes, with the short coordinate names
    const char *tc_text =
        "09L:\n"
        "  lat_deg: 25.5\n"
        "  lon_deg: -75.0\n"
        "  valid_time: 2017-09-08T12:00\n"
        "15E:\n"
        "  lat: 14.0\n"
        "  lon: 250.0\n";

    std::string tc_file = "test_yaml_util_tcinfo.yaml";
    {
    std::ofstream ofs(tc_file);
    ofs << tc_text;
    }

    tcd_tc_fix_list fixes;
    if (tcd_yaml_util::load_tc_fixes(tc_file, fixes) || (fixes.size() != 2) ||
        (fixes[0].id != "09L") || (fixes[0].lat_deg != 25.5) ||
        (fixes[0].lon_deg != -75.0) ||
        (fixes[0].valid_time != "2017-09-08T12:00") ||
        (fixes[1].id != "15E") || (fixes[1].lon_deg != 250.0))
    {
        TCD_ERROR("Wrong TC fixes")
        return -1;
    }

    if (tcd_yaml_util::parse("01W:\n  lat: 95.0\n  lon: 140.0\n", doc) ||
        (tcd_yaml_util::get_tc_fixes(doc, fixes) != tcd_error::config_error))
    {
        TCD_ERROR("An out of range position was accepted")
        return -1;
    }

    if (tcd_yaml_util::parse("01W:\n  lat: 15.0\n", doc) ||
        (tcd_yaml_util::get_tc_fixes(doc, fixes) != tcd_error::config_error))
    {
        TCD_ERROR("A fix without a longitude was accepted")
        return -1;
    }

    if (tcd_yaml_util::load("test_yaml_util_no_such_file.yaml", doc)
        != tcd_error::io_error)
    {
        TCD_ERROR("A missing file was not reported as an I/O error")
        return -1;
    }

    return 0;
}
