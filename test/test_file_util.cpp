#include "tcd_file_util.h"
#include "tcd_error.h"
#include "tcd_common.h"

#include <string>

int main(int, char **)
{
    // files named in a configuration are relative to it
    if ((tcd_file_util::resolve("exp/experiment.yaml", "inputs.gfs.yaml")
        != "exp/inputs.gfs.yaml") ||
        (tcd_file_util::resolve("experiment.yaml", "inputs.gfs.yaml")
        != "inputs.gfs.yaml") ||
        (tcd_file_util::resolve("exp/experiment.yaml", "/data/tcinfo.yaml")
        != "/data/tcinfo.yaml") ||
        !tcd_file_util::resolve("exp/experiment.yaml", "").empty())
    {
        TCD_ERROR("Configuration relative paths were not resolved")
        return -1;
    }

    if ((tcd_file_util::join("out/", "tcpi.nc") != "out/tcpi.nc") ||
        (tcd_file_util::join("", "tcpi.nc") != "tcpi.nc") ||
        (tcd_file_util::path("tcpi.nc") != ".") ||
        (tcd_file_util::filename("out/tcpi.nc") != "tcpi.nc"))
    {
        TCD_ERROR("Paths were not split and joined")
        return -1;
    }

    // the tests run in the build directory, which is writable
    if (tcd_file_util::check_output_dir("") ||
        !tcd_file_util::directory_exists(".") ||
        tcd_file_util::file_exists("."))
    {
        TCD_ERROR("The working directory was not accepted for output")
        return -1;
    }

    if (tcd_file_util::check_output_dir("test_file_util_no_such_dir")
        != tcd_error::io_error)
    {
        TCD_ERROR("A missing output directory was accepted")
        return -1;
    }

    return 0;
}
