#include "tcd_tc_relative_projector.h"
#include "tcd_polar_cache.h"
#include "tcd_polar_field.h"
#include "tcd_tc_fix.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>

int main(int, char **)
{
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(-10.0, 30.0, 81, 100.0, 160.0, 121, lat, lon);

    // a linear function is reproduced exactly by bilinear interpolation
    p_tcd_geo_field f = tcd_test_util::make_field("f", "m/s", 2, lat, lon,
        [](unsigned long k, double y, double x) -> double
        { return y + 0.5*x + 100.0*k; });

    tcd_tc_relative_projector proj;
    proj.set_max_radius(5.0e5);
    proj.set_dradius(5.0e4);
    proj.set_dazimuth(M_PI/8.0);

    tcd_tc_fix fix("01W", 10.0, 130.0);

    const_p_tcd_polar_field p1;
    const_p_tcd_polar_field p2;
    if (proj.project(*f, fix, 1, p1) || proj.project(*f, fix, 1, p2))
    {
        TCD_ERROR("Projection failed")
        return -1;
    }

    if ((p1->get_number_of_radii() != 11) || (p1->get_number_of_azimuths() != 16))
    {
        TCD_ERROR("Wrong polar grid " << p1->get_number_of_radii() << " x "
            << p1->get_number_of_azimuths())
        return -1;
    }

    // identical arguments give identical results
    if (p1->get_values() != p2->get_values())
    {
        TCD_ERROR("Projection is not repeatable")
        return -1;
    }

    // the center ring is the value at the TC
    for (unsigned long j = 0; j < p1->get_number_of_azimuths(); ++j)
    {
        if (!tcd_test_util::close((*p1)(0, j), 10.0 + 65.0 + 100.0, 1e-9))
        {
            TCD_ERROR("Wrong value at the center " << (*p1)(0, j))
            return -1;
        }
    }

    // due north increases, due south decreases, nothing is missing
    unsigned long n_rad = p1->get_number_of_radii();
    if (((*p1)(n_rad - 1, 0) <= (*p1)(0, 0)) ||
        ((*p1)(n_rad - 1, 8) >= (*p1)(0, 0)) || p1->ring_has_missing(n_rad - 1))
    {
        TCD_ERROR("Wrong values on the outer ring")
        return -1;
    }

    // points outside of the domain are marked
    tcd_tc_fix edge("02W", 28.0, 130.0);
    const_p_tcd_polar_field p3;
    if (proj.project(*f, edge, 0, p3))
    {
        TCD_ERROR("Projection near the edge failed")
        return -1;
    }

    if (!p3->is_missing((*p3)(n_rad - 1, 0)) || p3->is_missing((*p3)(n_rad - 1, 8)) ||
        ((*p3)(n_rad - 1, 0) != f->get_fill_value()))
    {
        TCD_ERROR("Points outside of the domain were not marked")
        return -1;
    }

    // levels out of range are rejected
    const_p_tcd_polar_field p4;
    if (proj.project(*f, fix, 2, p4) != tcd_error::config_error)
    {
        TCD_ERROR("An invalid level was accepted")
        return -1;
    }

    // spacings that leave a short gap before north are rejected
    tcd_tc_relative_projector uneven;
    uneven.set_max_radius(5.0e5);
    uneven.set_dradius(5.0e4);
    uneven.set_dazimuth(50.0*M_PI/180.0);

    const_p_tcd_polar_field p5;
    if ((uneven.validate() != tcd_error::config_error) ||
        (uneven.project(*f, fix, 0, p5) != tcd_error::config_error))
    {
        TCD_ERROR("An azimuthal spacing of 50 degrees was accepted")
        return -1;
    }

    uneven.set_dazimuth(2.0*M_PI/7.0);
    if (uneven.validate())
    {
        TCD_ERROR("An azimuthal spacing of 2 pi/7 was rejected")
        return -1;
    }

    // cached results are reused
    p_tcd_polar_cache cache = tcd_polar_cache::New();
    proj.set_cache(cache);

    const_p_tcd_polar_field c1;
    const_p_tcd_polar_field c2;
    if (proj.project(*f, fix, 0, c1) || proj.project(*f, fix, 0, c2) ||
        (c1 != c2))
    {
        TCD_ERROR("The cache was not used")
        return -1;
    }

    // entries are kept per TC and level until erased
    const_p_tcd_polar_field c3;
    const_p_tcd_polar_field c4;
    if (proj.project(*f, fix, 1, c3) || proj.project(*f, edge, 0, c4) ||
        (cache->size() != 3) || (c3 == c1) || (c4 == c1))
    {
        TCD_ERROR("Wrong cache contents, " << cache->size() << " entries")
        return -1;
    }

    cache->erase(fix.id);
    if ((cache->size() != 1) || cache->get(fix.id, f->get_name(), 0) ||
        (cache->get(edge.id, f->get_name(), 0) != c4))
    {
        TCD_ERROR("Erasing TC " << fix.id << " left the wrong entries")
        return -1;
    }

    return 0;
}
