#ifndef tcd_wavenumber_spectrum_h
#define tcd_wavenumber_spectrum_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_polar_field.h"

#include <vector>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_wavenumber_spectrum)

/** @brief
 * The azimuthal wavenumber components of a polar field.
 *
 * @details
 * Holds the original field, one real valued component per wavenumber
 * 0..max_wavenumber, the truncated field (the sum of the components) and the
 * residual, the original minus the truncated field. Components and residual
 * add up to the original.
 */
class TCD_EXPORT tcd_wavenumber_spectrum
{
public:
    /// allocate an empty spectrum of the field
    static p_tcd_wavenumber_spectrum New(const const_p_tcd_polar_field &original,
        unsigned int max_wavenumber);

    unsigned int get_max_wavenumber() const { return this->components.size() - 1; }
    unsigned int get_number_of_components() const { return this->components.size(); }

    const_p_tcd_polar_field get_original() const { return this->original; }

    /// get the component of wavenumber k
    const_p_tcd_polar_field get_component(unsigned int k) const
    { return this->components[k]; }

    void set_component(unsigned int k, const const_p_tcd_polar_field &comp)
    { this->components[k] = comp; }

    /// sum of the components
    const_p_tcd_polar_field get_truncated() const { return this->truncated; }

    void set_truncated(const const_p_tcd_polar_field &trunc)
    { this->truncated = trunc; }

    /// the original less the truncated field
    const_p_tcd_polar_field get_residual() const { return this->residual; }

    void set_residual(const const_p_tcd_polar_field &resid)
    { this->residual = resid; }

    /** get the largest absolute difference between the original and the sum
     * of the components and the residual, scaled by the largest magnitude
     * in the original. missing values are skipped. returns 0 if successful
     * and -1 if the spectrum is incomplete.
     */
    int get_reconstruction_error(double &err) const;

protected:
    tcd_wavenumber_spectrum() = default;

private:
    const_p_tcd_polar_field original;
    std::vector<const_p_tcd_polar_field> components;
    const_p_tcd_polar_field truncated;
    const_p_tcd_polar_field residual;
};

#endif
