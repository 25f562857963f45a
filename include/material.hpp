#ifndef MATERIAL_HPP
#define MATERIAL_HPP

#include <string>

/// Smeared-crack constitutive model of a membrane element.
enum class ConstitutiveModel {
    MCFT,   // Modified Compression Field Theory (Vecchio & Collins 1986)
    DSFM,   // Disturbed Stress Field Model (Vecchio 2000)
    SMM     // Softened Membrane Model (Hsu & Zhu 2002)
};

std::string model_name(ConstitutiveModel model);

/**
 * @brief Concrete parameters (MPa, mm).
 *
 * Tensile strength and elastic modulus are derived from fc unless given
 * explicitly (pass 0 to derive):
 *   MCFT/DSFM: fcr = 0.33·sqrt(fc), Ec = 2·fc/|eps0|
 *   SMM:       fcr = 0.31·sqrt(fc), Ec = 3875·sqrt(fc)
 */
class ConcreteParameters {
public:
    ConcreteParameters(double fc, double aggregate_diameter,
                       ConstitutiveModel model = ConstitutiveModel::MCFT,
                       double fcr = 0.0, double Ec = 0.0);

    double strength() const { return fc_; }
    double aggregate_diameter() const { return phi_ag_; }
    double tensile_strength() const { return fcr_; }
    double elastic_modulus() const { return Ec_; }
    double plastic_strain() const { return eps0_; }
    double cracking_strain() const { return fcr_ / Ec_; }
    double fracture_parameter() const { return Gf_; }

private:
    double fc_;
    double phi_ag_;
    double fcr_;
    double Ec_;
    double eps0_ = -0.002;   // strain at peak compressive stress
    double Gf_ = 0.075;      // N/mm
};

/**
 * @brief Elastic-perfectly-plastic reinforcing steel, symmetric in compression.
 */
class Steel {
public:
    Steel(double fy, double Es = 200000.0);

    double yield_stress() const { return fy_; }
    double elastic_modulus() const { return Es_; }
    double yield_strain() const { return fy_ / Es_; }

    /// sign(eps)·min(Es·|eps|, fy)
    double stress(double strain) const;

    /// stress/strain, or Es at zero strain.
    double secant_modulus(double strain) const;

private:
    double fy_;
    double Es_;
};

#endif // MATERIAL_HPP
