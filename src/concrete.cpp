/**
 * concrete.cpp — Biaxial concrete constitutive laws
 *
 * Tension (cracked):
 *   MCFT  fcr/(1 + sqrt(500·e1))                         Vecchio & Collins (1986)
 *   DSFM  max(fcr/(1 + sqrt(ct·e1)), linear softening)   Vecchio (2000)
 *   SMM   fcr·(ecr/e1)^0.4                               Hsu & Zhu (2002)
 *
 * Compression:
 *   MCFT  Hognestad parabola, peak beta·fc at eps0
 *   DSFM  parabola with strength and strain softening beta_d
 *   SMM   softened parabola with descending branch, coefficient zeta
 */

#include "concrete.hpp"

#include <algorithm>
#include <cmath>

BiaxialConcrete::BiaxialConcrete(const ConcreteParameters& parameters,
                                 ConstitutiveModel model, bool consider_slip)
    : params_(parameters), model_(model), consider_slip_(consider_slip),
      E1_(parameters.elastic_modulus()), E2_(parameters.elastic_modulus())
{
}

// ============================================================================
// Evaluation
// ============================================================================

void BiaxialConcrete::calculate(const StrainState& strains,
                                const WebReinforcement& reinforcement,
                                double reference_length)
{
    strains_ = strains;
    principal_strains_ = strains.to_principal();

    const double e1 = principal_strains_.e1;
    const double e2 = principal_strains_.e2;

    if (!cracked_ && e1 >= params_.cracking_strain())
        cracked_ = true;

    const double f1 = principal_stress(e1, e1, reinforcement, reference_length);
    const double f2 = principal_stress(e2, e1, reinforcement, reference_length);

    principal_stresses_ = PrincipalStressState(f1, f2, principal_strains_.theta1);
    update_moduli();
}

void BiaxialConcrete::set_tensile_stress(double f1)
{
    principal_stresses_.s1 = f1;
    update_moduli();
}

double BiaxialConcrete::principal_stress(double strain, double e1,
                                         const WebReinforcement& reinforcement,
                                         double reference_length) const
{
    if (strain > 0.0)
        return tensile_stress(strain, reinforcement, reference_length);
    if (strain < 0.0)
        return compressive_stress(e1, strain);
    return 0.0;
}

void BiaxialConcrete::update_moduli()
{
    const double Ec = params_.elastic_modulus();
    const double e1 = principal_strains_.e1;
    const double e2 = principal_strains_.e2;

    E1_ = PlaneAlgebra::approx_zero(e1) ? Ec : principal_stresses_.s1 / e1;
    E2_ = PlaneAlgebra::approx_zero(e2) ? Ec : principal_stresses_.s2 / e2;
}

StressState BiaxialConcrete::stresses() const
{
    return principal_stresses_.to_stress();
}

Eigen::Matrix3d BiaxialConcrete::stiffness() const
{
    return PlaneAlgebra::principal_to_cartesian(E1_, E2_,
                                                PlaneAlgebra::shear_modulus(E1_, E2_),
                                                principal_strains_.theta1);
}

Eigen::Matrix3d BiaxialConcrete::initial_stiffness() const
{
    const double Ec = params_.elastic_modulus();
    Eigen::Matrix3d K = Eigen::Matrix3d::Zero();
    K.diagonal() << Ec, Ec, 0.5 * Ec;
    return K;
}

// ============================================================================
// Tension
// ============================================================================

double BiaxialConcrete::tensile_stress(double e1, const WebReinforcement& reinforcement,
                                       double reference_length) const
{
    if (e1 <= 0.0) return 0.0;

    if (!cracked_)
        return params_.elastic_modulus() * e1;

    switch (model_) {
        case ConstitutiveModel::MCFT: return mcft_tension(e1);
        case ConstitutiveModel::DSFM: return dsfm_tension(e1, reinforcement, reference_length);
        case ConstitutiveModel::SMM:  return smm_tension(e1);
    }
    return 0.0;
}

double BiaxialConcrete::mcft_tension(double e1) const
{
    const double fcr = params_.tensile_strength();
    return std::min(params_.elastic_modulus() * e1, fcr / (1.0 + std::sqrt(500.0 * e1)));
}

double BiaxialConcrete::dsfm_tension(double e1, const WebReinforcement& reinforcement,
                                     double reference_length) const
{
    const double fcr = params_.tensile_strength();
    const double ecr = params_.cracking_strain();

    // Tension stiffening: ct = 2.2·m, 1/m = sum(4·rho/db·|cos theta_n|)
    double stiffening = 0.0;
    const double inverse_m = reinforcement.bond_coefficient(principal_strains_.theta1);
    if (inverse_m > 0.0) {
        const double ct = 2.2 / inverse_m;
        stiffening = fcr / (1.0 + std::sqrt(ct * e1));
    }

    // Tension softening to e_ts = 2·Gf/(fcr·Lr)
    double softening = 0.0;
    if (reference_length > 0.0) {
        const double ets = 2.0 * params_.fracture_parameter() / (fcr * reference_length);
        if (ets > ecr && e1 < ets)
            softening = fcr * (1.0 - (e1 - ecr) / (ets - ecr));
    }

    return std::min(std::max(stiffening, softening), params_.elastic_modulus() * e1);
}

double BiaxialConcrete::smm_tension(double e1) const
{
    const double fcr = params_.tensile_strength();
    const double ecr = params_.cracking_strain();
    if (e1 <= ecr) return params_.elastic_modulus() * e1;
    return fcr * std::pow(ecr / e1, 0.4);
}

// ============================================================================
// Compression
// ============================================================================

double BiaxialConcrete::compressive_stress(double e1, double e2) const
{
    if (e2 >= 0.0) return 0.0;

    const double e1_pos = std::max(e1, 0.0);
    switch (model_) {
        case ConstitutiveModel::MCFT: return mcft_compression(e1_pos, e2);
        case ConstitutiveModel::DSFM: return dsfm_compression(e1_pos, e2);
        case ConstitutiveModel::SMM:  return smm_compression(e1_pos, e2);
    }
    return 0.0;
}

double BiaxialConcrete::mcft_softening(double e1) const
{
    if (!cracked_ || e1 <= 0.0) return 1.0;
    return std::min(1.0 / (0.8 + 170.0 * e1), 1.0);
}

double BiaxialConcrete::mcft_compression(double e1, double e2) const
{
    const double fp = mcft_softening(e1) * params_.strength();
    const double r = e2 / params_.plastic_strain();
    const double shape = std::max(2.0 * r - r * r, 0.0);
    return -fp * shape;
}

double BiaxialConcrete::dsfm_softening(double e1, double e2) const
{
    if (!cracked_ || e1 <= 0.0 || e2 >= 0.0) return 1.0;

    const double ratio = -e1 / e2;
    const double Cd = ratio > 0.28 ? 0.35 * std::pow(ratio - 0.28, 0.8) : 0.0;
    const double Cs = consider_slip_ ? 0.55 : 1.0;
    return std::min(1.0 / (1.0 + Cs * Cd), 1.0);
}

double BiaxialConcrete::dsfm_compression(double e1, double e2) const
{
    const double beta = dsfm_softening(e1, e2);
    const double e0 = params_.plastic_strain();
    const double fp = -beta * params_.strength();
    const double ep = beta * e0;

    if (e2 >= ep) {
        // Pre-peak
        const double r = e2 / ep;
        return fp * std::max(2.0 * r - r * r, 0.0);
    }

    // Post-peak
    const double r = (e2 - ep) / (2.0 * e0 - ep);
    return fp * std::max(1.0 - r * r, 0.0);
}

double BiaxialConcrete::smm_softening(double e1) const
{
    if (!cracked_ || e1 <= 0.0) return 1.0;
    const double base = std::min(0.9, 5.8 / std::sqrt(params_.strength()));
    return base / std::sqrt(1.0 + 400.0 * e1);
}

double BiaxialConcrete::smm_compression(double e1, double e2) const
{
    const double zeta = smm_softening(e1);
    const double fc = params_.strength();
    const double x = e2 / (zeta * params_.plastic_strain());

    if (x <= 1.0)
        return -zeta * fc * std::max(2.0 * x - x * x, 0.0);

    const double r = (x - 1.0) / (4.0 / zeta - 1.0);
    return -zeta * fc * std::max(1.0 - r * r, 0.0);
}
