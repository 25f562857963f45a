/**
 * membrane.cpp — Reinforced concrete membrane element
 *
 * DSFM crack slip (Vecchio 2000):
 *   vci from local reinforcement equilibrium at the crack (Brent root of the
 *   tensile stress balance), slip candidates from the Walraven relation and
 *   from the rotation lag of the stress field, the larger one governs.
 *
 * SMM Poisson effect (Hsu & Zhu 2002):
 *   e1 = (e1i + nu21·e2i)/(1 - nu12·nu21)
 *   e2 = (e2i + nu21·e1i)/(1 - nu12·nu21)
 */

#include "membrane.hpp"
#include "root_finding.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string slip_approach_name(SlipApproach approach)
{
    switch (approach) {
        case SlipApproach::None:        return "none";
        case SlipApproach::StressBased: return "stress";
        case SlipApproach::RotationLag: return "rotation-lag";
    }
    return "none";
}

Membrane::Membrane(const ConcreteParameters& concrete, const WebReinforcement& reinforcement,
                   double width, ConstitutiveModel model, bool consider_slip)
    : concrete_(concrete, model, consider_slip && model == ConstitutiveModel::DSFM),
      reinforcement_(reinforcement),
      width_(width),
      model_(model),
      consider_slip_(consider_slip && model == ConstitutiveModel::DSFM)
{
    if (width <= 0.0)
        throw std::invalid_argument("Membrane width must be positive");
}

// ============================================================================
// Evaluation
// ============================================================================

void Membrane::calculate(const StrainState& applied)
{
    average_strains_ = applied.to_horizontal();
    average_principal_strains_ = average_strains_.to_principal();

    switch (model_) {
        case ConstitutiveModel::MCFT: calculate_mcft(average_strains_); break;
        case ConstitutiveModel::DSFM: calculate_dsfm(average_strains_); break;
        case ConstitutiveModel::SMM:  calculate_smm(average_strains_);  break;
    }
}

void Membrane::calculate_mcft(const StrainState& applied)
{
    concrete_.calculate(applied, reinforcement_);
    reinforcement_.calculate(applied);
    crack_check();
}

void Membrane::calculate_dsfm(const StrainState& applied)
{
    concrete_.calculate(applied - slip_strains_, reinforcement_, reference_length());
    reinforcement_.calculate(applied);

    // Latched at the first cracked evaluation, converged or trial iterate.
    if (!theta_ic_ && concrete_.cracked())
        theta_ic_ = concrete_.principal_strains().theta1;

    if (consider_slip_)
        update_crack_slip();

    crack_check();
}

void Membrane::calculate_smm(const StrainState& applied)
{
    const StrainState at_principal = applied.transform(average_principal_strains_.theta1);
    const StrainState decoupled = remove_poisson_effect(at_principal);

    concrete_.calculate(decoupled, reinforcement_);
    reinforcement_.calculate(decoupled.to_horizontal());
    crack_check();
}

StressState Membrane::average_stresses() const
{
    return concrete_.stresses() + reinforcement_.stresses();
}

Eigen::Matrix3d Membrane::stiffness() const
{
    return concrete_.stiffness() + reinforcement_.stiffness();
}

Eigen::Matrix3d Membrane::initial_stiffness() const
{
    return concrete_.initial_stiffness() + reinforcement_.initial_stiffness();
}

// ============================================================================
// Crack geometry
// ============================================================================

double Membrane::crack_spacing() const
{
    return CrackMechanics::average_spacing(reinforcement_, concrete_.principal_strains().theta1);
}

double Membrane::crack_opening() const
{
    return CrackMechanics::crack_opening(crack_spacing(), concrete_.principal_strains().e1);
}

double Membrane::reference_length() const
{
    return 0.5 * CrackMechanics::average_spacing(reinforcement_, average_principal_strains_.theta1);
}

StressState Membrane::pseudo_stresses() const
{
    return StressState::from_strains(slip_strains_, concrete_.stiffness());
}

void Membrane::crack_check()
{
    crack_check_ = CrackCheckResult();
    if (!concrete_.cracked()) return;

    crack_check_ = CrackMechanics::check(concrete_.principal_stresses().s1,
                                         concrete_.principal_strains(),
                                         concrete_.parameters(), reinforcement_);
    if (crack_check_.governed)
        concrete_.set_tensile_stress(crack_check_.limit);
}

// ============================================================================
// DSFM crack slip
// ============================================================================

double Membrane::shear_at_crack() const
{
    const auto& x = reinforcement_.x();
    const auto& y = reinforcement_.y();
    if (!x && !y) return 0.0;

    const double fc1 = concrete_.principal_stresses().s1;
    const auto theta_n = reinforcement_.angles(concrete_.principal_strains().theta1);
    const auto cs_x = PlaneAlgebra::direction_cosines(theta_n[0]);
    const auto cs_y = PlaneAlgebra::direction_cosines(theta_n[1]);
    const double cos2_x = cs_x[0] * cs_x[0];
    const double cos2_y = cs_y[0] * cs_y[0];

    // Stress increase of a direction when the crack opens by de1
    auto increase = [](const std::optional<ReinforcementDirection>& d, double de1, double cos2) {
        if (!d) return 0.0;
        return d->ratio() * (d->stress_at(d->strain() + de1 * cos2) - d->stress());
    };

    auto equilibrium = [&](double de1) {
        return increase(x, de1, cos2_x) * cos2_x + increase(y, de1, cos2_y) * cos2_y - fc1;
    };

    const RootResult root = brent_find_root(equilibrium, 0.0, 0.005);
    if (!root.found) return 0.0;

    return increase(x, root.value, cos2_x) * cs_x[0] * cs_x[1]
         + increase(y, root.value, cos2_y) * cs_y[0] * cs_y[1];
}

double Membrane::stress_slip(double vci) const
{
    const double s = crack_spacing();
    if (s <= 0.0) return 0.0;
    return CrackMechanics::crack_slip(vci, crack_opening(), concrete_.parameters()) / s;
}

double Membrane::rotation_lag_slip() const
{
    const double theta_ic = theta_ic_ ? *theta_ic_ : 0.25 * PlaneAlgebra::PI;
    const double d_theta_e = average_principal_strains_.theta1 - theta_ic;

    double theta_l;
    switch (reinforcement_.reinforced_directions()) {
        case 2:  theta_l = PlaneAlgebra::to_radians(5.0);  break;
        case 1:  theta_l = PlaneAlgebra::to_radians(7.5);  break;
        default: theta_l = PlaneAlgebra::to_radians(10.0); break;
    }

    double d_theta_s = d_theta_e;
    if (std::abs(d_theta_e) > theta_l)
        d_theta_s = d_theta_e > 0.0 ? d_theta_e - theta_l : d_theta_e + theta_l;

    const double theta_s = theta_ic + d_theta_s;
    const auto cs = PlaneAlgebra::direction_cosines(2.0 * theta_s);

    const StrainState& e = average_strains_;
    return std::abs(e.gxy * cs[0] + (e.ey - e.ex) * cs[1]);
}

void Membrane::update_crack_slip()
{
    if (!concrete_.cracked()) return;

    vci_ = shear_at_crack();

    const double ys_stress = std::abs(stress_slip(vci_));
    const double ys_lag = rotation_lag_slip();

    double ys;
    if (ys_stress >= ys_lag) {
        ys = ys_stress;
        slip_approach_ = SlipApproach::StressBased;
    } else {
        ys = ys_lag;
        slip_approach_ = SlipApproach::RotationLag;
    }

    const auto cs = PlaneAlgebra::direction_cosines(2.0 * concrete_.principal_strains().theta1);
    StrainState slip(-0.5 * ys * cs[1], 0.5 * ys * cs[1], ys * cs[0]);

    if (average_strains_.gxy < 0.0)
        slip = -slip;

    slip_strains_ = slip;
}

// ============================================================================
// SMM Poisson effect
// ============================================================================

std::array<double, 2> Membrane::poisson_coefficients() const
{
    const double nu21 = concrete_.cracked() ? 0.0 : 0.2;

    const auto& x = reinforcement_.x();
    const auto& y = reinforcement_.y();
    if (!x && !y) return {0.2, nu21};

    const double esx = x ? x->strain() : 0.0;
    const double esy = y ? y->strain() : 0.0;

    const bool x_governs = (x && esx >= esy) || !y;
    const double esf = x_governs ? esx : esy;
    const double ey = x_governs ? x->steel().yield_strain() : y->steel().yield_strain();

    double nu12 = 0.2;
    if (esf > ey)
        nu12 = 1.9;
    else if (esf > 0.0)
        nu12 = 0.2 + 850.0 * esf;

    return {nu12, nu21};
}

StrainState Membrane::remove_poisson_effect(const StrainState& at_principal) const
{
    const auto nu = poisson_coefficients();
    const double v1 = 1.0 / (1.0 - nu[0] * nu[1]);
    const double v2 = nu[1] * v1;

    const double e1i = at_principal.ex;
    const double e2i = at_principal.ey;

    return StrainState(v1 * e1i + v2 * e2i, v2 * e1i + v1 * e2i,
                       at_principal.gxy, at_principal.theta_x);
}
