/**
 * plane_state.cpp — Plane strain/stress algebra
 *
 * Principal values follow Mohr's circle:
 *   center = (x + y)/2,  radius = ½·sqrt((x - y)² + s²)
 *   theta1 = ½·atan2(s, x - y)
 * where s is the engineering shear (gamma_xy, or 2·tau_xy for stresses).
 */

#include "plane_state.hpp"

#include <cmath>
#include <stdexcept>

namespace PlaneAlgebra {

std::array<double, 2> direction_cosines(double angle, bool snap)
{
    double c = std::cos(angle);
    double s = std::sin(angle);
    if (snap) {
        if (std::abs(c) < SNAP_TOLERANCE) c = 0.0;
        if (std::abs(s) < SNAP_TOLERANCE) s = 0.0;
    }
    return {c, s};
}

double tangent(double angle)
{
    const auto cs = direction_cosines(angle);
    if (cs[0] == 0.0)
        return cs[1] >= 0.0 ? TANGENT_SENTINEL : -TANGENT_SENTINEL;
    return cs[1] / cs[0];
}

Eigen::Matrix3d transformation_matrix(double angle)
{
    const auto cs = direction_cosines(angle);
    const double c = cs[0], s = cs[1];
    const double cc = c * c, ss = s * s, sc = s * c;

    Eigen::Matrix3d T;
    T <<      cc,       ss,      sc,
              ss,       cc,     -sc,
        -2.0*sc,   2.0*sc, cc - ss;
    return T;
}

double shear_modulus(double E1, double E2)
{
    const double sum = E1 + E2;
    if (approx_zero(sum)) return 0.0;
    return E1 * E2 / sum;
}

Eigen::Matrix3d principal_to_cartesian(double E1, double E2, double G, double angle)
{
    const Eigen::Matrix3d T = transformation_matrix(angle);
    const Eigen::Vector3d d(E1, E2, G);
    return T.transpose() * d.asDiagonal() * T;
}

} // namespace PlaneAlgebra

namespace
{
    // Principal angle with the axis-aligned and 45° cases resolved explicitly.
    double principal_angle(double x, double y, double shear)
    {
        // +0.0 removes a negative zero before atan2
        shear += 0.0;

        if (PlaneAlgebra::approx_zero(x) && PlaneAlgebra::approx_zero(y)
            && PlaneAlgebra::approx_zero(shear))
            return 0.0;

        if (PlaneAlgebra::approx_zero(shear))
            return x >= y ? 0.0 : 0.5 * PlaneAlgebra::PI;

        if (PlaneAlgebra::approx_zero(x - y))
            return shear > 0.0 ? 0.25 * PlaneAlgebra::PI : -0.25 * PlaneAlgebra::PI;

        return 0.5 * std::atan2(shear, x - y);
    }

    // Stress transformation: tensor shear counterpart of T(a).
    Eigen::Matrix3d stress_transformation(double angle)
    {
        const auto cs = PlaneAlgebra::direction_cosines(angle);
        const double c = cs[0], s = cs[1];
        const double cc = c * c, ss = s * s, sc = s * c;

        Eigen::Matrix3d Ts;
        Ts <<  cc,  ss,  2.0*sc,
               ss,  cc, -2.0*sc,
              -sc,  sc, cc - ss;
        return Ts;
    }
}

// ============================================================================
// StrainState
// ============================================================================

StrainState StrainState::from_vector(const Eigen::Vector3d& v, double theta)
{
    return StrainState(v(0), v(1), v(2), theta);
}

StrainState StrainState::from_stresses(const StressState& stresses, const Eigen::Matrix3d& K)
{
    Eigen::FullPivLU<Eigen::Matrix3d> lu(K);
    if (!lu.isInvertible())
        throw std::runtime_error("Cannot compute strains: stiffness matrix is singular");

    const Eigen::Vector3d e = lu.solve(stresses.as_vector());
    return from_vector(e, stresses.theta_x);
}

StrainState StrainState::transform(double angle) const
{
    if (angle == 0.0) return *this;
    const Eigen::Vector3d e = PlaneAlgebra::transformation_matrix(angle) * as_vector();
    return from_vector(e, theta_x + angle);
}

PrincipalStrainState StrainState::to_principal() const
{
    const double center = 0.5 * (ex + ey);
    const double radius = 0.5 * std::sqrt((ex - ey) * (ex - ey) + gxy * gxy);
    const double theta  = principal_angle(ex, ey, gxy);
    return PrincipalStrainState(center + radius, center - radius, theta_x + theta);
}

bool StrainState::is_zero() const
{
    return PlaneAlgebra::approx_zero(ex) && PlaneAlgebra::approx_zero(ey)
        && PlaneAlgebra::approx_zero(gxy);
}

StrainState StrainState::operator+(const StrainState& o) const
{
    const StrainState b = o.transform(theta_x - o.theta_x);
    return StrainState(ex + b.ex, ey + b.ey, gxy + b.gxy, theta_x);
}

StrainState StrainState::operator-(const StrainState& o) const
{
    return *this + (-o);
}

StrainState StrainState::operator-() const
{
    return StrainState(-ex, -ey, -gxy, theta_x);
}

StrainState StrainState::operator*(double k) const
{
    return StrainState(k * ex, k * ey, k * gxy, theta_x);
}

// ============================================================================
// StressState
// ============================================================================

StressState StressState::from_vector(const Eigen::Vector3d& v, double theta)
{
    return StressState(v(0), v(1), v(2), theta);
}

StressState StressState::from_strains(const StrainState& strains, const Eigen::Matrix3d& K)
{
    return from_vector(K * strains.as_vector(), strains.theta_x);
}

StressState StressState::transform(double angle) const
{
    if (angle == 0.0) return *this;
    const Eigen::Vector3d s = stress_transformation(angle) * as_vector();
    return from_vector(s, theta_x + angle);
}

PrincipalStressState StressState::to_principal() const
{
    const double center = 0.5 * (sx + sy);
    const double radius = std::sqrt(0.25 * (sx - sy) * (sx - sy) + txy * txy);
    const double theta  = principal_angle(sx, sy, 2.0 * txy);
    return PrincipalStressState(center + radius, center - radius, theta_x + theta);
}

bool StressState::is_zero() const
{
    return PlaneAlgebra::approx_zero(sx) && PlaneAlgebra::approx_zero(sy)
        && PlaneAlgebra::approx_zero(txy);
}

StressState StressState::operator+(const StressState& o) const
{
    const StressState b = o.transform(theta_x - o.theta_x);
    return StressState(sx + b.sx, sy + b.sy, txy + b.txy, theta_x);
}

StressState StressState::operator-(const StressState& o) const
{
    return *this + (-o);
}

StressState StressState::operator-() const
{
    return StressState(-sx, -sy, -txy, theta_x);
}

StressState StressState::operator*(double k) const
{
    return StressState(k * sx, k * sy, k * txy, theta_x);
}

// ============================================================================
// Principal states
// ============================================================================

StrainState PrincipalStrainState::to_strain() const
{
    return as_principal_frame().transform(-theta1);
}

StressState PrincipalStressState::to_stress() const
{
    return StressState(s1, s2, 0.0, theta1).transform(-theta1);
}
