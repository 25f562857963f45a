#include "reinforcement.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

// ============================================================================
// ReinforcementDirection
// ============================================================================

ReinforcementDirection::ReinforcementDirection(double ratio, double bar_diameter,
                                               const Steel& steel, double angle)
    : rho_(ratio), phi_(bar_diameter), angle_(angle), steel_(steel)
{
    if (ratio < 0.0)
        throw std::invalid_argument("Reinforcement ratio must be non-negative");
    if (bar_diameter < 0.0)
        throw std::invalid_argument("Bar diameter must be non-negative");
}

ReinforcementDirection ReinforcementDirection::from_bars(double bar_diameter, double spacing,
                                                         double width, const Steel& steel,
                                                         double angle)
{
    if (spacing <= 0.0)
        throw std::invalid_argument("Bar spacing must be positive");
    if (width <= 0.0)
        throw std::invalid_argument("Panel width must be positive");

    const double rho = PlaneAlgebra::PI * bar_diameter * bar_diameter / (2.0 * spacing * width);
    return ReinforcementDirection(rho, bar_diameter, steel, angle);
}

double ReinforcementDirection::projected_strain(const StrainState& strains) const
{
    const StrainState e = strains.to_horizontal();
    const auto cs = PlaneAlgebra::direction_cosines(angle_);
    const double c = cs[0], s = cs[1];
    return e.ex * c * c + e.ey * s * s + e.gxy * s * c;
}

void ReinforcementDirection::calculate(const StrainState& strains)
{
    strain_ = projected_strain(strains);
    stress_ = steel_.stress(strain_);
}

double ReinforcementDirection::crack_spacing() const
{
    if (rho_ <= 0.0 || phi_ <= 0.0) return 0.0;
    return phi_ / (5.4 * rho_);
}

Eigen::Vector3d ReinforcementDirection::stresses() const
{
    const auto cs = PlaneAlgebra::direction_cosines(angle_);
    const double c = cs[0], s = cs[1];
    return rho_ * stress_ * Eigen::Vector3d(c * c, s * s, c * s);
}

Eigen::Matrix3d ReinforcementDirection::projection() const
{
    const auto cs = PlaneAlgebra::direction_cosines(angle_);
    const double c = cs[0], s = cs[1];
    const double c2 = c * c, s2 = s * s;

    Eigen::Matrix3d P;
    P << c2 * c2,  c2 * s2,  c2 * c * s,
         c2 * s2,  s2 * s2,  c * s2 * s,
         c2 * c * s, c * s2 * s, c2 * s2;
    return P;
}

Eigen::Matrix3d ReinforcementDirection::stiffness() const
{
    return rho_ * steel_.secant_modulus(strain_) * projection();
}

Eigen::Matrix3d ReinforcementDirection::initial_stiffness() const
{
    return rho_ * steel_.elastic_modulus() * projection();
}

// ============================================================================
// WebReinforcement
// ============================================================================

WebReinforcement::WebReinforcement(std::optional<ReinforcementDirection> x,
                                   std::optional<ReinforcementDirection> y)
    : x_(std::move(x)), y_(std::move(y))
{
}

int WebReinforcement::reinforced_directions() const
{
    int n = 0;
    if (x_ && x_->ratio() > 0.0) ++n;
    if (y_ && y_->ratio() > 0.0) ++n;
    return n;
}

void WebReinforcement::calculate(const StrainState& strains)
{
    if (x_) x_->calculate(strains);
    if (y_) y_->calculate(strains);
}

StressState WebReinforcement::stresses() const
{
    Eigen::Vector3d s = Eigen::Vector3d::Zero();
    if (x_) s += x_->stresses();
    if (y_) s += y_->stresses();
    return StressState::from_vector(s);
}

Eigen::Matrix3d WebReinforcement::stiffness() const
{
    Eigen::Matrix3d K = Eigen::Matrix3d::Zero();
    if (x_) K += x_->stiffness();
    if (y_) K += y_->stiffness();
    return K;
}

Eigen::Matrix3d WebReinforcement::initial_stiffness() const
{
    Eigen::Matrix3d K = Eigen::Matrix3d::Zero();
    if (x_) K += x_->initial_stiffness();
    if (y_) K += y_->initial_stiffness();
    return K;
}

StrainState WebReinforcement::strains() const
{
    return StrainState(x_ ? x_->strain() : 0.0, y_ ? y_->strain() : 0.0, 0.0);
}

std::array<double, 2> WebReinforcement::angles(double theta1) const
{
    const double alpha_x = x_ ? x_->angle() : 0.0;
    const double alpha_y = y_ ? y_->angle() : 0.5 * PlaneAlgebra::PI;
    return {theta1 - alpha_x, theta1 - alpha_y};
}

double WebReinforcement::bond_coefficient(double theta1) const
{
    const auto theta_n = angles(theta1);
    double sum = 0.0;
    if (x_ && x_->bar_diameter() > 0.0)
        sum += 4.0 * x_->ratio() / x_->bar_diameter()
             * std::abs(PlaneAlgebra::direction_cosines(theta_n[0])[0]);
    if (y_ && y_->bar_diameter() > 0.0)
        sum += 4.0 * y_->ratio() / y_->bar_diameter()
             * std::abs(PlaneAlgebra::direction_cosines(theta_n[1])[0]);
    return sum;
}
