#ifndef REINFORCEMENT_HPP
#define REINFORCEMENT_HPP

#include "material.hpp"
#include "plane_state.hpp"

#include <Eigen/Dense>
#include <array>
#include <cmath>
#include <optional>

/**
 * @brief Smeared reinforcement in one direction of a membrane.
 *
 * The direction's angle is measured from the horizontal axis (0 for X bars,
 * 90° for Y bars). Stresses are bar stresses; smeared contributions are
 * multiplied by the ratio.
 */
class ReinforcementDirection {
public:
    ReinforcementDirection(double ratio, double bar_diameter, const Steel& steel,
                           double angle = 0.0);

    /// Ratio from bars in two layers: pi·phi²/(2·s·w).
    static ReinforcementDirection from_bars(double bar_diameter, double spacing,
                                            double width, const Steel& steel,
                                            double angle = 0.0);

    /// Strain along the bars for a Cartesian strain state.
    double projected_strain(const StrainState& strains) const;

    void calculate(const StrainState& strains);

    /// Bar stress at @p strain without changing the stored state.
    double stress_at(double strain) const { return steel_.stress(strain); }

    double ratio() const { return rho_; }
    double bar_diameter() const { return phi_; }
    double angle() const { return angle_; }
    const Steel& steel() const { return steel_; }
    double strain() const { return strain_; }
    double stress() const { return stress_; }
    bool yielded() const { return std::abs(strain_) >= steel_.yield_strain(); }

    /// rho·(fy - fs)
    double capacity_reserve() const { return rho_ * (steel_.yield_stress() - stress_); }

    /// phi/(5.4·rho)
    double crack_spacing() const;

    /// Smeared stresses rho·fs·(c², s², cs).
    Eigen::Vector3d stresses() const;

    /// Secant stiffness rho·Esec·(projection).
    Eigen::Matrix3d stiffness() const;
    Eigen::Matrix3d initial_stiffness() const;

private:
    Eigen::Matrix3d projection() const;

    double rho_;
    double phi_;
    double angle_;
    Steel steel_;
    double strain_ = 0.0;
    double stress_ = 0.0;
};

/**
 * @brief Web reinforcement of a membrane: optional X and Y directions.
 */
class WebReinforcement {
public:
    WebReinforcement() = default;
    WebReinforcement(std::optional<ReinforcementDirection> x,
                     std::optional<ReinforcementDirection> y);

    const std::optional<ReinforcementDirection>& x() const { return x_; }
    const std::optional<ReinforcementDirection>& y() const { return y_; }

    /// Number of directions present with a positive ratio.
    int reinforced_directions() const;

    void calculate(const StrainState& strains);

    StressState stresses() const;
    Eigen::Matrix3d stiffness() const;
    Eigen::Matrix3d initial_stiffness() const;

    /// (epsilon_sx, epsilon_sy, 0)
    StrainState strains() const;

    /// Angles between the principal direction @p theta1 and each bar direction.
    std::array<double, 2> angles(double theta1) const;

    /// Ratio-weighted sum of 4·rho/phi·|cos(theta_n)| over both directions.
    double bond_coefficient(double theta1) const;

private:
    std::optional<ReinforcementDirection> x_;
    std::optional<ReinforcementDirection> y_;
};

#endif // REINFORCEMENT_HPP
