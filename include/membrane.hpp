#ifndef MEMBRANE_HPP
#define MEMBRANE_HPP

#include "concrete.hpp"
#include "crack.hpp"
#include "material.hpp"
#include "plane_state.hpp"
#include "reinforcement.hpp"

#include <Eigen/Dense>
#include <array>
#include <optional>
#include <string>

/// Approach that produced the governing DSFM crack slip.
enum class SlipApproach {
    None,
    StressBased,    // Walraven shear-slip relation
    RotationLag     // lag between stress and strain field rotation
};

std::string slip_approach_name(SlipApproach approach);

/**
 * @brief Reinforced concrete membrane element.
 *
 * Composes biaxial concrete and smeared web reinforcement. calculate()
 * evaluates the element at an applied strain state:
 *
 *   MCFT  concrete and steel at the applied strains, crack check
 *   DSFM  concrete at applied - crack slip, steel at applied,
 *         crack slip update, crack check
 *   SMM   Poisson effect removed at the average principal direction,
 *         concrete and steel at the decoupled strains, crack check
 */
class Membrane {
public:
    Membrane(const ConcreteParameters& concrete, const WebReinforcement& reinforcement,
             double width, ConstitutiveModel model, bool consider_slip = true);

    void calculate(const StrainState& applied);

    /// Concrete + reinforcement stresses.
    StressState average_stresses() const;

    /// Concrete + reinforcement secant stiffness.
    Eigen::Matrix3d stiffness() const;

    /// Uncracked concrete + elastic steel; depends only on the parameters.
    Eigen::Matrix3d initial_stiffness() const;

    const BiaxialConcrete& concrete() const { return concrete_; }
    const WebReinforcement& reinforcement() const { return reinforcement_; }
    ConstitutiveModel model() const { return model_; }
    double width() const { return width_; }
    bool consider_slip() const { return consider_slip_; }
    bool cracked() const { return concrete_.cracked(); }

    const StrainState& average_strains() const { return average_strains_; }
    const PrincipalStrainState& average_principal_strains() const { return average_principal_strains_; }
    const StrainState& crack_slip_strains() const { return slip_strains_; }
    StrainState concrete_strains() const { return concrete_.strains().to_horizontal(); }

    /// Average crack spacing at the concrete principal direction.
    double crack_spacing() const;
    double crack_opening() const;

    /// Tension softening length, half the average crack spacing.
    double reference_length() const;

    /// Concrete stiffness times the crack slip strains.
    StressState pseudo_stresses() const;

    const CrackCheckResult& last_crack_check() const { return crack_check_; }
    SlipApproach slip_approach() const { return slip_approach_; }
    double crack_shear() const { return vci_; }
    std::optional<double> initial_crack_angle() const { return theta_ic_; }

    /// Shear stress on the crack from local reinforcement equilibrium, 0 if no root.
    double shear_at_crack() const;

    /// Poisson ratios (nu12, nu21) from the current steel strains.
    std::array<double, 2> poisson_coefficients() const;

private:
    void calculate_mcft(const StrainState& applied);
    void calculate_dsfm(const StrainState& applied);
    void calculate_smm(const StrainState& applied);

    void crack_check();
    void update_crack_slip();
    double stress_slip(double vci) const;
    double rotation_lag_slip() const;
    StrainState remove_poisson_effect(const StrainState& at_principal) const;

    BiaxialConcrete concrete_;
    WebReinforcement reinforcement_;
    double width_;
    ConstitutiveModel model_;
    bool consider_slip_;

    StrainState average_strains_;
    PrincipalStrainState average_principal_strains_;
    StrainState slip_strains_;
    std::optional<double> theta_ic_;

    CrackCheckResult crack_check_;
    SlipApproach slip_approach_ = SlipApproach::None;
    double vci_ = 0.0;
};

#endif // MEMBRANE_HPP
