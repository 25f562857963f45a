#ifndef CRACK_HPP
#define CRACK_HPP

#include "material.hpp"
#include "plane_state.hpp"
#include "reinforcement.hpp"

#include <optional>

/**
 * @brief Result of the crack-check limiter on the concrete tensile stress.
 *
 *   f1b = f1cx·cos²(thNx) + f1cy·cos²(thNy)          (biaxial yielding)
 *   f1c = f1cx + vcimax·|tan(thNx)|                   (equilibrium in X)
 *   f1d = f1cy + vcimax·|tan(thNy)|                   (equilibrium in Y)
 */
struct CrackCheckResult {
    double f1a;            // average tensile stress before the check
    double f1b;
    double f1c;
    double f1d;
    double limit;          // min(f1a, f1b, f1c, f1d)
    double vcimax;
    double crack_width;
    bool governed;         // limit < f1a

    CrackCheckResult() : f1a(0), f1b(0), f1c(0), f1d(0), limit(0),
                         vcimax(0), crack_width(0), governed(false) {}
};

/**
 * @brief Crack geometry and stress transfer across cracks.
 */
namespace CrackMechanics {

// Spacing used for a direction that is absent or unreinforced (mm)
constexpr double DEFAULT_SPACING = 21.0;

/// phi/(5.4·rho) for the direction, DEFAULT_SPACING when absent or rho <= 0.
double direction_spacing(const std::optional<ReinforcementDirection>& direction);

/// 1/(|sin th|/smx + |cos th|/smy)
double average_spacing(const WebReinforcement& web, double theta1);

/// spacing·e1, zero for non-positive tensile strain.
double crack_opening(double spacing, double e1);

/// 0.18·sqrt(fc)/(0.31 + 24w/(ag + 16))
double max_shear_on_crack(double crack_width, const ConcreteParameters& concrete);

/**
 * @brief Slip along a crack carrying shear @p vci (Walraven):
 *   delta_s = vci/(1.8·w^-0.8 + a·fc),  a = max(0.234·w^-0.707 - 0.2, 0)
 * Zero when vci vanishes or the crack is closed.
 */
double crack_slip(double vci, double crack_width, const ConcreteParameters& concrete);

/// Limits @p f1a with the reinforcement capacity reserve across the crack.
CrackCheckResult check(double f1a, const PrincipalStrainState& strains,
                       const ConcreteParameters& concrete,
                       const WebReinforcement& web);

} // namespace CrackMechanics

#endif // CRACK_HPP
