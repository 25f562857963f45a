/**
 * test_reinforcement.cpp — Steel law and smeared web reinforcement
 *
 * Checks the elastic-perfectly-plastic law, the bar ratio from two layers,
 * the orthogonal-grid stiffness diag(rho_x·Esx, rho_y·Esy, 0), capacity
 * reserve and the projection on a skewed bar direction.
 */

#include "material.hpp"
#include "plane_state.hpp"
#include "reinforcement.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

static bool nearly_equal(double a, double b, double tol = 1e-9) {
    const double denom = std::max(std::abs(b), 1e-15);
    return std::abs(a - b) / denom < tol;
}

static void report(const char* name, bool pass, bool& all_pass) {
    std::cout << (pass ? "[PASS] " : "[FAIL] ") << name << "\n";
    if (!pass) all_pass = false;
}

int main()
{
    std::cout << "=== REINFORCEMENT TEST ===\n\n";
    bool all_pass = true;
    const double half_pi = 0.5 * PlaneAlgebra::PI;

    // --- Steel law ---
    const Steel steel(400.0, 200000.0);
    report("elastic branch", nearly_equal(steel.stress(0.001), 200.0), all_pass);
    report("tension yield plateau", nearly_equal(steel.stress(0.01), 400.0), all_pass);
    report("compression yield plateau", nearly_equal(steel.stress(-0.01), -400.0), all_pass);
    report("secant modulus at zero strain", steel.secant_modulus(0.0) == 200000.0, all_pass);
    report("secant modulus after yield", nearly_equal(steel.secant_modulus(0.01), 40000.0), all_pass);

    {
        bool threw = false;
        try {
            Steel bad(0.0, 200000.0);
            (void)bad;
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        report("non-positive yield stress rejected", threw, all_pass);
    }

    // --- Ratio from bars (PV10 X direction) ---
    const Steel pv10_steel(276.0, 200000.0);
    const ReinforcementDirection x =
        ReinforcementDirection::from_bars(6.35, 50.55, 70.0, pv10_steel, 0.0);
    const ReinforcementDirection y =
        ReinforcementDirection::from_bars(4.70, 49.57, 70.0, pv10_steel, half_pi);
    {
        const double expected = PlaneAlgebra::PI * 6.35 * 6.35 / (2.0 * 50.55 * 70.0);
        report("ratio from bars", nearly_equal(x.ratio(), expected), all_pass);
        report("PV10 rho_x close to 0.0179", std::abs(x.ratio() - 0.0179) < 1e-4, all_pass);
        report("crack spacing phi/(5.4 rho)",
               nearly_equal(x.crack_spacing(), 6.35 / (5.4 * x.ratio())), all_pass);
    }

    // --- Orthogonal web ---
    WebReinforcement web(x, y);
    const StrainState e(0.001, 0.0005, 0.0003);
    web.calculate(e);
    {
        const auto& dx = *web.x();
        const auto& dy = *web.y();
        report("X bar strain equals ex", nearly_equal(dx.strain(), 0.001), all_pass);
        report("Y bar strain equals ey", nearly_equal(dy.strain(), 0.0005), all_pass);

        const Eigen::Matrix3d K = web.stiffness();
        const bool diagonal = std::abs(K(0, 1)) < 1e-12 && std::abs(K(0, 2)) < 1e-12
                           && std::abs(K(1, 2)) < 1e-12 && std::abs(K(2, 2)) < 1e-12;
        report("orthogonal stiffness is diagonal", diagonal, all_pass);
        report("K11 = rho_x·Esx", nearly_equal(K(0, 0), dx.ratio() * 200000.0), all_pass);
        report("K22 = rho_y·Esy", nearly_equal(K(1, 1), dy.ratio() * 200000.0), all_pass);

        const StressState s = web.stresses();
        report("smeared sigma_x", nearly_equal(s.sx, dx.ratio() * 200.0), all_pass);
        report("smeared sigma_y", nearly_equal(s.sy, dy.ratio() * 100.0), all_pass);
        report("no smeared shear", std::abs(s.txy) < 1e-12, all_pass);

        report("capacity reserve", nearly_equal(dx.capacity_reserve(), dx.ratio() * (276.0 - 200.0)),
               all_pass);
        report("strain state of bars",
               nearly_equal(web.strains().ex, 0.001) && web.strains().gxy == 0.0, all_pass);
    }

    // Yielded X bars: reserve vanishes, secant modulus drops
    {
        web.calculate(StrainState(0.004, 0.0, 0.0));
        report("yielded reserve is zero", std::abs(web.x()->capacity_reserve()) < 1e-12, all_pass);
        report("yielded secant stiffness",
               nearly_equal(web.stiffness()(0, 0), web.x()->ratio() * 276.0 / 0.004), all_pass);
        report("initial stiffness stays elastic",
               nearly_equal(web.initial_stiffness()(0, 0), web.x()->ratio() * 200000.0), all_pass);
    }

    // Angles relative to a principal direction
    {
        const auto a = web.angles(0.6);
        report("angles (theta, theta - 90°)",
               nearly_equal(a[0], 0.6) && nearly_equal(a[1], 0.6 - half_pi), all_pass);

        const WebReinforcement none;
        const auto b = none.angles(0.6);
        report("default angles without reinforcement",
               nearly_equal(b[0], 0.6) && nearly_equal(b[1], 0.6 - half_pi), all_pass);
        report("reinforced direction count", web.reinforced_directions() == 2
               && none.reinforced_directions() == 0, all_pass);
    }

    // Skewed bars at 45° pick up half the shear strain
    {
        ReinforcementDirection skew(0.01, 6.0, steel, 0.25 * PlaneAlgebra::PI);
        skew.calculate(StrainState(0.0, 0.0, 0.0008));
        report("45° bar strain = gamma/2", nearly_equal(skew.strain(), 0.0004), all_pass);

        const Eigen::Matrix3d K = skew.stiffness();
        report("45° bar stiffness symmetric", (K - K.transpose()).norm() < 1e-9, all_pass);
        report("45° bar stiffness K11 = rho·E/4", nearly_equal(K(0, 0), 0.01 * 200000.0 / 4.0, 1e-6),
               all_pass);
    }

    std::cout << "\n=== OVERALL: " << (all_pass ? "PASS" : "FAIL") << " ===\n";
    return all_pass ? 0 : 1;
}
