/**
 * test_plane_state.cpp — Plane strain/stress algebra
 *
 * Verifies principal extraction (including the axis-aligned, 45° and
 * negative-zero shear cases), the principal/Cartesian round trip, the
 * snapped direction cosines and tangent sentinel, and the stiffness
 * transformation.
 */

#include "plane_state.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

static bool nearly_equal(double a, double b, double tol = 1e-9) {
    const double denom = std::max(std::abs(b), 1.0);
    return std::abs(a - b) / denom < tol;
}

static bool check(const char* name, bool pass, bool& all_pass) {
    std::cout << (pass ? "[PASS] " : "[FAIL] ") << name << "\n";
    if (!pass) all_pass = false;
    return pass;
}

int main()
{
    std::cout << "=== PLANE STATE ALGEBRA TEST ===\n\n";
    bool all_pass = true;
    const double deg = PlaneAlgebra::PI / 180.0;

    // Uniaxial, already principal
    {
        const PrincipalStrainState p = StrainState(0.001, -0.0005, 0.0).to_principal();
        check("axis-aligned principal strains",
              nearly_equal(p.e1, 0.001) && nearly_equal(p.e2, -0.0005) && p.theta1 == 0.0,
              all_pass);
    }

    // ey > ex, no shear: theta1 = 90°
    {
        const PrincipalStrainState p = StrainState(-0.0005, 0.001, 0.0).to_principal();
        check("vertical principal direction",
              nearly_equal(p.e1, 0.001) && nearly_equal(p.theta1, 90.0 * deg), all_pass);
    }

    // Negative zero shear must not flip the angle to -90°
    {
        const PrincipalStrainState p = StrainState(-0.0005, 0.001, -0.0).to_principal();
        check("negative zero shear", nearly_equal(p.theta1, 90.0 * deg), all_pass);
    }

    // Pure shear, both signs
    {
        const PrincipalStrainState pos = StrainState(0.0, 0.0, 0.002).to_principal();
        const PrincipalStrainState neg = StrainState(0.0, 0.0, -0.002).to_principal();
        check("positive pure shear at 45°",
              nearly_equal(pos.e1, 0.001) && nearly_equal(pos.e2, -0.001)
              && nearly_equal(pos.theta1, 45.0 * deg), all_pass);
        check("negative pure shear at -45°",
              nearly_equal(neg.e1, 0.001) && nearly_equal(neg.theta1, -45.0 * deg), all_pass);
    }

    // Zero state
    {
        const PrincipalStrainState p = StrainState().to_principal();
        check("zero state", p.e1 == 0.0 && p.e2 == 0.0 && p.theta1 == 0.0, all_pass);
    }

    // Round trip and ordering
    {
        const double cases[][3] = {
            {0.0003, -0.0007, 0.0011},
            {-0.0012, -0.0002, -0.0004},
            {0.0021, 0.0009, 0.0},
            {0.0004, 0.0004, -0.0015}
        };
        bool pass = true;
        for (const auto& c : cases) {
            const StrainState e(c[0], c[1], c[2]);
            const PrincipalStrainState p = e.to_principal();
            const StrainState back = p.to_strain();
            pass = pass && p.e1 >= p.e2
                && std::abs(back.ex - e.ex) < 1e-12
                && std::abs(back.ey - e.ey) < 1e-12
                && std::abs(back.gxy - e.gxy) < 1e-12;
        }
        check("principal round trip", pass, all_pass);
    }

    // Stress principal: pure shear tau = 2
    {
        const PrincipalStressState p = StressState(0.0, 0.0, 2.0).to_principal();
        const StressState back = p.to_stress();
        check("pure shear principal stresses",
              nearly_equal(p.s1, 2.0) && nearly_equal(p.s2, -2.0)
              && nearly_equal(p.theta1, 45.0 * deg)
              && std::abs(back.txy - 2.0) < 1e-12 && std::abs(back.sx) < 1e-12, all_pass);
    }

    // Rotation keeps the invariants
    {
        const StrainState e(0.0008, -0.0003, 0.0005);
        const StrainState r = e.transform(30.0 * deg);
        const StrainState h = r.to_horizontal();
        check("rotation preserves trace", nearly_equal(r.ex + r.ey, e.ex + e.ey), all_pass);
        check("rotation back to horizontal",
              std::abs(h.ex - e.ex) < 1e-12 && std::abs(h.gxy - e.gxy) < 1e-12
              && h.theta_x == 0.0, all_pass);
    }

    // Direction cosines and tangent sentinel
    {
        const auto cs = PlaneAlgebra::direction_cosines(90.0 * deg);
        check("cos(90°) snaps to zero", cs[0] == 0.0 && cs[1] == 1.0, all_pass);
        check("tan(90°) sentinel", PlaneAlgebra::tangent(90.0 * deg) == PlaneAlgebra::TANGENT_SENTINEL,
              all_pass);
        check("tan(-90°) sentinel", PlaneAlgebra::tangent(-90.0 * deg) == -PlaneAlgebra::TANGENT_SENTINEL,
              all_pass);
        check("tan(45°)", nearly_equal(PlaneAlgebra::tangent(45.0 * deg), 1.0), all_pass);
        check("tan is finite everywhere", std::isfinite(PlaneAlgebra::tangent(270.0 * deg)), all_pass);
    }

    // Isotropic stiffness (nu = 0) is rotation invariant
    {
        const double E = 30000.0;
        const Eigen::Matrix3d K = PlaneAlgebra::principal_to_cartesian(E, E, 0.5 * E, 27.0 * deg);
        Eigen::Matrix3d expected = Eigen::Matrix3d::Zero();
        expected.diagonal() << E, E, 0.5 * E;
        check("isotropic stiffness invariant", (K - expected).norm() < 1e-8, all_pass);
        check("transformed stiffness symmetric",
              (K - K.transpose()).norm() < 1e-8, all_pass);
        check("shear modulus guard", PlaneAlgebra::shear_modulus(0.0, 0.0) == 0.0, all_pass);
    }

    // Stress <-> strain through a stiffness matrix
    {
        Eigen::Matrix3d K;
        K << 20000.0, 3000.0, 0.0,
             3000.0, 15000.0, 0.0,
             0.0, 0.0, 8000.0;
        const StrainState e(0.0002, -0.0001, 0.0003);
        const StressState s = StressState::from_strains(e, K);
        const StrainState back = StrainState::from_stresses(s, K);
        check("from_stresses inverts from_strains",
              std::abs(back.ex - e.ex) < 1e-14 && std::abs(back.gxy - e.gxy) < 1e-14, all_pass);

        bool threw = false;
        try {
            (void)StrainState::from_stresses(s, Eigen::Matrix3d::Zero());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        check("singular stiffness rejected", threw, all_pass);
    }

    std::cout << "\n=== OVERALL: " << (all_pass ? "PASS" : "FAIL") << " ===\n";
    return all_pass ? 0 : 1;
}
