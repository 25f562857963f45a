#ifndef PLANE_STATE_HPP
#define PLANE_STATE_HPP

#include <Eigen/Dense>
#include <array>

/**
 * @brief Plane (membrane) strain and stress states and their rotations.
 *
 * Sign convention: tension positive. Shear strain is engineering shear
 * (gamma_xy), shear stress is tensor shear (tau_xy). Angles are measured
 * counter-clockwise from the horizontal axis, in radians.
 *
 * Strain transformation to a frame rotated by angle a:
 *
 *        | c²     s²     cs     |
 *   T =  | s²     c²    -cs     |
 *        | -2cs   2cs   c² - s² |
 */
namespace PlaneAlgebra {

constexpr double PI = 3.14159265358979323846;

// Values below this magnitude are snapped to zero in direction cosines
constexpr double SNAP_TOLERANCE = 1e-6;

// Finite stand-in for tan(90°)
constexpr double TANGENT_SENTINEL = 1e15;

inline double to_radians(double degrees) { return degrees * PI / 180.0; }
inline double to_degrees(double radians) { return radians * 180.0 / PI; }

inline bool approx_zero(double value, double tol = 1e-12) {
    return value < tol && value > -tol;
}

/// (cos a, sin a), optionally with |x| < SNAP_TOLERANCE snapped to 0.
std::array<double, 2> direction_cosines(double angle, bool snap = true);

/// tan(a), returning +/-TANGENT_SENTINEL where the snapped cosine vanishes.
double tangent(double angle);

/// Strain transformation matrix T(a).
Eigen::Matrix3d transformation_matrix(double angle);

/// Stiffness in Cartesian axes from principal-axis moduli: Tᵀ·diag(E1,E2,G)·T.
Eigen::Matrix3d principal_to_cartesian(double E1, double E2, double G, double angle);

/// Shear modulus E1·E2/(E1+E2), zero when the denominator vanishes.
double shear_modulus(double E1, double E2);

} // namespace PlaneAlgebra

struct PrincipalStrainState;
struct PrincipalStressState;
struct StressState;

struct StrainState {
    double ex = 0.0;
    double ey = 0.0;
    double gxy = 0.0;
    double theta_x = 0.0;   // angle of the state's x axis to the horizontal

    StrainState() = default;
    StrainState(double ex_, double ey_, double gxy_, double theta = 0.0)
        : ex(ex_), ey(ey_), gxy(gxy_), theta_x(theta) {}

    static StrainState from_vector(const Eigen::Vector3d& v, double theta = 0.0);

    /// Solves K·ε = σ (LU); throws std::runtime_error if K is singular.
    static StrainState from_stresses(const StressState& stresses, const Eigen::Matrix3d& K);

    Eigen::Vector3d as_vector() const { return Eigen::Vector3d(ex, ey, gxy); }

    /// Same state expressed in a frame rotated by @p angle.
    StrainState transform(double angle) const;
    StrainState to_horizontal() const { return transform(-theta_x); }

    PrincipalStrainState to_principal() const;

    bool is_zero() const;

    StrainState operator+(const StrainState& o) const;
    StrainState operator-(const StrainState& o) const;
    StrainState operator-() const;
    StrainState operator*(double k) const;
};

inline StrainState operator*(double k, const StrainState& s) { return s * k; }

struct StressState {
    double sx = 0.0;
    double sy = 0.0;
    double txy = 0.0;
    double theta_x = 0.0;

    StressState() = default;
    StressState(double sx_, double sy_, double txy_, double theta = 0.0)
        : sx(sx_), sy(sy_), txy(txy_), theta_x(theta) {}

    static StressState from_vector(const Eigen::Vector3d& v, double theta = 0.0);

    /// σ = K·ε
    static StressState from_strains(const StrainState& strains, const Eigen::Matrix3d& K);

    Eigen::Vector3d as_vector() const { return Eigen::Vector3d(sx, sy, txy); }

    StressState transform(double angle) const;
    StressState to_horizontal() const { return transform(-theta_x); }

    PrincipalStressState to_principal() const;

    bool is_zero() const;

    StressState operator+(const StressState& o) const;
    StressState operator-(const StressState& o) const;
    StressState operator-() const;
    StressState operator*(double k) const;
};

inline StressState operator*(double k, const StressState& s) { return s * k; }

/**
 * @brief Principal strains, e1 >= e2, theta1 from the horizontal to e1.
 */
struct PrincipalStrainState {
    double e1 = 0.0;
    double e2 = 0.0;
    double theta1 = 0.0;

    PrincipalStrainState() = default;
    PrincipalStrainState(double e1_, double e2_, double theta)
        : e1(e1_), e2(e2_), theta1(theta) {}

    double theta2() const { return theta1 - 0.5 * PlaneAlgebra::PI; }

    /// Cartesian state in the horizontal frame.
    StrainState to_strain() const;

    /// (e1, e2, 0) in the principal frame.
    StrainState as_principal_frame() const { return StrainState(e1, e2, 0.0, theta1); }
};

struct PrincipalStressState {
    double s1 = 0.0;
    double s2 = 0.0;
    double theta1 = 0.0;

    PrincipalStressState() = default;
    PrincipalStressState(double s1_, double s2_, double theta)
        : s1(s1_), s2(s2_), theta1(theta) {}

    double theta2() const { return theta1 - 0.5 * PlaneAlgebra::PI; }

    StressState to_stress() const;
};

#endif // PLANE_STATE_HPP
