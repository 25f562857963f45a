#ifndef ROOT_FINDING_HPP
#define ROOT_FINDING_HPP

#include <algorithm>
#include <cmath>

/**
 * @brief Outcome of a bracketed root search.
 *
 * found == false when the interval does not bracket a sign change or the
 * iteration cap is reached; value is then meaningless.
 */
struct RootResult {
    bool found;
    double value;
    int iterations;

    RootResult() : found(false), value(0.0), iterations(0) {}
};

struct RootSettings {
    double tolerance;
    int max_iterations;

    RootSettings() : tolerance(1e-9), max_iterations(1000) {}
};

/**
 * @brief Brent's method (inverse quadratic interpolation with bisection
 *        fallback) on [lower, upper].
 */
template<typename Func>
RootResult brent_find_root(Func f, double lower, double upper,
                           const RootSettings& settings = RootSettings())
{
    RootResult result;

    double a = lower, b = upper;
    double fa = f(a), fb = f(b);

    if (!std::isfinite(fa) || !std::isfinite(fb) || fa * fb > 0.0)
        return result;

    if (fa == 0.0) { result.found = true; result.value = a; return result; }
    if (fb == 0.0) { result.found = true; result.value = b; return result; }

    double c = a, fc = fa;
    double d = b - a, e = d;

    for (int iter = 1; iter <= settings.max_iterations; ++iter) {
        result.iterations = iter;

        if (fb * fc > 0.0) {
            c = a; fc = fa;
            d = b - a; e = d;
        }
        if (std::abs(fc) < std::abs(fb)) {
            a = b;  b = c;  c = a;
            fa = fb; fb = fc; fc = fa;
        }

        const double tol = 2.0 * 1e-16 * std::abs(b) + 0.5 * settings.tolerance;
        const double m = 0.5 * (c - b);

        if (std::abs(m) <= tol || fb == 0.0) {
            result.found = true;
            result.value = b;
            return result;
        }

        if (std::abs(e) >= tol && std::abs(fa) > std::abs(fb)) {
            double p, q;
            const double s = fb / fa;
            if (a == c) {
                // Secant step
                p = 2.0 * m * s;
                q = 1.0 - s;
            } else {
                // Inverse quadratic interpolation
                const double qa = fa / fc;
                const double r = fb / fc;
                p = s * (2.0 * m * qa * (qa - r) - (b - a) * (r - 1.0));
                q = (qa - 1.0) * (r - 1.0) * (s - 1.0);
            }
            if (p > 0.0) q = -q;
            else         p = -p;

            if (2.0 * p < std::min(3.0 * m * q - std::abs(tol * q), std::abs(e * q))) {
                e = d;
                d = p / q;
            } else {
                d = m;
                e = m;
            }
        } else {
            d = m;
            e = m;
        }

        a = b;
        fa = fb;
        b += std::abs(d) > tol ? d : (m > 0.0 ? tol : -tol);
        fb = f(b);

        if (!std::isfinite(fb))
            return RootResult();
    }

    return RootResult();
}

#endif // ROOT_FINDING_HPP
