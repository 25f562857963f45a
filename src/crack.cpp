#include "crack.hpp"

#include <algorithm>
#include <cmath>

namespace CrackMechanics {

double direction_spacing(const std::optional<ReinforcementDirection>& direction)
{
    if (!direction) return DEFAULT_SPACING;
    const double s = direction->crack_spacing();
    return s > 0.0 ? s : DEFAULT_SPACING;
}

double average_spacing(const WebReinforcement& web, double theta1)
{
    const double smx = direction_spacing(web.x());
    const double smy = direction_spacing(web.y());

    const auto cs = PlaneAlgebra::direction_cosines(theta1);
    const double inverse = std::abs(cs[1]) / smx + std::abs(cs[0]) / smy;
    return 1.0 / inverse;
}

double crack_opening(double spacing, double e1)
{
    if (e1 <= 0.0 || PlaneAlgebra::approx_zero(e1, 1e-9)) return 0.0;
    return spacing * e1;
}

double max_shear_on_crack(double crack_width, const ConcreteParameters& concrete)
{
    const double ag = concrete.aggregate_diameter();
    return 0.18 * std::sqrt(concrete.strength())
         / (0.31 + 24.0 * crack_width / (ag + 16.0));
}

double crack_slip(double vci, double crack_width, const ConcreteParameters& concrete)
{
    if (PlaneAlgebra::approx_zero(vci) || crack_width <= 0.0) return 0.0;

    const double a = std::max(0.234 * std::pow(crack_width, -0.707) - 0.2, 0.0);
    return vci / (1.8 * std::pow(crack_width, -0.8) + a * concrete.strength());
}

CrackCheckResult check(double f1a, const PrincipalStrainState& strains,
                       const ConcreteParameters& concrete,
                       const WebReinforcement& web)
{
    CrackCheckResult r;
    r.f1a = f1a;

    const auto theta_n = web.angles(strains.theta1);
    const double cos_nx = PlaneAlgebra::direction_cosines(theta_n[0])[0];
    const double cos_ny = PlaneAlgebra::direction_cosines(theta_n[1])[0];
    const double tan_nx = std::abs(PlaneAlgebra::tangent(theta_n[0]));
    const double tan_ny = std::abs(PlaneAlgebra::tangent(theta_n[1]));

    const double f1cx = web.x() ? web.x()->capacity_reserve() : 0.0;
    const double f1cy = web.y() ? web.y()->capacity_reserve() : 0.0;

    r.crack_width = crack_opening(average_spacing(web, strains.theta1), strains.e1);
    r.vcimax = max_shear_on_crack(r.crack_width, concrete);

    r.f1b = f1cx * cos_nx * cos_nx + f1cy * cos_ny * cos_ny;
    r.f1c = f1cx + r.vcimax * tan_nx;
    r.f1d = f1cy + r.vcimax * tan_ny;

    r.limit = std::min({r.f1a, r.f1b, r.f1c, r.f1d});
    r.governed = r.limit < r.f1a;
    return r;
}

} // namespace CrackMechanics
