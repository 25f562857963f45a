#include "material.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string model_name(ConstitutiveModel model)
{
    switch (model) {
        case ConstitutiveModel::MCFT: return "MCFT";
        case ConstitutiveModel::DSFM: return "DSFM";
        case ConstitutiveModel::SMM:  return "SMM";
    }
    return "unknown";
}

// ============================================================================
// ConcreteParameters
// ============================================================================

ConcreteParameters::ConcreteParameters(double fc, double aggregate_diameter,
                                       ConstitutiveModel model,
                                       double fcr, double Ec)
    : fc_(fc), phi_ag_(aggregate_diameter), fcr_(fcr), Ec_(Ec)
{
    if (fc <= 0.0)
        throw std::invalid_argument("Concrete compressive strength must be positive");
    if (aggregate_diameter < 0.0)
        throw std::invalid_argument("Aggregate diameter must be non-negative");
    if (fcr < 0.0 || Ec < 0.0)
        throw std::invalid_argument("Concrete tensile strength and modulus must be positive");

    const double root = std::sqrt(fc);
    const bool smm = (model == ConstitutiveModel::SMM);

    if (fcr_ == 0.0)
        fcr_ = smm ? 0.31 * root : 0.33 * root;
    if (Ec_ == 0.0)
        Ec_ = smm ? 3875.0 * root : 2.0 * fc / std::abs(eps0_);
}

// ============================================================================
// Steel
// ============================================================================

Steel::Steel(double fy, double Es)
    : fy_(fy), Es_(Es)
{
    if (fy <= 0.0)
        throw std::invalid_argument("Steel yield stress must be positive");
    if (Es <= 0.0)
        throw std::invalid_argument("Steel elastic modulus must be positive");
}

double Steel::stress(double strain) const
{
    const double magnitude = std::min(Es_ * std::abs(strain), fy_);
    return strain < 0.0 ? -magnitude : magnitude;
}

double Steel::secant_modulus(double strain) const
{
    if (strain == 0.0) return Es_;
    return stress(strain) / strain;
}
