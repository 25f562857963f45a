#ifndef CONCRETE_HPP
#define CONCRETE_HPP

#include "material.hpp"
#include "plane_state.hpp"
#include "reinforcement.hpp"

#include <Eigen/Dense>

/**
 * @brief Concrete under biaxial (membrane) strains.
 *
 * Evaluates principal stresses from principal strains with the law of the
 * selected model, latches the cracked flag once e1 reaches the cracking
 * strain, and builds the secant stiffness
 *
 *   K = Tᵀ(theta1)·diag(E1, E2, G)·T(theta1),   G = E1·E2/(E1 + E2)
 *
 * Compression softening is applied only after cracking, so the uncracked
 * response is the same for every model sharing the same parameters.
 */
class BiaxialConcrete {
public:
    BiaxialConcrete(const ConcreteParameters& parameters, ConstitutiveModel model,
                    bool consider_slip = true);

    /**
     * @brief Evaluate stresses for @p strains.
     * @param reinforcement   Web reinforcement (tension stiffening in DSFM)
     * @param reference_length  Tension softening length (DSFM), <= 0 disables softening
     */
    void calculate(const StrainState& strains, const WebReinforcement& reinforcement,
                   double reference_length = 0.0);

    /// Overwrite the principal tensile stress (crack check).
    void set_tensile_stress(double f1);

    const ConcreteParameters& parameters() const { return params_; }
    ConstitutiveModel model() const { return model_; }
    bool cracked() const { return cracked_; }

    const StrainState& strains() const { return strains_; }
    const PrincipalStrainState& principal_strains() const { return principal_strains_; }
    const PrincipalStressState& principal_stresses() const { return principal_stresses_; }

    /// Cartesian stresses in the horizontal frame.
    StressState stresses() const;

    double secant_modulus_1() const { return E1_; }
    double secant_modulus_2() const { return E2_; }

    Eigen::Matrix3d stiffness() const;

    /// Uncracked isotropic stiffness: diag(Ec, Ec, Ec/2).
    Eigen::Matrix3d initial_stiffness() const;

    // Individual constitutive laws, exposed for testing.
    double tensile_stress(double e1, const WebReinforcement& reinforcement,
                          double reference_length) const;
    double compressive_stress(double e1, double e2) const;

    /// DSFM compression softening 1/(1 + Cs·Cd).
    double dsfm_softening(double e1, double e2) const;

    /// MCFT compression softening 1/(0.8 + 170·e1), at most 1.
    double mcft_softening(double e1) const;

    /// SMM softening coefficient zeta.
    double smm_softening(double e1) const;

private:
    double mcft_tension(double e1) const;
    double dsfm_tension(double e1, const WebReinforcement& reinforcement,
                        double reference_length) const;
    double smm_tension(double e1) const;

    double mcft_compression(double e1, double e2) const;
    double dsfm_compression(double e1, double e2) const;
    double smm_compression(double e1, double e2) const;

    double principal_stress(double strain, double e1, const WebReinforcement& reinforcement,
                            double reference_length) const;
    void update_moduli();

    ConcreteParameters params_;
    ConstitutiveModel model_;
    bool consider_slip_;
    bool cracked_ = false;

    StrainState strains_;
    PrincipalStrainState principal_strains_;
    PrincipalStressState principal_stresses_;
    double E1_;
    double E2_;
};

#endif // CONCRETE_HPP
