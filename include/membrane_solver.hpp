#ifndef MEMBRANE_SOLVER_HPP
#define MEMBRANE_SOLVER_HPP

#include "membrane.hpp"
#include "plane_state.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

enum class StiffnessUpdate {
    Secant,          // K += ((d_r - K·d_eps)/||d_eps||) ⊗ d_eps
    NewtonRaphson    // K += d_sigma ⊗ d_eps
};

enum class AnalysisControl {
    Stress,
    Strain
};

/**
 * @brief Load-stepping quasi-Newton solver for a membrane element.
 *
 * Stress control drives the residual sigma(eps) - sigma_target to zero at
 * each load step with a secant or Newton stiffness update. Strain control
 * re-evaluates the element at fixed strains until stresses and crack slip
 * stop changing. A step that exhausts its iterations halts the run; the
 * result keeps the last converged state.
 */
class MembraneSolver {
public:
    struct Settings {
        int num_steps;
        int max_iterations;
        int min_iterations;
        double stress_tolerance;
        double strain_tolerance;
        StiffnessUpdate update;
        bool verbose;

        Settings()
            : num_steps(100)
            , max_iterations(10000)
            , min_iterations(2)
            , stress_tolerance(1e-3)
            , strain_tolerance(1e-8)
            , update(StiffnessUpdate::Secant)
            , verbose(false)
        {}
    };

    /// State of one iteration; the solver threads (current, previous) pairs.
    struct IterationRecord {
        StrainState strains;
        StressState stresses;
        StressState residual;
        Eigen::Matrix3d stiffness;

        IterationRecord() : stiffness(Eigen::Matrix3d::Zero()) {}
    };

    struct StepResult {
        int step;
        int iterations;
        StrainState average_strains;
        StressState average_stresses;
        PrincipalStrainState concrete_principal_strains;
        PrincipalStressState concrete_principal_stresses;
        PrincipalStrainState average_principal_strains;
        bool cracked;
        SlipApproach slip_approach;

        StepResult() : step(0), iterations(0), cracked(false),
                       slip_approach(SlipApproach::None) {}
    };

    struct SolverResult {
        bool converged;
        int failed_step;                  // 0 when every step converged
        std::vector<StepResult> steps;
        bool cracked;
        int cracking_step;
        StressState cracking_stresses;
        StressState ultimate_stresses;
        StrainState final_strains;
        Eigen::Matrix3d final_stiffness;
        int total_calculations;

        SolverResult() : converged(false), failed_step(0), cracked(false),
                         cracking_step(0), final_stiffness(Eigen::Matrix3d::Zero()),
                         total_calculations(0) {}
    };

    explicit MembraneSolver(const Settings& settings = Settings());

    /// Stress controlled analysis up to @p applied_stresses.
    SolverResult solve(Membrane& membrane, const StressState& applied_stresses) const;

    /// Strain controlled analysis up to @p applied_strains.
    SolverResult solve(Membrane& membrane, const StrainState& applied_strains) const;

    /// ||r||²/(1 + ||target||²)
    static double convergence(const StressState& residual, const StressState& target);

    /// Stiffness after one update; falls back to @p initial when singular or non-finite.
    Eigen::Matrix3d update_stiffness(const IterationRecord& current,
                                     const IterationRecord& previous,
                                     const Eigen::Matrix3d& initial) const;

    const Settings& settings() const { return settings_; }

private:
    enum class StepOutcome { Converged, Exhausted };

    IterationRecord evaluate(Membrane& membrane, const StrainState& strains,
                             const StressState& target, const Eigen::Matrix3d& stiffness,
                             int& calculations) const;

    StepOutcome stress_step(Membrane& membrane, const StressState& target,
                            const Eigen::Matrix3d& initial, IterationRecord& state,
                            int& iterations, int& calculations) const;

    StepOutcome strain_step(Membrane& membrane, const StrainState& target,
                            IterationRecord& state, int& iterations, int& calculations) const;

    void record_step(SolverResult& result, const Membrane& membrane,
                     const IterationRecord& state, int step, int iterations) const;

    void finish(SolverResult& result, const IterationRecord& state) const;

    Settings settings_;
};

std::string stiffness_update_name(StiffnessUpdate update);
std::string analysis_control_name(AnalysisControl control);

#endif // MEMBRANE_SOLVER_HPP
