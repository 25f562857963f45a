/**
 * membrane_solver.cpp — Load-stepping solver for membrane elements
 *
 * Stress control, step k of N (target sigma_k = k/N · sigma):
 *   seed       eps = eps_prev + K⁻¹(sigma_k - sigma_prev)
 *   iterate    r = sigma(eps) - sigma_k,  K·d_eps = -r
 *   converge   ||r||²/(1 + ||sigma_k||²) <= tol, after min_iterations
 *
 * Stiffness updates between iterations (d = current - previous):
 *   secant     K += ((d_r - K·d_eps)/||d_eps||) ⊗ d_eps
 *   newton     K += d_sigma ⊗ d_eps
 */

#include "membrane_solver.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace
{
    bool finite(const StressState& s)
    {
        return std::isfinite(s.sx) && std::isfinite(s.sy) && std::isfinite(s.txy);
    }

    // Solves K·x = rhs; false when K is singular or the solution is not finite.
    bool solve_linear(const Eigen::Matrix3d& K, const Eigen::Vector3d& rhs, Eigen::Vector3d& x)
    {
        if (!K.allFinite()) return false;
        Eigen::FullPivLU<Eigen::Matrix3d> lu(K);
        if (!lu.isInvertible()) return false;
        x = lu.solve(rhs);
        return x.allFinite();
    }
}

std::string stiffness_update_name(StiffnessUpdate update)
{
    return update == StiffnessUpdate::Secant ? "secant" : "newton";
}

std::string analysis_control_name(AnalysisControl control)
{
    return control == AnalysisControl::Stress ? "stress" : "strain";
}

MembraneSolver::MembraneSolver(const Settings& settings)
    : settings_(settings)
{
    if (settings.num_steps <= 0)
        throw std::invalid_argument("Number of load steps must be positive");
    if (settings.max_iterations <= 0)
        throw std::invalid_argument("Maximum iterations must be positive");
    if (settings.min_iterations < 1 || settings.min_iterations > settings.max_iterations)
        throw std::invalid_argument("Minimum iterations must lie in [1, max_iterations]");
    if (settings.stress_tolerance <= 0.0 || settings.strain_tolerance <= 0.0)
        throw std::invalid_argument("Convergence tolerances must be positive");
}

double MembraneSolver::convergence(const StressState& residual, const StressState& target)
{
    return residual.as_vector().squaredNorm() / (1.0 + target.as_vector().squaredNorm());
}

// ============================================================================
// Stiffness update
// ============================================================================

Eigen::Matrix3d MembraneSolver::update_stiffness(const IterationRecord& current,
                                                 const IterationRecord& previous,
                                                 const Eigen::Matrix3d& initial) const
{
    const Eigen::Vector3d d_eps = current.strains.as_vector() - previous.strains.as_vector();
    const double norm2 = d_eps.squaredNorm();
    if (norm2 == 0.0) return current.stiffness;

    const Eigen::Matrix3d& K = current.stiffness;
    Eigen::Matrix3d dK;

    switch (settings_.update) {
        case StiffnessUpdate::Secant: {
            const Eigen::Vector3d d_r = current.residual.as_vector() - previous.residual.as_vector();
            dK = ((d_r - K * d_eps) / std::sqrt(norm2)) * d_eps.transpose();
            break;
        }
        case StiffnessUpdate::NewtonRaphson: {
            const Eigen::Vector3d d_sigma = current.stresses.as_vector() - previous.stresses.as_vector();
            dK = d_sigma * d_eps.transpose();
            break;
        }
    }

    const Eigen::Matrix3d updated = K + dK;
    if (!updated.allFinite()) return initial;

    Eigen::FullPivLU<Eigen::Matrix3d> lu(updated);
    if (!lu.isInvertible()) return initial;

    return updated;
}

// ============================================================================
// Stress control
// ============================================================================

MembraneSolver::IterationRecord MembraneSolver::evaluate(Membrane& membrane,
                                                         const StrainState& strains,
                                                         const StressState& target,
                                                         const Eigen::Matrix3d& stiffness,
                                                         int& calculations) const
{
    membrane.calculate(strains);
    ++calculations;

    IterationRecord rec;
    rec.strains = strains;
    rec.stresses = membrane.average_stresses();
    rec.residual = rec.stresses - target;
    rec.stiffness = stiffness;
    return rec;
}

MembraneSolver::StepOutcome MembraneSolver::stress_step(Membrane& membrane,
                                                        const StressState& target,
                                                        const Eigen::Matrix3d& initial,
                                                        IterationRecord& state,
                                                        int& iterations,
                                                        int& calculations) const
{
    IterationRecord previous = state;
    Eigen::Matrix3d K = state.stiffness;

    // Initial guess from the last converged stiffness
    Eigen::Vector3d d_eps;
    const Eigen::Vector3d d_sigma = target.as_vector() - state.stresses.as_vector();
    if (!solve_linear(K, d_sigma, d_eps)) {
        K = initial;
        if (!solve_linear(K, d_sigma, d_eps))
            return StepOutcome::Exhausted;
    }

    IterationRecord current = evaluate(membrane, state.strains + StrainState::from_vector(d_eps),
                                       target, K, calculations);

    for (int it = 1; ; ++it) {
        iterations = it;

        if (!finite(current.residual))
            return StepOutcome::Exhausted;

        if (it >= settings_.min_iterations
            && convergence(current.residual, target) <= settings_.stress_tolerance) {
            state = current;
            return StepOutcome::Converged;
        }

        if (it >= settings_.max_iterations)
            return StepOutcome::Exhausted;

        if (it > 1)
            current.stiffness = update_stiffness(current, previous, initial);

        if (!solve_linear(current.stiffness, -current.residual.as_vector(), d_eps)) {
            current.stiffness = initial;
            if (!solve_linear(current.stiffness, -current.residual.as_vector(), d_eps))
                return StepOutcome::Exhausted;
        }

        previous = current;
        current = evaluate(membrane, current.strains + StrainState::from_vector(d_eps),
                           target, current.stiffness, calculations);
    }
}

MembraneSolver::SolverResult MembraneSolver::solve(Membrane& membrane,
                                                   const StressState& applied_stresses) const
{
    SolverResult result;
    const StressState applied = applied_stresses.to_horizontal();
    const Eigen::Matrix3d initial = membrane.initial_stiffness();

    IterationRecord state;
    state.stiffness = initial;

    int calculations = 0;

    for (int step = 1; step <= settings_.num_steps; ++step) {
        const StressState target = applied * (static_cast<double>(step) / settings_.num_steps);

        int iterations = 0;
        if (stress_step(membrane, target, initial, state, iterations, calculations)
            == StepOutcome::Exhausted) {
            result.failed_step = step;
            result.total_calculations = calculations;
            if (settings_.verbose) {
                std::cerr << "[Solver] Step " << step << " did not converge after "
                          << iterations << " iterations\n";
            }
            finish(result, state);
            return result;
        }

        record_step(result, membrane, state, step, iterations);
    }

    result.converged = true;
    result.total_calculations = calculations;
    finish(result, state);
    return result;
}

// ============================================================================
// Strain control
// ============================================================================

MembraneSolver::StepOutcome MembraneSolver::strain_step(Membrane& membrane,
                                                        const StrainState& target,
                                                        IterationRecord& state,
                                                        int& iterations,
                                                        int& calculations) const
{
    StressState last_stresses = state.stresses;
    StrainState last_slip = membrane.crack_slip_strains();

    for (int it = 1; ; ++it) {
        iterations = it;

        membrane.calculate(target);
        ++calculations;

        IterationRecord current;
        current.strains = target;
        current.stresses = membrane.average_stresses();
        current.residual = current.stresses - last_stresses;
        current.stiffness = membrane.stiffness();

        if (!finite(current.stresses))
            return StepOutcome::Exhausted;

        const StrainState slip = membrane.crack_slip_strains();
        const double stress_change = convergence(current.residual, current.stresses);
        const double slip_change = (slip - last_slip).as_vector().squaredNorm();

        if (it >= settings_.min_iterations
            && stress_change <= settings_.stress_tolerance
            && slip_change <= settings_.strain_tolerance) {
            state = current;
            return StepOutcome::Converged;
        }

        if (it >= settings_.max_iterations)
            return StepOutcome::Exhausted;

        last_stresses = current.stresses;
        last_slip = slip;
    }
}

MembraneSolver::SolverResult MembraneSolver::solve(Membrane& membrane,
                                                   const StrainState& applied_strains) const
{
    SolverResult result;
    const StrainState applied = applied_strains.to_horizontal();

    IterationRecord state;
    state.stiffness = membrane.initial_stiffness();

    int calculations = 0;

    for (int step = 1; step <= settings_.num_steps; ++step) {
        const StrainState target = applied * (static_cast<double>(step) / settings_.num_steps);

        int iterations = 0;
        if (strain_step(membrane, target, state, iterations, calculations)
            == StepOutcome::Exhausted) {
            result.failed_step = step;
            result.total_calculations = calculations;
            if (settings_.verbose) {
                std::cerr << "[Solver] Step " << step << " did not converge after "
                          << iterations << " iterations\n";
            }
            finish(result, state);
            return result;
        }

        record_step(result, membrane, state, step, iterations);
    }

    result.converged = true;
    result.total_calculations = calculations;
    finish(result, state);
    return result;
}

// ============================================================================
// Results
// ============================================================================

void MembraneSolver::record_step(SolverResult& result, const Membrane& membrane,
                                 const IterationRecord& state, int step, int iterations) const
{
    StepResult r;
    r.step = step;
    r.iterations = iterations;
    r.average_strains = state.strains;
    r.average_stresses = state.stresses;
    r.concrete_principal_strains = membrane.concrete().principal_strains();
    r.concrete_principal_stresses = membrane.concrete().principal_stresses();
    r.average_principal_strains = membrane.average_principal_strains();
    r.cracked = membrane.cracked();
    r.slip_approach = membrane.slip_approach();
    result.steps.push_back(r);

    if (r.cracked && !result.cracked) {
        result.cracked = true;
        result.cracking_step = step;
        result.cracking_stresses = state.stresses;

        if (settings_.verbose) {
            std::cout << "[Solver] Concrete cracked at step " << step
                      << ": sigma = (" << state.stresses.sx << ", " << state.stresses.sy
                      << ", " << state.stresses.txy << ") MPa\n";
        }
    }

    if (settings_.verbose) {
        std::cout << "[Solver] Step " << std::setw(4) << step
                  << " | iterations = " << std::setw(5) << iterations
                  << " | gamma_xy = " << std::scientific << std::setprecision(4)
                  << state.strains.gxy << std::defaultfloat
                  << " | tau_xy = " << state.stresses.txy << " MPa\n";
    }
}

void MembraneSolver::finish(SolverResult& result, const IterationRecord& state) const
{
    result.ultimate_stresses = state.stresses;
    result.final_strains = state.strains;
    result.final_stiffness = state.stiffness;

    if (settings_.verbose) {
        std::cout << "[Solver] " << (result.converged ? "Converged" : "Stopped")
                  << " after " << result.steps.size() << " steps, "
                  << result.total_calculations << " element evaluations\n";
    }
}
