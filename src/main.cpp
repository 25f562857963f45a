/**
 * main.cpp — Reinforced Concrete Membrane Analysis: Driver
 *
 * Builds a membrane element for a panel preset, runs a stress or strain
 * controlled analysis with the selected smeared-crack model and reports the
 * cracking and ultimate states. Per-step results optionally go to a CSV file.
 *
 * Examples:
 *   rc_membrane --panel pv10 --model dsfm --stress 0,0,5
 *   rc_membrane --panel pv22 --model mcft --strain 0,0,0.008 --output pv22.csv
 */

#include "membrane.hpp"
#include "membrane_solver.hpp"
#include "plane_state.hpp"
#include "result_writer.hpp"
#include "simulation_config.hpp"

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>

namespace
{
    void print_stress(const char* label, const StressState& s)
    {
        std::cout << "  " << label << " = (" << s.sx << ", " << s.sy << ", " << s.txy << ") MPa\n";
    }

    void print_panel(const SimulationConfig& config, const Membrane& membrane)
    {
        const auto& concrete = membrane.concrete().parameters();
        const auto& web = membrane.reinforcement();

        std::cout << "[Panel] " << config.preset_key
                  << " | fc = " << concrete.strength() << " MPa"
                  << ", fcr = " << concrete.tensile_strength() << " MPa"
                  << ", Ec = " << concrete.elastic_modulus() << " MPa\n";
        std::cout << "[Panel] rho_x = " << (web.x() ? web.x()->ratio() : 0.0)
                  << ", rho_y = " << (web.y() ? web.y()->ratio() : 0.0)
                  << ", width = " << membrane.width() << " mm\n";
        std::cout << "[Model] " << model_name(config.model)
                  << (config.model == ConstitutiveModel::DSFM
                          ? (membrane.consider_slip() ? " with crack slip" : " without crack slip")
                          : "")
                  << " | " << analysis_control_name(config.control) << " control"
                  << ", " << config.solver.num_steps << " steps"
                  << ", " << stiffness_update_name(config.solver.update) << " update\n";
    }
}

int main(int argc, char** argv)
{
    SimulationConfig config;
    try {
        config = parse_simulation_config(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "[Config] " << ex.what() << "\n";
        return EXIT_FAILURE;
    }

    try {
        Membrane membrane = build_membrane(config);
        const MembraneSolver solver(config.solver);

        print_panel(config, membrane);

        MembraneSolver::SolverResult result;
        if (config.control == AnalysisControl::Stress) {
            const Vec3& s = config.applied_stresses;
            print_stress("Applied", StressState(s.x, s.y, s.xy));
            result = solver.solve(membrane, StressState(s.x, s.y, s.xy));
        } else {
            const Vec3& e = config.applied_strains;
            std::cout << "  Applied = (" << e.x << ", " << e.y << ", " << e.xy << ")\n";
            result = solver.solve(membrane, StrainState(e.x, e.y, e.xy));
        }

        // =====================================================================
        // Summary
        // =====================================================================
        std::cout << "\n============================================================\n"
                  << (result.converged ? "Analysis complete.\n"
                                       : "Analysis stopped: no convergence.\n")
                  << std::fixed << std::setprecision(4);

        if (!result.converged)
            std::cout << "  Failed step          = " << result.failed_step << "\n";
        std::cout << "  Converged steps      = " << result.steps.size() << "\n"
                  << "  Element evaluations  = " << result.total_calculations << "\n";

        if (result.cracked) {
            std::cout << "  Cracking step        = " << result.cracking_step << "\n";
            print_stress("Cracking stresses   ", result.cracking_stresses);
        } else {
            std::cout << "  Concrete did not crack\n";
        }
        print_stress("Ultimate stresses   ", result.ultimate_stresses);

        const StrainState& e = result.final_strains;
        std::cout << std::scientific
                  << "  Ultimate strains     = (" << e.ex << ", " << e.ey << ", " << e.gxy << ")\n";

        if (!result.steps.empty() && config.model == ConstitutiveModel::DSFM) {
            std::cout << "  Slip approach        = "
                      << slip_approach_name(result.steps.back().slip_approach) << "\n";
        }

        if (!config.output_path.empty()) {
            if (ResultWriter::write_csv(config.output_path, result))
                std::cout << "[Writer] Results: " << config.output_path << "\n";
            else
                std::cerr << "[Writer] Failed to write " << config.output_path << "\n";
        }
        std::cout << "============================================================\n";

        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
