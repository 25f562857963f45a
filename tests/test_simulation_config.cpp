/**
 * test_simulation_config.cpp — Panel presets and CLI overrides
 */

#include "material.hpp"
#include "membrane.hpp"
#include "membrane_solver.hpp"
#include "simulation_config.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void report(const char* name, bool pass, bool& all_pass) {
    std::cout << (pass ? "[PASS] " : "[FAIL] ") << name << "\n";
    if (!pass) all_pass = false;
}

static SimulationConfig parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "rc_membrane");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_simulation_config(static_cast<int>(argv.size()), argv.data());
}

static bool rejects(const std::vector<std::string>& args)
{
    try {
        parse(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main()
{
    std::cout << "=== SIMULATION CONFIG TEST ===\n\n";
    bool all_pass = true;

    // --- Defaults ---
    {
        const SimulationConfig c = parse({});
        report("default preset pv10", c.preset_key == "pv10" && c.panel.fc == 14.5, all_pass);
        report("default model MCFT", c.model == ConstitutiveModel::MCFT, all_pass);
        report("default stress control in pure shear",
               c.control == AnalysisControl::Stress && c.applied_stresses.xy == 5.0
               && c.applied_stresses.x == 0.0, all_pass);
        report("default solver settings",
               c.solver.num_steps == 100 && c.solver.update == StiffnessUpdate::Secant
               && c.consider_slip && c.output_path.empty(), all_pass);
        report("ten panel presets", simulation_presets().size() == 10, all_pass);
    }

    // --- Overrides ---
    {
        const SimulationConfig c = parse({"--panel", "PV13", "--model", "dsfm", "--strain",
                                          "0,0,0.004", "--steps", "50", "--no-slip",
                                          "--update", "newton", "--output", "pv13.csv"});
        report("preset key is case-insensitive", c.preset_key == "pv13", all_pass);
        report("model override", c.model == ConstitutiveModel::DSFM, all_pass);
        report("strain control", c.control == AnalysisControl::Strain
               && c.applied_strains.xy == 0.004, all_pass);
        report("steps override", c.solver.num_steps == 50, all_pass);
        report("slip disabled", !c.consider_slip, all_pass);
        report("newton update", c.solver.update == StiffnessUpdate::NewtonRaphson, all_pass);
        report("output path", c.output_path == "pv13.csv", all_pass);

        const Membrane m = build_membrane(c);
        report("pv13 has no Y reinforcement",
               m.reinforcement().x().has_value() && !m.reinforcement().y().has_value(), all_pass);
        report("membrane carries the model", m.model() == ConstitutiveModel::DSFM
               && !m.consider_slip(), all_pass);
    }

    {
        const SimulationConfig c = parse({"--stress", "1,-2,3", "--max-iterations", "500",
                                          "--stress-tol", "1e-4", "--strain-tol", "1e-10"});
        report("stress triple", c.applied_stresses.x == 1.0 && c.applied_stresses.y == -2.0
               && c.applied_stresses.xy == 3.0, all_pass);
        report("iteration and tolerance overrides",
               c.solver.max_iterations == 500 && c.solver.stress_tolerance == 1e-4
               && c.solver.strain_tolerance == 1e-10, all_pass);
    }

    // --- Errors ---
    report("unknown argument rejected", rejects({"--bogus"}), all_pass);
    report("short triple rejected", rejects({"--stress", "1,2"}), all_pass);
    report("long triple rejected", rejects({"--stress", "1,2,3,4"}), all_pass);
    report("unknown preset rejected", rejects({"--panel", "pv99"}), all_pass);
    report("unknown model rejected", rejects({"--model", "cft"}), all_pass);
    report("unknown update rejected", rejects({"--update", "bfgs"}), all_pass);
    report("stress and strain together rejected",
           rejects({"--stress", "0,0,1", "--strain", "0,0,0.001"}), all_pass);

    report("model names parse", parse_model("SMM") == ConstitutiveModel::SMM
           && parse_model("Dsfm") == ConstitutiveModel::DSFM, all_pass);

    std::cout << "\n=== OVERALL: " << (all_pass ? "PASS" : "FAIL") << " ===\n";
    return all_pass ? 0 : 1;
}
