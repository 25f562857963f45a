#pragma once

#include "material.hpp"
#include "membrane.hpp"
#include "membrane_solver.hpp"
#include "plane_state.hpp"

#include <optional>
#include <string>
#include <unordered_map>

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double xy = 0.0;
};

/// Bars of one reinforcement direction (mm, MPa).
struct BarLayout {
    double diameter = 0.0;
    double spacing = 0.0;
    double yield_stress = 0.0;
    double elastic_modulus = 200000.0;
};

struct PanelDefinition {
    double fc = 0.0;
    double aggregate_diameter = 6.0;
    double width = 70.0;
    std::optional<BarLayout> bars_x;
    std::optional<BarLayout> bars_y;
};

struct SimulationConfig {
    std::string preset_key;
    PanelDefinition panel;
    ConstitutiveModel model = ConstitutiveModel::MCFT;
    bool consider_slip = true;
    AnalysisControl control = AnalysisControl::Stress;
    Vec3 applied_stresses;     // MPa, stress control
    Vec3 applied_strains;      // strain control
    MembraneSolver::Settings solver;
    std::string output_path;   // empty: no CSV output
};

const std::unordered_map<std::string, SimulationConfig>& simulation_presets();
SimulationConfig parse_simulation_config(int argc, char** argv);

/// Membrane element for the configured panel and model.
Membrane build_membrane(const SimulationConfig& config);

ConstitutiveModel parse_model(const std::string& name);
