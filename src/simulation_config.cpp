#include "simulation_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

Vec3 parse_vec3(const std::string& token)
{
    std::stringstream ss(token);
    std::string item;
    Vec3 v{};
    if (!std::getline(ss, item, ',')) {
        throw std::runtime_error("Failed to parse x component from token: " + token);
    }
    v.x = std::stod(item);
    if (!std::getline(ss, item, ',')) {
        throw std::runtime_error("Failed to parse y component from token: " + token);
    }
    v.y = std::stod(item);
    if (!std::getline(ss, item, ',')) {
        throw std::runtime_error("Failed to parse xy component from token: " + token);
    }
    v.xy = std::stod(item);
    if (std::getline(ss, item, ',')) {
        throw std::runtime_error("Expected three components, got: " + token);
    }
    return v;
}

std::string lower_copy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

StiffnessUpdate parse_update(const std::string& name)
{
    const std::string key = lower_copy(name);
    if (key == "secant") return StiffnessUpdate::Secant;
    if (key == "newton") return StiffnessUpdate::NewtonRaphson;
    throw std::runtime_error("Unknown stiffness update '" + name + "' (secant|newton)");
}

void print_usage(const char* binary)
{
    std::cerr << "Usage: " << binary
              << " [--panel PV10] [--model {mcft|dsfm|smm}] [--no-slip]\n"
              << "             [--stress sx,sy,txy | --strain ex,ey,gxy] [--steps n]\n"
              << "             [--max-iterations n] [--stress-tol value] [--strain-tol value]\n"
              << "             [--update {secant|newton}] [--output file.csv] [--verbose]\n";
}

BarLayout bars(double diameter, double spacing, double fy)
{
    BarLayout b;
    b.diameter = diameter;
    b.spacing = spacing;
    b.yield_stress = fy;
    return b;
}

// Vecchio & Collins (1982) panels, loaded in pure shear up to tau_xy.
SimulationConfig panel(const std::string& key, double fc,
                       std::optional<BarLayout> x, std::optional<BarLayout> y,
                       double tau_xy)
{
    SimulationConfig config;
    config.preset_key = key;
    config.panel.fc = fc;
    config.panel.bars_x = x;
    config.panel.bars_y = y;
    config.applied_stresses = Vec3{0.0, 0.0, tau_xy};
    config.applied_strains = Vec3{0.0, 0.0, 0.01};
    return config;
}

const std::unordered_map<std::string, SimulationConfig>& build_presets()
{
    static const std::unordered_map<std::string, SimulationConfig> presets = {
        {"pv1",  panel("pv1",  34.5, bars(6.35, 50.55, 483), bars(6.35, 53.86, 283), 9.0)},
        {"pv6",  panel("pv6",  29.8, bars(6.35, 50.55, 266), bars(6.35, 50.55, 266), 5.0)},
        {"pv10", panel("pv10", 14.5, bars(6.35, 50.55, 276), bars(4.70, 49.57, 276), 5.0)},
        {"pv11", panel("pv11", 15.6, bars(6.35, 50.55, 235), bars(5.44, 50.70, 235), 4.5)},
        {"pv12", panel("pv12", 16.0, bars(6.35, 50.55, 468), bars(3.18, 50.43, 468), 4.0)},
        {"pv13", panel("pv13", 18.2, bars(6.35, 50.55, 248), std::nullopt, 3.0)},
        {"pv19", panel("pv19", 19.0, bars(6.35, 50.55, 458), bars(4.01, 50.82, 299), 5.0)},
        {"pv20", panel("pv20", 19.6, bars(6.35, 50.55, 460), bars(4.47, 50.38, 297), 5.0)},
        {"pv21", panel("pv21", 19.5, bars(6.35, 50.55, 458), bars(5.41, 50.52, 302), 6.0)},
        {"pv22", panel("pv22", 19.6, bars(6.35, 50.55, 458), bars(5.87, 50.87, 420), 7.0)}
    };
    return presets;
}

} // namespace

const std::unordered_map<std::string, SimulationConfig>& simulation_presets()
{
    return build_presets();
}

ConstitutiveModel parse_model(const std::string& name)
{
    const std::string key = lower_copy(name);
    if (key == "mcft") return ConstitutiveModel::MCFT;
    if (key == "dsfm") return ConstitutiveModel::DSFM;
    if (key == "smm")  return ConstitutiveModel::SMM;
    throw std::runtime_error("Unknown constitutive model '" + name + "' (mcft|dsfm|smm)");
}

SimulationConfig parse_simulation_config(int argc, char** argv)
{
    std::string requested_panel = "pv10";
    std::optional<ConstitutiveModel> model_override;
    std::optional<Vec3> stress_override;
    std::optional<Vec3> strain_override;
    std::optional<int> steps_override;
    std::optional<int> iterations_override;
    std::optional<double> stress_tol_override;
    std::optional<double> strain_tol_override;
    std::optional<StiffnessUpdate> update_override;
    std::optional<std::string> output_override;
    bool no_slip = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--panel" && i + 1 < argc) {
            requested_panel = lower_copy(argv[++i]);
        } else if (arg == "--model" && i + 1 < argc) {
            model_override = parse_model(argv[++i]);
        } else if (arg == "--stress" && i + 1 < argc) {
            stress_override = parse_vec3(argv[++i]);
        } else if (arg == "--strain" && i + 1 < argc) {
            strain_override = parse_vec3(argv[++i]);
        } else if (arg == "--steps" && i + 1 < argc) {
            steps_override = std::stoi(argv[++i]);
        } else if (arg == "--max-iterations" && i + 1 < argc) {
            iterations_override = std::stoi(argv[++i]);
        } else if (arg == "--stress-tol" && i + 1 < argc) {
            stress_tol_override = std::stod(argv[++i]);
        } else if (arg == "--strain-tol" && i + 1 < argc) {
            strain_tol_override = std::stod(argv[++i]);
        } else if (arg == "--update" && i + 1 < argc) {
            update_override = parse_update(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            output_override = argv[++i];
        } else if (arg == "--no-slip") {
            no_slip = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else {
            print_usage(argv[0]);
            throw std::runtime_error("Unknown CLI argument: " + arg);
        }
    }

    if (stress_override && strain_override) {
        throw std::runtime_error("--stress and --strain are mutually exclusive");
    }

    const auto& presets = simulation_presets();
    auto it = presets.find(requested_panel);
    if (it == presets.end()) {
        std::stringstream ss;
        ss << "Unknown panel preset '" << requested_panel << "'. Allowed keys:";
        for (const auto& kv : presets) {
            ss << ' ' << kv.first;
        }
        throw std::runtime_error(ss.str());
    }

    SimulationConfig config = it->second;

    if (model_override) {
        config.model = *model_override;
    }
    if (stress_override) {
        config.control = AnalysisControl::Stress;
        config.applied_stresses = *stress_override;
    }
    if (strain_override) {
        config.control = AnalysisControl::Strain;
        config.applied_strains = *strain_override;
    }
    if (steps_override) {
        config.solver.num_steps = *steps_override;
    }
    if (iterations_override) {
        config.solver.max_iterations = *iterations_override;
    }
    if (stress_tol_override) {
        config.solver.stress_tolerance = *stress_tol_override;
    }
    if (strain_tol_override) {
        config.solver.strain_tolerance = *strain_tol_override;
    }
    if (update_override) {
        config.solver.update = *update_override;
    }
    if (output_override) {
        config.output_path = *output_override;
    }
    config.consider_slip = !no_slip;
    config.solver.verbose = verbose;

    return config;
}

Membrane build_membrane(const SimulationConfig& config)
{
    const PanelDefinition& p = config.panel;
    const ConcreteParameters concrete(p.fc, p.aggregate_diameter, config.model);

    auto direction = [&p](const std::optional<BarLayout>& b, double angle)
        -> std::optional<ReinforcementDirection> {
        if (!b) return std::nullopt;
        const Steel steel(b->yield_stress, b->elastic_modulus);
        return ReinforcementDirection::from_bars(b->diameter, b->spacing, p.width, steel, angle);
    };

    const WebReinforcement web(direction(p.bars_x, 0.0),
                               direction(p.bars_y, 0.5 * PlaneAlgebra::PI));

    return Membrane(concrete, web, p.width, config.model, config.consider_slip);
}
