#include "layout/layout_config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace prov {

LayoutConfig LayoutConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    LayoutConfig config;

    config.width = j.value("width", config.width);
    config.height = j.value("height", config.height);

    config.link_distance = j.value("link_distance", config.link_distance);
    config.charge_strength = j.value("charge_strength", config.charge_strength);
    config.charge_distance_min = j.value("charge_distance_min", config.charge_distance_min);
    config.center_strength = j.value("center_strength", config.center_strength);
    config.collision_radius = j.value("collision_radius", config.collision_radius);
    config.collision_strength = j.value("collision_strength", config.collision_strength);
    config.collision_iterations = j.value("collision_iterations", config.collision_iterations);

    config.min_separation = j.value("min_separation", config.min_separation);
    config.separation_passes = j.value("separation_passes", config.separation_passes);

    config.velocity_decay = j.value("velocity_decay", config.velocity_decay);
    config.alpha_initial = j.value("alpha_initial", config.alpha_initial);
    config.alpha_min = j.value("alpha_min", config.alpha_min);
    config.alpha_decay = j.value("alpha_decay", config.alpha_decay);
    config.drag_alpha_target = j.value("drag_alpha_target", config.drag_alpha_target);

    config.initial_radius = j.value("initial_radius", config.initial_radius);
    config.seed = j.value("seed", config.seed);
    config.max_ticks = j.value("max_ticks", config.max_ticks);
    config.verbose = j.value("verbose", config.verbose);

    return config;
}

void LayoutConfig::to_json_file(const std::string& path) const {
    json j;

    j["width"] = width;
    j["height"] = height;

    j["link_distance"] = link_distance;
    j["charge_strength"] = charge_strength;
    j["charge_distance_min"] = charge_distance_min;
    j["center_strength"] = center_strength;
    j["collision_radius"] = collision_radius;
    j["collision_strength"] = collision_strength;
    j["collision_iterations"] = collision_iterations;

    j["min_separation"] = min_separation;
    j["separation_passes"] = separation_passes;

    j["velocity_decay"] = velocity_decay;
    j["alpha_initial"] = alpha_initial;
    j["alpha_min"] = alpha_min;
    j["alpha_decay"] = alpha_decay;
    j["drag_alpha_target"] = drag_alpha_target;

    j["initial_radius"] = initial_radius;
    j["seed"] = seed;
    j["max_ticks"] = max_ticks;
    j["verbose"] = verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

static void read_env_double(const char* name, double& target) {
    const char* value = std::getenv(name);
    if (!value) return;
    try {
        target = std::stod(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
    }
}

LayoutConfig LayoutConfig::from_environment() {
    LayoutConfig config;

    read_env_double("PROVGRAPH_WIDTH", config.width);
    read_env_double("PROVGRAPH_HEIGHT", config.height);
    read_env_double("PROVGRAPH_LINK_DISTANCE", config.link_distance);
    read_env_double("PROVGRAPH_CHARGE", config.charge_strength);
    read_env_double("PROVGRAPH_COLLISION_RADIUS", config.collision_radius);
    read_env_double("PROVGRAPH_MIN_SEPARATION", config.min_separation);

    const char* verbose = std::getenv("PROVGRAPH_VERBOSE");
    if (verbose) config.verbose = std::string(verbose) == "1";

    return config;
}

bool LayoutConfig::validate(std::string& error_message) const {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0 || height <= 0.0) {
        error_message = "Canvas width and height must be positive";
        return false;
    }

    if (!std::isfinite(link_distance) || link_distance < 0.0) {
        error_message = "Link distance must be non-negative";
        return false;
    }

    if (!std::isfinite(charge_strength) || charge_strength > 0.0) {
        error_message = "Charge strength must be zero or negative";
        return false;
    }

    if (!std::isfinite(charge_distance_min) || charge_distance_min <= 0.0) {
        error_message = "Charge distance floor must be positive";
        return false;
    }

    if (center_strength < 0.0 || center_strength > 1.0) {
        error_message = "Center strength must be between 0.0 and 1.0";
        return false;
    }

    if (collision_strength < 0.0 || collision_strength > 1.0) {
        error_message = "Collision strength must be between 0.0 and 1.0";
        return false;
    }

    if (!std::isfinite(collision_radius) || collision_radius < 0.0 ||
        !std::isfinite(min_separation) || min_separation < 0.0) {
        error_message = "Collision radius and minimum separation must be non-negative";
        return false;
    }

    if (collision_iterations < 0 || separation_passes < 0) {
        error_message = "Iteration counts must be non-negative";
        return false;
    }

    if (velocity_decay < 0.0 || velocity_decay > 1.0) {
        error_message = "Velocity decay must be between 0.0 and 1.0";
        return false;
    }

    if (alpha_decay <= 0.0 || alpha_decay >= 1.0) {
        error_message = "Alpha decay must be in (0, 1)";
        return false;
    }

    if (alpha_min <= 0.0 || alpha_initial < alpha_min || drag_alpha_target < alpha_min) {
        error_message = "Alpha values must be positive and not below alpha_min";
        return false;
    }

    if (max_ticks <= 0) {
        error_message = "max_ticks must be positive";
        return false;
    }

    return true;
}

} // namespace prov
