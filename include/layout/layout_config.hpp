#pragma once

#include <cmath>
#include <string>

namespace prov {

/**
 * @brief Configuration for the force layout simulation
 *
 * Defaults reproduce the case-file network view: 800x600 canvas, links of
 * 100 units, charge -300, collision radius 30.
 */
struct LayoutConfig {
    // Canvas
    double width = 800.0;                   ///< Canvas width (center is width / 2)
    double height = 600.0;                  ///< Canvas height (center is height / 2)

    // Forces
    double link_distance = 100.0;           ///< Target separation of linked nodes
    double charge_strength = -300.0;        ///< Many-body strength (negative repels)
    double charge_distance_min = 1.0;       ///< Distance floor for the many-body force
    double center_strength = 1.0;           ///< Centering force strength [0, 1]
    double collision_radius = 30.0;         ///< Per-node radius of the collision force
    double collision_strength = 1.0;        ///< Collision force strength [0, 1]
    int collision_iterations = 1;           ///< Collision passes per tick

    // Hard constraint applied after integration
    double min_separation = 30.0;           ///< Minimum distance between node centers
    int separation_passes = 4;              ///< Projection passes per tick

    // Integration and cooling
    double velocity_decay = 0.4;            ///< Fraction of velocity lost per tick
    double alpha_initial = 1.0;             ///< Alpha on start and data replacement
    double alpha_min = 0.001;               ///< Settle threshold
    double alpha_decay = 1.0 - std::pow(0.001, 1.0 / 300.0);  ///< Geometric decay per tick
    double drag_alpha_target = 0.3;         ///< Warm alpha held while a node is dragged

    // Initial placement
    double initial_radius = 10.0;           ///< Phyllotaxis spiral step
    unsigned int seed = 42;                 ///< Seed for coincident-node jiggle

    int max_ticks = 1000;                   ///< Upper bound for run_until_settled
    bool verbose = false;                   ///< Log lifecycle events to stdout

    double center_x() const { return width / 2.0; }
    double center_y() const { return height / 2.0; }

    /**
     * @brief Load configuration from JSON file
     */
    static LayoutConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Override defaults from PROVGRAPH_* environment variables
     */
    static LayoutConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace prov
