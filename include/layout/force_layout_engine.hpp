#ifndef PROVGRAPH_FORCE_LAYOUT_ENGINE_HPP
#define PROVGRAPH_FORCE_LAYOUT_ENGINE_HPP

#include "graph/provenance_graph.hpp"
#include "layout/layout_config.hpp"
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace prov {

/**
 * @brief 2-D point in layout (world) coordinates
 */
struct Point {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Lifecycle of a simulation
 *
 * Idle -> Running -> Settled -> Running (drag start, disturbance or data
 * replacement) ... -> Disposed. Disposed is terminal.
 */
enum class SimulationState {
    Idle,
    Running,
    Settled,
    Disposed
};

std::string simulation_state_to_string(SimulationState state);

/**
 * @brief Live physics state of one node
 */
struct NodeState {
    std::string id;
    std::string label;
    NodeKind kind = NodeKind::Object;
    double x = 0.0;
    double y = 0.0;
    double vx = 0.0;
    double vy = 0.0;
    bool pinned = false;
    double fx = 0.0;               ///< Pinned x, valid while pinned
    double fy = 0.0;               ///< Pinned y, valid while pinned
    int degree = 0;                ///< Number of links touching the node
};

/**
 * @brief Iterative force-directed layout for a relationship graph
 *
 * Each tick composes link attraction, many-body repulsion, centering and
 * collision into node velocities, integrates free nodes, then projects
 * positions so that no two centers are closer than the minimum separation.
 * Pinned nodes follow their externally supplied position exactly.
 *
 * The engine is single-threaded and driven by the host, one tick() per
 * frame. Ticks depend only on the current positions and velocities, so a
 * host may delay or skip frames freely. pin(), unpin(), disturb() and
 * tick() are the only mutators of the simulation state.
 */
class ForceLayoutEngine {
public:
    using TickCallback = std::function<void(const ForceLayoutEngine&)>;

    /**
     * @brief Create an engine for a graph
     * @throws std::invalid_argument if the configuration fails validation
     *
     * Edges whose endpoints are missing from the node set are not simulated.
     */
    explicit ForceLayoutEngine(ProvenanceGraph graph, LayoutConfig config = LayoutConfig());

    // ==========================================
    // Lifecycle
    // ==========================================

    /**
     * @brief Idle -> Running
     */
    void start();

    /**
     * @brief Advance the simulation by one tick
     * @return false if the engine was not running (nothing happened)
     */
    bool tick();

    /**
     * @brief Tick until settled, disposed or max_ticks reached
     * @return Number of ticks performed
     */
    size_t run_until_settled(size_t max_ticks);
    size_t run_until_settled() { return run_until_settled(static_cast<size_t>(config_.max_ticks)); }

    /**
     * @brief Raise alpha back to the warm value and resume ticking
     */
    void disturb();

    /**
     * @brief Swap in the graph of a new case
     *
     * Halts the tick loop, discards all positions, velocities and pins,
     * then restarts from the initial alpha.
     * @return false once disposed
     */
    bool replace_graph(ProvenanceGraph graph);

    /**
     * @brief Halt and tear down; every later call is a no-op
     */
    void dispose();

    // ==========================================
    // Pinning
    // ==========================================

    /**
     * @brief Fix a node at an externally supplied position
     *
     * The first pin of a node is a drag start: alpha is raised to the warm
     * value and held there until the last pin is released. Repeated calls
     * move the pin.
     * @return false for an unknown node, a non-finite position, or after dispose
     */
    bool pin(const std::string& node_id, Point position);

    /**
     * @brief Release a pin; the node resumes free integration
     * @return false if the node is unknown or not pinned
     */
    bool unpin(const std::string& node_id);

    bool is_pinned(const std::string& node_id) const;
    size_t num_pinned() const { return num_pinned_; }

    // ==========================================
    // Observation
    // ==========================================

    SimulationState state() const { return state_; }
    double alpha() const { return alpha_; }
    double alpha_target() const { return alpha_target_; }
    size_t tick_count() const { return tick_count_; }

    /**
     * @brief Sum of node displacements during the last tick
     */
    double last_displacement() const { return last_displacement_; }

    /**
     * @brief Number of times a non-finite node was reset to the canvas center
     */
    size_t nonfinite_resets() const { return nonfinite_resets_; }

    size_t skipped_links() const { return skipped_links_; }

    /**
     * @brief Counter bumped by replace_graph() and dispose()
     *
     * Node ids may repeat across cases; hosts holding on to a node across
     * calls compare generations to tell whether it is still the same node.
     */
    size_t generation() const { return generation_; }

    const ProvenanceGraph& graph() const { return graph_; }
    const LayoutConfig& config() const { return config_; }
    const std::vector<NodeState>& nodes() const { return nodes_; }

    std::optional<Point> position(const std::string& node_id) const;
    const NodeState* node_state(const std::string& node_id) const;

    /**
     * @brief Smallest distance between any two node centers
     */
    double min_pair_distance() const;

    /**
     * @brief Export node positions as JSON
     */
    nlohmann::json positions_to_json() const;

    void set_tick_callback(TickCallback cb) { tick_cb_ = std::move(cb); }
    void set_settled_callback(TickCallback cb) { settled_cb_ = std::move(cb); }

private:
    struct LinkState {
        size_t source;
        size_t target;
        double strength;
        double bias;
    };

    ProvenanceGraph graph_;
    LayoutConfig config_;

    std::vector<NodeState> nodes_;
    std::vector<LinkState> links_;
    std::unordered_map<std::string, size_t> index_;

    SimulationState state_ = SimulationState::Idle;
    double alpha_ = 1.0;
    double alpha_target_ = 0.0;
    size_t tick_count_ = 0;
    size_t num_pinned_ = 0;
    double last_displacement_ = 0.0;
    size_t nonfinite_resets_ = 0;
    size_t skipped_links_ = 0;
    size_t generation_ = 0;

    std::mt19937 rng_;

    TickCallback tick_cb_;
    TickCallback settled_cb_;

    void initialize();
    double jiggle();

    void apply_link_force();
    void apply_charge_force();
    void apply_center_force();
    void apply_collision_force();
    void integrate();
    void enforce_min_separation();
    void sanitize();
};

} // namespace prov

#endif // PROVGRAPH_FORCE_LAYOUT_ENGINE_HPP
