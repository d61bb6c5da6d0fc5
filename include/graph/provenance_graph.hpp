#ifndef PROVGRAPH_PROVENANCE_GRAPH_HPP
#define PROVGRAPH_PROVENANCE_GRAPH_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace prov {

/**
 * @brief Kind of entity a graph node stands for
 *
 * This enumeration is part of the contract with the host: click callbacks
 * report it and the JSON format spells it as "object", "actor" or "place".
 */
enum class NodeKind {
    Object,
    Actor,
    Place
};

std::string node_kind_to_string(NodeKind kind);

/**
 * @brief Parse a node kind name
 * @throws std::invalid_argument for an unknown name
 */
NodeKind node_kind_from_string(const std::string& name);

/**
 * @brief A node of the relationship graph
 *
 * Ids are namespaced by kind, e.g. "object:123", "actor:Jane Doe", "place:Paris".
 */
struct GraphNode {
    std::string id;                // Unique identifier
    std::string label;             // Display name
    NodeKind kind = NodeKind::Object;

    bool operator==(const GraphNode& other) const;
    bool operator!=(const GraphNode& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A directed edge between two nodes
 *
 * Parallel edges are allowed: the same actor and place can be linked
 * once per event they appear in together.
 */
struct GraphEdge {
    std::string id;                           // Optional, empty when the source supplied none
    std::string source_id;
    std::string target_id;
    std::string label;                        // Event type
    std::string occurred_on;                  // ISO date, empty when unknown
    std::vector<std::string> policy_periods;  // Policy codes, e.g. NAZI_ERA
    std::string source_ref;                   // Citation, empty when unknown

    bool operator==(const GraphEdge& other) const;
    bool operator!=(const GraphEdge& other) const { return !(*this == other); }

    /**
     * @brief Check whether the edge carries a given policy code
     */
    bool has_policy(const std::string& code) const;

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief One provenance event of a case (ownership change, exhibition, ...)
 *
 * All fields are optional; an empty string means the value is absent.
 */
struct ProvenanceEvent {
    std::string event_type;
    std::string date_from;
    std::string date_to;
    std::string place;
    std::string actor;
    std::string method;
    std::string source_ref;

    nlohmann::json to_json() const;
    static ProvenanceEvent from_json(const nlohmann::json& j);
};

using EventList = std::vector<ProvenanceEvent>;

/**
 * @brief Cut a date or timestamp down to its YYYY-MM-DD part
 */
std::string to_iso_date(const std::string& value);

/**
 * @brief Summary figures about a relationship graph
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_objects = 0;
    size_t num_actors = 0;
    size_t num_places = 0;
    size_t num_policy_edges = 0;

    int max_degree = 0;
    int min_degree = 0;
    double avg_degree = 0.0;
    std::string top_hub;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable node/edge snapshot for one case
 *
 * Node and edge order is significant: augmentation appends to both arrays
 * and the layout engine indexes nodes by their position in the array.
 * Equality compares both arrays element by element.
 */
struct ProvenanceGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    bool operator==(const ProvenanceGraph& other) const;
    bool operator!=(const ProvenanceGraph& other) const { return !(*this == other); }

    size_t num_nodes() const { return nodes.size(); }
    size_t num_edges() const { return edges.size(); }
    bool empty() const { return nodes.empty(); }

    /**
     * @brief Exactly one node and no edges
     */
    bool is_degenerate() const { return nodes.size() == 1 && edges.empty(); }

    bool has_node(const std::string& node_id) const;
    const GraphNode* get_node(const std::string& node_id) const;

    /**
     * @brief Check node id uniqueness and edge endpoint existence
     * @param error_message Set to the first violation found
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Number of edge endpoints touching each node (parallel edges count)
     */
    std::map<std::string, int> compute_node_degrees() const;

    GraphStatistics compute_statistics() const;

    nlohmann::json to_json() const;
    static ProvenanceGraph from_json(const nlohmann::json& j);

    /**
     * @brief Load a graph from a JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static ProvenanceGraph load_from_json(const std::string& filename);

    void export_to_json(const std::string& filename) const;
};

/**
 * @brief Parse an event list from JSON
 *
 * Accepts a bare array or an object carrying an "events" array, which is
 * the shape of a case-file response.
 */
EventList events_from_json(const nlohmann::json& j);

/**
 * @brief Load an event list from a JSON file
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
EventList load_events_from_json(const std::string& filename);

} // namespace prov

#endif // PROVGRAPH_PROVENANCE_GRAPH_HPP
