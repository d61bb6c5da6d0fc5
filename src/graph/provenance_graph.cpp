#include "graph/provenance_graph.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace prov {

// ==========================================
// NodeKind
// ==========================================

std::string node_kind_to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Object: return "object";
        case NodeKind::Actor:  return "actor";
        case NodeKind::Place:  return "place";
    }
    return "object";
}

NodeKind node_kind_from_string(const std::string& name) {
    if (name == "object") return NodeKind::Object;
    if (name == "actor") return NodeKind::Actor;
    if (name == "place") return NodeKind::Place;
    throw std::invalid_argument("Unknown node kind: " + name);
}

std::string to_iso_date(const std::string& value) {
    return value.size() > 10 ? value.substr(0, 10) : value;
}

// JSON null and missing keys both read as an empty string
static std::string optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return "";
    return j[key].get<std::string>();
}

// ==========================================
// GraphNode Implementation
// ==========================================

bool GraphNode::operator==(const GraphNode& other) const {
    return id == other.id && label == other.label && kind == other.kind;
}

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["type"] = node_kind_to_string(kind);
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();
    node.label = j.value("label", node.id);
    node.kind = node_kind_from_string(j.at("type").get<std::string>());
    return node;
}

// ==========================================
// GraphEdge Implementation
// ==========================================

bool GraphEdge::operator==(const GraphEdge& other) const {
    return id == other.id &&
           source_id == other.source_id &&
           target_id == other.target_id &&
           label == other.label &&
           occurred_on == other.occurred_on &&
           policy_periods == other.policy_periods &&
           source_ref == other.source_ref;
}

bool GraphEdge::has_policy(const std::string& code) const {
    return std::find(policy_periods.begin(), policy_periods.end(), code) != policy_periods.end();
}

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    if (!id.empty()) {
        j["id"] = id;
    }
    j["source"] = source_id;
    j["target"] = target_id;
    j["label"] = label;
    j["policy"] = policy_periods;

    if (!occurred_on.empty()) {
        j["date"] = occurred_on;
    }
    if (!source_ref.empty()) {
        j["source_ref"] = source_ref;
    }

    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.id = optional_string(j, "id");
    edge.source_id = j.at("source").get<std::string>();
    edge.target_id = j.at("target").get<std::string>();
    edge.label = optional_string(j, "label");
    edge.occurred_on = to_iso_date(optional_string(j, "date"));
    edge.source_ref = optional_string(j, "source_ref");

    if (j.contains("policy") && j["policy"].is_array()) {
        edge.policy_periods = j["policy"].get<std::vector<std::string>>();
    }

    return edge;
}

// ==========================================
// ProvenanceEvent Implementation
// ==========================================

nlohmann::json ProvenanceEvent::to_json() const {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["date_from"] = date_from;
    j["date_to"] = date_to;
    j["place"] = place;
    j["actor"] = actor;
    j["method"] = method;
    j["source_ref"] = source_ref;
    return j;
}

ProvenanceEvent ProvenanceEvent::from_json(const nlohmann::json& j) {
    ProvenanceEvent event;
    event.event_type = optional_string(j, "event_type");
    event.date_from = to_iso_date(optional_string(j, "date_from"));
    event.date_to = to_iso_date(optional_string(j, "date_to"));
    event.place = optional_string(j, "place");
    event.actor = optional_string(j, "actor");
    event.method = optional_string(j, "method");
    event.source_ref = optional_string(j, "source_ref");
    return event;
}

EventList events_from_json(const nlohmann::json& j) {
    const nlohmann::json* array = &j;
    if (j.is_object() && j.contains("events")) {
        array = &j["events"];
    }
    if (!array->is_array()) {
        throw std::runtime_error("Expected an array of events");
    }

    EventList events;
    events.reserve(array->size());
    for (const auto& event_json : *array) {
        events.push_back(ProvenanceEvent::from_json(event_json));
    }
    return events;
}

static nlohmann::json read_json_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + filename + ": " + e.what());
    }
    return j;
}

EventList load_events_from_json(const std::string& filename) {
    return events_from_json(read_json_file(filename));
}

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_objects"] = num_objects;
    j["num_actors"] = num_actors;
    j["num_places"] = num_places;
    j["num_policy_edges"] = num_policy_edges;
    j["max_degree"] = max_degree;
    j["min_degree"] = min_degree;
    j["avg_degree"] = avg_degree;
    j["top_hub"] = top_hub;
    return j;
}

// ==========================================
// ProvenanceGraph Implementation
// ==========================================

bool ProvenanceGraph::operator==(const ProvenanceGraph& other) const {
    return nodes == other.nodes && edges == other.edges;
}

bool ProvenanceGraph::has_node(const std::string& node_id) const {
    return get_node(node_id) != nullptr;
}

const GraphNode* ProvenanceGraph::get_node(const std::string& node_id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const GraphNode& n) { return n.id == node_id; });
    return it != nodes.end() ? &(*it) : nullptr;
}

bool ProvenanceGraph::validate(std::string& error_message) const {
    std::set<std::string> ids;
    for (const auto& node : nodes) {
        if (node.id.empty()) {
            error_message = "Node with empty id";
            return false;
        }
        if (!ids.insert(node.id).second) {
            error_message = "Duplicate node id: " + node.id;
            return false;
        }
    }

    for (const auto& edge : edges) {
        if (ids.find(edge.source_id) == ids.end()) {
            error_message = "Edge source does not exist: " + edge.source_id;
            return false;
        }
        if (ids.find(edge.target_id) == ids.end()) {
            error_message = "Edge target does not exist: " + edge.target_id;
            return false;
        }
    }

    return true;
}

std::map<std::string, int> ProvenanceGraph::compute_node_degrees() const {
    std::map<std::string, int> degrees;
    for (const auto& node : nodes) {
        degrees[node.id] = 0;
    }
    for (const auto& edge : edges) {
        degrees[edge.source_id]++;
        degrees[edge.target_id]++;
    }
    return degrees;
}

GraphStatistics ProvenanceGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes.size();
    stats.num_edges = edges.size();

    for (const auto& node : nodes) {
        switch (node.kind) {
            case NodeKind::Object: stats.num_objects++; break;
            case NodeKind::Actor:  stats.num_actors++; break;
            case NodeKind::Place:  stats.num_places++; break;
        }
    }

    for (const auto& edge : edges) {
        if (!edge.policy_periods.empty()) {
            stats.num_policy_edges++;
        }
    }

    if (nodes.empty()) {
        return stats;
    }

    auto degrees = compute_node_degrees();
    stats.max_degree = 0;
    stats.min_degree = std::numeric_limits<int>::max();
    long total = 0;
    for (const auto& node : nodes) {
        int d = degrees[node.id];
        total += d;
        if (stats.top_hub.empty() || d > stats.max_degree) {
            stats.max_degree = d;
            stats.top_hub = node.id;
        }
        stats.min_degree = std::min(stats.min_degree, d);
    }
    stats.avg_degree = static_cast<double>(total) / nodes.size();

    return stats;
}

nlohmann::json ProvenanceGraph::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    return j;
}

ProvenanceGraph ProvenanceGraph::from_json(const nlohmann::json& j) {
    ProvenanceGraph graph;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            graph.nodes.push_back(GraphNode::from_json(node_json));
        }
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            graph.edges.push_back(GraphEdge::from_json(edge_json));
        }
    }

    return graph;
}

ProvenanceGraph ProvenanceGraph::load_from_json(const std::string& filename) {
    return from_json(read_json_file(filename));
}

void ProvenanceGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

} // namespace prov
