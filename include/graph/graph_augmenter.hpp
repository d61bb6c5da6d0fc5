#pragma once

#include "graph/provenance_graph.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace prov {

// Label of the edge linking an actor to the place of the same event
inline const std::string OCCURRED_IN_LABEL = "occurred in";

// Summary of the last augmentation run
struct AugmentationStats {
    bool augmented = false;        // Graph was degenerate and got expanded
    size_t events_seen = 0;
    size_t events_skipped = 0;     // Events with neither actor nor place
    size_t nodes_added = 0;
    size_t edges_added = 0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["augmented"] = augmented;
        j["events_seen"] = events_seen;
        j["events_skipped"] = events_skipped;
        j["nodes_added"] = nodes_added;
        j["edges_added"] = edges_added;
        return j;
    }
};

// Graph augmenter - turns a single isolated object node plus the case's
// provenance events into a connected object/actor/place graph.
//
// Only a degenerate graph (one node, no edges) with at least one event is
// expanded. Anything else passes through untouched, so running it on a
// graph that is already rich is harmless. It never throws.
class GraphAugmenter {
public:
    GraphAugmenter() = default;

    ProvenanceGraph augment(const ProvenanceGraph& raw, const EventList& events);

    // Missing inputs degrade to pass-through of whatever raw graph exists
    std::optional<ProvenanceGraph> augment(const std::optional<ProvenanceGraph>& raw,
                                           const std::optional<EventList>& events);

    const AugmentationStats& last_stats() const { return stats_; }

    // Deterministic id for the edge created from event #event_index
    static std::string make_edge_id(const std::string& source_id,
                                    const std::string& target_id,
                                    size_t event_index);

    static std::string actor_node_id(const std::string& actor) { return "actor:" + actor; }
    static std::string place_node_id(const std::string& place) { return "place:" + place; }

private:
    AugmentationStats stats_;

    GraphEdge make_event_edge(const std::string& source_id,
                              const std::string& target_id,
                              const std::string& label,
                              const ProvenanceEvent& event,
                              size_t event_index) const;
};

} // namespace prov
