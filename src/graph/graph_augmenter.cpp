#include "graph/graph_augmenter.hpp"
#include <unordered_set>

namespace prov {

std::string GraphAugmenter::make_edge_id(const std::string& source_id,
                                         const std::string& target_id,
                                         size_t event_index) {
    return "edge:" + source_id + "-" + target_id + "-" + std::to_string(event_index);
}

GraphEdge GraphAugmenter::make_event_edge(const std::string& source_id,
                                          const std::string& target_id,
                                          const std::string& label,
                                          const ProvenanceEvent& event,
                                          size_t event_index) const {
    GraphEdge edge;
    edge.id = make_edge_id(source_id, target_id, event_index);
    edge.source_id = source_id;
    edge.target_id = target_id;
    edge.label = label;
    edge.occurred_on = event.date_from;
    edge.source_ref = event.source_ref;
    return edge;
}

ProvenanceGraph GraphAugmenter::augment(const ProvenanceGraph& raw, const EventList& events) {
    stats_ = AugmentationStats{};
    stats_.events_seen = events.size();

    // Only expand a single isolated node; richer graphs are final
    if (!raw.is_degenerate() || events.empty()) {
        return raw;
    }

    const GraphNode& object_node = raw.nodes.front();
    if (object_node.kind != NodeKind::Object) {
        return raw;
    }

    ProvenanceGraph result = raw;
    std::unordered_set<std::string> node_ids;
    node_ids.insert(object_node.id);

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        bool has_actor = !event.actor.empty();
        bool has_place = !event.place.empty();

        if (!has_actor && !has_place) {
            stats_.events_skipped++;
            continue;
        }

        std::string label = event.event_type.empty() ? "UNKNOWN" : event.event_type;
        std::string actor_id = has_actor ? actor_node_id(event.actor) : "";
        std::string place_id = has_place ? place_node_id(event.place) : "";

        if (has_actor && node_ids.insert(actor_id).second) {
            result.nodes.push_back({actor_id, event.actor, NodeKind::Actor});
            stats_.nodes_added++;
        }
        if (has_place && node_ids.insert(place_id).second) {
            result.nodes.push_back({place_id, event.place, NodeKind::Place});
            stats_.nodes_added++;
        }

        if (has_actor) {
            result.edges.push_back(make_event_edge(object_node.id, actor_id, label, event, i));
        }
        if (has_place) {
            result.edges.push_back(make_event_edge(object_node.id, place_id, label, event, i));
        }
        if (has_actor && has_place) {
            result.edges.push_back(make_event_edge(actor_id, place_id, OCCURRED_IN_LABEL, event, i));
        }
    }

    stats_.edges_added = result.edges.size() - raw.edges.size();
    stats_.augmented = stats_.nodes_added > 0 || stats_.edges_added > 0;
    return result;
}

std::optional<ProvenanceGraph> GraphAugmenter::augment(const std::optional<ProvenanceGraph>& raw,
                                                       const std::optional<EventList>& events) {
    if (!raw || !events) {
        stats_ = AugmentationStats{};
        return raw;
    }
    return augment(*raw, *events);
}

} // namespace prov
