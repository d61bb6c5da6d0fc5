#pragma once

#include "graph/policy.hpp"
#include "graph/provenance_graph.hpp"
#include <string>

namespace prov {

// Visual rules for the network view. Objects are drawn larger than actors
// and places.
struct StyleRules {
    // Geometry
    double object_radius = 20.0;
    double default_radius = 15.0;       // Actors and places
    double hover_growth = 5.0;          // Added to the radius of an emphasized node
    double label_gap = 15.0;            // Label sits radius + gap below the center
    double font_size = 12.0;

    // Node colors
    std::string object_fill = "#f59e0b";
    std::string actor_fill = "#3b82f6";
    std::string place_fill = "#10b981";
    std::string node_stroke = "#475569";
    std::string label_color = "#f1f5f9";
    std::string background = "#0f172a";

    // Edge colors, one per policy class
    std::string edge_nazi = "#dc2626";
    std::string edge_unesco = "#d97706";
    std::string edge_normal = "#64748b";
    double edge_width = 2.0;
    double edge_opacity = 0.8;

    double radius_for(NodeKind kind, bool emphasized = false) const;
    double label_offset(NodeKind kind) const;
    const std::string& fill_for(NodeKind kind) const;
    const std::string& stroke_for(EdgeClass cls) const;

    static StyleRules from_json_file(const std::string& path);
    void to_json_file(const std::string& path) const;
    bool validate(std::string& error_message) const;
};

} // namespace prov
