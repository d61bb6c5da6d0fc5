#include "render/style_rules.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace prov {

double StyleRules::radius_for(NodeKind kind, bool emphasized) const {
    double radius = kind == NodeKind::Object ? object_radius : default_radius;
    return emphasized ? radius + hover_growth : radius;
}

double StyleRules::label_offset(NodeKind kind) const {
    // Scaled to the resting radius so hovering does not move the label
    return radius_for(kind) + label_gap;
}

const std::string& StyleRules::fill_for(NodeKind kind) const {
    switch (kind) {
        case NodeKind::Object: return object_fill;
        case NodeKind::Actor:  return actor_fill;
        case NodeKind::Place:  return place_fill;
    }
    return object_fill;
}

const std::string& StyleRules::stroke_for(EdgeClass cls) const {
    switch (cls) {
        case EdgeClass::Nazi:   return edge_nazi;
        case EdgeClass::Unesco: return edge_unesco;
        case EdgeClass::Normal: return edge_normal;
    }
    return edge_normal;
}

StyleRules StyleRules::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open style file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse style file " + path + ": " + e.what());
    }

    StyleRules style;
    style.object_radius = j.value("object_radius", style.object_radius);
    style.default_radius = j.value("default_radius", style.default_radius);
    style.hover_growth = j.value("hover_growth", style.hover_growth);
    style.label_gap = j.value("label_gap", style.label_gap);
    style.font_size = j.value("font_size", style.font_size);

    style.object_fill = j.value("object_fill", style.object_fill);
    style.actor_fill = j.value("actor_fill", style.actor_fill);
    style.place_fill = j.value("place_fill", style.place_fill);
    style.node_stroke = j.value("node_stroke", style.node_stroke);
    style.label_color = j.value("label_color", style.label_color);
    style.background = j.value("background", style.background);

    style.edge_nazi = j.value("edge_nazi", style.edge_nazi);
    style.edge_unesco = j.value("edge_unesco", style.edge_unesco);
    style.edge_normal = j.value("edge_normal", style.edge_normal);
    style.edge_width = j.value("edge_width", style.edge_width);
    style.edge_opacity = j.value("edge_opacity", style.edge_opacity);

    return style;
}

void StyleRules::to_json_file(const std::string& path) const {
    json j;
    j["object_radius"] = object_radius;
    j["default_radius"] = default_radius;
    j["hover_growth"] = hover_growth;
    j["label_gap"] = label_gap;
    j["font_size"] = font_size;
    j["object_fill"] = object_fill;
    j["actor_fill"] = actor_fill;
    j["place_fill"] = place_fill;
    j["node_stroke"] = node_stroke;
    j["label_color"] = label_color;
    j["background"] = background;
    j["edge_nazi"] = edge_nazi;
    j["edge_unesco"] = edge_unesco;
    j["edge_normal"] = edge_normal;
    j["edge_width"] = edge_width;
    j["edge_opacity"] = edge_opacity;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

bool StyleRules::validate(std::string& error_message) const {
    if (object_radius <= 0.0 || default_radius <= 0.0) {
        error_message = "Node radii must be positive";
        return false;
    }

    if (object_radius <= default_radius) {
        error_message = "Object radius must exceed the actor/place radius";
        return false;
    }

    if (hover_growth < 0.0 || label_gap < 0.0) {
        error_message = "Hover growth and label gap must be non-negative";
        return false;
    }

    if (edge_opacity < 0.0 || edge_opacity > 1.0) {
        error_message = "Edge opacity must be between 0.0 and 1.0";
        return false;
    }

    return true;
}

} // namespace prov
