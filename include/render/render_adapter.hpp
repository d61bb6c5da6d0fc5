#pragma once

#include "graph/policy.hpp"
#include "graph/provenance_graph.hpp"
#include "interaction/interaction_controller.hpp"
#include "layout/force_layout_engine.hpp"
#include "render/style_rules.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace prov {

// Drawable node, positions in world coordinates
struct RenderNode {
    std::string id;
    std::string label;
    NodeKind kind = NodeKind::Object;
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;
    double label_dy = 0.0;      // Label baseline offset below the center
    std::string fill;
    bool emphasized = false;
    bool pinned = false;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["label"] = label;
        j["type"] = node_kind_to_string(kind);
        j["x"] = x;
        j["y"] = y;
        j["r"] = radius;
        j["label_dy"] = label_dy;
        j["fill"] = fill;
        j["emphasized"] = emphasized;
        j["pinned"] = pinned;
        return j;
    }
};

// Drawable edge as a straight segment between its endpoints
struct RenderEdge {
    std::string id;
    std::string source_id;
    std::string target_id;
    std::string label;
    EdgeClass edge_class = EdgeClass::Normal;
    std::string stroke;
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["id"] = id;
        j["source"] = source_id;
        j["target"] = target_id;
        j["label"] = label;
        j["class"] = edge_class_to_string(edge_class);
        j["stroke"] = stroke;
        j["x1"] = x1;
        j["y1"] = y1;
        j["x2"] = x2;
        j["y2"] = y2;
        return j;
    }
};

// Everything needed to draw one tick
struct RenderFrame {
    size_t tick = 0;
    double width = 0.0;
    double height = 0.0;
    Viewport viewport;
    std::vector<RenderNode> nodes;
    std::vector<RenderEdge> edges;

    const RenderNode* find_node(const std::string& node_id) const;

    nlohmann::json to_json() const;
    void save_to_json(const std::string& path) const;
};

// Render adapter - maps the graph model and live simulation positions to
// drawable attributes. Holds no simulation state; call build_frame() from
// the engine's tick callback.
class RenderAdapter {
public:
    explicit RenderAdapter(StyleRules style = StyleRules(),
                           PolicyCatalog policies = PolicyCatalog::defaults());

    RenderFrame build_frame(const ForceLayoutEngine& engine,
                            const Viewport& viewport = Viewport(),
                            const std::string& emphasized_id = "") const;

    // Convenience overload reading viewport and hover from a controller
    RenderFrame build_frame(const ForceLayoutEngine& engine,
                            const InteractionController& controller) const;

    // Write a standalone SVG snapshot with a policy legend
    void export_svg(const RenderFrame& frame,
                    const std::string& filename,
                    const std::string& title = "Provenance Network") const;

    std::string to_svg(const RenderFrame& frame, const std::string& title) const;

    const StyleRules& style() const { return style_; }
    const PolicyCatalog& policies() const { return policies_; }

private:
    StyleRules style_;
    PolicyCatalog policies_;
};

} // namespace prov
