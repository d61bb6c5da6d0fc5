#include "render/render_adapter.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace prov {

static std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

// ==========================================
// RenderFrame
// ==========================================

const RenderNode* RenderFrame::find_node(const std::string& node_id) const {
    for (const auto& node : nodes) {
        if (node.id == node_id) return &node;
    }
    return nullptr;
}

nlohmann::json RenderFrame::to_json() const {
    nlohmann::json j;
    j["tick"] = tick;
    j["width"] = width;
    j["height"] = height;
    j["transform"] = {
        {"x", viewport.tx},
        {"y", viewport.ty},
        {"k", viewport.scale}
    };

    nlohmann::json nodes_arr = nlohmann::json::array();
    for (const auto& n : nodes) {
        nodes_arr.push_back(n.to_json());
    }
    j["nodes"] = nodes_arr;

    nlohmann::json edges_arr = nlohmann::json::array();
    for (const auto& e : edges) {
        edges_arr.push_back(e.to_json());
    }
    j["edges"] = edges_arr;

    return j;
}

void RenderFrame::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

// ==========================================
// RenderAdapter
// ==========================================

RenderAdapter::RenderAdapter(StyleRules style, PolicyCatalog policies)
    : style_(std::move(style)), policies_(std::move(policies)) {}

RenderFrame RenderAdapter::build_frame(const ForceLayoutEngine& engine,
                                       const Viewport& viewport,
                                       const std::string& emphasized_id) const {
    RenderFrame frame;
    frame.tick = engine.tick_count();
    frame.width = engine.config().width;
    frame.height = engine.config().height;
    frame.viewport = viewport;

    for (const auto& state : engine.nodes()) {
        RenderNode rn;
        rn.id = state.id;
        rn.label = state.label.empty() ? state.id : state.label;
        rn.kind = state.kind;
        rn.x = state.x;
        rn.y = state.y;
        rn.emphasized = !emphasized_id.empty() && state.id == emphasized_id;
        rn.pinned = state.pinned;
        rn.radius = style_.radius_for(state.kind, rn.emphasized);
        rn.label_dy = style_.label_offset(state.kind);
        rn.fill = style_.fill_for(state.kind);
        frame.nodes.push_back(rn);
    }

    for (const auto& edge : engine.graph().edges) {
        const NodeState* source = engine.node_state(edge.source_id);
        const NodeState* target = engine.node_state(edge.target_id);
        if (!source || !target) continue;

        RenderEdge re;
        re.id = edge.id;
        re.source_id = edge.source_id;
        re.target_id = edge.target_id;
        re.label = edge.label;
        re.edge_class = policies_.classify(edge);
        re.stroke = style_.stroke_for(re.edge_class);
        re.x1 = source->x;
        re.y1 = source->y;
        re.x2 = target->x;
        re.y2 = target->y;
        frame.edges.push_back(re);
    }

    return frame;
}

RenderFrame RenderAdapter::build_frame(const ForceLayoutEngine& engine,
                                       const InteractionController& controller) const {
    return build_frame(engine, controller.viewport(), controller.hovered());
}

std::string RenderAdapter::to_svg(const RenderFrame& frame, const std::string& title) const {
    std::stringstream svg;

    svg << "<?xml version=\"1.0\" standalone=\"no\"?>\n"
        << "<svg width=\"" << frame.width << "\" height=\"" << frame.height
        << "\" version=\"1.1\" xmlns=\"http://www.w3.org/2000/svg\" "
        << "style=\"background-color:" << style_.background << ";\">\n"
        << "<title>" << xml_escape(title) << "</title>\n"
        << "<rect width=\"100%\" height=\"100%\" fill=\"" << style_.background << "\"/>\n"
        << "<g transform=\"" << frame.viewport.to_transform() << "\">\n";

    // Edges first so circles cover their endpoints
    svg << "<g>\n";
    for (const auto& e : frame.edges) {
        svg << "<line x1=\"" << e.x1 << "\" y1=\"" << e.y1
            << "\" x2=\"" << e.x2 << "\" y2=\"" << e.y2
            << "\" stroke=\"" << e.stroke << "\" stroke-width=\"" << style_.edge_width
            << "\" stroke-opacity=\"" << style_.edge_opacity << "\">"
            << "<title>" << xml_escape(e.label) << "</title></line>\n";
    }
    svg << "</g>\n<g>\n";

    for (const auto& n : frame.nodes) {
        svg << "<g transform=\"translate(" << n.x << "," << n.y << ")\">\n"
            << "<circle r=\"" << n.radius << "\" fill=\"" << n.fill
            << "\" stroke=\"" << style_.node_stroke << "\" stroke-width=\"1\"/>\n"
            << "<text dy=\"" << n.label_dy << "\" text-anchor=\"middle\" font-size=\""
            << style_.font_size << "px\" font-family=\"system-ui, sans-serif\" fill=\""
            << style_.label_color << "\">" << xml_escape(n.label) << "</text>\n"
            << "</g>\n";
    }
    svg << "</g>\n</g>\n";

    // Legend stays fixed on screen, outside the pan/zoom group
    double y = 20.0;
    svg << "<g font-size=\"11px\" font-family=\"system-ui, sans-serif\" fill=\""
        << style_.label_color << "\">\n";
    for (const auto& window : policies_.windows()) {
        GraphEdge probe;
        probe.policy_periods.push_back(window.code);
        svg << "<line x1=\"10\" y1=\"" << y << "\" x2=\"30\" y2=\"" << y
            << "\" stroke=\"" << style_.stroke_for(policies_.classify(probe))
            << "\" stroke-width=\"" << style_.edge_width << "\"/>\n"
            << "<text x=\"36\" y=\"" << (y + 4) << "\">" << xml_escape(window.label) << "</text>\n";
        y += 16.0;
    }
    svg << "<line x1=\"10\" y1=\"" << y << "\" x2=\"30\" y2=\"" << y
        << "\" stroke=\"" << style_.edge_normal << "\" stroke-width=\"" << style_.edge_width << "\"/>\n"
        << "<text x=\"36\" y=\"" << (y + 4) << "\">Unclassified</text>\n"
        << "</g>\n";

    svg << "</svg>\n";
    return svg.str();
}

void RenderAdapter::export_svg(const RenderFrame& frame,
                               const std::string& filename,
                               const std::string& title) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_svg(frame, title);
    file.close();
}

} // namespace prov
