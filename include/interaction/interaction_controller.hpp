#pragma once

#include "graph/provenance_graph.hpp"
#include "layout/force_layout_engine.hpp"
#include "render/style_rules.hpp"
#include <functional>
#include <optional>
#include <string>

namespace prov {

// Pan/zoom transform: screen = world * scale + translate
struct Viewport {
    static constexpr double MIN_SCALE = 0.5;
    static constexpr double MAX_SCALE = 3.0;

    double tx = 0.0;
    double ty = 0.0;
    double scale = 1.0;

    Point to_screen(Point world) const { return {world.x * scale + tx, world.y * scale + ty}; }
    Point to_world(Point screen) const { return {(screen.x - tx) / scale, (screen.y - ty) / scale}; }

    void pan(double dx, double dy);

    // Multiply the scale (clamped to [MIN_SCALE, MAX_SCALE]) keeping the
    // world point under the anchor fixed on screen
    void zoom_at(double factor, Point anchor);

    // SVG transform attribute
    std::string to_transform() const;
};

// Invoked with the clicked node's id and kind
using NodeClickCallback = std::function<void(const std::string& node_id, NodeKind kind)>;

// Interaction controller - turns pointer input into viewport changes and
// pin/unpin requests on a layout engine.
//
// The controller never reaches into simulation internals; it only calls
// pin(), unpin() and reads positions. Pointer coordinates are screen
// coordinates and are clamped to the canvas. No input raises an error.
class InteractionController {
public:
    enum class Mode { Idle, Dragging, Panning };

    // Movement below this many screen pixels still counts as a click
    static constexpr double CLICK_TOLERANCE = 3.0;

    InteractionController(ForceLayoutEngine& engine, StyleRules style = StyleRules());

    void set_click_callback(NodeClickCallback cb) { click_cb_ = std::move(cb); }

    void pointer_down(Point screen);
    void pointer_move(Point screen);
    void pointer_up(Point screen);
    void pointer_leave();

    // Wheel delta in pixels (positive scrolls down and zooms out)
    void wheel(double delta_y, Point screen);

    const Viewport& viewport() const { return viewport_; }
    Mode mode() const { return mode_; }
    const std::string& hovered() const { return hovered_; }
    const std::string& dragged() const { return dragged_; }

    bool is_emphasized(const std::string& node_id) const {
        return !node_id.empty() && node_id == hovered_;
    }

    // Canvas bounds applied to pointer coordinates; non-finite values map
    // to the canvas center
    Point clamp_to_canvas(Point screen) const;

    // Topmost node whose rendered circle contains the point
    std::optional<std::string> node_at(Point screen) const;

private:
    ForceLayoutEngine& engine_;
    StyleRules style_;
    Viewport viewport_;
    NodeClickCallback click_cb_;

    Mode mode_ = Mode::Idle;
    std::string hovered_;
    std::string dragged_;
    Point press_screen_;
    Point last_screen_;
    Point grab_offset_;             // Node center minus pointer, world units
    double travel_ = 0.0;
    size_t drag_generation_ = 0;    // Engine generation when the drag began

    void end_drag();
    bool drag_is_stale() const { return engine_.generation() != drag_generation_; }
    void abandon_drag();
    void update_hover(Point screen);
};

} // namespace prov
