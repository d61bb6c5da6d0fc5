#include "interaction/interaction_controller.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace prov {

// ==========================================
// Viewport
// ==========================================

void Viewport::pan(double dx, double dy) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) return;
    tx += dx;
    ty += dy;
}

void Viewport::zoom_at(double factor, Point anchor) {
    if (!std::isfinite(factor) || factor <= 0.0) return;

    Point world = to_world(anchor);
    scale = std::clamp(scale * factor, MIN_SCALE, MAX_SCALE);
    tx = anchor.x - world.x * scale;
    ty = anchor.y - world.y * scale;
}

std::string Viewport::to_transform() const {
    std::stringstream ss;
    ss << "translate(" << tx << "," << ty << ") scale(" << scale << ")";
    return ss.str();
}

// ==========================================
// InteractionController
// ==========================================

InteractionController::InteractionController(ForceLayoutEngine& engine, StyleRules style)
    : engine_(engine), style_(std::move(style)) {}

Point InteractionController::clamp_to_canvas(Point screen) const {
    const double width = engine_.config().width;
    const double height = engine_.config().height;

    if (std::isnan(screen.x)) screen.x = width / 2.0;
    if (std::isnan(screen.y)) screen.y = height / 2.0;
    screen.x = std::clamp(screen.x, 0.0, width);
    screen.y = std::clamp(screen.y, 0.0, height);
    return screen;
}

std::optional<std::string> InteractionController::node_at(Point screen) const {
    Point world = viewport_.to_world(screen);
    const auto& nodes = engine_.nodes();

    // Later nodes are drawn on top
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        double radius = style_.radius_for(it->kind, is_emphasized(it->id));
        if (std::hypot(it->x - world.x, it->y - world.y) <= radius) {
            return it->id;
        }
    }
    return std::nullopt;
}

void InteractionController::pointer_down(Point screen) {
    Point p = clamp_to_canvas(screen);
    press_screen_ = p;
    last_screen_ = p;
    travel_ = 0.0;

    if (mode_ == Mode::Dragging) {
        end_drag();
    }

    auto hit = node_at(p);
    if (hit) {
        // Keep the grab offset so the node does not jump to the pointer
        Point world = viewport_.to_world(p);
        auto current = engine_.position(*hit);
        if (current) {
            grab_offset_ = {current->x - world.x, current->y - world.y};
            if (engine_.pin(*hit, *current)) {
                mode_ = Mode::Dragging;
                dragged_ = *hit;
                drag_generation_ = engine_.generation();
                return;
            }
        }
    }

    mode_ = Mode::Panning;
}

void InteractionController::pointer_move(Point screen) {
    Point p = clamp_to_canvas(screen);
    double dx = p.x - last_screen_.x;
    double dy = p.y - last_screen_.y;
    travel_ += std::hypot(dx, dy);
    last_screen_ = p;

    switch (mode_) {
        case Mode::Dragging: {
            if (drag_is_stale()) {
                abandon_drag();
                break;
            }
            Point world = viewport_.to_world(p);
            Point target{world.x + grab_offset_.x, world.y + grab_offset_.y};
            if (!engine_.pin(dragged_, target)) {
                // Node went away mid-drag (graph replaced or view disposed)
                mode_ = Mode::Idle;
                dragged_.clear();
            }
            break;
        }
        case Mode::Panning:
            viewport_.pan(dx, dy);
            break;
        case Mode::Idle:
            update_hover(p);
            break;
    }
}

void InteractionController::pointer_up(Point screen) {
    Point p = clamp_to_canvas(screen);
    travel_ += std::hypot(p.x - last_screen_.x, p.y - last_screen_.y);
    last_screen_ = p;

    if (mode_ == Mode::Dragging && drag_is_stale()) {
        abandon_drag();
    } else if (mode_ == Mode::Dragging) {
        std::string node_id = dragged_;
        end_drag();

        const NodeState* node = engine_.node_state(node_id);
        if (node && travel_ < CLICK_TOLERANCE && click_cb_) {
            click_cb_(node_id, node->kind);
        }
    }

    mode_ = Mode::Idle;
    update_hover(p);
}

void InteractionController::pointer_leave() {
    if (mode_ == Mode::Dragging) {
        end_drag();
    }
    mode_ = Mode::Idle;
    hovered_.clear();
}

void InteractionController::wheel(double delta_y, Point screen) {
    if (!std::isfinite(delta_y)) return;
    Point p = clamp_to_canvas(screen);
    viewport_.zoom_at(std::pow(2.0, -delta_y * 0.002), p);
}

void InteractionController::end_drag() {
    if (drag_is_stale()) {
        abandon_drag();
        return;
    }
    // A node removed since the drag began has no pin left to release
    if (engine_.is_pinned(dragged_)) {
        engine_.unpin(dragged_);
    }
    dragged_.clear();
    mode_ = Mode::Idle;
}

// The graph was replaced or disposed under the gesture: a node with the
// same id now belongs to another case and must not be pinned or clicked
void InteractionController::abandon_drag() {
    dragged_.clear();
    hovered_.clear();
    mode_ = Mode::Idle;
}

void InteractionController::update_hover(Point screen) {
    auto hit = node_at(screen);
    hovered_ = hit ? *hit : std::string();
}

} // namespace prov
