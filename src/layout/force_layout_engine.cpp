#include "layout/force_layout_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace prov {

std::string simulation_state_to_string(SimulationState state) {
    switch (state) {
        case SimulationState::Idle:     return "idle";
        case SimulationState::Running:  return "running";
        case SimulationState::Settled:  return "settled";
        case SimulationState::Disposed: return "disposed";
    }
    return "idle";
}

ForceLayoutEngine::ForceLayoutEngine(ProvenanceGraph graph, LayoutConfig config)
    : graph_(std::move(graph)), config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid layout configuration: " + error);
    }
    initialize();
}

// ==========================================
// Setup
// ==========================================

void ForceLayoutEngine::initialize() {
    nodes_.clear();
    links_.clear();
    index_.clear();
    num_pinned_ = 0;
    skipped_links_ = 0;
    tick_count_ = 0;
    last_displacement_ = 0.0;
    alpha_ = config_.alpha_initial;
    alpha_target_ = 0.0;
    rng_.seed(config_.seed);

    // Phyllotaxis spiral around the canvas center
    const double initial_angle = std::acos(-1.0) * (3.0 - std::sqrt(5.0));
    nodes_.reserve(graph_.nodes.size());
    for (const auto& node : graph_.nodes) {
        size_t i = nodes_.size();
        if (!index_.emplace(node.id, i).second) {
            continue;  // Duplicate id, first occurrence wins
        }

        double radius = config_.initial_radius * std::sqrt(0.5 + static_cast<double>(i));
        double angle = static_cast<double>(i) * initial_angle;

        NodeState state;
        state.id = node.id;
        state.label = node.label;
        state.kind = node.kind;
        state.x = config_.center_x() + radius * std::cos(angle);
        state.y = config_.center_y() + radius * std::sin(angle);
        nodes_.push_back(state);
    }

    for (const auto& edge : graph_.edges) {
        auto src = index_.find(edge.source_id);
        auto tgt = index_.find(edge.target_id);
        if (src == index_.end() || tgt == index_.end() || src->second == tgt->second) {
            skipped_links_++;
            continue;
        }
        links_.push_back({src->second, tgt->second, 0.0, 0.0});
        nodes_[src->second].degree++;
        nodes_[tgt->second].degree++;
    }

    // Hubs pull weakly on each of their links and move less than their leaves
    for (auto& link : links_) {
        double ds = nodes_[link.source].degree;
        double dt = nodes_[link.target].degree;
        link.strength = 1.0 / std::min(ds, dt);
        link.bias = ds / (ds + dt);
    }

    if (config_.verbose && skipped_links_ > 0) {
        std::cerr << "Layout: skipped " << skipped_links_
                  << " edges with missing or identical endpoints\n";
    }
}

double ForceLayoutEngine::jiggle() {
    std::uniform_real_distribution<double> dist(-0.5, 0.5);
    return dist(rng_) * 1e-6;
}

// ==========================================
// Lifecycle
// ==========================================

void ForceLayoutEngine::start() {
    if (state_ != SimulationState::Idle) return;
    state_ = SimulationState::Running;
    if (config_.verbose) {
        std::cout << "Layout started: " << nodes_.size() << " nodes, "
                  << links_.size() << " links\n";
    }
}

bool ForceLayoutEngine::tick() {
    // Halted, settled and disposed engines never mutate state
    if (state_ != SimulationState::Running) {
        return false;
    }

    alpha_ += (alpha_target_ - alpha_) * config_.alpha_decay;

    std::vector<Point> previous;
    previous.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        previous.push_back({n.x, n.y});
    }

    apply_link_force();
    apply_charge_force();
    apply_center_force();
    for (int i = 0; i < config_.collision_iterations; ++i) {
        apply_collision_force();
    }

    integrate();
    sanitize();
    enforce_min_separation();

    double displacement = 0.0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        displacement += std::hypot(nodes_[i].x - previous[i].x, nodes_[i].y - previous[i].y);
    }
    last_displacement_ = displacement;
    tick_count_++;

    if (tick_cb_) {
        tick_cb_(*this);
    }

    // The tick listener may have disposed or replaced the graph
    if (state_ == SimulationState::Running && alpha_ < config_.alpha_min && num_pinned_ == 0) {
        state_ = SimulationState::Settled;
        if (config_.verbose) {
            std::cout << "Layout settled after " << tick_count_ << " ticks\n";
        }
        if (settled_cb_) {
            settled_cb_(*this);
        }
    }

    return true;
}

size_t ForceLayoutEngine::run_until_settled(size_t max_ticks) {
    start();

    size_t ticks = 0;
    while (ticks < max_ticks && state_ == SimulationState::Running) {
        tick();
        ticks++;
    }
    return ticks;
}

void ForceLayoutEngine::disturb() {
    if (state_ == SimulationState::Disposed) return;
    alpha_ = std::max(alpha_, config_.drag_alpha_target);
    state_ = SimulationState::Running;
}

bool ForceLayoutEngine::replace_graph(ProvenanceGraph graph) {
    if (state_ == SimulationState::Disposed) {
        return false;
    }

    // Halt before touching any simulation state
    state_ = SimulationState::Idle;
    generation_++;
    graph_ = std::move(graph);
    initialize();
    state_ = SimulationState::Running;

    if (config_.verbose) {
        std::cout << "Layout restarted for new graph: " << nodes_.size() << " nodes, "
                  << links_.size() << " links\n";
    }
    return true;
}

void ForceLayoutEngine::dispose() {
    if (state_ == SimulationState::Disposed) return;
    state_ = SimulationState::Disposed;
    generation_++;
    nodes_.clear();
    links_.clear();
    index_.clear();
    num_pinned_ = 0;

    if (config_.verbose) {
        std::cout << "Layout disposed after " << tick_count_ << " ticks\n";
    }
}

// ==========================================
// Pinning
// ==========================================

bool ForceLayoutEngine::pin(const std::string& node_id, Point position) {
    if (state_ == SimulationState::Disposed) return false;
    if (!std::isfinite(position.x) || !std::isfinite(position.y)) return false;

    auto it = index_.find(node_id);
    if (it == index_.end()) return false;

    NodeState& node = nodes_[it->second];
    if (!node.pinned) {
        // Drag start: reheat and keep warm until released
        node.pinned = true;
        num_pinned_++;
        alpha_target_ = config_.drag_alpha_target;
        alpha_ = std::max(alpha_, config_.drag_alpha_target);
        state_ = SimulationState::Running;
    }

    node.fx = position.x;
    node.fy = position.y;
    node.x = position.x;
    node.y = position.y;
    node.vx = 0.0;
    node.vy = 0.0;
    return true;
}

bool ForceLayoutEngine::unpin(const std::string& node_id) {
    auto it = index_.find(node_id);
    if (it == index_.end()) return false;

    NodeState& node = nodes_[it->second];
    if (!node.pinned) return false;

    node.pinned = false;
    num_pinned_--;
    if (num_pinned_ == 0) {
        alpha_target_ = 0.0;
    }
    return true;
}

bool ForceLayoutEngine::is_pinned(const std::string& node_id) const {
    const NodeState* node = node_state(node_id);
    return node && node->pinned;
}

// ==========================================
// Observation
// ==========================================

const NodeState* ForceLayoutEngine::node_state(const std::string& node_id) const {
    auto it = index_.find(node_id);
    return it != index_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<Point> ForceLayoutEngine::position(const std::string& node_id) const {
    const NodeState* node = node_state(node_id);
    if (!node) return std::nullopt;
    return Point{node->x, node->y};
}

double ForceLayoutEngine::min_pair_distance() const {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (size_t j = i + 1; j < nodes_.size(); ++j) {
            best = std::min(best, std::hypot(nodes_[j].x - nodes_[i].x, nodes_[j].y - nodes_[i].y));
        }
    }
    return best;
}

nlohmann::json ForceLayoutEngine::positions_to_json() const {
    nlohmann::json j;
    j["state"] = simulation_state_to_string(state_);
    j["alpha"] = alpha_;
    j["ticks"] = tick_count_;
    j["width"] = config_.width;
    j["height"] = config_.height;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& n : nodes_) {
        nlohmann::json nj;
        nj["id"] = n.id;
        nj["type"] = node_kind_to_string(n.kind);
        nj["x"] = n.x;
        nj["y"] = n.y;
        nj["pinned"] = n.pinned;
        nodes_json.push_back(nj);
    }
    j["nodes"] = nodes_json;

    return j;
}

// ==========================================
// Forces
// ==========================================

void ForceLayoutEngine::apply_link_force() {
    for (const auto& link : links_) {
        NodeState& source = nodes_[link.source];
        NodeState& target = nodes_[link.target];

        double x = target.x + target.vx - source.x - source.vx;
        double y = target.y + target.vy - source.y - source.vy;
        if (x == 0.0) x = jiggle();
        if (y == 0.0) y = jiggle();

        double l = std::sqrt(x * x + y * y);
        l = (l - config_.link_distance) / l * alpha_ * link.strength;
        x *= l;
        y *= l;

        target.vx -= x * link.bias;
        target.vy -= y * link.bias;
        source.vx += x * (1.0 - link.bias);
        source.vy += y * (1.0 - link.bias);
    }
}

void ForceLayoutEngine::apply_charge_force() {
    if (config_.charge_strength == 0.0) return;

    const double distance_min2 = config_.charge_distance_min * config_.charge_distance_min;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        NodeState& node = nodes_[i];
        for (size_t j = 0; j < nodes_.size(); ++j) {
            if (i == j) continue;
            const NodeState& other = nodes_[j];

            double x = other.x - node.x;
            double y = other.y - node.y;
            double l = x * x + y * y;
            if (x == 0.0) {
                x = jiggle();
                l += x * x;
            }
            if (y == 0.0) {
                y = jiggle();
                l += y * y;
            }
            if (l < distance_min2) {
                l = std::sqrt(distance_min2 * l);
            }

            double w = config_.charge_strength * alpha_ / l;
            node.vx += x * w;
            node.vy += y * w;
        }
    }
}

void ForceLayoutEngine::apply_center_force() {
    if (nodes_.empty() || config_.center_strength == 0.0) return;

    double sx = 0.0;
    double sy = 0.0;
    for (const auto& n : nodes_) {
        sx += n.x;
        sy += n.y;
    }

    double shift_x = (sx / nodes_.size() - config_.center_x()) * config_.center_strength;
    double shift_y = (sy / nodes_.size() - config_.center_y()) * config_.center_strength;
    for (auto& n : nodes_) {
        n.x -= shift_x;
        n.y -= shift_y;
    }
}

void ForceLayoutEngine::apply_collision_force() {
    const double ri = config_.collision_radius;
    const double r = ri + ri;
    if (r <= 0.0 || config_.collision_strength == 0.0) return;

    // Equal radii split the correction evenly between the two nodes
    const double ratio = 0.5;

    for (size_t i = 0; i < nodes_.size(); ++i) {
        NodeState& node = nodes_[i];
        double xi = node.x + node.vx;
        double yi = node.y + node.vy;

        for (size_t j = i + 1; j < nodes_.size(); ++j) {
            NodeState& other = nodes_[j];
            double x = xi - (other.x + other.vx);
            double y = yi - (other.y + other.vy);
            double l = x * x + y * y;
            if (!(l < r * r)) continue;

            if (x == 0.0) {
                x = jiggle();
                l += x * x;
            }
            if (y == 0.0) {
                y = jiggle();
                l += y * y;
            }

            l = std::sqrt(l);
            l = (r - l) / l * config_.collision_strength;
            x *= l;
            y *= l;

            node.vx += x * ratio;
            node.vy += y * ratio;
            other.vx -= x * (1.0 - ratio);
            other.vy -= y * (1.0 - ratio);
        }
    }
}

// ==========================================
// Integration and constraints
// ==========================================

void ForceLayoutEngine::integrate() {
    const double keep = 1.0 - config_.velocity_decay;
    for (auto& n : nodes_) {
        if (n.pinned) {
            n.x = n.fx;
            n.y = n.fy;
            n.vx = 0.0;
            n.vy = 0.0;
        } else {
            n.vx *= keep;
            n.vy *= keep;
            n.x += n.vx;
            n.y += n.vy;
        }
    }
}

void ForceLayoutEngine::sanitize() {
    for (auto& n : nodes_) {
        if (std::isfinite(n.x) && std::isfinite(n.y) &&
            std::isfinite(n.vx) && std::isfinite(n.vy)) {
            continue;
        }

        n.x = n.pinned ? n.fx : config_.center_x();
        n.y = n.pinned ? n.fy : config_.center_y();
        n.vx = 0.0;
        n.vy = 0.0;
        nonfinite_resets_++;

        if (config_.verbose) {
            std::cerr << "Layout: non-finite position for " << n.id
                      << ", reset to canvas center\n";
        }
    }
}

void ForceLayoutEngine::enforce_min_separation() {
    const double sep = config_.min_separation;
    if (sep <= 0.0) return;

    const double two_pi = 2.0 * std::acos(-1.0);
    std::uniform_real_distribution<double> angle_dist(0.0, two_pi);

    for (int pass = 0; pass < config_.separation_passes; ++pass) {
        bool moved = false;

        for (size_t i = 0; i < nodes_.size(); ++i) {
            for (size_t j = i + 1; j < nodes_.size(); ++j) {
                NodeState& a = nodes_[i];
                NodeState& b = nodes_[j];
                if (a.pinned && b.pinned) continue;

                double dx = b.x - a.x;
                double dy = b.y - a.y;
                double d2 = dx * dx + dy * dy;
                if (!(d2 < sep * sep)) continue;

                double d = std::sqrt(d2);
                double ux, uy;
                if (d > 0.0) {
                    ux = dx / d;
                    uy = dy / d;
                } else {
                    double angle = angle_dist(rng_);
                    ux = std::cos(angle);
                    uy = std::sin(angle);
                }

                double overlap = sep - d;
                if (a.pinned) {
                    b.x += ux * overlap;
                    b.y += uy * overlap;
                } else if (b.pinned) {
                    a.x -= ux * overlap;
                    a.y -= uy * overlap;
                } else {
                    a.x -= ux * overlap * 0.5;
                    a.y -= uy * overlap * 0.5;
                    b.x += ux * overlap * 0.5;
                    b.y += uy * overlap * 0.5;
                }
                moved = true;
            }
        }

        if (!moved) break;
    }
}

} // namespace prov
