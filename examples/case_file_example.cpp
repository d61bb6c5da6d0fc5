#include "graph/graph_augmenter.hpp"
#include "graph/policy.hpp"
#include "interaction/interaction_controller.hpp"
#include "layout/force_layout_engine.hpp"
#include "render/render_adapter.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace prov;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

ProvenanceEvent make_event(const std::string& type, const std::string& date,
                           const std::string& actor, const std::string& place,
                           const std::string& source_ref) {
    ProvenanceEvent event;
    event.event_type = type;
    event.date_from = date;
    event.actor = actor;
    event.place = place;
    event.source_ref = source_ref;
    return event;
}

void print_positions(const ForceLayoutEngine& engine) {
    for (const auto& node : engine.nodes()) {
        std::cout << "   " << std::left << std::setw(24) << node.id
                  << std::fixed << std::setprecision(1)
                  << " (" << node.x << ", " << node.y << ")"
                  << (node.pinned ? "  [pinned]" : "") << "\n";
    }
}

int main() {
    print_separator("Case File Example - Provenance Network Session");

    const std::string output_dir = "output_case";
    std::filesystem::create_directories(output_dir);

    // The backend returned only the object itself
    ProvenanceGraph raw;
    raw.nodes.push_back({"object:17", "Portrait of a Young Woman", NodeKind::Object});

    EventList events = {
        make_event("SALE", "1928-06-12", "Galerie Weill", "Paris", "Sale catalogue, lot 44"),
        make_event("CONFISCATION", "1941-03-02", "ERR Taskforce", "Paris", "ERR card 2231"),
        make_event("TRANSFER", "1942-09-18", "ERR Taskforce", "Berlin", "ERR card 2231"),
        make_event("RESTITUTION", "1947-05-01", "Galerie Weill", "", "Claim file 118"),
        make_event("AUCTION", "1983-11-30", "Meyer Collection", "London", "Auction record"),
        make_event("EXHIBITION", "", "", "Vienna", "")
    };

    // 1. Augment the degenerate graph
    std::cout << "1. Augmenting the case graph from " << events.size() << " events\n";
    GraphAugmenter augmenter;
    ProvenanceGraph graph = augmenter.augment(raw, events);
    const auto& stats = augmenter.last_stats();
    std::cout << "   Nodes: " << raw.num_nodes() << " -> " << graph.num_nodes()
              << ", edges: " << raw.num_edges() << " -> " << graph.num_edges() << "\n";
    if (stats.events_skipped > 0) {
        std::cout << "   Events without actor or place: " << stats.events_skipped << "\n";
    }

    // Edges from augmentation carry no policy codes; look up the windows
    // their dates fall in for the report
    PolicyCatalog policies = PolicyCatalog::defaults();
    std::cout << "\n   Policy windows touched by the events:\n";
    for (const auto& event : events) {
        auto codes = policies.codes_for_date(event.date_from);
        if (codes.empty()) continue;
        std::cout << "   " << event.date_from << " " << event.event_type << ": " << codes.front() << "\n";
    }

    // 2. Run the layout to rest
    std::cout << "\n2. Running the force layout\n";
    LayoutConfig config;
    ForceLayoutEngine engine(graph, config);

    RenderAdapter adapter;
    size_t frames = 0;
    engine.set_tick_callback([&](const ForceLayoutEngine& e) {
        adapter.build_frame(e);
        frames++;
    });
    engine.set_settled_callback([](const ForceLayoutEngine& e) {
        std::cout << "   Settled after " << e.tick_count() << " ticks\n";
    });

    engine.run_until_settled();
    std::cout << "   Frames built: " << frames << "\n";
    std::cout << "   Closest pair: " << std::fixed << std::setprecision(1)
              << engine.min_pair_distance() << " units\n";
    print_positions(engine);

    // 3. Hover, drag and click through the controller
    std::cout << "\n3. Interacting with the view\n";
    InteractionController controller(engine);
    controller.set_click_callback([](const std::string& node_id, NodeKind kind) {
        std::cout << "   Clicked " << node_kind_to_string(kind) << " " << node_id << "\n";
    });

    Point berlin = *engine.position("place:Berlin");
    controller.pointer_move(berlin);
    std::cout << "   Hovering: " << controller.hovered() << "\n";

    controller.pointer_down(berlin);
    for (int step = 1; step <= 20; ++step) {
        controller.pointer_move({berlin.x + 4.0 * step, berlin.y - 3.0 * step});
        engine.tick();
    }
    std::cout << "   Dragged place:Berlin while the layout stayed warm (alpha "
              << std::setprecision(3) << engine.alpha() << ")\n";
    controller.pointer_up({berlin.x + 80.0, berlin.y - 60.0});

    Point paris = *engine.position("place:Paris");
    controller.pointer_down(paris);
    controller.pointer_up(paris);

    controller.wheel(-240.0, {400.0, 300.0});
    std::cout << "   Zoom: " << std::setprecision(2) << controller.viewport().scale << "x\n";

    size_t ticks = engine.run_until_settled();
    std::cout << "   Re-settled after " << ticks << " more ticks\n";

    // 4. Export
    std::cout << "\n4. Exporting\n";
    RenderFrame frame = adapter.build_frame(engine, controller);
    std::string svg_path = output_dir + "/case_network.svg";
    std::string frame_path = output_dir + "/case_frame.json";
    adapter.export_svg(frame, svg_path, "Portrait of a Young Woman");
    frame.save_to_json(frame_path);
    std::cout << "   SVG:   " << svg_path << "\n";
    std::cout << "   Frame: " << frame_path << "\n";

    engine.dispose();

    print_separator("Example Complete");
    return 0;
}
