#include "cli/cli.hpp"
#include "graph/provenance_graph.hpp"
#include "graph/graph_augmenter.hpp"
#include "graph/policy.hpp"
#include "layout/force_layout_engine.hpp"
#include "render/render_adapter.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace prov;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

void ensure_parent_directory(const std::string& path) {
    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
}

// Layout settings come from --config when given, otherwise from PROVGRAPH_* variables
LayoutConfig load_layout_config(const Args& args) {
    LayoutConfig config = args.has("config")
        ? LayoutConfig::from_json_file(args.get("config").value)
        : LayoutConfig::from_environment();

    if (args.has("ticks")) {
        config.max_ticks = args.get("ticks").as_int(config.max_ticks);
    }
    config.width = args.get("width").as_double(config.width);
    config.height = args.get("height").as_double(config.height);
    if (args.has("verbose")) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Configuration error: " + error);
    }
    return config;
}

// Load the case graph and, when an event file is given, augment it
ProvenanceGraph load_case_graph(const Args& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading graph from: " << input_path << "\n";
    ProvenanceGraph graph = ProvenanceGraph::load_from_json(input_path);
    std::cout << "Loaded " << graph.num_nodes() << " nodes and " << graph.num_edges() << " edges\n";

    if (args.has("events")) {
        EventList events = load_events_from_json(args.get("events").value);
        GraphAugmenter augmenter;
        graph = augmenter.augment(graph, events);
        const auto& stats = augmenter.last_stats();
        if (stats.augmented) {
            std::cout << "Augmented from " << stats.events_seen << " events: +"
                      << stats.nodes_added << " nodes, +" << stats.edges_added << " edges\n";
        }
    }

    std::string error;
    if (!graph.validate(error)) {
        throw std::runtime_error("Invalid graph: " + error);
    }
    return graph;
}

size_t settle(ForceLayoutEngine& engine) {
    auto start = std::chrono::steady_clock::now();
    size_t ticks = engine.run_until_settled();
    auto elapsed = std::chrono::steady_clock::now() - start;

    std::cout << "Layout " << simulation_state_to_string(engine.state())
              << " after " << ticks << " ticks (" << format_duration(elapsed) << ")\n";
    if (engine.state() != SimulationState::Settled) {
        std::cerr << "Warning: layout did not settle within " << ticks << " ticks\n";
    }
    if (engine.nonfinite_resets() > 0) {
        std::cerr << "Warning: " << engine.nonfinite_resets()
                  << " non-finite node positions were reset\n";
    }
    return ticks;
}

// ============== provgraph augment ==============
int cmd_augment(const Args& args) {
    std::string graph_path = args.require("graph");
    std::string events_path = args.require("events");
    std::string output_path = args.require("output");

    std::cout << "Loading graph from: " << graph_path << "\n";
    ProvenanceGraph graph = ProvenanceGraph::load_from_json(graph_path);

    std::cout << "Loading events from: " << events_path << "\n";
    EventList events = load_events_from_json(events_path);

    GraphAugmenter augmenter;
    ProvenanceGraph result = augmenter.augment(graph, events);
    const auto& stats = augmenter.last_stats();

    if (stats.augmented) {
        std::cout << "Degenerate graph expanded from " << stats.events_seen << " events\n";
        std::cout << "  Nodes added: " << stats.nodes_added << "\n";
        std::cout << "  Edges added: " << stats.edges_added << "\n";
        if (stats.events_skipped > 0) {
            std::cout << "  Events without actor or place: " << stats.events_skipped << "\n";
        }
    } else {
        std::cout << "Graph is not degenerate or no usable events; written unchanged\n";
    }

    ensure_parent_directory(output_path);
    result.export_to_json(output_path);
    std::cout << "Saved " << result.num_nodes() << " nodes and " << result.num_edges()
              << " edges to: " << output_path << "\n";
    return 0;
}

// ============== provgraph layout ==============
int cmd_layout(const Args& args) {
    std::string output_path = args.require("output");
    LayoutConfig config = load_layout_config(args);
    ProvenanceGraph graph = load_case_graph(args);

    ForceLayoutEngine engine(std::move(graph), config);
    settle(engine);

    ensure_parent_directory(output_path);
    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + output_path);
    }
    file << engine.positions_to_json().dump(2);

    std::cout << "Positions saved to: " << output_path << "\n";
    return 0;
}

// ============== provgraph render ==============
int cmd_render(const Args& args) {
    std::string output_dir = args.require("output");
    std::string title = args.get("title", "Provenance Network").value;

    LayoutConfig config = load_layout_config(args);
    StyleRules style;
    if (args.has("style")) {
        style = StyleRules::from_json_file(args.get("style").value);
    }
    std::string error;
    if (!style.validate(error)) {
        throw std::invalid_argument("Style error: " + error);
    }

    ProvenanceGraph graph = load_case_graph(args);
    ForceLayoutEngine engine(std::move(graph), config);
    settle(engine);

    RenderAdapter adapter(style);
    RenderFrame frame = adapter.build_frame(engine);

    fs::create_directories(output_dir);
    std::string svg_path = (fs::path(output_dir) / "network.svg").string();
    std::string frame_path = (fs::path(output_dir) / "network_frame.json").string();

    adapter.export_svg(frame, svg_path, title);
    frame.save_to_json(frame_path);

    std::cout << "\nOutput files:\n";
    std::cout << "  SVG:   " << svg_path << "\n";
    std::cout << "  Frame: " << frame_path << "\n";
    return 0;
}

// ============== provgraph stats ==============
int cmd_stats(const Args& args) {
    ProvenanceGraph graph = load_case_graph(args);
    auto stats = graph.compute_statistics();

    std::cout << "\nGraph Statistics:\n";
    std::cout << "  Nodes:         " << stats.num_nodes << "\n";
    std::cout << "    objects:     " << stats.num_objects << "\n";
    std::cout << "    actors:      " << stats.num_actors << "\n";
    std::cout << "    places:      " << stats.num_places << "\n";
    std::cout << "  Edges:         " << stats.num_edges << "\n";
    std::cout << "  Policy edges:  " << stats.num_policy_edges << "\n";
    std::cout << "  Degree:        min " << stats.min_degree << ", max " << stats.max_degree
              << ", avg " << std::fixed << std::setprecision(2) << stats.avg_degree << "\n";
    if (!stats.top_hub.empty()) {
        std::cout << "  Top hub:       " << stats.top_hub << "\n";
    }

    if (args.has("json")) {
        std::cout << stats.to_json().dump(2) << "\n";
    }
    return 0;
}

// ============== provgraph policies ==============
int cmd_policies(const Args& args) {
    PolicyCatalog catalog = PolicyCatalog::defaults();

    if (args.has("date")) {
        std::string date = args.get("date").value;
        auto codes = catalog.codes_for_date(date);
        std::cout << to_iso_date(date) << ": ";
        if (codes.empty()) {
            std::cout << "no policy window\n";
        }
        for (size_t i = 0; i < codes.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << codes[i];
        }
        if (!codes.empty()) std::cout << "\n";
        return 0;
    }

    std::cout << "Policy windows (in edge color priority order):\n";
    for (const auto& window : catalog.windows()) {
        std::cout << "  " << window.code << "  "
                  << (window.from.empty() ? "..." : window.from) << " to "
                  << (window.to.empty() ? "open" : window.to) << "\n"
                  << "      " << window.label << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("provgraph", "1.0.0");

    // provgraph augment
    cli.register_command({
        "augment",
        "Expand a single-node case graph from its provenance events",
        {
            {"graph", "g", "Raw graph JSON file", "", true, false},
            {"events", "e", "Events JSON file (array or case-file object)", "", true, false},
            {"output", "o", "Output path for the augmented graph JSON", "", true, false}
        },
        cmd_augment
    });

    // provgraph layout
    cli.register_command({
        "layout",
        "Run the force layout to rest and save node positions",
        {
            {"input", "i", "Graph JSON file", "", true, false},
            {"events", "e", "Events JSON file used to augment a degenerate graph", "", false, false},
            {"config", "c", "Layout configuration JSON file", "", false, false},
            {"output", "o", "Output path for positions JSON", "", true, false},
            {"width", "W", "Canvas width", "", false, false, true},
            {"height", "H", "Canvas height", "", false, false, true},
            {"ticks", "n", "Maximum number of ticks", "", false, false, true},
            {"verbose", "v", "Log layout lifecycle", "", false, true}
        },
        cmd_layout
    });

    // provgraph render
    cli.register_command({
        "render",
        "Lay out a graph and export an SVG snapshot",
        {
            {"input", "i", "Graph JSON file", "", true, false},
            {"events", "e", "Events JSON file used to augment a degenerate graph", "", false, false},
            {"config", "c", "Layout configuration JSON file", "", false, false},
            {"style", "s", "Style rules JSON file", "", false, false},
            {"output", "o", "Output directory for SVG and frame JSON", "", true, false},
            {"title", "t", "Title for the visualization", "Provenance Network", false, false},
            {"width", "W", "Canvas width", "", false, false, true},
            {"height", "H", "Canvas height", "", false, false, true},
            {"ticks", "n", "Maximum number of ticks", "", false, false, true},
            {"verbose", "v", "Log layout lifecycle", "", false, true}
        },
        cmd_render
    });

    // provgraph stats
    cli.register_command({
        "stats",
        "Print statistics about a case graph",
        {
            {"input", "i", "Graph JSON file", "", true, false},
            {"events", "e", "Events JSON file used to augment a degenerate graph", "", false, false},
            {"json", "j", "Also print statistics as JSON", "", false, true}
        },
        cmd_stats
    });

    // provgraph policies
    cli.register_command({
        "policies",
        "List policy windows or classify a date",
        {
            {"date", "d", "ISO date to classify", "", false, false}
        },
        cmd_policies
    });

    return cli.run(argc, argv);
}
