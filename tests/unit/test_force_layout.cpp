#include <gtest/gtest.h>
#include "layout/force_layout_engine.hpp"
#include "graph/graph_augmenter.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

using namespace prov;

class ForceLayoutEngineTest : public ::testing::Test {
protected:
    ProvenanceGraph graph;

    void SetUp() override {
        ProvenanceGraph single;
        single.nodes.push_back({"obj:1", "Still Life", NodeKind::Object});

        EventList events;
        events.push_back(make_event("Alice", "Paris", "SALE", "1935-01-01"));
        events.push_back(make_event("Bob", "London", "AUCTION", "1952-03-10"));
        events.push_back(make_event("Carol", "Paris", "GIFT", "1960-07-07"));
        events.push_back(make_event("Alice", "Berlin", "LOAN", "1972-01-01"));

        GraphAugmenter augmenter;
        graph = augmenter.augment(single, events);
    }

    static ProvenanceEvent make_event(const std::string& actor, const std::string& place,
                                      const std::string& type, const std::string& date) {
        ProvenanceEvent event;
        event.actor = actor;
        event.place = place;
        event.event_type = type;
        event.date_from = date;
        return event;
    }

    static bool all_finite(const ForceLayoutEngine& engine) {
        for (const auto& n : engine.nodes()) {
            if (!std::isfinite(n.x) || !std::isfinite(n.y)) return false;
        }
        return true;
    }
};

// ==========================================
// Lifecycle
// ==========================================

TEST_F(ForceLayoutEngineTest, StartsIdleWithAllNodesPlaced) {
    ForceLayoutEngine engine(graph);

    EXPECT_EQ(engine.state(), SimulationState::Idle);
    EXPECT_EQ(engine.nodes().size(), 7);
    EXPECT_EQ(engine.skipped_links(), 0);
    EXPECT_TRUE(all_finite(engine));

    // Idle engines do not move
    EXPECT_FALSE(engine.tick());
    EXPECT_EQ(engine.tick_count(), 0);

    engine.start();
    EXPECT_EQ(engine.state(), SimulationState::Running);
    EXPECT_TRUE(engine.tick());
    EXPECT_EQ(engine.tick_count(), 1);
}

TEST_F(ForceLayoutEngineTest, ConvergesWithinBoundedTicks) {
    ForceLayoutEngine engine(graph);
    size_t ticks = engine.run_until_settled(1000);

    EXPECT_EQ(engine.state(), SimulationState::Settled);
    EXPECT_GE(ticks, 250);
    EXPECT_LE(ticks, 350);
    EXPECT_LT(engine.alpha(), engine.config().alpha_min);
    EXPECT_LT(engine.last_displacement(), 1.0);
    EXPECT_TRUE(all_finite(engine));

    // Settled engines stay put
    EXPECT_FALSE(engine.tick());
}

TEST_F(ForceLayoutEngineTest, SettledLayoutRespectsMinimumSeparation) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();

    EXPECT_GE(engine.min_pair_distance(), engine.config().min_separation - 1e-6);
}

TEST_F(ForceLayoutEngineTest, SeparationHoldsEveryTick) {
    ForceLayoutEngine engine(graph);
    engine.start();
    for (int i = 0; i < 20; ++i) engine.tick();

    for (int i = 0; i < 50; ++i) {
        engine.tick();
        EXPECT_GE(engine.min_pair_distance(), engine.config().min_separation - 1e-6)
            << "at tick " << engine.tick_count();
    }
}

TEST_F(ForceLayoutEngineTest, SettledCallbackFiresOnce) {
    ForceLayoutEngine engine(graph);
    int settled = 0;
    size_t ticks_seen = 0;
    engine.set_tick_callback([&](const ForceLayoutEngine&) { ticks_seen++; });
    engine.set_settled_callback([&](const ForceLayoutEngine& e) {
        settled++;
        EXPECT_EQ(e.state(), SimulationState::Settled);
    });

    size_t ticks = engine.run_until_settled();
    EXPECT_EQ(settled, 1);
    EXPECT_EQ(ticks_seen, ticks);
}

TEST_F(ForceLayoutEngineTest, DisturbWakesSettledEngine) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();
    ASSERT_EQ(engine.state(), SimulationState::Settled);

    engine.disturb();
    EXPECT_EQ(engine.state(), SimulationState::Running);
    EXPECT_GE(engine.alpha(), engine.config().drag_alpha_target);
    EXPECT_TRUE(engine.tick());
}

TEST_F(ForceLayoutEngineTest, SameInputsGiveSameLayout) {
    ForceLayoutEngine a(graph);
    ForceLayoutEngine b(graph);
    a.start();
    b.start();

    for (int i = 0; i < 100; ++i) {
        a.tick();
    }
    // Ticks depend on state only, not on how the host spaces them
    for (int i = 0; i < 50; ++i) {
        b.tick();
    }
    for (int i = 0; i < 50; ++i) {
        b.tick();
    }

    ASSERT_EQ(a.nodes().size(), b.nodes().size());
    for (size_t i = 0; i < a.nodes().size(); ++i) {
        EXPECT_DOUBLE_EQ(a.nodes()[i].x, b.nodes()[i].x);
        EXPECT_DOUBLE_EQ(a.nodes()[i].y, b.nodes()[i].y);
    }
}

// ==========================================
// Pinning
// ==========================================

TEST_F(ForceLayoutEngineTest, PinnedNodeFollowsPinExactly) {
    ForceLayoutEngine engine(graph);
    engine.start();
    for (int i = 0; i < 50; ++i) engine.tick();

    ASSERT_TRUE(engine.pin("actor:Alice", {123.0, 456.0}));
    EXPECT_TRUE(engine.is_pinned("actor:Alice"));
    EXPECT_EQ(engine.num_pinned(), 1);

    for (int i = 0; i < 30; ++i) {
        engine.tick();
        auto p = engine.position("actor:Alice");
        ASSERT_TRUE(p.has_value());
        EXPECT_DOUBLE_EQ(p->x, 123.0);
        EXPECT_DOUBLE_EQ(p->y, 456.0);
    }

    // Moving the pin moves the node on the next tick
    ASSERT_TRUE(engine.pin("actor:Alice", {200.0, 210.0}));
    engine.tick();
    EXPECT_DOUBLE_EQ(engine.position("actor:Alice")->x, 200.0);
    EXPECT_DOUBLE_EQ(engine.position("actor:Alice")->y, 210.0);
}

TEST_F(ForceLayoutEngineTest, UnpinnedNodeResumesIntegration) {
    ForceLayoutEngine engine(graph);
    engine.start();
    ASSERT_TRUE(engine.pin("actor:Alice", {50.0, 50.0}));
    for (int i = 0; i < 10; ++i) engine.tick();

    ASSERT_TRUE(engine.unpin("actor:Alice"));
    EXPECT_FALSE(engine.is_pinned("actor:Alice"));
    EXPECT_DOUBLE_EQ(engine.alpha_target(), 0.0);

    for (int i = 0; i < 5; ++i) engine.tick();
    auto p = engine.position("actor:Alice");
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(p->x == 50.0 && p->y == 50.0);

    engine.run_until_settled();
    EXPECT_EQ(engine.state(), SimulationState::Settled);
}

TEST_F(ForceLayoutEngineTest, DragStartReheatsAndHoldsAlpha) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();
    ASSERT_EQ(engine.state(), SimulationState::Settled);

    ASSERT_TRUE(engine.pin("place:Paris", {400.0, 300.0}));
    EXPECT_EQ(engine.state(), SimulationState::Running);
    EXPECT_GE(engine.alpha(), engine.config().drag_alpha_target);
    EXPECT_DOUBLE_EQ(engine.alpha_target(), engine.config().drag_alpha_target);

    // A held pin never lets the layout settle
    size_t ticks = engine.run_until_settled(600);
    EXPECT_EQ(ticks, 600);
    EXPECT_EQ(engine.state(), SimulationState::Running);
    EXPECT_GT(engine.alpha(), engine.config().alpha_min);
}

TEST_F(ForceLayoutEngineTest, RejectsInvalidPins) {
    ForceLayoutEngine engine(graph);

    EXPECT_FALSE(engine.pin("actor:Nobody", {1.0, 1.0}));
    EXPECT_FALSE(engine.pin("actor:Alice", {std::nan(""), 1.0}));
    EXPECT_FALSE(engine.pin("actor:Alice", {1.0, INFINITY}));
    EXPECT_FALSE(engine.unpin("actor:Alice"));
    EXPECT_FALSE(engine.unpin("actor:Nobody"));
    EXPECT_EQ(engine.num_pinned(), 0);
}

TEST_F(ForceLayoutEngineTest, TwoPinsKeepWarmUntilBothReleased) {
    ForceLayoutEngine engine(graph);
    engine.start();
    ASSERT_TRUE(engine.pin("actor:Alice", {100.0, 100.0}));
    ASSERT_TRUE(engine.pin("actor:Bob", {700.0, 500.0}));

    ASSERT_TRUE(engine.unpin("actor:Alice"));
    EXPECT_DOUBLE_EQ(engine.alpha_target(), engine.config().drag_alpha_target);

    ASSERT_TRUE(engine.unpin("actor:Bob"));
    EXPECT_DOUBLE_EQ(engine.alpha_target(), 0.0);
}

// ==========================================
// Graph replacement and disposal
// ==========================================

TEST_F(ForceLayoutEngineTest, ReplaceGraphRestartsFromScratch) {
    ForceLayoutEngine engine(graph);
    engine.start();
    ASSERT_TRUE(engine.pin("actor:Alice", {10.0, 10.0}));
    for (int i = 0; i < 20; ++i) engine.tick();

    ProvenanceGraph other;
    other.nodes.push_back({"obj:2", "Vase", NodeKind::Object});
    other.nodes.push_back({"actor:Dora", "Dora", NodeKind::Actor});
    GraphEdge edge;
    edge.source_id = "obj:2";
    edge.target_id = "actor:Dora";
    other.edges.push_back(edge);

    ASSERT_TRUE(engine.replace_graph(other));
    EXPECT_EQ(engine.state(), SimulationState::Running);
    EXPECT_EQ(engine.nodes().size(), 2);
    EXPECT_EQ(engine.num_pinned(), 0);
    EXPECT_EQ(engine.tick_count(), 0);
    EXPECT_DOUBLE_EQ(engine.alpha(), engine.config().alpha_initial);
    EXPECT_FALSE(engine.position("actor:Alice").has_value());

    engine.run_until_settled();
    EXPECT_EQ(engine.state(), SimulationState::Settled);
}

TEST_F(ForceLayoutEngineTest, GenerationChangesOnReplaceAndDispose) {
    ForceLayoutEngine engine(graph);
    size_t initial = engine.generation();

    engine.start();
    engine.tick();
    ASSERT_TRUE(engine.pin("actor:Alice", {10.0, 10.0}));
    EXPECT_EQ(engine.generation(), initial);

    ASSERT_TRUE(engine.replace_graph(graph));
    EXPECT_EQ(engine.generation(), initial + 1);

    engine.dispose();
    EXPECT_EQ(engine.generation(), initial + 2);

    // Disposal is terminal
    engine.dispose();
    EXPECT_FALSE(engine.replace_graph(graph));
    EXPECT_EQ(engine.generation(), initial + 2);
}

TEST_F(ForceLayoutEngineTest, NodeStateCarriesLabel) {
    ForceLayoutEngine engine(graph);
    const NodeState* alice = engine.node_state("actor:Alice");
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->label, "Alice");

    ProvenanceGraph other;
    other.nodes.push_back({"actor:Alice", "Alice Weill", NodeKind::Actor});
    ASSERT_TRUE(engine.replace_graph(other));
    EXPECT_EQ(engine.node_state("actor:Alice")->label, "Alice Weill");
}

TEST_F(ForceLayoutEngineTest, DisposedEngineIgnoresEverything) {
    ForceLayoutEngine engine(graph);
    engine.start();
    engine.tick();
    engine.dispose();

    EXPECT_EQ(engine.state(), SimulationState::Disposed);
    EXPECT_TRUE(engine.nodes().empty());
    EXPECT_FALSE(engine.tick());
    EXPECT_FALSE(engine.pin("actor:Alice", {1.0, 1.0}));
    EXPECT_FALSE(engine.unpin("actor:Alice"));
    EXPECT_FALSE(engine.replace_graph(graph));

    engine.disturb();
    engine.start();
    EXPECT_EQ(engine.state(), SimulationState::Disposed);
    EXPECT_EQ(engine.run_until_settled(10), 0);
}

TEST_F(ForceLayoutEngineTest, DisposeFromTickCallbackStopsTheLoop) {
    ForceLayoutEngine engine(graph);
    engine.set_tick_callback([&engine](const ForceLayoutEngine& e) {
        if (e.tick_count() == 10) {
            engine.dispose();
        }
    });

    size_t ticks = engine.run_until_settled(1000);
    EXPECT_EQ(ticks, 10);
    EXPECT_EQ(engine.state(), SimulationState::Disposed);
}

// ==========================================
// Robustness
// ==========================================

TEST_F(ForceLayoutEngineTest, EdgesWithMissingEndpointsAreSkipped) {
    GraphEdge dangling;
    dangling.source_id = "obj:1";
    dangling.target_id = "place:Atlantis";
    graph.edges.push_back(dangling);

    GraphEdge loop;
    loop.source_id = "obj:1";
    loop.target_id = "obj:1";
    graph.edges.push_back(loop);

    ForceLayoutEngine engine(graph);
    EXPECT_EQ(engine.skipped_links(), 2);

    engine.run_until_settled();
    EXPECT_EQ(engine.state(), SimulationState::Settled);
    EXPECT_TRUE(all_finite(engine));
}

TEST_F(ForceLayoutEngineTest, NonFinitePositionsAreReset) {
    ProvenanceGraph pair;
    pair.nodes.push_back({"obj:1", "Still Life", NodeKind::Object});
    pair.nodes.push_back({"actor:Alice", "Alice", NodeKind::Actor});
    GraphEdge edge;
    edge.source_id = "obj:1";
    edge.target_id = "actor:Alice";
    pair.edges.push_back(edge);

    // Overflows the velocity arithmetic within a couple of ticks
    LayoutConfig config;
    config.charge_strength = -1e308;

    ForceLayoutEngine engine(pair, config);
    engine.start();
    for (int i = 0; i < 10; ++i) {
        engine.tick();
        EXPECT_TRUE(all_finite(engine)) << "at tick " << engine.tick_count();
    }
    EXPECT_GT(engine.nonfinite_resets(), 0);
}

TEST_F(ForceLayoutEngineTest, EmptyGraphSettles) {
    ForceLayoutEngine engine(ProvenanceGraph{});
    engine.run_until_settled();
    EXPECT_EQ(engine.state(), SimulationState::Settled);
    EXPECT_TRUE(std::isinf(engine.min_pair_distance()));
}

TEST_F(ForceLayoutEngineTest, InvalidConfigurationThrows) {
    LayoutConfig config;
    config.velocity_decay = 2.0;
    EXPECT_THROW({ ForceLayoutEngine engine(graph, config); }, std::invalid_argument);

    config = LayoutConfig();
    config.charge_strength = 50.0;
    EXPECT_THROW({ ForceLayoutEngine engine(graph, config); }, std::invalid_argument);
}

TEST_F(ForceLayoutEngineTest, PositionsExportAsJson) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();

    auto j = engine.positions_to_json();
    EXPECT_EQ(j["state"].get<std::string>(), "settled");
    ASSERT_EQ(j["nodes"].size(), 7);
    EXPECT_EQ(j["nodes"][0]["id"].get<std::string>(), "obj:1");
    EXPECT_EQ(j["nodes"][0]["type"].get<std::string>(), "object");
}

// ==========================================
// Configuration
// ==========================================

TEST(LayoutConfigTest, DefaultsAreValid) {
    LayoutConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_DOUBLE_EQ(config.center_x(), 400.0);
    EXPECT_DOUBLE_EQ(config.center_y(), 300.0);
    EXPECT_NEAR(std::pow(1.0 - config.alpha_decay, 300.0), 0.001, 1e-12);
}

TEST(LayoutConfigTest, FileRoundTrip) {
    LayoutConfig config;
    config.width = 1024.0;
    config.link_distance = 140.0;
    config.seed = 7;

    std::string path = (std::filesystem::temp_directory_path() / "provgraph_layout_test.json").string();
    config.to_json_file(path);
    LayoutConfig loaded = LayoutConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_DOUBLE_EQ(loaded.width, 1024.0);
    EXPECT_DOUBLE_EQ(loaded.link_distance, 140.0);
    EXPECT_EQ(loaded.seed, 7u);
    EXPECT_DOUBLE_EQ(loaded.charge_strength, config.charge_strength);
}

TEST(LayoutConfigTest, MissingFileThrows) {
    EXPECT_THROW(LayoutConfig::from_json_file("/nonexistent/layout.json"), std::runtime_error);
}

TEST(LayoutConfigTest, ReadsEnvironment) {
    setenv("PROVGRAPH_LINK_DISTANCE", "150", 1);
    setenv("PROVGRAPH_VERBOSE", "1", 1);
    LayoutConfig config = LayoutConfig::from_environment();
    EXPECT_DOUBLE_EQ(config.link_distance, 150.0);
    EXPECT_TRUE(config.verbose);

    setenv("PROVGRAPH_LINK_DISTANCE", "far", 1);
    EXPECT_THROW(LayoutConfig::from_environment(), std::invalid_argument);

    unsetenv("PROVGRAPH_LINK_DISTANCE");
    unsetenv("PROVGRAPH_VERBOSE");
}
