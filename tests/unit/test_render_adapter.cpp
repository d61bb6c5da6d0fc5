#include <gtest/gtest.h>
#include "render/render_adapter.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace prov;

class RenderAdapterTest : public ::testing::Test {
protected:
    ProvenanceGraph graph;
    RenderAdapter adapter;

    void SetUp() override {
        graph.nodes.push_back({"obj:1", "Smith & Sons Ledger", NodeKind::Object});
        graph.nodes.push_back({"actor:Alice", "Alice", NodeKind::Actor});
        graph.nodes.push_back({"place:Paris", "Paris", NodeKind::Place});

        graph.edges.push_back(make_edge("e-nazi", "actor:Alice", "obj:1", {POLICY_NAZI_ERA}));
        graph.edges.push_back(make_edge("e-unesco", "obj:1", "place:Paris", {POLICY_UNESCO_1970}));
        graph.edges.push_back(make_edge("e-both", "actor:Alice", "place:Paris",
                                        {POLICY_UNESCO_1970, POLICY_NAZI_ERA}));
        graph.edges.push_back(make_edge("e-plain", "place:Paris", "obj:1", {}));
    }

    static GraphEdge make_edge(const std::string& id, const std::string& source,
                               const std::string& target, std::vector<std::string> policies) {
        GraphEdge edge;
        edge.id = id;
        edge.source_id = source;
        edge.target_id = target;
        edge.label = "SALE";
        edge.policy_periods = std::move(policies);
        return edge;
    }

    static const RenderEdge* find_edge(const RenderFrame& frame, const std::string& id) {
        for (const auto& e : frame.edges) {
            if (e.id == id) return &e;
        }
        return nullptr;
    }
};

// ==========================================
// Style rules
// ==========================================

TEST(StyleRulesTest, RadiiAndLabelOffsets) {
    StyleRules style;
    EXPECT_DOUBLE_EQ(style.radius_for(NodeKind::Object), 20.0);
    EXPECT_DOUBLE_EQ(style.radius_for(NodeKind::Actor), 15.0);
    EXPECT_DOUBLE_EQ(style.radius_for(NodeKind::Place), 15.0);
    EXPECT_DOUBLE_EQ(style.radius_for(NodeKind::Object, true), 25.0);
    EXPECT_DOUBLE_EQ(style.radius_for(NodeKind::Place, true), 20.0);

    EXPECT_DOUBLE_EQ(style.label_offset(NodeKind::Object), 35.0);
    EXPECT_DOUBLE_EQ(style.label_offset(NodeKind::Actor), 30.0);
}

TEST(StyleRulesTest, EachKindHasItsOwnFill) {
    StyleRules style;
    EXPECT_NE(style.fill_for(NodeKind::Object), style.fill_for(NodeKind::Actor));
    EXPECT_NE(style.fill_for(NodeKind::Actor), style.fill_for(NodeKind::Place));
    EXPECT_NE(style.fill_for(NodeKind::Object), style.fill_for(NodeKind::Place));
}

TEST(StyleRulesTest, ValidateRejectsSmallObjects) {
    StyleRules style;
    std::string error;
    EXPECT_TRUE(style.validate(error)) << error;

    style.object_radius = style.default_radius;
    EXPECT_FALSE(style.validate(error));
}

TEST(StyleRulesTest, FileOverridesDefaults) {
    std::string path = (std::filesystem::temp_directory_path() / "provgraph_style_test.json").string();
    {
        std::ofstream file(path);
        file << R"({"object_radius": 24, "edge_nazi": "#ff0000"})";
    }

    StyleRules style = StyleRules::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_DOUBLE_EQ(style.object_radius, 24.0);
    EXPECT_EQ(style.edge_nazi, "#ff0000");
    EXPECT_DOUBLE_EQ(style.default_radius, 15.0);
}

// ==========================================
// Frames
// ==========================================

TEST_F(RenderAdapterTest, FrameMirrorsEnginePositions) {
    ForceLayoutEngine engine(graph);
    engine.start();
    for (int i = 0; i < 10; ++i) engine.tick();

    RenderFrame frame = adapter.build_frame(engine);

    EXPECT_EQ(frame.tick, 10);
    ASSERT_EQ(frame.nodes.size(), 3);
    for (const auto& node : frame.nodes) {
        auto p = engine.position(node.id);
        ASSERT_TRUE(p.has_value());
        EXPECT_DOUBLE_EQ(node.x, p->x);
        EXPECT_DOUBLE_EQ(node.y, p->y);
    }

    ASSERT_EQ(frame.edges.size(), 4);
    for (const auto& edge : frame.edges) {
        const RenderNode* source = frame.find_node(edge.source_id);
        const RenderNode* target = frame.find_node(edge.target_id);
        ASSERT_NE(source, nullptr);
        ASSERT_NE(target, nullptr);
        EXPECT_DOUBLE_EQ(edge.x1, source->x);
        EXPECT_DOUBLE_EQ(edge.y2, target->y);
    }
}

TEST_F(RenderAdapterTest, NodeAttributesFollowKind) {
    ForceLayoutEngine engine(graph);
    RenderFrame frame = adapter.build_frame(engine);

    const RenderNode* object = frame.find_node("obj:1");
    const RenderNode* actor = frame.find_node("actor:Alice");
    ASSERT_NE(object, nullptr);
    ASSERT_NE(actor, nullptr);

    EXPECT_GT(object->radius, actor->radius);
    EXPECT_DOUBLE_EQ(object->label_dy, 35.0);
    EXPECT_DOUBLE_EQ(actor->label_dy, 30.0);
    EXPECT_EQ(object->fill, adapter.style().object_fill);
    EXPECT_EQ(actor->fill, adapter.style().actor_fill);
    EXPECT_EQ(object->label, "Smith & Sons Ledger");
}

TEST_F(RenderAdapterTest, EdgeColorsFollowPolicyPriority) {
    ForceLayoutEngine engine(graph);
    RenderFrame frame = adapter.build_frame(engine);
    const StyleRules& style = adapter.style();

    const RenderEdge* nazi = find_edge(frame, "e-nazi");
    const RenderEdge* unesco = find_edge(frame, "e-unesco");
    const RenderEdge* both = find_edge(frame, "e-both");
    const RenderEdge* plain = find_edge(frame, "e-plain");
    ASSERT_TRUE(nazi && unesco && both && plain);

    EXPECT_EQ(nazi->stroke, style.edge_nazi);
    EXPECT_EQ(unesco->stroke, style.edge_unesco);
    EXPECT_EQ(both->edge_class, EdgeClass::Nazi);
    EXPECT_EQ(both->stroke, style.edge_nazi);
    EXPECT_EQ(plain->edge_class, EdgeClass::Normal);
    EXPECT_EQ(plain->stroke, style.edge_normal);
}

TEST_F(RenderAdapterTest, HoveredNodeGrows) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();
    InteractionController controller(engine);

    auto p = engine.position("actor:Alice");
    ASSERT_TRUE(p.has_value());
    controller.pointer_move(*p);
    ASSERT_EQ(controller.hovered(), "actor:Alice");

    RenderFrame frame = adapter.build_frame(engine, controller);
    EXPECT_TRUE(frame.find_node("actor:Alice")->emphasized);
    EXPECT_DOUBLE_EQ(frame.find_node("actor:Alice")->radius, 20.0);
    EXPECT_FALSE(frame.find_node("obj:1")->emphasized);
    EXPECT_DOUBLE_EQ(frame.find_node("obj:1")->radius, 20.0);

    // Label offset does not move with emphasis
    EXPECT_DOUBLE_EQ(frame.find_node("actor:Alice")->label_dy, 30.0);
}

TEST_F(RenderAdapterTest, FrameRebuiltOnEveryTick) {
    ForceLayoutEngine engine(graph);
    std::vector<size_t> frame_ticks;
    engine.set_tick_callback([&](const ForceLayoutEngine& e) {
        frame_ticks.push_back(adapter.build_frame(e).tick);
    });

    engine.start();
    for (int i = 0; i < 5; ++i) engine.tick();

    ASSERT_EQ(frame_ticks.size(), 5);
    EXPECT_EQ(frame_ticks.front(), 1);
    EXPECT_EQ(frame_ticks.back(), 5);
}

TEST_F(RenderAdapterTest, LabelsFollowReplacedGraph) {
    ForceLayoutEngine engine(graph);

    ProvenanceGraph next;
    next.nodes.push_back({"obj:1", "Portrait of a Young Woman", NodeKind::Object});
    next.nodes.push_back({"place:Vienna", "", NodeKind::Place});
    ASSERT_TRUE(engine.replace_graph(next));

    RenderFrame frame = adapter.build_frame(engine);
    ASSERT_EQ(frame.nodes.size(), 2);
    EXPECT_EQ(frame.find_node("obj:1")->label, "Portrait of a Young Woman");
    // An unlabeled node falls back to its id
    EXPECT_EQ(frame.find_node("place:Vienna")->label, "place:Vienna");
}

TEST_F(RenderAdapterTest, DisposedEngineYieldsEmptyFrame) {
    ForceLayoutEngine engine(graph);
    engine.dispose();

    RenderFrame frame = adapter.build_frame(engine);
    EXPECT_TRUE(frame.nodes.empty());
    EXPECT_TRUE(frame.edges.empty());
}

// ==========================================
// Export
// ==========================================

TEST_F(RenderAdapterTest, SvgContainsShapesAndLegend) {
    ForceLayoutEngine engine(graph);
    engine.run_until_settled();
    RenderFrame frame = adapter.build_frame(engine);

    std::string svg = adapter.to_svg(frame, "Case <42>");

    EXPECT_NE(svg.find("<svg"), std::string::npos);
    EXPECT_NE(svg.find("<circle"), std::string::npos);
    EXPECT_NE(svg.find("<line"), std::string::npos);
    EXPECT_NE(svg.find("Smith &amp; Sons Ledger"), std::string::npos);
    EXPECT_NE(svg.find("Case &lt;42&gt;"), std::string::npos);
    EXPECT_NE(svg.find("UNESCO 1970 Convention"), std::string::npos);
    EXPECT_NE(svg.find(adapter.style().edge_nazi), std::string::npos);
    EXPECT_NE(svg.find("translate(0,0) scale(1)"), std::string::npos);
}

TEST_F(RenderAdapterTest, FrameJsonDescribesDrawables) {
    ForceLayoutEngine engine(graph);
    RenderFrame frame = adapter.build_frame(engine);

    auto j = frame.to_json();
    ASSERT_EQ(j["nodes"].size(), 3);
    ASSERT_EQ(j["edges"].size(), 4);
    EXPECT_EQ(j["nodes"][0]["type"].get<std::string>(), "object");
    EXPECT_EQ(j["edges"][0]["class"].get<std::string>(), "nazi");
    EXPECT_DOUBLE_EQ(j["transform"]["k"].get<double>(), 1.0);
}

TEST_F(RenderAdapterTest, ExportToUnwritablePathThrows) {
    ForceLayoutEngine engine(graph);
    RenderFrame frame = adapter.build_frame(engine);

    EXPECT_THROW(adapter.export_svg(frame, "/nonexistent/dir/network.svg"), std::runtime_error);
    EXPECT_THROW(frame.save_to_json("/nonexistent/dir/frame.json"), std::runtime_error);
}
