#include <any>
#include <memory> // for std::make_unique
#include <sstream> // for std::ostringstream
#include <string>
#include <utility> // for std::pair
#include <vector>

#include <gtest/gtest.h>

#include "brook/blueprint.hpp"
#include "brook/not_used.hpp"

using namespace brook;

namespace {

struct nothing_logic final: source_logic
{
    auto run(const run_control&, const emitter&) -> void override
    {
        // Intentionally empty.
    }
};

struct pass_logic final: flow_logic
{
    auto on_push(element value, const emitter& emit) -> demand override
    {
        return emit(std::move(value));
    }
};

struct drop_logic final: sink_logic
{
    auto on_push(element) -> demand override { return demand::more; }
    auto on_complete() -> void override {}
    auto on_failure(std::exception_ptr) noexcept -> void override {}
};

template <class T>
auto make_int_source(stage_name name, T value) -> blueprint
{
    return make_blueprint(make_source_stage(name, element_type_of<int>(),
                                            [value](const stage_context&) {
        return stage_instance<source_logic>{
            std::make_unique<nothing_logic>(), value
        };
    }));
}

template <class In>
auto make_pass(stage_name name, int value) -> blueprint
{
    return make_blueprint(make_flow_stage(name, element_type_of<In>(),
                                          element_type_of<In>(),
                                          [value](const stage_context&) {
        return stage_instance<flow_logic>{
            std::make_unique<pass_logic>(), value
        };
    }));
}

template <class In>
auto make_drop(stage_name name, int value) -> blueprint
{
    return make_blueprint(make_sink_stage(name, element_type_of<In>(),
                                          [value](const stage_context&) {
        return stage_instance<sink_logic>{
            std::make_unique<drop_logic>(), value
        };
    }));
}

auto evaluate_all(const blueprint& value) -> std::any
{
    auto values = std::vector<std::any>{};
    for (auto&& s: value.stages) {
        std::visit([&values](const auto& factory) {
            values.push_back(factory(stage_context{}).value);
        }, s->factory);
    }
    return evaluate(value.materialized, values);
}

}

TEST(blueprint, default_construction)
{
    const auto bp = blueprint{};
    EXPECT_TRUE(bp.name.get().empty());
    EXPECT_TRUE(empty(bp.stages));
    EXPECT_FALSE(bp.inlet);
    EXPECT_FALSE(bp.outlet);
    EXPECT_FALSE(is_runnable(bp));
}

TEST(blueprint, make_blueprint)
{
    const auto src = make_int_source("src", 1);
    ASSERT_EQ(size(src.stages), 1u);
    EXPECT_FALSE(src.inlet);
    EXPECT_EQ(src.outlet, port_type{element_type_of<int>()});
    EXPECT_FALSE(is_runnable(src));
    EXPECT_EQ(std::any_cast<int>(evaluate_all(src)), 1);
}

TEST(blueprint, connect_default_keeps_right)
{
    const auto graph = connect(make_int_source("src", 1),
                               make_drop<int>("snk", 2));
    EXPECT_TRUE(is_runnable(graph));
    ASSERT_EQ(size(graph.stages), 2u);
    EXPECT_EQ(graph.stages[0]->name, stage_name("src"));
    EXPECT_EQ(graph.stages[1]->name, stage_name("snk"));
    EXPECT_EQ(std::any_cast<int>(evaluate_all(graph)), 2);
}

TEST(blueprint, connect_with_combiners)
{
    const auto src = make_int_source("src", 1);
    const auto snk = make_drop<int>("snk", 2);
    EXPECT_EQ(std::any_cast<int>(evaluate_all(
        connect(src, snk, combiners::keep_left()))), 1);
    EXPECT_EQ(std::any_cast<not_used>(evaluate_all(
        connect(src, snk, combiners::keep_none()))), not_used{});
    const auto both = evaluate_all(connect(src, snk, combiners::keep_both()));
    const auto& pair = std::any_cast<const std::pair<std::any, std::any>&>(
        both);
    EXPECT_EQ(std::any_cast<int>(pair.first), 1);
    EXPECT_EQ(std::any_cast<int>(pair.second), 2);
}

TEST(blueprint, nested_combination_offsets)
{
    const auto src = connect(make_int_source("src", 1),
                             make_pass<int>("mid", 2),
                             combiners::keep_right());
    const auto graph = connect(src, make_drop<int>("snk", 3),
                               combiners::keep_both());
    const auto value = evaluate_all(graph);
    const auto& pair = std::any_cast<const std::pair<std::any, std::any>&>(
        value);
    EXPECT_EQ(std::any_cast<int>(pair.first), 2);
    EXPECT_EQ(std::any_cast<int>(pair.second), 3);

    std::ostringstream os;
    os << graph.materialized;
    EXPECT_EQ(os.str(), "keep-both(keep-right(0,1),2)");
}

TEST(blueprint, connect_never_mutates)
{
    const auto src = make_int_source("src", 1);
    const auto before = src.stages;
    const auto graph = connect(src, make_drop<int>("snk", 2));
    EXPECT_EQ(src.stages, before);
    EXPECT_EQ(src.outlet, port_type{element_type_of<int>()});
    EXPECT_FALSE(is_runnable(src));
    EXPECT_EQ(std::any_cast<int>(evaluate_all(src)), 1);
    // Structurally shared.
    EXPECT_EQ(graph.stages[0], src.stages[0]);
}

TEST(blueprint, connect_type_mismatch)
{
    const auto src = make_int_source("src", 1);
    const auto snk = make_drop<std::string>("snk", 2);
    try {
        (void) connect(src, snk);
        FAIL() << "expected exception";
    }
    catch (const invalid_connection& ex) {
        EXPECT_EQ(ex.upstream, port_type{element_type_of<int>()});
        EXPECT_EQ(ex.downstream, port_type{element_type_of<std::string>()});
        EXPECT_NE(std::string(ex.what()).find("element type mismatch"),
                  std::string::npos);
    }
}

TEST(blueprint, connect_closed_ports)
{
    const auto src = make_int_source("src", 1);
    const auto graph = connect(src, make_drop<int>("snk", 2));
    EXPECT_THROW(connect(graph, make_drop<int>("snk", 3)),
                 invalid_connection);
    EXPECT_THROW(connect(src, src), invalid_connection);
    EXPECT_THROW(connect(blueprint{}, make_drop<int>("snk", 3)),
                 invalid_connection);
}

TEST(blueprint, named)
{
    const auto src = make_int_source("src", 1);
    const auto renamed = named(src, "numbers");
    EXPECT_EQ(renamed.name, stage_name("numbers"));
    EXPECT_TRUE(src.name.get().empty());
    EXPECT_EQ(renamed.stages, src.stages);
}

TEST(blueprint, connect_carries_a_single_name)
{
    const auto src = make_int_source("src", 1);
    const auto snk = make_drop<int>("snk", 3);
    EXPECT_EQ(connect(named(src, "numbers"), snk).name, stage_name("numbers"));
    EXPECT_EQ(connect(src, named(snk, "drain")).name, stage_name("drain"));
    EXPECT_TRUE(connect(src, snk).name.get().empty());
    EXPECT_TRUE(connect(named(src, "numbers"), named(snk, "drain"))
                .name.get().empty());
}

TEST(blueprint, ostream_operator_support)
{
    const auto graph = named(connect(make_int_source("src", 1),
                                     make_drop<int>("snk", 2)), "sum");
    std::ostringstream os;
    os << graph;
    EXPECT_EQ(os.str(),
              "blueprint{.name=sum,.stages={src,snk},.inlet=closed,"
              ".outlet=closed,.materialized=keep-right(0,1)}");
}

TEST(blueprint, pretty_print)
{
    const auto graph = connect(make_int_source("src", 1),
                               make_drop<int>("snk", 2));
    std::ostringstream os;
    pretty_print(os, graph);
    const auto expected = std::string{
        "{\n"
        "  .stages={\n"
        "    0: stage{.name=src,.role=source,.outlet=int},\n"
        "    1: stage{.name=snk,.role=sink,.inlet=int},\n"
        "  },\n"
        "  .inlet=closed,\n"
        "  .outlet=closed,\n"
        "  .materialized={\n"
        "    keep-right\n"
        "      stage 0\n"
        "      stage 1\n"
        "  }\n"
        "}\n"
    };
    EXPECT_EQ(os.str(), expected);
}

TEST(evaluate, errors)
{
    auto values = std::vector<std::any>{};
    EXPECT_THROW(evaluate(mat_tree{}, values), std::invalid_argument);
    const auto src = make_int_source("src", 1);
    EXPECT_THROW(evaluate(src.materialized, values), std::out_of_range);
}
