#include <memory> // for std::make_unique
#include <sstream> // for std::ostringstream
#include <string>

#include <gtest/gtest.h>

#include "brook/not_used.hpp"
#include "brook/stage.hpp"

using namespace brook;

namespace {

struct nothing_logic final: source_logic
{
    auto run(const run_control&, const emitter&) -> void override
    {
        // Intentionally empty.
    }
};

auto make_nothing(const stage_context&) -> stage_instance<source_logic>
{
    return {std::make_unique<nothing_logic>(), not_used{}};
}

}

TEST(stage, make_source_stage)
{
    const auto s = make_source_stage("nothing", element_type_of<int>(),
                                     make_nothing);
    EXPECT_EQ(s.name, stage_name("nothing"));
    EXPECT_FALSE(s.inlet);
    ASSERT_TRUE(s.outlet);
    EXPECT_EQ(*s.outlet, element_type_of<int>());
    EXPECT_EQ(role_of(s), stage_role::source);
}

TEST(stage, make_stage_without_factory)
{
    EXPECT_THROW(make_source_stage("a", element_type_of<int>(),
                                   source_factory{}),
                 std::invalid_argument);
    EXPECT_THROW(make_flow_stage("b", element_type_of<int>(),
                                 element_type_of<int>(), flow_factory{}),
                 std::invalid_argument);
    EXPECT_THROW(make_sink_stage("c", element_type_of<int>(),
                                 sink_factory{}),
                 std::invalid_argument);
}

TEST(stage, factory_makes_fresh_instances)
{
    const auto s = make_source_stage("nothing", element_type_of<int>(),
                                     make_nothing);
    const auto& factory = std::get<source_factory>(s.factory);
    auto a = factory(stage_context{});
    auto b = factory(stage_context{});
    ASSERT_TRUE(a.logic != nullptr);
    ASSERT_TRUE(b.logic != nullptr);
    EXPECT_NE(a.logic.get(), b.logic.get());
    EXPECT_EQ(std::any_cast<not_used>(a.value), not_used{});
}

TEST(stage, ostream_operator_support)
{
    const auto s = make_source_stage("nothing", element_type_of<int>(),
                                     make_nothing);
    std::ostringstream os;
    os << s;
    EXPECT_EQ(os.str(), "stage{.name=nothing,.role=source,.outlet=int}");
}

TEST(stage_role, ostream_operator_support)
{
    std::ostringstream os;
    os << stage_role::source << ' ' << stage_role::flow << ' ';
    os << stage_role::sink;
    EXPECT_EQ(os.str(), "source flow sink");
}

TEST(run_id, ostream_operator_support)
{
    std::ostringstream os;
    os << run_id{42u};
    EXPECT_EQ(os.str(), "42");
}

TEST(element, demangled_name)
{
    EXPECT_EQ(demangled_name(element_type_of<int>()), "int");
    EXPECT_EQ(demangled_name(element_type_of<double>()), "double");
}
