#include <chrono>
#include <memory> // for std::make_unique
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::runtime_error
#include <string>
#include <thread> // for std::this_thread

#include <gtest/gtest.h>

#include "brook/materializer.hpp"
#include "brook/sinks.hpp"
#include "brook/sources.hpp"

using namespace brook;
using namespace std::chrono_literals;

namespace {

auto sum() -> runnable_graph<future<int>>
{
    return sources::from({1, 2, 3, 4, 5, 6, 7, 8, 9, 10})
        .to(sinks::fold<int>(0, [](int acc, int x) { return acc + x; }));
}

auto endless() -> runnable_graph<cancellable>
{
    return sources::tick(1h, 1h, 0).to(sinks::ignore<int>(), keep::left);
}

}

TEST(materializer_settings, default_construction)
{
    const auto settings = materializer_settings{};
    EXPECT_EQ(settings.name, stage_name("brook"));
    EXPECT_TRUE(settings.log_lifecycle);
}

TEST(materializer, construction)
{
    std::ostringstream os;
    {
        auto m = materializer{os, {.name = "test"}};
        EXPECT_EQ(m.settings().name, stage_name("test"));
        EXPECT_FALSE(m.is_shutdown());
        EXPECT_EQ(m.active_runs(), 0u);
    }
    EXPECT_EQ(os.str(), "test: shutting down, aborting 0 run(s)\n");
}

TEST(materializer, run)
{
    std::ostringstream os;
    auto m = materializer{os, {.name = "test"}};
    auto result = m.run(sum().shape());
    EXPECT_TRUE(result.handle.valid());
    const auto value = std::any_cast<future<int>>(result.value);
    EXPECT_EQ(await(value, 3s), 55);
    EXPECT_EQ(result.handle.wait(), run_state{run_completed{}});
    EXPECT_EQ(os.str(), "test-1: started\ntest-1: completed\n");
}

TEST(materializer, run_named)
{
    std::ostringstream os;
    auto m = materializer{os, {.name = "test"}};
    auto result = materialize(sum().named("sum"), m);
    EXPECT_EQ(result.handle.name(), "test-1 (sum)");
    EXPECT_EQ(await(result.value, 3s), 55);
    (void) result.handle.wait();
    EXPECT_EQ(os.str(), "test-1 (sum): started\ntest-1 (sum): completed\n");
}

TEST(materializer, run_ids_increase)
{
    std::ostringstream os;
    auto m = materializer{os};
    auto first = materialize(sum(), m);
    auto second = materialize(sum(), m);
    EXPECT_EQ(first.handle.id(), run_id{1u});
    EXPECT_EQ(second.handle.id(), run_id{2u});
}

TEST(materializer, log_lifecycle_off)
{
    std::ostringstream os;
    {
        auto m = materializer{os, {.log_lifecycle = false}};
        auto result = materialize(sum(), m);
        EXPECT_EQ(await(result.value, 3s), 55);
    }
    EXPECT_TRUE(empty(os.str()));
}

TEST(materializer, run_non_runnable)
{
    std::ostringstream os;
    auto m = materializer{os};
    EXPECT_THROW(m.run(blueprint{}), invalid_blueprint);
    EXPECT_THROW(m.run(sources::single(1).shape()), invalid_blueprint);
    EXPECT_THROW(m.run(sinks::ignore<int>().shape()), invalid_blueprint);
    EXPECT_EQ(os.str(), "");
}

TEST(materializer, run_after_shutdown)
{
    std::ostringstream os;
    auto m = materializer{os};
    m.shutdown();
    EXPECT_TRUE(m.is_shutdown());
    EXPECT_THROW(m.run(sum().shape()), materializer_closed);
    EXPECT_THROW((void) sum().run(m), materializer_closed);
}

TEST(materializer, factory_failure)
{
    const auto failing = make_blueprint(make_source_stage(
        "failing", element_type_of<int>(),
        [](const stage_context&) -> stage_instance<source_logic> {
            throw std::runtime_error{"no resources"};
        }));
    const auto graph = connect(failing, sinks::ignore<int>().shape());
    std::ostringstream os;
    auto m = materializer{os, {.name = "test"}};
    EXPECT_THROW(m.run(graph), std::runtime_error);
    EXPECT_EQ(os.str().find("started"), std::string::npos);
}

TEST(materializer, factory_making_no_logic)
{
    const auto lazy = make_blueprint(make_source_stage(
        "lazy", element_type_of<int>(),
        [](const stage_context&) {
            return stage_instance<source_logic>{};
        }));
    std::ostringstream os;
    auto m = materializer{os};
    EXPECT_THROW(m.run(connect(lazy, sinks::ignore<int>().shape())),
                 invalid_blueprint);
}

TEST(materializer, adopt_and_shutdown)
{
    std::ostringstream os;
    auto m = materializer{os, {.name = "test"}};
    const auto first = endless().run(m);
    const auto second = endless().run(m);
    EXPECT_EQ(m.active_runs(), 2u);
    EXPECT_FALSE(first.is_cancelled());
    EXPECT_FALSE(second.is_cancelled());
    m.shutdown();
    EXPECT_TRUE(m.is_shutdown());
    EXPECT_EQ(m.active_runs(), 0u);
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
    EXPECT_NE(os.str().find("test: shutting down, aborting 2 run(s)\n"),
              std::string::npos);
    EXPECT_NE(os.str().find("test-1: failed: test-1 aborted\n"),
              std::string::npos);
    EXPECT_NE(os.str().find("test-2: failed: test-2 aborted\n"),
              std::string::npos);
}

TEST(materializer, adopt_reaps_ended_runs)
{
    std::ostringstream os;
    auto m = materializer{os};
    auto ended = materialize(sum(), m);
    (void) ended.handle.wait();
    m.adopt(std::move(ended.handle));
    EXPECT_EQ(m.active_runs(), 0u);
    const auto value = endless().run(m);
    EXPECT_EQ(m.active_runs(), 1u);
    EXPECT_TRUE(value.cancel());
    (void) await(sum().run(m), 3s);
    for (auto i = 0; (i < 300) && (m.active_runs() != 0u); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(m.active_runs(), 0u);
}

TEST(materializer, adopt_after_shutdown)
{
    std::ostringstream os;
    auto m = materializer{os};
    auto result = materialize(endless(), m);
    m.shutdown();
    m.adopt(std::move(result.handle));
    EXPECT_TRUE(result.value.is_cancelled());
    EXPECT_EQ(m.active_runs(), 0u);
}

TEST(materializer, adopt_invalid_handle)
{
    std::ostringstream os;
    auto m = materializer{os};
    EXPECT_NO_THROW(m.adopt(run_handle{}));
    EXPECT_EQ(m.active_runs(), 0u);
}
