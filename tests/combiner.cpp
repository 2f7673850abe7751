#include <any>
#include <sstream> // for std::ostringstream
#include <string>
#include <utility> // for std::pair

#include <gtest/gtest.h>

#include "brook/combiner.hpp"
#include "brook/keep.hpp"
#include "brook/not_used.hpp"

using namespace brook;

TEST(combiner, default_construction)
{
    const auto c = combiner{};
    EXPECT_EQ(c.policy, keep_policy::right);
    EXPECT_FALSE(c.function);
    EXPECT_THROW(combine(c, 1, 2), std::invalid_argument);
}

TEST(combiners, keep_left)
{
    const auto c = combiners::keep_left();
    EXPECT_EQ(c.policy, keep_policy::left);
    EXPECT_EQ(std::any_cast<int>(combine(c, 1, 2)), 1);
}

TEST(combiners, keep_right)
{
    const auto c = combiners::keep_right();
    EXPECT_EQ(c.policy, keep_policy::right);
    EXPECT_EQ(std::any_cast<int>(combine(c, 1, 2)), 2);
}

TEST(combiners, keep_both)
{
    const auto c = combiners::keep_both();
    EXPECT_EQ(c.policy, keep_policy::both);
    const auto result = combine(c, 1, std::string{"two"});
    const auto& pair = std::any_cast<const std::pair<std::any, std::any>&>(
        result);
    EXPECT_EQ(std::any_cast<int>(pair.first), 1);
    EXPECT_EQ(std::any_cast<std::string>(pair.second), "two");
}

TEST(combiners, keep_none)
{
    const auto c = combiners::keep_none();
    EXPECT_EQ(c.policy, keep_policy::none);
    EXPECT_EQ(std::any_cast<not_used>(combine(c, 1, 2)), not_used{});
}

TEST(keep_policy, ostream_operator_support)
{
    std::ostringstream os;
    os << keep_policy::left << ' ' << keep_policy::right << ' ';
    os << keep_policy::both << ' ' << keep_policy::none << ' ';
    os << keep_policy::custom;
    EXPECT_EQ(os.str(), "keep-left keep-right keep-both keep-none custom");
}

TEST(make_combiner, typed_keep)
{
    const auto left = make_combiner<int, double>(keep::left);
    EXPECT_EQ(left.policy, keep_policy::left);
    EXPECT_EQ(std::any_cast<int>(combine(left, 1, 2.5)), 1);

    const auto right = make_combiner<int, double>(keep::right);
    EXPECT_EQ(right.policy, keep_policy::right);
    EXPECT_EQ(std::any_cast<double>(combine(right, 1, 2.5)), 2.5);

    const auto both = make_combiner<int, double>(keep::both);
    EXPECT_EQ(both.policy, keep_policy::both);
    EXPECT_EQ((std::any_cast<std::pair<int, double>>(combine(both, 1, 2.5))),
              (std::pair<int, double>{1, 2.5}));

    const auto none = make_combiner<int, double>(keep::none);
    EXPECT_EQ(none.policy, keep_policy::none);
    EXPECT_EQ(std::any_cast<not_used>(combine(none, 1, 2.5)), not_used{});
}

TEST(make_combiner, custom)
{
    const auto c = make_combiner<int, int>([](int a, int b) {
        return a * 10 + b;
    });
    EXPECT_EQ(c.policy, keep_policy::custom);
    EXPECT_EQ(std::any_cast<int>(combine(c, 4, 2)), 42);
    EXPECT_THROW(combine(c, 4, std::string{"2"}), std::bad_any_cast);
}

TEST(combined_t, types)
{
    static_assert(std::is_same_v<combined_t<keep::left_t, int, double>, int>);
    static_assert(std::is_same_v<combined_t<keep::right_t, int, double>,
                                 double>);
    static_assert(std::is_same_v<combined_t<keep::both_t, int, double>,
                                 std::pair<int, double>>);
    static_assert(std::is_same_v<combined_t<keep::none_t, int, double>,
                                 not_used>);
}
