#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <type_traits>

#include "relay/listener.hpp"

using namespace relay;

static_assert(std::is_empty_v<any_t>);
static_assert(std::is_trivially_copyable_v<any_t>);
static_assert(any == any);

// 1. Exact Equality
TEST(ListenerTest, AnyOnlyEqualsAny) {
    listener<std::string> wildcard = any;
    listener<std::string> x = "x";

    EXPECT_TRUE(wildcard.is_any());
    EXPECT_FALSE(x.is_any());
    EXPECT_EQ(x.value(), "x");

    EXPECT_TRUE(wildcard == any);
    EXPECT_FALSE(x == any);
    EXPECT_FALSE(wildcard == x);
    EXPECT_TRUE(x == listener<std::string>("x"));
    EXPECT_FALSE(x == listener<std::string>("y"));
}

TEST(ListenerTest, DefaultIsAny) {
    listener<int> l;
    EXPECT_TRUE(l.is_any());
    EXPECT_EQ(l, listener<int>(any));
}

// 2. Dispatch Relation
TEST(ListenerTest, MatchesIsInclusive) {
    listener<int> wildcard = any;
    listener<int> one = 1;
    listener<int> two = 2;

    EXPECT_TRUE(matches(wildcard, one));
    EXPECT_TRUE(matches(one, wildcard));
    EXPECT_TRUE(matches(wildcard, wildcard));
    EXPECT_TRUE(matches(one, listener<int>(1)));
    EXPECT_FALSE(matches(one, two));
}

// 3. Falsy Values Are Ordinary Listeners
TEST(ListenerTest, EmptyValuesAreNotAny) {
    listener<std::string> empty = std::string{};
    listener<int> zero = 0;

    EXPECT_FALSE(empty.is_any());
    EXPECT_FALSE(zero.is_any());
    EXPECT_FALSE(matches(empty, listener<std::string>("x")));
    EXPECT_TRUE(matches(zero, listener<int>(0)));
}

// 4. Reading the Value of `any`
TEST(ListenerTest, ValueOfAnyThrows) {
    listener<std::string> wildcard = any;
    EXPECT_THROW(wildcard.value(), std::bad_optional_access);

    listener<std::string> x = "x";
    EXPECT_NO_THROW(x.value());
}
