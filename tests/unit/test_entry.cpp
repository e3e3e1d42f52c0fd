#include <gtest/gtest.h>
#include "medusa/core/entry.hpp"

using namespace medusa;
using namespace std::chrono_literals;

TEST(EntryTest, WithoutExpiryNeverExpires) {
    Entry e(std::string("v"));
    auto far = ttl::now() + 24h * 365;
    EXPECT_FALSE(e.is_expired(far));
    EXPECT_FALSE(e.remaining_ttl(far).has_value());
}

TEST(EntryTest, ExpiredAtTheDeadlineInstant) {
    auto base = ttl::now();
    Entry e(std::string("v"), base + 5s);
    EXPECT_FALSE(e.is_expired(base + 4999ms));
    EXPECT_TRUE(e.is_expired(base + 5s));
    EXPECT_TRUE(e.is_expired(base + 6s));
}

TEST(EntryTest, RemainingTtlRoundsUp) {
    auto base = ttl::now();
    Entry e(std::string("v"), base + 5s);
    EXPECT_EQ(e.remaining_ttl(base), 5);
    EXPECT_EQ(e.remaining_ttl(base + 1ms), 5);
    EXPECT_EQ(e.remaining_ttl(base + 4001ms), 1);
}

TEST(EntryTest, RemainingTtlNeverZeroWhileLive) {
    auto base = ttl::now();
    Entry e(std::string("v"), base + 1s);
    EXPECT_EQ(e.remaining_ttl(base + 999ms), 1);
    EXPECT_EQ(e.remaining_ttl(base + 999999us), 1);
}

TEST(EntryTest, RemainingTtlIsMinusOneOnceExpired) {
    auto base = ttl::now();
    Entry e(std::string("v"), base + 1s);
    EXPECT_EQ(e.remaining_ttl(base + 1s), ttl::TTL_EXPIRED);
    EXPECT_EQ(e.remaining_ttl(base + 10s), -1);
}

TEST(EntryTest, ZeroSecondTtlIsAlreadyExpired) {
    auto base = ttl::now();
    Entry e(std::string("v"), ttl::from_seconds(0, base));
    EXPECT_TRUE(e.is_expired(base));
}

TEST(EntryTest, ReportsItsVariant) {
    EXPECT_EQ(Entry(std::string("s")).type(), ValueType::String);
    EXPECT_EQ(Entry(Hash{ {"f", "v"} }).type(), ValueType::Hash);
    EXPECT_EQ(Entry(List{ "a", "b" }).type(), ValueType::List);
    EXPECT_STREQ(type_name(ValueType::List), "list");
}
