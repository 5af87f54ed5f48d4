#include <gtest/gtest.h>

#include "core/device/storage/identifier_resolver.hpp"

using devinv::core::device::storage::ResolveIdentifier;

TEST(IdentifierResolverTest, ResolvesPositiveDecimal) {
  EXPECT_EQ(ResolveIdentifier("1"), 1);
  EXPECT_EQ(ResolveIdentifier("0042"), 42);
  EXPECT_EQ(ResolveIdentifier("9223372036854775807"), 9223372036854775807LL);
}

TEST(IdentifierResolverTest, RejectsEverythingElse) {
  EXPECT_FALSE(ResolveIdentifier("").has_value());
  EXPECT_FALSE(ResolveIdentifier("0").has_value());
  EXPECT_FALSE(ResolveIdentifier("-3").has_value());
  EXPECT_FALSE(ResolveIdentifier("12abc").has_value());
  EXPECT_FALSE(ResolveIdentifier("192.168.1.1").has_value());
  EXPECT_FALSE(ResolveIdentifier("9223372036854775808").has_value());
}
