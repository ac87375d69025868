#include <gtest/gtest.h>
#include "util/timestamp.hpp"

using namespace vc::util;

TEST(Timestamp, PostgresFormatsParseAsUtc) {
    EXPECT_EQ(parsePostgresTimestamp("1970-01-02 00:00:00"), 86400);
    EXPECT_EQ(parsePostgresTimestamp("2024-03-01 12:30:15.123456+00"), 1709296215);
    EXPECT_THROW(parsePostgresTimestamp("yesterday"), std::runtime_error);
}

TEST(Timestamp, IsoRoundTrip) {
    const std::time_t t = 1709296215;
    EXPECT_EQ(timestampToString(t), "2024-03-01T12:30:15Z");
    EXPECT_EQ(parseTimestampFromString(timestampToString(t)), t);
    EXPECT_EQ(parseTimestampFromString("2024-03-01 12:30:15"), t);
}

TEST(Timestamp, UnparsableIsZero) {
    EXPECT_EQ(parseTimestampFromString(""), 0);
    EXPECT_EQ(parseTimestampFromString("2024-03-01"), 0);
    EXPECT_EQ(parseTimestampFromString("not a timestamp at all"), 0);
}
