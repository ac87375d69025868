#include <gtest/gtest.h>
#include "watch/LiveWatcher.hpp"

#include <sys/inotify.h>

using vc::types::Event;
using vc::watch::classify;

TEST(Classify, FileEvents) {
    EXPECT_EQ(classify(IN_CREATE), Event::Type::CREATED);
    EXPECT_EQ(classify(IN_MOVED_TO), Event::Type::CREATED);
    EXPECT_EQ(classify(IN_DELETE), Event::Type::DELETED);
    EXPECT_EQ(classify(IN_MOVED_FROM), Event::Type::DELETED);
    EXPECT_EQ(classify(IN_MODIFY), Event::Type::MODIFIED);
    EXPECT_EQ(classify(IN_CLOSE_WRITE), Event::Type::MODIFIED);
}

TEST(Classify, DirectoriesAndNoiseAreIgnored) {
    EXPECT_FALSE(classify(IN_CREATE | IN_ISDIR).has_value());
    EXPECT_FALSE(classify(IN_DELETE | IN_ISDIR).has_value());
    EXPECT_FALSE(classify(IN_ATTRIB).has_value());
    EXPECT_FALSE(classify(IN_OPEN).has_value());
    EXPECT_FALSE(classify(IN_CLOSE_NOWRITE).has_value());
}
