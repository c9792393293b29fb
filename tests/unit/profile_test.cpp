#include <gtest/gtest.h>
#include "puffer/core/profile.hpp"

using Profiling::Profiler;

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Profiler::reset();
    }
    void TearDown() override {
        Profiler::reset();
    }
};

TEST_F(ProfilerTest, ScopedSectionsAreCounted) {
    for (int i = 0; i < 3; ++i) {
        PROFILE_SCOPE("loop");
    }
    Profiler::ProfileData data = Profiler::getStats("loop");
    EXPECT_EQ(data.call_count, 3u);
    EXPECT_LE(data.min_time, data.max_time);
    EXPECT_GE(data.total_time, data.max_time);
}

TEST_F(ProfilerTest, UnknownSectionHasNoStats) {
    EXPECT_EQ(Profiler::getStats("never-run").call_count, 0u);
}

TEST_F(ProfilerTest, ResetClearsStats) {
    {
        PROFILE_SCOPE("once");
    }
    ASSERT_EQ(Profiler::getStats("once").call_count, 1u);

    Profiler::reset();
    EXPECT_EQ(Profiler::getStats("once").call_count, 0u);
}

TEST_F(ProfilerTest, ResetDropsOpenSections) {
    Profiler::startSection("open");
    Profiler::reset();

    // The section began before the reset; ending it must not record a sample
    Profiler::endSection("open");
    EXPECT_EQ(Profiler::getStats("open").call_count, 0u);

    {
        PROFILE_SCOPE("after");
    }
    EXPECT_EQ(Profiler::getStats("after").call_count, 1u);
}

TEST_F(ProfilerTest, MismatchedEndIsIgnored) {
    Profiler::startSection("outer");
    Profiler::endSection("inner");
    EXPECT_EQ(Profiler::getStats("inner").call_count, 0u);

    Profiler::endSection("outer");
    EXPECT_EQ(Profiler::getStats("outer").call_count, 1u);
}
