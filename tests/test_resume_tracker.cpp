#include <gtest/gtest.h>
#include <fstream>
#include "engine/resume_tracker.hpp"
#include "test_helpers.hpp"

using namespace morgue::engine;
using morgue::test::TempDir;

TEST(ResumeTrackerTest, MissingLogLoadsEmpty) {
    TempDir dir;
    ResumeTracker tracker(dir / "index" / "udn.resume.log");
    ASSERT_TRUE(tracker.load());
    EXPECT_TRUE(tracker.committed().empty());
    EXPECT_EQ(tracker.state("part0"), IngestionState::Pending);
}

TEST(ResumeTrackerTest, StateTransitionsAndPersistence) {
    TempDir dir;
    auto log = dir / "index" / "udn.resume.log";
    {
        ResumeTracker tracker(log);
        ASSERT_TRUE(tracker.load());
        tracker.mark_in_progress("part0");
        tracker.mark_in_progress("part1");
        EXPECT_EQ(tracker.state("part0"), IngestionState::InProgress);
        EXPECT_EQ(tracker.state("part1"), IngestionState::InProgress);

        ASSERT_TRUE(tracker.commit({"part0"}));
        EXPECT_EQ(tracker.state("part0"), IngestionState::Committed);
        EXPECT_EQ(tracker.state("part1"), IngestionState::InProgress);
    }

    // In-progress state does not survive a restart
    ResumeTracker restarted(log);
    ASSERT_TRUE(restarted.load());
    EXPECT_TRUE(restarted.is_committed("part0"));
    EXPECT_EQ(restarted.state("part1"), IngestionState::Pending);
}

TEST(ResumeTrackerTest, LoadIgnoresBlankLinesAndDuplicates) {
    TempDir dir;
    {
        std::ofstream out(dir / "r.log");
        out << "part0\n\npart1\npart0\n";
    }
    ResumeTracker tracker(dir / "r.log");
    ASSERT_TRUE(tracker.load());
    EXPECT_EQ(tracker.committed(), (std::set<std::string>{"part0", "part1"}));
}

TEST(ResumeTrackerTest, RewriteAndClear) {
    TempDir dir;
    auto log = dir / "r.log";
    ResumeTracker tracker(log);
    ASSERT_TRUE(tracker.commit({"a", "b", "c"}));
    ASSERT_TRUE(tracker.rewrite({"a"}));
    EXPECT_EQ(tracker.committed(), (std::set<std::string>{"a"}));

    ResumeTracker reread(log);
    ASSERT_TRUE(reread.load());
    EXPECT_EQ(reread.committed(), (std::set<std::string>{"a"}));

    ASSERT_TRUE(tracker.clear());
    EXPECT_FALSE(std::filesystem::exists(log));
    EXPECT_TRUE(tracker.committed().empty());
}
