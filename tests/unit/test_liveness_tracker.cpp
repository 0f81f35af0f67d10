#include <gtest/gtest.h>

#include "session/liveness_tracker.hpp"
#include "util/fake_collaborators.hpp"

using namespace termdeck;
using termdeck::test::FakeProcessBackend;

class LivenessTrackerTest : public ::testing::Test
{
   protected:
    FakeProcessBackend     backend;
    ProcessLivenessTracker tracker{backend};
    int                    changes = 0;

    void SetUp() override
    {
        tracker.set_on_change([this](const ProcessLivenessTracker::LivenessMap&) { ++changes; });
    }
};

// ─── Batches ─────────────────────────────────────────────────────────────────

TEST_F(LivenessTrackerTest, UncheckedIdsAreUnknown)
{
    tracker.set_tracked({"a"});
    EXPECT_FALSE(tracker.is_running("a").has_value());
    EXPECT_EQ(backend.probe_calls, 0u);   // not started yet
}

TEST_F(LivenessTrackerTest, StartProbesEveryTrackedId)
{
    tracker.set_tracked({"a", "b"});
    tracker.start();

    EXPECT_TRUE(tracker.is_started());
    EXPECT_EQ(backend.subscriber_count(), 1u);
    EXPECT_EQ(backend.pending_count("a"), 1u);
    EXPECT_EQ(backend.pending_count("b"), 1u);
    EXPECT_TRUE(tracker.batch_in_flight());
}

TEST_F(LivenessTrackerTest, BatchCommitsAtomically)
{
    tracker.set_tracked({"a", "b"});
    tracker.start();

    ASSERT_TRUE(backend.resolve("a", true));
    // Half a batch is never visible.
    EXPECT_FALSE(tracker.is_running("a").has_value());
    EXPECT_EQ(changes, 0);

    ASSERT_TRUE(backend.resolve("b", false));
    EXPECT_EQ(tracker.is_running("a"), std::optional<bool>(true));
    EXPECT_EQ(tracker.is_running("b"), std::optional<bool>(false));
    EXPECT_FALSE(tracker.batch_in_flight());
    EXPECT_EQ(changes, 1);
}

TEST_F(LivenessTrackerTest, SupersededBatchIsDiscarded)
{
    tracker.set_tracked({"a"});
    tracker.start();
    const auto first = tracker.generation();

    tracker.set_tracked({"a", "b"});
    EXPECT_GT(tracker.generation(), first);

    // The old probe for "a" is the oldest pending one; its answer is stale.
    ASSERT_TRUE(backend.resolve("a", false));
    EXPECT_TRUE(tracker.batch_in_flight());
    EXPECT_TRUE(tracker.liveness().empty());

    backend.resolve_all(true);
    EXPECT_EQ(tracker.is_running("a"), std::optional<bool>(true));
    EXPECT_EQ(tracker.is_running("b"), std::optional<bool>(true));
}

TEST_F(LivenessTrackerTest, SameTrackedSetDoesNotReprobe)
{
    tracker.set_tracked({"a", "b"});
    tracker.start();
    const auto calls = backend.probe_calls;

    tracker.set_tracked({"b", "a"});
    EXPECT_EQ(backend.probe_calls, calls);
}

TEST_F(LivenessTrackerTest, SynchronousBackendCommitsImmediately)
{
    backend.auto_answer["a"] = true;
    backend.auto_answer["b"] = false;
    tracker.set_tracked({"a", "b"});
    tracker.start();

    EXPECT_FALSE(tracker.batch_in_flight());
    EXPECT_EQ(tracker.is_running("a"), std::optional<bool>(true));
    EXPECT_EQ(tracker.is_running("b"), std::optional<bool>(false));
}

TEST_F(LivenessTrackerTest, ThrowingProbeCountsAsNotRunning)
{
    backend.throw_on_probe.insert("a");
    backend.auto_answer["b"] = true;
    tracker.set_tracked({"a", "b"});
    tracker.start();

    EXPECT_FALSE(tracker.batch_in_flight());
    EXPECT_EQ(tracker.is_running("a"), std::optional<bool>(false));
    EXPECT_EQ(tracker.is_running("b"), std::optional<bool>(true));
}

TEST_F(LivenessTrackerTest, UntrackedIdsArePruned)
{
    backend.auto_answer["a"] = true;
    backend.auto_answer["b"] = true;
    tracker.set_tracked({"a", "b"});
    tracker.start();

    tracker.set_tracked({"b"});
    EXPECT_FALSE(tracker.is_running("a").has_value());
    EXPECT_EQ(tracker.is_running("b"), std::optional<bool>(true));
}

TEST_F(LivenessTrackerTest, EmptyTrackedSetClearsMap)
{
    backend.auto_answer["a"] = true;
    tracker.set_tracked({"a"});
    tracker.start();

    tracker.set_tracked({});
    EXPECT_TRUE(tracker.liveness().empty());
    EXPECT_FALSE(tracker.batch_in_flight());
}

// ─── Exit events ─────────────────────────────────────────────────────────────

TEST_F(LivenessTrackerTest, ExitPatchesImmediately)
{
    backend.auto_answer["a"] = true;
    tracker.set_tracked({"a"});
    tracker.start();
    const int before = changes;

    backend.emit_exit("a");
    EXPECT_EQ(tracker.is_running("a"), std::optional<bool>(false));
    EXPECT_EQ(changes, before + 1);

    // Duplicate delivery is a no-op.
    backend.emit_exit("a");
    EXPECT_EQ(changes, before + 1);
}

TEST_F(LivenessTrackerTest, ExitDuringBatchWinsOverProbeResult)
{
    tracker.set_tracked({"x", "y"});
    tracker.start();

    backend.emit_exit("x");
    EXPECT_EQ(tracker.is_running("x"), std::optional<bool>(false));

    // The probe raced the exit and still saw the process.
    backend.resolve("x", true);
    backend.resolve("y", true);

    EXPECT_EQ(tracker.is_running("x"), std::optional<bool>(false));
    EXPECT_EQ(tracker.is_running("y"), std::optional<bool>(true));
}

TEST_F(LivenessTrackerTest, ExitIsStickyAcrossRefresh)
{
    backend.auto_answer["x"] = true;
    tracker.set_tracked({"x"});
    tracker.start();
    backend.emit_exit("x");

    tracker.refresh();
    EXPECT_EQ(tracker.is_running("x"), std::optional<bool>(false));
}

TEST_F(LivenessTrackerTest, RetrackingEndsExitedLifetime)
{
    backend.auto_answer["x"] = true;
    tracker.set_tracked({"x"});
    tracker.start();
    backend.emit_exit("x");

    tracker.set_tracked({});
    tracker.set_tracked({"x"});
    EXPECT_EQ(tracker.is_running("x"), std::optional<bool>(true));
}

TEST_F(LivenessTrackerTest, ExitForUntrackedIdIgnored)
{
    tracker.set_tracked({"a"});
    tracker.start();
    const int before = changes;

    backend.emit_exit("someone-else");
    EXPECT_EQ(changes, before);
    EXPECT_FALSE(tracker.is_running("someone-else").has_value());
}

// ─── Teardown ────────────────────────────────────────────────────────────────

TEST_F(LivenessTrackerTest, StopUnsubscribesAndDropsLateResults)
{
    tracker.set_tracked({"a"});
    tracker.start();
    tracker.stop();

    EXPECT_EQ(backend.subscriber_count(), 0u);
    EXPECT_EQ(backend.unsubscribe_calls, 1u);

    backend.resolve_all(true);
    EXPECT_FALSE(tracker.is_running("a").has_value());
    EXPECT_EQ(changes, 0);
}

TEST(LivenessTrackerLifetime, DestructionUnsubscribes)
{
    FakeProcessBackend backend;
    {
        ProcessLivenessTracker tracker(backend);
        tracker.set_tracked({"a"});
        tracker.start();
        EXPECT_EQ(backend.subscriber_count(), 1u);
    }
    EXPECT_EQ(backend.subscriber_count(), 0u);

    // A completion for the destroyed tracker must not touch it.
    EXPECT_EQ(backend.resolve_all(true), 1u);
}

TEST(LivenessTrackerLifetime, StartIsIdempotent)
{
    FakeProcessBackend     backend;
    ProcessLivenessTracker tracker(backend);
    tracker.start();
    tracker.start();
    EXPECT_EQ(backend.subscriber_count(), 1u);
}
