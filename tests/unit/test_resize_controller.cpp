#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "config/preference_store.hpp"
#include "ui/resize_controller.hpp"
#include "util/fake_collaborators.hpp"

using namespace termdeck;
using termdeck::test::RecordingPointerCapture;

namespace
{

ResizeConfig width_config(std::string key = {})
{
    ResizeConfig c;
    c.direction     = SplitDirection::Horizontal;
    c.mode          = ResizeMode::Absolute;
    c.default_value = 360.0f;
    c.min_value     = 240.0f;
    c.max_value     = 720.0f;
    c.storage_key   = std::move(key);
    return c;
}

}   // namespace

// ─── Clamping ────────────────────────────────────────────────────────────────

TEST(ResizeController, DefaultValueUsedWithoutStore)
{
    ResizeController rc(width_config());
    EXPECT_FLOAT_EQ(rc.value(), 360.0f);
    EXPECT_FALSE(rc.is_dragging());
}

TEST(ResizeController, EveryWriteIsClamped)
{
    ResizeController rc(width_config());
    for (float v : {-1000.0f, 0.0f, 239.0f, 240.0f, 500.0f, 720.0f, 721.0f, 1e9f})
    {
        rc.set_value(v);
        EXPECT_GE(rc.value(), 240.0f) << v;
        EXPECT_LE(rc.value(), 720.0f) << v;
    }
}

TEST(ResizeController, NonFiniteWriteIgnored)
{
    ResizeController rc(width_config());
    rc.set_value(400.0f);
    rc.set_value(std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(rc.value(), 400.0f);
    rc.set_value(std::numeric_limits<float>::infinity());
    EXPECT_FLOAT_EQ(rc.value(), 400.0f);
}

TEST(ResizeController, DefaultOutsideRangeIsClamped)
{
    auto cfg          = width_config();
    cfg.default_value = 10.0f;
    ResizeController rc(cfg);
    EXPECT_FLOAT_EQ(rc.value(), 240.0f);
}

TEST(ResizeController, NarrowingBoundsReclamps)
{
    ResizeController rc(width_config());
    rc.set_value(700.0f);
    rc.set_bounds(240.0f, 500.0f);
    EXPECT_FLOAT_EQ(rc.value(), 500.0f);
    EXPECT_FLOAT_EQ(rc.max_value(), 500.0f);
}

TEST(ResizeController, WideningBoundsRestoresChosenValue)
{
    ResizeController rc(width_config());
    std::vector<float> changes;
    rc.set_on_change([&changes](float v) { changes.push_back(v); });

    rc.set_value(600.0f);
    rc.set_bounds(240.0f, 450.0f);
    EXPECT_FLOAT_EQ(rc.value(), 450.0f);
    rc.set_bounds(240.0f, 720.0f);
    EXPECT_FLOAT_EQ(rc.value(), 600.0f);
    EXPECT_EQ(changes, (std::vector<float>{600.0f, 450.0f, 600.0f}));
}

// ─── Persistence ─────────────────────────────────────────────────────────────

TEST(ResizeControllerPersistence, LoadsSavedValueClamped)
{
    MemoryPreferenceStore prefs;
    prefs.set_number(pref_keys::PINNED_ZONE_WIDTH, 5000.0);

    ResizeController rc(width_config(std::string(pref_keys::PINNED_ZONE_WIDTH)), &prefs);
    EXPECT_FLOAT_EQ(rc.value(), 720.0f);
}

TEST(ResizeControllerPersistence, WrongTypeFallsBackToDefault)
{
    MemoryPreferenceStore prefs;
    prefs.set_string(pref_keys::PINNED_ZONE_WIDTH, "wide");

    ResizeController rc(width_config(std::string(pref_keys::PINNED_ZONE_WIDTH)), &prefs);
    EXPECT_FLOAT_EQ(rc.value(), 360.0f);
}

TEST(ResizeControllerPersistence, WritesOnEveryMove)
{
    MemoryPreferenceStore prefs;
    ResizeController      rc(width_config(std::string(pref_keys::PINNED_ZONE_WIDTH)), &prefs);

    rc.begin_gesture(100.0f, 0.0f);
    rc.update_gesture(150.0f, 0.0f);
    EXPECT_DOUBLE_EQ(prefs.get_number(pref_keys::PINNED_ZONE_WIDTH).value_or(0.0), 410.0);
    rc.update_gesture(160.0f, 0.0f);
    EXPECT_DOUBLE_EQ(prefs.get_number(pref_keys::PINNED_ZONE_WIDTH).value_or(0.0), 420.0);
    rc.end_gesture();
}

TEST(ResizeControllerPersistence, BoundsClampNotPersisted)
{
    MemoryPreferenceStore prefs;
    ResizeController      rc(width_config(std::string(pref_keys::PINNED_ZONE_WIDTH)), &prefs);

    rc.set_value(600.0f);
    rc.set_bounds(240.0f, 450.0f);
    EXPECT_FLOAT_EQ(rc.value(), 450.0f);
    EXPECT_DOUBLE_EQ(prefs.get_number(pref_keys::PINNED_ZONE_WIDTH).value_or(0.0), 600.0);

    // A drag inside the narrowed range is the user's choice again.
    rc.begin_gesture(450.0f, 0.0f);
    rc.update_gesture(400.0f, 0.0f);
    rc.end_gesture();
    EXPECT_DOUBLE_EQ(prefs.get_number(pref_keys::PINNED_ZONE_WIDTH).value_or(0.0), 400.0);
    rc.set_bounds(240.0f, 720.0f);
    EXPECT_FLOAT_EQ(rc.value(), 400.0f);
}

TEST(ResizeControllerPersistence, UnchangedValueNotRewritten)
{
    MemoryPreferenceStore prefs;
    ResizeController      rc(width_config(std::string(pref_keys::PINNED_ZONE_WIDTH)), &prefs);
    const size_t          writes = prefs.write_count();

    rc.set_value(rc.value());
    rc.set_value(9999.0f);
    rc.set_value(9999.0f);
    EXPECT_EQ(prefs.write_count(), writes + 1);
}

// ─── Gestures ────────────────────────────────────────────────────────────────

TEST(ResizeControllerGesture, AbsoluteDeltaFollowsAxis)
{
    auto cfg      = width_config();
    cfg.direction = SplitDirection::Vertical;
    ResizeController rc(cfg);

    rc.begin_gesture(0.0f, 100.0f);
    rc.update_gesture(999.0f, 80.0f);   // x is ignored on a vertical axis
    EXPECT_FLOAT_EQ(rc.value(), 340.0f);
}

TEST(ResizeControllerGesture, RatioModeDividesByExtent)
{
    ResizeConfig cfg;
    cfg.mode          = ResizeMode::Ratio;
    cfg.default_value = 0.5f;
    cfg.min_value     = 0.1f;
    cfg.max_value     = 0.9f;
    ResizeController rc(cfg);

    rc.begin_gesture(500.0f, 0.0f, nullptr, 1000.0f);
    rc.update_gesture(600.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 0.6f);
    rc.update_gesture(5000.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 0.9f);
}

TEST(ResizeControllerGesture, DragClampedThroughout)
{
    ResizeController rc(width_config());
    rc.begin_gesture(0.0f, 0.0f);
    for (float x = -2000.0f; x <= 2000.0f; x += 137.0f)
    {
        rc.update_gesture(x, 0.0f);
        EXPECT_GE(rc.value(), rc.min_value());
        EXPECT_LE(rc.value(), rc.max_value());
    }
}

TEST(ResizeControllerGesture, UpdateOutsideDragIgnored)
{
    ResizeController rc(width_config());
    rc.update_gesture(500.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 360.0f);
}

TEST(ResizeControllerGesture, ChangeAndEndCallbacks)
{
    ResizeController rc(width_config());
    std::vector<float> changes;
    int                ends = 0;
    rc.set_on_change([&](float v) { changes.push_back(v); });
    rc.set_on_end([&] { ++ends; });

    rc.begin_gesture(0.0f, 0.0f);
    rc.update_gesture(10.0f, 0.0f);
    rc.end_gesture();
    rc.end_gesture();   // second end is a no-op

    EXPECT_EQ(changes, (std::vector<float>{370.0f}));
    EXPECT_EQ(ends, 1);
}

// ─── Pointer capture ─────────────────────────────────────────────────────────

TEST(ResizeControllerCapture, MovesArriveThroughCapture)
{
    RecordingPointerCapture capture;
    ResizeController        rc(width_config());

    rc.begin_gesture(100.0f, 0.0f, &capture);
    EXPECT_TRUE(capture.active());
    EXPECT_EQ(capture.last_axis, SplitDirection::Horizontal);

    capture.move(140.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 400.0f);
}

TEST(ResizeControllerCapture, EndGestureReleasesCapture)
{
    RecordingPointerCapture capture;
    ResizeController        rc(width_config());

    rc.begin_gesture(0.0f, 0.0f, &capture);
    rc.end_gesture();
    EXPECT_FALSE(capture.active());
    EXPECT_EQ(capture.end_calls, 1);
}

TEST(ResizeControllerCapture, InterruptedCaptureEndsDrag)
{
    RecordingPointerCapture capture;
    ResizeController        rc(width_config());
    int                     ends = 0;
    rc.set_on_end([&] { ++ends; });

    rc.begin_gesture(0.0f, 0.0f, &capture);
    capture.release();   // focus lost mid-drag

    EXPECT_FALSE(rc.is_dragging());
    EXPECT_FALSE(capture.active());
    EXPECT_EQ(ends, 1);

    // Stray moves after the interruption do nothing.
    capture.move(300.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 360.0f);
}

TEST(ResizeControllerCapture, DestructionMidDragReleasesCapture)
{
    RecordingPointerCapture capture;
    {
        ResizeController rc(width_config());
        rc.begin_gesture(0.0f, 0.0f, &capture);
        ASSERT_TRUE(capture.active());
    }
    EXPECT_FALSE(capture.active());
}

TEST(ResizeControllerCapture, RestartCancelsPreviousDrag)
{
    RecordingPointerCapture capture;
    ResizeController        rc(width_config());

    rc.begin_gesture(0.0f, 0.0f, &capture);
    rc.begin_gesture(50.0f, 0.0f, &capture);
    EXPECT_EQ(capture.begin_calls, 2);
    EXPECT_EQ(capture.end_calls, 1);
    EXPECT_TRUE(capture.active());

    capture.move(60.0f, 0.0f);
    EXPECT_FLOAT_EQ(rc.value(), 370.0f);
}
