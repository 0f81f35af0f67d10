#include <gtest/gtest.h>

#include "config/preference_store.hpp"
#include "ui/layout_engine.hpp"
#include "workspace/panel_store.hpp"
#include "workspace/workspace_file.hpp"

using namespace termdeck;

class LayoutEngineTest : public ::testing::Test
{
   protected:
    PanelStore store{make_options()};
    PanelId    grid_a;

    void SetUp() override { grid_a = store.panels().front().id; }

    static PanelStore::Options make_options()
    {
        PanelStore::Options opts;
        opts.ids = sequential_ids("p");
        return opts;
    }

    PanelId pin_new_panel()
    {
        PanelId id = store.add_panel(SplitDirection::Horizontal);
        store.toggle_shared(id);
        return id;
    }
};

// ─── Pinned expanded set ─────────────────────────────────────────────────────

TEST_F(LayoutEngineTest, NewlyPinnedPanelIsExpandedOnSameSync)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    engine.sync(store);
    EXPECT_TRUE(engine.is_panel_expanded(x));
}

TEST_F(LayoutEngineTest, PromotingSecondPanelKeepsFirstAsIs)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    engine.sync(store);
    // The user collapses X; it must stay collapsed when Y arrives.
    ASSERT_TRUE(engine.toggle_panel_expanded(x));
    ASSERT_FALSE(engine.is_panel_expanded(x));

    PanelId y = pin_new_panel();
    EXPECT_TRUE(engine.sync(store));

    EXPECT_FALSE(engine.is_panel_expanded(x));
    EXPECT_TRUE(engine.is_panel_expanded(y));
}

TEST_F(LayoutEngineTest, UnpinnedPanelLeavesExpandedSet)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    engine.sync(store);

    store.toggle_shared(x);
    EXPECT_TRUE(engine.sync(store));
    EXPECT_FALSE(engine.is_panel_expanded(x));
    EXPECT_TRUE(engine.expanded_panels().empty());

    // Pinned again later: counts as newly pinned.
    store.toggle_shared(x);
    engine.sync(store);
    EXPECT_TRUE(engine.is_panel_expanded(x));
}

TEST_F(LayoutEngineTest, ToggleUnknownPanelFails)
{
    LayoutEngine engine;
    engine.sync(store);
    EXPECT_FALSE(engine.toggle_panel_expanded(grid_a));
    EXPECT_FALSE(engine.toggle_panel_expanded("ghost"));
}

TEST_F(LayoutEngineTest, RestoredExpandedSetIsNotOverridden)
{
    PanelId x = pin_new_panel();
    PanelId y = pin_new_panel();

    MemoryPreferenceStore prefs;
    prefs.set_list(pref_keys::PINNED_EXPANDED_PANELS, {y, "stale-id"});

    LayoutEngine engine;
    engine.attach_preferences(&prefs);
    engine.sync(store);

    EXPECT_FALSE(engine.is_panel_expanded(x));
    EXPECT_TRUE(engine.is_panel_expanded(y));
    EXPECT_FALSE(engine.is_panel_expanded("stale-id"));
    EXPECT_EQ(*prefs.get_list(pref_keys::PINNED_EXPANDED_PANELS), (std::vector<std::string>{y}));
}

TEST_F(LayoutEngineTest, PreferencesWrittenOnChange)
{
    MemoryPreferenceStore prefs;
    LayoutEngine          engine;
    engine.attach_preferences(&prefs);

    engine.set_pinned_collapsed(true);
    engine.set_layout_mode(SplitDirection::Vertical);

    EXPECT_TRUE(prefs.get_bool(pref_keys::PINNED_ZONE_COLLAPSED).value_or(false));
    EXPECT_EQ(prefs.get_string(pref_keys::LAYOUT_MODE).value_or(""), "vertical");

    LayoutEngine reloaded;
    reloaded.attach_preferences(&prefs);
    EXPECT_TRUE(reloaded.is_pinned_collapsed());
    EXPECT_EQ(reloaded.layout_mode(), SplitDirection::Vertical);
}

TEST_F(LayoutEngineTest, ZoneWidthNotReadFromPreferences)
{
    MemoryPreferenceStore prefs;
    prefs.set_number(pref_keys::PINNED_ZONE_WIDTH, 500.0);

    LayoutEngine engine;
    engine.attach_preferences(&prefs);
    EXPECT_FLOAT_EQ(engine.pinned_zone_width(), LayoutEngine::PINNED_DEFAULT_WIDTH);

    engine.set_pinned_zone_width(420.0f);
    pin_new_panel();
    engine.sync(store);
    EXPECT_FLOAT_EQ(engine.compute(store, 1600, 900).pinned_zone.w, 420.0f);
    EXPECT_DOUBLE_EQ(prefs.get_number(pref_keys::PINNED_ZONE_WIDTH).value_or(0.0), 500.0);
}

// ─── Compute ─────────────────────────────────────────────────────────────────

TEST_F(LayoutEngineTest, NoPinnedPanelsHidesZone)
{
    LayoutEngine engine;
    engine.sync(store);
    auto snap = engine.compute(store, 1200, 800);

    EXPECT_EQ(snap.pinned_state, PinnedZoneState::Hidden);
    EXPECT_FLOAT_EQ(snap.grid.x, 0.0f);
    EXPECT_FLOAT_EQ(snap.grid.w, 1200.0f);
    ASSERT_EQ(snap.grid_panes.size(), 1u);
    EXPECT_TRUE(snap.grid_panes[0].active);
    EXPECT_FLOAT_EQ(snap.grid_panes[0].header.h, LayoutEngine::PANE_HEADER_HEIGHT);
    EXPECT_FLOAT_EQ(snap.grid_panes[0].content.y, LayoutEngine::PANE_HEADER_HEIGHT);
}

TEST_F(LayoutEngineTest, ExpandedZoneSitsLeftOfGrid)
{
    LayoutEngine engine;
    pin_new_panel();
    engine.sync(store);
    auto snap = engine.compute(store, 1200, 800);

    EXPECT_EQ(snap.pinned_state, PinnedZoneState::Expanded);
    EXPECT_FLOAT_EQ(snap.pinned_zone.x, 0.0f);
    EXPECT_FLOAT_EQ(snap.pinned_zone.w, LayoutEngine::PINNED_DEFAULT_WIDTH);
    EXPECT_FLOAT_EQ(snap.pinned_resize_handle.x, LayoutEngine::PINNED_DEFAULT_WIDTH);
    EXPECT_FLOAT_EQ(snap.grid.x, LayoutEngine::PINNED_DEFAULT_WIDTH + LayoutEngine::RESIZE_HANDLE_WIDTH);
    EXPECT_EQ(snap.pinned_title, "Pinned");
}

TEST_F(LayoutEngineTest, HeaderShowsCountAboveOne)
{
    LayoutEngine engine;
    pin_new_panel();
    pin_new_panel();
    engine.sync(store);
    EXPECT_EQ(engine.compute(store, 1200, 800).pinned_title, "Pinned (2)");
}

TEST_F(LayoutEngineTest, ExpandedPanelsShareRemainingHeight)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    PanelId      y = pin_new_panel();
    PanelId      z = pin_new_panel();
    engine.sync(store);
    engine.toggle_panel_expanded(y);   // collapse Y

    auto snap = engine.compute(store, 1200, 800);
    ASSERT_EQ(snap.pinned.size(), 3u);

    const float body = 800.0f - LayoutEngine::PINNED_HEADER_HEIGHT;
    const float flex = (body - LayoutEngine::PANE_HEADER_HEIGHT) / 2.0f;
    EXPECT_EQ(snap.pinned[0].panel_id, x);
    EXPECT_TRUE(snap.pinned[0].flexed);
    EXPECT_FLOAT_EQ(snap.pinned[0].bounds.h, flex);
    EXPECT_FALSE(snap.pinned[1].flexed);
    EXPECT_FLOAT_EQ(snap.pinned[1].bounds.h, LayoutEngine::PANE_HEADER_HEIGHT);
    EXPECT_EQ(snap.pinned[2].panel_id, z);
    EXPECT_FLOAT_EQ(snap.pinned[2].bounds.h, flex);
    EXPECT_FLOAT_EQ(snap.pinned[2].bounds.y + snap.pinned[2].bounds.h, 800.0f);
}

TEST_F(LayoutEngineTest, NoneExpandedFallsBackToNaturalHeight)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    PanelId      y = pin_new_panel();
    engine.sync(store);
    engine.toggle_panel_expanded(x);
    engine.toggle_panel_expanded(y);

    auto snap = engine.compute(store, 1200, 800);
    ASSERT_EQ(snap.pinned.size(), 2u);
    for (const auto& pl : snap.pinned)
    {
        EXPECT_FALSE(pl.flexed);
        EXPECT_FALSE(pl.expanded);
        EXPECT_FLOAT_EQ(pl.bounds.h, LayoutEngine::PANE_HEADER_HEIGHT);
    }
}

TEST_F(LayoutEngineTest, CollapsedZoneShowsMarkersWithTooltips)
{
    LayoutEngine engine;
    PanelId      x = pin_new_panel();
    PanelId      y = pin_new_panel();
    const auto   sx = store.find_panel(x)->active_session_id;
    store.rename_session(x, sx, "server");
    store.rename_session(y, store.find_panel(y)->active_session_id, "");
    engine.sync(store);
    engine.set_pinned_collapsed(true);

    auto snap = engine.compute(store, 1200, 800);
    EXPECT_EQ(snap.pinned_state, PinnedZoneState::Collapsed);
    EXPECT_TRUE(snap.pinned.empty());
    ASSERT_EQ(snap.markers.size(), 2u);
    EXPECT_EQ(snap.markers[0].tooltip, "server");
    EXPECT_EQ(snap.markers[1].tooltip, "Shared");
    EXPECT_GT(snap.markers[1].bounds.y, snap.markers[0].bounds.y);
    EXPECT_FLOAT_EQ(snap.pinned_zone.w, LayoutEngine::PINNED_STRIP_WIDTH);
    EXPECT_FLOAT_EQ(snap.grid.x, LayoutEngine::PINNED_STRIP_WIDTH);
}

TEST_F(LayoutEngineTest, ZoneWidthLeavesRoomForGrid)
{
    LayoutEngine engine;
    pin_new_panel();
    engine.sync(store);
    engine.set_pinned_zone_width(LayoutEngine::PINNED_MAX_WIDTH);

    auto snap = engine.compute(store, 600, 400);
    EXPECT_GE(snap.grid.w, LayoutNode::MIN_PANE_SIZE - 0.01f);
    EXPECT_LE(snap.pinned_zone.w + LayoutEngine::RESIZE_HANDLE_WIDTH + snap.grid.w, 600.01f);
}

TEST_F(LayoutEngineTest, NoticeBarSitsAboveGrid)
{
    LayoutEngine engine;
    pin_new_panel();
    engine.sync(store);

    auto plain = engine.compute(store, 1200, 800);
    EXPECT_TRUE(plain.notice.empty());
    EXPECT_FLOAT_EQ(plain.notice_bar.h, 0.0f);

    auto snap = engine.compute(store, 1200, 800, "Skill \"foo\" not found");
    EXPECT_EQ(snap.notice, "Skill \"foo\" not found");
    EXPECT_FLOAT_EQ(snap.notice_bar.x, plain.grid.x);
    EXPECT_FLOAT_EQ(snap.notice_bar.w, plain.grid.w);
    EXPECT_FLOAT_EQ(snap.notice_bar.h, LayoutEngine::NOTICE_HEIGHT);
    EXPECT_FLOAT_EQ(snap.grid.y, LayoutEngine::NOTICE_HEIGHT);
    EXPECT_FLOAT_EQ(snap.grid.h, plain.grid.h - LayoutEngine::NOTICE_HEIGHT);
    ASSERT_FALSE(snap.grid_panes.empty());
    EXPECT_GE(snap.grid_panes.front().bounds.y, LayoutEngine::NOTICE_HEIGHT);
    // The pinned zone keeps the full height.
    EXPECT_FLOAT_EQ(snap.pinned_zone.h, 800.0f);
}

TEST_F(LayoutEngineTest, ZoneWidthClamped)
{
    LayoutEngine engine;
    engine.set_pinned_zone_width(10.0f);
    EXPECT_FLOAT_EQ(engine.pinned_zone_width(), LayoutEngine::PINNED_MIN_WIDTH);
    engine.set_pinned_zone_width(99999.0f);
    EXPECT_FLOAT_EQ(engine.pinned_zone_width(), LayoutEngine::PINNED_MAX_WIDTH);
}

TEST_F(LayoutEngineTest, SplitterHitTest)
{
    LayoutEngine engine;
    store.add_panel(SplitDirection::Horizontal);
    engine.sync(store);

    auto snap = engine.compute(store, 1000, 600);
    ASSERT_EQ(snap.splitters.size(), 1u);
    const Rect& s = snap.splitters[0].bounds;

    EXPECT_NE(hit_splitter(snap, s.x + s.w * 0.5f, 300.0f), nullptr);
    EXPECT_EQ(hit_splitter(snap, 10.0f, 300.0f), nullptr);
}

TEST_F(LayoutEngineTest, ComputeDoesNotMutateStore)
{
    LayoutEngine engine;
    pin_new_panel();
    engine.sync(store);
    const auto before = store.capture().panels.size();
    engine.compute(store, 800, 600);
    EXPECT_EQ(store.capture().panels.size(), before);
    EXPECT_TRUE(store.validate());
}
