#include <gtest/gtest.h>

#include "nav/location.hpp"

using namespace termdeck;

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(LocationParse, SplitsAndNormalizes)
{
    EXPECT_EQ(parse_location("/skills/foo").segments, (std::vector<std::string>{"skills", "foo"}));
    EXPECT_EQ(parse_location("#/skills//foo/").segments, (std::vector<std::string>{"skills", "foo"}));
    EXPECT_EQ(parse_location("skills/foo?tab=readme").segments,
              (std::vector<std::string>{"skills", "foo"}));
    EXPECT_TRUE(parse_location("").segments.empty());
    EXPECT_TRUE(parse_location("/").segments.empty());
}

TEST(LocationParse, DecodesSegments)
{
    auto loc = parse_location("/chat/my%20project/abc%2Fdef");
    ASSERT_EQ(loc.segments.size(), 3u);
    EXPECT_EQ(loc.segments[1], "my project");
    EXPECT_EQ(loc.segments[2], "abc/def");
}

TEST(PercentCoding, InvalidEscapesKeptLiterally)
{
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
    EXPECT_EQ(percent_decode("%4"), "%4");
    EXPECT_EQ(percent_decode("%41"), "A");
}

TEST(PercentCoding, EncodeLeavesUnreservedAlone)
{
    EXPECT_EQ(percent_encode("code-review_v1.2~x"), "code-review_v1.2~x");
    EXPECT_EQ(percent_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(percent_decode(percent_encode("ünïcode name")), "ünïcode name");
}

// ─── Initial entries ─────────────────────────────────────────────────────────

TEST(InitialEntry, FeatureRoutes)
{
    EXPECT_TRUE(std::holds_alternative<HomeView>(initial_entry_for(parse_location("/"))));
    EXPECT_TRUE(std::holds_alternative<WorkspaceView>(initial_entry_for(parse_location("/workspace"))));
    EXPECT_TRUE(std::holds_alternative<McpView>(initial_entry_for(parse_location("/mcp"))));
    EXPECT_TRUE(std::holds_alternative<SubAgentsView>(initial_entry_for(parse_location("/agents"))));
    EXPECT_TRUE(
        std::holds_alternative<AnnualReportView>(initial_entry_for(parse_location("/annual-report-2025"))));
    EXPECT_TRUE(std::holds_alternative<HomeView>(initial_entry_for(parse_location("/nowhere"))));
}

TEST(InitialEntry, DetailRoutesStartAtListView)
{
    EXPECT_EQ(initial_entry_for(parse_location("/skills/foo")), NavigationEntry(SkillsView{}));
    EXPECT_EQ(initial_entry_for(parse_location("/commands/deploy")), NavigationEntry(CommandsView{}));
}

TEST(InitialEntry, ChatDepth)
{
    EXPECT_EQ(initial_entry_for(parse_location("/chat")), NavigationEntry(ChatProjectsView{}));
    EXPECT_EQ(initial_entry_for(parse_location("/chat/p1")), NavigationEntry(ChatSessionsView{"p1"}));
    EXPECT_EQ(initial_entry_for(parse_location("/chat/p1/s9")),
              NavigationEntry(ChatMessagesView{"p1", "s9"}));
}

TEST(InitialEntry, SettingsAndKnowledgePages)
{
    EXPECT_EQ(initial_entry_for(parse_location("/settings")), NavigationEntry(SettingsView{}));
    EXPECT_EQ(initial_entry_for(parse_location("/settings/llm")),
              NavigationEntry(SettingsView{SettingsPage::Llm}));
    EXPECT_EQ(initial_entry_for(parse_location("/settings/bogus")), NavigationEntry(SettingsView{}));
    EXPECT_EQ(initial_entry_for(parse_location("/knowledge/reference")),
              NavigationEntry(KnowledgeView{KnowledgeSection::Reference}));
    EXPECT_EQ(initial_entry_for(parse_location("/knowledge")), NavigationEntry(HomeView{}));
}

TEST(InitialEntry, MarketplaceCategory)
{
    MarketplaceView plain;
    MarketplaceView agents;
    agents.category = "agents";
    EXPECT_EQ(initial_entry_for(parse_location("/marketplace")), NavigationEntry(plain));
    EXPECT_EQ(initial_entry_for(parse_location("/marketplace/agents")), NavigationEntry(agents));
}

// ─── Hydration requests ──────────────────────────────────────────────────────

TEST(HydrationRequestFor, OnlyDetailRoutes)
{
    auto skill = hydration_request_for(parse_location("/skills/foo"));
    ASSERT_TRUE(skill.has_value());
    EXPECT_EQ(skill->kind, CatalogKind::Skill);
    EXPECT_EQ(skill->id, "foo");

    auto cmd = hydration_request_for(parse_location("/commands/a%20b"));
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, CatalogKind::Command);
    EXPECT_EQ(cmd->id, "a b");

    EXPECT_FALSE(hydration_request_for(parse_location("/skills")).has_value());
    EXPECT_FALSE(hydration_request_for(parse_location("/chat/p1")).has_value());
}

// ─── Formatting ──────────────────────────────────────────────────────────────

TEST(FormatLocation, RoutesParseBackToSameEntry)
{
    const std::vector<NavigationEntry> entries = {
        HomeView{},
        WorkspaceView{},
        ChatMessagesView{"proj x", "sess/1"},
        SettingsView{SettingsPage::Context},
        KnowledgeView{KnowledgeSection::Distill},
        StatuslineView{},
    };
    for (const auto& e : entries)
        EXPECT_EQ(initial_entry_for(parse_location(format_location(e))), e) << format_location(e);
}

TEST(FormatLocation, DetailEntriesUseItemName)
{
    CatalogItem item;
    item.name = "my skill";
    EXPECT_EQ(format_location(SkillDetailView{item, "/tmp", true}), "/skills/my%20skill");
    EXPECT_EQ(format_location(CommandDetailView{item}), "/commands/my%20skill");
}

TEST(EntryTitle, NamesViews)
{
    EXPECT_EQ(entry_title(SkillsView{}), "Skills");
    EXPECT_EQ(entry_title(SettingsView{SettingsPage::Llm}), "LLM Provider");
    EXPECT_EQ(view_kind(SkillsView{}), "skills");
    EXPECT_EQ(view_kind(CommandDetailView{}), "command-detail");
}
