#pragma once

#include <termdeck/catalog.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace termdeck
{

// One alternative per view kind. Each carries exactly what its view needs to
// render without a further lookup.

struct HomeView
{
    bool operator==(const HomeView&) const = default;
};

struct WorkspaceView
{
    bool operator==(const WorkspaceView&) const = default;
};

struct FeaturesView
{
    bool operator==(const FeaturesView&) const = default;
};

struct ChatProjectsView
{
    bool operator==(const ChatProjectsView&) const = default;
};

struct ChatSessionsView
{
    std::string project_id;
    bool        operator==(const ChatSessionsView&) const = default;
};

struct ChatMessagesView
{
    std::string project_id;
    std::string session_id;
    bool        operator==(const ChatMessagesView&) const = default;
};

struct SkillsView
{
    bool operator==(const SkillsView&) const = default;
};

struct SkillDetailView
{
    CatalogItem item;
    std::string local_path;
    bool        installed = false;
    bool        operator==(const SkillDetailView&) const = default;
};

struct CommandsView
{
    bool operator==(const CommandsView&) const = default;
};

struct CommandDetailView
{
    CatalogItem item;
    bool        operator==(const CommandDetailView&) const = default;
};

struct McpView
{
    bool operator==(const McpView&) const = default;
};

struct HooksView
{
    bool operator==(const HooksView&) const = default;
};

struct SubAgentsView
{
    bool operator==(const SubAgentsView&) const = default;
};

struct OutputStylesView
{
    bool operator==(const OutputStylesView&) const = default;
};

struct StatuslineView
{
    bool operator==(const StatuslineView&) const = default;
};

enum class SettingsPage
{
    Overview,
    Environment,
    Llm,
    Version,
    Context
};

struct SettingsView
{
    SettingsPage page = SettingsPage::Overview;
    bool         operator==(const SettingsView&) const = default;
};

struct MarketplaceView
{
    std::optional<std::string> category;
    bool                       operator==(const MarketplaceView&) const = default;
};

struct TemplateDetailView
{
    std::string category;
    CatalogItem item;
    bool        operator==(const TemplateDetailView&) const = default;
};

enum class KnowledgeSection
{
    Distill,
    Reference
};

struct KnowledgeView
{
    KnowledgeSection section = KnowledgeSection::Distill;
    bool             operator==(const KnowledgeView&) const = default;
};

struct AnnualReportView
{
    bool operator==(const AnnualReportView&) const = default;
};

using NavigationEntry = std::variant<HomeView,
                                     WorkspaceView,
                                     FeaturesView,
                                     ChatProjectsView,
                                     ChatSessionsView,
                                     ChatMessagesView,
                                     SkillsView,
                                     SkillDetailView,
                                     CommandsView,
                                     CommandDetailView,
                                     McpView,
                                     HooksView,
                                     SubAgentsView,
                                     OutputStylesView,
                                     StatuslineView,
                                     SettingsView,
                                     MarketplaceView,
                                     TemplateDetailView,
                                     KnowledgeView,
                                     AnnualReportView>;

// Stable lowercase name of the view kind ("skills", "skill-detail", ...).
std::string_view view_kind(const NavigationEntry& entry);

// Human-readable title for headers and the window title.
std::string entry_title(const NavigationEntry& entry);

}   // namespace termdeck
