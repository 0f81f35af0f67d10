#include "navigation_entry.hpp"

#include <type_traits>

namespace termdeck
{

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string_view settings_page_title(SettingsPage page)
{
    switch (page)
    {
        case SettingsPage::Environment:
            return "Environment";
        case SettingsPage::Llm:
            return "LLM Provider";
        case SettingsPage::Version:
            return "Version";
        case SettingsPage::Context:
            return "Context Files";
        case SettingsPage::Overview:
            break;
    }
    return "Settings";
}

}   // namespace

std::string_view view_kind(const NavigationEntry& entry)
{
    return std::visit(overloaded{
                          [](const HomeView&) -> std::string_view { return "home"; },
                          [](const WorkspaceView&) -> std::string_view { return "workspace"; },
                          [](const FeaturesView&) -> std::string_view { return "features"; },
                          [](const ChatProjectsView&) -> std::string_view { return "chat-projects"; },
                          [](const ChatSessionsView&) -> std::string_view { return "chat-sessions"; },
                          [](const ChatMessagesView&) -> std::string_view { return "chat-messages"; },
                          [](const SkillsView&) -> std::string_view { return "skills"; },
                          [](const SkillDetailView&) -> std::string_view { return "skill-detail"; },
                          [](const CommandsView&) -> std::string_view { return "commands"; },
                          [](const CommandDetailView&) -> std::string_view { return "command-detail"; },
                          [](const McpView&) -> std::string_view { return "mcp"; },
                          [](const HooksView&) -> std::string_view { return "hooks"; },
                          [](const SubAgentsView&) -> std::string_view { return "sub-agents"; },
                          [](const OutputStylesView&) -> std::string_view { return "output-styles"; },
                          [](const StatuslineView&) -> std::string_view { return "statusline"; },
                          [](const SettingsView&) -> std::string_view { return "settings"; },
                          [](const MarketplaceView&) -> std::string_view { return "marketplace"; },
                          [](const TemplateDetailView&) -> std::string_view { return "template-detail"; },
                          [](const KnowledgeView&) -> std::string_view { return "knowledge"; },
                          [](const AnnualReportView&) -> std::string_view { return "annual-report"; },
                      },
                      entry);
}

std::string entry_title(const NavigationEntry& entry)
{
    return std::visit(overloaded{
                          [](const HomeView&) -> std::string { return "Home"; },
                          [](const WorkspaceView&) -> std::string { return "Workspace"; },
                          [](const FeaturesView&) -> std::string { return "Features"; },
                          [](const ChatProjectsView&) -> std::string { return "Projects"; },
                          [](const ChatSessionsView& v) -> std::string { return v.project_id; },
                          [](const ChatMessagesView& v) -> std::string { return v.session_id; },
                          [](const SkillsView&) -> std::string { return "Skills"; },
                          [](const SkillDetailView& v) -> std::string { return v.item.name; },
                          [](const CommandsView&) -> std::string { return "Commands"; },
                          [](const CommandDetailView& v) -> std::string { return v.item.name; },
                          [](const McpView&) -> std::string { return "MCP Servers"; },
                          [](const HooksView&) -> std::string { return "Hooks"; },
                          [](const SubAgentsView&) -> std::string { return "Sub-Agents"; },
                          [](const OutputStylesView&) -> std::string { return "Output Styles"; },
                          [](const StatuslineView&) -> std::string { return "Statusline"; },
                          [](const SettingsView& v) -> std::string
                          { return std::string(settings_page_title(v.page)); },
                          [](const MarketplaceView& v) -> std::string
                          { return v.category ? "Marketplace: " + *v.category : "Marketplace"; },
                          [](const TemplateDetailView& v) -> std::string { return v.item.name; },
                          [](const KnowledgeView& v) -> std::string
                          { return v.section == KnowledgeSection::Distill ? "Distill" : "Reference"; },
                          [](const AnnualReportView&) -> std::string { return "Annual Report 2025"; },
                      },
                      entry);
}

}   // namespace termdeck
