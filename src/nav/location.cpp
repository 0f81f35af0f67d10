#include "location.hpp"

namespace termdeck
{

// ─── Percent coding ──────────────────────────────────────────────────────────

static int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size())
        {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

std::string percent_encode(std::string_view s)
{
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string           out;
    out.reserve(s.size());
    for (char c : s)
    {
        const auto u = static_cast<unsigned char>(c);
        const bool unreserved = (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z')
                                || (u >= '0' && u <= '9') || u == '-' || u == '_' || u == '.'
                                || u == '~';
        if (unreserved)
        {
            out += c;
        }
        else
        {
            out += '%';
            out += HEX[u >> 4];
            out += HEX[u & 0xF];
        }
    }
    return out;
}

// ─── Parsing ─────────────────────────────────────────────────────────────────

Location parse_location(std::string_view raw)
{
    if (!raw.empty() && raw.front() == '#')
        raw.remove_prefix(1);
    if (auto q = raw.find('?'); q != std::string_view::npos)
        raw = raw.substr(0, q);

    Location loc;
    size_t   pos = 0;
    while (pos <= raw.size())
    {
        size_t next = raw.find('/', pos);
        if (next == std::string_view::npos)
            next = raw.size();
        if (next > pos)
            loc.segments.push_back(percent_decode(raw.substr(pos, next - pos)));
        pos = next + 1;
    }
    return loc;
}

static const std::string* segment(const Location& loc, size_t i)
{
    return i < loc.segments.size() ? &loc.segments[i] : nullptr;
}

NavigationEntry initial_entry_for(const Location& loc)
{
    const std::string* first = segment(loc, 0);
    if (!first)
        return HomeView{};

    const std::string* second = segment(loc, 1);
    const std::string* third  = segment(loc, 2);
    const std::string& f      = *first;

    if (f == "workspace")
        return WorkspaceView{};
    if (f == "features")
        return FeaturesView{};
    if (f == "annual-report-2025")
        return AnnualReportView{};
    if (f == "skills")
        return SkillsView{};   // detail arrives through hydration
    if (f == "commands")
        return CommandsView{};
    if (f == "mcp")
        return McpView{};
    if (f == "hooks")
        return HooksView{};
    if (f == "agents")
        return SubAgentsView{};
    if (f == "output-styles")
        return OutputStylesView{};
    if (f == "statusline")
        return StatuslineView{};
    if (f == "settings")
    {
        SettingsView v;
        if (second)
        {
            if (*second == "env")
                v.page = SettingsPage::Environment;
            else if (*second == "llm")
                v.page = SettingsPage::Llm;
            else if (*second == "version")
                v.page = SettingsPage::Version;
            else if (*second == "context")
                v.page = SettingsPage::Context;
        }
        return v;
    }
    if (f == "chat")
    {
        if (second && third)
            return ChatMessagesView{*second, *third};
        if (second)
            return ChatSessionsView{*second};
        return ChatProjectsView{};
    }
    if (f == "knowledge")
    {
        if (second && *second == "distill")
            return KnowledgeView{KnowledgeSection::Distill};
        if (second && *second == "reference")
            return KnowledgeView{KnowledgeSection::Reference};
        return HomeView{};
    }
    if (f == "marketplace")
    {
        MarketplaceView v;
        if (second)
            v.category = *second;
        return v;
    }
    return HomeView{};
}

std::optional<HydrationRequest> hydration_request_for(const Location& loc)
{
    if (loc.segments.size() < 2)
        return std::nullopt;

    const std::string& f = loc.segments[0];
    if (f == "skills")
        return HydrationRequest{CatalogKind::Skill, loc.segments[1]};
    if (f == "commands")
        return HydrationRequest{CatalogKind::Command, loc.segments[1]};
    return std::nullopt;
}

// ─── Formatting ──────────────────────────────────────────────────────────────

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string settings_location(SettingsPage page)
{
    switch (page)
    {
        case SettingsPage::Environment:
            return "/settings/env";
        case SettingsPage::Llm:
            return "/settings/llm";
        case SettingsPage::Version:
            return "/settings/version";
        case SettingsPage::Context:
            return "/settings/context";
        case SettingsPage::Overview:
            break;
    }
    return "/settings";
}

}   // namespace

std::string format_location(const NavigationEntry& entry)
{
    return std::visit(
        overloaded{
            [](const HomeView&) -> std::string { return "/"; },
            [](const WorkspaceView&) -> std::string { return "/workspace"; },
            [](const FeaturesView&) -> std::string { return "/features"; },
            [](const ChatProjectsView&) -> std::string { return "/chat"; },
            [](const ChatSessionsView& v) -> std::string { return "/chat/" + percent_encode(v.project_id); },
            [](const ChatMessagesView& v) -> std::string
            { return "/chat/" + percent_encode(v.project_id) + "/" + percent_encode(v.session_id); },
            [](const SkillsView&) -> std::string { return "/skills"; },
            [](const SkillDetailView& v) -> std::string { return "/skills/" + percent_encode(v.item.name); },
            [](const CommandsView&) -> std::string { return "/commands"; },
            [](const CommandDetailView& v) -> std::string
            { return "/commands/" + percent_encode(v.item.name); },
            [](const McpView&) -> std::string { return "/mcp"; },
            [](const HooksView&) -> std::string { return "/hooks"; },
            [](const SubAgentsView&) -> std::string { return "/agents"; },
            [](const OutputStylesView&) -> std::string { return "/output-styles"; },
            [](const StatuslineView&) -> std::string { return "/statusline"; },
            [](const SettingsView& v) -> std::string { return settings_location(v.page); },
            [](const MarketplaceView& v) -> std::string
            { return v.category ? "/marketplace/" + percent_encode(*v.category) : "/marketplace"; },
            // Template details have no route of their own; they live under
            // their marketplace category.
            [](const TemplateDetailView& v) -> std::string
            { return "/marketplace/" + percent_encode(v.category); },
            [](const KnowledgeView& v) -> std::string
            {
                return v.section == KnowledgeSection::Distill ? "/knowledge/distill"
                                                              : "/knowledge/reference";
            },
            [](const AnnualReportView&) -> std::string { return "/annual-report-2025"; },
        },
        entry);
}

}   // namespace termdeck
