#include "workspace_file.hpp"

#include <termdeck/logger.hpp>

#include "core/paths.hpp"

namespace termdeck
{

// ─── Serialization ───────────────────────────────────────────────────────────

static JsonValue session_to_json(const WorkspaceData::SessionState& s)
{
    JsonValue obj = JsonValue::object();
    obj.set("id", s.id);
    obj.set("process_id", s.process_id);
    obj.set("title", s.title);
    if (s.command)
        obj.set("command", *s.command);
    return obj;
}

static JsonValue panel_to_json(const WorkspaceData::PanelState& p)
{
    JsonValue obj = JsonValue::object();
    obj.set("id", p.id);
    obj.set("cwd", p.cwd);
    obj.set("is_shared", p.is_shared);
    obj.set("active_session_id", p.active_session_id);

    JsonValue sessions = JsonValue::array();
    for (const auto& s : p.sessions)
        sessions.push_back(session_to_json(s));
    obj.set("sessions", std::move(sessions));
    return obj;
}

std::string WorkspaceFile::serialize_json(const WorkspaceData& data)
{
    JsonValue root = JsonValue::object();
    root.set("version", data.version);
    root.set("active_panel_id", data.active_panel_id);

    JsonValue panels = JsonValue::array();
    for (const auto& p : data.panels)
        panels.push_back(panel_to_json(p));
    root.set("panels", std::move(panels));
    root.set("grid_layout", data.grid_layout);

    return root.dump();
}

bool WorkspaceFile::deserialize_json(const std::string& json, WorkspaceData& data)
{
    auto doc = JsonValue::parse(json);
    if (!doc || !doc->is_object())
        return false;

    auto version = static_cast<uint32_t>(doc->number_or("version", 0));
    if (version == 0 || version > WorkspaceData::FORMAT_VERSION)
    {
        TERMDECK_LOG_WARN("workspace", "Unsupported workspace format version {}", version);
        return false;
    }

    WorkspaceData out;
    out.version         = version;
    out.active_panel_id = doc->string_or("active_panel_id");

    if (const JsonValue* panels = doc->find("panels"); panels && panels->is_array())
    {
        for (const auto& pj : panels->as_array())
        {
            if (!pj.is_object())
                continue;

            WorkspaceData::PanelState p;
            p.id                = pj.string_or("id");
            p.cwd               = pj.string_or("cwd");
            p.is_shared         = pj.bool_or("is_shared", false);
            p.active_session_id = pj.string_or("active_session_id");

            if (const JsonValue* sessions = pj.find("sessions"); sessions && sessions->is_array())
            {
                for (const auto& sj : sessions->as_array())
                {
                    if (!sj.is_object())
                        continue;
                    WorkspaceData::SessionState s;
                    s.id         = sj.string_or("id");
                    s.process_id = sj.string_or("process_id");
                    s.title      = sj.string_or("title");
                    if (const JsonValue* cmd = sj.find("command"); cmd && cmd->is_string())
                        s.command = cmd->as_string();
                    p.sessions.push_back(std::move(s));
                }
            }
            out.panels.push_back(std::move(p));
        }
    }

    if (const JsonValue* layout = doc->find("grid_layout"))
        out.grid_layout = *layout;

    data = std::move(out);
    return true;
}

// ─── Save / Load ─────────────────────────────────────────────────────────────

bool WorkspaceFile::save(const std::string& path, const WorkspaceData& data)
{
    return write_text_file(path, serialize_json(data));
}

bool WorkspaceFile::load(const std::string& path, WorkspaceData& data)
{
    auto text = read_text_file(path);
    if (!text || text->empty())
        return false;
    return deserialize_json(*text, data);
}

std::string WorkspaceFile::default_path()
{
    return config_file_path("workspace.json");
}

}   // namespace termdeck
