#pragma once

#include <termdeck/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/json.hpp"

namespace termdeck
{

// Serializable panel/session tree.
// Format: JSON text file, ~/.config/termdeck/workspace.json by default.
struct WorkspaceData
{
    // File format version for migration support
    static constexpr uint32_t FORMAT_VERSION = 1;

    struct SessionState
    {
        std::string                id;
        std::string                process_id;
        std::string                title;
        std::optional<std::string> command;
    };

    struct PanelState
    {
        std::string               id;
        std::string               cwd;
        bool                      is_shared = false;
        std::string               active_session_id;
        std::vector<SessionState> sessions;
    };

    uint32_t                version = FORMAT_VERSION;
    std::vector<PanelState> panels;
    std::string             active_panel_id;

    // Grid split tree (LayoutTree::to_json). Null when the grid is empty.
    JsonValue grid_layout;
};

class WorkspaceFile
{
   public:
    // Returns false on any I/O failure.
    static bool save(const std::string& path, const WorkspaceData& data);

    // Returns false if the file is missing, malformed or from a newer format.
    static bool load(const std::string& path, WorkspaceData& data);

    static std::string serialize_json(const WorkspaceData& data);
    static bool        deserialize_json(const std::string& json, WorkspaceData& data);

    static std::string default_path();
};

}   // namespace termdeck
