#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace termdeck
{

// $HOME/.config/termdeck/<file_name> (USERPROFILE fallback). Falls back to a
// bare relative file name when no home directory is known.
std::string config_file_path(std::string_view file_name);

// Writes `content` to `path`, creating parent directories. Returns false on
// any I/O failure.
bool write_text_file(const std::string& path, std::string_view content);

// Whole-file read. nullopt when the file is missing or unreadable.
std::optional<std::string> read_text_file(const std::string& path);

}   // namespace termdeck
