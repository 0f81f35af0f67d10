#include "paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace termdeck
{

std::string config_file_path(std::string_view file_name)
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return std::string(file_name);

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "termdeck";
    return (dir / std::filesystem::path(file_name)).string();
}

bool write_text_file(const std::string& path, std::string_view content)
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return false;
    }

    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open())
        return false;
    f << content;
    return f.good();
}

std::optional<std::string> read_text_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return std::nullopt;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
        return std::nullopt;
    return text;
}

}   // namespace termdeck
