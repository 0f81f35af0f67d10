#pragma once

#include <string>
#include <string_view>

namespace termdeck
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool contains(float px, float py) const
    {
        return px >= x && px < x + w && py >= y && py < y + h;
    }
};

// Split/drag orientation.
//   Horizontal: children side by side (Left | Right), dragged along x.
//   Vertical:   children stacked (Top / Bottom), dragged along y.
enum class SplitDirection
{
    Horizontal,
    Vertical
};

inline std::string_view to_string(SplitDirection dir)
{
    return dir == SplitDirection::Vertical ? "vertical" : "horizontal";
}

inline SplitDirection split_direction_from_string(std::string_view s)
{
    return s == "vertical" ? SplitDirection::Vertical : SplitDirection::Horizontal;
}

// Panel and session ids are opaque strings, unique for the lifetime of a
// workspace file. ProcessId names the backend process behind a session.
using PanelId   = std::string;
using SessionId = std::string;
using ProcessId = std::string;

}   // namespace termdeck
