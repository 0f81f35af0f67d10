#pragma once

#include <termdeck/types.hpp>

#include <cstdint>
#include <functional>

namespace termdeck
{

// Window-level pointer grab used while a drag gesture is in progress.
//
// begin_capture() installs move/up listeners that see the pointer anywhere in
// the window and applies a resize cursor plus a text-selection override.
// end_capture() removes both listeners and clears the override. It must be
// safe to call from inside either handler, and more than once.
//
// An implementation may end a capture by itself (pointer left the window,
// focus lost); it then calls the release handler exactly once.
class PointerCapture
{
   public:
    using MoveHandler    = std::function<void(float x, float y)>;
    using ReleaseHandler = std::function<void()>;
    using Token          = uint64_t;

    virtual ~PointerCapture() = default;

    virtual Token begin_capture(SplitDirection axis,
                                MoveHandler    on_move,
                                ReleaseHandler on_release) = 0;
    virtual void  end_capture(Token token)                 = 0;
};

}   // namespace termdeck
