#pragma once

#include <termdeck/types.hpp>

#include <functional>
#include <string>

#include "ui/pointer_capture.hpp"

namespace termdeck
{

class PreferenceStore;

enum class ResizeMode
{
    Absolute,   // value in pixels, delta added as-is
    Ratio       // value in 0..1, delta divided by the container extent
};

struct ResizeConfig
{
    SplitDirection direction     = SplitDirection::Horizontal;
    ResizeMode     mode          = ResizeMode::Absolute;
    float          default_value = 0.0f;
    float          min_value     = 0.0f;
    float          max_value     = 1.0f;
    // Preference key; empty means not persisted.
    std::string storage_key;
};

// Turns a pointer drag into a clamped scalar.
//
// The value is clamped to [min, max] on every write, whether it came from a
// drag, set_value() or the persisted store. The persisted value is read once
// at construction; afterwards every change is written back. During a drag the
// value is written on each move, not only at release.
class ResizeController
{
   public:
    using ChangeCallback = std::function<void(float value)>;
    using EndCallback    = std::function<void()>;

    explicit ResizeController(ResizeConfig config, PreferenceStore* prefs = nullptr);
    ~ResizeController();

    ResizeController(const ResizeController&)            = delete;
    ResizeController& operator=(const ResizeController&) = delete;

    float value() const { return value_; }
    float min_value() const { return config_.min_value; }
    float max_value() const { return config_.max_value; }

    SplitDirection direction() const { return config_.direction; }
    ResizeMode     mode() const { return config_.mode; }

    void set_value(float value);

    // Narrow or widen the allowed range. The value is re-clamped from the
    // last one set or dragged to, so widening again restores it. A clamp
    // caused by the bounds alone is not persisted.
    void set_bounds(float min_value, float max_value);

    // Start a drag at (x, y). In ratio mode `container_extent` is the size of
    // the container along the drag axis; a non-positive extent falls back to 1.
    // With a capture the move/release events come through it; without one the
    // caller forwards them. Starting while a drag is active cancels it first.
    void begin_gesture(float           x,
                       float           y,
                       PointerCapture* capture          = nullptr,
                       float           container_extent = 0.0f);
    void update_gesture(float x, float y);
    void end_gesture();

    bool is_dragging() const { return dragging_; }

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }
    // Fired once when a drag ends, whether by end_gesture() or by the capture.
    void set_on_end(EndCallback cb) { on_end_ = std::move(cb); }

   private:
    ResizeConfig     config_;
    PreferenceStore* prefs_  = nullptr;
    float            value_  = 0.0f;
    float            chosen_ = 0.0f;   // last value written, before bounds clamps

    bool  dragging_         = false;
    float start_pos_        = 0.0f;
    float start_value_      = 0.0f;
    float container_extent_ = 1.0f;

    PointerCapture*       capture_       = nullptr;
    PointerCapture::Token capture_token_ = 0;

    ChangeCallback on_change_;
    EndCallback    on_end_;

    float clamp(float v) const;
    void  write(float v);
    void  release_capture();
};

}   // namespace termdeck
