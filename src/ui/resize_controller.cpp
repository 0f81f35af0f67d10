#include "resize_controller.hpp"

#include <termdeck/logger.hpp>
#include <termdeck/preferences.hpp>

#include <algorithm>
#include <cmath>

namespace termdeck
{

ResizeController::ResizeController(ResizeConfig config, PreferenceStore* prefs)
    : config_(std::move(config)), prefs_(prefs)
{
    if (config_.min_value > config_.max_value)
        std::swap(config_.min_value, config_.max_value);

    value_ = clamp(config_.default_value);

    if (prefs_ && !config_.storage_key.empty())
    {
        if (auto saved = prefs_->get_number(config_.storage_key); saved && std::isfinite(*saved))
        {
            value_ = clamp(static_cast<float>(*saved));
            TERMDECK_LOG_DEBUG("resize", "Loaded {} = {}", config_.storage_key, value_);
        }
    }
    chosen_ = value_;
}

ResizeController::~ResizeController()
{
    release_capture();
}

float ResizeController::clamp(float v) const
{
    if (!std::isfinite(v))
        v = value_;
    return std::clamp(v, config_.min_value, config_.max_value);
}

void ResizeController::write(float v)
{
    const float clamped = clamp(v);
    chosen_             = clamped;
    if (clamped == value_)
        return;

    value_ = clamped;
    if (prefs_ && !config_.storage_key.empty())
        prefs_->set_number(config_.storage_key, value_);
    if (on_change_)
        on_change_(value_);
}

void ResizeController::set_value(float value)
{
    write(value);
}

void ResizeController::set_bounds(float min_value, float max_value)
{
    if (min_value > max_value)
        std::swap(min_value, max_value);
    config_.min_value = min_value;
    config_.max_value = max_value;

    const float clamped = std::clamp(chosen_, min_value, max_value);
    if (clamped == value_)
        return;
    value_ = clamped;
    if (on_change_)
        on_change_(value_);
}

void ResizeController::begin_gesture(float x, float y, PointerCapture* capture, float container_extent)
{
    if (dragging_)
        end_gesture();

    dragging_         = true;
    start_pos_        = config_.direction == SplitDirection::Horizontal ? x : y;
    start_value_      = value_;
    container_extent_ = container_extent > 0.0f ? container_extent : 1.0f;

    if (capture)
    {
        capture_       = capture;
        capture_token_ = capture->begin_capture(
            config_.direction,
            [this](float mx, float my) { update_gesture(mx, my); },
            [this]() { end_gesture(); });
    }
}

void ResizeController::update_gesture(float x, float y)
{
    if (!dragging_)
        return;

    const float pos   = config_.direction == SplitDirection::Horizontal ? x : y;
    float       delta = pos - start_pos_;
    if (config_.mode == ResizeMode::Ratio)
        delta /= container_extent_;

    write(start_value_ + delta);
}

void ResizeController::end_gesture()
{
    if (!dragging_)
        return;
    dragging_ = false;
    release_capture();
    if (on_end_)
        on_end_();
}

void ResizeController::release_capture()
{
    if (!capture_)
        return;
    // Clear first: end_capture may re-enter through the release handler.
    PointerCapture*       capture = capture_;
    PointerCapture::Token token   = capture_token_;
    capture_                      = nullptr;
    capture_token_                = 0;
    capture->end_capture(token);
}

}   // namespace termdeck
