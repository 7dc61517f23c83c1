#pragma once

#include <easepath/keyframe_source.hpp>
#include <easepath/path.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace easepath
{

// ─── Tween data ─────────────────────────────────────────────────────────────

// Timing and value deltas of one keyframe pair. Frames are time * frame rate.
struct TweenData
{
    double start_time      = 0.0;
    double end_time        = 0.0;
    double duration_time   = 0.0;
    double start_frame     = 0.0;
    double end_frame       = 0.0;
    double duration_frames = 0.0;
    double start_value     = 0.0;
    double end_value       = 0.0;
};

// Build the tween between 1-based keys `start_index` and `end_index`.
// Vector-valued properties contribute only their first component.
TweenData compute_tween_data(const KeyframeSource& source, int start_index, int end_index);

// First component of a key's value. Throws std::invalid_argument if the
// source reports an empty value.
double scalar_key_value(const KeyframeSource& source, int index);

// ─── Ease classification ────────────────────────────────────────────────────

enum class EaseType : uint8_t
{
    LinearLinear,
    LinearBezier,
    BezierLinear,
    BezierBezier,
    Unsupported,
};

// Classify from the out-interpolation of the start key and the
// in-interpolation of the end key.
EaseType classify_ease(InterpolationType start_out, InterpolationType end_in);

// Classify the pair (key_index, key_index + 1) of `source`.
EaseType classify_ease(const KeyframeSource& source, int key_index);

// "linear-linear", "linear-bezier", "bezier-linear", "bezier-bezier", "unsupported".
const char* ease_type_name(EaseType type);

// ─── Control points ─────────────────────────────────────────────────────────

// Outgoing handle of the start key, in (frame, value) space.
Point outgoing_control_point(const TweenData& tween, const TemporalEase& ease, double frame_rate);

// Incoming handle of the end key, in (frame, value) space. The slope is the
// negated incoming speed.
Point incoming_control_point(const TweenData& tween, const TemporalEase& ease, double frame_rate);

// Source-reading variants for the pair (key_index, key_index + 1). Only the
// first ease record is consulted; an empty ease list throws
// std::invalid_argument.
Point outgoing_control_point(const KeyframeSource& source, const TweenData& tween, int key_index);
Point incoming_control_point(const KeyframeSource& source, const TweenData& tween, int key_index);

// ─── Normalization ──────────────────────────────────────────────────────────

// Magnitude used in place of an infinite normalized coordinate.
inline constexpr double kInfiniteClamp = 10.0;

// Map `value` from [min, max] onto [0, 1]. A zero-width range produces a
// signed infinity (or NaN when value == min); infinities are replaced by
// +/-kInfiniteClamp when `clamp_infinite` is set.
double normalize(double value, double min, double max, bool clamp_infinite);

// Cubic-bezier handles of one segment in unit space: [x1, y1, x2, y2].
struct NormalizedCurve
{
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    std::array<double, 4> values() const { return {x1, y1, x2, y2}; }

    // "x1,y1,x2,y2" rounded to two decimals.
    std::string to_string(NumberStyle style = NumberStyle::Fixed) const;
};

// Normalize the two absolute control points of `tween`. When the segment has
// no value change, each y is taken to be its x.
NormalizedCurve normalize_curve(const TweenData& tween,
                                const Point&     outgoing,
                                const Point&     incoming,
                                bool             clamp_infinite);

}   // namespace easepath
