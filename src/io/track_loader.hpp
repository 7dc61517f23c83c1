#pragma once

#include <easepath/keyframe_source.hpp>

#include <optional>
#include <string>

namespace easepath
{

// Keyframe table exported from an animation editor, one row per key.
//
// Columns are matched by header name (case-insensitive, any order):
//   time, value[, value2, value3 ...], in_type, out_type,
//   in_speed, in_influence, out_speed, out_influence
// Only `time` and `value` are required. Interpolation names are linear,
// bezier and hold. Comma, semicolon and tab delimiters are detected.
struct TrackLoadResult
{
    KeyframeTrack track;
    std::string   error;   // Non-empty on parse failure

    bool ok() const { return error.empty(); }
};

// Parse a keyframe table held in memory.
TrackLoadResult parse_track_csv(const std::string& text,
                                const std::string& name,
                                double             frame_rate);

// Parse a keyframe table from disk. The track is named after the file stem.
TrackLoadResult load_track_csv(const std::string& path, double frame_rate);

std::optional<InterpolationType> parse_interpolation_type(const std::string& name);

}   // namespace easepath
