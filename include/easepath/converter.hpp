#pragma once

#include <easepath/ease.hpp>
#include <easepath/keyframe_source.hpp>
#include <easepath/path.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace easepath
{

enum class OutputMode : uint8_t
{
    SvgPath,           // M0.0000,0.0000C...  one path string per property
    NormalizedArray,   // [x1,y1,x2,y2],[...] one group per keyframe pair
};

struct ConvertOptions
{
    bool        clamp_infinite_values = true;   // clamp +/-inf normalized values to +/-10
    OutputMode  output_mode           = OutputMode::SvgPath;
    bool        diagnostics_enabled   = false;   // per-segment classification logs
    NumberStyle number_style          = NumberStyle::Fixed;
};

// Non-fatal problem found while converting one keyframe pair.
struct Diagnostic
{
    int         key_index = 0;   // 1-based start key of the pair
    EaseType    ease      = EaseType::Unsupported;
    std::string message;
};

// One converted keyframe pair.
struct SegmentCommand
{
    PathCommand               command;
    std::optional<Diagnostic> diagnostic;
};

struct PathResult
{
    Path                    path;
    std::vector<Diagnostic> diagnostics;
};

struct CurveArrayResult
{
    std::vector<NormalizedCurve> curves;
    std::vector<Diagnostic>      diagnostics;
};

struct ConversionResult
{
    std::string             property;
    std::string             text;
    std::vector<Diagnostic> diagnostics;
};

// EasePathConverter: turns a property's keyframe eases into a CustomEase
// path string or an array of normalized cubic-bezier handles.
//
// Conversion is stateless apart from the options; every call builds its
// result from scratch.
class EasePathConverter
{
   public:
    EasePathConverter() = default;
    explicit EasePathConverter(const ConvertOptions& options);

    const ConvertOptions& options() const { return options_; }
    void                  set_options(const ConvertOptions& options) { options_ = options; }

    // Command for the pair (key_index, key_index + 1). Linear pairs become a
    // LineTo; every other pair, unsupported ones included, becomes a
    // CubicCurveTo. Unsupported pairs carry a diagnostic.
    SegmentCommand build_segment(const KeyframeSource& source, int key_index) const;

    // Full path for a property: MoveTo at the first key followed by one
    // command per keyframe pair. The y axis is inverted when the curve ends
    // above its start value. Returns nullopt for fewer than 2 keys.
    std::optional<PathResult> build_path(const KeyframeSource& source) const;

    // Normalized handles, one entry per keyframe pair. Empty for fewer than
    // 2 keys. No y inversion is applied.
    CurveArrayResult build_curve_array(const KeyframeSource& source) const;

    // Formatted output for one property in the configured mode. Returns
    // nullopt when the property has fewer than 2 keys.
    std::optional<ConversionResult> convert(const KeyframeSource& source) const;

    // Converts every property of a selection. In NormalizedArray mode only
    // the first property is converted.
    std::vector<ConversionResult> convert_selection(
        const std::vector<const KeyframeSource*>& selection) const;

   private:
    ConvertOptions options_;
};

// "[x1,y1,x2,y2],[x1,y1,x2,y2]"
std::string format_curve_array(const std::vector<NormalizedCurve>& curves,
                               NumberStyle                         style = NumberStyle::Fixed);

// Paste-ready registration line: CustomEase.create('name', 'path');
// Quotes and backslashes in either argument are escaped.
std::string custom_ease_snippet(const std::string& ease_name, const std::string& path);

}   // namespace easepath
