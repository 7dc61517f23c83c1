#include <easepath/converter.hpp>
#include <easepath/logger.hpp>

namespace easepath
{

namespace
{

constexpr const char* kCategory = "convert";

std::optional<Diagnostic> check_ease(const KeyframeSource& source,
                                     int                   key_index,
                                     EaseType              ease,
                                     bool                  verbose)
{
    if (verbose)
    {
        EASEPATH_LOG_DEBUG(kCategory,
                           "'{}' keys {}-{}: easeType {}",
                           source.name(),
                           key_index,
                           key_index + 1,
                           ease_type_name(ease));
    }

    if (ease != EaseType::Unsupported)
        return std::nullopt;

    Diagnostic d;
    d.key_index = key_index;
    d.ease      = ease;
    d.message   = "Keyframe pair " + std::to_string(key_index) + "-"
                + std::to_string(key_index + 1) + " of '" + source.name()
                + "' uses an unsupported pair of ease types ("
                + interpolation_type_name(source.key_out_interpolation(key_index)) + " -> "
                + interpolation_type_name(source.key_in_interpolation(key_index + 1))
                + "), results may be inaccurate";

    EASEPATH_LOG_WARN(kCategory, "{}", d.message);
    return d;
}

// Escapes `text` for a single-quoted JavaScript string literal.
std::string js_single_quoted(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    out += '\'';
    return out;
}

}   // namespace

EasePathConverter::EasePathConverter(const ConvertOptions& options) : options_(options) {}

SegmentCommand EasePathConverter::build_segment(const KeyframeSource& source, int key_index) const
{
    const TweenData tween = compute_tween_data(source, key_index, key_index + 1);
    const EaseType  ease  = classify_ease(source, key_index);
    const Point     end(tween.end_frame, tween.end_value);

    auto diagnostic = check_ease(source, key_index, ease, options_.diagnostics_enabled);

    if (ease == EaseType::LinearLinear)
        return {PathCommand::line_to(end), std::nullopt};

    // Unsupported pairs are still drawn as curves from whatever ease data
    // the host reports.
    Point out = outgoing_control_point(source, tween, key_index);
    Point in  = incoming_control_point(source, tween, key_index);
    return {PathCommand::cubic_to(out, in, end), std::move(diagnostic)};
}

std::optional<PathResult> EasePathConverter::build_path(const KeyframeSource& source) const
{
    const int num_keys = source.num_keys();
    if (num_keys <= 1)
    {
        EASEPATH_LOG_DEBUG(kCategory, "'{}' has {} key(s), skipped", source.name(), num_keys);
        return std::nullopt;
    }

    const double start_frame = source.key_time(1) * source.frame_rate();
    const double start_value = scalar_key_value(source, 1);

    PathResult result;
    result.path = Path(start_frame, start_value);

    for (int i = 1; i < num_keys; ++i)
    {
        auto segment = build_segment(source, i);
        result.path.append(std::move(segment.command));
        if (segment.diagnostic)
            result.diagnostics.push_back(std::move(*segment.diagnostic));
    }

    // CustomEase reads the curve with y pointing down; a rising curve has to
    // be mirrored to keep its perceived direction.
    if (result.path.end_point().y() > start_value)
    {
        if (options_.diagnostics_enabled)
            EASEPATH_LOG_DEBUG(kCategory, "'{}' ends above its start, inverting y", source.name());
        result.path = result.path.inverted_y();
    }

    return result;
}

CurveArrayResult EasePathConverter::build_curve_array(const KeyframeSource& source) const
{
    CurveArrayResult result;
    const int        num_keys = source.num_keys();

    for (int i = 1; i < num_keys; ++i)
    {
        const TweenData tween = compute_tween_data(source, i, i + 1);

        auto diagnostic =
            check_ease(source, i, classify_ease(source, i), options_.diagnostics_enabled);
        if (diagnostic)
            result.diagnostics.push_back(std::move(*diagnostic));

        Point out = outgoing_control_point(source, tween, i);
        Point in  = incoming_control_point(source, tween, i);
        result.curves.push_back(normalize_curve(tween, out, in, options_.clamp_infinite_values));
    }
    return result;
}

std::optional<ConversionResult> EasePathConverter::convert(const KeyframeSource& source) const
{
    ConversionResult result;
    result.property = source.name();

    if (options_.output_mode == OutputMode::NormalizedArray)
    {
        if (source.num_keys() <= 1)
            return std::nullopt;

        auto curves        = build_curve_array(source);
        result.text        = format_curve_array(curves.curves, options_.number_style);
        result.diagnostics = std::move(curves.diagnostics);
    }
    else
    {
        auto path = build_path(source);
        if (!path)
            return std::nullopt;

        result.text        = path->path.to_string(options_.number_style);
        result.diagnostics = std::move(path->diagnostics);
    }

    if (options_.diagnostics_enabled)
        EASEPATH_LOG_DEBUG(kCategory, "'{}' -> {}", result.property, result.text);
    return result;
}

std::vector<ConversionResult> EasePathConverter::convert_selection(
    const std::vector<const KeyframeSource*>& selection) const
{
    std::vector<ConversionResult> results;

    if (selection.empty())
    {
        EASEPATH_LOG_WARN(kCategory, "No properties selected");
        return results;
    }

    // Array output describes a single property's segments.
    size_t count = selection.size();
    if (options_.output_mode == OutputMode::NormalizedArray && count > 1)
    {
        EASEPATH_LOG_INFO(kCategory,
                          "Array output converts only the first property, ignoring {} more",
                          count - 1);
        count = 1;
    }

    for (size_t i = 0; i < count; ++i)
    {
        if (!selection[i])
            continue;
        if (auto converted = convert(*selection[i]))
            results.push_back(std::move(*converted));
    }
    return results;
}

std::string format_curve_array(const std::vector<NormalizedCurve>& curves, NumberStyle style)
{
    std::string out;
    for (size_t i = 0; i < curves.size(); ++i)
    {
        if (i > 0)
            out += ',';
        out += '[';
        out += curves[i].to_string(style);
        out += ']';
    }
    return out;
}

std::string custom_ease_snippet(const std::string& ease_name, const std::string& path)
{
    return "CustomEase.create(" + js_single_quoted(ease_name) + ", " + js_single_quoted(path)
           + ");";
}

}   // namespace easepath
