#include <easepath/ease.hpp>
#include <stdexcept>
#include <string>

namespace easepath
{

// ─── Tween data ─────────────────────────────────────────────────────────────

double scalar_key_value(const KeyframeSource& source, int index)
{
    auto value = source.key_value(index);
    if (value.empty())
    {
        throw std::invalid_argument("Property '" + source.name() + "' reported an empty value at key "
                                    + std::to_string(index));
    }
    // Multi-dimensional properties (position, scale) collapse to their first
    // component.
    return value.front();
}

TweenData compute_tween_data(const KeyframeSource& source, int start_index, int end_index)
{
    const double fps = source.frame_rate();

    TweenData t;
    t.start_time      = source.key_time(start_index);
    t.end_time        = source.key_time(end_index);
    t.duration_time   = t.end_time - t.start_time;
    t.start_frame     = t.start_time * fps;
    t.end_frame       = t.end_time * fps;
    t.duration_frames = t.end_frame - t.start_frame;
    t.start_value     = scalar_key_value(source, start_index);
    t.end_value       = scalar_key_value(source, end_index);
    return t;
}

// ─── Ease classification ────────────────────────────────────────────────────

EaseType classify_ease(InterpolationType start_out, InterpolationType end_in)
{
    using IT = InterpolationType;

    if (start_out == IT::Linear && end_in == IT::Linear)
        return EaseType::LinearLinear;
    if (start_out == IT::Linear && end_in == IT::Bezier)
        return EaseType::LinearBezier;
    if (start_out == IT::Bezier && end_in == IT::Linear)
        return EaseType::BezierLinear;
    if (start_out == IT::Bezier && end_in == IT::Bezier)
        return EaseType::BezierBezier;
    return EaseType::Unsupported;
}

EaseType classify_ease(const KeyframeSource& source, int key_index)
{
    return classify_ease(source.key_out_interpolation(key_index),
                         source.key_in_interpolation(key_index + 1));
}

const char* ease_type_name(EaseType type)
{
    switch (type)
    {
        case EaseType::LinearLinear:
            return "linear-linear";
        case EaseType::LinearBezier:
            return "linear-bezier";
        case EaseType::BezierLinear:
            return "bezier-linear";
        case EaseType::BezierBezier:
            return "bezier-bezier";
        case EaseType::Unsupported:
            return "unsupported";
    }
    return "unsupported";
}

}   // namespace easepath
