#include <cmath>
#include <easepath/ease.hpp>

namespace easepath
{

double normalize(double value, double min, double max, bool clamp_infinite)
{
    const double delta      = max - min;
    double       normalized = (value - min) / delta;

    if (clamp_infinite && std::isinf(normalized))
        normalized = normalized > 0.0 ? kInfiniteClamp : -kInfiniteClamp;

    return normalized;
}

NormalizedCurve normalize_curve(const TweenData& tween,
                                const Point&     outgoing,
                                const Point&     incoming,
                                bool             clamp_infinite)
{
    NormalizedCurve c;
    c.x1 = normalize(outgoing.x(), tween.start_frame, tween.end_frame, clamp_infinite);
    c.x2 = normalize(incoming.x(), tween.start_frame, tween.end_frame, clamp_infinite);

    if (tween.start_value == tween.end_value)
    {
        // No value change: the y axis has no range, follow x.
        c.y1 = c.x1;
        c.y2 = c.x2;
    }
    else
    {
        c.y1 = normalize(outgoing.y(), tween.start_value, tween.end_value, clamp_infinite);
        c.y2 = normalize(incoming.y(), tween.start_value, tween.end_value, clamp_infinite);
    }
    return c;
}

std::string NormalizedCurve::to_string(NumberStyle style) const
{
    return format_number(x1, 2, style) + "," + format_number(y1, 2, style) + ","
           + format_number(x2, 2, style) + "," + format_number(y2, 2, style);
}

}   // namespace easepath
