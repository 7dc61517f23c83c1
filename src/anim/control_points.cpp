#include <easepath/ease.hpp>
#include <stdexcept>
#include <string>

namespace easepath
{

namespace
{

// Only the first ease record is used; per-dimension eases of vector
// properties are ignored.
const TemporalEase& first_ease(const std::vector<TemporalEase>& eases,
                               const KeyframeSource&            source,
                               int                              index,
                               const char*                      side)
{
    if (eases.empty())
    {
        throw std::invalid_argument("Property '" + source.name() + "' reported no " + side
                                    + " temporal ease at key " + std::to_string(index));
    }
    return eases.front();
}

}   // namespace

Point outgoing_control_point(const TweenData& tween, const TemporalEase& ease, double frame_rate)
{
    const double slope = ease.speed / frame_rate;
    const double dx    = tween.duration_frames * (ease.influence / 100.0);
    return Point(tween.start_frame + dx, tween.start_value + slope * dx);
}

Point incoming_control_point(const TweenData& tween, const TemporalEase& ease, double frame_rate)
{
    // The handle extends backwards in time from the end key, hence the
    // negated slope.
    const double slope = -ease.speed / frame_rate;
    const double dx    = tween.duration_frames * (ease.influence / 100.0);
    return Point(tween.end_frame - dx, tween.end_value + slope * dx);
}

Point outgoing_control_point(const KeyframeSource& source, const TweenData& tween, int key_index)
{
    auto eases = source.key_out_temporal_ease(key_index);
    return outgoing_control_point(tween,
                                  first_ease(eases, source, key_index, "outgoing"),
                                  source.frame_rate());
}

Point incoming_control_point(const KeyframeSource& source, const TweenData& tween, int key_index)
{
    auto eases = source.key_in_temporal_ease(key_index + 1);
    return incoming_control_point(tween,
                                  first_ease(eases, source, key_index + 1, "incoming"),
                                  source.frame_rate());
}

}   // namespace easepath
