#include <easepath/keyframe_source.hpp>
#include <stdexcept>
#include <string>

namespace easepath
{

const char* interpolation_type_name(InterpolationType type)
{
    switch (type)
    {
        case InterpolationType::Linear:
            return "linear";
        case InterpolationType::Bezier:
            return "bezier";
        case InterpolationType::Hold:
            return "hold";
    }
    return "unknown";
}

KeyframeTrack::KeyframeTrack(std::string name, double frame_rate)
    : name_(std::move(name)), frame_rate_(frame_rate)
{
}

void KeyframeTrack::add_keyframe(Keyframe kf)
{
    keyframes_.push_back(std::move(kf));
}

void KeyframeTrack::add_keyframe(double            time,
                                 double            value,
                                 InterpolationType in_interp,
                                 InterpolationType out_interp,
                                 TemporalEase      in_ease,
                                 TemporalEase      out_ease)
{
    Keyframe kf;
    kf.time       = time;
    kf.value      = {value};
    kf.in_interp  = in_interp;
    kf.out_interp = out_interp;
    kf.in_ease    = {in_ease};
    kf.out_ease   = {out_ease};
    keyframes_.push_back(std::move(kf));
}

const Keyframe& KeyframeTrack::at(int index) const
{
    if (index < 1 || index > num_keys())
    {
        throw std::out_of_range("KeyframeTrack '" + name_ + "': key index "
                                + std::to_string(index) + " outside [1, "
                                + std::to_string(num_keys()) + "]");
    }
    return keyframes_[static_cast<size_t>(index - 1)];
}

double KeyframeTrack::key_time(int index) const
{
    return at(index).time;
}

std::vector<double> KeyframeTrack::key_value(int index) const
{
    return at(index).value;
}

InterpolationType KeyframeTrack::key_in_interpolation(int index) const
{
    return at(index).in_interp;
}

InterpolationType KeyframeTrack::key_out_interpolation(int index) const
{
    return at(index).out_interp;
}

std::vector<TemporalEase> KeyframeTrack::key_in_temporal_ease(int index) const
{
    return at(index).in_ease;
}

std::vector<TemporalEase> KeyframeTrack::key_out_temporal_ease(int index) const
{
    return at(index).out_ease;
}

}   // namespace easepath
