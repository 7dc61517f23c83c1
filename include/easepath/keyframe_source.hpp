#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace easepath
{

// Keyframe interpolation as reported by the host animation editor.
enum class InterpolationType : uint8_t
{
    Linear,
    Bezier,
    Hold,
};

// Temporal ease of one keyframe side.
struct TemporalEase
{
    double speed     = 0.0;   // value units per second
    double influence = 0.0;   // percent of the segment duration, nominally 0-100
};

// Read-only view of one animatable property's keyframes.
//
// Key indices are 1-based and run from 1 to num_keys(), matching the host
// scripting API. Callers never pass an index outside that range; concrete
// sources may throw std::out_of_range if they do.
class KeyframeSource
{
   public:
    virtual ~KeyframeSource() = default;

    virtual std::string name() const       = 0;
    virtual int         num_keys() const   = 0;
    virtual double      frame_rate() const = 0;   // frames per second

    virtual double key_time(int index) const = 0;   // seconds

    // Value components. Scalar properties carry exactly one.
    virtual std::vector<double> key_value(int index) const = 0;

    virtual InterpolationType key_in_interpolation(int index) const  = 0;
    virtual InterpolationType key_out_interpolation(int index) const = 0;

    // One ease record per value dimension.
    virtual std::vector<TemporalEase> key_in_temporal_ease(int index) const  = 0;
    virtual std::vector<TemporalEase> key_out_temporal_ease(int index) const = 0;
};

// A keyframe held by KeyframeTrack.
struct Keyframe
{
    double                    time  = 0.0;
    std::vector<double>       value = {0.0};
    InterpolationType         in_interp  = InterpolationType::Linear;
    InterpolationType         out_interp = InterpolationType::Linear;
    std::vector<TemporalEase> in_ease    = {TemporalEase{0.0, 16.666667}};
    std::vector<TemporalEase> out_ease   = {TemporalEase{0.0, 16.666667}};
};

// In-memory KeyframeSource. Keyframes are stored in insertion order and are
// expected to be appended in increasing time.
class KeyframeTrack : public KeyframeSource
{
   public:
    KeyframeTrack() = default;
    explicit KeyframeTrack(std::string name, double frame_rate = 30.0);

    void add_keyframe(Keyframe kf);

    // Convenience for scalar keyframes.
    void add_keyframe(double            time,
                      double            value,
                      InterpolationType in_interp,
                      InterpolationType out_interp,
                      TemporalEase      in_ease  = {0.0, 16.666667},
                      TemporalEase      out_ease = {0.0, 16.666667});

    void set_name(const std::string& n) { name_ = n; }
    void set_frame_rate(double fps) { frame_rate_ = fps; }

    const std::vector<Keyframe>& keyframes() const { return keyframes_; }

    // KeyframeSource
    std::string name() const override { return name_; }
    int         num_keys() const override { return static_cast<int>(keyframes_.size()); }
    double      frame_rate() const override { return frame_rate_; }

    double                    key_time(int index) const override;
    std::vector<double>       key_value(int index) const override;
    InterpolationType         key_in_interpolation(int index) const override;
    InterpolationType         key_out_interpolation(int index) const override;
    std::vector<TemporalEase> key_in_temporal_ease(int index) const override;
    std::vector<TemporalEase> key_out_temporal_ease(int index) const override;

   private:
    std::string           name_;
    double                frame_rate_ = 30.0;
    std::vector<Keyframe> keyframes_;

    const Keyframe& at(int index) const;
};

const char* interpolation_type_name(InterpolationType type);

}   // namespace easepath
