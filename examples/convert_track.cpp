#include <easepath/easepath.hpp>
#include <iostream>

using namespace easepath;

// Builds a small opacity animation in memory and prints both output formats.
int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    using IT = InterpolationType;

    KeyframeTrack opacity("Opacity", 30.0);
    opacity.add_keyframe(0.0, 0.0, IT::Linear, IT::Bezier, {0.0, 16.666667}, {0.0, 33.33});
    opacity.add_keyframe(0.8, 100.0, IT::Bezier, IT::Bezier, {0.0, 75.0}, {0.0, 50.0});
    opacity.add_keyframe(1.6, 40.0, IT::Linear, IT::Linear, {-75.0, 16.666667}, {0.0, 16.666667});
    opacity.add_keyframe(2.0, 0.0, IT::Linear, IT::Linear);

    ConvertOptions options;
    options.diagnostics_enabled = true;

    EasePathConverter converter(options);
    if (auto path = converter.convert(opacity))
    {
        std::cout << path->text << "\n";
        std::cout << custom_ease_snippet("opacityEase", path->text) << "\n";
    }

    options.output_mode = OutputMode::NormalizedArray;
    converter.set_options(options);
    if (auto curves = converter.convert(opacity))
        std::cout << curves->text << "\n";

    return 0;
}
