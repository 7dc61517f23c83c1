#include "cli.hpp"

#include "../io/track_loader.hpp"

#include <cstdlib>
#include <easepath/converter.hpp>
#include <easepath/logger.hpp>
#include <iostream>
#include <ostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

constexpr const char* kCategory = "cli";

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] track.csv...\n"
              << "\n"
              << "Converts keyframe eases into a CustomEase path, one line per track.\n"
              << "\n"
              << "Options:\n"
              << "  --fps N          Composition frame rate (default 30)\n"
              << "  --array          Output normalized [x1,y1,x2,y2] groups for the first track\n"
              << "  --no-clamp       Keep infinite normalized values instead of clamping to +/-10\n"
              << "  --compact        Drop trailing zeros from numbers\n"
              << "  --snippet NAME   Print a CustomEase.create('NAME', ...) line instead\n"
              << "  --debug          Log per-segment classification\n"
              << "  --log FILE       Also append log output to FILE\n"
              << "  --log-level LVL  trace, debug, info, warn, error, critical\n"
              << "  -h, --help       Show this help\n";
}

struct CliArgs
{
    easepath::ConvertOptions options;
    double                   fps = 30.0;
    std::string              snippet_name;
    std::string              log_file;
    std::string              log_level;
    std::vector<std::string> files;
    bool                     help = false;
};

// Returns false on a malformed command line.
bool parse_args(int argc, char* argv[], CliArgs& args)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        auto        next = [&](std::string& out) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            args.help = true;
        }
        else if (arg == "--fps")
        {
            std::string value;
            if (!next(value))
                return false;
            char* end = nullptr;
            args.fps  = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || !(args.fps > 0.0))
            {
                std::cerr << "Invalid frame rate: " << value << "\n";
                return false;
            }
        }
        else if (arg == "--array")
        {
            args.options.output_mode = easepath::OutputMode::NormalizedArray;
        }
        else if (arg == "--no-clamp")
        {
            args.options.clamp_infinite_values = false;
        }
        else if (arg == "--compact")
        {
            args.options.number_style = easepath::NumberStyle::Compact;
        }
        else if (arg == "--debug")
        {
            args.options.diagnostics_enabled = true;
        }
        else if (arg == "--snippet")
        {
            if (!next(args.snippet_name))
                return false;
        }
        else if (arg == "--log")
        {
            if (!next(args.log_file))
                return false;
        }
        else if (arg == "--log-level")
        {
            if (!next(args.log_level))
                return false;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else
        {
            args.files.push_back(arg);
        }
    }
    return true;
}

}   // anonymous namespace

namespace easepath::cli
{

int run(int argc, char* argv[], std::ostream& out)
{
    CliArgs args;
    if (!parse_args(argc, argv, args))
    {
        print_usage(argv[0]);
        return kExitError;
    }
    if (args.help)
    {
        print_usage(argv[0]);
        return kExitOk;
    }

    auto& logger = easepath::Logger::instance();
    logger.clear_sinks();
    logger.set_level(easepath::LogLevel::Info);
    logger.add_sink(easepath::sinks::stderr_sink());
    if (!args.log_file.empty())
        logger.add_sink(easepath::sinks::file_sink(args.log_file));

    if (args.options.diagnostics_enabled)
        logger.set_level(easepath::LogLevel::Debug);
    if (!args.log_level.empty())
    {
        auto level = easepath::Logger::level_from_string(args.log_level);
        if (!level)
        {
            std::cerr << "Unknown log level: " << args.log_level << "\n";
            return kExitError;
        }
        logger.set_level(*level);
    }

    if (args.files.empty())
    {
        EASEPATH_LOG_WARN(kCategory, "Please select at least one track file");
        print_usage(argv[0]);
        return kExitNoSelection;
    }

    std::vector<std::unique_ptr<easepath::KeyframeTrack>> tracks;
    for (const auto& file : args.files)
    {
        auto loaded = easepath::load_track_csv(file, args.fps);
        if (!loaded.ok())
        {
            EASEPATH_LOG_ERROR(kCategory, "{}: {}", file, loaded.error);
            return kExitError;
        }
        tracks.push_back(std::make_unique<easepath::KeyframeTrack>(std::move(loaded.track)));
    }

    std::vector<const easepath::KeyframeSource*> selection;
    for (const auto& t : tracks)
        selection.push_back(t.get());

    easepath::EasePathConverter converter(args.options);
    auto                        results = converter.convert_selection(selection);

    for (const auto& r : results)
    {
        if (!args.snippet_name.empty())
            out << easepath::custom_ease_snippet(args.snippet_name, r.text) << "\n";
        else
            out << r.text << "\n";

        if (!r.diagnostics.empty())
            EASEPATH_LOG_INFO(kCategory,
                              "'{}': {} segment(s) approximated",
                              r.property,
                              r.diagnostics.size());
    }

    if (results.empty())
        EASEPATH_LOG_INFO(kCategory, "No track had more than one keyframe, nothing to convert");

    return kExitOk;
}

}   // namespace easepath::cli
