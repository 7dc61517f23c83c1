#include "track_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <easepath/logger.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace easepath
{

namespace
{

constexpr const char* kCategory           = "loader";
constexpr int         kMaxValueComponents = 4;   // x, y, z, w

// Default ease the host assigns to a freshly created keyframe.
constexpr TemporalEase kDefaultEase{0.0, 16.666667};

std::string to_lower(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void trim(std::string& field)
{
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.front())))
        field.erase(field.begin());
    while (!field.empty() && std::isspace(static_cast<unsigned char>(field.back())))
        field.pop_back();
}

// Detect delimiter by scanning the header line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

// Parse the whole string as a double, ignoring surrounding whitespace.
bool try_parse_double(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char*  end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (end == s.c_str() || (end && *end != '\0'))
        return false;
    out = val;
    return true;
}

// Split a line by delimiter, respecting quoted fields.
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;

    for (char c : line)
    {
        if (c == '"')
        {
            in_quotes = !in_quotes;
        }
        else if (c == delim && !in_quotes)
        {
            trim(field);
            fields.push_back(field);
            field.clear();
        }
        else
        {
            field += c;
        }
    }
    trim(field);
    fields.push_back(field);
    return fields;
}

// Column positions resolved from the header row. -1 means absent.
struct ColumnMap
{
    int              time          = -1;
    std::vector<int> value;   // value, value2, value3 ...
    int              in_type       = -1;
    int              out_type      = -1;
    int              in_speed      = -1;
    int              in_influence  = -1;
    int              out_speed     = -1;
    int              out_influence = -1;
    std::string      error;
};

ColumnMap map_columns(const std::vector<std::string>& headers)
{
    ColumnMap        map;
    std::map<int, int> components;   // component number -> column

    for (size_t i = 0; i < headers.size(); ++i)
    {
        const std::string h   = to_lower(headers[i]);
        const int         col = static_cast<int>(i);

        if (h == "time")
            map.time = col;
        else if (h == "value")
            components[1] = col;
        else if (h.rfind("value", 0) == 0 && h.size() > 5
                 && std::all_of(h.begin() + 5, h.end(), [](unsigned char c) { return std::isdigit(c); }))
        {
            int         component = 0;
            const char* first     = h.data() + 5;
            const char* last      = h.data() + h.size();
            auto [ptr, ec]        = std::from_chars(first, last, component);
            if (ec != std::errc() || ptr != last || component < 1 || component > kMaxValueComponents)
            {
                map.error = "Column '" + headers[i] + "' must be value1..value"
                            + std::to_string(kMaxValueComponents);
                return map;
            }
            components[component] = col;
        }
        else if (h == "in_type")
            map.in_type = col;
        else if (h == "out_type")
            map.out_type = col;
        else if (h == "in_speed")
            map.in_speed = col;
        else if (h == "in_influence")
            map.in_influence = col;
        else if (h == "out_speed")
            map.out_speed = col;
        else if (h == "out_influence")
            map.out_influence = col;
        else
            EASEPATH_LOG_DEBUG(kCategory, "ignoring column '{}'", headers[i]);
    }

    for (const auto& [component, column] : components)
        map.value.push_back(column);
    return map;
}

const std::string& field_at(const std::vector<std::string>& fields, int col)
{
    static const std::string empty;
    if (col < 0 || static_cast<size_t>(col) >= fields.size())
        return empty;
    return fields[static_cast<size_t>(col)];
}

// Reads an optional numeric column. Absent or blank yields `fallback`.
bool read_number(const std::vector<std::string>& fields,
                 int                             col,
                 double                          fallback,
                 double&                         out)
{
    const std::string& f = field_at(fields, col);
    if (f.empty())
    {
        out = fallback;
        return true;
    }
    return try_parse_double(f, out);
}

bool read_interp(const std::vector<std::string>& fields, int col, InterpolationType& out)
{
    const std::string& f = field_at(fields, col);
    if (f.empty())
    {
        out = InterpolationType::Linear;
        return true;
    }
    auto parsed = parse_interpolation_type(f);
    if (!parsed)
        return false;
    out = *parsed;
    return true;
}

}   // namespace

std::optional<InterpolationType> parse_interpolation_type(const std::string& name)
{
    std::string lower = to_lower(name);
    trim(lower);
    if (lower == "linear")
        return InterpolationType::Linear;
    if (lower == "bezier")
        return InterpolationType::Bezier;
    if (lower == "hold")
        return InterpolationType::Hold;
    return std::nullopt;
}

TrackLoadResult parse_track_csv(const std::string& text, const std::string& name, double frame_rate)
{
    TrackLoadResult result;
    result.track = KeyframeTrack(name, frame_rate);

    if (!(frame_rate > 0.0))
    {
        result.error = "Frame rate must be positive";
        return result;
    }

    std::vector<std::string> lines;
    std::istringstream       in(text);
    std::string              line;
    while (std::getline(in, line))
    {
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        std::string probe = line;
        trim(probe);
        if (!probe.empty() && probe.front() != '#')
            lines.push_back(line);
    }

    if (lines.empty())
    {
        result.error = "File is empty";
        return result;
    }

    const char delim   = detect_delimiter(lines[0]);
    const auto columns = map_columns(split_line(lines[0], delim));

    if (!columns.error.empty())
    {
        result.error = columns.error;
        return result;
    }

    if (columns.time < 0 || columns.value.empty())
    {
        result.error = "Header must name 'time' and 'value' columns";
        return result;
    }

    double last_time = 0.0;
    for (size_t row = 1; row < lines.size(); ++row)
    {
        const auto        fields = split_line(lines[row], delim);
        const std::string where  = "Line " + std::to_string(row + 1) + ": ";

        Keyframe kf;
        if (!try_parse_double(field_at(fields, columns.time), kf.time))
        {
            result.error = where + "invalid time '" + field_at(fields, columns.time) + "'";
            return result;
        }
        if (row > 1 && kf.time < last_time)
        {
            result.error = where + "keys must be listed in increasing time";
            return result;
        }
        last_time = kf.time;

        kf.value.clear();
        for (int col : columns.value)
        {
            double v = 0.0;
            if (!try_parse_double(field_at(fields, col), v))
            {
                result.error = where + "invalid value '" + field_at(fields, col) + "'";
                return result;
            }
            kf.value.push_back(v);
        }

        if (!read_interp(fields, columns.in_type, kf.in_interp)
            || !read_interp(fields, columns.out_type, kf.out_interp))
        {
            result.error = where + "unknown interpolation type";
            return result;
        }

        TemporalEase in_ease, out_ease;
        if (!read_number(fields, columns.in_speed, kDefaultEase.speed, in_ease.speed)
            || !read_number(fields, columns.in_influence, kDefaultEase.influence, in_ease.influence)
            || !read_number(fields, columns.out_speed, kDefaultEase.speed, out_ease.speed)
            || !read_number(
                fields, columns.out_influence, kDefaultEase.influence, out_ease.influence))
        {
            result.error = where + "invalid ease value";
            return result;
        }
        kf.in_ease  = {in_ease};
        kf.out_ease = {out_ease};

        result.track.add_keyframe(std::move(kf));
    }

    EASEPATH_LOG_DEBUG(kCategory,
                       "parsed '{}': {} key(s), {} value component(s)",
                       name,
                       result.track.num_keys(),
                       columns.value.size());
    return result;
}

TrackLoadResult load_track_csv(const std::string& path, double frame_rate)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        TrackLoadResult result;
        result.error = "Cannot open file: " + path;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_track_csv(buffer.str(), std::filesystem::path(path).stem().string(), frame_rate);
}

}   // namespace easepath
