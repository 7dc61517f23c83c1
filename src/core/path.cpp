#include <cmath>
#include <cstdio>
#include <easepath/path.hpp>
#include <stdexcept>
#include <string>

namespace easepath
{

// ─── Number formatting ──────────────────────────────────────────────────────

namespace
{
constexpr double kMaxExactInteger = 9007199254740992.0;   // 2^53
}   // namespace

std::string format_number(double value, int decimals, NumberStyle style)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0.0 ? "Infinity" : "-Infinity";

    // Above 2^53 every double is already an integer, and value * scale may
    // overflow to inf.
    const double scale   = std::pow(10.0, decimals);
    const double scaled  = value * scale;
    double       rounded = value;
    if (std::isfinite(scaled) && std::abs(scaled) <= kMaxExactInteger)
        rounded = std::round(scaled) / scale;
    if (rounded == 0.0)
        rounded = 0.0;   // drops the sign of -0.0

    const int   len = std::snprintf(nullptr, 0, "%.*f", decimals, rounded);
    std::string out(static_cast<size_t>(len), '\0');
    std::snprintf(out.data(), out.size() + 1, "%.*f", decimals, rounded);

    if (style == NumberStyle::Compact && out.find('.') != std::string::npos)
    {
        while (out.back() == '0')
            out.pop_back();
        if (out.back() == '.')
            out.pop_back();
    }
    return out;
}

// ─── Point ──────────────────────────────────────────────────────────────────

std::string Point::to_string(int decimals, NumberStyle style) const
{
    return format_number(x_, decimals, style) + "," + format_number(y_, decimals, style);
}

// ─── PathCommand ────────────────────────────────────────────────────────────

char command_tag(PathCommand::Kind kind)
{
    switch (kind)
    {
        case PathCommand::Kind::MoveTo:
            return 'M';
        case PathCommand::Kind::LineTo:
            return 'L';
        case PathCommand::Kind::CubicCurveTo:
            return 'C';
    }
    return '?';
}

size_t expected_point_count(PathCommand::Kind kind)
{
    return kind == PathCommand::Kind::CubicCurveTo ? 3 : 1;
}

namespace
{

std::vector<Point> points_from_coordinates(std::initializer_list<double> coordinates)
{
    if (coordinates.size() % 2 != 0)
    {
        throw std::invalid_argument(
            "PathCommand requires an even number of coordinates, got "
            + std::to_string(coordinates.size()));
    }

    std::vector<Point> points;
    points.reserve(coordinates.size() / 2);
    for (auto it = coordinates.begin(); it != coordinates.end(); it += 2)
        points.emplace_back(*it, *(it + 1));
    return points;
}

}   // namespace

PathCommand::PathCommand(Kind kind, std::vector<Point> points)
    : kind_(kind), points_(std::move(points))
{
    if (points_.size() != expected_point_count(kind_))
    {
        throw std::invalid_argument(std::string("PathCommand '") + command_tag(kind_)
                                    + "' expects " + std::to_string(expected_point_count(kind_))
                                    + " point(s), got " + std::to_string(points_.size()));
    }
}

PathCommand::PathCommand(Kind kind, std::initializer_list<double> coordinates)
    : PathCommand(kind, points_from_coordinates(coordinates))
{
}

PathCommand PathCommand::move_to(const Point& p)
{
    return PathCommand(Kind::MoveTo, std::vector<Point>{p});
}

PathCommand PathCommand::line_to(const Point& p)
{
    return PathCommand(Kind::LineTo, std::vector<Point>{p});
}

PathCommand PathCommand::cubic_to(const Point& out_control,
                                  const Point& in_control,
                                  const Point& end)
{
    return PathCommand(Kind::CubicCurveTo, std::vector<Point>{out_control, in_control, end});
}

PathCommand PathCommand::with_inverted_y() const
{
    std::vector<Point> flipped;
    flipped.reserve(points_.size());
    for (const auto& p : points_)
        flipped.push_back(p.with_inverted_y());
    return PathCommand(kind_, std::move(flipped));
}

std::string PathCommand::to_string(NumberStyle style) const
{
    std::string out(1, command_tag(kind_));
    for (size_t i = 0; i < points_.size(); ++i)
    {
        if (i > 0)
            out += ',';
        out += points_[i].to_string(4, style);
    }
    return out;
}

// ─── Path ───────────────────────────────────────────────────────────────────

Path::Path(double start_x, double start_y)
{
    commands_.push_back(PathCommand::move_to(Point(start_x, start_y)));
}

void Path::append(PathCommand command)
{
    commands_.push_back(std::move(command));
}

const Point& Path::start_point() const
{
    if (commands_.empty())
        throw std::logic_error("Path::start_point on an empty path");
    return commands_.front().points().front();
}

const Point& Path::end_point() const
{
    if (commands_.empty())
        throw std::logic_error("Path::end_point on an empty path");
    return commands_.back().end_point();
}

Path Path::inverted_y() const
{
    Path flipped;
    flipped.commands_.reserve(commands_.size());
    for (const auto& cmd : commands_)
        flipped.commands_.push_back(cmd.with_inverted_y());
    return flipped;
}

std::string Path::to_string(NumberStyle style) const
{
    std::string out;
    for (const auto& cmd : commands_)
        out += cmd.to_string(style);
    return out;
}

}   // namespace easepath
