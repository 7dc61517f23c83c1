#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace easepath
{

// ─── Number formatting ──────────────────────────────────────────────────────

enum class NumberStyle : uint8_t
{
    Fixed,     // Always `decimals` digits: 8.0000
    Compact,   // Rounded, trailing zeros dropped: 8, 2.6667
};

// Round `value` to `decimals` places and print it. Rounded zero is printed
// unsigned; non-finite values print as Infinity / -Infinity / NaN.
std::string format_number(double value, int decimals, NumberStyle style = NumberStyle::Fixed);

// ─── Point ──────────────────────────────────────────────────────────────────

// Immutable 2D coordinate. Holds (frame, value) before normalization and
// unit-interval coordinates after.
class Point
{
   public:
    constexpr Point() = default;
    constexpr Point(double x, double y) : x_(x), y_(y) {}

    constexpr double x() const { return x_; }
    constexpr double y() const { return y_; }

    constexpr Point with_inverted_y() const { return Point(x_, -y_); }

    // "x,y" with each coordinate rounded to `decimals` places.
    std::string to_string(int decimals = 4, NumberStyle style = NumberStyle::Fixed) const;

    constexpr bool operator==(const Point& other) const = default;

   private:
    double x_ = 0.0;
    double y_ = 0.0;
};

// ─── PathCommand ────────────────────────────────────────────────────────────

// A single SVG drawing instruction. MoveTo and LineTo carry one point;
// CubicCurveTo carries (outgoing control, incoming control, end anchor).
class PathCommand
{
   public:
    enum class Kind : uint8_t
    {
        MoveTo,
        LineTo,
        CubicCurveTo,
    };

    // Throws std::invalid_argument when the point count does not match `kind`.
    PathCommand(Kind kind, std::vector<Point> points);

    // Builds the points from flat x,y pairs. Throws std::invalid_argument on an
    // odd coordinate count or a point count that does not match `kind`.
    PathCommand(Kind kind, std::initializer_list<double> coordinates);

    static PathCommand move_to(const Point& p);
    static PathCommand line_to(const Point& p);
    static PathCommand cubic_to(const Point& out_control,
                                const Point& in_control,
                                const Point& end);

    Kind                      kind() const { return kind_; }
    const std::vector<Point>& points() const { return points_; }
    const Point&              end_point() const { return points_.back(); }

    PathCommand with_inverted_y() const;

    std::string to_string(NumberStyle style = NumberStyle::Fixed) const;

    bool operator==(const PathCommand& other) const = default;

   private:
    Kind               kind_;
    std::vector<Point> points_;
};

// Single-letter SVG tag for a command kind: M, L or C.
char command_tag(PathCommand::Kind kind);

// Number of points a command of `kind` must carry.
size_t expected_point_count(PathCommand::Kind kind);

// ─── Path ───────────────────────────────────────────────────────────────────

// Ordered sequence of commands describing one property's easing curve.
class Path
{
   public:
    Path() = default;

    // Seeds the path with a MoveTo at (start_x, start_y).
    Path(double start_x, double start_y);

    void append(PathCommand command);

    const std::vector<PathCommand>& commands() const { return commands_; }
    size_t                          size() const { return commands_.size(); }
    bool                            empty() const { return commands_.empty(); }

    // First point of the first command / last point of the last command.
    // Throws std::logic_error on an empty path.
    const Point& start_point() const;
    const Point& end_point() const;

    // Copy of this path with every y coordinate negated. Applying it twice
    // yields an equal path.
    Path inverted_y() const;

    // Concatenated command strings, e.g. "M0.0000,0.0000C8.0000,2.6667,...".
    std::string to_string(NumberStyle style = NumberStyle::Fixed) const;

    bool operator==(const Path& other) const = default;

   private:
    std::vector<PathCommand> commands_;
};

}   // namespace easepath
