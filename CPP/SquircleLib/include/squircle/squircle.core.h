/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Core structures for squircle (smoothed corner) rectangles      *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_CORE_H_
#define SQUIRCLE_CORE_H_

#include <array>
#include <cmath>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "squircle.version.h"

#define SQUIRCLE_THROW(exception) throw exception

namespace SquircleLib
{

  class SquircleException : public std::exception {
  public:
    explicit SquircleException(const char* description) :
      m_descr(description) {}
    virtual const char* what() const noexcept override { return m_descr.c_str(); }
  private:
    std::string m_descr;
  };

  static const double PI = 3.141592653589793238;
  static const double MAX_DBL = (std::numeric_limits<double>::max)();

  // error codes (2^n)
  const int range_error_i = 1;      // non-finite dimension, radius or smoothing
  const int undefined_error_i = 32; // unexpected internal failure

  static const char* range_error =
    "Non-finite width, height, radius or smoothing value";
  static const char* undefined_error =
    "There is an undefined error in SquircleLib";

  inline void DoError([[maybe_unused]] int error_code)
  {
#if (defined(__cpp_exceptions) && __cpp_exceptions) || (defined(__EXCEPTIONS) && __EXCEPTIONS)
    switch (error_code)
    {
    case range_error_i:
      SQUIRCLE_THROW(SquircleException(range_error));
    default:
      SQUIRCLE_THROW(SquircleException(undefined_error));
    }
#endif
  }

  inline double ToRadians(double degrees)
  {
    return degrees * PI / 180.0;
  }

  // Point ------------------------------------------------------------------------

  template <typename T>
  struct Point {
    T x;
    T y;

    Point() : x(0), y(0) {}
    Point(const T x_, const T y_) : x(x_), y(y_) {}

    Point operator+(const Point& b) const { return Point(x + b.x, y + b.y); }
    Point operator-(const Point& b) const { return Point(x - b.x, y - b.y); }
    Point& operator+=(const Point& b) { x += b.x; y += b.y; return *this; }

    friend bool operator==(const Point& a, const Point& b)
    {
      return a.x == b.x && a.y == b.y;
    }

    friend bool operator!=(const Point& a, const Point& b)
    {
      return !(a == b);
    }

    friend std::ostream& operator<<(std::ostream& os, const Point& point)
    {
      os << point.x << "," << point.y << " ";
      return os;
    }
  };

  using PointD = Point<double>;

  template <typename T>
  using Path = std::vector<Point<T>>;
  using PathD = Path<double>;

  template <typename T>
  std::ostream& operator<<(std::ostream& outstream, const Path<T>& path)
  {
    if (!path.empty())
    {
      auto pt = path.cbegin(), last = path.cend() - 1;
      while (pt != last)
        outstream << *pt++ << ", ";
      outstream << *last << std::endl;
    }
    return outstream;
  }

  // Rect -------------------------------------------------------------------------

  template <typename T>
  struct Rect {
    T left;
    T top;
    T right;
    T bottom;

    Rect(T l, T t, T r, T b) : left(l), top(t), right(r), bottom(b) {}
    Rect() : left(0), top(0), right(0), bottom(0) {}

    T Width() const { return right - left; }
    T Height() const { return bottom - top; }
    bool IsEmpty() const { return bottom <= top || right <= left; }

    friend std::ostream& operator<<(std::ostream& os, const Rect<T>& rect)
    {
      os << "(" << rect.left << "," << rect.top << "," << rect.right << ","
        << rect.bottom << ") ";
      return os;
    }
  };

  using RectD = Rect<double>;

  // Corners ----------------------------------------------------------------------

  enum class Corner { TopLeft, TopRight, BottomLeft, BottomRight };
  enum class Side { Top, Left, Right, Bottom };

  static const std::array<Corner, 4> all_corners = {
    Corner::TopLeft, Corner::TopRight, Corner::BottomLeft, Corner::BottomRight };

  struct Adjacent {
    Corner corner;
    Side side;
  };

  // the two corners that share a side with 'corner'
  inline std::pair<Adjacent, Adjacent> GetAdjacents(Corner corner)
  {
    static const std::pair<Adjacent, Adjacent> adjacents[4] = {
      { {Corner::TopRight, Side::Top}, {Corner::BottomLeft, Side::Left} },
      { {Corner::TopLeft, Side::Top}, {Corner::BottomRight, Side::Right} },
      { {Corner::BottomRight, Side::Bottom}, {Corner::TopLeft, Side::Left} },
      { {Corner::BottomLeft, Side::Bottom}, {Corner::TopRight, Side::Right} }
    };
    return adjacents[static_cast<size_t>(corner)];
  }

  inline const char* CornerName(Corner corner)
  {
    switch (corner)
    {
    case Corner::TopLeft: return "TopLeft";
    case Corner::TopRight: return "TopRight";
    case Corner::BottomLeft: return "BottomLeft";
    default: return "BottomRight";
    }
  }

  inline std::ostream& operator<<(std::ostream& os, Corner corner)
  {
    return os << CornerName(corner);
  }

  // A fixed mapping from the four corners to a value of type T
  template <typename T>
  struct CornerMap {
    T top_left{};
    T top_right{};
    T bottom_left{};
    T bottom_right{};

    CornerMap() = default;
    explicit CornerMap(const T& value) :
      top_left(value), top_right(value), bottom_left(value), bottom_right(value) {}
    CornerMap(const T& tl, const T& tr, const T& bl, const T& br) :
      top_left(tl), top_right(tr), bottom_left(bl), bottom_right(br) {}

    T& operator[](Corner corner)
    {
      switch (corner)
      {
      case Corner::TopLeft: return top_left;
      case Corner::TopRight: return top_right;
      case Corner::BottomLeft: return bottom_left;
      default: return bottom_right;
      }
    }

    const T& operator[](Corner corner) const
    {
      switch (corner)
      {
      case Corner::TopLeft: return top_left;
      case Corner::TopRight: return top_right;
      case Corner::BottomLeft: return bottom_left;
      default: return bottom_right;
      }
    }
  };

  struct RoundedRect {
    double width = 0.0;
    double height = 0.0;
    CornerMap<double> radii;

    RoundedRect() = default;
    RoundedRect(double w, double h, const CornerMap<double>& r) :
      width(w), height(h), radii(r) {}

    double SideLength(Side side) const
    {
      return (side == Side::Top || side == Side::Bottom) ? width : height;
    }
  };

  struct NormalizedCorner {
    double radius = 0.0;
    double rounding_and_smoothing_budget = 0.0;
  };

  using NormalizedCorners = CornerMap<NormalizedCorner>;

  // Distances along one side of a corner, named after figure 11.1 of
  // "Desperately seeking squircles" (figma.com/blog):
  //   a, b : the two outer cubic control distances (P1-P2, P2-P3)
  //   c, d : the inner control offsets either side of the arc (P3-P4)
  //   p    : the full length of the side consumed by the corner
  struct CornerPathParams {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double p = 0.0;
    double corner_radius = 0.0;
    double arc_section_length = 0.0;
  };

  using CornerPathParamsMap = CornerMap<CornerPathParams>;

  // Path commands ----------------------------------------------------------------

  enum class PathCmdType { MoveTo, LineTo, CubicTo, ArcTo, Close };

  struct PathCmd {
    PathCmdType type = PathCmdType::Close;
    bool relative = false;
    PointD pt;        // end point (a delta when relative)
    PointD ctrl1;     // CubicTo only
    PointD ctrl2;     // CubicTo only
    double rx = 0.0;  // ArcTo only
    double ry = 0.0;
    double x_axis_rotation = 0.0;
    bool large_arc = false;
    bool sweep = false;

    static PathCmd MoveTo(double x, double y)
    {
      PathCmd cmd;
      cmd.type = PathCmdType::MoveTo;
      cmd.pt = PointD(x, y);
      return cmd;
    }

    static PathCmd LineTo(double x, double y, bool rel = false)
    {
      PathCmd cmd;
      cmd.type = PathCmdType::LineTo;
      cmd.relative = rel;
      cmd.pt = PointD(x, y);
      return cmd;
    }

    static PathCmd CubicTo(const PointD& c1, const PointD& c2,
      const PointD& end, bool rel = false)
    {
      PathCmd cmd;
      cmd.type = PathCmdType::CubicTo;
      cmd.relative = rel;
      cmd.ctrl1 = c1;
      cmd.ctrl2 = c2;
      cmd.pt = end;
      return cmd;
    }

    static PathCmd ArcTo(double rx, double ry, double rotation,
      bool large_arc, bool sweep, const PointD& end, bool rel = false)
    {
      PathCmd cmd;
      cmd.type = PathCmdType::ArcTo;
      cmd.relative = rel;
      cmd.rx = rx;
      cmd.ry = ry;
      cmd.x_axis_rotation = rotation;
      cmd.large_arc = large_arc;
      cmd.sweep = sweep;
      cmd.pt = end;
      return cmd;
    }

    static PathCmd Close()
    {
      return PathCmd();
    }
  };

  using PathCmds = std::vector<PathCmd>;

  inline char CmdLetter(const PathCmd& cmd)
  {
    switch (cmd.type)
    {
    case PathCmdType::MoveTo: return cmd.relative ? 'm' : 'M';
    case PathCmdType::LineTo: return cmd.relative ? 'l' : 'L';
    case PathCmdType::CubicTo: return cmd.relative ? 'c' : 'C';
    case PathCmdType::ArcTo: return cmd.relative ? 'a' : 'A';
    default: return 'Z';
    }
  }

  inline std::ostream& operator<<(std::ostream& os, const PathCmd& cmd)
  {
    os << CmdLetter(cmd);
    switch (cmd.type)
    {
    case PathCmdType::CubicTo:
      os << " " << cmd.ctrl1 << cmd.ctrl2 << cmd.pt;
      break;
    case PathCmdType::ArcTo:
      os << " " << cmd.rx << "," << cmd.ry << " " << cmd.x_axis_rotation << " "
        << cmd.large_arc << " " << cmd.sweep << " " << cmd.pt;
      break;
    case PathCmdType::Close:
      os << " ";
      break;
    default:
      os << " " << cmd.pt;
      break;
    }
    return os;
  }

  inline std::ostream& operator<<(std::ostream& os, const PathCmds& cmds)
  {
    for (const PathCmd& cmd : cmds) os << cmd;
    return os;
  }

}  // namespace SquircleLib

#endif  // SQUIRCLE_CORE_H_
