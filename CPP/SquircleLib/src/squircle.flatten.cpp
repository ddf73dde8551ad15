/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Convert squircle path commands into polygons                    *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#include <algorithm>

#include "squircle/squircle.flatten.h"

namespace SquircleLib {

const double floating_point_tolerance = 1e-12;

// When the user doesn't define an arc tolerance, 1/500th of the curve's size
// generally gives smooth results without excessively short segments.
const double arc_const = 0.002;

// limits the subdivision of a cubic to 2^16 segments
const int max_cubic_depth = 16;

inline double Hypot(double x, double y)
{
  return std::sqrt(x * x + y * y);
}

inline void AddVertex(PathD& path, const PointD& pt)
{
  if (path.empty() || path.back() != pt) path.push_back(pt);
}

PathCmds MakeAbsolute(const PathCmds& cmds)
{
  PathCmds result;
  result.reserve(cmds.size());
  PointD curr, start;
  for (PathCmd cmd : cmds)
  {
    if (cmd.relative)
    {
      cmd.pt += curr;
      if (cmd.type == PathCmdType::CubicTo)
      {
        cmd.ctrl1 += curr;
        cmd.ctrl2 += curr;
      }
      cmd.relative = false;
    }

    if (cmd.type == PathCmdType::Close)
      curr = start;
    else
      curr = cmd.pt;
    if (cmd.type == PathCmdType::MoveTo) start = curr;
    result.push_back(cmd);
  }
  return result;
}

PointD GetEndPoint(const PathCmds& cmds)
{
  PointD result;
  for (const PathCmd& cmd : MakeAbsolute(cmds))
    if (cmd.type != PathCmdType::Close) result = cmd.pt;
  return result;
}

//------------------------------------------------------------------------------
// Curve flattening
//------------------------------------------------------------------------------

static double DistanceFromLine(const PointD& pt, const PointD& ln1,
  const PointD& ln2)
{
  double dx = ln2.x - ln1.x, dy = ln2.y - ln1.y;
  double len = Hypot(dx, dy);
  if (len < floating_point_tolerance)
    return Hypot(pt.x - ln1.x, pt.y - ln1.y);
  return std::fabs((pt.x - ln1.x) * dy - (pt.y - ln1.y) * dx) / len;
}

static void FlattenCubic(PathD& path, const PointD& p1, const PointD& p2,
  const PointD& p3, const PointD& p4, double tolerance, int depth)
{
  if (depth >= max_cubic_depth ||
    (DistanceFromLine(p2, p1, p4) <= tolerance &&
      DistanceFromLine(p3, p1, p4) <= tolerance))
  {
    AddVertex(path, p4);
    return;
  }

  // de Casteljau split at t = 0.5
  PointD p12((p1.x + p2.x) * 0.5, (p1.y + p2.y) * 0.5);
  PointD p23((p2.x + p3.x) * 0.5, (p2.y + p3.y) * 0.5);
  PointD p34((p3.x + p4.x) * 0.5, (p3.y + p4.y) * 0.5);
  PointD p123((p12.x + p23.x) * 0.5, (p12.y + p23.y) * 0.5);
  PointD p234((p23.x + p34.x) * 0.5, (p23.y + p34.y) * 0.5);
  PointD mid((p123.x + p234.x) * 0.5, (p123.y + p234.y) * 0.5);
  FlattenCubic(path, p1, p12, p123, mid, tolerance, depth + 1);
  FlattenCubic(path, mid, p234, p34, p4, tolerance, depth + 1);
}

static double CubicTolerance(const PointD& p1, const PointD& p2,
  const PointD& p3, const PointD& p4, double arc_tolerance)
{
  if (arc_tolerance > floating_point_tolerance) return arc_tolerance;
  double size = Hypot(p2.x - p1.x, p2.y - p1.y) +
    Hypot(p3.x - p2.x, p3.y - p2.y) + Hypot(p4.x - p3.x, p4.y - p3.y);
  return std::max(size * arc_const, floating_point_tolerance);
}

// Only circular arcs without rotation are drawn by this library, so rx is
// used for the radius and ry and x_axis_rotation are ignored.
static void FlattenArc(PathD& path, const PointD& pt1, const PathCmd& cmd,
  double arc_tolerance)
{
  const PointD& pt2 = cmd.pt;
  double dx = pt2.x - pt1.x, dy = pt2.y - pt1.y;
  double chord = Hypot(dx, dy);
  double radius = std::fabs(cmd.rx);
  if (chord < floating_point_tolerance || radius < floating_point_tolerance)
  {
    AddVertex(path, pt2);
    return;
  }
  // a radius too small to span the chord is scaled up (as per SVG)
  radius = std::max(radius, chord / 2);

  double h = std::sqrt(std::max(0.0, radius * radius - chord * chord / 4));
  double scale = h / chord;
  if (cmd.sweep == cmd.large_arc) scale = -scale;
  PointD center((pt1.x + pt2.x) * 0.5 - dy * scale,
    (pt1.y + pt2.y) * 0.5 + dx * scale);

  double angle1 = std::atan2(pt1.y - center.y, pt1.x - center.x);
  double angle2 = std::atan2(pt2.y - center.y, pt2.x - center.x);
  double sweep_angle = angle2 - angle1;
  if (sweep_angle < 0 && cmd.sweep)
    sweep_angle += 2 * PI;
  else if (sweep_angle > 0 && !cmd.sweep)
    sweep_angle -= 2 * PI;

  double arc_tol = (arc_tolerance > floating_point_tolerance ?
    std::min(radius, arc_tolerance) : radius * arc_const);
  double steps_per_360 =
    std::min(PI / std::acos(1 - arc_tol / radius), radius * PI);
  int steps = std::max(1, static_cast<int>(
    std::ceil(steps_per_360 * std::fabs(sweep_angle) / (2 * PI))));

  for (int i = 1; i < steps; ++i)
  {
    double angle = angle1 + sweep_angle * i / steps;
    AddVertex(path, PointD(center.x + radius * std::cos(angle),
      center.y + radius * std::sin(angle)));
  }
  AddVertex(path, pt2);
}

PathD FlattenPathCmds(const PathCmds& cmds, double arc_tolerance)
{
  PathD result;
  PointD curr;
  for (const PathCmd& cmd : MakeAbsolute(cmds))
  {
    switch (cmd.type)
    {
    case PathCmdType::MoveTo:
    case PathCmdType::LineTo:
      AddVertex(result, cmd.pt);
      break;
    case PathCmdType::CubicTo:
      FlattenCubic(result, curr, cmd.ctrl1, cmd.ctrl2, cmd.pt,
        CubicTolerance(curr, cmd.ctrl1, cmd.ctrl2, cmd.pt, arc_tolerance), 0);
      break;
    case PathCmdType::ArcTo:
      FlattenArc(result, curr, cmd, arc_tolerance);
      break;
    case PathCmdType::Close:
      continue;
    }
    curr = cmd.pt;
  }
  // the closing edge is implied
  while (result.size() > 1 && result.back() == result.front())
    result.pop_back();
  return result;
}

RectD GetBounds(const PathD& path)
{
  if (path.empty()) return RectD();
  RectD result(MAX_DBL, MAX_DBL, -MAX_DBL, -MAX_DBL);
  for (const PointD& pt : path)
  {
    if (pt.x < result.left) result.left = pt.x;
    if (pt.x > result.right) result.right = pt.x;
    if (pt.y < result.top) result.top = pt.y;
    if (pt.y > result.bottom) result.bottom = pt.y;
  }
  return result;
}

double Area(const PathD& path)
{
  size_t cnt = path.size();
  if (cnt < 3) return 0.0;
  double a = 0.0;
  auto prev = path.cend() - 1;
  for (auto it = path.cbegin(); it != path.cend(); ++it)
  {
    a += (prev->y + it->y) * (prev->x - it->x);
    prev = it;
  }
  return a * 0.5;
}

}  // namespace SquircleLib
