/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Assemble squircle corners into an SVG path                      *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#include <iomanip>
#include <locale>
#include <sstream>

#include "squircle/squircle.svg.h"

namespace SquircleLib {

//------------------------------------------------------------------------------
// Corner drawing
//------------------------------------------------------------------------------

inline PointD Scale(const PointD& vec, double factor)
{
  return PointD(vec.x * factor, vec.y * factor);
}

// 'along' is the direction of travel entering the corner and 'turn' is the
// direction of travel leaving it (ie 'along' rotated 90deg clockwise).
static void AddCorner(PathCmds& cmds, const CornerPathParams& pp,
  const PointD& along, const PointD& turn)
{
  if (pp.corner_radius <= 0.0)
  {
    PointD delta = Scale(along, pp.p);
    cmds.push_back(PathCmd::LineTo(delta.x, delta.y, true));
    return;
  }

  double ab = pp.a + pp.b;
  double abc = ab + pp.c;
  cmds.push_back(PathCmd::CubicTo(
    Scale(along, pp.a),
    Scale(along, ab),
    Scale(along, abc) + Scale(turn, pp.d), true));
  cmds.push_back(PathCmd::ArcTo(pp.corner_radius, pp.corner_radius, 0.0,
    false, true,
    Scale(along, pp.arc_section_length) + Scale(turn, pp.arc_section_length),
    true));
  cmds.push_back(PathCmd::CubicTo(
    Scale(along, pp.d) + Scale(turn, pp.c),
    Scale(along, pp.d) + Scale(turn, pp.b + pp.c),
    Scale(along, pp.d) + Scale(turn, abc), true));
}

PathCmds GetPathCmdsFromPathParams(double width, double height,
  const CornerPathParamsMap& corner_params)
{
  const PointD right(1, 0), down(0, 1), left(-1, 0), up(0, -1);
  PathCmds result;
  result.reserve(17);
  result.push_back(PathCmd::MoveTo(width - corner_params.top_right.p, 0));
  AddCorner(result, corner_params.top_right, right, down);
  result.push_back(PathCmd::LineTo(width, height - corner_params.bottom_right.p));
  AddCorner(result, corner_params.bottom_right, down, left);
  result.push_back(PathCmd::LineTo(corner_params.bottom_left.p, height));
  AddCorner(result, corner_params.bottom_left, left, up);
  result.push_back(PathCmd::LineTo(0, corner_params.top_left.p));
  AddCorner(result, corner_params.top_left, up, right);
  result.push_back(PathCmd::Close());
  return result;
}

//------------------------------------------------------------------------------
// Serialization
//------------------------------------------------------------------------------

static void WriteNumber(std::ostringstream& ss, double value)
{
  std::ostringstream num;
  num.imbue(std::locale::classic());
  num << std::fixed << std::setprecision(svg_precision) << value;
  std::string s = num.str();
  // values that round to zero are written without a sign
  if (s.size() > 1 && s[0] == '-' &&
    s.find_first_not_of("-0.") == std::string::npos)
    s.erase(0, 1);
  ss << ' ' << s;
}

static void WritePoint(std::ostringstream& ss, const PointD& pt)
{
  WriteNumber(ss, pt.x);
  WriteNumber(ss, pt.y);
}

std::string PathCmdsToSvg(const PathCmds& cmds)
{
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  bool first = true;
  for (const PathCmd& cmd : cmds)
  {
    if (!first) ss << ' ';
    first = false;
    ss << CmdLetter(cmd);
    switch (cmd.type)
    {
    case PathCmdType::MoveTo:
    case PathCmdType::LineTo:
      WritePoint(ss, cmd.pt);
      break;
    case PathCmdType::CubicTo:
      WritePoint(ss, cmd.ctrl1);
      WritePoint(ss, cmd.ctrl2);
      WritePoint(ss, cmd.pt);
      break;
    case PathCmdType::ArcTo:
      WriteNumber(ss, cmd.rx);
      WriteNumber(ss, cmd.ry);
      WriteNumber(ss, cmd.x_axis_rotation);
      ss << ' ' << (cmd.large_arc ? 1 : 0) << ' ' << (cmd.sweep ? 1 : 0);
      WritePoint(ss, cmd.pt);
      break;
    case PathCmdType::Close:
      break;
    }
  }
  return ss.str();
}

}  // namespace SquircleLib
