/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Convert squircle path commands into polygons                    *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_FLATTEN_H_
#define SQUIRCLE_FLATTEN_H_

#include "squircle.core.h"

namespace SquircleLib {

  // Rewrites relative commands (l, c, a) with absolute coordinates.
  PathCmds MakeAbsolute(const PathCmds& cmds);

  // The current point once every command except a closing 'Z' has been drawn.
  PointD GetEndPoint(const PathCmds& cmds);

  // Approximates curves and arcs with straight line segments. arc_tolerance is
  // the maximum distance between a segment and the true curve; when it's 0,
  // each arc or curve uses 1/500th of its own size.
  // The closing 'Z' is implied, so the last vertex doesn't repeat the first.
  PathD FlattenPathCmds(const PathCmds& cmds, double arc_tolerance = 0.0);

  // An empty path returns an empty rect at the origin.
  RectD GetBounds(const PathD& path);

  // Positive for the clockwise (y axis down) paths this library builds.
  double Area(const PathD& path);

}  // namespace SquircleLib

#endif  // SQUIRCLE_FLATTEN_H_
