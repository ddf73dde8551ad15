/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Assemble squircle corners into an SVG path                      *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_SVG_H_
#define SQUIRCLE_SVG_H_

#include <string>

#include "squircle.core.h"

namespace SquircleLib {

  // decimal places used for every value in an SVG path string
  const int svg_precision = 4;

  // Builds the closed outline of a width x height rectangle, clockwise from
  // the end of the top edge (width - top_right.p, 0). Every corner after the
  // initial move is drawn with relative commands, either cubic + arc + cubic
  // or, when its radius is 0, a (zero length) line.
  PathCmds GetPathCmdsFromPathParams(double width, double height,
    const CornerPathParamsMap& corner_params);

  // Serializes path commands in SVG path syntax ("M x y c ... a ... Z").
  // Numbers are written in fixed point with svg_precision decimals.
  std::string PathCmdsToSvg(const PathCmds& cmds);

  inline std::string GetSvgPathFromPathParams(double width, double height,
    const CornerPathParamsMap& corner_params)
  {
    return PathCmdsToSvg(GetPathCmdsFromPathParams(width, height, corner_params));
  }

}  // namespace SquircleLib

#endif  // SQUIRCLE_SVG_H_
