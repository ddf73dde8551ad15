/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  This module provides a simple interface to the SquircleLib      *
*              library                                                         *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_H
#define SQUIRCLE_H

#include <optional>
#include <string>

#include "squircle.core.h"
#include "squircle.builder.h"
#include "squircle.corner.h"
#include "squircle.distribute.h"
#include "squircle.flatten.h"
#include "squircle.svg.h"

namespace SquircleLib {

  // Any corner radius that isn't set uses corner_radius, which defaults to 0.
  struct SquircleParams {
    double width = 0.0;
    double height = 0.0;
    double corner_smoothing = 0.0;
    std::optional<double> corner_radius;
    std::optional<double> top_left_corner_radius;
    std::optional<double> top_right_corner_radius;
    std::optional<double> bottom_right_corner_radius;
    std::optional<double> bottom_left_corner_radius;
    std::optional<bool> preserve_smoothing;
  };

  namespace details
  {
    inline SquircleBuilder MakeBuilder(const SquircleParams& params)
    {
      SquircleBuilder sb(params.corner_smoothing,
        params.corner_radius.value_or(0.0),
        params.preserve_smoothing.value_or(false));
      if (params.top_left_corner_radius)
        sb.SetCornerRadius(Corner::TopLeft, *params.top_left_corner_radius);
      if (params.top_right_corner_radius)
        sb.SetCornerRadius(Corner::TopRight, *params.top_right_corner_radius);
      if (params.bottom_right_corner_radius)
        sb.SetCornerRadius(Corner::BottomRight, *params.bottom_right_corner_radius);
      if (params.bottom_left_corner_radius)
        sb.SetCornerRadius(Corner::BottomLeft, *params.bottom_left_corner_radius);
      return sb;
    }
  }  // namespace details

  inline std::string GetSvgPath(const SquircleParams& params)
  {
    SquircleBuilder sb = details::MakeBuilder(params);
    std::string result;
    sb.Execute(params.width, params.height, result);
    if (sb.ErrorCode()) DoError(sb.ErrorCode());
    return result;
  }

  inline PathD GetSquirclePathD(const SquircleParams& params,
    double arc_tolerance = 0.0)
  {
    SquircleBuilder sb = details::MakeBuilder(params);
    sb.ArcTolerance(arc_tolerance);
    PathD result;
    sb.Execute(params.width, params.height, result);
    if (sb.ErrorCode()) DoError(sb.ErrorCode());
    return result;
  }

}  // namespace SquircleLib

#endif  // SQUIRCLE_H
