/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Squircle (smoothed corner) rectangle path builder               *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#include <algorithm>

#include "squircle/squircle.builder.h"
#include "squircle/squircle.corner.h"
#include "squircle/squircle.distribute.h"
#include "squircle/squircle.flatten.h"
#include "squircle/squircle.svg.h"

namespace SquircleLib {

bool SquircleBuilder::CheckInput(double width, double height) const
{
  if (!std::isfinite(width) || !std::isfinite(height) ||
    !std::isfinite(corner_smoothing_)) return false;
  for (Corner corner : all_corners)
    if (!std::isfinite(CornerRadius(corner))) return false;
  return true;
}

CornerMap<double> SquircleBuilder::GetClampedRadii() const
{
  CornerMap<double> result;
  for (Corner corner : all_corners)
    result[corner] = std::max(0.0, CornerRadius(corner));
  return result;
}

bool SquircleBuilder::IsUniform() const
{
  CornerMap<double> radii = GetClampedRadii();
  return radii.top_left == radii.top_right &&
    radii.top_right == radii.bottom_right &&
    radii.bottom_right == radii.bottom_left;
}

CornerPathParamsMap SquircleBuilder::GetCornerPathParams(double width,
  double height) const
{
  width = std::max(0.0, width);
  height = std::max(0.0, height);
  CornerMap<double> radii = GetClampedRadii();

  CornerParams cp;
  cp.corner_smoothing = corner_smoothing_;
  cp.preserve_smoothing = preserve_smoothing_;

  if (IsUniform())
  {
    // every corner is the same, so there's no need to distribute budgets
    cp.rounding_and_smoothing_budget = std::min(width, height) / 2.0;
    cp.corner_radius = std::min(radii.top_left, cp.rounding_and_smoothing_budget);
    return CornerPathParamsMap(GetPathParamsForCorner(cp));
  }

  NormalizedCorners normalized =
    DistributeAndNormalize(RoundedRect(width, height, radii));
  CornerPathParamsMap result;
  for (Corner corner : all_corners)
  {
    cp.corner_radius = normalized[corner].radius;
    cp.rounding_and_smoothing_budget =
      normalized[corner].rounding_and_smoothing_budget;
    result[corner] = GetPathParamsForCorner(cp);
  }
  return result;
}

void SquircleBuilder::ExecuteInternal(double width, double height,
  PathCmds& cmds)
{
  error_code_ = 0;
  cmds.clear();
  if (!CheckInput(width, height))
  {
    error_code_ |= range_error_i;
    return;
  }
  cmds = GetPathCmdsFromPathParams(std::max(0.0, width),
    std::max(0.0, height), GetCornerPathParams(width, height));
}

void SquircleBuilder::Execute(double width, double height, PathCmds& cmds)
{
  ExecuteInternal(width, height, cmds);
}

void SquircleBuilder::Execute(double width, double height,
  std::string& svg_path)
{
  svg_path.clear();
  PathCmds cmds;
  ExecuteInternal(width, height, cmds);
  if (error_code_) return;
  svg_path = PathCmdsToSvg(cmds);
}

void SquircleBuilder::Execute(double width, double height, PathD& path)
{
  path.clear();
  PathCmds cmds;
  ExecuteInternal(width, height, cmds);
  if (error_code_) return;
  path = FlattenPathCmds(cmds, arc_tolerance_);
}

}  // namespace SquircleLib
