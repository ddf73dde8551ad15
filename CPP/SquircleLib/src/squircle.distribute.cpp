/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Distribute edge lengths between adjacent rounded corners        *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#include <algorithm>

#include "squircle/squircle.distribute.h"

namespace SquircleLib {

// budgets are never negative, so this marks a corner not yet processed
const double unset_budget = -1.0;

static std::vector<std::pair<Corner, double>> GetCornersBySize(
  const CornerMap<double>& radii)
{
  std::vector<std::pair<Corner, double>> result;
  result.reserve(4);
  for (Corner corner : all_corners)
    result.emplace_back(corner, radii[corner]);
  // stable, so equal radii keep TopLeft, TopRight, BottomLeft, BottomRight
  std::stable_sort(result.begin(), result.end(),
    [](const std::pair<Corner, double>& a, const std::pair<Corner, double>& b) {
      return a.second > b.second;
    });
  return result;
}

static double CalcSideBudget(const RoundedRect& rect, double radius,
  const Adjacent& adjacent, const CornerMap<double>& radii,
  const CornerMap<double>& budgets)
{
  double adjacent_radius = radii[adjacent.corner];
  if (radius == 0.0 && adjacent_radius == 0.0) return 0.0;

  double side_length = rect.SideLength(adjacent.side);
  double adjacent_budget = budgets[adjacent.corner];
  // the adjacent corner has already been given its share of this side
  if (adjacent_budget >= 0.0)
    return side_length - adjacent_budget;
  return (radius / (radius + adjacent_radius)) * side_length;
}

NormalizedCorners DistributeAndNormalize(const RoundedRect& rect)
{
  CornerMap<double> budgets(unset_budget);
  CornerMap<double> radii = rect.radii;

  for (const auto& item : GetCornersBySize(radii))
  {
    Corner corner = item.first;
    double radius = item.second;
    std::pair<Adjacent, Adjacent> adjacents = GetAdjacents(corner);
    double budget = std::min(
      CalcSideBudget(rect, radius, adjacents.first, radii, budgets),
      CalcSideBudget(rect, radius, adjacents.second, radii, budgets));

    budgets[corner] = budget;
    radii[corner] = std::min(radius, budget);
  }

  NormalizedCorners result;
  for (Corner corner : all_corners)
  {
    result[corner].radius = radii[corner];
    result[corner].rounding_and_smoothing_budget = budgets[corner];
  }
  return result;
}

}  // namespace SquircleLib
