/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Bezier and arc parameters for a single squircle corner          *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#include <algorithm>

#include "squircle/squircle.corner.h"

namespace SquircleLib {

// keeps some distance between P1 and P2 when a & b are squeezed
const double min_a_fraction = 1.0 / 6.0;

CornerPathParams GetPathParamsForCorner(const CornerParams& params)
{
  CornerPathParams result;
  double radius = params.corner_radius;
  double budget = params.rounding_and_smoothing_budget;
  double smoothing = params.corner_smoothing;
  // a square corner (and avoids dividing the budget by zero below)
  if (radius <= 0.0) return result;

  // figure 12.2: p = (1 + smoothing) * q, and q == R when theta == 90deg
  double p = (1.0 + smoothing) * radius;

  if (!params.preserve_smoothing)
  {
    double max_smoothing = budget / radius - 1.0;
    smoothing = std::min(smoothing, max_smoothing);
    p = std::min(p, budget);
  }

  double arc_measure = 90.0 * (1.0 - smoothing);
  double arc_section_length =
    std::sin(ToRadians(arc_measure / 2.0)) * radius * std::sqrt(2.0);

  // distance between control points P3 and P4
  double angle_alpha = (90.0 - arc_measure) / 2.0;
  double p3_to_p4_distance = radius * std::tan(ToRadians(angle_alpha / 2.0));

  double angle_beta = ToRadians(45.0 * smoothing);
  double c = p3_to_p4_distance * std::cos(angle_beta);
  double d = c * std::tan(angle_beta);

  double b = (p - arc_section_length - c - d) / 3.0;
  double a = 2.0 * b;

  if (params.preserve_smoothing && p > budget)
  {
    double p1_to_p3_max_distance = budget - d - arc_section_length - c;
    double min_a = p1_to_p3_max_distance * min_a_fraction;
    double max_b = p1_to_p3_max_distance - min_a;
    b = std::min(b, max_b);
    a = p1_to_p3_max_distance - b;
    p = std::min(p, budget);
  }

  result.a = a;
  result.b = b;
  result.c = c;
  result.d = d;
  result.p = p;
  result.corner_radius = radius;
  result.arc_section_length = arc_section_length;
  return result;
}

}  // namespace SquircleLib
