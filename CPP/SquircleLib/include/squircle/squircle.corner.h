/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Bezier and arc parameters for a single squircle corner          *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_CORNER_H_
#define SQUIRCLE_CORNER_H_

#include "squircle.core.h"

namespace SquircleLib {

  struct CornerParams {
    double corner_radius = 0.0;
    double corner_smoothing = 0.0;
    bool preserve_smoothing = false;
    double rounding_and_smoothing_budget = 0.0;
  };

  // Approximates one 90 degree squircle corner by a cubic, a circular arc and
  // a second (mirrored) cubic. See "Desperately seeking squircles" on the
  // figma.com blog, and MartinRGB's Figma_Squircles_Approximation.
  //
  // corner_smoothing is nominally 0..1 but isn't clamped. When the budget is
  // too small for the requested smoothing, preserve_smoothing = false lowers
  // the smoothing until the corner fits, while preserve_smoothing = true keeps
  // it and pulls in only the outer control points (a & b).
  CornerPathParams GetPathParamsForCorner(const CornerParams& params);

}  // namespace SquircleLib

#endif  // SQUIRCLE_CORNER_H_
