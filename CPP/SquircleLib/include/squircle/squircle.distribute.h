/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Distribute edge lengths between adjacent rounded corners        *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_DISTRIBUTE_H_
#define SQUIRCLE_DISTRIBUTE_H_

#include "squircle.core.h"

namespace SquircleLib {

  // Assigns each corner a rounding and smoothing budget (the length of each
  // adjoining side that its curve may consume) and clamps its radius to that
  // budget. Corners are processed largest radius first, and a corner whose
  // neighbour has already been processed gets whatever that neighbour left of
  // the shared side, so adjacent corners never claim more than the side.
  NormalizedCorners DistributeAndNormalize(const RoundedRect& rect);

}  // namespace SquircleLib

#endif  // SQUIRCLE_DISTRIBUTE_H_
