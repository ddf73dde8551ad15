/*******************************************************************************
* Author    :  Angus Johnson                                                   *
* Date      :  19 October 2026                                                 *
* Website   :  https://www.angusj.com                                          *
* Copyright :  Angus Johnson 2010-2026                                         *
* Purpose   :  Squircle (smoothed corner) rectangle path builder               *
* License   :  https://www.boost.org/LICENSE_1_0.txt                           *
*******************************************************************************/

#ifndef SQUIRCLE_BUILDER_H_
#define SQUIRCLE_BUILDER_H_

#include <optional>
#include <string>

#include "squircle.core.h"

namespace SquircleLib {

class SquircleBuilder {
private:
  int error_code_ = 0;
  double corner_radius_ = 0.0;
  double corner_smoothing_ = 0.0;
  bool preserve_smoothing_ = false;
  double arc_tolerance_ = 0.0;
  // per corner overrides of corner_radius_
  CornerMap<std::optional<double>> corner_radii_;

  bool CheckInput(double width, double height) const;
  CornerMap<double> GetClampedRadii() const;
  void ExecuteInternal(double width, double height, PathCmds& cmds);
public:
  explicit SquircleBuilder(double corner_smoothing = 0.0,
    double corner_radius = 0.0,
    bool preserve_smoothing = false) :
    corner_radius_(corner_radius), corner_smoothing_(corner_smoothing),
    preserve_smoothing_(preserve_smoothing) { };

  int ErrorCode() const { return error_code_; };

  // the radius used by any corner without its own radius
  double CornerRadius() const { return corner_radius_; }
  void CornerRadius(double radius) { corner_radius_ = radius; }

  double CornerRadius(Corner corner) const
  {
    return corner_radii_[corner].value_or(corner_radius_);
  }
  void SetCornerRadius(Corner corner, double radius) { corner_radii_[corner] = radius; }
  void ClearCornerRadius(Corner corner) { corner_radii_[corner].reset(); }
  void ClearCornerRadii() { corner_radii_ = CornerMap<std::optional<double>>(); }

  //CornerSmoothing: 0 = circular arcs, 1 = fully smoothed (values above 1
  //exaggerate the effect)
  double CornerSmoothing() const { return corner_smoothing_; }
  void CornerSmoothing(double smoothing) { corner_smoothing_ = smoothing; }

  bool PreserveSmoothing() const { return preserve_smoothing_; }
  void PreserveSmoothing(bool preserve) { preserve_smoothing_ = preserve; }

  //ArcTolerance: only used when flattening (0 = auto)
  double ArcTolerance() const { return arc_tolerance_; }
  void ArcTolerance(double arc_tolerance) { arc_tolerance_ = arc_tolerance; }

  // true when all four corners have the same radius
  bool IsUniform() const;

  // Per corner curve parameters for a width x height rectangle.
  CornerPathParamsMap GetCornerPathParams(double width, double height) const;

  void Execute(double width, double height, PathCmds& cmds);
  void Execute(double width, double height, std::string& svg_path);
  void Execute(double width, double height, PathD& path);
};

}  // namespace SquircleLib

#endif  // SQUIRCLE_BUILDER_H_
