#pragma once

#include <opencv2/core.hpp>

namespace spotmap {

/* Length of a scale line drawn between two image positions, in pixels. */
double pixelDistance(const cv::Point2d& a, const cv::Point2d& b);

/* Pixels-per-micrometre ratio for a line of 'pixels' covering 'microns'.
   Rounded to two decimals. Throws Error{InvalidValue} on non-positive input
   or when the ratio rounds to zero. */
double pixelsPerMicron(double pixels, double microns);

} // namespace spotmap
