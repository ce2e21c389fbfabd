#include "spotmap/core/Scale.hpp"
#include "spotmap/core/Error.hpp"

#include <cmath>
#include <string>

namespace spotmap {

double pixelDistance(const cv::Point2d& a, const cv::Point2d& b)
{
    return cv::norm(b - a);
}

double pixelsPerMicron(double pixels, double microns)
{
    if (!(pixels > 0.0))
        throw Error(ErrorKind::InvalidValue, "pixel length must be positive, got " + std::to_string(pixels));
    if (!(microns > 0.0))
        throw Error(ErrorKind::InvalidValue, "distance must be positive, got " + std::to_string(microns));

    // two decimals, as shown to the user
    const double ratio = std::round(pixels / microns * 100.0) / 100.0;
    if (ratio <= 0.0)
        throw Error(ErrorKind::InvalidValue,
                    "scale " + std::to_string(pixels) + " px / " + std::to_string(microns)
                    + " um rounds to 0.00 px/um");
    return ratio;
}

} // namespace spotmap
