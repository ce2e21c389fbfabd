#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>
#include "spotmap/core/Point.hpp"
#include "spotmap/core/Registry.hpp"

namespace spotmap {

struct OverlayOptions {
    int    ring_thickness = 4;      // outer ring, pixels
    int    dot_radius     = 1;      // centre dot
    double font_scale     = 0.5;    // cv::FONT_HERSHEY_SIMPLEX
    int    font_thickness = 1;
    int    text_offset    = 4;      // gap between ring and label text
};

struct OverlayResult {
    cv::Mat   image;     // BGR, at least the size of the input
    cv::Point origin;    // where input pixel (0,0) landed (canvas grows left/up too)
};

/** "#rrggbb" -> BGR. Anything else gives the default yellow. */
cv::Scalar parseColour(const std::string& hex);

/** Outer ring radius in pixels: diameter * scale / 2. */
double ringRadius(const Point& p);

/** Draw points over 'image' (Gray8 or BGR). The canvas grows to keep points past the border. */
OverlayResult renderPoints(const cv::Mat& image,
                           const std::vector<Point>& points,
                           const OverlayOptions& opt = {});

/** Path with ".png" appended when it has no extension. */
std::string resolveImagePath(const std::string& path);

/** Render and write. Returns the path actually written. Throws Error{FileAccessError}. */
std::string exportImage(const cv::Mat& image,
                        const std::vector<Point>& points,
                        const std::string& path,
                        const OverlayOptions& opt = {});

/** Most recently added point whose ring contains (x, y). */
std::optional<Point> pointAt(const PointRegistry& registry, double x, double y);

} // namespace spotmap
