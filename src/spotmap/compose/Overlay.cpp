#include "spotmap/compose/Overlay.hpp"
#include "spotmap/core/Error.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace spotmap {

static const cv::Scalar kDefaultColour(0, 255, 255); // #ffff00 in BGR

static int hexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

cv::Scalar parseColour(const std::string& hex)
{
    if (hex.size() != 7 || hex[0] != '#') return kDefaultColour;
    int v[6];
    for (int i = 0; i < 6; ++i) {
        v[i] = hexDigit(hex[i + 1]);
        if (v[i] < 0) return kDefaultColour;
    }
    const int r = v[0] * 16 + v[1], g = v[2] * 16 + v[3], b = v[4] * 16 + v[5];
    return cv::Scalar(b, g, r);
}

double ringRadius(const Point& p)
{
    return p.diameter * p.scale / 2.0;
}

static std::string caption(const Point& p)
{
    return std::to_string(p.id) + "_" + labelName(p.label);
}

/* Box covering ring and caption of one point, in input image coordinates. */
static cv::Rect2d footprint(const Point& p, const OverlayOptions& opt)
{
    const double r = ringRadius(p) + opt.ring_thickness;
    int baseline = 0;
    const cv::Size ts = cv::getTextSize(caption(p), cv::FONT_HERSHEY_SIMPLEX,
                                        opt.font_scale, opt.font_thickness, &baseline);
    const double tx = p.x + ringRadius(p) + opt.text_offset;
    const double x0 = p.x - r;
    const double y0 = std::min(p.y - r, p.y - (double)ts.height);
    const double x1 = std::max(p.x + r, tx + ts.width);
    const double y1 = std::max(p.y + r, p.y + (double)baseline);
    return cv::Rect2d(x0, y0, x1 - x0, y1 - y0);
}

/*
  Overlay rebuilt from point state.

    1) Bounding box of the image and every point footprint.
       Pad the image with black so the box fits; 'origin' is the shift.
    2) Per point, in insertion order (later points draw on top):
         ring   : radius diameter*scale/2, thickness opt.ring_thickness
         centre : filled dot
         text   : "<id>_<label>" right of the ring
       all in the point's colour.
*/
OverlayResult renderPoints(const cv::Mat& image,
                           const std::vector<Point>& points,
                           const OverlayOptions& opt)
{
    OverlayResult out{};
    CV_Assert(!image.empty());

    cv::Mat bgr;
    if (image.channels() == 1) cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    else if (image.channels() == 4) cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    else bgr = image.clone();

    // --- 1) canvas
    double minX = 0, minY = 0;
    double maxX = bgr.cols, maxY = bgr.rows;
    for (const auto& p : points) {
        const cv::Rect2d R = footprint(p, opt);
        minX = std::min(minX, R.x);
        minY = std::min(minY, R.y);
        maxX = std::max(maxX, R.x + R.width);
        maxY = std::max(maxY, R.y + R.height);
    }
    const int left   = (int)std::ceil(-minX);
    const int top    = (int)std::ceil(-minY);
    const int right  = (int)std::ceil(maxX) - bgr.cols;
    const int bottom = (int)std::ceil(maxY) - bgr.rows;
    if (left || top || right || bottom)
        cv::copyMakeBorder(bgr, out.image, top, bottom, left, right,
                           cv::BORDER_CONSTANT, cv::Scalar::all(0));
    else
        out.image = bgr;
    out.origin = cv::Point(left, top);

    // --- 2) draw
    for (const auto& p : points) {
        const cv::Scalar colour = parseColour(p.colour);
        const cv::Point c(p.x + left, p.y + top);
        const int r = (int)std::lround(ringRadius(p));
        cv::circle(out.image, c, r, colour, opt.ring_thickness, cv::LINE_AA);
        cv::circle(out.image, c, opt.dot_radius, colour, cv::FILLED, cv::LINE_AA);
        const cv::Point t(c.x + r + opt.text_offset, c.y);
        cv::putText(out.image, caption(p), t, cv::FONT_HERSHEY_SIMPLEX,
                    opt.font_scale, colour, opt.font_thickness, cv::LINE_AA);
    }
    return out;
}

std::string resolveImagePath(const std::string& path)
{
    if (std::filesystem::path(path).has_extension()) return path;
    return path + ".png";
}

std::string exportImage(const cv::Mat& image,
                        const std::vector<Point>& points,
                        const std::string& path,
                        const OverlayOptions& opt)
{
    const std::string target = resolveImagePath(path);
    const OverlayResult r = renderPoints(image, points, opt);
    bool written = false;
    try {
        written = cv::imwrite(target, r.image);
    } catch (const cv::Exception& e) {
        throw Error(ErrorKind::FileAccessError, "cannot write image '" + target + "': " + e.what());
    }
    if (!written)
        throw Error(ErrorKind::FileAccessError, "cannot write image '" + target + "'");
    return target;
}

std::optional<Point> pointAt(const PointRegistry& registry, double x, double y)
{
    const auto& pts = registry.points();
    for (auto it = pts.rbegin(); it != pts.rend(); ++it) {
        const double dx = x - it->x, dy = y - it->y;
        const double r = ringRadius(*it);
        if (dx * dx + dy * dy <= r * r) return *it;
    }
    return std::nullopt;
}

} // namespace spotmap
