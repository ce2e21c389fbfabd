#include "spotmap/align/AffineSolver.hpp"
#include "spotmap/core/Error.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

/*
 Affine fit from exactly three point pairs.

 Unknowns: [a b tx c d ty]
 For each pair (x,y) -> (x',y'):
     [x y 1 0 0 0] * u = x'
     [0 0 0 x y 1] * u = y'

 Three pairs give a square 6x6 system. Its determinant is (twice the
 triangle area)^2, so it is singular exactly when the sources are collinear.
 The area test below catches that with a tolerance relative to the
 triangle size before the LU solve sees a nearly singular matrix.
*/

namespace spotmap {

// Twice the signed area of triangle (a, b, c).
static double cross2(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c)
{
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

static bool collinear(const ReferenceTriplet& s)
{
    const double e01 = cv::norm(s[1] - s[0]);
    const double e02 = cv::norm(s[2] - s[0]);
    const double e12 = cv::norm(s[2] - s[1]);
    const double longest = std::max({e01, e02, e12});
    if (longest <= 1e-12) return true;                // all coincident

    // |cross| = longest * height; height relative to the longest edge
    const double height = std::abs(cross2(s[0], s[1], s[2])) / longest;
    return height <= 1e-9 * longest;
}

AffineTransform fitAffine(const ReferenceTriplet& src, const ReferenceTriplet& dst)
{
    if (collinear(src))
        throw Error(ErrorKind::DegenerateReferenceSet,
                    "reference points are collinear or coincident; no unique affine map exists");

    cv::Matx66d A = cv::Matx66d::zeros();
    cv::Vec6d   b;
    for (int i = 0; i < 3; ++i) {
        const int rx = 2*i, ry = 2*i + 1;
        A(rx,0) = src[i].x; A(rx,1) = src[i].y; A(rx,2) = 1.0;
        A(ry,3) = src[i].x; A(ry,4) = src[i].y; A(ry,5) = 1.0;
        b[rx] = dst[i].x;
        b[ry] = dst[i].y;
    }

    cv::Mat_<double> u;
    if (!cv::solve(cv::Mat(A), cv::Mat(b), u, cv::DECOMP_LU))
        throw Error(ErrorKind::DegenerateReferenceSet, "reference system is singular");

    AffineTransform T;
    T.m = cv::Matx23d(u(0), u(1), u(2),
                      u(3), u(4), u(5));
    return T;
}

cv::Point applyAffine(const AffineTransform& T, const cv::Point2d& p)
{
    const cv::Point2d q = T.apply(p);
    auto fits = [](double v) {
        return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    };
    if (!fits(q.x) || !fits(q.y))
        throw Error(ErrorKind::MalformedRow,
                    "mapped position (" + std::to_string(q.x) + ", " + std::to_string(q.y)
                    + ") is outside the pixel range");
    // std::lround: halves away from zero (cvRound would round half to even)
    return { static_cast<int>(std::lround(q.x)), static_cast<int>(std::lround(q.y)) };
}

ReferenceTriplet firstThree(const std::vector<cv::Point2d>& pts)
{
    if (pts.size() < 3)
        throw Error(ErrorKind::InsufficientReferencePoints,
                    "3 reference points are needed, found " + std::to_string(pts.size()));
    return { pts[0], pts[1], pts[2] };
}

ReferenceTriplet firstThree(const std::vector<Point>& refs)
{
    std::vector<cv::Point2d> pts;
    pts.reserve(refs.size());
    for (const auto& r : refs) pts.emplace_back(r.x, r.y);
    return firstThree(pts);
}

} // namespace spotmap
