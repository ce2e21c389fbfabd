#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <vector>
#include "spotmap/core/Point.hpp"

namespace spotmap {

/** Three correspondences in a fixed order.
 *  The i-th source point pairs with the i-th destination point; nothing
 *  checks that they mark the same physical feature, the caller must order
 *  both sides consistently. */
using ReferenceTriplet = std::array<cv::Point2d, 3>;

/** 2D affine map p' = A*p + b stored as [A | b]. */
struct AffineTransform {
    cv::Matx23d m{1,0,0, 0,1,0};

    /** Unrounded image of p. */
    [[nodiscard]] cv::Point2d apply(const cv::Point2d& p) const {
        return { m(0,0)*p.x + m(0,1)*p.y + m(0,2),
                 m(1,0)*p.x + m(1,1)*p.y + m(1,2) };
    }
};

/**
 * Exact affine fit through three correspondences (6 equations, 6 unknowns).
 * Throws Error{DegenerateReferenceSet} when the source points are collinear
 * or coincident.
 */
AffineTransform fitAffine(const ReferenceTriplet& src, const ReferenceTriplet& dst);

/** Apply T and round to integer pixels, halves away from zero.
 *  Throws Error{MalformedRow} when the result does not fit in int. */
cv::Point applyAffine(const AffineTransform& T, const cv::Point2d& p);

/** The first three entries in order; later ones are ignored.
 *  Throws Error{InsufficientReferencePoints} when fewer than three exist. */
ReferenceTriplet firstThree(const std::vector<cv::Point2d>& pts);
ReferenceTriplet firstThree(const std::vector<Point>& refs);

} // namespace spotmap
