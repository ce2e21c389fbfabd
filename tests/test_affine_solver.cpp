#include "test_support.hpp"

#include "spotmap/align/AffineSolver.hpp"

using namespace spotmap;

TEST(AffineSolver, MapsReferencesExactly)
{
    const ReferenceTriplet src{{{10, 10}, {110, 10}, {10, 110}}};
    const ReferenceTriplet dst{{{0, 0}, {100, 0}, {0, 100}}};
    const AffineTransform T = fitAffine(src, dst);
    for (int i = 0; i < 3; ++i) {
        const cv::Point2d q = T.apply(src[i]);
        EXPECT_NEAR(q.x, dst[i].x, 1e-9);
        EXPECT_NEAR(q.y, dst[i].y, 1e-9);
    }
    EXPECT_EQ(applyAffine(T, {60, 60}), cv::Point(50, 50));
}

TEST(AffineSolver, RecoversRotationScaleAndShear)
{
    // p' = A p + b with a general A
    const cv::Matx22d A(1.5, -0.4, 0.3, 0.8);
    const cv::Vec2d b(-20, 35);
    auto f = [&](cv::Point2d p) {
        return cv::Point2d(A(0,0)*p.x + A(0,1)*p.y + b[0], A(1,0)*p.x + A(1,1)*p.y + b[1]);
    };
    const ReferenceTriplet src{{{0, 0}, {200, 15}, {40, 180}}};
    const ReferenceTriplet dst{{f(src[0]), f(src[1]), f(src[2])}};
    const AffineTransform T = fitAffine(src, dst);
    EXPECT_NEAR(T.m(0,0), 1.5, 1e-9);
    EXPECT_NEAR(T.m(0,1), -0.4, 1e-9);
    EXPECT_NEAR(T.m(1,2), 35.0, 1e-9);

    const cv::Point2d probe(77, -13);
    const cv::Point2d q = T.apply(probe);
    EXPECT_NEAR(q.x, f(probe).x, 1e-9);
    EXPECT_NEAR(q.y, f(probe).y, 1e-9);
}

TEST(AffineSolver, CollinearOrCoincidentIsDegenerate)
{
    const ReferenceTriplet dst{{{0, 0}, {1, 0}, {0, 1}}};
    EXPECT_SPOTMAP_ERROR(fitAffine({{{0, 0}, {1, 1}, {2, 2}}}, dst), DegenerateReferenceSet);
    EXPECT_SPOTMAP_ERROR(fitAffine({{{5, 5}, {5, 5}, {5, 5}}}, dst), DegenerateReferenceSet);
    EXPECT_SPOTMAP_ERROR(fitAffine({{{0, 0}, {0, 0}, {3, 4}}}, dst), DegenerateReferenceSet);
}

TEST(AffineSolver, SmallButValidTriangleIsAccepted)
{
    const ReferenceTriplet src{{{0, 0}, {0.01, 0}, {0, 0.01}}};
    const ReferenceTriplet dst{{{0, 0}, {1, 0}, {0, 1}}};
    const AffineTransform T = fitAffine(src, dst);
    EXPECT_NEAR(T.m(0,0), 100.0, 1e-6);
}

TEST(AffineSolver, RoundsHalfAwayFromZero)
{
    AffineTransform T;   // identity
    EXPECT_EQ(applyAffine(T, {2.5, -2.5}), cv::Point(3, -3));
    EXPECT_EQ(applyAffine(T, {0.5, 1.49}), cv::Point(1, 1));
}

TEST(AffineSolver, FirstThreeTakesLeadingEntries)
{
    const std::vector<cv::Point2d> pts{{1, 1}, {2, 2}, {3, 3}, {4, 4}};
    const ReferenceTriplet t = firstThree(pts);
    EXPECT_EQ(t[2], cv::Point2d(3, 3));
    EXPECT_SPOTMAP_ERROR(firstThree(std::vector<cv::Point2d>{{1, 1}, {2, 2}}), InsufficientReferencePoints);
    EXPECT_SPOTMAP_ERROR(firstThree(std::vector<Point>{}), InsufficientReferencePoints);
}

TEST(AffineSolver, ResultOutsideIntRangeIsMalformed)
{
    AffineTransform T;
    EXPECT_SPOTMAP_ERROR(applyAffine(T, {1e10, 0}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(applyAffine(T, {0, -1e10}), MalformedRow);

    T.m(0,0) = 1e6;   // in range before the map, out of range after it
    EXPECT_SPOTMAP_ERROR(applyAffine(T, {1e4, 0}), MalformedRow);
}
