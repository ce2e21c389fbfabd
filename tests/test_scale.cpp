#include "test_support.hpp"

#include "spotmap/core/Scale.hpp"

using namespace spotmap;

TEST(Scale, DistanceOfDrawnLine)
{
    EXPECT_DOUBLE_EQ(pixelDistance({0, 0}, {3, 4}), 5.0);
    EXPECT_DOUBLE_EQ(pixelDistance({2, 2}, {2, 2}), 0.0);
}

TEST(Scale, RatioRoundedToTwoDecimals)
{
    EXPECT_DOUBLE_EQ(pixelsPerMicron(100.0, 50.0), 2.0);
    EXPECT_DOUBLE_EQ(pixelsPerMicron(100.0, 30.0), 3.33);
    EXPECT_DOUBLE_EQ(pixelsPerMicron(200.0, 30.0), 6.67);
}

TEST(Scale, NonPositiveInputIsInvalid)
{
    EXPECT_SPOTMAP_ERROR(pixelsPerMicron(0.0, 10.0), InvalidValue);
    EXPECT_SPOTMAP_ERROR(pixelsPerMicron(10.0, 0.0), InvalidValue);
    EXPECT_SPOTMAP_ERROR(pixelsPerMicron(10.0, -5.0), InvalidValue);
}

TEST(Scale, RatioRoundingToZeroIsInvalid)
{
    EXPECT_SPOTMAP_ERROR(pixelsPerMicron(1.0, 300.0), InvalidValue);
    EXPECT_DOUBLE_EQ(pixelsPerMicron(1.0, 200.0), 0.01);
}
