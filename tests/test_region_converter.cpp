/**
 * Unit Tests for the voxel and physical region conversions
 */

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "../src/block/ImageBlock.h"
#include "../src/block/RegionConverter.h"
#include "../src/core/BlockFuseExceptions.h"
#include "TestUtilities.h"

// ITK Headers
#include "itkEuler3DTransform.h"
#include "itkMath.h"

using namespace blockfuse;
using namespace blockfuse::testing;

namespace {

// ITK refuses to store non-positive spacing, so report it instead
class DegenerateSpacingImage : public ImageBaseType {
public:
    using Self = DegenerateSpacingImage;
    using Pointer = itk::SmartPointer<Self>;
    itkNewMacro(Self);

    const SpacingType &GetSpacing() const override { return m_ReportedSpacing; }
    void SetReportedSpacing(double i, double j, double k) {
        m_ReportedSpacing[0] = i;
        m_ReportedSpacing[1] = j;
        m_ReportedSpacing[2] = k;
    }

protected:
    DegenerateSpacingImage() { m_ReportedSpacing.Fill(1.0); }

private:
    SpacingType m_ReportedSpacing;
};

} // namespace

class RegionConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        tolerance = 1e-9;
        unit_image = CreateTestImage(MakeSize(20, 20, 20));
    }

    void ExpectTripleNear(const Triple& actual, const Triple& expected) {
        for (unsigned int dim = 0; dim < Dimension; ++dim) {
            EXPECT_NEAR(actual[dim], expected[dim], tolerance) << "axis " << dim;
        }
    }

    double tolerance;
    ImagePointer unit_image;
};

TEST_F(RegionConverterTest, BlockEdgesSitHalfVoxelBeforeSamples) {
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {10, 10, 10}});
    const PhysicalRegion physical = BlockToPhysicalRegion(block, unit_image);

    ExpectTripleNear(physical.lower, {{-0.5, -0.5, -0.5}});
    ExpectTripleNear(physical.upper, {{9.5, 9.5, 9.5}});
}

TEST_F(RegionConverterTest, SpacingAndOriginApply) {
    ImagePointer image = CreateTestImage(MakeSize(8, 8, 8), {{2.0, 1.0, 0.5}}, {{10.0, 0.0, -1.0}});
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {4, 4, 4}});
    const PhysicalRegion physical = BlockToPhysicalRegion(block, image);

    ExpectTripleNear(physical.lower, {{9.0, -0.5, -1.25}});
    ExpectTripleNear(physical.upper, {{17.0, 3.5, 0.75}});
}

TEST_F(RegionConverterTest, RoundTripPreservesBlock) {
    const BlockRegion block = BlockRegion::FromBounds({{2, 3, 4}, {7, 9, 11}});
    const BlockRegion round_trip = PhysicalToBlockRegion(BlockToPhysicalRegion(block, unit_image), unit_image);

    ExpectTripleNear(round_trip.lower, block.lower);
    ExpectTripleNear(round_trip.upper, block.upper);
}

TEST_F(RegionConverterTest, RoundTripWithFlippedDirection) {
    ImagePointer image = CreateTestImage(MakeSize(8, 8, 8));
    DirectionType direction;
    direction.SetIdentity();
    direction(0, 0) = -1.0;
    image->SetDirection(direction);

    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {4, 4, 4}});
    const PhysicalRegion physical = BlockToPhysicalRegion(block, image);
    EXPECT_NEAR(physical.lower[0], -3.5, tolerance);
    EXPECT_NEAR(physical.upper[0], 0.5, tolerance);

    const BlockRegion round_trip = PhysicalToBlockRegion(physical, image);
    ExpectTripleNear(round_trip.lower, block.lower);
    ExpectTripleNear(round_trip.upper, block.upper);
}

TEST_F(RegionConverterTest, ImageRegionTruncatesFractionalBounds) {
    const BlockRegion block = BlockRegion::FromBounds({{1.7, 2.2, 0.0}, {5.9, 2.0, 3.0}});
    const RegionType region = BlockToImageRegion(block);

    EXPECT_EQ(region.GetIndex()[0], 1);
    EXPECT_EQ(region.GetIndex()[1], 2);
    EXPECT_EQ(region.GetIndex()[2], 0);
    EXPECT_EQ(region.GetSize()[0], 4u);
    EXPECT_EQ(region.GetSize()[1], 0u);
    EXPECT_EQ(region.GetSize()[2], 3u);
}

TEST_F(RegionConverterTest, ImageRegionRoundTrip) {
    IndexType index = {{3, 0, 5}};
    const RegionType region(index, MakeSize(4, 6, 2));
    EXPECT_EQ(BlockToImageRegion(ImageToBlockRegion(region)), region);
    EXPECT_EQ(PhysicalToImageRegion(ImageToPhysicalRegion(region, unit_image), unit_image), region);
}

TEST_F(RegionConverterTest, MalformedBoundsAreRejected) {
    EXPECT_THROW(BlockRegion::FromBounds({{0, 0}, {1, 1}}), ValidationException);
    EXPECT_THROW(BlockRegion::FromBounds({{0, 0, 0}}), ValidationException);
    EXPECT_THROW(PhysicalRegion::FromBounds({{0, 0, 0}, {1, 1, 1}, {2, 2, 2}}), ValidationException);
}

TEST_F(RegionConverterTest, NullReferenceImageIsRejected) {
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {1, 1, 1}});
    EXPECT_THROW(BlockToPhysicalRegion(block, nullptr), ValidationException);
    EXPECT_THROW(PhysicalToBlockRegion(PhysicalRegion(), nullptr), ValidationException);
}

TEST_F(RegionConverterTest, NonPositiveSpacingIsRejected) {
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {1, 1, 1}});
    const PhysicalRegion physical = PhysicalRegion::FromBounds({{0, 0, 0}, {1, 1, 1}});

    auto negative = DegenerateSpacingImage::New();
    negative->SetReportedSpacing(1.0, -1.0, 1.0);
    EXPECT_THROW(BlockToPhysicalRegion(block, negative), ValidationException);
    EXPECT_THROW(PhysicalToBlockRegion(physical, negative), ValidationException);

    auto zero = DegenerateSpacingImage::New();
    zero->SetReportedSpacing(0.0, 1.0, 1.0);
    EXPECT_THROW(BlockToPhysicalRegion(block, zero), ValidationException);
}

TEST_F(RegionConverterTest, BoundingBoxOfRotatedRegion) {
    auto rotation = itk::Euler3DTransform<double>::New();
    rotation->SetRotation(0.0, 0.0, itk::Math::pi / 2.0);

    const PhysicalRegion region = PhysicalRegion::FromBounds({{0, 0, 0}, {1, 2, 3}});
    const PhysicalRegion bounds = EstimateBoundingBox(region, rotation);

    constexpr double ROTATION_TOLERANCE = 1e-6;
    EXPECT_NEAR(bounds.lower[0], -2.0, ROTATION_TOLERANCE);
    EXPECT_NEAR(bounds.upper[0], 0.0, ROTATION_TOLERANCE);
    EXPECT_NEAR(bounds.lower[1], 0.0, ROTATION_TOLERANCE);
    EXPECT_NEAR(bounds.upper[1], 1.0, ROTATION_TOLERANCE);
    EXPECT_NEAR(bounds.lower[2], 0.0, ROTATION_TOLERANCE);
    EXPECT_NEAR(bounds.upper[2], 3.0, ROTATION_TOLERANCE);

    EXPECT_THROW(EstimateBoundingBox(region, nullptr), ValidationException);
}

TEST_F(RegionConverterTest, BlockSizesAcrossSpacings) {
    ImagePointer coarse = CreateTestImage(MakeSize(10, 10, 10), {{2.0, 2.0, 2.0}});

    const Triple physical_size = BlockToPhysicalSize(MakeSize(4, 4, 4), coarse);
    ExpectTripleNear(physical_size, {{8.0, 8.0, 8.0}});
    EXPECT_EQ(PhysicalToBlockSize(physical_size, coarse), MakeSize(4, 4, 4));

    EXPECT_EQ(GetTargetBlockSize(MakeSize(10, 6, 4), unit_image, coarse), MakeSize(5, 3, 2));
}

TEST_F(RegionConverterTest, TargetRegionFollowsTransform) {
    ImagePointer target = CreateTestImage(MakeSize(12, 20, 20));
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {10, 10, 10}});
    TransformType::ConstPointer shift = CreateTranslation(5.0, 0.0, 0.0);

    const BlockRegion mapped = GetTargetBlockRegion(block, unit_image, target, shift);
    ExpectTripleNear(mapped.lower, {{5.0, 0.0, 0.0}});
    ExpectTripleNear(mapped.upper, {{15.0, 10.0, 10.0}});

    const BlockRegion cropped = GetTargetBlockRegion(block, unit_image, target, shift, true);
    ExpectTripleNear(cropped.lower, {{5.0, 0.0, 0.0}});
    ExpectTripleNear(cropped.upper, {{12.0, 10.0, 10.0}});
    EXPECT_TRUE(target->GetLargestPossibleRegion().IsInside(BlockToImageRegion(cropped)));
}

TEST_F(RegionConverterTest, DisjointTargetRegionIsEmpty) {
    const BlockRegion block = BlockRegion::FromBounds({{0, 0, 0}, {10, 10, 10}});
    TransformType::ConstPointer far_away = CreateTranslation(100.0, 0.0, 0.0);

    const BlockRegion cropped = GetTargetBlockRegion(block, unit_image, unit_image, far_away, true);
    EXPECT_TRUE(cropped.IsEmpty());
    EXPECT_EQ(BlockToImageRegion(cropped).GetNumberOfPixels(), 0u);
}

TEST_F(RegionConverterTest, SampleBoundsAndMidpoint) {
    ImagePointer image = CreateTestImage(MakeSize(4, 4, 4), {{1.0, 1.0, 1.0}}, {{1.0, 1.0, 1.0}});
    const PhysicalRegion bounds = GetSampleBounds(image);
    ExpectTripleNear(bounds.lower, {{0.5, 0.5, 0.5}});
    ExpectTripleNear(bounds.upper, {{4.5, 4.5, 4.5}});
    ExpectTripleNear(GetPhysicalMidpoint(image), {{2.5, 2.5, 2.5}});

    PointType on_edge;
    on_edge.Fill(4.5);
    EXPECT_TRUE(bounds.Contains(on_edge));
    on_edge[0] = 4.6;
    EXPECT_FALSE(bounds.Contains(on_edge));
}

TEST_F(RegionConverterTest, SamplingGridCoversRegion) {
    const PhysicalRegion region = PhysicalRegion::FromBounds({{0, 0, 0}, {10, 10, 10}});
    SpacingType spacing;
    spacing.Fill(2.0);
    DirectionType direction;
    direction.SetIdentity();

    auto image = PhysicalRegionToImage<ImageType>(region, spacing, direction);
    EXPECT_EQ(image->GetLargestPossibleRegion().GetSize(), MakeSize(5, 5, 5));
    EXPECT_NEAR(image->GetOrigin()[0], 1.0, tolerance);

    // Grids only cover whole voxels, centered on the region
    spacing.Fill(3.0);
    const ImageGeometry extended = ComputeSamplingGrid(region, spacing, direction, true);
    const ImageGeometry inside = ComputeSamplingGrid(region, spacing, direction, false);
    EXPECT_EQ(extended.size, MakeSize(4, 4, 4));
    EXPECT_EQ(inside.size, MakeSize(3, 3, 3));
    EXPECT_NEAR(extended.origin[0], -1.0 + 1.5, tolerance);
    EXPECT_NEAR(inside.origin[0], 0.5 + 1.5, tolerance);
}

TEST_F(RegionConverterTest, SamplingGridRejectsObliqueDirection) {
    const PhysicalRegion region = PhysicalRegion::FromBounds({{0, 0, 0}, {10, 10, 10}});
    SpacingType spacing;
    spacing.Fill(1.0);
    DirectionType direction;
    direction.SetIdentity();
    direction(0, 1) = 0.5;

    EXPECT_THROW(ComputeSamplingGrid(region, spacing, direction), ValidationException);
}
