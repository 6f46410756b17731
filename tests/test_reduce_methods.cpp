/**
 * Unit Tests for rigid transform utilities and the reduce methods
 */

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "../src/block/ImageSource.h"
#include "../src/core/BlockFuseExceptions.h"
#include "../src/fusion/MatrixTransform.h"
#include "../src/fusion/ReduceMethods.h"
#include "TestUtilities.h"

// ITK Headers
#include "itkCompositeTransform.h"
#include "itkMath.h"

using namespace blockfuse;
using namespace blockfuse::testing;

namespace {

using CompositeTransformType = itk::CompositeTransform<ScalarType, Dimension>;

EulerTransformType::Pointer MakeEuler(double angle_z, double tx, double ty, double tz) {
    auto transform = EulerTransformType::New();
    transform->SetRotation(0.0, 0.0, angle_z);
    EulerTransformType::OutputVectorType translation;
    translation[0] = tx;
    translation[1] = ty;
    translation[2] = tz;
    transform->SetTranslation(translation);
    return transform;
}

RotationMatrixType RotationAboutZ(double angle) {
    return MakeEuler(angle, 0.0, 0.0, 0.0)->GetMatrix();
}

BlockDescriptor MakeBlock(size_t k) {
    return BlockDescriptor({k, 0, 0}, {VoxelSlice{k * 5, k * 5 + 5}, VoxelSlice{0, 10}, VoxelSlice{0, 10}});
}

LocatedBlockResult MakeLocated(size_t k, TransformType::ConstPointer transform) {
    if (transform.IsNull()) {
        return LocatedBlockResult{MakeBlock(k), BlockPairResult::Failure()};
    }
    // Domain spans the block's K slab of a 10^3 volume
    Triple origin = {{0.0, 0.0, static_cast<double>(k * 5)}};
    return LocatedBlockResult{MakeBlock(k),
                              BlockPairResult::Success(transform, CreateDomain(origin, MakeSize(10, 10, 5)))};
}

} // namespace

class MatrixTransformTest : public ::testing::Test {
protected:
    void SetUp() override {
        tolerance = 1e-6;
    }

    void ExpectMatrixNear(const RotationMatrixType& actual, const RotationMatrixType& expected) {
        for (unsigned int row = 0; row < 3; ++row) {
            for (unsigned int col = 0; col < 3; ++col) {
                EXPECT_NEAR(actual(row, col), expected(row, col), tolerance)
                    << "element (" << row << "," << col << ")";
            }
        }
    }

    double tolerance;
};

TEST_F(MatrixTransformTest, FlattenNestedComposites) {
    TransformType::ConstPointer a = CreateTranslation(1.0, 0.0, 0.0);
    TransformType::ConstPointer b = CreateTranslation(2.0, 0.0, 0.0);
    auto c = MakeEuler(0.1, 0.0, 0.0, 0.0);

    auto inner = CompositeTransformType::New();
    inner->AddTransform(const_cast<TransformType*>(b.GetPointer()));
    inner->AddTransform(c);

    auto outer = CompositeTransformType::New();
    outer->AddTransform(const_cast<TransformType*>(a.GetPointer()));
    outer->AddTransform(inner);

    const auto leaves = FlattenTransform(outer);
    ASSERT_EQ(leaves.size(), 3u);
    EXPECT_EQ(leaves[0].GetPointer(), a.GetPointer());
    EXPECT_EQ(leaves[1].GetPointer(), b.GetPointer());
    EXPECT_EQ(leaves[2].GetPointer(), c.GetPointer());

    EXPECT_EQ(FlattenTransform(a).size(), 1u);
    EXPECT_TRUE(FlattenTransform(nullptr).empty());
}

TEST_F(MatrixTransformTest, HomogeneousMatrixUsesOffset) {
    auto euler = MakeEuler(itk::Math::pi / 2.0, 1.0, 2.0, 3.0);
    const HomogeneousMatrixType matrix = MatrixTransformToMatrix(euler);

    EXPECT_NEAR(matrix(0, 3), 1.0, tolerance);
    EXPECT_NEAR(matrix(1, 3), 2.0, tolerance);
    EXPECT_NEAR(matrix(2, 3), 3.0, tolerance);
    EXPECT_NEAR(matrix(3, 3), 1.0, tolerance);
    EXPECT_NEAR(matrix(0, 1), -1.0, tolerance);

    EXPECT_THROW(MatrixTransformToMatrix(nullptr), ValidationException);
}

TEST_F(MatrixTransformTest, RotationValidation) {
    EXPECT_TRUE(IsRotationMatrix(RotationAboutZ(0.3)));

    RotationMatrixType reflection;
    reflection.SetIdentity();
    reflection(0, 0) = -1.0;
    EXPECT_FALSE(IsRotationMatrix(reflection));

    RotationMatrixType scaled;
    scaled.SetIdentity();
    scaled(1, 1) = 2.0;
    EXPECT_FALSE(IsRotationMatrix(scaled));
    EXPECT_THROW(AverageRotation({scaled}), ValidationException);
    EXPECT_THROW(AverageRotation({}), ValidationException);
}

TEST_F(MatrixTransformTest, OppositeRotationsAverageToIdentity) {
    RotationMatrixType identity;
    identity.SetIdentity();
    ExpectMatrixNear(AverageRotation({RotationAboutZ(0.2), RotationAboutZ(-0.2)}), identity);
}

TEST_F(MatrixTransformTest, AveragingAlignsQuaternionHemispheres) {
    // 170 and -170 degrees meet at 180, not at 0
    const double angle = 170.0 * itk::Math::pi / 180.0;
    ExpectMatrixNear(AverageRotation({RotationAboutZ(angle), RotationAboutZ(-angle)}),
                     RotationAboutZ(itk::Math::pi));
}

TEST_F(MatrixTransformTest, ConsensusAveragesTranslation) {
    std::vector<HomogeneousMatrixType> samples;
    samples.push_back(MatrixTransformToMatrix(MakeEuler(0.1, 1.0, 0.0, 0.0)));
    samples.push_back(MatrixTransformToMatrix(MakeEuler(-0.1, 3.0, 2.0, 0.0)));

    const HomogeneousMatrixType consensus = EstimateEulerTransformConsensus(samples);
    EXPECT_NEAR(consensus(0, 3), 2.0, tolerance);
    EXPECT_NEAR(consensus(1, 3), 1.0, tolerance);
    EXPECT_NEAR(consensus(0, 0), 1.0, tolerance);

    auto euler = ToEulerTransform(consensus);
    PointType origin;
    origin.Fill(0.0);
    const PointType mapped = euler->TransformPoint(origin);
    EXPECT_NEAR(mapped[0], 2.0, tolerance);
    EXPECT_NEAR(mapped[1], 1.0, tolerance);
}

class ReduceMethodsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tolerance = 1e-6;
        fixed_source = MakeInMemoryImageSourceFactory(CreateTestImage(MakeSize(10, 10, 10)).GetPointer(), "fixed");
    }

    double tolerance;
    ImageSourceFactory fixed_source;
};

TEST_F(ReduceMethodsTest, EulerConsensusOfRigidBlocks) {
    auto wrapped = CompositeTransformType::New();
    wrapped->AddTransform(MakeEuler(0.0, 3.0, 0.0, 0.0));

    const std::vector<LocatedBlockResult> results{
        MakeLocated(0, MakeEuler(0.0, 1.0, 0.0, 0.0).GetPointer()),
        MakeLocated(1, wrapped.GetPointer()),
    };

    EulerConsensusReduceMethod method;
    const RegistrationTransformResult output = method(results, fixed_source, nullptr, Logger::Silent());

    PointType point;
    point.Fill(0.0);
    const PointType mapped = output.GetTransform()->TransformPoint(point);
    EXPECT_NEAR(mapped[0], 2.0, tolerance);
    EXPECT_NEAR(mapped[1], 0.0, tolerance);
}

TEST_F(ReduceMethodsTest, EulerConsensusIgnoresFailedBlocks) {
    const std::vector<LocatedBlockResult> results{
        MakeLocated(0, MakeEuler(0.0, 1.0, 0.0, 0.0).GetPointer()),
        MakeLocated(1, nullptr),
    };

    EulerConsensusReduceMethod method;
    const RegistrationTransformResult output = method(results, fixed_source, nullptr, Logger::Silent());
    PointType point;
    point.Fill(0.0);
    EXPECT_NEAR(output.GetTransform()->TransformPoint(point)[0], 1.0, tolerance);
}

TEST_F(ReduceMethodsTest, EulerConsensusRejectsNonRigidTransforms) {
    const std::vector<LocatedBlockResult> results{MakeLocated(0, CreateTranslation(1.0, 0.0, 0.0))};
    EulerConsensusReduceMethod method;
    EXPECT_THROW(method(results, fixed_source, nullptr, Logger::Silent()), ReductionException);

    const std::vector<LocatedBlockResult> failures{MakeLocated(0, nullptr)};
    EXPECT_THROW(method(failures, fixed_source, nullptr, Logger::Silent()), ReductionException);
}

TEST_F(ReduceMethodsTest, CollectTransformsKeepsSuccessesOnly) {
    const std::vector<LocatedBlockResult> results{
        MakeLocated(0, CreateTranslation(1.0, 1.0, 1.0)),
        MakeLocated(1, nullptr),
    };
    const TransformCollection collection =
        ReduceToDisplacementFieldMethod::CollectTransforms(results, Logger::Silent());
    EXPECT_EQ(collection.GetNumberOfEntries(), 1u);
    EXPECT_TRUE(collection.GetEntries().front().IsBounded());
}

TEST_F(ReduceMethodsTest, DisplacementFieldBlendsBlockTransforms) {
    const std::vector<LocatedBlockResult> results{
        MakeLocated(0, CreateTranslation(1.0, 1.0, 1.0)),
        MakeLocated(1, CreateTranslation(1.0, 1.0, 1.0)),
    };

    DisplacementFieldConfig config;
    config.scale_factors = {{2.0, 2.0, 2.0}};
    ReduceToDisplacementFieldMethod method(config);
    const RegistrationTransformResult output = method(results, fixed_source, nullptr, Logger::Silent());

    const auto* field_transform =
        dynamic_cast<const DisplacementFieldTransformType*>(output.GetTransform());
    ASSERT_NE(field_transform, nullptr);
    EXPECT_EQ(field_transform->GetDisplacementField()->GetLargestPossibleRegion().GetSize(),
              MakeSize(5, 5, 5));

    PointType center;
    center.Fill(4.5);
    const PointType mapped = field_transform->TransformPoint(center);
    for (unsigned int dim = 0; dim < Dimension; ++dim) {
        EXPECT_NEAR(mapped[dim], 5.5, tolerance);
    }
}

TEST_F(ReduceMethodsTest, DisplacementFieldRequiresOneSuccess) {
    const std::vector<LocatedBlockResult> failures{MakeLocated(0, nullptr), MakeLocated(1, nullptr)};
    ReduceToDisplacementFieldMethod method;
    EXPECT_THROW(method(failures, fixed_source, nullptr, Logger::Silent()), ReductionException);
}

TEST_F(ReduceMethodsTest, FactorySelectsMethod) {
    ReduceMethodConfig config;
    config.type = ReduceMethodConfig::ParseType("euler_consensus");
    EXPECT_NE(std::dynamic_pointer_cast<const EulerConsensusReduceMethod>(MakeReduceResultsMethod(config)),
              nullptr);

    config.type = ReduceMethodConfig::ParseType("displacement_field");
    EXPECT_NE(std::dynamic_pointer_cast<const ReduceToDisplacementFieldMethod>(MakeReduceResultsMethod(config)),
              nullptr);
    EXPECT_EQ(ReduceMethodConfig::TypeToString(config.type), "displacement_field");

    EXPECT_THROW(ReduceMethodConfig::ParseType("elastix"), ConfigurationException);
}
