/**
 * Unit Tests for block results, the status grid and result composition
 */

#include <gtest/gtest.h>
#include <vector>

#include "../src/block/BlockPartitioner.h"
#include "../src/core/BlockFuseExceptions.h"
#include "../src/registration/BlockResults.h"
#include "../src/registration/ResultComposer.h"
#include "TestUtilities.h"

using namespace blockfuse;
using namespace blockfuse::testing;

class BlockResultsTest : public ::testing::Test {
protected:
    void SetUp() override {
        transform = CreateTranslation(1.0, 0.0, 0.0);
        domain = CreateDomain({{0.0, 0.0, 0.0}}, MakeSize(4, 4, 4));
    }

    TransformType::ConstPointer transform;
    ImageBaseType::ConstPointer domain;
};

TEST_F(BlockResultsTest, FailureCarriesNothing) {
    const BlockPairResult failure = BlockPairResult::Failure();
    EXPECT_FALSE(failure.IsSuccess());
    EXPECT_EQ(failure.GetStatus(), BlockRegStatus::Failure);
    EXPECT_EQ(failure.GetTransform(), nullptr);
    EXPECT_EQ(failure.GetTransformDomain(), nullptr);
    EXPECT_FALSE(failure.HasInverseTransform());
}

TEST_F(BlockResultsTest, SuccessKeepsTransformAndDomain) {
    const BlockPairResult success = BlockPairResult::Success(transform, domain);
    EXPECT_TRUE(success.IsSuccess());
    EXPECT_EQ(success.GetTransform(), transform.GetPointer());
    EXPECT_EQ(success.GetTransformDomain(), domain.GetPointer());
}

TEST_F(BlockResultsTest, InvariantsAreEnforced) {
    // Success without a transform
    EXPECT_THROW(BlockPairResult(BlockRegStatus::Success, nullptr, nullptr), ValidationException);
    // Transform without a domain and the reverse
    EXPECT_THROW(BlockPairResult(BlockRegStatus::Success, transform, nullptr), ValidationException);
    EXPECT_THROW(BlockPairResult(BlockRegStatus::Failure, nullptr, domain), ValidationException);
    // Inverse without forward
    EXPECT_THROW(BlockPairResult(BlockRegStatus::Failure, nullptr, nullptr, transform, domain),
                 ValidationException);
    // Inverse without its domain
    EXPECT_THROW(BlockPairResult(BlockRegStatus::Success, transform, domain, transform, nullptr),
                 ValidationException);
}

TEST_F(BlockResultsTest, EmptyDomainIsRejected) {
    ImageBaseType::ConstPointer empty_domain = CreateDomain({{0.0, 0.0, 0.0}}, MakeSize(4, 0, 4));
    EXPECT_THROW(BlockPairResult::Success(transform, empty_domain), ValidationException);
}

TEST_F(BlockResultsTest, FailureMayKeepDiagnosticTransform) {
    const BlockPairResult result(BlockRegStatus::Failure, transform, domain, transform, domain);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_TRUE(result.HasInverseTransform());
}

TEST_F(BlockResultsTest, RegistrationResultRequiresForwardTransform) {
    EXPECT_THROW(RegistrationTransformResult(nullptr), ValidationException);
    const RegistrationTransformResult result(transform);
    EXPECT_EQ(result.GetInverseTransform(), nullptr);
}

TEST(StatusGridTest, DefaultsToFailure) {
    StatusGrid grid({2, 3, 4});
    EXPECT_EQ(grid.GetNumberOfElements(), 24u);
    EXPECT_EQ(grid.Count(BlockRegStatus::Failure), 24u);

    grid.Set({1, 2, 3}, BlockRegStatus::Success);
    EXPECT_EQ(grid.At({1, 2, 3}), BlockRegStatus::Success);
    EXPECT_EQ(grid.GetValues().back(), 0u);
    EXPECT_EQ(grid.Count(BlockRegStatus::Success), 1u);
}

TEST(StatusGridTest, IndexValidation) {
    StatusGrid grid({2, 2, 2});
    EXPECT_THROW(grid.At({2, 0, 0}), ValidationException);
    EXPECT_THROW(grid.At({0, 0}), ValidationException);
    EXPECT_EQ(StatusToString(BlockRegStatus::Failure), "FAILURE");
}

TEST(ResultComposerTest, StatusGridMatchesBlocks) {
    BlockPartitioner partitioner({20, 20, 10}, {10, 10, 10});
    std::vector<BlockDescriptor> blocks(partitioner.begin(), partitioner.end());
    ASSERT_EQ(blocks.size(), 4u);

    TransformType::ConstPointer transform = CreateTranslation(0.0, 0.0, 0.0);
    ImageBaseType::ConstPointer domain = CreateDomain({{0.0, 0.0, 0.0}}, MakeSize(2, 2, 2));

    std::vector<BlockPairResult> results;
    for (size_t i = 0; i < blocks.size(); ++i) {
        results.push_back(i % 2 == 0 ? BlockPairResult::Success(transform, domain)
                                     : BlockPairResult::Failure());
    }

    const StatusGrid grid = ComposeBlockStatus(partitioner.GetPartitionShape(), blocks, results);
    EXPECT_EQ(grid.GetShape(), (std::vector<size_t>{2, 2, 1}));
    EXPECT_EQ(grid.At({0, 0, 0}), BlockRegStatus::Success);
    EXPECT_EQ(grid.At({0, 1, 0}), BlockRegStatus::Failure);
    EXPECT_EQ(grid.At({1, 0, 0}), BlockRegStatus::Success);
    EXPECT_EQ(grid.At({1, 1, 0}), BlockRegStatus::Failure);

    results.pop_back();
    EXPECT_THROW(ComposeBlockStatus(partitioner.GetPartitionShape(), blocks, results),
                 ValidationException);
}

TEST(ResultComposerTest, DuplicateChunkIndexIsRejected) {
    BlockPartitioner partitioner({20, 10, 10}, {10, 10, 10});
    std::vector<BlockDescriptor> blocks(partitioner.begin(), partitioner.end());
    ASSERT_EQ(blocks.size(), 2u);
    blocks[1] = blocks[0];

    const std::vector<BlockPairResult> results{BlockPairResult::Failure(), BlockPairResult::Failure()};
    EXPECT_THROW(ComposeBlockStatus(partitioner.GetPartitionShape(), blocks, results),
                 ValidationException);
}

TEST(ResultComposerTest, OutputBundlesTransformAndStatus) {
    TransformType::ConstPointer transform = CreateTranslation(0.0, 0.0, 0.0);
    StatusGrid grid({1, 1, 1}, BlockRegStatus::Success);

    const RegistrationResult output = ComposeOutput(RegistrationTransformResult(transform), grid);
    EXPECT_EQ(output.transforms.GetTransform(), transform.GetPointer());
    EXPECT_EQ(output.status.At({0, 0, 0}), BlockRegStatus::Success);
}
