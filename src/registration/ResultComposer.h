/**
 * @file ResultComposer.h
 * @brief Packaging of block statuses and the fused transform
 */

#ifndef BLOCKFUSE_RESULT_COMPOSER_H
#define BLOCKFUSE_RESULT_COMPOSER_H

#include "../block/BlockPartitioner.h"
#include "BlockResults.h"

#include <vector>

namespace blockfuse {

/**
 * @brief Status grid shaped like the partition
 *
 * results[i] belongs to blocks[i]. Cells without a block stay Failure.
 *
 * @throws ValidationException when the lengths differ or a chunk index
 *         falls outside the partition
 */
StatusGrid ComposeBlockStatus(const std::vector<size_t> &partition_shape,
                              const std::vector<BlockDescriptor> &blocks,
                              const std::vector<BlockPairResult> &results);

RegistrationResult ComposeOutput(RegistrationTransformResult transform_result,
                                 StatusGrid status);

} // namespace blockfuse

#endif // BLOCKFUSE_RESULT_COMPOSER_H
