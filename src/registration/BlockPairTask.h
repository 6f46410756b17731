/**
 * @file BlockPairTask.h
 * @brief Registration of one fixed block against its moving counterpart
 */

#ifndef BLOCKFUSE_BLOCK_PAIR_TASK_H
#define BLOCKFUSE_BLOCK_PAIR_TASK_H

#include "../block/BlockPartitioner.h"
#include "../block/ImageSource.h"
#include "../core/Logger.h"
#include "BlockResults.h"
#include "RegistrationMethods.h"

#include <memory>
#include <string>
#include <vector>

namespace blockfuse {

struct BlockPairTaskConfig {
  // Total padding per axis as a fraction of the block length, array order.
  // Empty means no padding.
  std::vector<double> overlap_factors;

  // When set, subimages are written to <dir>/<chunk>/ before registration
  std::string debug_output_directory;
};

/**
 * @brief Fetches a padded block pair and runs the registration method on it
 *
 * Every recoverable problem (region outside a volume, no moving signal,
 * method error, invalid result) becomes BlockPairResult::Failure() and is
 * logged. Image source errors propagate.
 *
 * Each Run creates its own image sources, so one task object can serve
 * concurrent calls.
 */
class BlockPairTask {
private:
  ImageSourceFactory m_fixed_source;
  ImageSourceFactory m_moving_source;
  std::shared_ptr<const BlockPairRegistrationMethod> m_method;
  TransformType::ConstPointer m_initial_transform;
  BlockPairTaskConfig m_config;
  Logger m_logger;

public:
  BlockPairTask(ImageSourceFactory fixed_source,
                ImageSourceFactory moving_source,
                std::shared_ptr<const BlockPairRegistrationMethod> method,
                TransformType::ConstPointer initial_transform,
                BlockPairTaskConfig config, Logger logger);

  BlockPairResult Run(const BlockDescriptor &block) const;

  // Per-axis padding in array order: ceil(length * overlap / 2)
  static std::vector<size_t>
  ComputePadding(const std::vector<size_t> &block_shape,
                 const std::vector<double> &overlap_factors);

private:
  BlockPairResult RegisterBlock(const BlockDescriptor &block,
                                const BlockContext &context) const;

  void WriteDebugSubimages(const BlockDescriptor &block,
                           const ImageType *fixed_subimage,
                           const ImageType *moving_subimage,
                           const Logger &logger) const;
};

// True if any buffered voxel is non-zero
bool HasSignal(const ImageType *image);

} // namespace blockfuse

#endif // BLOCKFUSE_BLOCK_PAIR_TASK_H
