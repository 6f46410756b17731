/**
 * @file RegistrationMethods.h
 * @brief Pluggable block registration and reduction capabilities
 */

#ifndef BLOCKFUSE_REGISTRATION_METHODS_H
#define BLOCKFUSE_REGISTRATION_METHODS_H

#include "../block/BlockPartitioner.h"
#include "../block/ImageSource.h"
#include "../core/BlockFuseTypes.h"
#include "../core/Logger.h"
#include "BlockResults.h"

#include <vector>

namespace blockfuse {

// Per-block call context; the logger is tagged with the chunk index
struct BlockContext {
  Logger logger;
};

/**
 * @brief Registers one fixed/moving block pair
 *
 * The fixed subimage's requested region is the unpadded block and its
 * buffered region adds the overlap padding. The moving subimage's requested
 * region approximates the same physical bounds after the initial transform.
 *
 * Implementations must be safe to call concurrently and must leave the
 * metadata of both inputs unchanged. Thrown exceptions are converted to a
 * failed block by the caller.
 */
class BlockPairRegistrationMethod {
public:
  virtual ~BlockPairRegistrationMethod() = default;

  /**
   * @param initial_transform maps fixed to moving space, may be null
   * @return forward transform to be applied after @p initial_transform and
   *         the fixed-space domain over which it holds
   */
  virtual BlockPairResult operator()(const ImageType *fixed_subimage,
                                     const ImageType *moving_subimage,
                                     const TransformType *initial_transform,
                                     const BlockDescriptor &block_info,
                                     const BlockContext &context) const = 0;
};

/**
 * @brief Fuses every located block result into one transform
 *
 * Receives one entry per block, failed blocks included. Called once per
 * registration, after every block finished.
 */
class ReduceResultsMethod {
public:
  virtual ~ReduceResultsMethod() = default;

  virtual RegistrationTransformResult
  operator()(const std::vector<LocatedBlockResult> &block_results,
             const ImageSourceFactory &fixed_source,
             const TransformType *initial_transform,
             const Logger &logger) const = 0;
};

} // namespace blockfuse

#endif // BLOCKFUSE_REGISTRATION_METHODS_H
