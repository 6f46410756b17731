/**
 * @file ReduceMethods.h
 * @brief Concrete strategies that fuse block results into one transform
 */

#ifndef BLOCKFUSE_REDUCE_METHODS_H
#define BLOCKFUSE_REDUCE_METHODS_H

#include "../registration/RegistrationMethods.h"
#include "DisplacementFieldSynthesizer.h"

#include <memory>
#include <string>

namespace blockfuse {

/**
 * @brief Blends successful block transforms into a displacement field
 *
 * Block transforms are weighted by their distance to the domain edge and
 * sampled over the fixed volume after the initial transform.
 */
class ReduceToDisplacementFieldMethod : public ReduceResultsMethod {
private:
  DisplacementFieldConfig m_config;

public:
  explicit ReduceToDisplacementFieldMethod(
      const DisplacementFieldConfig &config = DisplacementFieldConfig());

  /**
   * @throws ReductionException when no block succeeded
   */
  RegistrationTransformResult
  operator()(const std::vector<LocatedBlockResult> &block_results,
             const ImageSourceFactory &fixed_source,
             const TransformType *initial_transform,
             const Logger &logger) const override;

  // Collection of every successful block, distance-weighted blending
  static TransformCollection
  CollectTransforms(const std::vector<LocatedBlockResult> &block_results,
                    const Logger &logger);
};

/**
 * @brief Averages rigid block results into one Euler transform
 *
 * A block transform that is a composite of exactly one Euler transform is
 * unwrapped first.
 */
class EulerConsensusReduceMethod : public ReduceResultsMethod {
public:
  /**
   * @throws ReductionException for a non-rigid block transform or when no
   *         block succeeded
   */
  RegistrationTransformResult
  operator()(const std::vector<LocatedBlockResult> &block_results,
             const ImageSourceFactory &fixed_source,
             const TransformType *initial_transform,
             const Logger &logger) const override;
};

struct ReduceMethodConfig {
  enum class Type { DisplacementField, EulerConsensus };

  Type type = Type::DisplacementField;
  DisplacementFieldConfig displacement_field;

  static Type ParseType(const std::string &name);
  static std::string TypeToString(Type type);
};

std::shared_ptr<const ReduceResultsMethod>
MakeReduceResultsMethod(const ReduceMethodConfig &config);

} // namespace blockfuse

#endif // BLOCKFUSE_REDUCE_METHODS_H
