/**
 * @file DisplacementFieldSynthesizer.h
 * @brief Rasterization of a transform collection into a displacement field
 */

#ifndef BLOCKFUSE_DISPLACEMENT_FIELD_SYNTHESIZER_H
#define BLOCKFUSE_DISPLACEMENT_FIELD_SYNTHESIZER_H

#include "../core/BlockFuseTypes.h"
#include "../core/Logger.h"
#include "TransformCollection.h"

namespace blockfuse {

struct DisplacementFieldConfig {
  // Output spacing relative to the reference spacing, (I,J,K)
  Triple scale_factors{{1.0, 1.0, 1.0}};

  // Zero keeps the ITK multi-threader default
  unsigned int number_of_work_units = 0;

  // Throws ConfigurationException for non-positive scale factors
  void Validate() const;
};

class DisplacementFieldSynthesizer {
private:
  DisplacementFieldConfig m_config;
  Logger m_logger;

public:
  explicit DisplacementFieldSynthesizer(
      const DisplacementFieldConfig &config = DisplacementFieldConfig(),
      Logger logger = Logger());

  /**
   * @brief Sample the collection over the reference extent
   *
   * The output grid covers the reference sample bounds after
   * @p initial_transform, with the reference direction and the reference
   * spacing scaled by the configured factors. Each voxel stores
   * TransformPoint(p) - p. Voxels no entry covers keep a zero displacement.
   *
   * The result is meant to be applied after @p initial_transform.
   */
  DisplacementFieldTransformType::Pointer
  Synthesize(const TransformCollection &collection,
             const ImageBaseType *reference_image,
             const TransformType *initial_transform) const;

  // Unallocated output grid for the given reference
  DisplacementFieldType::Pointer
  MakeOutputGrid(const ImageBaseType *reference_image,
                 const TransformType *initial_transform) const;

  const DisplacementFieldConfig &GetConfig() const { return m_config; }
};

} // namespace blockfuse

#endif // BLOCKFUSE_DISPLACEMENT_FIELD_SYNTHESIZER_H
