/**
 * @file TransformCollection.h
 * @brief Piecewise transform assembled from bounded block transforms
 */

#ifndef BLOCKFUSE_TRANSFORM_COLLECTION_H
#define BLOCKFUSE_TRANSFORM_COLLECTION_H

#include "../block/RegionConverter.h"
#include "../core/BlockFuseTypes.h"
#include "../core/Logger.h"

#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace blockfuse {

/**
 * @brief A transform and the oriented domain where it is valid
 *
 * A null domain means the transform is valid everywhere. The domain's voxel
 * grid is ignored; only its sampled physical bounds matter.
 */
struct TransformEntry {
  TransformType::ConstPointer transform;
  ImageBaseType::ConstPointer domain;

  bool IsBounded() const { return domain.IsNotNull(); }
};

/**
 * @brief Ordered collection of possibly bounded transforms
 *
 * A point is mapped by every entry whose domain contains it and the
 * candidates are blended. Appends are not thread safe; concurrent
 * TransformPoint calls on a finished collection are.
 */
class TransformCollection {
public:
  using BlendFunction = std::function<PointType(
      const PointType &, const std::vector<const TransformEntry *> &,
      const Logger &)>;

  // Floor for blend weights and fixed weight of unbounded entries
  static constexpr double MIN_WEIGHT = 1e-9;

private:
  std::vector<TransformEntry> m_entries;
  std::vector<std::optional<PhysicalRegion>> m_bounds;
  BlendFunction m_blend;
  Logger m_logger;

public:
  explicit TransformCollection(BlendFunction blend = BlendDistanceWeightedMean,
                               Logger logger = Logger());

  /**
   * @throws ValidationException for a null transform or a domain with an
   *         empty region
   */
  void Push(const TransformEntry &entry);

  /**
   * @brief Blend the outputs of every entry covering @p point
   * @throws CoverageException when no entry covers the point
   */
  PointType TransformPoint(const PointType &point) const;

  // Entries whose domain is absent or contains the point, in insertion order
  std::vector<const TransformEntry *>
  GetContributors(const PointType &point) const;

  const std::vector<TransformEntry> &GetEntries() const { return m_entries; }
  std::vector<TransformType::ConstPointer> GetTransforms() const;
  std::vector<ImageBaseType::ConstPointer> GetDomains() const;
  size_t GetNumberOfEntries() const { return m_entries.size(); }
  bool Empty() const { return m_entries.empty(); }

  // Unweighted average of candidates; discontinuous at domain edges
  static PointType
  BlendSimpleMean(const PointType &point,
                  const std::vector<const TransformEntry *> &contributors,
                  const Logger &logger);

  /**
   * @brief Average weighted by the distance to each domain's nearest face
   *
   * Unbounded entries get MIN_WEIGHT, so they only matter where nothing
   * else covers the point. Weights on a boundary are raised to MIN_WEIGHT.
   * A negative weight means the point lies outside a contributing domain and
   * is logged as an error.
   */
  static PointType BlendDistanceWeightedMean(
      const PointType &point,
      const std::vector<const TransformEntry *> &contributors,
      const Logger &logger);

  /**
   * @brief Signed voxel distance to the nearest face along each axis (I,J,K)
   *
   * Positive inside the sampled bounds of the domain.
   */
  static Triple PixelDistanceFromEdge(const PointType &point,
                                      const ImageBaseType *domain);

  /**
   * @brief Signed physical distance to the nearest face and its voxel axis
   */
  static std::pair<double, unsigned int>
  PhysicalDistanceFromEdge(const PointType &point, const ImageBaseType *domain);
};

} // namespace blockfuse

#endif // BLOCKFUSE_TRANSFORM_COLLECTION_H
