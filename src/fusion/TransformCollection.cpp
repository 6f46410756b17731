/**
 * @file TransformCollection.cpp
 * @brief Candidate selection and blending
 */

#include "TransformCollection.h"
#include "../block/ImageBlock.h"
#include "../core/BlockFuseExceptions.h"

#include <cmath>

namespace blockfuse {

namespace {

// Signed step along the dominant physical axis of each voxel axis
Triple DominantPhysicalStep(const ImageBaseType *domain) {
  const DirectionType &direction = domain->GetDirection();
  const SpacingType &spacing = domain->GetSpacing();

  Triple physical_step;
  for (unsigned int row = 0; row < Dimension; ++row) {
    unsigned int max_col = 0;
    for (unsigned int col = 1; col < Dimension; ++col) {
      if (std::abs(direction(row, col) * spacing[col]) >
          std::abs(direction(row, max_col) * spacing[max_col])) {
        max_col = col;
      }
    }
    physical_step[row] = direction(row, max_col) * spacing[max_col];
  }
  return physical_step;
}

} // namespace

TransformCollection::TransformCollection(BlendFunction blend, Logger logger)
    : m_blend(std::move(blend)), m_logger(std::move(logger)) {
  if (!m_blend) {
    throw ValidationException("TransformCollection", "blend function is empty",
                              "TransformCollection");
  }
}

void TransformCollection::Push(const TransformEntry &entry) {
  if (entry.transform.IsNull()) {
    throw ValidationException("TransformCollection", "entry transform is null",
                              "Push");
  }

  std::optional<PhysicalRegion> bounds;
  if (entry.domain) {
    if (entry.domain->GetLargestPossibleRegion().GetNumberOfPixels() == 0) {
      throw ValidationException("TransformCollection",
                                "entry domain has an empty region", "Push");
    }
    bounds = GetSampleBounds(entry.domain);
  }

  m_entries.push_back(entry);
  m_bounds.push_back(bounds);
}

std::vector<const TransformEntry *>
TransformCollection::GetContributors(const PointType &point) const {
  std::vector<const TransformEntry *> contributors;
  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (!m_bounds[i] || m_bounds[i]->Contains(point)) {
      contributors.push_back(&m_entries[i]);
    }
  }
  return contributors;
}

PointType TransformCollection::TransformPoint(const PointType &point) const {
  const std::vector<const TransformEntry *> contributors =
      GetContributors(point);
  if (contributors.empty()) {
    throw CoverageException({{point[0], point[1], point[2]}});
  }
  return m_blend(point, contributors, m_logger);
}

std::vector<TransformType::ConstPointer>
TransformCollection::GetTransforms() const {
  std::vector<TransformType::ConstPointer> transforms;
  transforms.reserve(m_entries.size());
  for (const auto &entry : m_entries) {
    transforms.push_back(entry.transform);
  }
  return transforms;
}

std::vector<ImageBaseType::ConstPointer> TransformCollection::GetDomains() const {
  std::vector<ImageBaseType::ConstPointer> domains;
  domains.reserve(m_entries.size());
  for (const auto &entry : m_entries) {
    domains.push_back(entry.domain);
  }
  return domains;
}

PointType TransformCollection::BlendSimpleMean(
    const PointType &point,
    const std::vector<const TransformEntry *> &contributors, const Logger &) {
  if (contributors.empty()) {
    throw CoverageException({{point[0], point[1], point[2]}});
  }

  VectorType sum;
  sum.Fill(0.0);
  for (const TransformEntry *entry : contributors) {
    sum += entry->transform->TransformPoint(point).GetVectorFromOrigin();
  }

  PointType blended;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    blended[dim] = sum[dim] / static_cast<double>(contributors.size());
  }
  return blended;
}

PointType TransformCollection::BlendDistanceWeightedMean(
    const PointType &point,
    const std::vector<const TransformEntry *> &contributors,
    const Logger &logger) {
  if (contributors.empty()) {
    throw CoverageException({{point[0], point[1], point[2]}});
  }

  std::vector<double> weights;
  weights.reserve(contributors.size());
  bool negative_weight = false;
  for (const TransformEntry *entry : contributors) {
    double weight = MIN_WEIGHT;
    if (entry->IsBounded()) {
      weight = PhysicalDistanceFromEdge(point, entry->domain).first;
      negative_weight = negative_weight || weight < 0.0;
    }
    weights.push_back(weight);
  }

  if (negative_weight) {
    logger.Error("Detected at least one negative weight indicating"
                 " a point unexpectedly lies outside a contributing region."
                 " May impact transform blending results.");
  }

  // Points on an inclusive boundary count as a tiny step inside it
  VectorType weighted_sum;
  weighted_sum.Fill(0.0);
  double total_weight = 0.0;
  for (size_t i = 0; i < contributors.size(); ++i) {
    double weight = weights[i];
    if (std::abs(weight) < 1e-8 || weight < MIN_WEIGHT) {
      weight = MIN_WEIGHT;
    }

    const PointType candidate = contributors[i]->transform->TransformPoint(point);
    for (unsigned int dim = 0; dim < Dimension; ++dim) {
      weighted_sum[dim] += weight * candidate[dim];
    }
    total_weight += weight;
  }

  PointType blended;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    blended[dim] = weighted_sum[dim] / total_weight;
  }
  return blended;
}

Triple TransformCollection::PixelDistanceFromEdge(const PointType &point,
                                                  const ImageBaseType *domain) {
  ContinuousIndexType continuous_index;
  domain->TransformPhysicalPointToContinuousIndex(point, continuous_index);

  const RegionType &region = domain->GetLargestPossibleRegion();

  Triple axis_distances;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    const double to_lower =
        continuous_index[dim] - (static_cast<double>(region.GetIndex(dim)) - 0.5);
    const double to_upper = static_cast<double>(region.GetSize(dim)) - to_lower;
    axis_distances[dim] =
        std::abs(to_upper) < std::abs(to_lower) ? to_upper : to_lower;
  }
  return axis_distances;
}

std::pair<double, unsigned int>
TransformCollection::PhysicalDistanceFromEdge(const PointType &point,
                                              const ImageBaseType *domain) {
  const Triple physical_step = DominantPhysicalStep(domain);
  const Triple pixel_distances = PixelDistanceFromEdge(point, domain);

  unsigned int nearest_axis = 0;
  double nearest_distance = pixel_distances[0] * std::abs(physical_step[0]);
  for (unsigned int dim = 1; dim < Dimension; ++dim) {
    const double distance = pixel_distances[dim] * std::abs(physical_step[dim]);
    if (std::abs(distance) < std::abs(nearest_distance)) {
      nearest_distance = distance;
      nearest_axis = dim;
    }
  }
  return {nearest_distance, nearest_axis};
}

} // namespace blockfuse
