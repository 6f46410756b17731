/**
 * @file RegionConverter.cpp
 * @brief Voxel and physical region conversions
 */

#include "RegionConverter.h"
#include "../core/BlockFuseExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace blockfuse {

namespace {

constexpr double HALF_VOXEL_STEP = 0.5;

void ValidateReferenceImage(const ImageBaseType *ref_image,
                            const std::string &function) {
  if (ref_image == nullptr) {
    throw ValidationException("RegionConverter", "reference image is null",
                              function);
  }
  const SpacingType &spacing = ref_image->GetSpacing();
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    if (!(spacing[dim] > 0.0)) {
      std::stringstream ss;
      ss << "reference image spacing must be positive, got " << spacing;
      throw ValidationException("RegionConverter", ss.str(), function);
    }
  }
}

void ValidateRows(const std::vector<std::vector<double>> &rows,
                  const std::string &type_name) {
  if (rows.size() != 2 || rows[0].size() != Dimension ||
      rows[1].size() != Dimension) {
    std::stringstream ss;
    ss << type_name << " requires 2x" << Dimension << " bounds, got "
       << rows.size() << " rows";
    if (!rows.empty()) {
      ss << " of lengths";
      for (const auto &row : rows) {
        ss << " " << row.size();
      }
    }
    throw ValidationException("RegionConverter", ss.str(), "FromBounds");
  }
}

std::string BoundsToString(const Triple &lower, const Triple &upper) {
  std::stringstream ss;
  ss << "[[" << lower[0] << "," << lower[1] << "," << lower[2] << "],["
     << upper[0] << "," << upper[1] << "," << upper[2] << "]]";
  return ss.str();
}

} // namespace

BlockRegion BlockRegion::FromBounds(const std::vector<std::vector<double>> &rows) {
  ValidateRows(rows, "BlockRegion");
  BlockRegion region;
  std::copy(rows[0].begin(), rows[0].end(), region.lower.begin());
  std::copy(rows[1].begin(), rows[1].end(), region.upper.begin());
  return region;
}

BlockRegion BlockRegion::Normalized() const {
  BlockRegion region;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    region.lower[dim] = std::min(lower[dim], upper[dim]);
    region.upper[dim] = std::max(lower[dim], upper[dim]);
  }
  return region;
}

BlockRegion BlockRegion::Rounded() const {
  BlockRegion region;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    region.lower[dim] = std::round(lower[dim]);
    region.upper[dim] = std::round(upper[dim]);
  }
  return region;
}

Triple BlockRegion::GetSize() const {
  Triple size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    size[dim] = upper[dim] - lower[dim];
  }
  return size;
}

bool BlockRegion::IsEmpty() const {
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    if (!(upper[dim] > lower[dim])) {
      return true;
    }
  }
  return false;
}

std::string BlockRegion::ToString() const {
  return BoundsToString(lower, upper);
}

PhysicalRegion
PhysicalRegion::FromBounds(const std::vector<std::vector<double>> &rows) {
  ValidateRows(rows, "PhysicalRegion");
  PhysicalRegion region;
  std::copy(rows[0].begin(), rows[0].end(), region.lower.begin());
  std::copy(rows[1].begin(), rows[1].end(), region.upper.begin());
  return region;
}

PhysicalRegion PhysicalRegion::Normalized() const {
  PhysicalRegion region;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    region.lower[dim] = std::min(lower[dim], upper[dim]);
    region.upper[dim] = std::max(lower[dim], upper[dim]);
  }
  return region;
}

Triple PhysicalRegion::GetSize() const {
  Triple size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    size[dim] = upper[dim] - lower[dim];
  }
  return size;
}

Triple PhysicalRegion::GetMidpoint() const {
  Triple midpoint;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    midpoint[dim] = 0.5 * (lower[dim] + upper[dim]);
  }
  return midpoint;
}

bool PhysicalRegion::Contains(const PointType &point) const {
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    if (point[dim] < lower[dim] || point[dim] > upper[dim]) {
      return false;
    }
  }
  return true;
}

std::string PhysicalRegion::ToString() const {
  return BoundsToString(lower, upper);
}

PhysicalRegion EstimateBoundingBox(const PhysicalRegion &physical_region,
                                   const TransformType *transform) {
  if (transform == nullptr) {
    throw ValidationException("RegionConverter", "transform is null",
                              "EstimateBoundingBox");
  }

  PhysicalRegion bounds;
  bounds.lower.fill(std::numeric_limits<double>::max());
  bounds.upper.fill(std::numeric_limits<double>::lowest());

  constexpr unsigned int NUM_CORNERS = 1u << Dimension;
  for (unsigned int corner = 0; corner < NUM_CORNERS; ++corner) {
    PointType point;
    for (unsigned int dim = 0; dim < Dimension; ++dim) {
      point[dim] = (corner >> dim) & 1u ? physical_region.upper[dim]
                                        : physical_region.lower[dim];
    }

    const PointType mapped = transform->TransformPoint(point);
    for (unsigned int dim = 0; dim < Dimension; ++dim) {
      bounds.lower[dim] = std::min(bounds.lower[dim], mapped[dim]);
      bounds.upper[dim] = std::max(bounds.upper[dim], mapped[dim]);
    }
  }

  return bounds;
}

PhysicalRegion BlockToPhysicalRegion(const BlockRegion &block_region,
                                     const ImageBaseType *ref_image,
                                     const TransformType *transform) {
  ValidateReferenceImage(ref_image, "BlockToPhysicalRegion");

  const BlockRegion normalized = block_region.Normalized();

  // Shift both rows back by half a voxel from sample centers to voxel edges
  ContinuousIndexType lower_index;
  ContinuousIndexType upper_index;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    lower_index[dim] = normalized.lower[dim] - HALF_VOXEL_STEP;
    upper_index[dim] = normalized.upper[dim] - HALF_VOXEL_STEP;
  }

  PointType lower_point;
  PointType upper_point;
  ref_image->TransformContinuousIndexToPhysicalPoint(lower_index, lower_point);
  ref_image->TransformContinuousIndexToPhysicalPoint(upper_index, upper_point);

  PhysicalRegion physical_region;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    physical_region.lower[dim] = std::min(lower_point[dim], upper_point[dim]);
    physical_region.upper[dim] = std::max(lower_point[dim], upper_point[dim]);
  }

  if (transform == nullptr) {
    return physical_region;
  }
  return EstimateBoundingBox(physical_region, transform);
}

BlockRegion PhysicalToBlockRegion(const PhysicalRegion &physical_region,
                                  const ImageBaseType *ref_image) {
  ValidateReferenceImage(ref_image, "PhysicalToBlockRegion");

  PointType lower_point;
  PointType upper_point;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    lower_point[dim] = physical_region.lower[dim];
    upper_point[dim] = physical_region.upper[dim];
  }

  // Points outside the image still map to a valid continuous index
  ContinuousIndexType lower_index;
  ContinuousIndexType upper_index;
  ref_image->TransformPhysicalPointToContinuousIndex(lower_point, lower_index);
  ref_image->TransformPhysicalPointToContinuousIndex(upper_point, upper_index);

  BlockRegion block_region;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    block_region.lower[dim] =
        std::min(lower_index[dim], upper_index[dim]) + HALF_VOXEL_STEP;
    block_region.upper[dim] =
        std::max(lower_index[dim], upper_index[dim]) + HALF_VOXEL_STEP;
  }
  return block_region;
}

RegionType BlockToImageRegion(const BlockRegion &block_region) {
  const BlockRegion normalized = block_region.Normalized();

  IndexType index;
  SizeType size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    const auto lower =
        static_cast<IndexValueType>(std::trunc(normalized.lower[dim]));
    const auto upper =
        static_cast<IndexValueType>(std::trunc(normalized.upper[dim]));
    index[dim] = lower;
    size[dim] = upper > lower ? static_cast<SizeValueType>(upper - lower) : 0;
  }
  return RegionType(index, size);
}

BlockRegion ImageToBlockRegion(const RegionType &image_region) {
  BlockRegion block_region;
  const IndexType &index = image_region.GetIndex();
  const SizeType &size = image_region.GetSize();
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    block_region.lower[dim] = static_cast<double>(index[dim]);
    block_region.upper[dim] =
        static_cast<double>(index[dim] + static_cast<IndexValueType>(size[dim]));
  }
  return block_region;
}

RegionType PhysicalToImageRegion(const PhysicalRegion &physical_region,
                                 const ImageBaseType *ref_image) {
  return BlockToImageRegion(PhysicalToBlockRegion(physical_region, ref_image));
}

PhysicalRegion ImageToPhysicalRegion(const RegionType &image_region,
                                     const ImageBaseType *ref_image,
                                     const TransformType *transform) {
  return BlockToPhysicalRegion(ImageToBlockRegion(image_region), ref_image,
                               transform);
}

Triple BlockToPhysicalSize(const SizeType &block_size,
                           const ImageBaseType *ref_image,
                           const TransformType *transform) {
  ValidateReferenceImage(ref_image, "BlockToPhysicalSize");

  IndexType block_index;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    block_index[dim] = static_cast<IndexValueType>(block_size[dim]);
  }

  PointType corner;
  ref_image->TransformIndexToPhysicalPoint(block_index, corner);
  PointType origin = ref_image->GetOrigin();

  if (transform != nullptr) {
    corner = transform->TransformPoint(corner);
    origin = transform->TransformPoint(origin);
  }

  Triple physical_size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    physical_size[dim] = std::abs(corner[dim] - origin[dim]);
  }
  return physical_size;
}

SizeType PhysicalToBlockSize(const Triple &physical_size,
                             const ImageBaseType *ref_image) {
  ValidateReferenceImage(ref_image, "PhysicalToBlockSize");

  PointType point = ref_image->GetOrigin();
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    point[dim] += physical_size[dim];
  }

  IndexType index;
  ref_image->TransformPhysicalPointToIndex(point, index);

  SizeType block_size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    block_size[dim] = static_cast<SizeValueType>(std::abs(index[dim]));
  }
  return block_size;
}

SizeType GetTargetBlockSize(const SizeType &block_size,
                            const ImageBaseType *src_image,
                            const ImageBaseType *target_image) {
  return PhysicalToBlockSize(BlockToPhysicalSize(block_size, src_image),
                             target_image);
}

BlockRegion GetTargetBlockRegion(const BlockRegion &block_region,
                                 const ImageBaseType *src_image,
                                 const ImageBaseType *target_image,
                                 const TransformType *src_transform,
                                 bool crop_to_target) {
  BlockRegion target_region = PhysicalToBlockRegion(
      BlockToPhysicalRegion(block_region, src_image, src_transform),
      target_image);

  if (crop_to_target) {
    RegionType image_region = BlockToImageRegion(target_region);
    if (!image_region.Crop(target_image->GetLargestPossibleRegion())) {
      // Disjoint from the target
      image_region.SetSize(SizeType::Filled(0));
    }
    target_region = ImageToBlockRegion(image_region);
  }

  return target_region;
}

} // namespace blockfuse
