/**
 * @file RegionConverter.h
 * @brief Conversions between voxel regions and physical regions
 *
 * Terms used throughout:
 *  - block region: [lower, upper) voxel bounds in ITK access order (I,J,K).
 *    Bounds may be fractional after a physical round trip.
 *  - physical region: inclusive axis-aligned bounds in (X,Y,Z).
 *  - image region: itk::ImageRegion<3> with integer index and size.
 *
 * Voxels are samples at their centers, so a block edge sits half a voxel
 * before the first sample along each axis.
 */

#ifndef BLOCKFUSE_REGION_CONVERTER_H
#define BLOCKFUSE_REGION_CONVERTER_H

#include "../core/BlockFuseTypes.h"

#include <array>
#include <string>
#include <vector>

namespace blockfuse {

struct BlockRegion {
  Triple lower{{0.0, 0.0, 0.0}};
  Triple upper{{0.0, 0.0, 0.0}};

  /**
   * @brief Build from a 2x3 row layout {lower, upper}
   * @throws ValidationException for any other shape
   */
  static BlockRegion FromBounds(const std::vector<std::vector<double>> &rows);

  // Per-axis min in lower and max in upper
  BlockRegion Normalized() const;
  BlockRegion Rounded() const;
  Triple GetSize() const;
  bool IsEmpty() const;
  std::string ToString() const;

  bool operator==(const BlockRegion &other) const {
    return lower == other.lower && upper == other.upper;
  }
  bool operator!=(const BlockRegion &other) const { return !(*this == other); }
};

struct PhysicalRegion {
  Triple lower{{0.0, 0.0, 0.0}};
  Triple upper{{0.0, 0.0, 0.0}};

  static PhysicalRegion
  FromBounds(const std::vector<std::vector<double>> &rows);

  PhysicalRegion Normalized() const;
  Triple GetSize() const;
  Triple GetMidpoint() const;

  // Inclusive on both bounds
  bool Contains(const PointType &point) const;
  std::string ToString() const;
};

/**
 * @brief Axis-aligned bounds of the 8 transformed corners of a region
 *
 * Deformable transforms may move interior points outside the estimate.
 */
PhysicalRegion EstimateBoundingBox(const PhysicalRegion &physical_region,
                                   const TransformType *transform);

PhysicalRegion BlockToPhysicalRegion(const BlockRegion &block_region,
                                     const ImageBaseType *ref_image,
                                     const TransformType *transform = nullptr);

BlockRegion PhysicalToBlockRegion(const PhysicalRegion &physical_region,
                                  const ImageBaseType *ref_image);

// Fractional bounds are truncated; an inverted region yields zero size
RegionType BlockToImageRegion(const BlockRegion &block_region);
BlockRegion ImageToBlockRegion(const RegionType &image_region);

RegionType PhysicalToImageRegion(const PhysicalRegion &physical_region,
                                 const ImageBaseType *ref_image);

PhysicalRegion ImageToPhysicalRegion(const RegionType &image_region,
                                     const ImageBaseType *ref_image,
                                     const TransformType *transform = nullptr);

Triple BlockToPhysicalSize(const SizeType &block_size,
                           const ImageBaseType *ref_image,
                           const TransformType *transform = nullptr);

SizeType PhysicalToBlockSize(const Triple &physical_size,
                             const ImageBaseType *ref_image);

SizeType GetTargetBlockSize(const SizeType &block_size,
                            const ImageBaseType *src_image,
                            const ImageBaseType *target_image);

/**
 * @brief Map a voxel region of one image onto the voxel grid of another
 *
 * The block is mapped to physical space through @p src_image, optionally
 * transformed, and mapped back through @p target_image. With
 * @p crop_to_target the result is cropped to the target's largest possible
 * region, so it lies either fully inside it or is empty.
 */
BlockRegion GetTargetBlockRegion(const BlockRegion &block_region,
                                 const ImageBaseType *src_image,
                                 const ImageBaseType *target_image,
                                 const TransformType *src_transform = nullptr,
                                 bool crop_to_target = false);

} // namespace blockfuse

#endif // BLOCKFUSE_REGION_CONVERTER_H
