/**
 * @file ImageBlock.h
 * @brief Image-level helpers built on the region conversions
 */

#ifndef BLOCKFUSE_IMAGE_BLOCK_H
#define BLOCKFUSE_IMAGE_BLOCK_H

#include "../core/BlockFuseTypes.h"
#include "../core/Logger.h"
#include "RegionConverter.h"

#include <string>

namespace blockfuse {

/**
 * @brief Physical bounds of the space sampled by an image
 *
 * Every voxel samples the volume around its center, so the bounds extend
 * half a voxel past the outermost sample points. Always uses the largest
 * possible region; a warning is logged when the buffered region differs.
 */
PhysicalRegion GetSampleBounds(const ImageBaseType *image,
                               const TransformType *transform = nullptr,
                               const Logger *logger = nullptr);

Triple GetPhysicalMidpoint(const ImageBaseType *image,
                           const TransformType *transform = nullptr);

struct ImageGeometry {
  PointType origin;
  SpacingType spacing;
  DirectionType direction;
  SizeType size;
};

/**
 * @brief Voxel grid that subdivides a physical region
 *
 * The grid is centered on the region. With @p extend_beyond the grid covers
 * the whole region and may overhang it by up to one voxel per edge,
 * otherwise it lies inside the region. The direction must be a signed
 * permutation (entries in {-1, 0, 1}).
 *
 * @throws ValidationException for zero spacing or an invalid direction
 */
ImageGeometry ComputeSamplingGrid(const PhysicalRegion &physical_region,
                                  const SpacingType &spacing,
                                  const DirectionType &direction,
                                  bool extend_beyond = true);

// Unallocated image whose grid samples the physical region
template <typename TImage>
typename TImage::Pointer
PhysicalRegionToImage(const PhysicalRegion &physical_region,
                      const SpacingType &spacing,
                      const DirectionType &direction,
                      bool extend_beyond = true) {
  const ImageGeometry geometry =
      ComputeSamplingGrid(physical_region, spacing, direction, extend_beyond);

  typename TImage::RegionType region;
  region.SetSize(geometry.size); // always zero index

  auto image = TImage::New();
  image->SetOrigin(geometry.origin);
  image->SetSpacing(geometry.spacing);
  image->SetDirection(geometry.direction);
  image->SetRegions(region);
  return image;
}

/**
 * @brief Write the buffered region of an image to disk
 * @throws ImageSourceException when the writer fails
 */
void WriteBufferedRegion(const ImageType *image, const std::string &path);

} // namespace blockfuse

#endif // BLOCKFUSE_IMAGE_BLOCK_H
