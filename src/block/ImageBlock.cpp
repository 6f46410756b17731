/**
 * @file ImageBlock.cpp
 * @brief Sample bounds, sampling grids and debug output
 */

#include "ImageBlock.h"
#include "../core/BlockFuseExceptions.h"

// ITK Headers
#include "itkImageFileWriter.h"

#include <cmath>
#include <sstream>

namespace blockfuse {

PhysicalRegion GetSampleBounds(const ImageBaseType *image,
                               const TransformType *transform,
                               const Logger *logger) {
  if (image == nullptr) {
    throw ValidationException("ImageBlock", "image is null", "GetSampleBounds");
  }

  if (logger != nullptr &&
      image->GetLargestPossibleRegion() != image->GetBufferedRegion()) {
    logger->Warning("Buffered and largest regions do not match. "
                    "Sample bounds may extend beyond buffered region.");
  }

  return ImageToPhysicalRegion(image->GetLargestPossibleRegion(), image,
                               transform);
}

Triple GetPhysicalMidpoint(const ImageBaseType *image,
                           const TransformType *transform) {
  return GetSampleBounds(image, transform).GetMidpoint();
}

ImageGeometry ComputeSamplingGrid(const PhysicalRegion &physical_region,
                                  const SpacingType &spacing,
                                  const DirectionType &direction,
                                  bool extend_beyond) {
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    if (std::abs(spacing[dim]) < 1e-12) {
      std::stringstream ss;
      ss << "invalid spacing " << spacing;
      throw ValidationException("ImageBlock", ss.str(), "ComputeSamplingGrid");
    }
  }
  for (unsigned int row = 0; row < Dimension; ++row) {
    for (unsigned int col = 0; col < Dimension; ++col) {
      const double value = direction(row, col);
      if (value != 0.0 && value != 1.0 && value != -1.0) {
        std::stringstream ss;
        ss << "direction must contain only -1, 0 or 1, got " << direction;
        throw ValidationException("ImageBlock", ss.str(),
                                  "ComputeSamplingGrid");
      }
    }
  }

  // Columns of M are the physical steps taken along each voxel axis
  itk::Matrix<double, Dimension, Dimension> voxel_step_vecs;
  for (unsigned int row = 0; row < Dimension; ++row) {
    for (unsigned int col = 0; col < Dimension; ++col) {
      voxel_step_vecs(row, col) = direction(row, col) * spacing[col];
    }
  }

  // Signed step along each physical axis
  Triple physical_step;
  for (unsigned int row = 0; row < Dimension; ++row) {
    unsigned int max_col = 0;
    for (unsigned int col = 1; col < Dimension; ++col) {
      if (std::abs(voxel_step_vecs(row, col)) >
          std::abs(voxel_step_vecs(row, max_col))) {
        max_col = col;
      }
    }
    physical_step[row] = voxel_step_vecs(row, max_col);
    if (physical_step[row] == 0.0) {
      throw ValidationException("ImageBlock",
                                "direction leaves a physical axis unsampled",
                                "ComputeSamplingGrid");
    }
  }

  const PhysicalRegion region = physical_region.Normalized();
  const Triple center = region.GetMidpoint();

  Triple output_lower;
  Triple output_upper;
  itk::Vector<double, Dimension> corner_to_upper;
  PointType origin;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    const double grid_size_f =
        (region.upper[dim] - region.lower[dim]) / std::abs(physical_step[dim]);
    const double grid_size =
        extend_beyond ? std::ceil(grid_size_f) : std::floor(grid_size_f);

    output_lower[dim] = center[dim] - (grid_size / 2.0) * physical_step[dim];
    output_upper[dim] = center[dim] + (grid_size / 2.0) * physical_step[dim];

    // Edge of voxel 0 is the min corner along a positive step, else the max
    const double voxel_0_corner =
        physical_step[dim] > 0 ? std::min(output_lower[dim], output_upper[dim])
                               : std::max(output_lower[dim], output_upper[dim]);
    origin[dim] = voxel_0_corner + 0.5 * physical_step[dim];
    corner_to_upper[dim] = output_upper[dim] - voxel_0_corner;
  }

  const itk::Vector<double, Dimension> voxel_extent =
      itk::Matrix<double, Dimension, Dimension>(voxel_step_vecs.GetInverse()) *
      corner_to_upper;

  ImageGeometry geometry;
  geometry.origin = origin;
  geometry.spacing = spacing;
  geometry.direction = direction;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    geometry.size[dim] =
        static_cast<SizeValueType>(std::max(0L, std::lround(voxel_extent[dim])));
  }
  return geometry;
}

void WriteBufferedRegion(const ImageType *image, const std::string &path) {
  using WriterType = itk::ImageFileWriter<ImageType>;
  auto writer = WriterType::New();
  writer->SetInput(image);
  writer->SetFileName(path);
  writer->SetUseCompression(true);

  try {
    writer->Update();
  } catch (const itk::ExceptionObject &e) {
    throw ImageSourceException(path, "write", e.GetDescription());
  }
}

} // namespace blockfuse
