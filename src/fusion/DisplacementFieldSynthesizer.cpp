/**
 * @file DisplacementFieldSynthesizer.cpp
 * @brief Parallel voxel sampling of blended transforms
 */

#include "DisplacementFieldSynthesizer.h"
#include "../block/ImageBlock.h"
#include "../core/BlockFuseExceptions.h"

// ITK Headers
#include "itkImageRegionIteratorWithIndex.h"
#include "itkMultiThreaderBase.h"

#include <atomic>
#include <cmath>
#include <sstream>

namespace blockfuse {

void DisplacementFieldConfig::Validate() const {
  for (double factor : scale_factors) {
    if (!std::isfinite(factor) || factor <= 0.0) {
      std::stringstream ss;
      ss << factor;
      throw ConfigurationException("scale_factors", ss.str(),
                                   "positive finite values");
    }
  }
}

DisplacementFieldSynthesizer::DisplacementFieldSynthesizer(
    const DisplacementFieldConfig &config, Logger logger)
    : m_config(config), m_logger(std::move(logger)) {
  m_config.Validate();
}

DisplacementFieldType::Pointer DisplacementFieldSynthesizer::MakeOutputGrid(
    const ImageBaseType *reference_image,
    const TransformType *initial_transform) const {
  if (reference_image == nullptr) {
    throw ValidationException("DisplacementFieldSynthesizer",
                              "reference image is null", "MakeOutputGrid");
  }

  const PhysicalRegion physical_region = ImageToPhysicalRegion(
      reference_image->GetLargestPossibleRegion(), reference_image,
      initial_transform);

  SpacingType spacing = reference_image->GetSpacing();
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    spacing[dim] *= m_config.scale_factors[dim];
  }

  return PhysicalRegionToImage<DisplacementFieldType>(
      physical_region, spacing, reference_image->GetDirection(), true);
}

DisplacementFieldTransformType::Pointer DisplacementFieldSynthesizer::Synthesize(
    const TransformCollection &collection, const ImageBaseType *reference_image,
    const TransformType *initial_transform) const {
  DisplacementFieldType::Pointer output_field =
      MakeOutputGrid(reference_image, initial_transform);

  DisplacementFieldType::PixelType zero;
  zero.Fill(0.0);
  output_field->Allocate();
  output_field->FillBuffer(zero);

  {
    std::stringstream ss;
    ss << "Output field has size " << output_field->GetBufferedRegion().GetSize()
       << " and domain "
       << ImageToPhysicalRegion(output_field->GetBufferedRegion(), output_field)
              .ToString();
    m_logger.Info(ss.str());
  }

  std::atomic<size_t> uncovered_voxels{0};
  const Logger &logger = m_logger;

  // Work units write disjoint sub-regions of the output buffer
  auto multi_threader = itk::MultiThreaderBase::New();
  if (m_config.number_of_work_units > 0) {
    multi_threader->SetNumberOfWorkUnits(m_config.number_of_work_units);
  }
  multi_threader->ParallelizeImageRegion<Dimension>(
      output_field->GetBufferedRegion(),
      [&output_field, &collection, &uncovered_voxels,
       &logger](const RegionType &region) {
        using IterType = itk::ImageRegionIteratorWithIndex<DisplacementFieldType>;
        PointType physical_point;
        for (IterType it(output_field, region); !it.IsAtEnd(); ++it) {
          output_field->TransformIndexToPhysicalPoint(it.GetIndex(),
                                                      physical_point);
          try {
            it.Set(collection.TransformPoint(physical_point) - physical_point);
          } catch (const CoverageException &e) {
            ++uncovered_voxels;
            if (logger.IsEnabled(Logger::Level::Debug)) {
              logger.Debug(e.GetMessage());
            }
          }
        }
      },
      nullptr);

  if (uncovered_voxels > 0) {
    std::stringstream ss;
    ss << uncovered_voxels.load() << " of "
       << output_field->GetBufferedRegion().GetNumberOfPixels()
       << " voxels lie outside all transform domains and keep a zero "
          "displacement";
    m_logger.Warning(ss.str());
  }

  auto output_transform = DisplacementFieldTransformType::New();
  output_transform->SetDisplacementField(output_field);
  return output_transform;
}

} // namespace blockfuse
