/**
 * @file BlockPairTask.cpp
 * @brief Padded block fetch, validation and per-block registration
 */

#include "BlockPairTask.h"
#include "../block/ImageBlock.h"
#include "../block/RegionConverter.h"
#include "../core/BlockFuseExceptions.h"

// ITK Headers
#include "itkImageRegionConstIterator.h"

#include <cmath>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace blockfuse {

namespace {

std::string RegionToString(const RegionType &region) {
  std::stringstream ss;
  ss << "[index (" << region.GetIndex()[0] << "," << region.GetIndex()[1]
     << "," << region.GetIndex()[2] << ") size (" << region.GetSize()[0] << ","
     << region.GetSize()[1] << "," << region.GetSize()[2] << ")]";
  return ss.str();
}

std::string ChunkDirectoryName(const BlockDescriptor &block) {
  std::stringstream ss;
  for (size_t i = 0; i < block.chunk_index.size(); ++i) {
    ss << (i ? "_" : "") << block.chunk_index[i];
  }
  return ss.str();
}

} // namespace

bool HasSignal(const ImageType *image) {
  itk::ImageRegionConstIterator<ImageType> it(image, image->GetBufferedRegion());
  for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
    if (it.Get() != 0) {
      return true;
    }
  }
  return false;
}

BlockPairTask::BlockPairTask(
    ImageSourceFactory fixed_source, ImageSourceFactory moving_source,
    std::shared_ptr<const BlockPairRegistrationMethod> method,
    TransformType::ConstPointer initial_transform, BlockPairTaskConfig config,
    Logger logger)
    : m_fixed_source(std::move(fixed_source)),
      m_moving_source(std::move(moving_source)), m_method(std::move(method)),
      m_initial_transform(std::move(initial_transform)),
      m_config(std::move(config)), m_logger(std::move(logger)) {
  if (!m_fixed_source || !m_moving_source) {
    throw ValidationException("BlockPairTask", "image source factory is empty",
                              "BlockPairTask");
  }
  if (!m_method) {
    throw ValidationException("BlockPairTask", "registration method is null",
                              "BlockPairTask");
  }
}

std::vector<size_t>
BlockPairTask::ComputePadding(const std::vector<size_t> &block_shape,
                              const std::vector<double> &overlap_factors) {
  std::vector<size_t> padding(block_shape.size(), 0);
  if (overlap_factors.empty()) {
    return padding;
  }
  if (overlap_factors.size() != block_shape.size()) {
    throw ConfigurationException("overlap_factors",
                                 std::to_string(overlap_factors.size()) +
                                     " values",
                                 std::to_string(block_shape.size()) +
                                     " values, one per axis");
  }

  for (size_t dim = 0; dim < block_shape.size(); ++dim) {
    padding[dim] = static_cast<size_t>(std::ceil(
        static_cast<double>(block_shape[dim]) * overlap_factors[dim] * 0.5));
  }
  return padding;
}

BlockPairResult BlockPairTask::Run(const BlockDescriptor &block) const {
  const Logger block_logger = m_logger.WithContext(block.ToString());
  block_logger.Info("Entering block registration");

  const BlockContext context{block_logger};
  try {
    BlockPairResult result = RegisterBlock(block, context);
    block_logger.Info("Registration completed with status " +
                      StatusToString(result.GetStatus()));
    return result;
  } catch (const BlockRegistrationException &e) {
    block_logger.Warning(e.GetMessage());
    return BlockPairResult::Failure();
  }
}

BlockPairResult BlockPairTask::RegisterBlock(const BlockDescriptor &block,
                                             const BlockContext &context) const {
  const Logger &logger = context.logger;
  const std::string chunk = block.ToString();

  // Unpadded and padded fixed regions in ITK order
  const std::vector<size_t> shape = block.GetShape();
  const std::vector<size_t> padding =
      ComputePadding(shape, m_config.overlap_factors);

  const RegionType block_region = block.ToImageRegion();
  RegionType padded_region = block_region;
  padded_region.PadByRadius([&padding]() {
    SizeType radius;
    for (unsigned int dim = 0; dim < Dimension; ++dim) {
      radius[dim] = padding[Dimension - 1 - dim];
    }
    return radius;
  }());

  // Fixed subimage
  std::unique_ptr<ImageSource> fixed_source = m_fixed_source();
  ImageType::ConstPointer fixed_metadata = fixed_source->GetMetadata();
  const RegionType &fixed_largest = fixed_metadata->GetLargestPossibleRegion();

  // Crop leaves a disjoint region unchanged, which the check below rejects
  const bool fixed_overlaps = padded_region.Crop(fixed_largest);
  if (!fixed_overlaps || !fixed_largest.IsInside(padded_region) ||
      !fixed_largest.IsInside(block_region) ||
      padded_region.GetNumberOfPixels() == 0) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::FixedRegionOutsideImage,
        chunk,
        "padded region " + RegionToString(padded_region) + " vs largest " +
            RegionToString(fixed_largest));
  }
  logger.Debug("Fixed block has unpadded region " +
               RegionToString(block_region) + " and padded region " +
               RegionToString(padded_region));

  ImagePointer fixed_subimage = fixed_source->ReadRegion(padded_region);
  fixed_subimage->SetRequestedRegion(block_region); // ROI for registration

  // Moving subimage, mapped through the initial transform
  std::unique_ptr<ImageSource> moving_source = m_moving_source();
  ImageType::ConstPointer moving_metadata = moving_source->GetMetadata();
  const RegionType &moving_largest =
      moving_metadata->GetLargestPossibleRegion();

  const BlockRegion moving_block_region = GetTargetBlockRegion(
      ImageToBlockRegion(block_region), fixed_subimage, moving_metadata,
      m_initial_transform, true);
  const BlockRegion moving_padded_block_region = GetTargetBlockRegion(
      ImageToBlockRegion(padded_region), fixed_subimage, moving_metadata,
      m_initial_transform, true);

  const RegionType moving_padded_region =
      BlockToImageRegion(moving_padded_block_region);
  if (moving_padded_region.GetNumberOfPixels() == 0 ||
      !moving_largest.IsInside(moving_padded_region)) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::MovingRegionOutsideImage,
        chunk,
        "moving region " + RegionToString(moving_padded_region) +
            " vs largest " + RegionToString(moving_largest));
  }

  ImagePointer moving_subimage = moving_source->ReadRegion(moving_padded_region);

  // The round trip through physical space can shift the unpadded border by
  // one voxel past the padded region
  RegionType moving_unpadded_region = BlockToImageRegion(moving_block_region);
  if (!moving_unpadded_region.Crop(moving_padded_region)) {
    moving_unpadded_region = moving_padded_region;
  }
  moving_subimage->SetRequestedRegion(moving_unpadded_region);
  logger.Debug("Moving unpadded region " +
               RegionToString(moving_unpadded_region) + ", padded region " +
               RegionToString(moving_padded_region));

  if (!HasSignal(moving_subimage)) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::NoMovingSignal, chunk);
  }

  if (!m_config.debug_output_directory.empty()) {
    WriteDebugSubimages(block, fixed_subimage, moving_subimage, logger);
  }

  try {
    return (*m_method)(fixed_subimage, moving_subimage, m_initial_transform,
                       block, context);
  } catch (const ValidationException &e) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::InvalidResult, chunk,
        e.GetMessage());
  } catch (const std::exception &e) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::MethodFailure, chunk,
        e.what());
  } catch (...) {
    throw BlockRegistrationException(
        BlockRegistrationException::FailureReason::MethodFailure, chunk,
        "unknown exception");
  }
}

void BlockPairTask::WriteDebugSubimages(const BlockDescriptor &block,
                                        const ImageType *fixed_subimage,
                                        const ImageType *moving_subimage,
                                        const Logger &logger) const {
  const std::filesystem::path directory =
      std::filesystem::path(m_config.debug_output_directory) /
      ChunkDirectoryName(block);

  std::error_code error;
  std::filesystem::create_directories(directory, error);
  if (error) {
    logger.Warning("Could not create debug directory " + directory.string() +
                   ": " + error.message());
    return;
  }

  try {
    WriteBufferedRegion(fixed_subimage,
                        (directory / "fixed_subimage.mha").string());
    WriteBufferedRegion(moving_subimage,
                        (directory / "moving_subimage.mha").string());
    logger.Debug("Wrote debug subimages to " + directory.string());
  } catch (const ImageSourceException &e) {
    logger.Warning(e.GetMessage());
  }
}

} // namespace blockfuse
