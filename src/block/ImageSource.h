/**
 * @file ImageSource.h
 * @brief Lazily evaluated access to fixed and moving volumes
 *
 * A source answers metadata queries without fetching voxels and materializes
 * only the sub-regions a block task asks for. Sources are created on demand
 * by a factory so each block task owns its readers outright.
 */

#ifndef BLOCKFUSE_IMAGE_SOURCE_H
#define BLOCKFUSE_IMAGE_SOURCE_H

#include "../core/BlockFuseTypes.h"

#include <functional>
#include <memory>
#include <string>

namespace blockfuse {

class ImageSource {
public:
  virtual ~ImageSource() = default;

  /**
   * @brief Image carrying origin, spacing, direction and largest region
   *
   * No voxel data is guaranteed to be buffered.
   */
  virtual ImageType::ConstPointer GetMetadata() = 0;

  /**
   * @brief Materialize one sub-region
   *
   * The returned image is new, owned by the caller, and its buffered and
   * largest regions both equal @p region.
   *
   * @throws ImageSourceException if the region cannot be read
   */
  virtual ImagePointer ReadRegion(const RegionType &region) = 0;

  virtual std::string GetDescription() const = 0;
};

// Each call yields an independent source
using ImageSourceFactory = std::function<std::unique_ptr<ImageSource>()>;

/**
 * @brief Streams regions from an image file with itk::ImageFileReader
 */
class StreamingFileImageSource : public ImageSource {
private:
  std::string m_path;
  ImageType::ConstPointer m_metadata;

public:
  explicit StreamingFileImageSource(const std::string &path);

  ImageType::ConstPointer GetMetadata() override;
  ImagePointer ReadRegion(const RegionType &region) override;
  std::string GetDescription() const override { return m_path; }
};

/**
 * @brief Serves regions of a volume already held in memory
 *
 * Reads go through a private image that shares the pixel container of the
 * wrapped volume, so sources never share pipeline state.
 */
class InMemoryImageSource : public ImageSource {
private:
  ImageType::Pointer m_view;
  std::string m_description;

public:
  explicit InMemoryImageSource(const ImageType *image,
                               const std::string &description = "in-memory");

  ImageType::ConstPointer GetMetadata() override;
  ImagePointer ReadRegion(const RegionType &region) override;
  std::string GetDescription() const override { return m_description; }
};

/**
 * @brief Factory for file sources
 * @throws ImageSourceException unless @p path is absolute or a URL
 */
ImageSourceFactory MakeFileImageSourceFactory(const std::string &path);

// The image must be fully buffered
ImageSourceFactory
MakeInMemoryImageSourceFactory(ImageType::ConstPointer image,
                               const std::string &description = "in-memory");

} // namespace blockfuse

#endif // BLOCKFUSE_IMAGE_SOURCE_H
