/**
 * @file ImageSource.cpp
 * @brief File-backed and in-memory image sources
 */

#include "ImageSource.h"
#include "../core/BlockFuseExceptions.h"

// ITK Headers
#include "itkExtractImageFilter.h"
#include "itkImageFileReader.h"

#include <filesystem>
#include <sstream>

namespace blockfuse {

namespace {

std::string RegionToString(const RegionType &region) {
  std::stringstream ss;
  ss << "index " << region.GetIndex() << " size " << region.GetSize();
  return ss.str();
}

ImagePointer ExtractRegion(const ImageType *input, const RegionType &region) {
  using ExtractFilterType = itk::ExtractImageFilter<ImageType, ImageType>;
  auto extractor = ExtractFilterType::New();
  extractor->SetInput(input);
  extractor->SetExtractionRegion(region);
  extractor->SetDirectionCollapseToSubmatrix();
  extractor->Update();

  ImagePointer output = extractor->GetOutput();
  output->DisconnectPipeline();
  return output;
}

bool IsRemoteUrl(const std::string &path) {
  return path.find("://") != std::string::npos;
}

} // namespace

StreamingFileImageSource::StreamingFileImageSource(const std::string &path)
    : m_path(path) {}

ImageType::ConstPointer StreamingFileImageSource::GetMetadata() {
  if (m_metadata) {
    return m_metadata;
  }

  using ReaderType = itk::ImageFileReader<ImageType>;
  auto reader = ReaderType::New();
  reader->SetFileName(m_path);

  try {
    reader->UpdateOutputInformation();
  } catch (const itk::ExceptionObject &e) {
    throw ImageSourceException(m_path, "metadata read", e.GetDescription());
  }

  ImagePointer metadata = reader->GetOutput();
  metadata->DisconnectPipeline();
  m_metadata = metadata;
  return m_metadata;
}

ImagePointer StreamingFileImageSource::ReadRegion(const RegionType &region) {
  using ReaderType = itk::ImageFileReader<ImageType>;
  auto reader = ReaderType::New();
  reader->SetFileName(m_path);

  try {
    reader->UpdateOutputInformation();
    if (!reader->GetOutput()->GetLargestPossibleRegion().IsInside(region)) {
      throw ImageSourceException(m_path, "region read",
                                 "requested " + RegionToString(region) +
                                     " lies outside the image");
    }

    // Streaming-capable IO only fetches the requested region
    reader->GetOutput()->SetRequestedRegion(region);
    return ExtractRegion(reader->GetOutput(), region);
  } catch (const itk::ExceptionObject &e) {
    throw ImageSourceException(m_path, "region read", e.GetDescription());
  }
}

InMemoryImageSource::InMemoryImageSource(const ImageType *image,
                                         const std::string &description)
    : m_description(description) {
  if (image == nullptr) {
    throw ImageSourceException(description, "construction", "image is null");
  }
  if (image->GetBufferedRegion() != image->GetLargestPossibleRegion()) {
    throw ImageSourceException(description, "construction",
                               "image must be fully buffered");
  }

  m_view = ImageType::New();
  m_view->SetRegions(image->GetBufferedRegion());
  m_view->SetOrigin(image->GetOrigin());
  m_view->SetSpacing(image->GetSpacing());
  m_view->SetDirection(image->GetDirection());
  m_view->SetPixelContainer(
      const_cast<ImageType::PixelContainer *>(image->GetPixelContainer()));
}

ImageType::ConstPointer InMemoryImageSource::GetMetadata() {
  return ImageType::ConstPointer(m_view.GetPointer());
}

ImagePointer InMemoryImageSource::ReadRegion(const RegionType &region) {
  if (!m_view->GetLargestPossibleRegion().IsInside(region)) {
    throw ImageSourceException(m_description, "region read",
                               "requested " + RegionToString(region) +
                                   " lies outside the image");
  }

  try {
    return ExtractRegion(m_view, region);
  } catch (const itk::ExceptionObject &e) {
    throw ImageSourceException(m_description, "region read",
                               e.GetDescription());
  }
}

ImageSourceFactory MakeFileImageSourceFactory(const std::string &path) {
  if (!IsRemoteUrl(path) && !std::filesystem::path(path).is_absolute()) {
    throw ImageSourceException(path, "factory construction",
                               "expected an absolute path or a remote URL");
  }

  return [path]() -> std::unique_ptr<ImageSource> {
    return std::make_unique<StreamingFileImageSource>(path);
  };
}

ImageSourceFactory
MakeInMemoryImageSourceFactory(ImageType::ConstPointer image,
                               const std::string &description) {
  if (!image) {
    throw ImageSourceException(description, "factory construction",
                               "image is null");
  }

  return [image, description]() -> std::unique_ptr<ImageSource> {
    return std::make_unique<InMemoryImageSource>(image.GetPointer(),
                                                 description);
  };
}

} // namespace blockfuse
