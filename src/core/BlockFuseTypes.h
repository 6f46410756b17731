#ifndef BLOCKFUSE_TYPES_H
#define BLOCKFUSE_TYPES_H

#include <array>

// ITK Headers
#include "itkContinuousIndex.h"
#include "itkDisplacementFieldTransform.h"
#include "itkImage.h"
#include "itkImageBase.h"
#include "itkImageRegion.h"
#include "itkPoint.h"
#include "itkTransform.h"

namespace blockfuse {

constexpr unsigned int Dimension = 3;

using PixelType = float;
using ImageType = itk::Image<PixelType, Dimension>;
using ImagePointer = ImageType::Pointer;
using ImageBaseType = itk::ImageBase<Dimension>;

using RegionType = itk::ImageRegion<Dimension>;
using IndexType = RegionType::IndexType;
using SizeType = RegionType::SizeType;
using IndexValueType = itk::IndexValueType;
using SizeValueType = itk::SizeValueType;
using SpacingType = ImageBaseType::SpacingType;
using DirectionType = ImageBaseType::DirectionType;

using ScalarType = double;
using PointType = itk::Point<ScalarType, Dimension>;
using VectorType = itk::Vector<ScalarType, Dimension>;
using ContinuousIndexType = itk::ContinuousIndex<ScalarType, Dimension>;
using TransformType = itk::Transform<ScalarType, Dimension, Dimension>;

using DisplacementFieldTransformType =
    itk::DisplacementFieldTransform<ScalarType, Dimension>;
using DisplacementFieldType =
    DisplacementFieldTransformType::DisplacementFieldType;

// Plain (X,Y,Z) or (I,J,K) triple
using Triple = std::array<double, Dimension>;

} // namespace blockfuse

#endif // BLOCKFUSE_TYPES_H
