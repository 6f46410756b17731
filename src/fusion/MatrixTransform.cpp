/**
 * @file MatrixTransform.cpp
 * @brief Transform flattening and rigid averaging
 */

#include "MatrixTransform.h"
#include "../core/BlockFuseExceptions.h"

// ITK Headers
#include "itkCompositeTransform.h"
#include "itkVersor.h"

#include "vnl/vnl_det.h"

#include <cmath>
#include <sstream>

namespace blockfuse {

std::vector<TransformType::ConstPointer>
FlattenTransform(const TransformType *transform) {
  using CompositeTransformType = itk::CompositeTransform<ScalarType, Dimension>;

  std::vector<TransformType::ConstPointer> leaves;
  if (transform == nullptr) {
    return leaves;
  }

  // Depth-first; children are pushed in reverse to pop in queue order
  std::vector<TransformType::ConstPointer> stack;
  stack.emplace_back(transform);
  while (!stack.empty()) {
    TransformType::ConstPointer current = stack.back();
    stack.pop_back();

    const auto *composite =
        dynamic_cast<const CompositeTransformType *>(current.GetPointer());
    if (composite == nullptr) {
      leaves.push_back(current);
      continue;
    }

    for (size_t n = composite->GetNumberOfTransforms(); n-- > 0;) {
      stack.emplace_back(composite->GetNthTransformConstPointer(n));
    }
  }
  return leaves;
}

HomogeneousMatrixType MatrixTransformToMatrix(const MatrixTransformType *transform) {
  if (transform == nullptr) {
    throw ValidationException("MatrixTransform", "transform is null",
                              "MatrixTransformToMatrix");
  }

  HomogeneousMatrixType output;
  output.SetIdentity();

  const auto &matrix = transform->GetMatrix();
  const auto &offset = transform->GetOffset();
  for (unsigned int row = 0; row < 3; ++row) {
    for (unsigned int col = 0; col < 3; ++col) {
      output(row, col) = matrix(row, col);
    }
    output(row, 3) = offset[row];
  }
  return output;
}

bool IsRotationMatrix(const RotationMatrixType &matrix, double tolerance) {
  const RotationMatrixType product =
      RotationMatrixType(matrix.GetVnlMatrix() * matrix.GetTranspose());
  for (unsigned int row = 0; row < 3; ++row) {
    for (unsigned int col = 0; col < 3; ++col) {
      const double expected = row == col ? 1.0 : 0.0;
      if (std::abs(product(row, col) - expected) > tolerance) {
        return false;
      }
    }
  }
  return vnl_det(matrix.GetVnlMatrix()) > 0.0;
}

RotationMatrixType
AverageRotation(const std::vector<RotationMatrixType> &rotations) {
  if (rotations.empty()) {
    throw ValidationException("MatrixTransform",
                              "no rotations to average", "AverageRotation");
  }

  using VersorType = itk::Versor<double>;

  double accum[4] = {0.0, 0.0, 0.0, 0.0};
  double reference[4] = {0.0, 0.0, 0.0, 0.0};
  for (size_t index = 0; index < rotations.size(); ++index) {
    if (!IsRotationMatrix(rotations[index])) {
      std::stringstream ss;
      ss << "matrix " << index << " is not a rigid rotation matrix";
      throw ValidationException("MatrixTransform", ss.str(),
                                "AverageRotation");
    }

    VersorType versor;
    try {
      versor.Set(rotations[index]);
    } catch (const itk::ExceptionObject &e) {
      throw ValidationException("MatrixTransform", e.GetDescription(),
                                "AverageRotation");
    }
    double quat[4] = {versor.GetX(), versor.GetY(), versor.GetZ(),
                      versor.GetW()};

    if (index == 0) {
      std::copy(quat, quat + 4, reference);
    }
    double dot = 0.0;
    for (int i = 0; i < 4; ++i) {
      dot += quat[i] * reference[i];
    }
    const double sign = dot < 0.0 ? -1.0 : 1.0;
    for (int i = 0; i < 4; ++i) {
      accum[i] += sign * quat[i];
    }
  }

  double norm = 0.0;
  for (double value : accum) {
    norm += value * value;
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    throw ValidationException("MatrixTransform",
                              "rotations cancel out and have no mean",
                              "AverageRotation");
  }

  VersorType mean;
  mean.Set(accum[0] / norm, accum[1] / norm, accum[2] / norm, accum[3] / norm);
  return mean.GetMatrix();
}

VectorType AverageTranslation(const std::vector<VectorType> &translations) {
  if (translations.empty()) {
    throw ValidationException("MatrixTransform", "no translations to average",
                              "AverageTranslation");
  }

  VectorType mean;
  mean.Fill(0.0);
  for (const auto &translation : translations) {
    mean += translation;
  }
  return mean / static_cast<double>(translations.size());
}

HomogeneousMatrixType
EstimateEulerTransformConsensus(const std::vector<HomogeneousMatrixType> &transforms) {
  std::vector<RotationMatrixType> rotations;
  std::vector<VectorType> translations;
  rotations.reserve(transforms.size());
  translations.reserve(transforms.size());

  for (const auto &matrix : transforms) {
    RotationMatrixType rotation;
    VectorType translation;
    for (unsigned int row = 0; row < 3; ++row) {
      for (unsigned int col = 0; col < 3; ++col) {
        rotation(row, col) = matrix(row, col);
      }
      translation[row] = matrix(row, 3);
    }
    rotations.push_back(rotation);
    translations.push_back(translation);
  }

  const RotationMatrixType mean_rotation = AverageRotation(rotations);
  const VectorType mean_translation = AverageTranslation(translations);

  HomogeneousMatrixType consensus;
  consensus.SetIdentity();
  for (unsigned int row = 0; row < 3; ++row) {
    for (unsigned int col = 0; col < 3; ++col) {
      consensus(row, col) = mean_rotation(row, col);
    }
    consensus(row, 3) = mean_translation[row];
  }
  return consensus;
}

EulerTransformType::Pointer ToEulerTransform(const HomogeneousMatrixType &matrix) {
  RotationMatrixType rotation;
  EulerTransformType::OutputVectorType translation;
  for (unsigned int row = 0; row < 3; ++row) {
    for (unsigned int col = 0; col < 3; ++col) {
      rotation(row, col) = matrix(row, col);
    }
    translation[row] = matrix(row, 3);
  }

  if (!IsRotationMatrix(rotation)) {
    throw ValidationException("MatrixTransform",
                              "matrix is not a rigid rotation",
                              "ToEulerTransform");
  }

  auto transform = EulerTransformType::New();
  transform->SetMatrix(rotation, 1e-5);
  transform->SetTranslation(translation);
  return transform;
}

} // namespace blockfuse
