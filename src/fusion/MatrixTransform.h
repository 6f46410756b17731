/**
 * @file MatrixTransform.h
 * @brief Rigid transform utilities for consensus reduction
 */

#ifndef BLOCKFUSE_MATRIX_TRANSFORM_H
#define BLOCKFUSE_MATRIX_TRANSFORM_H

#include "../core/BlockFuseTypes.h"

// ITK Headers
#include "itkEuler3DTransform.h"
#include "itkMatrix.h"
#include "itkMatrixOffsetTransformBase.h"

#include <vector>

namespace blockfuse {

using RotationMatrixType = itk::Matrix<double, 3, 3>;
using HomogeneousMatrixType = itk::Matrix<double, 4, 4>;
using MatrixTransformType = itk::MatrixOffsetTransformBase<double, 3, 3>;
using EulerTransformType = itk::Euler3DTransform<double>;

/**
 * @brief Leaf transforms of arbitrarily nested composite transforms
 *
 * Traversal is iterative and keeps the composite queue order. A
 * non-composite input yields itself.
 */
std::vector<TransformType::ConstPointer>
FlattenTransform(const TransformType *transform);

// 4x4 homogeneous matrix [R | offset] of a matrix transform
HomogeneousMatrixType MatrixTransformToMatrix(const MatrixTransformType *transform);

/**
 * @brief Mean rotation by normalized quaternion averaging
 *
 * Quaternions are aligned to the hemisphere of the first sample before
 * summing, so q and -q count as the same rotation.
 *
 * @throws ValidationException for an empty input or a matrix that is not
 *         a proper rotation
 */
RotationMatrixType AverageRotation(const std::vector<RotationMatrixType> &rotations);

VectorType AverageTranslation(const std::vector<VectorType> &translations);

HomogeneousMatrixType
EstimateEulerTransformConsensus(const std::vector<HomogeneousMatrixType> &transforms);

// Rotation about the origin followed by the matrix translation column
EulerTransformType::Pointer ToEulerTransform(const HomogeneousMatrixType &matrix);

bool IsRotationMatrix(const RotationMatrixType &matrix,
                      double tolerance = 1e-5);

} // namespace blockfuse

#endif // BLOCKFUSE_MATRIX_TRANSFORM_H
