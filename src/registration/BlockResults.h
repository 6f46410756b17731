/**
 * @file BlockResults.h
 * @brief Per-block and whole-volume registration results
 */

#ifndef BLOCKFUSE_BLOCK_RESULTS_H
#define BLOCKFUSE_BLOCK_RESULTS_H

#include "../block/BlockPartitioner.h"
#include "../core/BlockFuseTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace blockfuse {

enum class BlockRegStatus : uint8_t {
  Success = 0, // at least a forward transform was produced
  Failure = 1
};

std::string StatusToString(BlockRegStatus status);

/**
 * @brief Outcome of registering one fixed/moving block pair
 *
 * The forward transform maps moving to fixed space and is composed after
 * the initial transform. Domains are metadata-only images describing the
 * oriented physical region where the matching transform is valid.
 *
 * Construction enforces:
 *  - Success requires a forward transform
 *  - a transform has a domain and a domain has a transform
 *  - an inverse transform requires a forward transform
 *  - every domain spans a non-zero volume
 */
class BlockPairResult {
private:
  BlockRegStatus m_status;
  TransformType::ConstPointer m_transform;
  ImageBaseType::ConstPointer m_transform_domain;
  TransformType::ConstPointer m_inv_transform;
  ImageBaseType::ConstPointer m_inv_transform_domain;

public:
  /**
   * @throws ValidationException if any invariant is violated
   */
  BlockPairResult(BlockRegStatus status, TransformType::ConstPointer transform,
                  ImageBaseType::ConstPointer transform_domain,
                  TransformType::ConstPointer inv_transform = nullptr,
                  ImageBaseType::ConstPointer inv_transform_domain = nullptr);

  // Uniform placeholder for a block that could not be registered
  static BlockPairResult Failure();

  static BlockPairResult Success(TransformType::ConstPointer transform,
                                 ImageBaseType::ConstPointer transform_domain);

  BlockRegStatus GetStatus() const { return m_status; }
  bool IsSuccess() const { return m_status == BlockRegStatus::Success; }
  const TransformType *GetTransform() const { return m_transform; }
  const ImageBaseType *GetTransformDomain() const { return m_transform_domain; }
  const TransformType *GetInverseTransform() const { return m_inv_transform; }
  const ImageBaseType *GetInverseTransformDomain() const {
    return m_inv_transform_domain;
  }
  bool HasInverseTransform() const { return m_inv_transform.IsNotNull(); }
};

struct LocatedBlockResult {
  BlockDescriptor fixed_info;
  BlockPairResult result;
};

/**
 * @brief Fused output of the reduction step
 *
 * The forward transform maps moving to fixed space; the inverse is optional.
 */
class RegistrationTransformResult {
private:
  TransformType::ConstPointer m_transform;
  TransformType::ConstPointer m_inv_transform;

public:
  // Throws ValidationException for a null forward transform
  explicit RegistrationTransformResult(
      TransformType::ConstPointer transform,
      TransformType::ConstPointer inv_transform = nullptr);

  const TransformType *GetTransform() const { return m_transform; }
  const TransformType *GetInverseTransform() const { return m_inv_transform; }
};

/**
 * @brief Dense row-major grid of status codes shaped like the block partition
 */
class StatusGrid {
private:
  std::vector<size_t> m_shape;
  std::vector<uint8_t> m_values;

public:
  StatusGrid() = default;
  StatusGrid(const std::vector<size_t> &shape,
             BlockRegStatus fill = BlockRegStatus::Failure);

  const std::vector<size_t> &GetShape() const { return m_shape; }
  size_t GetNumberOfElements() const { return m_values.size(); }
  const std::vector<uint8_t> &GetValues() const { return m_values; }

  BlockRegStatus At(const std::vector<size_t> &index) const;
  void Set(const std::vector<size_t> &index, BlockRegStatus status);
  size_t Count(BlockRegStatus status) const;

private:
  size_t LinearIndex(const std::vector<size_t> &index) const;
};

struct RegistrationResult {
  RegistrationTransformResult transforms;
  StatusGrid status;
};

} // namespace blockfuse

#endif // BLOCKFUSE_BLOCK_RESULTS_H
