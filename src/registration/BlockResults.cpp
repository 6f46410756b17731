/**
 * @file BlockResults.cpp
 * @brief Result validation and status grid storage
 */

#include "BlockResults.h"
#include "../core/BlockFuseExceptions.h"

#include <algorithm>
#include <sstream>

namespace blockfuse {

namespace {

void ValidateDomain(const ImageBaseType *domain, const std::string &name) {
  if (domain->GetLargestPossibleRegion().GetNumberOfPixels() == 0) {
    throw ValidationException("BlockPairResult",
                              name + " must describe a non-zero volume",
                              "BlockPairResult");
  }
}

} // namespace

std::string StatusToString(BlockRegStatus status) {
  return status == BlockRegStatus::Success ? "SUCCESS" : "FAILURE";
}

BlockPairResult::BlockPairResult(BlockRegStatus status,
                                 TransformType::ConstPointer transform,
                                 ImageBaseType::ConstPointer transform_domain,
                                 TransformType::ConstPointer inv_transform,
                                 ImageBaseType::ConstPointer inv_transform_domain)
    : m_status(status), m_transform(std::move(transform)),
      m_transform_domain(std::move(transform_domain)),
      m_inv_transform(std::move(inv_transform)),
      m_inv_transform_domain(std::move(inv_transform_domain)) {
  if (m_status == BlockRegStatus::Success && m_transform.IsNull()) {
    throw ValidationException("BlockPairResult",
                              "a successful result requires a transform",
                              "BlockPairResult");
  }
  if (m_transform.IsNull() != m_transform_domain.IsNull()) {
    throw ValidationException(
        "BlockPairResult",
        "transform and transform domain must be provided together",
        "BlockPairResult");
  }
  if (m_inv_transform.IsNotNull() && m_transform.IsNull()) {
    throw ValidationException(
        "BlockPairResult",
        "an inverse transform requires a forward transform",
        "BlockPairResult");
  }
  if (m_inv_transform.IsNull() != m_inv_transform_domain.IsNull()) {
    throw ValidationException(
        "BlockPairResult",
        "inverse transform and inverse domain must be provided together",
        "BlockPairResult");
  }

  if (m_transform_domain) {
    ValidateDomain(m_transform_domain, "transform domain");
  }
  if (m_inv_transform_domain) {
    ValidateDomain(m_inv_transform_domain, "inverse transform domain");
  }
}

BlockPairResult BlockPairResult::Failure() {
  return BlockPairResult(BlockRegStatus::Failure, nullptr, nullptr);
}

BlockPairResult
BlockPairResult::Success(TransformType::ConstPointer transform,
                         ImageBaseType::ConstPointer transform_domain) {
  return BlockPairResult(BlockRegStatus::Success, std::move(transform),
                         std::move(transform_domain));
}

RegistrationTransformResult::RegistrationTransformResult(
    TransformType::ConstPointer transform,
    TransformType::ConstPointer inv_transform)
    : m_transform(std::move(transform)),
      m_inv_transform(std::move(inv_transform)) {
  if (m_transform.IsNull()) {
    throw ValidationException("RegistrationTransformResult",
                              "forward transform is required",
                              "RegistrationTransformResult");
  }
}

StatusGrid::StatusGrid(const std::vector<size_t> &shape, BlockRegStatus fill)
    : m_shape(shape) {
  size_t count = shape.empty() ? 0 : 1;
  for (size_t extent : shape) {
    count *= extent;
  }
  m_values.assign(count, static_cast<uint8_t>(fill));
}

BlockRegStatus StatusGrid::At(const std::vector<size_t> &index) const {
  return static_cast<BlockRegStatus>(m_values[LinearIndex(index)]);
}

void StatusGrid::Set(const std::vector<size_t> &index, BlockRegStatus status) {
  m_values[LinearIndex(index)] = static_cast<uint8_t>(status);
}

size_t StatusGrid::Count(BlockRegStatus status) const {
  return static_cast<size_t>(
      std::count(m_values.begin(), m_values.end(),
                 static_cast<uint8_t>(status)));
}

size_t StatusGrid::LinearIndex(const std::vector<size_t> &index) const {
  if (index.size() != m_shape.size()) {
    throw ValidationException("StatusGrid",
                              "index rank " + std::to_string(index.size()) +
                                  " does not match grid rank " +
                                  std::to_string(m_shape.size()),
                              "LinearIndex");
  }

  size_t linear = 0;
  for (size_t dim = 0; dim < m_shape.size(); ++dim) {
    if (index[dim] >= m_shape[dim]) {
      std::stringstream ss;
      ss << "index " << index[dim] << " out of range along axis " << dim
         << " of extent " << m_shape[dim];
      throw ValidationException("StatusGrid", ss.str(), "LinearIndex");
    }
    linear = linear * m_shape[dim] + index[dim];
  }
  return linear;
}

} // namespace blockfuse
