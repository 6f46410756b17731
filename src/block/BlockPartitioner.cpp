/**
 * @file BlockPartitioner.cpp
 * @brief Block grid enumeration
 */

#include "BlockPartitioner.h"
#include "../core/BlockFuseExceptions.h"

#include <algorithm>
#include <sstream>

namespace blockfuse {

namespace {

std::string ShapeToString(const std::vector<size_t> &shape) {
  std::stringstream ss;
  ss << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    ss << (i ? ", " : "") << shape[i];
  }
  ss << ")";
  return ss.str();
}

} // namespace

BlockDescriptor::BlockDescriptor(std::vector<size_t> chunk_index,
                                 std::vector<VoxelSlice> voxel_slice)
    : chunk_index(std::move(chunk_index)), voxel_slice(std::move(voxel_slice)) {
  if (this->chunk_index.size() != this->voxel_slice.size()) {
    throw ValidationException("BlockDescriptor",
                              "chunk index and voxel slice ranks differ",
                              "BlockDescriptor");
  }
}

std::vector<size_t> BlockDescriptor::GetShape() const {
  std::vector<size_t> shape;
  shape.reserve(voxel_slice.size());
  for (const auto &slice : voxel_slice) {
    shape.push_back(slice.Length());
  }
  return shape;
}

RegionType BlockDescriptor::ToImageRegion() const {
  if (GetDimension() != Dimension) {
    throw ValidationException("BlockDescriptor",
                              "expected a " + std::to_string(Dimension) +
                                  "-D block, got " +
                                  std::to_string(GetDimension()),
                              "ToImageRegion");
  }

  IndexType index;
  SizeType size;
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    const VoxelSlice &slice = voxel_slice[Dimension - 1 - dim];
    index[dim] = static_cast<IndexValueType>(slice.start);
    size[dim] = slice.Length();
  }
  return RegionType(index, size);
}

std::string BlockDescriptor::ToString() const {
  return ShapeToString(chunk_index);
}

BlockPartitioner::BlockPartitioner(const std::vector<size_t> &extent,
                                   const std::vector<size_t> &block_shape)
    : m_extent(extent), m_block_shape(block_shape), m_number_of_blocks(1) {
  if (extent.empty() || extent.size() != block_shape.size()) {
    throw ConfigurationException("block_shape", ShapeToString(block_shape),
                                 std::to_string(extent.size()) +
                                     " positive sizes matching the extent " +
                                     ShapeToString(extent));
  }

  for (size_t dim = 0; dim < extent.size(); ++dim) {
    if (extent[dim] == 0) {
      throw ConfigurationException("extent", ShapeToString(extent),
                                   "positive sizes");
    }
    if (block_shape[dim] == 0) {
      throw ConfigurationException("block_shape", ShapeToString(block_shape),
                                   "positive sizes");
    }
    const size_t blocks =
        (extent[dim] + block_shape[dim] - 1) / block_shape[dim];
    m_partition_shape.push_back(blocks);
    m_number_of_blocks *= blocks;
  }
}

BlockDescriptor BlockPartitioner::GetBlock(size_t linear_index) const {
  if (linear_index >= m_number_of_blocks) {
    throw ValidationException("BlockPartitioner",
                              "block " + std::to_string(linear_index) +
                                  " out of range for " +
                                  std::to_string(m_number_of_blocks) +
                                  " blocks",
                              "GetBlock");
  }

  const size_t rank = m_extent.size();
  std::vector<size_t> chunk_index(rank);
  std::vector<VoxelSlice> voxel_slice(rank);

  size_t remainder = linear_index;
  for (size_t i = rank; i-- > 0;) {
    chunk_index[i] = remainder % m_partition_shape[i];
    remainder /= m_partition_shape[i];

    const size_t start = chunk_index[i] * m_block_shape[i];
    voxel_slice[i] =
        VoxelSlice{start, std::min(start + m_block_shape[i], m_extent[i])};
  }

  return BlockDescriptor(std::move(chunk_index), std::move(voxel_slice));
}

std::vector<size_t> GetArrayExtent(const RegionType &region) {
  std::vector<size_t> extent(Dimension);
  for (unsigned int dim = 0; dim < Dimension; ++dim) {
    extent[Dimension - 1 - dim] = region.GetSize(dim);
  }
  return extent;
}

} // namespace blockfuse
