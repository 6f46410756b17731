/**
 * @file BlockPartitioner.h
 * @brief Subdivision of a volume into a grid of axis-aligned blocks
 *
 * Extents, block shapes and chunk indices are in array order, slowest axis
 * first. ToImageRegion flips to ITK access order.
 */

#ifndef BLOCKFUSE_BLOCK_PARTITIONER_H
#define BLOCKFUSE_BLOCK_PARTITIONER_H

#include "../core/BlockFuseTypes.h"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace blockfuse {

// Half-open [start, stop) with unit step
struct VoxelSlice {
  size_t start = 0;
  size_t stop = 0;

  size_t Length() const { return stop > start ? stop - start : 0; }
  bool operator==(const VoxelSlice &other) const {
    return start == other.start && stop == other.stop;
  }
};

struct BlockDescriptor {
  std::vector<size_t> chunk_index;
  std::vector<VoxelSlice> voxel_slice;

  BlockDescriptor() = default;

  // Throws ValidationException when the ranks differ
  BlockDescriptor(std::vector<size_t> chunk_index,
                  std::vector<VoxelSlice> voxel_slice);

  size_t GetDimension() const { return chunk_index.size(); }
  std::vector<size_t> GetShape() const;

  // Requires a 3-D descriptor
  RegionType ToImageRegion() const;

  // e.g. "(0, 1, 2)"
  std::string ToString() const;

  bool operator==(const BlockDescriptor &other) const {
    return chunk_index == other.chunk_index && voxel_slice == other.voxel_slice;
  }
};

class BlockPartitioner {
private:
  std::vector<size_t> m_extent;
  std::vector<size_t> m_block_shape;
  std::vector<size_t> m_partition_shape;
  size_t m_number_of_blocks;

public:
  /**
   * @throws ConfigurationException on a rank mismatch or a zero size
   */
  BlockPartitioner(const std::vector<size_t> &extent,
                   const std::vector<size_t> &block_shape);

  const std::vector<size_t> &GetExtent() const { return m_extent; }
  const std::vector<size_t> &GetBlockShape() const { return m_block_shape; }
  const std::vector<size_t> &GetPartitionShape() const {
    return m_partition_shape;
  }
  size_t GetNumberOfBlocks() const { return m_number_of_blocks; }

  // Row-major linear index, last axis fastest; edge blocks are truncated
  BlockDescriptor GetBlock(size_t linear_index) const;

  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = BlockDescriptor;
    using difference_type = std::ptrdiff_t;
    using pointer = const BlockDescriptor *;
    using reference = BlockDescriptor;

    const_iterator() = default;
    const_iterator(const BlockPartitioner *partitioner, size_t position)
        : m_partitioner(partitioner), m_position(position) {}

    BlockDescriptor operator*() const {
      return m_partitioner->GetBlock(m_position);
    }
    const_iterator &operator++() {
      ++m_position;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator previous = *this;
      ++m_position;
      return previous;
    }
    bool operator==(const const_iterator &other) const {
      return m_partitioner == other.m_partitioner &&
             m_position == other.m_position;
    }
    bool operator!=(const const_iterator &other) const {
      return !(*this == other);
    }

  private:
    const BlockPartitioner *m_partitioner = nullptr;
    size_t m_position = 0;
  };

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const {
    return const_iterator(this, m_number_of_blocks);
  }
};

/**
 * @brief Extent of an image in array order (K,J,I)
 */
std::vector<size_t> GetArrayExtent(const RegionType &region);

} // namespace blockfuse

#endif // BLOCKFUSE_BLOCK_PARTITIONER_H
