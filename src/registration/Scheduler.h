/**
 * @file Scheduler.h
 * @brief Construction of the block registration task graph
 */

#ifndef BLOCKFUSE_SCHEDULER_H
#define BLOCKFUSE_SCHEDULER_H

#include "../block/BlockPartitioner.h"
#include "../block/ImageSource.h"
#include "../core/Logger.h"
#include "../core/TaskGraph.h"
#include "BlockPairTask.h"
#include "BlockResults.h"
#include "RegistrationMethods.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blockfuse {

/**
 * @brief Options for a block-wise registration run
 *
 * Per-axis values are in array order (slowest axis first).
 */
struct RegistrationConfig {
  static constexpr size_t DEFAULT_BLOCK_LENGTH = 256;

  // Empty selects DEFAULT_BLOCK_LENGTH along every axis
  std::vector<size_t> block_shape;

  // Empty means no overlap. 0.1 pads a 100 voxel block by 5 voxels per side
  std::vector<double> overlap_factors;

  std::string debug_output_directory;

  std::vector<size_t> GetBlockShape(size_t dimension) const;
  std::vector<double> GetOverlapFactors(size_t dimension) const;

  // Throws ConfigurationException
  void Validate(size_t dimension) const;
};

/**
 * @brief Unexecuted registration task graph
 *
 * Holds one node per block, a reduction node and a status node that each
 * depend on every block node, and an output node joining the two. Nothing
 * is read until Compute runs the graph.
 */
class RegistrationSchedule {
public:
  struct State {
    std::vector<BlockDescriptor> blocks;
    std::vector<std::optional<BlockPairResult>> results;
    std::optional<RegistrationTransformResult> transforms;
    std::optional<StatusGrid> status;
    std::optional<RegistrationResult> output;
  };

private:
  std::vector<size_t> m_partition_shape;
  std::shared_ptr<State> m_state;
  TaskGraph m_graph;

public:
  RegistrationSchedule(std::vector<size_t> partition_shape,
                       std::shared_ptr<State> state, TaskGraph graph);

  const std::vector<size_t> &GetPartitionShape() const {
    return m_partition_shape;
  }
  const std::vector<BlockDescriptor> &GetBlocks() const {
    return m_state->blocks;
  }
  const TaskGraph &GetTaskGraph() const { return m_graph; }
  size_t GetNumberOfBlocks() const { return m_state->blocks.size(); }

  /**
   * @brief Run the graph and return the composed result
   *
   * Block failures are reported in the status grid. Reduction failures and
   * image source errors propagate. Not safe to call concurrently on the
   * same schedule.
   */
  RegistrationResult Compute(Executor &executor);
};

/**
 * @brief Partition the fixed volume and build the registration graph
 *
 * Only fixed image metadata is read here.
 *
 * @param initial_transform maps fixed to moving space, may be null
 */
RegistrationSchedule
ScheduleRegistration(const ImageSourceFactory &fixed_source,
                     const ImageSourceFactory &moving_source,
                     std::shared_ptr<const BlockPairRegistrationMethod> block_method,
                     std::shared_ptr<const ReduceResultsMethod> reduce_method,
                     TransformType::ConstPointer initial_transform,
                     const RegistrationConfig &config, const Logger &logger);

} // namespace blockfuse

#endif // BLOCKFUSE_SCHEDULER_H
