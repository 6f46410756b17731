/**
 * @file Scheduler.cpp
 * @brief Registration task graph assembly and execution
 */

#include "Scheduler.h"
#include "../core/BlockFuseExceptions.h"
#include "ResultComposer.h"

#include <cmath>
#include <sstream>

namespace blockfuse {

std::vector<size_t> RegistrationConfig::GetBlockShape(size_t dimension) const {
  if (block_shape.empty()) {
    return std::vector<size_t>(dimension, DEFAULT_BLOCK_LENGTH);
  }
  return block_shape;
}

std::vector<double>
RegistrationConfig::GetOverlapFactors(size_t dimension) const {
  if (overlap_factors.empty()) {
    return std::vector<double>(dimension, 0.0);
  }
  return overlap_factors;
}

void RegistrationConfig::Validate(size_t dimension) const {
  if (!block_shape.empty()) {
    if (block_shape.size() != dimension) {
      throw ConfigurationException("block_shape",
                                   std::to_string(block_shape.size()) +
                                       " values",
                                   std::to_string(dimension) + " values");
    }
    for (size_t length : block_shape) {
      if (length == 0) {
        throw ConfigurationException("block_shape", "0", "positive lengths");
      }
    }
  }

  if (!overlap_factors.empty()) {
    if (overlap_factors.size() != dimension) {
      throw ConfigurationException("overlap_factors",
                                   std::to_string(overlap_factors.size()) +
                                       " values",
                                   std::to_string(dimension) + " values");
    }
    for (double factor : overlap_factors) {
      if (!std::isfinite(factor) || factor < 0.0) {
        std::stringstream ss;
        ss << factor;
        throw ConfigurationException("overlap_factors", ss.str(),
                                     "finite non-negative fractions");
      }
    }
  }
}

RegistrationSchedule::RegistrationSchedule(std::vector<size_t> partition_shape,
                                           std::shared_ptr<State> state,
                                           TaskGraph graph)
    : m_partition_shape(std::move(partition_shape)), m_state(std::move(state)),
      m_graph(std::move(graph)) {}

RegistrationResult RegistrationSchedule::Compute(Executor &executor) {
  m_state->results.assign(m_state->blocks.size(), std::nullopt);
  m_state->transforms.reset();
  m_state->status.reset();
  m_state->output.reset();

  executor.Execute(m_graph);

  if (!m_state->output) {
    throw ValidationException("RegistrationSchedule",
                              "graph finished without an output",
                              "Compute");
  }
  return *m_state->output;
}

RegistrationSchedule
ScheduleRegistration(const ImageSourceFactory &fixed_source,
                     const ImageSourceFactory &moving_source,
                     std::shared_ptr<const BlockPairRegistrationMethod> block_method,
                     std::shared_ptr<const ReduceResultsMethod> reduce_method,
                     TransformType::ConstPointer initial_transform,
                     const RegistrationConfig &config, const Logger &logger) {
  if (!reduce_method) {
    throw ValidationException("Scheduler", "reduce method is null",
                              "ScheduleRegistration");
  }
  config.Validate(Dimension);

  logger.Info("Preparing registration task graph...");

  // Metadata only, no voxels are fetched
  if (!fixed_source) {
    throw ValidationException("Scheduler", "fixed image source is empty",
                              "ScheduleRegistration");
  }
  ImageType::ConstPointer fixed_metadata = fixed_source()->GetMetadata();

  const BlockPartitioner partitioner(
      GetArrayExtent(fixed_metadata->GetLargestPossibleRegion()),
      config.GetBlockShape(Dimension));

  auto state = std::make_shared<RegistrationSchedule::State>();
  state->blocks.assign(partitioner.begin(), partitioner.end());
  state->results.assign(state->blocks.size(), std::nullopt);

  std::stringstream summary;
  summary << "Subdivided the fixed image into " << state->blocks.size()
          << " blocks";
  logger.Info(summary.str());

  BlockPairTaskConfig task_config;
  task_config.overlap_factors = config.GetOverlapFactors(Dimension);
  task_config.debug_output_directory = config.debug_output_directory;

  auto task = std::make_shared<const BlockPairTask>(
      fixed_source, moving_source, std::move(block_method), initial_transform,
      task_config, logger.WithContext("register"));

  TaskGraph graph;
  std::vector<TaskGraph::NodeId> block_nodes;
  block_nodes.reserve(state->blocks.size());

  // Each block node writes only its own result slot
  for (size_t i = 0; i < state->blocks.size(); ++i) {
    block_nodes.push_back(graph.AddNode(
        "register " + state->blocks[i].ToString(), [state, task, i]() {
          state->results[i].emplace(task->Run(state->blocks[i]));
        }));
  }

  const Logger reduce_logger = logger.WithContext("reduce");
  const TaskGraph::NodeId reduce_node = graph.AddNode(
      "reduce",
      [state, reduce_method, fixed_source, initial_transform, reduce_logger]() {
        std::vector<LocatedBlockResult> located;
        located.reserve(state->blocks.size());
        for (size_t i = 0; i < state->blocks.size(); ++i) {
          located.push_back(LocatedBlockResult{state->blocks[i],
                                               *state->results[i]});
        }
        state->transforms.emplace((*reduce_method)(
            located, fixed_source, initial_transform, reduce_logger));
      },
      block_nodes);

  const std::vector<size_t> partition_shape = partitioner.GetPartitionShape();
  const TaskGraph::NodeId status_node = graph.AddNode(
      "compose status",
      [state, partition_shape]() {
        std::vector<BlockPairResult> results;
        results.reserve(state->results.size());
        for (const auto &result : state->results) {
          results.push_back(*result);
        }
        state->status.emplace(
            ComposeBlockStatus(partition_shape, state->blocks, results));
      },
      block_nodes);

  const Logger output_logger = logger;
  graph.AddNode(
      "compose output",
      [state, output_logger]() {
        state->output.emplace(ComposeOutput(*state->transforms, *state->status));
        std::stringstream ss;
        ss << "Registration finished with "
           << state->status->Count(BlockRegStatus::Success) << " of "
           << state->status->GetNumberOfElements() << " blocks succeeding";
        output_logger.Info(ss.str());
      },
      {reduce_node, status_node});

  return RegistrationSchedule(partition_shape, state, std::move(graph));
}

} // namespace blockfuse
