/**
 * @file TaskGraph.h
 * @brief Dependency graph of named work items and the executors that run it
 */

#ifndef BLOCKFUSE_TASK_GRAPH_H
#define BLOCKFUSE_TASK_GRAPH_H

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace blockfuse {

class TaskGraph {
public:
  using NodeId = size_t;
  using Work = std::function<void()>;

  struct Node {
    std::string name;
    Work work;
    std::vector<NodeId> dependencies;
  };

private:
  std::vector<Node> m_nodes;

public:
  /**
   * @brief Append a node
   *
   * Dependencies must name nodes that were already added, which keeps the
   * insertion order a valid topological order. Throws ValidationException
   * otherwise, or when @p work is empty.
   */
  NodeId AddNode(const std::string &name, Work work,
                 const std::vector<NodeId> &dependencies = {});

  const Node &GetNode(NodeId id) const;
  const std::vector<Node> &GetNodes() const { return m_nodes; }
  size_t GetNumberOfNodes() const { return m_nodes.size(); }
  bool Empty() const { return m_nodes.empty(); }

  // Direct dependents of every node, indexed by node id
  std::vector<std::vector<NodeId>> BuildDependents() const;
};

/**
 * @brief Strategy for running a TaskGraph
 *
 * Execute returns once every runnable node has finished. If any node threw,
 * its transitive dependents are skipped and the first captured exception is
 * rethrown.
 */
class Executor {
public:
  virtual ~Executor() = default;
  virtual void Execute(const TaskGraph &graph) = 0;
};

class SequentialExecutor : public Executor {
public:
  void Execute(const TaskGraph &graph) override;
};

class ThreadPoolExecutor : public Executor {
private:
  size_t m_num_threads;

public:
  // Zero selects the hardware concurrency
  explicit ThreadPoolExecutor(size_t num_threads = 0);

  void Execute(const TaskGraph &graph) override;
  size_t GetNumThreads() const { return m_num_threads; }
};

} // namespace blockfuse

#endif // BLOCKFUSE_TASK_GRAPH_H
