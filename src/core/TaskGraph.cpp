/**
 * @file TaskGraph.cpp
 * @brief Task graph construction and execution
 */

#include "TaskGraph.h"
#include "BlockFuseExceptions.h"
#include "ThreadPool.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>

namespace blockfuse {

TaskGraph::NodeId TaskGraph::AddNode(const std::string &name, Work work,
                                     const std::vector<NodeId> &dependencies) {
  if (!work) {
    throw ValidationException("TaskGraph", "node '" + name + "' has no work",
                              "AddNode");
  }

  const NodeId id = m_nodes.size();
  for (NodeId dep : dependencies) {
    if (dep >= id) {
      throw ValidationException("TaskGraph",
                                "node '" + name + "' depends on unknown node " +
                                    std::to_string(dep),
                                "AddNode");
    }
  }

  m_nodes.push_back(Node{name, std::move(work), dependencies});
  return id;
}

const TaskGraph::Node &TaskGraph::GetNode(NodeId id) const {
  if (id >= m_nodes.size()) {
    throw ValidationException("TaskGraph",
                              "no node with id " + std::to_string(id),
                              "GetNode");
  }
  return m_nodes[id];
}

std::vector<std::vector<TaskGraph::NodeId>> TaskGraph::BuildDependents() const {
  std::vector<std::vector<NodeId>> dependents(m_nodes.size());
  for (NodeId id = 0; id < m_nodes.size(); ++id) {
    for (NodeId dep : m_nodes[id].dependencies) {
      dependents[dep].push_back(id);
    }
  }
  return dependents;
}

void SequentialExecutor::Execute(const TaskGraph &graph) {
  const auto &nodes = graph.GetNodes();
  std::vector<bool> skipped(nodes.size(), false);
  std::exception_ptr first_error;

  for (TaskGraph::NodeId id = 0; id < nodes.size(); ++id) {
    for (TaskGraph::NodeId dep : nodes[id].dependencies) {
      if (skipped[dep]) {
        skipped[id] = true;
        break;
      }
    }
    if (skipped[id]) {
      continue;
    }

    try {
      nodes[id].work();
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
      skipped[id] = true;
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads)
    : m_num_threads(num_threads) {
  if (m_num_threads == 0) {
    m_num_threads = std::thread::hardware_concurrency();
    if (m_num_threads == 0)
      m_num_threads = 4;
  }
}

void ThreadPoolExecutor::Execute(const TaskGraph &graph) {
  const auto &nodes = graph.GetNodes();
  if (nodes.empty()) {
    return;
  }

  const auto dependents = graph.BuildDependents();

  std::mutex state_mutex;
  std::condition_variable finished_condition;
  std::vector<size_t> remaining_deps(nodes.size());
  std::vector<bool> skipped(nodes.size(), false);
  size_t settled = 0; // completed, failed or skipped
  std::exception_ptr first_error;

  for (TaskGraph::NodeId id = 0; id < nodes.size(); ++id) {
    remaining_deps[id] = nodes[id].dependencies.size();
  }

  ThreadPool pool(m_num_threads);

  // Mark a node and its transitive dependents as skipped. Caller holds lock.
  auto skip_dependents = [&](TaskGraph::NodeId failed) {
    std::vector<TaskGraph::NodeId> stack(dependents[failed]);
    while (!stack.empty()) {
      TaskGraph::NodeId id = stack.back();
      stack.pop_back();
      if (skipped[id]) {
        continue;
      }
      skipped[id] = true;
      ++settled;
      for (TaskGraph::NodeId next : dependents[id]) {
        stack.push_back(next);
      }
    }
  };

  std::function<void(TaskGraph::NodeId)> submit;
  submit = [&](TaskGraph::NodeId id) {
    pool.Enqueue([&, id]() {
      bool failed = false;
      try {
        nodes[id].work();
      } catch (...) {
        failed = true;
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }

      std::vector<TaskGraph::NodeId> ready;
      {
        std::lock_guard<std::mutex> lock(state_mutex);
        ++settled;
        if (failed) {
          skip_dependents(id);
        } else {
          for (TaskGraph::NodeId next : dependents[id]) {
            if (skipped[next]) {
              continue;
            }
            if (--remaining_deps[next] == 0) {
              ready.push_back(next);
            }
          }
        }
      }

      for (TaskGraph::NodeId next : ready) {
        submit(next);
      }
      finished_condition.notify_all();
    });
  };

  std::vector<TaskGraph::NodeId> roots;
  for (TaskGraph::NodeId id = 0; id < nodes.size(); ++id) {
    if (remaining_deps[id] == 0) {
      roots.push_back(id);
    }
  }
  for (TaskGraph::NodeId id : roots) {
    submit(id);
  }

  {
    std::unique_lock<std::mutex> lock(state_mutex);
    finished_condition.wait(lock, [&] { return settled == nodes.size(); });
  }
  pool.WaitForCompletion();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace blockfuse
