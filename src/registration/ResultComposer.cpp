#include "ResultComposer.h"
#include "../core/BlockFuseExceptions.h"

#include <set>
#include <vector>

namespace blockfuse {

StatusGrid ComposeBlockStatus(const std::vector<size_t> &partition_shape,
                              const std::vector<BlockDescriptor> &blocks,
                              const std::vector<BlockPairResult> &results) {
  if (blocks.size() != results.size()) {
    throw ValidationException("ResultComposer",
                              std::to_string(blocks.size()) + " blocks but " +
                                  std::to_string(results.size()) + " results",
                              "ComposeBlockStatus");
  }

  StatusGrid grid(partition_shape, BlockRegStatus::Failure);
  std::set<std::vector<size_t>> seen;
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (!seen.insert(blocks[i].chunk_index).second) {
      throw ValidationException("ResultComposer",
                                "duplicate chunk index " + blocks[i].ToString(),
                                "ComposeBlockStatus");
    }
    grid.Set(blocks[i].chunk_index, results[i].GetStatus());
  }
  return grid;
}

RegistrationResult ComposeOutput(RegistrationTransformResult transform_result,
                                 StatusGrid status) {
  return RegistrationResult{std::move(transform_result), std::move(status)};
}

} // namespace blockfuse
