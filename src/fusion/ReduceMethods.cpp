/**
 * @file ReduceMethods.cpp
 * @brief Displacement field and rigid consensus reductions
 */

#include "ReduceMethods.h"
#include "../block/ImageBlock.h"
#include "../core/BlockFuseExceptions.h"
#include "MatrixTransform.h"

#include <sstream>

namespace blockfuse {

namespace {

size_t CountSuccesses(const std::vector<LocatedBlockResult> &block_results) {
  size_t count = 0;
  for (const auto &located : block_results) {
    if (located.result.IsSuccess()) {
      ++count;
    }
  }
  return count;
}

} // namespace

ReduceToDisplacementFieldMethod::ReduceToDisplacementFieldMethod(
    const DisplacementFieldConfig &config)
    : m_config(config) {
  m_config.Validate();
}

TransformCollection ReduceToDisplacementFieldMethod::CollectTransforms(
    const std::vector<LocatedBlockResult> &block_results,
    const Logger &logger) {
  TransformCollection collection(TransformCollection::BlendDistanceWeightedMean,
                                 logger);
  for (const auto &located : block_results) {
    if (!located.result.IsSuccess()) {
      // TODO: estimate the failed block's physical domain and push a
      // stand-in default transform for it
      continue;
    }
    collection.Push(TransformEntry{located.result.GetTransform(),
                                   located.result.GetTransformDomain()});
  }

  if (logger.IsEnabled(Logger::Level::Debug)) {
    for (const auto &domain : collection.GetDomains()) {
      if (domain) {
        logger.Debug("Collected domain with physical bounds " +
                     GetSampleBounds(domain).ToString());
      }
    }
  }
  return collection;
}

RegistrationTransformResult ReduceToDisplacementFieldMethod::operator()(
    const std::vector<LocatedBlockResult> &block_results,
    const ImageSourceFactory &fixed_source,
    const TransformType *initial_transform, const Logger &logger) const {
  const TransformCollection collection =
      CollectTransforms(block_results, logger);
  if (collection.Empty()) {
    throw ReductionException("DisplacementField",
                             "failed to compose at least one transform for "
                             "sampling",
                             0);
  }

  std::stringstream ss;
  ss << "Sampling " << collection.GetNumberOfEntries() << " of "
     << block_results.size() << " block transforms into a displacement field";
  logger.Info(ss.str());

  ImageType::ConstPointer reference = fixed_source()->GetMetadata();
  const DisplacementFieldSynthesizer synthesizer(m_config, logger);
  DisplacementFieldTransformType::Pointer forward =
      synthesizer.Synthesize(collection, reference, initial_transform);

  return RegistrationTransformResult(forward.GetPointer());
}

RegistrationTransformResult EulerConsensusReduceMethod::operator()(
    const std::vector<LocatedBlockResult> &block_results,
    const ImageSourceFactory &, const TransformType *,
    const Logger &logger) const {
  std::vector<HomogeneousMatrixType> samples;

  for (const auto &located : block_results) {
    const TransformType *transform = located.result.GetTransform();
    if (transform == nullptr) {
      continue;
    }
    logger.Debug("Attempting to reduce transform of type " +
                 std::string(transform->GetNameOfClass()) + " from block " +
                 located.fixed_info.ToString());

    const std::vector<TransformType::ConstPointer> leaves =
        FlattenTransform(transform);
    const auto *euler =
        leaves.size() == 1
            ? dynamic_cast<const EulerTransformType *>(leaves.front().GetPointer())
            : nullptr;
    if (euler == nullptr) {
      throw ReductionException(
          "EulerConsensus",
          "could not get rigid consensus with transform type " +
              std::string(transform->GetNameOfClass()),
          CountSuccesses(block_results));
    }

    if (located.result.IsSuccess()) {
      samples.push_back(MatrixTransformToMatrix(euler));
    }
  }

  if (samples.empty()) {
    throw ReductionException("EulerConsensus",
                             "no successful rigid block results", 0);
  }

  std::stringstream ss;
  ss << "Averaging " << samples.size() << " rigid block transforms";
  logger.Info(ss.str());

  EulerTransformType::Pointer consensus =
      ToEulerTransform(EstimateEulerTransformConsensus(samples));
  return RegistrationTransformResult(consensus.GetPointer());
}

ReduceMethodConfig::Type ReduceMethodConfig::ParseType(const std::string &name) {
  if (name == "displacement_field") {
    return Type::DisplacementField;
  }
  if (name == "euler_consensus") {
    return Type::EulerConsensus;
  }
  throw ConfigurationException("reduce_method", name,
                               "displacement_field or euler_consensus");
}

std::string ReduceMethodConfig::TypeToString(Type type) {
  switch (type) {
  case Type::DisplacementField:
    return "displacement_field";
  case Type::EulerConsensus:
    return "euler_consensus";
  default:
    return "unknown";
  }
}

std::shared_ptr<const ReduceResultsMethod>
MakeReduceResultsMethod(const ReduceMethodConfig &config) {
  switch (config.type) {
  case ReduceMethodConfig::Type::DisplacementField:
    return std::make_shared<ReduceToDisplacementFieldMethod>(
        config.displacement_field);
  case ReduceMethodConfig::Type::EulerConsensus:
    return std::make_shared<EulerConsensusReduceMethod>();
  default:
    throw ConfigurationException("reduce_method",
                                 ReduceMethodConfig::TypeToString(config.type),
                                 "displacement_field or euler_consensus");
  }
}

} // namespace blockfuse
