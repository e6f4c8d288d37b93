#include "ResamplingStrategy.h"

#include <algorithm>
#include <limits>

#include "SensitivityException.h"
#include "SobolEstimators.h"

namespace qmc_sensitivity
{
  std::string toString(ResamplingMode mode)
  {
    switch (mode)
      {
      case ResamplingMode::AUTOMATIC:
        return "automatic";
      case ResamplingMode::VECTORIZED:
        return "vectorized";
      case ResamplingMode::SEQUENTIAL:
        return "sequential";
      }
    return "unknown";
  }

  ResamplingMode selectResamplingMode(std::size_t   numSamples,
                                      std::size_t   numBootstrap,
                                      std::size_t   numQoiElements,
                                      std::uint64_t threshold)
  {
    const std::uint64_t maxValue = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t a = static_cast<std::uint64_t>(numSamples);
    const std::uint64_t b = static_cast<std::uint64_t>(numBootstrap);
    const std::uint64_t c = static_cast<std::uint64_t>(numQoiElements);

    if (a != 0 && b > maxValue / a)
      return ResamplingMode::SEQUENTIAL;
    const std::uint64_t ab = a * b;
    if (ab != 0 && c > maxValue / ab)
      return ResamplingMode::SEQUENTIAL;

    return (ab * c <= threshold) ? ResamplingMode::VECTORIZED : ResamplingMode::SEQUENTIAL;
  }

  void ResamplingStrategy::checkCompatible(const SaltelliMatrices&     matrices,
                                           const BootstrapIndexMatrix& indices)
  {
    if (indices.numSamples() != matrices.numMonteCarloSamples())
      throw ShapeError("ResamplingStrategy: index matrix drawn for "
                       + std::to_string(indices.numSamples()) + " samples, matrices have "
                       + std::to_string(matrices.numMonteCarloSamples()));
    if (indices.numTrials() == 0)
      throw ConfigError("ResamplingStrategy: no bootstrap trials");
  }

  namespace
  {
    EvaluationMatrix gatherRows(const EvaluationMatrix& src, const std::vector<std::size_t>& rows)
    {
      EvaluationMatrix out(rows.size(), src.cols());
      for (std::size_t r = 0; r < rows.size(); ++r)
        {
          const double* from = src.rowData(rows[r]);
          std::copy(from, from + src.cols(), out.rowData(r));
        }
      return out;
    }

    void storeReplicate(EvaluationMatrix& dst, std::size_t trial, const std::vector<double>& values)
    {
      std::copy(values.begin(), values.end(), dst.rowData(trial));
    }

    std::vector<ReplicateSet> allocateReplicates(const SaltelliMatrices&     matrices,
                                                 const BootstrapIndexMatrix& indices)
    {
      const std::size_t nBoot = indices.numTrials();
      const std::size_t nQoi  = matrices.numQoiElements();

      std::vector<ReplicateSet> out(matrices.numParameters());
      for (auto& set : out)
        {
          set.firstOrder = EvaluationMatrix(nBoot, nQoi);
          set.totalOrder = EvaluationMatrix(nBoot, nQoi);
        }
      return out;
    }
  }

  std::vector<ReplicateSet>
  VectorizedResampling::computeReplicates(const SaltelliMatrices&     matrices,
                                          const BootstrapIndexMatrix& indices) const
  {
    checkCompatible(matrices, indices);

    const std::size_t nBoot = indices.numTrials();
    auto out = allocateReplicates(matrices, indices);

    // f_M2[r] and f_M1[r] are the same for every parameter
    std::vector<EvaluationMatrix> resampledM2;
    std::vector<EvaluationMatrix> resampledM1;
    resampledM2.reserve(nBoot);
    resampledM1.reserve(nBoot);
    for (std::size_t b = 0; b < nBoot; ++b)
      {
        resampledM2.push_back(gatherRows(matrices.fM2, indices.trial(b)));
        resampledM1.push_back(gatherRows(matrices.fM1, indices.trial(b)));
      }

    for (std::size_t j = 0; j < matrices.numParameters(); ++j)
      {
        std::vector<EvaluationMatrix> resampledNi;
        resampledNi.reserve(nBoot);
        for (std::size_t b = 0; b < nBoot; ++b)
          resampledNi.push_back(gatherRows(matrices.fNi[j], indices.trial(b)));

        for (std::size_t b = 0; b < nBoot; ++b)
          {
            storeReplicate(out[j].firstOrder, b,
                           SobolEstimators::firstOrder(resampledM2[b], resampledM1[b], resampledNi[b]));
            storeReplicate(out[j].totalOrder, b,
                           SobolEstimators::totalOrder(resampledM2[b], resampledM1[b], resampledNi[b]));
          }
      }

    return out;
  }

  std::vector<ReplicateSet>
  SequentialResampling::computeReplicates(const SaltelliMatrices&     matrices,
                                          const BootstrapIndexMatrix& indices) const
  {
    checkCompatible(matrices, indices);

    auto out = allocateReplicates(matrices, indices);

    for (std::size_t j = 0; j < matrices.numParameters(); ++j)
      {
        for (std::size_t b = 0; b < indices.numTrials(); ++b)
          {
            const auto& rows = indices.trial(b);
            storeReplicate(out[j].firstOrder, b,
                           SobolEstimators::firstOrder(matrices.fM2, matrices.fM1, matrices.fNi[j], rows));
            storeReplicate(out[j].totalOrder, b,
                           SobolEstimators::totalOrder(matrices.fM2, matrices.fM1, matrices.fNi[j], rows));
          }
      }

    return out;
  }

  std::unique_ptr<ResamplingStrategy> makeResamplingStrategy(ResamplingMode mode)
  {
    switch (mode)
      {
      case ResamplingMode::VECTORIZED:
        return std::make_unique<VectorizedResampling>();
      case ResamplingMode::SEQUENTIAL:
        return std::make_unique<SequentialResampling>();
      case ResamplingMode::AUTOMATIC:
        break;
      }
    throw ConfigError("makeResamplingStrategy: resolve AUTOMATIC with selectResamplingMode() first");
  }

} // namespace qmc_sensitivity
