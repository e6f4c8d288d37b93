#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "BootstrapIndexSource.h"
#include "EvaluationMatrix.h"
#include "SaltelliDecomposer.h"

namespace qmc_sensitivity
{
  /// Above this many gathered values (n_mc * n_bootstrap * n_qoi) resampling runs trial by trial.
  constexpr std::uint64_t kDefaultVectorizationThreshold = 10000000ull;

  enum class ResamplingMode
  {
    AUTOMATIC,   // pick by selectResamplingMode()
    VECTORIZED,  // gather every trial up front, then estimate
    SEQUENTIAL   // one trial at a time, reading rows through the index list
  };

  std::string toString(ResamplingMode mode);

  /**
   * @brief VECTORIZED when n_mc * n_bootstrap * n_qoi <= threshold, SEQUENTIAL
   * otherwise. A product that overflows 64 bits counts as above any threshold.
   */
  ResamplingMode selectResamplingMode(std::size_t   numSamples,
                                      std::size_t   numBootstrap,
                                      std::size_t   numQoiElements,
                                      std::uint64_t threshold = kDefaultVectorizationThreshold);

  /// Replicate estimates for one parameter, n_bootstrap x n_qoi each.
  struct ReplicateSet
  {
    EvaluationMatrix firstOrder;
    EvaluationMatrix totalOrder;
  };

  /**
   * @brief Computes bootstrap replicates of the Sobol estimators for every
   * parameter from one shared index matrix.
   *
   * Implementations differ only in peak memory; for the same matrices and
   * index matrix they return identical replicates.
   */
  class ResamplingStrategy
  {
  public:
    virtual ~ResamplingStrategy() = default;

    /**
     * @return one ReplicateSet per parameter, in parameter order
     * @throws ShapeError if the index matrix was drawn for a different n_mc
     */
    virtual std::vector<ReplicateSet> computeReplicates(const SaltelliMatrices&     matrices,
                                                        const BootstrapIndexMatrix& indices) const = 0;

    virtual ResamplingMode mode() const = 0;

  protected:
    static void checkCompatible(const SaltelliMatrices& matrices, const BootstrapIndexMatrix& indices);
  };

  /**
   * @brief Materializes f_M2[r], f_M1[r] and f_Ni[r] for all trials at once.
   * Transient memory O(n_mc * n_bootstrap * n_qoi).
   */
  class VectorizedResampling : public ResamplingStrategy
  {
  public:
    std::vector<ReplicateSet> computeReplicates(const SaltelliMatrices&     matrices,
                                                const BootstrapIndexMatrix& indices) const override;

    ResamplingMode mode() const override { return ResamplingMode::VECTORIZED; }
  };

  /**
   * @brief Evaluates one trial at a time directly on the decomposed matrices.
   * Transient memory O(n_mc * n_qoi) at most.
   */
  class SequentialResampling : public ResamplingStrategy
  {
  public:
    std::vector<ReplicateSet> computeReplicates(const SaltelliMatrices&     matrices,
                                                const BootstrapIndexMatrix& indices) const override;

    ResamplingMode mode() const override { return ResamplingMode::SEQUENTIAL; }
  };

  /// @throws ConfigError for ResamplingMode::AUTOMATIC, which must be resolved first.
  std::unique_ptr<ResamplingStrategy> makeResamplingStrategy(ResamplingMode mode);

} // namespace qmc_sensitivity
