#pragma once

#include <cstddef>
#include <vector>

#include "EvaluationMatrix.h"

namespace qmc_sensitivity
{
  /**
   * @brief Code evaluations on the Saltelli input matrices.
   *
   * fM2 and fM1 hold the evaluations on base matrices M2 and M1; fNi[j] holds
   * the evaluations on the radial matrix of parameter j. All are n_mc x n_qoi.
   */
  struct SaltelliMatrices
  {
    EvaluationMatrix              fM2;
    EvaluationMatrix              fM1;
    std::vector<EvaluationMatrix> fNi;

    std::size_t numMonteCarloSamples() const { return fM2.rows(); }
    std::size_t numParameters() const { return fNi.size(); }
    std::size_t numQoiElements() const { return fM2.cols(); }
  };

  /**
   * @brief Splits a Saltelli-ordered run sequence into its input-matrix
   * contributions.
   *
   * The sampler writes runs in blocks of n_params + 2:
   *
   *   [ M2 row, N_1 row, ..., N_nparams row, M1 row ]  repeated n_mc times
   *
   * so block b contributes row b of every matrix.
   */
  class SaltelliDecomposer
  {
  public:
    explicit SaltelliDecomposer(std::size_t numParameters);

    std::size_t numParameters() const noexcept { return m_numParameters; }
    std::size_t blockSize() const noexcept { return m_numParameters + 2; }

    /**
     * @brief Number of Monte Carlo base samples in a run sequence of the given length.
     * @throws ShapeError if the length is zero or not a multiple of blockSize().
     */
    std::size_t numMonteCarloSamples(std::size_t numRuns) const;

    /**
     * @throws ShapeError if the sample count does not fit the block layout or
     *         the evaluations differ in length.
     */
    SaltelliMatrices decompose(const std::vector<EvaluationResult>& samples) const;

  private:
    std::size_t m_numParameters;
  };

} // namespace qmc_sensitivity
