#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "BootstrapIndexSource.h"
#include "BootstrapIntervals.h"
#include "ResamplingStrategy.h"
#include "SaltelliDecomposer.h"
#include "SensitivityException.h"
#include "SobolEstimators.h"

namespace qmc_sensitivity
{
  /// Point estimates and intervals for one varied parameter.
  struct ParameterSensitivity
  {
    std::vector<double> firstOrder;
    std::vector<double> totalOrder;
    ConfidenceInterval  firstOrderCI;
    ConfidenceInterval  totalOrderCI;
  };

  /**
   * @brief First- and total-order Sobol indices with bootstrap confidence
   * intervals (Saltelli 2002 design).
   *
   * CI construction for every parameter j and QoI element q:
   *   1) decompose the runs into f_M2, f_M1, f_Nj
   *   2) θ̂ = S_j (resp. ST_j) on all n_mc rows
   *   3) draw one n_mc x B index matrix shared by every parameter
   *   4) θ*_b = estimator on the rows of trial b
   *   5) interval from the quantiles of {θ*_b}, pivotal by default:
   *        [ 2θ̂ - q_{1-α/2} , 2θ̂ - q_{α/2} ]
   *
   * Step 4 runs vectorized or trial by trial depending on
   * n_mc * B * n_qoi versus the vectorization threshold; both give the same
   * replicates.
   *
   * @tparam Rng random engine used to draw the index matrix.
   */
  template <class Rng = std::mt19937_64>
  class SobolBootstrap
  {
  public:
    struct Result
    {
      std::vector<ParameterSensitivity> parameters;   // in parameter order
      std::size_t                       n_mc;         // Monte Carlo base samples
      std::size_t                       n_qoi;        // elements per evaluation
      std::size_t                       B;            // bootstrap trials
      ResamplingMode                    mode;         // strategy actually used
    };

  public:
    /**
     * @throws ConfigError if numParameters or B is zero, or alpha is outside (0,1).
     */
    SobolBootstrap(std::size_t    numParameters,
                   std::size_t    B,
                   double         alpha,
                   IntervalMethod method    = IntervalMethod::PIVOTAL,
                   ResamplingMode mode      = ResamplingMode::AUTOMATIC,
                   std::uint64_t  threshold = kDefaultVectorizationThreshold)
      : m_decomposer(numParameters),
        m_B(B),
        m_alpha(alpha),
        m_method(method),
        m_mode(mode),
        m_threshold(threshold)
    {
      if (m_B == 0)
        throw ConfigError("SobolBootstrap: n_bootstrap must be positive");
      if (!(m_alpha > 0.0 && m_alpha < 1.0))
        throw ConfigError("SobolBootstrap: alpha must be in (0,1), got " + std::to_string(m_alpha));
    }

    /**
     * @brief Run with indices drawn from a caller-supplied engine.
     * @throws ConfigError if samples is empty, ShapeError if it does not fit the block layout.
     */
    Result run(const std::vector<EvaluationResult>& samples, Rng& rng) const
    {
      if (samples.empty())
        throw ConfigError("SobolBootstrap: no samples");

      const SaltelliMatrices matrices = m_decomposer.decompose(samples);
      const BootstrapIndexMatrix indices =
        drawBootstrapIndices(matrices.numMonteCarloSamples(), m_B, rng);

      return run_core_(matrices, indices);
    }

    /**
     * @brief Run with a precomputed index matrix (must have B trials of n_mc indices).
     */
    Result run(const std::vector<EvaluationResult>& samples,
               const BootstrapIndexMatrix&          indices) const
    {
      if (samples.empty())
        throw ConfigError("SobolBootstrap: no samples");
      if (indices.numTrials() != m_B)
        throw ConfigError("SobolBootstrap: index matrix has " + std::to_string(indices.numTrials())
                          + " trials, expected " + std::to_string(m_B));

      return run_core_(m_decomposer.decompose(samples), indices);
    }

    /// Strategy used for n_mc base samples of n_qoi elements.
    ResamplingMode resolveMode(std::size_t nMc, std::size_t nQoi) const
    {
      if (m_mode != ResamplingMode::AUTOMATIC)
        return m_mode;
      return selectResamplingMode(nMc, m_B, nQoi, m_threshold);
    }

    std::size_t    numParameters() const { return m_decomposer.numParameters(); }
    std::size_t    B()             const { return m_B; }
    double         alpha()         const { return m_alpha; }
    IntervalMethod method()        const { return m_method; }

  private:
    Result run_core_(const SaltelliMatrices& matrices, const BootstrapIndexMatrix& indices) const
    {
      Result out;
      out.n_mc  = matrices.numMonteCarloSamples();
      out.n_qoi = matrices.numQoiElements();
      out.B     = indices.numTrials();
      out.mode  = resolveMode(out.n_mc, out.n_qoi);

      const auto strategy   = makeResamplingStrategy(out.mode);
      const auto replicates = strategy->computeReplicates(matrices, indices);

      out.parameters.resize(matrices.numParameters());
      for (std::size_t j = 0; j < matrices.numParameters(); ++j)
        {
          auto& p = out.parameters[j];
          p.firstOrder = SobolEstimators::firstOrder(matrices.fM2, matrices.fM1, matrices.fNi[j]);
          p.totalOrder = SobolEstimators::totalOrder(matrices.fM2, matrices.fM1, matrices.fNi[j]);

          p.firstOrderCI = BootstrapIntervals::compute(replicates[j].firstOrder, p.firstOrder,
                                                       m_alpha, m_method);
          p.totalOrderCI = BootstrapIntervals::compute(replicates[j].totalOrder, p.totalOrder,
                                                       m_alpha, m_method);
        }

      return out;
    }

  private:
    SaltelliDecomposer m_decomposer;
    std::size_t        m_B;
    double             m_alpha;
    IntervalMethod     m_method;
    ResamplingMode     m_mode;
    std::uint64_t      m_threshold;
  };

} // namespace qmc_sensitivity
