#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "EvaluationMatrix.h"
#include "SensitivityException.h"

namespace qmc_sensitivity
{
  /**
   * @brief How a bootstrap confidence interval is formed from the replicates.
   *
   * PIVOTAL:    [ 2θ̂ - q_{1-α/2} , 2θ̂ - q_{α/2} ]   (basic / reverse percentile)
   * PERCENTILE: [ q_{α/2} , q_{1-α/2} ]
   */
  enum class IntervalMethod
  {
    PIVOTAL,
    PERCENTILE
  };

  /// Element-wise interval bounds, one entry per QoI element.
  struct ConfidenceInterval
  {
    std::vector<double> low;
    std::vector<double> high;
  };

  struct BootstrapIntervals
  {
    /**
     * @brief Hyndman–Fan type-7 quantile (linear interpolation between order
     * statistics), the default of numpy.percentile.
     *
     * @param s unsorted sample
     * @param p probability in [0,1]
     */
    static double quantileType7(const std::vector<double>& s, double p)
    {
      if (s.empty())
	throw std::invalid_argument("BootstrapIntervals::quantileType7: empty input");
      if (s.size() == 1)
	return s.front();
      if (p <= 0.0)
	return *std::min_element(s.begin(), s.end());
      if (p >= 1.0)
	return *std::max_element(s.begin(), s.end());

      const double      h    = (static_cast<double>(s.size()) - 1.0) * p;
      const std::size_t lo   = static_cast<std::size_t>(std::floor(h));
      const std::size_t hi   = std::min(lo + 1, s.size() - 1);
      const double      frac = h - static_cast<double>(lo);

      std::vector<double> w(s.begin(), s.end());
      std::nth_element(w.begin(), w.begin() + static_cast<std::ptrdiff_t>(lo), w.end());
      const double x0 = w[lo];
      // After nth_element everything right of lo is >= x0; the next order
      // statistic is the minimum of that tail.
      const double x1 = (hi == lo) ? x0
	: *std::min_element(w.begin() + static_cast<std::ptrdiff_t>(hi), w.end());

      return x0 + (x1 - x0) * frac;
    }

    /**
     * @brief Interval for every QoI element.
     *
     * @param replicates n_bootstrap x n_qoi replicate estimates
     * @param pointEstimate n_qoi point estimates θ̂
     * @param alpha the interval covers (1 - alpha) * 100 percent
     */
    static ConfidenceInterval compute(const EvaluationMatrix&    replicates,
				      const std::vector<double>& pointEstimate,
				      double                     alpha,
				      IntervalMethod             method = IntervalMethod::PIVOTAL)
    {
      if (!(alpha > 0.0 && alpha < 1.0))
	throw ConfigError("BootstrapIntervals: alpha must be in (0,1), got " + std::to_string(alpha));
      if (replicates.rows() == 0)
	throw ConfigError("BootstrapIntervals: no bootstrap replicates");
      if (replicates.cols() != pointEstimate.size())
	throw ShapeError("BootstrapIntervals: replicate width does not match point estimate");

      const double pLow  = alpha / 2.0;
      const double pHigh = 1.0 - alpha / 2.0;

      ConfidenceInterval ci;
      ci.low.resize(pointEstimate.size());
      ci.high.resize(pointEstimate.size());

      for (std::size_t q = 0; q < pointEstimate.size(); ++q)
	{
	  const std::vector<double> column = replicates.column(q);
	  const double qLow  = quantileType7(column, pLow);
	  const double qHigh = quantileType7(column, pHigh);

	  if (method == IntervalMethod::PIVOTAL)
	    {
	      ci.low[q]  = 2.0 * pointEstimate[q] - qHigh;
	      ci.high[q] = 2.0 * pointEstimate[q] - qLow;
	    }
	  else
	    {
	      ci.low[q]  = qLow;
	      ci.high[q] = qHigh;
	    }
	}

      return ci;
    }
  };

} // namespace qmc_sensitivity
