#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include "EvaluationMatrix.h"
#include "SensitivityException.h"

namespace qmc_sensitivity
{
  /// Element-wise mean, population variance and standard deviation of a QoI.
  struct StatisticalMoments
  {
    std::vector<double> mean;
    std::vector<double> var;
    std::vector<double> stddev;
  };

  /**
   * @brief Moments over all evaluations of one QoI, one value per QoI element.
   * @throws InputError for an empty sample list, ShapeError for ragged evaluations.
   */
  inline StatisticalMoments computeStatisticalMoments(const std::vector<EvaluationResult>& samples)
  {
    namespace ba = boost::accumulators;
    using MomentAccumulator = ba::accumulator_set<double, ba::stats<ba::tag::mean, ba::tag::variance>>;

    if (samples.empty())
      throw InputError("computeStatisticalMoments: no samples");

    const std::size_t nQoi = samples.front().size();
    std::vector<MomentAccumulator> acc(nQoi);

    for (const auto& evaluation : samples)
      {
	if (evaluation.size() != nQoi)
	  throw ShapeError("computeStatisticalMoments: evaluations differ in length");

	for (std::size_t q = 0; q < nQoi; ++q)
	  acc[q](evaluation[q]);
      }

    StatisticalMoments out;
    out.mean.reserve(nQoi);
    out.var.reserve(nQoi);
    out.stddev.reserve(nQoi);
    for (auto& a : acc)
      {
	const double v = ba::variance(a);
	out.mean.push_back(ba::mean(a));
	out.var.push_back(v);
	out.stddev.push_back(std::sqrt(std::max(v, 0.0)));
      }

    return out;
  }

} // namespace qmc_sensitivity
