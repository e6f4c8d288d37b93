#include "SaltelliDecomposer.h"

#include <string>

#include "SensitivityException.h"

namespace qmc_sensitivity
{
  SaltelliDecomposer::SaltelliDecomposer(std::size_t numParameters)
    : m_numParameters(numParameters)
  {
    if (m_numParameters == 0)
      throw ConfigError("SaltelliDecomposer: at least one varied parameter is required");
  }

  std::size_t SaltelliDecomposer::numMonteCarloSamples(std::size_t numRuns) const
  {
    const std::size_t step = blockSize();
    if (numRuns == 0 || numRuns % step != 0)
      throw ShapeError("SaltelliDecomposer: " + std::to_string(numRuns)
                       + " samples is not a positive multiple of the block size "
                       + std::to_string(step));
    return numRuns / step;
  }

  SaltelliMatrices SaltelliDecomposer::decompose(const std::vector<EvaluationResult>& samples) const
  {
    const std::size_t nMc  = numMonteCarloSamples(samples.size());
    const std::size_t nQoi = samples.front().size();
    const std::size_t step = blockSize();

    SaltelliMatrices out;
    out.fM2 = EvaluationMatrix(nMc, nQoi);
    out.fM1 = EvaluationMatrix(nMc, nQoi);
    out.fNi.assign(m_numParameters, EvaluationMatrix(nMc, nQoi));

    for (std::size_t b = 0; b < nMc; ++b)
      {
        const std::size_t base = b * step;

        out.fM2.setRow(b, samples[base]);
        for (std::size_t j = 0; j < m_numParameters; ++j)
          out.fNi[j].setRow(b, samples[base + 1 + j]);
        out.fM1.setRow(b, samples[base + step - 1]);
      }

    return out;
  }

} // namespace qmc_sensitivity
