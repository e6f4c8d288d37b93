#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "EvaluationMatrix.h"
#include "SensitivityException.h"

namespace qmc_sensitivity
{
  namespace detail
  {
    // Row r of the estimator input is row r of the matrices
    struct IdentityRows
    {
      std::size_t size;

      std::size_t count() const noexcept { return size; }
      std::size_t operator[](std::size_t r) const noexcept { return r; }
    };

    // Row r of the estimator input is row rows[r] of the matrices (one bootstrap trial)
    struct IndexedRows
    {
      const std::size_t* rows;
      std::size_t        size;

      std::size_t count() const noexcept { return size; }
      std::size_t operator[](std::size_t r) const noexcept { return rows[r]; }
    };

    inline void checkSameShape(const EvaluationMatrix& fM2,
                               const EvaluationMatrix& fM1,
                               const EvaluationMatrix& fNi)
    {
      if (!fM2.sameShape(fM1) || !fM2.sameShape(fNi))
        throw ShapeError("SobolEstimators: f_M2, f_M1 and f_Ni must have identical shapes");
      if (fM2.rows() == 0 || fM2.cols() == 0)
        throw ShapeError("SobolEstimators: empty evaluation matrices");
    }

    /**
     * Population variance of concat(f_M2, f_M1) along the sample axis, one
     * value per QoI element. Two-pass: mean first, then squared deviations.
     */
    template <class Rows>
    std::vector<double> pooledVariance(const EvaluationMatrix& fM2,
                                       const EvaluationMatrix& fM1,
                                       const Rows&             rows)
    {
      const std::size_t n    = rows.count();
      const std::size_t nQoi = fM2.cols();
      const double      N    = static_cast<double>(2 * n);

      std::vector<double> mean(nQoi, 0.0);
      for (std::size_t r = 0; r < n; ++r)
        {
          const double* a = fM2.rowData(rows[r]);
          for (std::size_t q = 0; q < nQoi; ++q)
            mean[q] += a[q];
        }
      for (std::size_t r = 0; r < n; ++r)
        {
          const double* b = fM1.rowData(rows[r]);
          for (std::size_t q = 0; q < nQoi; ++q)
            mean[q] += b[q];
        }
      for (auto& m : mean)
        m /= N;

      std::vector<double> var(nQoi, 0.0);
      for (std::size_t r = 0; r < n; ++r)
        {
          const double* a = fM2.rowData(rows[r]);
          for (std::size_t q = 0; q < nQoi; ++q)
            {
              const double d = a[q] - mean[q];
              var[q] += d * d;
            }
        }
      for (std::size_t r = 0; r < n; ++r)
        {
          const double* b = fM1.rowData(rows[r]);
          for (std::size_t q = 0; q < nQoi; ++q)
            {
              const double d = b[q] - mean[q];
              var[q] += d * d;
            }
        }
      for (auto& v : var)
        v /= N;

      return var;
    }

    // Divide by V, except where V == 0: those elements are defined as 0.
    inline void normalizeByVariance(std::vector<double>&       numerators,
                                    const std::vector<double>& V)
    {
      for (std::size_t q = 0; q < numerators.size(); ++q)
        numerators[q] = (V[q] == 0.0) ? 0.0 : numerators[q] / V[q];
    }

    template <class Rows>
    std::vector<double> firstOrder(const EvaluationMatrix& fM2,
                                   const EvaluationMatrix& fM1,
                                   const EvaluationMatrix& fNi,
                                   const Rows&             rows)
    {
      const std::size_t n    = rows.count();
      const std::size_t nQoi = fM2.cols();

      std::vector<double> acc(nQoi, 0.0);
      for (std::size_t r = 0; r < n; ++r)
        {
          const std::size_t src = rows[r];
          const double*     a   = fM2.rowData(src);
          const double*     b   = fM1.rowData(src);
          const double*     ab  = fNi.rowData(src);
          for (std::size_t q = 0; q < nQoi; ++q)
            acc[q] += b[q] * (ab[q] - a[q]);
        }
      for (auto& v : acc)
        v /= static_cast<double>(n);

      normalizeByVariance(acc, pooledVariance(fM2, fM1, rows));
      return acc;
    }

    template <class Rows>
    std::vector<double> totalOrder(const EvaluationMatrix& fM2,
                                   const EvaluationMatrix& fM1,
                                   const EvaluationMatrix& fNi,
                                   const Rows&             rows)
    {
      const std::size_t n    = rows.count();
      const std::size_t nQoi = fM2.cols();

      std::vector<double> acc(nQoi, 0.0);
      for (std::size_t r = 0; r < n; ++r)
        {
          const std::size_t src = rows[r];
          const double*     a   = fM2.rowData(src);
          const double*     ab  = fNi.rowData(src);
          for (std::size_t q = 0; q < nQoi; ++q)
            {
              const double d = a[q] - ab[q];
              acc[q] += d * d;
            }
        }
      for (auto& v : acc)
        v = 0.5 * (v / static_cast<double>(n));

      normalizeByVariance(acc, pooledVariance(fM2, fM1, rows));
      return acc;
    }
  } // namespace detail

  /**
   * @brief Saltelli estimators of first- and total-order Sobol indices.
   *
   * With V = var(concat(f_M2, f_M1)) per QoI element:
   *
   *   S_j  = mean(f_M1 * (f_Nj - f_M2)) / V
   *   ST_j = 0.5 * mean((f_M2 - f_Nj)^2) / V        (Jansen form, Saltelli 2010)
   *
   * Elements with V == 0 yield exactly 0. The row-indexed overloads evaluate the
   * same estimators on the rows selected by one bootstrap trial.
   */
  struct SobolEstimators
  {
    static std::vector<double> firstOrder(const EvaluationMatrix& fM2,
                                          const EvaluationMatrix& fM1,
                                          const EvaluationMatrix& fNi)
    {
      detail::checkSameShape(fM2, fM1, fNi);
      return detail::firstOrder(fM2, fM1, fNi, detail::IdentityRows{ fM2.rows() });
    }

    static std::vector<double> totalOrder(const EvaluationMatrix& fM2,
                                          const EvaluationMatrix& fM1,
                                          const EvaluationMatrix& fNi)
    {
      detail::checkSameShape(fM2, fM1, fNi);
      return detail::totalOrder(fM2, fM1, fNi, detail::IdentityRows{ fM2.rows() });
    }

    static std::vector<double> firstOrder(const EvaluationMatrix&         fM2,
                                          const EvaluationMatrix&         fM1,
                                          const EvaluationMatrix&         fNi,
                                          const std::vector<std::size_t>& rows)
    {
      detail::checkSameShape(fM2, fM1, fNi);
      checkRows(rows, fM2.rows());
      return detail::firstOrder(fM2, fM1, fNi, detail::IndexedRows{ rows.data(), rows.size() });
    }

    static std::vector<double> totalOrder(const EvaluationMatrix&         fM2,
                                          const EvaluationMatrix&         fM1,
                                          const EvaluationMatrix&         fNi,
                                          const std::vector<std::size_t>& rows)
    {
      detail::checkSameShape(fM2, fM1, fNi);
      checkRows(rows, fM2.rows());
      return detail::totalOrder(fM2, fM1, fNi, detail::IndexedRows{ rows.data(), rows.size() });
    }

    /// Population variance of concat(f_M2, f_M1), one value per QoI element.
    static std::vector<double> totalVariance(const EvaluationMatrix& fM2,
                                             const EvaluationMatrix& fM1)
    {
      if (!fM2.sameShape(fM1) || fM2.empty())
        throw ShapeError("SobolEstimators: f_M2 and f_M1 must be non-empty and equally shaped");
      return detail::pooledVariance(fM2, fM1, detail::IdentityRows{ fM2.rows() });
    }

  private:
    static void checkRows(const std::vector<std::size_t>& rows, std::size_t numRows)
    {
      if (rows.empty())
        throw ShapeError("SobolEstimators: empty row selection");
      for (std::size_t r : rows)
        if (r >= numRows)
          throw ShapeError("SobolEstimators: row index " + std::to_string(r)
                           + " out of range for " + std::to_string(numRows) + " rows");
    }
  };

} // namespace qmc_sensitivity
