#pragma once

#include <vector>
#include <cstddef>
#include <string>
#include <algorithm>

#include "SensitivityException.h"

namespace qmc_sensitivity
{
  /// One model evaluation of a quantity of interest. Scalars have length 1.
  using EvaluationResult = std::vector<double>;

  /**
   * @brief Dense row-major matrix of model evaluations.
   *
   * Row r holds one evaluation result, so the number of columns is the number
   * of elements of the quantity of interest (n_qoi). Used for the Saltelli
   * input-matrix contributions (n_mc x n_qoi) and for bootstrap replicate sets
   * (n_bootstrap x n_qoi).
   */
  class EvaluationMatrix
  {
  public:
    EvaluationMatrix()
      : m_rows(0),
        m_cols(0),
        m_data()
    {}

    EvaluationMatrix(std::size_t rows, std::size_t cols, double fill = 0.0)
      : m_rows(rows),
        m_cols(cols),
        m_data(rows * cols, fill)
    {}

    std::size_t rows() const noexcept { return m_rows; }
    std::size_t cols() const noexcept { return m_cols; }
    bool        empty() const noexcept { return m_data.empty(); }

    double& operator()(std::size_t r, std::size_t c)
    {
      return m_data[r * m_cols + c];
    }

    double operator()(std::size_t r, std::size_t c) const
    {
      return m_data[r * m_cols + c];
    }

    const double* rowData(std::size_t r) const
    {
      return m_data.data() + r * m_cols;
    }

    double* rowData(std::size_t r)
    {
      return m_data.data() + r * m_cols;
    }

    /**
     * @brief Overwrite row r with an evaluation result.
     * @throws ShapeError if the evaluation length differs from cols().
     */
    void setRow(std::size_t r, const EvaluationResult& values)
    {
      if (values.size() != m_cols)
        throw ShapeError("EvaluationMatrix::setRow: evaluation has "
                         + std::to_string(values.size()) + " elements, expected "
                         + std::to_string(m_cols));

      std::copy(values.begin(), values.end(), rowData(r));
    }

    EvaluationResult row(std::size_t r) const
    {
      return EvaluationResult(rowData(r), rowData(r) + m_cols);
    }

    /// Copy of column c, one entry per row.
    std::vector<double> column(std::size_t c) const
    {
      std::vector<double> out(m_rows);
      for (std::size_t r = 0; r < m_rows; ++r)
        out[r] = (*this)(r, c);
      return out;
    }

    bool sameShape(const EvaluationMatrix& other) const noexcept
    {
      return m_rows == other.m_rows && m_cols == other.m_cols;
    }

    const std::vector<double>& data() const noexcept { return m_data; }

  private:
    std::size_t         m_rows;
    std::size_t         m_cols;
    std::vector<double> m_data;
  };

} // namespace qmc_sensitivity
