// SaltelliDecomposerTest.cpp
//
// Unit tests for SaltelliDecomposer (block layout M2, N_1..N_p, M1).

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "SaltelliDecomposer.h"
#include "SensitivityException.h"

using namespace qmc_sensitivity;

namespace
{
    // [ {0}, {1}, ..., {n-1} ]
    std::vector<EvaluationResult> scalarRamp(std::size_t n)
    {
        std::vector<EvaluationResult> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i)
            out.push_back({ static_cast<double>(i) });
        return out;
    }

    std::vector<double> column0(const EvaluationMatrix& m)
    {
        return m.column(0);
    }
}

TEST_CASE("SaltelliDecomposer: recovers the input-matrix rows from a ramp", "[Saltelli][Decomposer]")
{
    SaltelliDecomposer dec(2);
    REQUIRE(dec.blockSize() == 4);

    const auto m = dec.decompose(scalarRamp(12));

    REQUIRE(m.numMonteCarloSamples() == 3);
    REQUIRE(m.numParameters() == 2);
    REQUIRE(m.numQoiElements() == 1);

    REQUIRE(column0(m.fM2) == std::vector<double>{ 0, 4, 8 });
    REQUIRE(column0(m.fM1) == std::vector<double>{ 3, 7, 11 });
    REQUIRE(column0(m.fNi[0]) == std::vector<double>{ 1, 5, 9 });
    REQUIRE(column0(m.fNi[1]) == std::vector<double>{ 2, 6, 10 });
}

TEST_CASE("SaltelliDecomposer: layout holds for other parameter counts", "[Saltelli][Decomposer]")
{
    for (std::size_t nParams = 1; nParams <= 5; ++nParams)
    {
        const std::size_t nMc  = 4;
        const std::size_t step = nParams + 2;

        SaltelliDecomposer dec(nParams);
        const auto m = dec.decompose(scalarRamp(nMc * step));

        REQUIRE(m.numMonteCarloSamples() == nMc);
        for (std::size_t b = 0; b < nMc; ++b)
        {
            REQUIRE(m.fM2(b, 0) == static_cast<double>(b * step));
            REQUIRE(m.fM1(b, 0) == static_cast<double>(b * step + step - 1));
            for (std::size_t j = 0; j < nParams; ++j)
                REQUIRE(m.fNi[j](b, 0) == static_cast<double>(b * step + 1 + j));
        }
    }
}

TEST_CASE("SaltelliDecomposer: vector-valued evaluations keep their elements", "[Saltelli][Decomposer]")
{
    std::vector<EvaluationResult> samples;
    for (int i = 0; i < 6; ++i)
        samples.push_back({ static_cast<double>(i), static_cast<double>(10 * i), -1.0 });

    SaltelliDecomposer dec(1);
    const auto m = dec.decompose(samples);

    REQUIRE(m.numMonteCarloSamples() == 2);
    REQUIRE(m.numQoiElements() == 3);

    REQUIRE(m.fM2.row(1) == EvaluationResult{ 3.0, 30.0, -1.0 });
    REQUIRE(m.fNi[0].row(0) == EvaluationResult{ 1.0, 10.0, -1.0 });
    REQUIRE(m.fM1.row(1) == EvaluationResult{ 5.0, 50.0, -1.0 });
}

TEST_CASE("SaltelliDecomposer: rejects sample counts outside the block layout", "[Saltelli][Decomposer][Errors]")
{
    SaltelliDecomposer dec(2);

    REQUIRE_THROWS_AS(dec.numMonteCarloSamples(0), ShapeError);
    REQUIRE_THROWS_AS(dec.numMonteCarloSamples(10), ShapeError);
    REQUIRE(dec.numMonteCarloSamples(8) == 2);

    REQUIRE_THROWS_AS(dec.decompose(scalarRamp(7)), ShapeError);
    REQUIRE_THROWS_AS(dec.decompose({}), ShapeError);
}

TEST_CASE("SaltelliDecomposer: rejects ragged evaluations and zero parameters", "[Saltelli][Decomposer][Errors]")
{
    REQUIRE_THROWS_AS(SaltelliDecomposer(0), ConfigError);

    std::vector<EvaluationResult> samples = scalarRamp(4);
    samples[2] = { 1.0, 2.0 };

    SaltelliDecomposer dec(2);
    REQUIRE_THROWS_AS(dec.decompose(samples), ShapeError);
}
