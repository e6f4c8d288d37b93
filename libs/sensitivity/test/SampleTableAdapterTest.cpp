// SampleTableAdapterTest.cpp
//
// Unit tests for SampleTableAdapter: table form, run dictionary form,
// output index selection and concatenation.

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "SampleTableAdapter.h"
#include "SensitivityException.h"

using namespace qmc_sensitivity;

namespace
{
    RunTableRow row(const std::string& runId, std::map<std::string, double> values)
    {
        return RunTableRow{ runId, std::move(values) };
    }
}

TEST_CASE("SampleTableAdapter: dictionary runs are ordered by run index", "[Adapter][Dictionary]")
{
    RunDictionary dict;
    dict.data["te"]["Run_2"] = { 5.0 };
    dict.data["te"]["Run_1"] = { 3.0 };

    SampleTableAdapter adapter({ "te" });
    const SampleTable table = adapter.adapt(dict);

    REQUIRE(table.at("te") == std::vector<EvaluationResult>{ { 3.0 }, { 5.0 } });
}

TEST_CASE("SampleTableAdapter: numeric, not lexical, run order", "[Adapter][Dictionary]")
{
    RunDictionary dict;
    for (int i = 1; i <= 12; ++i)
        dict.data["f"]["Run_" + std::to_string(i)] = { static_cast<double>(i) };

    const SampleTable table = SampleTableAdapter({ "f" }).adapt(dict);

    REQUIRE(table.at("f").size() == 12);
    for (std::size_t i = 0; i < 12; ++i)
        REQUIRE(table.at("f")[i][0] == static_cast<double>(i + 1));
}

TEST_CASE("SampleTableAdapter: dictionary errors", "[Adapter][Dictionary][Errors]")
{
    SampleTableAdapter adapter({ "f" });

    SECTION("Empty table")
    {
        REQUIRE_THROWS_AS(adapter.adapt(RunDictionary{}), InputError);
    }

    SECTION("Missing QoI")
    {
        RunDictionary dict;
        dict.data["g"]["Run_1"] = { 1.0 };
        REQUIRE_THROWS_AS(adapter.adapt(dict), InputError);
    }

    SECTION("Run index gap")
    {
        RunDictionary dict;
        dict.data["f"]["Run_1"] = { 1.0 };
        dict.data["f"]["Run_3"] = { 3.0 };
        REQUIRE_THROWS_AS(adapter.adapt(dict), InputError);
    }

    SECTION("Duplicate index through leading zeros")
    {
        RunDictionary dict;
        dict.data["f"]["Run_1"]  = { 1.0 };
        dict.data["f"]["Run_01"] = { 1.0 };
        REQUIRE_THROWS_AS(adapter.adapt(dict), InputError);
    }

    SECTION("Ragged evaluations")
    {
        RunDictionary dict;
        dict.data["f"]["Run_1"] = { 1.0, 2.0 };
        dict.data["f"]["Run_2"] = { 1.0 };
        REQUIRE_THROWS_AS(adapter.adapt(dict), ShapeError);
    }
}

TEST_CASE("SampleTableAdapter::parseRunLabel", "[Adapter][Labels]")
{
    REQUIRE(SampleTableAdapter::parseRunLabel("Run_1") == 1);
    REQUIRE(SampleTableAdapter::parseRunLabel("Run_250") == 250);

    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("Run_0"), InputError);
    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("Run_"), InputError);
    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("run_1"), InputError);
    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("Run_-1"), InputError);
    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("Run_1a"), InputError);
    REQUIRE_THROWS_AS(SampleTableAdapter::parseRunLabel("Run_99999999999999999999999"), InputError);
}

TEST_CASE("SampleTableAdapter: table form keeps first-appearance order", "[Adapter][Table]")
{
    RunTable table;
    table.rows.push_back(row("Run_7", { { "f", 7.0 }, { "g", -7.0 } }));
    table.rows.push_back(row("Run_2", { { "f", 2.0 }, { "g", -2.0 } }));
    table.rows.push_back(row("Run_5", { { "f", 5.0 }, { "g", -5.0 } }));

    const SampleTable out = SampleTableAdapter({ "f", "g" }).adapt(table);

    REQUIRE(out.at("f") == std::vector<EvaluationResult>{ { 7.0 }, { 2.0 }, { 5.0 } });
    REQUIRE(out.at("g") == std::vector<EvaluationResult>{ { -7.0 }, { -2.0 }, { -5.0 } });
}

TEST_CASE("SampleTableAdapter: repeated run ids form vector QoIs", "[Adapter][Table]")
{
    RunTable table;
    table.rows.push_back(row("a", { { "f", 1.0 } }));
    table.rows.push_back(row("b", { { "f", 10.0 } }));
    table.rows.push_back(row("a", { { "f", 2.0 } }));
    table.rows.push_back(row("b", { { "f", 20.0 } }));

    SampleTableAdapter adapter({ "f" });
    const SampleTable out = adapter.adapt(table);
    REQUIRE(out.at("f") == std::vector<EvaluationResult>{ { 1.0, 2.0 }, { 10.0, 20.0 } });

    SECTION("Output index picks one element")
    {
        const SampleTable second = adapter.adapt(table, 1);
        REQUIRE(second.at("f") == std::vector<EvaluationResult>{ { 2.0 }, { 20.0 } });

        REQUIRE_THROWS_AS(adapter.adapt(table, 2), InputError);
    }
}

TEST_CASE("SampleTableAdapter: table errors", "[Adapter][Table][Errors]")
{
    SampleTableAdapter adapter({ "f" });

    REQUIRE_THROWS_AS(adapter.adapt(RunTable{}), InputError);

    RunTable missing;
    missing.rows.push_back(row("Run_1", { { "g", 1.0 } }));
    REQUIRE_THROWS_AS(adapter.adapt(missing), InputError);

    REQUIRE_THROWS_AS(SampleTableAdapter(std::vector<std::string>{}), ConfigError);
}

TEST_CASE("SampleTableAdapter::concatenate appends in input order", "[Adapter][Concatenate]")
{
    SampleTable first{ { "f", { { 1.0 }, { 2.0 } } }, { "g", { { 0.1 }, { 0.2 } } } };
    SampleTable second{ { "f", { { 3.0 } } }, { "g", { { 0.3 } } } };

    const SampleTable merged = SampleTableAdapter::concatenate({ first, second }, { "f", "g" });

    REQUIRE(merged.at("f") == std::vector<EvaluationResult>{ { 1.0 }, { 2.0 }, { 3.0 } });
    REQUIRE(merged.at("g") == std::vector<EvaluationResult>{ { 0.1 }, { 0.2 }, { 0.3 } });

    SampleTable lacking{ { "f", { { 4.0 } } } };
    REQUIRE_THROWS_AS(SampleTableAdapter::concatenate({ first, lacking }, { "f", "g" }), InputError);
}
