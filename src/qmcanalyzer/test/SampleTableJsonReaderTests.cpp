#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>
#include <variant>

#include <boost/filesystem.hpp>

#include "SampleTableAdapter.h"
#include "SampleTableJsonReader.h"
#include "SensitivityException.h"

using namespace qmc_sensitivity;
namespace fs = boost::filesystem;

TEST_CASE("SampleTableJsonReader: table format", "[SampleTable][JSON]") {
    const std::string json = R"({
        "format": "table",
        "rows": [
            { "run_id": "Run_1", "te": 1.5, "ti": 0.25 },
            { "run_id": 2,       "te": 2.5, "ti": 0.5 }
        ]
    })";

    const SampleTableSource source = SampleTableJsonReader::readString(json);
    REQUIRE(std::holds_alternative<RunTable>(source));

    const RunTable& table = std::get<RunTable>(source);
    REQUIRE(table.rows.size() == 2);
    REQUIRE(table.rows[0].runId == "Run_1");
    REQUIRE(table.rows[1].runId == "2");
    REQUIRE(table.rows[0].values.at("te") == 1.5);
    REQUIRE(table.rows[1].values.at("ti") == 0.5);
    REQUIRE(table.rows[0].values.count("run_id") == 0);
}

TEST_CASE("SampleTableJsonReader: runs format", "[SampleTable][JSON]") {
    const std::string json = R"({
        "format": "runs",
        "data": {
            "te": { "Run_2": 5, "Run_1": 3 },
            "profile": { "Run_1": [0.0, 1.0], "Run_2": [2.0, 3.0] }
        }
    })";

    const SampleTableSource source = SampleTableJsonReader::readString(json);
    REQUIRE(std::holds_alternative<RunDictionary>(source));

    const SampleTable samples = SampleTableAdapter({ "te", "profile" }).adapt(source);
    REQUIRE(samples.at("te") == std::vector<EvaluationResult>{ { 3.0 }, { 5.0 } });
    REQUIRE(samples.at("profile") == std::vector<EvaluationResult>{ { 0.0, 1.0 }, { 2.0, 3.0 } });
}

TEST_CASE("SampleTableJsonReader: bare run dictionary", "[SampleTable][JSON]") {
    const SampleTableSource source = SampleTableJsonReader::readString(R"({"te": {"Run_1": 1.0}})");
    REQUIRE(std::holds_alternative<RunDictionary>(source));
    REQUIRE(std::get<RunDictionary>(source).data.at("te").at("Run_1") == EvaluationResult{ 1.0 });
}

TEST_CASE("SampleTableJsonReader: malformed documents", "[SampleTable][JSON][Errors]") {
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString("{ broken"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString("[]"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"format": "csv"})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"format": "table"})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"format": "runs", "data": []})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"format": "table", "rows": [{"te": 1}]})"),
                      InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(
                          R"({"format": "table", "rows": [{"run_id": 1, "te": "hot"}]})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"te": {"Run_1": [1, "x"]}})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readString(R"({"te": 3})"), InputError);
    REQUIRE_THROWS_AS(SampleTableJsonReader::readFile("/nonexistent/samples.json"), InputError);
}

TEST_CASE("SampleTableJsonReader::readFile", "[SampleTable][File]") {
    const fs::path path = fs::temp_directory_path() / fs::unique_path("qmc_samples_%%%%-%%%%.json");
    {
        std::ofstream out(path.string());
        out << R"({"format": "runs", "data": {"f": {"Run_1": 0.5, "Run_2": 1.5}}})";
    }

    const SampleTableSource source = SampleTableJsonReader::readFile(path.string());
    fs::remove(path);

    REQUIRE(std::get<RunDictionary>(source).data.at("f").size() == 2);
}
