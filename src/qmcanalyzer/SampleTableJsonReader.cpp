#include "SampleTableJsonReader.h"

#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "SensitivityException.h"

namespace fs = boost::filesystem;
using namespace rapidjson;

namespace qmc_sensitivity {

namespace {

EvaluationResult readEvaluation(const Value& value, const std::string& where) {
    if (value.IsNumber())
        return EvaluationResult{ value.GetDouble() };

    if (value.IsArray()) {
        EvaluationResult out;
        out.reserve(value.Size());
        for (const auto& item : value.GetArray()) {
            if (!item.IsNumber())
                throw InputError("Non-numeric element in evaluation " + where);
            out.push_back(item.GetDouble());
        }
        return out;
    }

    throw InputError("Evaluation " + where + " must be a number or an array of numbers");
}

std::string readRunId(const Value& value) {
    if (value.IsString())
        return value.GetString();
    if (value.IsUint64())
        return std::to_string(value.GetUint64());
    if (value.IsInt64())
        return std::to_string(value.GetInt64());
    throw InputError("'run_id' must be a string or an integer");
}

RunTable readRunTable(const Value& rows) {
    if (!rows.IsArray())
        throw InputError("'rows' must be an array");

    RunTable table;
    table.rows.reserve(rows.Size());
    for (const auto& row : rows.GetArray()) {
        if (!row.IsObject())
            throw InputError("Every entry of 'rows' must be an object");
        if (!row.HasMember("run_id"))
            throw InputError("Row without 'run_id'");

        RunTableRow out;
        out.runId = readRunId(row["run_id"]);
        for (Value::ConstMemberIterator it = row.MemberBegin(); it != row.MemberEnd(); ++it) {
            const std::string column = it->name.GetString();
            if (column == "run_id")
                continue;
            if (!it->value.IsNumber())
                throw InputError("Column '" + column + "' of run '" + out.runId + "' is not numeric");
            out.values[column] = it->value.GetDouble();
        }
        table.rows.push_back(std::move(out));
    }
    return table;
}

RunDictionary readRunDictionary(const Value& data) {
    if (!data.IsObject())
        throw InputError("Run dictionary must be a JSON object");

    RunDictionary dict;
    for (Value::ConstMemberIterator q = data.MemberBegin(); q != data.MemberEnd(); ++q) {
        const std::string qoi = q->name.GetString();
        if (!q->value.IsObject())
            throw InputError("Runs of QoI '" + qoi + "' must be a JSON object");

        auto& runs = dict.data[qoi];
        for (Value::ConstMemberIterator r = q->value.MemberBegin(); r != q->value.MemberEnd(); ++r) {
            const std::string label = r->name.GetString();
            runs[label] = readEvaluation(r->value, qoi + "/" + label);
        }
    }
    return dict;
}

bool allMembersAreObjects(const Value& obj) {
    for (Value::ConstMemberIterator it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        if (!it->value.IsObject())
            return false;
    }
    return true;
}

} // namespace

SampleTableSource SampleTableJsonReader::readString(const std::string& jsonContent) {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError()) {
        throw InputError("JSON parse error in sample table at offset "
                         + std::to_string(doc.GetErrorOffset()) + ": "
                         + GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw InputError("Sample table must be a JSON object");
    }

    if (doc.HasMember("format")) {
        if (!doc["format"].IsString())
            throw InputError("'format' must be a string");

        const std::string format = doc["format"].GetString();
        if (format == "table") {
            if (!doc.HasMember("rows"))
                throw InputError("Sample table of format 'table' has no 'rows'");
            return readRunTable(doc["rows"]);
        }
        if (format == "runs") {
            if (!doc.HasMember("data"))
                throw InputError("Sample table of format 'runs' has no 'data'");
            return readRunDictionary(doc["data"]);
        }
        throw InputError("Unknown sample table format '" + format + "'");
    }

    if (allMembersAreObjects(doc)) {
        return readRunDictionary(doc);
    }

    throw InputError("Sample table is neither a 'table' nor a 'runs' document");
}

SampleTableSource SampleTableJsonReader::readFile(const std::string& filePath) {
    if (!fs::exists(filePath)) {
        throw InputError("Sample table file not found: " + filePath);
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw InputError("Cannot open file: " + filePath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return readString(buffer.str());
}

} // namespace qmc_sensitivity
