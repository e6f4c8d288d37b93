#include "ResultsSerializer.h"

#include <fstream>
#include <iostream>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "QMCAnalysis.h"

using namespace rapidjson;

namespace qmc_sensitivity {
namespace analysis {

namespace {

using JsonAllocator = Document::AllocatorType;

Value serializeValues(const std::vector<double>& values, JsonAllocator& allocator) {
    if (values.size() == 1) {
        return Value(values.front());
    }

    Value array(kArrayType);
    array.Reserve(static_cast<SizeType>(values.size()), allocator);
    for (double v : values) {
        array.PushBack(v, allocator);
    }
    return array;
}

Value serializeMoments(const StatisticalMoments& moments, JsonAllocator& allocator) {
    Value obj(kObjectType);
    obj.AddMember("mean", serializeValues(moments.mean, allocator), allocator);
    obj.AddMember("var", serializeValues(moments.var, allocator), allocator);
    obj.AddMember("std", serializeValues(moments.stddev, allocator), allocator);
    return obj;
}

Value serializeInterval(const ConfidenceInterval& ci, JsonAllocator& allocator) {
    Value obj(kObjectType);
    obj.AddMember("low", serializeValues(ci.low, allocator), allocator);
    obj.AddMember("high", serializeValues(ci.high, allocator), allocator);
    return obj;
}

Value key(const std::string& name, JsonAllocator& allocator) {
    return Value(name.c_str(), static_cast<SizeType>(name.size()), allocator);
}

template <class PerParameterMap, class Serialize>
Value serializeNested(const std::map<std::string, PerParameterMap>& byQoi,
                      const AnalysisResults& results,
                      Serialize serialize,
                      JsonAllocator& allocator) {
    Value out(kObjectType);
    for (const auto& qoi : results.qoiColumns()) {
        auto q = byQoi.find(qoi);
        if (q == byQoi.end())
            continue;

        Value perParam(kObjectType);
        for (const auto& param : results.parameterNames()) {
            auto p = q->second.find(param);
            if (p != q->second.end())
                perParam.AddMember(key(param, allocator), serialize(p->second, allocator), allocator);
        }
        out.AddMember(key(qoi, allocator), perParam, allocator);
    }
    return out;
}

Document buildDocument(const AnalysisResults& results) {
    Document doc;
    doc.SetObject();
    JsonAllocator& allocator = doc.GetAllocator();

    doc.AddMember("element", key(QMCAnalysis::elementName(), allocator), allocator);
    doc.AddMember("version", key(QMCAnalysis::elementVersion(), allocator), allocator);

    Value moments(kObjectType);
    for (const auto& qoi : results.qoiColumns()) {
        auto it = results.statisticalMoments().find(qoi);
        if (it != results.statisticalMoments().end())
            moments.AddMember(key(qoi, allocator), serializeMoments(it->second, allocator), allocator);
    }
    doc.AddMember("statistical_moments", moments, allocator);

    auto values = [](const std::vector<double>& v, JsonAllocator& a) { return serializeValues(v, a); };
    auto intervals = [](const ConfidenceInterval& ci, JsonAllocator& a) { return serializeInterval(ci, a); };

    doc.AddMember("sobols_first", serializeNested(results.sobolsFirst(), results, values, allocator), allocator);
    doc.AddMember("sobols_total", serializeNested(results.sobolsTotal(), results, values, allocator), allocator);
    doc.AddMember("conf_sobols_first", serializeNested(results.confSobolsFirst(), results, intervals, allocator), allocator);
    doc.AddMember("conf_sobols_total", serializeNested(results.confSobolsTotal(), results, intervals, allocator), allocator);

    return doc;
}

} // namespace

std::string ResultsSerializer::toJson(const AnalysisResults& results, bool pretty) {
    Document doc = buildDocument(results);

    StringBuffer buffer;
    if (pretty) {
        PrettyWriter<StringBuffer, UTF8<>, UTF8<>, CrtAllocator, kWriteNanAndInfFlag> writer(buffer);
        doc.Accept(writer);
    } else {
        Writer<StringBuffer, UTF8<>, UTF8<>, CrtAllocator, kWriteNanAndInfFlag> writer(buffer);
        doc.Accept(writer);
    }

    return buffer.GetString();
}

bool ResultsSerializer::saveToFile(const AnalysisResults& results, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "Could not open file for writing: " << filePath << std::endl;
        return false;
    }

    file << toJson(results);
    return static_cast<bool>(file);
}

} // namespace analysis
} // namespace qmc_sensitivity
