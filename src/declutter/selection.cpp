#include "selection.h"
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {
    std::vector<std::string> readIdList(const Json::Value& json, const char* member) {
        const Json::Value& arr = json[member];
        if (!arr.isArray()) {
            throw std::runtime_error(std::string("selection: '") + member + "' must be an array");
        }
        std::vector<std::string> out;
        out.reserve(arr.size());
        for (const auto& v : arr) {
            if (!v.isString()) {
                throw std::runtime_error(std::string("selection: '") + member + "' must contain strings");
            }
            out.push_back(v.asString());
        }
        return out;
    }
}

Json::Value selectionToJson(const SelectionResult& r) {
    Json::Value json(Json::objectValue);

    json["filteredInSensors"] = Json::Value(Json::arrayValue);
    for (const auto& id : r.visible) json["filteredInSensors"].append(id);

    json["filteredOutSensors"] = Json::Value(Json::arrayValue);
    for (const auto& id : r.hidden) json["filteredOutSensors"].append(id);

    json["hiddenCountsMap"] = Json::Value(Json::objectValue);
    for (const auto& [id, count] : r.hidden_count_by_visible) {
        json["hiddenCountsMap"][id] = count;
    }
    return json;
}

SelectionResult selectionFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::runtime_error("selection: expected a JSON object");
    }

    SelectionResult r;
    r.visible = readIdList(json, "filteredInSensors");
    r.hidden = readIdList(json, "filteredOutSensors");

    const Json::Value& counts = json["hiddenCountsMap"];
    if (!counts.isNull()) {
        if (!counts.isObject()) {
            throw std::runtime_error("selection: 'hiddenCountsMap' must be an object");
        }
        for (const auto& id : counts.getMemberNames()) {
            if (!counts[id].isInt()) {
                throw std::runtime_error("selection: hidden count for '" + id + "' is not an integer");
            }
            r.hidden_count_by_visible[id] = counts[id].asInt();
        }
    }
    return r;
}

std::string serializeSelection(const SelectionResult& r) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, selectionToJson(r));
}

SelectionResult parseSelection(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value json;
    std::string errs;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &json, &errs)) {
        throw std::runtime_error("selection: invalid JSON: " + errs);
    }
    return selectionFromJson(json);
}
