#pragma once

#include <map>
#include <string>
#include <vector>
#include <json/json.h>

// Outcome of one declutter run for one (period, zoom level).
struct SelectionResult {
    std::vector<std::string> visible;   // input order
    std::vector<std::string> hidden;    // input order
    std::map<std::string, int> hidden_count_by_visible;

    bool empty() const { return visible.empty() && hidden.empty(); }
    size_t size() const { return visible.size() + hidden.size(); }

    bool operator==(const SelectionResult& o) const {
        return visible == o.visible && hidden == o.hidden &&
               hidden_count_by_visible == o.hidden_count_by_visible;
    }
    bool operator!=(const SelectionResult& o) const { return !(*this == o); }
};

// Wire format: {"filteredInSensors": [...], "filteredOutSensors": [...], "hiddenCountsMap": {...}}
Json::Value selectionToJson(const SelectionResult& r);

// Throws std::runtime_error when a required member is missing or mistyped.
SelectionResult selectionFromJson(const Json::Value& json);

std::string serializeSelection(const SelectionResult& r);
SelectionResult parseSelection(const std::string& text);
