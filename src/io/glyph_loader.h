#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "core/geometry.h"

// Reads glyph records from a JSON file.
//
// Accepted layouts:
//   [ {"sensor": "id", "latitude": 52.1, "longitude": 4.3, ...}, ... ]   ("id" also accepted)
//   { "id": { "location": [ {"lat": 52.1, "long": 4.3} ] }, ... }
//
// Records without an id or finite coordinates are skipped with a warning.
// Throws std::runtime_error when the file cannot be read or parsed.
std::vector<core::Glyph> load_glyphs(const std::string& path);
std::vector<core::Glyph> parse_glyphs(const Json::Value& root);
