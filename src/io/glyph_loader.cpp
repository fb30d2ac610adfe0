#include "glyph_loader.h"
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

bool readCoordinate(const Json::Value& v, double& out) {
  if (!v.isNumeric()) return false;
  out = v.asDouble();
  return std::isfinite(out);
}

void pushGlyph(std::vector<core::Glyph>& out, const std::string& id, const Json::Value& lat, const Json::Value& lon) {
  double latitude = 0.0, longitude = 0.0;
  if (id.empty() || !readCoordinate(lat, latitude) || !readCoordinate(lon, longitude)) {
    std::cerr << "[GlyphLoader] skipping record '" << id << "': missing id or coordinates" << std::endl;
    return;
  }
  out.emplace_back(id, latitude, longitude);
}

std::string recordId(const Json::Value& rec) {
  if (rec.isMember("sensor") && rec["sensor"].isString()) return rec["sensor"].asString();
  if (rec.isMember("id") && rec["id"].isString()) return rec["id"].asString();
  return {};
}

} // namespace

std::vector<core::Glyph> parse_glyphs(const Json::Value& root) {
  std::vector<core::Glyph> glyphs;

  if (root.isArray()) {
    glyphs.reserve(root.size());
    for (const auto& rec : root) {
      if (!rec.isObject()) {
        std::cerr << "[GlyphLoader] skipping non-object record" << std::endl;
        continue;
      }
      pushGlyph(glyphs, recordId(rec), rec["latitude"], rec["longitude"]);
    }
  } else if (root.isObject()) {
    for (const auto& id : root.getMemberNames()) {
      const Json::Value& rec = root[id];
      const Json::Value& loc = rec.isObject() ? rec["location"] : Json::Value::nullSingleton();
      if (!loc.isArray() || loc.empty() || !loc[0].isObject()) {
        std::cerr << "[GlyphLoader] skipping record '" << id << "': no location" << std::endl;
        continue;
      }
      pushGlyph(glyphs, id, loc[0]["lat"], loc[0]["long"]);
    }
  } else {
    throw std::runtime_error("glyph data must be a JSON array or object");
  }

  return glyphs;
}

std::vector<core::Glyph> load_glyphs(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open glyph file " + path);
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs)) {
    throw std::runtime_error("invalid JSON in " + path + ": " + errs);
  }

  auto glyphs = parse_glyphs(root);
  std::cout << "[GlyphLoader] Loaded " << glyphs.size() << " glyphs from " << path << std::endl;
  return glyphs;
}
