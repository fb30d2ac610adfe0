#include "config.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>

static double clampd(double v, double lo, double hi){ return std::max(lo, std::min(hi, v)); }

static AppConfig from_yaml(const YAML::Node& y){
  AppConfig cfg;

  if (auto d = y["declutter"]) {
    if (d["strategy"]) {
      std::string s = d["strategy"].as<std::string>(cfg.declutter.strategy);
      if (s == "greedy" || s == "kmeans") {
        cfg.declutter.strategy = s;
      } else {
        std::cerr << "[Config] unknown declutter.strategy '" << s << "', using " << cfg.declutter.strategy << std::endl;
      }
    }
    if (d["radius_scale"])  cfg.declutter.radius_scale  = std::max(0.01, d["radius_scale"].as<double>(cfg.declutter.radius_scale));
    if (d["carry_visible"]) cfg.declutter.carry_visible = d["carry_visible"].as<bool>(cfg.declutter.carry_visible);
  }

  if (auto k = y["kmeans"]) {
    if (k["max_iterations"]) cfg.kmeans.max_iterations = std::max(1, k["max_iterations"].as<int>(cfg.kmeans.max_iterations));
    if (k["workers"])        cfg.kmeans.workers        = std::clamp(k["workers"].as<int>(cfg.kmeans.workers), 1, 64);
    if (k["seed"])           cfg.kmeans.seed           = k["seed"].as<uint32_t>(cfg.kmeans.seed);
    if (k["verbose"])        cfg.kmeans.verbose        = k["verbose"].as<bool>(cfg.kmeans.verbose);
    if (k["default_clusters"]) cfg.kmeans.default_clusters = std::max(1, k["default_clusters"].as<int>(cfg.kmeans.default_clusters));

    if (auto cc = k["cluster_counts"]) {
      if (cc.IsMap()) {
        cfg.kmeans.cluster_counts.clear();
        for (const auto& kv : cc) {
          const int level = kv.first.as<int>();
          const int count = std::max(1, kv.second.as<int>(1));
          cfg.kmeans.cluster_counts[level] = count;
        }
      }
    }
  }

  if (auto z = y["zoom"]) {
    if (z["min_zoom"])   cfg.zoom.min_zoom   = z["min_zoom"].as<double>(cfg.zoom.min_zoom);
    if (z["max_zoom"])   cfg.zoom.max_zoom   = z["max_zoom"].as<double>(cfg.zoom.max_zoom);
    if (cfg.zoom.min_zoom > cfg.zoom.max_zoom)
      std::swap(cfg.zoom.min_zoom, cfg.zoom.max_zoom);
    if (z["num_levels"]) cfg.zoom.num_levels = std::max(1, z["num_levels"].as<int>(cfg.zoom.num_levels));
    if (z["reference_latitude"])
      cfg.zoom.reference_latitude = clampd(z["reference_latitude"].as<double>(cfg.zoom.reference_latitude), -85.0, 85.0);
    if (z["glyph_radius_px"]) cfg.zoom.glyph_radius_px = std::max(1.0, z["glyph_radius_px"].as<double>(cfg.zoom.glyph_radius_px));

    if (auto lz = z["level_zooms"]) {
      cfg.zoom.level_zooms.clear();
      if (lz.IsSequence()) {
        for (const auto& n : lz) {
          cfg.zoom.level_zooms.push_back(n.as<double>());
        }
      }
    }
  }
  // Per-level zooms must cover every level, otherwise fall back to even spacing
  if (!cfg.zoom.level_zooms.empty() &&
      static_cast<int>(cfg.zoom.level_zooms.size()) != cfg.zoom.num_levels) {
    std::cerr << "[Config] zoom.level_zooms has " << cfg.zoom.level_zooms.size()
              << " entries for " << cfg.zoom.num_levels << " levels, ignoring" << std::endl;
    cfg.zoom.level_zooms.clear();
  }

  if (auto c = y["cache"]) {
    if (c["enabled"])         cfg.cache.enabled         = c["enabled"].as<bool>(cfg.cache.enabled);
    if (c["static_dir"])      cfg.cache.static_dir      = c["static_dir"].as<std::string>(cfg.cache.static_dir);
    if (c["store_dir"])       cfg.cache.store_dir       = c["store_dir"].as<std::string>(cfg.cache.store_dir);
    if (c["static_writable"]) cfg.cache.static_writable = c["static_writable"].as<bool>(cfg.cache.static_writable);
  }

  if (y["datasets"] && y["datasets"].IsSequence()) {
    for (const auto& dn : y["datasets"]) {
      DatasetConfig ds;
      if (dn["period"]) ds.period = dn["period"].as<std::string>("");
      if (dn["path"])   ds.path   = dn["path"].as<std::string>("");
      if (ds.period.empty() || ds.path.empty()) {
        std::cerr << "[Config] dataset entry without period/path skipped" << std::endl;
        continue;
      }
      cfg.datasets.push_back(std::move(ds));
    }
  }

  if (auto u = y["ui"]) {
    if (u["listen"]) cfg.ui.listen = u["listen"].as<std::string>(cfg.ui.listen);
  }

  if (auto sec = y["security"]) {
    if (sec["api_token"]) {
      cfg.security.api_token = sec["api_token"].as<std::string>("");
    }
  }

  return cfg;
}

AppConfig load_app_config(const std::string& path){
  return from_yaml(YAML::LoadFile(path));
}

AppConfig parse_app_config(const std::string& yaml_text){
  return from_yaml(YAML::Load(yaml_text));
}

std::string dump_app_config(const AppConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "declutter" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "strategy" << YAML::Value << cfg.declutter.strategy;
  out << YAML::Key << "radius_scale" << YAML::Value << cfg.declutter.radius_scale;
  out << YAML::Key << "carry_visible" << YAML::Value << cfg.declutter.carry_visible;
  out << YAML::EndMap;

  out << YAML::Key << "kmeans" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "max_iterations" << YAML::Value << cfg.kmeans.max_iterations;
  out << YAML::Key << "workers" << YAML::Value << cfg.kmeans.workers;
  out << YAML::Key << "seed" << YAML::Value << cfg.kmeans.seed;
  out << YAML::Key << "verbose" << YAML::Value << cfg.kmeans.verbose;
  out << YAML::Key << "default_clusters" << YAML::Value << cfg.kmeans.default_clusters;
  out << YAML::Key << "cluster_counts" << YAML::Value << YAML::BeginMap;
  for (const auto& [level, count] : cfg.kmeans.cluster_counts) {
    out << YAML::Key << level << YAML::Value << count;
  }
  out << YAML::EndMap;
  out << YAML::EndMap;

  out << YAML::Key << "zoom" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "min_zoom" << YAML::Value << cfg.zoom.min_zoom;
  out << YAML::Key << "max_zoom" << YAML::Value << cfg.zoom.max_zoom;
  out << YAML::Key << "num_levels" << YAML::Value << cfg.zoom.num_levels;
  out << YAML::Key << "reference_latitude" << YAML::Value << cfg.zoom.reference_latitude;
  out << YAML::Key << "glyph_radius_px" << YAML::Value << cfg.zoom.glyph_radius_px;
  out << YAML::Key << "level_zooms" << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (double z : cfg.zoom.level_zooms) {
    out << z;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::Key << "cache" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enabled" << YAML::Value << cfg.cache.enabled;
  out << YAML::Key << "static_dir" << YAML::Value << cfg.cache.static_dir;
  out << YAML::Key << "store_dir" << YAML::Value << cfg.cache.store_dir;
  out << YAML::Key << "static_writable" << YAML::Value << cfg.cache.static_writable;
  out << YAML::EndMap;

  out << YAML::Key << "datasets" << YAML::Value << YAML::BeginSeq;
  for (const auto& ds : cfg.datasets) {
    out << YAML::BeginMap;
    out << YAML::Key << "period" << YAML::Value << ds.period;
    out << YAML::Key << "path" << YAML::Value << ds.path;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "ui" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "listen" << YAML::Value << cfg.ui.listen;
  out << YAML::EndMap;

  out << YAML::Key << "security" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "api_token" << YAML::Value << cfg.security.api_token;
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str());
}
