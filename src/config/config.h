#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct DeclutterConfig {
  std::string strategy{"greedy"}; // "greedy" | "kmeans"
  double radius_scale{1.0};       // Scale applied to glyph radii in the overlap test
  bool carry_visible{true};       // Feed each level's visible set into the next (finer) level
};

struct KMeansConfig {
  int max_iterations{10000};
  int workers{2};                 // Assignment partitions per iteration
  uint32_t seed{0};               // 0 = seed from std::random_device
  bool verbose{false};

  // zoom level -> cluster count
  std::map<int, int> cluster_counts{{0, 1}, {1, 2}, {2, 9}, {3, 18}, {4, 24}};
  int default_clusters{8};
};

struct ZoomConfig {
  double min_zoom{12.0};
  double max_zoom{20.0};
  int num_levels{5};
  double reference_latitude{0.0};  // Latitude used for meters-per-pixel
  double glyph_radius_px{40.0};    // On-screen glyph radius

  // Map zoom each level is sized for; empty = evenly spaced between min/max
  std::vector<double> level_zooms{15.0, 15.0, 16.0, 17.0, 18.0};
};

struct CacheConfig {
  bool enabled{true};
  std::string static_dir{"./cache"};       // Tier 1: precomputed <key>_cache.json files
  std::string store_dir{"./cache_store"};  // Tier 2: persisted key-value entries
  bool static_writable{false};             // Allow invalidate() to delete tier-1 files
};

struct DatasetConfig {
  std::string period;  // Scenario/period key, e.g. "lockdown"
  std::string path;    // JSON glyph file
};

struct UiConfig {
  std::string listen{"0.0.0.0:8080"};
};

struct SecurityConfig {
  std::string api_token; // empty => auth disabled
};

struct AppConfig {
  DeclutterConfig declutter{};
  KMeansConfig kmeans{};
  ZoomConfig zoom{};
  CacheConfig cache{};
  std::vector<DatasetConfig> datasets;
  UiConfig ui{};
  SecurityConfig security{};
};

AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const std::string& yaml_text);
std::string dump_app_config(const AppConfig& cfg);
