// Computes every (period, zoom level) layer and writes <out>/<key>_cache.json,
// the files the server reads as its static cache tier.
#include <iostream>
#include <memory>
#include <string>
#include "config/config.h"
#include "cache/kv_store.h"
#include "cache/result_cache.h"
#include "core/layer_manager.h"
#include "io/glyph_loader.h"

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  std::string outDir = "";

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--out" && i+1<argc) outDir = argv[++i];
    else {
      std::cerr << "usage: " << argv[0] << " --config <yaml> --out <dir>" << std::endl;
      return 2;
    }
  }

  try {
    AppConfig appcfg = load_app_config(cfgPath);
    if (outDir.empty()) outDir = appcfg.cache.static_dir;
    appcfg.cache.enabled = true;

    // Fresh results only: no static tier, nothing persisted between runs
    auto cache = std::make_shared<ResultCache>("", std::make_unique<MemoryKeyValueStore>());
    LayerManager layers(appcfg, cache);

    for (const auto& ds : appcfg.datasets) {
      layers.setDataset(ds.period, load_glyphs(ds.path));
    }
    layers.initialize();

    size_t written = 0;
    for (const auto& period : layers.periods()) {
      for (int level = 0; level < layers.zoom().levelCount(); ++level) {
        cache->exportToFile(ResultCache::makeKey(period, level), outDir);
        ++written;
      }
    }
    std::cout << "[Precompute] Wrote " << written << " layers to " << outDir << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[Precompute] " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
