#include <crow.h>
#include <iostream>
#include <memory>
#include "config/config.h"
#include "cache/kv_store.h"
#include "cache/result_cache.h"
#include "core/layer_manager.h"
#include "io/glyph_loader.h"
#include "io/rest_handlers.h"

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  std::string httpListen = "";

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--listen" && i+1<argc) httpListen = argv[++i];
  }

  AppConfig appcfg;
  try {
    appcfg = load_app_config(cfgPath);
  } catch (const std::exception& e) {
    std::cerr << "[App] Failed to load config " << cfgPath << ": " << e.what() << std::endl;
    return 1;
  }

  auto cache = std::make_shared<ResultCache>(
      appcfg.cache.static_dir,
      std::make_unique<FileKeyValueStore>(appcfg.cache.store_dir),
      appcfg.cache.static_writable);
  LayerManager layers(appcfg, cache);

  for (const auto& ds : appcfg.datasets) {
    try {
      layers.setDataset(ds.period, load_glyphs(ds.path));
    } catch (const std::exception& e) {
      std::cerr << "[App] Skipping dataset '" << ds.period << "': " << e.what() << std::endl;
    }
  }

  // Build every layer up front so requests are served from the cache
  try {
    layers.initialize();
  } catch (const std::exception& e) {
    std::cerr << "[App] Layer initialization failed: " << e.what() << std::endl;
    return 1;
  }

  // Initialize CrowCpp application
  crow::SimpleApp app;

  auto rest = std::make_shared<RestApi>(layers, appcfg);
  rest->registerRoutes(app);

  // Configure HTTP listen address and port
  std::string host = "0.0.0.0";
  uint16_t port = 8080;

  auto parseListenAddress = [&](const std::string& url) {
    auto pos = url.find(":");
    if (pos != std::string::npos) {
      host = url.substr(0, pos);
      port = static_cast<uint16_t>(std::stoi(url.substr(pos + 1)));
    }
  };

  try {
    if (!httpListen.empty()) {
      parseListenAddress(httpListen);
    }
    else if (!appcfg.ui.listen.empty()) {
      parseListenAddress(appcfg.ui.listen);
    }
  } catch (const std::exception& e) {
    std::cerr << "[App] Invalid listen address: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[App] Starting HTTP server on host:" << host << " port:" << port << std::endl;

  app.bindaddr(host).port(port).multithreaded();
  app.run();
  return 0;
}
