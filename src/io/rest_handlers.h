#pragma once
#include <crow.h>
#include "core/layer_manager.h"
#include "config/config.h"
#include <string>

class RestApi {
   LayerManager& layers_;
   const AppConfig& config_;
   std::string token_;

  public:
    RestApi(LayerManager& l, const AppConfig& cfg)
     : layers_(l), config_(cfg), token_(cfg.security.api_token) {}

    // Register all routes with the Crow app
    void registerRoutes(crow::SimpleApp& app);

private:
  bool authorize(const crow::request& req) const;
  crow::response sendUnauthorized() const;

  // Layers
  crow::response getLayers();
  crow::response getLayer(const std::string& period, int level);
  crow::response postRebuild();

  // Zoom
  crow::response getZoom(double zoom);

  // Cache
  crow::response deleteCache(const std::string& period, int level);
  crow::response getCacheExport(const std::string& period, int level);

  // Configs
  crow::response getConfig();
};
