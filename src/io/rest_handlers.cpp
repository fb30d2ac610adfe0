#include "rest_handlers.h"
#include "core/errors.h"
#include <json/json.h>
#include <iostream>

namespace {

crow::response jsonResponse(int code, const Json::Value& body) {
  crow::response resp(code, body.toStyledString());
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response errorResponse(int code, const std::string& error, const std::string& message) {
  Json::Value body;
  body["error"] = error;
  body["message"] = message;
  return jsonResponse(code, body);
}

} // namespace

void RestApi::registerRoutes(crow::SimpleApp& app) {
  // Layers endpoints
  CROW_ROUTE(app, "/api/v1/layers").methods("GET"_method)([this]() {
    return getLayers();
  });

  CROW_ROUTE(app, "/api/v1/layers/<string>/<int>").methods("GET"_method)([this](const std::string& period, int level) {
    return getLayer(period, level);
  });

  CROW_ROUTE(app, "/api/v1/layers/rebuild").methods("POST"_method)([this](const crow::request& req) {
    if (!authorize(req)) {
      return sendUnauthorized();
    }
    return postRebuild();
  });

  // Zoom endpoint
  CROW_ROUTE(app, "/api/v1/zoom/<double>").methods("GET"_method)([this](double zoom) {
    return getZoom(zoom);
  });

  // Cache endpoints
  CROW_ROUTE(app, "/api/v1/cache/<string>/<int>").methods("DELETE"_method)([this](const crow::request& req, const std::string& period, int level) {
    if (!authorize(req)) {
      return sendUnauthorized();
    }
    return deleteCache(period, level);
  });

  CROW_ROUTE(app, "/api/v1/cache/<string>/<int>/export").methods("GET"_method)([this](const std::string& period, int level) {
    return getCacheExport(period, level);
  });

  // Config endpoint
  CROW_ROUTE(app, "/api/v1/config").methods("GET"_method)([this]() {
    return getConfig();
  });
}

bool RestApi::authorize(const crow::request& req) const {
  if (token_.empty()) return true; // Auth disabled if no token

  auto auth_it = req.headers.find("Authorization");
  if (auth_it == req.headers.end()) return false;

  const std::string auth = auth_it->second;
  const std::string bearer_prefix = "Bearer ";
  if (auth.size() <= bearer_prefix.size() ||
      auth.substr(0, bearer_prefix.size()) != bearer_prefix) {
    return false;
  }

  return auth.substr(bearer_prefix.size()) == token_;
}

crow::response RestApi::sendUnauthorized() const {
  Json::Value error;
  error["error"] = "unauthorized";
  error["message"] = "Invalid or missing authorization token";

  crow::response resp(401, error.toStyledString());
  resp.add_header("Content-Type", "application/json");
  resp.add_header("WWW-Authenticate", "Bearer realm=\"api\", error=\"invalid_token\"");
  return resp;
}

crow::response RestApi::getLayers() {
  try {
    return jsonResponse(200, layers_.listAsJson());
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::getLayer(const std::string& period, int level) {
  try {
    SelectionResult layer = layers_.getLayer(period, level);
    Json::Value body = selectionToJson(layer);
    body["period"] = period;
    body["level"] = level;
    return jsonResponse(200, body);
  } catch (const core::InvalidInputError& e) {
    return errorResponse(404, "not_found", e.what());
  } catch (const core::WorkerFailureError& e) {
    std::cerr << "[RestApi] Layer " << period << "/" << level << " failed: " << e.what() << std::endl;
    return errorResponse(500, "worker_failure", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[RestApi] Layer " << period << "/" << level << " failed: " << e.what() << std::endl;
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::postRebuild() {
  try {
    layers_.rebuild();
    Json::Value result;
    result["ok"] = true;
    result["layers"] = layers_.listAsJson();
    return jsonResponse(200, result);
  } catch (const std::exception& e) {
    std::cerr << "[RestApi] Rebuild failed: " << e.what() << std::endl;
    return errorResponse(500, "rebuild_failed", e.what());
  }
}

crow::response RestApi::getZoom(double zoom) {
  const auto& model = layers_.zoom();
  const int level = model.levelForZoom(zoom);

  Json::Value result;
  result["zoom"] = zoom;
  result["level"] = level;
  result["radius_m"] = model.radiusForLevel(level);
  result["clusters"] = core::clusterCountForLevel(config_.kmeans, level);
  return jsonResponse(200, result);
}

crow::response RestApi::deleteCache(const std::string& period, int level) {
  try {
    layers_.invalidate(period, level);
    Json::Value result;
    result["ok"] = true;
    result["key"] = ResultCache::makeKey(period, level);
    return jsonResponse(200, result);
  } catch (const core::InvalidInputError& e) {
    return errorResponse(404, "not_found", e.what());
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::getCacheExport(const std::string& period, int level) {
  try {
    std::string blob = layers_.exportLayer(period, level);
    const std::string key = ResultCache::makeKey(period, level);

    crow::response resp(200, blob);
    resp.add_header("Content-Type", "application/json");
    resp.add_header("Content-Disposition", "attachment; filename=\"" + key + "_cache.json\"");
    return resp;
  } catch (const core::NoCachedDataError& e) {
    return errorResponse(404, "no_cached_data", e.what());
  } catch (const core::InvalidInputError& e) {
    return errorResponse(404, "not_found", e.what());
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::getConfig() {
  try {
    crow::response resp(200, dump_app_config(config_));
    resp.add_header("Content-Type", "application/x-yaml");
    return resp;
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}
