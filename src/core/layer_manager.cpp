#include "layer_manager.h"
#include "core/errors.h"
#include "declutter/greedy_selector.h"
#include "declutter/kmeans_selector.h"
#include <chrono>
#include <iostream>

LayerManager::LayerManager(const AppConfig& config, std::shared_ptr<ResultCache> cache)
    : config_(config), zoom_(config.zoom), cache_(config.cache.enabled ? std::move(cache) : nullptr) {}

void LayerManager::setDataset(const std::string& period, std::vector<core::Glyph> glyphs) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[LayerManager] Dataset '" << period << "': " << glyphs.size() << " glyphs" << std::endl;
    datasets_[period] = std::move(glyphs);
    // Results of the previous dataset are no longer valid
    for (auto it = layers_.begin(); it != layers_.end();) {
        if (it->first.rfind(period + "_", 0) == 0) it = layers_.erase(it);
        else ++it;
    }
}

bool LayerManager::hasPeriod(const std::string& period) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return datasets_.count(period) > 0;
}

std::vector<std::string> LayerManager::periods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(datasets_.size());
    for (const auto& [period, glyphs] : datasets_) out.push_back(period);
    return out;
}

size_t LayerManager::glyphCount(const std::string& period) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = datasets_.find(period);
    return it == datasets_.end() ? 0 : it->second.size();
}

void LayerManager::checkLayer(const std::string& period, int level) const {
    if (level < 0 || level >= zoom_.levelCount()) {
        throw core::InvalidInputError("zoom level " + std::to_string(level) + " out of range [0, " +
                                      std::to_string(zoom_.levelCount() - 1) + "]");
    }
    if (!hasPeriod(period)) {
        throw core::InvalidInputError("unknown period '" + period + "'");
    }
}

std::vector<core::Glyph> LayerManager::glyphsFor(const std::string& period) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = datasets_.find(period);
    if (it == datasets_.end()) {
        throw core::InvalidInputError("unknown period '" + period + "'");
    }
    return it->second;
}

SelectionResult LayerManager::computeLayer(const std::string& period, int level,
                                           const std::vector<std::string>& already_visible) const {
    const std::vector<core::Glyph> glyphs = glyphsFor(period);
    auto start = std::chrono::steady_clock::now();

    SelectionResult result;
    if (config_.declutter.strategy == "kmeans") {
        KMeansSelector selector(config_.kmeans);
        result = selector.selectForLevel(glyphs, level);
        const auto& run = selector.getLastRun();
        if (!run.converged && !glyphs.empty()) {
            std::cerr << "[LayerManager] k-means for " << period << "/" << level
                      << " stopped after " << run.iterations << " iterations without converging" << std::endl;
        }
    } else {
        GreedySelector selector(config_.declutter.radius_scale);
        result = selector.select(glyphs, zoom_.radiusForLevel(level), already_visible);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cout << "[LayerManager] " << period << "/" << level << " (" << config_.declutter.strategy
              << "): " << result.visible.size() << " visible, " << result.hidden.size()
              << " hidden in " << elapsed << " ms" << std::endl;
    return result;
}

SelectionResult LayerManager::getLayer(const std::string& period, int level) {
    checkLayer(period, level);

    std::vector<std::string> already_visible;
    if (config_.declutter.carry_visible && level > 0 && config_.declutter.strategy != "kmeans") {
        already_visible = getLayer(period, level - 1).visible;
    }

    const std::string key = ResultCache::makeKey(period, level);
    if (cache_) {
        return cache_->getOrCompute(key, [&]() { return computeLayer(period, level, already_visible); });
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = layers_.find(key);
        if (it != layers_.end()) return it->second;
    }
    SelectionResult result = computeLayer(period, level, already_visible);
    std::lock_guard<std::mutex> lock(mutex_);
    layers_[key] = result;
    return result;
}

void LayerManager::initialize() {
    const auto keys = periods();
    std::cout << "[LayerManager] Building " << zoom_.levelCount() << " levels for "
              << keys.size() << " periods" << std::endl;

    for (int level = 0; level < zoom_.levelCount(); ++level) {
        for (const auto& period : keys) {
            getLayer(period, level);
        }
    }
}

void LayerManager::invalidate(const std::string& period, int level) {
    checkLayer(period, level);
    const std::string key = ResultCache::makeKey(period, level);
    if (cache_) {
        cache_->invalidate(key);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    layers_.erase(key);
    std::cout << "[LayerManager] Layer " << key << " invalidated" << std::endl;
}

std::string LayerManager::exportLayer(const std::string& period, int level) const {
    checkLayer(period, level);
    const std::string key = ResultCache::makeKey(period, level);
    if (!cache_) {
        throw core::NoCachedDataError(key);
    }
    return cache_->exportEntry(key);
}

void LayerManager::rebuild() {
    for (const auto& period : periods()) {
        for (int level = 0; level < zoom_.levelCount(); ++level) {
            invalidate(period, level);
        }
    }
    initialize();
}

Json::Value LayerManager::listAsJson() const {
    Json::Value root;
    root["strategy"] = config_.declutter.strategy;
    root["cache_enabled"] = cacheEnabled();

    Json::Value levels(Json::arrayValue);
    for (int level = 0; level < zoom_.levelCount(); ++level) {
        Json::Value l;
        l["level"] = level;
        l["zoom"] = zoom_.zoomForLevel(level);
        l["radius_m"] = zoom_.radiusForLevel(level);
        l["clusters"] = core::clusterCountForLevel(config_.kmeans, level);
        levels.append(l);
    }
    root["levels"] = levels;

    Json::Value periods_json(Json::arrayValue);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [period, glyphs] : datasets_) {
        Json::Value p;
        p["period"] = period;
        p["glyphs"] = static_cast<Json::UInt64>(glyphs.size());
        periods_json.append(p);
    }
    root["periods"] = periods_json;
    return root;
}
