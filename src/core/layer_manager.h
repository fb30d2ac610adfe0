#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <json/json.h>
#include "cache/result_cache.h"
#include "config/config.h"
#include "core/geometry.h"
#include "core/zoom.h"
#include "declutter/selection.h"

// Owns the glyph datasets and produces one decluttered layer per
// (period, zoom level). Levels are built coarse to fine; with
// declutter.carry_visible the visible set of level L-1 is handed to the
// greedy selector of level L so glyphs shown when zoomed out stay shown.
class LayerManager {
public:
    LayerManager(const AppConfig& config, std::shared_ptr<ResultCache> cache);

    void setDataset(const std::string& period, std::vector<core::Glyph> glyphs);
    bool hasPeriod(const std::string& period) const;
    std::vector<std::string> periods() const;
    size_t glyphCount(const std::string& period) const;

    // Builds every layer, zoom levels outer, periods inner.
    void initialize();

    // Cached or freshly computed layer. Throws core::InvalidInputError for
    // an unknown period or a level out of range.
    SelectionResult getLayer(const std::string& period, int level);

    void invalidate(const std::string& period, int level);

    // Persisted entry for the layer; throws core::NoCachedDataError
    std::string exportLayer(const std::string& period, int level) const;

    // Drops every layer and builds them again
    void rebuild();

    Json::Value listAsJson() const;

    const core::ZoomModel& zoom() const { return zoom_; }
    const AppConfig& config() const { return config_; }
    bool cacheEnabled() const { return cache_ != nullptr; }

private:
    void checkLayer(const std::string& period, int level) const;
    std::vector<core::Glyph> glyphsFor(const std::string& period) const;
    SelectionResult computeLayer(const std::string& period, int level,
                                 const std::vector<std::string>& already_visible) const;

    AppConfig config_;
    core::ZoomModel zoom_;
    std::shared_ptr<ResultCache> cache_;  // null when cache.enabled is false

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<core::Glyph>> datasets_;
    std::map<std::string, SelectionResult> layers_;  // used without a cache
};
