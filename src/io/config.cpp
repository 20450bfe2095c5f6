#include "raw_view/config/configuration.hpp"
#include "raw_view/core/errors.hpp"
#include "raw_view/core/utils.hpp"

#include <cmath>
#include <fstream>

namespace raw_view::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["demosaic"]) {
            auto d = node["demosaic"];
            if (d["parallel_workers"]) cfg.demosaic.parallel_workers = d["parallel_workers"].as<int>();
        }

        if (node["view"]) {
            auto v = node["view"];
            if (v["zoom_sensitivity"]) cfg.view.zoom_sensitivity = v["zoom_sensitivity"].as<float>();
            if (v["zoom_min"]) cfg.view.zoom_min = v["zoom_min"].as<float>();
        }

        if (node["navigation"]) {
            auto n = node["navigation"];
            if (n["extensions"] && n["extensions"].IsSequence()) {
                cfg.navigation.extensions.clear();
                for (const auto& it : n["extensions"]) {
                    std::string ext = core::to_lower(it.as<std::string>());
                    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
                    cfg.navigation.extensions.push_back(ext);
                }
            }
        }

        if (node["events"]) {
            auto e = node["events"];
            if (e["enabled"]) cfg.events.enabled = e["enabled"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["demosaic"]["parallel_workers"] = demosaic.parallel_workers;

    node["view"]["zoom_sensitivity"] = view.zoom_sensitivity;
    node["view"]["zoom_min"] = view.zoom_min;

    for (const auto& ext : navigation.extensions) {
        node["navigation"]["extensions"].push_back(ext);
    }

    node["events"]["enabled"] = events.enabled;

    return node;
}

void Config::validate() const {
    if (demosaic.parallel_workers < 1) {
        throw ValidationError("demosaic.parallel_workers must be >= 1");
    }

    if (!std::isfinite(view.zoom_sensitivity) || view.zoom_sensitivity <= 0.0f) {
        throw ValidationError("view.zoom_sensitivity must be > 0");
    }
    if (!std::isfinite(view.zoom_min) || view.zoom_min <= 0.0f) {
        throw ValidationError("view.zoom_min must be > 0");
    }
    if (view.zoom_min > 1.0f) {
        throw ValidationError("view.zoom_min must be <= 1 so the fitted view is reachable");
    }

    if (navigation.extensions.empty()) {
        throw ValidationError("navigation.extensions must not be empty");
    }
    for (const auto& ext : navigation.extensions) {
        if (ext.empty()) {
            throw ValidationError("navigation.extensions must not contain empty entries");
        }
    }
}

} // namespace raw_view::config
