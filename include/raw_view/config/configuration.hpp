#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace raw_view::config {

namespace fs = std::filesystem;

struct DemosaicConfig {
  int parallel_workers = 4;
};

struct ViewConfig {
  float zoom_sensitivity = 0.1f;
  float zoom_min = 0.01f;
};

struct NavigationConfig {
  std::vector<std::string> extensions{"jpg", "jpeg", "png", "nef",
                                      "cr2", "dng", "arw"};
};

struct EventsConfig {
  bool enabled = true;
};

struct Config {
  DemosaicConfig demosaic;
  ViewConfig view;
  NavigationConfig navigation;
  EventsConfig events;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace raw_view::config
