#include "runner_shared.hpp"

#include "sar_compose/core/errors.hpp"

#include <iostream>
#include <sstream>

namespace sar_compose::runner {

namespace fs = std::filesystem;

config::Config load_config(const std::string &config_path, bool from_stdin) {
  config::Config cfg;
  if (from_stdin || config_path == "-") {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    const std::string cfg_text = ss.str();
    if (cfg_text.empty()) {
      throw ConfigError("--stdin provided but no config YAML received");
    }
    YAML::Node node;
    try {
      node = YAML::Load(cfg_text);
    } catch (const YAML::Exception &e) {
      throw ConfigError(std::string("Cannot parse stdin: ") + e.what());
    }
    cfg = config::Config::from_yaml(node);
  } else {
    cfg = config::Config::load(config_path);
  }
  cfg.validate();
  return cfg;
}

nlohmann::json grid_to_json(const RasterGrid &grid) {
  nlohmann::json j = {{"width", grid.width}, {"height", grid.height}};
  if (grid.transform) {
    j["transform"] = *grid.transform;
  } else {
    j["transform"] = nullptr;
  }
  j["has_crs"] = !grid.crs_wkt.empty();
  return j;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace sar_compose::runner
