#pragma once

#include "sar_compose/config/configuration.hpp"
#include "sar_compose/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <streambuf>
#include <string>

namespace sar_compose::runner {

// Reads the YAML from `config_path`, or from stdin when `from_stdin` is set or
// the path is "-". Throws ConfigError / ValidationError.
config::Config load_config(const std::string &config_path, bool from_stdin);

nlohmann::json grid_to_json(const RasterGrid &grid);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace sar_compose::runner
