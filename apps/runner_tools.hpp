#pragma once

#include <string>
#include <vector>

int match_command(const std::string &config_path, const std::string &scene_id);

int lookup_command(const std::string &config_path, const std::string &name);

int clip_command(const std::string &input, const std::string &output,
                 const std::vector<double> &bbox, int threads);

int verify_command(const std::string &a, const std::string &b);

int composite_command(const std::string &vv, const std::string &vh,
                      const std::string &output, const std::string &input_scale,
                      const std::string &preview);
