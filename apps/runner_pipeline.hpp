#pragma once

#include <string>

int run_pipeline_command(const std::string &config_path,
                         const std::string &runs_dir,
                         bool dry_run,
                         bool config_from_stdin);
