#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace sar_compose::core {

using json = nlohmann::json;

// One JSON object per line; consumed by log tooling and the run log file.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out)
        : run_id_(std::move(run_id)), out_(out) {}

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());

    void phase_start(Phase phase, const json& extra = json::object());
    void phase_progress(Phase phase, float progress, const std::string& message);
    void phase_end(Phase phase, const std::string& status, const json& extra = json::object());

    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message);

    // Phase started and not yet ended, if any.
    std::optional<Phase> open_phase() const { return open_phase_; }

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
    std::optional<Phase> open_phase_;
};

} // namespace sar_compose::core
