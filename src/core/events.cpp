#include "sar_compose/core/events.hpp"
#include "sar_compose/core/utils.hpp"

namespace sar_compose::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

} // namespace

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::phase_start(Phase phase, const json& extra) {
    json event = base_event("phase_start");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    merge_into(event, extra);
    emit(event);
    open_phase_ = phase;
}

void EventEmitter::phase_progress(Phase phase, float progress, const std::string& message) {
    json event = base_event("phase_progress");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["progress"] = progress;
    event["substep"] = message;
    emit(event);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    merge_into(event, extra);
    emit(event);
    if (open_phase_ == phase) open_phase_.reset();
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json event = base_event("warning");
    event["message"] = message;
    merge_into(event, extra);
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace sar_compose::core
