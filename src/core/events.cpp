#include "raw_view/core/events.hpp"
#include "raw_view/core/utils.hpp"

namespace raw_view::core {

EventEmitter::EventEmitter(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

json EventEmitter::base_event(const std::string& type, uint64_t generation) {
    return {
        {"type", type},
        {"generation", generation},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!enabled_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // Camera strings and paths are not guaranteed to be UTF-8.
    out_ << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
}

void EventEmitter::load_start(uint64_t generation, const std::string& source) {
    json event = base_event("load_start", generation);
    event["source"] = source;
    emit(event);
}

void EventEmitter::load_end(uint64_t generation, bool success, const json& extra) {
    json event = base_event("load_end", generation);
    event["success"] = success;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::load_discarded(uint64_t generation, uint64_t current_generation) {
    json event = base_event("load_discarded", generation);
    event["current_generation"] = current_generation;
    emit(event);
}

void EventEmitter::reconstruct_progress(uint64_t generation, int rows_done, int rows_total) {
    json event = base_event("reconstruct_progress", generation);
    event["current"] = rows_done;
    event["total"] = rows_total;
    event["progress"] = rows_total > 0
                            ? static_cast<float>(rows_done) / static_cast<float>(rows_total)
                            : 1.0f;
    emit(event);
}

void EventEmitter::warning(uint64_t generation, const std::string& message) {
    json event = base_event("warning", generation);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(uint64_t generation, const std::string& message) {
    json event = base_event("error", generation);
    event["message"] = message;
    emit(event);
}

} // namespace raw_view::core
