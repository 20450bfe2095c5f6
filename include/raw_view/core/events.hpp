#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace raw_view::core {

using json = nlohmann::json;

/**
 * JSON-lines event log. One object per line, each with "type", "generation"
 * and an ISO-8601 "ts". Safe to call from loader threads.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, bool enabled = true);

    void load_start(uint64_t generation, const std::string& source);
    void load_end(uint64_t generation, bool success, const json& extra);
    void load_discarded(uint64_t generation, uint64_t current_generation);
    void reconstruct_progress(uint64_t generation, int rows_done, int rows_total);

    void warning(uint64_t generation, const std::string& message);
    void error(uint64_t generation, const std::string& message);

    bool enabled() const { return enabled_; }

private:
    void emit(const json& event);
    json base_event(const std::string& type, uint64_t generation);

    std::ostream& out_;
    bool enabled_;
    std::mutex mutex_;
};

} // namespace raw_view::core
