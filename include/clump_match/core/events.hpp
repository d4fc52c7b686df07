#pragma once

#include "types.hpp"
#include <exception>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace clump_match::core {

using json = nlohmann::json;

// Run log written as JSON lines. Every record carries type, run_id, a
// per-log sequence number and a UTC timestamp; the payload keys are merged
// in beside them. A log without a stream drops every record.
class EventLog {
public:
    explicit EventLog(std::ostream* out = nullptr, std::string run_id = "");

    void attach(std::ostream* out) { out_ = out; }
    bool enabled() const { return out_ != nullptr; }
    const std::string& run_id() const { return run_id_; }

    void write(const std::string& type, const json& payload = json::object());

    void phase_start(Phase phase);
    void phase_end(Phase phase, const std::string& status, const json& payload = json::object());

    void warning(const std::string& message);
    void error(const std::exception& e);

private:
    std::ostream* out_;
    std::string run_id_;
    long seq_ = 0;
};

} // namespace clump_match::core
