#include "clump_match/core/events.hpp"
#include "clump_match/core/errors.hpp"
#include "clump_match/core/utils.hpp"

#include <utility>

namespace clump_match::core {

EventLog::EventLog(std::ostream* out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

void EventLog::write(const std::string& type, const json& payload) {
    if (!out_) return;

    json record = payload.is_object() ? payload : json{{"value", payload}};
    record["type"] = type;
    record["run_id"] = run_id_;
    record["seq"] = ++seq_;
    record["ts"] = utc_timestamp();

    *out_ << record.dump() << '\n';
    out_->flush();
}

void EventLog::phase_start(Phase phase) {
    write("phase_start", {{"phase", phase_to_int(phase)}, {"phase_name", phase_to_string(phase)}});
}

void EventLog::phase_end(Phase phase, const std::string& status, const json& payload) {
    json record = payload;
    record["phase"] = phase_to_int(phase);
    record["phase_name"] = phase_to_string(phase);
    record["status"] = status;
    write("phase_end", record);
}

void EventLog::warning(const std::string& message) {
    write("warning", {{"message", message}});
}

void EventLog::error(const std::exception& e) {
    write("error", {{"message", e.what()}, {"error_type", error_kind(e)}});
}

} // namespace clump_match::core
