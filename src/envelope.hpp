// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <functional>
#include <string>

#include "result.hpp"
#include "types.hpp"

namespace hostscope {

/**
 * Uniform wrapper around one snapshot.
 *
 * Exactly one of `data_json` (Success) or `error_*` (Failure) is meaningful.
 * `data_json` always holds a serialized JSON object.
 */
struct Envelope {
    std::string timestamp;
    SnapshotStatus status = SnapshotStatus::Success;
    TaskType task_type = TaskType::State;
    std::string subtype;
    std::string data_json;
    ErrorCode error_code = ErrorCode::ExecutionFailure;
    std::string error_message;

    [[nodiscard]] bool ok() const { return status == SnapshotStatus::Success; }
};

const char* task_type_name(TaskType type);
const char* status_name(SnapshotStatus status);

Envelope make_success(const std::string& subtype, std::string data_json);
Envelope make_failure(const std::string& subtype, ErrorCode code, const std::string& message);
Envelope make_failure(const std::string& subtype, const Error& error);

std::string to_json(const Envelope& envelope);

// Run a snapshot body, converting any escaping exception into an
// ExecutionFailure envelope for `subtype`.
Envelope guarded_snapshot(const std::string& subtype, const std::function<Envelope()>& body);

} // namespace hostscope
