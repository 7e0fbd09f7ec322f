// cppcheck-suppress-file missingIncludeSystem
#include "envelope.hpp"

#include <exception>
#include <new>
#include <sstream>
#include <utility>

#include "logging.hpp"
#include "utils.hpp"

namespace hostscope {

const char* task_type_name(TaskType type)
{
    switch (type) {
        case TaskType::State:
            return "STATE";
        case TaskType::Event:
            return "EVENT";
        case TaskType::Interrupt:
            return "INTERRUPT";
    }
    return "STATE";
}

const char* status_name(SnapshotStatus status)
{
    return status == SnapshotStatus::Success ? "SUCCESS" : "FAILURE";
}

Envelope make_success(const std::string& subtype, std::string data_json)
{
    Envelope env;
    env.timestamp = iso_utc_timestamp();
    env.status = SnapshotStatus::Success;
    env.subtype = subtype;
    env.data_json = data_json.empty() ? "{}" : std::move(data_json);
    return env;
}

Envelope make_failure(const std::string& subtype, ErrorCode code, const std::string& message)
{
    Envelope env;
    env.timestamp = iso_utc_timestamp();
    env.status = SnapshotStatus::Failure;
    env.subtype = subtype;
    env.error_code = code;
    env.error_message = message;
    return env;
}

Envelope make_failure(const std::string& subtype, const Error& error)
{
    return make_failure(subtype, error.code(), error.to_string());
}

std::string to_json(const Envelope& envelope)
{
    std::ostringstream out;
    out << "{\"timestamp\":" << json_quote(envelope.timestamp) << ",\"status\":\"" << status_name(envelope.status)
        << "\",\"metadata\":{\"task_type\":\"" << task_type_name(envelope.task_type)
        << "\",\"subtype\":" << json_quote(envelope.subtype) << "}";
    if (envelope.ok()) {
        out << ",\"data\":" << (envelope.data_json.empty() ? "{}" : envelope.data_json);
    } else {
        out << ",\"error\":{\"code\":" << static_cast<int>(envelope.error_code)
            << ",\"message\":" << json_quote(envelope.error_message) << "}";
    }
    out << "}";
    return out.str();
}

Envelope guarded_snapshot(const std::string& subtype, const std::function<Envelope()>& body)
{
    try {
        return body();
    } catch (const std::bad_alloc& e) {
        logger().log(SLOG_ERROR("Snapshot ran out of memory").field("subtype", subtype));
        return make_failure(subtype, ErrorCode::MemoryAllocationFailure, e.what());
    } catch (const std::exception& e) {
        logger().log(SLOG_ERROR("Snapshot raised an exception").field("subtype", subtype).field("error", e.what()));
        return make_failure(subtype, ErrorCode::ExecutionFailure, std::string("Unexpected error: ") + e.what());
    } catch (...) {
        logger().log(SLOG_ERROR("Snapshot raised a non-standard exception").field("subtype", subtype));
        return make_failure(subtype, ErrorCode::ExecutionFailure, "Unexpected error: Unknown exception");
    }
}

} // namespace hostscope
