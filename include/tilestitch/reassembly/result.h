#pragma once

#include <cstdint>
#include <string>

#include <Poco/JSON/Object.h>

namespace tilestitch::reassembly {

/// @brief How a reassembly attempt ended.
enum class Outcome {
    kCompleted,
    kAlreadyCompleted,
    kNotReady,
    kInProgress,
    kNotFound,
    kFailed,
    kInvalid,
};

const char* OutcomeName(Outcome outcome);
/// @brief HTTP status an invocation answers with for `outcome`.
int OutcomeStatusCode(Outcome outcome);

/// @brief Structured outcome of one pipeline run; serialised as the invocation response.
struct ReassemblyResult {
    Outcome outcome{Outcome::kFailed};
    bool success{false};
    std::string message;
    std::string booking_id;
    std::string session_id;
    std::string resource_id;
    std::string file_name;
    std::string url;
    std::string blob_key;
    std::uint64_t size{0};
    int required_chunks{0};
    int chunks_found{0};

    static ReassemblyResult Completed(const std::string& booking_id, const std::string& session_id);
    static ReassemblyResult Failure(Outcome outcome, const std::string& booking_id,
                                    const std::string& session_id, const std::string& message);

    /// Response body: success/message/bookingId always; the rest only when known.
    Poco::JSON::Object::Ptr ToJson() const;
};

}  // namespace tilestitch::reassembly
