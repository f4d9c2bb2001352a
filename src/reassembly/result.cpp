#include "tilestitch/reassembly/result.h"

namespace tilestitch::reassembly {

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::kCompleted:
            return "completed";
        case Outcome::kAlreadyCompleted:
            return "already_completed";
        case Outcome::kNotReady:
            return "not_ready";
        case Outcome::kInProgress:
            return "in_progress";
        case Outcome::kNotFound:
            return "not_found";
        case Outcome::kFailed:
            return "failed";
        case Outcome::kInvalid:
            return "invalid";
    }
    return "failed";
}

int OutcomeStatusCode(Outcome outcome) {
    switch (outcome) {
        case Outcome::kCompleted:
        case Outcome::kAlreadyCompleted:
            return 200;
        case Outcome::kNotReady:
        case Outcome::kInProgress:
            return 202;
        case Outcome::kNotFound:
            return 404;
        case Outcome::kInvalid:
            return 400;
        case Outcome::kFailed:
            return 500;
    }
    return 500;
}

ReassemblyResult ReassemblyResult::Completed(const std::string& booking_id,
                                             const std::string& session_id) {
    ReassemblyResult result;
    result.outcome = Outcome::kCompleted;
    result.success = true;
    result.message = "Successfully reassembled file";
    result.booking_id = booking_id;
    result.session_id = session_id;
    return result;
}

ReassemblyResult ReassemblyResult::Failure(Outcome outcome, const std::string& booking_id,
                                           const std::string& session_id,
                                           const std::string& message) {
    ReassemblyResult result;
    result.outcome = outcome;
    result.success = false;
    result.message = message;
    result.booking_id = booking_id;
    result.session_id = session_id;
    return result;
}

Poco::JSON::Object::Ptr ReassemblyResult::ToJson() const {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("success", success);
    obj->set("message", message);
    obj->set("status", std::string(OutcomeName(outcome)));
    obj->set("bookingId", booking_id);
    if (!session_id.empty()) {
        obj->set("sessionId", session_id);
    }
    if (!resource_id.empty()) {
        obj->set("resourceId", resource_id);
    }
    if (!file_name.empty()) {
        obj->set("fileName", file_name);
    }
    if (!url.empty()) {
        obj->set("url", url);
    }
    if (!blob_key.empty()) {
        obj->set("blobKey", blob_key);
    }
    if (success) {
        obj->set("size", static_cast<Poco::UInt64>(size));
    }
    if (outcome == Outcome::kNotReady) {
        obj->set("requiredChunks", required_chunks);
        obj->set("chunksFound", chunks_found);
    }
    return obj;
}

}  // namespace tilestitch::reassembly
