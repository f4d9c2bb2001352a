#include "tilestitch/reassembly/trigger_dispatcher.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <typeinfo>
#include <vector>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Parser.h>
#include <Poco/RegularExpression.h>
#include <Poco/URI.h>

#include "tilestitch/core/logger.h"
#include "tilestitch/observability/metrics.h"

namespace tilestitch::reassembly {

namespace {

constexpr const char* kManifestSuffix = "_manifest.json";

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Resource types become the resource id prefix and part of the output key.
bool IsValidResourceType(const std::string& value) {
    static const Poco::RegularExpression pattern("^[A-Za-z0-9_-]+$");
    return pattern.match(value);
}

bool IsBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Storage notifications carry form-encoded keys: '+' is a space.
std::string DecodeObjectKey(const std::string& raw) {
    std::string plus_decoded = raw;
    std::replace(plus_decoded.begin(), plus_decoded.end(), '+', ' ');
    std::string decoded;
    Poco::URI::decode(plus_decoded, decoded);
    return decoded;
}

std::vector<std::string> SplitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string item;
    while (std::getline(ss, item, '/')) {
        parts.push_back(item);
    }
    return parts;
}

InvocationResponse Respond(int status_code, bool success, const std::string& message) {
    InvocationResponse response;
    response.status_code = status_code;
    response.body = new Poco::JSON::Object();
    response.body->set("success", success);
    response.body->set("message", message);
    return response;
}

std::string OptString(const Poco::JSON::Object::Ptr& obj, const std::string& name) {
    return obj->optValue<std::string>(name, "");
}

}  // namespace

const char* TriggerKindName(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::kStorageEvent:
            return "storage_event";
        case TriggerKind::kScheduledSweep:
            return "scheduled_sweep";
        case TriggerKind::kDirectRequest:
            return "direct_request";
        case TriggerKind::kInvalid:
            break;
    }
    return "invalid";
}

std::string InvocationResponse::BodyString() const {
    std::ostringstream out;
    if (body) {
        body->stringify(out);
    } else {
        out << "{}";
    }
    return out.str();
}

TriggerDispatcher::TriggerDispatcher(std::shared_ptr<ReassemblyPipeline> pipeline,
                                     std::shared_ptr<Sweeper> sweeper, std::string bucket)
    : pipeline_(std::move(pipeline)), sweeper_(std::move(sweeper)), bucket_(std::move(bucket)) {}

TriggerKind TriggerDispatcher::Classify(const Poco::JSON::Object::Ptr& event) {
    if (!event) {
        return TriggerKind::kInvalid;
    }
    if (event->has("Records")) {
        return TriggerKind::kStorageEvent;
    }
    if (event->size() == 0) {
        return TriggerKind::kScheduledSweep;
    }
    if (event->has("detail-type") &&
        ToLower(event->optValue<std::string>("detail-type", "")).find("scheduled") !=
            std::string::npos) {
        return TriggerKind::kScheduledSweep;
    }
    if (event->has("body") || event->has("bookingId")) {
        return TriggerKind::kDirectRequest;
    }
    return TriggerKind::kInvalid;
}

InvocationResponse TriggerDispatcher::Dispatch(const std::string& payload) {
    InvocationResponse response;
    try {
        Poco::JSON::Object::Ptr event;
        if (IsBlank(payload)) {
            event = new Poco::JSON::Object();
        } else {
            try {
                Poco::JSON::Parser parser;
                event = parser.parse(payload).extract<Poco::JSON::Object::Ptr>();
            } catch (const Poco::Exception& ex) {
                core::LogWarning("Rejecting unparseable invocation: " + ex.displayText());
            }
        }

        const auto kind = Classify(event);
        core::LogDebug(std::string("Dispatching invocation as ") + TriggerKindName(kind));
        switch (kind) {
            case TriggerKind::kStorageEvent:
                response = HandleStorageEvent(event);
                break;
            case TriggerKind::kScheduledSweep:
                response = HandleSweep();
                break;
            case TriggerKind::kDirectRequest: {
                Poco::JSON::Object::Ptr request = event;
                if (event->has("body")) {
                    auto body = event->get("body");
                    if (body.type() == typeid(Poco::JSON::Object::Ptr)) {
                        request = body.extract<Poco::JSON::Object::Ptr>();
                    } else if (body.isString()) {
                        try {
                            Poco::JSON::Parser parser;
                            request = parser.parse(body.convert<std::string>())
                                          .extract<Poco::JSON::Object::Ptr>();
                        } catch (const Poco::Exception& ex) {
                            core::LogWarning("Direct request body is not a JSON object: " +
                                             ex.displayText());
                            request = new Poco::JSON::Object();
                        }
                    } else {
                        request = new Poco::JSON::Object();
                    }
                }
                response = HandleDirectRequest(request);
                break;
            }
            case TriggerKind::kInvalid:
                observability::RecordReassembly(OutcomeName(Outcome::kInvalid));
                response = Respond(400, false, "Invalid trigger event");
                break;
        }
    } catch (const std::exception& ex) {
        core::LogError(std::string("Invocation failed: ") + ex.what());
        observability::RecordReassembly(OutcomeName(Outcome::kFailed));
        response = Respond(500, false, std::string("Internal error: ") + ex.what());
    }
    return response;
}

InvocationResponse TriggerDispatcher::HandleStorageEvent(const Poco::JSON::Object::Ptr& event) {
    auto records = event->getArray("Records");
    if (!records || records->size() == 0) {
        return Respond(400, false, "Invalid storage event");
    }
    auto record = records->getObject(0);
    if (!record || !record->getObject("s3")) {
        return Respond(400, false, "Invalid storage event");
    }
    auto s3 = record->getObject("s3");
    auto bucket = s3->getObject("bucket");
    auto object = s3->getObject("object");
    if (!bucket || !object || !object->has("key")) {
        return Respond(400, false, "Invalid storage event");
    }

    const auto key = DecodeObjectKey(object->getValue<std::string>("key"));
    if (!EndsWith(key, kManifestSuffix)) {
        core::LogInfo("Not a manifest file, ignoring: " + key);
        return Respond(200, true, "Not a manifest file, ignoring");
    }
    const auto bucket_name = bucket->optValue<std::string>("name", "");
    if (bucket_name != bucket_) {
        core::LogWarning("Ignoring event for unexpected bucket " + bucket_name);
        return Respond(400, false, "Unexpected bucket: " + bucket_name);
    }

    const auto segments = SplitKey(key);
    if (segments.size() < 2 || segments.front().empty()) {
        return Respond(400, false, "Invalid key path format");
    }
    const auto& booking_id = segments.front();

    auto manifest = pipeline_->resolver().Fetch(key);
    if (!manifest) {
        observability::RecordReassembly(OutcomeName(Outcome::kNotFound));
        return Respond(404, false, "Manifest file not found or invalid");
    }
    if (manifest->session_id.empty()) {
        observability::RecordReassembly(OutcomeName(Outcome::kInvalid));
        return Respond(400, false, "Manifest missing sessionId");
    }

    auto result = pipeline_->ReassembleManifest(booking_id, *manifest, key);
    if (result.outcome == Outcome::kNotReady) {
        result.message = "Manifest registered, waiting for all chunks";
        result.required_chunks = manifest->total_chunks;
    }
    return FromResult(result);
}

InvocationResponse TriggerDispatcher::HandleSweep() {
    const auto report = sweeper_->RunOnce();
    observability::RecordSweep(report.checked, report.reassembled, report.failed);
    InvocationResponse response;
    response.status_code = 200;
    response.body = report.ToJson();
    return response;
}

InvocationResponse TriggerDispatcher::HandleDirectRequest(const Poco::JSON::Object::Ptr& request) {
    const auto booking_id = request ? OptString(request, "bookingId") : std::string();
    if (booking_id.empty()) {
        observability::RecordReassembly(OutcomeName(Outcome::kInvalid));
        return Respond(400, false, "bookingId is required");
    }

    RequestOptions options;
    options.manifest_key = OptString(request, "manifestKey");
    options.final_resource_id = OptString(request, "finalResourceId");
    options.base_file_name = OptString(request, "baseFileName");
    options.resource_type = OptString(request, "resourceType");
    if (!options.resource_type.empty() && !IsValidResourceType(options.resource_type)) {
        observability::RecordReassembly(OutcomeName(Outcome::kInvalid));
        return Respond(400, false, "resourceType may only contain letters, digits, '_' and '-'");
    }
    options.fail_if_not_found = request->optValue<bool>("failIfNotFound", false);
    options.allow_restart = true;

    const auto session_id = OptString(request, "sessionId");
    core::LogInfo("Direct reassembly request for booking " + booking_id +
                  (session_id.empty() ? std::string() : ", session " + session_id));
    if (!session_id.empty()) {
        return FromResult(pipeline_->ReassembleSession(booking_id, session_id, options));
    }
    return FromResult(pipeline_->ReassembleBooking(booking_id, options));
}

InvocationResponse TriggerDispatcher::FromResult(const ReassemblyResult& result) {
    observability::RecordReassembly(OutcomeName(result.outcome));
    InvocationResponse response;
    response.status_code = OutcomeStatusCode(result.outcome);
    response.body = result.ToJson();
    return response;
}

}  // namespace tilestitch::reassembly
