#pragma once

#include <memory>
#include <string>

#include <Poco/JSON/Object.h>

#include "tilestitch/reassembly/pipeline.h"
#include "tilestitch/reassembly/sweeper.h"

namespace tilestitch::reassembly {

enum class TriggerKind {
    kStorageEvent,
    kScheduledSweep,
    kDirectRequest,
    kInvalid,
};

const char* TriggerKindName(TriggerKind kind);

/// @brief Status code plus JSON body returned to the invoker.
struct InvocationResponse {
    int status_code{200};
    Poco::JSON::Object::Ptr body;

    std::string BodyString() const;
};

/// @brief Routes an invocation payload to the storage, sweep or direct-request handler.
class TriggerDispatcher {
public:
    TriggerDispatcher(std::shared_ptr<ReassemblyPipeline> pipeline,
                      std::shared_ptr<Sweeper> sweeper, std::string bucket);

    /// Classifies and handles a raw JSON payload. Never throws.
    InvocationResponse Dispatch(const std::string& payload);
    /// Handles a direct-request object (the body of a direct invocation).
    InvocationResponse HandleDirectRequest(const Poco::JSON::Object::Ptr& request);

    static TriggerKind Classify(const Poco::JSON::Object::Ptr& event);

private:
    InvocationResponse HandleStorageEvent(const Poco::JSON::Object::Ptr& event);
    InvocationResponse HandleSweep();
    InvocationResponse FromResult(const ReassemblyResult& result);

    std::shared_ptr<ReassemblyPipeline> pipeline_;
    std::shared_ptr<Sweeper> sweeper_;
    std::string bucket_;
};

}  // namespace tilestitch::reassembly
