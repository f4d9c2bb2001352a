#include "tilestitch/reassembly/sweeper.h"

#include <exception>

#include <Poco/JSON/Array.h>

#include "tilestitch/core/logger.h"
#include "tilestitch/core/time.h"

namespace tilestitch::reassembly {

Poco::JSON::Object::Ptr SweepReport::ToJson() const {
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("success", true);
    obj->set("message", "Processed " + std::to_string(checked) + " sessions");
    obj->set("checked", checked);
    obj->set("reassembled", reassembled);
    obj->set("notReady", not_ready);
    obj->set("failed", failed);
    Poco::JSON::Array::Ptr items = new Poco::JSON::Array();
    for (const auto& result : results) {
        items->add(result.ToJson());
    }
    obj->set("results", items);
    return obj;
}

Sweeper::Sweeper(std::shared_ptr<metadata::MetadataStore> metadata,
                 std::shared_ptr<ReassemblyPipeline> pipeline, core::SweeperConfig config)
    : metadata_(std::move(metadata)), pipeline_(std::move(pipeline)), config_(config) {}

SweepReport Sweeper::RunOnce() {
    SweepReport report;
    const auto cutoff = core::NowIso8601WithOffsetSeconds(-config_.stale_after_seconds);
    auto sessions = metadata_->ListStalePendingSessions(cutoff, config_.max_sessions_per_sweep);
    if (!sessions.ok()) {
        core::LogError("Sweep failed to list pending sessions: " + sessions.error().message);
        return report;
    }

    for (const auto& session : sessions.value()) {
        ++report.checked;
        auto result = SweepSession(session);
        switch (result.outcome) {
            case Outcome::kCompleted:
            case Outcome::kAlreadyCompleted:
                ++report.reassembled;
                break;
            case Outcome::kNotReady:
            case Outcome::kInProgress:
            case Outcome::kNotFound:
                ++report.not_ready;
                break;
            case Outcome::kFailed:
            case Outcome::kInvalid:
                ++report.failed;
                break;
        }
        report.results.push_back(std::move(result));
    }

    core::LogEvent("sweep_finished", {{"checked", std::to_string(report.checked)},
                                      {"reassembled", std::to_string(report.reassembled)},
                                      {"not_ready", std::to_string(report.not_ready)},
                                      {"failed", std::to_string(report.failed)}});
    return report;
}

ReassemblyResult Sweeper::SweepSession(const metadata::ChunkSession& session) {
    try {
        // ReassembleSession prefers the recorded or newest manifest and falls back to
        // discovery by session id.
        return pipeline_->ReassembleSession(session.booking_id, session.session_id);
    } catch (const std::exception& ex) {
        core::LogError("Sweep of session " + session.session_id + " failed: " + ex.what());
        return ReassemblyResult::Failure(Outcome::kFailed, session.booking_id, session.session_id,
                                         std::string("Error processing session: ") + ex.what());
    }
}

}  // namespace tilestitch::reassembly
