#pragma once

#include <memory>
#include <string>
#include <vector>

#include <Poco/JSON/Object.h>

#include "tilestitch/core/config.h"
#include "tilestitch/metadata/metadata_store.h"
#include "tilestitch/reassembly/pipeline.h"

namespace tilestitch::reassembly {

struct SweepReport {
    int checked{0};
    int reassembled{0};
    int not_ready{0};
    int failed{0};
    std::vector<ReassemblyResult> results;

    Poco::JSON::Object::Ptr ToJson() const;
};

/// @brief Retries pending sessions that have been idle longer than stale_after_seconds.
class Sweeper {
public:
    Sweeper(std::shared_ptr<metadata::MetadataStore> metadata,
            std::shared_ptr<ReassemblyPipeline> pipeline, core::SweeperConfig config);

    SweepReport RunOnce();

private:
    ReassemblyResult SweepSession(const metadata::ChunkSession& session);

    std::shared_ptr<metadata::MetadataStore> metadata_;
    std::shared_ptr<ReassemblyPipeline> pipeline_;
    core::SweeperConfig config_;
};

}  // namespace tilestitch::reassembly
