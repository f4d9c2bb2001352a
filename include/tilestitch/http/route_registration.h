#pragma once

#include <memory>

#include "tilestitch/http/router.h"

namespace tilestitch::reassembly {
class TriggerDispatcher;
}

namespace tilestitch::http {

/// Registers health, metrics and invocation routes into the provided router.
void RegisterReassemblyRoutes(Router& router,
                              std::shared_ptr<reassembly::TriggerDispatcher> dispatcher);

}  // namespace tilestitch::http
