#include "tilestitch/core/ids.h"

#include <Poco/UUIDGenerator.h>

#include "tilestitch/core/time.h"

namespace tilestitch::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateResourceId(const std::string& prefix) {
    std::string hex;
    for (char c : Poco::UUIDGenerator().createRandom().toString()) {
        if (c != '-') {
            hex += c;
        }
        if (hex.size() == 8) {
            break;
        }
    }
    return prefix + "_" + std::to_string(NowEpochSeconds()) + "_" + hex;
}

}  // namespace tilestitch::core
