#include "tilestitch/reassembly/part_order.h"

#include <algorithm>
#include <array>
#include <cctype>

#include <Poco/RegularExpression.h>

namespace tilestitch::reassembly {

namespace {

// Order matters: the first pattern that matches wins.
const std::array<const Poco::RegularExpression*, 3>& PartPatterns() {
    static const Poco::RegularExpression dot_part("\\.part(\\d+)$");
    static const Poco::RegularExpression underscore_part("_part(\\d+)_");
    static const Poco::RegularExpression bare_part("part(\\d+)");
    static const std::array<const Poco::RegularExpression*, 3> patterns{
        &dot_part, &underscore_part, &bare_part};
    return patterns;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

int ExtractPartIndex(const std::string& key) {
    const auto lowered = ToLower(key);
    for (const auto& pattern : PartPatterns()) {
        std::vector<std::string> groups;
        if (pattern->split(lowered, groups) >= 2 && groups.size() >= 2) {
            try {
                return std::stoi(groups[1]);
            } catch (const std::out_of_range&) {
                return 0;
            }
        }
    }
    return 0;
}

std::vector<std::string> SortByPartIndex(std::vector<std::string> keys) {
    std::stable_sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b) {
        return ExtractPartIndex(a) < ExtractPartIndex(b);
    });
    return keys;
}

std::string BaseName(const std::string& key) {
    const auto slash = key.find_last_of('/');
    if (slash == std::string::npos) {
        return key;
    }
    return key.substr(slash + 1);
}

std::string StripPartSuffix(const std::string& file_name) {
    static const Poco::RegularExpression suffix("^(.+)\\.part\\d+$",
                                                Poco::RegularExpression::RE_CASELESS);
    std::vector<std::string> groups;
    if (suffix.split(file_name, groups) >= 2 && groups.size() >= 2) {
        return groups[1];
    }
    return file_name;
}

}  // namespace tilestitch::reassembly
