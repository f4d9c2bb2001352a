#pragma once

#include <string>
#include <vector>

namespace tilestitch::reassembly {

/// @brief Extracts the part index of a chunk key.
///
/// Tries `\.part(\d+)$`, then `_part(\d+)_`, then `part(\d+)` on the lower-cased key and
/// returns the first capture; keys without an index sort as 0.
int ExtractPartIndex(const std::string& key);

/// @brief Stable sort of chunk keys by part index.
std::vector<std::string> SortByPartIndex(std::vector<std::string> keys);

/// @brief Last `/`-separated segment of a key.
std::string BaseName(const std::string& key);

/// @brief Removes a trailing `.partN` from a file name ("a.tif.part3" -> "a.tif").
std::string StripPartSuffix(const std::string& file_name);

}  // namespace tilestitch::reassembly
