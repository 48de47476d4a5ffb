#pragma once

#include <string>
#include <string_view>

namespace codebox::utils {

bool IsValidUtf8(std::string_view bytes);

// Replaces every malformed sequence with U+FFFD; valid input is returned unchanged.
std::string SanitizeUtf8(std::string_view bytes);

}  // namespace codebox::utils
