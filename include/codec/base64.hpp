#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace uisync {

// Standard alphabet with '=' padding, no line breaks.
std::string Base64Encode(std::string_view bytes);

// Whitespace (including PEM-style line breaks) is ignored. Missing trailing
// padding is tolerated.
Expected<std::string> Base64Decode(std::string_view text);

// True when `text` is non-empty and consists only of base64 alphabet characters,
// padding and whitespace, with a length that can be decoded.
bool LooksLikeBase64(std::string_view text);

} // namespace uisync
