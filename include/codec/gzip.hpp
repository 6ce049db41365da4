#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace uisync {

// gzip-wrapped deflate stream.
Expected<std::string> GzipCompress(std::string_view plain);

// Accepts gzip or zlib wrapped deflate streams. Trailing garbage and truncated
// streams are errors.
Expected<std::string> GzipDecompress(std::string_view compressed);

// Header check for a gzip member or a zlib stream.
bool LooksCompressed(std::string_view bytes);

} // namespace uisync
