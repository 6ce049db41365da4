#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace uisync {

// Converts between plain JSON text and the wire form of a remote document body.
//
// Wire form written by Encode: base64(base64(gzip(plain))). The remote platform
// strips one base64 layer when it stores a body, so a body read back carries a
// single layer. Decode accepts both forms.
class ContentCodec {
public:
    static constexpr int kMaxTextLayers = 2;

    static Expected<std::string> Encode(std::string_view plain);
    static Expected<std::string> Decode(std::string_view wire);
};

} // namespace uisync
