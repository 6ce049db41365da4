#include "codec/content_codec.hpp"

#include "codec/base64.hpp"
#include "codec/gzip.hpp"
#include "util/logger.hpp"

namespace uisync {

Expected<std::string> ContentCodec::Encode(std::string_view plain) {
    auto compressed = GzipCompress(plain);
    if (!compressed)
        return std::unexpected("compress failed: " + compressed.error());

    // The first layer is the transport requirement for document bodies; the
    // platform decodes it on write. The second survives storage.
    std::string once = Base64Encode(*compressed);
    return Base64Encode(once);
}

Expected<std::string> ContentCodec::Decode(std::string_view wire) {
    std::string payload(wire);

    int layers = 0;
    while (!LooksCompressed(payload)) {
        if (layers == kMaxTextLayers) {
            return std::unexpected("no compressed payload after " + std::to_string(layers) +
                                   " base64 layers");
        }
        if (!LooksLikeBase64(payload)) {
            return std::unexpected(layers == 0 ? "wire text is not base64"
                                               : "decoded layer is neither base64 nor compressed");
        }
        auto decoded = Base64Decode(payload);
        if (!decoded)
            return std::unexpected("base64 decode failed: " + decoded.error());
        payload = std::move(*decoded);
        ++layers;
    }
    LogDebug("ContentCodec: stripped %d base64 layer(s), %zu compressed bytes", layers, payload.size());

    auto plain = GzipDecompress(payload);
    if (!plain)
        return std::unexpected("decompress failed: " + plain.error());
    return plain;
}

} // namespace uisync
