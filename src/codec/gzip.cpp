#include "codec/gzip.hpp"

#include <climits>
#include <cstdint>
#include <vector>
#include <zlib.h>

namespace uisync {

namespace {

constexpr size_t kChunk = 16384;

class ZStream final {
public:
    ZStream() = default;
    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;
    ~ZStream() {
        if (!initialized_) return;
        if (deflating_) {
            deflateEnd(&strm_);
        } else {
            inflateEnd(&strm_);
        }
    }

    bool InitDeflate() {
        // 16 + MAX_WBITS writes a gzip header and trailer
        initialized_ = deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                                    Z_DEFAULT_STRATEGY) == Z_OK;
        deflating_ = true;
        return initialized_;
    }

    bool InitInflate() {
        // 32 + MAX_WBITS auto-detects a gzip or zlib header
        initialized_ = inflateInit2(&strm_, 32 + MAX_WBITS) == Z_OK;
        deflating_ = false;
        return initialized_;
    }

    z_stream* get() { return &strm_; }

private:
    z_stream strm_{};
    bool initialized_ = false;
    bool deflating_ = false;
};

} // namespace

Expected<std::string> GzipCompress(std::string_view plain) {
    if (plain.size() > static_cast<size_t>(UINT_MAX)) {
        return std::unexpected("input too large to compress");
    }

    ZStream zs;
    if (!zs.InitDeflate()) {
        return std::unexpected("Failed to initialize zlib deflate");
    }

    z_stream* strm = zs.get();
    strm->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(plain.data()));
    strm->avail_in = static_cast<uInt>(plain.size());

    std::string out;
    std::vector<std::uint8_t> buf(kChunk);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm->next_out = buf.data();
        strm->avail_out = static_cast<uInt>(buf.size());
        ret = deflate(strm, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            return std::unexpected(std::string("deflate failed: ") + (strm->msg ? strm->msg : "unknown"));
        }
        out.append(reinterpret_cast<const char*>(buf.data()), buf.size() - strm->avail_out);
    }
    return out;
}

Expected<std::string> GzipDecompress(std::string_view compressed) {
    if (compressed.empty()) {
        return std::unexpected("empty compressed stream");
    }
    if (compressed.size() > static_cast<size_t>(UINT_MAX)) {
        return std::unexpected("compressed input too large");
    }

    ZStream zs;
    if (!zs.InitInflate()) {
        return std::unexpected("Failed to initialize zlib inflate");
    }

    z_stream* strm = zs.get();
    strm->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    strm->avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    std::vector<std::uint8_t> buf(kChunk);
    while (true) {
        strm->next_out = buf.data();
        strm->avail_out = static_cast<uInt>(buf.size());

        const int ret = inflate(strm, Z_NO_FLUSH);
        out.append(reinterpret_cast<const char*>(buf.data()), buf.size() - strm->avail_out);

        if (ret == Z_STREAM_END) break;

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return std::unexpected(std::string("inflate failed: ") + (strm->msg ? strm->msg : "corrupt data"));
        }

        // No more input and zlib has not seen the end of the stream.
        if (strm->avail_in == 0 && strm->avail_out != 0) {
            return std::unexpected("truncated compressed stream");
        }
    }

    if (strm->avail_in != 0) {
        return std::unexpected("trailing data after compressed stream");
    }
    return out;
}

bool LooksCompressed(std::string_view bytes) {
    if (bytes.size() < 2) return false;
    const auto b0 = static_cast<unsigned char>(bytes[0]);
    const auto b1 = static_cast<unsigned char>(bytes[1]);
    if (b0 == 0x1f && b1 == 0x8b) return true;
    // zlib: CM = 8 (deflate) and the header checksum holds
    return (b0 & 0x0f) == 8 && (b0 >> 4) <= 7 && ((b0 << 8) | b1) % 31 == 0;
}

} // namespace uisync
