#include "codec/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <vector>

namespace uisync {

namespace {

bool IsBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

std::string StripWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

} // namespace

std::string Base64Encode(std::string_view bytes) {
    if (bytes.empty()) return {};

    std::string out;
    // EVP_EncodeBlock takes int lengths; encode in chunks that are a multiple of 3
    // so the concatenation equals a single-pass encoding.
    constexpr size_t kChunk = 3 * 1024 * 1024;
    std::vector<unsigned char> buf(4 * ((kChunk + 2) / 3) + 1);
    out.reserve(4 * ((bytes.size() + 2) / 3));

    for (size_t pos = 0; pos < bytes.size(); pos += kChunk) {
        const size_t n = std::min(kChunk, bytes.size() - pos);
        const int written = EVP_EncodeBlock(buf.data(),
                                            reinterpret_cast<const unsigned char*>(bytes.data() + pos),
                                            static_cast<int>(n));
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(written));
    }
    return out;
}

Expected<std::string> Base64Decode(std::string_view text) {
    std::string clean = StripWhitespace(text);
    if (clean.empty()) return std::string{};

    switch (clean.size() % 4) {
        case 0: break;
        case 2: clean.append("=="); break;
        case 3: clean.append("="); break;
        default: return std::unexpected("invalid base64 length");
    }
    if (clean.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected("base64 input too large");
    }

    // '=' may only appear as the last one or two characters.
    size_t padding = 0;
    for (size_t i = 0; i < clean.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(clean[i]);
        if (c == '=') {
            if (i + 2 < clean.size()) return std::unexpected("invalid base64 padding");
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            return std::unexpected("invalid base64 character");
        }
    }

    std::vector<unsigned char> buf(clean.size() / 4 * 3 + 1);
    const int n = EVP_DecodeBlock(buf.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0) return std::unexpected("invalid base64 data");

    // EVP_DecodeBlock counts padding as zero bytes.
    const size_t len = static_cast<size_t>(n) - padding;
    return std::string(reinterpret_cast<const char*>(buf.data()), len);
}

bool LooksLikeBase64(std::string_view text) {
    size_t count = 0;
    bool seen_padding = false;
    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;
        if (c == '=') {
            seen_padding = true;
        } else if (seen_padding || !IsBase64Char(c)) {
            return false;
        }
        ++count;
    }
    return count > 0 && count % 4 != 1;
}

} // namespace uisync
