#include "crypto/base64.hpp"

#include <openssl/evp.h>

#include <climits>

namespace rbp {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

bool Base64Decode(std::string_view in, std::vector<std::uint8_t>& out) {
    out.clear();
    while (!in.empty() && IsSpace(in.front())) in.remove_prefix(1);
    while (!in.empty() && IsSpace(in.back())) in.remove_suffix(1);
    if (in.empty()) return true;
    if (in.size() % 4 != 0 || in.size() > static_cast<size_t>(INT_MAX)) return false;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t pad = 0;
    if (in.back() == '=') ++pad;
    if (in.size() >= 2 && in[in.size() - 2] == '=') ++pad;
    if (in.substr(0, in.size() - pad).find('=') != std::string_view::npos) return false;

    out.resize(in.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0 || static_cast<size_t>(n) < pad) {
        out.clear();
        return false;
    }
    out.resize(static_cast<size_t>(n) - pad);
    return true;
}

std::string Base64Encode(std::span<const std::uint8_t> data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(),
                                  static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

} // namespace rbp
