#include <geohashing/hash/digest.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <array>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace geohashing::hash {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

auto digest_input(Date date, std::string_view index_value) -> std::string {
    return fmt::format("{}-{}", format_iso(date), index_value);
}

auto md5_hex(std::string_view data) -> std::string {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw std::runtime_error("OpenSSL: EVP md5 digest failed");
    }
    if (out_len * 2 != kDigestLength) {
        throw std::runtime_error("OpenSSL: unexpected MD5 digest length");
    }

    std::string hex;
    hex.reserve(kDigestLength);
    for (unsigned int i = 0; i < out_len; ++i) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", out[i]);
    }
    return hex;
}

auto compute_digest(Date date, std::string_view index_value) -> Digest {
    return md5_hex(digest_input(date, index_value));
}

}  // namespace geohashing::hash
