#pragma once

#include <geohashing/core/date.hpp>

#include <string>
#include <string_view>

namespace geohashing::hash {

/// 32 lowercase hex characters of an MD5 digest.
using Digest = std::string;

inline constexpr std::size_t kDigestLength = 32;

/// The exact text that is hashed: "<YYYY-MM-DD>-<index>".
[[nodiscard]] auto digest_input(Date date, std::string_view index_value) -> std::string;

/// MD5 of digest_input(date, index_value), as lowercase hex.
///
/// The index value is hashed verbatim; "10458.6" and "10458.60" give
/// different digests.
[[nodiscard]] auto compute_digest(Date date, std::string_view index_value) -> Digest;

/// MD5 of arbitrary bytes as lowercase hex.
[[nodiscard]] auto md5_hex(std::string_view data) -> std::string;

}  // namespace geohashing::hash
