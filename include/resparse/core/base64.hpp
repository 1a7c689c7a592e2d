#pragma once

#include <resparse/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace resparse {

using Bytes = std::vector<std::uint8_t>;

/// Decode standard (RFC 4648) base64. ASCII whitespace is skipped; missing
/// trailing padding is tolerated. Any other character outside the alphabet
/// is an error (category Decode).
[[nodiscard]] Result<Bytes, Error> Base64Decode(std::string_view encoded);

[[nodiscard]] std::string Base64Encode(const Bytes& data);

} // namespace resparse
