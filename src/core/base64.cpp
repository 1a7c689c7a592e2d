#include <resparse/core/base64.hpp>

#include <array>

namespace resparse {

namespace {

constexpr const char* kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kInvalid = -1;
constexpr int kPad = -2;
constexpr int kSkip = -3;

std::array<int, 256> BuildDecodeTable() {
    std::array<int, 256> table{};
    table.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    table[static_cast<unsigned char>('=')] = kPad;
    for (char c : {' ', '\t', '\r', '\n', '\f', '\v'}) {
        table[static_cast<unsigned char>(c)] = kSkip;
    }
    return table;
}

Error Base64Error(const std::string& message) {
    return Error{"Base64Decode", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Decode};
}

} // anonymous namespace

Result<Bytes, Error> Base64Decode(std::string_view encoded) {
    static const std::array<int, 256> table = BuildDecodeTable();

    Bytes out;
    out.reserve(encoded.size() / 4 * 3);

    std::uint32_t accumulator = 0;
    int sextets = 0;
    int padding = 0;

    for (size_t i = 0; i < encoded.size(); ++i) {
        const int v = table[static_cast<unsigned char>(encoded[i])];
        if (v == kSkip) {
            continue;
        }
        if (v == kInvalid) {
            return Result<Bytes, Error>::Err(Base64Error(
                "invalid base64 character at offset " + std::to_string(i)));
        }
        if (v == kPad) {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return Result<Bytes, Error>::Err(
                Base64Error("base64 data after padding"));
        }
        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(v);
        if (++sextets == 4) {
            out.push_back(static_cast<std::uint8_t>((accumulator >> 16) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((accumulator >> 8) & 0xFF));
            out.push_back(static_cast<std::uint8_t>(accumulator & 0xFF));
            accumulator = 0;
            sextets = 0;
        }
    }

    switch (sextets) {
        case 0:
            break;
        case 2:
            out.push_back(static_cast<std::uint8_t>((accumulator >> 4) & 0xFF));
            break;
        case 3:
            out.push_back(static_cast<std::uint8_t>((accumulator >> 10) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((accumulator >> 2) & 0xFF));
            break;
        default:
            return Result<Bytes, Error>::Err(
                Base64Error("truncated base64 quantum"));
    }
    if (padding > 2) {
        return Result<Bytes, Error>::Err(Base64Error("too much base64 padding"));
    }

    return Result<Bytes, Error>::Ok(std::move(out));
}

std::string Base64Encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace resparse
