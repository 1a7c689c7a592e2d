#pragma once

#include <resparse/core/base64.hpp>
#include <resparse/core/http.hpp>
#include <resparse/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace resparse::protocol_utils {

inline Error DecodeFailure(std::string_view operation,
                           std::string_view protocol,
                           std::string message) {
    return Error{std::string(operation), std::string(protocol), std::nullopt,
                 std::move(message), std::nullopt, ErrorCategory::Decode};
}

inline Error MalformedBody(std::string_view operation,
                           std::string_view protocol,
                           std::string message,
                           std::optional<std::string> detail = std::nullopt) {
    return Error{std::string(operation), std::string(protocol), std::nullopt,
                 std::move(message), std::move(detail), ErrorCategory::MalformedBody};
}

inline bool IsBlank(std::string_view body) {
    for (char c : body) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

inline std::string TrimWhitespace(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

// Base-10 integer; surrounding whitespace is allowed, nothing else.
inline Result<nlohmann::json, Error> ParseInteger(std::string_view raw,
                                                  std::string_view operation) {
    const std::string text = TrimWhitespace(raw);
    try {
        size_t consumed = 0;
        const long long value = std::stoll(text, &consumed, 10);
        if (consumed == text.size()) {
            return Result<nlohmann::json, Error>::Ok(static_cast<std::int64_t>(value));
        }
    } catch (const std::exception&) {
        // Reported below.
    }
    return Result<nlohmann::json, Error>::Err(
        DecodeFailure(operation, "", "invalid integer: '" + text + "'"));
}

inline Result<nlohmann::json, Error> ParseFloat(std::string_view raw,
                                                std::string_view operation) {
    const std::string text = TrimWhitespace(raw);
    try {
        size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return Result<nlohmann::json, Error>::Ok(value);
        }
    } catch (const std::exception&) {
        // Reported below.
    }
    return Result<nlohmann::json, Error>::Err(
        DecodeFailure(operation, "", "invalid float: '" + text + "'"));
}

inline Result<nlohmann::json, Error> DecodeBase64Blob(std::string_view text) {
    auto bytes = Base64Decode(text);
    if (bytes.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(bytes).Error());
    }
    return Result<nlohmann::json, Error>::Ok(
        nlohmann::json::binary(std::move(bytes).Value()));
}

// "com.amazon.coral#ThrottlingException" -> "ThrottlingException".
inline std::string StripTypeNamespace(const std::string& code) {
    const auto hash = code.rfind('#');
    return hash == std::string::npos ? code : code.substr(hash + 1);
}

// Move parsed[from] into parsed["ResponseMetadata"][to] when present.
inline void PromoteToMetadata(nlohmann::json& parsed, const char* from, const char* to) {
    auto it = parsed.find(from);
    if (it == parsed.end()) {
        return;
    }
    nlohmann::json value = std::move(*it);
    parsed.erase(from);
    parsed["ResponseMetadata"] = nlohmann::json{{to, std::move(value)}};
}

} // namespace resparse::protocol_utils
