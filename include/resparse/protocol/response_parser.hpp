#pragma once

#include <resparse/core/http.hpp>
#include <resparse/model/shape.hpp>
#include <resparse/protocol/i_protocol.hpp>

#include <memory>
#include <string_view>

namespace resparse {

/// Responses with a status below this take the success path.
inline constexpr int kFirstErrorStatus = 301;

// ---------------------------------------------------------------------------
// ResponseParser — entry point: one protocol, many responses.
//
// Every successful Parse() yields an object with a ResponseMetadata object
// carrying at least RequestId. Error responses (status >= 301) yield exactly
// {"Error": {"Code", "Message", ...}, "ResponseMetadata": {...}}; they are
// data, not failures. A failed Parse() returns no partial document.
// ---------------------------------------------------------------------------
class ResponseParser {
public:
    explicit ResponseParser(std::unique_ptr<IProtocol> protocol);

    /// `shape` is the operation's output structure or nullptr.
    [[nodiscard]] DecodeResult Parse(const HttpResponse& response, const Shape* shape) const;
    [[nodiscard]] DecodeResult Parse(const HttpResponse& response, const Shape& shape) const {
        return Parse(response, &shape);
    }

    [[nodiscard]] std::string_view Protocol() const noexcept { return protocol_->Name(); }

private:
    [[nodiscard]] DecodeResult NormalizeSuccess(nlohmann::json parsed) const;
    [[nodiscard]] DecodeResult NormalizeError(const HttpResponse& response,
                                              nlohmann::json parsed) const;

    std::unique_ptr<IProtocol> protocol_;
};

} // namespace resparse
