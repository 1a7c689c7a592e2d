#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_protocol.hpp>
#include <resparse/protocol/json_body_decoder.hpp>
#include <resparse/protocol/rest_decoder.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// RestJsonProtocol — REST bindings (status, headers, payload) over JSON
// bodies. Error codes come from the x-amzn-errortype header.
// ---------------------------------------------------------------------------
class RestJsonProtocol : public IProtocol {
public:
    explicit RestJsonProtocol(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] std::string_view Name() const noexcept override { return "rest-json"; }

    [[nodiscard]] DecodeResult DecodeSuccess(const HttpResponse& response,
                                             const Shape* shape) const override;
    [[nodiscard]] DecodeResult DecodeError(const HttpResponse& response,
                                           const Shape* shape) const override;

private:
    // Declaration order matters: rest_ borrows json_.
    JsonBodyDecoder json_;
    RestDecoder rest_;
};

} // namespace resparse
