#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_protocol.hpp>
#include <resparse/protocol/json_body_decoder.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// JsonProtocol — JSON-RPC style: the whole body maps onto the output shape,
// the request id travels in the x-amzn-requestid header.
// ---------------------------------------------------------------------------
class JsonProtocol : public IProtocol {
public:
    explicit JsonProtocol(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] std::string_view Name() const noexcept override { return "json"; }

    [[nodiscard]] DecodeResult DecodeSuccess(const HttpResponse& response,
                                             const Shape* shape) const override;
    [[nodiscard]] DecodeResult DecodeError(const HttpResponse& response,
                                           const Shape* shape) const override;

private:
    JsonBodyDecoder json_;
};

} // namespace resparse
