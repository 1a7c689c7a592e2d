#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_protocol.hpp>
#include <resparse/protocol/rest_decoder.hpp>
#include <resparse/protocol/xml_body_decoder.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// RestXmlProtocol — REST bindings over XML bodies.
//
// Two error layouts are accepted: a bare <Error> root (request ids come from
// the headers) and an <ErrorResponse> wrapper with a top-level <RequestId>.
// The root is compared by local name like every other tag, so a prefixed
// <s3:Error> is also bare. An empty or whitespace-only error body is
// described from the status line alone.
// ---------------------------------------------------------------------------
class RestXmlProtocol : public IProtocol {
public:
    explicit RestXmlProtocol(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] std::string_view Name() const noexcept override { return "rest-xml"; }

    [[nodiscard]] DecodeResult DecodeSuccess(const HttpResponse& response,
                                             const Shape* shape) const override;
    [[nodiscard]] DecodeResult DecodeError(const HttpResponse& response,
                                           const Shape* shape) const override;

private:
    [[nodiscard]] static nlohmann::json ErrorFromHttpStatus(const HttpResponse& response);
    [[nodiscard]] DecodeResult ErrorFromBody(const HttpResponse& response) const;

    // Declaration order matters: rest_ borrows xml_.
    XmlBodyDecoder xml_;
    RestDecoder rest_;
};

} // namespace resparse
