#pragma once

#include <resparse/core/http.hpp>
#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_body_decoder.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace resparse {

/// ResponseMetadata for the REST protocols: "x-amzn-requestid" when present,
/// else "x-amz-request-id" as RequestId plus "x-amz-id-2" (default "") as
/// HostId. Empty object when neither request id header is present.
[[nodiscard]] nlohmann::json ResponseMetadataFromHeaders(const HttpHeaders& headers);

// ---------------------------------------------------------------------------
// RestDecoder — decodes the members of a REST output shape.
//
// Members with a location are taken from the status line or headers; the
// rest come from the body, decoded by the injected body-format strategy.
// The strategy is borrowed and must outlive the RestDecoder.
// ---------------------------------------------------------------------------
class RestDecoder {
public:
    RestDecoder(const IBodyDecoder& body_decoder, TimestampParser timestamp_parser);

    /// Decoded members of `shape` (a structure); no ResponseMetadata.
    [[nodiscard]] DecodeResult Decode(const HttpResponse& response, const Shape& shape) const;

    /// Convert one header value according to the member's scalar kind.
    [[nodiscard]] DecodeResult DecodeHeaderValue(const Shape& shape,
                                                 const std::string& value) const;

    /// Every header whose name starts with the shape's declared prefix
    /// (case-insensitively), keyed by the remainder of the header name.
    [[nodiscard]] static nlohmann::json DecodeHeaderMap(const Shape& shape,
                                                        const HttpHeaders& headers);

private:
    Result<void, Error> DecodeNonPayloadAttributes(const HttpResponse& response,
                                                   const Shape& shape,
                                                   nlohmann::json& parsed) const;
    Result<void, Error> DecodePayload(const HttpResponse& response,
                                      const Shape& shape,
                                      nlohmann::json& parsed) const;

    const IBodyDecoder& body_decoder_;
    TimestampParser timestamp_parser_;
};

} // namespace resparse
