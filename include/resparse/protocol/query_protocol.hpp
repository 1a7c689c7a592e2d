#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_protocol.hpp>
#include <resparse/protocol/xml_body_decoder.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// QueryProtocol — form-encoded requests, XML responses.
//
// Success bodies look like:
//   <FooResponse>
//     <FooResult>...</FooResult>
//     <ResponseMetadata><RequestId>id</RequestId></ResponseMetadata>
//   </FooResponse>
// where the output shape's resultWrapper names the <FooResult> element.
// ---------------------------------------------------------------------------
class QueryProtocol : public IProtocol {
public:
    explicit QueryProtocol(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] std::string_view Name() const noexcept override { return "query"; }

    [[nodiscard]] DecodeResult DecodeSuccess(const HttpResponse& response,
                                             const Shape* shape) const override;
    [[nodiscard]] DecodeResult DecodeError(const HttpResponse& response,
                                           const Shape* shape) const override;

protected:
    /// The <ResponseMetadata> block's children as text, else a top-level
    /// <RequestId>; nullopt when the body carries neither.
    [[nodiscard]] virtual std::optional<nlohmann::json> ExtractResponseMetadata(
        const XmlTagIndex& root_index) const;

    /// Leaf-collapsed error document with a top-level RequestId promoted
    /// into ResponseMetadata.
    [[nodiscard]] DecodeResult CollapseErrorBody(const HttpResponse& response) const;

    XmlBodyDecoder xml_;
};

} // namespace resparse
