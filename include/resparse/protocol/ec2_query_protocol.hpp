#pragma once

#include <resparse/protocol/query_protocol.hpp>

namespace resparse {

// ---------------------------------------------------------------------------
// Ec2QueryProtocol — the EC2 flavor of the query protocol.
//
// Success metadata is a lowercase top-level <requestId>. Errors arrive as
//   <Response>
//     <Errors><Error><Code/><Message/></Error></Errors>
//     <RequestID>id</RequestID>
//   </Response>
// Only the first <Error> under <Errors> is reported.
// ---------------------------------------------------------------------------
class Ec2QueryProtocol : public QueryProtocol {
public:
    explicit Ec2QueryProtocol(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] std::string_view Name() const noexcept override { return "ec2"; }

    [[nodiscard]] DecodeResult DecodeError(const HttpResponse& response,
                                           const Shape* shape) const override;

protected:
    [[nodiscard]] std::optional<nlohmann::json> ExtractResponseMetadata(
        const XmlTagIndex& root_index) const override;
};

} // namespace resparse
