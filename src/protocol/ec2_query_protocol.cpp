#include <resparse/protocol/ec2_query_protocol.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

namespace {

constexpr const char* kComponent = "Ec2QueryProtocol";

} // anonymous namespace

Ec2QueryProtocol::Ec2QueryProtocol(TimestampParser timestamp_parser)
    : QueryProtocol(std::move(timestamp_parser)) {}

DecodeResult Ec2QueryProtocol::DecodeError(const HttpResponse& response, const Shape*) const {
    auto collapsed = CollapseErrorBody(response);
    if (collapsed.IsErr()) {
        return collapsed;
    }
    auto parsed = std::move(collapsed).Value();

    // EC2 spells it RequestID.
    protocol_utils::PromoteToMetadata(parsed, "RequestID", "RequestId");

    auto errors = parsed.find("Errors");
    if (errors == parsed.end()) {
        return DecodeResult::Ok(std::move(parsed));
    }
    nlohmann::json error;
    if (errors->is_object()) {
        auto inner = errors->find("Error");
        if (inner != errors->end()) {
            if (inner->is_array()) {
                LogWarn(kComponent, std::to_string(inner->size()) +
                                        " <Error> elements in response; reporting the first");
                if (!inner->empty()) {
                    error = inner->front();
                }
            } else {
                error = *inner;
            }
        }
    }
    parsed.erase("Errors");
    if (!error.is_null()) {
        parsed["Error"] = std::move(error);
    }
    return DecodeResult::Ok(std::move(parsed));
}

std::optional<nlohmann::json> Ec2QueryProtocol::ExtractResponseMetadata(
    const XmlTagIndex& root_index) const {
    auto it = root_index.find("requestId");
    if (it == root_index.end()) {
        return std::nullopt;
    }
    return nlohmann::json{{"RequestId", XmlBodyDecoder::Text(it->second.Element())}};
}

} // namespace resparse
