#include <resparse/protocol/query_protocol.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

using protocol_utils::DecodeFailure;

namespace {

constexpr const char* kComponent = "QueryProtocol";

} // anonymous namespace

QueryProtocol::QueryProtocol(TimestampParser timestamp_parser)
    : xml_(std::move(timestamp_parser)) {}

DecodeResult QueryProtocol::DecodeSuccess(const HttpResponse& response,
                                          const Shape* shape) const {
    tinyxml2::XMLDocument doc;
    auto root = XmlBodyDecoder::ParseDocument(doc, response.body, "QueryProtocol::DecodeSuccess");
    if (root.IsErr()) {
        auto error = std::move(root).Error();
        error.protocol = std::string(Name());
        return DecodeResult::Err(std::move(error));
    }
    const XmlTagIndex root_index = XmlBodyDecoder::BuildTagIndex(root.Value());

    auto parsed = nlohmann::json::object();
    if (shape != nullptr) {
        XmlNode start = XmlNode::Single(root.Value());
        const auto& wrapper = shape->serialization.result_wrapper;
        if (wrapper.has_value() && root.Value() != nullptr) {
            auto it = root_index.find(*wrapper);
            if (it == root_index.end()) {
                return DecodeResult::Err(DecodeFailure(
                    "QueryProtocol::DecodeSuccess", Name(),
                    "result wrapper element <" + *wrapper + "> not found"));
            }
            start = it->second;
        }
        auto decoded = xml_.Decode(*shape, start);
        if (decoded.IsErr()) {
            auto error = std::move(decoded).Error();
            error.protocol = std::string(Name());
            return DecodeResult::Err(std::move(error));
        }
        parsed = std::move(decoded).Value();
    }

    if (auto metadata = ExtractResponseMetadata(root_index)) {
        parsed["ResponseMetadata"] = std::move(*metadata);
    }
    return DecodeResult::Ok(std::move(parsed));
}

DecodeResult QueryProtocol::DecodeError(const HttpResponse& response, const Shape*) const {
    return CollapseErrorBody(response);
}

std::optional<nlohmann::json> QueryProtocol::ExtractResponseMetadata(
    const XmlTagIndex& root_index) const {
    auto it = root_index.find("ResponseMetadata");
    if (it == root_index.end()) {
        if (auto id = root_index.find("RequestId"); id != root_index.end()) {
            return nlohmann::json{{"RequestId", XmlBodyDecoder::Text(id->second.Element())}};
        }
        return std::nullopt;
    }
    auto metadata = nlohmann::json::object();
    for (const auto& [tag, node] : XmlBodyDecoder::BuildTagIndex(it->second.Element())) {
        metadata[tag] = XmlBodyDecoder::Text(node.Element());
    }
    return metadata;
}

DecodeResult QueryProtocol::CollapseErrorBody(const HttpResponse& response) const {
    tinyxml2::XMLDocument doc;
    auto root = XmlBodyDecoder::ParseDocument(doc, response.body, "QueryProtocol::DecodeError");
    if (root.IsErr()) {
        auto error = std::move(root).Error();
        error.protocol = std::string(Name());
        error.http_status = response.status_code;
        return DecodeResult::Err(std::move(error));
    }
    auto parsed = XmlBodyDecoder::CollapseLeaves(XmlBodyDecoder::BuildTagIndex(root.Value()));
    protocol_utils::PromoteToMetadata(parsed, "RequestId", "RequestId");
    LogDebug(kComponent, "error body collapsed for status " +
                             std::to_string(response.status_code));
    return DecodeResult::Ok(std::move(parsed));
}

} // namespace resparse
