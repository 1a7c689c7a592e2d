#include <resparse/protocol/rest_xml_protocol.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

namespace {

constexpr const char* kComponent = "RestXmlProtocol";

} // anonymous namespace

RestXmlProtocol::RestXmlProtocol(TimestampParser timestamp_parser)
    : xml_(timestamp_parser), rest_(xml_, timestamp_parser) {}

DecodeResult RestXmlProtocol::DecodeSuccess(const HttpResponse& response,
                                            const Shape* shape) const {
    auto parsed = nlohmann::json::object();
    if (shape != nullptr) {
        auto decoded = rest_.Decode(response, *shape);
        if (decoded.IsErr()) {
            auto error = std::move(decoded).Error();
            error.protocol = std::string(Name());
            return DecodeResult::Err(std::move(error));
        }
        parsed = std::move(decoded).Value();
    }
    parsed["ResponseMetadata"] = ResponseMetadataFromHeaders(response.headers);
    return DecodeResult::Ok(std::move(parsed));
}

DecodeResult RestXmlProtocol::DecodeError(const HttpResponse& response, const Shape*) const {
    if (response.body.empty()) {
        return DecodeResult::Ok(ErrorFromHttpStatus(response));
    }
    return ErrorFromBody(response);
}

nlohmann::json RestXmlProtocol::ErrorFromHttpStatus(const HttpResponse& response) {
    auto parsed = nlohmann::json::object();
    parsed["Error"] = nlohmann::json{
        {"Code", std::to_string(response.status_code)},
        {"Message", std::string(ReasonPhrase(response.status_code))}};
    parsed["ResponseMetadata"] = nlohmann::json{
        {"RequestId", FindHeaderValueCi(response.headers, "x-amz-request-id").value_or("")},
        {"HostId", FindHeaderValueCi(response.headers, "x-amz-id-2").value_or("")}};
    return parsed;
}

DecodeResult RestXmlProtocol::ErrorFromBody(const HttpResponse& response) const {
    tinyxml2::XMLDocument doc;
    auto root = XmlBodyDecoder::ParseDocument(doc, response.body, "RestXmlProtocol::DecodeError");
    if (root.IsErr()) {
        auto error = std::move(root).Error();
        error.protocol = std::string(Name());
        error.http_status = response.status_code;
        return DecodeResult::Err(std::move(error));
    }
    if (root.Value() == nullptr) {
        // Whitespace only.
        return DecodeResult::Ok(ErrorFromHttpStatus(response));
    }

    auto parsed = XmlBodyDecoder::CollapseLeaves(XmlBodyDecoder::BuildTagIndex(root.Value()));
    if (XmlBodyDecoder::LocalName(root.Value()->Name()) == "Error") {
        // Bare <Error> root: the ids it repeats are already in the headers.
        parsed.erase("RequestId");
        parsed.erase("HostId");
        LogDebug(kComponent, "bare <Error> root; metadata taken from headers");
        auto result = nlohmann::json::object();
        result["Error"] = std::move(parsed);
        result["ResponseMetadata"] = ResponseMetadataFromHeaders(response.headers);
        return DecodeResult::Ok(std::move(result));
    }
    protocol_utils::PromoteToMetadata(parsed, "RequestId", "RequestId");
    return DecodeResult::Ok(std::move(parsed));
}

} // namespace resparse
