#include <resparse/protocol/rest_json_protocol.hpp>

#include "protocol_utils.hpp"

#include <utility>

namespace resparse {

namespace {

std::string StringMember(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // anonymous namespace

RestJsonProtocol::RestJsonProtocol(TimestampParser timestamp_parser)
    : json_(timestamp_parser), rest_(json_, timestamp_parser) {}

DecodeResult RestJsonProtocol::DecodeSuccess(const HttpResponse& response,
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

DecodeResult RestJsonProtocol::DecodeError(const HttpResponse& response, const Shape*) const {
    auto body = JsonBodyDecoder::ParseBody(response.body, "RestJsonProtocol::DecodeError");
    if (body.IsErr()) {
        auto error = std::move(body).Error();
        error.protocol = std::string(Name());
        error.http_status = response.status_code;
        return DecodeResult::Err(std::move(error));
    }
    const auto& document = body.Value();
    if (!document.is_object()) {
        return DecodeResult::Err(protocol_utils::DecodeFailure(
            "RestJsonProtocol::DecodeError", Name(),
            std::string("error body is a JSON ") + document.type_name() + ", not an object"));
    }

    auto error = nlohmann::json::object();
    error["Message"] = StringMember(document, "message");

    // "ValidationException:http://internal.amazon.com/..." -> "ValidationException"
    if (auto type = FindHeaderValueCi(response.headers, "x-amzn-errortype")) {
        error["Code"] = type->substr(0, type->find(':'));
    } else if (document.contains("code")) {
        error["Code"] = StringMember(document, "code");
    } else if (document.contains("__type")) {
        error["Code"] = protocol_utils::StripTypeNamespace(StringMember(document, "__type"));
    }

    auto parsed = nlohmann::json::object();
    parsed["Error"] = std::move(error);
    parsed["ResponseMetadata"] = ResponseMetadataFromHeaders(response.headers);
    return DecodeResult::Ok(std::move(parsed));
}

} // namespace resparse
