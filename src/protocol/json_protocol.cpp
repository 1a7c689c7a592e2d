#include <resparse/protocol/json_protocol.hpp>

#include "protocol_utils.hpp"

#include <utility>

namespace resparse {

namespace {

void InjectRequestId(const HttpHeaders& headers, nlohmann::json& parsed) {
    if (auto id = FindHeaderValueCi(headers, "x-amzn-requestid")) {
        parsed["ResponseMetadata"] = nlohmann::json{{"RequestId", *id}};
    }
}

std::string StringMember(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // anonymous namespace

JsonProtocol::JsonProtocol(TimestampParser timestamp_parser)
    : json_(std::move(timestamp_parser)) {}

DecodeResult JsonProtocol::DecodeSuccess(const HttpResponse& response,
                                         const Shape* shape) const {
    auto parsed = nlohmann::json::object();
    if (shape != nullptr) {
        auto decoded = json_.DecodeBody(*shape, response.body);
        if (decoded.IsErr()) {
            auto error = std::move(decoded).Error();
            error.protocol = std::string(Name());
            return DecodeResult::Err(std::move(error));
        }
        parsed = std::move(decoded).Value();
    }
    InjectRequestId(response.headers, parsed);
    return DecodeResult::Ok(std::move(parsed));
}

DecodeResult JsonProtocol::DecodeError(const HttpResponse& response, const Shape*) const {
    auto body = JsonBodyDecoder::ParseBody(response.body, "JsonProtocol::DecodeError");
    if (body.IsErr()) {
        auto error = std::move(body).Error();
        error.protocol = std::string(Name());
        error.http_status = response.status_code;
        return DecodeResult::Err(std::move(error));
    }
    const auto& document = body.Value();
    if (!document.is_object()) {
        return DecodeResult::Err(protocol_utils::DecodeFailure(
            "JsonProtocol::DecodeError", Name(),
            std::string("error body is a JSON ") + document.type_name() + ", not an object"));
    }

    // Services disagree on the casing of the message key.
    const std::string message = document.contains("message")
                                    ? StringMember(document, "message")
                                    : StringMember(document, "Message");
    const std::string code = protocol_utils::StripTypeNamespace(StringMember(document, "__type"));

    auto parsed = nlohmann::json::object();
    parsed["Error"] = nlohmann::json{{"Code", code}, {"Message", message}};
    InjectRequestId(response.headers, parsed);
    return DecodeResult::Ok(std::move(parsed));
}

} // namespace resparse
