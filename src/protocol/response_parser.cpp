#include <resparse/protocol/response_parser.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

namespace {

constexpr const char* kComponent = "ResponseParser";

void EnsureResponseMetadata(nlohmann::json& parsed) {
    auto& metadata = parsed["ResponseMetadata"];
    if (!metadata.is_object()) {
        metadata = nlohmann::json::object();
    }
    if (!metadata.contains("RequestId")) {
        metadata["RequestId"] = "";
    }
}

} // anonymous namespace

ResponseParser::ResponseParser(std::unique_ptr<IProtocol> protocol)
    : protocol_(std::move(protocol)) {}

DecodeResult ResponseParser::Parse(const HttpResponse& response, const Shape* shape) const {
    if (shape != nullptr && shape->kind != ShapeKind::Structure) {
        return DecodeResult::Err(protocol_utils::DecodeFailure(
            "ResponseParser::Parse", Protocol(),
            "output shape '" + shape->name + "' is a " +
                std::string(ShapeKindName(shape->kind)) + ", not a structure"));
    }

    const bool is_error = response.status_code >= kFirstErrorStatus;
    LogDebug(kComponent, std::string(Protocol()) + ": status " +
                             std::to_string(response.status_code) + ", " +
                             std::to_string(response.body.size()) + " body bytes, " +
                             (is_error ? "error path" : "success path"));

    auto decoded = is_error ? protocol_->DecodeError(response, shape)
                            : protocol_->DecodeSuccess(response, shape);
    if (decoded.IsErr()) {
        auto error = std::move(decoded).Error();
        if (error.protocol.empty()) {
            error.protocol = std::string(Protocol());
        }
        if (!error.http_status.has_value()) {
            error.http_status = response.status_code;
        }
        LogDebug(kComponent, error.ToString());
        return DecodeResult::Err(std::move(error));
    }

    auto parsed = std::move(decoded).Value();
    if (!parsed.is_object()) {
        return DecodeResult::Err(protocol_utils::DecodeFailure(
            "ResponseParser::Parse", Protocol(),
            std::string("decoded document is a JSON ") + parsed.type_name() + ", not an object"));
    }
    return is_error ? NormalizeError(response, std::move(parsed))
                    : NormalizeSuccess(std::move(parsed));
}

DecodeResult ResponseParser::NormalizeSuccess(nlohmann::json parsed) const {
    EnsureResponseMetadata(parsed);
    return DecodeResult::Ok(std::move(parsed));
}

DecodeResult ResponseParser::NormalizeError(const HttpResponse& response,
                                            nlohmann::json parsed) const {
    nlohmann::json error;
    if (auto it = parsed.find("Error"); it != parsed.end() && it->is_object()) {
        error = std::move(*it);
    } else {
        LogDebug(kComponent, "no Error element in body; describing status " +
                                 std::to_string(response.status_code));
        error = nlohmann::json{
            {"Code", std::to_string(response.status_code)},
            {"Message", std::string(ReasonPhrase(response.status_code))}};
    }
    if (!error.contains("Code")) {
        error["Code"] = "";
    }
    if (!error.contains("Message")) {
        error["Message"] = "";
    }

    auto normalized = nlohmann::json::object();
    normalized["Error"] = std::move(error);
    if (auto it = parsed.find("ResponseMetadata"); it != parsed.end()) {
        normalized["ResponseMetadata"] = std::move(*it);
    }
    EnsureResponseMetadata(normalized);
    return DecodeResult::Ok(std::move(normalized));
}

} // namespace resparse
