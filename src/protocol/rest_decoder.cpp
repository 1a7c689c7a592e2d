#include <resparse/protocol/rest_decoder.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

using protocol_utils::DecodeFailure;

namespace {

constexpr const char* kComponent = "RestDecoder";

} // anonymous namespace

nlohmann::json ResponseMetadataFromHeaders(const HttpHeaders& headers) {
    auto metadata = nlohmann::json::object();
    if (auto id = FindHeaderValueCi(headers, "x-amzn-requestid")) {
        metadata["RequestId"] = *id;
    } else if (auto legacy_id = FindHeaderValueCi(headers, "x-amz-request-id")) {
        metadata["RequestId"] = *legacy_id;
        // The XML error bodies call this value HostId; keep the same name.
        metadata["HostId"] = FindHeaderValueCi(headers, "x-amz-id-2").value_or("");
    }
    return metadata;
}

RestDecoder::RestDecoder(const IBodyDecoder& body_decoder, TimestampParser timestamp_parser)
    : body_decoder_(body_decoder), timestamp_parser_(std::move(timestamp_parser)) {}

DecodeResult RestDecoder::Decode(const HttpResponse& response, const Shape& shape) const {
    auto parsed = nlohmann::json::object();

    auto attributes = DecodeNonPayloadAttributes(response, shape, parsed);
    if (attributes.IsErr()) {
        return DecodeResult::Err(std::move(attributes).Error());
    }
    auto payload = DecodePayload(response, shape, parsed);
    if (payload.IsErr()) {
        return DecodeResult::Err(std::move(payload).Error());
    }
    return DecodeResult::Ok(std::move(parsed));
}

Result<void, Error> RestDecoder::DecodeNonPayloadAttributes(const HttpResponse& response,
                                                            const Shape& shape,
                                                            nlohmann::json& parsed) const {
    for (const auto& member : shape.members) {
        if (member.shape == nullptr || !member.shape->serialization.location.has_value()) {
            continue;
        }
        const Shape& member_shape = *member.shape;
        const Location location = *member_shape.serialization.location;
        if (location == Location::Header && !member_shape.IsScalar()) {
            return Result<void, Error>::Err(DecodeFailure(
                "RestDecoder::DecodeNonPayloadAttributes", body_decoder_.Format(),
                "member '" + member.name + "' bound to " +
                    std::string(LocationName(location)) + " must be a scalar, got " +
                    std::string(ShapeKindName(member_shape.kind))));
        }
        switch (location) {
            case Location::StatusCode:
                parsed[member.name] = response.status_code;
                break;
            case Location::Headers:
                parsed[member.name] = DecodeHeaderMap(member_shape, response.headers);
                break;
            case Location::Header: {
                const std::string header_name =
                    member_shape.serialization.name.value_or(member.name);
                auto it = response.headers.find(header_name);
                if (it == response.headers.end()) {
                    break;
                }
                auto value = DecodeHeaderValue(member_shape, it->second);
                if (value.IsErr()) {
                    return Result<void, Error>::Err(std::move(value).Error());
                }
                parsed[member.name] = std::move(value).Value();
                break;
            }
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RestDecoder::DecodePayload(const HttpResponse& response,
                                               const Shape& shape,
                                               nlohmann::json& parsed) const {
    const auto& payload_name = shape.serialization.payload;
    if (!payload_name.has_value()) {
        // No payload member: the whole body maps onto the whole shape.
        auto body = body_decoder_.DecodeBody(shape, response.body);
        if (body.IsErr()) {
            return Result<void, Error>::Err(std::move(body).Error());
        }
        for (const auto& [key, value] : body.Value().items()) {
            parsed[key] = value;
        }
        return Result<void, Error>::Ok();
    }

    const Shape* payload_shape = shape.FindMember(*payload_name);
    if (payload_shape == nullptr) {
        return Result<void, Error>::Err(DecodeFailure(
            "RestDecoder::DecodePayload", body_decoder_.Format(),
            "payload member '" + *payload_name + "' is not declared"));
    }

    switch (payload_shape->kind) {
        case ShapeKind::Blob:
            // Streaming payload: raw bytes, never interpreted as text.
            parsed[*payload_name] = nlohmann::json::binary(
                Bytes(response.body.begin(), response.body.end()));
            break;
        case ShapeKind::String:
            parsed[*payload_name] = response.body;
            break;
        default: {
            auto body = body_decoder_.DecodeBody(*payload_shape, response.body);
            if (body.IsErr()) {
                return Result<void, Error>::Err(std::move(body).Error());
            }
            parsed[*payload_name] = std::move(body).Value();
            break;
        }
    }
    LogDebug(kComponent, "payload member '" + *payload_name + "' decoded as " +
                             std::string(ShapeKindName(payload_shape->kind)));
    return Result<void, Error>::Ok();
}

DecodeResult RestDecoder::DecodeHeaderValue(const Shape& shape,
                                            const std::string& value) const {
    switch (shape.kind) {
        case ShapeKind::Integer:
        case ShapeKind::Long:
            return protocol_utils::ParseInteger(value, "RestDecoder::DecodeHeaderValue");
        case ShapeKind::Float:
        case ShapeKind::Double:
            return protocol_utils::ParseFloat(value, "RestDecoder::DecodeHeaderValue");
        case ShapeKind::Boolean:
            return DecodeResult::Ok(value == "true");
        case ShapeKind::Timestamp:
            return timestamp_parser_(nlohmann::json(value));
        case ShapeKind::Blob:
            return DecodeResult::Ok(nlohmann::json::binary(Bytes(value.begin(), value.end())));
        default:
            return DecodeResult::Ok(value);
    }
}

nlohmann::json RestDecoder::DecodeHeaderMap(const Shape& shape, const HttpHeaders& headers) {
    auto parsed = nlohmann::json::object();
    const std::string prefix = shape.serialization.name.value_or("");
    for (const auto& [name, value] : headers) {
        if (IStartsWith(name, prefix)) {
            parsed[name.substr(prefix.size())] = value;
        }
    }
    return parsed;
}

} // namespace resparse
