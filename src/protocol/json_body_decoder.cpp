#include <resparse/protocol/json_body_decoder.hpp>

#include "protocol_utils.hpp"

#include <utility>

namespace resparse {

using protocol_utils::DecodeFailure;

namespace {

Error TypeMismatch(std::string_view operation, const Shape& shape,
                   const char* expected, const nlohmann::json& node) {
    std::string message = std::string("expected JSON ") + expected + " for " +
                          std::string(ShapeKindName(shape.kind));
    if (!shape.name.empty()) {
        message += " '" + shape.name + "'";
    }
    message += ", got " + std::string(node.type_name());
    return DecodeFailure(operation, "", std::move(message));
}

} // anonymous namespace

JsonBodyDecoder::JsonBodyDecoder(TimestampParser timestamp_parser)
    : timestamp_parser_(std::move(timestamp_parser)) {}

Result<nlohmann::json, Error> JsonBodyDecoder::ParseBody(std::string_view body,
                                                         std::string_view operation) {
    if (protocol_utils::IsBlank(body)) {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::object());
    }
    try {
        return Result<nlohmann::json, Error>::Ok(
            nlohmann::json::parse(body.begin(), body.end()));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            protocol_utils::MalformedBody(operation, "", "JSON parse error", e.what()));
    }
}

DecodeResult JsonBodyDecoder::DecodeBody(const Shape& shape, std::string_view body) const {
    auto parsed = ParseBody(body, "JsonBodyDecoder::DecodeBody");
    if (parsed.IsErr()) {
        return parsed;
    }
    return Decode(shape, parsed.Value());
}

DecodeResult JsonBodyDecoder::DecodeStructure(const Shape& shape,
                                              const nlohmann::json& node) const {
    if (!node.is_object()) {
        return DecodeResult::Err(
            TypeMismatch("JsonBodyDecoder::DecodeStructure", shape, "object", node));
    }
    auto parsed = nlohmann::json::object();
    for (const auto& member : shape.members) {
        if (member.shape == nullptr) {
            return DecodeResult::Err(DecodeFailure(
                "JsonBodyDecoder::DecodeStructure", "",
                "member '" + member.name + "' has no shape"));
        }
        // Header and status-code members are filled by the REST extractor.
        if (member.shape->serialization.location.has_value()) {
            continue;
        }
        const std::string json_name =
            member.shape->serialization.name.value_or(member.name);
        auto it = node.find(json_name);
        if (it == node.end() || it->is_null()) {
            continue;
        }
        auto value = Decode(*member.shape, *it);
        if (value.IsErr()) {
            return value;
        }
        parsed[member.name] = std::move(value).Value();
    }
    return DecodeResult::Ok(std::move(parsed));
}

Result<void, Error> JsonBodyDecoder::ForEachListItem(const Shape& shape,
                                                     const nlohmann::json& node,
                                                     const ItemVisitor& visit) const {
    if (!node.is_array()) {
        return Result<void, Error>::Err(
            TypeMismatch("JsonBodyDecoder::DecodeList", shape, "array", node));
    }
    for (const auto& item : node) {
        auto visited = visit(item);
        if (visited.IsErr()) {
            return visited;
        }
    }
    return Result<void, Error>::Ok();
}

DecodeResult JsonBodyDecoder::DecodeMap(const Shape& shape, const nlohmann::json& node) const {
    if (shape.key == nullptr || shape.value == nullptr) {
        return DecodeResult::Err(DecodeFailure(
            "JsonBodyDecoder::DecodeMap", "",
            "map shape '" + shape.name + "' needs key and value shapes"));
    }
    if (!node.is_object()) {
        return DecodeResult::Err(
            TypeMismatch("JsonBodyDecoder::DecodeMap", shape, "object", node));
    }

    auto parsed = nlohmann::json::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
        // Keys go through the key shape too; they are not assumed valid.
        auto key = Decode(*shape.key, nlohmann::json(it.key()));
        if (key.IsErr()) {
            return key;
        }
        auto value = Decode(*shape.value, it.value());
        if (value.IsErr()) {
            return value;
        }
        const auto& decoded_key = key.Value();
        const std::string key_text =
            decoded_key.is_string() ? decoded_key.get<std::string>() : decoded_key.dump();
        parsed[key_text] = std::move(value).Value();
    }
    return DecodeResult::Ok(std::move(parsed));
}

DecodeResult JsonBodyDecoder::DecodeBlob(const Shape& shape, const nlohmann::json& node) const {
    if (!node.is_string()) {
        return DecodeResult::Err(
            TypeMismatch("JsonBodyDecoder::DecodeBlob", shape, "string", node));
    }
    return protocol_utils::DecodeBase64Blob(node.get_ref<const std::string&>());
}

DecodeResult JsonBodyDecoder::DecodeTimestamp(const Shape&, const nlohmann::json& node) const {
    return timestamp_parser_(node);
}

DecodeResult JsonBodyDecoder::DecodeDefault(const Shape&, const nlohmann::json& node) const {
    return DecodeResult::Ok(node);
}

} // namespace resparse
