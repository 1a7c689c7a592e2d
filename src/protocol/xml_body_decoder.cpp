#include <resparse/protocol/xml_body_decoder.hpp>

#include "protocol_utils.hpp"

#include <resparse/core/log.hpp>

#include <utility>

namespace resparse {

using protocol_utils::DecodeFailure;

namespace {

constexpr const char* kComponent = "XmlBodyDecoder";

nlohmann::json CollapseElement(const tinyxml2::XMLElement* element) {
    if (element->FirstChildElement() != nullptr) {
        return XmlBodyDecoder::CollapseLeaves(XmlBodyDecoder::BuildTagIndex(element));
    }
    return XmlBodyDecoder::Text(element);
}

std::string KeyString(const nlohmann::json& decoded) {
    return decoded.is_string() ? decoded.get<std::string>() : decoded.dump();
}

} // anonymous namespace

XmlBodyDecoder::XmlBodyDecoder(TimestampParser timestamp_parser)
    : timestamp_parser_(std::move(timestamp_parser)) {}

// ---------------------------------------------------------------------------
// Document helpers
// ---------------------------------------------------------------------------

Result<const tinyxml2::XMLElement*, Error> XmlBodyDecoder::ParseDocument(
    tinyxml2::XMLDocument& doc, std::string_view body, std::string_view operation) {
    if (protocol_utils::IsBlank(body)) {
        return Result<const tinyxml2::XMLElement*, Error>::Ok(nullptr);
    }
    if (doc.Parse(body.data(), body.size()) != tinyxml2::XML_SUCCESS) {
        std::string detail;
        if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
            detail = err;
        }
        return Result<const tinyxml2::XMLElement*, Error>::Err(
            protocol_utils::MalformedBody(operation, "", "XML parse error",
                                          detail.empty() ? std::nullopt
                                                         : std::optional<std::string>(detail)));
    }
    const tinyxml2::XMLElement* root = doc.RootElement();
    if (root == nullptr) {
        return Result<const tinyxml2::XMLElement*, Error>::Err(
            protocol_utils::MalformedBody(operation, "", "XML document has no root element"));
    }
    return Result<const tinyxml2::XMLElement*, Error>::Ok(root);
}

std::string XmlBodyDecoder::LocalName(std::string_view tag) {
    if (const auto brace = tag.rfind('}'); brace != std::string_view::npos) {
        return std::string(tag.substr(brace + 1));
    }
    if (const auto colon = tag.find(':'); colon != std::string_view::npos) {
        return std::string(tag.substr(colon + 1));
    }
    return std::string(tag);
}

XmlTagIndex XmlBodyDecoder::BuildTagIndex(const tinyxml2::XMLElement* parent) {
    XmlTagIndex index;
    if (parent == nullptr) {
        return index;
    }
    for (auto* child = parent->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        auto [it, inserted] = index.try_emplace(LocalName(child->Name()));
        it->second.elements.push_back(child);
        if (!inserted) {
            // <foo>1</foo><foo>2</foo> -> one sequence node
            it->second.sequence = true;
        }
    }
    return index;
}

nlohmann::json XmlBodyDecoder::CollapseLeaves(const XmlTagIndex& index) {
    auto collapsed = nlohmann::json::object();
    for (const auto& [tag, node] : index) {
        if (node.sequence) {
            auto items = nlohmann::json::array();
            for (const auto* element : node.elements) {
                items.push_back(CollapseElement(element));
            }
            collapsed[tag] = std::move(items);
        } else {
            collapsed[tag] = CollapseElement(node.Element());
        }
    }
    return collapsed;
}

std::string XmlBodyDecoder::Text(const tinyxml2::XMLElement* element) {
    if (element == nullptr) {
        return {};
    }
    const char* text = element->GetText();
    return text ? text : "";
}

std::string XmlBodyDecoder::MemberXmlName(const ShapeMember& member) {
    const Shape& shape = *member.shape;
    // A flattened list has no wrapper element; its items carry the list
    // member's name directly under the parent.
    if (shape.kind == ShapeKind::List && shape.serialization.flattened &&
        shape.member != nullptr && shape.member->serialization.name.has_value()) {
        return *shape.member->serialization.name;
    }
    if (shape.serialization.name.has_value()) {
        return *shape.serialization.name;
    }
    return member.name;
}

// ---------------------------------------------------------------------------
// IBodyDecoder
// ---------------------------------------------------------------------------

DecodeResult XmlBodyDecoder::DecodeBody(const Shape& shape, std::string_view body) const {
    tinyxml2::XMLDocument doc;
    auto root = ParseDocument(doc, body, "XmlBodyDecoder::DecodeBody");
    if (root.IsErr()) {
        return DecodeResult::Err(std::move(root).Error());
    }
    return Decode(shape, XmlNode::Single(root.Value()));
}

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

DecodeResult XmlBodyDecoder::DecodeStructure(const Shape& shape, const XmlNode& node) const {
    auto parsed = nlohmann::json::object();
    const XmlTagIndex index = BuildTagIndex(node.Element());
    for (const auto& member : shape.members) {
        if (member.shape == nullptr) {
            return DecodeResult::Err(DecodeFailure(
                "XmlBodyDecoder::DecodeStructure", "",
                "member '" + member.name + "' has no shape"));
        }
        // Header and status-code members are filled by the REST extractor.
        if (member.shape->serialization.location.has_value()) {
            continue;
        }
        auto it = index.find(MemberXmlName(member));
        if (it == index.end()) {
            continue;
        }
        auto value = Decode(*member.shape, it->second);
        if (value.IsErr()) {
            return value;
        }
        parsed[member.name] = std::move(value).Value();
    }
    return DecodeResult::Ok(std::move(parsed));
}

Result<void, Error> XmlBodyDecoder::ForEachListItem(const Shape& shape,
                                                    const XmlNode& node,
                                                    const ItemVisitor& visit) const {
    if (node.sequence || shape.serialization.flattened) {
        // Flattened: every indexed occurrence is an item, including a lone one.
        for (const auto* element : node.elements) {
            auto visited = visit(XmlNode::Single(element));
            if (visited.IsErr()) {
                return visited;
            }
        }
        return Result<void, Error>::Ok();
    }

    const auto* wrapper = node.Element();
    if (wrapper == nullptr) {
        return Result<void, Error>::Ok();
    }
    for (auto* item = wrapper->FirstChildElement(); item;
         item = item->NextSiblingElement()) {
        auto visited = visit(XmlNode::Single(item));
        if (visited.IsErr()) {
            return visited;
        }
    }
    return Result<void, Error>::Ok();
}

DecodeResult XmlBodyDecoder::DecodeMap(const Shape& shape, const XmlNode& node) const {
    if (shape.key == nullptr || shape.value == nullptr) {
        return DecodeResult::Err(DecodeFailure(
            "XmlBodyDecoder::DecodeMap", "",
            "map shape '" + shape.name + "' needs key and value shapes"));
    }

    auto parsed = nlohmann::json::object();
    if (node.sequence || shape.serialization.flattened) {
        // Flattened map: the entries are the repeated siblings themselves.
        for (const auto* entry : node.elements) {
            auto decoded = DecodeMapEntry(shape, entry, parsed);
            if (decoded.IsErr()) {
                return DecodeResult::Err(std::move(decoded).Error());
            }
        }
        return DecodeResult::Ok(std::move(parsed));
    }

    const auto* wrapper = node.Element();
    if (wrapper == nullptr) {
        return DecodeResult::Ok(std::move(parsed));
    }
    for (auto* entry = wrapper->FirstChildElement(); entry;
         entry = entry->NextSiblingElement()) {
        auto decoded = DecodeMapEntry(shape, entry, parsed);
        if (decoded.IsErr()) {
            return DecodeResult::Err(std::move(decoded).Error());
        }
    }
    return DecodeResult::Ok(std::move(parsed));
}

Result<void, Error> XmlBodyDecoder::DecodeMapEntry(const Shape& shape,
                                                   const tinyxml2::XMLElement* entry,
                                                   nlohmann::json& parsed) const {
    constexpr const char* kOperation = "XmlBodyDecoder::DecodeMap";
    const std::string key_name = shape.key->serialization.name.value_or("key");
    const std::string value_name = shape.value->serialization.name.value_or("value");

    const tinyxml2::XMLElement* key_element = nullptr;
    const tinyxml2::XMLElement* value_element = nullptr;
    for (auto* child = entry->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        const std::string tag = LocalName(child->Name());
        const tinyxml2::XMLElement** slot = nullptr;
        if (tag == key_name) {
            slot = &key_element;
        } else if (tag == value_name) {
            slot = &value_element;
        } else {
            return Result<void, Error>::Err(
                DecodeFailure(kOperation, "", "Unknown tag: " + tag));
        }
        if (*slot != nullptr) {
            return Result<void, Error>::Err(
                DecodeFailure(kOperation, "", "Duplicate tag in map entry: " + tag));
        }
        *slot = child;
    }
    if (key_element == nullptr || value_element == nullptr) {
        return Result<void, Error>::Err(DecodeFailure(
            kOperation, "",
            "map entry <" + LocalName(entry->Name()) + "> needs <" + key_name +
                "> and <" + value_name + ">"));
    }

    auto key = Decode(*shape.key, XmlNode::Single(key_element));
    if (key.IsErr()) {
        return Result<void, Error>::Err(std::move(key).Error());
    }
    auto value = Decode(*shape.value, XmlNode::Single(value_element));
    if (value.IsErr()) {
        return Result<void, Error>::Err(std::move(value).Error());
    }

    const std::string key_text = KeyString(key.Value());
    if (parsed.contains(key_text)) {
        LogDebug(kComponent, "map key '" + key_text + "' repeated; last entry wins");
    }
    parsed[key_text] = std::move(value).Value();
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

DecodeResult XmlBodyDecoder::DecodeDefault(const Shape&, const XmlNode& node) const {
    return DecodeResult::Ok(Text(node.Element()));
}

DecodeResult XmlBodyDecoder::DecodeBoolean(const Shape&, const XmlNode& node) const {
    return DecodeResult::Ok(Text(node.Element()) == "true");
}

DecodeResult XmlBodyDecoder::DecodeInteger(const Shape&, const XmlNode& node) const {
    return protocol_utils::ParseInteger(Text(node.Element()),
                                        "XmlBodyDecoder::DecodeInteger");
}

DecodeResult XmlBodyDecoder::DecodeFloat(const Shape&, const XmlNode& node) const {
    return protocol_utils::ParseFloat(Text(node.Element()),
                                      "XmlBodyDecoder::DecodeFloat");
}

DecodeResult XmlBodyDecoder::DecodeString(const Shape&, const XmlNode& node) const {
    return DecodeResult::Ok(Text(node.Element()));
}

DecodeResult XmlBodyDecoder::DecodeBlob(const Shape&, const XmlNode& node) const {
    return protocol_utils::DecodeBase64Blob(Text(node.Element()));
}

DecodeResult XmlBodyDecoder::DecodeTimestamp(const Shape&, const XmlNode& node) const {
    return timestamp_parser_(nlohmann::json(Text(node.Element())));
}

} // namespace resparse
