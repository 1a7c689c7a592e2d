#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_body_decoder.hpp>
#include <resparse/protocol/shape_decoder.hpp>

#include <tinyxml2.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace resparse {

// ---------------------------------------------------------------------------
// XmlNode — what a tag lookup yields: one element, or the ordered sequence
// of same-named siblings. A flattened list with one occurrence is therefore
// a single element here; the list decoder normalizes it.
// An XmlNode without elements stands for an empty body.
// ---------------------------------------------------------------------------
struct XmlNode {
    std::vector<const tinyxml2::XMLElement*> elements;
    bool sequence = false;

    [[nodiscard]] static XmlNode Single(const tinyxml2::XMLElement* element) {
        XmlNode node;
        if (element != nullptr) {
            node.elements.push_back(element);
        }
        return node;
    }

    [[nodiscard]] const tinyxml2::XMLElement* Element() const noexcept {
        return elements.empty() ? nullptr : elements.front();
    }
};

/// Immediate children of an element, grouped by local tag name.
using XmlTagIndex = std::map<std::string, XmlNode>;

// ---------------------------------------------------------------------------
// XmlBodyDecoder — shape-driven decoding of tinyxml2 element trees.
// ---------------------------------------------------------------------------
class XmlBodyDecoder : public ShapeDecoder<XmlNode>, public IBodyDecoder {
public:
    explicit XmlBodyDecoder(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] DecodeResult DecodeBody(const Shape& shape,
                                          std::string_view body) const override;

    [[nodiscard]] std::string_view Format() const noexcept override { return "xml"; }

    // -- Document helpers shared by the XML protocols ------------------------

    /// Parse `body` into `doc`. Returns the root element, or nullptr when the
    /// body is blank. Tokenizer failures are MalformedBody errors.
    [[nodiscard]] static Result<const tinyxml2::XMLElement*, Error> ParseDocument(
        tinyxml2::XMLDocument& doc, std::string_view body, std::string_view operation);

    /// Tag name with any namespace qualification removed:
    /// "{http://ns}Foo" -> "Foo", "ns:Foo" -> "Foo".
    [[nodiscard]] static std::string LocalName(std::string_view tag);

    [[nodiscard]] static XmlTagIndex BuildTagIndex(const tinyxml2::XMLElement* parent);

    /// Replace every indexed node by a nested object when it has child
    /// elements, else by its text. Repeated tags collapse to arrays.
    [[nodiscard]] static nlohmann::json CollapseLeaves(const XmlTagIndex& index);

    /// Text content of an element; empty when absent.
    [[nodiscard]] static std::string Text(const tinyxml2::XMLElement* element);

    /// Effective XML name of a structure member.
    [[nodiscard]] static std::string MemberXmlName(const ShapeMember& member);

protected:
    Result<void, Error> ForEachListItem(const Shape& shape, const XmlNode& node,
                                        const ItemVisitor& visit) const override;

    DecodeResult DecodeDefault(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeStructure(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeMap(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeBoolean(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeInteger(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeFloat(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeString(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeBlob(const Shape& shape, const XmlNode& node) const override;
    DecodeResult DecodeTimestamp(const Shape& shape, const XmlNode& node) const override;

private:
    Result<void, Error> DecodeMapEntry(const Shape& shape,
                                       const tinyxml2::XMLElement* entry,
                                       nlohmann::json& parsed) const;

    TimestampParser timestamp_parser_;
};

} // namespace resparse
