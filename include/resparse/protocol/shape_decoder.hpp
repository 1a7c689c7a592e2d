#pragma once

#include <resparse/core/result.hpp>
#include <resparse/model/shape.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace resparse {

using DecodeResult = Result<nlohmann::json, Error>;

// ---------------------------------------------------------------------------
// ShapeDecoder<Node> — recursive-descent decoding of a body node against a
// shape.
//
// Decode() switches over the closed ShapeKind set; kinds that share a wire
// representation share one routine (Integer/Long, Float/Double,
// String/Character). Every routine defaults to DecodeDefault(), which body
// formats implement as passthrough. List decoding is common to all formats:
// the concrete decoder only isolates the items.
//
// Implementations hold no per-call state and are safe for concurrent use.
// ---------------------------------------------------------------------------
template <typename Node>
class ShapeDecoder {
public:
    virtual ~ShapeDecoder() = default;

    [[nodiscard]] DecodeResult Decode(const Shape& shape, const Node& node) const {
        switch (shape.kind) {
            case ShapeKind::Structure: return DecodeStructure(shape, node);
            case ShapeKind::List:      return DecodeList(shape, node);
            case ShapeKind::Map:       return DecodeMap(shape, node);
            case ShapeKind::Boolean:   return DecodeBoolean(shape, node);
            case ShapeKind::Integer:
            case ShapeKind::Long:      return DecodeInteger(shape, node);
            case ShapeKind::Float:
            case ShapeKind::Double:    return DecodeFloat(shape, node);
            case ShapeKind::String:
            case ShapeKind::Character: return DecodeString(shape, node);
            case ShapeKind::Blob:      return DecodeBlob(shape, node);
            case ShapeKind::Timestamp: return DecodeTimestamp(shape, node);
        }
        return DecodeDefault(shape, node);
    }

protected:
    ShapeDecoder() = default;
    ShapeDecoder(const ShapeDecoder&) = default;
    ShapeDecoder& operator=(const ShapeDecoder&) = default;

    using ItemVisitor = std::function<Result<void, Error>(const Node& item)>;

    /// Call `visit` for each list item isolated from `node`, in wire order.
    virtual Result<void, Error> ForEachListItem(const Shape& shape,
                                                const Node& node,
                                                const ItemVisitor& visit) const = 0;

    virtual DecodeResult DecodeDefault(const Shape& shape, const Node& node) const = 0;

    virtual DecodeResult DecodeStructure(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeMap(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeBoolean(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeInteger(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeFloat(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeString(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeBlob(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }
    virtual DecodeResult DecodeTimestamp(const Shape& shape, const Node& node) const {
        return DecodeDefault(shape, node);
    }

    virtual DecodeResult DecodeList(const Shape& shape, const Node& node) const {
        if (shape.member == nullptr) {
            return DecodeResult::Err(Error{
                "DecodeList", "", std::nullopt,
                "list shape '" + shape.name + "' has no member shape",
                std::nullopt, ErrorCategory::Decode});
        }
        auto parsed = nlohmann::json::array();
        auto visited = ForEachListItem(shape, node,
            [&](const Node& item) -> Result<void, Error> {
                auto value = Decode(*shape.member, item);
                if (value.IsErr()) {
                    return Result<void, Error>::Err(std::move(value).Error());
                }
                parsed.push_back(std::move(value).Value());
                return Result<void, Error>::Ok();
            });
        if (visited.IsErr()) {
            return DecodeResult::Err(std::move(visited).Error());
        }
        return DecodeResult::Ok(std::move(parsed));
    }
};

} // namespace resparse
