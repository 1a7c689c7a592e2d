#include <resparse/model/shape.hpp>

#include <utility>

namespace resparse {

namespace {

struct KindName {
    ShapeKind kind;
    std::string_view name;
};

constexpr KindName kKindNames[] = {
    {ShapeKind::Structure, "structure"},
    {ShapeKind::List, "list"},
    {ShapeKind::Map, "map"},
    {ShapeKind::String, "string"},
    {ShapeKind::Character, "character"},
    {ShapeKind::Boolean, "boolean"},
    {ShapeKind::Integer, "integer"},
    {ShapeKind::Long, "long"},
    {ShapeKind::Float, "float"},
    {ShapeKind::Double, "double"},
    {ShapeKind::Blob, "blob"},
    {ShapeKind::Timestamp, "timestamp"},
};

} // anonymous namespace

std::optional<ShapeKind> ShapeKindFromString(std::string_view name) {
    for (const auto& entry : kKindNames) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::string_view ShapeKindName(ShapeKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<Location> LocationFromString(std::string_view name) {
    if (name == "statusCode") return Location::StatusCode;
    if (name == "header") return Location::Header;
    if (name == "headers") return Location::Headers;
    return std::nullopt;
}

std::string_view LocationName(Location location) {
    switch (location) {
        case Location::StatusCode: return "statusCode";
        case Location::Header:     return "header";
        case Location::Headers:    return "headers";
    }
    return "unknown";
}

const Shape* Shape::FindMember(std::string_view member_name) const {
    for (const auto& m : members) {
        if (m.name == member_name) {
            return m.shape;
        }
    }
    return nullptr;
}

bool Shape::IsScalar() const noexcept {
    return kind != ShapeKind::Structure && kind != ShapeKind::List &&
           kind != ShapeKind::Map;
}

// ---------------------------------------------------------------------------
// ShapeArena
// ---------------------------------------------------------------------------

Shape& ShapeArena::Add(Shape shape) {
    shapes_.push_back(std::make_unique<Shape>(std::move(shape)));
    return *shapes_.back();
}

const Shape& ShapeArena::Scalar(ShapeKind kind, Serialization serialization) {
    Shape shape;
    shape.kind = kind;
    shape.serialization = std::move(serialization);
    return Add(std::move(shape));
}

const Shape& ShapeArena::List(const Shape& member, Serialization serialization) {
    Shape shape;
    shape.kind = ShapeKind::List;
    shape.serialization = std::move(serialization);
    shape.member = &member;
    return Add(std::move(shape));
}

const Shape& ShapeArena::Map(const Shape& key, const Shape& value,
                             Serialization serialization) {
    Shape shape;
    shape.kind = ShapeKind::Map;
    shape.serialization = std::move(serialization);
    shape.key = &key;
    shape.value = &value;
    return Add(std::move(shape));
}

const Shape& ShapeArena::Structure(std::vector<ShapeMember> members,
                                   Serialization serialization) {
    Shape shape;
    shape.kind = ShapeKind::Structure;
    shape.serialization = std::move(serialization);
    shape.members = std::move(members);
    return Add(std::move(shape));
}

} // namespace resparse
