#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resparse {

// ---------------------------------------------------------------------------
// ShapeKind — the closed set of value kinds a shape can describe.
// ---------------------------------------------------------------------------
enum class ShapeKind {
    Structure,
    List,
    Map,
    String,
    Character,
    Boolean,
    Integer,
    Long,
    Float,
    Double,
    Blob,
    Timestamp,
};

[[nodiscard]] std::optional<ShapeKind> ShapeKindFromString(std::string_view name);
[[nodiscard]] std::string_view ShapeKindName(ShapeKind kind);

// ---------------------------------------------------------------------------
// Location — where a non-body structure member is found in the response.
// ---------------------------------------------------------------------------
enum class Location {
    StatusCode,
    Header,
    Headers,   // every header with a given prefix
};

[[nodiscard]] std::optional<Location> LocationFromString(std::string_view name);
[[nodiscard]] std::string_view LocationName(Location location);

// ---------------------------------------------------------------------------
// Serialization — wire-encoding descriptor carried by every shape.
// `payload` and `result_wrapper` are only meaningful on an output shape.
// ---------------------------------------------------------------------------
struct Serialization {
    std::optional<std::string> name;
    std::optional<Location> location;
    bool flattened = false;
    std::optional<std::string> payload;
    std::optional<std::string> result_wrapper;
};

struct Shape;

struct ShapeMember {
    std::string name;
    const Shape* shape = nullptr;
};

// ---------------------------------------------------------------------------
// Shape — read-only structural descriptor of an expected value.
//
// Child pointers are non-owning; the ShapeArena that created the shape owns
// every node, so recursive shapes are plain pointer cycles.
// ---------------------------------------------------------------------------
struct Shape {
    ShapeKind kind = ShapeKind::String;
    std::string name;                   // model name, empty when anonymous
    Serialization serialization;
    std::vector<ShapeMember> members;   // Structure, in declaration order
    const Shape* member = nullptr;      // List
    const Shape* key = nullptr;         // Map
    const Shape* value = nullptr;       // Map

    [[nodiscard]] const Shape* FindMember(std::string_view member_name) const;
    [[nodiscard]] bool IsScalar() const noexcept;
};

// ---------------------------------------------------------------------------
// ShapeArena — owns shapes; addresses stay stable for the arena's lifetime.
// ---------------------------------------------------------------------------
class ShapeArena {
public:
    ShapeArena() = default;
    ShapeArena(const ShapeArena&) = delete;
    ShapeArena& operator=(const ShapeArena&) = delete;
    ShapeArena(ShapeArena&&) = default;
    ShapeArena& operator=(ShapeArena&&) = default;

    Shape& Add(Shape shape);

    const Shape& Scalar(ShapeKind kind, Serialization serialization = {});
    const Shape& List(const Shape& member, Serialization serialization = {});
    const Shape& Map(const Shape& key, const Shape& value,
                     Serialization serialization = {});
    const Shape& Structure(std::vector<ShapeMember> members,
                           Serialization serialization = {});

    [[nodiscard]] size_t Size() const noexcept { return shapes_.size(); }

private:
    std::vector<std::unique_ptr<Shape>> shapes_;
};

} // namespace resparse
