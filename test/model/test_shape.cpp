#include <catch2/catch_test_macros.hpp>

#include <resparse/model/shape.hpp>

#include "support/shape_builders.hpp"

using namespace resparse;
using namespace resparse::testing;

// ===========================================================================
// Kind and location names
// ===========================================================================

TEST_CASE("ShapeKindFromString: every model type name", "[shape]") {
    CHECK(ShapeKindFromString("structure") == ShapeKind::Structure);
    CHECK(ShapeKindFromString("list") == ShapeKind::List);
    CHECK(ShapeKindFromString("map") == ShapeKind::Map);
    CHECK(ShapeKindFromString("string") == ShapeKind::String);
    CHECK(ShapeKindFromString("character") == ShapeKind::Character);
    CHECK(ShapeKindFromString("boolean") == ShapeKind::Boolean);
    CHECK(ShapeKindFromString("integer") == ShapeKind::Integer);
    CHECK(ShapeKindFromString("long") == ShapeKind::Long);
    CHECK(ShapeKindFromString("float") == ShapeKind::Float);
    CHECK(ShapeKindFromString("double") == ShapeKind::Double);
    CHECK(ShapeKindFromString("blob") == ShapeKind::Blob);
    CHECK(ShapeKindFromString("timestamp") == ShapeKind::Timestamp);
}

TEST_CASE("ShapeKindFromString: unknown names", "[shape]") {
    CHECK_FALSE(ShapeKindFromString("Structure").has_value());
    CHECK_FALSE(ShapeKindFromString("union").has_value());
    CHECK_FALSE(ShapeKindFromString("").has_value());
}

TEST_CASE("ShapeKindName: inverse of ShapeKindFromString", "[shape]") {
    for (const char* name : {"structure", "list", "map", "string", "blob", "timestamp"}) {
        auto kind = ShapeKindFromString(name);
        REQUIRE(kind.has_value());
        CHECK(ShapeKindName(*kind) == name);
    }
}

TEST_CASE("LocationFromString: response locations only", "[shape]") {
    CHECK(LocationFromString("statusCode") == Location::StatusCode);
    CHECK(LocationFromString("header") == Location::Header);
    CHECK(LocationFromString("headers") == Location::Headers);
    CHECK_FALSE(LocationFromString("uri").has_value());
    CHECK(LocationName(Location::Headers) == "headers");
}

// ===========================================================================
// ShapeArena
// ===========================================================================

TEST_CASE("ShapeArena: builds linked shapes", "[shape]") {
    ShapeArena arena;
    const auto& str = arena.Scalar(ShapeKind::String);
    const auto& list = arena.List(str, Flattened("item"));
    const auto& map = arena.Map(str, arena.Scalar(ShapeKind::Integer));
    const auto& top = arena.Structure({{"Names", &list}, {"Counts", &map}});

    CHECK(arena.Size() == 5);
    CHECK(top.kind == ShapeKind::Structure);
    CHECK(top.FindMember("Names") == &list);
    CHECK(top.FindMember("Counts") == &map);
    CHECK(top.FindMember("Missing") == nullptr);
    CHECK(list.member == &str);
    CHECK(list.serialization.flattened);
    CHECK(list.serialization.name == "item");
    CHECK(map.key == &str);
    REQUIRE(map.value != nullptr);
    CHECK(map.value->kind == ShapeKind::Integer);
}

TEST_CASE("ShapeArena: addresses survive growth and moves", "[shape]") {
    ShapeArena arena;
    const Shape* first = &arena.Scalar(ShapeKind::Blob);
    for (int i = 0; i < 100; ++i) {
        (void)arena.Scalar(ShapeKind::String);
    }
    ShapeArena moved = std::move(arena);
    CHECK(moved.Size() == 101);
    CHECK(first->kind == ShapeKind::Blob);
}

TEST_CASE("ShapeArena: recursive structure through Add", "[shape]") {
    ShapeArena arena;
    Shape& node = arena.Add(Shape{ShapeKind::Structure, "Node", {}, {}, nullptr, nullptr, nullptr});
    const auto& children = arena.List(node);
    node.members.push_back({"Value", &arena.Scalar(ShapeKind::String)});
    node.members.push_back({"Children", &children});

    CHECK(node.FindMember("Children")->member == &node);
}

TEST_CASE("Shape: IsScalar", "[shape]") {
    ShapeArena arena;
    CHECK(arena.Scalar(ShapeKind::Timestamp).IsScalar());
    CHECK(arena.Scalar(ShapeKind::Boolean).IsScalar());
    CHECK_FALSE(arena.Structure({}).IsScalar());
    CHECK_FALSE(arena.List(arena.Scalar(ShapeKind::String)).IsScalar());
}
