#include <catch2/catch_test_macros.hpp>

#include <resparse/model/shape_model.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace resparse;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/model
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

ShapeModel LoadQueryService() {
    auto model = ShapeModel::FromFile(TestDataPath("models/query_service.json"));
    REQUIRE(model.IsOk());
    return std::move(model).Value();
}

} // anonymous namespace

// ===========================================================================
// FromFile
// ===========================================================================

TEST_CASE("ShapeModel: loads protocol and operations", "[model]") {
    auto model = LoadQueryService();
    CHECK(model.Protocol() == "query");

    auto names = model.OperationNames();
    REQUIRE(names.size() == 3);
    CHECK(names[0] == "DeleteWidget");
    CHECK(names[1] == "DescribeWidgets");
    CHECK(names[2] == "GetTree");
}

TEST_CASE("ShapeModel: operation output carries the result wrapper", "[model]") {
    auto model = LoadQueryService();
    auto output = model.OutputShape("DescribeWidgets");
    REQUIRE(output.IsOk());
    REQUIRE(output.Value() != nullptr);
    CHECK(output.Value()->kind == ShapeKind::Structure);
    CHECK(output.Value()->serialization.result_wrapper == "DescribeWidgetsResult");

    // The wrapper belongs to the operation reference, not to the named shape.
    auto named = model.Resolve("DescribeWidgetsResult");
    REQUIRE(named.IsOk());
    CHECK_FALSE(named.Value()->serialization.result_wrapper.has_value());
}

TEST_CASE("ShapeModel: operation without output", "[model]") {
    auto model = LoadQueryService();
    auto output = model.OutputShape("DeleteWidget");
    REQUIRE(output.IsOk());
    CHECK(output.Value() == nullptr);
}

TEST_CASE("ShapeModel: unknown operation and shape", "[model]") {
    auto model = LoadQueryService();
    auto op = model.OutputShape("Nope");
    REQUIRE(op.IsErr());
    CHECK(op.Error().category == ErrorCategory::ShapeModel);
    CHECK(op.Error().message == "unknown operation 'Nope'");
    CHECK(op.Error().detail == "known operations: DeleteWidget, DescribeWidgets, GetTree");
    CHECK(model.Resolve("Nope").IsErr());
}

TEST_CASE("ShapeModel: member references apply serialization overrides", "[model]") {
    auto model = LoadQueryService();
    auto widget = model.Resolve("Widget");
    REQUIRE(widget.IsOk());

    const Shape* parts = widget.Value()->FindMember("Parts");
    REQUIRE(parts != nullptr);
    CHECK(parts->kind == ShapeKind::List);
    CHECK(parts->serialization.flattened);
    CHECK(parts->serialization.name == "Part");
    REQUIRE(parts->member != nullptr);
    CHECK(parts->member->serialization.name == "Part");

    const Shape* labels = widget.Value()->FindMember("Labels");
    REQUIRE(labels != nullptr);
    REQUIRE(labels->key != nullptr);
    CHECK(labels->key->serialization.name == "Name");
    CHECK(labels->value->serialization.name == "Value");
}

TEST_CASE("ShapeModel: members keep declaration order", "[model]") {
    auto model = LoadQueryService();
    auto widget = model.Resolve("Widget");
    REQUIRE(widget.IsOk());
    const auto& members = widget.Value()->members;
    REQUIRE(members.size() == 6);
    CHECK(members[0].name == "Name");
    CHECK(members[5].name == "Parts");
}

TEST_CASE("ShapeModel: recursive shapes resolve to a cycle", "[model]") {
    auto model = LoadQueryService();
    auto tree = model.OutputShape("GetTree");
    REQUIRE(tree.IsOk());
    const Shape* children = tree.Value()->FindMember("Children");
    REQUIRE(children != nullptr);
    CHECK(children->member == tree.Value());
}

TEST_CASE("ShapeModel: missing file is an Io error", "[model]") {
    auto model = ShapeModel::FromFile(TestDataPath("models/does_not_exist.json"));
    REQUIRE(model.IsErr());
    CHECK(model.Error().category == ErrorCategory::Io);
}

// ===========================================================================
// FromJson
// ===========================================================================

TEST_CASE("ShapeModel: REST locations and payload", "[model]") {
    auto document = nlohmann::ordered_json::parse(R"({
        "metadata": {"protocol": "rest-xml"},
        "operations": {"GetObject": {"output": {"shape": "GetObjectOutput"}}},
        "shapes": {
            "GetObjectOutput": {
                "type": "structure",
                "payload": "Body",
                "members": {
                    "Body": {"shape": "Blob"},
                    "ETag": {"shape": "String", "location": "header", "locationName": "ETag"},
                    "Metadata": {"shape": "Meta", "location": "headers", "locationName": "x-amz-meta-"},
                    "Status": {"shape": "Int", "location": "statusCode"},
                    "Key": {"shape": "String", "location": "uri", "locationName": "Key"}
                }
            },
            "Meta": {"type": "map", "key": {"shape": "String"}, "value": {"shape": "String"}},
            "Blob": {"type": "blob"},
            "String": {"type": "string"},
            "Int": {"type": "integer"}
        }
    })");
    auto model = ShapeModel::FromJson(document);
    REQUIRE(model.IsOk());
    auto output = model.Value().OutputShape("GetObject");
    REQUIRE(output.IsOk());
    const Shape& shape = *output.Value();

    CHECK(shape.serialization.payload == "Body");
    CHECK(shape.FindMember("ETag")->serialization.location == Location::Header);
    CHECK(shape.FindMember("Metadata")->serialization.location == Location::Headers);
    CHECK(shape.FindMember("Metadata")->serialization.name == "x-amz-meta-");
    CHECK(shape.FindMember("Status")->serialization.location == Location::StatusCode);
    // Request-only locations do not affect response decoding.
    CHECK_FALSE(shape.FindMember("Key")->serialization.location.has_value());
}

TEST_CASE("ShapeModel: invalid documents", "[model]") {
    SECTION("not an object") {
        CHECK(ShapeModel::FromJson(nlohmann::ordered_json::array()).IsErr());
    }
    SECTION("no shapes") {
        CHECK(ShapeModel::FromJson(nlohmann::ordered_json::parse(R"({"operations": {}})")).IsErr());
    }
    SECTION("dangling reference") {
        auto r = ShapeModel::FromJson(nlohmann::ordered_json::parse(R"({
            "shapes": {"A": {"type": "list", "member": {"shape": "Missing"}}}
        })"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Missing") != std::string::npos);
    }
    SECTION("unsupported type") {
        auto r = ShapeModel::FromJson(nlohmann::ordered_json::parse(R"({
            "shapes": {"U": {"type": "union", "members": {}}}
        })"));
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::ShapeModel);
    }
    SECTION("payload names an unknown member") {
        auto r = ShapeModel::FromJson(nlohmann::ordered_json::parse(R"({
            "shapes": {"S": {"type": "structure", "payload": "Body", "members": {}}}
        })"));
        CHECK(r.IsErr());
    }
    SECTION("list without member") {
        CHECK(ShapeModel::FromJson(nlohmann::ordered_json::parse(R"({
            "shapes": {"L": {"type": "list"}}
        })")).IsErr());
    }
}
