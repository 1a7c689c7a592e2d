#include <catch2/catch_test_macros.hpp>

#include <resparse/protocol/xml_body_decoder.hpp>

#include "support/capture_sink.hpp"
#include "support/shape_builders.hpp"

#include <string>
#include <vector>

using namespace resparse;
using namespace resparse::testing;
using nlohmann::json;

namespace {

Bytes BinaryOf(const json& value) {
    const auto& bin = value.get_binary();
    return Bytes(bin.begin(), bin.end());
}

} // anonymous namespace

// ===========================================================================
// Structures and scalars
// ===========================================================================

TEST_CASE("XmlBodyDecoder: structure with scalar members", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({
        {"Name", &arena.Scalar(ShapeKind::String)},
        {"Count", &arena.Scalar(ShapeKind::Integer)},
        {"Total", &arena.Scalar(ShapeKind::Long)},
        {"Ratio", &arena.Scalar(ShapeKind::Double)},
        {"Enabled", &arena.Scalar(ShapeKind::Boolean)},
        {"Missing", &arena.Scalar(ShapeKind::String)},
    });

    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, R"(<Thing>
        <Name>widget</Name>
        <Count>3</Count>
        <Total>9007199254740993</Total>
        <Ratio>0.5</Ratio>
        <Enabled>true</Enabled>
    </Thing>)");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({
        "Name": "widget", "Count": 3, "Total": 9007199254740993,
        "Ratio": 0.5, "Enabled": true
    })"));
    CHECK_FALSE(r.Value().contains("Missing"));
}

TEST_CASE("XmlBodyDecoder: member locationName selects the element", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({
        {"InstanceId", &arena.Scalar(ShapeKind::String, Named("instanceId"))},
    });

    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><instanceId>i-1</instanceId></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"InstanceId", "i-1"}});
}

TEST_CASE("XmlBodyDecoder: boolean is true only for literal true", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Flag", &arena.Scalar(ShapeKind::Boolean)}});
    XmlBodyDecoder decoder;

    auto decode = [&](const std::string& body) {
        auto r = decoder.DecodeBody(shape, body);
        REQUIRE(r.IsOk());
        return r.Value()["Flag"].get<bool>();
    };
    CHECK(decode("<R><Flag>true</Flag></R>"));
    CHECK_FALSE(decode("<R><Flag>false</Flag></R>"));
    CHECK_FALSE(decode("<R><Flag></Flag></R>"));
    CHECK_FALSE(decode("<R><Flag>TRUE</Flag></R>"));
    CHECK_FALSE(decode("<R><Flag>1</Flag></R>"));
}

TEST_CASE("XmlBodyDecoder: empty string element decodes to empty string", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Marker", &arena.Scalar(ShapeKind::String)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><Marker/></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"Marker", ""}});
}

TEST_CASE("XmlBodyDecoder: invalid integer is a Decode error", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Count", &arena.Scalar(ShapeKind::Integer)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><Count>three</Count></R>");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Decode);
}

TEST_CASE("XmlBodyDecoder: numbers tolerate surrounding whitespace", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({
        {"Count", &arena.Scalar(ShapeKind::Integer)},
        {"Ratio", &arena.Scalar(ShapeKind::Float)},
    });
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><Count> 7\n</Count><Ratio> 1.25 </Ratio></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"Count", 7}, {"Ratio", 1.25}});
}

// ===========================================================================
// Blobs and timestamps
// ===========================================================================

TEST_CASE("XmlBodyDecoder: blob yields raw bytes", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Data", &arena.Scalar(ShapeKind::Blob)}});
    XmlBodyDecoder decoder;

    // 0xff 0x00 0xfe is not valid UTF-8.
    auto r = decoder.DecodeBody(shape, "<R><Data>/wD+</Data></R>");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value()["Data"].is_binary());
    CHECK(BinaryOf(r.Value()["Data"]) == Bytes{0xff, 0x00, 0xfe});
}

TEST_CASE("XmlBodyDecoder: timestamps go through the injected converter", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"When", &arena.Scalar(ShapeKind::Timestamp)}});

    std::vector<json> seen;
    XmlBodyDecoder decoder([&seen](const json& raw) {
        seen.push_back(raw);
        return Result<json, Error>::Ok("converted");
    });
    auto r = decoder.DecodeBody(shape, "<R><When>2015-01-25T08:00:00Z</When></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"When", "converted"}});
    REQUIRE(seen.size() == 1);
    CHECK(seen[0] == "2015-01-25T08:00:00Z");
}

TEST_CASE("XmlBodyDecoder: default converter normalizes timestamps", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"When", &arena.Scalar(ShapeKind::Timestamp)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><When>Sun, 25 Jan 2015 08:00:00 GMT</When></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"When", "2015-01-25T08:00:00Z"}});
}

TEST_CASE("XmlBodyDecoder: converter failure aborts the decode", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"When", &arena.Scalar(ShapeKind::Timestamp)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><When>soon</When></R>");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timestamp);
}

// ===========================================================================
// Lists
// ===========================================================================

TEST_CASE("XmlBodyDecoder: wrapped list", "[xml][decoder][list]") {
    ShapeArena arena;
    const auto& list = arena.List(arena.Scalar(ShapeKind::String, Named("member")));
    const auto& shape = arena.Structure({{"Names", &list}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape,
        "<R><Names><member>a</member><member>b</member></Names></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({"Names": ["a", "b"]})"));

    auto empty = decoder.DecodeBody(shape, "<R><Names/></R>");
    REQUIRE(empty.IsOk());
    CHECK(empty.Value() == json::parse(R"({"Names": []})"));
}

TEST_CASE("XmlBodyDecoder: flattened list with one occurrence is a sequence", "[xml][decoder][list]") {
    ShapeArena arena;
    const auto& list = arena.List(arena.Scalar(ShapeKind::String), Flattened());
    const auto& shape = arena.Structure({{"Item", &list}});
    XmlBodyDecoder decoder;

    auto one = decoder.DecodeBody(shape, "<R><Item>only</Item></R>");
    REQUIRE(one.IsOk());
    REQUIRE(one.Value()["Item"].is_array());
    CHECK(one.Value()["Item"] == json::array({"only"}));

    auto many = decoder.DecodeBody(shape, "<R><Item>a</Item><Other/><Item>b</Item></R>");
    REQUIRE(many.IsOk());
    CHECK(many.Value()["Item"] == json::array({"a", "b"}));
}

TEST_CASE("XmlBodyDecoder: flattened list items named by the member shape", "[xml][decoder][list]") {
    ShapeArena arena;
    const auto& list = arena.List(arena.Scalar(ShapeKind::Integer, Named("Port")), Flattened());
    const auto& shape = arena.Structure({{"Ports", &list}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape, "<R><Port>80</Port><Port>443</Port></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({"Ports": [80, 443]})"));
}

TEST_CASE("XmlBodyDecoder: list of structures", "[xml][decoder][list]") {
    ShapeArena arena;
    const auto& item = arena.Structure({
        {"Key", &arena.Scalar(ShapeKind::String)},
        {"Size", &arena.Scalar(ShapeKind::Long)},
    });
    const auto& shape = arena.Structure({{"Contents", &arena.List(item, Flattened())}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape, R"(<ListBucketResult>
        <Contents><Key>a.txt</Key><Size>1</Size></Contents>
        <Contents><Key>b.txt</Key></Contents>
    </ListBucketResult>)");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({"Contents": [
        {"Key": "a.txt", "Size": 1},
        {"Key": "b.txt"}
    ]})"));
}

// ===========================================================================
// Maps
// ===========================================================================

TEST_CASE("XmlBodyDecoder: wrapped map with integer values", "[xml][decoder][map]") {
    ShapeArena arena;
    const auto& map = arena.Map(arena.Scalar(ShapeKind::String),
                                arena.Scalar(ShapeKind::Integer));
    const auto& shape = arena.Structure({{"Counts", &map}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape,
        "<R><Counts>"
        "<entry><key>a</key><value>1</value></entry>"
        "<entry><key>b</key><value>2</value></entry>"
        "</Counts></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["Counts"] == json::parse(R"({"a": 1, "b": 2})"));
}

TEST_CASE("XmlBodyDecoder: flattened map with custom key and value tags", "[xml][decoder][map]") {
    ShapeArena arena;
    const auto& map = arena.Map(arena.Scalar(ShapeKind::String, Named("Name")),
                                arena.Scalar(ShapeKind::String, Named("Value")),
                                Flattened("Attribute"));
    const auto& shape = arena.Structure({{"Attributes", &map}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape,
        "<R>"
        "<Attribute><Name>color</Name><Value>red</Value></Attribute>"
        "<Attribute><Name>size</Name><Value>L</Value></Attribute>"
        "</R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["Attributes"] == json::parse(R"({"color": "red", "size": "L"})"));
}

TEST_CASE("XmlBodyDecoder: map entry must hold exactly one key and one value", "[xml][decoder][map]") {
    ShapeArena arena;
    const auto& map = arena.Map(arena.Scalar(ShapeKind::String), arena.Scalar(ShapeKind::String));
    const auto& shape = arena.Structure({{"M", &map}});
    XmlBodyDecoder decoder;

    SECTION("unknown tag") {
        auto r = decoder.DecodeBody(shape,
            "<R><M><entry><key>a</key><value>1</value><extra/></entry></M></R>");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Decode);
        CHECK(r.Error().message.find("Unknown tag: extra") != std::string::npos);
    }
    SECTION("duplicate key tag") {
        auto r = decoder.DecodeBody(shape,
            "<R><M><entry><key>a</key><key>b</key><value>1</value></entry></M></R>");
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("Duplicate") != std::string::npos);
    }
    SECTION("missing value") {
        auto r = decoder.DecodeBody(shape, "<R><M><entry><key>a</key></entry></M></R>");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Decode);
    }
}

TEST_CASE("XmlBodyDecoder: repeated map key keeps the last entry", "[xml][decoder][map]") {
    ScopedGlobalCapture capture;
    ShapeArena arena;
    const auto& map = arena.Map(arena.Scalar(ShapeKind::String), arena.Scalar(ShapeKind::String));
    const auto& shape = arena.Structure({{"M", &map}});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(shape,
        "<R><M>"
        "<entry><key>a</key><value>first</value></entry>"
        "<entry><key>a</key><value>second</value></entry>"
        "</M></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value()["M"] == json{{"a", "second"}});
    CHECK(capture.Contains(LogLevel::Debug, "map key 'a' repeated"));
}

// ===========================================================================
// Documents
// ===========================================================================

TEST_CASE("XmlBodyDecoder: namespaced tags match by local name", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Name", &arena.Scalar(ShapeKind::String)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape,
        R"(<s:R xmlns:s="http://example.com/ns"><s:Name>n</s:Name></s:R>)");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"Name", "n"}});
}

TEST_CASE("XmlBodyDecoder: LocalName strips qualification", "[xml]") {
    CHECK(XmlBodyDecoder::LocalName("{http://example.com/ns}Foo") == "Foo");
    CHECK(XmlBodyDecoder::LocalName("ns:Foo") == "Foo");
    CHECK(XmlBodyDecoder::LocalName("Foo") == "Foo");
}

TEST_CASE("XmlBodyDecoder: blank body decodes to an empty structure", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({{"Name", &arena.Scalar(ShapeKind::String)}});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "  \n");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::object());
}

TEST_CASE("XmlBodyDecoder: malformed XML is a MalformedBody error", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({});
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><Open></R>");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::MalformedBody);
}

TEST_CASE("XmlBodyDecoder: members bound to headers are not read from the body", "[xml][decoder]") {
    ShapeArena arena;
    const auto& shape = arena.Structure({
        {"ETag", &arena.Scalar(ShapeKind::String, At(Location::Header, "ETag"))},
        {"Name", &arena.Scalar(ShapeKind::String)},
    });
    XmlBodyDecoder decoder;
    auto r = decoder.DecodeBody(shape, "<R><ETag>body</ETag><Name>n</Name></R>");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"Name", "n"}});
}

TEST_CASE("XmlBodyDecoder: recursive shapes", "[xml][decoder]") {
    ShapeArena arena;
    Shape& node = arena.Add(Shape{ShapeKind::Structure, "Node", {}, {}, nullptr, nullptr, nullptr});
    node.members.push_back({"Label", &arena.Scalar(ShapeKind::String)});
    node.members.push_back({"Children", &arena.List(node)});
    XmlBodyDecoder decoder;

    auto r = decoder.DecodeBody(node, R"(<Node>
        <Label>root</Label>
        <Children>
            <member><Label>leaf</Label><Children/></member>
        </Children>
    </Node>)");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({
        "Label": "root",
        "Children": [{"Label": "leaf", "Children": []}]
    })"));
}

// ===========================================================================
// CollapseLeaves
// ===========================================================================

TEST_CASE("XmlBodyDecoder: CollapseLeaves nests elements and gathers repeats", "[xml]") {
    tinyxml2::XMLDocument doc;
    auto root = XmlBodyDecoder::ParseDocument(doc,
        "<ErrorResponse>"
        "<Error><Type>Sender</Type><Code>Throttling</Code><Message/></Error>"
        "<Detail>a</Detail><Detail>b</Detail>"
        "<RequestId>rid</RequestId>"
        "</ErrorResponse>",
        "test");
    REQUIRE(root.IsOk());
    auto collapsed = XmlBodyDecoder::CollapseLeaves(XmlBodyDecoder::BuildTagIndex(root.Value()));
    CHECK(collapsed == json::parse(R"({
        "Error": {"Type": "Sender", "Code": "Throttling", "Message": ""},
        "Detail": ["a", "b"],
        "RequestId": "rid"
    })"));
}
