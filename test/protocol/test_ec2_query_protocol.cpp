#include <catch2/catch_test_macros.hpp>

#include <resparse/protocol/ec2_query_protocol.hpp>

#include "support/capture_sink.hpp"
#include "support/shape_builders.hpp"

#include <string>

using namespace resparse;
using namespace resparse::testing;
using nlohmann::json;

namespace {

HttpResponse Xml(int status, std::string body) {
    HttpResponse response;
    response.status_code = status;
    response.body = std::move(body);
    return response;
}

} // anonymous namespace

// ===========================================================================
// Success path
// ===========================================================================

TEST_CASE("Ec2QueryProtocol: decodes from the root with requestId metadata", "[ec2]") {
    ShapeArena arena;
    const auto& instance = arena.Structure({
        {"InstanceId", &arena.Scalar(ShapeKind::String, Named("instanceId"))},
        {"State", &arena.Scalar(ShapeKind::String, Named("instanceState"))},
    });
    const auto& shape = arena.Structure({
        {"Instances", &arena.List(instance, Named("instancesSet"))},
    });
    Ec2QueryProtocol protocol;

    auto r = protocol.DecodeSuccess(Xml(200, R"(<DescribeInstancesResponse xmlns="http://ec2.amazonaws.com/doc/2016-11-15/">
    <requestId>8f7724cf-496f-496e-8fe3-example</requestId>
    <instancesSet>
        <item><instanceId>i-1</instanceId><instanceState>running</instanceState></item>
        <item><instanceId>i-2</instanceId></item>
    </instancesSet>
</DescribeInstancesResponse>)"), &shape);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({
        "Instances": [{"InstanceId": "i-1", "State": "running"}, {"InstanceId": "i-2"}],
        "ResponseMetadata": {"RequestId": "8f7724cf-496f-496e-8fe3-example"}
    })"));
}

TEST_CASE("Ec2QueryProtocol: ResponseMetadata block is not EC2 metadata", "[ec2]") {
    Ec2QueryProtocol protocol;
    auto r = protocol.DecodeSuccess(Xml(200,
        "<R><ResponseMetadata><RequestId>x</RequestId></ResponseMetadata></R>"), nullptr);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::object());
}

// ===========================================================================
// Error path
// ===========================================================================

TEST_CASE("Ec2QueryProtocol: Errors wrapper is unwrapped", "[ec2][error]") {
    Ec2QueryProtocol protocol;
    auto r = protocol.DecodeError(Xml(400,
        "<Response><Errors><Error><Code>E</Code><Message>bad</Message></Error></Errors>"
        "<RequestID>rid</RequestID></Response>"), nullptr);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({
        "Error": {"Code": "E", "Message": "bad"},
        "ResponseMetadata": {"RequestId": "rid"}
    })"));
}

TEST_CASE("Ec2QueryProtocol: several errors keep the first and warn", "[ec2][error]") {
    ScopedGlobalCapture capture;
    Ec2QueryProtocol protocol;
    auto r = protocol.DecodeError(Xml(400, R"(<Response>
    <Errors>
        <Error><Code>InvalidInstanceID.Malformed</Code><Message>Invalid id: "1343124"</Message></Error>
        <Error><Code>InvalidInstanceID.NotFound</Code><Message>missing</Message></Error>
    </Errors>
    <RequestID>rid</RequestID>
</Response>)"), nullptr);
    REQUIRE(r.IsOk());
    CHECK(r.Value()["Error"] == json::parse(R"({
        "Code": "InvalidInstanceID.Malformed", "Message": "Invalid id: \"1343124\""
    })"));
    CHECK_FALSE(r.Value().contains("Errors"));
    CHECK(capture.Contains(LogLevel::Warn, "2 <Error> elements"));
}

TEST_CASE("Ec2QueryProtocol: body without Errors is left as collapsed", "[ec2][error]") {
    Ec2QueryProtocol protocol;
    auto r = protocol.DecodeError(Xml(500,
        "<Response><RequestID>rid</RequestID><Detail>x</Detail></Response>"), nullptr);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::parse(R"({
        "Detail": "x", "ResponseMetadata": {"RequestId": "rid"}
    })"));
}

TEST_CASE("Ec2QueryProtocol: Name", "[ec2]") {
    Ec2QueryProtocol protocol;
    const IProtocol& base = protocol;
    CHECK(base.Name() == "ec2");
}
