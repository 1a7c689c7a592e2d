#pragma once

#include <resparse/core/result.hpp>
#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_protocol.hpp>
#include <resparse/protocol/response_parser.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace resparse {

// A factory builds a fresh protocol instance around a timestamp converter.
using ProtocolFactory = std::function<std::unique_ptr<IProtocol>(TimestampParser)>;

// ---------------------------------------------------------------------------
// ProtocolRegistry — protocol name ("ec2", "query", "json", "rest-json",
// "rest-xml") to factory.
// ---------------------------------------------------------------------------
class ProtocolRegistry {
public:
    void Register(const std::string& name, ProtocolFactory factory);

    [[nodiscard]] bool HasProtocol(std::string_view name) const;

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> Names() const;

    [[nodiscard]] Result<std::unique_ptr<IProtocol>, Error> Create(
        std::string_view name, TimestampParser timestamp_parser = ParseTimestamp) const;

    /// The five built-in protocols.
    [[nodiscard]] static const ProtocolRegistry& Default();

private:
    std::map<std::string, ProtocolFactory, std::less<>> factories_;
};

/// Names accepted by CreateResponseParser().
[[nodiscard]] std::vector<std::string> SupportedProtocols();

[[nodiscard]] Result<std::unique_ptr<IProtocol>, Error> CreateProtocol(
    std::string_view name, TimestampParser timestamp_parser = ParseTimestamp);

[[nodiscard]] Result<ResponseParser, Error> CreateResponseParser(
    std::string_view name, TimestampParser timestamp_parser = ParseTimestamp);

} // namespace resparse
