#include <resparse/protocol/protocol_registry.hpp>

#include <resparse/protocol/ec2_query_protocol.hpp>
#include <resparse/protocol/json_protocol.hpp>
#include <resparse/protocol/query_protocol.hpp>
#include <resparse/protocol/rest_json_protocol.hpp>
#include <resparse/protocol/rest_xml_protocol.hpp>

#include <utility>

namespace resparse {

namespace {

template <typename P>
ProtocolFactory FactoryFor() {
    return [](TimestampParser timestamp_parser) -> std::unique_ptr<IProtocol> {
        return std::make_unique<P>(std::move(timestamp_parser));
    };
}

ProtocolRegistry BuildDefaultRegistry() {
    ProtocolRegistry registry;
    registry.Register("ec2", FactoryFor<Ec2QueryProtocol>());
    registry.Register("query", FactoryFor<QueryProtocol>());
    registry.Register("json", FactoryFor<JsonProtocol>());
    registry.Register("rest-json", FactoryFor<RestJsonProtocol>());
    registry.Register("rest-xml", FactoryFor<RestXmlProtocol>());
    return registry;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

void ProtocolRegistry::Register(const std::string& name, ProtocolFactory factory) {
    factories_[name] = std::move(factory);
}

bool ProtocolRegistry::HasProtocol(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> ProtocolRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        (void)factory;
        names.push_back(name);
    }
    return names;
}

Result<std::unique_ptr<IProtocol>, Error> ProtocolRegistry::Create(
    std::string_view name, TimestampParser timestamp_parser) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return Result<std::unique_ptr<IProtocol>, Error>::Err(Error{
            "CreateProtocol", std::string(name), std::nullopt,
            "Unknown protocol: " + std::string(name),
            "supported protocols: " + JoinNames(Names()),
            ErrorCategory::UnknownProtocol});
    }
    return Result<std::unique_ptr<IProtocol>, Error>::Ok(
        it->second(std::move(timestamp_parser)));
}

const ProtocolRegistry& ProtocolRegistry::Default() {
    static const ProtocolRegistry registry = BuildDefaultRegistry();
    return registry;
}

std::vector<std::string> SupportedProtocols() {
    return ProtocolRegistry::Default().Names();
}

Result<std::unique_ptr<IProtocol>, Error> CreateProtocol(std::string_view name,
                                                         TimestampParser timestamp_parser) {
    return ProtocolRegistry::Default().Create(name, std::move(timestamp_parser));
}

Result<ResponseParser, Error> CreateResponseParser(std::string_view name,
                                                   TimestampParser timestamp_parser) {
    auto protocol = CreateProtocol(name, std::move(timestamp_parser));
    if (protocol.IsErr()) {
        return Result<ResponseParser, Error>::Err(std::move(protocol).Error());
    }
    return Result<ResponseParser, Error>::Ok(ResponseParser(std::move(protocol).Value()));
}

} // namespace resparse
