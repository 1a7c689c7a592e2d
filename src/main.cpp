#include <resparse/cli/output_formatter.hpp>
#include <resparse/config/config_loader.hpp>
#include <resparse/core/log.hpp>
#include <resparse/model/shape_model.hpp>
#include <resparse/protocol/protocol_registry.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitInternal = 99;

constexpr const char* kComponent = "main";

resparse::Error MakeMainError(const std::string& message) {
    return resparse::Error{"main", "", std::nullopt, message, std::nullopt,
                           resparse::ErrorCategory::Config};
}

int Run(const resparse::AppConfig& config, const resparse::OutputFormatter& formatter) {
    using namespace resparse;

    auto model = ShapeModel::FromFile(config.model_path);
    if (model.IsErr()) {
        formatter.PrintError(model.Error());
        return model.Error().ExitCode();
    }

    const std::string protocol = config.protocol.value_or(model.Value().Protocol());
    if (protocol.empty()) {
        const auto error = MakeMainError(
            "No protocol: pass --protocol or set metadata.protocol in the model");
        formatter.PrintError(error);
        return error.ExitCode();
    }

    auto shape = config.operation.has_value()
                     ? model.Value().OutputShape(*config.operation)
                     : model.Value().Resolve(*config.shape_name);
    if (shape.IsErr()) {
        formatter.PrintError(shape.Error());
        return shape.Error().ExitCode();
    }

    auto response = LoadResponseFixture(config.response_path);
    if (response.IsErr()) {
        formatter.PrintError(response.Error());
        return response.Error().ExitCode();
    }

    auto parser = CreateResponseParser(protocol);
    if (parser.IsErr()) {
        formatter.PrintError(parser.Error());
        return parser.Error().ExitCode();
    }

    LogInfo(kComponent, "decoding " + config.response_path + " as " + protocol);
    auto document = parser.Value().Parse(response.Value(), shape.Value());
    if (document.IsErr()) {
        formatter.PrintError(document.Error());
        return document.Error().ExitCode();
    }
    formatter.PrintDocument(document.Value());
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace resparse;

    auto config_result = LoadFromCli(argc, argv);
    if (config_result.IsErr()) {
        OutputFormatter(false).PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    const LogLevel log_level = config.verbose ? LogLevel::Debug : LogLevel::Warn;
    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log_level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(), log_level);
    }

    const OutputFormatter formatter(config.log_json, config.pretty);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    try {
        return Run(config, formatter);
    } catch (const std::exception& e) {
        formatter.PrintError(Error{"main", "", std::nullopt,
                                   std::string("Unexpected exception: ") + e.what(),
                                   std::nullopt, ErrorCategory::Internal});
        return kExitInternal;
    }
}
