#include <resparse/config/config_loader.hpp>

#include <resparse/core/base64.hpp>
#include <resparse/core/version.hpp>
#include <resparse/protocol/protocol_registry.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace resparse {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Error MakeIoError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Io};
}

Result<std::string, Error> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(
            MakeIoError("Cannot open file: " + path.string()));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return Result<std::string, Error>::Ok(contents.str());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("resparse", kVersion);
    program.add_description("Decode a recorded HTTP response against a service model.");

    program.add_argument("-m", "--model")
        .help("Service model JSON file")
        .required();
    program.add_argument("-r", "--response")
        .help("YAML response fixture (status, headers, body)")
        .required();
    program.add_argument("-o", "--operation")
        .help("Operation whose output shape is decoded");
    program.add_argument("-s", "--shape")
        .help("Decode against a named shape instead of an operation output");
    program.add_argument("-p", "--protocol")
        .help("Protocol override (ec2, query, json, rest-json, rest-xml)");

    program.add_argument("--pretty")
        .help("Indent the JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Log as JSON lines on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.model_path = program.get<std::string>("--model");
    config.response_path = program.get<std::string>("--response");
    if (auto val = program.present("--operation")) {
        config.operation = *val;
    }
    if (auto val = program.present("--shape")) {
        config.shape_name = *val;
    }
    if (auto val = program.present("--protocol")) {
        config.protocol = *val;
    }
    config.pretty = program.get<bool>("--pretty");
    config.log_json = program.get<bool>("--log-json");
    config.verbose = program.get<bool>("--verbose");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.model_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: model"));
    }
    if (config.response_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: response"));
    }
    if (!config.operation.has_value() && !config.shape_name.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("One of operation or shape is required"));
    }
    if (config.operation.has_value() && config.shape_name.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("operation and shape are mutually exclusive"));
    }
    if (config.protocol.has_value()) {
        const auto names = SupportedProtocols();
        if (std::find(names.begin(), names.end(), *config.protocol) == names.end()) {
            return Result<void, Error>::Err(
                MakeConfigError("Unknown protocol: " + *config.protocol));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadResponseFixture
// ---------------------------------------------------------------------------
Result<HttpResponse, Error> LoadResponseFixture(std::string_view file_path) {
    const std::filesystem::path path{std::string(file_path)};
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return Result<HttpResponse, Error>::Err(
            MakeIoError("Cannot open response fixture: " + path.string()));
    } catch (const YAML::Exception& e) {
        return Result<HttpResponse, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    if (!root.IsMap()) {
        return Result<HttpResponse, Error>::Err(
            MakeConfigError("Response fixture must be a YAML mapping"));
    }

    HttpResponse response;
    try {
        if (!root["status"]) {
            return Result<HttpResponse, Error>::Err(
                MakeConfigError("Response fixture missing 'status' field"));
        }
        response.status_code = root["status"].as<int>();

        if (root["headers"]) {
            for (const auto& header : root["headers"]) {
                response.headers[header.first.as<std::string>()] =
                    header.second.as<std::string>();
            }
        }

        const int body_sources = (root["body"] ? 1 : 0) + (root["body_file"] ? 1 : 0) +
                                 (root["body_base64"] ? 1 : 0);
        if (body_sources > 1) {
            return Result<HttpResponse, Error>::Err(MakeConfigError(
                "Response fixture may set only one of body, body_file, body_base64"));
        }

        if (root["body"]) {
            response.body = root["body"].as<std::string>();
        } else if (root["body_file"]) {
            auto body = ReadFile(path.parent_path() / root["body_file"].as<std::string>());
            if (body.IsErr()) {
                return Result<HttpResponse, Error>::Err(std::move(body).Error());
            }
            response.body = std::move(body).Value();
        } else if (root["body_base64"]) {
            auto bytes = Base64Decode(root["body_base64"].as<std::string>());
            if (bytes.IsErr()) {
                return Result<HttpResponse, Error>::Err(
                    MakeConfigError("Invalid body_base64: " + bytes.Error().message));
            }
            const auto& raw = bytes.Value();
            response.body.assign(raw.begin(), raw.end());
        }
    } catch (const YAML::Exception& e) {
        return Result<HttpResponse, Error>::Err(
            MakeConfigError("Invalid response fixture: " + std::string(e.what())));
    }

    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace resparse
