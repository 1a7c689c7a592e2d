#pragma once

#include <resparse/config/app_config.hpp>
#include <resparse/core/http.hpp>
#include <resparse/core/result.hpp>

#include <string_view>

namespace resparse {

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Read a recorded HTTP response from YAML:
//
//   status: 404
//   headers:
//     x-amz-request-id: abc
//   body: "<Error>...</Error>"      # or body_file: relative/path
//                                   # or body_base64: ...
//
// body_file is resolved relative to the fixture's directory.
Result<HttpResponse, Error> LoadResponseFixture(std::string_view file_path);

} // namespace resparse
