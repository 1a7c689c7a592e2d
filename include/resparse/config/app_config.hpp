#pragma once

#include <optional>
#include <string>

namespace resparse {

struct AppConfig {
    std::optional<std::string> protocol;    // overrides the model's metadata.protocol
    std::string model_path;
    std::optional<std::string> operation;
    std::optional<std::string> shape_name;  // decode against a named shape instead
    std::string response_path;              // YAML response fixture
    bool pretty = false;
    bool log_json = false;
    bool verbose = false;
};

} // namespace resparse
