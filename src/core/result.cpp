#include <resparse/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace resparse {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:          return 1;
        case ErrorCategory::Io:              return 1;
        case ErrorCategory::ShapeModel:      return 1;
        case ErrorCategory::UnknownProtocol: return 1;
        case ErrorCategory::MalformedBody:   return 2;
        case ErrorCategory::Decode:          return 2;
        case ErrorCategory::Timestamp:       return 2;
        case ErrorCategory::Internal:        return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::MalformedBody:   return "malformed_body";
        case ErrorCategory::Decode:          return "decode";
        case ErrorCategory::Timestamp:       return "timestamp";
        case ErrorCategory::UnknownProtocol: return "unknown_protocol";
        case ErrorCategory::ShapeModel:      return "shape_model";
        case ErrorCategory::Config:          return "config";
        case ErrorCategory::Io:              return "io";
        case ErrorCategory::Internal:        return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!protocol.empty()) {
        oss << " [" << protocol << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json error = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!protocol.empty()) {
        error["protocol"] = protocol;
    }
    if (http_status.has_value()) {
        error["http_status"] = *http_status;
    }
    if (detail.has_value() && !detail->empty()) {
        error["detail"] = *detail;
    }
    return nlohmann::json{{"error", error}}.dump();
}

} // namespace resparse
