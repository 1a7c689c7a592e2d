#pragma once

#include <resparse/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>

namespace resparse {

// ---------------------------------------------------------------------------
// OutputFormatter — writes decoded documents to stdout, errors to stderr.
//
// Binary values (blobs) cannot be serialized as JSON text; they are written
// as base64 strings. In json mode errors are a single JSON object.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool pretty = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), pretty_(pretty), out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }

    /// Copy of `document` with every binary value replaced by its base64 text.
    [[nodiscard]] static nlohmann::json ToPrintable(const nlohmann::json& document);

    void PrintDocument(const nlohmann::json& document) const;

    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool pretty_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace resparse
