#include <resparse/cli/output_formatter.hpp>

#include <resparse/core/base64.hpp>

namespace resparse {

nlohmann::json OutputFormatter::ToPrintable(const nlohmann::json& document) {
    if (document.is_binary()) {
        const auto& bytes = document.get_binary();
        return Base64Encode(Bytes(bytes.begin(), bytes.end()));
    }
    if (document.is_object()) {
        auto printable = nlohmann::json::object();
        for (auto it = document.begin(); it != document.end(); ++it) {
            printable[it.key()] = ToPrintable(it.value());
        }
        return printable;
    }
    if (document.is_array()) {
        auto printable = nlohmann::json::array();
        for (const auto& item : document) {
            printable.push_back(ToPrintable(item));
        }
        return printable;
    }
    return document;
}

void OutputFormatter::PrintDocument(const nlohmann::json& document) const {
    const auto printable = ToPrintable(document);
    out_ << printable.dump(pretty_ ? 2 : -1, ' ', false,
                           nlohmann::json::error_handler_t::replace)
         << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.protocol.empty()) {
        err_ << " [" << error.protocol << "]";
    }
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  Detail: " << error.detail.value() << "\n";
    }
}

} // namespace resparse
