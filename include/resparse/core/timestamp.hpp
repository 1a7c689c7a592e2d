#pragma once

#include <resparse/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace resparse {

// ---------------------------------------------------------------------------
// TimestampParser — converts a raw wire timestamp (XML text or a JSON string
// or number) into its calendar representation in the result document.
//
// Injected into every protocol at construction; must be safe to call from
// several threads at once.
// ---------------------------------------------------------------------------
using TimestampParser =
    std::function<Result<nlohmann::json, Error>(const nlohmann::json& raw)>;

/// Default converter. Accepts epoch seconds (number or numeric string),
/// ISO-8601 and RFC 822 dates; yields an ISO-8601 UTC string such as
/// "2015-01-25T08:00:00Z" or "2015-01-25T08:00:00.123Z".
[[nodiscard]] Result<nlohmann::json, Error> ParseTimestamp(const nlohmann::json& raw);

/// Format seconds + microseconds since the Unix epoch as ISO-8601 UTC.
[[nodiscard]] std::string FormatIso8601(std::int64_t epoch_seconds,
                                        std::int64_t microseconds = 0);

} // namespace resparse
