// driftscan/model/json_io.hpp - JSON serialization for scan records
//
// Field names follow the camelCase wire format consumed downstream
// (usedBy, scannedAt, exportName, ...).
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "driftscan/basic/scan_error.hpp"
#include "driftscan/model/component.hpp"
#include "driftscan/model/design_token.hpp"
#include "driftscan/signals/signal.hpp"

namespace driftscan
{

[[nodiscard]] nlohmann::json to_json(const DesignToken & token);
[[nodiscard]] nlohmann::json to_json(const Component & component);
[[nodiscard]] nlohmann::json to_json(const ScanError & error);
[[nodiscard]] nlohmann::json to_json(const RawSignal & signal);

/**
 * Rebuild a token from to_json() output.
 *
 * @throws nlohmann::json::exception on missing or mistyped fields,
 *         std::invalid_argument on unknown enum spellings
 */
[[nodiscard]] DesignToken token_from_json(const nlohmann::json & j);

/**
 * Rebuild a component from to_json() output.
 *
 * @throws nlohmann::json::exception or std::invalid_argument, as token_from_json()
 */
[[nodiscard]] Component component_from_json(const nlohmann::json & j);

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
[[nodiscard]] std::string format_timestamp(Timestamp t);

/// Inverse of format_timestamp(); throws std::invalid_argument on bad input.
[[nodiscard]] Timestamp parse_timestamp(std::string_view s);

}  // namespace driftscan
