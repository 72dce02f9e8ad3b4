// wire_check/basic/diagnostic_json.hpp - Machine-readable diagnostics
#pragma once

#include <nlohmann/json.hpp>

#include "wire_check/basic/diagnostic.hpp"

namespace wire_check
{

/**
 * Serialize a diagnostic.
 *
 * @code
 *   {"severity": "error", "code": "E0303", "message": "Input Error",
 *    "declaration": "clicks", "text": "<rendered document>", "lines": [...]}
 * @endcode
 */
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diag);

/// Serialize every diagnostic of a bag as {"items": [...], "errorCount": N}.
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diags);

}  // namespace wire_check
