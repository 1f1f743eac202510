#pragma once

#include "frontier/http/request.h"

#include <nlohmann/json.hpp>

#include <string>

namespace frontier {

// ============================================================================
// Slot Resolution
// ============================================================================

/**
 * @brief Return the slot a request is scheduled under
 * @param request Request to inspect; its slot is filled in when unset
 * @return Explicit override, or the host of the request URL
 *
 * The computed value is written back so that later observers (the
 * downloader, dispatch hooks) see the same slot.
 */
std::string resolve_slot(Request& request);

/**
 * @brief Slot of a request without writing anything back
 */
[[nodiscard]] std::string slot_of(const Request& request);

/**
 * @brief Return the slot of a request given in key-value form
 * @param document Request document; meta[SLOT_META_KEY] is filled in when unset
 * @throws InvalidRequestException if the document is not an object
 */
std::string resolve_slot(nlohmann::json& document);

/**
 * @brief Host component of a URL, lowercased
 * @return Host, or an empty string if the URL has no parsable authority
 */
[[nodiscard]] std::string extract_host(const std::string& url);

/**
 * @brief Filesystem-safe, collision-resistant directory name for a slot
 *
 * Characters outside [A-Za-z0-9-._] become '_', then the hex MD5 of the
 * raw slot is appended, so two slots that sanitize identically still
 * land in different directories.
 */
[[nodiscard]] std::string slot_to_path(const std::string& slot);

} // namespace frontier
