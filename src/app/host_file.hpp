/**
 * @file host_file.hpp
 * @brief Loads host records for bulk checks from a TOML file.
 *
 * Format:
 *   [[host]]
 *   id = "nas"
 *   name = "Storage box"
 *   mac = "AA-BB-CC-DD-EE-01"
 *   static_ip = "192.168.1.20"        # optional
 *   use_as_fallback = true            # optional
 *   interfaces = ["eth0", "eth1"]     # optional, or "eth0,eth1"
 *   broadcast = "192.168.1.255:9"     # optional
 *   created_at = 2024-03-01T10:00:00Z # optional
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <vector>

namespace lanwake {

Result<std::vector<Host>> load_hosts(const std::filesystem::path& path);

}  // namespace lanwake
