/**
 * @file host_file.cpp
 * @brief Host file parsing using toml++.
 */

#include "app/host_file.hpp"
#include "net/address.hpp"

#include <chrono>

#include <toml++/toml.hpp>

namespace lanwake {

namespace {

Timestamp to_timestamp(const toml::date_time& dt) {
    using namespace std::chrono;
    auto days = sys_days{year{dt.date.year} / month{dt.date.month} / day{dt.date.day}};
    auto tp = time_point_cast<system_clock::duration>(
        days + hours{dt.time.hour} + minutes{dt.time.minute} + seconds{dt.time.second});
    if (dt.offset) tp -= minutes{dt.offset->minutes};
    return tp;
}

}  // anonymous namespace

Result<std::vector<Host>> load_hosts(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Host file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        auto* entries = tbl["host"].as_array();
        if (entries == nullptr) {
            return Error{ErrorCode::Config, "Host file has no [[host]] entries: " + path.string()};
        }

        std::vector<Host> hosts;
        size_t index = 0;
        for (auto& node : *entries) {
            ++index;
            auto* entry = node.as_table();
            if (entry == nullptr) continue;

            Host host;
            host.mac_address = (*entry)["mac"].value_or(std::string{});
            if (host.mac_address.empty()) {
                return Error{ErrorCode::Config,
                             "host #" + std::to_string(index) + " is missing 'mac'"};
            }
            host.id = (*entry)["id"].value_or(host.mac_address);
            host.name = (*entry)["name"].value_or(host.id);
            if (auto ip = (*entry)["static_ip"].value<std::string>(); ip && !ip->empty()) {
                host.static_ip = *ip;
            }
            host.use_as_fallback = (*entry)["use_as_fallback"].value_or(false);
            host.broadcast_target = (*entry)["broadcast"].value_or(host.broadcast_target);

            if (auto* list = (*entry)["interfaces"].as_array()) {
                for (auto& item : *list) {
                    if (auto name = item.value<std::string>()) host.interfaces.push_back(*name);
                }
            } else if (auto text = (*entry)["interfaces"].value<std::string>()) {
                host.interfaces = split_interface_list(*text);
            }

            if (auto created = (*entry)["created_at"].value<toml::date_time>()) {
                host.created_at = to_timestamp(*created);
            }
            hosts.push_back(std::move(host));
        }
        return hosts;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace lanwake
