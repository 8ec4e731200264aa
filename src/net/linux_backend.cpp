/**
 * @file linux_backend.cpp
 * @brief Linux implementation of the network backend using POSIX sockets,
 *        AF_PACKET and rtnetlink.
 */

#include "net/linux_backend.hpp"
#include "net/address.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ifaddrs.h>
#include <linux/capability.h>
#include <linux/if_packet.h>
#include <linux/neighbour.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace lanwake {

namespace {

/**
 * @brief Owns a file descriptor; closes it on destruction.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

Error errno_error(const std::string& what, int err) {
    auto code = (err == EPERM || err == EACCES) ? ErrorCode::PermissionDenied : ErrorCode::Io;
    return Error{code, what + ": " + std::strerror(err)};
}

/// Remaining milliseconds until @p deadline, clamped at zero.
int remaining_ms(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

uint8_t prefix_from_netmask(uint32_t mask_host_order) noexcept {
    return static_cast<uint8_t>(__builtin_popcount(mask_host_order));
}

uint16_t icmp_checksum(const uint8_t* data, size_t len) noexcept {
    uint32_t sum = 0;
    for (; len > 1; len -= 2, data += 2) {
        uint16_t word;
        std::memcpy(&word, data, 2);
        sum += word;
    }
    if (len == 1) sum += *data;
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

// ── ARP frame layout (Ethernet II + IPv4 ARP) ──

struct EthernetHeader {
    uint8_t destination[6];
    uint8_t source[6];
    uint8_t ethertype[2];
};

struct ArpIpv4 {
    uint8_t htype[2];
    uint8_t ptype[2];
    uint8_t hlen[1];
    uint8_t plen[1];
    uint8_t oper[2];
    uint8_t sha[6];
    uint8_t spa[4];
    uint8_t tha[6];
    uint8_t tpa[4];
};

struct ArpFrame {
    EthernetHeader eth;
    ArpIpv4 arp;
};

static_assert(sizeof(ArpFrame) == 42, "ARP frame must be 42 bytes");

void write_ipv4(uint8_t* out, Ipv4Address ip) noexcept {
    uint32_t net = htonl(ip.value);
    std::memcpy(out, &net, 4);
}

Ipv4Address read_ipv4(const uint8_t* in) noexcept {
    uint32_t net;
    std::memcpy(&net, in, 4);
    return Ipv4Address{ntohl(net)};
}

struct LinkInfo {
    int index{0};
    MacAddress mac;
    Ipv4Address ip;
};

Result<LinkInfo> query_link(const InterfaceName& name) {
    if (name.empty() || name.size() >= IFNAMSIZ) {
        return Error{ErrorCode::InterfaceNotFound, "network interface '" + name + "' not found"};
    }

    UniqueFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!fd) return errno_error("socket", errno);

    ifreq ifr{};
    std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);

    LinkInfo info;
    if (::ioctl(fd.get(), SIOCGIFINDEX, &ifr) < 0) {
        if (errno == ENODEV) {
            return Error{ErrorCode::InterfaceNotFound, "network interface '" + name + "' not found"};
        }
        return errno_error("SIOCGIFINDEX " + name, errno);
    }
    info.index = ifr.ifr_ifindex;

    if (::ioctl(fd.get(), SIOCGIFHWADDR, &ifr) < 0) {
        return errno_error("SIOCGIFHWADDR " + name, errno);
    }
    std::memcpy(info.mac.octets.data(), ifr.ifr_hwaddr.sa_data, 6);

    // An interface without IPv4 still answers ARP probes sent from 0.0.0.0.
    if (::ioctl(fd.get(), SIOCGIFADDR, &ifr) == 0) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ifr.ifr_addr);
        info.ip = Ipv4Address{ntohl(sin->sin_addr.s_addr)};
    }
    return info;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

LinuxNetworkBackend::LinuxNetworkBackend(std::filesystem::path arp_table)
    : arp_table_(std::move(arp_table)) {}

// ─────────────────────────────────────────────
// Interfaces
// ─────────────────────────────────────────────

Result<std::vector<InterfaceInfo>> LinuxNetworkBackend::interfaces() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) < 0) {
        return errno_error("getifaddrs", errno);
    }

    std::vector<InterfaceInfo> result;
    auto find_or_add = [&result](const char* name) -> InterfaceInfo& {
        for (auto& info : result) {
            if (info.name == name) return info;
        }
        result.push_back(InterfaceInfo{.name = name});
        return result.back();
    };

    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) continue;

        auto& info = find_or_add(ifa->ifa_name);
        info.up = (ifa->ifa_flags & IFF_UP) != 0;
        info.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;

        auto* addr = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        uint8_t prefix = 32;
        if (ifa->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask);
            prefix = prefix_from_netmask(ntohl(mask->sin_addr.s_addr));
        }
        info.addresses.push_back(Ipv4Network{Ipv4Address{ntohl(addr->sin_addr.s_addr)}, prefix});
    }

    ::freeifaddrs(list);
    return result;
}

// ─────────────────────────────────────────────
// Neighbor Table
// ─────────────────────────────────────────────

Result<std::vector<LinuxNetworkBackend::NeighborEntry>> LinuxNetworkBackend::read_arp_table() const {
    std::ifstream file(arp_table_);
    if (!file.is_open()) {
        return Error{ErrorCode::Io, "cannot open " + arp_table_.string()};
    }

    // IP address  HW type  Flags  HW address  Mask  Device
    std::vector<NeighborEntry> entries;
    std::string line;
    std::getline(file, line);  // header

    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string ip_text, hw_type, flags_text, hw_text, mask, device;
        if (!(iss >> ip_text >> hw_type >> flags_text >> hw_text >> mask >> device)) continue;

        unsigned long flags = 0;
        try {
            flags = std::stoul(flags_text, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        constexpr unsigned long kAtfComplete = 0x2;
        if ((flags & kAtfComplete) == 0) continue;

        auto ip = parse_ipv4(ip_text);
        auto mac = parse_mac(hw_text);
        if (!ip || !mac) continue;

        entries.push_back(NeighborEntry{*ip, *mac, device});
    }
    return entries;
}

Result<std::optional<Ipv4Address>> LinuxNetworkBackend::lookup_neighbor(const MacAddress& mac) {
    auto table = read_arp_table();
    if (!table) return table.error();

    for (const auto& entry : *table) {
        if (entry.mac == mac) return std::optional<Ipv4Address>{entry.ip};
    }
    return std::optional<Ipv4Address>{};
}

Result<void> LinuxNetworkBackend::flush_neighbor(Ipv4Address ip) {
    auto table = read_arp_table();
    if (!table) return table.error();

    UniqueFd fd(::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE));
    if (!fd) return errno_error("netlink socket", errno);

    sockaddr_nl local{};
    local.nl_family = AF_NETLINK;
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        return errno_error("netlink bind", errno);
    }

    uint32_t seq = 1;
    for (const auto& entry : *table) {
        if (entry.ip != ip) continue;

        unsigned index = ::if_nametoindex(entry.device.c_str());
        if (index == 0) continue;

        struct {
            nlmsghdr nh;
            ndmsg ndm;
            char attrs[RTA_SPACE(4)];
        } req{};

        req.nh.nlmsg_len = NLMSG_LENGTH(sizeof(ndmsg));
        req.nh.nlmsg_type = RTM_DELNEIGH;
        req.nh.nlmsg_flags = NLM_F_REQUEST | NLM_F_ACK;
        req.nh.nlmsg_seq = seq++;
        req.ndm.ndm_family = AF_INET;
        req.ndm.ndm_ifindex = static_cast<int>(index);

        auto* rta = reinterpret_cast<rtattr*>(
            reinterpret_cast<char*>(&req.nh) + NLMSG_ALIGN(req.nh.nlmsg_len));
        rta->rta_type = NDA_DST;
        rta->rta_len = RTA_LENGTH(4);
        uint32_t dst = htonl(ip.value);
        std::memcpy(RTA_DATA(rta), &dst, 4);
        req.nh.nlmsg_len = NLMSG_ALIGN(req.nh.nlmsg_len) + RTA_LENGTH(4);

        sockaddr_nl kernel{};
        kernel.nl_family = AF_NETLINK;
        if (::sendto(fd.get(), &req, req.nh.nlmsg_len, 0,
                     reinterpret_cast<sockaddr*>(&kernel), sizeof(kernel)) < 0) {
            return errno_error("RTM_DELNEIGH", errno);
        }

        char buf[1024];
        ssize_t len = ::recv(fd.get(), buf, sizeof(buf), 0);
        if (len < 0) return errno_error("netlink recv", errno);

        for (auto* nh = reinterpret_cast<nlmsghdr*>(buf); NLMSG_OK(nh, len);
             nh = NLMSG_NEXT(nh, len)) {
            if (nh->nlmsg_type != NLMSG_ERROR) continue;
            auto* err = static_cast<nlmsgerr*>(NLMSG_DATA(nh));
            // ENOENT: the kernel already dropped the entry.
            if (err->error != 0 && err->error != -ENOENT) {
                return errno_error("RTM_DELNEIGH " + ip.to_string(), -err->error);
            }
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// Active ARP
// ─────────────────────────────────────────────

Result<ArpReply> LinuxNetworkBackend::arp_request(Ipv4Address target,
                                                  const InterfaceName& interface,
                                                  std::chrono::milliseconds timeout) {
    auto link = query_link(interface);
    if (!link) return link.error();

    UniqueFd fd(::socket(AF_PACKET, SOCK_RAW | SOCK_CLOEXEC, htons(ETH_P_ARP)));
    if (!fd) return errno_error("AF_PACKET socket", errno);

    sockaddr_ll bind_addr{};
    bind_addr.sll_family = AF_PACKET;
    bind_addr.sll_protocol = htons(ETH_P_ARP);
    bind_addr.sll_ifindex = link->index;
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        return errno_error("bind " + interface, errno);
    }

    ArpFrame request{};
    std::memset(request.eth.destination, 0xFF, 6);
    std::memcpy(request.eth.source, link->mac.octets.data(), 6);
    request.eth.ethertype[0] = 0x08;
    request.eth.ethertype[1] = 0x06;
    request.arp.htype[1] = 0x01;
    request.arp.ptype[0] = 0x08;
    request.arp.hlen[0] = 0x06;
    request.arp.plen[0] = 0x04;
    request.arp.oper[1] = 0x01;
    std::memcpy(request.arp.sha, link->mac.octets.data(), 6);
    write_ipv4(request.arp.spa, link->ip);
    write_ipv4(request.arp.tpa, target);

    sockaddr_ll dest{};
    dest.sll_family = AF_PACKET;
    dest.sll_protocol = htons(ETH_P_ARP);
    dest.sll_ifindex = link->index;
    dest.sll_halen = 6;
    std::memset(dest.sll_addr, 0xFF, 6);

    if (::sendto(fd.get(), &request, sizeof(request), 0,
                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        return errno_error("ARP send on " + interface, errno);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int wait = remaining_ms(deadline);
        if (wait == 0) break;

        pollfd pfd{};
        pfd.fd = fd.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return errno_error("poll", errno);
        }
        if (ready == 0) break;

        ArpFrame reply{};
        ssize_t n = ::recv(fd.get(), &reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(reply))) continue;
        if (reply.eth.ethertype[0] != 0x08 || reply.eth.ethertype[1] != 0x06) continue;
        if (reply.arp.oper[0] != 0x00 || reply.arp.oper[1] != 0x02) continue;
        if (read_ipv4(reply.arp.spa) != target) continue;

        ArpReply result;
        result.ip = target;
        std::memcpy(result.mac.octets.data(), reply.arp.sha, 6);
        result.interface = interface;
        return result;
    }

    return Error{ErrorCode::ProbeTimeout,
                 "no ARP reply from " + target.to_string() + " on " + interface};
}

// ─────────────────────────────────────────────
// ICMP
// ─────────────────────────────────────────────

bool LinuxNetworkBackend::icmp_echo(Ipv4Address target, std::chrono::milliseconds timeout) {
    // Unprivileged ping socket first; raw socket when net.ipv4.ping_group_range excludes us.
    bool raw = false;
    UniqueFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if (!fd) {
        fd.reset(::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP));
        raw = true;
    }
    if (!fd) return false;

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = htonl(target.value);

    uint8_t packet[sizeof(icmphdr) + 16]{};
    auto* hdr = reinterpret_cast<icmphdr*>(packet);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    // Concurrent echoes share the pid identifier; the sequence tells them apart.
    static std::atomic<uint16_t> next_sequence{0};
    const auto id = static_cast<uint16_t>(::getpid() & 0xFFFF);
    const auto sequence = static_cast<uint16_t>(++next_sequence);
    hdr->un.echo.id = htons(id);
    hdr->un.echo.sequence = htons(sequence);
    hdr->checksum = 0;
    hdr->checksum = icmp_checksum(packet, sizeof(packet));

    if (::sendto(fd.get(), packet, sizeof(packet), 0,
                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint8_t buf[1500];
    while (true) {
        int wait = remaining_ms(deadline);
        if (wait == 0) return false;

        pollfd pfd{};
        pfd.fd = fd.get();
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t n = ::recvfrom(fd.get(), buf, sizeof(buf), 0,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n <= 0) continue;
        if (ntohl(from.sin_addr.s_addr) != target.value) continue;

        std::span<const uint8_t> datagram(buf, static_cast<size_t>(n));
        if (matches_echo_reply(datagram, raw, id, sequence)) return true;
    }
}

bool matches_echo_reply(std::span<const uint8_t> datagram,
                        bool raw,
                        uint16_t id,
                        uint16_t sequence) noexcept {
    size_t offset = 0;
    if (raw) {
        if (datagram.size() < sizeof(iphdr)) return false;
        offset = (datagram[0] & 0x0Fu) * 4u;
    }
    if (datagram.size() < offset + sizeof(icmphdr)) return false;

    icmphdr reply{};
    std::memcpy(&reply, datagram.data() + offset, sizeof(reply));
    if (reply.type != ICMP_ECHOREPLY) return false;
    if (ntohs(reply.un.echo.sequence) != sequence) return false;
    return !raw || ntohs(reply.un.echo.id) == id;
}

// ─────────────────────────────────────────────
// UDP
// ─────────────────────────────────────────────

Result<void> LinuxNetworkBackend::send_udp(Ipv4Address local,
                                           Ipv4Address target,
                                           uint16_t port,
                                           std::span<const uint8_t> payload) {
    UniqueFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!fd) return errno_error("UDP socket", errno);

    int optval = 1;
    if (::setsockopt(fd.get(), SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        return errno_error("SO_BROADCAST", errno);
    }

    if (!local.is_unspecified()) {
        sockaddr_in bind_addr{};
        bind_addr.sin_family = AF_INET;
        bind_addr.sin_addr.s_addr = htonl(local.value);
        bind_addr.sin_port = 0;
        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
            return errno_error("bind " + local.to_string(), errno);
        }
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    dest.sin_addr.s_addr = htonl(target.value);

    ssize_t sent = ::sendto(fd.get(), payload.data(), payload.size(), 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return errno_error("sendto " + target.to_string() + ":" + std::to_string(port), errno);
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        return Error{ErrorCode::Io, "short UDP write to " + target.to_string()};
    }
    return {};
}

// ─────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────

Capabilities LinuxNetworkBackend::detect_capabilities() {
    Capabilities caps;

    caps.active_arp = static_cast<bool>(
        UniqueFd(::socket(AF_PACKET, SOCK_RAW | SOCK_CLOEXEC, htons(ETH_P_ARP))));

    caps.icmp = static_cast<bool>(UniqueFd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP)))
             || static_cast<bool>(UniqueFd(::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP)));

    __user_cap_header_struct header{};
    header.version = _LINUX_CAPABILITY_VERSION_3;
    header.pid = 0;
    __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3]{};
    if (::syscall(SYS_capget, &header, data) == 0) {
        caps.neighbor_flush =
            (data[CAP_TO_INDEX(CAP_NET_ADMIN)].effective & CAP_TO_MASK(CAP_NET_ADMIN)) != 0;
    }

    return caps;
}

}  // namespace lanwake
