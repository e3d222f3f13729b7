#include "BroadcastAddress.hpp"
#include "Logging.hpp"
#include "MessageCodec.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

bool find_interface_broadcast(const std::string& if_name, std::string& out_bcast) {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        qCWarning(lcNet) << "getifaddrs failed:" << std::strerror(errno);
        return false;
    }

    bool found = false;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!if_name.empty() && if_name != ifa->ifa_name) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        struct sockaddr_in* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        struct sockaddr_in* netmask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
        if (!addr || !netmask) continue;

        uint32_t ip = ntohl(addr->sin_addr.s_addr);
        uint32_t mask = ntohl(netmask->sin_addr.s_addr);
        uint32_t bcast = (ip & mask) | (~mask);

        struct in_addr baddr;
        baddr.s_addr = htonl(bcast);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &baddr, buf, sizeof(buf)) == nullptr) continue;

        out_bcast = buf;
        found = true;
        qCDebug(lcNet) << "interface" << ifa->ifa_name << "broadcast" << buf;
        break;
    }

    freeifaddrs(ifaddr);
    if (!found && !if_name.empty()) {
        qCWarning(lcNet) << "interface" << if_name.c_str() << "not found or not usable";
    }
    return found;
}

std::string resolve_broadcast_address(const std::string& if_name) {
    std::string bcast;
    if (find_interface_broadcast(if_name, bcast)) return bcast;
    qCInfo(lcNet) << "falling back to" << MessageCodec::FALLBACK_BROADCAST_ADDRESS;
    return MessageCodec::FALLBACK_BROADCAST_ADDRESS;
}
