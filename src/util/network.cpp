#include "util/network.hpp"
#include "log/Registry.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>

namespace wb::util {

bool hasNetworkConnectivity() {
    ifaddrs* ifs = nullptr;
    if (getifaddrs(&ifs) != 0) {
        log::Registry::jobs()->warn("[Network] getifaddrs failed: {}", std::strerror(errno));
        return false;
    }

    bool up = false;
    for (const ifaddrs* it = ifs; it && !up; it = it->ifa_next) {
        if (!it->ifa_addr) continue;
        if (!(it->ifa_flags & IFF_UP) || !(it->ifa_flags & IFF_RUNNING)) continue;
        if (it->ifa_flags & IFF_LOOPBACK) continue;
        const auto family = it->ifa_addr->sa_family;
        up = family == AF_INET || family == AF_INET6;
    }

    freeifaddrs(ifs);
    return up;
}

}
