#pragma once

namespace wb::util {

// True when any non-loopback interface is up and carries an IPv4 or IPv6 address.
bool hasNetworkConnectivity();

}
