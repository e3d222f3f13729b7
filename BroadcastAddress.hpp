#ifndef BROADCAST_ADDRESS_HPP
#define BROADCAST_ADDRESS_HPP

#include <string>

// Broadcast address of the named interface, or of the first up non-loopback IPv4
// interface when if_name is empty.
bool find_interface_broadcast(const std::string& if_name, std::string& out_bcast);

// find_interface_broadcast() with the limited broadcast address as fallback.
std::string resolve_broadcast_address(const std::string& if_name = std::string());

#endif // BROADCAST_ADDRESS_HPP
