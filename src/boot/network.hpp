#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../core/settings.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

// Parsed ip= parameter
struct NetworkSpec {
    enum class Mode { Off, Dhcp, Static };

    Mode mode = Mode::Dhcp;
    std::string interface;  // empty: first ethernet interface
    std::string client;
    std::string server;
    std::string gateway;
    unsigned prefix_length = 24;
    std::string hostname;
    std::vector<std::string> dns;
};

/**
 * Parse the ip= grammar.
 *
 * Accepts "dhcp", "on", "any", "off", "none", "<iface>:dhcp" and the kernel
 * form "client:server:gw:netmask:hostname:iface:autoconf[:dns0[:dns1]]".
 * An empty string means DHCP on the first interface. Returns nullopt for
 * anything else.
 */
std::optional<NetworkSpec> parse_network_spec(const std::string& text);

enum class NetworkPolicy {
    // A global address without confirmed reachability is good enough
    BestEffort,
    // Reachability must be confirmed
    RequireOnline,
};

// Bring up networking per config.network_spec and wait for it
MaybeFailure configure_network(Platform& platform, const BootConfig& config,
                               const Settings& settings, NetworkPolicy policy);

}  // namespace rdinit
