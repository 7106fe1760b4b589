#include "network.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <arpa/inet.h>
#include <algorithm>

namespace rdinit {

namespace {

constexpr const char* FALLBACK_NAMESERVER = "8.8.8.8";

bool is_dhcp_word(const std::string& word) {
    return word == "dhcp" || word == "on" || word == "any" || word == "both";
}

bool is_off_word(const std::string& word) {
    return word == "off" || word == "none";
}

bool parse_ipv4(const std::string& text, uint32_t* out) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
        return false;
    if (out)
        *out = ntohl(addr.s_addr);
    return true;
}

// Netmask as dotted quad or prefix length
std::optional<unsigned> parse_prefix(const std::string& text) {
    if (text.empty())
        return 24u;

    auto bits = parse_unsigned(text);
    if (bits)
        return *bits <= 32 ? std::optional<unsigned>(static_cast<unsigned>(*bits)) : std::nullopt;

    uint32_t mask;
    if (!parse_ipv4(text, &mask))
        return std::nullopt;

    unsigned prefix = 0;
    while (prefix < 32 && (mask & (0x80000000u >> prefix)))
        ++prefix;
    // Reject non-contiguous masks
    uint32_t expected = prefix == 0 ? 0 : ~((1ULL << (32 - prefix)) - 1) & 0xffffffffu;
    if (mask != expected)
        return std::nullopt;
    return prefix;
}

Failure network_failure(const std::string& what) {
    std::string reason = "network configuration failed: " + what;
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::NetworkReady, FailureKind::NetworkFailed, reason);
}

std::optional<std::string> pick_interface(Platform& platform, const NetworkSpec& spec) {
    if (!spec.interface.empty())
        return spec.interface;

    auto names = platform.list_directory(SYS_NET_DIR);
    if (!names)
        return std::nullopt;
    std::sort(names->begin(), names->end());

    for (const auto& name : *names) {
        if (starts_with(name, "e"))
            return name;
    }
    for (const auto& name : *names) {
        if (name != "lo")
            return name;
    }
    return std::nullopt;
}

bool wait_for_address(Platform& platform, unsigned timeout) {
    for (unsigned waited = 0;; ++waited) {
        if (platform.has_global_address())
            return true;
        if (waited >= timeout)
            return false;
        platform.sleep_seconds(1);
    }
}

MaybeFailure configure_manual(Platform& platform, const NetworkSpec& spec) {
    auto iface = pick_interface(platform, spec);
    if (!iface) {
        return network_failure("no network interface found");
    }

    auto link = platform.run({"ip", "link", "set", *iface, "up"});
    if (link.exit_code != 0) {
        return network_failure("cannot bring up " + *iface + ": " + trim(link.stderr_str));
    }

    if (!spec.hostname.empty()) {
        if (!platform.write_file("/proc/sys/kernel/hostname", spec.hostname)) {
            LOGW("Cannot set hostname: %s", platform.last_error().c_str());
        }
    }

    if (spec.mode == NetworkSpec::Mode::Dhcp) {
        LOGI("Configuring %s via DHCP", iface->c_str());
        if (!platform.has_program("udhcpc")) {
            return network_failure("no DHCP client (udhcpc) in the initramfs");
        }
        auto dhcp = platform.run({"udhcpc", "-i", *iface, "-t", "10", "-n"});
        if (dhcp.exit_code != 0) {
            return network_failure("DHCP failed on " + *iface);
        }
        return std::nullopt;
    }

    std::string address = spec.client + "/" + std::to_string(spec.prefix_length);
    LOGI("Configuring %s with %s", iface->c_str(), address.c_str());
    auto addr = platform.run({"ip", "addr", "add", address, "dev", *iface});
    if (addr.exit_code != 0) {
        return network_failure("cannot assign " + address + " to " + *iface);
    }
    if (!spec.gateway.empty()) {
        auto route = platform.run({"ip", "route", "add", "default", "via", spec.gateway, "dev",
                                   *iface});
        if (route.exit_code != 0) {
            return network_failure("cannot add default route via " + spec.gateway);
        }
    }

    std::string resolv;
    for (const auto& server : spec.dns)
        resolv += "nameserver " + server + "\n";
    if (resolv.empty())
        resolv = std::string("nameserver ") + FALLBACK_NAMESERVER + "\n";
    if (!platform.write_file(RESOLV_CONF_PATH, resolv)) {
        LOGW("Cannot write %s: %s", RESOLV_CONF_PATH, platform.last_error().c_str());
    }
    return std::nullopt;
}

// Returns whether reachability was confirmed
Outcome<bool> run_network_manager(Platform& platform, unsigned timeout) {
    if (platform.has_program(NM_INITRD_GENERATOR_PATH)) {
        std::vector<std::string> args = {NM_INITRD_GENERATOR_PATH, "--"};
        auto cmdline = platform.read_file(CMDLINE_PATH);
        if (cmdline) {
            for (const auto& token : tokenize_cmdline(*cmdline))
                args.push_back(token);
        }
        auto generated = platform.run(args);
        if (generated.exit_code != 0) {
            LOGW("nm-initrd-generator failed: %s", trim(generated.stderr_str).c_str());
        }
    }

    LOGI("Starting NetworkManager (timeout %us)", timeout);
    pid_t pid = platform.spawn({NETWORK_MANAGER_PATH, "--configure-and-quit=initrd",
                                "--no-daemon"});
    if (pid < 0) {
        return network_failure("cannot start NetworkManager: " + platform.last_error());
    }

    bool online;
    if (platform.has_program(NM_ONLINE_PATH)) {
        auto result = platform.run({NM_ONLINE_PATH, "-t", std::to_string(timeout), "-s"});
        online = result.exit_code == 0;
    } else {
        // Without nm-online a global address is the only reachability signal
        online = wait_for_address(platform, timeout);
    }

    // NetworkManager quits by itself once the initrd profile is applied
    unsigned waited = 0;
    std::optional<int> status = platform.try_reap(pid);
    while (!status && waited < timeout) {
        platform.sleep_seconds(1);
        ++waited;
        status = platform.try_reap(pid);
    }
    if (!status) {
        LOGW("NetworkManager still running after %us, stopping it", timeout);
        platform.terminate(pid);
    } else if (*status != 0) {
        LOGW("NetworkManager exited with %d", *status);
    }

    return online;
}

}  // namespace

std::optional<NetworkSpec> parse_network_spec(const std::string& text) {
    NetworkSpec spec;
    if (text.empty() || is_dhcp_word(text)) {
        spec.mode = NetworkSpec::Mode::Dhcp;
        return spec;
    }
    if (is_off_word(text)) {
        spec.mode = NetworkSpec::Mode::Off;
        return spec;
    }

    auto fields = split(text, ':');
    if (fields.size() == 2) {
        if (fields[0].empty() || !is_dhcp_word(fields[1]))
            return std::nullopt;
        spec.mode = NetworkSpec::Mode::Dhcp;
        spec.interface = fields[0];
        return spec;
    }

    if (fields.size() < 4 || fields.size() > 9)
        return std::nullopt;

    auto field = [&fields](size_t i) { return i < fields.size() ? fields[i] : std::string(); };
    spec.client = field(0);
    spec.server = field(1);
    spec.gateway = field(2);
    spec.hostname = field(4);
    spec.interface = field(5);
    std::string autoconf = field(6);

    if (autoconf.empty()) {
        spec.mode = spec.client.empty() ? NetworkSpec::Mode::Dhcp : NetworkSpec::Mode::Static;
    } else if (is_off_word(autoconf) || autoconf == "static") {
        spec.mode = NetworkSpec::Mode::Static;
    } else if (is_dhcp_word(autoconf)) {
        spec.mode = NetworkSpec::Mode::Dhcp;
    } else {
        return std::nullopt;
    }

    for (size_t i = 7; i < fields.size(); ++i) {
        if (fields[i].empty())
            continue;
        if (!parse_ipv4(fields[i], nullptr))
            return std::nullopt;
        spec.dns.push_back(fields[i]);
    }

    if (spec.mode == NetworkSpec::Mode::Dhcp)
        return spec;

    if (!parse_ipv4(spec.client, nullptr))
        return std::nullopt;
    if (!spec.server.empty() && !parse_ipv4(spec.server, nullptr))
        return std::nullopt;
    if (!spec.gateway.empty() && !parse_ipv4(spec.gateway, nullptr))
        return std::nullopt;
    auto prefix = parse_prefix(field(3));
    if (!prefix)
        return std::nullopt;
    spec.prefix_length = *prefix;
    return spec;
}

MaybeFailure configure_network(Platform& platform, const BootConfig& config,
                               const Settings& settings, NetworkPolicy policy) {
    auto spec = parse_network_spec(config.network_spec);
    if (!spec) {
        return network_failure("malformed ip=" + config.network_spec);
    }

    if (spec->mode == NetworkSpec::Mode::Off) {
        if (policy == NetworkPolicy::RequireOnline) {
            return network_failure("ip=" + config.network_spec +
                                   " disables networking but the root needs it");
        }
        LOGI("Networking disabled by ip=%s", config.network_spec.c_str());
        return std::nullopt;
    }

    unsigned timeout = settings.network_timeout;
    bool online;
    if (platform.has_program(NETWORK_MANAGER_PATH)) {
        auto result = run_network_manager(platform, timeout);
        if (!result)
            return result.failure();
        online = result.value();
    } else {
        LOGI("NetworkManager not found, configuring manually");
        auto failure = configure_manual(platform, *spec);
        if (failure)
            return failure;
        // Without NetworkManager a global address is the only reachability signal
        online = wait_for_address(platform, timeout);
    }

    if (online) {
        LOGI("Network is online");
        return std::nullopt;
    }

    if (platform.has_global_address()) {
        if (policy == NetworkPolicy::BestEffort) {
            LOGW("Network not confirmed online after %us, continuing with the address we have",
                 timeout);
            return std::nullopt;
        }
        return network_failure("network not reachable after " + std::to_string(timeout) + "s");
    }
    return network_failure("no global address after " + std::to_string(timeout) + "s");
}

}  // namespace rdinit
