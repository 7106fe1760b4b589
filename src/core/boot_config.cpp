#include "boot_config.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include "settings.hpp"

#include <algorithm>
#include <sstream>

namespace rdinit {

std::optional<DeviceSpec> DeviceSpec::parse(const std::string& text) {
    DeviceSpec spec;
    if (starts_with(text, "UUID=")) {
        spec.kind = Kind::Uuid;
        spec.value = text.substr(5);
    } else if (starts_with(text, "LABEL=")) {
        spec.kind = Kind::Label;
        spec.value = text.substr(6);
    } else if (starts_with(text, "PARTUUID=")) {
        spec.kind = Kind::PartUuid;
        spec.value = text.substr(9);
    } else if (starts_with(text, "/")) {
        spec.kind = Kind::Path;
        spec.value = text;
    } else if (!text.empty() && text.find_first_of("=:") == std::string::npos) {
        spec.kind = Kind::Path;
        spec.value = "/dev/" + text;
    } else {
        return std::nullopt;
    }

    if (spec.value.empty())
        return std::nullopt;
    return spec;
}

DeviceSpec DeviceSpec::path(const std::string& path) {
    DeviceSpec spec;
    spec.kind = Kind::Path;
    spec.value = path;
    return spec;
}

std::string DeviceSpec::text() const {
    switch (kind) {
    case Kind::Uuid:
        return "UUID=" + value;
    case Kind::Label:
        return "LABEL=" + value;
    case Kind::PartUuid:
        return "PARTUUID=" + value;
    case Kind::Path:
        break;
    }
    return value;
}

SquashfsSource parse_squashfs_source(const std::string& text) {
    if (starts_with(text, "http://") || starts_with(text, "https://")) {
        return SquashfsHttpFile{text};
    }

    if (starts_with(text, "nfs:")) {
        // nfs:server:/path/to/file.squashfs
        std::string rest = text.substr(4);
        size_t colon = rest.find(':');
        if (colon != std::string::npos) {
            return SquashfsNfsFile{rest.substr(0, colon), rest.substr(colon + 1)};
        }
        return SquashfsNfsFile{rest, ""};
    }

    if (starts_with(text, "UUID=") || starts_with(text, "LABEL=") ||
        starts_with(text, "PARTUUID=") || (starts_with(text, "/dev/") &&
                                           text.find(':') != std::string::npos)) {
        std::string device_text = text;
        std::string inner = DEFAULT_SQUASHFS_NAME;
        size_t colon = text.find(':');
        if (colon != std::string::npos) {
            device_text = text.substr(0, colon);
            inner = text.substr(colon + 1);
            if (inner.empty() || inner[0] != '/')
                inner = "/" + inner;
        }
        auto device = DeviceSpec::parse(device_text);
        if (device) {
            return SquashfsDeviceFile{*device, inner};
        }
    }

    return SquashfsLocalFile{text};
}

bool squashfs_source_needs_network(const SquashfsSource& source) {
    return std::holds_alternative<SquashfsNfsFile>(source) ||
           std::holds_alternative<SquashfsHttpFile>(source);
}

namespace {

struct StrategyNamer {
    const char* operator()(const PlainRoot&) const { return "plain"; }
    const char* operator()(const LuksRoot& r) const { return r.lvm ? "lvm-on-luks" : "luks"; }
    const char* operator()(const LvmRoot&) const { return "lvm"; }
    const char* operator()(const SquashfsRoot&) const { return "squashfs-overlay"; }
    const char* operator()(const NetworkRoot&) const { return "nfs"; }
};

bool network_disabled(const std::string& spec) {
    return spec == "off" || spec == "none";
}

std::optional<LuksSpec> parse_luks_uuid(const std::string& value) {
    std::string uuid = value;
    if (starts_with(uuid, "luks-"))
        uuid = uuid.substr(5);
    if (uuid.empty())
        return std::nullopt;

    LuksSpec spec;
    spec.source.kind = DeviceSpec::Kind::Uuid;
    spec.source.value = uuid;
    spec.mapper_name = "luks-" + uuid;
    return spec;
}

// cryptdevice=<spec>:<mapper-name>[:<options>]
std::optional<LuksSpec> parse_cryptdevice(const std::string& value) {
    auto fields = split(value, ':');
    if (fields.size() < 2 || fields[1].empty())
        return std::nullopt;

    auto source = DeviceSpec::parse(fields[0]);
    if (!source)
        return std::nullopt;

    LuksSpec spec;
    spec.source = *source;
    spec.mapper_name = fields[1];
    if (fields.size() > 2)
        spec.options = fields[2];
    return spec;
}

}  // namespace

const char* strategy_name(const RootStrategy& strategy) {
    return std::visit(StrategyNamer{}, strategy);
}

bool BootConfig::needs_network() const {
    if (std::holds_alternative<NetworkRoot>(strategy))
        return true;
    if (auto* squashfs = std::get_if<SquashfsRoot>(&strategy)) {
        if (squashfs_source_needs_network(squashfs->source))
            return true;
    }
    return !network_spec.empty() && !network_disabled(network_spec);
}

std::vector<std::string> tokenize_cmdline(const std::string& cmdline,
                                          std::vector<std::string>* init_args) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quote = false;
    bool have_token = false;
    bool after_separator = false;

    auto flush = [&]() {
        if (!have_token)
            return;
        if (after_separator) {
            if (init_args)
                init_args->push_back(current);
        } else if (!in_quote && current == "--") {
            after_separator = true;
        } else {
            tokens.push_back(current);
        }
        current.clear();
        have_token = false;
    };

    for (char c : cmdline) {
        if (c == '"') {
            in_quote = !in_quote;
            have_token = true;
            continue;
        }
        if (!in_quote && (c == ' ' || c == '\t' || c == '\n' || c == '\r')) {
            flush();
            continue;
        }
        current += c;
        have_token = true;
    }
    flush();

    return tokens;
}

std::optional<NfsSpec> parse_nfs_spec(const std::string& text) {
    // server:/path[:options] or server:/path[,options]
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0)
        return std::nullopt;

    NfsSpec spec;
    spec.server = text.substr(0, colon);
    std::string rest = text.substr(colon + 1);

    size_t opt_sep = rest.find_first_of(":,");
    if (opt_sep != std::string::npos) {
        spec.options = rest.substr(opt_sep + 1);
        rest = rest.substr(0, opt_sep);
    }
    if (rest.empty() || rest[0] != '/')
        return std::nullopt;

    spec.path = rest;
    return spec;
}

Outcome<BootConfig> parse_cmdline(const std::string& cmdline, const Settings& settings) {
    BootConfig config;
    config.overlay_size_bytes = settings.overlay_size;

    for (const auto& token : tokenize_cmdline(cmdline, &config.init_args)) {
        std::string key = token;
        std::string value;
        bool has_value = false;
        size_t eq = token.find('=');
        if (eq != std::string::npos) {
            key = token.substr(0, eq);
            value = token.substr(eq + 1);
            has_value = true;
        }

        if (key == "root" && has_value) {
            config.root = value;
        } else if (key == "rootfstype" && has_value) {
            config.rootfstype = value.empty() ? "auto" : value;
        } else if (key == "rootflags" && has_value) {
            config.rootflags = value;
        } else if (key == "ro" && !has_value) {
            config.read_only = true;
        } else if (key == "rw" && !has_value) {
            config.read_only = false;
        } else if (key == "rootdelay" && has_value) {
            auto seconds = parse_unsigned(value);
            if (seconds && *seconds <= UINT32_MAX) {
                config.root_delay_seconds = static_cast<unsigned>(*seconds);
            } else {
                LOGW("Ignoring malformed rootdelay=%s", value.c_str());
            }
        } else if (key == "rootwait" && !has_value) {
            config.root_wait_forever = true;
        } else if (key == "init" && has_value) {
            if (!value.empty())
                config.init = value;
        } else if (key == "break" || key == "rd.break") {
            std::vector<std::string> stages =
                has_value ? split(value, ',') : std::vector<std::string>{BREAK_PREMOUNT};
            for (const auto& stage : stages) {
                if (std::find(BREAK_CHECKPOINTS.begin(), BREAK_CHECKPOINTS.end(), stage) ==
                    BREAK_CHECKPOINTS.end()) {
                    LOGW("Ignoring unknown break stage '%s'", stage.c_str());
                    continue;
                }
                config.break_stages.insert(stage);
            }
        } else if ((key == "debug" || key == "rd.debug") && !has_value) {
            config.debug = true;
        } else if (key == "ip" && has_value) {
            config.network_spec = value;
        } else if (key == "squashfs" && has_value) {
            config.squashfs_spec = value;
        } else if (key == "overlay_size" && has_value) {
            auto size = parse_size(value);
            if (size) {
                config.overlay_size_bytes = *size;
            } else {
                LOGW("Ignoring malformed overlay_size=%s", value.c_str());
            }
        } else if (key == "persistent" && has_value) {
            config.persistent_device_spec = value;
        } else if (key == "toram" && !has_value) {
            config.to_ram = true;
        } else if (key == "rd.luks.uuid" && has_value) {
            auto luks = parse_luks_uuid(value);
            if (luks) {
                config.luks = luks;
            } else {
                LOGW("Ignoring malformed rd.luks.uuid=%s", value.c_str());
            }
        } else if (key == "cryptdevice" && has_value) {
            auto luks = parse_cryptdevice(value);
            if (luks) {
                config.luks = luks;
            } else {
                LOGW("Ignoring malformed cryptdevice=%s", value.c_str());
            }
        } else if (key == "rd.lvm.vg" && has_value) {
            if (!config.lvm)
                config.lvm = LvmSpec{};
            config.lvm->vg = value;
        } else if (key == "rd.lvm.lv" && has_value) {
            if (!config.lvm)
                config.lvm = LvmSpec{};
            size_t slash = value.find('/');
            if (slash != std::string::npos) {
                config.lvm->vg = value.substr(0, slash);
                config.lvm->lv = value.substr(slash + 1);
            } else {
                config.lvm->lv = value;
            }
        } else if (key == "nfsroot" && has_value) {
            config.nfsroot = value;
        } else if (key == "rd.driver.pre" && has_value) {
            for (const auto& module : split(value, ',')) {
                if (!module.empty())
                    config.extra_modules.push_back(module);
            }
        }
    }

    // Strategy precedence: squashfs, network root, LUKS, LVM, plain
    if (!config.squashfs_spec.empty()) {
        config.strategy = SquashfsRoot{parse_squashfs_source(config.squashfs_spec)};
        return config;
    }

    if (config.root.empty()) {
        return make_failure(BootStage::CmdlineParsed, FailureKind::MissingRootSpecifier,
                            "no root= or squashfs= on the kernel command line");
    }

    if (starts_with(config.root, "nfs:") || config.root == "/dev/nfs") {
        std::optional<NfsSpec> nfs;
        if (config.root == "/dev/nfs") {
            nfs = parse_nfs_spec(config.nfsroot);
        } else {
            nfs = parse_nfs_spec(config.root.substr(4));
        }
        if (!nfs) {
            return make_failure(BootStage::CmdlineParsed, FailureKind::MissingRootSpecifier,
                                "root=" + config.root + " does not name a usable NFS export");
        }
        config.strategy = NetworkRoot{*nfs};
        return config;
    }

    auto device = DeviceSpec::parse(config.root);
    if (!device) {
        return make_failure(BootStage::CmdlineParsed, FailureKind::MissingRootSpecifier,
                            "root=" + config.root + " is not a device specifier");
    }

    DeviceSpec root_device = *device;
    if (config.lvm && !config.lvm->vg.empty() && !config.lvm->lv.empty()) {
        root_device = DeviceSpec::path("/dev/" + config.lvm->vg + "/" + config.lvm->lv);
    }

    if (config.luks) {
        config.strategy = LuksRoot{*config.luks, config.lvm, root_device};
    } else if (config.lvm) {
        config.strategy = LvmRoot{*config.lvm, root_device};
    } else {
        config.strategy = PlainRoot{*device};
    }

    return config;
}

std::string describe_config(const BootConfig& config) {
    std::ostringstream out;
    out << "strategy:      " << strategy_name(config.strategy) << "\n";
    out << "root:          " << (config.root.empty() ? "-" : config.root) << "\n";
    out << "rootfstype:    " << config.rootfstype << "\n";
    out << "rootflags:     " << (config.rootflags.empty() ? "-" : config.rootflags) << "\n";
    out << "mode:          " << (config.read_only ? "ro" : "rw") << "\n";
    out << "init:          " << config.init << "\n";
    if (config.root_wait_forever) {
        out << "root wait:     forever\n";
    } else if (config.root_delay_seconds) {
        out << "root wait:     " << *config.root_delay_seconds << "s\n";
    }
    if (!config.break_stages.empty()) {
        std::vector<std::string> stages(config.break_stages.begin(), config.break_stages.end());
        out << "break:         " << join(stages, ",") << "\n";
    }
    if (!config.network_spec.empty())
        out << "ip:            " << config.network_spec << "\n";
    if (!config.squashfs_spec.empty()) {
        out << "squashfs:      " << config.squashfs_spec << "\n";
        out << "overlay size:  " << config.overlay_size_bytes << " bytes\n";
        out << "persistent:    "
            << (config.persistent_device_spec.empty() ? "-" : config.persistent_device_spec)
            << "\n";
        out << "toram:         " << (config.to_ram ? "yes" : "no") << "\n";
    }
    if (config.luks) {
        out << "luks:          " << config.luks->source.text() << " -> "
            << config.luks->mapper_path() << "\n";
    }
    if (config.lvm) {
        out << "lvm:           vg=" << (config.lvm->vg.empty() ? "*" : config.lvm->vg)
            << " lv=" << (config.lvm->lv.empty() ? "-" : config.lvm->lv) << "\n";
    }
    if (!config.extra_modules.empty())
        out << "extra modules: " << join(config.extra_modules, ",") << "\n";
    if (!config.init_args.empty())
        out << "init args:     " << join(config.init_args, " ") << "\n";
    out << "debug:         " << (config.debug ? "yes" : "no") << "\n";
    return out.str();
}

}  // namespace rdinit
