#include "cli.hpp"
#include "core/boot_config.hpp"
#include "core/settings.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <cstdio>
#include <iostream>

namespace rdinit {

void CliParser::add_option(const CliOption& opt) {
    options_.push_back(opt);
}

bool CliParser::parse(int argc, char* argv[]) {
    bool ok = true;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.empty())
            continue;

        // Check if it's an option
        if (arg[0] == '-' && arg.size() > 1) {
            const CliOption* match = nullptr;
            std::string opt_value;
            bool has_inline_value = false;

            // Long option
            if (arg[1] == '-') {
                std::string opt_name = arg.substr(2);
                size_t eq_pos = opt_name.find('=');
                if (eq_pos != std::string::npos) {
                    opt_value = opt_name.substr(eq_pos + 1);
                    opt_name = opt_name.substr(0, eq_pos);
                    has_inline_value = true;
                }
                for (const auto& opt : options_) {
                    if (opt.long_name == opt_name) {
                        match = &opt;
                        break;
                    }
                }
            }
            // Short option
            else {
                for (const auto& opt : options_) {
                    if (opt.short_name != '\0' && opt.short_name == arg[1]) {
                        match = &opt;
                        break;
                    }
                }
            }

            if (!match) {
                LOGE("Unknown option: %s", arg.c_str());
                ok = false;
                continue;
            }

            if (match->takes_value && !has_inline_value) {
                if (i + 1 >= argc) {
                    LOGE("Option %s needs a value", arg.c_str());
                    ok = false;
                    continue;
                }
                opt_value = argv[++i];
            }
            parsed_options_[match->long_name] = match->takes_value ? opt_value : "true";
        }
        // Positional argument
        else {
            positional_args_.push_back(arg);
        }
    }

    return ok;
}

std::optional<std::string> CliParser::get_option(const std::string& name) const {
    auto it = parsed_options_.find(name);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    // Return default value if exists
    for (const auto& opt : options_) {
        if (opt.long_name == name && !opt.default_value.empty()) {
            return opt.default_value;
        }
    }

    return std::nullopt;
}

bool CliParser::has_option(const std::string& name) const {
    return parsed_options_.find(name) != parsed_options_.end();
}

std::string CliParser::describe_options() const {
    std::string out;
    for (const auto& opt : options_) {
        std::string flag = "  ";
        if (opt.short_name != '\0') {
            flag += "-";
            flag += opt.short_name;
            flag += ", ";
        } else {
            flag += "    ";
        }
        flag += "--" + opt.long_name;
        if (opt.takes_value)
            flag += " <value>";
        while (flag.size() < 30)
            flag += ' ';
        out += flag + opt.description + "\n";
    }
    return out;
}

static void print_usage() {
    printf("rdinit - initramfs boot sequencer\n\n");
    printf("When started as PID 1 it boots the system. Otherwise:\n\n");
    printf("USAGE: rdinit <COMMAND>\n\n");
    printf("COMMANDS:\n");
    printf("  check-cmdline  Parse a kernel command line and show the boot plan\n");
    printf("  version        Show version\n");
    printf("  help           Show this help\n");
}

static void print_version() {
    printf("rdinit %s\n", RDINIT_VERSION);
}

static int cmd_check_cmdline(int argc, char* argv[]) {
    CliParser parser;
    parser.add_option({"cmdline", 'c', "Command line to parse (default: /proc/cmdline)", true, ""});
    parser.add_option({"settings", 's', "Settings file", true, SETTINGS_PATH});
    parser.add_option({"help", 'h', "Show this help", false, ""});

    if (!parser.parse(argc, argv) || parser.has_option("help")) {
        printf("USAGE: rdinit check-cmdline [OPTIONS]\n\n%s", parser.describe_options().c_str());
        return parser.has_option("help") ? 0 : 1;
    }

    Settings settings = Settings::from_file(*parser.get_option("settings"));

    std::string cmdline;
    if (auto text = parser.get_option("cmdline")) {
        cmdline = *text;
    } else {
        auto content = read_file(CMDLINE_PATH);
        if (!content) {
            LOGE("Cannot read %s", CMDLINE_PATH);
            return 1;
        }
        cmdline = trim(*content);
    }

    auto config = parse_cmdline(cmdline, settings);
    if (!config) {
        std::cerr << config.failure().summary() << std::endl;
        return 1;
    }

    std::cout << describe_config(config.value());
    return 0;
}

int cli_run(int argc, char* argv[]) {
    log_init("rdinit");

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string cmd = argv[1];

    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
        print_usage();
        return 0;
    } else if (cmd == "version" || cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    } else if (cmd == "check-cmdline") {
        return cmd_check_cmdline(argc - 1, argv + 1);
    }

    LOGE("Unknown command: %s", cmd.c_str());
    print_usage();
    return 1;
}

}  // namespace rdinit
