/**
 * rdinit-validate - static checks for an initramfs image or directory
 *
 * Exit codes: 0 all checks passed, 1 errors (will not boot), 2 warnings only.
 */

#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <memory>
#include <string>

#include "../cli.hpp"
#include "../log.hpp"
#include "image_tree.hpp"
#include "validator.hpp"

namespace {

const char* RED = "\033[0;31m";
const char* YELLOW = "\033[1;33m";
const char* GREEN = "\033[0;32m";
const char* NC = "\033[0m";

void print_usage(const rdinit::CliParser& parser) {
    printf("USAGE: rdinit-validate [OPTIONS] <initramfs.img|initramfs-directory>\n\n");
    printf("Validates an initramfs image or extracted directory for common issues.\n\n");
    printf("OPTIONS:\n%s", parser.describe_options().c_str());
}

void print_report(const rdinit::ValidationReport& report, const std::string& target, bool color,
                  bool quiet) {
    auto paint = [color](const char* code) { return color ? code : ""; };

    printf("\n==========================================\n");
    printf("Validating initramfs: %s\n", target.c_str());
    printf("==========================================\n");

    std::string section;
    for (const auto& finding : report.findings()) {
        if (quiet && (finding.severity == rdinit::Severity::Ok ||
                      finding.severity == rdinit::Severity::Info))
            continue;
        if (finding.section != section) {
            section = finding.section;
            printf("\n--- %s ---\n", section.c_str());
        }
        switch (finding.severity) {
        case rdinit::Severity::Ok:
            printf("%s[OK]%s %s\n", paint(GREEN), paint(NC), finding.message.c_str());
            break;
        case rdinit::Severity::Info:
            printf("[INFO] %s\n", finding.message.c_str());
            break;
        case rdinit::Severity::Warning:
            printf("%s[WARN]%s %s\n", paint(YELLOW), paint(NC), finding.message.c_str());
            break;
        case rdinit::Severity::Error:
            printf("%s[ERROR]%s %s\n", paint(RED), paint(NC), finding.message.c_str());
            break;
        }
    }

    printf("\n==========================================\n");
    printf("Validation Summary\n");
    printf("==========================================\n\n");
    if (report.error_count() > 0) {
        printf("%sERRORS: %d%s - initramfs may not boot\n", paint(RED), report.error_count(),
               paint(NC));
    }
    if (report.warning_count() > 0) {
        printf("%sWARNINGS: %d%s - review recommended\n", paint(YELLOW), report.warning_count(),
               paint(NC));
    }
    if (report.error_count() == 0 && report.warning_count() == 0) {
        printf("%sAll checks passed!%s\n", paint(GREEN), paint(NC));
    }
    printf("\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    rdinit::log_init("rdinit-validate");
    rdinit::log_set_level(rdinit::LogLevel::WARN);

    rdinit::CliParser parser;
    parser.add_option({"quiet", 'q', "Only show warnings and errors", false, ""});
    parser.add_option({"no-color", 'n', "Disable colored output", false, ""});
    parser.add_option({"verbose", 'v', "Log what is being done", false, ""});
    parser.add_option({"help", 'h', "Show this help", false, ""});

    if (!parser.parse(argc, argv) || parser.has_option("help") ||
        parser.positional().size() != 1) {
        print_usage(parser);
        return parser.has_option("help") ? 0 : 1;
    }
    if (parser.has_option("verbose"))
        rdinit::log_set_level(rdinit::LogLevel::DEBUG);

    const std::string& target = parser.positional().front();
    struct stat st;
    if (stat(target.c_str(), &st) != 0) {
        LOGE("Target not found: %s", target.c_str());
        return 1;
    }

    std::unique_ptr<rdinit::ImageTree> tree;
    if (S_ISDIR(st.st_mode)) {
        tree.reset(new rdinit::DirectoryTree(target));
    } else {
        std::string error;
        auto archive = rdinit::load_archive(target, &error);
        if (!archive) {
            LOGE("%s: %s", target.c_str(), error.c_str());
            return 1;
        }
        tree = std::move(archive);
    }

    bool color = !parser.has_option("no-color") && isatty(STDOUT_FILENO);
    auto report = rdinit::validate_image(*tree);
    print_report(report, target, color, parser.has_option("quiet"));
    return report.exit_code();
}
