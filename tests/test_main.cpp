#include <iomanip>

#include "../src/log.hpp"
#include "test_framework.hpp"

#define COLOR_RESET "\033[0m"
#define COLOR_GREEN "\033[1;32m"
#define COLOR_RED "\033[1;31m"
#define COLOR_YELLOW "\033[1;33m"
#define COLOR_CYAN "\033[1;36m"

int main() {
    // Components log freely; keep the report readable
    rdinit::log_init("rdinit-test");
    rdinit::log_set_level(rdinit::LogLevel::ERROR);

    auto& registry = get_registry();

    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET
              << std::endl;
    std::cout << "    rdinit Test Suite" << std::endl;
    std::cout << "    Total Tests Registered: " << registry.size() << std::endl;
    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET
              << std::endl;

    int passed = 0;
    int failed = 0;

    for (const auto& test : registry) {
        std::cout << "[ RUN      ] " << std::left << std::setw(50) << test.name << std::flush;

        try {
            test.func();
            std::cout << "\r" << COLOR_GREEN << "[       OK ] " << COLOR_RESET << std::left
                      << std::setw(50) << test.name << std::endl;
            passed++;
        } catch (const std::exception& e) {
            std::cout << "\r" << COLOR_RED << "[  FAILED  ] " << COLOR_RESET << std::left
                      << std::setw(50) << test.name << " (" << COLOR_YELLOW << e.what()
                      << COLOR_RESET << ")" << std::endl;
            failed++;
        }
    }

    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET
              << std::endl;
    if (failed == 0) {
        std::cout << COLOR_GREEN << "  ALL TESTS PASSED (" << passed << "/" << passed << ")"
                  << COLOR_RESET << std::endl;
    } else {
        std::cout << COLOR_RED << "  TESTS FAILED: " << failed << " | Passed: " << passed
                  << COLOR_RESET << std::endl;
    }

    return (failed == 0) ? 0 : 1;
}
