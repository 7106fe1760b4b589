#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rdinit {

// Entry point when rdinit is run by hand instead of as PID 1
int cli_run(int argc, char* argv[]);

struct CliOption {
    std::string long_name;
    char short_name;
    std::string description;
    bool takes_value;
    std::string default_value;
};

class CliParser {
public:
    void add_option(const CliOption& opt);
    // Returns false on an unknown option or a missing value
    bool parse(int argc, char* argv[]);

    std::optional<std::string> get_option(const std::string& name) const;
    bool has_option(const std::string& name) const;
    const std::vector<std::string>& positional() const { return positional_args_; }

    // One line per option, for usage text
    std::string describe_options() const;

private:
    std::vector<CliOption> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
};

}  // namespace rdinit
