#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace prov {

// One parsed option value
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    // Numeric options are checked while parsing, so these only fall back
    // to the default when the option is absent. as_int throws
    // std::invalid_argument for a value with a fractional part.
    int as_int(int default_val = 0) const;
    double as_double(double default_val = 0.0) const;
};

// Parsed options and positional arguments of one command
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;

    // Throws std::runtime_error when the option was not given
    std::string require(const std::string& name) const;
};

// Option definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;   // Presence alone sets the option
    bool numeric = false;   // Value must parse as a number
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const;
};

// Subcommand dispatcher: `program <command> [--option value] [--flag]`.
// Handler exceptions are reported on stderr and turn into exit code 1.
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv);
    void print_help() const;

    static Args parse_args(int argc, char** argv, const Command& cmd);

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace prov
