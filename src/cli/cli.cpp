#include "cli/cli.hpp"
#include <climits>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace prov {

// ==========================================
// ArgValue / Args
// ==========================================

// Read through stod so "1e3" is 1000 rather than stopping at the exponent
int ArgValue::as_int(int default_val) const {
    if (!is_set) return default_val;
    double number = std::stod(value);
    if (number != std::floor(number) || number < INT_MIN || number > INT_MAX) {
        throw std::invalid_argument("Expected a whole number, got '" + value + "'");
    }
    return static_cast<int>(number);
}

double ArgValue::as_double(double default_val) const {
    return is_set ? std::stod(value) : default_val;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return ArgValue{default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

std::string Args::require(const std::string& name) const {
    if (!has(name)) {
        throw std::runtime_error("Missing required argument: --" + name);
    }
    return named.at(name).value;
}

// ==========================================
// Help output
// ==========================================

void Command::print_help(const std::string& program_name) const {
    std::cout << "\nUsage: " << program_name << " " << name;
    for (const auto& arg : args) {
        if (arg.required) std::cout << " --" << arg.name << " <value>";
    }
    std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& arg : args) {
        std::string flag = "--" + arg.name;
        if (!arg.short_name.empty()) flag += ", -" + arg.short_name;
        if (!arg.is_flag) flag += arg.numeric ? " <number>" : " <value>";

        std::cout << "  " << flag << "\n      " << arg.description;
        if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
        if (arg.required) std::cout << " [required]";
        std::cout << "\n";
    }
    std::cout << "\n";
}

void CLI::print_help() const {
    std::cout << program_name_ << " - Provenance Relationship Graph CLI\n\n"
              << "Usage: " << program_name_ << " <command> [options]\n\n"
              << "Commands:\n";
    for (const auto& [name, cmd] : commands_) {
        std::cout << "  " << std::left << std::setw(16) << name << cmd.description << "\n";
    }
    std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n"
              << "\nVersion: " << version_ << "\n";
}

// ==========================================
// Dispatch
// ==========================================

int CLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_help();
        return 1;
    }

    std::string cmd_name = argv[1];
    if (cmd_name == "--help" || cmd_name == "-h") {
        print_help();
        return 0;
    }
    if (cmd_name == "--version") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(cmd_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << cmd_name << "\n"
                  << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& cmd = it->second;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cmd.print_help(program_name_);
            return 0;
        }
    }

    Args args;
    try {
        args = parse_args(argc - 2, argv + 2, cmd);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        cmd.print_help(program_name_);
        return 1;
    }

    try {
        return cmd.handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

static bool is_number(const std::string& text) {
    if (text.empty()) return false;
    size_t used = 0;
    try {
        std::stod(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    return used == text.size();
}

Args CLI::parse_args(int argc, char** argv, const Command& cmd) {
    std::map<std::string, const ArgDef*> lookup;
    for (const auto& def : cmd.args) {
        lookup["--" + def.name] = &def;
        if (!def.short_name.empty()) lookup["-" + def.short_name] = &def;
    }

    Args result;
    for (int i = 0; i < argc; ++i) {
        std::string token = argv[i];
        if (token.empty() || token[0] != '-') {
            result.positional.push_back(token);
            continue;
        }

        // --name=value
        std::string inline_value;
        bool has_inline = false;
        auto eq = token.find('=');
        if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = token.substr(eq + 1);
            token = token.substr(0, eq);
            has_inline = true;
        }

        auto found = lookup.find(token);
        if (found == lookup.end()) {
            throw std::runtime_error("Unknown argument: " + token);
        }
        const ArgDef& def = *found->second;

        std::string value;
        if (def.is_flag) {
            value = "true";
        } else if (has_inline) {
            value = inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw std::runtime_error("Argument " + token + " requires a value");
        }

        if (def.numeric && !is_number(value)) {
            throw std::runtime_error("Argument --" + def.name + " expects a number, got '" + value + "'");
        }
        result.named[def.name] = ArgValue{value, true};
    }

    for (const auto& def : cmd.args) {
        if (result.named.count(def.name)) continue;
        if (def.required) {
            throw std::runtime_error("Missing required argument: --" + def.name);
        }
        if (!def.default_value.empty()) {
            result.named[def.name] = ArgValue{def.default_value, true};
        }
    }

    return result;
}

} // namespace prov
