#pragma once

/**
 * @file argparser.hxx
 * @brief Command-line argument parser with optional TOML config file
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Precedence (lowest → highest):
 *   1. Defaults registered with .default_val()
 *   2. Values from the file given by --config / -C
 *   3. Values from the command line
 *
 * Config file format: flat `key = value` lines, an optional table header
 * (ignored) and `#` comments. Strings may be double- or single-quoted.
 *
 *   [profile]
 *   threads    = 8
 *   iterations = 10000
 *   output     = "trace.tsv"   # where to write
 *   disabled   = false
 *
 * Supported argument types: int, bool, std::string, std::filesystem::path.
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <variant>
#include <vector>

namespace rprof::cli {

namespace fs = std::filesystem;

using Value = std::variant<int, bool, std::string, fs::path>;

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Argument descriptor ────────────────────────────────────────────────────

struct Arg {
    std::string name;    // long name, e.g. "threads"
    char shortName = 0;  // 0 = none
    std::string help;
    std::type_index type{typeid(void)};

    std::optional<Value> defaultValue;
    std::optional<int> minValue;  // inclusive, int only
    std::optional<int> maxValue;  // inclusive, int only

    auto shorthand(char short_name) -> Arg& {
        shortName = short_name;
        return *this;
    }

    auto description(std::string_view text) -> Arg& {
        help = text;
        return *this;
    }

    template <typename T>
    auto default_val(T value) -> Arg& {
        if constexpr (std::is_same_v<T, bool>) {
            check_type(typeid(bool));
            defaultValue = Value{value};
        } else if constexpr (std::is_same_v<T, fs::path>) {
            check_type(typeid(fs::path));
            defaultValue = Value{value};
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            check_type(typeid(std::string));
            defaultValue = Value{std::string{value}};
        } else if constexpr (std::is_integral_v<T>) {
            check_type(typeid(int));
            defaultValue = Value{static_cast<int>(value)};
        } else {
            static_assert(std::is_integral_v<T>, "unsupported default value type");
        }
        return *this;
    }

    auto min(int value) -> Arg& {
        check_type(typeid(int));
        minValue = value;
        return *this;
    }

    auto max(int value) -> Arg& {
        check_type(typeid(int));
        maxValue = value;
        return *this;
    }

   private:
    void check_type(std::type_index expected) const {
        if (type != expected) {
            throw ParseError(std::format("type mismatch in definition of --{}", name));
        }
    }
};

// ── Parser ─────────────────────────────────────────────────────────────────

class ArgParser {
   public:
    explicit ArgParser(std::string programName, std::string description = "")
        : programName_(std::move(programName)), description_(std::move(description)) {}

    template <typename T>
    auto add(std::string name) -> Arg& {
        static_assert(std::is_same_v<T, int> || std::is_same_v<T, bool> || std::is_same_v<T, std::string> || std::is_same_v<T, fs::path>,
                      "unsupported argument type");
        if (find_arg(name) != nullptr) {
            throw ParseError(std::format("duplicate argument registration: --{}", name));
        }
        args_.push_back(Arg{.name = std::move(name), .type = typeid(T)});
        return args_.back();
    }

    /**
     * Parses argv. `--help` prints usage and exits the process.
     * @throws ParseError on unknown, malformed or duplicate arguments.
     */
    void parse(int argc, char* argv[]) {
        for (const auto& arg : args_) {
            if (arg.defaultValue) {
                parsed_[arg.name] = *arg.defaultValue;
            }
        }

        std::vector<std::string> remaining;
        for (int i = 1; i < argc; ++i) {
            std::string tok(argv[i]);
            if (tok == "--config" || tok == "-C") {
                if (i + 1 >= argc) {
                    throw ParseError("--config requires a file path");
                }
                load_toml(argv[++i]);
            } else {
                remaining.push_back(std::move(tok));
            }
        }

        parse_cli_arguments(remaining);
    }

    template <typename T>
    auto get(const std::string& name) const -> T {
        auto value_it = parsed_.find(name);
        if (value_it == parsed_.end()) {
            throw ParseError(std::format("argument not found: {}", name));
        }
        if (!std::holds_alternative<T>(value_it->second)) {
            throw ParseError(std::format("type mismatch for --{}", name));
        }
        return std::get<T>(value_it->second);
    }

    void print_help() const {
        constexpr std::size_t HELP_COLUMN_WIDTH = 26;
        std::cout << "Usage: " << programName_ << " [options]\n";
        if (!description_.empty()) {
            std::cout << description_ << "\n";
        }
        std::cout << "\nOptions:\n";
        std::cout << "  -h, --help              Show this help message\n";
        std::cout << "  -C, --config <file>     Load parameters from a TOML file\n";
        for (const auto& arg : args_) {
            std::string left = "  --" + arg.name;
            if (arg.shortName != 0) {
                left += std::format(", -{}", arg.shortName);
            }
            left += std::format(" <{}>", type_to_string(arg.type));
            if (left.size() < HELP_COLUMN_WIDTH) {
                left.resize(HELP_COLUMN_WIDTH, ' ');
            } else {
                left += ' ';
            }
            std::cout << left << arg.help;
            if (arg.defaultValue) {
                std::cout << std::format(" [default: {}]", value_to_string(*arg.defaultValue));
            }
            if (arg.minValue && arg.maxValue) {
                std::cout << std::format(" [range: {}..{}]", *arg.minValue, *arg.maxValue);
            }
            std::cout << '\n';
        }
    }

   private:
    void parse_cli_arguments(const std::vector<std::string>& tokens) {
        std::set<std::string> seen;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto& tok = tokens[i];
            if (tok == "--help" || tok == "-h") {
                print_help();
                std::exit(0);
            }

            std::string key;
            if (tok.starts_with("--")) {
                key = tok.substr(2);
            } else if (tok.starts_with("-") && tok.size() == 2) {
                key = expand_short(tok[1]);
            } else {
                throw ParseError(std::format("unexpected token: {}", tok));
            }

            const Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError(std::format("unknown argument: --{}", key));
            }
            if (!seen.insert(key).second) {
                throw ParseError(std::format("duplicate argument: --{}", key));
            }

            // bool flags may stand alone
            if (arg->type == typeid(bool) && (i + 1 >= tokens.size() || tokens[i + 1].starts_with("-"))) {
                parsed_[key] = true;
                continue;
            }
            if (i + 1 >= tokens.size()) {
                throw ParseError(std::format("--{} requires a value", key));
            }
            Value value = parse_value(*arg, tokens[++i]);
            validate(*arg, value);
            parsed_[key] = std::move(value);
        }
    }

    void load_toml(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ParseError(std::format("cannot open config file: {}", path));
        }

        std::set<std::string> seen;
        std::string line;
        while (std::getline(file, line)) {
            const std::string stripped = strip_comment(trim(line));
            if (stripped.empty() || stripped[0] == '[') {
                continue;
            }
            const auto equal = stripped.find('=');
            if (equal == std::string::npos) {
                throw ParseError(std::format("malformed line in config file: {}", stripped));
            }
            const std::string key = trim(stripped.substr(0, equal));
            const Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError(std::format("unknown argument in config file: {}", key));
            }
            if (!seen.insert(key).second) {
                throw ParseError(std::format("duplicate key in config file: {}", key));
            }
            Value value = parse_value(*arg, trim(stripped.substr(equal + 1)));
            validate(*arg, value);
            parsed_[key] = std::move(value);
        }
    }

    static auto trim(const std::string& str) -> std::string {
        const auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        const auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }

    // Cuts at the first '#' outside quotes.
    static auto strip_comment(const std::string& text) -> std::string {
        char quote = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            const char chr = text[i];
            if (quote == 0 && (chr == '"' || chr == '\'')) {
                quote = chr;
            } else if (chr == quote) {
                quote = 0;
            } else if (quote == 0 && chr == '#') {
                return trim(text.substr(0, i));
            }
        }
        return text;
    }

    auto find_arg(const std::string& key) const -> const Arg* {
        for (const auto& arg : args_) {
            if (arg.name == key) {
                return &arg;
            }
        }
        return nullptr;
    }

    auto expand_short(char short_name) const -> std::string {
        for (const auto& arg : args_) {
            if (arg.shortName == short_name) {
                return arg.name;
            }
        }
        throw ParseError(std::format("unknown short option: -{}", short_name));
    }

    static auto parse_bool(const std::string& str) -> bool {
        if (str == "true" || str == "1" || str == "yes") {
            return true;
        }
        if (str == "false" || str == "0" || str == "no") {
            return false;
        }
        throw ParseError(std::format("invalid bool value: {}", str));
    }

    static auto parse_value(const Arg& arg, const std::string& raw) -> Value {
        std::string clean = raw;
        if (clean.size() >= 2 && (clean.front() == '"' || clean.front() == '\'') && clean.back() == clean.front()) {
            clean = clean.substr(1, clean.size() - 2);
        }

        if (arg.type == typeid(bool)) {
            return Value{parse_bool(clean)};
        }
        if (arg.type == typeid(std::string)) {
            return Value{clean};
        }
        if (arg.type == typeid(fs::path)) {
            return Value{fs::path{clean}};
        }
        try {
            std::size_t used = 0;
            const int value = std::stoi(clean, &used);
            if (used != clean.size()) {
                throw ParseError(std::format("invalid value for --{}: {}", arg.name, raw));
            }
            return Value{value};
        } catch (const std::invalid_argument&) {
            throw ParseError(std::format("invalid value for --{}: {}", arg.name, raw));
        } catch (const std::out_of_range&) {
            throw ParseError(std::format("value out of range for --{}: {}", arg.name, raw));
        }
    }

    static void validate(const Arg& arg, const Value& val) {
        if (!std::holds_alternative<int>(val)) {
            return;
        }
        const int int_value = std::get<int>(val);
        if (arg.minValue && int_value < *arg.minValue) {
            throw ParseError(std::format("--{}: value {} below minimum {}", arg.name, int_value, *arg.minValue));
        }
        if (arg.maxValue && int_value > *arg.maxValue) {
            throw ParseError(std::format("--{}: value {} above maximum {}", arg.name, int_value, *arg.maxValue));
        }
    }

    static auto value_to_string(const Value& value) -> std::string {
        return std::visit(
            [](const auto& val) -> std::string {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, bool>) {
                    return val ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return val;
                } else if constexpr (std::is_same_v<T, fs::path>) {
                    return val.string();
                } else {
                    return std::to_string(val);
                }
            },
            value);
    }

    static auto type_to_string(std::type_index type) -> std::string {
        if (type == typeid(int)) {
            return "int";
        }
        if (type == typeid(bool)) {
            return "bool";
        }
        if (type == typeid(std::string)) {
            return "string";
        }
        if (type == typeid(fs::path)) {
            return "path";
        }
        return "unknown";
    }

    std::string programName_;
    std::string description_;
    std::vector<Arg> args_;
    std::map<std::string, Value> parsed_;
};

/// Parses and, on failure, prints the error plus usage. Returns false on failure.
inline auto parse_or_report(ArgParser& parser, int argc, char* argv[]) -> bool {
    try {
        parser.parse(argc, argv);
        return true;
    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        parser.print_help();
        return false;
    }
}

}  // namespace rprof::cli
