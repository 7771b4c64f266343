#pragma once

#include <cstring> // std::strlen()
#include <optional>
#include <stdexcept> // std::invalid_argument
#include <string>
#include <string_view>
#include <type_traits> // std::is_same_v
#include <unordered_map>
#include <vector>

namespace ArgParsers {
    template<typename T>
    bool parse_to(std::string_view text, T *out);

    // Accepts 0/1 and false/true
    template<>
    inline bool parse_to<bool>(std::string_view text, bool *out) {
        if (text == "1" || text == "true") { *out = true; return true; }
        if (text == "0" || text == "false") { *out = false; return true; }
        return false;
    }
}

// Command line parser, used builder-style:
//
//   auto result = Args::parser()
//       .add_arg("d", "dry", opts.dry_run)
//       .add_arg("help", help)
//       .parse(argc, argv);
//
// Flags (bool) take no value, but `--dry=0` works. Short flags can be grouped
// (`-dlp`). Anything after `--` is positional.
class Args {
    using ParseFn = bool(void*, std::string_view);

    struct Binding {
        void *target;
        bool is_flag;
        ParseFn *parse;
    };

public:
    struct ParseResult {
        std::vector<std::string_view> remaining_args; // positional
        std::vector<std::string_view> unrecognized_options;
        std::vector<std::string> errors; // bad or missing values
    };

    static Args parser() {
        return Args();
    }

    template<typename T>
    Args &add_arg(std::string_view short_name, std::string_view long_name, T &target) {
        if (short_name.empty() && long_name.empty()) {
            throw std::invalid_argument("an option needs a short or a long name");
        }

        const auto binding = Binding {
            .target = &target,
            .is_flag = std::is_same_v<T, bool>,
            .parse = [](void *raw, std::string_view text) {
                return ArgParsers::parse_to(text, static_cast<T*>(raw));
            }
        };

        if (!short_name.empty()) short_options.emplace(short_name, binding);
        if (!long_name.empty()) long_options.emplace(long_name, binding);

        return *this;
    }

    template<typename T>
    Args &add_arg(std::string_view long_name, T &target) {
        return add_arg({}, long_name, target);
    }

    ParseResult parse(std::size_t argc, char **argv) {
        auto result = ParseResult{};

        std::size_t i = 1; // argv[0] is the program name
        while (i < argc) {
            const auto word = view_of(argv[i++]);

            if (word == "--") {
                while (i < argc) result.remaining_args.push_back(view_of(argv[i++]));
                break;
            }

            if (word.size() < 2 || word[0] != '-') {
                result.remaining_args.push_back(word);
                continue;
            }

            auto next = i < argc ? std::optional{ view_of(argv[i]) } : std::nullopt;
            bool took_next = false;
            if (word[1] == '-') {
                took_next = apply(long_options, word, word.substr(2), next, result);
            } else {
                took_next = apply_short(word, next, result);
            }
            if (took_next) i += 1;
        }

        return result;
    }

private:
    using OptionMap = std::unordered_map<std::string_view, Binding>;

    static std::string_view view_of(const char *c_str) {
        return c_str ? std::string_view(c_str, std::strlen(c_str)) : std::string_view{};
    }

    // -d, -d=1, -d 1, or a group of flags such as -dlp
    bool apply_short(std::string_view word, std::optional<std::string_view> next, ParseResult &result) {
        auto name = word.substr(1);
        if (name.find('=') != name.npos || short_options.count(name)) {
            return apply(short_options, word, name, next, result);
        }

        for (std::size_t k = 0; k < name.size(); ++k) {
            auto it = short_options.find(name.substr(k, 1));
            if (it == short_options.end() || !it->second.is_flag) {
                result.unrecognized_options.push_back(word);
                return false;
            }
        }
        for (std::size_t k = 0; k < name.size(); ++k) {
            apply(short_options, word, name.substr(k, 1), std::nullopt, result);
        }
        return false;
    }

    // Returns true if the value came from `next`.
    static bool apply(const OptionMap &options, std::string_view word, std::string_view name,
                      std::optional<std::string_view> next, ParseResult &result) {
        std::optional<std::string_view> value{};
        if (auto eq = name.find('='); eq != name.npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        auto it = options.find(name);
        if (it == options.end()) {
            result.unrecognized_options.push_back(word);
            return false;
        }

        const Binding &binding = it->second;
        bool took_next = false;
        if (!value && binding.is_flag) {
            value = "1";
        } else if (!value && next) {
            value = next;
            took_next = true;
        } else if (!value) {
            result.errors.push_back("Missing value for option \"" + std::string{ word } + "\"");
            return false;
        }

        if (!binding.parse(binding.target, *value)) {
            result.errors.push_back("Failed to parse value \"" + std::string{ *value }
                + "\" for option \"" + std::string{ name } + "\"");
        }
        return took_next;
    }

    OptionMap short_options;
    OptionMap long_options;
};
