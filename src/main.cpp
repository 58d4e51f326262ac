#include <speakml/core/config.h>
#include <speakml/core/diagnostics.h>
#include <speakml/markup/normalizer.h>

#include <charconv>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kStdinName[] = "<stdin>";

void print_usage(std::ostream& stream) {
    stream << "usage: " << speakml::core::config::kProgramName
           << " [--check] [--verbose] [--cache-size=N] [file...]\n";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_size(std::string_view text, std::size_t& value) {
    if (text.empty()) {
        return false;
    }
    std::size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }
    value = parsed;
    return true;
}

bool read_input(const std::string& path, std::string& contents) {
    if (path == kStdinName) {
        contents.assign(std::istreambuf_iterator<char>(std::cin),
                        std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    contents = buffer.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    bool check_only = false;
    bool verbose = false;
    std::size_t cache_size = speakml::core::config::kDefaultCacheCapacity;
    std::vector<std::string> paths;

    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index]);
        if (argument == "-h" || argument == "--help") {
            print_usage(std::cout);
            return 0;
        }
        if (argument == "-V" || argument == "--version") {
            std::cout << speakml::core::config::kVersionString << "\n";
            return 0;
        }
        if (argument == "--check") {
            check_only = true;
        } else if (argument == "--verbose") {
            verbose = true;
        } else if (starts_with(argument, "--cache-size=")) {
            if (!parse_size(argument.substr(13), cache_size)) {
                std::cerr << "Invalid --cache-size: '" << argument << "'\n";
                print_usage(std::cerr);
                return 1;
            }
        } else if (argument == "-") {
            paths.emplace_back(kStdinName);
        } else if (starts_with(argument, "-")) {
            std::cerr << "Unknown option: '" << argument << "'\n";
            print_usage(std::cerr);
            return 1;
        } else {
            paths.emplace_back(argument);
        }
    }
    if (paths.empty()) {
        paths.emplace_back(kStdinName);
    }

    speakml::core::DiagnosticEmitter diagnostics;
    if (verbose) {
        diagnostics.add_observer([](const speakml::core::DiagnosticEvent& event) {
            std::cerr << speakml::core::format_diagnostic(event) << "\n";
        });
    } else {
        diagnostics.set_min_severity(speakml::core::Severity::Error);
    }

    speakml::markup::Normalizer normalizer(cache_size, &diagnostics);

    int exit_code = 0;
    for (const auto& path : paths) {
        diagnostics.set_source(path);

        std::string contents;
        if (!read_input(path, contents)) {
            std::cerr << path << ": cannot read input\n";
            exit_code = 1;
            continue;
        }

        const speakml::markup::NormalizeResult result = normalizer.normalize(contents);
        if (!result.ok) {
            std::cerr << path << ": " << result.error->what() << "\n";
            exit_code = 1;
            continue;
        }
        if (!check_only) {
            std::cout << result.output << "\n";
        }
    }
    return exit_code;
}
