#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GenerationClient.hpp"

namespace fs = std::filesystem;
using namespace genclient;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config PATH] [--endpoint URL] [--model NAME] [--timeout SECONDS]"
                 " [--save-config] [PROMPT...]\n"
                 "Reads the prompt from stdin when none is given.\n";
}

struct CliOptions {
    std::optional<fs::path> configPath;
    std::optional<std::string> endpoint;
    std::optional<std::string> model;
    std::optional<int> timeoutSeconds;
    bool saveConfig = false;
    std::vector<std::string> promptWords;
};

// Returns std::nullopt on bad usage.
std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            auto v = needValue(arg);
            if (!v) return std::nullopt;
            opts.configPath = fs::path(*v);
        } else if (arg == "--endpoint") {
            auto v = needValue(arg);
            if (!v) return std::nullopt;
            opts.endpoint = *v;
        } else if (arg == "--model") {
            auto v = needValue(arg);
            if (!v) return std::nullopt;
            opts.model = *v;
        } else if (arg == "--timeout") {
            auto v = needValue(arg);
            if (!v) return std::nullopt;
            opts.timeoutSeconds = infrastructure::ConfigLoader::ParseTimeoutSeconds(*v);
            if (!opts.timeoutSeconds) {
                std::cerr << "Invalid --timeout value: " << *v << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--save-config") {
            opts.saveConfig = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) opts.promptWords.emplace_back(argv[i]);
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            opts.promptWords.push_back(arg);
        }
    }
    return opts;
}

std::string JoinWords(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = ParseArgs(argc, argv);
    if (!opts) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    const fs::path configPath = opts->configPath.value_or(infrastructure::ConfigLoader::DefaultPath());
    infrastructure::ClientSettings settings =
        infrastructure::ConfigLoader::Load(configPath).value_or(infrastructure::ClientSettings{});
    if (opts->endpoint) settings.endpoint = *opts->endpoint;
    if (opts->model) settings.model = *opts->model;
    if (opts->timeoutSeconds) settings.timeoutSeconds = *opts->timeoutSeconds;

    if (opts->saveConfig && !infrastructure::ConfigLoader::Save(configPath, settings)) {
        return kExitFailure;
    }

    std::string prompt;
    if (!opts->promptWords.empty()) {
        prompt = JoinWords(opts->promptWords);
    } else {
        prompt.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::optional<infrastructure::GenerationClient> client;
    try {
        client.emplace(settings.endpoint, settings.model, settings.timeoutSeconds);
    } catch (const std::exception& e) {
        std::cerr << "[genclient] Fatal: " << e.what() << std::endl;
        return kExitFailure;
    }

    auto result = client->generate(prompt);
    if (!result) {
        std::cerr << "error: " << result.error().message << std::endl;
        return kExitFailure;
    }

    std::cout << result.value() << std::endl;
    return kExitOk;
}
