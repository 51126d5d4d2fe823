#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace genclient::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "genclient_config_test";
    fs::remove_all(testRoot);
    fs::path settingsPath = testRoot / "nested" / "settings.json";

    // Missing file
    assert(!ConfigLoader::Load(settingsPath).has_value());

    // Save creates parent directories; Load reads it back.
    ClientSettings custom;
    custom.endpoint = "http://gpu-box:11434";
    custom.model = "llama3:8b";
    custom.timeoutSeconds = 180;
    assert(ConfigLoader::Save(settingsPath, custom));
    auto loaded = ConfigLoader::Load(settingsPath);
    assert(loaded.has_value());
    assert(loaded->endpoint == "http://gpu-box:11434");
    assert(loaded->model == "llama3:8b");
    assert(loaded->timeoutSeconds == 180);

    // Missing keys keep defaults; unrelated keys survive a save.
    {
        std::ofstream f(settingsPath);
        f << R"({"model": "phi3", "theme": "dark"})";
    }
    loaded = ConfigLoader::Load(settingsPath);
    assert(loaded.has_value());
    assert(loaded->model == "phi3");
    assert(loaded->endpoint == ClientSettings{}.endpoint);
    assert(loaded->timeoutSeconds == ClientSettings{}.timeoutSeconds);

    assert(ConfigLoader::Save(settingsPath, *loaded));
    {
        std::ifstream f(settingsPath);
        auto j = nlohmann::json::parse(f);
        assert(j["theme"] == "dark");
        assert(j["timeout_seconds"] == ClientSettings{}.timeoutSeconds);
    }

    // Malformed file and wrongly typed values.
    {
        std::ofstream f(settingsPath);
        f << "{ endpoint: ";
    }
    assert(!ConfigLoader::Load(settingsPath).has_value());
    {
        std::ofstream f(settingsPath);
        f << R"({"timeout_seconds": "soon"})";
    }
    assert(!ConfigLoader::Load(settingsPath).has_value());

    // A path that cannot be inspected is reported, not silently treated as missing.
    {
        std::ostringstream captured;
        std::streambuf* original = std::cerr.rdbuf(captured.rdbuf());
        auto result = ConfigLoader::Load(testRoot / std::string(300, 'x'));
        std::cerr.rdbuf(original);
        assert(!result.has_value());
        assert(captured.str().find("[ConfigLoader] Cannot access") != std::string::npos);
    }

    // Timeout flag values must be whole numbers of seconds.
    assert(ConfigLoader::ParseTimeoutSeconds("30") == 30);
    assert(ConfigLoader::ParseTimeoutSeconds("-5") == -5);
    assert(!ConfigLoader::ParseTimeoutSeconds("30s").has_value());
    assert(!ConfigLoader::ParseTimeoutSeconds("30 ").has_value());
    assert(!ConfigLoader::ParseTimeoutSeconds("").has_value());
    assert(!ConfigLoader::ParseTimeoutSeconds("soon").has_value());
    assert(!ConfigLoader::ParseTimeoutSeconds("99999999999").has_value());

    // Default path follows XDG_CONFIG_HOME.
    setenv("XDG_CONFIG_HOME", testRoot.c_str(), 1);
    assert(PathUtils::GetConfigHome() == testRoot);
    assert(ConfigLoader::DefaultPath() == testRoot / "genclient" / "settings.json");

    fs::remove_all(testRoot);
    std::cout << "[Test] ConfigLoader Test PASSED." << std::endl;
    return 0;
}
