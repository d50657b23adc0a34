#include <catch2/catch_all.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "config/Config.hpp"

using namespace ReadServe;

namespace {

struct TempConfig {
    std::filesystem::path path;

    explicit TempConfig(const std::string& contents) {
        path = std::filesystem::temp_directory_path() /
               ("readserve_config_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
        std::ofstream(path) << contents;
    }
    ~TempConfig() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(std::filesystem::path(path.string() + ".bak"), ec);
    }
};

}

TEST_CASE("Config fills in and writes back missing keys") {
    TempConfig file(R"({"listen_port": 9090, "custom": true})");
    Config config;
    config.Load(file.path.string());
    CHECK(config.listen_port == 9090);
    CHECK(config.max_body_bytes == 2097152);
    CHECK(config.http_max_redirects == 5);

    std::ifstream in(file.path);
    auto written = nlohmann::json::parse(in);
    CHECK(written["listen_port"] == 9090);
    CHECK(written["custom"] == true);
    CHECK(written.contains("max_connections"));
    CHECK(std::filesystem::exists(file.path.string() + ".bak"));
}

TEST_CASE("Config rejects a negative body cap") {
    TempConfig file(R"({"max_body_bytes": -1})");
    Config config;
    CHECK_THROWS_AS(config.Load(file.path.string()), std::runtime_error);
}

TEST_CASE("Config rejects malformed JSON") {
    TempConfig file("{ not json");
    Config config;
    CHECK_THROWS_AS(config.Load(file.path.string()), std::runtime_error);
}
