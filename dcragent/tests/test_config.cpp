#include <doctest/doctest.h>
#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>

using testing_support::TempDir;

using Words = std::vector<std::string>;

TEST_CASE("Defaults cover every deliverable category") {
    Config config;
    CHECK(config.categories.size() == 16);
    CHECK(config.category(Category::Tsunami).use);
    CHECK(config.category(Category::Tsunami).keywords.empty());
    CHECK(config.source_command == "stdbuf -oL gpsmon -a");
    CHECK(config.cache_valid_period() == std::chrono::hours(24));
    CHECK(config.file.policy.ignore_filter);
    CHECK_FALSE(config.mail.policy.ignore_filter);
    CHECK_THROWS_AS(config.category(Category::Null), std::out_of_range);
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("YAML sections override the defaults") {
    Config config;
    config.load_from_yaml(YAML::Load(R"(
general:
  log_level: debug
  ignore_filter_when_training: 1
cache:
  valid_period_hour: 12
  path: /tmp/dcragent-cache.json
source:
  command: "cat /tmp/reports.ndjson"
  restart_delay_seconds: 2
categories:
  SeismicIntensity:
    prefectures: " 東京都, 神奈川県 ,"
  Tsunami:
    use: 0
    regions: [岩手県, "  ", 宮城県]
  Hypocenter:
    use: false
  Mystery:
    use: 1
mail:
  use: yes
  host: smtp.example.org
  port: 587
  address: ops@example.org
  tls: true
  report_training: 0
console:
  use: true
  ignore_filter: 1
)"));

    CHECK(config.log_level == "debug");
    CHECK(config.ignore_filter_when_training);
    CHECK(config.cache_valid_period_hours == 12);
    CHECK(config.cache_path == "/tmp/dcragent-cache.json");
    CHECK(config.source_command == "cat /tmp/reports.ndjson");
    CHECK(config.restart_delay_seconds == 2);

    CHECK(config.category(Category::SeismicIntensity).keywords == Words{"東京都", "神奈川県"});
    CHECK_FALSE(config.category(Category::Tsunami).use);
    CHECK(config.category(Category::Tsunami).keywords == Words{"岩手県", "宮城県"});
    CHECK_FALSE(config.category(Category::Hypocenter).use);

    CHECK(config.mail.use);
    CHECK(config.mail.port == 587);
    CHECK(config.mail.tls);
    CHECK_FALSE(config.mail.policy.report_training);
    CHECK(config.console.use);
    CHECK(config.console.policy.ignore_filter);

    CHECK_NOTHROW(config.validate());
}

TEST_CASE("Malformed values are configuration errors") {
    Config config;
    CHECK_THROWS_AS(config.load_from_yaml(YAML::Load("mail:\n  use: maybe\n")), ConfigError);
    CHECK_THROWS_AS(config.load_from_yaml(YAML::Load("mail:\n  port: lots\n")), ConfigError);
    CHECK_THROWS_AS(config.load_from_yaml(YAML::Load("categories: [a, b]\n")), ConfigError);
    CHECK_THROWS_AS(config.load_from_yaml(YAML::Load("- just\n- a list\n")), ConfigError);
}

TEST_CASE("validate rejects inconsistent settings") {
    Config config;

    SUBCASE("non-positive validity period") {
        config.cache_valid_period_hours = 0;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }

    SUBCASE("mail without a host") {
        config.mail.use = true;
        config.mail.address = "ops@example.org";
        config.mail.port = 25;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }

    SUBCASE("mail with an invalid port") {
        config.mail.use = true;
        config.mail.host = "smtp.example.org";
        config.mail.address = "ops@example.org";
        config.mail.port = 70000;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }

    SUBCASE("unterminated quote in the producer command") {
        config.source_command = "gpsmon 'oops";
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }

    SUBCASE("empty producer command") {
        config.source_command = "   ";
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }

    SUBCASE("report file count beyond the sink's range") {
        config.file.use = true;
        config.file.path = "/tmp/dcragent-report.log";
        config.file.max_files = 65535;
        CHECK_NOTHROW(config.validate());
        config.file.max_files = 65536;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
}

TEST_CASE("Config::load falls back to defaults for a missing file") {
    TempDir dir;
    auto config = Config::load(dir.file("missing.yaml"));
    CHECK(config.log_level == "info");
}

TEST_CASE("Config::load rejects unparsable YAML") {
    TempDir dir;
    std::ofstream(dir.file("broken.yaml")) << "general: [unclosed\n";
    CHECK_THROWS_AS(Config::load(dir.file("broken.yaml")), ConfigError);
}

TEST_CASE("Environment overrides the file") {
    TempDir dir;
    std::ofstream(dir.file("secret")) << "s3cret\nignored\n";

    setenv("DCRAGENT_SOURCE_COMMAND", "cat feed.ndjson", 1);
    setenv("DCRAGENT_CACHE_VALID_PERIOD_HOURS", "6", 1);
    setenv("DCRAGENT_MAIL_PASSWORD_FILE", dir.file("secret").c_str(), 1);

    Config config;
    config.load_from_env();

    unsetenv("DCRAGENT_SOURCE_COMMAND");
    unsetenv("DCRAGENT_CACHE_VALID_PERIOD_HOURS");
    unsetenv("DCRAGENT_MAIL_PASSWORD_FILE");

    CHECK(config.source_command == "cat feed.ndjson");
    CHECK(config.cache_valid_period_hours == 6);
    CHECK(config.mail.password == "s3cret");
}
