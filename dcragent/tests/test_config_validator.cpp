#include <doctest/doctest.h>
#include "config_validator.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <fstream>

using testing_support::TempDir;

using Words = std::vector<std::string>;

namespace {

Vocabulary prefecture_vocabulary() {
    Vocabulary vocabulary;
    vocabulary.set("prefectures", {"北海道", "東京都", "神奈川県", "大阪府"});
    return vocabulary;
}

}

TEST_CASE("Configuration without keywords is always valid") {
    Config config;
    CHECK(validate_keywords(config, Vocabulary{}).empty());
}

TEST_CASE("Legal keywords pass, partial names included") {
    Config config;
    config.categories[Category::SeismicIntensity].keywords = {"東京", "神奈川県"};
    CHECK(validate_keywords(config, prefecture_vocabulary()).empty());
}

TEST_CASE("Every keyword must be legal") {
    Config config;
    config.categories[Category::SeismicIntensity].keywords = {"東京都", "東京市"};

    auto failures = validate_keywords(config, prefecture_vocabulary());
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].category == Category::SeismicIntensity);
    CHECK(failures[0].keyword_key == "prefectures");
    CHECK(failures[0].unmatched == Words{"東京市"});
    CHECK(failures[0].legal_values.size() == 4);
    CHECK_NOTHROW(log_validation_failures(failures));
}

TEST_CASE("Keywords without a vocabulary cannot be validated") {
    Config config;
    config.categories[Category::Tsunami].keywords = {"岩手県"};

    auto failures = validate_keywords(config, prefecture_vocabulary());
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].vocabulary_field == "tsunami_forecast_regions");
    CHECK(failures[0].unmatched == Words{"岩手県"});
    CHECK(failures[0].legal_values.empty());
}

TEST_CASE("Vocabulary file loading") {
    TempDir dir;

    SUBCASE("fields map to lists") {
        std::ofstream(dir.file("vocab.yaml")) << "prefectures: [北海道, 青森県]\ncoastal_regions: [日本]\n";
        auto vocabulary = Vocabulary::load(dir.file("vocab.yaml"));
        CHECK(vocabulary.size() == 2);
        REQUIRE(vocabulary.find("prefectures") != nullptr);
        CHECK(*vocabulary.find("prefectures") == Words{"北海道", "青森県"});
        CHECK(vocabulary.find("regions") == nullptr);
    }

    SUBCASE("missing file is empty") {
        CHECK(Vocabulary::load(dir.file("none.yaml")).size() == 0);
    }

    SUBCASE("non-mapping root is rejected") {
        std::ofstream(dir.file("bad.yaml")) << "- 北海道\n";
        CHECK_THROWS_AS(Vocabulary::load(dir.file("bad.yaml")), ConfigError);
    }

    SUBCASE("non-list field is rejected") {
        std::ofstream(dir.file("bad.yaml")) << "prefectures:\n  a: b\n";
        CHECK_THROWS_AS(Vocabulary::load(dir.file("bad.yaml")), ConfigError);
    }
}

TEST_CASE("Region keywords validate against their own field") {
    Vocabulary vocabulary;
    vocabulary.set("weather_forecast_regions", {"石狩地方", "東京地方", "伊豆諸島北部"});
    vocabulary.set("local_governments", {"札幌市", "鹿児島市", "十島村"});

    Config config;
    config.categories[Category::Weather].keywords = {"東京", "伊豆諸島"};
    config.categories[Category::Volcano].keywords = {"鹿児島市"};
    config.categories[Category::AshFall].keywords = {"十島村", "桜島町"};

    auto failures = validate_keywords(config, vocabulary);
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].category == Category::AshFall);
    CHECK(failures[0].keyword_key == "local_governments");
    CHECK(failures[0].unmatched == Words{"桜島町"});
}

TEST_CASE("Shipped vocabulary validates prefecture and tsunami region filters") {
    auto vocabulary = Vocabulary::load(DCRAGENT_SHIPPED_VOCABULARY);
    REQUIRE(vocabulary.find("prefectures") != nullptr);
    REQUIRE(vocabulary.find("tsunami_forecast_regions") != nullptr);
    CHECK(vocabulary.find("prefectures")->size() == 47);
    CHECK(vocabulary.find("tsunami_forecast_regions")->size() == 66);

    Config config;
    config.categories[Category::SeismicIntensity].keywords = {"宮城県", "東京都"};
    config.categories[Category::Tsunami].keywords = {"宮城県", "相模湾", "伊豆諸島"};
    CHECK(validate_keywords(config, vocabulary).empty());

    config.categories[Category::Tsunami].keywords = {"宮城県", "琵琶湖"};
    auto failures = validate_keywords(config, vocabulary);
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].vocabulary_field == "tsunami_forecast_regions");
    CHECK(failures[0].unmatched == Words{"琵琶湖"});
}
