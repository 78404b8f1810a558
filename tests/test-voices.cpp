#include "polly-tts-voices.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace polly_tts;

TEST_CASE("arabic registry has zeina and hala", "[voices]") {
    const voice_registry voices = voice_registry::arabic();

    REQUIRE(voices.keys() == (std::vector<std::string>{"zeina", "hala"}));
    REQUIRE(voices.default_key() == "zeina");

    const voice_descriptor * zeina = voices.find("zeina");
    REQUIRE(zeina != nullptr);
    CHECK(zeina->id == "Zeina");
    CHECK(zeina->language == "arb");
    CHECK(zeina->gender == "Female");
    CHECK(zeina->engine == "standard");

    const voice_descriptor * hala = voices.find("hala");
    REQUIRE(hala != nullptr);
    CHECK(hala->id == "Hala");
    CHECK(hala->language == "ar-AE");
    CHECK(hala->engine == "neural");
}

TEST_CASE("unknown voice keys are not found", "[voices]") {
    const voice_registry voices = voice_registry::arabic();

    CHECK(voices.find("Zeina") == nullptr);
    CHECK(voices.find("") == nullptr);
    CHECK_FALSE(voices.contains("joanna"));
    CHECK(voices.contains("hala"));
}

TEST_CASE("registry json keeps registration order", "[voices]") {
    const json j = voice_registry::arabic().to_json();

    REQUIRE(j.size() == 2);
    CHECK(j.begin().key() == "zeina");
    CHECK(j["hala"]["name"] == "Hala (Female, Gulf Arabic)");
    CHECK(j["zeina"]["name"] == "Zeina (Female, Modern Standard Arabic)");
}

TEST_CASE("default key must be registered", "[voices]") {
    REQUIRE_THROWS_AS(voice_registry({{"a", {"A", "A", "arb", "Male", "standard"}}}, "b"), std::invalid_argument);
}

TEST_CASE("only standard and neural are known engines", "[voices]") {
    CHECK(is_known_engine("standard"));
    CHECK(is_known_engine("neural"));
    CHECK_FALSE(is_known_engine("Neural"));
    CHECK_FALSE(is_known_engine("long-form"));
    CHECK_FALSE(is_known_engine(""));
}
