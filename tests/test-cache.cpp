#include "polly-tts-cache.h"
#include "test-support.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace polly_tts;

TEST_CASE("cache key is md5 hex of text_voice_engine", "[cache]") {
    CHECK(compute_cache_key("hello", "zeina", "standard") == "49a994b324a4d79f05de82a182ff2506");
    CHECK(compute_cache_key("", "zeina", "standard") == "344d824c6ed16661ad1c416d908895e9");
    CHECK(compute_cache_key("\xd9\x85\xd8\xb1\xd8\xad\xd8\xa8\xd8\xa7", "hala", "neural") == "b33a0035bae27a00d4d42aa2f1ec5e87");
}

TEST_CASE("cache key is deterministic and sensitive to every field", "[cache]") {
    const std::string k = compute_cache_key("text", "zeina", "standard");

    CHECK(k.size() == 32);
    CHECK(compute_cache_key("text", "zeina", "standard") == k);
    CHECK(compute_cache_key("text2", "zeina", "standard") != k);
    CHECK(compute_cache_key("text", "hala", "standard") != k);
    CHECK(compute_cache_key("text", "zeina", "neural") != k);
}

TEST_CASE("lookup misses until a key is stored", "[cache]") {
    scoped_temp_dir tmp("store");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));

    const std::string key = compute_cache_key("a", "zeina", "standard");
    std::string audio;
    CHECK_FALSE(cache.lookup(key, audio, err));
    CHECK(err.empty());
    CHECK_FALSE(cache.contains(key));

    const std::string blob("\x00\x01\xff\xfe mp3", 8);
    REQUIRE(cache.store(key, blob, err));
    CHECK(cache.contains(key));
    CHECK(cache.path_for(key) == (std::filesystem::path(tmp.str()) / (key + ".mp3")).string());

    REQUIRE(cache.lookup(key, audio, err));
    CHECK(audio == blob);
    CHECK(cache.count() == 1);
}

TEST_CASE("store replaces an existing entry", "[cache]") {
    scoped_temp_dir tmp("replace");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));

    REQUIRE(cache.store("k", "first-longer-payload", err));
    REQUIRE(cache.store("k", "second", err));

    std::string audio;
    REQUIRE(cache.lookup("k", audio, err));
    CHECK(audio == "second");
}

TEST_CASE("failed write leaves no entry and no leftovers", "[cache][posix]") {
    scoped_temp_dir tmp("short-write");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));

    const std::string key = compute_cache_key("long", "zeina", "standard");
    const std::string big(200000, 'a');
    {
        scoped_file_size_limit limit(4096);
        REQUIRE(limit.active());
        CHECK_FALSE(cache.store(key, big, err));
    }
    CHECK_FALSE(err.empty());

    std::string audio;
    err.clear();
    CHECK_FALSE(cache.lookup(key, audio, err));
    CHECK(err.empty());
    CHECK_FALSE(cache.contains(key));
    CHECK(count_dir_entries(tmp.str()) == 0);
}

TEST_CASE("failed write keeps the previous entry intact", "[cache][posix]") {
    scoped_temp_dir tmp("keep-previous");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));
    REQUIRE(cache.store("k", "complete", err));

    {
        scoped_file_size_limit limit(4096);
        REQUIRE(limit.active());
        CHECK_FALSE(cache.store("k", std::string(200000, 'b'), err));
    }

    std::string audio;
    REQUIRE(cache.lookup("k", audio, err));
    CHECK(audio == "complete");
    CHECK(count_dir_entries(tmp.str()) == 1);
}

TEST_CASE("store fails cleanly when the entry path is a directory", "[cache]") {
    scoped_temp_dir tmp("squatted");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));
    REQUIRE(std::filesystem::create_directories(cache.path_for("k")));

    CHECK_FALSE(cache.store("k", "bytes", err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(cache.contains("k"));
    CHECK(cache.count() == 0);
    // only the squatting directory remains
    CHECK(count_dir_entries(tmp.str()) == 1);
}

TEST_CASE("store recreates a missing cache directory", "[cache]") {
    scoped_temp_dir tmp("recreate");
    audio_cache cache(tmp.str() + "/nested");
    std::string err;

    REQUIRE(cache.store("k", "bytes", err));
    CHECK(cache.contains("k"));
}

TEST_CASE("clear removes every entry and leaves an empty directory", "[cache]") {
    scoped_temp_dir tmp("clear");
    audio_cache cache(tmp.str());
    std::string err;
    REQUIRE(cache.init(err));
    REQUIRE(cache.store("one", "1", err));
    REQUIRE(cache.store("two", "2", err));
    {
        std::ofstream stray(tmp.str() + "/notes.txt");
        stray << "x";
    }
    CHECK(cache.count() == 2);

    REQUIRE(cache.clear(err));
    CHECK(cache.count() == 0);
    CHECK(std::filesystem::is_directory(tmp.str()));
    CHECK(std::filesystem::is_empty(tmp.str()));
}

TEST_CASE("clear fails when the directory can't be created", "[cache]") {
    scoped_temp_dir tmp("clear-blocked");
    REQUIRE(std::filesystem::create_directories(tmp.str()));
    const std::string blocker = tmp.str() + "/blocker";
    {
        std::ofstream f(blocker);
        f << "x";
    }

    audio_cache cache(blocker + "/cache");
    std::string err;
    CHECK_FALSE(cache.clear(err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("clear on a missing directory creates it", "[cache]") {
    scoped_temp_dir tmp("clear-missing");
    audio_cache cache(tmp.str());
    std::string err;

    REQUIRE(cache.clear(err));
    CHECK(std::filesystem::is_directory(tmp.str()));
}

TEST_CASE("default cache dir lives under the temp dir", "[cache]") {
    const std::filesystem::path dir(default_cache_dir());
    CHECK(dir.filename() == "arabic_tutor_cache");
}
