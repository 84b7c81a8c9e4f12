#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

#include "config.h"

TEST_CASE("Config can be created with default values", "[config]") {
    Config config;

    REQUIRE(config.audio.device == "default");
    REQUIRE(config.audio.sample_rate == 16000);

    REQUIRE(config.whisper.model == "base.en");
    REQUIRE(config.whisper.params == "-l en");
    REQUIRE(config.whisper.model_path() == "./whisper.cpp/models/ggml-base.en.bin");

    REQUIRE(config.ollama.host == "http://localhost:11434");
    REQUIRE(config.ollama.conversation_model == "jarvis-at-home-model_llama3.2:3Bv1");
    REQUIRE(config.ollama.command_model == "jarvis-at-home-commands_model_qwen2.5-coder:3Bv3");

    REQUIRE(config.tts.engine == "espeak");
    REQUIRE(config.tts.speed == 170);

    REQUIRE(config.relay.command_keywords ==
            std::vector<std::string>{"open", "launch", "execute", "run", "shutdown"});
    REQUIRE(config.relay.listen_timeout_seconds == 15);
    REQUIRE(config.relay.command_confirm_timeout_seconds == 15);
    REQUIRE(config.relay.execute_confirm_timeout_seconds == 5);
    REQUIRE(config.relay.cooldown_ms == 3000);

    REQUIRE_FALSE(config.notify.enabled);
    REQUIRE(config.notify.program == "kdeconnect-cli");
}

TEST_CASE("Config can be saved and loaded", "[config]") {
    std::string temp_file = "/tmp/voice_relay_test_config.json";

    Config config1;
    config1.audio.device = "hw:1,0";
    config1.whisper.model = "tiny";
    config1.ollama.host = "http://gpu-box:11434";
    config1.ollama.command_model = "qwen2.5-coder";
    config1.tts.engine = "piper";
    config1.tts.speed = 200;
    config1.relay.command_keywords = {"start", "open"};
    config1.relay.execute_confirm_timeout_seconds = 8;
    config1.relay.cooldown_ms = 0;
    config1.notify.enabled = true;
    config1.notify.device = "abc123";
    config1.streaming.min_speech_ms = 450;

    config1.save(temp_file);

    Config config2;
    config2.load(temp_file);

    REQUIRE(config2.audio.device == "hw:1,0");
    REQUIRE(config2.whisper.model == "tiny");
    REQUIRE(config2.ollama.host == "http://gpu-box:11434");
    REQUIRE(config2.ollama.command_model == "qwen2.5-coder");
    REQUIRE(config2.tts.engine == "piper");
    REQUIRE(config2.tts.speed == 200);
    REQUIRE(config2.relay.command_keywords == std::vector<std::string>{"start", "open"});
    REQUIRE(config2.relay.execute_confirm_timeout_seconds == 8);
    REQUIRE(config2.relay.cooldown_ms == 0);
    REQUIRE(config2.notify.enabled);
    REQUIRE(config2.notify.device == "abc123");
    REQUIRE(config2.streaming.min_speech_ms == 450);

    std::remove(temp_file.c_str());
}

TEST_CASE("Config keeps defaults for absent keys", "[config]") {
    std::string temp_file = "/tmp/voice_relay_partial_config.json";
    {
        std::ofstream out(temp_file);
        out << R"({"ollama": {"host": "http://other:11434"}, "relay": {"cooldown_ms": 500}})";
    }

    Config config;
    config.load(temp_file);

    REQUIRE(config.ollama.host == "http://other:11434");
    REQUIRE(config.ollama.conversation_model == "jarvis-at-home-model_llama3.2:3Bv1");
    REQUIRE(config.relay.cooldown_ms == 500);
    REQUIRE(config.relay.listen_timeout_seconds == 15);
    REQUIRE(config.audio.device == "default");

    std::remove(temp_file.c_str());
}

TEST_CASE("Config handles missing file", "[config]") {
    Config config;
    std::string nonexistent_file = "/tmp/voice_relay_nonexistent_config.json";
    std::remove(nonexistent_file.c_str());

    REQUIRE_THROWS_AS(config.load(nonexistent_file), std::runtime_error);
}

TEST_CASE("Config rejects invalid JSON", "[config]") {
    std::string temp_file = "/tmp/voice_relay_broken_config.json";
    {
        std::ofstream out(temp_file);
        out << "{ not json";
    }

    Config config;
    REQUIRE_THROWS_AS(config.load(temp_file), std::runtime_error);

    std::remove(temp_file.c_str());
}

TEST_CASE("Config reports a wrong-typed key as a load error", "[config]") {
    std::string temp_file = "/tmp/voice_relay_wrong_type_config.json";
    {
        std::ofstream file(temp_file);
        file << R"({"tts": {"speed": "fast"}})";
    }

    Config config;
    REQUIRE_THROWS_AS(config.load(temp_file), std::runtime_error);

    std::remove(temp_file.c_str());
}

TEST_CASE("load_or_create only writes defaults when the file is missing", "[config]") {
    std::string temp_file = "/tmp/voice_relay_load_or_create.json";
    std::remove(temp_file.c_str());

    SECTION("Missing file is created with defaults") {
        Config config;
        REQUIRE(config.load_or_create(temp_file));

        Config reread;
        REQUIRE_NOTHROW(reread.load(temp_file));
        REQUIRE(reread.ollama.host == "http://localhost:11434");
    }

    SECTION("Existing invalid file is left untouched") {
        const std::string original = R"({"relay": {"cooldown_ms": "soon"}, "ollama": {"host": "http://gpu-box:11434"}})";
        {
            std::ofstream file(temp_file);
            file << original;
        }

        Config config;
        REQUIRE_THROWS_AS(config.load_or_create(temp_file), std::runtime_error);

        std::ifstream file(temp_file);
        std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(contents == original);
    }

    SECTION("Existing valid file is loaded, not rewritten") {
        {
            std::ofstream file(temp_file);
            file << R"({"ollama": {"host": "http://gpu-box:11434"}})";
        }

        Config config;
        REQUIRE_FALSE(config.load_or_create(temp_file));
        REQUIRE(config.ollama.host == "http://gpu-box:11434");
    }

    std::remove(temp_file.c_str());
}
