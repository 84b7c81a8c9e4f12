#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <string>

#include <nlohmann/json.hpp>

#include "command_synthesizer.h"
#include "ollama_client.h"

TEST_CASE("Non-streaming reply yields the response text", "[ollama]") {
    OracleReply reply = parse_generate_response(
        R"({"model":"llama3","created_at":"2024-01-01T00:00:00Z","response":"Hello there.","done":true})");

    REQUIRE(reply.ok());
    REQUIRE(reply.text == "Hello there.");
}

TEST_CASE("Malformed bodies are reported as Malformed", "[ollama]") {
    REQUIRE(parse_generate_response("").status == OracleStatus::Malformed);
    REQUIRE(parse_generate_response("<html>502</html>").status == OracleStatus::Malformed);
    REQUIRE(parse_generate_response(R"({"done":true})").status == OracleStatus::Malformed);
    REQUIRE(parse_generate_response(R"({"response":7})").status == OracleStatus::Malformed);
}

TEST_CASE("Streamed chunks are joined until done", "[ollama]") {
    std::string body =
        "{\"response\":\"Hel\",\"done\":false}\n"
        "{\"response\":\"lo\",\"done\":false}\r\n"
        "\n"
        "{\"response\":\"!\",\"done\":true}\n"
        "{\"response\":\" ignored\",\"done\":false}\n";

    OracleReply reply = parse_generate_stream(body);

    REQUIRE(reply.ok());
    REQUIRE(reply.text == "Hello!");
}

TEST_CASE("Stream errors are not treated as text", "[ollama]") {
    REQUIRE(parse_generate_stream("{\"error\":\"model not found\"}\n").status == OracleStatus::Unavailable);
    REQUIRE(parse_generate_stream("").status == OracleStatus::Malformed);
    REQUIRE(parse_generate_stream("{\"response\":\"a\"}\nnot json\n").status == OracleStatus::Malformed);
}

TEST_CASE("OllamaClient handles an unreachable server", "[ollama]") {
    OllamaConfig config;
    // Nothing listens on port 1
    config.host = "http://127.0.0.1:1";
    config.connect_timeout_seconds = 2;
    config.timeout_seconds = 5;

    OllamaClient ollama(config);
    REQUIRE(ollama.host() == "http://127.0.0.1:1");

    OracleReply reply = ollama.generate(config.conversation_model, "Test query", false);
    REQUIRE_FALSE(reply.ok());
    REQUIRE(reply.status == OracleStatus::Unavailable);
    REQUIRE(reply.text.empty());
    REQUIRE_FALSE(reply.error.empty());
}

TEST_CASE("OllamaClient rejects an empty prompt", "[ollama]") {
    OllamaClient ollama(OllamaConfig{});
    REQUIRE(ollama.generate("any-model", "", false).status == OracleStatus::Malformed);
}

TEST_CASE("Request body tolerates prompts that are not UTF-8", "[ollama]") {
    // Latin-1 "café" as typed on a non-UTF-8 terminal
    std::string body;
    REQUIRE_NOTHROW(body = build_generate_request("chat-model", "open caf\xe9", false));

    nlohmann::json request = nlohmann::json::parse(body);
    REQUIRE(request["model"].get<std::string>() == "chat-model");
    REQUIRE(request["prompt"].get<std::string>() == "open caf\xEF\xBF\xBD");
    REQUIRE(request["stream"].get<bool>() == false);
}

TEST_CASE("Invalid UTF-8 prompts come back as a failed reply", "[ollama]") {
    OllamaConfig config;
    config.host = "http://127.0.0.1:1";
    config.connect_timeout_seconds = 2;
    config.timeout_seconds = 5;
    OllamaClient ollama(config);

    OracleReply reply;
    REQUIRE_NOTHROW(reply = ollama.generate(config.command_model, "open caf\xe9", false));
    REQUIRE_FALSE(reply.ok());

    CommandSynthesizer synthesizer(ollama, config.command_model);
    std::optional<SynthesizedCommand> command;
    REQUIRE_NOTHROW(command = synthesizer.synthesize("open caf\xe9", "Linux (Arch Linux , KDE)"));
    REQUIRE_FALSE(command);
}
