#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <string>

#include "command_summarizer.h"
#include "command_synthesizer.h"
#include "fakes.h"

namespace {
const std::string kCommandModel = "command-model";
const std::string kChatModel = "chat-model";
const std::string kKdeProfile = "Linux (Manjaro Linux 24.0, KDE)";
}

TEST_CASE("Code fences around the JSON are removed", "[synthesizer]") {
    REQUIRE(strip_code_fence("```json\n{\"command\": \"konsole\"}\n```") == "{\"command\": \"konsole\"}");
    REQUIRE(strip_code_fence("  {\"command\": \"ls\"}  ") == "{\"command\": \"ls\"}");
    REQUIRE(strip_code_fence("{\"command\": \"ls\"}\n```") == "{\"command\": \"ls\"}");
}

TEST_CASE("Well formed replies yield a command", "[synthesizer]") {
    auto fenced = parse_command_reply("```json\n{\"command\": \"konsole\"}\n```");
    REQUIRE(fenced);
    REQUIRE(fenced->command == "konsole");
    REQUIRE(fenced->raw["command"].get<std::string>() == "konsole");

    auto extra = parse_command_reply(R"({"command": "kcalc", "note": "calculator"})");
    REQUIRE(extra);
    REQUIRE(extra->command == "kcalc");
}

TEST_CASE("Unusable replies yield nothing", "[synthesizer]") {
    REQUIRE_FALSE(parse_command_reply("I cannot help with that"));
    REQUIRE_FALSE(parse_command_reply(R"({"note": "no action"})"));
    REQUIRE_FALSE(parse_command_reply(R"(["command", "ls"])"));
    REQUIRE_FALSE(parse_command_reply(R"({"command": 42})"));
    REQUIRE_FALSE(parse_command_reply(R"({"command": "   "})"));
    REQUIRE_FALSE(parse_command_reply(""));
}

TEST_CASE("Prompt carries the profile, desktop hint and instruction", "[synthesizer]") {
    std::string prompt = build_command_prompt("open the calculator", kKdeProfile);

    REQUIRE(prompt.find("This system is running on " + kKdeProfile) == 0);
    REQUIRE(prompt.find("single key 'command'") != std::string::npos);
    REQUIRE(prompt.find("konsole") != std::string::npos);
    REQUIRE(prompt.find("gnome-terminal") != std::string::npos);
    REQUIRE(prompt.find("Instruction: open the calculator") != std::string::npos);
}

TEST_CASE("Desktop hint follows the desktop environment", "[synthesizer]") {
    REQUIRE(desktop_hint("Linux (Fedora Linux 40, KDE)").find("KDE") != std::string::npos);
    REQUIRE(desktop_hint("Linux (Ubuntu 24.04, ubuntu:GNOME)").find("GNOME") != std::string::npos);
    REQUIRE(desktop_hint("Linux (Debian 12, XFCE)").find("xfce4-terminal") != std::string::npos);
    REQUIRE(desktop_hint("Linux (Arch Linux , Unknown DE)").find("installed") != std::string::npos);
}

TEST_CASE("Synthesizer asks the command model without streaming", "[synthesizer]") {
    FakeOracle oracle;
    oracle.reply(kCommandModel, "```json\n{\"command\": \"kcalc\"}\n```");
    CommandSynthesizer synthesizer(oracle, kCommandModel);

    auto command = synthesizer.synthesize("open the calculator", kKdeProfile);

    REQUIRE(command);
    REQUIRE(command->command == "kcalc");
    REQUIRE(oracle.calls.size() == 1);
    REQUIRE(oracle.calls[0].model == kCommandModel);
    REQUIRE_FALSE(oracle.calls[0].stream);
    REQUIRE(oracle.calls[0].prompt == build_command_prompt("open the calculator", kKdeProfile));
}

TEST_CASE("Synthesizer yields nothing when the oracle fails", "[synthesizer]") {
    FakeOracle oracle;
    oracle.fail(kCommandModel, OracleStatus::Timeout);
    CommandSynthesizer synthesizer(oracle, kCommandModel);

    REQUIRE_FALSE(synthesizer.synthesize("open the calculator", kKdeProfile));
}

TEST_CASE("Summarizer uses the conversation model", "[summarizer]") {
    FakeOracle oracle;
    oracle.reply(kChatModel, "  Opens the KDE calculator.\n");
    CommandSummarizer summarizer(oracle, kChatModel);

    REQUIRE(summarizer.summarize("kcalc") == "Opens the KDE calculator.");
    REQUIRE(oracle.calls.size() == 1);
    REQUIRE(oracle.calls[0].model == kChatModel);
    REQUIRE(oracle.calls[0].prompt == "Summarize in one sentence what the following command does: kcalc");
}

TEST_CASE("Summarizer failures produce an empty summary", "[summarizer]") {
    FakeOracle oracle;
    CommandSummarizer summarizer(oracle, kChatModel);

    REQUIRE(summarizer.summarize("kcalc").empty());

    oracle.reply(kChatModel, "   ");
    REQUIRE(summarizer.summarize("kcalc").empty());
}
