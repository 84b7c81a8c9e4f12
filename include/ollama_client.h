#ifndef OLLAMA_CLIENT_H
#define OLLAMA_CLIENT_H

#include <string>
#include "config.h"
#include "language_oracle.h"

// Body for POST /api/generate. Invalid UTF-8 is replaced with U+FFFD.
std::string build_generate_request(const std::string& model, const std::string& prompt, bool stream);

// Parse the body of a non-streaming /api/generate reply
OracleReply parse_generate_response(const std::string& body);

// Parse a newline-delimited stream of /api/generate chunks and join the
// "response" fields until a chunk reports done
OracleReply parse_generate_stream(const std::string& body);

// HTTP client for the Ollama /api/generate endpoint
class OllamaClient : public LanguageOracle {
private:
    OllamaConfig config;
    bool debug_enabled = false;

public:
    explicit OllamaClient(const OllamaConfig& cfg, bool debug = false);
    ~OllamaClient() override;

    OllamaClient(const OllamaClient&) = delete;
    OllamaClient& operator=(const OllamaClient&) = delete;

    OracleReply generate(const std::string& model,
                         const std::string& prompt,
                         bool stream) override;

    const std::string& host() const { return config.host; }
};

#endif // OLLAMA_CLIENT_H
