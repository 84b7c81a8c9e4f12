#include "ollama_client.h"
#include <iostream>
#include <sstream>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

// Callback for CURL to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

const char* to_string(OracleStatus status) {
    switch (status) {
        case OracleStatus::Ok: return "ok";
        case OracleStatus::Timeout: return "timeout";
        case OracleStatus::Unavailable: return "unavailable";
        case OracleStatus::Malformed: return "malformed";
    }
    return "unknown";
}

std::string build_generate_request(const std::string& model, const std::string& prompt, bool stream) {
    nlohmann::json request_json;
    request_json["model"] = model;
    request_json["prompt"] = prompt;
    request_json["stream"] = stream;
    // Transcripts and typed lines are not guaranteed to be UTF-8
    return request_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

OracleReply parse_generate_response(const std::string& body) {
    if (body.empty()) {
        return OracleReply::failure(OracleStatus::Malformed, "empty response body");
    }

    try {
        nlohmann::json response = nlohmann::json::parse(body);
        if (!response.is_object() || !response.contains("response") || !response["response"].is_string()) {
            return OracleReply::failure(OracleStatus::Malformed, "response missing 'response' field: " + body);
        }
        return OracleReply::success(response["response"].get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        return OracleReply::failure(OracleStatus::Malformed, std::string("error parsing JSON response: ") + e.what());
    }
}

OracleReply parse_generate_stream(const std::string& body) {
    std::stringstream lines(body);
    std::string line;
    std::string text;
    bool saw_chunk = false;

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        try {
            nlohmann::json chunk = nlohmann::json::parse(line);
            if (chunk.contains("error")) {
                return OracleReply::failure(OracleStatus::Unavailable, chunk["error"].dump());
            }
            if (chunk.contains("response") && chunk["response"].is_string()) {
                text += chunk["response"].get<std::string>();
                saw_chunk = true;
            }
            if (chunk.value("done", false)) {
                break;
            }
        } catch (const nlohmann::json::exception& e) {
            return OracleReply::failure(OracleStatus::Malformed, std::string("error parsing stream chunk: ") + e.what());
        }
    }

    if (!saw_chunk) {
        return OracleReply::failure(OracleStatus::Malformed, "stream carried no response chunks");
    }
    return OracleReply::success(text);
}

OllamaClient::OllamaClient(const OllamaConfig& cfg, bool debug)
    : config(cfg), debug_enabled(debug) {
    curl_global_init(CURL_GLOBAL_ALL);
}

OllamaClient::~OllamaClient() {
    curl_global_cleanup();
}

OracleReply OllamaClient::generate(const std::string& model, const std::string& prompt, bool stream) {
    if (prompt.empty()) {
        std::cerr << "Error: Attempted to query Ollama with an empty prompt" << std::endl;
        return OracleReply::failure(OracleStatus::Malformed, "empty prompt");
    }

    std::string json_data = build_generate_request(model, prompt, stream);

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "Error: Failed to initialize CURL" << std::endl;
        return OracleReply::failure(OracleStatus::Unavailable, "curl_easy_init failed");
    }

    std::string url = config.host + "/api/generate";
    std::string read_buffer;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_data.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &read_buffer);

    if (debug_enabled) {
        std::cout << "Debug: POST " << url << " model=" << model
                  << " stream=" << (stream ? "true" : "false") << std::endl;
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        std::cerr << "Error: CURL error: " << curl_easy_strerror(res) << std::endl;

        if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
            std::cerr << "Could not connect to Ollama server at " << config.host << ". Is it running?" << std::endl;
            std::cerr << "Start it with: ollama serve" << std::endl;
            return OracleReply::failure(OracleStatus::Unavailable, curl_easy_strerror(res));
        }
        if (res == CURLE_OPERATION_TIMEDOUT) {
            std::cerr << "Connection to Ollama server timed out. Is the model loaded? Try 'ollama pull "
                      << model << "'." << std::endl;
            return OracleReply::failure(OracleStatus::Timeout, curl_easy_strerror(res));
        }
        return OracleReply::failure(OracleStatus::Unavailable, curl_easy_strerror(res));
    }

    if (http_code == 404) {
        std::cerr << "Error: Model not found: " << model << ". Run 'ollama pull " << model << "' first." << std::endl;
        return OracleReply::failure(OracleStatus::Unavailable, "model not found: " + model);
    }
    if (http_code < 200 || http_code >= 300) {
        std::cerr << "Error: Ollama API error (HTTP " << http_code << "): " << read_buffer << std::endl;
        return OracleReply::failure(OracleStatus::Unavailable, "HTTP " + std::to_string(http_code));
    }

    OracleReply reply = stream ? parse_generate_stream(read_buffer) : parse_generate_response(read_buffer);
    if (!reply.ok()) {
        std::cerr << "Error: " << reply.error << std::endl;
    }
    return reply;
}
