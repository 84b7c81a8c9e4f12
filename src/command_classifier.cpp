#include "command_classifier.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

const std::vector<std::string>& KeywordCommandClassifier::default_keywords() {
    static const std::vector<std::string> keywords = {
        "open", "launch", "execute", "run", "shutdown"
    };
    return keywords;
}

KeywordCommandClassifier::KeywordCommandClassifier(bool debug)
    : keywords(default_keywords()), debug_enabled(debug) {}

KeywordCommandClassifier::KeywordCommandClassifier(const std::vector<std::string>& words, bool debug)
    : debug_enabled(debug) {
    for (const auto& word : words) {
        if (!word.empty()) {
            keywords.push_back(to_lower(word));
        }
    }
}

std::string KeywordCommandClassifier::matched_keyword(const std::string& text) const {
    std::string text_lower = to_lower(text);
    for (const auto& keyword : keywords) {
        if (text_lower.find(keyword) != std::string::npos) {
            return keyword;
        }
    }
    return "";
}

bool KeywordCommandClassifier::classify(const std::string& text) {
    std::string keyword = matched_keyword(text);
    if (debug_enabled) {
        if (keyword.empty()) {
            std::cout << "Debug: No command keyword found in '" << to_lower(text) << "'" << std::endl;
        } else {
            std::cout << "Debug: Detected keyword '" << keyword << "' in '" << to_lower(text) << "'" << std::endl;
        }
    }
    return !keyword.empty();
}
