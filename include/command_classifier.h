#ifndef COMMAND_CLASSIFIER_H
#define COMMAND_CLASSIFIER_H

#include <string>
#include <vector>

// Decides whether an utterance asks for something to be done on the machine
class CommandClassifier {
public:
    virtual ~CommandClassifier() = default;

    virtual bool classify(const std::string& text) = 0;
};

// Case-insensitive substring match against an ordered keyword list. The
// first keyword found wins. Words such as "running" also match.
class KeywordCommandClassifier : public CommandClassifier {
private:
    std::vector<std::string> keywords;
    bool debug_enabled = false;

public:
    static const std::vector<std::string>& default_keywords();

    explicit KeywordCommandClassifier(bool debug = false);
    KeywordCommandClassifier(const std::vector<std::string>& words, bool debug = false);

    bool classify(const std::string& text) override;

    // The keyword that matched, or an empty string
    std::string matched_keyword(const std::string& text) const;
};

#endif // COMMAND_CLASSIFIER_H
