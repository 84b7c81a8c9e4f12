#ifndef LANGUAGE_ORACLE_H
#define LANGUAGE_ORACLE_H

#include <string>

// Outcome of a single call to the language model backend
enum class OracleStatus {
    Ok,
    Timeout,        // the backend did not answer in time
    Unavailable,    // connection refused, non-2xx status, ...
    Malformed       // the backend answered but the body was not usable
};

struct OracleReply {
    OracleStatus status = OracleStatus::Unavailable;
    std::string text;   // model free text, set when status == Ok
    std::string error;  // diagnostic message otherwise

    bool ok() const { return status == OracleStatus::Ok; }

    static OracleReply success(const std::string& text) {
        return {OracleStatus::Ok, text, ""};
    }

    static OracleReply failure(OracleStatus status, const std::string& error) {
        return {status, "", error};
    }
};

const char* to_string(OracleStatus status);

// Untrusted natural language backend. Implementations never throw for
// transport or protocol problems; they report them through OracleReply.
class LanguageOracle {
public:
    virtual ~LanguageOracle() = default;

    virtual OracleReply generate(const std::string& model,
                                 const std::string& prompt,
                                 bool stream) = 0;
};

#endif // LANGUAGE_ORACLE_H
