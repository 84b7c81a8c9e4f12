#ifndef CONVERSATION_LOG_H
#define CONVERSATION_LOG_H

#include <string>

// "relay_YYYYmmdd_HHMMSS.log" for the current local time
std::string default_log_file_name();

// Append "[HH:MM:SS] Speaker: message". No-op when log_file is empty.
void log_conversation(const std::string& log_file, const std::string& speaker, const std::string& message);

// Write the session start marker. Returns false if the file is not writable.
bool begin_conversation_log(const std::string& log_file);
void end_conversation_log(const std::string& log_file);

#endif // CONVERSATION_LOG_H
