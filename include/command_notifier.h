#ifndef COMMAND_NOTIFIER_H
#define COMMAND_NOTIFIER_H

#include <string>
#include <vector>
#include "command_executor.h"
#include "config.h"

// Side channel that shows a proposed command on another device.
// Best effort: a failed push never affects the confirmation flow.
class CommandNotifier {
public:
    virtual ~CommandNotifier() = default;
    virtual bool notify(const std::string& command_text) = 0;
};

// Sends a notification to paired phones with kdeconnect-cli
class KdeConnectNotifier : public CommandNotifier {
private:
    ProcessRunner& runner;
    NotifyConfig config;

public:
    KdeConnectNotifier(ProcessRunner& process_runner, const NotifyConfig& cfg);

    std::vector<std::string> build_argv(const std::string& command_text) const;
    bool notify(const std::string& command_text) override;
};

#endif // COMMAND_NOTIFIER_H
