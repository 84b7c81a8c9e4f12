#include "command_notifier.h"
#include <iostream>

KdeConnectNotifier::KdeConnectNotifier(ProcessRunner& process_runner, const NotifyConfig& cfg)
    : runner(process_runner), config(cfg) {}

std::vector<std::string> KdeConnectNotifier::build_argv(const std::string& command_text) const {
    std::vector<std::string> argv = {config.program, "--send-notification", "Command: " + command_text};
    if (!config.device.empty()) {
        argv.push_back("--device");
        argv.push_back(config.device);
    }
    return argv;
}

bool KdeConnectNotifier::notify(const std::string& command_text) {
    ProcessResult result = runner.run(build_argv(command_text));
    if (!result.succeeded()) {
        std::cerr << "Warning: Error sending KDE Connect notification: " << config.program << " "
                  << describe_failure(result) << std::endl;
        return false;
    }
    std::cout << "Command pushed to phone for inspection." << std::endl;
    return true;
}
