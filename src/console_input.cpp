#include "console_input.h"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

std::optional<std::string> ConsoleInput::read_line(const std::string& prompt, int timeout_seconds) {
    std::cout << prompt << std::flush;

    // std::cin may already hold a buffered line that poll() cannot see
    if (timeout_seconds > 0 && std::cin.rdbuf()->in_avail() <= 0) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, timeout_seconds * 1000);
        if (ready < 0) {
            std::cerr << "\nError: Waiting for typed input failed: " << std::strerror(errno) << std::endl;
            return std::nullopt;
        }
        if (ready == 0) {
            std::cout << "\nNo typed input within " << timeout_seconds << " seconds." << std::endl;
            return std::nullopt;
        }
    }

    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}
