#include "system_profile.h"
#include <cstdlib>
#include <fstream>
#include <sys/utsname.h>

namespace {

std::string unquote(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

OsRelease parse_os_release(std::istream& input) {
    OsRelease release;
    std::string version_id;
    std::string version;

    std::string line;
    while (std::getline(input, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos || line[0] == '#') {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = unquote(line.substr(eq + 1));

        if (key == "NAME") {
            release.name = value;
        } else if (key == "VERSION_ID") {
            version_id = value;
        } else if (key == "VERSION") {
            version = value;
        }
    }

    release.version = version_id.empty() ? version : version_id;
    return release;
}

std::string format_system_profile(const std::string& os_name, const std::string& distro,
                                  const std::string& version, const std::string& desktop) {
    if (os_name != "Linux") {
        return os_name;
    }
    std::string dist = distro.empty() ? "Linux" : distro;
    std::string de = desktop.empty() ? "Unknown DE" : desktop;
    return os_name + " (" + dist + " " + version + ", " + de + ")";
}

std::string detect_system_profile() {
    std::string os_name = "Unknown";
    struct utsname uts;
    if (uname(&uts) == 0) {
        os_name = uts.sysname;
    }

    OsRelease release;
    std::ifstream os_release("/etc/os-release");
    if (!os_release.is_open()) {
        os_release.open("/usr/lib/os-release");
    }
    if (os_release.is_open()) {
        release = parse_os_release(os_release);
    }

    std::string desktop = env_or_empty("XDG_CURRENT_DESKTOP");
    if (desktop.empty()) {
        desktop = env_or_empty("DESKTOP_SESSION");
    }

    return format_system_profile(os_name, release.name, release.version, desktop);
}
