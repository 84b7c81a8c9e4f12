#ifndef SYSTEM_PROFILE_H
#define SYSTEM_PROFILE_H

#include <istream>
#include <string>

// Distribution name and version read from an os-release file
struct OsRelease {
    std::string name;
    std::string version;
};

// Parse /etc/os-release content. VERSION_ID is preferred over VERSION;
// surrounding quotes are removed.
OsRelease parse_os_release(std::istream& input);

// "Linux (<distro> <version>, <desktop>)" on Linux, the bare OS name elsewhere.
// An empty desktop is reported as "Unknown DE".
std::string format_system_profile(const std::string& os_name, const std::string& distro,
                                  const std::string& version, const std::string& desktop);

// Probe the running host once. Used verbatim in every command prompt.
std::string detect_system_profile();

#endif // SYSTEM_PROFILE_H
