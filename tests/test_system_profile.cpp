#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <sstream>
#include <string>

#include "system_profile.h"

TEST_CASE("os-release fields are parsed and unquoted", "[profile]") {
    std::istringstream input(
        "NAME=\"Manjaro Linux\"\n"
        "PRETTY_NAME=\"Manjaro Linux\"\n"
        "# a comment=ignored\n"
        "VERSION=\"24.0.1 (Wynsdey)\"\n"
        "VERSION_ID=24.0.1\n"
        "ID=manjaro\n");

    OsRelease release = parse_os_release(input);

    REQUIRE(release.name == "Manjaro Linux");
    REQUIRE(release.version == "24.0.1");
}

TEST_CASE("VERSION is used when VERSION_ID is absent", "[profile]") {
    std::istringstream input("NAME='Debian GNU/Linux'\nVERSION=\"12 (bookworm)\"\n");

    OsRelease release = parse_os_release(input);

    REQUIRE(release.name == "Debian GNU/Linux");
    REQUIRE(release.version == "12 (bookworm)");
}

TEST_CASE("Empty os-release yields empty fields", "[profile]") {
    std::istringstream input("");
    OsRelease release = parse_os_release(input);
    REQUIRE(release.name.empty());
    REQUIRE(release.version.empty());
}

TEST_CASE("Linux profiles include distribution and desktop", "[profile]") {
    REQUIRE(format_system_profile("Linux", "Manjaro Linux", "24.0.1", "KDE") ==
            "Linux (Manjaro Linux 24.0.1, KDE)");
    REQUIRE(format_system_profile("Linux", "Fedora Linux", "40", "") ==
            "Linux (Fedora Linux 40, Unknown DE)");
    REQUIRE(format_system_profile("Linux", "", "", "GNOME") == "Linux (Linux , GNOME)");
}

TEST_CASE("Other systems report only the OS name", "[profile]") {
    REQUIRE(format_system_profile("Darwin", "", "", "Aqua") == "Darwin");
    REQUIRE(format_system_profile("FreeBSD", "FreeBSD", "14.0", "") == "FreeBSD");
}

TEST_CASE("Detected profile is never empty", "[profile]") {
    std::string profile = detect_system_profile();
    REQUIRE_FALSE(profile.empty());
#ifdef __linux__
    REQUIRE(profile.rfind("Linux (", 0) == 0);
#endif
}
