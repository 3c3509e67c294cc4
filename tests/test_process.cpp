#include "tilekeep/core/process.hpp"
#include <catch2/catch_test_macros.hpp>
#include <unistd.h>

using namespace tilekeep;

TEST_CASE("Image name prefers comm", "[process]")
{
    REQUIRE(process::resolve_image_name("kitty", "/usr/bin/kitty") == "kitty");
    REQUIRE(process::resolve_image_name("nautilus", "") == "nautilus");
    // Scripts are named after the script, not the interpreter
    REQUIRE(process::resolve_image_name("mytool", "/usr/bin/python3.12") == "mytool");
}

TEST_CASE("Truncated comm is extended from the exe path", "[process]")
{
    std::string comm = "gnome-system-mo";
    REQUIRE(comm.size() == process::COMM_MAX_LEN);

    REQUIRE(process::resolve_image_name(comm, "/usr/bin/gnome-system-monitor") == "gnome-system-monitor");
    REQUIRE(process::resolve_image_name(comm, "/usr/bin/gnome-system-monitor (deleted)") == "gnome-system-monitor");
    // Unrelated exe leaves comm alone
    REQUIRE(process::resolve_image_name(comm, "/usr/bin/python3") == comm);
}

TEST_CASE("Empty comm falls back to the exe basename", "[process]")
{
    REQUIRE(process::resolve_image_name("", "/opt/app/bin/editor") == "editor");
    REQUIRE_FALSE(process::resolve_image_name("", "").has_value());
}

TEST_CASE("Own process name is readable from procfs", "[process]")
{
    auto name = process::name_for_pid(static_cast<uint32_t>(getpid()));
    REQUIRE(name.has_value());
    REQUIRE_FALSE(name->empty());

    REQUIRE_FALSE(process::name_for_pid(0).has_value());
}
