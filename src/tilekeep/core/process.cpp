#include "process.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace tilekeep::process {

namespace {

std::string exe_basename(std::string const& exe_path)
{
    std::string name = fs::path(exe_path).filename().string();

    // Replaced binaries keep running with this suffix on the link target
    constexpr std::string_view deleted_suffix = " (deleted)";
    if (name.size() > deleted_suffix.size() && name.ends_with(deleted_suffix))
        name.resize(name.size() - deleted_suffix.size());
    return name;
}

}

std::optional<std::string> resolve_image_name(std::string const& comm, std::string const& exe_path)
{
    if (comm.empty())
    {
        if (exe_path.empty())
            return std::nullopt;
        std::string name = exe_basename(exe_path);
        if (name.empty())
            return std::nullopt;
        return name;
    }

    if (comm.size() == COMM_MAX_LEN && !exe_path.empty())
    {
        std::string name = exe_basename(exe_path);
        if (name.size() > comm.size() && name.starts_with(comm))
            return name;
    }

    return comm;
}

std::optional<std::string> name_for_pid(uint32_t pid)
{
    if (pid == 0)
        return std::nullopt;

    std::string base = "/proc/" + std::to_string(pid);

    std::string comm;
    {
        std::ifstream f(base + "/comm");
        if (f.is_open())
            std::getline(f, comm);
    }

    std::error_code ec;
    std::string exe_path = fs::read_symlink(base + "/exe", ec).string();
    if (ec)
        exe_path.clear();

    return resolve_image_name(comm, exe_path);
}

} // namespace tilekeep::process
