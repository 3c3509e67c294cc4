#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tilekeep::process {

/// Kernel limit for /proc/<pid>/comm (TASK_COMM_LEN - 1).
constexpr size_t COMM_MAX_LEN = 15;

/**
 * @brief Choose the image name from the two procfs sources.
 *
 * comm is preferred because it names scripts after the script rather than
 * the interpreter. When comm is exactly at the kernel limit it may be
 * truncated, so the exe basename is used instead if it extends comm.
 *
 * @param comm Contents of /proc/<pid>/comm without the trailing newline
 * @param exe_path Target of /proc/<pid>/exe, empty if unreadable
 * @return The image name, or nullopt if neither source yields one
 */
std::optional<std::string> resolve_image_name(std::string const& comm, std::string const& exe_path);

/// Image name of a running process, or nullopt if it has exited or is unreadable.
std::optional<std::string> name_for_pid(uint32_t pid);

} // namespace tilekeep::process
