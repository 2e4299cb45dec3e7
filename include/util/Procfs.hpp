// Helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "model/Process.hpp"

namespace tasktop::util {

// Map an absolute /proc path to an alternate root if TASKTOP_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as string, reporting why it failed.
auto read_file_status(const std::string& abs, std::string& out) -> tasktop::model::ProcStatus;

// Read a symlink target, reporting why it failed. err receives errno text for Other.
auto read_symlink_status(const std::string& abs, std::string& out, std::string* err = nullptr)
    -> tasktop::model::ProcStatus;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// List directory entries, reporting why it failed.
auto list_dir_status(const std::string& abs, std::vector<std::string>& out) -> tasktop::model::ProcStatus;

// Numeric entries of /proc, in directory order.
auto list_pids() -> std::vector<int32_t>;

// Map errno from a failed /proc call.
[[nodiscard]] auto status_from_errno(int err) -> tasktop::model::ProcStatus;

[[nodiscard]] bool is_numeric(const std::string& s);

} // namespace tasktop::util
