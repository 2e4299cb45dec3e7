#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace tasktop::util {

using tasktop::model::ProcStatus;

static std::string proc_root() {
  const char* env = std::getenv("TASKTOP_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto status_from_errno(int err) -> ProcStatus {
  switch (err) {
    case ENOENT:
    case ESRCH:
      return ProcStatus::NotFound;
    case EACCES:
    case EPERM:
      return ProcStatus::AccessDenied;
    default:
      return ProcStatus::Other;
  }
}

auto read_file_status(const std::string& abs, std::string& out) -> ProcStatus {
  out.clear();
  const auto path = map_proc_path(abs);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return status_from_errno(errno);
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) break;
    if (errno == EINTR) continue;
    // The process died between open and read
    int err = errno;
    ::close(fd);
    out.clear();
    return status_from_errno(err);
  }
  ::close(fd);
  return ProcStatus::Ok;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::string s;
  if (read_file_status(abs, s) != ProcStatus::Ok) return std::nullopt;
  return s;
}

auto read_symlink_status(const std::string& abs, std::string& out, std::string* err) -> ProcStatus {
  out.clear();
  const auto path = map_proc_path(abs);
  std::vector<char> buf(1024);
  for (;;) {
    ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
    if (n < 0) {
      if (err) *err = std::strerror(errno);
      return status_from_errno(errno);
    }
    if (static_cast<size_t>(n) < buf.size()) {
      out.assign(buf.data(), static_cast<size_t>(n));
      return ProcStatus::Ok;
    }
    if (buf.size() >= 64 * 1024) {
      if (err) *err = "link target too long";
      return ProcStatus::Other;
    }
    buf.resize(buf.size() * 2);
  }
}

auto list_dir_status(const std::string& abs, std::vector<std::string>& out) -> ProcStatus {
  out.clear();
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return status_from_errno(errno);
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return ProcStatus::Ok;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  if (list_dir_status(abs, out) != ProcStatus::Ok) out.clear();
  return out;
}

bool is_numeric(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

auto list_pids() -> std::vector<int32_t> {
  std::vector<int32_t> pids;
  for (const auto& name : list_dir("/proc")) {
    if (!is_numeric(name)) continue;
    pids.push_back(static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10)));
  }
  return pids;
}

} // namespace tasktop::util
