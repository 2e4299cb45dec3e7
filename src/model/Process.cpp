#include "model/Process.hpp"

namespace tasktop::model {

const char* to_string(ProcStatus s) {
  switch (s) {
    case ProcStatus::Ok:           return "ok";
    case ProcStatus::NotFound:     return "process no longer exists";
    case ProcStatus::AccessDenied: return "access denied";
    case ProcStatus::Other:        return "error";
  }
  return "error";
}

const char* to_string(SortKey k) {
  switch (k) {
    case SortKey::Cpu:    return "cpu";
    case SortKey::Memory: return "mem";
    case SortKey::Pid:    return "pid";
    case SortKey::Name:   return "name";
  }
  return "cpu";
}

} // namespace tasktop::model
