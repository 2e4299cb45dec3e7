#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tasktop::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v[6];
  for (int i = 0; i < 6; ++i) { v[i] = hexv(hex[i + 1]); if (v[i] < 0) return false; }
  r = v[0]*16+v[1]; g = v[2]*16+v[3]; b = v[4]*16+v[5];
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.starts_with("TASKTOP_")) {
    alt = std::string("tasktop_") + n.substr(8);
  } else if (n.starts_with("tasktop_")) {
    alt = std::string("TASKTOP_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  char* endp = nullptr;
  long n = std::strtol(v, &endp, 10);
  if (endp == v || *endp != '\0') return defv;
  return static_cast<int>(n);
}

double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  char* endp = nullptr;
  double d = std::strtod(v, &endp);
  if (endp == v || *endp != '\0') return defv;
  return d;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tasktop/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tasktop/config.toml";
  return {};
}

// Role color from TOML -> compiled default. A TOML value is either a
// palette index (looked up in [palette] for a truecolor override) or
// "#RRGGBB".
static std::string resolve_color(const tasktop::util::TomlReader& toml, bool have_toml,
                                 const char* role, int def_palette_idx,
                                 const char* def_hex) {
  if (have_toml && toml.has("roles", role)) {
    std::string val = toml.get_string("roles", role);
    if (!val.empty() && std::isdigit(static_cast<unsigned char>(val[0]))) {
      int idx = std::clamp(toml.get_int("roles", role, def_palette_idx), 0, 255);
      std::string pkey = "color" + std::to_string(idx);
      if (toml.has("palette", pkey)) {
        int r, g, b;
        if (parse_hex_rgb(toml.get_string("palette", pkey), r, g, b)) return sgr_truecolor(r, g, b);
      }
      return sgr_palette_idx(idx);
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) return sgr_truecolor(r, g, b);
    std::fprintf(stderr, "tasktop: config: roles.%s: unrecognized color '%s'\n", role, val.c_str());
  }
  if (def_hex) {
    int r, g, b;
    if (parse_hex_rgb(std::string(def_hex), r, g, b)) return sgr_truecolor(r, g, b);
  }
  return sgr_palette_idx(def_palette_idx);
}

static int resolve_int(const tasktop::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const tasktop::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const tasktop::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static constexpr const char* kKnownKeys[] = {
  "refresh.full_interval_s", "refresh.partial_interval_s", "refresh.baseline_wait_ms", "refresh.frame_ms",
  "process.normalize_cpu", "process.hide_idle", "process.visible_buffer", "process.kill_timeout_ms",
  "trend.cpu_change_pct", "trend.mem_change_mb",
  "highlight.new_process_s",
  "thresholds.cpu_caution_pct", "thresholds.cpu_warning_pct",
  "ui.alt_screen", "ui.max_search_len",
  "log.verbose",
  "roles.accent", "roles.caution", "roles.warning", "roles.normal", "roles.muted", "roles.fresh",
};

static bool known_key(const std::string& k) {
  if (k.starts_with("palette.color")) return true;
  return std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys), [&](const char* s){ return k == s; });
}

static constexpr double kMinInterval = 0.05;

Config build_config(const tasktop::util::TomlReader& toml, bool have_toml) {
  Config c{};

  // --- [refresh] ---
  c.refresh.full_interval_s    = resolve_double(toml, have_toml, "refresh", "full_interval_s",    "TASKTOP_FULL_INTERVAL", 3.0);
  c.refresh.partial_interval_s = resolve_double(toml, have_toml, "refresh", "partial_interval_s", "TASKTOP_PARTIAL_INTERVAL", 1.0);
  c.refresh.baseline_wait_ms   = resolve_int(toml, have_toml, "refresh", "baseline_wait_ms",      "TASKTOP_BASELINE_WAIT_MS", 10);
  c.refresh.frame_ms           = resolve_int(toml, have_toml, "refresh", "frame_ms",              "TASKTOP_FRAME_MS", 50);

  // --- [process] ---
  c.process.normalize_cpu   = resolve_bool(toml, have_toml, "process", "normalize_cpu",   "TASKTOP_NORMALIZE_CPU", true);
  c.process.hide_idle       = resolve_bool(toml, have_toml, "process", "hide_idle",       "TASKTOP_HIDE_IDLE", true);
  c.process.visible_buffer  = resolve_int(toml, have_toml, "process", "visible_buffer",   "TASKTOP_VISIBLE_BUFFER", 10);
  c.process.kill_timeout_ms = resolve_int(toml, have_toml, "process", "kill_timeout_ms",  "TASKTOP_KILL_TIMEOUT_MS", 3000);

  // --- [trend] / [highlight] ---
  c.trend.cpu_change_pct        = resolve_double(toml, have_toml, "trend", "cpu_change_pct",        "TASKTOP_CPU_CHANGE_PCT", 10.0);
  c.trend.mem_change_mb         = resolve_double(toml, have_toml, "trend", "mem_change_mb",         "TASKTOP_MEM_CHANGE_MB", 50.0);
  c.highlight.new_process_s     = resolve_double(toml, have_toml, "highlight", "new_process_s",     "TASKTOP_NEW_PROCESS_S", 5.0);

  // --- [thresholds] ---
  c.thresholds.cpu_caution_pct = resolve_int(toml, have_toml, "thresholds", "cpu_caution_pct", "TASKTOP_CPU_CAUTION_PCT", 50);
  c.thresholds.cpu_warning_pct = resolve_int(toml, have_toml, "thresholds", "cpu_warning_pct", "TASKTOP_CPU_WARNING_PCT", 80);

  // --- [ui] / [log] ---
  c.ui.alt_screen     = resolve_bool(toml, have_toml, "ui", "alt_screen",     "TASKTOP_ALT_SCREEN", true);
  c.ui.max_search_len = resolve_int(toml, have_toml, "ui", "max_search_len",  "TASKTOP_MAX_SEARCH_LEN", 50);
  c.log.verbose       = resolve_bool(toml, have_toml, "log", "verbose",       "TASKTOP_VERBOSE", false);

  // --- [roles] ---
  c.colors.accent  = resolve_color(toml, have_toml, "accent",   6, nullptr);
  c.colors.caution = resolve_color(toml, have_toml, "caution",  3, nullptr);
  c.colors.warning = resolve_color(toml, have_toml, "warning",  1, nullptr);
  c.colors.normal  = resolve_color(toml, have_toml, "normal",   2, nullptr);
  c.colors.muted   = resolve_color(toml, have_toml, "muted",    8, "#787878");
  c.colors.fresh   = resolve_color(toml, have_toml, "fresh",    2, nullptr);

  // Clamp
  c.refresh.full_interval_s = std::max(kMinInterval, c.refresh.full_interval_s);
  c.refresh.partial_interval_s = std::clamp(c.refresh.partial_interval_s, kMinInterval, c.refresh.full_interval_s);
  c.refresh.baseline_wait_ms = std::clamp(c.refresh.baseline_wait_ms, 0, 1000);
  c.refresh.frame_ms = std::clamp(c.refresh.frame_ms, 10, 1000);
  c.process.visible_buffer = std::clamp(c.process.visible_buffer, 0, 500);
  c.process.kill_timeout_ms = std::max(0, c.process.kill_timeout_ms);
  c.trend.cpu_change_pct = std::max(0.0, c.trend.cpu_change_pct);
  c.trend.mem_change_mb = std::max(0.0, c.trend.mem_change_mb);
  c.highlight.new_process_s = std::max(0.0, c.highlight.new_process_s);
  c.thresholds.cpu_caution_pct = std::max(0, c.thresholds.cpu_caution_pct);
  c.thresholds.cpu_warning_pct = std::max(c.thresholds.cpu_caution_pct, c.thresholds.cpu_warning_pct);
  c.ui.max_search_len = std::clamp(c.ui.max_search_len, 1, 256);

  if (have_toml) {
    for (const auto& k : toml.keys())
      if (!known_key(k)) c.unknown_keys.push_back(k);
  }
  return c;
}

Config load_config(const std::string& path) {
  tasktop::util::TomlReader toml;
  const std::string p = path.empty() ? config_file_path() : path;
  const bool have_toml = !p.empty() && toml.load(p);
  if (!have_toml && !path.empty())
    std::fprintf(stderr, "tasktop: config: cannot read %s, using defaults\n", p.c_str());
  Config c = build_config(toml, have_toml);
  for (const auto& k : c.unknown_keys)
    std::fprintf(stderr, "tasktop: config: unknown key '%s' in %s\n", k.c_str(), p.c_str());
  return c;
}

static std::string& config_path_override() {
  static std::string path;
  return path;
}

void set_config_path(const std::string& path) { config_path_override() = path; }

const Config& config() {
  static Config cfg = load_config(config_path_override());
  return cfg;
}

tasktop::app::ProcessOptions Config::to_process_options() const {
  tasktop::app::ProcessOptions o;
  o.full_interval_s = refresh.full_interval_s;
  o.partial_interval_s = refresh.partial_interval_s;
  o.baseline_wait = std::chrono::milliseconds(refresh.baseline_wait_ms);
  o.normalize_cpu = process.normalize_cpu;
  o.hide_idle = process.hide_idle;
  o.cpu_change_pct = trend.cpu_change_pct;
  o.mem_change_mb = trend.mem_change_mb;
  o.new_process_s = highlight.new_process_s;
  o.visible_buffer = static_cast<size_t>(process.visible_buffer);
  o.verbose = log.verbose;
  return o;
}

} // namespace tasktop::ui
