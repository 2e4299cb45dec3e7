#pragma once

#include <string>
#include <vector>
#include "app/ProcessCache.hpp"
#include "util/TomlReader.hpp"

namespace tasktop::ui {

struct Config {
  struct Refresh {
    double full_interval_s{3.0};
    double partial_interval_s{1.0};
    int baseline_wait_ms{10};
    int frame_ms{50};
  } refresh;

  struct Process {
    bool normalize_cpu{true};
    bool hide_idle{true};
    int visible_buffer{10};
    int kill_timeout_ms{3000};
  } process;

  struct Trend {
    double cpu_change_pct{10.0};
    double mem_change_mb{50.0};
  } trend;

  struct Highlight {
    double new_process_s{5.0};
  } highlight;

  struct Thresholds {
    int cpu_caution_pct{50};
    int cpu_warning_pct{80};
  } thresholds;

  struct Colors {
    std::string accent;
    std::string caution;
    std::string warning;
    std::string normal;
    std::string muted;
    std::string fresh; // rows of newly seen processes
  } colors;

  struct UI {
    bool alt_screen{true};
    int max_search_len{50};
  } ui;

  struct Log {
    bool verbose{false};
  } log;

  // Keys present in the file that nothing reads
  std::vector<std::string> unknown_keys;

  [[nodiscard]] tasktop::app::ProcessOptions to_process_options() const;
};

// Resolve every value TOML -> env -> compiled default and clamp it.
[[nodiscard]] Config build_config(const tasktop::util::TomlReader& toml, bool have_toml);

// Load from path (empty: the default location) and warn about unknown keys.
[[nodiscard]] Config load_config(const std::string& path);

// Process-wide config, resolved on first use. set_config_path() must run
// before the first call to take effect.
const Config& config();
void set_config_path(const std::string& path);

// $XDG_CONFIG_HOME/tasktop/config.toml, else ~/.config/tasktop/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
double getenv_double(const char* name, double defv);
bool env_flag(const char* name, bool defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace tasktop::ui
