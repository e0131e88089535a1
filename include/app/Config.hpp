#pragma once

#include <string>

namespace tickwatch::util { class TomlReader; }

namespace tickwatch::app {

struct SamplerSettings {
  int interval_ms{1500};
  int warmup_ms{200};          // first pass -> second pass
  int channel_capacity{2};
  bool show_threads{false};
};

struct UiSettings {
  bool alt_screen{true};
  std::string cpu_scale{"core"}; // core | total
  int caution_pct{60};
  int warning_pct{80};
};

struct Config {
  SamplerSettings sampler;
  UiSettings ui;
};

// Environment variable helpers. TICKWATCH_FOO and tickwatch_FOO are equivalent.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/tickwatch/config.toml, else ~/.config/tickwatch/config.toml
std::string config_file_path();

// Resolve every setting TOML -> env -> compiled default, then clamp to sane ranges.
Config resolve_config(const util::TomlReader& toml, bool have_toml);
Config load_config(const std::string& path);

// Process-wide configuration, loaded once from config_file_path().
const Config& config();

} // namespace tickwatch::app
