#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace tickwatch::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TICKWATCH_", 0) == 0) {
    alt = std::string("tickwatch_") + n.substr(10);
  } else if (n.rfind("tickwatch_", 0) == 0) {
    alt = std::string("TICKWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int out = 0;
  const char* end = v + std::strlen(v);
  auto [p, ec] = std::from_chars(v, end, out);
  return (ec == std::errc{} && p == end) ? out : defv;
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/tickwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/tickwatch/config.toml";
  return {};
}

static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::string normalize_cpu_scale(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s=="core"||s=="percore"||s=="irix") return "core";
  if (s=="total"||s=="machine"||s=="share") return "total";
  std::fprintf(stderr, "tickwatch: config: unknown cpu_scale '%s', using 'core'\n", s.c_str());
  return "core";
}

Config resolve_config(const util::TomlReader& toml, bool have_toml) {
  Config c{};

  // --- [sampler] ---
  c.sampler.interval_ms      = resolve_int(toml, have_toml, "sampler", "interval_ms",      "TICKWATCH_INTERVAL_MS", 1500);
  c.sampler.warmup_ms        = resolve_int(toml, have_toml, "sampler", "warmup_ms",        "TICKWATCH_WARMUP_MS", 200);
  c.sampler.channel_capacity = resolve_int(toml, have_toml, "sampler", "channel_capacity", "TICKWATCH_CHANNEL_CAPACITY", 2);
  c.sampler.show_threads     = resolve_bool(toml, have_toml, "sampler", "show_threads",    "TICKWATCH_SHOW_THREADS", false);
  c.sampler.interval_ms      = std::clamp(c.sampler.interval_ms, 100, 60000);
  c.sampler.warmup_ms        = std::clamp(c.sampler.warmup_ms, 0, c.sampler.interval_ms);
  c.sampler.channel_capacity = std::clamp(c.sampler.channel_capacity, 1, 64);

  // --- [ui] ---
  c.ui.alt_screen  = resolve_bool(toml, have_toml, "ui", "alt_screen",  "TICKWATCH_ALT_SCREEN", true);
  c.ui.cpu_scale   = normalize_cpu_scale(resolve_string(toml, have_toml, "ui", "cpu_scale", "TICKWATCH_CPU_SCALE", "core"));
  c.ui.caution_pct = resolve_int(toml, have_toml, "ui", "caution_pct", "TICKWATCH_CAUTION_PCT", 60);
  c.ui.warning_pct = resolve_int(toml, have_toml, "ui", "warning_pct", "TICKWATCH_WARNING_PCT", 80);
  return c;
}

Config load_config(const std::string& path) {
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  return resolve_config(toml, have_toml);
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace tickwatch::app
