#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using tickwatch::util::TomlReader;

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path()
          / (std::string("tickwatch_test_toml_") + suffix + "_" + std::to_string(::getpid()) + ".toml")).string();
}

TEST(toml_load_missing_file) {
  TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_sampler_section) {
  auto path = tmp_path("basic");
  std::ofstream(path) << "[sampler]\n"
                         "interval_ms = 2000\n"
                         "show_threads = true\n"
                         "\n"
                         "[ui]\n"
                         "cpu_scale = \"total\"\n";
  TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampler", "interval_ms"), 2000);
  ASSERT_EQ(tr.get_bool("sampler", "show_threads", false), true);
  ASSERT_EQ(tr.get_string("ui", "cpu_scale"), "total");
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_defaults_for_missing_keys) {
  TomlReader tr;
  tr.load_string("[ui]\nalt_screen = true\n");
  ASSERT_EQ(tr.get_string("ui", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("ui", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("ui", "missing_bool", true), true);
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  ASSERT_TRUE(tr.has("ui", "alt_screen"));
  ASSERT_TRUE(!tr.has("sampler", "alt_screen"));
}

TEST(toml_bool_and_int_coercion) {
  TomlReader tr;
  tr.load_string("[b]\na = true\nb = FALSE\nc = 1\nd = junk\n"
                 "[n]\nneg = -7\nstr = hello\n");
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b", true), false);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d", true), true);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
}

TEST(toml_comments_and_whitespace) {
  TomlReader tr;
  tr.load_string("# top-level comment\n"
                 "\n"
                 "[ sampler ]  \n"
                 "  interval_ms  =  500   # twice a second\n"
                 "  label = \"a # not a comment\"\n");
  ASSERT_EQ(tr.get_int("sampler", "interval_ms"), 500);
  ASSERT_EQ(tr.get_string("sampler", "label"), "a # not a comment");
}

TEST(toml_later_key_wins) {
  TomlReader tr;
  tr.load_string("[ui]\ncaution_pct = 50\ncaution_pct = 70\n");
  ASSERT_EQ(tr.get_int("ui", "caution_pct"), 70);
}
