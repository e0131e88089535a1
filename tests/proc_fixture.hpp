#pragma once
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

// Scratch /proc tree under the temp directory, selected via TICKWATCH_PROC_ROOT
// for the lifetime of the object.
class ProcFixture {
public:
  explicit ProcFixture(const char* tag) {
    root_ = std::filesystem::temp_directory_path()
          / (std::string("tickwatch_test_") + tag + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_ / "proc");
    setenv("TICKWATCH_PROC_ROOT", root_.c_str(), 1);
  }
  ~ProcFixture() {
    unsetenv("TICKWATCH_PROC_ROOT");
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  void write(const std::string& rel, const std::string& content) const {
    auto p = root_ / "proc" / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary | std::ios::trunc) << content;
  }
  void remove(const std::string& rel) const {
    std::error_code ec;
    std::filesystem::remove_all(root_ / "proc" / rel, ec);
  }

  void uptime(double secs) const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f 0.00\n", secs);
    write("uptime", buf);
  }

  // One /proc/<dir>/stat (and cmdline; empty for kernel threads)
  void task(const std::string& dir, int id, const std::string& comm, unsigned long long utime,
            unsigned long long stime, int threads, const std::string& cmdline,
            char state = 'S') const {
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "%d (%s) %c 1 %d %d 0 -1 4194304 10 0 0 0 %llu %llu 0 0 20 0 %d 0 12345 8192000 250 "
                  "18446744073709551615 1 1 0 0 0 0 0 0 0 0 0 0 17 0 0 0 0 0 0\n",
                  id, comm.c_str(), state, id, id, utime, stime, threads);
    write(dir + "/stat", buf);
    std::string argv = cmdline;
    for (auto& c : argv) if (c == ' ') c = '\0';
    if (!argv.empty()) argv.push_back('\0');
    write(dir + "/cmdline", argv);
  }

  void standard_system_files() const {
    write("stat", "cpu  1000 0 0 9000 0 0 0 0 0 0\n"
                  "cpu0 500 0 0 4500 0 0 0 0 0 0\n"
                  "cpu1 500 0 0 4500 0 0 0 0 0 0\n"
                  "intr 12345\n");
    write("loadavg", "0.50 0.25 0.10 1/123 4567\n");
    write("meminfo", "MemTotal:       16000000 kB\n"
                     "MemFree:         4000000 kB\n"
                     "MemAvailable:    8000000 kB\n"
                     "SwapTotal:        2000000 kB\n"
                     "SwapFree:         1500000 kB\n");
  }

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};
