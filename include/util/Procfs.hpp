// C++23 utility helpers for reading /proc with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tickwatch::util {

// Map an absolute /proc path to an alternate root if TICKWATCH_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// List directory entries (names only). Returns std::nullopt if the directory cannot be opened.
auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

// Owner uid of a path (stat st_uid). Returns std::nullopt on error.
auto path_owner(const std::string& abs) -> std::optional<uint32_t>;

// True for a non-empty all-digit entry name such as a pid directory.
[[nodiscard]] bool is_numeric_name(const std::string& name);

} // namespace tickwatch::util
