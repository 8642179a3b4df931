#pragma once

#include <string>
#include <sys/stat.h>
#include <vector>

bool ensure_directory(const std::string& path, mode_t mode = 0755);
bool ensure_parent_directory(const std::string& path);
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

bool read_file(const std::string& path, std::string& contents);
// Writes through a temporary sibling and rename(2) so readers never see a partial file.
bool write_file_atomic(const std::string& path, const std::string& contents);
bool copy_file(const std::string& from, const std::string& to, std::string& error_message);
bool remove_tree(const std::string& path);
std::vector<std::string> list_directory(const std::string& path);

std::string path_join(const std::string& base, const std::string& child);
std::string join_strings(const std::vector<std::string>& parts, const char* delimiter = ",");
std::vector<std::string> split_whitespace(const std::string& text);
