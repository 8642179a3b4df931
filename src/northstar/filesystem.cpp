#include "northstar/filesystem.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

bool ensure_directory(const std::string& path, mode_t mode) {
    if (path.empty()) {
        return false;
    }
    struct stat st {};
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    std::string parent;
    auto pos = path.find_last_of('/');
    if (pos != std::string::npos && pos != 0) {
        parent = path.substr(0, pos);
    } else if (pos == 0) {
        parent = "/";
    }
    if (!parent.empty() && parent != path) {
        if (!ensure_directory(parent, mode)) {
            return false;
        }
    }
    if (mkdir(path.c_str(), mode) == 0 || errno == EEXIST) {
        return true;
    }
    return false;
}

bool ensure_parent_directory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return true;
    }
    return ensure_directory(path.substr(0, pos));
}

bool path_exists(const std::string& path) {
    struct stat st {};
    return lstat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool read_file(const std::string& path, std::string& contents) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    contents = buffer.str();
    return true;
}

bool write_file_atomic(const std::string& path, const std::string& contents) {
    if (!ensure_parent_directory(path)) {
        return false;
    }
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return false;
        }
        ofs << contents;
        ofs.flush();
        if (!ofs.good()) {
            unlink(tmp_path.c_str());
            return false;
        }
    }
    if (rename(tmp_path.c_str(), path.c_str()) != 0) {
        unlink(tmp_path.c_str());
        return false;
    }
    return true;
}

bool copy_file(const std::string& from, const std::string& to, std::string& error_message) {
    std::ifstream in(from, std::ios::binary);
    if (!in) {
        error_message = "cannot open " + from + ": " + std::strerror(errno);
        return false;
    }
    if (!ensure_parent_directory(to)) {
        error_message = "cannot create parent directory of " + to;
        return false;
    }
    std::string tmp_path = to + ".tmp";
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error_message = "cannot create " + tmp_path + ": " + std::strerror(errno);
        return false;
    }
    out << in.rdbuf();
    out.close();
    if (!out) {
        error_message = "failed to write " + tmp_path;
        unlink(tmp_path.c_str());
        return false;
    }
    if (rename(tmp_path.c_str(), to.c_str()) != 0) {
        error_message = "rename to " + to + " failed: " + std::strerror(errno);
        unlink(tmp_path.c_str());
        return false;
    }
    return true;
}

bool remove_tree(const std::string& path) {
    struct stat st {};
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0 || errno == ENOENT;
    }
    bool ok = true;
    for (const auto& entry : list_directory(path)) {
        ok = remove_tree(path_join(path, entry)) && ok;
    }
    if (rmdir(path.c_str()) != 0 && errno != ENOENT) {
        return false;
    }
    return ok;
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return entries;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        entries.emplace_back(entry->d_name);
    }
    closedir(dir);
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::string path_join(const std::string& base, const std::string& child) {
    if (base.empty()) {
        return child;
    }
    if (child.empty()) {
        return base;
    }
    if (base.back() == '/') {
        return child.front() == '/' ? base + child.substr(1) : base + child;
    }
    return child.front() == '/' ? base + child : base + "/" + child;
}

std::string join_strings(const std::vector<std::string>& parts, const char* delimiter) {
    if (parts.empty()) {
        return "";
    }
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << parts[i];
    }
    return oss.str();
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}
