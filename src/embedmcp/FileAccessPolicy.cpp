//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileAccessPolicy.cpp
// Purpose: Root-based accessibility policy for resource URIs
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "embedmcp/FileAccessPolicy.h"
#include "logging/Logger.h"

namespace embedmcp {

namespace fs = std::filesystem;

namespace {
constexpr const char* kFileScheme = "file://";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return std::nullopt;
        }
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        char decoded = static_cast<char>((hi << 4) | lo);
        if (decoded == '\0') {
            return std::nullopt;
        }
        out.push_back(decoded);
        i += 2;
    }
    return out;
}
} // namespace

FileAccessPolicy::FileAccessPolicy(const std::vector<std::string>& rootList) {
    for (const auto& r : rootList) {
        AddRoot(r);
    }
}

std::optional<std::string> FileAccessPolicy::FileUriToPath(const std::string& uri) {
    if (uri.rfind(kFileScheme, 0) != 0) {
        return std::nullopt;
    }
    std::string rest = uri.substr(std::char_traits<char>::length(kFileScheme));
    // file://localhost/path is the same as file:///path
    if (rest.rfind("localhost/", 0) == 0) {
        rest = rest.substr(std::char_traits<char>::length("localhost"));
    }
    if (rest.empty() || rest.front() != '/') {
        return std::nullopt;
    }
    auto q = rest.find_first_of("?#");
    if (q != std::string::npos) {
        rest.resize(q);
    }
    return percentDecode(rest);
}

std::string FileAccessPolicy::PathToFileUri(const std::string& path) {
    return std::string(kFileScheme) + path;
}

bool FileAccessPolicy::HasValidScheme(const std::string& uri) {
    auto sep = uri.find("://");
    if (sep == std::string::npos || sep == 0 || sep + 3 >= uri.size()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(uri[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < sep; ++i) {
        unsigned char c = static_cast<unsigned char>(uri[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return std::none_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string FileAccessPolicy::canonicalize(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        p = fs::path(path).lexically_normal();
    }
    std::string s = p.string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

void FileAccessPolicy::AddRoot(const std::string& root, const std::string& name) {
    std::string path = root;
    if (root.find("://") != std::string::npos) {
        auto decoded = FileUriToPath(root);
        if (!decoded.has_value()) {
            throw std::invalid_argument("Root must be an absolute path or file:// URI: " + root);
        }
        path = decoded.value();
    }
    if (path.empty() || path.front() != '/') {
        throw std::invalid_argument("Root must be absolute: " + root);
    }
    RootEntry entry;
    entry.path = canonicalize(path);
    entry.name = name.empty() ? fs::path(entry.path).filename().string() : name;
    if (entry.name.empty()) {
        entry.name = entry.path;
    }
    LOG_INFO("Access root added: {}", entry.path);
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find_if(roots.begin(), roots.end(), [&](const RootEntry& r) { return r.path == entry.path; });
    if (it != roots.end()) {
        *it = std::move(entry);
    } else {
        roots.push_back(std::move(entry));
    }
}

bool FileAccessPolicy::RemoveRoot(const std::string& root) {
    std::string path = root;
    if (auto decoded = FileUriToPath(root)) {
        path = decoded.value();
    }
    const std::string canonical = canonicalize(path);
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::remove_if(roots.begin(), roots.end(), [&](const RootEntry& r) { return r.path == canonical; });
    bool removed = it != roots.end();
    roots.erase(it, roots.end());
    return removed;
}

std::vector<Root> FileAccessPolicy::GetRoots() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Root> out;
    out.reserve(roots.size());
    for (const auto& r : roots) {
        out.push_back(Root{PathToFileUri(r.path), r.name});
    }
    return out;
}

bool FileAccessPolicy::underRoot(const std::string& canonicalPath) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& r : roots) {
        if (canonicalPath == r.path) {
            return true;
        }
        const std::string prefix = (r.path == "/") ? r.path : r.path + "/";
        if (canonicalPath.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> FileAccessPolicy::ResolveLocalPath(const std::string& uri) const {
    auto path = FileUriToPath(uri);
    if (!path.has_value()) {
        return std::nullopt;
    }
    const std::string canonical = canonicalize(path.value());
    if (!underRoot(canonical)) {
        return std::nullopt;
    }
    return canonical;
}

bool FileAccessPolicy::IsAccessible(const std::string& uri) const {
    if (uri.rfind(kFileScheme, 0) == 0) {
        bool ok = ResolveLocalPath(uri).has_value();
        if (!ok) {
            LOG_DEBUG("Access denied for {}", uri);
        }
        return ok;
    }
    return HasValidScheme(uri);
}

} // namespace embedmcp
