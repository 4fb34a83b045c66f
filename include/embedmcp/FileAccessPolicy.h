//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FileAccessPolicy.h
// Purpose: Root-based accessibility policy for resource URIs
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "embedmcp/Protocol.h"
#include "embedmcp/Providers.h"

namespace embedmcp {

//==========================================================================================================
// FileAccessPolicy
// Purpose: Accepts file:// URIs whose canonical path lies under one of the configured roots, and any
//          other URI with a well-formed "scheme://" prefix. Everything else is rejected.
// Notes:
//   - Paths are canonicalized with std::filesystem::weakly_canonical so "..", "." and symlinks cannot
//     escape a root. The target file itself does not need to exist yet.
//   - Percent-encoded octets in file URIs are decoded before canonicalization.
//==========================================================================================================
class FileAccessPolicy : public IAccessPolicy {
public:
    FileAccessPolicy() = default;
    explicit FileAccessPolicy(const std::vector<std::string>& roots);

    //==========================================================================================================
    // Adds a root directory (absolute path or file:// URI).
    // Args:
    //   root: Directory to allow.
    //   name: Display name for roots/list; defaults to the last path component.
    // Throws:
    //   std::invalid_argument for relative paths and non-file URIs.
    //==========================================================================================================
    void AddRoot(const std::string& root, const std::string& name = std::string());

    // Returns true when a root was removed.
    bool RemoveRoot(const std::string& root);

    std::vector<Root> GetRoots() const;

    bool IsAccessible(const std::string& uri) const override;
    std::optional<std::string> ResolveLocalPath(const std::string& uri) const override;

    // Decodes a file:// URI into an absolute local path; nullopt when the URI is not a file URI.
    static std::optional<std::string> FileUriToPath(const std::string& uri);
    static std::string PathToFileUri(const std::string& path);
    static bool HasValidScheme(const std::string& uri);

private:
    struct RootEntry {
        std::string path;  // canonical, no trailing separator
        std::string name;
    };

    static std::string canonicalize(const std::string& path);
    bool underRoot(const std::string& canonicalPath) const;

    mutable std::mutex mutex;
    std::vector<RootEntry> roots;
};

} // namespace embedmcp
