//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_file_access_policy.cpp
// Purpose: Tests for root-based URI access checks
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "embedmcp/FileAccessPolicy.h"

using namespace embedmcp;

TEST(FileAccessPolicy, FileUrisMustResolveUnderARoot) {
    FileAccessPolicy policy({"/srv/embedmcp-policy/data"});
    EXPECT_TRUE(policy.IsAccessible("file:///srv/embedmcp-policy/data/config.json"));
    EXPECT_TRUE(policy.IsAccessible("file:///srv/embedmcp-policy/data"));
    EXPECT_TRUE(policy.IsAccessible("file://localhost/srv/embedmcp-policy/data/a.txt"));
    EXPECT_FALSE(policy.IsAccessible("file:///srv/embedmcp-policy/database/a.txt"));
    EXPECT_FALSE(policy.IsAccessible("file:///etc/passwd"));
}

TEST(FileAccessPolicy, DotDotCannotEscapeRoot) {
    FileAccessPolicy policy({"/srv/embedmcp-policy/data"});
    EXPECT_FALSE(policy.IsAccessible("file:///srv/embedmcp-policy/data/../secret.txt"));
    EXPECT_FALSE(policy.IsAccessible("file:///srv/embedmcp-policy/data/%2e%2e/secret.txt"));
    EXPECT_TRUE(policy.IsAccessible("file:///srv/embedmcp-policy/data/sub/../a.txt"));
    auto resolved = policy.ResolveLocalPath("file:///srv/embedmcp-policy/data/sub/../a.txt");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved.value(), "/srv/embedmcp-policy/data/a.txt");
}

TEST(FileAccessPolicy, MalformedUrisAreDenied) {
    FileAccessPolicy policy({"/srv/embedmcp-policy/data"});
    EXPECT_FALSE(policy.IsAccessible(""));
    EXPECT_FALSE(policy.IsAccessible("no scheme"));
    EXPECT_FALSE(policy.IsAccessible("://missing"));
    EXPECT_FALSE(policy.IsAccessible("1app://x"));
    EXPECT_FALSE(policy.IsAccessible("app://has space"));
    EXPECT_FALSE(policy.IsAccessible("file://relative/path"));
    EXPECT_FALSE(policy.IsAccessible("file:///srv/embedmcp-policy/data/%zz"));
}

TEST(FileAccessPolicy, NonFileSchemesOnlyNeedAValidScheme) {
    FileAccessPolicy policy;
    EXPECT_TRUE(policy.IsAccessible("app://status/uptime"));
    EXPECT_TRUE(policy.IsAccessible("db+sqlite://main/users"));
    EXPECT_FALSE(policy.ResolveLocalPath("app://status/uptime").has_value());
    // No roots: every file URI is denied.
    EXPECT_FALSE(policy.IsAccessible("file:///tmp/a.txt"));
}

TEST(FileAccessPolicy, RootManagement) {
    FileAccessPolicy policy;
    EXPECT_THROW(policy.AddRoot("relative/dir"), std::invalid_argument);
    EXPECT_THROW(policy.AddRoot("http://example.com/"), std::invalid_argument);

    policy.AddRoot("/srv/embedmcp-policy/one/", "first");
    policy.AddRoot("file:///srv/embedmcp-policy/two");
    policy.AddRoot("/srv/embedmcp-policy/one", "renamed");

    auto roots = policy.GetRoots();
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0].uri, "file:///srv/embedmcp-policy/one");
    EXPECT_EQ(roots[0].name, "renamed");
    EXPECT_EQ(roots[1].uri, "file:///srv/embedmcp-policy/two");
    EXPECT_EQ(roots[1].name, "two");

    EXPECT_TRUE(policy.RemoveRoot("file:///srv/embedmcp-policy/one"));
    EXPECT_FALSE(policy.RemoveRoot("/srv/embedmcp-policy/one"));
    EXPECT_FALSE(policy.IsAccessible("file:///srv/embedmcp-policy/one/a.txt"));
    EXPECT_TRUE(policy.IsAccessible("file:///srv/embedmcp-policy/two/a.txt"));
}
