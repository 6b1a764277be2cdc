#include <gtest/gtest.h>

#include "cloner/archive_path_policy.hpp"

namespace cloner {

TEST(ArchivePathPolicyTest, NormalizesSafeEntryPath) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeEntryPath("./dir//disk.img", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/disk.img");
}

TEST(ArchivePathPolicyTest, StripsLeadingSlash) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    ASSERT_TRUE(policy.NormalizeEntryPath("/disk.img", out).is_ok());
    EXPECT_EQ(out, "disk.img");
}

TEST(ArchivePathPolicyTest, RejectsUnsafeEntryPath) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeEntryPath("../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsDotDotInMiddle) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    EXPECT_FALSE(policy.NormalizeEntryPath("a/../../b", out).is_ok());
    EXPECT_TRUE(policy.NormalizeEntryPath("a/..b/c", out).is_ok());
}

TEST(ArchivePathPolicyTest, PermissiveModeKeepsDotDot) {
    ArchivePathPolicy policy(/*safe_paths_only=*/false);
    std::string out;

    ASSERT_TRUE(policy.NormalizeEntryPath("../x", out).is_ok());
    EXPECT_EQ(out, "../x");
}

TEST(ArchivePathPolicyTest, RejectsUnsafeHardlinkTarget) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeHardlinkPath("../etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe hardlink target"), std::string::npos);
}

TEST(ArchivePathPolicyTest, EmptyHardlinkIsAllowed) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out = "stale";

    ASSERT_TRUE(policy.NormalizeHardlinkPath(nullptr, out).is_ok());
    EXPECT_TRUE(out.empty());
}

} // namespace cloner
