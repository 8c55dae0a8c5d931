#include "SandboxFixture.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"

#include <nlohmann/json.hpp>

using namespace fw::sandbox;

class GuardTest : public SandboxFixture {};

TEST_F(GuardTest, PathInsideRootIsSafe) {
    writeFile(root / "a.txt", "x");
    const Guard guard({root});

    const auto c = guard.check(root / "a.txt");
    EXPECT_TRUE(c.is_safe);
    ASSERT_TRUE(c.resolved_path);
    EXPECT_EQ(*c.resolved_path, root / "a.txt");
    ASSERT_TRUE(c.allowed_root);
    EXPECT_EQ(*c.allowed_root, root);
}

TEST_F(GuardTest, RootItselfIsSafe) {
    const Guard guard({root});
    EXPECT_TRUE(guard.check(root).is_safe);
}

TEST_F(GuardTest, DotDotTraversalIsRejected) {
    writeFile(outside / "secret.txt", "s");
    const Guard guard({root});

    EXPECT_FALSE(guard.check(root / ".." / "outside" / "secret.txt").is_safe);
    EXPECT_FALSE(guard.check("../outside/secret.txt").is_safe);
}

TEST_F(GuardTest, SiblingWithSharedPrefixIsRejected) {
    const auto evil = base / "root-evil";
    fs::create_directory(evil);
    writeFile(evil / "x.txt", "x");
    const Guard guard({root});

    EXPECT_FALSE(guard.check(evil / "x.txt").is_safe);
}

TEST_F(GuardTest, SymlinkEscapingTheRootIsRejected) {
    writeFile(outside / "secret.txt", "s");
    fs::create_directory_symlink(outside, root / "link");
    fs::create_symlink(outside / "secret.txt", root / "file-link");
    const Guard guard({root});

    EXPECT_FALSE(guard.check(root / "link").is_safe);
    EXPECT_FALSE(guard.check(root / "link" / "secret.txt").is_safe);
    EXPECT_FALSE(guard.check(root / "file-link").is_safe);
}

TEST_F(GuardTest, SymlinkStayingInsideIsSafe) {
    fs::create_directory(root / "real");
    fs::create_directory_symlink(root / "real", root / "alias");
    const Guard guard({root});

    const auto c = guard.check(root / "alias");
    EXPECT_TRUE(c.is_safe);
    EXPECT_EQ(*c.resolved_path, root / "real");
}

TEST_F(GuardTest, NonExistentLeafResolvesThroughParent) {
    const Guard guard({root});

    const auto c = guard.check(root / "new" / "deeper.txt");
    EXPECT_TRUE(c.is_safe);
    EXPECT_EQ(*c.resolved_path, root / "new" / "deeper.txt");

    EXPECT_FALSE(guard.check(root / "new" / ".." / ".." / "outside").is_safe);
}

TEST_F(GuardTest, RelativePathIsTakenFromPrimaryRoot) {
    writeFile(root / "docs" / "a.txt", "x");
    const Guard guard({root});

    const auto c = guard.check("docs/a.txt");
    EXPECT_TRUE(c.is_safe);
    EXPECT_EQ(*c.resolved_path, root / "docs" / "a.txt");
}

TEST_F(GuardTest, SecondRootIsHonoured) {
    writeFile(outside / "b.txt", "x");
    const Guard guard({root, outside});

    const auto c = guard.check(outside / "b.txt");
    EXPECT_TRUE(c.is_safe);
    EXPECT_EQ(*c.allowed_root, outside);
    EXPECT_EQ(guard.primaryRoot(), root);
}

TEST_F(GuardTest, MissingRootsAreDropped) {
    const Guard guard({base / "does-not-exist", root});
    ASSERT_EQ(guard.roots().size(), 1u);
    EXPECT_EQ(guard.roots().front(), root);
}

TEST_F(GuardTest, NoUsableRootThrows) {
    writeFile(base / "file.txt", "x");
    EXPECT_THROW(Guard({base / "missing"}), fw::engine::SecurityError);
    EXPECT_THROW(Guard({base / "file.txt"}), fw::engine::SecurityError);
    EXPECT_THROW(Guard(std::vector<fs::path>{}), fw::engine::SecurityError);
}

TEST_F(GuardTest, ValidateThrowsOutsideAndReturnsResolvedInside) {
    const Guard guard({root});
    EXPECT_THROW((void)guard.validate(outside), fw::engine::SecurityError);
    EXPECT_EQ(guard.validate(root / "." / "x"), root / "x");
}

TEST_F(GuardTest, EmptyPathIsUnsafe) {
    const Guard guard({root});
    EXPECT_FALSE(guard.check("").is_safe);
}

TEST_F(GuardTest, CheckSerializesAllowedFolder) {
    const Guard guard({root});
    const nlohmann::json j = guard.check(root);
    EXPECT_TRUE(j["is_safe"].get<bool>());
    EXPECT_EQ(j["allowed_folder"], root.string());

    const nlohmann::json denied = guard.check(outside);
    EXPECT_FALSE(denied["is_safe"].get<bool>());
    EXPECT_FALSE(denied.contains("allowed_folder"));
}
