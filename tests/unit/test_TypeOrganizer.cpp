#include "SandboxFixture.hpp"
#include "plan/TypeOrganizer.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"

#include <sys/stat.h>
#include <nlohmann/json.hpp>

using namespace fw::plan;
using namespace fw::plan::model;

TEST(TypeFolderTest, UsesUpperCasedExtension) {
    EXPECT_EQ(typeFolderFor("report.pdf"), "PDF");
    EXPECT_EQ(typeFolderFor("Photo.JpG"), "JPG");
    EXPECT_EQ(typeFolderFor("archive.tar.gz"), "GZ");
    EXPECT_EQ(typeFolderFor("Makefile"), NO_EXTENSION_FOLDER);
    EXPECT_EQ(typeFolderFor("notes."), NO_EXTENSION_FOLDER);
}

class TypeOrganizerTest : public SandboxFixture {};

TEST_F(TypeOrganizerTest, DryRunPlansWithoutTouchingDisk) {
    writeFile(root / "a.PDF", "a");
    writeFile(root / "b.pdf", "b");
    writeFile(root / "Makefile", "all:");
    writeFile(root / ".hidden.pdf", "h");
    fs::create_directory(root / "docs");
    const auto before = snapshot(root);
    const fw::sandbox::Guard guard({root});

    const auto r = TypeOrganizer(guard).planOrApply(root, true);

    EXPECT_EQ(snapshot(root), before);
    ASSERT_EQ(r.plan.size(), 3u);
    EXPECT_EQ(r.applied.size(), 3u);
    EXPECT_EQ(r.state, PlanState::Validated);
    ASSERT_EQ(r.created_folders.size(), 2u);
    EXPECT_EQ(r.created_folders[0], root / NO_EXTENSION_FOLDER);
    EXPECT_EQ(r.created_folders[1], root / "PDF");
    EXPECT_EQ(r.targetFolders(), (std::vector<std::string>{NO_EXTENSION_FOLDER, "PDF"}));
}

TEST_F(TypeOrganizerTest, CommitMovesFilesIntoTypeFolders) {
    writeFile(root / "a.PDF", "a");
    writeFile(root / "song.mp3", "m");
    fs::create_directory(root / "docs");
    const fw::sandbox::Guard guard({root});

    const auto r = TypeOrganizer(guard).planOrApply(root, false);

    EXPECT_TRUE(r.success());
    EXPECT_EQ(r.state, PlanState::Committed);
    EXPECT_EQ(readFile(root / "PDF" / "a.PDF"), "a");
    EXPECT_EQ(readFile(root / "MP3" / "song.mp3"), "m");
    EXPECT_FALSE(fs::exists(root / "a.PDF"));
    EXPECT_TRUE(fs::is_directory(root / "docs"));
    ASSERT_EQ(r.applied.size(), 2u);
    EXPECT_EQ(r.applied[0].proposed_name, "PDF/a.PDF");
    EXPECT_EQ(r.applied[0].target_folder.value_or(""), "PDF");
}

TEST_F(TypeOrganizerTest, ExistingTargetFileIsSkipped) {
    writeFile(root / "a.txt", "new");
    writeFile(root / "TXT" / "a.txt", "old");
    const fw::sandbox::Guard guard({root});

    const auto r = TypeOrganizer(guard).planOrApply(root, false);

    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_NE(r.skipped[0].reason.find("Target already exists"), std::string::npos);
    EXPECT_EQ(readFile(root / "a.txt"), "new");
    EXPECT_EQ(readFile(root / "TXT" / "a.txt"), "old");
    EXPECT_TRUE(r.created_folders.empty());
}

TEST_F(TypeOrganizerTest, FolderAlreadyNamedAfterTypeIsLeftAlone) {
    writeFile(root / "PDF" / "x.pdf", "x");
    const fw::sandbox::Guard guard({root});

    const auto r = TypeOrganizer(guard).planOrApply(root / "PDF", false);

    ASSERT_EQ(r.skipped.size(), 1u);
    EXPECT_EQ(r.skipped[0].reason, "Already inside matching type folder");
    EXPECT_TRUE(fs::exists(root / "PDF" / "x.pdf"));
    EXPECT_FALSE(fs::exists(root / "PDF" / "PDF"));
}

TEST_F(TypeOrganizerTest, NonDirectoryTargetIsAConflict) {
    writeFile(root / "a.txt", "a");
    ASSERT_EQ(::mkfifo((root / "TXT").c_str(), 0600), 0);
    const fw::sandbox::Guard guard({root});

    for (const bool dryRun : {true, false}) {
        const auto r = TypeOrganizer(guard).planOrApply(root, dryRun);
        ASSERT_EQ(r.errors.size(), 1u);
        EXPECT_EQ(r.errors[0].kind, ItemErrorKind::Conflict);
    }
    EXPECT_TRUE(fs::exists(root / "a.txt"));
}

TEST_F(TypeOrganizerTest, DryRunMatchesCommit) {
    writeFile(root / "a.txt", "1");
    writeFile(root / "b.txt", "2");
    writeFile(root / "c.jpg", "3");
    writeFile(root / "TXT" / "b.txt", "exists");
    const fw::sandbox::Guard guard({root});

    const auto dry = TypeOrganizer(guard).planOrApply(root, true);
    const auto real = TypeOrganizer(guard).planOrApply(root, false);

    EXPECT_EQ(dry.applied.size(), real.applied.size());
    EXPECT_EQ(dry.skipped.size(), real.skipped.size());
    EXPECT_EQ(dry.errors.size(), real.errors.size());
    EXPECT_EQ(dry.created_folders, real.created_folders);
}

TEST_F(TypeOrganizerTest, SerializesSummary) {
    writeFile(root / "a.txt", "1");
    const fw::sandbox::Guard guard({root});

    const nlohmann::json j = TypeOrganizer(guard).planOrApply(root, true);
    EXPECT_EQ(j["summary"]["total_files_considered"], 1);
    EXPECT_EQ(j["summary"]["files_moved"], 1);
    EXPECT_EQ(j["summary"]["target_folders"][0], "TXT");
    EXPECT_EQ(j["plan"][0]["action"], "move");
    EXPECT_EQ(j["created_folders"][0], (root / "TXT").string());
}

TEST_F(TypeOrganizerTest, UnenumerableFolderThrowsIOError) {
    fs::create_directory(root / "locked");
    writeFile(root / "locked" / "a.pdf", "a");
    lock(root / "locked");
    const fw::sandbox::Guard guard({root});

    UnprivilegedAccess access;
    ASSERT_TRUE(access.effective());

    EXPECT_THROW((void)TypeOrganizer(guard).planOrApply(root / "locked", true), fw::engine::IOError);
}
