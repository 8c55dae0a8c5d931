#include "SandboxFixture.hpp"
#include "plan/Applier.hpp"
#include "plan/NormalizationPlanner.hpp"
#include "fs/DuplicateDetector.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"

#include <nlohmann/json.hpp>

using namespace fw::plan;
using namespace fw::plan::model;

namespace {

RenameItem renameItem(const std::string& from, const std::string& to) {
    return {from, to, "test", true, fw::fs::model::EntryKind::File};
}

}

class ApplierTest : public SandboxFixture {};

TEST_F(ApplierTest, CommitRenamesFiles) {
    writeFile(root / "A B.TXT", "one");
    const fw::sandbox::Guard guard({root});

    const auto r = Applier(guard).apply({renameItem("A B.TXT", "a_b.txt")}, root, false);

    ASSERT_EQ(r.applied.size(), 1u);
    EXPECT_TRUE(r.success());
    EXPECT_EQ(r.state, PlanState::Committed);
    EXPECT_FALSE(fs::exists(root / "A B.TXT"));
    EXPECT_EQ(readFile(root / "a_b.txt"), "one");
}

TEST_F(ApplierTest, DryRunHasNoSideEffects) {
    writeFile(root / "A B.TXT", "one");
    writeFile(root / "C D.txt", "two");
    fs::create_directory(root / "Some Dir");
    const auto before = snapshot(root);
    const auto mtime = fs::last_write_time(root / "A B.TXT");
    const fw::sandbox::Guard guard({root});

    const auto plan = NormalizationPlanner(guard).planAlpha(root);
    const auto r = Applier(guard).apply(plan.items, root, true);

    EXPECT_EQ(r.applied.size(), 3u);
    EXPECT_EQ(r.state, PlanState::Validated);
    EXPECT_TRUE(r.dry_run);
    EXPECT_EQ(snapshot(root), before);
    EXPECT_EQ(fs::last_write_time(root / "A B.TXT"), mtime);
}

TEST_F(ApplierTest, ExistingDestinationIsAConflictAndNeverOverwritten) {
    writeFile(root / "Report.txt", "new");
    writeFile(root / "report.txt", "old");
    const fw::sandbox::Guard guard({root});

    for (const bool dryRun : {true, false}) {
        const auto r = Applier(guard).apply({renameItem("Report.txt", "report.txt")}, root, dryRun);
        ASSERT_EQ(r.errors.size(), 1u);
        EXPECT_EQ(r.errors[0].kind, ItemErrorKind::Conflict);
        EXPECT_TRUE(r.applied.empty());
    }

    EXPECT_EQ(readFile(root / "Report.txt"), "new");
    EXPECT_EQ(readFile(root / "report.txt"), "old");
}

TEST_F(ApplierTest, EveryItemLandsInExactlyOneBucket) {
    writeFile(root / "ok.TXT", "1");
    writeFile(root / "taken", "2");
    writeFile(root / "src", "3");
    const fw::sandbox::Guard guard({root});

    const std::vector<RenameItem> plan{
        renameItem("ok.TXT", "ok.txt"),
        {"same", "same", "", false, fw::fs::model::EntryKind::File},
        renameItem("missing.txt", "found.txt"),
        renameItem("src", "taken"),
        renameItem("src", "../escape"),
        renameItem("src", "sub/dir"),
        renameItem("ok.TXT", "again.txt"),
    };

    const auto r = Applier(guard).apply(plan, root, false);

    EXPECT_EQ(r.total(), plan.size());
    EXPECT_EQ(r.applied.size(), 1u);
    EXPECT_EQ(r.skipped.size(), 1u);
    ASSERT_EQ(r.errors.size(), 5u);
    EXPECT_EQ(r.errors[0].kind, ItemErrorKind::NotFound);
    EXPECT_EQ(r.errors[1].kind, ItemErrorKind::Conflict);
    EXPECT_EQ(r.errors[2].kind, ItemErrorKind::InvalidName);
    EXPECT_EQ(r.errors[3].kind, ItemErrorKind::InvalidName);
    EXPECT_EQ(r.errors[4].kind, ItemErrorKind::NotFound);   // vacated by the first item
    EXPECT_EQ(r.state, PlanState::PartiallyCommitted);
    EXPECT_FALSE(fs::exists(base / "escape"));
}

TEST_F(ApplierTest, DryRunPredictsChainedRenames) {
    writeFile(root / "a", "A");
    writeFile(root / "b", "B");
    const fw::sandbox::Guard guard({root});

    // b -> c frees "b" for a -> b
    const std::vector<RenameItem> plan{renameItem("b", "c"), renameItem("a", "b"), renameItem("c", "a2")};

    const auto dry = Applier(guard).apply(plan, root, true);
    const auto real = Applier(guard).apply(plan, root, false);

    EXPECT_EQ(dry.applied.size(), real.applied.size());
    EXPECT_EQ(dry.errors.size(), real.errors.size());
    EXPECT_EQ(readFile(root / "b"), "A");
    EXPECT_EQ(readFile(root / "a2"), "B");
}

TEST_F(ApplierTest, SymlinkOutOfSandboxIsASecurityError) {
    writeFile(outside / "secret", "s");
    fs::create_symlink(outside / "secret", root / "link");
    const fw::sandbox::Guard guard({root});

    const auto r = Applier(guard).apply({renameItem("link", "renamed")}, root, false);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ItemErrorKind::Security);
    EXPECT_TRUE(fs::is_symlink(root / "link"));
}

TEST_F(ApplierTest, StalePlanReportsMissingSource) {
    writeFile(root / "Old Name.txt", "x");
    const fw::sandbox::Guard guard({root});
    const auto plan = NormalizationPlanner(guard).planAlpha(root);

    fs::remove(root / "Old Name.txt");

    const auto r = Applier(guard).apply(plan.items, root, false);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ItemErrorKind::NotFound);
}

TEST_F(ApplierTest, PhotoTripScenario) {
    writeFile(root / "Photo Trip.JPG", "jpeg bytes");
    writeFile(root / "photo_trip.jpg", "jpeg bytes");
    writeFile(root / "notes.txt", "notes");
    const fw::sandbox::Guard guard({root});

    const auto dupes = fw::fs::DuplicateDetector(guard).findDuplicates(root, false);
    ASSERT_EQ(dupes.groups.size(), 1u);
    EXPECT_EQ(dupes.groups[0].count(), 2u);
    EXPECT_EQ(dupes.groups[0].wasted_bytes, 10u);

    const auto plan = NormalizationPlanner(guard).planAlpha(root);
    const auto it = std::find_if(plan.items.begin(), plan.items.end(),
                                 [](const RenameItem& i) { return i.current_name == "Photo Trip.JPG"; });
    ASSERT_NE(it, plan.items.end());
    EXPECT_TRUE(it->needs_change);
    EXPECT_EQ(it->proposed_name, "photo_trip.jpg");

    const auto r = Applier(guard).apply(plan.items, root, false);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].current_name, "Photo Trip.JPG");
    EXPECT_EQ(r.errors[0].kind, ItemErrorKind::Conflict);
    EXPECT_NE(r.errors[0].message.find("conflict"), std::string::npos);
    EXPECT_TRUE(fs::exists(root / "Photo Trip.JPG"));
    EXPECT_TRUE(fs::exists(root / "photo_trip.jpg"));
    EXPECT_EQ(r.total(), plan.items.size());
}

TEST_F(ApplierTest, ApplyingAPlanLeavesNothingToNormalize) {
    writeFile(root / "My Notes.PDF", "n");
    writeFile(root / "a  -  b.txt", "ab");
    fs::create_directory(root / "Old Stuff");
    const fw::sandbox::Guard guard({root});
    const NormalizationPlanner planner(guard);

    const auto r = Applier(guard).apply(planner.planAlpha(root).items, root, false);
    ASSERT_TRUE(r.errors.empty());

    EXPECT_EQ(planner.planAlpha(root).changesCount(), 0u);
    EXPECT_EQ(readFile(root / "my_notes.pdf"), "n");
    EXPECT_TRUE(fs::is_directory(root / "old_stuff"));
}

TEST_F(ApplierTest, SerializesResult) {
    writeFile(root / "X.txt", "x");
    const fw::sandbox::Guard guard({root});

    const nlohmann::json j = Applier(guard).apply({renameItem("X.txt", "x.txt"), renameItem("nope", "n")}, root, true);
    EXPECT_TRUE(j["dry_run"].get<bool>());
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["state"], "validated");
    EXPECT_EQ(j["applied"][0]["current_name"], "X.txt");
    EXPECT_EQ(j["errors"][0]["kind"], "not_found");
    EXPECT_EQ(j["total_items"], 2);
}

TEST(RenameItemJson, NeedsChangeDefaultsToTrue) {
    const auto item = nlohmann::json{{"current_name", "A"}, {"proposed_name", "a"}}.get<RenameItem>();
    EXPECT_TRUE(item.needs_change);
    EXPECT_EQ(item.kind, fw::fs::model::EntryKind::File);
}

TEST(RenameItemJson, UnknownTypeIsAnInvalidRequest) {
    const nlohmann::json j{{"current_name", "A"}, {"proposed_name", "a"}, {"type", "socket"}};
    EXPECT_THROW((void)j.get<RenameItem>(), fw::engine::InvalidRequestError);

    const nlohmann::json dir{{"current_name", "A"}, {"proposed_name", "a"}, {"type", "directory"}};
    EXPECT_EQ(dir.get<RenameItem>().kind, fw::fs::model::EntryKind::Directory);
}
