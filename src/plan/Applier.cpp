#include "plan/Applier.hpp"
#include "fs/Lister.hpp"
#include "fs/model/Path.hpp"
#include "sandbox/Guard.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <system_error>

using namespace fw::plan;
using namespace fw::plan::model;
using namespace fw::fs::model;

namespace stdfs = std::filesystem;

PlanExecutionResult Applier::apply(const std::vector<RenameItem>& plan,
                                   const stdfs::path& resolvedFolder,
                                   const bool dryRun) const {
    fs::Lister::requireDirectory(resolvedFolder, resolvedFolder);

    PlanExecutionResult result;
    result.dry_run = dryRun;
    result.folder = resolvedFolder;

    Overlay overlay;

    const auto fail = [&](const RenameItem& item, const ItemErrorKind kind, const std::string& message) {
        result.errors.push_back({item.current_name, item.proposed_name, kind, message});
    };

    for (const auto& item : plan) {
        if (!item.needs_change || item.current_name == item.proposed_name) {
            result.skipped.push_back({item.current_name, "No change needed"});
            continue;
        }

        if (!isSingleComponent(item.current_name) || !isSingleComponent(item.proposed_name)) {
            fail(item, ItemErrorKind::InvalidName, "Names must be single path components");
            continue;
        }

        const auto from = resolvedFolder / item.current_name;
        const auto to = resolvedFolder / item.proposed_name;

        if (const auto c = guard_.check(from); !c.is_safe) {
            fail(item, ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }
        if (const auto c = guard_.check(to); !c.is_safe) {
            fail(item, ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }

        if (!overlay.exists(from)) {
            fail(item, ItemErrorKind::NotFound, "Source does not exist");
            continue;
        }
        if (overlay.exists(to)) {
            fail(item, ItemErrorKind::Conflict, "Destination already exists (conflict)");
            continue;
        }

        if (!dryRun) {
            try {
                util::renameNoReplace(from, to);
                log::Registry::audit()->info("rename {} -> {}", from.string(), to.string());
                log::Registry::plan()->info("[Applier] Renamed: {} -> {}", item.current_name, item.proposed_name);
            } catch (const stdfs::filesystem_error& e) {
                if (e.code() == std::errc::file_exists) fail(item, ItemErrorKind::Conflict, "Destination already exists (conflict)");
                else if (e.code() == std::errc::no_such_file_or_directory) fail(item, ItemErrorKind::NotFound, "Source does not exist");
                else fail(item, ItemErrorKind::IOFailure, std::string("Rename failed: ") + e.code().message());
                continue;
            }
        }

        overlay.move(from, to);
        result.applied.push_back({item.current_name, item.proposed_name, item.kind, std::nullopt});
    }

    result.finalizeState();

    log::Registry::plan()->info("[Applier] Plan execution: {} applied, {} skipped, {} errors (dry_run={})",
                                result.applied.size(), result.skipped.size(), result.errors.size(), dryRun);
    return result;
}
