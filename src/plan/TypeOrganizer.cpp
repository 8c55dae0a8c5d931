#include "plan/TypeOrganizer.hpp"
#include "plan/Overlay.hpp"
#include "fs/Lister.hpp"
#include "fs/model/Path.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <set>
#include <system_error>

using namespace fw::plan;
using namespace fw::plan::model;
using namespace fw::fs::model;

namespace stdfs = std::filesystem;

namespace {

std::vector<std::string> topLevelFiles(const stdfs::path& folder) {
    std::vector<std::string> names;
    std::error_code ec;
    stdfs::directory_iterator it(folder, ec);
    if (ec) throw fw::engine::IOError("Unable to enumerate " + folder.string() + ": " + ec.message());

    for (const stdfs::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (isHidden(name)) continue;
        std::error_code fec;
        if (it->is_regular_file(fec)) names.push_back(name);
    }

    if (ec) fw::log::Registry::plan()->warn("[TypeOrganizer] Listing of {} stopped early: {}", folder.string(), ec.message());

    std::ranges::sort(names);
    return names;
}

}

std::string fw::plan::typeFolderFor(const std::string& fileName) {
    const auto ext = splitExtension(fileName).second;
    if (ext.empty()) return NO_EXTENSION_FOLDER;
    return toUpper(ext.substr(1));
}

OrganizeByTypeResult TypeOrganizer::planOrApply(const stdfs::path& resolvedFolder, const bool dryRun) const {
    fs::Lister::requireDirectory(resolvedFolder, resolvedFolder);

    OrganizeByTypeResult result;
    result.dry_run = dryRun;
    result.folder = resolvedFolder;

    const auto folderName = toUpper(resolvedFolder.filename().string());

    Overlay overlay;
    std::set<stdfs::path> knownFolders;

    for (const auto& name : topLevelFiles(resolvedFolder)) {
        const auto target = typeFolderFor(name);

        if (folderName == target) {
            result.skipped.push_back({name, "Already inside matching type folder"});
            continue;
        }

        const auto current = resolvedFolder / name;
        const auto targetDir = resolvedFolder / target;
        const auto targetPath = targetDir / name;
        const auto ext = splitExtension(name).second;

        result.plan.push_back({
            name, current, targetPath, target,
            ext.empty() ? "Group extensionless files together" : "Group " + toLower(ext.substr(1)) + " files together"
        });

        const auto fail = [&](const ItemErrorKind kind, const std::string& message) {
            result.errors.push_back({name, (stdfs::path(target) / name).string(), kind, message});
        };

        if (const auto c = guard_.check(current); !c.is_safe) {
            fail(ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }
        if (const auto c = guard_.check(targetDir); !c.is_safe) {
            fail(ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }

        const bool folderExists = knownFolders.contains(targetDir) || overlay.exists(targetDir);
        std::error_code ec;
        if (folderExists && !knownFolders.contains(targetDir) && !stdfs::is_directory(targetDir, ec)) {
            fail(ItemErrorKind::Conflict, "Target folder exists and is not a directory: " + targetDir.string());
            continue;
        }

        if (const auto c = guard_.check(targetPath); !c.is_safe) {
            fail(ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }

        if (folderExists && overlay.exists(targetPath)) {
            result.skipped.push_back({name, "Target already exists: " + targetPath.string()});
            continue;
        }

        if (dryRun) {
            if (!folderExists && std::ranges::find(result.created_folders, targetDir) == result.created_folders.end())
                result.created_folders.push_back(targetDir);
        } else {
            try {
                if (util::ensureDirectory(targetDir)) {
                    result.created_folders.push_back(targetDir);
                    log::Registry::audit()->info("mkdir {}", targetDir.string());
                }
                util::renameNoReplace(current, targetPath);
                log::Registry::audit()->info("move {} -> {}", current.string(), targetPath.string());
            } catch (const stdfs::filesystem_error& e) {
                if (e.code() == std::errc::file_exists) result.skipped.push_back({name, "Target already exists: " + targetPath.string()});
                else fail(ItemErrorKind::IOFailure, std::string("Move failed: ") + e.code().message());
                continue;
            }
        }

        knownFolders.insert(targetDir);
        overlay.move(current, targetPath);
        result.applied.push_back({name, (stdfs::path(target) / name).string(), EntryKind::File, target});
    }

    result.finalizeState();

    log::Registry::plan()->info("[TypeOrganizer] {} files considered, {} moved, {} skipped, {} errors (dry_run={})",
                                result.plan.size(), result.applied.size(), result.skipped.size(),
                                result.errors.size(), dryRun);
    return result;
}
