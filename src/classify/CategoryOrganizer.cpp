#include "classify/CategoryOrganizer.hpp"
#include "classify/Classifier.hpp"
#include "classify/ConflictResolver.hpp"
#include "plan/Overlay.hpp"
#include "fs/Lister.hpp"
#include "fs/model/Path.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <map>
#include <system_error>

using namespace fw::classify;
using namespace fw::classify::model;
using namespace fw::plan::model;
using namespace fw::fs::model;
using namespace fw::engine;

namespace stdfs = std::filesystem;

namespace {

void addCandidate(std::vector<FileCandidate>& out, const stdfs::directory_entry& entry, const stdfs::path& folder) {
    std::error_code ec;
    if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) return;
    const auto size = entry.file_size(ec);
    if (ec) {
        fw::log::Registry::classify()->warn("[CategoryOrganizer] Cannot stat {}: {}", entry.path().string(), ec.message());
        return;
    }
    out.push_back({
        relativeTo(entry.path(), folder).string(),
        entry.path(),
        size,
        toLower(splitExtension(entry.path().filename().string()).second)
    });
}

std::vector<FileCandidate> scanFiles(const stdfs::path& folder, const stdfs::path& targetDir, const bool recursive) {
    std::vector<FileCandidate> files;
    std::error_code ec;

    if (!recursive) {
        stdfs::directory_iterator it(folder, ec);
        for (const stdfs::directory_iterator end{}; !ec && it != end; it.increment(ec))
            if (!isHidden(it->path().filename().string())) addCandidate(files, *it, folder);
    } else {
        stdfs::recursive_directory_iterator it(folder, stdfs::directory_options::skip_permission_denied, ec);
        for (const stdfs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
            if (isHidden(it->path().filename().string()) || it->path() == targetDir) {
                it.disable_recursion_pending();
                continue;
            }
            addCandidate(files, *it, folder);
        }
    }

    if (ec) fw::log::Registry::classify()->warn("[CategoryOrganizer] Scan of {} stopped early: {}", folder.string(), ec.message());

    std::ranges::sort(files, {}, &FileCandidate::filename);
    return files;
}

std::string nextFreeName(const stdfs::path& dir, const std::string& name, const fw::plan::Overlay& overlay) {
    const auto [stem, ext] = splitExtension(name);
    for (unsigned int n = 2; n < 10000; ++n) {
        auto candidate = stem + "_" + std::to_string(n) + ext;
        if (!overlay.exists(dir / candidate)) return candidate;
    }
    return {};
}

uintmax_t sizeOrZero(const stdfs::path& p) {
    std::error_code ec;
    const auto size = stdfs::file_size(p, ec);
    return ec ? 0 : size;
}

void replaceExisting(const stdfs::path& from, const stdfs::path& to, const bool copy) {
    if (copy) {
        stdfs::copy_file(from, to, stdfs::copy_options::overwrite_existing);
        return;
    }
    std::error_code ec;
    stdfs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) throw stdfs::filesystem_error("replace", from, to, ec);
    stdfs::copy_file(from, to, stdfs::copy_options::overwrite_existing);
    stdfs::remove(from);
}

}

CategoryOrganizeResult CategoryOrganizer::organize(const stdfs::path& resolvedFolder,
                                                   const std::string& category,
                                                   const stdfs::path& targetFolder,
                                                   const CategoryOptions& opts) const {
    fs::Lister::requireDirectory(resolvedFolder, resolvedFolder);
    if (category.empty()) throw InvalidRequestError("category must not be empty");
    if (targetFolder.empty()) throw InvalidRequestError("target folder must not be empty");

    const auto targetDir = guard_.validate(targetFolder.is_absolute() ? targetFolder : resolvedFolder / targetFolder);

    std::error_code ec;
    bool targetExists = stdfs::exists(targetDir, ec);
    if (targetExists && !stdfs::is_directory(targetDir, ec))
        throw NotADirectoryError("Target is not a directory: " + targetDir.string());

    CategoryOrganizeResult result;
    result.category = category;
    result.folder = resolvedFolder;
    result.target_folder = targetDir;
    result.dry_run = opts.dry_run;
    result.copy = opts.copy;
    result.recursive = opts.recursive;

    const auto candidates = scanFiles(resolvedFolder, targetDir, opts.recursive);
    result.total_evaluated = candidates.size();

    log::Registry::classify()->info("[CategoryOrganizer] Evaluating {} files for category '{}'", candidates.size(), category);

    std::vector<Decision> decisions;
    std::string classifierFailure;
    if (!candidates.empty()) {
        try {
            decisions = classifier_.classify(candidates, category);
        } catch (const std::exception& e) {
            classifierFailure = e.what();
            log::Registry::classify()->warn("[CategoryOrganizer] Classifier failed, excluding all files: {}", e.what());
        }
    }

    std::map<std::string, const Decision*> byName;
    for (const auto& d : decisions) byName.emplace(d.filename, &d);

    plan::Overlay overlay;

    for (const auto& cand : candidates) {
        CategoryDecision decision{cand.filename, false, {}};
        if (!classifierFailure.empty()) decision.rationale = "Classifier failed: " + classifierFailure;
        else if (const auto it = byName.find(cand.filename); it == byName.end()) decision.rationale = "No decision returned for this file";
        else decision = {cand.filename, it->second->include, it->second->rationale};
        result.decisions.push_back(decision);

        if (!decision.include) {
            result.skipped.push_back({cand.filename, decision.rationale.empty() ? "Not part of the category" : decision.rationale});
            continue;
        }

        const auto name = cand.path.filename().string();
        auto dest = targetDir / name;

        const auto fail = [&](const ItemErrorKind kind, const std::string& message) {
            result.errors.push_back({cand.filename, dest.string(), kind, message});
        };

        if (const auto c = guard_.check(cand.path); !c.is_safe) {
            fail(ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }
        if (const auto c = guard_.check(dest); !c.is_safe) {
            fail(ItemErrorKind::Security, "Security violation: " + c.message);
            continue;
        }

        bool renamed = false, replaced = false;

        if (overlay.exists(dest)) {
            Resolution res;
            try {
                res = resolver_.resolve({name, dest, sizeOrZero(dest)}, {name, cand.path, cand.size});
            } catch (const std::exception& e) {
                res = {ConflictAction::Skip, std::nullopt, std::string("Conflict resolver failed: ") + e.what()};
            }

            if (res.action == ConflictAction::Skip) {
                result.skipped.push_back({cand.filename, "Skipped: " + res.rationale});
                continue;
            }

            if (res.action == ConflictAction::Replace) {
                if (!allowReplace_) {
                    result.skipped.push_back({cand.filename, "Replace not permitted; kept existing file"});
                    continue;
                }
                if (!stdfs::is_regular_file(dest, ec)) {
                    result.skipped.push_back({cand.filename, "Existing destination is not a regular file"});
                    continue;
                }
                replaced = true;
            } else {
                const auto newName = res.new_name ? *res.new_name : nextFreeName(targetDir, name, overlay);
                const auto alt = targetDir / newName;
                if (!isSingleComponent(newName)) {
                    result.skipped.push_back({cand.filename, "Rename target rejected: invalid name"});
                    continue;
                }
                if (!guard_.check(alt).is_safe) {
                    result.skipped.push_back({cand.filename, "Rename target rejected: outside sandbox"});
                    continue;
                }
                if (overlay.exists(alt)) {
                    result.skipped.push_back({cand.filename, "Rename target rejected: already exists"});
                    continue;
                }
                dest = alt;
                renamed = true;
            }
        }

        if (!opts.dry_run) {
            try {
                if (!targetExists && util::ensureDirectory(targetDir)) {
                    result.target_created = true;
                    log::Registry::audit()->info("mkdir {}", targetDir.string());
                }
                targetExists = true;

                if (replaced) replaceExisting(cand.path, dest, opts.copy);
                else if (opts.copy) util::copyNoReplace(cand.path, dest);
                else util::moveNoReplace(cand.path, dest);

                log::Registry::audit()->info("{}{} {} -> {}", opts.copy ? "copy" : "move", replaced ? " (replace)" : "",
                                             cand.path.string(), dest.string());
            } catch (const stdfs::filesystem_error& e) {
                if (e.code() == std::errc::file_exists) result.skipped.push_back({cand.filename, "Destination appeared while organizing"});
                else fail(ItemErrorKind::IOFailure, std::string(opts.copy ? "Copy" : "Move") + " failed: " + e.code().message());
                continue;
            }
        } else if (!targetExists) {
            result.target_created = true;
            targetExists = true;
        }

        if (opts.copy) overlay.claim(dest);
        else overlay.move(cand.path, dest);

        result.moved.push_back({cand.filename, dest, renamed, replaced});
    }

    log::Registry::classify()->info("[CategoryOrganizer] '{}': {} {}, {} skipped, {} errors (dry_run={})",
                                    category, result.moved.size(), opts.copy ? "copied" : "moved",
                                    result.skipped.size(), result.errors.size(), opts.dry_run);
    return result;
}
