#include "fs/DuplicateDetector.hpp"
#include "fs/Lister.hpp"
#include "fs/model/Path.hpp"
#include "crypto/util/hash.hpp"
#include "sandbox/Guard.hpp"
#include "log/Registry.hpp"
#include "engine/errors.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <system_error>
#include <vector>

using namespace fw::fs;
using namespace fw::fs::model;

namespace stdfs = std::filesystem;

namespace {

std::vector<stdfs::path> collectFiles(const stdfs::path& folder, const bool recursive, std::vector<UnreadableFile>& unreadable) {
    std::vector<stdfs::path> files;
    std::vector<stdfs::path> pending{folder};

    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        stdfs::directory_iterator it(dir, ec);
        if (ec && dir == folder) throw fw::engine::IOError("Unable to enumerate " + folder.string() + ": " + ec.message());

        for (const stdfs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
            if (isHidden(it->path().filename().string())) continue;

            std::error_code lec;
            if (it->is_symlink(lec)) continue;
            if (recursive && it->is_directory(lec)) {
                pending.push_back(it->path());
                continue;
            }
            if (!it->is_regular_file(lec)) {
                if (lec) unreadable.push_back({relativeTo(it->path(), folder), lec.message()});
                continue;
            }
            files.push_back(it->path());
        }

        if (ec) {
            fw::log::Registry::fs()->warn("[DuplicateDetector] Cannot walk {}: {}", dir.string(), ec.message());
            unreadable.push_back({relativeTo(dir, folder), ec.message()});
        }
    }

    return files;
}

}

DuplicatesResult DuplicateDetector::findDuplicates(const stdfs::path& resolvedFolder,
                                                   const bool recursive,
                                                   const std::atomic<bool>* cancel) const {
    Lister::requireDirectory(resolvedFolder, resolvedFolder);

    DuplicatesResult result;
    result.folder = resolvedFolder;
    result.recursive = recursive;

    const auto files = collectFiles(resolvedFolder, recursive, result.unreadable);
    std::map<std::string, std::vector<DuplicateMember>> byHash;

    for (const auto& file : files) {
        if (cancel && cancel->load()) {
            log::Registry::fs()->info("[DuplicateDetector] Scan of {} cancelled after {} files", resolvedFolder.string(), result.files_scanned);
            result.cancelled = true;
            break;
        }

        const auto rel = relativeTo(file, resolvedFolder);

        if (!guard_.check(file).is_safe) {
            result.unreadable.push_back({rel, "outside sandbox"});
            continue;
        }

        try {
            DuplicateMember member{Entry::fromStatus(file.filename().string(), file), file, rel};
            auto digest = crypto::hash::blake2b(file, chunkSize_);
            byHash[std::move(digest)].push_back(std::move(member));
            ++result.files_scanned;
        } catch (const std::exception& e) {
            log::Registry::crypto()->warn("[DuplicateDetector] Cannot hash {}: {}", rel.string(), e.what());
            result.unreadable.push_back({rel, e.what()});
        }
    }

    for (auto& [digest, members] : byHash) {
        if (members.size() < 2) continue;

        std::ranges::sort(members, [](const DuplicateMember& a, const DuplicateMember& b) {
            if (a.entry.name != b.entry.name) return a.entry.name < b.entry.name;
            return a.relative_path < b.relative_path;
        });

        DuplicateGroup group;
        group.content_hash = digest;
        group.representative_size = members.front().entry.size_bytes.value_or(0);
        group.wasted_bytes = group.representative_size * (members.size() - 1);
        group.members = std::move(members);
        result.groups.push_back(std::move(group));
    }

    // byHash iteration is already hash-ordered, so stable_sort keeps ties deterministic
    std::ranges::stable_sort(result.groups, std::greater<>{}, &DuplicateGroup::wasted_bytes);

    log::Registry::fs()->info("[DuplicateDetector] {} files scanned in {}, {} duplicate groups",
                              result.files_scanned, resolvedFolder.string(), result.groups.size());
    return result;
}
