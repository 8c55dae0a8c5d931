#include "fs/Lister.hpp"
#include "fs/model/Path.hpp"
#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <system_error>

using namespace fw::fs;
using namespace fw::fs::model;
using namespace fw::engine;

namespace stdfs = std::filesystem;

void Lister::requireDirectory(const stdfs::path& resolvedFolder, const stdfs::path& requested) {
    std::error_code ec;
    const auto st = stdfs::status(resolvedFolder, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw IOError("Folder not accessible: " + requested.string() + " (" + ec.message() + ")");
    if (!stdfs::exists(st)) throw NotFoundError("Folder not found: " + requested.string());
    if (!stdfs::is_directory(st)) throw NotADirectoryError("Path is not a directory: " + requested.string());
}

ListResult Lister::list(const stdfs::path& resolvedFolder) const {
    requireDirectory(resolvedFolder, resolvedFolder);

    ListResult result;
    result.folder = resolvedFolder;
    if (const auto root = guard_.rootFor(resolvedFolder)) {
        result.allowed_root = *root;
        result.relative_path = relativeTo(resolvedFolder, *root);
    }

    std::error_code ec;
    stdfs::directory_iterator it(resolvedFolder, ec);
    if (ec) throw IOError("Unable to enumerate " + resolvedFolder.string() + ": " + ec.message());

    for (const stdfs::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (isHidden(name)) continue;

        std::error_code lec;
        if (it->is_symlink(lec) && !guard_.check(it->path()).is_safe) {
            log::Registry::fs()->warn("[Lister] Skipping symlink leaving the sandbox: {}", name);
            ++result.skipped;
            continue;
        }

        try {
            result.items.push_back(Entry::fromStatus(name, it->path()));
        } catch (const stdfs::filesystem_error& e) {
            log::Registry::fs()->warn("[Lister] Cannot stat {}: {}", name, e.code().message());
            ++result.skipped;
        }
    }

    if (ec) log::Registry::fs()->warn("[Lister] Listing of {} stopped early: {}", resolvedFolder.string(), ec.message());

    std::ranges::sort(result.items, {}, &Entry::name);

    log::Registry::fs()->debug("[Lister] Listed {} items in {}", result.items.size(), resolvedFolder.string());
    return result;
}
