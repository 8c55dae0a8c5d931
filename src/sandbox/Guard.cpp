#include "sandbox/Guard.hpp"
#include "engine/errors.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <system_error>

using namespace fw::sandbox;
using namespace fw::engine;
using namespace fw::fs::model;

namespace stdfs = std::filesystem;

Guard::Guard(const std::vector<stdfs::path>& configuredRoots) {
    for (const auto& configured : configuredRoots) {
        if (configured.empty()) continue;

        std::error_code ec;
        const auto absolute = configured.is_absolute() ? configured : stdfs::absolute(configured, ec);
        if (ec) {
            log::Registry::sandbox()->warn("[Guard] Cannot make root absolute: {} ({})", configured.string(), ec.message());
            continue;
        }

        const auto canon = stdfs::canonical(absolute, ec);
        if (ec) {
            log::Registry::sandbox()->warn("[Guard] Configured folder does not exist: {} ({})", configured.string(), ec.message());
            continue;
        }

        if (!stdfs::is_directory(canon, ec) || ec) {
            log::Registry::sandbox()->warn("[Guard] Configured folder is not a directory: {}", configured.string());
            continue;
        }

        if (std::ranges::find(roots_, canon) == roots_.end()) roots_.push_back(canon);
    }

    if (roots_.empty()) throw SecurityError("no configured roots");

    for (const auto& r : roots_) log::Registry::sandbox()->debug("[Guard] Allowed root: {}", r.string());
}

std::optional<stdfs::path> Guard::resolve(const stdfs::path& path) const {
    if (path.empty()) return std::nullopt;

    const auto candidate = path.is_absolute() ? path : primaryRoot() / path;

    std::error_code ec;
    stdfs::path existing = candidate.root_path();
    stdfs::path tail;
    bool missing = false;

    for (const auto& part : candidate.relative_path()) {
        if (part.empty()) continue; // trailing separator

        if (missing) {
            if (part == "." || part == "..") return std::nullopt;
            tail /= part;
            continue;
        }

        const auto next = existing / part;
        const auto st = stdfs::symlink_status(next, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) return std::nullopt;
        ec.clear();

        if (stdfs::exists(st)) {
            existing = next;
            continue;
        }

        if (part == "." || part == "..") return std::nullopt;
        missing = true;
        tail /= part;
    }

    auto resolved = stdfs::canonical(existing, ec);
    if (ec) return std::nullopt; // dangling symlink, loop, permission

    if (!tail.empty()) resolved /= tail;
    return resolved;
}

std::optional<stdfs::path> Guard::rootFor(const stdfs::path& resolved) const {
    for (const auto& root : roots_)
        if (isWithin(resolved, root)) return root;
    return std::nullopt;
}

Check Guard::check(const stdfs::path& path) const {
    Check out;
    try {
        const auto resolved = resolve(path);
        if (!resolved) {
            out.message = "Sandbox validation failed: cannot resolve " + path.string();
            log::Registry::sandbox()->warn("[Guard] {}", out.message);
            return out;
        }

        out.resolved_path = *resolved;
        if (const auto root = rootFor(*resolved)) {
            out.is_safe = true;
            out.allowed_root = *root;
            out.message = "Path is within allowed folder: " + root->string();
            return out;
        }

        out.message = "Path outside all allowed folders: " + path.string();
        log::Registry::sandbox()->warn("[Guard] Rejected {} (resolved to {})", path.string(), resolved->string());
    } catch (const std::exception& e) {
        out = Check{};
        out.message = std::string("Sandbox validation failed: ") + e.what();
        log::Registry::sandbox()->error("[Guard] {}", out.message);
    }
    return out;
}

stdfs::path Guard::validate(const stdfs::path& path) const {
    const auto result = check(path);
    if (!result.is_safe || !result.resolved_path) throw SecurityError(result.message);
    return *result.resolved_path;
}

void fw::sandbox::to_json(nlohmann::json& j, const Check& c) {
    j = {
        {"is_safe", c.is_safe},
        {"message", c.message},
        {"resolved_path", c.resolved_path ? nlohmann::json(c.resolved_path->string()) : nlohmann::json(nullptr)}
    };
    if (c.allowed_root) j["allowed_folder"] = c.allowed_root->string();
}
