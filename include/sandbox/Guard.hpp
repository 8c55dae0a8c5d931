#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fw::sandbox {

struct Check {
    bool is_safe{false};
    std::string message{};
    std::optional<std::filesystem::path> resolved_path{};
    std::optional<std::filesystem::path> allowed_root{};
};

void to_json(nlohmann::json& j, const Check& c);

// Sole authority on "is this path inside one of the allowed roots".
// Every component asks the guard before it stats, reads or writes anything.
class Guard {
public:
    /// Roots are canonicalized here; missing or non-directory roots are dropped with a warning.
    /// Throws engine::SecurityError when no usable root remains.
    explicit Guard(const std::vector<std::filesystem::path>& configuredRoots);

    /// Never throws. Any resolution failure yields is_safe == false.
    [[nodiscard]] Check check(const std::filesystem::path& path) const;

    /// Returns the resolved absolute path or throws engine::SecurityError.
    [[nodiscard]] std::filesystem::path validate(const std::filesystem::path& path) const;

    /// Resolves symlinks and ".." segments. For paths that do not exist yet, the nearest
    /// existing ancestor is resolved and the missing tail appended; a missing tail holding
    /// "." or ".." is rejected. Returns nullopt on any failure.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::filesystem::path& path) const;

    [[nodiscard]] std::optional<std::filesystem::path> rootFor(const std::filesystem::path& resolved) const;

    [[nodiscard]] const std::vector<std::filesystem::path>& roots() const { return roots_; }
    [[nodiscard]] const std::filesystem::path& primaryRoot() const { return roots_.front(); }

private:
    std::vector<std::filesystem::path> roots_;
};

}
