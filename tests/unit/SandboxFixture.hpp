#pragma once

#include <gtest/gtest.h>
#include <sys/fsuid.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Permission bits do not stop root. While alive, filesystem access checks of this thread run
// as "nobody" when the process is root, so chmod-based tests behave the same for every user.
class UnprivilegedAccess {
public:
    UnprivilegedAccess() {
        if (::geteuid() != 0) return;
        ::setfsuid(NOBODY);
        dropped_ = static_cast<uid_t>(::setfsuid(NOBODY)) == NOBODY;
    }

    ~UnprivilegedAccess() {
        if (dropped_) ::setfsuid(0);
    }

    UnprivilegedAccess(const UnprivilegedAccess&) = delete;
    UnprivilegedAccess& operator=(const UnprivilegedAccess&) = delete;

    [[nodiscard]] bool effective() const { return ::geteuid() != 0 || dropped_; }

private:
    static constexpr uid_t NOBODY = 65534;
    bool dropped_ = false;
};

// Fresh "<tmp>/fw-XXXXXX/{root,outside}" per test. Paths are canonical so they compare
// equal to what the guard resolves.
class SandboxFixture : public ::testing::Test {
protected:
    fs::path base, root, outside;

    void SetUp() override {
        std::string tmpl = (fs::temp_directory_path() / "fw-XXXXXX").string();
        ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
        base = fs::canonical(tmpl);
        root = base / "root";
        outside = base / "outside";
        fs::create_directory(root);
        fs::create_directory(outside);
    }

    void TearDown() override {
        std::error_code ec;
        for (const auto& p : locked_) fs::permissions(p, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::permissions(base, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(base, ec);
    }

    // Strips every permission bit; restored before cleanup. The sandbox is opened up to
    // "others" so that an UnprivilegedAccess scope can still reach everything else.
    void lock(const fs::path& p) {
        constexpr auto readable = fs::perms::group_read | fs::perms::others_read;
        constexpr auto searchable = fs::perms::group_exec | fs::perms::others_exec;
        for (const auto& dir : {base, root, outside}) fs::permissions(dir, readable | searchable, fs::perm_options::add);
        for (const auto& e : fs::recursive_directory_iterator(root)) {
            if (e.is_symlink()) continue;
            fs::permissions(e.path(), e.is_directory() ? readable | searchable : readable, fs::perm_options::add);
        }
        fs::permissions(p, fs::perms::none);
        locked_.push_back(p);
    }

    static void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    // Relative names of everything under dir, sorted, for before/after comparisons.
    static std::vector<std::string> snapshot(const fs::path& dir) {
        std::vector<std::string> out;
        for (const auto& e : fs::recursive_directory_iterator(dir))
            out.push_back(fs::relative(e.path(), dir).string() + (e.is_directory() ? "/" : "=" + readFile(e.path())));
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::vector<fs::path> locked_;
};
