#pragma once

#include <filesystem>
#include <set>

namespace fw::plan {

// Existence as seen by a plan in flight: earlier items have vacated their sources
// and claimed their destinations. Lets a dry run predict what a commit would do.
class Overlay {
public:
    [[nodiscard]] bool exists(const std::filesystem::path& p) const;
    void move(const std::filesystem::path& from, const std::filesystem::path& to);
    void claim(const std::filesystem::path& p);

private:
    std::set<std::filesystem::path> vacated_, claimed_;
};

}
