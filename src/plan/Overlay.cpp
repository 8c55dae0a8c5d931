#include "plan/Overlay.hpp"

#include <system_error>

using namespace fw::plan;

namespace stdfs = std::filesystem;

bool Overlay::exists(const stdfs::path& p) const {
    if (claimed_.contains(p)) return true;
    if (vacated_.contains(p)) return false;
    std::error_code ec;
    return stdfs::symlink_status(p, ec).type() != stdfs::file_type::not_found;
}

void Overlay::move(const stdfs::path& from, const stdfs::path& to) {
    claimed_.erase(from);
    vacated_.insert(from);
    claim(to);
}

void Overlay::claim(const stdfs::path& p) {
    vacated_.erase(p);
    claimed_.insert(p);
}
