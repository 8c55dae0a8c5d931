#include "util/files.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <system_error>

namespace stdfs = std::filesystem;

namespace {

[[noreturn]] void throwFsError(const char* what, const stdfs::path& from, const stdfs::path& to, const int err) {
    throw stdfs::filesystem_error(what, from, to, std::error_code(err, std::generic_category()));
}

}

void fw::util::renameNoReplace(const stdfs::path& from, const stdfs::path& to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) return;

    const int err = errno;
    if (err != EINVAL && err != ENOSYS) throwFsError("renameNoReplace", from, to, err);

    std::error_code ec;
    if (stdfs::symlink_status(to, ec).type() != stdfs::file_type::not_found)
        throwFsError("renameNoReplace", from, to, EEXIST);

    stdfs::rename(from, to);
}

void fw::util::moveNoReplace(const stdfs::path& from, const stdfs::path& to) {
    try {
        renameNoReplace(from, to);
    } catch (const stdfs::filesystem_error& e) {
        if (e.code() != std::errc::cross_device_link) throw;
        copyNoReplace(from, to);
        stdfs::remove(from);
    }
}

void fw::util::copyNoReplace(const stdfs::path& from, const stdfs::path& to) {
    std::error_code ec;
    stdfs::copy_file(from, to, stdfs::copy_options::none, ec);
    if (ec) throwFsError("copyNoReplace", from, to, ec.value());
}

bool fw::util::ensureDirectory(const stdfs::path& dir) {
    std::error_code ec;
    if (stdfs::create_directories(dir, ec)) return true;
    if (ec) throwFsError("ensureDirectory", dir, {}, ec.value());
    if (!stdfs::is_directory(dir, ec)) throwFsError("ensureDirectory", dir, {}, ENOTDIR);
    return false;
}
