#include "file_ops.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path resolve(const fs::path& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(fs::absolute(p, ec), ec);
    return ec ? p.lexically_normal() : r;
}

BrowseResult browse_directory(const fs::path& path) {
    fs::path target = resolve(path);
    std::error_code ec;
    if (!fs::exists(target, ec)) throw FileOpError(FileErrorCode::NotFound, "Path not found");
    if (!fs::is_directory(target, ec)) throw FileOpError(FileErrorCode::NotADirectory, "Path is not a directory");

    BrowseResult out;
    out.path = target;
    fs::directory_iterator it(target, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) throw FileOpError(FileErrorCode::PermissionDenied, "Permission denied");
        throw FileOpError(FileErrorCode::NotFound, ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        DirEntry e;
        e.name = it->path().filename().string();
        std::error_code sec;
        auto st = fs::status(it->path(), sec);
        if (sec) {
            e.type = "unknown";
        } else {
            e.type = fs::is_directory(st) ? "dir" : "file";
            if (fs::is_regular_file(st)) {
                auto sz = fs::file_size(it->path(), sec);
                if (!sec) e.size = sz;
            }
        }
        out.entries.push_back(std::move(e));
    }
    if (ec) log_warn("browse " + target.string() + ": listing truncated: " + ec.message());
    std::sort(out.entries.begin(), out.entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return out;
}

std::vector<FileInfo> list_files(const fs::path& dir) {
    std::vector<FileInfo> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        auto sz = it->file_size(fec);
        if (fec) continue;
        out.push_back({it->path().filename().string(), sz});
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return out;
}

fs::path resolve_download(const fs::path& dir, const std::string& name) {
    fs::path base = resolve(dir);
    fs::path target = resolve(base / name);
    fs::path rel = target.lexically_relative(base);
    if (name.empty() || rel.empty() || *rel.begin() == "..") {
        throw FileOpError(FileErrorCode::InvalidPath, "Invalid file path");
    }
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) throw FileOpError(FileErrorCode::NotFound, "File not found");
    return target;
}

static double to_gb(std::uintmax_t bytes) {
    double gb = (double)bytes / (1024.0 * 1024.0 * 1024.0);
    return std::round(gb * 100.0) / 100.0;
}

DiskUsage disk_usage(const fs::path& path) {
    std::error_code ec;
    fs::space_info si = fs::space(path, ec);
    if (ec) throw FileOpError(FileErrorCode::NotFound, path.string() + ": " + ec.message());
    DiskUsage du;
    du.total_gb = to_gb(si.capacity);
    du.used_gb = to_gb(si.capacity - si.free);
    du.free_gb = to_gb(si.available);
    return du;
}

UploadSink::UploadSink() {
    std::string tmpl = (fs::temp_directory_path() / "executor-upload-XXXXXX").string();
    fd_ = ::mkstemp(tmpl.data());
    if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "mkstemp");
    tmp_path_ = tmpl;
    // mkstemp creates 0600; uploads should be readable like any other file.
    if (::fchmod(fd_, 0644) != 0) log_warn("upload: fchmod failed on " + tmpl);
}

UploadSink::~UploadSink() {
    if (fd_ >= 0) ::close(fd_);
    if (!committed_) {
        std::error_code ec;
        fs::remove(tmp_path_, ec);
    }
}

void UploadSink::write(const char* data, std::size_t n) {
    while (n > 0) {
        ssize_t w = ::write(fd_, data, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write upload");
        }
        data += w;
        n -= (std::size_t)w;
        written_ += (std::uintmax_t)w;
    }
}

fs::path UploadSink::commit(const fs::path& dest_dir, const std::string& filename) {
    fs::path name = fs::path(filename).filename();
    if (name.empty() || name == "." || name == "..") {
        throw FileOpError(FileErrorCode::InvalidPath, "Invalid file name");
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        throw std::system_error(errno, std::generic_category(), "close upload");
    }
    fd_ = -1;

    fs::path dest = resolve(dest_dir);
    fs::create_directories(dest);
    fs::path target = dest / name;
    std::error_code ec;
    fs::rename(tmp_path_, target, ec);
    if (ec == std::errc::cross_device_link) {
        fs::copy_file(tmp_path_, target, fs::copy_options::overwrite_existing);
        fs::remove(tmp_path_);
    } else if (ec) {
        throw fs::filesystem_error("move upload", tmp_path_, target, ec);
    }
    committed_ = true;
    return target;
}
