#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class FileErrorCode { NotFound, NotADirectory, PermissionDenied, InvalidPath };

class FileOpError : public std::runtime_error {
public:
    FileOpError(FileErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}
    FileErrorCode code() const { return code_; }

private:
    FileErrorCode code_;
};

struct DirEntry {
    std::string name;
    std::string type; // "dir" | "file" | "unknown"
    std::optional<std::uintmax_t> size;
};

struct BrowseResult {
    std::filesystem::path path;
    std::vector<DirEntry> entries; // sorted by name
};

struct FileInfo {
    std::string name;
    std::uintmax_t size{0};
};

struct DiskUsage {
    double total_gb{0.0};
    double used_gb{0.0};
    double free_gb{0.0};
};

BrowseResult browse_directory(const std::filesystem::path& path);

// Regular files directly under `dir`; a missing directory yields nothing.
std::vector<FileInfo> list_files(const std::filesystem::path& dir);

// Path of `name` inside `dir`. Throws InvalidPath if it escapes `dir`,
// NotFound if there is no such regular file.
std::filesystem::path resolve_download(const std::filesystem::path& dir, const std::string& name);

DiskUsage disk_usage(const std::filesystem::path& path);

// Receives an uploaded file into a temporary file, then moves it into place.
// The temporary is removed if the upload is never committed.
class UploadSink {
public:
    UploadSink();
    ~UploadSink();

    UploadSink(const UploadSink&) = delete;
    UploadSink& operator=(const UploadSink&) = delete;

    void write(const char* data, std::size_t n);
    std::filesystem::path commit(const std::filesystem::path& dest_dir, const std::string& filename);
    std::uintmax_t bytes_written() const { return written_; }

private:
    std::filesystem::path tmp_path_;
    int fd_{-1};
    std::uintmax_t written_{0};
    bool committed_{false};
};
