#pragma once

// ============================================================
// file_io.hpp -- Sequential file I/O for one transfer
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: sequential chunk reads of the source file ----
class FileReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Read up to 'len' bytes; returns 0 at end of file.
    // Throws std::runtime_error on a read error.
    size_t read(void* buf, size_t len);

    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    void close();

private:
    std::FILE*  fp_{nullptr};
    u64         size_{0};
    std::string path_;
};

// ---- FileWriter: truncate-or-append writes of the destination ----
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open for writing. append=false truncates; append=true keeps the
    // existing bytes and positions at the end.
    void open(const std::string& path, bool append);

    // Write all of 'len' bytes; throws std::runtime_error on a short write
    void write(const void* data, size_t len);

    void close();

    bool is_open() const { return fp_ != nullptr; }

    // Bytes in the file: the pre-existing length in append mode plus
    // everything written since open().
    u64 offset() const { return offset_; }

    const std::string& path() const { return path_; }

private:
    std::FILE*  fp_{nullptr};
    u64         offset_{0};
    std::string path_;
};

// ---- Utility functions ----

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

bool file_exists(const std::string& path);

// True when the last path component has an extension ("a/b.txt")
bool has_extension(const std::string& path);

// Receiver destination: the caller's chosen path, with the sender's
// extension appended when the chosen path has none. Falls back to the
// extension of the header's own name for the two-field form.
std::string resolve_destination(const std::string& chosen, const TransferHeader& header);

// "received_file_YYYYmmdd_HHMMSS" inside 'dir'
std::string auto_destination(const std::string& dir);

} // namespace file_io
