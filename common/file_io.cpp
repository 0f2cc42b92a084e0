// ============================================================
// file_io.cpp -- Sequential file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "protocol_io.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace file_io;

static std::string errno_str() {
    return std::string(std::strerror(errno)) + " (errno=" + std::to_string(errno) + ")";
}

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path) : path_(path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path);
    }
    fp_ = std::fopen(path.c_str(), "rb");
    if (!fp_) {
        throw std::runtime_error("Cannot open file: " + path + ": " + errno_str());
    }
    size_ = get_file_size(path);
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read(void* buf, size_t len) {
    if (!fp_) throw std::runtime_error("FileReader::read on closed file: " + path_);
    size_t n = std::fread(buf, 1, len, fp_);
    if (n < len && std::ferror(fp_)) {
        throw std::runtime_error("Read error on " + path_ + ": " + errno_str());
    }
    return n;
}

void FileReader::close() {
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::~FileWriter() {
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

void FileWriter::open(const std::string& file_path, bool append) {
    close();
    path_   = file_path;
    offset_ = append ? get_file_size(file_path) : 0;
    fp_ = std::fopen(file_path.c_str(), append ? "ab" : "wb");
    if (!fp_) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + errno_str());
    }
}

void FileWriter::write(const void* data, size_t len) {
    if (len == 0) return;
    if (!fp_) throw std::runtime_error("FileWriter::write on closed file: " + path_);
    size_t n = std::fwrite(data, 1, len, fp_);
    if (n != len) {
        throw std::runtime_error("Write error on " + path_ + ": " + errno_str());
    }
    offset_ += len;
}

void FileWriter::close() {
    if (!fp_) return;
    std::FILE* fp = fp_;
    fp_ = nullptr;
    if (std::fclose(fp) != 0) {
        throw std::runtime_error("Close failed on " + path_ + ": " + errno_str());
    }
}

// ============================================================
// Utility functions
// ============================================================

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

bool file_io::file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool file_io::has_extension(const std::string& path) {
    return fs::path(path).has_extension();
}

std::string file_io::resolve_destination(const std::string& chosen, const TransferHeader& header) {
    if (has_extension(chosen)) return chosen;

    std::string ext = header.extension;
    if (!header.has_extension) {
        ext = proto::make_header(header.name, header.size).extension;
    }
    // Never let a peer-supplied extension climb out of the chosen directory
    if (ext.find('/') != std::string::npos || ext.find('\\') != std::string::npos) {
        return chosen;
    }
    return chosen + ext;
}

std::string file_io::auto_destination(const std::string& dir) {
    fs::path p = fs::path(dir) / ("received_file_" + utils::format_now("%Y%m%d_%H%M%S"));
    return p.string();
}
