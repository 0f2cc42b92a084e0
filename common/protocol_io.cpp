// ============================================================
// protocol_io.cpp -- Header frame encode / decode
// ============================================================

#include "protocol_io.hpp"
#include "socket.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>

namespace proto {

static bool has_reserved_char(const std::string& s) {
    return s.find(FILEDROP_FIELD_SEP) != std::string::npos ||
           s.find(FILEDROP_HEADER_DELIM) != std::string::npos;
}

TransferHeader make_header(const std::string& name, u64 size) {
    TransferHeader h;
    h.name = name;
    h.size = size;
    auto dot = name.rfind('.');
    // A leading dot (".bashrc") is a hidden file, not an extension
    if (dot != std::string::npos && dot > 0 && dot + 1 < name.size()) {
        h.extension     = name.substr(dot);
        h.has_extension = true;
    }
    return h;
}

std::string encode_header(const TransferHeader& h) {
    if (h.name.empty()) {
        throw MalformedHeaderError("Header name must not be empty");
    }
    if (has_reserved_char(h.name)) {
        throw MalformedHeaderError("File name contains '|' or newline: " + h.name);
    }
    if (h.has_extension && has_reserved_char(h.extension)) {
        throw MalformedHeaderError("Extension contains '|' or newline: " + h.extension);
    }

    std::string out;
    out.reserve(h.name.size() + h.extension.size() + 24);
    out += h.name;
    out += FILEDROP_FIELD_SEP;
    out += std::to_string(h.size);
    if (h.has_extension) {
        out += FILEDROP_FIELD_SEP;
        out += h.extension;
    }
    out += FILEDROP_HEADER_DELIM;
    return out;
}

bool parse_size(const std::string& text, u64& out) {
    if (text.empty()) return false;
    u64 v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        u64 digit = (u64)(c - '0');
        if (v > (std::numeric_limits<u64>::max() - digit) / 10) return false;
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

TransferHeader parse_header_line(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (;;) {
        size_t pos = line.find(FILEDROP_FIELD_SEP, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }

    if (fields.size() != 2 && fields.size() != 3) {
        throw MalformedHeaderError("Invalid file header format: expected 2 or 3 fields, got " +
                                   std::to_string(fields.size()));
    }

    TransferHeader h;
    h.name = fields[0];
    if (!parse_size(fields[1], h.size)) {
        throw MalformedHeaderError("Invalid file size in header: '" + fields[1] + "'");
    }
    if (fields.size() == 3) {
        h.extension     = fields[2];
        h.has_extension = true;
    }
    return h;
}

DecodedHeader read_header(Stream& stream, size_t max_len) {
    std::vector<u8> buf;
    buf.reserve(CHUNK_SIZE);
    u8 chunk[CHUNK_SIZE];
    size_t scanned = 0;

    for (;;) {
        size_t n = stream.read_some(chunk, sizeof(chunk));
        if (n == 0) {
            throw PrematureCloseError("Connection closed before receiving file header", 0, 0);
        }
        buf.insert(buf.end(), chunk, chunk + n);

        auto first = buf.begin() + (std::ptrdiff_t)scanned;
        auto it = std::find(first, buf.end(), (u8)FILEDROP_HEADER_DELIM);
        if (it != buf.end()) {
            size_t delim_pos = (size_t)(it - buf.begin());
            if (delim_pos + 1 > max_len) {
                throw OversizedHeaderError("File header too large (" +
                                           std::to_string(delim_pos + 1) + " bytes)");
            }
            DecodedHeader out;
            out.header = parse_header_line(std::string(buf.begin(), it));
            out.leftover.assign(it + 1, buf.end());
            return out;
        }
        scanned = buf.size();
        if (buf.size() >= max_len) {
            throw OversizedHeaderError("File header too large, no delimiter within " +
                                       std::to_string(max_len) + " bytes");
        }
    }
}

} // namespace proto
