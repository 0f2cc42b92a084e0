#pragma once

// ============================================================
// protocol_io.hpp -- Header frame encode / decode
// ============================================================

#include "protocol.hpp"
#include <string>
#include <vector>

class Stream;

namespace proto {

// Header decoded from a stream, plus any payload bytes that arrived in
// the same read. Leftover bytes are the start of the file content.
struct DecodedHeader {
    TransferHeader  header;
    std::vector<u8> leftover;
};

// Build a header for a file name. The extension is the name's own
// extension (".pdf" for "report.pdf"); the three-field form is used
// whenever one exists.
TransferHeader make_header(const std::string& name, u64 size);

// Serialize to "name|size|extension\n" (or "name|size\n" when
// has_extension is false). Throws MalformedHeaderError for an empty name
// or when name/extension contain '|' or '\n'.
std::string encode_header(const TransferHeader& h);

// Parse one header line without its delimiter.
// Throws MalformedHeaderError unless the line has 2 or 3 fields and the
// size field is a non-negative decimal integer.
TransferHeader parse_header_line(const std::string& line);

// Strict decimal parse: digits only, no sign, no whitespace, no overflow
bool parse_size(const std::string& text, u64& out);

// Read from 'stream' until the delimiter arrives.
// Throws OversizedHeaderError if no delimiter within max_len bytes,
// PrematureCloseError if the peer closes first, TransportError on a
// socket failure.
DecodedHeader read_header(Stream& stream, size_t max_len = MAX_HEADER_LEN);

} // namespace proto
