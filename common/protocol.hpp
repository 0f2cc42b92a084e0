#pragma once

// protocol.hpp -- Wire protocol definitions for FileDrop
//
// One file per connection. The sender writes a single text header line
//
//     name|size|extension\n      (three-field form)
//     name|size\n                (two-field form)
//
// followed by exactly `size` raw payload bytes. No trailer, no checksum.

#include "platform.hpp"
#include <string>

static constexpr char FILEDROP_FIELD_SEP    = '|';
static constexpr char FILEDROP_HEADER_DELIM = '\n';

// Header line, delimiter included, must fit in this many bytes.
static constexpr size_t MAX_HEADER_LEN = 1024000;

static constexpr size_t CHUNK_SIZE = 4096;

static constexpr int DEFAULT_MAX_RETRIES    = 3;
static constexpr int DEFAULT_RETRY_DELAY_MS = 2000;

// Receiver progress callbacks are throttled to one per interval
// (plus a final 100% call).
static constexpr int PROGRESS_INTERVAL_MS = 100;

static constexpr u16 DEFAULT_PORT = 12345;

struct TransferHeader {
    std::string name;
    u64         size{0};
    std::string extension;          // e.g. ".pdf"; may be empty
    bool        has_extension{false}; // true for the three-field form

    bool same_target(const TransferHeader& o) const {
        return name == o.name && size == o.size;
    }
};
