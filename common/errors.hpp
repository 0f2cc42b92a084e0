#pragma once

// ============================================================
// errors.hpp -- Transfer error taxonomy
//
//   TransferError
//     ConnectError          dial failed
//     HeaderError           framing violation, never retried
//       MalformedHeaderError
//       OversizedHeaderError
//     TransportError        socket failure mid-stream, retried
//     PrematureCloseError   peer closed before the declared size
//     ResumeMismatchError   resumed stream is not the same content
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConnectError : public TransferError {
public:
    using TransferError::TransferError;
};

class HeaderError : public TransferError {
public:
    using TransferError::TransferError;
};

class MalformedHeaderError : public HeaderError {
public:
    using HeaderError::HeaderError;
};

class OversizedHeaderError : public HeaderError {
public:
    using HeaderError::HeaderError;
};

class TransportError : public TransferError {
public:
    using TransferError::TransferError;
};

class PrematureCloseError : public TransferError {
public:
    PrematureCloseError(const std::string& msg, u64 received, u64 expected)
        : TransferError(msg), received_(received), expected_(expected) {}

    u64 received() const { return received_; }
    u64 expected() const { return expected_; }

private:
    u64 received_;
    u64 expected_;
};

class ResumeMismatchError : public TransferError {
public:
    using TransferError::TransferError;
};
