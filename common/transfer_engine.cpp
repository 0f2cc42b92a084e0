// ============================================================
// transfer_engine.cpp
// ============================================================

#include "transfer_engine.hpp"
#include "protocol_io.hpp"
#include "socket.hpp"
#include "file_io.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <vector>

TransferEngine::TransferEngine(size_t chunk_size, std::chrono::milliseconds progress_interval)
    : chunk_size_(chunk_size ? chunk_size : CHUNK_SIZE)
    , progress_interval_(progress_interval)
{}

// ---------------------------------------------------------------
// send
// ---------------------------------------------------------------

SendResult TransferEngine::send(Stream& stream,
                                const TransferHeader& header,
                                file_io::FileReader& source,
                                const ProgressFn& on_progress) const
{
    std::string line = proto::encode_header(header);
    stream.send_all(line.data(), line.size());

    SendResult res;
    if (header.size == 0) {
        res.complete = true;
        if (on_progress) on_progress(100, 0, 0);
        return res;
    }

    std::vector<u8> buf(chunk_size_);
    while (res.bytes_sent < header.size) {
        size_t want = (size_t)std::min<u64>(chunk_size_, header.size - res.bytes_sent);
        size_t n = source.read(buf.data(), want);
        if (n == 0) break;

        stream.send_all(buf.data(), n);
        res.bytes_sent += n;
        if (on_progress) {
            on_progress(utils::percent(res.bytes_sent, header.size),
                        res.bytes_sent, header.size);
        }
    }

    res.complete = res.bytes_sent >= header.size;
    if (!res.complete) {
        LOG_WARN("Source " + source.path() + " ended early: sent " +
                 std::to_string(res.bytes_sent) + " of " +
                 std::to_string(header.size) + " bytes");
    }
    return res;
}

// ---------------------------------------------------------------
// receive
// ---------------------------------------------------------------

u64 TransferEngine::receive(Stream& stream,
                            const std::string& destination,
                            const ProgressFn& on_progress) const
{
    ResumeState resume;
    TransferSession session;
    session.peer = stream.peer_addr();
    return receive(stream, destination, resume, session, on_progress);
}

u64 TransferEngine::receive(Stream& stream,
                            const std::string& destination,
                            ResumeState& resume,
                            TransferSession& session,
                            const ProgressFn& on_progress) const
{
    proto::DecodedHeader decoded = proto::read_header(stream);
    const TransferHeader& hdr = decoded.header;
    session.header = hdr;

    if (resume.accumulated > 0 && !(resume.have_header && resume.header.same_target(hdr))) {
        LOG_WARN("Reconnected stream announces '" + hdr.name + "' (" +
                 std::to_string(hdr.size) + " bytes), previous attempt had '" +
                 resume.header.name + "' (" + std::to_string(resume.header.size) +
                 " bytes); restarting from byte 0");
        resume.restart();
    }

    const std::string path = file_io::resolve_destination(destination, hdr);
    if (resume.accumulated > 0 &&
        (path != resume.dest_path || file_io::get_file_size(path) != resume.accumulated))
    {
        LOG_WARN("Partial file " + path + " no longer matches " +
                 std::to_string(resume.accumulated) + " received bytes; restarting from byte 0");
        resume.restart();
    }
    resume.have_header = true;
    resume.header      = hdr;
    resume.dest_path   = path;
    session.path       = path;

    file_io::ensure_parent_dirs(path);
    const bool append = resume.accumulated > 0;
    file_io::FileWriter writer;
    writer.open(path, append);

    const u64 total = hdr.size;
    if (append) {
        LOG_INFO("Resuming '" + hdr.name + "' into " + path + " at byte " +
                 std::to_string(resume.accumulated) + "/" + std::to_string(total));
    } else {
        LOG_INFO("Receiving '" + hdr.name + "' (" + utils::format_bytes(total) +
                 ") into " + path);
    }

    if (total == 0) {
        writer.close();
        session.bytes_done = 0;
        if (on_progress) on_progress(100, 0, 0);
        return 0;
    }

    // The sender restarts the payload at byte 0 on every connection, so a
    // resumed attempt first consumes the prefix it already has on disk.
    const u64 skip            = resume.accumulated;
    const u64 expected_prefix = resume.prefix.digest();
    hash::StreamHasher64 verify;
    u64 stream_off = 0;

    auto consume = [&](const u8* p, size_t n) {
        if (stream_off < skip) {
            size_t part = (size_t)std::min<u64>(n, skip - stream_off);
            verify.update(p, part);
            stream_off += part;
            p += part;
            n -= part;
            if (stream_off == skip) {
                if (verify.digest() != expected_prefix) {
                    writer.close();
                    file_io::FileWriter truncate;
                    truncate.open(path, false);
                    truncate.close();
                    resume.restart();
                    throw ResumeMismatchError("Resumed content of '" + hdr.name +
                                              "' differs from the first " +
                                              std::to_string(skip) + " bytes received");
                }
                LOG_DEBUG("Resume prefix verified (" + std::to_string(skip) +
                          " bytes, xxh3 " + hash::to_hex(expected_prefix) + ")");
            }
        }
        if (n == 0) return;
        writer.write(p, n);
        resume.prefix.update(p, n);
        resume.accumulated += n;
        stream_off += n;
        session.bytes_done = stream_off;
    };

    ProgressThrottle throttle(progress_interval_);
    auto report = [&]() {
        if (on_progress && throttle.ready()) {
            on_progress(utils::percent(stream_off, total), stream_off, total);
        }
    };

    if (!decoded.leftover.empty()) {
        size_t take = (size_t)std::min<u64>(decoded.leftover.size(), total);
        if (take < decoded.leftover.size()) {
            LOG_WARN("Discarding " + std::to_string(decoded.leftover.size() - take) +
                     " bytes beyond the declared size");
        }
        consume(decoded.leftover.data(), take);
        report();
    }

    std::vector<u8> buf(chunk_size_);
    while (stream_off < total) {
        size_t want = (size_t)std::min<u64>(chunk_size_, total - stream_off);
        size_t n = stream.read_some(buf.data(), want);
        if (n == 0) {
            throw PrematureCloseError("Connection lost during transfer (" +
                                      std::to_string(resume.accumulated) + "/" +
                                      std::to_string(total) + " bytes)",
                                      resume.accumulated, total);
        }
        consume(buf.data(), n);
        report();
    }

    writer.close();
    if (on_progress) on_progress(100, total, total);
    LOG_INFO("File received and saved as '" + path + "'");
    return total;
}
