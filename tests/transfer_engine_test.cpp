// ============================================================
// transfer_engine_test.cpp -- Send / receive loops and resume
// ============================================================

#include "test_helpers.hpp"
#include "../common/transfer_engine.hpp"
#include "../common/protocol_io.hpp"
#include "../common/file_io.hpp"
#include "../common/errors.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <tuple>
#include <vector>

using test::MemoryStream;
using test::TempDir;
using ProgressCall = std::tuple<int, u64, u64>;

namespace {

// Throttle that never lets an intermediate report through
const auto NO_INTERMEDIATE = std::chrono::hours(1);

ProgressFn recorder(std::vector<ProgressCall>& calls) {
    return [&calls](int pct, u64 done, u64 total) {
        calls.emplace_back(pct, done, total);
    };
}

} // namespace

// ---------------------------------------------------------------
// send
// ---------------------------------------------------------------

TEST(TransferEngineSend, WritesHeaderThenPayloadInChunks) {
    TempDir dir;
    std::string src = dir.file("data.bin");
    std::string payload = test::make_payload(10000);
    test::write_file(src, payload);

    TransferEngine engine;
    file_io::FileReader reader(src);
    MemoryStream out;
    std::vector<ProgressCall> calls;
    SendResult res = engine.send(out, proto::make_header("data.bin", reader.size()),
                                 reader, recorder(calls));

    EXPECT_TRUE(res.complete);
    EXPECT_EQ(res.bytes_sent, 10000u);
    EXPECT_EQ(out.written(), "data.bin|10000|.bin\n" + payload);

    // 4096 + 4096 + 1808
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], ProgressCall(40, 4096, 10000));
    EXPECT_EQ(calls[1], ProgressCall(81, 8192, 10000));
    EXPECT_EQ(calls[2], ProgressCall(100, 10000, 10000));
}

TEST(TransferEngineSend, ZeroByteFileReportsCompletionAtOnce) {
    TempDir dir;
    std::string src = dir.file("empty.txt");
    test::write_file(src, "");

    TransferEngine engine;
    file_io::FileReader reader(src);
    MemoryStream out;
    std::vector<ProgressCall> calls;
    SendResult res = engine.send(out, proto::make_header("empty.txt", 0), reader, recorder(calls));

    EXPECT_TRUE(res.complete);
    EXPECT_EQ(out.written(), "empty.txt|0|.txt\n");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], ProgressCall(100, 0, 0));
}

TEST(TransferEngineSend, ShortSourceIsIncomplete) {
    TempDir dir;
    std::string src = dir.file("short.bin");
    test::write_file(src, "abc");

    TransferEngine engine;
    file_io::FileReader reader(src);
    MemoryStream out;
    // Header claims more than the file holds
    SendResult res = engine.send(out, proto::make_header("short.bin", 10), reader, nullptr);
    EXPECT_FALSE(res.complete);
    EXPECT_EQ(res.bytes_sent, 3u);
}

TEST(TransferEngineSend, ClosedStreamRaisesTransportError) {
    TempDir dir;
    std::string src = dir.file("a.bin");
    test::write_file(src, "abc");

    TransferEngine engine;
    file_io::FileReader reader(src);
    MemoryStream out;
    out.close();
    EXPECT_THROW(engine.send(out, proto::make_header("a.bin", 3), reader, nullptr), TransportError);
}

// ---------------------------------------------------------------
// receive
// ---------------------------------------------------------------

TEST(TransferEngineReceive, WritesExactPayloadAndAppendsExtension) {
    TempDir dir;
    std::string payload = test::make_payload(5000);
    MemoryStream in(test::script("data.bin|5000|.bin\n", payload, 1000));

    TransferEngine engine(CHUNK_SIZE, NO_INTERMEDIATE);
    std::vector<ProgressCall> calls;
    u64 n = engine.receive(in, dir.file("out"), recorder(calls));

    EXPECT_EQ(n, 5000u);
    EXPECT_EQ(test::read_file(dir.file("out.bin")), payload);
    ASSERT_FALSE(calls.empty());
    EXPECT_EQ(calls.back(), ProgressCall(100, 5000, 5000));
}

TEST(TransferEngineReceive, PayloadInSameReadAsHeader) {
    TempDir dir;
    MemoryStream in({"note.txt|5|.txt\nhello"});
    TransferEngine engine;
    EXPECT_EQ(engine.receive(in, dir.file("note"), nullptr), 5u);
    EXPECT_EQ(test::read_file(dir.file("note.txt")), "hello");
}

TEST(TransferEngineReceive, ZeroByteFileDoesNotWaitForPayload) {
    TempDir dir;
    // fail_at_end: any read past the header would throw
    MemoryStream in({"empty.txt|0|.txt\n"}, /*fail_at_end=*/true);
    TransferEngine engine;
    std::vector<ProgressCall> calls;
    EXPECT_EQ(engine.receive(in, dir.file("empty"), recorder(calls)), 0u);

    EXPECT_TRUE(file_io::file_exists(dir.file("empty.txt")));
    EXPECT_EQ(file_io::get_file_size(dir.file("empty.txt")), 0u);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], ProgressCall(100, 0, 0));
}

TEST(TransferEngineReceive, DiscardsBytesBeyondDeclaredSize) {
    TempDir dir;
    MemoryStream in({"a.txt|3|.txt\nabcdef"});
    TransferEngine engine;
    EXPECT_EQ(engine.receive(in, dir.file("a"), nullptr), 3u);
    EXPECT_EQ(test::read_file(dir.file("a.txt")), "abc");
}

TEST(TransferEngineReceive, PrematureCloseReportsProgressMade) {
    TempDir dir;
    std::string payload = test::make_payload(5000);
    MemoryStream in(test::script("a.bin|5000|.bin\n", payload.substr(0, 1000)));
    TransferEngine engine;

    try {
        engine.receive(in, dir.file("a"), nullptr);
        FAIL() << "expected PrematureCloseError";
    } catch (const PrematureCloseError& e) {
        EXPECT_EQ(e.received(), 1000u);
        EXPECT_EQ(e.expected(), 5000u);
    }
    EXPECT_EQ(test::read_file(dir.file("a.bin")), payload.substr(0, 1000));
}

TEST(TransferEngineReceive, IntermediateProgressIsThrottled) {
    TempDir dir;
    std::string payload = test::make_payload(64 * 1024);
    MemoryStream in(test::script("big.bin|65536|.bin\n", payload, 512));

    TransferEngine engine(CHUNK_SIZE, NO_INTERMEDIATE);
    std::vector<ProgressCall> calls;
    engine.receive(in, dir.file("big"), recorder(calls));

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], ProgressCall(100, 65536, 65536));
}

TEST(TransferEngineReceive, PercentNeverDecreases) {
    TempDir dir;
    std::string payload = test::make_payload(20000);
    MemoryStream in(test::script("p.bin|20000|.bin\n", payload, 100));

    TransferEngine engine(CHUNK_SIZE, std::chrono::milliseconds(0));
    std::vector<ProgressCall> calls;
    engine.receive(in, dir.file("p"), recorder(calls));

    ASSERT_FALSE(calls.empty());
    for (size_t i = 1; i < calls.size(); ++i) {
        EXPECT_GE(std::get<0>(calls[i]), std::get<0>(calls[i - 1]));
    }
    EXPECT_EQ(std::get<0>(calls.back()), 100);
}

// ---------------------------------------------------------------
// resume
// ---------------------------------------------------------------

TEST(TransferEngineResume, SecondAttemptAppendsAfterVerifiedPrefix) {
    TempDir dir;
    std::string payload = test::make_payload(5000);
    TransferEngine engine;
    ResumeState resume;

    MemoryStream first(test::script("doc.bin|5000|.bin\n", payload.substr(0, 1000)));
    TransferSession s1;
    EXPECT_THROW(engine.receive(first, dir.file("doc"), resume, s1, nullptr), PrematureCloseError);
    EXPECT_EQ(resume.accumulated, 1000u);
    EXPECT_EQ(resume.dest_path, dir.file("doc.bin"));

    MemoryStream second(test::script("doc.bin|5000|.bin\n", payload));
    TransferSession s2;
    std::vector<ProgressCall> calls;
    EXPECT_EQ(engine.receive(second, dir.file("doc"), resume, s2, recorder(calls)), 5000u);

    EXPECT_EQ(test::read_file(dir.file("doc.bin")), payload);
    EXPECT_EQ(resume.accumulated, 5000u);
    EXPECT_EQ(calls.back(), ProgressCall(100, 5000, 5000));
}

TEST(TransferEngineResume, ChangedContentTruncatesAndFails) {
    TempDir dir;
    std::string original = test::make_payload(5000, 1);
    std::string changed  = test::make_payload(5000, 2);
    TransferEngine engine;
    ResumeState resume;

    MemoryStream first(test::script("doc.bin|5000|.bin\n", original.substr(0, 1000)));
    TransferSession s1;
    EXPECT_THROW(engine.receive(first, dir.file("doc"), resume, s1, nullptr), PrematureCloseError);

    MemoryStream second(test::script("doc.bin|5000|.bin\n", changed));
    TransferSession s2;
    EXPECT_THROW(engine.receive(second, dir.file("doc"), resume, s2, nullptr), ResumeMismatchError);
    EXPECT_EQ(resume.accumulated, 0u);
    EXPECT_EQ(file_io::get_file_size(dir.file("doc.bin")), 0u);

    MemoryStream third(test::script("doc.bin|5000|.bin\n", changed));
    TransferSession s3;
    EXPECT_EQ(engine.receive(third, dir.file("doc"), resume, s3, nullptr), 5000u);
    EXPECT_EQ(test::read_file(dir.file("doc.bin")), changed);
}

TEST(TransferEngineResume, DifferentHeaderRestartsFromZero) {
    TempDir dir;
    std::string a = test::make_payload(5000, 1);
    std::string b = test::make_payload(3000, 2);
    TransferEngine engine;
    ResumeState resume;

    MemoryStream first(test::script("a.bin|5000|.bin\n", a.substr(0, 1000)));
    TransferSession s1;
    EXPECT_THROW(engine.receive(first, dir.file("out"), resume, s1, nullptr), PrematureCloseError);

    MemoryStream second(test::script("b.bin|3000|.bin\n", b));
    TransferSession s2;
    EXPECT_EQ(engine.receive(second, dir.file("out"), resume, s2, nullptr), 3000u);
    EXPECT_EQ(test::read_file(dir.file("out.bin")), b);
    EXPECT_EQ(s2.header.name, "b.bin");
}

TEST(TransferEngineResume, PartialFileChangedOnDiskRestartsFromZero) {
    TempDir dir;
    std::string payload = test::make_payload(5000);
    TransferEngine engine;
    ResumeState resume;

    MemoryStream first(test::script("doc.bin|5000|.bin\n", payload.substr(0, 1000)));
    TransferSession s1;
    EXPECT_THROW(engine.receive(first, dir.file("doc"), resume, s1, nullptr), PrematureCloseError);

    // Someone else touched the partial file between attempts
    test::write_file(dir.file("doc.bin"), "xx");

    MemoryStream second(test::script("doc.bin|5000|.bin\n", payload));
    TransferSession s2;
    EXPECT_EQ(engine.receive(second, dir.file("doc"), resume, s2, nullptr), 5000u);
    EXPECT_EQ(test::read_file(dir.file("doc.bin")), payload);
}
