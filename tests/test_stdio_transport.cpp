//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport framing, EOF and write-path tests over plain pipes
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

using namespace std::chrono_literals;
using namespace toolhost;

namespace {

struct PipePair {
    int toClientRead{-1};   // transport reads here
    int toClientWrite{-1};  // test plays the server's stdout
    int fromClientRead{-1}; // test plays the server's stdin
    int fromClientWrite{-1};// transport writes here

    PipePair() {
        int a[2]{};
        int b[2]{};
        EXPECT_EQ(::pipe(a), 0);
        EXPECT_EQ(::pipe(b), 0);
        toClientRead = a[0];
        toClientWrite = a[1];
        fromClientRead = b[0];
        fromClientWrite = b[1];
    }

    ~PipePair() {
        if (toClientWrite >= 0) ::close(toClientWrite);
        if (fromClientRead >= 0) ::close(fromClientRead);
    }

    void serverWrite(const std::string& s) {
        size_t off = 0;
        while (off < s.size()) {
            ssize_t w = ::write(toClientWrite, s.data() + off, s.size() - off);
            ASSERT_GT(w, 0);
            off += static_cast<size_t>(w);
        }
    }

    void closeServerStdout() {
        ::close(toClientWrite);
        toClientWrite = -1;
    }

    void closeServerStdin() {
        ::close(fromClientRead);
        fromClientRead = -1;
    }

    std::string serverReadLine() {
        std::string line;
        char c = 0;
        while (::read(fromClientRead, &c, 1) == 1) {
            if (c == '\n') {
                break;
            }
            line.push_back(c);
        }
        return line;
    }
};

// Collects frames delivered on the reader thread.
struct FrameSink {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> frames;

    void add(const std::string& f) {
        std::lock_guard<std::mutex> lk(m);
        frames.push_back(f);
        cv.notify_all();
    }

    bool waitFor(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lk(m);
        return cv.wait_for(lk, timeout, [&] { return frames.size() >= n; });
    }
};

} // namespace

TEST(StdioTransport, DeliversLinesAndSkipsBlankOnes) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    FrameSink sink;
    t.Start([&](const std::string& f) { sink.add(f); }, [](const std::string&) {}).get();

    p.serverWrite("{\"a\":1}\r\n\n   \n{\"b\":2}\n");
    ASSERT_TRUE(sink.waitFor(2));
    EXPECT_EQ(sink.frames[0], "{\"a\":1}");
    EXPECT_EQ(sink.frames[1], "{\"b\":2}");
    t.Close().get();
}

TEST(StdioTransport, ReassemblesFramesSplitAcrossWrites) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    FrameSink sink;
    t.Start([&](const std::string& f) { sink.add(f); }, [](const std::string&) {}).get();

    p.serverWrite("{\"par");
    std::this_thread::sleep_for(50ms);
    p.serverWrite("tial\":true}\n{\"next\"");
    std::this_thread::sleep_for(50ms);
    p.serverWrite(":1}\n");
    ASSERT_TRUE(sink.waitFor(2));
    EXPECT_EQ(sink.frames[0], "{\"partial\":true}");
    EXPECT_EQ(sink.frames[1], "{\"next\":1}");
    t.Close().get();
}

TEST(StdioTransport, OversizedLineIsDroppedAndReaderResyncs) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.SetMaxLineBytes(16);
    FrameSink sink;
    t.Start([&](const std::string& f) { sink.add(f); }, [](const std::string&) {}).get();

    p.serverWrite(std::string(100, 'x'));
    std::this_thread::sleep_for(50ms);
    p.serverWrite("yyyy\nok\n");
    ASSERT_TRUE(sink.waitFor(1));
    std::this_thread::sleep_for(50ms);
    std::lock_guard<std::mutex> lk(sink.m);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0], "ok");
}

TEST(StdioTransport, FinalLineWithoutNewlineIsDeliveredAtEof) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    FrameSink sink;
    t.Start([&](const std::string& f) { sink.add(f); }, [](const std::string&) {}).get();
    p.serverWrite("{\"last\":true}");
    p.closeServerStdout();
    ASSERT_TRUE(sink.waitFor(1));
    EXPECT_EQ(sink.frames[0], "{\"last\":true}");
}

TEST(StdioTransport, EofInvokesErrorHandlerOnce) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    std::atomic<int> errorCount{0};
    std::promise<void> sawError;
    t.Start([](const std::string&) {}, [&](const std::string&) {
        if (errorCount.fetch_add(1) == 0) {
            sawError.set_value();
        }
    }).get();
    EXPECT_TRUE(t.IsConnected());

    p.closeServerStdout();
    ASSERT_EQ(sawError.get_future().wait_for(2s), std::future_status::ready);
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(errorCount.load(), 1);
    EXPECT_FALSE(t.IsConnected());
    t.Close().get();
    EXPECT_EQ(errorCount.load(), 1);
}

TEST(StdioTransport, CloseDoesNotReportError) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    std::atomic<int> errorCount{0};
    t.Start([](const std::string&) {}, [&](const std::string&) { errorCount++; }).get();
    t.Close().get();
    t.Close().get();
    EXPECT_EQ(errorCount.load(), 0);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.SendFrame("{}"), errors::ToolHostError);
}

TEST(StdioTransport, SendFrameAppendsNewline) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();
    t.SendFrame("{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}");
    EXPECT_EQ(p.serverReadLine(), "{\"jsonrpc\":\"2.0\",\"method\":\"ping\"}");
    t.Close().get();
}

TEST(StdioTransport, WriteToClosedPeerThrowsTransportClosed) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();
    p.closeServerStdin();
    try {
        t.SendFrame("{\"x\":1}");
        FAIL() << "expected ToolHostError";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::TransportClosed);
    }
    t.Close().get();
}

TEST(StdioTransport, WriteTimeoutWhenPeerDoesNotDrain) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.SetWriteTimeoutMs(100);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();
    // Pipe capacity is far below 4 MiB and nobody reads the other end
    const std::string big(4 * 1024 * 1024, 'a');
    const auto start = std::chrono::steady_clock::now();
    try {
        t.SendFrame(big);
        FAIL() << "expected ToolHostError";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    t.Close().get();
}

TEST(StdioTransport, IncompleteWriteLeavesStreamUnusable) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();
    const std::string big(1024 * 1024, 'a');
    EXPECT_THROW(t.SendFrameUntil(big, std::chrono::steady_clock::now() + 100ms), errors::ToolHostError);
    EXPECT_FALSE(t.IsConnected());
    try {
        t.SendFrame("{}");
        FAIL() << "expected TransportClosed";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::TransportClosed);
    }
    t.Close().get();
}

TEST(StdioTransport, DeadlineCoversWaitBehindStalledWriter) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();

    // First writer fills the pipe and holds the write lock until its own deadline
    auto stalled = std::async(std::launch::async, [&t] {
        const std::string big(1024 * 1024, 'a');
        EXPECT_THROW(t.SendFrameUntil(big, std::chrono::steady_clock::now() + 1500ms), errors::ToolHostError);
    });
    std::this_thread::sleep_for(100ms);

    const auto start = std::chrono::steady_clock::now();
    try {
        t.SendFrameUntil("{\"small\":true}", start + 200ms);
        FAIL() << "expected Timeout";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    stalled.get();
    t.Close().get();
}

TEST(StdioTransport, ConcurrentWritersNeverInterleave) {
    PipePair p;
    StdioTransport t(p.toClientRead, p.fromClientWrite);
    t.Start([](const std::string&) {}, [](const std::string&) {}).get();

    constexpr int kThreads = 8;
    constexpr int kFrames = 40;
    std::vector<std::string> received;
    std::thread drain([&] {
        for (int i = 0; i < kThreads * kFrames; ++i) {
            received.push_back(p.serverReadLine());
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < kThreads; ++w) {
        writers.emplace_back([&t, w] {
            const std::string payload(3000, static_cast<char>('a' + w));
            for (int i = 0; i < kFrames; ++i) {
                t.SendFrame(payload);
            }
        });
    }
    for (auto& th : writers) th.join();
    drain.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kThreads * kFrames));
    for (const auto& line : received) {
        ASSERT_EQ(line.size(), 3000u);
        EXPECT_EQ(line.find_first_not_of(line[0]), std::string::npos);
    }
    t.Close().get();
}
