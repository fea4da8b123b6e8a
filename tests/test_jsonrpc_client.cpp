//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_jsonrpc_client.cpp
// Purpose: JsonRpcClient correlation, timeout, error and handshake tests against an in-process peer
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>
#include <poll.h>

#include "toolhost/JsonRpcClient.h"
#include "toolhost/StdioTransport.hpp"
#include "toolhost/errors/Errors.h"

using namespace std::chrono_literals;
using namespace toolhost;

namespace {

struct PeerRequest {
    JSONRPCId id;
    bool hasId{false};
    std::string method;
    JSONValue params;
};

//==========================================================================================================
// ScriptedPeer
// Purpose: Plays the server side of a pipe pair. Every inbound frame is handed to onFrame on the
//          peer thread; replies are written with reply()/send().
//==========================================================================================================
class ScriptedPeer {
public:
    using Handler = std::function<void(ScriptedPeer&, const PeerRequest&)>;

    explicit ScriptedPeer(Handler handler) : handler_(std::move(handler)) {
        int a[2]{};
        int b[2]{};
        EXPECT_EQ(::pipe(a), 0);
        EXPECT_EQ(::pipe(b), 0);
        clientRead_ = a[0];
        peerWrite_ = a[1];
        peerRead_ = b[0];
        clientWrite_ = b[1];
        thread_ = std::thread([this] { loop(); });
    }

    ~ScriptedPeer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        closeStdout();
        if (peerRead_ >= 0) ::close(peerRead_);
    }

    std::unique_ptr<ITransport> clientTransport() {
        return std::make_unique<StdioTransport>(clientRead_, clientWrite_);
    }

    void send(const std::string& line) {
        std::lock_guard<std::mutex> lk(writeMutex_);
        if (peerWrite_ < 0) return;
        std::string framed = line + "\n";
        size_t off = 0;
        while (off < framed.size()) {
            ssize_t w = ::write(peerWrite_, framed.data() + off, framed.size() - off);
            if (w <= 0) return;
            off += static_cast<size_t>(w);
        }
    }

    void reply(const PeerRequest& req, JSONValue result) {
        send(JSONRPCResponse(req.id, std::move(result)).Serialize());
    }

    void replyError(const PeerRequest& req, JSONValue error) {
        send(JSONRPCResponse(req.id, std::move(error), true).Serialize());
    }

    void closeStdout() {
        std::lock_guard<std::mutex> lk(writeMutex_);
        if (peerWrite_ >= 0) {
            ::close(peerWrite_);
            peerWrite_ = -1;
        }
    }

    std::vector<std::string> methods() {
        std::lock_guard<std::mutex> lk(seenMutex_);
        return methods_;
    }

    std::vector<int64_t> ids() {
        std::lock_guard<std::mutex> lk(seenMutex_);
        return ids_;
    }

    bool waitForMethod(const std::string& method, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lk(seenMutex_);
        return seenCv_.wait_for(lk, timeout, [&] {
            for (const auto& m : methods_) if (m == method) return true;
            return false;
        });
    }

private:
    void loop() {
        std::string buffer;
        char tmp[4096];
        while (!stop_) {
            pollfd pfd{};
            pfd.fd = peerRead_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 50) <= 0) continue;
            ssize_t n = ::read(peerRead_, tmp, sizeof(tmp));
            if (n <= 0) break;
            buffer.append(tmp, static_cast<size_t>(n));
            size_t nl;
            while ((nl = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, nl);
                buffer.erase(0, nl + 1);
                dispatch(line);
            }
        }
    }

    void dispatch(const std::string& line) {
        JSONValue frame = ParseJSON(line);
        PeerRequest req;
        if (const JSONValue* id = frame.find("id"); id != nullptr && id->isInt()) {
            req.id = std::get<int64_t>(id->value);
            req.hasId = true;
        }
        req.method = std::get<std::string>(frame.find("method")->value);
        if (const JSONValue* p = frame.find("params")) req.params = *p;
        {
            std::lock_guard<std::mutex> lk(seenMutex_);
            methods_.push_back(req.method);
            if (req.hasId) ids_.push_back(std::get<int64_t>(req.id));
        }
        seenCv_.notify_all();
        handler_(*this, req);
    }

    Handler handler_;
    int clientRead_{-1};
    int clientWrite_{-1};
    int peerRead_{-1};
    int peerWrite_{-1};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::mutex writeMutex_;
    std::mutex seenMutex_;
    std::condition_variable seenCv_;
    std::vector<std::string> methods_;
    std::vector<int64_t> ids_;
};

ClientOptions fastOptions(std::chrono::milliseconds timeout = 2000ms) {
    ClientOptions opts = DefaultClientOptions();
    opts.requestTimeout = timeout;
    return opts;
}

JSONValue obj(const std::string& key, JSONValue value) {
    JSONValue::Object o;
    o[key] = std::make_shared<JSONValue>(std::move(value));
    return JSONValue{std::move(o)};
}

// Echoes params back as the result for every request.
void echoHandler(ScriptedPeer& peer, const PeerRequest& req) {
    if (req.hasId) peer.reply(req, req.params);
}

} // namespace

TEST(JsonRpcClient, RequestReturnsResult) {
    ScriptedPeer peer(echoHandler);
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    JSONValue result = client.Request("demo/echo", obj("v", JSONValue(int64_t{42})));
    ASSERT_NE(result.find("v"), nullptr);
    EXPECT_EQ(std::get<int64_t>(result.find("v")->value), 42);
    EXPECT_EQ(client.PendingCount(), 0u);
}

TEST(JsonRpcClient, IdsAreUniqueAndIncreasing) {
    ScriptedPeer peer(echoHandler);
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());
    for (int i = 0; i < 5; ++i) {
        client.Request("demo/echo", obj("i", JSONValue(int64_t{i})));
    }
    auto ids = peer.ids();
    ASSERT_EQ(ids.size(), 5u);
    EXPECT_EQ(ids.front(), 1);
    for (size_t i = 1; i < ids.size(); ++i) {
        EXPECT_GT(ids[i], ids[i - 1]);
    }
}

TEST(JsonRpcClient, OutOfOrderResponsesAreCorrelatedById) {
    std::mutex m;
    std::vector<PeerRequest> held;
    ScriptedPeer peer([&](ScriptedPeer& p, const PeerRequest& req) {
        std::vector<PeerRequest> toSend;
        {
            std::lock_guard<std::mutex> lk(m);
            held.push_back(req);
            if (held.size() < 3) return;
            toSend = held;
        }
        // Answer in reverse order of arrival
        for (auto it = toSend.rbegin(); it != toSend.rend(); ++it) {
            p.reply(*it, it->params);
        }
    });
    JsonRpcClient client(fastOptions(5000ms));
    client.Connect(peer.clientTransport());

    std::vector<std::future<int64_t>> futures;
    for (int64_t i = 0; i < 3; ++i) {
        futures.push_back(std::async(std::launch::async, [&client, i] {
            JSONValue r = client.Request("demo/echo", obj("n", JSONValue(i)));
            return std::get<int64_t>(r.find("n")->value);
        }));
    }
    for (int64_t i = 0; i < 3; ++i) {
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), i);
    }
}

TEST(JsonRpcClient, TimeoutFailsOnlyThatRequestAndLateResponseIsDiscarded) {
    std::mutex m;
    std::optional<PeerRequest> slow;
    ScriptedPeer peer([&](ScriptedPeer& p, const PeerRequest& req) {
        if (req.method == "demo/slow") {
            std::lock_guard<std::mutex> lk(m);
            slow = req;
            return;
        }
        p.reply(req, req.params);
    });
    JsonRpcClient client(fastOptions(200ms));
    client.Connect(peer.clientTransport());

    const auto start = std::chrono::steady_clock::now();
    try {
        client.Request("demo/slow");
        FAIL() << "expected timeout";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Timeout);
        EXPECT_NE(std::string(e.what()).find("demo/slow"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(client.PendingCount(), 0u);

    // A late answer to the abandoned id must not disturb later calls
    {
        std::lock_guard<std::mutex> lk(m);
        ASSERT_TRUE(slow.has_value());
        peer.reply(*slow, obj("late", JSONValue(true)));
    }
    JSONValue r = client.Request("demo/echo", obj("fresh", JSONValue(true)));
    EXPECT_NE(r.find("fresh"), nullptr);
    EXPECT_EQ(r.find("late"), nullptr);
}

TEST(JsonRpcClient, ServerThatStopsReadingStdinCannotBlockCallers) {
    int toClient[2]{};
    int fromClient[2]{};
    ASSERT_EQ(::pipe(toClient), 0);
    ASSERT_EQ(::pipe(fromClient), 0);
    // fromClient[0] is never read, so the pipe fills and writes stall
    JsonRpcClient client(fastOptions(300ms));
    client.Connect(std::make_unique<StdioTransport>(toClient[0], fromClient[1]));

    JSONValue::Object args;
    args["blob"] = std::make_shared<JSONValue>(std::string(1024 * 1024, 'x'));
    const auto start = std::chrono::steady_clock::now();
    auto big = std::async(std::launch::async, [&client, &args]() -> std::optional<std::string> {
        try {
            client.CallTool("echo", args);
        } catch (const errors::ToolHostError& e) {
            if (e.category() == errors::ErrorCategory::Timeout) return std::string(e.what());
            return std::string("unexpected category: ") + errors::toString(e.category());
        }
        return std::nullopt;
    });
    std::this_thread::sleep_for(50ms);
    auto small = std::async(std::launch::async, [&client]() -> bool {
        try {
            client.Request("demo/ping");
        } catch (const errors::ToolHostError&) {
            return true;
        }
        return false;
    });

    ASSERT_EQ(big.wait_for(3s), std::future_status::ready);
    ASSERT_EQ(small.wait_for(3s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    const auto bigError = big.get();
    ASSERT_TRUE(bigError.has_value());
    EXPECT_NE(bigError->find("tools/call"), std::string::npos) << *bigError;
    EXPECT_TRUE(small.get());
    EXPECT_EQ(client.PendingCount(), 0u);

    // Part of the large frame reached the pipe, so nothing more can be framed on it
    EXPECT_THROW(client.Request("demo/after"), errors::ToolHostError);
    client.Close();
    ::close(toClient[1]);
    ::close(fromClient[0]);
}

TEST(JsonRpcClient, MalformedAndUnmatchedFramesAreIgnored) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        p.send("this is not json");
        p.send("{\"jsonrpc\":\"2.0\",\"id\":424242,\"result\":{\"wrong\":true}}");
        p.send("{\"jsonrpc\":\"2.0\",\"id\":\"text-id\",\"result\":{\"wrong\":true}}");
        p.send("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{}}");
        p.send(JSONRPCRequest(req.id, "sampling/createMessage", std::nullopt).Serialize());
        p.send("{\"unterminated\":");
        p.reply(req, obj("ok", JSONValue(true)));
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    JSONValue r = client.Request("demo/echo");
    ASSERT_NE(r.find("ok"), nullptr);
    EXPECT_EQ(r.find("wrong"), nullptr);
    EXPECT_TRUE(client.IsConnected());
}

TEST(JsonRpcClient, ServerErrorSurfacesAsRemoteError) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        p.replyError(req, CreateErrorObject(-32001, "boom", obj("detail", JSONValue(std::string("x")))));
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    try {
        client.Request("demo/fail");
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::RemoteError);
        ASSERT_TRUE(e.rpcError().has_value());
        EXPECT_EQ(e.rpcError()->code, -32001);
        EXPECT_EQ(e.rpcError()->message, "boom");
        ASSERT_NE(e.payload().find("data"), nullptr);
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    }
}

TEST(JsonRpcClient, NonStandardErrorPayloadIsKeptVerbatim) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        p.replyError(req, JSONValue(std::string("oops")));
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    try {
        client.Request("demo/fail");
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_FALSE(e.rpcError().has_value());
        EXPECT_STREQ(e.what(), "\"oops\"");
    }
}

TEST(JsonRpcClient, InitializeIsBestEffort) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        if (req.method == "initialize") return; // never acknowledged
        if (req.hasId) p.reply(req, req.params);
    });
    JsonRpcClient client(fastOptions(200ms));
    client.Connect(peer.clientTransport());

    EXPECT_FALSE(client.Initialize());
    EXPECT_FALSE(client.IsInitialized());
    // Still usable for tool calls
    JSONValue::Object args;
    args["x"] = std::make_shared<JSONValue>(int64_t{1});
    JSONValue r = client.CallTool("echo", args);
    ASSERT_NE(r.find("arguments"), nullptr);
    // No initialized notification without an acknowledgement
    for (const auto& m : peer.methods()) {
        EXPECT_NE(m, "initialized");
        EXPECT_NE(m, "notifications/initialized");
    }
}

TEST(JsonRpcClient, InitializeHandshakeStoresServerInfo) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        if (req.method != "initialize") return;
        EXPECT_NE(req.params.find("protocolVersion"), nullptr);
        EXPECT_NE(req.params.find("clientInfo"), nullptr);
        EXPECT_NE(req.params.find("capabilities"), nullptr);
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(std::string("scripted"));
        info["version"] = std::make_shared<JSONValue>(std::string("9.9"));
        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        result["serverInfo"] = std::make_shared<JSONValue>(info);
        result["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        p.reply(req, JSONValue{result});
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    EXPECT_TRUE(client.Initialize());
    EXPECT_TRUE(client.IsInitialized());
    const ServerInfo info = client.GetServerInfo();
    EXPECT_EQ(info.implementation.name, "scripted");
    EXPECT_EQ(info.implementation.version, "9.9");
    EXPECT_EQ(info.protocolVersion, PROTOCOL_VERSION);
    EXPECT_TRUE(peer.waitForMethod("initialized"));
}

TEST(JsonRpcClient, InitializedNotificationNameIsConfigurable) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        if (req.method == "initialize") p.reply(req, JSONValue{JSONValue::Object{}});
    });
    ClientOptions opts = fastOptions();
    opts.initializedMethod = Methods::InitializedNotification;
    JsonRpcClient client(opts);
    client.Connect(peer.clientTransport());

    EXPECT_TRUE(client.Initialize());
    EXPECT_TRUE(peer.waitForMethod("notifications/initialized"));
    for (const auto& m : peer.methods()) {
        EXPECT_NE(m, "initialized");
    }
}

TEST(JsonRpcClient, PendingRequestsFailWhenServerStdoutCloses) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest&) { p.closeStdout(); });
    JsonRpcClient client(fastOptions(10000ms));
    client.Connect(peer.clientTransport());

    const auto start = std::chrono::steady_clock::now();
    try {
        client.Request("demo/hang");
        FAIL() << "expected TransportClosed";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::TransportClosed);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    // Later calls fail fast as well
    EXPECT_THROW(client.Request("demo/again"), errors::ToolHostError);
}

TEST(JsonRpcClient, CloseFailsOutstandingRequests) {
    ScriptedPeer peer([](ScriptedPeer&, const PeerRequest&) {});
    JsonRpcClient client(fastOptions(10000ms));
    client.Connect(peer.clientTransport());

    auto fut = std::async(std::launch::async, [&client] { client.Request("demo/hang"); });
    ASSERT_TRUE(peer.waitForMethod("demo/hang"));
    client.Close();
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected TransportClosed";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::TransportClosed);
    }
}

TEST(JsonRpcClient, ListToolsFollowsCursorAndSkipsNamelessEntries) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        if (req.method != "tools/list") return;
        auto tool = [](const std::string& name) {
            JSONValue::Object t;
            if (!name.empty()) t["name"] = std::make_shared<JSONValue>(name);
            t["description"] = std::make_shared<JSONValue>(std::string("d-") + name);
            return std::make_shared<JSONValue>(t);
        };
        JSONValue::Object result;
        if (req.params.find("cursor") == nullptr) {
            result["tools"] = std::make_shared<JSONValue>(JSONValue::Array{tool("alpha"), tool("")});
            result["nextCursor"] = std::make_shared<JSONValue>(std::string("page2"));
        } else {
            EXPECT_EQ(std::get<std::string>(req.params.find("cursor")->value), "page2");
            result["tools"] = std::make_shared<JSONValue>(JSONValue::Array{tool("beta")});
        }
        p.reply(req, JSONValue{result});
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    auto tools = client.ListTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "alpha");
    EXPECT_EQ(tools[0].description, "d-alpha");
    EXPECT_EQ(tools[1].name, "beta");
    EXPECT_NE(tools[1].raw.find("description"), nullptr);
}

TEST(JsonRpcClient, ListToolsIsEmptyOnError) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        p.replyError(req, CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "nope"));
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());
    EXPECT_TRUE(client.ListTools().empty());
}

TEST(JsonRpcClient, CallToolSendsNameAndArguments) {
    ScriptedPeer peer([](ScriptedPeer& p, const PeerRequest& req) {
        ASSERT_EQ(req.method, "tools/call");
        EXPECT_EQ(std::get<std::string>(req.params.find("name")->value), "echo");
        p.reply(req, *req.params.find("arguments"));
    });
    JsonRpcClient client(fastOptions());
    client.Connect(peer.clientTransport());

    JSONValue::Object args;
    args["x"] = std::make_shared<JSONValue>(int64_t{1});
    JSONValue r = client.CallTool("echo", args);
    EXPECT_EQ(SerializeJSON(r), "{\"x\":1}");
}
