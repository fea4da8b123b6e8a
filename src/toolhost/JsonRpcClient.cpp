//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcClient.cpp
// Purpose: JSON-RPC client implementation (pending-request map, reader dispatch, handshake, tools)
//==========================================================================================================
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/JsonRpcClient.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

ClientOptions DefaultClientOptions() {
    ClientOptions opts;
    opts.clientInfo = Implementation("toolhost", getVersionString());
    const uint64_t ms = GetEnvUint("TOOLHOST_REQUEST_TIMEOUT_MS", 0);
    if (ms > 0) {
        opts.requestTimeout = std::chrono::milliseconds(ms);
    }
    return opts;
}

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

std::string stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.find(key);
    if (v != nullptr && v->isString()) {
        return std::get<std::string>(v->value);
    }
    return std::string();
}

} // namespace

class JsonRpcClient::Impl {
public:
    ClientOptions options;
    std::unique_ptr<ITransport> transport;
    std::atomic<int64_t> nextId{1};
    std::atomic<bool> initialized{false};

    // Guards pending and peerGone
    mutable std::mutex requestMutex;
    std::unordered_map<int64_t, std::promise<JSONValue>> pending;
    bool peerGone{false};

    mutable std::mutex infoMutex;
    ServerInfo serverInfo;

    explicit Impl(ClientOptions opts) : options(std::move(opts)) {
        if (options.clientInfo.name.empty()) {
            options.clientInfo = Implementation("toolhost", getVersionString());
        }
    }

    void onFrame(const std::string& line) {
        JSONValue frame;
        try {
            frame = ParseJSON(line);
        } catch (const std::exception& e) {
            LOG_DEBUG("JsonRpcClient: ignoring non-JSON line ({})", e.what());
            return;
        }
        const FrameKind kind = ClassifyFrame(frame);
        if (kind != FrameKind::Response) {
            const std::string method = stringMember(frame, "method");
            LOG_DEBUG("JsonRpcClient: ignoring server-initiated frame (method='{}')", method);
            return;
        }
        const JSONValue* idVal = frame.find("id");
        if (idVal == nullptr || !idVal->isInt()) {
            LOG_DEBUG("JsonRpcClient: ignoring response without integer id");
            return;
        }
        const int64_t id = std::get<int64_t>(idVal->value);

        std::promise<JSONValue> slot;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            auto it = pending.find(id);
            if (it == pending.end()) {
                LOG_DEBUG("JsonRpcClient: dropping response for unknown id {}", id);
                return;
            }
            slot = std::move(it->second);
            pending.erase(it);
        }
        try {
            slot.set_value(std::move(frame));
        } catch (const std::future_error& e) {
            LOG_DEBUG("JsonRpcClient: response slot for id {} rejected delivery: {}", id, e.what());
        }
    }

    void failAll(const std::string& reason) {
        std::unordered_map<int64_t, std::promise<JSONValue>> drained;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            peerGone = true;
            drained.swap(pending);
        }
        if (!drained.empty()) {
            LOG_DEBUG("JsonRpcClient: failing {} pending request(s): {}", drained.size(), reason);
        }
        for (auto& [id, slot] : drained) {
            try {
                slot.set_exception(std::make_exception_ptr(
                    errors::ToolHostError(errors::ErrorCategory::TransportClosed, reason)));
            } catch (const std::future_error& e) {
                LOG_DEBUG("JsonRpcClient: could not fail request {}: {}", id, e.what());
            }
        }
    }

    // Returns false when the reader (or failAll) already took the slot.
    bool forget(int64_t id) {
        std::lock_guard<std::mutex> lock(requestMutex);
        return pending.erase(id) > 0;
    }

    [[noreturn]] void throwTimeout(const std::string& method, int64_t id, const char* stage) const {
        const auto ms = static_cast<long long>(options.requestTimeout.count());
        LOG_WARN("JsonRpcClient: {} (id={}) timed out {} after {} ms", method, id, stage, ms);
        throw errors::ToolHostError(errors::ErrorCategory::Timeout,
                                    fmt::format("Request timed out after {} ms: {}", ms, method));
    }

    void parseServerInfo(const JSONValue& result) {
        ServerInfo info;
        info.protocolVersion = stringMember(result, "protocolVersion");
        if (const JSONValue* si = result.find("serverInfo")) {
            info.implementation = Implementation(stringMember(*si, "name"), stringMember(*si, "version"));
        }
        if (const JSONValue* caps = result.find("capabilities")) {
            info.capabilities = *caps;
        }
        std::lock_guard<std::mutex> lock(infoMutex);
        serverInfo = std::move(info);
    }
};

JsonRpcClient::JsonRpcClient(ClientOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

JsonRpcClient::~JsonRpcClient() {
    FUNC_SCOPE();
    Close();
}

void JsonRpcClient::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "JsonRpcClient: null transport");
    }
    pImpl->transport = std::move(transport);
    Impl* impl = pImpl.get();
    auto started = pImpl->transport->Start(
        [impl](const std::string& frame) { impl->onFrame(frame); },
        [impl](const std::string& reason) { impl->failAll(reason); });
    started.get();
    LOG_DEBUG("JsonRpcClient connected over {}", pImpl->transport->GetSessionId());
}

void JsonRpcClient::Close() {
    FUNC_SCOPE();
    if (pImpl->transport) {
        pImpl->transport->Close().get();
    }
    pImpl->failAll("JsonRpcClient: closed");
}

bool JsonRpcClient::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->transport && pImpl->transport->IsConnected();
}

JSONValue JsonRpcClient::Request(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "JsonRpcClient: not connected");
    }
    const int64_t id = pImpl->nextId.fetch_add(1);

    std::future<JSONValue> fut;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->peerGone) {
            throw errors::ToolHostError(errors::ErrorCategory::TransportClosed,
                                        fmt::format("JsonRpcClient: server gone, cannot send {}", method));
        }
        std::promise<JSONValue> slot;
        fut = slot.get_future();
        pImpl->pending.emplace(id, std::move(slot));
    }

    const auto timeout = pImpl->options.requestTimeout;
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    JSONRPCRequest request(id, method, params);
    try {
        if (bounded) {
            pImpl->transport->SendFrameUntil(request.Serialize(), deadline);
        } else {
            pImpl->transport->SendFrame(request.Serialize());
        }
    } catch (const errors::ToolHostError& e) {
        pImpl->forget(id);
        if (e.category() == errors::ErrorCategory::Timeout) {
            pImpl->throwTimeout(method, id, "while sending");
        }
        throw;
    } catch (const std::exception&) {
        pImpl->forget(id);
        throw;
    }

    if (bounded && fut.wait_until(deadline) != std::future_status::ready) {
        if (pImpl->forget(id)) {
            pImpl->throwTimeout(method, id, "waiting for a response");
        }
        // Otherwise the reader claimed the slot just before the deadline and is about to fill it
    }

    JSONValue frame = fut.get();
    JSONRPCResponse response;
    if (!response.FromValue(frame)) {
        throw errors::ToolHostError(errors::ErrorCategory::Protocol,
                                    fmt::format("Malformed response to {}", method));
    }
    if (response.IsError()) {
        throw errors::MakeRemoteError(*response.error);
    }
    return response.result.value_or(JSONValue(nullptr));
}

void JsonRpcClient::Notify(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw errors::ToolHostError(errors::ErrorCategory::TransportClosed, "JsonRpcClient: not connected");
    }
    JSONRPCNotification notification(method, params);
    const auto timeout = pImpl->options.requestTimeout;
    if (timeout.count() > 0) {
        pImpl->transport->SendFrameUntil(notification.Serialize(), std::chrono::steady_clock::now() + timeout);
    } else {
        pImpl->transport->SendFrame(notification.Serialize());
    }
}

bool JsonRpcClient::Initialize() {
    FUNC_SCOPE();
    const auto& info = pImpl->options.clientInfo;
    JSONValue::Object clientInfo;
    clientInfo["name"] = str(info.name);
    clientInfo["version"] = str(info.version);
    JSONValue::Object capabilities;
    capabilities["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object params;
    params["protocolVersion"] = str(pImpl->options.protocolVersion);
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(clientInfo));
    params["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));

    JSONValue result;
    try {
        result = Request(Methods::Initialize, JSONValue{std::move(params)});
    } catch (const std::exception& e) {
        LOG_WARN("Initialize not acknowledged; continuing without handshake: {}", e.what());
        return false;
    }
    pImpl->parseServerInfo(result);
    pImpl->initialized = true;

    try {
        Notify(pImpl->options.initializedMethod, JSONValue{JSONValue::Object{}});
    } catch (const std::exception& e) {
        LOG_WARN("Failed to send initialized notification: {}", e.what());
    }
    return true;
}

bool JsonRpcClient::IsInitialized() const {
    FUNC_SCOPE();
    return pImpl->initialized.load();
}

ServerInfo JsonRpcClient::GetServerInfo() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->infoMutex);
    return pImpl->serverInfo;
}

std::vector<RemoteTool> JsonRpcClient::ListTools() {
    FUNC_SCOPE();
    std::vector<RemoteTool> tools;
    std::optional<std::string> cursor;
    std::size_t page = 0;
    for (; page < pImpl->options.maxToolPages; ++page) {
        JSONValue::Object params;
        if (cursor) {
            params["cursor"] = str(*cursor);
        }
        JSONValue result;
        try {
            result = Request(Methods::ListTools, JSONValue{std::move(params)});
        } catch (const std::exception& e) {
            LOG_WARN("tools/list failed: {}", e.what());
            return {};
        }

        if (const JSONValue* list = result.find("tools"); list != nullptr && list->isArray()) {
            for (const auto& entry : std::get<JSONValue::Array>(list->value)) {
                if (!entry || !entry->isObject()) {
                    continue;
                }
                RemoteTool tool;
                tool.name = stringMember(*entry, "name");
                if (tool.name.empty()) {
                    LOG_DEBUG("tools/list: skipping entry without a name");
                    continue;
                }
                tool.description = stringMember(*entry, "description");
                if (const JSONValue* schema = entry->find("inputSchema")) {
                    tool.inputSchema = *schema;
                }
                tool.raw = *entry;
                tools.push_back(std::move(tool));
            }
        }

        const std::string next = stringMember(result, "nextCursor");
        if (next.empty()) {
            break;
        }
        cursor = next;
    }
    if (page == pImpl->options.maxToolPages) {
        LOG_WARN("tools/list: stopped after {} pages", pImpl->options.maxToolPages);
    }
    return tools;
}

JSONValue JsonRpcClient::CallTool(const std::string& name, const JSONValue::Object& arguments) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = str(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    return Request(Methods::CallTool, JSONValue{std::move(params)});
}

std::size_t JsonRpcClient::PendingCount() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pending.size();
}

} // namespace toolhost
