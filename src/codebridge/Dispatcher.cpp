//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: JSON-RPC request routing, pooled coroutine execution and the response path
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_set>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "codebridge/Dispatcher.h"
#include "codebridge/MessageCodec.h"
#include "codebridge/PendingRequestTable.h"
#include "codebridge/Protocol.h"
#include "codebridge/async/FutureAwaitable.h"
#include "codebridge/async/Task.h"
#include "codebridge/completion/ArgumentCompletion.h"
#include "codebridge/errors/Errors.h"
#include "codebridge/index/IndexJson.h"
#include "codebridge/prompts/PromptCatalog.h"
#include "codebridge/resources/ResourceCatalog.h"
#include "codebridge/tools/ToolRegistry.h"

namespace codebridge {

namespace {

using Entry = PendingRequestTable::Entry;

enum class ResultShape {
    Bare,         // tools/<name>: the domain value itself
    ToolEnvelope  // tools/call: MCP CallToolResult
};

JSONValue toolEnvelope(JSONValue domain) {
    JSONValue::Object text;
    text["type"] = MakeJSON("text");
    text["text"] = MakeJSON(SerializeJSONPretty(domain));
    JSONValue::Array content;
    content.push_back(MakeJSON(std::move(text)));
    JSONValue::Object structured;
    structured["result"] = MakeJSON(std::move(domain));
    JSONValue::Object result;
    result["content"] = MakeJSON(std::move(content));
    result["structuredContent"] = MakeJSON(std::move(structured));
    result["isError"] = MakeJSON(false);
    return JSONValue(std::move(result));
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// file:///home/me/My%20Project -> /home/me/My Project; plain paths pass through.
std::string rootFromUri(const std::string& uri) {
    static const std::string scheme = "file://";
    if (!uri.starts_with(scheme)) {
        return uri;
    }
    std::string path = uri.substr(scheme.size());
    if (path.starts_with("localhost/")) {
        path.erase(0, std::string("localhost").size());
    }
    std::string decoded;
    decoded.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '%' && i + 2 < path.size() && hexValue(path[i + 1]) >= 0 && hexValue(path[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hexValue(path[i + 1]) * 16 + hexValue(path[i + 2])));
            i += 2;
        } else {
            decoded.push_back(path[i]);
        }
    }
    return decoded;
}

std::string stringArg(const JSONValue& args, const std::string& key, const std::string& fallback) {
    const JSONValue* v = GetMember(args, key);
    return (v != nullptr && v->isString()) ? std::get<std::string>(v->value) : fallback;
}

std::string normalizeFileArg(std::string path) {
    while (path.starts_with("./")) path.erase(0, 2);
    return path;
}

// Exact name matches first (snapshot order), then the remaining partial matches.
std::vector<SymbolRecord> pickByName(const std::vector<SymbolRecord>& listed, const std::string& name, std::size_t wanted) {
    std::vector<SymbolRecord> picked;
    for (const auto& s : listed) {
        if (picked.size() >= wanted) break;
        if (s.name == name) picked.push_back(s);
    }
    for (const auto& s : listed) {
        if (picked.size() >= wanted) break;
        if (s.name != name) picked.push_back(s);
    }
    return picked;
}

} // namespace

class Dispatcher::Impl {
public:
    enum class ExitCause { ShutdownRequest, ExitNotification, TransportClosed };
    struct ExitSignal {
        ExitCause cause{ExitCause::TransportClosed};
        CloseReason reason{CloseReason::Local};
    };

    ITransport& transport;
    ProviderFactory providerFactory;
    DispatcherOptions options;
    std::unique_ptr<IMessageCodec> codec;
    ToolRegistry registry;
    PendingRequestTable pending;
    Lifecycle lifecycle;
    boost::asio::thread_pool pool;

    // Set by initialize on the reader thread; read by handlers and by Dispatcher::ProjectRoot().
    mutable std::mutex sessionMutex;
    std::shared_ptr<IIndexProvider> provider;
    std::string projectRoot;

    // resources/subscribe bookkeeping; the index is a snapshot, so no updates are pushed.
    mutable std::mutex subscriptionMutex;
    std::unordered_set<std::string> subscribedUris;

    // Serializes completion + write so that a drained table implies the responses are queued.
    std::mutex sendMutex;
    bool acceptingResponses{true};

    std::mutex exitMutex;
    std::condition_variable exitCv;
    std::optional<ExitSignal> exitSignal;
    bool exited{false};

    Impl(ITransport& transport, ProviderFactory factory, DispatcherOptions opts)
        : transport(transport),
          providerFactory(std::move(factory)),
          options(std::move(opts)),
          codec(MakeJsonRpcCodec()),
          pool(std::max<std::size_t>(1, options.workerThreads)),
          projectRoot(options.projectRoot) {}

    ~Impl() {
        pending.CancelAll();
        pool.join();
    }

    std::string currentRoot() const {
        std::lock_guard<std::mutex> lock(sessionMutex);
        return projectRoot;
    }

    std::shared_ptr<IIndexProvider> currentProvider() const {
        std::lock_guard<std::mutex> lock(sessionMutex);
        return provider;
    }

    ////////////////////////////////////////////// Response path //////////////////////////////////////////////
    // Caller holds sendMutex.
    void writeLocked(const JSONRPCResponse& response) {
        if (!acceptingResponses) {
            LOG_DEBUG("Dispatcher: session closed, dropping response for id={}", IdToString(response.id));
            return;
        }
        if (!transport.Send(codec->encode(Message{response}))) {
            LOG_WARN("Dispatcher: response for id={} could not be queued", IdToString(response.id));
        }
    }

    void respondResult(const JSONRPCId& id, JSONValue result) {
        std::lock_guard<std::mutex> lock(sendMutex);
        writeLocked(JSONRPCResponse(id, std::move(result)));
    }

    void respondError(const JSONRPCId& id, const errors::RpcError& err) {
        LOG_DEBUG("Dispatcher: id={} -> error {} ({})", IdToString(id), err.code, err.message);
        std::lock_guard<std::mutex> lock(sendMutex);
        writeLocked(*errors::makeErrorResponse(id, err));
    }

    bool completeLocked(const std::shared_ptr<Entry>& entry) {
        if (!pending.Complete(entry)) {
            LOG_DEBUG("Dispatcher: id={} was cancelled; discarding its result", IdToString(entry->id));
            return false;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - entry->start);
        LOG_DEBUG("Dispatcher: id={} completed in {} ms", IdToString(entry->id), elapsed.count());
        return true;
    }

    void finishResult(const std::shared_ptr<Entry>& entry, JSONValue result) {
        std::lock_guard<std::mutex> lock(sendMutex);
        if (completeLocked(entry)) {
            writeLocked(JSONRPCResponse(entry->id, std::move(result)));
        }
    }

    void finishError(const std::shared_ptr<Entry>& entry, const errors::RpcError& err) {
        std::lock_guard<std::mutex> lock(sendMutex);
        if (completeLocked(entry)) {
            writeLocked(*errors::makeErrorResponse(entry->id, err));
        }
    }

    void reportFault(const std::shared_ptr<Entry>& entry, const ProviderFault& fault) {
        if (fault.kind == FaultKind::NotFound) {
            LOG_DEBUG("Dispatcher: id={} not found: {}", IdToString(entry->id), fault.detail);
        } else {
            LOG_WARN("Dispatcher: id={} index fault {}: {}", IdToString(entry->id), FaultKindName(fault.kind), fault.detail);
        }
        finishError(entry, errors::faultToRpcError(fault));
    }

    void signalExit(ExitSignal signal) {
        std::lock_guard<std::mutex> lock(exitMutex);
        if (!exitSignal.has_value()) {
            exitSignal = signal;
            exitCv.notify_all();
        }
    }

    template <typename T>
    async::StoppableFutureAwaitable<T> awaitProvider(std::future<T>&& fut, std::stop_token stop) {
        return async::StoppableFutureAwaitable<T>(pool.get_executor(), std::move(fut), std::move(stop));
    }

    ////////////////////////////////////////////// Inbound //////////////////////////////////////////////
    void handleMessage(const std::string& payload) {
        auto decoded = codec->decode(payload);
        if (auto* err = std::get_if<DecodeError>(&decoded)) {
            if (err->id.has_value()) {
                LOG_WARN("Dispatcher: rejecting malformed message id={}: {}", IdToString(*err->id), err->message);
                respondError(*err->id, errors::makeRpcError(err->code, err->message));
            } else {
                LOG_WARN("Dispatcher: dropping malformed message without id: {}", err->message);
            }
            return;
        }
        auto& message = std::get<Message>(decoded);
        if (auto* request = std::get_if<JSONRPCRequest>(&message)) {
            handleRequest(*request);
        } else if (auto* notification = std::get_if<JSONRPCNotification>(&message)) {
            handleNotification(*notification);
        } else {
            LOG_DEBUG("Dispatcher: ignoring unsolicited response id={}", IdToString(std::get<JSONRPCResponse>(message).id));
        }
    }

    void handleNotification(const JSONRPCNotification& notification) {
        LOG_DEBUG("Dispatcher: notification {}", notification.method);
        if (notification.method == Methods::Exit) {
            LOG_INFO("Dispatcher: exit notification received");
            lifecycle.BeginShutdown();
            pending.CancelAll();
            signalExit(ExitSignal{ExitCause::ExitNotification, CloseReason::Local});
        } else if (notification.method == Methods::Cancelled) {
            handleCancelled(notification);
        } else if (notification.method == Methods::Initialized) {
            LOG_INFO("Dispatcher: client confirmed initialization");
        } else {
            LOG_DEBUG("Dispatcher: no handler for notification {}", notification.method);
        }
    }

    void handleCancelled(const JSONRPCNotification& notification) {
        const JSONValue* idValue = nullptr;
        if (notification.params.has_value()) {
            idValue = GetMember(*notification.params, "requestId");
            if (idValue == nullptr) {
                idValue = GetMember(*notification.params, "id");
            }
        }
        JSONRPCId id;
        if (idValue != nullptr && idValue->isString()) {
            id = std::get<std::string>(idValue->value);
        } else if (idValue != nullptr && idValue->isInteger()) {
            id = std::get<int64_t>(idValue->value);
        } else {
            LOG_WARN("Dispatcher: cancellation without a usable request id");
            return;
        }
        if (pending.Cancel(id)) {
            LOG_INFO("Dispatcher: cancelled request id={}", IdToString(id));
        } else {
            LOG_DEBUG("Dispatcher: cancellation for unknown or finished id={}", IdToString(id));
        }
    }

    void handleRequest(const JSONRPCRequest& request) {
        LOG_DEBUG("Dispatcher: request {} id={}", request.method, IdToString(request.id));
        if (request.method == Methods::Initialize) {
            handleInitialize(request);
            return;
        }
        if (auto err = lifecycle.Admit(request.method)) {
            respondError(request.id, *err);
            return;
        }
        if (pending.Contains(request.id)) {
            respondError(request.id, errors::invalidRequest("Request id " + IdToString(request.id) + " is already pending"));
            return;
        }

        const std::string& method = request.method;
        const JSONValue* params = request.params.has_value() ? &*request.params : nullptr;

        if (method == Methods::Shutdown) {
            handleShutdown(request);
        } else if (method == Methods::Ping) {
            respondResult(request.id, JSONValue(JSONValue::Object{}));
        } else if (method == Methods::ListTools) {
            respondResult(request.id, registry.toolsListResult());
        } else if (method == Methods::ListResourceTemplates) {
            respondResult(request.id, resources::ResourceTemplatesListResult());
        } else if (method == Methods::ListPrompts) {
            respondResult(request.id, prompts::PromptsListResult());
        } else if (method == Methods::CallTool) {
            handleCallTool(request, params);
        } else if (method.starts_with(Methods::ToolPrefix)) {
            const std::string toolName = method.substr(std::string(Methods::ToolPrefix).size());
            ToolCall call;
            if (auto err = registry.validate(toolName, params, call)) {
                respondError(request.id, *err);
                return;
            }
            dispatchTool(request, std::move(call), ResultShape::Bare);
        } else if (method == Methods::ListResources) {
            dispatchPooled(request, [this](std::shared_ptr<Entry> entry, std::shared_ptr<IIndexProvider> prov) {
                coResourcesList(std::move(entry), std::move(prov));
            });
        } else if (method == Methods::ReadResource) {
            handleReadResource(request, params);
        } else if (method == Methods::GetPrompt) {
            handleGetPrompt(request, params);
        } else if (method == Methods::Subscribe || method == Methods::Unsubscribe) {
            handleSubscription(request, params, method == Methods::Subscribe);
        } else if (method == Methods::Complete) {
            handleComplete(request, params);
        } else {
            respondError(request.id, errors::methodNotFound(method));
        }
    }

    ////////////////////////////////////////////// Lifecycle methods //////////////////////////////////////////////
    void handleInitialize(const JSONRPCRequest& request) {
        LOG_INFO("Dispatcher: handling initialize");
        if (auto err = lifecycle.BeginInitialize()) {
            respondError(request.id, *err);
            return;
        }
        auto fail = [this, &request](const errors::RpcError& err) {
            lifecycle.AbortInitialize();
            respondError(request.id, err);
        };

        const JSONValue params = request.params.value_or(JSONValue(JSONValue::Object{}));
        if (!params.isObject()) {
            return fail(errors::invalidParams("initialize params must be an object"));
        }
        std::string requestedVersion;
        if (const JSONValue* v = GetMember(params, "protocolVersion")) {
            if (!v->isString()) {
                return fail(errors::invalidParams("protocolVersion: expected string"));
            }
            requestedVersion = std::get<std::string>(v->value);
        }
        if (const JSONValue* caps = GetMember(params, "capabilities"); caps != nullptr && !caps->isObject()) {
            return fail(errors::invalidParams("capabilities: expected object"));
        }

        std::string root = options.projectRoot;
        for (const char* key : {"rootPath", "rootUri"}) { // rootUri wins when both are given
            const JSONValue* v = GetMember(params, key);
            if (v == nullptr || v->isNull()) continue;
            if (!v->isString()) {
                return fail(errors::invalidParams(std::string(key) + ": expected string"));
            }
            root = rootFromUri(std::get<std::string>(v->value));
        }
        std::error_code ec;
        if (root.empty() || !std::filesystem::is_directory(root, ec)) {
            return fail(errors::invalidParams("project root '" + root + "' is not a directory"));
        }

        std::shared_ptr<IIndexProvider> opened;
        try {
            opened = providerFactory(root);
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: opening the index for {} failed: {}", root, e.what());
        }
        if (!opened) {
            return fail(errors::internalError("Failed to open the code index for the project"));
        }
        {
            std::lock_guard<std::mutex> lock(sessionMutex);
            provider = std::move(opened);
            projectRoot = root;
        }

        if (const JSONValue* info = GetMember(params, "clientInfo")) {
            LOG_INFO("Dispatcher: client {} {}", stringArg(*info, "name", "<unnamed>"), stringArg(*info, "version", "?"));
        }

        JSONValue::Object listChangedFalse;
        listChangedFalse["listChanged"] = MakeJSON(false);
        JSONValue::Object resourcesCap;
        resourcesCap["subscribe"] = MakeJSON(true);
        resourcesCap["listChanged"] = MakeJSON(false);
        JSONValue::Object caps;
        caps["tools"] = MakeJSON(listChangedFalse);
        caps["prompts"] = MakeJSON(listChangedFalse);
        caps["resources"] = MakeJSON(std::move(resourcesCap));
        caps["completions"] = MakeJSON(JSONValue::Object{});
        JSONValue::Object serverInfo;
        serverInfo["name"] = MakeJSON(options.serverName);
        serverInfo["version"] = MakeJSON(options.serverVersion);
        JSONValue::Object result;
        result["protocolVersion"] = MakeJSON(NegotiateProtocolVersion(requestedVersion));
        result["capabilities"] = MakeJSON(std::move(caps));
        result["serverInfo"] = MakeJSON(std::move(serverInfo));

        respondResult(request.id, JSONValue(std::move(result)));
        lifecycle.CompleteInitialize();
        LOG_INFO("Dispatcher: session ready for {}", root);
    }

    void handleShutdown(const JSONRPCRequest& request) {
        lifecycle.BeginShutdown();
        const std::size_t cancelled = pending.CancelAll();
        LOG_INFO("Dispatcher: shutdown requested ({} pending request(s) cancelled)", cancelled);
        respondResult(request.id, JSONValue(JSONValue::Object{}));
        signalExit(ExitSignal{ExitCause::ShutdownRequest, CloseReason::Local});
    }

    ////////////////////////////////////////////// Pooled execution //////////////////////////////////////////////
    template <typename Start>
    void dispatchPooled(const JSONRPCRequest& request, Start start) {
        auto entry = pending.Register(request.id);
        if (!entry) {
            respondError(request.id, errors::invalidRequest("Request id " + IdToString(request.id) + " is already pending"));
            return;
        }
        auto prov = currentProvider();
        boost::asio::post(pool, [this, entry, prov, start = std::move(start)]() mutable {
            try {
                start(entry, prov);
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatcher: handler for id={} failed: {}", IdToString(entry->id), e.what());
                finishError(entry, errors::internalError());
            }
        });
    }

    void dispatchTool(const JSONRPCRequest& request, ToolCall call, ResultShape shape) {
        dispatchPooled(request, [this, call = std::move(call), shape](std::shared_ptr<Entry> entry,
                                                                      std::shared_ptr<IIndexProvider> prov) {
            const std::stop_token stop = entry->stop.get_token();
            std::visit([&](const auto& params) {
                using P = std::decay_t<decltype(params)>;
                if constexpr (std::is_same_v<P, SearchParams>) {
                    coProviderRequest<std::vector<SearchMatch>>(entry, prov->search(params, stop), shape);
                } else if constexpr (std::is_same_v<P, SymbolsParams>) {
                    coProviderRequest<std::vector<SymbolRecord>>(entry, prov->listSymbols(params, stop), shape);
                } else if constexpr (std::is_same_v<P, FilesParams>) {
                    coProviderRequest<std::vector<std::string>>(entry, prov->listFiles(params, stop), shape);
                } else if constexpr (std::is_same_v<P, ShowParams>) {
                    coProviderRequest<SymbolDetail>(entry, prov->showSymbol(params, stop), shape);
                } else {
                    coProviderRequest<TreeNode>(entry, prov->tree(params, stop), shape);
                }
            }, call);
        });
    }

    void handleCallTool(const JSONRPCRequest& request, const JSONValue* params) {
        if (params == nullptr || !params->isObject()) {
            respondError(request.id, errors::invalidParams("tools/call params must be an object"));
            return;
        }
        const JSONValue* name = GetMember(*params, "name");
        if (name == nullptr || !name->isString()) {
            respondError(request.id, errors::invalidParams("name: required string"));
            return;
        }
        const JSONValue* arguments = GetMember(*params, "arguments");
        ToolCall call;
        if (auto err = registry.validate(std::get<std::string>(name->value), arguments, call)) {
            respondError(request.id, *err);
            return;
        }
        dispatchTool(request, std::move(call), ResultShape::ToolEnvelope);
    }

    void handleReadResource(const JSONRPCRequest& request, const JSONValue* params) {
        const JSONValue* uriValue = params != nullptr ? GetMember(*params, "uri") : nullptr;
        if (uriValue == nullptr || !uriValue->isString()) {
            respondError(request.id, errors::invalidParams("uri: required string"));
            return;
        }
        std::string uri = std::get<std::string>(uriValue->value);
        auto parsed = resources::ParseResourceUri(uri);
        if (auto* err = std::get_if<errors::RpcError>(&parsed)) {
            respondError(request.id, *err);
            return;
        }
        auto target = std::get<resources::ResourceTarget>(std::move(parsed));
        if (target.kind == resources::ResourceTarget::Kind::File) {
            target.path = normalizeFileArg(target.path);
            if (!resources::ResolveInsideRoot(currentRoot(), target.path)) {
                respondError(request.id, errors::invalidParams("path '" + target.path + "' is outside the project root"));
                return;
            }
        }
        dispatchPooled(request, [this, target = std::move(target), uri = std::move(uri)](std::shared_ptr<Entry> entry,
                                                                                        std::shared_ptr<IIndexProvider> prov) {
            coReadResource(std::move(entry), std::move(prov), target, uri);
        });
    }

    void handleGetPrompt(const JSONRPCRequest& request, const JSONValue* params) {
        const JSONValue* nameValue = params != nullptr ? GetMember(*params, "name") : nullptr;
        if (nameValue == nullptr || !nameValue->isString()) {
            respondError(request.id, errors::invalidParams("name: required string"));
            return;
        }
        const std::string& name = std::get<std::string>(nameValue->value);
        const prompts::PromptDescriptor* prompt = prompts::FindPrompt(name);
        if (prompt == nullptr) {
            respondError(request.id, errors::invalidParams("Unknown prompt: " + name));
            return;
        }
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = GetMember(*params, "arguments"); a != nullptr && !a->isNull()) {
            if (!a->isObject()) {
                respondError(request.id, errors::invalidParams("arguments: expected object"));
                return;
            }
            arguments = *a;
        }
        if (auto missing = prompts::MissingArgument(*prompt, arguments)) {
            respondError(request.id, errors::invalidParams("missing required argument '" + *missing + "'"));
            return;
        }
        const std::string direction = stringArg(arguments, "direction", "both");
        if (direction != "both" && direction != "callers" && direction != "callees") {
            respondError(request.id, errors::invalidParams("direction must be 'callers', 'callees' or 'both'"));
            return;
        }
        const std::string filePath = stringArg(arguments, "file_path", "");
        if (!filePath.empty() && !resources::ResolveInsideRoot(currentRoot(), normalizeFileArg(filePath))) {
            respondError(request.id, errors::invalidParams("file_path '" + filePath + "' is outside the project root"));
            return;
        }
        dispatchPooled(request, [this, prompt, arguments = std::move(arguments)](std::shared_ptr<Entry> entry,
                                                                               std::shared_ptr<IIndexProvider> prov) {
            coGetPrompt(std::move(entry), std::move(prov), prompt, arguments);
        });
    }

    void handleSubscription(const JSONRPCRequest& request, const JSONValue* params, bool subscribe) {
        const JSONValue* uriValue = params != nullptr ? GetMember(*params, "uri") : nullptr;
        if (uriValue == nullptr || !uriValue->isString()) {
            respondError(request.id, errors::invalidParams("uri: required string"));
            return;
        }
        const std::string& uri = std::get<std::string>(uriValue->value);
        const auto target = resources::ParseResourceUri(uri);
        if (const auto* err = std::get_if<errors::RpcError>(&target)) {
            respondError(request.id, *err);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(subscriptionMutex);
            if (subscribe) {
                subscribedUris.insert(uri);
            } else {
                subscribedUris.erase(uri);
            }
        }
        LOG_INFO("Dispatcher: {} {}", subscribe ? "subscribed to" : "unsubscribed from", uri);
        respondResult(request.id, JSONValue(JSONValue::Object{}));
    }

    void handleComplete(const JSONRPCRequest& request, const JSONValue* params) {
        auto parsed = completion::ParseCompletionRequest(params);
        if (auto* err = std::get_if<errors::RpcError>(&parsed)) {
            respondError(request.id, *err);
            return;
        }
        auto query = std::get<completion::CompletionRequest>(std::move(parsed));
        switch (completion::SourceFor(query)) {
            case completion::CandidateSource::None:
                respondResult(request.id, completion::CompletionResult({}));
                return;
            case completion::CandidateSource::Fixed:
                respondResult(request.id, completion::CompletionResult(completion::FilterCandidates(
                    completion::FixedCandidates(query.argumentName), query.argumentValue)));
                return;
            case completion::CandidateSource::ProjectFiles:
            case completion::CandidateSource::SymbolNames:
                break;
        }
        dispatchPooled(request, [this, query = std::move(query)](std::shared_ptr<Entry> entry,
                                                                 std::shared_ptr<IIndexProvider> prov) {
            coComplete(std::move(entry), std::move(prov), query);
        });
    }

    ////////////////////////////////////////////// Coroutines //////////////////////////////////////////////
    template <typename T>
    async::Task coProviderRequest(std::shared_ptr<Entry> entry, std::future<ProviderResult<T>> fut, ResultShape shape) {
        try {
            auto outcome = co_await awaitProvider(std::move(fut), entry->stop.get_token());
            if (!outcome.has_value()) {
                LOG_DEBUG("Dispatcher: id={} stopped while waiting on the index", IdToString(entry->id));
                co_return;
            }
            if (const auto* fault = std::get_if<ProviderFault>(&*outcome)) {
                reportFault(entry, *fault);
                co_return;
            }
            JSONValue domain = ToJSON(std::get<T>(*outcome));
            finishResult(entry, shape == ResultShape::ToolEnvelope ? toolEnvelope(std::move(domain)) : std::move(domain));
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: id={} failed: {}", IdToString(entry->id), e.what());
            finishError(entry, errors::internalError());
        }
    }

    async::Task coResourcesList(std::shared_ptr<Entry> entry, std::shared_ptr<IIndexProvider> prov) {
        try {
            const std::stop_token stop = entry->stop.get_token();
            auto listed = co_await awaitProvider(prov->listFiles(FilesParams{}, stop), stop);
            if (!listed.has_value()) co_return;
            std::vector<std::string> files;
            if (const auto* fault = std::get_if<ProviderFault>(&*listed)) {
                LOG_INFO("Dispatcher: listing resources without files ({})", FaultKindName(fault->kind));
            } else {
                files = std::get<std::vector<std::string>>(std::move(*listed));
            }
            finishResult(entry, resources::ResourcesListResult(files));
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: resources/list failed: {}", e.what());
            finishError(entry, errors::internalError());
        }
    }

    async::Task coReadResource(std::shared_ptr<Entry> entry, std::shared_ptr<IIndexProvider> prov,
                                     resources::ResourceTarget target, std::string uri) {
        using Kind = resources::ResourceTarget::Kind;
        try {
            const std::stop_token stop = entry->stop.get_token();
            switch (target.kind) {
                case Kind::Status: {
                    auto status = co_await awaitProvider(prov->status(stop), stop);
                    if (!status.has_value()) co_return;
                    if (const auto* fault = std::get_if<ProviderFault>(&*status)) {
                        reportFault(entry, *fault);
                        co_return;
                    }
                    finishResult(entry, resources::ReadResult(uri, "application/json",
                                                              SerializeJSONPretty(ToJSON(std::get<IndexStatus>(*status)))));
                    co_return;
                }
                case Kind::Tree: {
                    auto tree = co_await awaitProvider(prov->tree(TreeParams{}, stop), stop);
                    if (!tree.has_value()) co_return;
                    if (const auto* fault = std::get_if<ProviderFault>(&*tree)) {
                        reportFault(entry, *fault);
                        co_return;
                    }
                    finishResult(entry, resources::ReadResult(uri, "application/json",
                                                              SerializeJSONPretty(ToJSON(std::get<TreeNode>(*tree)))));
                    co_return;
                }
                case Kind::Symbol: {
                    ShowParams show;
                    show.id = target.symbolId;
                    auto detail = co_await awaitProvider(prov->showSymbol(show, stop), stop);
                    if (!detail.has_value()) co_return;
                    if (const auto* fault = std::get_if<ProviderFault>(&*detail)) {
                        reportFault(entry, *fault);
                        co_return;
                    }
                    finishResult(entry, resources::ReadResult(uri, "application/json",
                                                              SerializeJSONPretty(ToJSON(std::get<SymbolDetail>(*detail)))));
                    co_return;
                }
                case Kind::File:
                    break;
            }

            FilesParams filesQuery;
            filesQuery.prefix = target.path;
            auto files = co_await awaitProvider(prov->listFiles(filesQuery, stop), stop);
            if (!files.has_value()) co_return;
            if (const auto* fault = std::get_if<ProviderFault>(&*files)) {
                reportFault(entry, *fault);
                co_return;
            }
            const auto& paths = std::get<std::vector<std::string>>(*files);
            if (std::find(paths.begin(), paths.end(), target.path) == paths.end()) {
                finishError(entry, errors::notFound("File '" + target.path + "' is not in the index"));
                co_return;
            }

            SymbolsParams symbolsQuery;
            symbolsQuery.file = target.path;
            symbolsQuery.limit = SymbolsParams::MaxLimit;
            auto symbols = co_await awaitProvider(prov->listSymbols(symbolsQuery, stop), stop);
            if (!symbols.has_value()) co_return;
            if (const auto* fault = std::get_if<ProviderFault>(&*symbols)) {
                reportFault(entry, *fault);
                co_return;
            }
            std::vector<SymbolRecord> own;
            for (const auto& s : std::get<std::vector<SymbolRecord>>(*symbols)) {
                if (s.file == target.path) own.push_back(s);
            }

            JSONValue::Object fileInfo;
            fileInfo["path"] = MakeJSON(target.path);
            fileInfo["language"] = MakeJSON(own.empty() ? std::string("unknown") : own.front().language.value_or("unknown"));
            fileInfo["mimeType"] = MakeJSON(resources::MimeTypeForPath(target.path));
            JSONValue::Object body;
            body["file"] = MakeJSON(std::move(fileInfo));
            body["symbols"] = MakeJSON(ToJSON(own));
            if (auto text = resources::ReadProjectFile(currentRoot(), target.path)) {
                body["content"] = MakeJSON(std::move(text->text));
                if (text->truncated) body["truncated"] = MakeJSON(true);
            }
            finishResult(entry, resources::ReadResult(uri, "application/json", SerializeJSON(JSONValue(std::move(body)))));
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: resources/read {} failed: {}", uri, e.what());
            finishError(entry, errors::internalError());
        }
    }

    async::Task coGetPrompt(std::shared_ptr<Entry> entry, std::shared_ptr<IIndexProvider> prov,
                                  const prompts::PromptDescriptor* prompt, JSONValue arguments) {
        try {
            const std::stop_token stop = entry->stop.get_token();
            const std::string& name = prompt->name;
            std::string text;

            if (name == "find_similar") {
                text = prompts::RenderFindSimilar(stringArg(arguments, "description", ""));
            } else if (name == "architecture_overview") {
                auto status = co_await awaitProvider(prov->status(stop), stop);
                if (!status.has_value()) co_return;
                std::optional<IndexStatus> known;
                if (auto* s = std::get_if<IndexStatus>(&*status)) known = *s;
                text = prompts::RenderArchitectureOverview(known);
            } else if (name == "code_review" || name == "summarize_file") {
                const std::string path = normalizeFileArg(stringArg(arguments, "file_path", ""));
                SymbolsParams query;
                query.file = path;
                query.limit = SymbolsParams::MaxLimit;
                auto listed = co_await awaitProvider(prov->listSymbols(query, stop), stop);
                if (!listed.has_value()) co_return;
                if (const auto* fault = std::get_if<ProviderFault>(&*listed); fault && fault->kind != FaultKind::NotFound) {
                    reportFault(entry, *fault);
                    co_return;
                }
                std::vector<SymbolRecord> own;
                if (auto* all = std::get_if<std::vector<SymbolRecord>>(&*listed)) {
                    for (const auto& s : *all) {
                        if (s.file == path) own.push_back(s);
                    }
                }
                std::optional<std::string> language;
                if (!own.empty()) language = own.front().language.value_or("unknown");
                std::optional<std::string> content;
                if (auto file = resources::ReadProjectFile(currentRoot(), path)) content = std::move(file->text);
                if (name == "code_review") {
                    text = prompts::RenderCodeReview(path, stringArg(arguments, "focus", "general"), language, own, content);
                } else {
                    text = prompts::RenderSummarizeFile(path, language, own, content);
                }
            } else {
                // explain_symbol, analyze_dependencies, refactor_suggestions: look the symbol up by name.
                const bool explain = name == "explain_symbol";
                const std::string target = stringArg(arguments, explain ? "symbol_name" : "target", "");
                SymbolsParams query;
                query.name = target;
                query.limit = SymbolsParams::MaxLimit;
                auto listed = co_await awaitProvider(prov->listSymbols(query, stop), stop);
                if (!listed.has_value()) co_return;
                if (const auto* fault = std::get_if<ProviderFault>(&*listed); fault && fault->kind != FaultKind::NotFound) {
                    reportFault(entry, *fault);
                    co_return;
                }
                std::vector<SymbolDetail> details;
                if (auto* all = std::get_if<std::vector<SymbolRecord>>(&*listed)) {
                    for (const auto& candidate : pickByName(*all, target, explain ? 3 : 1)) {
                        ShowParams show;
                        show.id = candidate.id;
                        auto shown = co_await awaitProvider(prov->showSymbol(show, stop), stop);
                        if (!shown.has_value()) co_return;
                        if (auto* d = std::get_if<SymbolDetail>(&*shown)) details.push_back(std::move(*d));
                    }
                }
                std::optional<SymbolDetail> first;
                if (!details.empty()) first = details.front();
                if (explain) {
                    text = prompts::RenderExplainSymbol(target, details);
                } else if (name == "analyze_dependencies") {
                    text = prompts::RenderAnalyzeDependencies(target, stringArg(arguments, "direction", "both"), first);
                } else {
                    text = prompts::RenderRefactorSuggestions(target, first);
                }
            }
            finishResult(entry, prompts::PromptResult(prompt->description, text));
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: prompts/get {} failed: {}", prompt->name, e.what());
            finishError(entry, errors::internalError());
        }
    }

    // Completion is advisory: an unavailable index completes nothing instead of failing.
    async::Task coComplete(std::shared_ptr<Entry> entry, std::shared_ptr<IIndexProvider> prov,
                           completion::CompletionRequest query) {
        try {
            const std::stop_token stop = entry->stop.get_token();
            std::vector<std::string> candidates;
            std::string partial = query.argumentValue;
            if (completion::SourceFor(query) == completion::CandidateSource::ProjectFiles) {
                auto files = co_await awaitProvider(prov->listFiles(FilesParams{}, stop), stop);
                if (!files.has_value()) co_return;
                if (auto* paths = std::get_if<std::vector<std::string>>(&*files)) {
                    candidates = std::move(*paths);
                } else {
                    LOG_DEBUG("Dispatcher: no file completions ({})", FaultKindName(std::get<ProviderFault>(*files).kind));
                }
            } else if (!query.argumentValue.empty()) {
                SymbolsParams byName;
                byName.name = query.argumentValue;
                byName.limit = SymbolsParams::MaxLimit;
                auto symbols = co_await awaitProvider(prov->listSymbols(byName, stop), stop);
                if (!symbols.has_value()) co_return;
                if (auto* found = std::get_if<std::vector<SymbolRecord>>(&*symbols)) {
                    for (const auto& s : *found) candidates.push_back(s.name);
                    partial.clear(); // the index already matched names, ignoring case
                } else {
                    LOG_DEBUG("Dispatcher: no symbol completions ({})", FaultKindName(std::get<ProviderFault>(*symbols).kind));
                }
            }
            finishResult(entry, completion::CompletionResult(completion::FilterCandidates(candidates, partial)));
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatcher: completion/complete failed: {}", e.what());
            finishError(entry, errors::internalError());
        }
    }

    ////////////////////////////////////////////// Exit //////////////////////////////////////////////
    int waitForExit() {
        ExitSignal signal;
        {
            std::unique_lock<std::mutex> lock(exitMutex);
            exitCv.wait(lock, [this]{ return exitSignal.has_value(); });
            signal = *exitSignal;
            if (exited) {
                LOG_WARN("Dispatcher: WaitForExit called twice");
            }
            exited = true;
        }
        lifecycle.BeginShutdown();

        int code = ExitCodes::Clean;
        if (signal.cause == ExitCause::TransportClosed) {
            LOG_INFO("Dispatcher: transport closed ({})", CloseReasonName(signal.reason));
            if (signal.reason == CloseReason::FramingError || signal.reason == CloseReason::IOError) {
                code = ExitCodes::TransportFailure;
            }
        }
        // Anything still pending lost its connection: stop it and discard whatever it produces.
        pending.CancelAll();
        {
            std::lock_guard<std::mutex> lock(sendMutex);
            acceptingResponses = false;
        }
        pool.join();
        lifecycle.MarkClosed();
        LOG_INFO("Dispatcher: session closed with exit code {}", code);
        return code;
    }
};

Dispatcher::Dispatcher(ITransport& transport, ProviderFactory providerFactory, DispatcherOptions options)
    : pImpl(std::make_unique<Impl>(transport, std::move(providerFactory), std::move(options))) {
    FUNC_SCOPE();
    transport.SetMessageHandler([this](const std::string& payload) { HandleMessage(payload); });
    transport.SetCloseHandler([this](CloseReason reason) { HandleTransportClosed(reason); });
    transport.SetErrorHandler([](const std::string& error) { LOG_WARN("Dispatcher: transport error: {}", error); });
}

Dispatcher::~Dispatcher() { FUNC_SCOPE(); }

void Dispatcher::HandleMessage(const std::string& payload) {
    try {
        pImpl->handleMessage(payload);
    } catch (const std::exception& e) {
        // Reader-thread failures must not take the session down.
        LOG_ERROR("Dispatcher: failed to handle message: {}", e.what());
    }
}

void Dispatcher::HandleTransportClosed(CloseReason reason) {
    FUNC_SCOPE();
    const std::size_t cancelled = pImpl->pending.CancelAll();
    if (cancelled > 0) {
        LOG_INFO("Dispatcher: connection closed with {} request(s) in flight; their results will be discarded", cancelled);
    }
    pImpl->signalExit(Impl::ExitSignal{Impl::ExitCause::TransportClosed, reason});
}

int Dispatcher::WaitForExit() { return pImpl->waitForExit(); }

LifecycleState Dispatcher::State() const { return pImpl->lifecycle.State(); }

std::size_t Dispatcher::PendingCount() const { return pImpl->pending.Size(); }

std::string Dispatcher::ProjectRoot() const { return pImpl->currentRoot(); }

bool Dispatcher::IsSubscribed(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->subscriptionMutex);
    return pImpl->subscribedUris.count(uri) > 0;
}

} // namespace codebridge
