// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcprt
{

namespace
{

    auto transportDisconnectedError(std::string_view reason) -> Error
    {
        auto error = Error {
            .code = ErrorCode::CancelledError,
            .message = "cancelled: transport disconnected",
        };
        error.data = nlohmann::json { { "reason", std::string(reason) } };
        return error;
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Splits complete lines off the front of @p buffer.
    template <typename Handler>
    void consumeLines(std::string& buffer, Handler&& handler)
    {
        auto pos = std::size_t { 0 };
        while (true)
        {
            auto const newlinePos = buffer.find('\n', pos);
            if (newlinePos == std::string::npos)
                break;

            auto line = std::string_view(buffer).substr(pos, newlinePos - pos);
            pos = newlinePos + 1;

            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
                line.remove_suffix(1);
            while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
                line.remove_prefix(1);

            if (!line.empty())
                handler(line);
        }
        buffer.erase(0, pos);
    }

    /// @brief Waits until @p fd is readable or the wakeup pipe fires.
    /// @return 1 if @p fd is readable, 0 on wakeup, -1 on poll failure.
    auto waitReadable(int fd, int wakeupFd) -> int
    {
        while (true)
        {
            auto fds = std::array<pollfd, 2> { {
                { .fd = fd, .events = POLLIN, .revents = 0 },
                { .fd = wakeupFd, .events = POLLIN, .revents = 0 },
            } };

            auto const ret = ::poll(fds.data(), fds.size(), -1);
            if (ret < 0)
            {
                if (errno == EINTR)
                    continue;
                return -1;
            }

            if (fds[1].revents & POLLIN)
                return 0;
            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR))
                return 1;
        }
    }

    /// @brief How long a child gets to exit after SIGTERM before it is killed.
    constexpr auto SigtermGracePeriod = std::chrono::milliseconds(1000);

    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

} // namespace

struct StdioTransport::Impl
{
    using PendingSlot = std::promise<Result<jsonrpc::Response>>;

    StdioTransportConfig config;

    std::mutex lifecycleMutex;
    std::atomic<TransportState> state { TransportState::Disconnected };
    EventChannel<TransportEvent> events { 256 };

    std::atomic<int> childPid { -1 };
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::array<int, 2> wakeupPipe { -1, -1 };

    mutable std::mutex pendingMutex;
    std::unordered_map<std::string, PendingSlot> pending;

    std::mutex writeMutex;
    std::condition_variable_any writeCv;
    std::deque<std::string> writeQueue;

    std::jthread writer;
    std::jthread reader;
    std::jthread stderrReader;

    std::atomic<uint64_t> requestCounter { 1 };

    void publish(TransportEvent::Kind kind, std::string reason = {}, std::optional<jsonrpc::Message> message = {})
    {
        events.publish(TransportEvent { .kind = kind, .reason = std::move(reason), .message = std::move(message) });
    }

    /// @brief Fulfils the pending slot for @p key, if it is still pending.
    auto resolvePending(const std::string& key, Result<jsonrpc::Response> outcome) -> bool
    {
        auto slot = PendingSlot {};
        {
            auto lock = std::lock_guard(pendingMutex);
            auto const it = pending.find(key);
            if (it == pending.end())
                return false;
            slot = std::move(it->second);
            pending.erase(it);
        }
        slot.set_value(std::move(outcome));
        return true;
    }

    void failAllPending(std::string_view reason)
    {
        auto slots = std::unordered_map<std::string, PendingSlot> {};
        {
            auto lock = std::lock_guard(pendingMutex);
            slots.swap(pending);
        }

        if (!slots.empty())
            log::debug("{}: resolving {} pending request(s): {}", config.command, slots.size(), reason);

        for (auto& [key, slot]: slots)
            slot.set_value(std::unexpected(transportDisconnectedError(reason)));
    }

    /// @brief Moves from Connected to @p next. Does nothing while disconnect() is in progress.
    auto leaveConnected(TransportState next) -> bool
    {
        auto expected = TransportState::Connected;
        return state.compare_exchange_strong(expected, next);
    }

    void wakeUp() const
    {
        if (wakeupPipe[1] >= 0)
        {
            auto const byte = char { 1 };
            [[maybe_unused]] auto const n = ::write(wakeupPipe[1], &byte, 1);
        }
    }

    void handleLine(std::string_view line)
    {
        auto message = jsonrpc::parseMessage(line);
        if (!message)
        {
            log::trace("{}: dropping unparseable line: {}", config.command, message.error().message);
            return;
        }

        if (auto* response = std::get_if<jsonrpc::Response>(&*message))
        {
            auto const key = jsonrpc::idKey(response->id);
            if (!key || !resolvePending(*key, std::move(*response)))
                log::debug("{}: response for unknown request id {}", config.command, response->id.dump());
            return;
        }

        publish(TransportEvent::Kind::MessageReceived, {}, std::move(*message));
    }

    void readLoop(const std::stop_token& stopToken)
    {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};

        while (!stopToken.stop_requested())
        {
            auto const ready = waitReadable(stdoutRead, wakeupPipe[0]);
            if (ready == 0)
                return;
            if (ready < 0)
            {
                handleIoError(std::format("poll failed: {}", std::strerror(errno)));
                return;
            }

            auto const bytesRead = ::read(stdoutRead, chunk.data(), chunk.size());
            if (bytesRead < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                handleIoError(std::format("Failed to read from process stdout: {}", std::strerror(errno)));
                return;
            }

            if (bytesRead == 0)
            {
                if (leaveConnected(TransportState::Disconnected))
                {
                    log::info("MCP server process exited: {}", config.command);
                    failAllPending("Process exited");
                    publish(TransportEvent::Kind::Disconnected, "Process exited");
                }
                writeCv.notify_all();
                return;
            }

            buffer.append(chunk.data(), static_cast<std::size_t>(bytesRead));
            consumeLines(buffer, [this](std::string_view line) { handleLine(line); });
        }
    }

    void writeLoop(const std::stop_token& stopToken)
    {
        writeMessages(stopToken);

        // The writer owns stdin. Closing it on the way out tells the child that no more input is coming.
        closeFd(stdinWrite);
    }

    void writeMessages(const std::stop_token& stopToken)
    {
        while (true)
        {
            auto data = std::string {};
            {
                auto lock = std::unique_lock(writeMutex);
                writeCv.wait(lock, stopToken, [this] {
                    return !writeQueue.empty() || state.load() != TransportState::Connected;
                });

                if (stopToken.stop_requested() || state.load() != TransportState::Connected)
                    return;

                data = std::move(writeQueue.front());
                writeQueue.pop_front();
            }

            // One write per message; the pipe is unbuffered, so each line reaches the child immediately.
            auto const* cursor = data.data();
            auto remaining = data.size();
            while (remaining > 0)
            {
                auto const written = ::write(stdinWrite, cursor, remaining);
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    handleIoError(std::format("Failed to write to process stdin: {}", std::strerror(errno)));
                    return;
                }
                cursor += written;
                remaining -= static_cast<std::size_t>(written);
            }
        }
    }

    void stderrLoop(const std::stop_token& stopToken)
    {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};

        while (!stopToken.stop_requested())
        {
            if (waitReadable(stderrRead, wakeupPipe[0]) <= 0)
                return;

            auto const bytesRead = ::read(stderrRead, chunk.data(), chunk.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                return;

            buffer.append(chunk.data(), static_cast<std::size_t>(bytesRead));
            consumeLines(buffer, [this](std::string_view line) { log::debug("[{}] {}", config.command, line); });
        }
    }

    void handleIoError(std::string message)
    {
        if (!leaveConnected(TransportState::Error))
            return;

        log::error("{}: {}", config.command, message);
        failAllPending(message);
        publish(TransportEvent::Kind::Error, std::move(message));
        writeCv.notify_all();
    }

    /// @brief Reaps @p pid if it exits within @p timeout.
    static auto waitForExit(int pid, std::chrono::milliseconds timeout) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        auto status = 0;
        while (true)
        {
            auto const result = ::waitpid(pid, &status, WNOHANG);
            if (result == pid || (result < 0 && errno != EINTR))
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    /// @brief Ends the child: end of input first, then SIGTERM, then SIGKILL.
    ///
    /// Must be called after the writer was asked to stop, as the writer closes stdin on exit.
    void terminateChild(std::chrono::milliseconds gracePeriod)
    {
        auto const pid = childPid.exchange(-1);
        if (pid <= 0)
            return;

        if (waitForExit(pid, gracePeriod))
            return;

        log::debug("{} still running after end of input, sending SIGTERM", config.command);
        ::kill(pid, SIGTERM);
        if (waitForExit(pid, std::min(gracePeriod, SigtermGracePeriod)))
            return;

        if (gracePeriod > std::chrono::milliseconds::zero())
            log::warning("{} did not exit after SIGTERM, killing it", config.command);
        ::kill(pid, SIGKILL);
        auto status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
    }

    /// @brief Stops both loops, ends the child and resolves every pending request.
    void shutdown(std::chrono::milliseconds gracePeriod)
    {
        auto lock = std::lock_guard(lifecycleMutex);

        auto const previous = state.exchange(TransportState::Closing);
        auto const hadProcess = childPid.load() > 0;
        if (!hadProcess && !reader.joinable() && !writer.joinable())
        {
            state = previous == TransportState::Error ? TransportState::Error : TransportState::Disconnected;
            return;
        }

        failAllPending("disconnect");

        for (auto* thread: { &reader, &writer, &stderrReader })
            thread->request_stop();
        wakeUp();
        writeCv.notify_all();

        terminateChild(gracePeriod);

        for (auto* thread: { &reader, &writer, &stderrReader })
        {
            if (thread->joinable())
                thread->join();
        }

        closeAll();
        {
            auto writeLock = std::lock_guard(writeMutex);
            writeQueue.clear();
        }

        // Requests that raced with the state change above.
        failAllPending("disconnect");

        state = TransportState::Disconnected;
        if (previous == TransportState::Connected)
            publish(TransportEvent::Kind::Disconnected, "Transport disconnected");

        log::debug("MCP transport closed: {}", config.command);
    }

    void closeAll()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
        closeFd(wakeupPipe[0]);
        closeFd(wakeupPipe[1]);
    }
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    disconnect();
}

auto StdioTransport::type() const -> TransportType
{
    return TransportType::Stdio;
}

auto StdioTransport::connect() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->state.load() == TransportState::Connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (_impl->childPid.load() > 0)
        return makeError(ErrorCode::TransportError, "Transport must be disconnected before reconnecting");

    auto const& config = _impl->config;
    if (config.command.empty())
        return makeError(ErrorCode::ConfigError, "Stdio transport requires a command");

    ignoreSigpipe();
    _impl->state = TransportState::Connecting;
    _impl->publish(TransportEvent::Kind::Connecting);

    auto fail = [this](std::string message) -> VoidResult {
        _impl->closeAll();
        _impl->state = TransportState::Error;
        _impl->publish(TransportEvent::Kind::Error, message);
        return makeError(ErrorCode::ConnectionError, std::move(message));
    };

    // All pipe ends are close-on-exec; dup2 in the child clears the flag on the standard descriptors.
    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return fail(std::format("Failed to capture stdin of child process: {}", std::strerror(errno)));
    _impl->stdinWrite = stdinPipe[1];

    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        return fail(std::format("Failed to capture stdout of child process: {}", std::strerror(errno)));
    }
    _impl->stdoutRead = stdoutPipe[0];

    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);
        return fail(std::format("Failed to capture stderr of child process: {}", std::strerror(errno)));
    }
    _impl->stderrRead = stderrPipe[0];

    if (::pipe2(_impl->wakeupPipe.data(), O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);
        ::close(stderrPipe[1]);
        return fail(std::format("Failed to create wakeup pipe: {}", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.cwd.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.cwd.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const name = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(name)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
        return fail(std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));

    _impl->childPid = pid;
    {
        auto writeLock = std::lock_guard(_impl->writeMutex);
        _impl->writeQueue.clear();
    }
    _impl->state = TransportState::Connected;
    _impl->publish(TransportEvent::Kind::Connected);

    _impl->writer = std::jthread([this](const std::stop_token& token) { _impl->writeLoop(token); });
    _impl->reader = std::jthread([this](const std::stop_token& token) { _impl->readLoop(token); });
    _impl->stderrReader = std::jthread([this](const std::stop_token& token) { _impl->stderrLoop(token); });

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

void StdioTransport::disconnect()
{
    _impl->shutdown(_impl->config.shutdownTimeout);
}

void StdioTransport::terminate()
{
    _impl->shutdown(std::chrono::milliseconds::zero());
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (_impl->state.load() != TransportState::Connected)
        return makeError(ErrorCode::TransportError, "Transport is not connected");

    auto data = message.dump() + "\n";
    {
        auto lock = std::lock_guard(_impl->writeMutex);
        _impl->writeQueue.push_back(std::move(data));
    }
    _impl->writeCv.notify_one();
    return {};
}

auto StdioTransport::sendRequest(const jsonrpc::Request& request,
                                 std::chrono::milliseconds timeout,
                                 CancellationToken token) -> Result<jsonrpc::Response>
{
    if (_impl->state.load() != TransportState::Connected)
        return makeError(ErrorCode::TransportError, "Transport is not connected");

    auto const key = jsonrpc::idKey(request.id);
    if (!key)
        return makeError(ErrorCode::ValidationError, "Request id must be a string or a number");

    auto future = std::future<Result<jsonrpc::Response>> {};
    {
        auto lock = std::lock_guard(_impl->pendingMutex);
        if (_impl->pending.contains(*key))
            return makeError(ErrorCode::ValidationError, std::format("Request id {} is already in flight", *key));
        future = _impl->pending[*key].get_future();
    }

    auto const callbackId = token.onCancel([this, key = *key](CancellationReason reason) {
        auto error = Error {
            .code = ErrorCode::CancelledError,
            .message = std::format("Request cancelled: {}", describe(reason)),
        };
        error.data = nlohmann::json { { "reason", std::string(describe(reason)) } };
        _impl->resolvePending(key, std::unexpected(std::move(error)));
    });

    if (auto sent = send(jsonrpc::toJson(request)); !sent)
    {
        token.removeCallback(callbackId);
        _impl->resolvePending(*key, std::unexpected(sent.error()));
        return future.get();
    }

    auto const status = future.wait_for(timeout);
    token.removeCallback(callbackId);

    if (status == std::future_status::timeout)
    {
        auto error = Error {
            .code = ErrorCode::TimeoutError,
            .message = "Request timed out",
        };
        error.data = nlohmann::json { { "timeoutMs", timeout.count() }, { "method", request.method } };

        // First resolution wins: if the response landed in the meantime, it is returned below.
        _impl->resolvePending(*key, std::unexpected(std::move(error)));
    }

    return future.get();
}

auto StdioTransport::subscribe() -> EventChannel<TransportEvent>::Receiver
{
    return _impl->events.subscribe();
}

auto StdioTransport::state() const -> TransportState
{
    return _impl->state.load();
}

auto StdioTransport::processId() const -> std::optional<int>
{
    auto const pid = _impl->childPid.load();
    if (pid <= 0)
        return std::nullopt;
    return pid;
}

auto StdioTransport::nextRequestId() -> std::string
{
    return std::format("req-{}", _impl->requestCounter.fetch_add(1));
}

auto StdioTransport::pendingRequestCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->pendingMutex);
    return _impl->pending.size();
}

auto StdioTransport::config() const -> const StdioTransportConfig&
{
    return _impl->config;
}

} // namespace mcprt
