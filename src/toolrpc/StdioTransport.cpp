//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#ifdef __linux__
#  include <sys/epoll.h>
#  include <sys/eventfd.h>
#else
#  include <poll.h>
#endif

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <list>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolrpc/Config.h"
#include "toolrpc/JSONRPCTypes.h"
#include "toolrpc/JsonRpcMessageRouter.h"
#include "toolrpc/StdioTransport.hpp"

namespace toolrpc {

namespace {
constexpr int kWaitTimeoutMs = 100;
constexpr auto kWriterJoinTimeout = std::chrono::milliseconds(2000);

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}
} // namespace

class StdioTransport::Impl {
public:
    StdioTransportOptions options;
    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> writerStop{false}; // set once no further responses can be produced
    std::atomic<bool> readerExited{false};
    std::atomic<bool> writerExited{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread writerThread;

    // One thread per dispatched request; joined before the router and handlers go away.
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workersMutex;
    std::list<Worker> workers;

    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};

    std::unique_ptr<IContentFramer> framer;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    LineFramer lineFramer;
    std::string partial; // bytes after the last '\n'

#ifdef __linux__
    int wakeEventFd{-1};
#else
    int wakePipe[2]{-1, -1};
#endif

    explicit Impl(StdioTransportOptions opts)
        : options(std::move(opts)),
          framer(MakeFramer(options.framing)),
          router(MakeDefaultJsonRpcMessageRouter(options.maxMessageBytes)),
          lineFramer(LineFramer::Options{options.maxMessageBytes, options.frameTimeout}) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

#ifdef __linux__
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
#else
        if (::pipe(wakePipe) != 0) {
            LOG_ERROR("StdioTransport: failed to create self-pipe (errno={} msg={})", errno, ::strerror(errno));
        } else {
            setNonBlocking(wakePipe[0]);
            setNonBlocking(wakePipe[1]);
        }
#endif
    }

    ~Impl() {
        connected = false;
        stopping = true;
        wake();
        joinWorkers();
        writerStop = true;
        cvWrite.notify_all();
        if (readerThread.joinable()) {
            if (readerExited.load()) {
                readerThread.join();
            } else {
                readerThread.detach();
            }
        }
        if (writerThread.joinable()) {
            if (writerExited.load()) {
                writerThread.join();
            } else {
                writerThread.detach();
            }
        }
#ifdef __linux__
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
#else
        if (wakePipe[0] >= 0) { ::close(wakePipe[0]); wakePipe[0] = -1; }
        if (wakePipe[1] >= 0) { ::close(wakePipe[1]); wakePipe[1] = -1; }
#endif
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
#ifdef __linux__
        if (wakeEventFd >= 0) {
            uint64_t one = 1;
            ssize_t wr;
            do {
                wr = ::write(wakeEventFd, &one, sizeof(one));
            } while (wr < 0 && errno == EINTR);
            if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
#else
        if (wakePipe[1] >= 0) {
            char b = 'x';
            ssize_t wr;
            do {
                wr = ::write(wakePipe[1], &b, 1);
            } while (wr < 0 && errno == EINTR);
            if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("StdioTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
#endif
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = framer->encode(payload);
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (stopping.load() && writerExited.load()) {
                LOG_DEBUG("StdioTransport: dropping frame after close ({} bytes)", frame.size());
                return false;
            }
            if (queuedBytes + frame.size() > options.writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})",
                          queuedBytes, frame.size(), options.writeQueueMaxBytes);
                lk.unlock();
                reportError("StdioTransport: write queue overflow");
                connected = false;
                wake();
                cvWrite.notify_all();
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    // Joins request threads that have already finished.
    void reapWorkers() {
        std::list<Worker> finished;
        {
            std::lock_guard<std::mutex> lk(workersMutex);
            for (auto it = workers.begin(); it != workers.end();) {
                if (it->done->load()) {
                    finished.splice(finished.end(), workers, it++);
                } else {
                    ++it;
                }
            }
        }
        for (auto& w : finished) {
            w.thread.join();
        }
    }

    // Blocks until every dispatched request has produced its response.
    void joinWorkers() {
        for (;;) {
            std::list<Worker> pending;
            {
                std::lock_guard<std::mutex> lk(workersMutex);
                pending.swap(workers);
            }
            if (pending.empty()) {
                return;
            }
            for (auto& w : pending) {
                if (w.thread.get_id() == std::this_thread::get_id()) {
                    w.thread.detach();
                } else {
                    w.thread.join();
                }
            }
        }
    }

    ////////////////////////////////////////// Inbound //////////////////////////////////////////
    void processBody(const std::string& body) {
        LOG_DEBUG("Received message ({} bytes)", body.size());
        auto msg = router->parse(body);
        switch (msg.kind) {
            case IJsonRpcMessageRouter::MessageKind::Request: {
                reapWorkers();
                auto done = std::make_shared<std::atomic<bool>>(false);
                std::thread worker([this, done, req = std::move(msg.request)]() {
                    const std::string payload = router->handleRequest(*req, requestHandler);
                    (void)enqueueFrame(payload);
                    done->store(true);
                });
                std::lock_guard<std::mutex> lk(workersMutex);
                workers.push_back(Worker{std::move(worker), std::move(done)});
                break;
            }
            case IJsonRpcMessageRouter::MessageKind::Notification:
                if (notificationHandler) {
                    try {
                        notificationHandler(std::move(msg.notification));
                    } catch (const std::exception& e) {
                        LOG_ERROR("StdioTransport: notification handler exception: {}", e.what());
                    }
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Response:
                LOG_DEBUG("StdioTransport: ignoring response without a pending request");
                break;
            case IJsonRpcMessageRouter::MessageKind::Invalid:
                LOG_WARN("StdioTransport: invalid JSON-RPC message{}", msg.errorReply ? "" : " without id; dropped");
                if (msg.errorReply) {
                    (void)enqueueFrame(*msg.errorReply);
                }
                break;
            case IJsonRpcMessageRouter::MessageKind::Unparsable:
            default:
                LOG_DEBUG("StdioTransport: dropping unparsable message ({} bytes)", body.size());
                break;
        }
    }

    void feedLine(const std::string& line, LineFramer::Clock::time_point now) {
        for (const auto& body : lineFramer.Feed(line, now)) {
            processBody(body);
        }
    }

    // Splits appended bytes into lines. A Content-Length body without a trailing newline is completed
    // as soon as enough bytes are buffered.
    void consume(const char* data, std::size_t n) {
        partial.append(data, n);
        const auto now = LineFramer::Clock::now();
        std::size_t start = 0;
        for (;;) {
            const std::size_t eol = partial.find('\n', start);
            if (eol == std::string::npos) break;
            feedLine(partial.substr(start, eol - start), now);
            start = eol + 1;
        }
        partial.erase(0, start);

        const std::size_t remaining = lineFramer.RemainingBytes();
        if (remaining > 0 && partial.size() >= remaining) {
            const std::string chunk = partial.substr(0, remaining);
            partial.erase(0, remaining);
            feedLine(chunk, now);
        }
        if (!lineFramer.IsPending() && partial.size() > options.maxMessageBytes) {
            LOG_WARN("StdioTransport: unterminated input of {} bytes exceeds maximum message size; discarded", partial.size());
            partial.clear();
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            const int fd = options.inputFd;
            setNonBlocking(fd);
            auto lastReadTs = std::chrono::steady_clock::now();
            std::vector<char> tmp(65536);
#ifdef __linux__
            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: epoll_create1 failed");
                connected = false;
                readerExited.store(true);
                return;
            }
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP | EPOLLERR; evIn.data.fd = fd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0) {
                LOG_WARN("StdioTransport: epoll_ctl on input failed (errno={} msg={})", errno, ::strerror(errno));
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }
#endif
            while (connected) {
                bool readable = false;
                bool hangup = false;
#ifdef __linux__
                std::array<epoll_event, 2> events{};
                int rc = ::epoll_wait(ep, events.data(), static_cast<int>(events.size()), kWaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: epoll_wait failed");
                    break;
                }
                for (int i = 0; i < rc; ++i) {
                    const auto& ev = events[static_cast<std::size_t>(i)];
                    if (ev.data.fd == fd) {
                        if (ev.events & EPOLLIN) readable = true;
                        if (ev.events & (EPOLLERR | EPOLLHUP | EPOLLRDHUP)) hangup = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do { r = ::read(ev.data.fd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                    }
                }
#else
                struct pollfd pfds[2];
                pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                int nfds = 1;
                if (wakePipe[0] >= 0) { pfds[1].fd = wakePipe[0]; pfds[1].events = POLLIN; pfds[1].revents = 0; nfds = 2; }
                int rc = ::poll(pfds, nfds, kWaitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: poll failed");
                    break;
                }
                if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                    std::array<char, 64> b{};
                    while (::read(wakePipe[0], b.data(), b.size()) > 0) {}
                }
                if (pfds[0].revents & POLLIN) readable = true;
                if (pfds[0].revents & (POLLERR | POLLHUP)) hangup = true;
#endif
                if (!connected) break;

                bool eof = false;
                if (readable || hangup) {
                    // Drain what is available; a hangup still leaves buffered bytes to read.
                    for (;;) {
                        ssize_t n = ::read(fd, tmp.data(), tmp.size());
                        if (n > 0) {
                            lastReadTs = std::chrono::steady_clock::now();
                            consume(tmp.data(), static_cast<std::size_t>(n));
                            continue;
                        }
                        if (n == 0) {
                            eof = true;
                        } else if (errno == EINTR) {
                            continue;
                        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                            LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                            reportError("StdioTransport: read error");
                            eof = true;
                        }
                        break;
                    }
                }
                if (eof) {
                    LOG_INFO("StdioTransport: EOF on input");
                    if (!partial.empty()) {
                        const std::string last = std::move(partial);
                        partial.clear();
                        feedLine(last, LineFramer::Clock::now());
                    }
                    reportError("StdioTransport: EOF on input");
                    break;
                }

                lineFramer.Expire(LineFramer::Clock::now());

                if (options.idleReadTimeout.count() > 0 &&
                    std::chrono::steady_clock::now() - lastReadTs >= options.idleReadTimeout) {
                    LOG_ERROR("StdioTransport: idle read timeout ({} ms)", static_cast<long long>(options.idleReadTimeout.count()));
                    reportError("StdioTransport: idle read timeout");
                    break;
                }
            }
#ifdef __linux__
            ::close(ep);
#endif
            connected = false;
            readerExited.store(true);
        });
    }

    ////////////////////////////////////////// Outbound //////////////////////////////////////////
    void startWriter() {
        writerThread = std::thread([this]() {
            const int fd = options.outputFd;
            setNonBlocking(fd);
            for (;;) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait_for(lk, std::chrono::milliseconds(50), [&] { return writerStop.load() || !writeQueue.empty(); });
                    if (writeQueue.empty()) {
                        if (writerStop.load()) break;
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }

                bool failed = false;
                std::size_t total = 0;
                const auto start = std::chrono::steady_clock::now();
                while (total < frame.size()) {
                    ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
                    if (w > 0) {
                        total += static_cast<std::size_t>(w);
                    } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                        if (options.writeTimeout.count() > 0 && (std::chrono::steady_clock::now() - start) >= options.writeTimeout) {
                            LOG_ERROR("StdioTransport: write timeout ({} ms)", static_cast<long long>(options.writeTimeout.count()));
                            reportError("StdioTransport: write timeout");
                            failed = true;
                            break;
                        }
                        std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    } else if (w < 0 && errno == EINTR) {
                        continue;
                    } else if (w == 0) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    } else {
                        LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                        reportError("StdioTransport: write error");
                        failed = true;
                        break;
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                    if (failed) {
                        writeQueue.clear();
                        queuedBytes = 0;
                    }
                }
                if (failed) {
                    connected = false;
                    wake();
                    break;
                }
            }
            writerExited.store(true);
        });
    }

    void joinWithDeadline(std::thread& t, const std::atomic<bool>& exited, std::chrono::milliseconds timeout, const char* name) {
        if (!t.joinable()) return;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!exited.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (exited.load()) {
            t.join();
        } else {
            LOG_WARN("StdioTransport: {} thread appears blocked; detaching to avoid hang", name);
            t.detach();
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(StdioTransportOptions{}) {}

StdioTransport::StdioTransport(StdioTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport ({} framing)", pImpl->framer->mode() == FramingMode::ContentLength ? "content-length" : "newline");
    pImpl->connected = true;
    pImpl->stopping = false;
    pImpl->writerStop = false;
    pImpl->startReader();
    pImpl->startWriter();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->stopping.exchange(true)) {
        std::promise<void> promise; promise.set_value(); return promise.get_future();
    }
    LOG_INFO("Closing StdioTransport");
    pImpl->connected = false;
    pImpl->wake();
    pImpl->joinWithDeadline(pImpl->readerThread, pImpl->readerExited, std::chrono::milliseconds(500), "reader");

    // Requests already dispatched still enqueue their responses before the writer drains.
    std::size_t running = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->workersMutex);
        for (const auto& w : pImpl->workers) {
            if (!w.done->load()) ++running;
        }
    }
    if (running > 0) {
        LOG_INFO("StdioTransport: waiting for {} running requests", running);
    }
    pImpl->joinWorkers();

    pImpl->writerStop = true;
    pImpl->cvWrite.notify_all();
    pImpl->joinWithDeadline(pImpl->writerThread, pImpl->writerExited, kWriterJoinTimeout, "writer");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const { return pImpl->connected; }
std::string StdioTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<void> StdioTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!notification || pImpl->stopping.load()) {
        LOG_DEBUG("StdioTransport: SendNotification called while closed; ignoring");
        std::promise<void> ready; ready.set_value(); return ready.get_future();
    }
    (void)pImpl->enqueueFrame(notification->Serialize());
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void StdioTransport::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) {
    pImpl->options.idleReadTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->options.writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    pImpl->options.writeTimeout = std::chrono::milliseconds(timeoutMs);
}

const StdioTransportOptions& StdioTransport::Options() const { return pImpl->options; }

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    StdioTransportOptions opts;
    for (const auto& [key, val] : ParseConfigString(config)) {
        std::uint64_t v = 0;
        if (key == "content_length") {
            bool on = false;
            if (ParseBool(val, on)) {
                opts.framing = on ? FramingMode::ContentLength : FramingMode::Newline;
                continue;
            }
        } else if (ParseUnsigned(val, v)) {
            if (key == "max_message_bytes" && v > 0) { opts.maxMessageBytes = static_cast<std::size_t>(v); continue; }
            if (key == "frame_timeout_ms" && v > 0) { opts.frameTimeout = std::chrono::milliseconds(v); continue; }
            if (key == "idle_read_timeout_ms") { opts.idleReadTimeout = std::chrono::milliseconds(v); continue; }
            if (key == "write_timeout_ms") { opts.writeTimeout = std::chrono::milliseconds(v); continue; }
            if (key == "write_queue_max_bytes" && v > 0) { opts.writeQueueMaxBytes = static_cast<std::size_t>(v); continue; }
        }
        LOG_WARN("StdioTransportFactory: ignoring config entry {}={}", key, val);
    }
    return std::make_unique<StdioTransport>(std::move(opts));
}

////////////////////////////////////////// Test hooks //////////////////////////////////////////
void StdioTransportTestHooks::feedBytes(StdioTransport& t, const std::string& bytes) {
    t.pImpl->consume(bytes.data(), bytes.size());
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) { t.pImpl->connected = v; }

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) { return t.pImpl->connected.load(); }

LineFramer::Stats StdioTransportTestHooks::framerStats(const StdioTransport& t) { return t.pImpl->lineFramer.GetStats(); }

std::size_t StdioTransportTestHooks::queuedBytes(const StdioTransport& t) {
    std::lock_guard<std::mutex> lk(t.pImpl->writeMutex);
    return t.pImpl->queuedBytes;
}

FramingMode StdioTransportTestHooks::outboundMode(const StdioTransport& t) { return t.pImpl->framer->mode(); }

} // namespace toolrpc
