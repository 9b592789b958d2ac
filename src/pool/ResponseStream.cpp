// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/ResponseStream.h>

#include <condition_variable>
#include <deque>
#include <mutex>

namespace corral::pool {

namespace detail {

class StreamChannel {
public:
    bool push(CompletionChunk chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (terminated_ || consumerGone_) {
                return false;
            }
            if (chunk.terminal()) {
                terminated_ = true;
                succeeded_ = chunk.kind == CompletionChunk::Kind::Complete;
            }
            ++sent_;
            chunks_.push_back(std::move(chunk));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<CompletionChunk> pop(std::chrono::milliseconds timeout, bool& timedOut) {
        std::unique_lock<std::mutex> lock(mutex_);
        timedOut = !cv_.wait_for(lock, timeout, [this] { return !chunks_.empty(); });
        if (timedOut) {
            return std::nullopt;
        }
        auto chunk = std::move(chunks_.front());
        chunks_.pop_front();
        return chunk;
    }

    void abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!terminated_) {
            consumerGone_ = true;
        }
        chunks_.clear();
    }

    bool terminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_;
    }
    bool succeeded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return succeeded_;
    }
    bool consumerGone() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consumerGone_;
    }
    std::size_t sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<CompletionChunk> chunks_;
    bool terminated_ = false;
    bool succeeded_ = false;
    bool consumerGone_ = false;
    std::size_t sent_ = 0;
};

} // namespace detail

// ============================================================================
// ResponseStream
// ============================================================================

ResponseStream::ResponseStream(std::shared_ptr<detail::StreamChannel> channel)
    : channel_(std::move(channel)) {}

ResponseStream::~ResponseStream() {
    abandon();
}

ResponseStream& ResponseStream::operator=(ResponseStream&& other) noexcept {
    if (this != &other) {
        abandon();
        channel_ = std::move(other.channel_);
        delivered_ = other.delivered_;
    }
    return *this;
}

void ResponseStream::abandon() noexcept {
    if (channel_ && !delivered_) {
        channel_->abandon();
    }
    channel_.reset();
}

std::optional<CompletionChunk> ResponseStream::next() {
    while (true) {
        auto chunk = nextFor(std::chrono::hours(1));
        if (chunk) {
            return std::move(chunk).value();
        }
        if (chunk.error().code != ErrorCode::Timeout) {
            return std::nullopt;
        }
    }
}

Result<CompletionChunk> ResponseStream::nextFor(std::chrono::milliseconds timeout) {
    if (!channel_) {
        return Error{ErrorCode::InvalidState, "response stream is not connected"};
    }
    if (delivered_) {
        return Error{ErrorCode::InvalidState, "response stream already finished"};
    }
    bool timedOut = false;
    auto chunk = channel_->pop(timeout, timedOut);
    if (!chunk) {
        return Error{ErrorCode::Timeout, "no chunk within timeout"};
    }
    if (chunk->terminal()) {
        delivered_ = true;
    }
    return std::move(*chunk);
}

Result<Completion> ResponseStream::collect(std::chrono::milliseconds timeout) {
    Completion out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return Error{ErrorCode::Timeout, "response stream did not finish in time"};
        }
        auto chunk = nextFor(remaining);
        if (!chunk) {
            return chunk.error();
        }
        auto& c = chunk.value();
        switch (c.kind) {
            case CompletionChunk::Kind::Text:
                out.text += c.text;
                ++out.chunks;
                break;
            case CompletionChunk::Kind::Complete:
                out.usage = c.usage;
                out.finishReason = c.finishReason;
                return out;
            case CompletionChunk::Kind::Error:
                return Error{c.errorCode, std::move(c.text)};
        }
    }
}

bool ResponseStream::finished() const {
    return delivered_;
}

// ============================================================================
// ChunkSink
// ============================================================================

ChunkSink::ChunkSink(std::shared_ptr<detail::StreamChannel> channel)
    : channel_(std::move(channel)) {}

bool ChunkSink::send(CompletionChunk chunk) {
    if (!channel_->push(std::move(chunk))) {
        return false;
    }
    if (progress_) {
        progress_();
    }
    return true;
}

bool ChunkSink::fail(ErrorCode code, std::string message) {
    return channel_->push(CompletionChunk::failure(code, std::move(message)));
}

bool ChunkSink::terminated() const {
    return channel_->terminated();
}

bool ChunkSink::succeeded() const {
    return channel_->succeeded();
}

bool ChunkSink::consumerGone() const {
    return channel_->consumerGone();
}

std::size_t ChunkSink::chunksSent() const {
    return channel_->sent();
}

std::pair<ChunkSink, ResponseStream> makeResponseChannel() {
    auto channel = std::make_shared<detail::StreamChannel>();
    return {ChunkSink(channel), ResponseStream(channel)};
}

} // namespace corral::pool
