// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace corral::pool {

// ============================================================================
// Chunks
// ============================================================================

struct TokenUsage {
    std::uint32_t inputTokens = 0;
    std::uint32_t outputTokens = 0;
};

enum class FinishReason : std::uint8_t { Stop = 0, Length = 1, Cancelled = 2 };

struct CompletionChunk {
    enum class Kind : std::uint8_t { Text, Complete, Error };

    Kind kind = Kind::Text;
    std::string text;                         ///< Token text, or error message for Error
    TokenUsage usage{};                       ///< Complete only
    FinishReason finishReason = FinishReason::Stop;
    ErrorCode errorCode = ErrorCode::Success; ///< Error only

    static CompletionChunk token(std::string text) {
        CompletionChunk c;
        c.text = std::move(text);
        return c;
    }
    static CompletionChunk complete(TokenUsage usage, FinishReason reason = FinishReason::Stop) {
        CompletionChunk c;
        c.kind = Kind::Complete;
        c.usage = usage;
        c.finishReason = reason;
        return c;
    }
    static CompletionChunk failure(ErrorCode code, std::string message) {
        CompletionChunk c;
        c.kind = Kind::Error;
        c.errorCode = code;
        c.text = std::move(message);
        return c;
    }

    bool terminal() const noexcept { return kind != Kind::Text; }
};

/// Aggregate of a fully consumed stream
struct Completion {
    std::string text;
    TokenUsage usage{};
    FinishReason finishReason = FinishReason::Stop;
    std::size_t chunks = 0;
};

namespace detail {
class StreamChannel;
}

// ============================================================================
// Consumer side
// ============================================================================

/// Ordered chunks of one request, ending with exactly one Complete or Error
/// chunk. Destroying the stream before the terminal chunk abandons it; the
/// producer sees its next send fail.
class ResponseStream {
public:
    ResponseStream() = default;
    explicit ResponseStream(std::shared_ptr<detail::StreamChannel> channel);
    ~ResponseStream();

    ResponseStream(ResponseStream&& other) noexcept = default;
    ResponseStream& operator=(ResponseStream&& other) noexcept;
    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    /// Blocks for the next chunk; nullopt once the terminal chunk was delivered.
    std::optional<CompletionChunk> next();

    /// Bounded wait. Timeout error if nothing arrives in time, InvalidState
    /// after the terminal chunk was delivered.
    Result<CompletionChunk> nextFor(std::chrono::milliseconds timeout);

    /// Drains the stream. An Error chunk becomes the returned error.
    Result<Completion> collect(std::chrono::milliseconds timeout = std::chrono::seconds(30));

    [[nodiscard]] bool finished() const;
    [[nodiscard]] bool valid() const noexcept { return channel_ != nullptr; }

private:
    void abandon() noexcept;

    std::shared_ptr<detail::StreamChannel> channel_;
    bool delivered_ = false;
};

// ============================================================================
// Producer side
// ============================================================================

class ChunkSink {
public:
    explicit ChunkSink(std::shared_ptr<detail::StreamChannel> channel);

    /// False when the consumer is gone or a terminal chunk was already sent.
    bool send(CompletionChunk chunk);

    /// Terminates the stream with an Error chunk unless already terminated.
    bool fail(ErrorCode code, std::string message);

    [[nodiscard]] bool terminated() const;
    [[nodiscard]] bool succeeded() const;
    [[nodiscard]] bool consumerGone() const;
    [[nodiscard]] std::size_t chunksSent() const;

    /// Invoked after every accepted chunk.
    void onProgress(std::function<void()> hook) { progress_ = std::move(hook); }

private:
    std::shared_ptr<detail::StreamChannel> channel_;
    std::function<void()> progress_;
};

/// A connected producer/consumer pair.
std::pair<ChunkSink, ResponseStream> makeResponseChannel();

} // namespace corral::pool
