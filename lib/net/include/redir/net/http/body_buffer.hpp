/*
Module Name:
- body_buffer.hpp

Abstract:
- One-shot drain of a streaming request body into a single BufferedBody.
- The whole body is collected before the first send so that every hop can replay it.
  Memory use is therefore proportional to the body size.
- Two-phase object: an accumulator plus a phase flag. collect() may run once;
  a second call is a contract violation and terminates.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <redir/net/http/body.hpp>

namespace redir::net
{

    class BodyBuffer
    {
    public:
        /// A null source stands for "no body" and collects to an empty buffer.
        explicit BodyBuffer(std::unique_ptr<BodySource> source) noexcept;

        BodyBuffer(BodyBuffer&&) noexcept = default;
        BodyBuffer& operator=(BodyBuffer&&) noexcept = default;
        BodyBuffer(const BodyBuffer&) = delete;
        BodyBuffer& operator=(const BodyBuffer&) = delete;

        /// Drain the source to completion. Suspends whenever the source does.
        /// Throws RedirectError(errc::body_read_failed) if a chunk fails.
        [[nodiscard]] boost::asio::awaitable<BufferedBody> collect();

        [[nodiscard]] bool done() const noexcept
        {
            return phase_ == Phase::complete;
        }

    private:
        enum class Phase
        {
            idle,
            draining,
            complete
        };

        std::unique_ptr<BodySource> source_;
        std::string accumulated_;
        Phase phase_{ Phase::idle };
    };

} // namespace redir::net
