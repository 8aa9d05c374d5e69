/*
Module Name:
- body.hpp

Abstract:
- Request body types used while following redirects.
- BodySource is the streaming side: a finite sequence of chunks, drained once.
- BufferedBody is the replay side: immutable bytes whose storage is shared by
  every copy, so resending the same body on each hop does not copy it.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

namespace redir::net
{

    class BufferedBody
    {
    public:
        BufferedBody() = default;
        explicit BufferedBody(std::string bytes) :
            bytes_{ std::make_shared<const std::string>(std::move(bytes)) }
        {
        }

        [[nodiscard]] std::string_view view() const noexcept
        {
            return bytes_ ? std::string_view{ *bytes_ } : std::string_view{};
        }
        [[nodiscard]] std::size_t size() const noexcept
        {
            return bytes_ ? bytes_->size() : 0;
        }
        [[nodiscard]] bool empty() const noexcept
        {
            return size() == 0;
        }

        // Whether two bodies share storage. Used to observe that hops do not copy.
        [[nodiscard]] bool shares_storage_with(const BufferedBody& other) const noexcept
        {
            return bytes_ == other.bytes_;
        }

    private:
        std::shared_ptr<const std::string> bytes_;
    };

    /// A request body that arrives in pieces.
    class BodySource
    {
    public:
        virtual ~BodySource() = default;

        /// Next chunk, or std::nullopt once the stream has ended.
        /// Read failures are thrown.
        virtual boost::asio::awaitable<std::optional<std::string>> next_chunk() = 0;
    };

    /// A body that is already in memory, yielded as one chunk.
    class StringBodySource final : public BodySource
    {
    public:
        explicit StringBodySource(std::string body) noexcept :
            body_{ std::move(body) }
        {
        }

        boost::asio::awaitable<std::optional<std::string>> next_chunk() override
        {
            if (consumed_ || body_.empty())
            {
                co_return std::nullopt;
            }
            consumed_ = true;
            co_return std::move(body_);
        }

    private:
        std::string body_;
        bool consumed_{ false };
    };

} // namespace redir::net
