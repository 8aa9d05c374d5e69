// C++ Standard Library
#include <exception>
#include <optional>
#include <utility>

// Boost.Asio
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <redir/net/http/body_buffer.hpp>
#include <redir/net/http/error.hpp>

namespace redir::net
{

    BodyBuffer::BodyBuffer(std::unique_ptr<BodySource> source) noexcept :
        source_{ std::move(source) }
    {
    }

    boost::asio::awaitable<BufferedBody> BodyBuffer::collect()
    {
        Expects(phase_ == Phase::idle);
        phase_ = Phase::draining;

        if (source_)
        {
            for (;;)
            {
                std::optional<std::string> chunk;
                try
                {
                    chunk = co_await source_->next_chunk();
                }
                catch (const boost::system::system_error& e)
                {
                    // Cancellation is not a read failure.
                    if (e.code() == boost::asio::error::operation_aborted)
                    {
                        throw;
                    }
                    throw RedirectError(errc::body_read_failed, e.what());
                }
                catch (const std::exception& e)
                {
                    throw RedirectError(errc::body_read_failed, e.what());
                }

                if (!chunk)
                {
                    break;
                }
                accumulated_.append(*chunk);
            }
            source_.reset();
        }

        phase_ = Phase::complete;
        co_return BufferedBody{ std::exchange(accumulated_, std::string{}) };
    }

} // namespace redir::net
