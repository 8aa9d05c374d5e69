#include <redir/net/http/body_buffer.hpp>
#include <redir/net/http/error.hpp>

#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "test_support.hpp"

using namespace redir::net;
using redir::test::ChunkedSource;
using redir::test::run;

namespace {

boost::asio::awaitable<BufferedBody> collect(BodyBuffer& buffer) {
  co_return co_await buffer.collect();
}

}  // namespace

TEST(BodyBufferTests, ConcatenatesChunksInOrder) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<ChunkedSource>(std::vector<std::string>{"hello", " ", "world"})};
  EXPECT_FALSE(buffer.done());

  BufferedBody body = run(ctx, collect(buffer));
  EXPECT_EQ(body.view(), "hello world");
  EXPECT_EQ(body.size(), 11u);
  EXPECT_TRUE(buffer.done());
}

TEST(BodyBufferTests, EmptyStreamYieldsEmptyBody) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<ChunkedSource>(std::vector<std::string>{})};
  BufferedBody body = run(ctx, collect(buffer));
  EXPECT_TRUE(body.empty());
  EXPECT_TRUE(buffer.done());
}

TEST(BodyBufferTests, NullSourceYieldsEmptyBody) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{nullptr};
  EXPECT_TRUE(run(ctx, collect(buffer)).empty());
  EXPECT_TRUE(buffer.done());
}

TEST(BodyBufferTests, StringSourceIsOneChunk) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<StringBodySource>("payload")};
  EXPECT_EQ(run(ctx, collect(buffer)).view(), "payload");
}

TEST(BodyBufferTests, BinaryBytesSurviveUnchanged) {
  boost::asio::io_context ctx;
  const std::string bytes{"\0\x01\xFF\r\n", 5};
  BodyBuffer buffer{std::make_unique<ChunkedSource>(std::vector<std::string>{bytes, bytes})};
  EXPECT_EQ(run(ctx, collect(buffer)).view(), bytes + bytes);
}

TEST(BodyBufferTests, ChunkErrorSurfacesAsBodyReadFailure) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<ChunkedSource>(std::vector<std::string>{"a", "b", "c"}, 2)};
  try {
    (void)run(ctx, collect(buffer));
    FAIL() << "expected RedirectError";
  } catch (const RedirectError& e) {
    EXPECT_EQ(e.code(), make_error_code(errc::body_read_failed));
    EXPECT_NE(std::string{e.what()}.find("connection reset"), std::string::npos);
  }
  EXPECT_FALSE(buffer.done());
}

namespace {

class ThrowingSource final : public BodySource {
 public:
  explicit ThrowingSource(boost::system::error_code ec) : ec_{ec} {}

  boost::asio::awaitable<std::optional<std::string>> next_chunk() override {
    co_await redir::test::yield();
    throw boost::system::system_error{ec_};
  }

 private:
  boost::system::error_code ec_;
};

}  // namespace

TEST(BodyBufferTests, CancellationPassesThroughUnchanged) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<ThrowingSource>(boost::asio::error::operation_aborted)};
  try {
    (void)run(ctx, collect(buffer));
    FAIL() << "expected system_error";
  } catch (const RedirectError&) {
    FAIL() << "cancellation was rewrapped as a read failure";
  } catch (const boost::system::system_error& e) {
    EXPECT_EQ(e.code(), boost::asio::error::operation_aborted);
  }
  EXPECT_FALSE(buffer.done());
}

TEST(BodyBufferTests, SocketErrorIsAReadFailure) {
  boost::asio::io_context ctx;
  BodyBuffer buffer{std::make_unique<ThrowingSource>(boost::asio::error::connection_reset)};
  try {
    (void)run(ctx, collect(buffer));
    FAIL() << "expected RedirectError";
  } catch (const RedirectError& e) {
    EXPECT_EQ(e.code(), make_error_code(errc::body_read_failed));
  }
}

TEST(BodyBufferTests, CopiesShareStorage) {
  BufferedBody a{"bytes"};
  BufferedBody b = a;
  EXPECT_TRUE(a.shares_storage_with(b));
  EXPECT_EQ(b.view(), "bytes");
  EXPECT_FALSE(a.shares_storage_with(BufferedBody{"bytes"}));
}

TEST(BodyBufferDeathTest, SecondCollectIsAContractViolation) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH(
      {
        boost::asio::io_context ctx;
        BodyBuffer buffer{std::make_unique<StringBodySource>("once")};
        (void)run(ctx, collect(buffer));
        (void)run(ctx, collect(buffer));
      },
      "");
}
