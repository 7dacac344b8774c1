#include <pipecoro/error.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/iocoro.hpp>

#include <gtest/gtest.h>

#include "async_test_util.hpp"

#include <string>
#include <vector>

using namespace pipecoro;
using iocoro::awaitable;

TEST(stream_test, from_vector_yields_items_then_completes) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto s = from_vector(std::vector<int>{1, 2, 3});
    auto r = co_await collect(*s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (std::vector<int>{1, 2, 3}));

    // Completion is sticky.
    auto again = co_await s->next();
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again->has_value());
  });
}

TEST(stream_test, just_accepts_several_items) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto s = just(std::string{"a"}, "b", "c");
    auto r = co_await collect(*s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, (std::vector<std::string>{"a", "b", "c"}));
  });
}

TEST(stream_test, cancelled_vector_fails_with_operation_aborted) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto s = from_vector(std::vector<int>{1, 2});
    auto first = co_await s->next();
    ASSERT_TRUE(first.has_value());

    s->cancel();
    auto r = co_await s->next();
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(client_errc::operation_aborted));
  });
}

TEST(stream_test, cancel_after_completion_is_noop) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto s = just(1);
    (void)co_await collect(*s);
    s->cancel();

    auto r = co_await s->next();
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_value());
  });
}

TEST(stream_test, failed_stream_reports_its_error) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto s = failed<int>(error_info{client_errc::write_failed, "boom"});
    auto r = co_await collect(*s);
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(client_errc::write_failed));
    EXPECT_EQ(r.error().detail, "boom");
  });
}

TEST(stream_test, never_terminates_only_when_cancelled) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto ex = co_await iocoro::this_coro::executor;
    auto s = never<int>();
    auto* raw = s.get();
    auto out = test_util::consume(ex, std::move(s));

    co_await test_util::settle();
    EXPECT_FALSE(out->done);

    raw->cancel();
    EXPECT_TRUE(co_await test_util::wait_until([&] { return out->done; }));
    ASSERT_TRUE(out->error.has_value());
    EXPECT_TRUE(out->error->is(client_errc::operation_aborted));
  });
}

TEST(stream_test, channel_delivers_items_sent_later) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto ex = co_await iocoro::this_coro::executor;
    channel<int> ch;
    EXPECT_FALSE(ch.subscribed());

    auto out = test_util::consume(ex, ch.stream());
    EXPECT_TRUE(co_await test_util::wait_until([&] { return ch.subscribed(); }));

    EXPECT_TRUE(ch.send(1));
    EXPECT_TRUE(ch.send(2));
    EXPECT_TRUE(co_await test_util::wait_until([&] { return out->items.size() == 2; }));
    EXPECT_FALSE(out->done);

    ch.complete();
    EXPECT_TRUE(co_await test_util::wait_until([&] { return out->done; }));
    EXPECT_TRUE(out->ok());
    EXPECT_EQ(out->items, (std::vector<int>{1, 2}));

    EXPECT_FALSE(ch.send(3));
  });
}

TEST(stream_test, channel_failure_after_buffered_items) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    channel<int> ch;
    auto s = ch.stream();
    ch.send(1);
    ch.fail(error_info{client_errc::read_failed});

    auto first = co_await s->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(**first, 1);

    auto second = co_await s->next();
    ASSERT_FALSE(second.has_value());
    EXPECT_TRUE(second.error().is(client_errc::read_failed));
  });
}

TEST(stream_test, cancelled_channel_refuses_sends) {
  iocoro::io_context ctx;

  test_util::run_async(ctx, [&]() -> awaitable<void> {
    auto ex = co_await iocoro::this_coro::executor;
    channel<int> ch;
    auto s = ch.stream();
    auto* raw = s.get();
    auto out = test_util::consume(ex, std::move(s));
    co_await test_util::settle();

    raw->cancel();
    EXPECT_TRUE(co_await test_util::wait_until([&] { return out->done; }));
    EXPECT_TRUE(ch.cancelled());
    EXPECT_FALSE(ch.send(1));
    ASSERT_TRUE(out->error.has_value());
    EXPECT_TRUE(out->error->is(client_errc::operation_aborted));
  });
}
