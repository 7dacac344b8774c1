#include <pipecoro/config.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

using pipecoro::client_errc;
using pipecoro::error_info;

TEST(error_test, client_errc_maps_to_its_category) {
  std::error_code ec = client_errc::queue_full;

  EXPECT_EQ(&ec.category(), &pipecoro::client_category());
  EXPECT_STREQ(ec.category().name(), "pipecoro");
  EXPECT_EQ(ec.value(), static_cast<int>(client_errc::queue_full));
  EXPECT_EQ(ec, client_errc::queue_full);
  EXPECT_NE(ec, client_errc::connection_closed);
}

TEST(error_test, every_code_has_a_message) {
  for (auto e : {client_errc::operation_aborted, client_errc::queue_full,
                 client_errc::write_failed, client_errc::read_failed,
                 client_errc::connection_closed, client_errc::internal_error}) {
    auto msg = pipecoro::make_error_code(e).message();
    EXPECT_FALSE(msg.empty());
    EXPECT_EQ(msg.find("Unknown"), std::string::npos);
  }
}

TEST(error_test, default_error_info_is_empty) {
  error_info err{};
  EXPECT_FALSE(err.code);
  EXPECT_TRUE(err.detail.empty());
  EXPECT_EQ(err.to_string(), "unknown error");
}

TEST(error_test, to_string_includes_detail) {
  error_info err{client_errc::queue_full, "max_pending_requests=2"};

  EXPECT_TRUE(err.is(client_errc::queue_full));
  EXPECT_EQ(err.to_string(), "pipecoro: Too many pending requests. (max_pending_requests=2)");
}

TEST(error_test, append_detail_joins_with_separator) {
  error_info err{client_errc::read_failed};
  err.append_detail("first").append_detail("").append_detail("second");

  EXPECT_EQ(err.detail, "first; second");
}

TEST(error_test, to_string_falls_back_to_cause) {
  error_info err{client_errc::write_failed};
  err.set_cause(std::make_error_code(std::errc::broken_pipe));

  auto s = err.to_string();
  EXPECT_NE(s.find("Request write failed."), std::string::npos);
  EXPECT_NE(s.find("cause=generic"), std::string::npos);
}

TEST(error_test, wrap_keeps_cause_code_and_detail) {
  error_info cause{std::make_error_code(std::errc::connection_reset), "peer went away"};

  auto wrapped = error_info::wrap(client_errc::read_failed, cause);

  EXPECT_TRUE(wrapped.is(client_errc::read_failed));
  EXPECT_EQ(wrapped.cause_ec, std::make_error_code(std::errc::connection_reset));
  EXPECT_NE(wrapped.detail.find("peer went away"), std::string::npos);
  EXPECT_NE(wrapped.detail.find(cause.code.message()), std::string::npos);
}

TEST(error_test, wrap_of_empty_cause_has_no_cause_code) {
  auto wrapped = error_info::wrap(client_errc::connection_closed, error_info{});

  EXPECT_TRUE(wrapped.is(client_errc::connection_closed));
  EXPECT_FALSE(wrapped.cause_ec);
  EXPECT_TRUE(wrapped.detail.empty());
}

TEST(error_test, config_rejects_zero_depth) {
  pipecoro::pipeline_config cfg{};
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_EQ(cfg.max_pending_requests, 16u);

  cfg.max_pending_requests = 0;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}
