#include <pipecoro/pipecoro.hpp>
#include <pipecoro/src.hpp>

#include <iocoro/iocoro.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

struct trace_printer {
  static auto on_start(void*, pipecoro::request_trace_start const& ev) -> void {
    std::cout << "[trace start] id=" << ev.info.id << " kind=" << pipecoro::to_string(ev.info.kind)
              << " pending=" << ev.pending << "\n";
  }

  static auto on_finish(void*, pipecoro::request_trace_finish const& ev) -> void {
    std::cout << "[trace finish] id=" << ev.info.id
              << " outcome=" << pipecoro::to_string(ev.outcome)
              << " items=" << ev.items_read << " duration_ns=" << ev.duration.count();
    if (ev.primary_error) {
      std::cout << " error=" << ev.primary_error.message() << " detail=" << ev.primary_error_detail;
    }
    std::cout << "\n";
  }
};

// Plays the server: answers every flushed command once it reaches the connection.
auto echo_server(std::shared_ptr<pipecoro::memory_connection<std::string, std::string>> conn,
                 std::size_t expected) -> iocoro::awaitable<void> {
  std::size_t answered = 0;
  while (answered < expected && !conn->is_closed()) {
    auto flushed = conn->flushed();
    for (; answered < flushed.size() && answered < expected; ++answered) {
      auto const& cmd = flushed[answered];
      if (cmd == "KEYS") {
        conn->push_inbound("k1");
        conn->push_inbound("k2");
        conn->push_inbound("END");
      } else {
        conn->push_inbound("+" + cmd);
      }
    }
    co_await iocoro::co_sleep(std::chrono::milliseconds{1});
  }
}

auto print(std::string_view label, pipecoro::item_stream<std::string>& s)
  -> iocoro::awaitable<void> {
  auto r = co_await pipecoro::collect(s);
  if (!r) {
    std::cout << label << " failed: " << r.error().to_string() << "\n";
    co_return;
  }
  std::cout << label << ":";
  for (auto const& item : *r) {
    std::cout << " " << item;
  }
  std::cout << "\n";
}

auto pipelined_memory_task() -> iocoro::awaitable<void> {
  auto ex = co_await iocoro::this_coro::executor;

  auto conn = std::make_shared<pipecoro::memory_connection<std::string, std::string>>(
    iocoro::any_executor{ex}, [](std::string const& item) { return item != "k1" && item != "k2"; });

  pipecoro::pipeline_config cfg{};
  cfg.max_pending_requests = 3;
  cfg.trace_hooks = {
    .on_start = &trace_printer::on_start,
    .on_finish = &trace_printer::on_finish,
  };
  pipecoro::pipelined_connection<std::string, std::string> pc{conn, cfg};

  iocoro::co_spawn(ex, echo_server(conn, 3), iocoro::detached);

  auto ping = pc.request(std::string{"PING"});
  auto keys = pc.request(pipecoro::just(std::string{"KEYS"}), pipecoro::flush_on_end());
  auto echo = pc.request([conn](std::stop_token) {
    return conn->write_and_flush("ECHO");
  });
  auto overflow = pc.request(std::string{"DROPPED"});

  co_await print("overflow", *overflow);
  co_await print("ping", *ping);
  co_await print("keys", *keys);
  co_await print("echo", *echo);

  co_await pc.close();
}

int main() {
  iocoro::io_context ctx;
  iocoro::co_spawn(ctx.get_executor(), pipelined_memory_task(), iocoro::detached);
  ctx.run();
  return 0;
}
