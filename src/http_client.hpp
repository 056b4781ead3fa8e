#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "log.hpp"

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// http(s)://host[:port][/base]
struct ServerUrl {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  std::string base_path;

  // route("/peers") -> "http://host:port/base/peers"
  std::string route(const std::string& path) const;
};

// Parsed with libcurl's URL API. nullopt for a non-http scheme, a missing
// host or an out-of-range port.
std::optional<ServerUrl> parse_server_url(const std::string& text);

// Error category for CURLcode values.
const std::error_category& curl_category();

// Requests run one at a time on a libcurl worker thread; completions are
// posted back onto the caller's io_context. An outstanding request keeps that
// io_context's run() from returning until its completion has been delivered.
class HttpClient {
public:
  using Callback = std::function<void(std::error_code, HttpResponse)>;

  explicit HttpClient(asio::io_context& io, std::shared_ptr<Logger> logger = nullptr);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // `method` is GET, POST or DELETE. A non-empty body is sent as JSON.
  void async_request(std::string method,
                     std::string url,
                     std::string body,
                     std::chrono::milliseconds timeout,
                     Callback done);

  // Aborts the running request and drops the queued ones. Each of them still
  // completes, with asio::error::operation_aborted.
  void cancel_all();

private:
  struct Job {
    std::string method;
    std::string url;
    std::string body;
    std::chrono::milliseconds timeout{0};
    Callback done;
    uint64_t epoch = 0;
    asio::executor_work_guard<asio::io_context::executor_type> work;
  };

  void worker_loop();
  HttpResponse perform(const Job& job, std::error_code& ec);
  void complete(Job job, std::error_code ec, HttpResponse response);

  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<bool> alive_;

  std::mutex m_;
  std::condition_variable cv_;
  std::deque<Job> queue_;
  std::atomic<uint64_t> epoch_{0};
  bool stopping_ = false;
  std::thread worker_;
};
