#include "http_client.hpp"

#include <curl/curl.h>

namespace {

constexpr std::size_t kMaxBodyBytes = 16 * 1024 * 1024;

void global_init() {
  static std::once_flag once;
  std::call_once(once, [](){
    curl_global_init(CURL_GLOBAL_DEFAULT);
  });
}

class CurlCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "curl"; }
  std::string message(int code) const override {
    return curl_easy_strerror(static_cast<CURLcode>(code));
  }
};

// Reads one part of a parsed URL; empty when curl has none.
std::string url_part(CURLU* url, CURLUPart part, unsigned int flags = 0) {
  char* value = nullptr;
  if(curl_url_get(url, part, &value, flags) != CURLUE_OK || !value) return {};
  std::string out(value);
  curl_free(value);
  return out;
}

size_t on_body(char* data, size_t size, size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  auto n = size * count;
  if(body->size() + n > kMaxBodyBytes) return 0;
  body->append(data, n);
  return n;
}

struct AbortCheck {
  const std::atomic<uint64_t>* epoch;
  uint64_t started;
};

int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* check = static_cast<AbortCheck*>(user);
  return check->epoch->load() != check->started ? 1 : 0;
}

} // namespace

const std::error_category& curl_category() {
  static CurlCategory category;
  return category;
}

std::string ServerUrl::route(const std::string& path) const {
  auto authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return scheme + "://" + authority + ":" + std::to_string(port) + base_path + path;
}

std::optional<ServerUrl> parse_server_url(const std::string& text) {
  if(text.find("://") == std::string::npos) return std::nullopt;
  std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> url(curl_url(), &curl_url_cleanup);
  if(!url || curl_url_set(url.get(), CURLUPART_URL, text.c_str(), 0) != CURLUE_OK) {
    return std::nullopt;
  }

  ServerUrl out;
  out.scheme = url_part(url.get(), CURLUPART_SCHEME);
  if(out.scheme != "http" && out.scheme != "https") return std::nullopt;

  out.host = url_part(url.get(), CURLUPART_HOST);
  if(out.host.size() > 2 && out.host.front() == '[' && out.host.back() == ']') {
    out.host = out.host.substr(1, out.host.size() - 2);
  }
  if(out.host.empty()) return std::nullopt;

  auto port = url_part(url.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
  try {
    auto value = std::stoul(port);
    if(value == 0 || value > 65535) return std::nullopt;
    out.port = static_cast<uint16_t>(value);
  } catch(const std::exception&) {
    return std::nullopt;
  }

  out.base_path = url_part(url.get(), CURLUPART_PATH);
  while(!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();
  return out;
}

HttpClient::HttpClient(asio::io_context& io, std::shared_ptr<Logger> logger)
  : io_(io),
    logger_(std::move(logger)),
    alive_(std::make_shared<bool>(true)) {
  global_init();
  worker_ = std::thread([this](){ worker_loop(); });
}

HttpClient::~HttpClient() {
  {
    std::lock_guard lg(m_);
    stopping_ = true;
    ++epoch_;
  }
  cv_.notify_all();
  if(worker_.joinable()) worker_.join();
}

void HttpClient::async_request(std::string method,
                               std::string url,
                               std::string body,
                               std::chrono::milliseconds timeout,
                               Callback done) {
  {
    std::lock_guard lg(m_);
    queue_.push_back(Job{std::move(method), std::move(url), std::move(body), timeout,
                         std::move(done), epoch_.load(), asio::make_work_guard(io_)});
  }
  cv_.notify_one();
}

void HttpClient::cancel_all() {
  std::deque<Job> dropped;
  {
    std::lock_guard lg(m_);
    ++epoch_;
    dropped.swap(queue_);
  }
  for(auto& job : dropped) {
    complete(std::move(job), asio::error::operation_aborted, HttpResponse{});
  }
}

void HttpClient::worker_loop() {
  for(;;) {
    std::optional<Job> job;
    {
      std::unique_lock lk(m_);
      cv_.wait(lk, [this](){ return stopping_ || !queue_.empty(); });
      if(stopping_) return;
      job.emplace(std::move(queue_.front()));
      queue_.pop_front();
    }
    std::error_code ec;
    HttpResponse response;
    if(job->epoch != epoch_.load()) {
      ec = asio::error::operation_aborted;
    } else {
      response = perform(*job, ec);
    }
    complete(std::move(*job), ec, std::move(response));
  }
}

HttpResponse HttpClient::perform(const Job& job, std::error_code& ec) {
  HttpResponse response;
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> easy(curl_easy_init(), &curl_easy_cleanup);
  if(!easy) {
    ec = std::error_code(CURLE_FAILED_INIT, curl_category());
    return response;
  }

  curl_slist* list = nullptr;
  list = curl_slist_append(list, "Accept: application/json");
  if(!job.body.empty()) list = curl_slist_append(list, "Content-Type: application/json");
  list = curl_slist_append(list, "Expect:");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(list, &curl_slist_free_all);

  char error_text[CURL_ERROR_SIZE] = {0};
  AbortCheck abort_check{&epoch_, job.epoch};
  auto* h = easy.get();
  curl_easy_setopt(h, CURLOPT_URL, job.url.c_str());
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(job.timeout.count()));
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(job.timeout.count()));
  curl_easy_setopt(h, CURLOPT_USERAGENT, "songmesh");
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_text);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &on_body);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &on_progress);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, &abort_check);

  if(job.method == "POST") {
    curl_easy_setopt(h, CURLOPT_POST, 1L);
  } else if(job.method != "GET") {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, job.method.c_str());
  }
  if(job.method != "GET") {
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, job.body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(job.body.size()));
  }

  auto rc = curl_easy_perform(h);
  if(rc == CURLE_ABORTED_BY_CALLBACK) {
    ec = asio::error::operation_aborted;
    return HttpResponse{};
  }
  if(rc != CURLE_OK) {
    log_debug(logger_.get(), "{} {} failed: {}", job.method, job.url,
              error_text[0] ? error_text : curl_easy_strerror(rc));
    ec = std::error_code(rc, curl_category());
    return HttpResponse{};
  }
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
  log_debug(logger_.get(), "{} {} -> {}", job.method, job.url, response.status);
  return response;
}

void HttpClient::complete(Job job, std::error_code ec, HttpResponse response) {
  std::weak_ptr<bool> alive = alive_;
  asio::post(io_, [alive, done = std::move(job.done), ec, response = std::move(response)]() mutable {
    if(!alive.lock()) return;
    if(done) done(ec, std::move(response));
  });
  job.work.reset();
}
