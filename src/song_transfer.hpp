#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "catalog_provider.hpp"
#include "connection.hpp"
#include "library_error.hpp"
#include "library_status.hpp"
#include "log.hpp"
#include "peer_transport.hpp"

enum class TransferState {
  Idle,
  Connecting,
  Requesting,
  AwaitingResponse,
  Validating,
  Persisting,
  Complete,
  Failed
};

const char* to_string(TransferState state);

// Outbound: fetch one song from one peer and hand it to the album.
//
//   Idle -> Connecting(10) -> Requesting(20) -> AwaitingResponse
//        -> Validating(50) -> Persisting(80) -> Complete(100)
//
// Any state fails on the hard timeout, counted from start().
class SongDownload : public std::enable_shared_from_this<SongDownload> {
public:
  using Ptr = std::shared_ptr<SongDownload>;

  struct Request {
    std::string hash;
    std::string song_name;
    std::string peer_address;
    std::string peer_display_name;
    std::string requester_name;
  };

  struct Hooks {
    std::function<void(const DownloadProgress&)> on_progress;
    std::function<void(const TransferOutcome&)> on_finished;
  };

  static Ptr create(asio::io_context& io,
                    PeerTransport& transport,
                    std::shared_ptr<CatalogSource> album,
                    Request request,
                    std::chrono::milliseconds timeout,
                    Hooks hooks,
                    std::shared_ptr<Logger> logger = nullptr);

  void start();

  TransferState state() const { return state_; }
  const Request& request() const { return request_; }
  const std::optional<TransferOutcome>& outcome() const { return outcome_; }

private:
  SongDownload(asio::io_context& io,
               PeerTransport& transport,
               std::shared_ptr<CatalogSource> album,
               Request request,
               std::chrono::milliseconds timeout,
               Hooks hooks,
               std::shared_ptr<Logger> logger);

  void on_connected(std::error_code ec);
  void on_message(PeerMessage message);
  void on_song_data(const SongData& data);
  void advance(TransferState state, int progress, const char* status);
  void succeed(std::string saved_path);
  void fail(LibraryErrorKind kind, std::string message);
  void finish(TransferOutcome outcome);
  bool terminal() const { return state_ == TransferState::Complete || state_ == TransferState::Failed; }

  PeerTransport& transport_;
  std::shared_ptr<CatalogSource> album_;
  Request request_;
  std::chrono::milliseconds timeout_;
  Hooks hooks_;
  std::shared_ptr<Logger> logger_;
  asio::steady_timer timer_;
  Connection::Ptr conn_;
  TransferState state_ = TransferState::Idle;
  std::optional<TransferOutcome> outcome_;
};

// Inbound: answer one request_song on an accepted connection.
class SongServe : public std::enable_shared_from_this<SongServe> {
public:
  using Ptr = std::shared_ptr<SongServe>;

  enum class State { Idle, AwaitingRequest, Reading, Sending, Complete, Failed };

  using SharedHandler = std::function<void(const ShareNotification&)>;

  static Ptr create(Connection::Ptr conn,
                    std::shared_ptr<CatalogProvider> catalog,
                    SharedHandler on_shared,
                    std::shared_ptr<Logger> logger = nullptr);

  void start();
  State state() const { return state_; }

private:
  SongServe(Connection::Ptr conn,
            std::shared_ptr<CatalogProvider> catalog,
            SharedHandler on_shared,
            std::shared_ptr<Logger> logger);

  void on_request(const RequestSong& request);
  void reply_error(const std::string& hash, const std::string& reason);
  void fail(const std::string& reason);

  Connection::Ptr conn_;
  std::shared_ptr<CatalogProvider> catalog_;
  SharedHandler on_shared_;
  std::shared_ptr<Logger> logger_;
  State state_ = State::Idle;
};
