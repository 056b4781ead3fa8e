#include "song_transfer.hpp"

#include <filesystem>
#include <variant>

#include "content_validator.hpp"

const char* to_string(TransferState state) {
  switch(state) {
    case TransferState::Idle: return "Idle";
    case TransferState::Connecting: return "Connecting";
    case TransferState::Requesting: return "Requesting";
    case TransferState::AwaitingResponse: return "AwaitingResponse";
    case TransferState::Validating: return "Validating";
    case TransferState::Persisting: return "Persisting";
    case TransferState::Complete: return "Complete";
    case TransferState::Failed: return "Failed";
  }
  return "Idle";
}

SongDownload::Ptr SongDownload::create(asio::io_context& io,
                                       PeerTransport& transport,
                                       std::shared_ptr<CatalogSource> album,
                                       Request request,
                                       std::chrono::milliseconds timeout,
                                       Hooks hooks,
                                       std::shared_ptr<Logger> logger) {
  return Ptr(new SongDownload(io, transport, std::move(album), std::move(request),
                              timeout, std::move(hooks), std::move(logger)));
}

SongDownload::SongDownload(asio::io_context& io,
                           PeerTransport& transport,
                           std::shared_ptr<CatalogSource> album,
                           Request request,
                           std::chrono::milliseconds timeout,
                           Hooks hooks,
                           std::shared_ptr<Logger> logger)
  : transport_(transport),
    album_(std::move(album)),
    request_(std::move(request)),
    timeout_(timeout),
    hooks_(std::move(hooks)),
    logger_(std::move(logger)),
    timer_(io) {}

void SongDownload::advance(TransferState state, int progress, const char* status) {
  state_ = state;
  log_debug(logger_.get(), "Download {} -> {}", request_.hash, to_string(state));
  if(progress > 0 && hooks_.on_progress) {
    hooks_.on_progress(DownloadProgress{request_.song_name, progress, status});
  }
}

void SongDownload::start() {
  if(state_ != TransferState::Idle) return;
  auto self = shared_from_this();
  advance(TransferState::Connecting, 10, "Connecting...");

  timer_.expires_after(timeout_);
  timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->terminal()) return;
    self->fail(LibraryErrorKind::PeerUnreachable, "Connection timeout");
  });

  conn_ = transport_.dial(request_.peer_address, [self](std::error_code ec){
    self->on_connected(ec);
  });
}

void SongDownload::on_connected(std::error_code ec) {
  if(terminal()) return;
  if(ec) {
    fail(LibraryErrorKind::PeerUnreachable, "Failed to connect to peer: " + ec.message());
    return;
  }
  auto self = shared_from_this();
  Connection::Handlers handlers;
  handlers.on_message = [self](const Connection::Ptr&, PeerMessage message){
    self->on_message(std::move(message));
  };
  handlers.on_protocol_error = [self](const Connection::Ptr&, const std::string& reason){
    if(!self->terminal()) self->fail(LibraryErrorKind::PeerRejected, "Protocol error: " + reason);
  };
  handlers.on_closed = [self](const Connection::Ptr&, std::error_code){
    if(!self->terminal()) self->fail(LibraryErrorKind::PeerUnreachable, "Connection closed by peer");
  };
  conn_->set_handlers(std::move(handlers));

  advance(TransferState::Requesting, 20, "Requesting...");
  conn_->async_send(RequestSong{request_.hash, request_.requester_name}, [self](std::error_code ec){
    if(self->terminal()) return;
    if(ec) {
      self->fail(LibraryErrorKind::PeerUnreachable, "Failed to send request: " + ec.message());
      return;
    }
    if(self->state_ == TransferState::Requesting) {
      self->advance(TransferState::AwaitingResponse, 0, "");
    }
  });
}

void SongDownload::on_message(PeerMessage message) {
  if(terminal()) return;
  if(state_ != TransferState::Requesting && state_ != TransferState::AwaitingResponse) {
    fail(LibraryErrorKind::PeerRejected, "Protocol error: unexpected " + std::string(message_type(message)));
    return;
  }
  if(auto* data = std::get_if<SongData>(&message)) {
    on_song_data(*data);
  } else if(auto* error = std::get_if<SongError>(&message)) {
    fail(LibraryErrorKind::PeerRejected, error->error.empty() ? "Peer rejected the request" : error->error);
  } else {
    fail(LibraryErrorKind::PeerRejected, "Protocol error: unexpected request_song");
  }
}

void SongDownload::on_song_data(const SongData& data) {
  if(!data.hash.empty() && data.hash != request_.hash) {
    fail(LibraryErrorKind::PeerRejected, "Protocol error: response for a different song");
    return;
  }
  advance(TransferState::Validating, 50, "Verifying...");

  auto bytes = decode_payload(data);
  if(!bytes) {
    fail(LibraryErrorKind::InvalidContent, "Invalid song data encoding");
    return;
  }
  std::string proposed = !data.filename.empty() ? data.filename
                       : !data.name.empty() ? data.name
                       : request_.song_name;
  auto verdict = validate_song(*bytes, proposed);
  if(!verdict) {
    log_warn(logger_.get(), "Rejected song from {}: {}", request_.peer_display_name, verdict.reason);
    fail(LibraryErrorKind::InvalidContent, verdict.reason);
    return;
  }

  advance(TransferState::Persisting, 80, "Saving...");
  std::string saved_path;
  try {
    saved_path = album_->store_song(verdict.sanitized_filename, *bytes);
  } catch(const std::exception& e) {
    fail(LibraryErrorKind::PersistenceFailure, e.what());
    return;
  }
  try {
    album_->rescan();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Album rescan after download failed: {}", e.what());
  }
  succeed(std::move(saved_path));
}

void SongDownload::succeed(std::string saved_path) {
  advance(TransferState::Complete, 100, "Complete!");
  TransferOutcome outcome;
  outcome.hash = request_.hash;
  outcome.song_name = request_.song_name;
  outcome.saved_path = std::move(saved_path);
  finish(std::move(outcome));
}

void SongDownload::fail(LibraryErrorKind kind, std::string message) {
  log_warn(logger_.get(), "Download of '{}' from {} failed in {}: {}",
           request_.song_name, request_.peer_address, to_string(state_), message);
  state_ = TransferState::Failed;
  TransferOutcome outcome;
  outcome.hash = request_.hash;
  outcome.song_name = request_.song_name;
  outcome.error = LibraryError{kind, std::move(message)};
  finish(std::move(outcome));
}

void SongDownload::finish(TransferOutcome outcome) {
  std::error_code ignored;
  timer_.cancel(ignored);
  if(conn_) {
    auto conn = std::move(conn_);
    conn_.reset();
    conn->close();
  }
  outcome_ = outcome;
  auto on_finished = std::move(hooks_.on_finished);
  hooks_ = Hooks{};
  if(on_finished) on_finished(outcome);
}

SongServe::Ptr SongServe::create(Connection::Ptr conn,
                                 std::shared_ptr<CatalogProvider> catalog,
                                 SharedHandler on_shared,
                                 std::shared_ptr<Logger> logger) {
  return Ptr(new SongServe(std::move(conn), std::move(catalog), std::move(on_shared), std::move(logger)));
}

SongServe::SongServe(Connection::Ptr conn,
                     std::shared_ptr<CatalogProvider> catalog,
                     SharedHandler on_shared,
                     std::shared_ptr<Logger> logger)
  : conn_(std::move(conn)),
    catalog_(std::move(catalog)),
    on_shared_(std::move(on_shared)),
    logger_(std::move(logger)) {}

void SongServe::start() {
  if(state_ != State::Idle) return;
  state_ = State::AwaitingRequest;
  auto self = shared_from_this();
  Connection::Handlers handlers;
  handlers.on_message = [self](const Connection::Ptr&, PeerMessage message){
    if(self->state_ != State::AwaitingRequest) {
      self->fail("unexpected message while serving");
      return;
    }
    if(auto* request = std::get_if<RequestSong>(&message)) {
      self->on_request(*request);
    } else {
      self->fail(std::string("unexpected ") + message_type(message));
    }
  };
  handlers.on_protocol_error = [self](const Connection::Ptr&, const std::string& reason){
    self->fail(reason);
  };
  handlers.on_closed = [self](const Connection::Ptr&, std::error_code){
    if(self->state_ != State::Complete) self->state_ = State::Failed;
    self->conn_.reset();
  };
  conn_->set_handlers(std::move(handlers));
  conn_->start();
}

void SongServe::on_request(const RequestSong& request) {
  auto peer_name = request.peer_name.empty() ? std::string("Unknown") : request.peer_name;
  log_info(logger_.get(), "{} requested {}", peer_name, request.hash);

  auto found = catalog_->lookup(request.hash);
  if(found.status == LookupStatus::NotFound) {
    reply_error(request.hash, "Song not found");
    return;
  }
  if(found.status == LookupStatus::NotShared) {
    reply_error(request.hash, "Song not shared");
    return;
  }

  state_ = State::Reading;
  std::string bytes;
  try {
    bytes = catalog_->source()->read_song(found.song.path);
  } catch(const std::exception& e) {
    reply_error(request.hash, e.what());
    return;
  }

  state_ = State::Sending;
  auto filename = std::filesystem::path(found.song.path).filename().string();
  auto song_name = found.song.name;
  auto self = shared_from_this();
  conn_->async_send(make_song_data(request.hash, song_name, filename, bytes),
    [self, song_name, peer_name](std::error_code ec){
      if(ec) {
        log_warn(self->logger_.get(), "Failed to send '{}' to {}: {}", song_name, peer_name, ec.message());
        self->state_ = State::Failed;
        return;
      }
      self->state_ = State::Complete;
      log_info(self->logger_.get(), "{} downloaded '{}' from you", peer_name, song_name);
      if(self->on_shared_) {
        self->on_shared_(ShareNotification{song_name, peer_name, std::chrono::system_clock::now()});
      }
      if(self->conn_) self->conn_->close();
    });
}

void SongServe::reply_error(const std::string& hash, const std::string& reason) {
  log_info(logger_.get(), "Refusing {}: {}", hash, reason);
  state_ = State::Sending;
  auto self = shared_from_this();
  conn_->async_send(SongError{hash, reason}, [self](std::error_code ec){
    self->state_ = ec ? State::Failed : State::Complete;
    if(self->conn_) self->conn_->close();
  });
}

void SongServe::fail(const std::string& reason) {
  log_warn(logger_.get(), "Closing inbound connection from {}: {}",
           conn_ ? conn_->remote_address() : std::string("?"), reason);
  state_ = State::Failed;
  if(conn_) conn_->close();
}
