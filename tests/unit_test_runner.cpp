#include "album_directory.hpp"
#include "catalog_provider.hpp"
#include "content_validator.hpp"
#include "discovery_client.hpp"
#include "discovery_server.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct TestContext {
  songmesh::test::LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

// Records the failing expression in the capture so the runner prints it.
bool check(TestContext& ctx, bool condition, const std::string& what) {
  if(!condition) ctx.logger->error("check failed: {}", what);
  return condition;
}

bool test_validator_accepts_midi(TestContext& ctx) {
  auto midi = songmesh::test::make_midi(std::string("\x00\x90\x3C\x40", 4));
  auto verdict = validate_song(midi, "Nice Tune.mid");
  bool ok = check(ctx, static_cast<bool>(verdict), "well-formed MIDI accepted: " + verdict.reason);
  ok &= check(ctx, verdict.sanitized_filename == "Nice Tune.mid", "filename kept: " + verdict.sanitized_filename);

  auto renamed = validate_song(midi, "groove");
  ok &= check(ctx, renamed.sanitized_filename == "groove.mid", "extension appended: " + renamed.sanitized_filename);
  return ok;
}

bool test_validator_rejects_oversize(TestContext& ctx) {
  std::string huge = songmesh::test::make_midi();
  huge.resize(kMaxSongBytes + 1, '\0');
  auto verdict = validate_song(huge, "big.mid");
  bool ok = check(ctx, !verdict, "oversize rejected");
  ok &= check(ctx, verdict.reason == "File too large (>50MB)", "oversize reason: " + verdict.reason);

  std::string exact = songmesh::test::make_midi();
  ok &= check(ctx, !check_size(exact).has_value(), "small payload passes size check");
  return ok;
}

bool test_validator_rejects_executables(TestContext& ctx) {
  struct Case {
    std::string bytes;
    std::string expected;
  };
  std::vector<Case> cases = {
    {std::string("MZ\x90\x00\x03\x00\x00\x00", 8), "Blocked Windows executable (MZ)"},
    {std::string("\x7F" "ELF\x02\x01\x01\x00", 8), "Blocked Linux executable (ELF)"},
    {std::string("\xCF\xFA\xED\xFE\x07\x00\x00\x01", 8), "Blocked macOS executable (Mach-O)"},
    {std::string("\xCA\xFE\xBA\xBE\x00\x00\x00\x34", 8), "Blocked Java class file"},
    {"#!/bin/sh\nrm -rf ~\n", "Blocked Shell script"},
    {"@echo off\r\ndel *.*\r\n", "Blocked Windows batch file"},
    {"Write-Host hi; powershell -enc AAAA", "Blocked PowerShell script"},
  };
  bool ok = true;
  for(const auto& c : cases) {
    auto verdict = validate_song(c.bytes, "x.mid");
    ok &= check(ctx, !verdict && verdict.reason == c.expected,
                "expected '" + c.expected + "', got '" + verdict.reason + "'");
  }

  // A MIDI header does not hide a PE signature further in.
  auto disguised = songmesh::test::make_midi(std::string("\x00\xFF\x01\x04PE\x00\x00", 8));
  auto verdict = validate_song(disguised, "x.mid");
  ok &= check(ctx, !verdict && verdict.reason == "Blocked Embedded PE executable",
              "embedded PE rejected: " + verdict.reason);
  return ok;
}

bool test_validator_rejects_bad_structure(TestContext& ctx) {
  bool ok = true;
  auto no_header = validate_song("RIFF0000WAVEfmt ", "a.mid");
  ok &= check(ctx, !no_header && no_header.reason == "Missing MIDI header (MThd)", "missing MThd: " + no_header.reason);

  auto midi = songmesh::test::make_midi();
  auto header_only = midi.substr(0, 14);
  auto truncated = validate_song(header_only, "a.mid");
  ok &= check(ctx, !truncated && truncated.reason == "Missing track header (MTrk)", "missing MTrk: " + truncated.reason);

  auto overrun = midi;
  overrun[21] = '\x7F'; // track length low byte now points past the end
  auto bad_len = validate_song(overrun, "a.mid");
  ok &= check(ctx, !bad_len && bad_len.reason == "Chunk length exceeds file size", "overrun: " + bad_len.reason);
  return ok;
}

bool test_validator_parses_track_events(TestContext& ctx) {
  bool ok = true;
  // Running status, a program change, sysex and a tempo meta all parse.
  auto rich = songmesh::test::make_midi(std::string(
    "\x00\xFF\x51\x03\x07\xA1\x20"
    "\x00\xC0\x05"
    "\x00\xF0\x03\x7E\x7F\xF7"
    "\x00\x90\x3C\x40"
    "\x81\x00\x3C\x00", 24));
  auto accepted = validate_song(rich, "rich.mid");
  ok &= check(ctx, static_cast<bool>(accepted), "well-formed events accepted: " + accepted.reason);

  auto orphan = validate_song(songmesh::test::make_midi(std::string("\x00\x3C\x40", 3)), "a.mid");
  ok &= check(ctx, !orphan && orphan.reason == "Track data without a status byte", "orphan data: " + orphan.reason);

  auto high_data = validate_song(songmesh::test::make_midi(std::string("\x00\x90\x3C\x80", 4)), "a.mid");
  ok &= check(ctx, !high_data && high_data.reason == "Invalid channel message data", "data byte: " + high_data.reason);

  auto long_meta = validate_song(songmesh::test::make_midi(std::string("\x00\xFF\x01\x40" "ab", 6)), "a.mid");
  ok &= check(ctx, !long_meta && long_meta.reason == "Truncated meta event", "meta overrun: " + long_meta.reason);

  auto long_delta = validate_song(songmesh::test::make_midi(std::string("\xFF\xFF\xFF\xFF\x00", 5)), "a.mid");
  ok &= check(ctx, !long_delta && long_delta.reason == "Invalid delta time in track", "delta: " + long_delta.reason);

  auto format = songmesh::test::make_midi();
  format[9] = '\x03';
  auto bad_format = validate_song(format, "a.mid");
  ok &= check(ctx, !bad_format && bad_format.reason == "Unsupported MIDI format", "format: " + bad_format.reason);
  return ok;
}

bool test_validator_sanitizes_filenames(TestContext& ctx) {
  auto midi = songmesh::test::make_midi();
  bool ok = true;
  auto traversal = validate_song(midi, "../../etc/passwd");
  ok &= check(ctx, traversal && traversal.sanitized_filename == "passwd.mid",
              "traversal stripped: " + traversal.sanitized_filename);

  auto windows = validate_song(midi, "..\\..\\Windows\\evil<>.mid");
  ok &= check(ctx, windows && windows.sanitized_filename == "evil.mid",
              "backslash traversal stripped: " + windows.sanitized_filename);

  auto dots = validate_song(midi, "../..");
  ok &= check(ctx, !dots && dots.reason == "Invalid filename", "nothing left: " + dots.reason);
  return ok;
}

bool test_protocol_encode_decode(TestContext& ctx) {
  bool ok = true;
  auto request = encode_message(RequestSong{"abc123", "HappyBard7"});
  ok &= check(ctx, request["type"] == "request_song" && request["hash"] == "abc123" &&
                   request["peerName"] == "HappyBard7", "request_song wire shape: " + request.dump());

  auto decoded = decode_line(R"({"type":"song_error","hash":"h1","error":"Song not shared"})");
  auto* error = std::get_if<SongError>(&decoded);
  ok &= check(ctx, error && error->hash == "h1" && error->error == "Song not shared", "song_error decoded");

  std::string bytes("MThd\x00\x00\x00\x06\xFF", 9);
  auto data = make_song_data("h2", "Tune", "Tune.mid", bytes);
  auto wire = encode_message(data);
  ok &= check(ctx, wire["type"] == "song_data" && wire["filename"] == "Tune.mid", "song_data wire shape");
  auto back = decode_message(wire);
  auto* song = std::get_if<SongData>(&back);
  ok &= check(ctx, song != nullptr, "song_data decoded");
  if(song) {
    auto payload = decode_payload(*song);
    ok &= check(ctx, payload && *payload == bytes, "payload bytes preserved");
  }

  SongData garbage{"h3", "x", "x.mid", "not*base64!"};
  ok &= check(ctx, !decode_payload(garbage).has_value(), "invalid base64 rejected");
  return ok;
}

bool test_protocol_rejects_unknown(TestContext& ctx) {
  auto expect_error = [&](const std::string& line, const std::string& fragment) {
    try {
      decode_line(line);
    } catch(const ProtocolError& e) {
      return check(ctx, std::string(e.what()).find(fragment) != std::string::npos,
                   "'" + line + "' -> " + e.what());
    }
    return check(ctx, false, "no ProtocolError for " + line);
  };
  bool ok = true;
  ok &= expect_error(R"({"type":"peer_announce","hash":"x"})", "unknown message type 'peer_announce'");
  ok &= expect_error(R"({"hash":"x"})", "type");
  ok &= expect_error(R"([1,2,3])", "not a JSON object");
  ok &= expect_error("{not json", "malformed frame");
  ok &= expect_error(R"({"type":"request_song"})", "hash");
  return ok;
}

bool test_identity_survives_restart(TestContext& ctx) {
  auto root = songmesh::test::fresh_workspace("identity");
  auto settings_path = root / ".config" / "settings.json";
  auto album = std::make_shared<AlbumDirectory>(root / "album");

  auto first = std::make_shared<SettingsManager>();
  first->set_settings_path(settings_path);
  CatalogProvider provider_a(first, album, ctx.logger);
  auto id = provider_a.get_or_create_identity();
  bool ok = check(ctx, id.size() == 36 && id[14] == '4', "uuid v4 shape: " + id);
  ok &= check(ctx, provider_a.get_or_create_identity() == id, "idempotent within a run");

  auto second = std::make_shared<SettingsManager>();
  second->set_settings_path(settings_path);
  ok &= check(ctx, second->load(), "settings reloaded");
  CatalogProvider provider_b(second, album, ctx.logger);
  ok &= check(ctx, provider_b.get_or_create_identity() == id, "identity survives restart");
  return ok;
}

bool test_share_policy(TestContext& ctx) {
  auto root = songmesh::test::fresh_workspace("share_policy");
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / ".config" / "settings.json");
  auto album = std::make_shared<AlbumDirectory>(root / "album", ctx.logger);
  auto shared = songmesh::test::write_file(root / "album" / "Shared.mid",
                                           songmesh::test::make_midi(std::string("\x00\x90\x3C\x40", 4)));
  auto hidden = songmesh::test::write_file(root / "album" / "Hidden.mid",
                                           songmesh::test::make_midi(std::string("\x00\x90\x3E\x40", 4)));
  songmesh::test::write_file(root / "album" / "notes.txt", "not a song");

  CatalogProvider provider(settings, album, ctx.logger);
  provider.set_share_all(false);
  provider.set_shared_paths({shared, shared});

  bool ok = check(ctx, provider.local_songs().size() == 2, "two local songs");
  ok &= check(ctx, provider.shared_paths().size() == 1, "allow-list deduplicated");
  auto catalog = provider.shareable_catalog();
  ok &= check(ctx, catalog.size() == 1 && catalog[0].name == "Shared", "only the allow-listed song is published");

  std::string hidden_hash;
  for(const auto& song : provider.local_songs()) {
    if(song.path == hidden) hidden_hash = song.hash;
  }
  ok &= check(ctx, !hidden_hash.empty(), "hidden song fingerprinted");
  ok &= check(ctx, provider.lookup(hidden_hash).status == LookupStatus::NotShared, "hidden lookup is NotShared");
  ok &= check(ctx, provider.lookup(catalog.empty() ? "" : catalog[0].hash).status == LookupStatus::Shared,
              "allow-listed lookup is Shared");
  ok &= check(ctx, provider.lookup("0000").status == LookupStatus::NotFound, "unknown hash is NotFound");

  provider.set_share_all(true);
  ok &= check(ctx, provider.shareable_catalog().size() == 2, "share_all publishes everything");

  provider.set_share_all(false);
  provider.unshare_path(shared);
  ok &= check(ctx, provider.shareable_catalog().empty(), "empty allow-list publishes nothing");
  return ok;
}

// Lists files without fingerprints so the provider has to fill them in.
class UnhashedSource : public CatalogSource {
public:
  explicit UnhashedSource(std::vector<std::string> paths) : paths_(std::move(paths)) {}

  std::vector<LocalSong> list_songs() override {
    std::vector<LocalSong> out;
    for(const auto& p : paths_) {
      LocalSong song;
      song.path = p;
      song.name = std::filesystem::path(p).stem().string();
      out.push_back(song);
    }
    return out;
  }
  std::string store_song(const std::string&, const std::string&) override {
    throw std::runtime_error("read-only");
  }
  std::string read_song(const std::string&) override {
    throw std::runtime_error("read-only");
  }
  void rescan() override {}

private:
  std::vector<std::string> paths_;
};

bool test_fallback_hash(TestContext& ctx) {
  auto root = songmesh::test::fresh_workspace("fallback_hash");
  auto real = songmesh::test::write_file(root / "Real.mid", songmesh::test::make_midi());
  auto missing = (root / "Gone.mid").string();

  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / ".config" / "settings.json");
  songmesh::test::configure(settings, "share_all", true);
  CatalogProvider provider(settings, std::make_shared<UnhashedSource>(std::vector<std::string>{real, missing}), ctx.logger);

  auto catalog = provider.shareable_catalog();
  bool ok = check(ctx, catalog.size() == 2, "both entries published");
  if(catalog.size() == 2) {
    ok &= check(ctx, catalog[0].hash == sha256_file_hex(real).value_or("?"), "content digest for readable file");
    ok &= check(ctx, catalog[1].hash == sha256_hex(missing), "path digest for unreadable file");
  }
  return ok;
}

bool test_settings_round_trip(TestContext& ctx) {
  auto root = songmesh::test::fresh_workspace("settings");
  auto path = root / ".config" / "settings.json";

  SettingsManager a;
  a.set_settings_path(path);
  std::string error;
  bool ok = check(ctx, a.set_from_string("server", "http://10.0.0.5:4000", error), "alias set: " + error);
  ok &= check(ctx, a.set_from_string("share_all", "on", error), "bool set: " + error);
  ok &= check(ctx, a.set_from_json("shared_songs", nlohmann::json::array({"/a/b.mid"}), error), "list set: " + error);
  ok &= check(ctx, a.set_from_string("listen_port", "4100", error), "int set: " + error);
  ok &= check(ctx, !a.set_from_string("listen_port", "many", error), "bad int refused");
  ok &= check(ctx, a.set_from_string("help", "true", error), "transient set");
  ok &= check(ctx, a.save(), "saved");

  SettingsManager b;
  b.set_settings_path(path);
  ok &= check(ctx, b.load(), "loaded");
  ok &= check(ctx, b.get<std::string>("discovery_url") == "http://10.0.0.5:4000", "discovery_url persisted");
  ok &= check(ctx, b.get<bool>("share_all"), "share_all persisted");
  ok &= check(ctx, b.get<std::vector<std::string>>("shared_songs") == std::vector<std::string>{"/a/b.mid"},
              "shared_songs persisted");
  ok &= check(ctx, b.get<int>("listen_port") == 4100, "listen_port persisted");
  ok &= check(ctx, !b.get<bool>("help"), "non-persistent key not saved");
  return ok;
}

bool test_http_client_exchange(TestContext& ctx) {
  DiscoveryServer::Options server_options;
  server_options.port = 0;
  DiscoveryServer server(server_options, ctx.logger);
  server.start_background();

  asio::io_context io;
  HttpClient client(io, ctx.logger);
  auto url = parse_server_url(server.base_url());
  bool ok = check(ctx, url.has_value(), "server url parses: " + server.base_url());
  if(!url) return ok;

  std::error_code health_ec, register_ec, missing_ec, refused_ec, aborted_ec;
  HttpResponse health, registered, missing;
  auto record = nlohmann::json{{"peer_id", "p1"}, {"webrtc_id", "127.0.0.1:6000"},
                               {"name", "BraveBard7"}, {"songs", nlohmann::json::array()}};
  client.async_request("GET", url->route("/health"), {}, std::chrono::seconds(2),
    [&](std::error_code ec, HttpResponse r){ health_ec = ec; health = std::move(r); });
  client.async_request("POST", url->route("/register"), record.dump(), std::chrono::seconds(2),
    [&](std::error_code ec, HttpResponse r){ register_ec = ec; registered = std::move(r); });
  client.async_request("GET", url->route("/nowhere"), {}, std::chrono::seconds(2),
    [&](std::error_code ec, HttpResponse r){ missing_ec = ec; missing = std::move(r); });
  client.async_request("GET", "http://127.0.0.1:1/health", {}, std::chrono::seconds(2),
    [&](std::error_code ec, HttpResponse){ refused_ec = ec; });
  io.run();

  ok &= check(ctx, !health_ec && health.ok() && health.body == "OK", "health answered");
  ok &= check(ctx, !register_ec && registered.status == 200, "register accepted");
  ok &= check(ctx, server.peer_count() == 1, "peer stored by the server");
  ok &= check(ctx, !missing_ec && missing.status == 404 && !missing.ok(), "404 is a response, not an error");
  ok &= check(ctx, refused_ec && refused_ec.category() == curl_category(), "refused connect reported by curl");

  // The first request may already be on the wire; the queued one never is.
  io.restart();
  int delivered = 0;
  client.async_request("GET", url->route("/peers"), {}, std::chrono::seconds(2),
    [&](std::error_code, HttpResponse){ ++delivered; });
  client.async_request("GET", url->route("/peers"), {}, std::chrono::seconds(2),
    [&](std::error_code ec, HttpResponse){ aborted_ec = ec; ++delivered; });
  client.cancel_all();
  io.run();
  ok &= check(ctx, delivered == 2, "every cancelled request completes");
  ok &= check(ctx, aborted_ec == asio::error::operation_aborted, "queued request aborted: " + aborted_ec.message());

  server.stop();
  return ok;
}

bool test_url_parsing(TestContext& ctx) {
  bool ok = true;
  auto plain = parse_server_url("http://discovery.local");
  ok &= check(ctx, plain && plain->host == "discovery.local" && plain->port == 80 && plain->base_path.empty(),
              "default http port");
  auto tls = parse_server_url("https://songs.example.com:8443/api/v1/");
  ok &= check(ctx, tls && tls->scheme == "https" && tls->port == 8443 && tls->base_path == "/api/v1",
              "https with base path");
  ok &= check(ctx, tls && tls->route("/peers") == "https://songs.example.com:8443/api/v1/peers", "joined route");
  auto v6 = parse_server_url("http://[::1]:3456");
  ok &= check(ctx, v6 && v6->host == "::1" && v6->port == 3456, "bracketed v6 host");
  ok &= check(ctx, v6 && v6->route("/health") == "http://[::1]:3456/health", "v6 route re-bracketed");
  ok &= check(ctx, !parse_server_url("ftp://host"), "non-http scheme refused");
  ok &= check(ctx, !parse_server_url("http://host:99999"), "out-of-range port refused");
  ok &= check(ctx, !parse_server_url("localhost:3456"), "missing scheme refused");
  return ok;
}

bool test_flatten_peers_filters_self(TestContext& ctx) {
  nlohmann::json doc = {
    {"peers", nlohmann::json::array({
      {{"peer_id", "me"}, {"webrtc_id", "127.0.0.1:5000"}, {"name", "Me"},
       {"songs", nlohmann::json::array({{{"name", "Mine"}, {"hash", "m1"}, {"size", 10}}})}},
      {{"peer_id", "ghost"}, {"webrtc_id", nullptr}, {"name", "Ghost"},
       {"songs", nlohmann::json::array({{{"name", "Boo"}, {"hash", "g1"}, {"size", 10}}})}},
      {{"peer_id", "other"}, {"webrtc_id", "127.0.0.1:5001"}, {"name", "CalmBard3"},
       {"songs", nlohmann::json::array({
          {{"name", "One"}, {"hash", "o1"}, {"size", 100}, {"bpm", 120}, {"duration", nullptr}},
          {{"name", "Two"}, {"hash", "o2"}, {"size", 200}}})}}
    })},
    {"total_songs", 4}
  };
  std::size_t online = 99;
  auto entries = flatten_peers(doc, "me", online);
  bool ok = check(ctx, online == 1, "only the other peer counts as online");
  ok &= check(ctx, entries.size() == 2, "self and address-less peers dropped");
  ok &= check(ctx, std::all_of(entries.begin(), entries.end(), [](const GlobalCatalogEntry& e){
                return e.owner_identity == "other" && e.transport_address == "127.0.0.1:5001" &&
                       e.display_name == "CalmBard3";
              }), "entries carry owner address and name");
  if(!entries.empty()) {
    ok &= check(ctx, entries[0].song.bpm == 120 && !entries[0].song.duration, "optional metadata decoded");
  }
  return ok;
}

bool test_discovery_server_routes(TestContext& ctx) {
  DiscoveryServer server(DiscoveryServer::Options{}, ctx.logger);
  auto call = [&](const std::string& method, const std::string& target, const std::string& body) {
    DiscoveryRequest r{boost::beast::http::string_to_verb(method), target, 11};
    r.body() = body;
    r.prepare_payload();
    return server.handle(r);
  };
  bool ok = true;
  ok &= check(ctx, call("GET", "/health", "").body() == "OK", "health");
  auto record = nlohmann::json{{"peer_id", "p1"}, {"webrtc_id", "127.0.0.1:6000"}, {"name", "WiseArtist1"},
                               {"songs", nlohmann::json::array({{{"name", "A"}, {"hash", "a"}, {"size", 1}}})}};
  ok &= check(ctx, call("POST", "/register", record.dump()).result_int() == 200, "register");
  ok &= check(ctx, call("POST", "/heartbeat", record.dump()).result_int() == 200, "heartbeat");
  ok &= check(ctx, server.peer_count() == 1, "heartbeat upserts instead of duplicating");

  auto peers = call("GET", "/peers?fresh=1", "");
  auto doc = nlohmann::json::parse(peers.body());
  ok &= check(ctx, doc["peers"].size() == 1 && doc["total_songs"] == 1, "peer listing: " + peers.body());

  ok &= check(ctx, call("POST", "/register", "{oops").result_int() == 400, "bad JSON refused");
  ok &= check(ctx, call("POST", "/register", R"({"peer_id":"x"})").result_int() == 400, "missing fields refused");
  ok &= check(ctx, call("GET", "/register", "").result_int() == 405, "wrong method");
  ok &= check(ctx, call("GET", "/nowhere", "").result_int() == 404, "unknown route");

  ok &= check(ctx, call("DELETE", "/unregister", nlohmann::json("p1").dump()).result_int() == 200, "unregister");
  ok &= check(ctx, server.peer_count() == 0, "peer removed");
  ok &= check(ctx, server.request_count("/register") == 4, "requests counted per route");
  return ok;
}

bool test_album_store_collision(TestContext& ctx) {
  auto root = songmesh::test::fresh_workspace("album_store");
  AlbumDirectory album(root / "album", ctx.logger);
  auto midi = songmesh::test::make_midi();
  auto first = album.store_song("Tune.mid", midi);
  auto second = album.store_song("Tune.mid", midi);
  bool ok = check(ctx, std::filesystem::path(first).filename() == "Tune.mid", "first keeps name");
  ok &= check(ctx, std::filesystem::path(second).filename() == "Tune (1).mid", "collision renamed: " + second);
  ok &= check(ctx, album.read_song(first) == midi, "stored bytes read back");
  album.rescan();
  ok &= check(ctx, album.list_songs().size() == 2 && album.rescan_count() == 1, "rescan lists both");
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("SONGMESH_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SONGMESH_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  songmesh::test::LogCapture logs;
  auto logger = std::make_shared<Logger>("unit");
  logs.attach(logger);
  TestContext ctx{logs, logger, verbose};
  std::vector<TestCase> tests = {
    {"validator_accepts_midi", test_validator_accepts_midi},
    {"validator_rejects_oversize", test_validator_rejects_oversize},
    {"validator_rejects_executables", test_validator_rejects_executables},
    {"validator_rejects_bad_structure", test_validator_rejects_bad_structure},
    {"validator_parses_track_events", test_validator_parses_track_events},
    {"validator_sanitizes_filenames", test_validator_sanitizes_filenames},
    {"protocol_encode_decode", test_protocol_encode_decode},
    {"protocol_rejects_unknown", test_protocol_rejects_unknown},
    {"identity_survives_restart", test_identity_survives_restart},
    {"share_policy", test_share_policy},
    {"fallback_hash", test_fallback_hash},
    {"settings_round_trip", test_settings_round_trip},
    {"http_client_exchange", test_http_client_exchange},
    {"url_parsing", test_url_parsing},
    {"flatten_peers_filters_self", test_flatten_peers_filters_self},
    {"discovery_server_routes", test_discovery_server_routes},
    {"album_store_collision", test_album_store_collision},
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " unit tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " unit tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
