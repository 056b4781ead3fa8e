#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "library_session.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

class LibraryCLI {
public:
  explicit LibraryCLI(LibrarySession& session)
    : session_(session), settings_(session.settings()), running_(true) {
    listener_ = session_.status().add_listener([this](StatusEvent event, const LibraryStatus::Snapshot& snap){
      on_status(event, snap);
    });
  }

  ~LibraryCLI() {
    session_.status().remove_listener(listener_);
  }

  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      auto line = trim_copy(*input);
      if(line.empty()) continue;

      std::istringstream iss(line);
      std::string cmd;
      iss >> cmd;
      std::string args;
      std::getline(iss, args);
      args = trim_copy(args);

      if(cmd == "status" || cmd == "st") {
        print_status();
      } else if(cmd == "songs" || cmd == "ls") {
        list_global_songs(args);
      } else if(cmd == "get") {
        if(!args.empty() && std::all_of(args.begin(), args.end(), ::isdigit)) {
          download_command(args);
        } else {
          handle_settings_command(args.empty() ? "get" : "get " + args);
        }
      } else if(cmd == "refresh") {
        session_.refresh();
        std::cout << "Refreshing song list...\n";
      } else if(cmd == "connect") {
        session_.connect();
      } else if(cmd == "disconnect") {
        session_.disconnect();
      } else if(cmd == "toggle") {
        session_.toggle_library();
        std::cout << "Library " << (settings_->get<bool>("library_enabled") ? "enabled" : "disabled") << "\n";
      } else if(cmd == "share") {
        share_command(args);
      } else if(cmd == "local") {
        list_local_songs();
      } else if(cmd == "server") {
        server_command(args);
      } else if(cmd == "rescan") {
        session_.rescan();
      } else if(cmd == "settings" || cmd == "s") {
        handle_settings_command(args.empty() ? "list" : args);
      } else if(cmd == "set") {
        handle_settings_command(args.empty() ? "list" : "set " + args);
      } else if(cmd == "save") {
        handle_settings_command("save");
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        std::cout << "Quitting...\n";
        running_ = false;
      } else {
        print_help();
        std::cout << "Unknown command: " << cmd << "\n";
      }
    }
  }

  void stop() { running_ = false; }

private:
  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    {
      std::lock_guard lg(out_m_);
      std::cout << prompt;
      std::cout.flush();
    }
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  void on_status(StatusEvent event, const LibraryStatus::Snapshot& snap) {
    std::lock_guard lg(out_m_);
    if(event == StatusEvent::ProgressChanged && snap.download_progress) {
      const auto& p = *snap.download_progress;
      std::cout << "\r[" << std::setw(3) << p.progress << "%] " << p.song_name << ": " << p.status << "\n";
    } else if(event == StatusEvent::ShareNotified && snap.share_notification) {
      const auto& n = *snap.share_notification;
      std::cout << "\r" << n.peer_display_name << " downloaded \"" << n.song_name << "\" from you\n";
    } else if(event == StatusEvent::TransferFinished && snap.last_transfer) {
      const auto& t = *snap.last_transfer;
      if(t.succeeded()) {
        std::cout << "\rSaved \"" << t.song_name << "\" to " << t.saved_path << "\n";
      } else {
        std::cout << "\rDownload of \"" << t.song_name << "\" failed: " << t.error->describe() << "\n";
      }
    } else if(event == StatusEvent::ConnectionChanged) {
      if(snap.connected == was_connected_) return;
      was_connected_ = snap.connected;
      std::cout << "\r" << (snap.connected ? "Connected to song library" : "Disconnected from song library") << "\n";
    } else if(event == StatusEvent::ErrorChanged && snap.last_error) {
      std::cout << "\rError: " << snap.last_error->describe() << "\n";
    } else {
      return;
    }
    std::cout.flush();
  }

  void print_status() {
    auto snap = session_.status().snapshot();
    std::cout << "Name:       " << session_.display_name() << "\n";
    std::cout << "Identity:   " << session_.client_identity() << "\n";
    std::cout << "Library:    " << (settings_->get<bool>("library_enabled") ? "enabled" : "disabled") << "\n";
    std::cout << "Server:     " << settings_->get<std::string>("discovery_url")
              << " (" << to_string(snap.discovery_state) << ")\n";
    std::cout << "Address:    " << (snap.transport_address.empty() ? "-" : snap.transport_address) << "\n";
    std::cout << "Connected:  " << (snap.connected ? "yes" : "no") << "\n";
    std::cout << "Peers:      " << snap.online_peers << "\n";
    std::cout << "Songs:      " << snap.global_catalog.size() << " available\n";
    std::cout << "Share all:  " << (session_.catalog()->share_all() ? "on" : "off") << "\n";
    if(snap.download_progress) {
      std::cout << "Download:   " << snap.download_progress->song_name << " "
                << snap.download_progress->progress << "% " << snap.download_progress->status << "\n";
    }
    if(snap.last_error) {
      std::cout << "Last error: " << snap.last_error->describe() << "\n";
    }
  }

  void list_global_songs(const std::string& filter) {
    auto catalog = session_.status().global_catalog();
    if(catalog.empty()) {
      std::cout << (session_.status().connected() ? "No songs shared by other peers.\n"
                                                  : "Not connected. Use 'connect' or 'toggle'.\n");
      return;
    }
    auto needle = to_lower_copy(filter);
    for(std::size_t i = 0; i < catalog.size(); ++i) {
      const auto& entry = catalog[i];
      if(!needle.empty() &&
         to_lower_copy(entry.song.name).find(needle) == std::string::npos &&
         to_lower_copy(entry.display_name).find(needle) == std::string::npos) {
        continue;
      }
      std::cout << std::setw(4) << i << "  " << entry.song.name
                << "  [" << entry.display_name << "]"
                << "  " << format_size(entry.song.size);
      if(entry.song.bpm) std::cout << "  " << *entry.song.bpm << " bpm";
      if(entry.song.duration) std::cout << "  " << std::fixed << std::setprecision(1) << *entry.song.duration << "s";
      std::cout << "\n";
    }
  }

  void download_command(const std::string& index_text) {
    auto catalog = session_.status().global_catalog();
    std::size_t index = 0;
    try {
      index = static_cast<std::size_t>(std::stoul(index_text));
    } catch(const std::exception&) {
      std::cout << "Usage: get <index>\n";
      return;
    }
    if(index >= catalog.size()) {
      std::cout << "No song at index " << index << ". Run 'songs' to list.\n";
      return;
    }
    session_.request_song(catalog[index]);
  }

  void list_local_songs() {
    auto songs = session_.local_songs();
    if(songs.empty()) {
      std::cout << "No songs in the album directory.\n";
      return;
    }
    auto catalog = session_.catalog();
    for(const auto& song : songs) {
      std::cout << (catalog->is_shared(song) ? " * " : "   ")
                << song.name << "  " << format_size(song.size) << "  " << song.path << "\n";
    }
  }

  void share_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;
    std::string rest;
    std::getline(iss, rest);
    rest = trim_copy(rest);

    if(action.empty() || action == "list") {
      auto catalog = session_.catalog();
      std::cout << "Share all: " << (catalog->share_all() ? "on" : "off") << "\n";
      for(const auto& path : catalog->shared_paths()) {
        std::cout << "  " << path << "\n";
      }
      return;
    }
    if(action == "all") {
      auto value = to_lower_copy(rest);
      bool enabled = value.empty() ? !session_.catalog()->share_all()
                                   : (value == "on" || value == "true" || value == "1");
      session_.set_share_all(enabled);
      std::cout << "Share all: " << (enabled ? "on" : "off") << "\n";
      return;
    }
    if(action == "add" || action == "remove") {
      if(rest.empty()) {
        std::cout << "Usage: share " << action << " <path>\n";
        return;
      }
      auto path = resolve_song_path(rest);
      if(action == "add") {
        session_.share_song(path);
        std::cout << "Sharing " << path << "\n";
      } else {
        session_.unshare_song(path);
        std::cout << "No longer sharing " << path << "\n";
      }
      return;
    }
    std::cout << "Usage: share [list|all [on|off]|add <path>|remove <path>]\n";
  }

  // Accepts a song name or a path relative to the album directory.
  std::string resolve_song_path(const std::string& token) {
    for(const auto& song : session_.local_songs()) {
      if(song.name == token || std::filesystem::path(song.path).filename() == token) {
        return song.path;
      }
    }
    std::filesystem::path candidate(token);
    if(candidate.is_relative()) {
      candidate = session_.workspace_root() / settings_->get<std::string>("album_dir") / candidate;
    }
    return CatalogProvider::normalize_path(candidate.string());
  }

  void server_command(const std::string& url) {
    if(url.empty()) {
      std::cout << "Discovery server: " << settings_->get<std::string>("discovery_url") << "\n";
      return;
    }
    if(!session_.set_discovery_server(url)) {
      std::cout << "Invalid server URL '" << url << "'\n";
      return;
    }
    std::cout << "Discovery server set to " << url << "\n";
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action.empty() || action == "list") {
      auto keys = settings_->keys();
      std::sort(keys.begin(), keys.end());
      for(const auto& key : keys) {
        std::cout << key << " = " << settings_->value_as_string(key) << "\n";
      }
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        std::cout << "Usage: get <key>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = trim_copy(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      if(*resolved == "discovery_url") {
        server_command(value);
        return;
      }
      std::string error;
      if(!settings_->set_from_string(*resolved, value, error)) {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
        return;
      }
      if(*resolved == "share_all") {
        session_.set_share_all(settings_->get<bool>("share_all"));
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        std::cout << "Saved settings to " << settings_->settings_path() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    std::cout << "Unknown settings command.\n";
  }

  static std::string format_size(uint64_t bytes) {
    std::ostringstream out;
    if(bytes >= 1024 * 1024) {
      out << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    } else if(bytes >= 1024) {
      out << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KB";
    } else {
      out << bytes << " B";
    }
    return out.str();
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                          Show this help message\n";
    std::cout << "  quit                              Exit the application\n";
    std::cout << "  status                            Show connection and download state\n";
    std::cout << "  songs|ls [filter]                 List songs shared by other peers\n";
    std::cout << "  get <index>                       Download a song from the list\n";
    std::cout << "  refresh                           Fetch the song list now\n";
    std::cout << "  connect | disconnect              Join or leave the song library\n";
    std::cout << "  toggle                            Enable/disable the library (persisted)\n";
    std::cout << "  share [list]                      Show the share policy\n";
    std::cout << "  share all [on|off]                Share every song in the album\n";
    std::cout << "  share add|remove <song|path>      Edit the shared song list\n";
    std::cout << "  local                             List album songs (* = shared)\n";
    std::cout << "  rescan                            Re-read the album directory\n";
    std::cout << "  server [url]                      Show or change the discovery server\n";
    std::cout << "  settings [list|get|set|save]      Manage runtime settings\n";
    std::cout << "  set [key value]                   Shortcut for settings set (lists when empty)\n";
    std::cout << "  get <key>                         Shortcut for settings get\n";
    std::cout << "  save                              Shortcut for settings save\n";
  }

  LibrarySession& session_;
  std::shared_ptr<SettingsManager> settings_;
  std::atomic<bool> running_;
  std::mutex out_m_;
  LibraryStatus::ListenerHandle listener_ = 0;
  bool was_connected_ = false;
};
