#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>

#include "LibraryCLI.hpp"
#include "command_line_parser.hpp"
#include "discovery_server.hpp"
#include "library_session.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    LibrarySession::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "songmesh");
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("songmesh");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    std::unique_ptr<DiscoveryServer> discovery_server;
    if(settings->get<bool>("host_discovery")) {
      int port = settings->get<int>("discovery_port");
      if(port < 0 || port > 65535) {
        logger->error("Invalid discovery_port '{}'", port);
        return 1;
      }
      DiscoveryServer::Options server_options;
      server_options.listen_ip = settings->get<std::string>("listen_ip");
      server_options.port = static_cast<uint16_t>(port);
      discovery_server = std::make_unique<DiscoveryServer>(server_options, logger);
      discovery_server->start();
      discovery_server->start_background();
      logger->print("Discovery server listening on {}", discovery_server->base_url());
    }

    LibrarySession session(settings, options);
    session.start();
    session.start_background();
    logger->print("{} ready. Type 'help' for commands.", session.display_name());

    LibraryCLI cli(session);
    cli.run_loop();

    session.stop();
    if(discovery_server) discovery_server->stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("songmesh-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
