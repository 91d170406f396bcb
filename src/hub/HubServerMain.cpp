#include <cxxopts.hpp>

#include "HubConfig.hpp"
#include "HubServer.hpp"
#include "LogHandler.hpp"
#include "SignatureHandler.hpp"
#include "TcpSocketHandler.hpp"

using namespace sb;

namespace {
std::atomic<HubServer *> activeServer(nullptr);

void shutdownSignalHandler(int sig) {
  HubServer *server = activeServer.load();
  if (server) {
    server->requestShutdown();
  }
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  sb::HandleTerminate();

  cxxopts::Options options("sbserver",
                           "Multi-tenant message hub for terminals");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("8888"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("admin-public-key",
         "Public key of the tenant allowed to use admin services",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory() + "switchboard"))  //
        ("logtostdout", "log to stdout")           //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sbserver version " << SB_VERSION << endl;
      exit(0);
    }

    HubConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      try {
        config = parseHubConfigFile(result["cfgfile"].as<string>(), config);
      } catch (const std::runtime_error &e) {
        CLOG(ERROR, "stdout") << e.what() << endl;
        exit(1);
      }
    }

    // Command line values override the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("admin-public-key")) {
      config.adminPublicKey = result["admin-public-key"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    SignatureHandler::init();
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    optional<KeyPair> adminKeyPair;
    const char *adminPrivateKey = getenv("ADMIN_PRIVATE_KEY");
    if (adminPrivateKey && *adminPrivateKey) {
      try {
        adminKeyPair = SignatureHandler::fromPrivateKey(adminPrivateKey);
      } catch (const std::runtime_error &e) {
        CLOG(ERROR, "stdout") << "Invalid ADMIN_PRIVATE_KEY: " << e.what()
                              << endl;
        exit(1);
      }
    } else if (config.adminPublicKey.empty()) {
      adminKeyPair = SignatureHandler::createKeyPair();
    }
    if (adminKeyPair) {
      config.adminPublicKey = adminKeyPair->publicKey;
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logFile = LogHandler::setupLogFiles(
        &defaultConf, result["logdir"].as<string>(), "sbserver", logToStdout,
        !logToStdout, config.maxLogSize);
    LogHandler::setVerbosity(config.verbose);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("sbserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    LOG(INFO) << "sbserver " << SB_VERSION << " logging to " << logFile;

    if (adminKeyPair) {
      CLOG(INFO, "stdout")
          << "Host Server Started ADMIN_HOST_URL ws://localhost:"
          << config.port << "?public_key=" << adminKeyPair->publicKey
          << "&signature="
          << SignatureHandler::sign(AUTH_CHALLENGE, adminKeyPair->privateKey)
          << endl;
    } else {
      CLOG(INFO, "stdout") << "Host Server Started, admin public key "
                           << config.adminPublicKey << endl;
    }

    ::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    SocketEndpoint serverEndpoint;
    serverEndpoint.set_port(config.port);
    if (config.bindIp.length()) {
      serverEndpoint.set_name(config.bindIp);
    }

    std::unique_ptr<HubServer> server;
    try {
      server.reset(new HubServer(tcpSocketHandler, serverEndpoint, config));
    } catch (const std::runtime_error &e) {
      CLOG(ERROR, "stdout") << "Cannot start server: " << e.what() << endl;
      STFATAL << "Cannot start server: " << e.what();
    }
    activeServer = server.get();
    ::signal(SIGINT, shutdownSignalHandler);
    ::signal(SIGTERM, shutdownSignalHandler);

    server->run();

    activeServer = nullptr;
    server.reset();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
