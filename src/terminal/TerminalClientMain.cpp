#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LogHandler.hpp"
#include "MobileReconnectionEngine.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SocketTransport.hpp"
#include "TcpSocketHandler.hpp"
#include "TerminalClient.hpp"

using namespace tt;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

cxxopts::ParseResult parseOrExit(cxxopts::Options& options, int argc,
                                 char** argv) {
  try {
    return options.parse(argc, argv);
  } catch (std::exception& e) {
    handleParseException(e, options);
  }
  // Unreachable, handleParseException exits
  exit(1);
}

GatewaySession loadGatewaySession(const string& path) {
  ifstream in(path);
  if (!in.good()) {
    CLOG(INFO, "stdout") << "Cannot read gateway session " << path << endl;
    exit(1);
  }
  try {
    return GatewaySession::fromJson(json::parse(in));
  } catch (const json::exception& je) {
    CLOG(INFO, "stdout") << "Invalid gateway session " << path << ": "
                         << je.what() << endl;
    exit(1);
  }
}

void saveGatewaySession(const string& path, const GatewaySession& session) {
  ofstream out(path, ios::trunc);
  if (!out.good()) {
    LOG(ERROR) << "Cannot persist gateway session to " << path;
    return;
  }
  out << session.toJson().dump(2);
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ttclient",
                           "Attach to a terminal session that survives "
                           "disconnects");
  options.positional_help("[host]").show_positional_help();
  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("host", "Server host",
       cxxopts::value<std::string>()->default_value("localhost"))  //
      ("p,port", "Server attach port",
       cxxopts::value<int>()->default_value("2122"))  //
      ("http_port", "Server HTTP API port",
       cxxopts::value<int>()->default_value("2123"))  //
      ("w,worktree", "Worktree id to open a terminal in",
       cxxopts::value<std::string>())  //
      ("scope", "Launch profile (terminal, claude, codex, gemini, opencode)",
       cxxopts::value<std::string>()->default_value(""))  //
      ("c,command", "Startup command run in place of an interactive shell",
       cxxopts::value<std::string>()->default_value(""))  //
      ("token", "Bearer token for a server with auth enabled",
       cxxopts::value<std::string>()->default_value(""))  //
      ("mobile",
       "Attach to agent sessions with a gateway session file (see "
       "--gateway_session)")  //
      ("gateway_session", "JSON file holding the gateway session",
       cxxopts::value<std::string>()->default_value(""))  //
      ("session_cache", "Session cache file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("destroy", "Destroy the cached session for this worktree and exit")  //
      ("logtostdout", "Write log to stdout")                               //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;
  options.parse_positional({"host"});

  auto result = parseOrExit(options, argc, argv);
  if (result.count("help")) {
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(0);
  }
  if (result.count("version")) {
    CLOG(INFO, "stdout") << "ttclient version " << TT_VERSION << endl;
    exit(0);
  }
  if (!result.count("worktree")) {
    CLOG(INFO, "stdout") << "--worktree is required" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  LogSettings logSettings;
  logSettings.directory = GetTempDirectory() + "tetherterm";
  logSettings.filenamePrefix = "ttclient";
  logSettings.appendPid = true;
  logSettings.logToStdout = result.count("logtostdout") > 0;
  logSettings.verbosity = result["verbose"].as<int>();
  LogHandler::setupLogFiles(&defaultConf, logSettings);
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("ttclient-main");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  string host = result["host"].as<string>();
  int port = result["port"].as<int>();
  bool mobile = result.count("mobile") > 0;

  EngineTarget target;
  target.endpoint = host + ":" + to_string(port);
  target.worktreeId = result["worktree"].as<string>();
  target.scope = result["scope"].as<string>();
  target.startupCommand = result["command"].as<string>();
  if (mobile && target.scope.empty()) {
    CLOG(INFO, "stdout") << "--mobile requires an agent --scope" << endl;
    exit(1);
  }

  shared_ptr<EventQueue> eventQueue(
      new EventQueue(shared_ptr<Clock>(new SteadyClock())));
  shared_ptr<SessionApi> sessionApi(
      new HttpSessionApi(host, result["http_port"].as<int>(), eventQueue,
                         mobile));
  string cachePath = result["session_cache"].as<string>();
  if (cachePath.empty()) {
    cachePath = FileSessionCache::defaultPath();
  }
  shared_ptr<SessionCache> sessionCache(new FileSessionCache(cachePath));

  SocketEndpoint endpoint;
  endpoint.set_name(host);
  endpoint.set_port(port);
  shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
  shared_ptr<TransportFactory> transportFactory(
      new SocketTransportFactory(socketHandler, endpoint, eventQueue));

  shared_ptr<ReconnectionEngine> engine;
  if (mobile) {
    string sessionPath = result["gateway_session"].as<string>();
    if (sessionPath.empty()) {
      CLOG(INFO, "stdout") << "--mobile requires --gateway_session" << endl;
      exit(1);
    }
    shared_ptr<MobileReconnectionEngine> mobileEngine(
        new MobileReconnectionEngine(
            eventQueue, sessionApi, transportFactory, sessionCache, target,
            loadGatewaySession(sessionPath),
            shared_ptr<Clock>(new SystemClock())));
    mobileEngine->setGatewaySessionListener(
        [sessionPath](const GatewaySession& session) {
          saveGatewaySession(sessionPath, session);
        });
    engine = mobileEngine;
  } else {
    engine.reset(new ReconnectionEngine(eventQueue, sessionApi,
                                        transportFactory, sessionCache,
                                        target));
    if (!result["token"].as<string>().empty()) {
      engine->setAccessToken(result["token"].as<string>());
    }
  }

  if (result.count("destroy")) {
    engine->destroy();
    // Releasing the api joins its request pool, so the DELETE completes
    sessionApi.reset();
    engine.reset();
    eventQueue->runReady();
    CLOG(INFO, "stdout") << "Destroyed cached session for "
                         << target.worktreeId << endl;
    return 0;
  }

  shared_ptr<Console> console(new PseudoTerminalConsole());
  int exitCode;
  {
    TerminalClient terminalClient(console, eventQueue, engine);
    exitCode = terminalClient.run();
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
