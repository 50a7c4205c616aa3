#include <cxxopts.hpp>

#include "HttpApiServer.hpp"
#include "LogHandler.hpp"
#include "DaemonCreator.hpp"
#include "PseudoTerminalProcess.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"
#include "TerminalServer.hpp"

using namespace tt;

cxxopts::ParseResult parseOrExit(cxxopts::Options &options, int argc,
                                 char **argv) {
  try {
    return options.parse(argc, argv);
  } catch (const std::exception &e) {
    CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);
  // Broken attach sockets are reported through write errors
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ttserver",
                           "Keeps terminal sessions alive between clients");
  options.allow_unrecognised_options();

  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("port", "Port for attach connections",
       cxxopts::value<int>()->default_value("0"))  //
      ("http_port", "Port for the HTTP session API",
       cxxopts::value<int>()->default_value("0"))  //
      ("bindip", "IP to listen on",
       cxxopts::value<string>()->default_value(""))  //
      ("daemon", "Daemonize the server")             //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("worktree", "A worktree the server may open, as id=path",
       cxxopts::value<vector<string>>())  //
      ("shell", "Shell used for every session",
       cxxopts::value<std::string>()->default_value(""))  //
      ("auth", "Require bearer tokens")                    //
      ("project", "Project id tokens are issued for",
       cxxopts::value<std::string>()->default_value(""))  //
      ("logtostdout", "log to stdout")                    //
      ("logdir", "Directory for log files",
       cxxopts::value<std::string>()->default_value(""))  //
      ("pidfile", "Location of the pid file",
       cxxopts::value<std::string>()->default_value(
           "/var/run/ttserver.pid"))  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;

  auto result = parseOrExit(options, argc, argv);

  if (result.count("help")) {
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(0);
  }
  if (result.count("version")) {
    CLOG(INFO, "stdout") << "ttserver version " << TT_VERSION << endl;
    exit(0);
  }

  LogSettings logSettings;
  logSettings.directory = GetTempDirectory() + "tetherterm";
  logSettings.filenamePrefix = "ttserver";
  logSettings.redirectStderrToFile = !result.count("logtostdout");
  logSettings.logToStdout = result.count("logtostdout") > 0;

  int port = 0;
  int httpPort = 0;
  string bindIp = "";
  bool authEnabled = false;
  string projectId = "";
  map<string, string> worktrees;
  if (!result["cfgfile"].as<string>().empty()) {
    // Load the config file
    CSimpleIniA ini(true, false, false);
    string cfgfilename = result["cfgfile"].as<string>();
    SI_Error rc = ini.LoadFile(cfgfilename.c_str());
    if (rc != 0) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    const char *portString = ini.GetValue("Networking", "port", NULL);
    if (portString) {
      port = stoi(portString);
    }
    const char *httpPortString = ini.GetValue("Networking", "http_port", NULL);
    if (httpPortString) {
      httpPort = stoi(httpPortString);
    }
    const char *bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
    if (bindIpPtr) {
      bindIp = string(bindIpPtr);
    }

    authEnabled = bool(stoi(ini.GetValue("Auth", "enabled", "0")));
    projectId = ini.GetValue("Auth", "project", "");

    const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
    if (vlevel) {
      logSettings.verbosity = atoi(vlevel);
    }
    // read silent setting
    const char *silent = ini.GetValue("Debug", "silent", NULL);
    if (silent && atoi(silent) != 0) {
      logSettings.silent = true;
    }
    // read log file size limit
    const char *logsize = ini.GetValue("Debug", "logsize", NULL);
    if (logsize && atoi(logsize) != 0) {
      // make sure maxlogsize is a string of int value
      logSettings.maxLogSize = string(logsize);
    }

    CSimpleIniA::TNamesDepend keys;
    ini.GetAllKeys("Worktrees", keys);
    for (const auto &key : keys) {
      worktrees[key.pItem] = ini.GetValue("Worktrees", key.pItem, "");
    }
  }

  // Command line wins over the config file
  if (result["port"].as<int>() != 0) {
    port = result["port"].as<int>();
  }
  if (result["http_port"].as<int>() != 0) {
    httpPort = result["http_port"].as<int>();
  }
  if (!result["bindip"].as<string>().empty()) {
    bindIp = result["bindip"].as<string>();
  }
  if (result.count("auth")) {
    authEnabled = true;
  }
  if (!result["project"].as<string>().empty()) {
    projectId = result["project"].as<string>();
  }
  if (result["verbose"].as<int>() != 0) {
    logSettings.verbosity = result["verbose"].as<int>();
  }
  if (!result["logdir"].as<string>().empty()) {
    logSettings.directory = result["logdir"].as<string>();
  }
  if (result.count("worktree")) {
    for (const auto &entry : result["worktree"].as<vector<string>>()) {
      size_t equals = entry.find('=');
      if (equals == string::npos || equals == 0) {
        CLOG(INFO, "stdout") << "Invalid --worktree (expected id=path): "
                             << entry << endl;
        exit(1);
      }
      worktrees[entry.substr(0, equals)] = entry.substr(equals + 1);
    }
  }

  if (port == 0) {
    port = 2122;
  }
  if (httpPort == 0) {
    httpPort = 2123;
  }
  if (authEnabled && projectId.empty()) {
    projectId = "default";
  }

  if (result.count("daemon")) {
    if (DaemonCreator::create(true, result["pidfile"].as<string>()) == -1) {
      STFATAL << "Error creating daemon: " << strerror(GetErrno());
    }
  }

  GOOGLE_PROTOBUF_VERIFY_VERSION;

  LogHandler::setupLogFiles(&defaultConf, logSettings);
  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);
  // set thread name
  el::Helpers::setThreadName("ttserver-main");
  // Install log rotation callback
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  string shell = result["shell"].as<string>();
  if (shell.empty()) {
    shell = SessionRegistry::defaultShell();
  }
  LOG(INFO) << "Serving " << worktrees.size() << " worktrees with shell "
            << shell;

  shared_ptr<TerminalProcessFactory> processFactory(
      new PseudoTerminalProcessFactory());
  shared_ptr<SessionRegistry> registry(
      new SessionRegistry(processFactory, shell));
  registry->subscribe([](const SessionLifecycleEvent &event) {
    if (event.created) {
      return;
    }
    LOG(INFO) << "Session " << event.sessionId << " closed ("
              << sessionCloseReasonName(event.reason) << ")"
              << (event.exitCode ? " exit code " + to_string(*event.exitCode)
                                 : string());
  });

  shared_ptr<TokenAuthority> tokenAuthority;
  if (authEnabled) {
    tokenAuthority.reset(new TokenAuthority(
        shared_ptr<Clock>(new SystemClock()),
        TokenAuthority::DEFAULT_LIFETIME_MS));
    GatewaySession pairing = tokenAuthority->issue(projectId);
    // The first gateway session is how a client gets paired
    CLOG(INFO, "stdout") << pairing.toJson().dump() << endl;
  }

  shared_ptr<TerminalApi> api(
      new TerminalApi(registry, worktrees, tokenAuthority, projectId));
  HttpApiServer httpServer(api);
  string httpHost = bindIp.empty() ? "0.0.0.0" : bindIp;
  thread httpThread([&httpServer, httpHost, httpPort]() {
    el::Helpers::setThreadName("http-api");
    if (!httpServer.listen(httpHost, httpPort)) {
      STERROR << "Could not serve HTTP API on " << httpHost << ":" << httpPort;
    }
  });

  shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
  SocketEndpoint serverEndpoint;
  serverEndpoint.set_port(port);
  if (bindIp.length()) {
    serverEndpoint.set_name(bindIp);
  }
  try {
    TerminalServer terminalServer(tcpSocketHandler, serverEndpoint, registry,
                                  tokenAuthority, projectId);
    terminalServer.run();
  } catch (const std::runtime_error &re) {
    STERROR << "Terminal server stopped: " << re.what();
  }

  httpServer.stop();
  httpThread.join();
  registry->destroyAll();

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
