#include "netdiag/cli/router.hpp"

#include "agent/agent_config.hpp"
#include "agent/autostart.hpp"
#include "agent/locality_table.hpp"
#include "agent/server_url.hpp"
#include "core/errors/exit_codes.hpp"
#include "hostprobe/host_identity.hpp"
#include "probe/probe_runner.hpp"
#include "probe/process_launcher.hpp"
#include "session/probe_dispatcher.hpp"
#include "session/websocket_session.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace netdiag::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

// Shared by `help` and every usage error.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  netdiag-agent [run] [--config <config.json>] "
         "[--log-level <debug|info|warn|error>] [--log-file <path>]\n"
      << "  netdiag-agent probe <ping|tracert> <target>\n"
      << "  netdiag-agent version\n";
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "netdiag-agent " << kAgentVersion << '\n';
  return kExitSuccess;
}

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--log-file") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-file";
        return false;
      }
      options.log_file = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }

  if (options.config_path.empty()) {
    options.config_path = fs::path(std::string(agent::kDefaultConfigFileName));
  }
  return true;
}

// Opens the log mirror in append mode. A log file that cannot be opened only
// costs the mirror; console logging keeps working.
void AttachLogFile(const fs::path& path, std::ofstream& stream, core::logging::Logger& logger) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  stream.open(path, std::ios::out | std::ios::app);
  if (!stream) {
    logger.Warn("failed to open log file", {
                                               {"path", path.string()},
                                               {"error", ec ? ec.message() : "open failed"},
                                           });
    return;
  }
  logger.AddMirror(stream);
}

void RegisterAutostartIfEnabled(const agent::AgentConfig& config,
                                const RunOptions& options,
                                core::logging::Logger& logger) {
  if (!config.autostart) {
    logger.Debug("autostart disabled in config");
    return;
  }

  fs::path executable = agent::CurrentExecutablePath().value_or(fs::path{});
  if (executable.empty() && !options.invoked_as.empty()) {
    std::error_code ec;
    executable = fs::absolute(options.invoked_as, ec);
    if (ec) {
      executable.clear();
    }
  }

  std::string error;
  if (!agent::RegisterAutostart(executable, options.config_path, error)) {
    logger.Warn("autostart registration failed", {{"error", error}});
    return;
  }
  logger.Info("autostart registered", {{"executable", executable.string()}});
}

int CommandRun(const std::vector<std::string_view>& args, const fs::path& invoked_as) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  options.invoked_as = invoked_as;

  return ExecuteAgentRun(options);
}

int CommandProbe(const std::vector<std::string_view>& args) {
  if (args.size() != 2U) {
    std::cerr << "error: probe requires exactly 2 arguments: <ping|tracert> <target>\n";
    return kExitUsage;
  }

  core::logging::Logger logger(core::logging::LogLevel::kWarn);
  probe::SystemProcessLauncher launcher;
  probe::ProbeRunner runner(launcher, logger);

  const probe::ProbeOutcome outcome = runner.Run(args[0], std::string(args[1]));
  std::cout << probe::ToWireString(outcome) << '\n';
  return outcome.ok() ? kExitSuccess : kExitFailure;
}

} // namespace

int ExecuteAgentRun(const RunOptions& options) {
  // The mirror stream is declared first so it outlives every logger write.
  std::ofstream log_stream;
  core::logging::Logger logger(options.log_level.value_or(core::logging::LogLevel::kInfo));

  agent::AgentConfig config;
  bool created = false;
  std::string error;
  if (!agent::LoadOrCreateAgentConfig(options.config_path, agent::LocalityTable::Default(),
                                      config, created, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  logger.SetMinLevel(options.log_level.value_or(config.log_level));
  AttachLogFile(options.log_file.value_or(config.log_file), log_stream, logger);
  logger.SetAgentId(config.agreement_id);
  if (created) {
    logger.Info("default config written", {{"path", options.config_path.string()}});
  }

  agent::ServerEndpoint endpoint;
  if (!agent::ParseServerUrl(config.server_url, endpoint, error)) {
    logger.Error("invalid server url", {{"error", error}});
    return kExitConfigInvalid;
  }

  logger.Info("agent starting", {
                                    {"version", kAgentVersion},
                                    {"server_url", config.server_url},
                                    {"city", config.city},
                                    {"max_concurrent_probes",
                                     std::to_string(config.max_concurrent_probes)},
                                });

  RegisterAutostartIfEnabled(config, options, logger);

  session::SessionIdentity identity{
      .agreement_id = config.agreement_id,
      .city = config.city,
      .host = hostprobe::CollectHostIdentity(),
  };

  probe::SystemProcessLauncher launcher;
  probe::ProbeRunner runner(launcher, logger, config.probe);
  session::ThreadPoolProbeDispatcher dispatcher(runner, config.max_concurrent_probes);
  session::WebSocketSession session(
      session::WebSocketSessionOptions{
          .endpoint = endpoint,
          .reconnect_delay = config.reconnect_delay,
          .handle_signals = true,
      },
      std::move(identity), dispatcher, logger);

  const core::errors::ExitCode exit_code = session.Run();
  logger.Info("agent exiting", {{"exit_code", std::to_string(core::errors::ToInt(exit_code))}});
  return core::errors::ToInt(exit_code);
}

int Dispatch(int argc, char** argv) {
  const fs::path invoked_as = argc > 0 ? fs::path(argv[0]) : fs::path{};
  if (argc < 2) {
    return CommandRun({}, invoked_as);
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "run") {
    return CommandRun(args, invoked_as);
  }

  if (command == "probe") {
    return CommandProbe(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  // `netdiag-agent --config x.json` reads as an implicit `run`.
  if (!command.empty() && command.front() == '-') {
    const std::vector<std::string_view> run_args(argv + 1, argv + argc);
    return CommandRun(run_args, invoked_as);
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace netdiag::cli
