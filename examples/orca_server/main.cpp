/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 */

/**
 * @file main.cpp
 * @brief Line-delimited JSON-RPC front end for the orca dispatcher.
 *
 * stdin carries requests, stdout carries replies and progress notifications,
 * the log goes to stderr (and optionally a file). Each tools/call runs on
 * its own thread so a blocking wait never stalls other requests.
 *
 * Run: ./orca_server [--config orca.json] [--sync] [--disable tool]...
 *                    [--log-file path] [--log-level debug]
 */

#include "orca/command_catalog.hpp"
#include "orca/config.hpp"
#include "orca/dispatcher.hpp"
#include "orca/hints.hpp"
#include "orca/log.hpp"
#include "orca/notifier.hpp"
#include "orca/operation_registry.hpp"
#include "orca/settings.hpp"
#include "orca/shutdown.hpp"
#include "orca/task_group.hpp"
#include "orca/tool_protocol.hpp"
#include "orca/worker_pool.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace {

struct CliOptions {
  const char* config_path = nullptr;
  bool sync = false;
  std::vector<std::string> disabled;
  const char* log_file = nullptr;
  const char* log_level = nullptr;
};

void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s [--config FILE] [--sync] [--disable TOOL]...\n"
               "          [--log-file FILE] [--log-level LEVEL]\n",
               prog);
}

bool ParseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    const bool has_next = (i + 1) < argc;
    if (std::strcmp(a, "--sync") == 0) {
      opts.sync = true;
    } else if (std::strcmp(a, "--config") == 0 && has_next) {
      opts.config_path = argv[++i];
    } else if (std::strcmp(a, "--disable") == 0 && has_next) {
      opts.disabled.emplace_back(argv[++i]);
    } else if (std::strcmp(a, "--log-file") == 0 && has_next) {
      opts.log_file = argv[++i];
    } else if (std::strcmp(a, "--log-level") == 0 && has_next) {
      opts.log_level = argv[++i];
    } else {
      return false;
    }
  }
  return true;
}

/// Serializes whole lines onto stdout.
class StdoutWriter {
 public:
  void WriteLine(const orca::json& j) {
    const std::string line = j.dump() + "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fflush(stdout);
  }

 private:
  std::mutex mutex_;
};

class Server {
 public:
  Server(orca::Dispatcher& dispatcher, std::shared_ptr<orca::ChannelSender> channel,
         StdoutWriter& out)
      : dispatcher_(dispatcher), channel_(std::move(channel)), out_(out) {}

  ~Server() { JoinRequests(); }

  void StartProgressPump() {
    pump_ = std::thread([this] {
      for (;;) {
        auto update = channel_->Pop(std::chrono::milliseconds(200));
        if (update.has_value()) {
          out_.WriteLine(orca::ProgressToJson(*update));
        } else if (channel_->IsClosed() && channel_->Size() == 0U) {
          return;
        }
      }
    });
  }

  void StopProgressPump() {
    channel_->Close();
    if (pump_.joinable()) pump_.join();
  }

  void HandleLine(const std::string& line) {
    if (line.empty()) return;
    auto msg = orca::ParseRpcLine(line);
    if (!msg.has_value()) {
      out_.WriteLine(orca::MakeRpcError(nullptr, msg.get_error(),
                                        msg.get_error() == orca::RpcErrorCode::kParseError
                                            ? "parse error"
                                            : "invalid request"));
      return;
    }
    const orca::json& req = msg.value();
    const std::string method = req["method"].get<std::string>();
    const bool is_notification = !req.contains("id");
    const orca::json id = is_notification ? orca::json(nullptr) : req["id"];

    if (method == "initialize") {
      out_.WriteLine(orca::MakeRpcResult(id, orca::InitializeResult()));
    } else if (method == "ping") {
      out_.WriteLine(orca::MakeRpcResult(id, orca::json::object()));
    } else if (method == "tools/list") {
      out_.WriteLine(orca::MakeRpcResult(id, orca::ToolListJson(dispatcher_.Tools())));
    } else if (method == "tools/call") {
      const orca::json params = req.contains("params") ? req["params"] : orca::json::object();
      SpawnRequest(id, params);
    } else if (is_notification) {
      ORCA_LOG_DEBUG("Server", "ignoring notification %s", method.c_str());
    } else {
      out_.WriteLine(orca::MakeRpcError(id, orca::RpcErrorCode::kMethodNotFound,
                                        "method not found: " + method));
    }
  }

  /// @brief Wait for in-flight calls; later calls are refused.
  void JoinRequests() { (void)requests_.CloseAndJoin(); }

 private:
  // Finished request threads are joined on the next spawn.
  void SpawnRequest(const orca::json& id, const orca::json& params) {
    const bool spawned = requests_.Spawn([this, id, params] {
      auto parsed = orca::ParseToolCall(params);
      if (!parsed.has_value()) {
        out_.WriteLine(orca::MakeRpcResult(id, orca::ToolErrorToJson(parsed.get_error())));
        return;
      }
      auto reply = dispatcher_.Invoke(parsed.value(), channel_);
      if (!reply.has_value()) {
        out_.WriteLine(orca::MakeRpcResult(id, orca::ToolErrorToJson(reply.get_error())));
        return;
      }
      out_.WriteLine(orca::MakeRpcResult(id, orca::ReplyToJson(reply.value())));
    });
    if (!spawned) {
      out_.WriteLine(orca::MakeRpcResult(
          id, orca::ToolErrorToJson(orca::MakeToolError(orca::ToolErrorCode::kShuttingDown,
                                                        "server is shutting down"))));
    }
  }

  orca::Dispatcher& dispatcher_;
  std::shared_ptr<orca::ChannelSender> channel_;
  StdoutWriter& out_;
  std::thread pump_;
  orca::TaskGroup requests_;
};

/// @brief Read stdin until EOF or shutdown, feeding complete lines to @p server.
void ReadLoop(Server& server, orca::ShutdownManager& shutdown) {
  std::string pending;
  char buf[4096];
  while (!shutdown.IsShutdownRequested()) {
    struct pollfd fds[2];
    fds[0].fd = STDIN_FILENO;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = shutdown.WakeupFd();
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      ORCA_LOG_ERROR("Server", "poll failed: %s", std::strerror(errno));
      shutdown.Quit(0);
      break;
    }
    if ((fds[1].revents & POLLIN) != 0) break;
    if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      ORCA_LOG_INFO("Server", "stdin closed");
      shutdown.Quit(0);
      break;
    }
    pending.append(buf, static_cast<size_t>(n));
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      server.HandleLine(line);
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions cli;
  if (!ParseArgs(argc, argv, cli)) {
    PrintUsage(argv[0]);
    return 2;
  }

  orca::MultiConfig cfg;
  if (cli.config_path != nullptr) {
    auto loaded = cfg.LoadFile(cli.config_path);
    if (!loaded.has_value()) {
      std::fprintf(stderr, "orca: cannot load %s: %s\n", cli.config_path,
                   orca::ConfigErrorMessage(loaded.get_error()));
      return 2;
    }
  }
  auto settings_r = orca::LoadSettings(cfg);
  if (!settings_r.has_value()) {
    std::fprintf(stderr, "orca: invalid configuration: %s\n",
                 orca::ConfigErrorMessage(settings_r.get_error()));
    return 2;
  }
  orca::OrcaSettings settings = settings_r.value();
  if (cli.sync) settings.dispatcher.synchronous_mode = true;
  for (const auto& tool : cli.disabled) settings.dispatcher.disabled_tools.insert(tool);
  if (cli.log_file != nullptr) settings.log_file = cli.log_file;
  if (cli.log_level != nullptr && !orca::log::ParseLevel(cli.log_level, settings.log_level)) {
    std::fprintf(stderr, "orca: unknown log level '%s'\n", cli.log_level);
    return 2;
  }

  if (!orca::log::Init(settings.log_file.empty() ? nullptr : settings.log_file.c_str())) {
    std::fprintf(stderr, "orca: logger already initialized\n");
  }
  orca::log::SetLevel(settings.log_level);
  ORCA_LOG_INFO("Server", "orca %s starting (%s mode, program %s)", orca::kServerVersion,
                settings.dispatcher.synchronous_mode ? "synchronous" : "async",
                settings.program.c_str());

  orca::OperationRegistry registry(settings.monitor);
  orca::WorkerPool pool(settings.pool);
  orca::NotificationDispatcher notifier;
  orca::HintEngine hints(settings.hints);
  const orca::CommandCatalog catalog = orca::CommandCatalog::Default(settings.program);
  orca::Dispatcher dispatcher(registry, pool, notifier, hints, catalog, settings.dispatcher);

  auto reg_started = registry.Start();
  if (!reg_started.has_value()) {
    ORCA_LOG_WARN("Server", "registry sweep not armed (timer error %u)",
                  static_cast<unsigned>(reg_started.get_error()));
  }
  auto pool_started = pool.Start();
  if (!pool_started.has_value()) {
    ORCA_LOG_WARN("Server", "pool maintenance not armed (timer error %u)",
                  static_cast<unsigned>(pool_started.get_error()));
  }

  orca::ShutdownManager shutdown;
  // LIFO: dispatcher tasks drain first, then the pool, then the registry.
  const bool registered =
      shutdown
          .Register([](int, void* r) { static_cast<orca::OperationRegistry*>(r)->Shutdown(); },
                    &registry)
          .has_value() &&
      shutdown.Register([](int, void* p) { static_cast<orca::WorkerPool*>(p)->Shutdown(); }, &pool)
          .has_value() &&
      shutdown
          .Register([](int, void* d) { static_cast<orca::Dispatcher*>(d)->Shutdown(); },
                    &dispatcher)
          .has_value();
  if (!registered) {
    ORCA_LOG_WARN("Server", "shutdown callbacks not registered; relying on destructors");
  }
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    ORCA_LOG_WARN("Server", "signal handlers not installed");
  }

  StdoutWriter out;
  auto channel = std::make_shared<orca::ChannelSender>(1024);
  {
    Server server(dispatcher, channel, out);
    server.StartProgressPump();
    ReadLoop(server, shutdown);
    ORCA_LOG_INFO("Server", "shutting down (signal %d)", shutdown.Signal());
    shutdown.RunCallbacks();
    server.JoinRequests();
    server.StopProgressPump();
  }

  orca::log::Shutdown();
  return 0;
}
