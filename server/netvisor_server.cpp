// netvisor_server.cpp: NetVisor 控制面服务
//  - 加载配置：配置文件 < 环境变量 < 命令行
//  - 初始化日志、打开 daemon 存储
//  - 启动 io_context 工作线程和会话回收任务
//  - SIGINT / SIGTERM 优雅退出

#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <optional>
#include <string>

#include "log/log.h"
#include "netvisor/netvisor.hpp"

using namespace netvisor;

namespace {

struct CliOptions {
  std::optional<std::string> config_file;
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<std::string> log_level;
  bool help = false;
  bool version = false;
};

void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <file>   Config file (default: .netvisor/config.json, ~/.config/netvisor/config.json)\n"
            << "      --host <addr>     Listen address\n"
            << "      --port <port>     Listen port\n"
            << "      --log-level <lvl> trace|debug|info|warn|error|off\n"
            << "  -h, --help            Show this help\n"
            << "  -v, --version         Show version\n";
}

// 解析命令行参数，出错时返回错误信息
std::optional<std::string> parse_args(int argc, char* argv[], CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto next = [&](std::string& out) -> bool {
      if (i + 1 >= argc) return false;
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "-v" || arg == "--version") {
      opts.version = true;
    } else if (arg == "-c" || arg == "--config") {
      if (!next(value)) return "Missing value for " + arg;
      opts.config_file = value;
    } else if (arg == "--host") {
      if (!next(value)) return "Missing value for " + arg;
      opts.host = value;
    } else if (arg == "--port") {
      if (!next(value)) return "Missing value for " + arg;
      try {
        auto port = std::stoul(value);
        if (port == 0 || port > 65535) return "Invalid port: " + value;
        opts.port = static_cast<uint16_t>(port);
      } catch (const std::exception&) {
        return "Invalid port: " + value;
      }
    } else if (arg == "--log-level") {
      if (!next(value)) return "Missing value for " + arg;
      opts.log_level = value;
    } else {
      return "Unknown option: " + arg;
    }
  }
  return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (auto err = parse_args(argc, argv, opts)) {
    std::cerr << "Error: " << *err << "\n\n";
    print_usage(argv[0]);
    return 2;
  }
  if (opts.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (opts.version) {
    std::cout << "netvisor " << version() << "\n";
    return 0;
  }

  // ----- 加载配置 -----
  auto loaded = opts.config_file ? ServerConfig::load(*opts.config_file) : ServerConfig::load_default();
  if (loaded.failed()) {
    std::cerr << "Error: " << loaded.error->message << "\n";
    return 1;
  }
  ServerConfig config = std::move(*loaded.value);
  config.apply_env();

  if (opts.host) config.server.host = *opts.host;
  if (opts.port) config.server.port = *opts.port;
  if (opts.log_level) config.log_level = *opts.log_level;

  // ----- 初始化日志 -----
  if (!init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level)) {
    std::cerr << "Warning: file logging disabled\n";
  }
  spdlog::info("netvisor {} starting, storage={}, data_dir={}", version(), config.storage, config.data_dir.string());

  // ----- 创建控制面 -----
  auto plane = ControlPlane::create(config);
  if (plane.failed()) {
    spdlog::critical("Failed to start control plane: {}", plane.error->describe());
    return 1;
  }
  auto& control_plane = **plane.value;

  // ----- 信号处理 -----
  std::promise<int> shutdown;
  auto shutdown_future = shutdown.get_future();
  asio::signal_set signals(control_plane.io_context(), SIGINT, SIGTERM);
  signals.async_wait([&shutdown](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, shutting down", signo);
    shutdown.set_value(signo);
  });

  control_plane.start();
  spdlog::info("Control plane ready on {}:{}", config.server.host, config.server.port);

  shutdown_future.wait();
  control_plane.stop();

  spdlog::info("=== netvisor stopped ===");
  spdlog::shutdown();
  return EXIT_SUCCESS;
}
