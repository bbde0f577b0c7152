#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace netvisor {

namespace {

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.9.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  // 如果当前日志文件不存在，无需轮转
  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto backup = [&](size_t index) {
    return log_dir / (stem + "." + std::to_string(index) + ".log");
  };

  std::error_code ec;

  // 删除最旧的日志文件
  fs::remove(backup(max_files - 1), ec);

  // 从后往前依次重命名：<stem>.8.log -> <stem>.9.log, ...
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
      if (ec) {
        std::cerr << "Failed to rotate " << old_name.string() << ": " << ec.message() << "\n";
      }
    }
  }

  // 把当前日志文件重命名为 <stem>.0.log
  fs::rename(current_log, backup(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate " << current_log.string() << ": " << ec.message() << "\n";
  }
}

}  // namespace

int parse_log_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

bool init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  namespace fs = std::filesystem;

  // 确定日志目录和文件路径
  fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "netvisor.log" : fs::path(log_path);

  // 确保日志目录存在
  std::error_code ec;
  if (actual_path.has_parent_path()) {
    fs::create_directories(actual_path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      return false;
    }
  }

  // 每次启动时轮转日志
  rotate_logs_on_startup(actual_path, max_files);

  try {
    // 文件 sink（每次启动都是新的干净文件）+ stderr 彩色输出
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("netvisor", spdlog::sinks_init_list{file_sink, console_sink});

    logger->set_level(static_cast<spdlog::level::level_enum>(parse_log_level(level)));

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // warn 及以上立即刷新，其余每秒刷新
    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(1));

    // 注册并设为默认 logger
    spdlog::drop("netvisor");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== netvisor started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
    return false;
  }
  return true;
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace netvisor
