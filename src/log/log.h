#ifndef NETVISOR_LOG_H
#define NETVISOR_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace netvisor {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动服务时，当前的 netvisor.log 会被清空
 * - 上次的日志重命名为 netvisor.0.log
 * - 历史日志依次向后移动：netvisor.0.log -> netvisor.1.log -> ... -> netvisor.9.log
 * - 最旧的日志（netvisor.9.log）被删除
 *
 * 日志同时输出到文件和 stderr（彩色）。
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/netvisor/log/netvisor.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个（netvisor.0.log ~ netvisor.9.log）
 * @param level 日志级别，默认 info
 * @return 初始化是否成功；失败时仍保留 spdlog 默认的控制台 logger
 */
bool init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * 日志级别字符串转换，无法识别时返回 info
 */
int parse_log_level(const std::string& level);

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace netvisor

#endif  // NETVISOR_LOG_H
