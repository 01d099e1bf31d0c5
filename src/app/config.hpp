#pragma once

#include "common/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trk::app
{

// tracker_cli 的运行配置
struct CliConfig
{
    bool        runDemo{false};   // --demo：运行内置演示脚本
    bool        pretty{false};    // --pretty：JSON 缩进输出
    bool        showHelp{false};  // -h / --help
    LogLevel    logLevel{LogLevel::Info};
    std::string scriptPath;       // --script <file>：从文件读取命令，为空表示读标准输入
};

// 环境变量名：提供默认日志级别，可被 --log-level 覆盖
inline constexpr const char* kLogLevelEnv = "TRK_LOG_LEVEL";

// 解析命令行参数（不含程序名）。
// envLogLevel 为 TRK_LOG_LEVEL 的值（可为 nullptr），非法值会被忽略并保留默认级别。
// 参数非法时返回 std::nullopt，并把原因写入 error。
std::optional<CliConfig> parseCliArgs(const std::vector<std::string>& args,
                                      const char*                     envLogLevel,
                                      std::string&                    error);

std::string usageText(const std::string& program);

} // namespace trk::app
