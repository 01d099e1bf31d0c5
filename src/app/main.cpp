#include "command_processor.hpp"
#include "command_utils.hpp"
#include "config.hpp"

#include "common/logger.hpp"
#include "service/synchronized_tracker.hpp"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{

// 内置演示：三个用户、一个项目、一个 CRITICAL bug 和一个 LOW task，最后由 Manager 审批
const std::vector<std::string>& demoScript()
{
    static const std::vector<std::string> lines = {
        "CREATE_USER U1 Alice QA alice@example.com",
        "CREATE_USER U2 Bob DEV bob@example.com",
        "CREATE_USER M1 Carol MANAGER carol@example.com",
        "CREATE_PROJECT P1 Alpha https://repo/alpha",
        "ADD_MEMBER P1 U1",
        "ADD_MEMBER P1 U2",
        "ADD_MEMBER P1 M1",
        R"(CREATE_ISSUE I1 "NullPointer in Login" "NPE when user logs in" CRITICAL bug)",
        R"(CREATE_ISSUE I2 "UI alignment" "Button misaligned on mobile" LOW task)",
        "ADD_ISSUE P1 I1",
        "ADD_ISSUE P1 I2",
        "ATTACH I1 screenshot.png",
        "TAG I1 login",
        "ASSIGN I1 U2",
        "STATUS I2 IN_PROGRESS",
        "DASHBOARD P1",
        "REPORT P1",
        "LIST_ISSUES",
        "APPROVE M1 I1",
        "LIST_ISSUES",
    };
    return lines;
}

bool isQuitCommand(const std::string& line)
{
    return line == "quit" || line == "exit" || line == "q";
}

// 执行一行并打印响应，返回该命令是否成功
bool runLine(trk::app::CommandProcessor& processor, const std::string& line, bool pretty)
{
    auto resp = processor.executeLine(line);
    std::cout << trk::protocol::serialize(resp, pretty ? 2 : -1) << '\n';
    return resp.ok();
}

// 逐行读取并执行；空行和 # 开头的注释行跳过。返回是否全部成功
bool runStream(std::istream& in, trk::app::CommandProcessor& processor, bool pretty, bool prompt)
{
    bool        allOk = true;
    std::string line;

    for (;;)
    {
        if (prompt)
        {
            std::cout << "> " << std::flush;
        }
        if (!std::getline(in, line))
        {
            break;
        }

        const std::string trimmed = trk::app::utils::trimCopy(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            continue;
        }
        if (isQuitCommand(trimmed))
        {
            break;
        }
        allOk = runLine(processor, trimmed, pretty) && allOk;
    }
    return allOk;
}

} // namespace

int main(int argc, char** argv)
{
    // 用法：tracker_cli [--demo | --script <file>] [--pretty] [--log-level <level>]
    // 也可通过环境变量 TRK_LOG_LEVEL 设置默认日志级别。
    const std::string        program = argc > 0 ? argv[0] : "tracker_cli";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    std::string error;
    auto        cfg = trk::app::parseCliArgs(args, std::getenv(trk::app::kLogLevelEnv), error);
    if (!cfg)
    {
        std::cerr << program << ": " << error << '\n' << trk::app::usageText(program);
        return 1;
    }
    if (cfg->showHelp)
    {
        std::cout << trk::app::usageText(program);
        return 0;
    }

    trk::setLogLevel(cfg->logLevel);

    trk::service::SynchronizedTracker tracker;
    trk::app::CommandProcessor        processor(tracker);

    if (cfg->runDemo)
    {
        trk::log(trk::LogLevel::Info, "Running built-in demo");
        bool allOk = true;
        for (const auto& line : demoScript())
        {
            allOk = runLine(processor, line, cfg->pretty) && allOk;
        }
        return allOk ? 0 : 2;
    }

    if (!cfg->scriptPath.empty())
    {
        std::ifstream in(cfg->scriptPath);
        if (!in)
        {
            trk::log(trk::LogLevel::Error, "Cannot open script: " + cfg->scriptPath);
            return 1;
        }
        trk::log(trk::LogLevel::Info, "Running script " + cfg->scriptPath);
        return runStream(in, processor, cfg->pretty, false) ? 0 : 2;
    }

    // 交互模式：只有终端输入时才打印提示符，失败的命令不影响退出码
    const bool interactive = isatty(STDIN_FILENO) != 0;
    if (interactive)
    {
        std::cout << "Issue tracker. Type HELP for commands, quit to exit.\n";
    }
    runStream(std::cin, processor, cfg->pretty, interactive);
    trk::log(trk::LogLevel::Info, "Session closed");
    return 0;
}
