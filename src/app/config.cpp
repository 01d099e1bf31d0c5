#include "config.hpp"

namespace trk::app
{

std::optional<CliConfig> parseCliArgs(const std::vector<std::string>& args,
                                      const char*                     envLogLevel,
                                      std::string&                    error)
{
    CliConfig cfg;

    if (envLogLevel && *envLogLevel != '\0')
    {
        if (auto level = parseLogLevel(envLogLevel))
        {
            cfg.logLevel = *level;
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help")
        {
            cfg.showHelp = true;
        }
        else if (arg == "--demo")
        {
            cfg.runDemo = true;
        }
        else if (arg == "--pretty")
        {
            cfg.pretty = true;
        }
        else if (arg == "--log-level")
        {
            if (i + 1 >= args.size())
            {
                error = "--log-level: missing value";
                return std::nullopt;
            }
            auto level = parseLogLevel(args[++i]);
            if (!level)
            {
                error = "--log-level: invalid value: " + args[i];
                return std::nullopt;
            }
            cfg.logLevel = *level;
        }
        else if (arg == "--script")
        {
            if (i + 1 >= args.size())
            {
                error = "--script: missing file path";
                return std::nullopt;
            }
            cfg.scriptPath = args[++i];
        }
        else
        {
            error = "unknown option: " + arg;
            return std::nullopt;
        }
    }

    if (cfg.runDemo && !cfg.scriptPath.empty())
    {
        error = "--demo and --script cannot be combined";
        return std::nullopt;
    }
    return cfg;
}

std::string usageText(const std::string& program)
{
    return "Usage: " + program + " [--demo | --script <file>] [--pretty] [--log-level debug|info|warn|error]\n"
           "  Reads one command per line from stdin unless --demo or --script is given.\n"
           "  Type HELP for the command list, quit / exit / q to leave.\n"
           "  Environment: " + std::string(kLogLevelEnv) + " sets the default log level.\n";
}

} // namespace trk::app
