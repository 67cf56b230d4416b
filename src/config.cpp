#include <config.hpp>
#include <boost/program_options.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <vector>

namespace po = boost::program_options;

namespace NWorkspace {

    namespace {

        spdlog::level::level_enum ParseLevel(const std::string& name) {
            auto level = spdlog::level::from_str(name);
            if (level == spdlog::level::off && name != "off") {
                throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Unknown log level " + name);
            }
            return level;
        }

    } // namespace

    std::optional<TAppConfig> ParseConfig(int argc, const char* const argv[], std::ostream& out) {
        TAppConfig config;
        std::string dataDir;
        std::string remoteDir;
        std::string logFile;
        std::string configFile;
        size_t attempts = 0;
        long long baseMs = 0;
        long long maxMs = 0;

        po::options_description description{"Workspace manager"};
        description.add_options()("help,h", "Show the help message")(
            "config,c", po::value<std::string>(&configFile), "Config file with key=value lines")(
            "data-dir,d", po::value<std::string>(&dataDir)->default_value(config.DataDir.string()), "Directory for the registry and the local cache")(
            "remote-dir,r", po::value<std::string>(&remoteDir)->default_value(config.RemoteDir.string()), "Directory standing in for the remote store")(
            "log-level,l", po::value<std::string>(&config.LogLevel)->default_value(config.LogLevel), "trace, debug, info, warn, err, critical or off")(
            "log-file", po::value<std::string>(&logFile), "Also write the log to this file")(
            "account,a", po::value<std::string>(&config.Account), "Publish the workspace list under this name so other devices can load it")(
            "retry-attempts", po::value<size_t>(&attempts)->default_value(config.Retry.MaxAttempts), "Attempts per remote call")(
            "retry-base-ms", po::value<long long>(&baseMs)->default_value(config.Retry.BaseDelay.count()), "First retry delay")(
            "retry-max-ms", po::value<long long>(&maxMs)->default_value(config.Retry.MaxDelay.count()), "Retry delay cap");

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, description), vm);
            if (vm.count("config")) {
                auto path = vm["config"].as<std::string>();
                std::ifstream ifs(path);
                if (!ifs) {
                    throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Cannot open config file " + path);
                }
                po::store(po::parse_config_file(ifs, description), vm);
            }
            po::notify(vm);
        } catch (const po::error& e) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, e.what());
        }

        if (vm.count("help")) {
            out << description << std::endl;
            return std::nullopt;
        }

        if (baseMs < 0 || maxMs < 0) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Retry delays cannot be negative");
        }
        ParseLevel(config.LogLevel);

        config.DataDir = dataDir;
        config.RemoteDir = remoteDir;
        if (!logFile.empty()) {
            config.LogFile = logFile;
        }
        config.Retry.MaxAttempts = std::max<size_t>(attempts, 1);
        config.Retry.BaseDelay = std::chrono::milliseconds(baseMs);
        config.Retry.MaxDelay = std::chrono::milliseconds(std::max(maxMs, baseMs));
        return config;
    }

    void SetupLogging(const TAppConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.LogFile) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.LogFile->string(), false));
        }

        auto logger = std::make_shared<spdlog::logger>("workspace", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
        spdlog::set_level(ParseLevel(config.LogLevel));
    }

} // namespace NWorkspace
