#include <mcpline/config/config_loader.hpp>
#include <mcpline/core/log.hpp>
#include <mcpline/core/terminal.hpp>
#include <mcpline/core/version.hpp>
#include <mcpline/mcp/mcp_server.hpp>
#include <mcpline/tools/example_tools.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;
constexpr const char* kComponent = "main";

// --version: print and exit before any parsing.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "mcpline " << mcpline::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// Parse the command line, then layer it over the YAML file if one is named.
mcpline::Result<mcpline::AppConfig, mcpline::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace mcpline;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig config = cli.Value();
    if (config.config_file.has_value()) {
        auto file = LoadFromYaml(*config.config_file);
        if (file.IsErr()) {
            return file;
        }
        config = MergeConfigs(file.Value(), cli.Value());
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// Build the diagnostic sink. Never touches stdout.
mcpline::Result<std::unique_ptr<mcpline::ILogSink>, mcpline::Error> MakeLogSink(
    const mcpline::LoggingSection& logging) {
    using namespace mcpline;
    using SinkResult = Result<std::unique_ptr<ILogSink>, Error>;

    const bool json = logging.format.value_or(LogFormat::Text) == LogFormat::Json;

    if (logging.file.has_value()) {
        auto sink = FileSink::Open(*logging.file, json);
        if (!sink) {
            return SinkResult::Err(Error::Make(ErrorCategory::Config, "Logging",
                                               "Cannot open log file: " + *logging.file));
        }
        return SinkResult::Ok(std::unique_ptr<ILogSink>(std::move(sink)));
    }
    if (json) {
        return SinkResult::Ok(
            std::unique_ptr<ILogSink>(std::make_unique<JsonSink>(std::cerr)));
    }
    const bool use_color =
        ResolveColor(logging.color.value_or(ColorMode::Auto), StderrFd());
    return SinkResult::Ok(
        std::unique_ptr<ILogSink>(std::make_unique<ColorConsoleSink>(use_color)));
}

int RunServer(const mcpline::AppConfig& config) {
    using namespace mcpline;

    const auto kind = config.server.toolset.value_or(ToolSetKind::Example);
    auto registry = BuildToolRegistry(kind);
    if (registry.IsErr()) {
        std::cerr << "Error: " << registry.Error().ToString() << "\n";
        return registry.Error().ExitCode();
    }

    auto info = DefaultServerInfo(kind);
    if (config.server.name.has_value()) {
        info.name = *config.server.name;
    }
    if (config.server.version.has_value()) {
        info.version = *config.server.version;
    }

    McpServer server(std::move(registry).Value(), std::move(info),
                     config.server.protocol_version.value_or(kDefaultProtocolVersion));
    InstallTerminationHandlers(server);
    server.Run();
    RemoveTerminationHandlers();

    LogInfo(kComponent, "Server stopped");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcpline;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto config = ResolveConfig(argc, argv);
    if (config.IsErr()) {
        std::cerr << "Error: " << config.Error().message << "\n";
        return config.Error().ExitCode();
    }

    auto sink = MakeLogSink(config.Value().logging);
    if (sink.IsErr()) {
        std::cerr << "Error: " << sink.Error().message << "\n";
        return sink.Error().ExitCode();
    }
    InitGlobalLogger(std::move(sink).Value(),
                     config.Value().logging.level.value_or(kDefaultLogLevel));

    if (config.Value().config_file.has_value()) {
        LogDebug(kComponent, "Loaded config from " + *config.Value().config_file);
    }

    return RunServer(config.Value());
}
