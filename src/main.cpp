#include <pocketbase/cli/command_executor.hpp>
#include <pocketbase/cli/output_formatter.hpp>
#include <pocketbase/config/config_loader.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/core/terminal.hpp>
#include <pocketbase/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

// --version is only honoured before the subcommand.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "pocketbase-cli " << pocketbase::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') {
            break;
        }
    }
    return false;
}

// Errors raised before the config is known still honour --json.
bool JsonRequested(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") {
            return true;
        }
    }
    return false;
}

void InitLogging(const pocketbase::AppConfig& config) {
    using namespace pocketbase;

    auto level = LogLevel::Warn;
    if (config.verbose) {
        level = LogLevel::Debug;
    } else if (config.quiet) {
        level = LogLevel::Error;
    }

    std::unique_ptr<ILogSink> sink = std::make_unique<ColorConsoleSink>(
        ResolveColor(config.color, IsStderrTty()));
    if (config.log_file) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file);
        if (file_sink->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file_sink));
        } else {
            std::cerr << "warning: cannot open log file " << *config.log_file << "\n";
        }
    }
    InitGlobalLogger(std::move(sink), level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace pocketbase;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    OutputFormatter early_fmt(JsonRequested(argc, argv));

    auto invocation = LoadFromCli(argc, argv);
    if (invocation.IsErr()) {
        early_fmt.PrintError(invocation.Error());
        return invocation.Error().ExitCode();
    }
    auto cli = std::move(invocation).Value();

    AppConfig config = cli.config;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            early_fmt.PrintError(yaml.Error());
            return yaml.Error().ExitCode();
        }
        config = MergeConfigs(yaml.Value(), cli.config);
    }

    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        early_fmt.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        early_fmt.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    InitLogging(config);
    LogDebug("config", "Base URL " + config.url);

    OutputFormatter fmt(config.json_output, ResolveColor(config.color, IsStdoutTty()));

    auto client = BuildClient(config);
    if (client.IsErr()) {
        fmt.PrintError(client.Error());
        return client.Error().ExitCode();
    }
    return ExecuteCommand(cli.args, config, client.Value(), fmt);
}
