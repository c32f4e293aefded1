#include <pocketbase/config/config_loader.hpp>

#include <pocketbase/core/types.hpp>
#include <pocketbase/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <vector>

namespace pocketbase {

namespace {

const AppConfig kDefaults{};

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, ErrorKind::InvalidArgument};
}

void AddFlag(argparse::ArgumentParser& parser, const std::string& name,
             const std::string& help) {
    parser.add_argument(name)
        .help(help)
        .default_value(false)
        .implicit_value(true);
}

void AddQueryFlags(argparse::ArgumentParser& parser) {
    parser.add_argument("--sort").help("Sort expression, e.g. -created,title");
    parser.add_argument("--filter").help("Filter expression, e.g. 'status = true'");
    parser.add_argument("--expand").help("Relations to expand, comma separated");
}

void AddCollectionOption(argparse::ArgumentParser& parser) {
    parser.add_argument("--collection")
        .help("Auth collection (default: auth.collection from config, else 'users')");
}

void ReadQueryFlags(const argparse::ArgumentParser& parser, CommandArgs& args) {
    args.sort = parser.present("--sort");
    args.filter = parser.present("--filter");
    args.expand = parser.present("--expand");
}

void ReadCollectionOption(const argparse::ArgumentParser& parser, CommandArgs& args) {
    if (auto val = parser.present("--collection")) {
        args.collection = *val;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (root["url"]) {
            config.url = root["url"].as<std::string>();
        }

        // -- Auth --
        if (root["auth"]) {
            const auto& auth = root["auth"];
            if (auth["collection"]) {
                config.auth.collection = auth["collection"].as<std::string>();
            }
            if (auth["identity"]) {
                config.auth.identity = auth["identity"].as<std::string>();
            }
            if (auth["password"]) {
                config.auth.password = auth["password"].as<std::string>();
            }
            if (auth["password_env"]) {
                config.auth.password_env = auth["password_env"].as<std::string>();
            }
        }

        // -- Timeouts --
        if (root["timeouts"]) {
            const auto& timeouts = root["timeouts"];
            if (timeouts["connect"]) {
                config.timeouts.connect_seconds = timeouts["connect"].as<int>();
            }
            if (timeouts["read"]) {
                config.timeouts.read_seconds = timeouts["read"].as<int>();
            }
        }

        // -- Options --
        if (root["insecure"]) {
            config.insecure = root["insecure"].as<bool>();
        }
        if (root["session_file"]) {
            config.session_file = root["session_file"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    using argparse::default_arguments;

    argparse::ArgumentParser program("pocketbase-cli", kVersion, default_arguments::help);
    program.add_description("Command-line client for the PocketBase REST API.");

    // Global flags
    program.add_argument("--url")
        .help("PocketBase base URL, e.g. http://127.0.0.1:8090");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--session-file")
        .help("Where the auth session is loaded from and saved to");
    program.add_argument("--timeout")
        .help("Read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("Connect timeout in seconds")
        .scan<'i', int>();
    AddFlag(program, "--insecure", "Skip TLS certificate verification");
    AddFlag(program, "--json", "JSON output");
    AddFlag(program, "--color", "Force colored output");
    AddFlag(program, "--no-color", "Disable colored output");
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    // -- list --
    argparse::ArgumentParser list_cmd("list", kVersion, default_arguments::help);
    list_cmd.add_description("List one page of records");
    list_cmd.add_argument("collection").help("Collection name");
    list_cmd.add_argument("--page").help("Page number (from 1)").scan<'i', int>();
    list_cmd.add_argument("--per-page").help("Records per page").scan<'i', int>();
    AddQueryFlags(list_cmd);
    AddFlag(list_cmd, "--skip-total", "Do not count total items");

    // -- get --
    argparse::ArgumentParser get_cmd("get", kVersion, default_arguments::help);
    get_cmd.add_description("Fetch one record by id");
    get_cmd.add_argument("collection").help("Collection name");
    get_cmd.add_argument("id").help("Record id");
    get_cmd.add_argument("--expand").help("Relations to expand, comma separated");

    // -- first --
    argparse::ArgumentParser first_cmd("first", kVersion, default_arguments::help);
    first_cmd.add_description("Fetch the first record matching a filter");
    first_cmd.add_argument("collection").help("Collection name");
    AddQueryFlags(first_cmd);

    // -- all --
    argparse::ArgumentParser all_cmd("all", kVersion, default_arguments::help);
    all_cmd.add_description("Fetch every record, page by page");
    all_cmd.add_argument("collection").help("Collection name");
    all_cmd.add_argument("--batch").help("Records per request (1-500)").scan<'i', int>();
    AddQueryFlags(all_cmd);

    // -- create --
    argparse::ArgumentParser create_cmd("create", kVersion, default_arguments::help);
    create_cmd.add_description("Create a record from JSON, or from fields and files");
    create_cmd.add_argument("collection").help("Collection name");
    create_cmd.add_argument("--data").help("Record as a JSON object");
    create_cmd.add_argument("--field")
        .help("Text field name=value (repeatable)")
        .append()
        .default_value(std::vector<std::string>{});
    create_cmd.add_argument("--file")
        .help("File field name=path (repeatable, sends multipart)")
        .append()
        .default_value(std::vector<std::string>{});

    // -- update --
    argparse::ArgumentParser update_cmd("update", kVersion, default_arguments::help);
    update_cmd.add_description("Update a record");
    update_cmd.add_argument("collection").help("Collection name");
    update_cmd.add_argument("id").help("Record id");
    update_cmd.add_argument("--data").help("Changed fields as a JSON object");
    update_cmd.add_argument("--field")
        .help("Text field name=value (repeatable)")
        .append()
        .default_value(std::vector<std::string>{});

    // -- delete --
    argparse::ArgumentParser delete_cmd("delete", kVersion, default_arguments::help);
    delete_cmd.add_description("Delete a record");
    delete_cmd.add_argument("collection").help("Collection name");
    delete_cmd.add_argument("id").help("Record id");

    // -- login --
    argparse::ArgumentParser login_cmd("login", kVersion, default_arguments::help);
    login_cmd.add_description("Authenticate with identity and password");
    AddCollectionOption(login_cmd);
    login_cmd.add_argument("--identity").help("Email or username");
    login_cmd.add_argument("--password").help("Password");
    login_cmd.add_argument("--password-env")
        .help("Environment variable containing the password");

    // -- refresh --
    argparse::ArgumentParser refresh_cmd("refresh", kVersion, default_arguments::help);
    refresh_cmd.add_description("Refresh the current session token");
    AddCollectionOption(refresh_cmd);

    // -- impersonate --
    argparse::ArgumentParser impersonate_cmd("impersonate", kVersion, default_arguments::help);
    impersonate_cmd.add_description("Obtain a session for another user (superuser only)");
    impersonate_cmd.add_argument("user_id").help("Record id of the user");
    AddCollectionOption(impersonate_cmd);
    impersonate_cmd.add_argument("--duration")
        .help("Token lifetime in seconds")
        .scan<'i', int>();
    AddFlag(impersonate_cmd, "--save", "Save the impersonated session to the session file");

    // -- verify --
    argparse::ArgumentParser verify_cmd("verify", kVersion, default_arguments::help);
    verify_cmd.add_description("Send a verification email");
    verify_cmd.add_argument("email").help("Email address");
    AddCollectionOption(verify_cmd);

    program.add_subparser(list_cmd);
    program.add_subparser(get_cmd);
    program.add_subparser(first_cmd);
    program.add_subparser(all_cmd);
    program.add_subparser(create_cmd);
    program.add_subparser(update_cmd);
    program.add_subparser(delete_cmd);
    program.add_subparser(login_cmd);
    program.add_subparser(refresh_cmd);
    program.add_subparser(impersonate_cmd);
    program.add_subparser(verify_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;
    auto& config = invocation.config;
    auto& args = invocation.args;

    // Global options
    if (auto val = program.present("--url")) {
        config.url = *val;
    }
    invocation.config_path = program.present("--config");
    config.session_file = program.present("--session-file");
    if (auto val = program.present<int>("--timeout")) {
        config.timeouts.read_seconds = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.timeouts.connect_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.insecure = true;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--color") && program.get<bool>("--no-color")) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    } else if (program.get<bool>("--no-color")) {
        config.color = false;
    }
    config.log_file = program.present("--log-file");
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    // Subcommand
    if (program.is_subcommand_used(list_cmd)) {
        args.command = CommandKind::List;
        args.collection = list_cmd.get<std::string>("collection");
        args.page = list_cmd.present<int>("--page");
        args.per_page = list_cmd.present<int>("--per-page");
        ReadQueryFlags(list_cmd, args);
        args.skip_total = list_cmd.get<bool>("--skip-total");
    } else if (program.is_subcommand_used(get_cmd)) {
        args.command = CommandKind::Get;
        args.collection = get_cmd.get<std::string>("collection");
        args.target = get_cmd.get<std::string>("id");
        args.expand = get_cmd.present("--expand");
    } else if (program.is_subcommand_used(first_cmd)) {
        args.command = CommandKind::First;
        args.collection = first_cmd.get<std::string>("collection");
        ReadQueryFlags(first_cmd, args);
    } else if (program.is_subcommand_used(all_cmd)) {
        args.command = CommandKind::All;
        args.collection = all_cmd.get<std::string>("collection");
        args.batch_size = all_cmd.present<int>("--batch");
        ReadQueryFlags(all_cmd, args);
    } else if (program.is_subcommand_used(create_cmd)) {
        args.command = CommandKind::Create;
        args.collection = create_cmd.get<std::string>("collection");
        args.data = create_cmd.present("--data");
        args.fields = create_cmd.get<std::vector<std::string>>("--field");
        args.files = create_cmd.get<std::vector<std::string>>("--file");
    } else if (program.is_subcommand_used(update_cmd)) {
        args.command = CommandKind::Update;
        args.collection = update_cmd.get<std::string>("collection");
        args.target = update_cmd.get<std::string>("id");
        args.data = update_cmd.present("--data");
        args.fields = update_cmd.get<std::vector<std::string>>("--field");
    } else if (program.is_subcommand_used(delete_cmd)) {
        args.command = CommandKind::Delete;
        args.collection = delete_cmd.get<std::string>("collection");
        args.target = delete_cmd.get<std::string>("id");
    } else if (program.is_subcommand_used(login_cmd)) {
        args.command = CommandKind::Login;
        ReadCollectionOption(login_cmd, args);
        if (auto val = login_cmd.present("--identity")) {
            config.auth.identity = *val;
        }
        if (auto val = login_cmd.present("--password")) {
            config.auth.password = *val;
        }
        if (auto val = login_cmd.present("--password-env")) {
            config.auth.password_env = *val;
        }
    } else if (program.is_subcommand_used(refresh_cmd)) {
        args.command = CommandKind::Refresh;
        ReadCollectionOption(refresh_cmd, args);
    } else if (program.is_subcommand_used(impersonate_cmd)) {
        args.command = CommandKind::Impersonate;
        args.target = impersonate_cmd.get<std::string>("user_id");
        ReadCollectionOption(impersonate_cmd, args);
        args.duration = impersonate_cmd.present<int>("--duration");
        args.save_session = impersonate_cmd.get<bool>("--save");
    } else if (program.is_subcommand_used(verify_cmd)) {
        args.command = CommandKind::Verify;
        args.target = verify_cmd.get<std::string>("email");
        ReadCollectionOption(verify_cmd, args);
    } else {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("No command given. Run with --help for usage."));
    }

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.url.empty()) {
        merged.url = cli_overrides.url;
    }

    // Auth overrides
    if (cli_overrides.auth.collection != kDefaults.auth.collection) {
        merged.auth.collection = cli_overrides.auth.collection;
    }
    if (!cli_overrides.auth.identity.empty()) {
        merged.auth.identity = cli_overrides.auth.identity;
    }
    if (!cli_overrides.auth.password.empty()) {
        merged.auth.password = cli_overrides.auth.password;
    }
    if (cli_overrides.auth.password_env.has_value()) {
        merged.auth.password_env = cli_overrides.auth.password_env;
    }

    // Timeouts
    if (cli_overrides.timeouts.connect_seconds != kDefaults.timeouts.connect_seconds) {
        merged.timeouts.connect_seconds = cli_overrides.timeouts.connect_seconds;
    }
    if (cli_overrides.timeouts.read_seconds != kDefaults.timeouts.read_seconds) {
        merged.timeouts.read_seconds = cli_overrides.timeouts.read_seconds;
    }

    // Options
    if (cli_overrides.insecure) {
        merged.insecure = true;
    }
    if (cli_overrides.session_file.has_value()) {
        merged.session_file = cli_overrides.session_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (config.auth.password.empty() && config.auth.password_env.has_value()) {
        const auto& env_var = *config.auth.password_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.auth.password = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: url"));
    }
    auto url = BaseUrl::Create(config.url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError("Invalid url: " + url.Error()));
    }
    auto collection = CollectionName::Create(config.auth.collection);
    if (collection.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid auth.collection: " + collection.Error()));
    }
    if (config.timeouts.connect_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Connect timeout must be positive, got " +
                            std::to_string(config.timeouts.connect_seconds)));
    }
    if (config.timeouts.read_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Read timeout must be positive, got " +
                            std::to_string(config.timeouts.read_seconds)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace pocketbase
