#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pocketbase {

struct AuthConfig {
    std::string collection = "users";
    std::string identity;
    std::string password;
    std::optional<std::string> password_env; // env var name to read password from
};

struct TimeoutConfig {
    int connect_seconds = 10;
    int read_seconds = 30;
};

struct AppConfig {
    std::string url;
    AuthConfig auth;
    TimeoutConfig timeouts;
    bool insecure = false;
    std::optional<std::string> session_file;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<bool> color; // unset: follow the terminal
};

enum class CommandKind {
    List,
    Get,
    First,
    All,
    Create,
    Update,
    Delete,
    Login,
    Refresh,
    Impersonate,
    Verify,
};

// Arguments of the selected subcommand. Which fields are meaningful depends
// on `command`; unused ones stay empty.
struct CommandArgs {
    CommandKind command = CommandKind::List;
    std::string collection;
    std::string target;                     // record id, user id or email
    std::optional<std::string> data;        // JSON object body
    std::vector<std::string> fields;        // name=value
    std::vector<std::string> files;         // name=path
    std::optional<int> page;
    std::optional<int> per_page;
    std::optional<int> batch_size;
    std::optional<std::string> sort;
    std::optional<std::string> filter;
    std::optional<std::string> expand;
    bool skip_total = false;
    std::optional<int> duration;
    bool save_session = false;              // impersonate: keep the new session
};

struct CliInvocation {
    AppConfig config;
    std::optional<std::string> config_path;
    CommandArgs args;
};

} // namespace pocketbase
