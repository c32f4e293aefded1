#pragma once

#include <pocketbase/cli/output_formatter.hpp>
#include <pocketbase/client/pocketbase.hpp>
#include <pocketbase/config/app_config.hpp>
#include <pocketbase/core/multipart.hpp>
#include <pocketbase/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace pocketbase {

// Session file used when neither --session-file nor session_file is set.
inline constexpr const char* kDefaultSessionFile = ".pocketbase-session.json";

// Effective session file path for `config`.
std::string SessionFilePath(const AppConfig& config);

// Client for config.url with the configured timeouts. A readable session
// file is loaded; a malformed one is reported as a warning and ignored.
Result<PocketBase, Error> BuildClient(const AppConfig& config);

// Record body from --data (a JSON object) with every --field name=value
// applied on top as a string.
Result<nlohmann::json, Error> BuildRecordBody(const CommandArgs& args);

// Multipart form from --field name=value and --file name=path. Files are
// read from disk; --data is not allowed together with --file.
Result<MultipartForm, Error> BuildMultipartForm(const CommandArgs& args);

// ---------------------------------------------------------------------------
// ExecuteCommand: run one subcommand against `client`.
//
// Writes results through `fmt` and returns the process exit code: 0 on
// success, Error::ExitCode() on failure. Auth commands save the new session
// to SessionFilePath(config).
// ---------------------------------------------------------------------------
int ExecuteCommand(const CommandArgs& args,
                   const AppConfig& config,
                   PocketBase& client,
                   const OutputFormatter& fmt);

} // namespace pocketbase
