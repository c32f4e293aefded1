#include <pocketbase/cli/command_executor.hpp>

#include <pocketbase/client/status_policy.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/records/collection.hpp>

#include <chrono>
#include <fstream>
#include <sstream>

namespace pocketbase {

namespace {

Error MakeValidationError(const std::string& message) {
    return Error{"CLI", "", std::nullopt, message, ErrorKind::InvalidArgument};
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

// Split "name=value"; the value may itself contain '='.
Result<std::pair<std::string, std::string>, Error> SplitAssignment(
    const std::string& text, const std::string& flag) {
    using R = Result<std::pair<std::string, std::string>, Error>;
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return R::Err(MakeValidationError(
            "Invalid " + flag + " '" + text + "', expected name=value"));
    }
    return R::Ok({text.substr(0, eq), text.substr(eq + 1)});
}

Result<std::string, Error> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(
            MakeValidationError("Cannot read file '" + path + "'"));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string, Error>::Ok(ss.str());
}

std::string BaseName(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string AuthCollection(const CommandArgs& args, const AppConfig& config) {
    return args.collection.empty() ? config.auth.collection : args.collection;
}

void SaveSessionFile(const PocketBase& client, const AppConfig& config) {
    auto path = SessionFilePath(config);
    auto saved = client.SaveSession(path);
    if (saved.IsErr()) {
        LogWarn("cli", "Could not save session: " + saved.Error().message);
    }
}

void PrintSession(const OutputFormatter& fmt, const AuthSession& session,
                  const std::string& title, bool show_token) {
    if (fmt.IsJsonMode()) {
        nlohmann::json j = session;
        if (!show_token) {
            j.erase("token");
        }
        fmt.PrintJson(j.dump());
        return;
    }
    DetailSection root;
    root.entries = {
        {"id", session.record.id},
        {"email", session.record.email},
        {"collection", session.record.collection_name},
        {"verified", session.record.verified ? "true" : "false"},
    };
    if (show_token) {
        root.entries.emplace_back("token", session.token);
    }
    fmt.PrintDetail(title, {root});
}

// ---------------------------------------------------------------------------
// Record commands
// ---------------------------------------------------------------------------
int HandleList(const Collection& collection, const CommandArgs& args,
               const OutputFormatter& fmt) {
    ListOptions opts;
    opts.page = args.page;
    opts.per_page = args.per_page;
    opts.sort = args.sort;
    opts.filter = args.filter;
    opts.expand = args.expand;
    opts.skip_total = args.skip_total;

    auto result = collection.GetList(opts);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& list = result.Value();
    if (fmt.IsJsonMode()) {
        nlohmann::json j = {
            {"page", list.page},
            {"perPage", list.per_page},
            {"totalItems", list.total_items},
            {"totalPages", list.total_pages},
            {"items", list.items},
        };
        fmt.PrintJson(j.dump());
        return 0;
    }
    fmt.PrintRecords(list.items);
    std::string footer = "Page " + std::to_string(list.page);
    if (list.total_pages >= 0) {
        footer += " of " + std::to_string(list.total_pages) + ", " +
                  std::to_string(list.total_items) + " record(s) total";
    }
    fmt.PrintSuccess(footer);
    return 0;
}

int HandleGet(const Collection& collection, const CommandArgs& args,
              const OutputFormatter& fmt) {
    GetOneOptions opts;
    opts.expand = args.expand;
    auto result = collection.GetOne(args.target, opts);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintRecord(collection.Name().Value() + "/" + args.target, result.Value());
    return 0;
}

int HandleFirst(const Collection& collection, const CommandArgs& args,
                const OutputFormatter& fmt) {
    FirstItemOptions opts;
    opts.sort = args.sort;
    opts.filter = args.filter;
    opts.expand = args.expand;
    auto result = collection.GetFirstListItem(opts);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& record = result.Value();
    fmt.PrintRecord(collection.Name().Value() + "/" + StringMember(record, "id").value_or(""),
                    record);
    return 0;
}

int HandleAll(const Collection& collection, const CommandArgs& args,
              const OutputFormatter& fmt) {
    FullListOptions opts;
    if (args.batch_size) {
        opts.batch_size = *args.batch_size;
    }
    opts.sort = args.sort;
    opts.filter = args.filter;
    opts.expand = args.expand;
    auto result = collection.GetFullList(opts);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintRecords(result.Value());
    if (!fmt.IsJsonMode()) {
        fmt.PrintSuccess(std::to_string(result.Value().size()) + " record(s)");
    }
    return 0;
}

void PrintMeta(const OutputFormatter& fmt, const RecordMeta& meta, const std::string& verb) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json(meta).dump());
        return;
    }
    fmt.PrintSuccess(verb + " " + meta.collection_name + "/" + meta.id +
                     " (updated " + meta.updated + ")");
}

Result<RecordMeta, Error> CreateRecord(const Collection& collection,
                                       const CommandArgs& args) {
    if (!args.files.empty()) {
        auto form = BuildMultipartForm(args);
        if (form.IsErr()) {
            return Result<RecordMeta, Error>::Err(form.Error());
        }
        return collection.CreateMultipart(form.Value());
    }
    auto body = BuildRecordBody(args);
    if (body.IsErr()) {
        return Result<RecordMeta, Error>::Err(body.Error());
    }
    return collection.Create(body.Value());
}

int HandleCreate(const Collection& collection, const CommandArgs& args,
                 const OutputFormatter& fmt) {
    auto result = CreateRecord(collection, args);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintMeta(fmt, result.Value(), "Created");
    return 0;
}

int HandleUpdate(const Collection& collection, const CommandArgs& args,
                 const OutputFormatter& fmt) {
    auto body = BuildRecordBody(args);
    if (body.IsErr()) {
        return Fail(fmt, body.Error());
    }
    auto result = collection.Update(args.target, body.Value());
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintMeta(fmt, result.Value(), "Updated");
    return 0;
}

int HandleDelete(const Collection& collection, const CommandArgs& args,
                 const OutputFormatter& fmt) {
    auto result = collection.Delete(args.target);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintSuccess("Deleted " + collection.Name().Value() + "/" + args.target);
    return 0;
}

// ---------------------------------------------------------------------------
// Auth commands
// ---------------------------------------------------------------------------
int HandleLogin(const Collection& collection, const AppConfig& config,
                PocketBase& client, const OutputFormatter& fmt) {
    if (config.auth.identity.empty()) {
        return Fail(fmt, MakeValidationError(
            "Missing identity. Use --identity or auth.identity in the config file."));
    }
    if (config.auth.password.empty()) {
        return Fail(fmt, MakeValidationError(
            "Missing password. Use --password, --password-env or auth.password_env."));
    }
    auto result = collection.AuthWithPassword(config.auth.identity, config.auth.password);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    SaveSessionFile(client, config);
    PrintSession(fmt, result.Value(), "Logged in", false);
    return 0;
}

int HandleRefresh(const Collection& collection, const AppConfig& config,
                  PocketBase& client, const OutputFormatter& fmt) {
    if (!client.IsAuthenticated()) {
        return Fail(fmt, MakeValidationError(
            "No session to refresh. Run 'login' first."));
    }
    auto result = collection.AuthRefresh();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    SaveSessionFile(client, config);
    PrintSession(fmt, result.Value(), "Session refreshed", false);
    return 0;
}

int HandleImpersonate(const Collection& collection, const CommandArgs& args,
                      const AppConfig& config, const OutputFormatter& fmt) {
    ImpersonateOptions opts;
    if (args.duration) {
        if (*args.duration <= 0) {
            return Fail(fmt, MakeValidationError("--duration must be positive"));
        }
        opts.duration = static_cast<std::uint64_t>(*args.duration);
    }
    auto result = collection.Impersonate(args.target, opts);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    auto impersonated = std::move(result).Value();
    auto session = impersonated.AuthStore();
    if (!session) {
        return Fail(fmt, Error{"Impersonate", "", std::nullopt,
                               "Impersonated client holds no session",
                               ErrorKind::Unexpected});
    }
    if (args.save_session) {
        SaveSessionFile(impersonated, config);
    }
    PrintSession(fmt, *session, "Impersonating " + args.target, true);
    return 0;
}

int HandleVerify(const Collection& collection, const CommandArgs& args,
                 const OutputFormatter& fmt) {
    auto result = collection.RequestVerification(args.target);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintSuccess("Verification email requested for " + args.target);
    return 0;
}

} // anonymous namespace

std::string SessionFilePath(const AppConfig& config) {
    return config.session_file.value_or(kDefaultSessionFile);
}

Result<PocketBase, Error> BuildClient(const AppConfig& config) {
    HttpTransportOptions opts;
    opts.connect_timeout = std::chrono::seconds(config.timeouts.connect_seconds);
    opts.read_timeout = std::chrono::seconds(config.timeouts.read_seconds);
    opts.write_timeout = std::chrono::seconds(config.timeouts.read_seconds);
    opts.disable_tls_verify = config.insecure;

    auto client = PocketBase::Create(config.url, opts);
    if (client.IsErr()) {
        return client;
    }

    auto path = SessionFilePath(config);
    std::ifstream existing(path);
    if (existing.good()) {
        existing.close();
        auto loaded = client.Value().LoadSession(path);
        if (loaded.IsErr()) {
            LogWarn("cli", "Ignoring session file: " + loaded.Error().message);
        }
    }
    return client;
}

Result<nlohmann::json, Error> BuildRecordBody(const CommandArgs& args) {
    using R = Result<nlohmann::json, Error>;
    auto body = nlohmann::json::object();
    if (args.data) {
        body = nlohmann::json::parse(*args.data, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return R::Err(MakeValidationError("--data must be a JSON object"));
        }
    }
    for (const auto& field : args.fields) {
        auto kv = SplitAssignment(field, "--field");
        if (kv.IsErr()) {
            return R::Err(kv.Error());
        }
        body[kv.Value().first] = kv.Value().second;
    }
    if (body.empty()) {
        return R::Err(MakeValidationError("Nothing to send. Use --data or --field."));
    }
    return R::Ok(std::move(body));
}

Result<MultipartForm, Error> BuildMultipartForm(const CommandArgs& args) {
    using R = Result<MultipartForm, Error>;
    if (args.data) {
        return R::Err(MakeValidationError(
            "--data cannot be combined with --file; use --field for text values"));
    }
    MultipartForm form;
    for (const auto& field : args.fields) {
        auto kv = SplitAssignment(field, "--field");
        if (kv.IsErr()) {
            return R::Err(kv.Error());
        }
        form.push_back(TextField(kv.Value().first, kv.Value().second));
    }
    for (const auto& file : args.files) {
        auto kv = SplitAssignment(file, "--file");
        if (kv.IsErr()) {
            return R::Err(kv.Error());
        }
        auto content = ReadFile(kv.Value().second);
        if (content.IsErr()) {
            return R::Err(content.Error());
        }
        form.push_back(FileField(kv.Value().first, BaseName(kv.Value().second),
                                 std::move(content).Value()));
    }
    return R::Ok(std::move(form));
}

int ExecuteCommand(const CommandArgs& args,
                   const AppConfig& config,
                   PocketBase& client,
                   const OutputFormatter& fmt) {
    const bool auth_command = args.command == CommandKind::Login ||
                              args.command == CommandKind::Refresh ||
                              args.command == CommandKind::Impersonate ||
                              args.command == CommandKind::Verify;
    auto name = auth_command ? AuthCollection(args, config) : args.collection;

    auto handle = client.GetCollection(name);
    if (handle.IsErr()) {
        return Fail(fmt, handle.Error());
    }
    const auto& collection = handle.Value();

    switch (args.command) {
        case CommandKind::List:        return HandleList(collection, args, fmt);
        case CommandKind::Get:         return HandleGet(collection, args, fmt);
        case CommandKind::First:       return HandleFirst(collection, args, fmt);
        case CommandKind::All:         return HandleAll(collection, args, fmt);
        case CommandKind::Create:      return HandleCreate(collection, args, fmt);
        case CommandKind::Update:      return HandleUpdate(collection, args, fmt);
        case CommandKind::Delete:      return HandleDelete(collection, args, fmt);
        case CommandKind::Login:       return HandleLogin(collection, config, client, fmt);
        case CommandKind::Refresh:     return HandleRefresh(collection, config, client, fmt);
        case CommandKind::Impersonate: return HandleImpersonate(collection, args, config, fmt);
        case CommandKind::Verify:      return HandleVerify(collection, args, fmt);
    }
    return Fail(fmt, MakeValidationError("Unknown command"));
}

} // namespace pocketbase
