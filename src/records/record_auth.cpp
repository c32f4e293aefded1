#include <pocketbase/records/collection.hpp>
#include <pocketbase/client/status_policy.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/core/url.hpp>

namespace pocketbase {

namespace {

constexpr const char* kValidationIsEmail = "validation_is_email";
constexpr const char* kValidationRequired = "validation_required";

Result<AuthSession, Error> DecodeSession(const std::string& operation,
                                         const std::string& endpoint,
                                         const std::string& body) {
    auto j = ParseJsonBody(operation, endpoint, body);
    if (j.IsErr()) {
        return Result<AuthSession, Error>::Err(j.Error());
    }
    try {
        auto session = j.Value().get<AuthSession>();
        if (session.token.empty()) {
            return Result<AuthSession, Error>::Err(Error{
                operation, endpoint, std::nullopt,
                std::string(DefaultMessage(ErrorKind::ParseError)) + ": empty token",
                ErrorKind::ParseError});
        }
        return Result<AuthSession, Error>::Ok(std::move(session));
    } catch (const nlohmann::json::exception& e) {
        return Result<AuthSession, Error>::Err(Error{
            operation, endpoint, std::nullopt,
            std::string(DefaultMessage(ErrorKind::ParseError)) + ": " + e.what(),
            ErrorKind::ParseError});
    }
}

// Refine a 400 from auth-with-password using the field codes in `data`.
Error ClassifyAuthBadRequest(const std::string& endpoint, const std::string& body) {
    auto parsed = ParseErrorBody(body);
    const auto& data = parsed.data;

    ErrorKind kind = ErrorKind::InvalidCredentials;
    bool empty_identity = false;
    bool empty_password = false;

    if (data.is_object() && !data.empty()) {
        const bool has_password = data.contains("password");
        auto code = data.contains("identity")
            ? StringMember(data.at("identity"), "code")
            : std::nullopt;
        if (!code) {
            kind = ErrorKind::EmptyField;
            empty_password = has_password;
        } else if (*code == kValidationIsEmail) {
            kind = ErrorKind::IdentityMustBeEmail;
        } else if (*code == kValidationRequired) {
            kind = ErrorKind::EmptyField;
            empty_identity = true;
            empty_password = has_password;
        }
    }

    auto error = Error::FromStatus("AuthWithPassword", endpoint, 400, kind,
                                   parsed.message);
    error.field_errors = ExtractFieldErrors(parsed);
    error.empty_identity = empty_identity;
    error.empty_password = empty_password;
    return error;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// AuthWithPassword
// ---------------------------------------------------------------------------
Result<AuthSession, Error> Collection::AuthWithPassword(std::string_view identity,
                                                        std::string_view password) const {
    using R = Result<AuthSession, Error>;
    auto endpoint = client_.CollectionPath(name_, "/auth-with-password");
    nlohmann::json credentials = {
        {"identity", std::string(identity)},
        {"password", std::string(password)},
    };

    LogInfo("auth", "Authenticating against collection " + name_.Value());
    auto response = client_.SendPostJson(endpoint, credentials, client_.AuthHeaders());
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = "AuthWithPassword";
        return R::Err(std::move(error));
    }

    const auto& http = response.Value();
    auto kind = Classify(StatusPolicy::AuthWithPassword(), http.status_code);
    if (kind) {
        if (http.status_code == 400) {
            auto error = ClassifyAuthBadRequest(endpoint, http.body);
            LogWarn("auth", "Authentication rejected: " + error.KindName());
            return R::Err(std::move(error));
        }
        return R::Err(Error::FromStatus("AuthWithPassword", endpoint,
                                        http.status_code, *kind,
                                        ParseErrorBody(http.body).message));
    }

    auto session = DecodeSession("AuthWithPassword", endpoint, http.body);
    if (session.IsErr()) {
        return session;
    }
    client_.UpdateSession(session.Value());
    LogInfo("auth", "Authenticated as record " + session.Value().record.id);
    return session;
}

// ---------------------------------------------------------------------------
// AuthRefresh / AuthRefreshForUser
// ---------------------------------------------------------------------------
Result<AuthSession, Error> Collection::RefreshWith(const std::string& operation,
                                                   const HttpHeaders& headers) const {
    using R = Result<AuthSession, Error>;
    auto endpoint = client_.CollectionPath(name_, "/auth-refresh");
    auto response = client_.SendPost(endpoint, headers);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = operation;
        return R::Err(std::move(error));
    }
    auto check = CheckResponse(StatusPolicy::AuthRefresh(operation), endpoint,
                               response.Value());
    if (check.IsErr()) {
        return R::Err(check.Error());
    }
    return DecodeSession(operation, endpoint, response.Value().body);
}

Result<AuthSession, Error> Collection::AuthRefresh() const {
    auto session = RefreshWith("AuthRefresh", client_.AuthHeaders());
    if (session.IsOk()) {
        client_.UpdateSession(session.Value());
        LogInfo("auth", "Token refreshed for record " + session.Value().record.id);
    }
    return session;
}

Result<AuthSession, Error> Collection::AuthRefreshForUser(std::string_view token) const {
    HttpHeaders headers{{"Authorization", "Bearer " + std::string(token)}};
    return RefreshWith("AuthRefreshForUser", headers);
}

// ---------------------------------------------------------------------------
// Impersonate
// ---------------------------------------------------------------------------
Result<PocketBase, Error> Collection::Impersonate(std::string_view user_id,
                                                  ImpersonateOptions options) const {
    using R = Result<PocketBase, Error>;
    auto endpoint = client_.CollectionPath(
        name_, "/impersonate/" + UrlEncode(std::string(user_id)));

    auto response = options.duration.has_value()
        ? client_.SendPostForm(endpoint,
                               {TextField("duration", std::to_string(*options.duration))},
                               client_.AuthHeaders())
        : client_.SendPost(endpoint, client_.AuthHeaders());
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = "Impersonate";
        return R::Err(std::move(error));
    }
    auto check = CheckResponse(StatusPolicy::Impersonate(), endpoint, response.Value());
    if (check.IsErr()) {
        return R::Err(check.Error());
    }
    auto session = DecodeSession("Impersonate", endpoint, response.Value().body);
    if (session.IsErr()) {
        return R::Err(std::move(session).Error());
    }
    LogInfo("auth", "Impersonating record " + session.Value().record.id);
    return R::Ok(client_.WithSession(std::move(session).Value()));
}

// ---------------------------------------------------------------------------
// RequestVerification
// ---------------------------------------------------------------------------
Result<void, Error> Collection::RequestVerification(std::string_view email) const {
    auto endpoint = client_.CollectionPath(name_, "/request-verification");
    nlohmann::json body = {{"email", std::string(email)}};
    auto response = client_.SendPostJson(endpoint, body, client_.AuthHeaders());
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = "RequestVerification";
        return Result<void, Error>::Err(std::move(error));
    }
    auto check = CheckResponse(StatusPolicy::RequestVerification(), endpoint,
                               response.Value());
    if (check.IsOk()) {
        LogInfo("auth", "Verification email requested");
    }
    return check;
}

} // namespace pocketbase
