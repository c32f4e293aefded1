#include <pocketbase/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace pocketbase {

const char* DefaultMessage(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:
            return "Bad request: the server rejected the request";
        case ErrorKind::InvalidCredentials:
            return "Invalid credentials: identity and/or password is wrong";
        case ErrorKind::EmptyField:
            return "Empty credential field: identity and/or password is empty";
        case ErrorKind::IdentityMustBeEmail:
            return "Given identity is not a valid email";
        case ErrorKind::Unauthorized:
            return "Unauthorized: the request requires a valid authorization token";
        case ErrorKind::Forbidden:
            return "Forbidden: the authenticated record is not allowed to perform this action";
        case ErrorKind::NotFound:
            return "Not found: the requested resource could not be found";
        case ErrorKind::TooManyRequests:
            return "Too many requests: the server is rate limiting requests";
        case ErrorKind::Unreachable:
            return "Unreachable: communication with the PocketBase API failed";
        case ErrorKind::ParseError:
            return "Could not parse response into the expected data structure";
        case ErrorKind::Unexpected:
            return "Unexpected response from the PocketBase API";
        case ErrorKind::InvalidArgument:
            return "Invalid argument";
    }
    return "Unexpected response from the PocketBase API";
}

Error Error::FromStatus(const std::string& operation,
                        const std::string& endpoint,
                        int status_code,
                        ErrorKind kind,
                        const std::string& server_message) {
    std::string message = DefaultMessage(kind);
    if (kind == ErrorKind::Unexpected) {
        message = "Unhandled HTTP status " + std::to_string(status_code);
    }
    if (!server_message.empty()) {
        message += " (" + server_message + ")";
    }
    Error error;
    error.operation = operation;
    error.endpoint = endpoint;
    error.http_status = status_code;
    error.message = std::move(message);
    error.kind = kind;
    return error;
}

int Error::ExitCode() const {
    switch (kind) {
        case ErrorKind::Unreachable:         return 1;
        case ErrorKind::Unauthorized:        return 2;
        case ErrorKind::InvalidCredentials:  return 2;
        case ErrorKind::EmptyField:          return 2;
        case ErrorKind::IdentityMustBeEmail: return 2;
        case ErrorKind::Forbidden:           return 3;
        case ErrorKind::NotFound:            return 4;
        case ErrorKind::BadRequest:          return 5;
        case ErrorKind::TooManyRequests:     return 6;
        case ErrorKind::ParseError:          return 7;
        case ErrorKind::InvalidArgument:     return 64;
        case ErrorKind::Unexpected:          return 99;
    }
    return 99;
}

std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::BadRequest:          return "bad_request";
        case ErrorKind::InvalidCredentials:  return "invalid_credentials";
        case ErrorKind::EmptyField:          return "empty_field";
        case ErrorKind::IdentityMustBeEmail: return "identity_must_be_email";
        case ErrorKind::Unauthorized:        return "unauthorized";
        case ErrorKind::Forbidden:           return "forbidden";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::TooManyRequests:     return "too_many_requests";
        case ErrorKind::Unreachable:         return "unreachable";
        case ErrorKind::ParseError:          return "parse_error";
        case ErrorKind::Unexpected:          return "unexpected";
        case ErrorKind::InvalidArgument:     return "invalid_argument";
    }
    return "unexpected";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    for (const auto& field : field_errors) {
        oss << "\n  " << field.name << ": " << field.code;
        if (!field.message.empty()) {
            oss << " " << field.message;
        }
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["kind"] = KindName();
    j["operation"] = operation;
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (!field_errors.empty()) {
        auto fields = nlohmann::json::object();
        for (const auto& field : field_errors) {
            fields[field.name] = {{"code", field.code}, {"message", field.message}};
        }
        j["fields"] = std::move(fields);
    }
    if (kind == ErrorKind::EmptyField) {
        j["empty_identity"] = empty_identity;
        j["empty_password"] = empty_password;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", std::move(j)}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace pocketbase
