#include <pocketbase/client/status_policy.hpp>

#include <algorithm>

namespace pocketbase {

StatusPolicy StatusPolicy::Read(std::string operation) {
    return StatusPolicy{std::move(operation), {},
                        {{401, ErrorKind::Unauthorized},
                         {403, ErrorKind::Forbidden},
                         {404, ErrorKind::NotFound},
                         {429, ErrorKind::TooManyRequests}}};
}

StatusPolicy StatusPolicy::Create() {
    return StatusPolicy{"Create", {200},
                        {{400, ErrorKind::BadRequest},
                         {403, ErrorKind::Forbidden},
                         {404, ErrorKind::NotFound}}};
}

StatusPolicy StatusPolicy::Update() {
    auto policy = Create();
    policy.operation = "Update";
    return policy;
}

StatusPolicy StatusPolicy::Delete() {
    return StatusPolicy{"Delete", {200, 204},
                        {{400, ErrorKind::BadRequest},
                         {403, ErrorKind::Forbidden},
                         {404, ErrorKind::NotFound}}};
}

StatusPolicy StatusPolicy::AuthWithPassword() {
    // 400 is refined further from the error body.
    return StatusPolicy{"AuthWithPassword", {},
                        {{400, ErrorKind::InvalidCredentials}}};
}

StatusPolicy StatusPolicy::AuthRefresh(std::string operation) {
    return StatusPolicy{std::move(operation), {200},
                        {{401, ErrorKind::Unauthorized},
                         {403, ErrorKind::Forbidden},
                         {404, ErrorKind::NotFound}}};
}

StatusPolicy StatusPolicy::Impersonate() {
    return StatusPolicy{"Impersonate", {200},
                        {{400, ErrorKind::BadRequest},
                         {401, ErrorKind::Unauthorized},
                         {403, ErrorKind::Forbidden},
                         {404, ErrorKind::NotFound}}};
}

StatusPolicy StatusPolicy::RequestVerification() {
    auto policy = Impersonate();
    policy.operation = "RequestVerification";
    policy.success_codes = {204};
    return policy;
}

std::optional<ErrorKind> Classify(const StatusPolicy& policy, int status_code) {
    if (policy.success_codes.empty()) {
        if (status_code >= 200 && status_code < 300) {
            return std::nullopt;
        }
    } else if (policy.success_codes.count(status_code) > 0) {
        return std::nullopt;
    }
    auto it = policy.mapped.find(status_code);
    if (it != policy.mapped.end()) {
        return it->second;
    }
    return ErrorKind::Unexpected;
}

ErrorBody ParseErrorBody(const std::string& body) {
    ErrorBody fallback{400, "Unknown error", nlohmann::json::object()};
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fallback;
    }

    ErrorBody result;
    // Older servers send "code", newer ones "status".
    auto status_it = j.find("status");
    if (status_it == j.end()) {
        status_it = j.find("code");
    }
    auto message_it = j.find("message");
    if (status_it == j.end() || !status_it->is_number_integer() ||
        message_it == j.end() || !message_it->is_string()) {
        return fallback;
    }
    result.status = status_it->get<int>();
    result.message = message_it->get<std::string>();

    auto data_it = j.find("data");
    if (data_it != j.end()) {
        if (!data_it->is_object()) {
            return fallback;
        }
        result.data = *data_it;
    }
    return result;
}

std::optional<std::string> StringMember(const nlohmann::json& object,
                                        const std::string& key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<FieldError> ExtractFieldErrors(const ErrorBody& body) {
    std::vector<FieldError> fields;
    for (const auto& [name, detail] : body.data.items()) {
        FieldError field;
        field.name = name;
        field.code = StringMember(detail, "code").value_or("");
        field.message = StringMember(detail, "message").value_or("");
        fields.push_back(std::move(field));
    }
    std::sort(fields.begin(), fields.end(),
              [](const FieldError& a, const FieldError& b) { return a.name < b.name; });
    return fields;
}

Result<void, Error> CheckResponse(const StatusPolicy& policy,
                                  const std::string& endpoint,
                                  const HttpResponse& response) {
    auto kind = Classify(policy, response.status_code);
    if (!kind) {
        return Result<void, Error>::Ok();
    }

    auto body = ParseErrorBody(response.body);
    auto error = Error::FromStatus(policy.operation, endpoint,
                                   response.status_code, *kind, body.message);
    if (*kind == ErrorKind::BadRequest) {
        error.field_errors = ExtractFieldErrors(body);
    }
    return Result<void, Error>::Err(std::move(error));
}

Result<nlohmann::json, Error> ParseJsonBody(const std::string& operation,
                                            const std::string& endpoint,
                                            const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error{
            operation, endpoint, std::nullopt,
            "Could not parse response into the expected data structure: invalid JSON",
            ErrorKind::ParseError});
    }
    return Result<nlohmann::json, Error>::Ok(std::move(j));
}

} // namespace pocketbase
