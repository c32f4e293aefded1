#pragma once

#include <pocketbase/core/result.hpp>
#include <pocketbase/http/i_http_transport.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>

namespace pocketbase {

// ---------------------------------------------------------------------------
// StatusPolicy: per-family table driving the shared status classifier.
//
// `success_codes` empty means any 2xx is success. Statuses listed in
// `mapped` become the given ErrorKind; anything else is Unexpected.
// ---------------------------------------------------------------------------
struct StatusPolicy {
    std::string operation;
    std::set<int> success_codes;
    std::map<int, ErrorKind> mapped;

    static StatusPolicy Read(std::string operation);
    static StatusPolicy Create();
    static StatusPolicy Update();
    static StatusPolicy Delete();
    static StatusPolicy AuthWithPassword();
    static StatusPolicy AuthRefresh(std::string operation = "AuthRefresh");
    static StatusPolicy Impersonate();
    static StatusPolicy RequestVerification();
};

// nullopt on success, otherwise the error kind for this status.
[[nodiscard]] std::optional<ErrorKind> Classify(const StatusPolicy& policy,
                                                int status_code);

// ---------------------------------------------------------------------------
// ErrorBody: the server's structured error envelope.
// ---------------------------------------------------------------------------
struct ErrorBody {
    int status = 400;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
};

// Parse `{status|code, message, data}`. A body that does not have this shape
// yields the synthetic {400, "Unknown error", {}}.
[[nodiscard]] ErrorBody ParseErrorBody(const std::string& body);

// `object[key]` when `object` is an object and that member is a string.
[[nodiscard]] std::optional<std::string> StringMember(const nlohmann::json& object,
                                                      const std::string& key);

// Field errors from the `data` map, sorted by field name. Non-string `code`
// or `message` members read as empty.
[[nodiscard]] std::vector<FieldError> ExtractFieldErrors(const ErrorBody& body);

// Classify `response` under `policy`. On failure the Error carries the
// server message and, for BadRequest, the field errors.
[[nodiscard]] Result<void, Error> CheckResponse(const StatusPolicy& policy,
                                                const std::string& endpoint,
                                                const HttpResponse& response);

// Parse a success body; failures become ErrorKind::ParseError.
[[nodiscard]] Result<nlohmann::json, Error> ParseJsonBody(
    const std::string& operation,
    const std::string& endpoint,
    const std::string& body);

} // namespace pocketbase
