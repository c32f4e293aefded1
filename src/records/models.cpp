#include <pocketbase/records/models.hpp>

namespace pocketbase {

void from_json(const nlohmann::json& j, RecordMeta& meta) {
    meta.id = j.at("id").get<std::string>();
    meta.collection_name = j.value("collectionName", "");
    meta.collection_id = j.value("collectionId", "");
    meta.created = j.value("created", "");
    meta.updated = j.value("updated", "");
}

void to_json(nlohmann::json& j, const RecordMeta& meta) {
    j = nlohmann::json{
        {"collectionName", meta.collection_name},
        {"collectionId", meta.collection_id},
        {"id", meta.id},
        {"created", meta.created},
        {"updated", meta.updated},
    };
}

void from_json(const nlohmann::json& j, AuthRecord& record) {
    record.id = j.at("id").get<std::string>();
    record.collection_id = j.value("collectionId", "");
    record.collection_name = j.value("collectionName", "");
    record.created = j.value("created", "");
    record.updated = j.value("updated", "");
    record.email = j.value("email", "");
    record.email_visibility = j.value("emailVisibility", false);
    record.verified = j.value("verified", false);
}

void to_json(nlohmann::json& j, const AuthRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"collectionId", record.collection_id},
        {"collectionName", record.collection_name},
        {"created", record.created},
        {"updated", record.updated},
        {"email", record.email},
        {"emailVisibility", record.email_visibility},
        {"verified", record.verified},
    };
}

void from_json(const nlohmann::json& j, AuthSession& session) {
    session.token = j.at("token").get<std::string>();
    session.record = j.at("record").get<AuthRecord>();
}

void to_json(nlohmann::json& j, const AuthSession& session) {
    j = nlohmann::json{
        {"token", session.token},
        {"record", session.record},
    };
}

} // namespace pocketbase
