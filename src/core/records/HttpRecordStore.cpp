/**
 * HttpRecordStore.cpp
 */

#include "HttpRecordStore.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace modeld::core::records {

using utils::StringUtils;

HttpRecordStore::HttpRecordStore(std::string serverUrl, const std::string& token, int timeoutMs)
    : m_serverUrl(std::move(serverUrl)) {
    while (StringUtils::endsWith(m_serverUrl, "/")) {
        m_serverUrl.pop_back();
    }

    utils::HttpOptions defaults;
    defaults.withBearer(token);
    defaults.timeoutSeconds = timeoutMs > 0 ? (timeoutMs + 999) / 1000 : 0;
    m_client.setDefaultOptions(defaults);
}

std::string HttpRecordStore::recordUrl(int64_t id) const {
    return m_serverUrl + "/v1/model-files/" + std::to_string(id);
}

json HttpRecordStore::fetch(int64_t id) {
    auto response = m_client.get(recordUrl(id));
    if (!response.isSuccess()) {
        throw RecordStoreError("GET model file " + std::to_string(id) + " failed: " + response.describe(),
                               response.statusCode);
    }
    try {
        auto record = json::parse(response.body);
        if (!record.is_object()) {
            throw RecordStoreError("model file " + std::to_string(id) + " is not a JSON object");
        }
        return record;
    } catch (const json::exception& e) {
        throw RecordStoreError("model file " + std::to_string(id) + " is not valid JSON: " + e.what());
    }
}

WorkItem HttpRecordStore::get(int64_t id) {
    auto record = fetch(id);
    try {
        return record.get<WorkItem>();
    } catch (const std::exception& e) {
        throw RecordStoreError("model file " + std::to_string(id) + " is malformed: " + e.what());
    }
}

void HttpRecordStore::update(int64_t id, const json& fields) {
    // The server replaces the whole record, so apply the fields to a fresh copy
    auto record = fetch(id);
    for (const auto& [key, value] : fields.items()) {
        record[key] = value;
    }

    auto response = m_client.putJson(recordUrl(id), record.dump());
    if (!response.isSuccess()) {
        throw RecordStoreError("PUT model file " + std::to_string(id) + " failed: " + response.describe(),
                               response.statusCode);
    }
    LOG_TRACE("Updated model file {}: {}", id, fields.dump());
}

} // namespace modeld::core::records
