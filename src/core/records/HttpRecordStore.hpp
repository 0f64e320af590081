#pragma once

/**
 * HttpRecordStore.hpp
 *
 * RecordStore over the server's REST API:
 *   GET {server}/v1/model-files/{id}
 *   PUT {server}/v1/model-files/{id}    (current record with the fields applied)
 */

#include "RecordStore.hpp"
#include "../../utils/HttpClient.hpp"

#include <string>

namespace modeld::core::records {

class HttpRecordStore : public RecordStore {
public:
    HttpRecordStore(std::string serverUrl, const std::string& token, int timeoutMs);

    WorkItem get(int64_t id) override;
    void update(int64_t id, const json& fields) override;

private:
    json fetch(int64_t id);
    std::string recordUrl(int64_t id) const;

    std::string m_serverUrl;
    utils::HttpClient m_client;
};

} // namespace modeld::core::records
