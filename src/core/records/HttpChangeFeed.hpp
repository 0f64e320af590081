#pragma once

/**
 * HttpChangeFeed.hpp
 *
 * ChangeFeed over a streamed HTTP response:
 *   GET {server}/v1/model-files?watch=true
 * One JSON event per line: {"type": "CREATED" | 1, "data": {...}}
 */

#include "ChangeFeed.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>
#include <string>

namespace modeld::core::records {

class HttpChangeFeed : public ChangeFeed {
public:
    HttpChangeFeed(std::string serverUrl, const std::string& token);

    void watch(const EventCallback& onEvent, const StopPredicate& stopRequested) override;

    /**
     * Parse one feed line.
     * @return nullopt for heartbeats
     * @throws std::exception if the line is not a valid event
     */
    static std::optional<ChangeEvent> parseEvent(const std::string& line);

private:
    std::string m_serverUrl;
    utils::HttpClient m_client;
};

} // namespace modeld::core::records
