/**
 * HttpChangeFeed.cpp
 */

#include "HttpChangeFeed.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <stdexcept>
#include <utility>

namespace modeld::core::records {

using utils::StringUtils;

HttpChangeFeed::HttpChangeFeed(std::string serverUrl, const std::string& token)
    : m_serverUrl(std::move(serverUrl)) {
    while (StringUtils::endsWith(m_serverUrl, "/")) {
        m_serverUrl.pop_back();
    }

    utils::HttpOptions defaults;
    defaults.withBearer(token);
    defaults.headers["Accept"] = "application/x-ndjson";
    defaults.timeoutSeconds = 0;
    m_client.setDefaultOptions(defaults);
}

std::optional<ChangeEvent> HttpChangeFeed::parseEvent(const std::string& line) {
    auto message = json::parse(line);
    if (!message.is_object() || !message.contains("type")) {
        throw std::invalid_argument("event has no type");
    }

    auto type = changeTypeFromJson(message["type"]);
    if (!type) {
        throw std::invalid_argument("unknown event type " + message["type"].dump());
    }
    if (*type == ChangeType::Heartbeat) {
        return std::nullopt;
    }

    ChangeEvent event;
    event.type = *type;
    event.item = message.at("data").get<WorkItem>();
    return event;
}

void HttpChangeFeed::watch(const EventCallback& onEvent, const StopPredicate& stopRequested) {
    auto url = m_serverUrl + "/v1/model-files?watch=true";
    LOG_DEBUG("Subscribing to {}", url);

    auto response = m_client.streamLines(url,
        [&](const std::string& line) {
            std::optional<ChangeEvent> event;
            try {
                event = parseEvent(line);
            } catch (const std::exception& e) {
                LOG_WARN("Skipping malformed model file event: {}", e.what());
                return !stopRequested();
            }
            if (!event) {
                LOG_TRACE("Model file feed heartbeat");
            } else {
                onEvent(*event);
            }
            return !stopRequested();
        },
        stopRequested);

    if (response.aborted) {
        return;
    }
    if (!response.error.empty()) {
        throw FeedError("model file feed failed: " + response.error);
    }
    if (!response.isSuccess()) {
        throw FeedError("model file feed rejected: " + response.describe());
    }
    LOG_DEBUG("Model file feed closed by server");
}

} // namespace modeld::core::records
