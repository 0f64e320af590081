#pragma once

/**
 * ChangeFeed.hpp
 *
 * Long-lived subscription to record changes.
 */

#include "../models/WorkItem.hpp"

#include <functional>

namespace modeld::core::records {

using EventCallback = std::function<void(const ChangeEvent& event)>;
using StopPredicate = std::function<bool()>;

class ChangeFeed {
public:
    virtual ~ChangeFeed() = default;

    /**
     * Block delivering events until the feed ends or stopRequested()
     * returns true. Heartbeats and malformed events are not delivered.
     * @throws FeedError on transport failure
     */
    virtual void watch(const EventCallback& onEvent, const StopPredicate& stopRequested) = 0;
};

} // namespace modeld::core::records
