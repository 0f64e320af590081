#pragma once

/**
 * WorkItemSink.hpp
 *
 * What the change watcher dispatches to.
 */

#include "../models/WorkItem.hpp"

namespace modeld::core::downloader {

class WorkItemSink {
public:
    virtual ~WorkItemSink() = default;

    /**
     * The item is downloading; make sure exactly one execution exists
     */
    virtual void ensureRunning(const WorkItem& item) = 0;

    /**
     * The item was deleted; cancel its execution and clean up
     */
    virtual void ensureCancelled(const WorkItem& item) = 0;
};

} // namespace modeld::core::downloader
