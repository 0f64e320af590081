#pragma once

/**
 * RecordStore.hpp
 *
 * Read/update access to the externally owned model-file records.
 */

#include "../models/WorkItem.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>

namespace modeld::core::records {

using json = nlohmann::json;

class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @throws RecordStoreError
     */
    virtual WorkItem get(int64_t id) = 0;

    /**
     * Merge the given wire-format fields into the record. Fields not
     * named are left as they are.
     * @throws RecordStoreError
     */
    virtual void update(int64_t id, const json& fields) = 0;
};

} // namespace modeld::core::records
