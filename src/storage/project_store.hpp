#pragma once

#include "core/item.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tandem::storage {

/**
 * ProjectStore - persistence seam used by the sync orchestrator.
 *
 * Holds the singleton project record, the items, and one binary payload
 * per item. Implementations report failures as ErrorCode::Storage.
 */
class ProjectStore {
public:
    virtual ~ProjectStore() = default;

    [[nodiscard]] virtual Result<std::optional<Project>> load_project() = 0;
    [[nodiscard]] virtual Result<void> save_project(const Project& project) = 0;

    /**
     * All items, ascending by order.
     */
    [[nodiscard]] virtual Result<std::vector<Item>> load_items() = 0;
    [[nodiscard]] virtual Result<std::optional<Item>> load_item(const std::string& id) = 0;

    /**
     * Insert or replace an item record. Its payload is left untouched.
     */
    [[nodiscard]] virtual Result<void> save_item(const Item& item) = 0;

    /**
     * Delete an item and its payload. Deleting an unknown id is not an error.
     */
    [[nodiscard]] virtual Result<void> remove_item(const std::string& id) = 0;

    [[nodiscard]] virtual Result<std::optional<Bytes>> load_payload(const std::string& item_id) = 0;

    /**
     * Byte size of the stored payload, 0 when there is none.
     */
    [[nodiscard]] virtual Result<uint64_t> payload_size(const std::string& item_id) = 0;

    [[nodiscard]] virtual Result<void> save_payload(const std::string& item_id,
                                                    const Bytes& data) = 0;

    /**
     * Atomically replace the whole dataset.
     */
    [[nodiscard]] virtual Result<void> replace_all(const ProjectSnapshot& snapshot) = 0;
};

} // namespace tandem::storage
