#pragma once

#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

enum class ItemColor {
    Neutral,
    Red,
    Orange,
    Yellow,
    Green,
    Blue,
    Purple,
    Pink
};

[[nodiscard]] std::string_view item_color_to_string(ItemColor color) noexcept;
[[nodiscard]] std::optional<ItemColor> item_color_from_string(std::string_view name) noexcept;

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    bool operator==(const TranscriptSegment&) const = default;
};

/**
 * Project - the singleton metadata record of the synchronized dataset.
 */
struct Project {
    std::string created_at;
    std::string updated_at;

    bool operator==(const Project&) const = default;
};

/**
 * Item - one entry of the synchronized dataset.
 *
 * The binary payload (recorded audio) is not part of the record; it is
 * stored and transferred separately, keyed by the item id.
 */
struct Item {
    std::string id;
    std::string label;
    std::string notes;
    std::vector<std::string> tags;
    ItemColor color = ItemColor::Neutral;
    double duration = 0.0;
    std::optional<std::vector<double>> waveform;
    std::optional<std::vector<TranscriptSegment>> transcript;
    std::string created_at;
    std::string updated_at;
    int order = 0;

    bool operator==(const Item&) const = default;
};

/**
 * Item record plus the size of its binary payload (0 when it has none).
 */
struct ItemMetadata {
    Item item;
    uint64_t payload_size = 0;

    bool operator==(const ItemMetadata&) const = default;
};

/**
 * Fields an update operation may carry. Unset fields are left untouched.
 */
struct ItemChanges {
    std::optional<std::string> label;
    std::optional<std::string> notes;
    std::optional<std::vector<std::string>> tags;
    std::optional<ItemColor> color;

    [[nodiscard]] bool empty() const noexcept {
        return !label && !notes && !tags && !color;
    }

    bool operator==(const ItemChanges&) const = default;
};

/**
 * Metadata that accompanies a replaced binary payload.
 */
struct PayloadMetadata {
    double duration = 0.0;
    std::optional<std::vector<double>> waveform;
    std::optional<std::vector<TranscriptSegment>> transcript;

    bool operator==(const PayloadMetadata&) const = default;
};

struct ItemOrder {
    std::string id;
    int order = 0;

    bool operator==(const ItemOrder&) const = default;
};

/**
 * Full dataset: what the initial sync transfers and what a commit installs.
 */
struct ProjectSnapshot {
    Project project;
    std::vector<Item> items;
    std::map<std::string, Bytes> payloads;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] Project create_project();

/**
 * Create a new item appended at `order`.
 */
[[nodiscard]] Item create_item(std::string label, int order = 0);

[[nodiscard]] Item with_changes(Item item, const ItemChanges& changes);

[[nodiscard]] Item with_payload_metadata(Item item, const PayloadMetadata& metadata);

/**
 * Apply order values to matching items and sort by order.
 * Ids not present in `items` are ignored.
 */
[[nodiscard]] std::vector<Item> apply_order(std::vector<Item> items,
                                            const std::vector<ItemOrder>& order);

void sort_by_order(std::vector<Item>& items);

} // namespace tandem
