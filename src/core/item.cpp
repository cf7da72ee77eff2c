#include "core/item.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>

namespace tandem {

namespace {

constexpr std::array<std::pair<ItemColor, std::string_view>, 8> kColorNames{{
    {ItemColor::Neutral, "neutral"},
    {ItemColor::Red, "red"},
    {ItemColor::Orange, "orange"},
    {ItemColor::Yellow, "yellow"},
    {ItemColor::Green, "green"},
    {ItemColor::Blue, "blue"},
    {ItemColor::Purple, "purple"},
    {ItemColor::Pink, "pink"},
}};

std::string now_iso() {
    return Timestamp::now().to_iso_string();
}

} // namespace

std::string_view item_color_to_string(ItemColor color) noexcept {
    for (const auto& [value, name] : kColorNames) {
        if (value == color) return name;
    }
    return "neutral";
}

std::optional<ItemColor> item_color_from_string(std::string_view name) noexcept {
    for (const auto& [value, text] : kColorNames) {
        if (text == name) return value;
    }
    return std::nullopt;
}

Project create_project() {
    const auto now = now_iso();
    return Project{.created_at = now, .updated_at = now};
}

Item create_item(std::string label, int order) {
    const auto now = now_iso();
    Item item;
    item.id = Uuid::generate().to_string();
    item.label = std::move(label);
    item.created_at = now;
    item.updated_at = now;
    item.order = order;
    return item;
}

Item with_changes(Item item, const ItemChanges& changes) {
    if (changes.label) item.label = *changes.label;
    if (changes.notes) item.notes = *changes.notes;
    if (changes.tags) item.tags = *changes.tags;
    if (changes.color) item.color = *changes.color;
    item.updated_at = now_iso();
    return item;
}

Item with_payload_metadata(Item item, const PayloadMetadata& metadata) {
    item.duration = metadata.duration;
    item.waveform = metadata.waveform;
    item.transcript = metadata.transcript;
    item.updated_at = now_iso();
    return item;
}

std::vector<Item> apply_order(std::vector<Item> items, const std::vector<ItemOrder>& order) {
    std::unordered_map<std::string, int> lookup;
    lookup.reserve(order.size());
    for (const auto& entry : order) {
        lookup[entry.id] = entry.order;
    }
    for (auto& item : items) {
        auto it = lookup.find(item.id);
        if (it != lookup.end()) {
            item.order = it->second;
        }
    }
    sort_by_order(items);
    return items;
}

void sort_by_order(std::vector<Item>& items) {
    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return a.order < b.order;
    });
}

} // namespace tandem
