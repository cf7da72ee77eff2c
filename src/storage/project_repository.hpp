#pragma once

#include "storage/database.hpp"
#include "storage/project_store.hpp"

namespace tandem::storage {

/**
 * ProjectRepository - SQLite-backed ProjectStore.
 *
 * The database must already be migrated (see initialize_database()).
 */
class ProjectRepository : public ProjectStore {
public:
    explicit ProjectRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Project>> load_project() override;
    [[nodiscard]] Result<void> save_project(const Project& project) override;

    [[nodiscard]] Result<std::vector<Item>> load_items() override;
    [[nodiscard]] Result<std::optional<Item>> load_item(const std::string& id) override;
    [[nodiscard]] Result<void> save_item(const Item& item) override;
    [[nodiscard]] Result<void> remove_item(const std::string& id) override;

    [[nodiscard]] Result<std::optional<Bytes>> load_payload(const std::string& item_id) override;
    [[nodiscard]] Result<uint64_t> payload_size(const std::string& item_id) override;
    [[nodiscard]] Result<void> save_payload(const std::string& item_id, const Bytes& data) override;

    [[nodiscard]] Result<void> replace_all(const ProjectSnapshot& snapshot) override;

private:
    Database& db_;

    [[nodiscard]] Item row_to_item(Statement& stmt);
    [[nodiscard]] Result<void> insert_item(const Item& item);
    [[nodiscard]] Result<void> insert_payload(const std::string& item_id, const Bytes& data);
};

} // namespace tandem::storage
