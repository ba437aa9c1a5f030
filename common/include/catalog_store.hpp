#pragma once

#include "recognition_types.hpp"
#include <sqlite3.h>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dre {

class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// One persisted catalog image with its stored descriptor
struct CatalogRow {
    DrugId drug_id;
    ImageId image_id;
    FeatureVector feature_vector;
    std::string shape;
    std::string color;

    CatalogRow() : drug_id(0), image_id(0) {}
};

// Catalog image as seen by the indexer
struct ImageRecord {
    ImageId image_id;
    DrugId drug_id;
    std::string filename;
    std::string path;
    bool has_features;

    ImageRecord() : image_id(0), drug_id(0), has_features(false) {}
};

// Persistence collaborator consumed by the catalog cache and the engine.
// Implementations raise CatalogUnavailableError when the store is unreachable.
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    // Every image that has a stored descriptor, ordered by image id
    virtual std::vector<CatalogRow> get_catalog_snapshot() = 0;

    virtual std::optional<DrugInfo> get_drug_by_id(DrugId id) = 0;

    // All drugs, used to build the name index
    virtual std::vector<DrugInfo> list_drugs() = 0;
};

// SQLite implementation over the drugs / drug_images schema
class SqliteCatalogStore : public CatalogSource {
public:
    explicit SqliteCatalogStore(const std::string& database_path);
    ~SqliteCatalogStore() override;

    SqliteCatalogStore(const SqliteCatalogStore&) = delete;
    SqliteCatalogStore& operator=(const SqliteCatalogStore&) = delete;

    std::vector<CatalogRow> get_catalog_snapshot() override;
    std::optional<DrugInfo> get_drug_by_id(DrugId id) override;
    std::vector<DrugInfo> list_drugs() override;

    // Create tables and indices if missing
    void init_schema();

    // Returns the new drug id (info.id is ignored)
    DrugId add_drug(const DrugInfo& info);

    std::optional<DrugId> find_drug_by_license(const std::string& license_number);

    // Returns the new image id
    ImageId add_image(DrugId drug_id, const std::string& filename, const std::string& path);

    std::vector<ImageRecord> list_images();

    // Stores the descriptor as a float32 BLOB, in a transaction
    void store_feature_vector(ImageId image_id, const FeatureVector& features);

    const std::string& path() const {
        return database_path_;
    }

private:
    void execute_sql(const std::string& sql);
    void begin_transaction();
    void commit_transaction();
    void rollback_transaction();

    sqlite3_stmt* prepare(const char* sql);

    std::string database_path_;
    sqlite3* db_;

    // One connection shared by the cache refresher and request workers
    std::mutex mutex_;
};

}  // namespace dre
