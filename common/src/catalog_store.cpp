#include "catalog_store.hpp"
#include "errors.hpp"
#include <cstring>

namespace dre {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

// RAII guard so every early return finalizes the statement
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const {
        return stmt_;
    }

private:
    sqlite3_stmt* stmt_;
};

DrugInfo read_drug(sqlite3_stmt* stmt) {
    DrugInfo info;
    info.id = sqlite3_column_int64(stmt, 0);
    info.license_number = column_text(stmt, 1);
    info.chinese_name = column_text(stmt, 2);
    info.english_name = column_text(stmt, 3);
    info.shape = column_text(stmt, 4);
    info.color = column_text(stmt, 5);
    info.special_dosage_form = column_text(stmt, 6);
    return info;
}

}  // namespace

SqliteCatalogStore::SqliteCatalogStore(const std::string& database_path)
    : database_path_(database_path)
    , db_(nullptr) {

    int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw DatabaseError("Failed to open database: " + error);
    }

    // Enable WAL mode so the indexer can write while the server reads
    if (database_path_ != ":memory:") {
        execute_sql("PRAGMA journal_mode=WAL;");
    }
    execute_sql("PRAGMA foreign_keys=ON;");
}

SqliteCatalogStore::~SqliteCatalogStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteCatalogStore::execute_sql(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        throw DatabaseError("SQL execution failed: " + error);
    }
}

sqlite3_stmt* SqliteCatalogStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw DatabaseError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteCatalogStore::begin_transaction() {
    execute_sql("BEGIN TRANSACTION;");
}

void SqliteCatalogStore::commit_transaction() {
    execute_sql("COMMIT;");
}

void SqliteCatalogStore::rollback_transaction() {
    execute_sql("ROLLBACK;");
}

void SqliteCatalogStore::init_schema() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* create_drugs_table = R"(
        CREATE TABLE IF NOT EXISTS drugs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            license_number TEXT UNIQUE NOT NULL,
            chinese_name TEXT NOT NULL,
            english_name TEXT,
            shape TEXT,
            special_dosage_form TEXT,
            color TEXT,
            mark TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
    )";

    execute_sql(create_drugs_table);

    const char* create_images_table = R"(
        CREATE TABLE IF NOT EXISTS drug_images (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            drug_id INTEGER NOT NULL,
            image_filename TEXT NOT NULL,
            image_path TEXT NOT NULL,
            image_order INTEGER DEFAULT 1,
            feature_vector BLOB,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY(drug_id) REFERENCES drugs(id) ON DELETE CASCADE
        );
    )";

    execute_sql(create_images_table);

    execute_sql("CREATE INDEX IF NOT EXISTS idx_drugs_shape ON drugs(shape);");
    execute_sql("CREATE INDEX IF NOT EXISTS idx_drugs_color ON drugs(color);");
    execute_sql("CREATE INDEX IF NOT EXISTS idx_drug_images_drug_id ON drug_images(drug_id);");
    execute_sql("CREATE INDEX IF NOT EXISTS idx_drug_images_filename ON drug_images(image_filename);");
}

DrugId SqliteCatalogStore::add_drug(const DrugInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* insert_drug_sql = R"(
        INSERT INTO drugs (license_number, chinese_name, english_name, shape, color, special_dosage_form)
        VALUES (?, ?, ?, ?, ?, ?);
    )";

    Statement stmt(prepare(insert_drug_sql));
    sqlite3_bind_text(stmt.get(), 1, info.license_number.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, info.chinese_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, info.english_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, info.shape.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, info.color.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 6, info.special_dosage_form.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw DatabaseError("Failed to insert drug: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

std::optional<DrugId> SqliteCatalogStore::find_drug_by_license(const std::string& license_number) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(prepare("SELECT id FROM drugs WHERE license_number = ?;"));
    sqlite3_bind_text(stmt.get(), 1, license_number.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return static_cast<DrugId>(sqlite3_column_int64(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw DatabaseError("Failed to look up license " + license_number + ": " +
                            std::string(sqlite3_errmsg(db_)));
    }
    return std::nullopt;
}

ImageId SqliteCatalogStore::add_image(DrugId drug_id, const std::string& filename,
                                      const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* insert_image_sql = R"(
        INSERT INTO drug_images (drug_id, image_filename, image_path)
        VALUES (?, ?, ?);
    )";

    Statement stmt(prepare(insert_image_sql));
    sqlite3_bind_int64(stmt.get(), 1, drug_id);
    sqlite3_bind_text(stmt.get(), 2, filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, path.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw DatabaseError("Failed to insert image: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

std::vector<ImageRecord> SqliteCatalogStore::list_images() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* select_sql = R"(
        SELECT id, drug_id, image_filename, image_path, feature_vector IS NOT NULL
        FROM drug_images
        ORDER BY id;
    )";

    Statement stmt(prepare(select_sql));

    std::vector<ImageRecord> images;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ImageRecord record;
        record.image_id = sqlite3_column_int64(stmt.get(), 0);
        record.drug_id = sqlite3_column_int64(stmt.get(), 1);
        record.filename = column_text(stmt.get(), 2);
        record.path = column_text(stmt.get(), 3);
        record.has_features = sqlite3_column_int(stmt.get(), 4) != 0;
        images.push_back(std::move(record));
    }

    if (rc != SQLITE_DONE) {
        throw DatabaseError("Failed to list images: " + std::string(sqlite3_errmsg(db_)));
    }

    return images;
}

void SqliteCatalogStore::store_feature_vector(ImageId image_id, const FeatureVector& features) {
    std::lock_guard<std::mutex> lock(mutex_);

    begin_transaction();

    try {
        const char* update_sql = R"(
            UPDATE drug_images SET feature_vector = ? WHERE id = ?;
        )";

        Statement stmt(prepare(update_sql));
        sqlite3_bind_blob(stmt.get(), 1, features.data(),
                          static_cast<int>(features.size() * sizeof(float)), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, image_id);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw DatabaseError("Failed to store feature vector");
        }

        if (sqlite3_changes(db_) == 0) {
            throw DatabaseError("No image with id " + std::to_string(image_id));
        }

        commit_transaction();

    } catch (const std::exception&) {
        rollback_transaction();
        throw;
    }
}

std::vector<CatalogRow> SqliteCatalogStore::get_catalog_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* select_sql = R"(
        SELECT i.drug_id, i.id, i.feature_vector, d.shape, d.color
        FROM drug_images i
        INNER JOIN drugs d ON d.id = i.drug_id
        WHERE i.feature_vector IS NOT NULL
        ORDER BY i.id;
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw CatalogUnavailableError("Catalog query failed: " + std::string(sqlite3_errmsg(db_)));
    }
    Statement stmt(raw);

    std::vector<CatalogRow> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        CatalogRow row;
        row.drug_id = sqlite3_column_int64(stmt.get(), 0);
        row.image_id = sqlite3_column_int64(stmt.get(), 1);

        const void* blob = sqlite3_column_blob(stmt.get(), 2);
        int bytes = sqlite3_column_bytes(stmt.get(), 2);
        size_t count = static_cast<size_t>(bytes) / sizeof(float);
        row.feature_vector.resize(count);
        if (count > 0) {
            std::memcpy(row.feature_vector.data(), blob, count * sizeof(float));
        }

        row.shape = column_text(stmt.get(), 3);
        row.color = column_text(stmt.get(), 4);
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        throw CatalogUnavailableError("Catalog read failed: " + std::string(sqlite3_errmsg(db_)));
    }

    return rows;
}

std::optional<DrugInfo> SqliteCatalogStore::get_drug_by_id(DrugId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* select_sql = R"(
        SELECT id, license_number, chinese_name, english_name, shape, color, special_dosage_form
        FROM drugs
        WHERE id = ?;
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw CatalogUnavailableError("Drug lookup failed: " + std::string(sqlite3_errmsg(db_)));
    }
    Statement stmt(raw);
    sqlite3_bind_int64(stmt.get(), 1, id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_drug(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw CatalogUnavailableError("Drug lookup failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return std::nullopt;
}

std::vector<DrugInfo> SqliteCatalogStore::list_drugs() {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* select_sql = R"(
        SELECT id, license_number, chinese_name, english_name, shape, color, special_dosage_form
        FROM drugs
        ORDER BY id;
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw CatalogUnavailableError("Drug listing failed: " + std::string(sqlite3_errmsg(db_)));
    }
    Statement stmt(raw);

    std::vector<DrugInfo> drugs;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        drugs.push_back(read_drug(stmt.get()));
    }

    if (rc != SQLITE_DONE) {
        throw CatalogUnavailableError("Drug listing failed: " + std::string(sqlite3_errmsg(db_)));
    }

    return drugs;
}

}  // namespace dre
