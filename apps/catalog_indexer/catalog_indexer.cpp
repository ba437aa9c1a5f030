#include "catalog_indexer.hpp"
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <utility>

namespace dre {

namespace fs = std::filesystem;

namespace {

constexpr size_t MANIFEST_COLUMNS = 7;

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream stream(line);
    std::string field;
    while (std::getline(stream, field, '\t')) {
        fields.push_back(field);
    }
    return fields;
}

}  // namespace

CatalogIndexer::CatalogIndexer(const std::string& database_path,
                               const std::string& photo_dir,
                               size_t num_workers,
                               bool reindex)
    : database_path_(database_path)
    , photo_dir_(photo_dir)
    , reindex_(reindex)
    , pool_(num_workers)
    , images_indexed_(0)
    , images_failed_(0)
    , images_skipped_(0) {

    if (!photo_dir_.empty() && !fs::is_directory(photo_dir_)) {
        throw std::runtime_error("Photo directory does not exist: " + photo_dir_);
    }

    store_ = std::make_unique<SqliteCatalogStore>(database_path_);
    store_->init_schema();
    std::cout << "Database initialized: " << database_path_ << std::endl;
}

CatalogIndexer::~CatalogIndexer() = default;

size_t CatalogIndexer::import_manifest(const std::string& manifest_path) {
    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open manifest: " + manifest_path);
    }

    size_t added = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields = split_tabs(line);
        if (fields.size() != MANIFEST_COLUMNS) {
            std::cerr << manifest_path << ":" << line_number << ": expected "
                      << MANIFEST_COLUMNS << " columns, found " << fields.size() << std::endl;
            continue;
        }

        DrugInfo info;
        info.license_number = fields[0];
        info.chinese_name = fields[1];
        info.english_name = fields[2];
        info.shape = fields[3];
        info.color = fields[4];
        info.special_dosage_form = fields[5];
        const std::string& filename = fields[6];

        if (info.license_number.empty() || info.chinese_name.empty() || filename.empty()) {
            std::cerr << manifest_path << ":" << line_number
                      << ": license, name and image file are required" << std::endl;
            continue;
        }

        try {
            std::optional<DrugId> drug_id = store_->find_drug_by_license(info.license_number);
            if (!drug_id) {
                drug_id = store_->add_drug(info);
            }

            fs::path image_path = photo_dir_.empty() ? fs::path(filename) : fs::path(photo_dir_) / filename;
            store_->add_image(*drug_id, filename, image_path.string());
            added++;

        } catch (const DatabaseError& e) {
            std::cerr << manifest_path << ":" << line_number << ": " << e.what() << std::endl;
        }
    }

    std::cout << "Imported " << added << " images from " << manifest_path << std::endl;
    return added;
}

fs::path CatalogIndexer::resolve_path(const ImageRecord& record) const {
    if (!record.path.empty()) {
        fs::path stored(record.path);
        if (stored.is_absolute() || photo_dir_.empty()) {
            return stored;
        }
    }
    return fs::path(photo_dir_) / record.filename;
}

std::vector<uint8_t> CatalogIndexer::load_image_file(const fs::path& image_path) {
    // Open file in binary mode
    std::ifstream file(image_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open image file: " + image_path.string());
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw std::runtime_error("Failed to read image file: " + image_path.string());
    }

    return buffer;
}

void CatalogIndexer::run() {
    std::cout << "\n=== Starting Catalog Indexer ===" << std::endl;
    std::cout << "Database: " << database_path_ << std::endl;
    std::cout << "Photo directory: " << (photo_dir_.empty() ? "(stored paths)" : photo_dir_) << std::endl;
    std::cout << "Workers: " << pool_.size() << std::endl;
    std::cout << "Reindex: " << (reindex_ ? "yes" : "no") << std::endl;
    std::cout << "================================\n" << std::endl;

    auto start = std::chrono::steady_clock::now();

    std::vector<ImageRecord> images = store_->list_images();

    // Decoding and extraction run on the pool; SQLite writes stay on this thread
    std::vector<std::pair<ImageRecord, std::future<FeatureVector>>> work;
    for (const auto& record : images) {
        if (record.has_features && !reindex_) {
            images_skipped_++;
            continue;
        }

        fs::path image_path = resolve_path(record);
        work.emplace_back(record, pool_.submit([this, image_path]() {
            return extractor_.extract(load_image_file(image_path));
        }));
    }

    std::cout << images.size() << " images registered, " << work.size() << " to index" << std::endl;

    size_t done = 0;
    for (auto& item : work) {
        const ImageRecord& record = item.first;
        ++done;

        try {
            FeatureVector features = item.second.get();
            store_->store_feature_vector(record.image_id, features);
            images_indexed_++;

            std::cout << "[" << done << "/" << work.size() << "] Indexed: " << record.filename
                      << " (drug " << record.drug_id << ")" << std::endl;

        } catch (const std::exception& e) {
            images_failed_++;
            std::cerr << "[" << done << "/" << work.size() << "] Failed: " << record.filename
                      << ": " << e.what() << std::endl;
        }
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::cout << "\n=== Catalog Indexer Finished ===" << std::endl;
    std::cout << "Images indexed: " << images_indexed_ << std::endl;
    std::cout << "Images failed: " << images_failed_ << std::endl;
    std::cout << "Images skipped: " << images_skipped_ << std::endl;
    std::cout << "Duration: " << duration_ms << "ms" << std::endl;
}

size_t CatalogIndexer::get_images_indexed() const {
    return images_indexed_;
}

size_t CatalogIndexer::get_images_failed() const {
    return images_failed_;
}

size_t CatalogIndexer::get_images_skipped() const {
    return images_skipped_;
}

}  // namespace dre
