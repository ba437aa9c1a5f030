#pragma once

#include "catalog_store.hpp"
#include "lbp_extractor.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dre {

// Offline tool that fills drug_images.feature_vector for the server
class CatalogIndexer {
public:
    CatalogIndexer(const std::string& database_path,
                   const std::string& photo_dir,
                   size_t num_workers = 0,
                   bool reindex = false);
    ~CatalogIndexer();

    // Registers drugs and images from a tab-separated manifest:
    // license, chinese name, english name, shape, color, dosage form, image file.
    // Returns the number of images added.
    size_t import_manifest(const std::string& manifest_path);

    // Compute descriptors for every image that lacks one (all with reindex)
    void run();

    // Get statistics
    size_t get_images_indexed() const;
    size_t get_images_failed() const;
    size_t get_images_skipped() const;

private:
    // Absolute stored paths win; otherwise the file is looked up in photo_dir
    std::filesystem::path resolve_path(const ImageRecord& record) const;

    static std::vector<uint8_t> load_image_file(const std::filesystem::path& image_path);

    std::string database_path_;
    std::string photo_dir_;
    bool reindex_;

    std::unique_ptr<SqliteCatalogStore> store_;
    LbpExtractor extractor_;
    WorkerPool pool_;

    std::atomic<size_t> images_indexed_;
    std::atomic<size_t> images_failed_;
    std::atomic<size_t> images_skipped_;
};

}  // namespace dre
