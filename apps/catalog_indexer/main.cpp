#include "catalog_indexer.hpp"
#include <iostream>
#include <memory>
#include <string>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --database <path>           Catalog database (default: drugs.db)" << std::endl;
    std::cout << "  --photo-dir <path>          Folder holding catalog photos" << std::endl;
    std::cout << "  --manifest <file>           Tab-separated drug/image list to import first" << std::endl;
    std::cout << "  --workers <n>               Extraction threads, 0 = CPU cores (default: 0)" << std::endl;
    std::cout << "  --reindex                   Recompute descriptors that already exist" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << "\nManifest columns:" << std::endl;
    std::cout << "  license  chinese_name  english_name  shape  color  dosage_form  image_file" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << program_name << " --database drugs.db --photo-dir ./photos --manifest drugs.tsv" << std::endl;
}

int main(int argc, char* argv[]) {
    // Default parameters
    std::string database_path = "drugs.db";
    std::string photo_dir;
    std::string manifest_path;
    size_t workers = 0;
    bool reindex = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--database") {
            if (i + 1 < argc) {
                database_path = argv[++i];
            } else {
                std::cerr << "Error: --database requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--photo-dir") {
            if (i + 1 < argc) {
                photo_dir = argv[++i];
            } else {
                std::cerr << "Error: --photo-dir requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--manifest") {
            if (i + 1 < argc) {
                manifest_path = argv[++i];
            } else {
                std::cerr << "Error: --manifest requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--workers") {
            if (i + 1 < argc) {
                try {
                    int value = std::stoi(argv[++i]);
                    if (value < 0) {
                        std::cerr << "Error: workers must not be negative" << std::endl;
                        return 1;
                    }
                    workers = static_cast<size_t>(value);
                } catch (const std::exception&) {
                    std::cerr << "Error: invalid workers value" << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: --workers requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--reindex") {
            reindex = true;
        } else {
            std::cerr << "Error: unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        dre::CatalogIndexer indexer(database_path, photo_dir, workers, reindex);

        if (!manifest_path.empty()) {
            indexer.import_manifest(manifest_path);
        }

        indexer.run();

        if (indexer.get_images_failed() > 0) {
            return 2;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
