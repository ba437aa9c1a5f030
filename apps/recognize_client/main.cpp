#include "recognize_client.hpp"
#include "errors.hpp"
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [image ...]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --endpoint <endpoint>       Server endpoint (default: tcp://localhost:5560)" << std::endl;
    std::cout << "  --dir <folder>              Recognize every image in folder" << std::endl;
    std::cout << "  --mode <mode>               auto, feature, ocr or prescription (default: auto)" << std::endl;
    std::cout << "  --top-k <n>                 Number of results (default: 5)" << std::endl;
    std::cout << "  --shape <shape>             Only match drugs of this shape" << std::endl;
    std::cout << "  --color <color>             Only match drugs of this color" << std::endl;
    std::cout << "  --request-id <id>           Request id (single image only)" << std::endl;
    std::cout << "  --progress <id>             Query progress of a running request" << std::endl;
    std::cout << "  --cancel <id>               Cancel a running request" << std::endl;
    std::cout << "  --timeout <ms>              Reply timeout in milliseconds (default: 30000)" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << program_name << " --mode feature --top-k 3 pill.jpg" << std::endl;
}

int main(int argc, char* argv[]) {
    // Default parameters
    std::string endpoint = "tcp://localhost:5560";
    std::string folder;
    std::string request_id;
    std::string progress_id;
    std::string cancel_id;
    dre::RecognitionMode mode = dre::RecognitionMode::AUTO;
    dre::SearchFilters filters;
    uint32_t top_k = 5;
    int timeout_ms = 30000;
    std::vector<std::filesystem::path> images;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool takes_value = arg == "--endpoint" || arg == "--dir" || arg == "--mode" ||
                           arg == "--top-k" || arg == "--shape" || arg == "--color" ||
                           arg == "--request-id" || arg == "--progress" || arg == "--cancel" ||
                           arg == "--timeout";

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }

        if (takes_value && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value" << std::endl;
            return 1;
        }

        if (arg == "--endpoint") {
            endpoint = argv[++i];
        } else if (arg == "--dir") {
            folder = argv[++i];
        } else if (arg == "--mode") {
            std::optional<dre::RecognitionMode> parsed = dre::parse_mode(argv[++i]);
            if (!parsed) {
                std::cerr << "Error: unknown mode: " << argv[i] << std::endl;
                return 1;
            }
            mode = *parsed;
        } else if (arg == "--top-k" || arg == "--timeout") {
            int value = 0;
            try {
                value = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid value for " << arg << std::endl;
                return 1;
            }
            if (value <= 0) {
                std::cerr << "Error: " << arg << " must be positive" << std::endl;
                return 1;
            }
            if (arg == "--top-k") {
                top_k = static_cast<uint32_t>(value);
            } else {
                timeout_ms = value;
            }
        } else if (arg == "--shape") {
            filters.shape = std::string(argv[++i]);
        } else if (arg == "--color") {
            filters.color = std::string(argv[++i]);
        } else if (arg == "--request-id") {
            request_id = argv[++i];
        } else if (arg == "--progress") {
            progress_id = argv[++i];
        } else if (arg == "--cancel") {
            cancel_id = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            images.emplace_back(arg);
        }
    }

    try {
        dre::RecognizeClient client(endpoint, timeout_ms);

        if (!cancel_id.empty()) {
            dre::CancelReply reply = client.cancel(cancel_id);
            std::cout << "Cancel " << reply.request_id << ": "
                      << (reply.acknowledged ? "acknowledged" : "no active job") << std::endl;
            return 0;
        }

        if (!progress_id.empty()) {
            dre::RecognizeClient::print(client.progress(progress_id));
            return 0;
        }

        if (!folder.empty()) {
            std::vector<std::filesystem::path> found = dre::RecognizeClient::collect_images(folder);
            images.insert(images.end(), found.begin(), found.end());
        }

        if (images.empty()) {
            std::cerr << "Error: no images given" << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        if (!request_id.empty() && images.size() > 1) {
            std::cerr << "Error: --request-id needs exactly one image" << std::endl;
            return 1;
        }

        int failures = 0;
        for (const auto& image : images) {
            std::cout << "\n" << image.filename().string() << std::endl;
            try {
                dre::RecognitionResponse response = client.recognize(image, mode, top_k, filters, request_id);
                dre::RecognizeClient::print(response);
                if (!response.success) {
                    failures++;
                }
            } catch (const dre::RecognitionError& e) {
                std::cerr << "  " << dre::to_string(e.kind()) << ": " << e.what() << std::endl;
                failures++;
            }
        }

        return failures > 0 ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
