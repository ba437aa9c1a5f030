#include "recognize_client.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace dre {

namespace fs = std::filesystem;

RecognizeClient::RecognizeClient(const std::string& endpoint, int timeout_ms)
    : endpoint_(endpoint) {

    client_ = std::make_unique<RequestClient>(endpoint_, timeout_ms);
}

RecognizeClient::~RecognizeClient() = default;

std::vector<uint8_t> RecognizeClient::exchange(const std::vector<uint8_t>& payload, MessageType expected) {
    std::vector<uint8_t> reply = client_->request(payload);

    MessageType type = Serializer::peek_type(reply);
    if (type == MessageType::ERROR_RESPONSE) {
        ErrorReply error = Serializer::deserialize_error_reply(reply);
        throw RecognitionError(error.error, "Server rejected request: " + error.message);
    }
    if (type != expected) {
        throw SerializationError("Unexpected reply type from " + endpoint_);
    }

    return reply;
}

RecognitionResponse RecognizeClient::recognize(const fs::path& image_path,
                                               RecognitionMode mode,
                                               uint32_t top_k,
                                               const SearchFilters& filters,
                                               const std::string& request_id) {
    RecognitionRequest request;
    request.request_id = request_id;
    request.image_data = load_image_file(image_path);
    request.mode = mode;
    request.top_k = top_k;
    request.filters = filters;

    std::vector<uint8_t> reply = exchange(Serializer::serialize(request),
                                          MessageType::RECOGNIZE_RESPONSE);
    return Serializer::deserialize_recognize_response(reply);
}

ProgressReply RecognizeClient::progress(const std::string& request_id) {
    ProgressQuery query;
    query.request_id = request_id;

    std::vector<uint8_t> reply = exchange(Serializer::serialize(query),
                                          MessageType::PROGRESS_RESPONSE);
    return Serializer::deserialize_progress_reply(reply);
}

CancelReply RecognizeClient::cancel(const std::string& request_id) {
    CancelQuery query;
    query.request_id = request_id;

    std::vector<uint8_t> reply = exchange(Serializer::serialize(query),
                                          MessageType::CANCEL_RESPONSE);
    return Serializer::deserialize_cancel_reply(reply);
}

std::vector<fs::path> RecognizeClient::collect_images(const std::string& folder) {
    if (!fs::is_directory(folder)) {
        throw std::runtime_error("Path is not a directory: " + folder);
    }

    // Supported image extensions
    const std::vector<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tiff", ".tif", ".webp"
    };

    std::vector<fs::path> paths;
    try {
        for (const auto& entry : fs::directory_iterator(folder)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
                paths.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error("Error reading directory: " + std::string(e.what()));
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<uint8_t> RecognizeClient::load_image_file(const fs::path& image_path) {
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

void RecognizeClient::print(const RecognitionResponse& response) {
    std::cout << "Request " << response.request_id << ": " << to_string(response.status)
              << " via " << to_string(response.method_used) << std::endl;

    if (!response.success) {
        std::cout << "  Error: " << to_string(response.error);
        if (!response.message.empty()) {
            std::cout << " - " << response.message;
        }
        std::cout << std::endl;
    } else if (response.results.empty()) {
        std::cout << "  " << (response.message.empty() ? "No matching drugs found" : response.message)
                  << std::endl;
    }

    for (const auto& warning : response.warnings) {
        std::cout << "  Warning: " << warning << std::endl;
    }

    for (const auto& result : response.results) {
        std::cout << "  #" << result.rank << "  drug " << result.drug_id
                  << "  similarity " << std::fixed << std::setprecision(4) << result.similarity;
        std::cout.unsetf(std::ios::floatfield);

        if (result.drug) {
            const DrugInfo& drug = *result.drug;
            std::cout << "  " << drug.chinese_name;
            if (!drug.english_name.empty()) {
                std::cout << " (" << drug.english_name << ")";
            }
            std::cout << "  [" << drug.license_number << "]";
        }
        std::cout << std::endl;
    }
}

void RecognizeClient::print(const ProgressReply& reply) {
    if (!reply.found) {
        std::cout << "Request " << reply.request_id << ": " << to_string(reply.error)
                  << " - " << reply.message << std::endl;
        return;
    }

    std::cout << "Request " << reply.request_id << ": " << to_string(reply.progress.status)
              << " " << reply.progress.processed << "/" << reply.progress.total
              << " (" << std::fixed << std::setprecision(1) << reply.progress.percent << "%)"
              << std::endl;
    std::cout.unsetf(std::ios::floatfield);
}

}  // namespace dre
