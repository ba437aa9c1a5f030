#pragma once

#include "ipc_manager.hpp"
#include "message_types.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dre {

class RecognizeClient {
public:
    explicit RecognizeClient(const std::string& endpoint, int timeout_ms = 30000);
    ~RecognizeClient();

    // Error replies from the server are raised as RecognitionError
    RecognitionResponse recognize(const std::filesystem::path& image_path,
                                  RecognitionMode mode,
                                  uint32_t top_k,
                                  const SearchFilters& filters,
                                  const std::string& request_id);

    ProgressReply progress(const std::string& request_id);

    CancelReply cancel(const std::string& request_id);

    // Supported image files in folder, sorted
    static std::vector<std::filesystem::path> collect_images(const std::string& folder);

    static std::vector<uint8_t> load_image_file(const std::filesystem::path& image_path);

    static void print(const RecognitionResponse& response);
    static void print(const ProgressReply& reply);

private:
    std::vector<uint8_t> exchange(const std::vector<uint8_t>& payload, MessageType expected);

    std::string endpoint_;
    std::unique_ptr<RequestClient> client_;
};

}  // namespace dre
