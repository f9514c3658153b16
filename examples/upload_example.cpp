/**
 * @file upload_example.cpp
 * @brief Upload a recorded capture file as a chunked, resumable session
 *
 * This example demonstrates:
 * - Wiring an upload_session to the REST backend and the file state store
 * - Hashing units into a chain of custody while they are captured
 * - Progress callbacks and error handling
 * - Completing with the Merkle root as the content hash
 */

#include <custody/upload/upload.h>
#include <custody/upload/storage/file_key_value_store.h>
#include <custody/upload/transport/http_client.h>
#include <custody/upload/transport/http_part_transport.h>
#include <custody/upload/transport/rest_upload_api.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace custody::upload;

namespace {

constexpr std::size_t unit_size = 1024 * 1024;

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Upload Example - Custody Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <api_base_url> <capture_file> [capture_id]" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  CUSTODY_API_TOKEN   Bearer token sent to the backend" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string base_url = argv[1];
    const std::filesystem::path capture_file = argv[2];
    const std::string capture_id = argc > 3 ? argv[3] : capture_file.stem().string();

    std::cout << "========================================" << std::endl;
    std::cout << "  Custody Upload - Upload Example" << std::endl;
    std::cout << "  Version " << version::to_string() << std::endl;
    std::cout << "========================================" << std::endl;

    std::ifstream input(capture_file, std::ios::binary);
    if (!input) {
        std::cerr << "[Error] Cannot open capture file: " << capture_file << std::endl;
        return 1;
    }

    auto client = make_http_client();
    if (!client->is_available()) {
        std::cerr << "[Error] HTTP support not available; rebuild with BUILD_WITH_NETWORK_SYSTEM"
                  << std::endl;
        return 1;
    }

    rest_api_config api_config;
    api_config.base_url = base_url;
    if (const char* token = std::getenv("CUSTODY_API_TOKEN")) {
        api_config.headers["Authorization"] = std::string("Bearer ") + token;
    }

    auto session_result = upload_session::builder()
        .with_api(std::make_shared<rest_upload_api>(client, api_config))
        .with_transport(std::make_shared<http_part_transport>(client))
        .with_key_value_store(std::make_shared<file_key_value_store>())
        .build();

    if (!session_result) {
        std::cerr << "[Error] Failed to create session: "
                  << session_result.error().message << std::endl;
        return 1;
    }
    auto& session = session_result.value();

    session.on_progress([](const upload_progress& progress) {
        std::cout << "\r[" << to_string(progress.status) << "] "
                  << progress.units_uploaded << " parts, "
                  << format_bytes(progress.bytes_uploaded) << " / "
                  << format_bytes(progress.bytes_total_received) << std::flush;
    });

    auto identity = session.initiate(capture_id);
    if (!identity) {
        std::cerr << "[Error] " << identity.error().message << std::endl;
        return 1;
    }
    std::cout << "Session " << identity.value().session_id << " -> "
              << identity.value().object_key << std::endl;

    chunk_chain chain;
    std::vector<std::byte> buffer(unit_size);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        auto read = static_cast<std::size_t>(input.gcount());
        if (read == 0) {
            break;
        }

        std::span<const std::byte> unit(buffer.data(), read);
        auto entry = chain.append(chain.size(), unit);
        if (!entry) {
            std::cerr << "\n[Error] " << entry.error().message << std::endl;
            session.abort();
            return 1;
        }

        auto added = session.add_unit(unit, entry.value().hash, entry.value().previous_hash);
        if (!added) {
            // The block is kept and retried by complete()
            std::cerr << "\n[Warning] " << added.error().message << std::endl;
        }
    }

    preview_metadata preview;
    if (auto root = chain.merkle_root()) {
        preview.content_hash = root.value();
    }
    preview.file_size = chain.total_size();
    preview.metadata["source"] = capture_file.filename().string();

    auto completed = session.complete(preview);
    std::cout << std::endl;
    if (!completed) {
        std::cerr << "[Error] Completion failed: " << completed.error().message << std::endl;
        if (completed.error().recoverable) {
            std::cerr << "Persisted state kept; run resume_upload to finish" << std::endl;
        } else {
            session.abort();
        }
        return 1;
    }

    std::cout << "Uploaded " << completed.value().total_parts << " parts ("
              << format_bytes(chain.total_size()) << ")" << std::endl;
    std::cout << "URL: " << completed.value().url << std::endl;
    std::cout << "Content hash: " << preview.content_hash.value_or("") << std::endl;
    return 0;
}
