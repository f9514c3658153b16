/**
 * @file resume_upload.cpp
 * @brief Resume an interrupted upload after a process restart
 *
 * This example demonstrates:
 * - Binding a session to a capture with for_capture()
 * - Restoring persisted parts with resume()
 * - Appending the rest of the capture and completing
 * - Aborting a session that cannot be finished
 */

#include <custody/upload/upload.h>
#include <custody/upload/storage/file_key_value_store.h>
#include <custody/upload/transport/http_client.h>
#include <custody/upload/transport/http_part_transport.h>
#include <custody/upload/transport/rest_upload_api.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

using namespace custody::upload;

namespace {

void print_usage(const char* program) {
    std::cout << "Resume Upload Example - Custody Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <api_base_url> <capture_id> [remaining_file]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --state-dir <dir>   Directory of persisted session state" << std::endl;
    std::cout << "  -a, --abort             Cancel the session instead of finishing it" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

/**
 * @brief Feed a file to the session in 1 MiB units
 */
auto append_file(upload_session& session, const std::filesystem::path& path) -> bool {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        std::cerr << "[Error] Cannot open " << path << std::endl;
        return false;
    }

    std::vector<std::byte> buffer(1024 * 1024);
    std::optional<std::string> previous;
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        auto read = static_cast<std::size_t>(input.gcount());
        if (read == 0) {
            break;
        }

        std::span<const std::byte> unit(buffer.data(), read);
        auto hash = checksum::sha256(unit);
        auto added = session.add_unit(unit, hash, previous);
        if (!added) {
            std::cerr << "[Warning] " << added.error().message << std::endl;
        }
        previous = hash;
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path state_dir;
    bool abort_session = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--state-dir") == 0) &&
                   i + 1 < argc) {
            state_dir = argv[++i];
        } else if (std::strcmp(argv[i], "-a") == 0 || std::strcmp(argv[i], "--abort") == 0) {
            abort_session = true;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto client = make_http_client();
    if (!client->is_available()) {
        std::cerr << "[Error] HTTP support not available; rebuild with BUILD_WITH_NETWORK_SYSTEM"
                  << std::endl;
        return 1;
    }

    rest_api_config api_config;
    api_config.base_url = positional[0];
    if (const char* token = std::getenv("CUSTODY_API_TOKEN")) {
        api_config.headers["Authorization"] = std::string("Bearer ") + token;
    }

    auto store = state_dir.empty()
                     ? std::make_shared<file_key_value_store>()
                     : std::make_shared<file_key_value_store>(file_store_config(state_dir));

    auto session_result = upload_session::builder()
        .with_api(std::make_shared<rest_upload_api>(client, api_config))
        .with_transport(std::make_shared<http_part_transport>(client))
        .with_key_value_store(store)
        .for_capture(positional[1])
        .build();

    if (!session_result) {
        std::cerr << "[Error] " << session_result.error().message << std::endl;
        return 1;
    }
    auto& session = session_result.value();

    auto resumed = session.resume();
    if (!resumed) {
        std::cerr << "[Error] Cannot read persisted state: " << resumed.error().message
                  << std::endl;
        session.abort();
        return 1;
    }
    if (!resumed.value()) {
        std::cout << "No interrupted upload found for " << positional[1] << std::endl;
        return 0;
    }

    std::cout << "Resumed session " << session.session_id().value_or("") << " with "
              << session.parts().size() << " parts; next part "
              << session.next_part_number() << std::endl;

    if (abort_session) {
        session.abort();
        std::cout << "Session cancelled" << std::endl;
        return 0;
    }

    if (positional.size() > 2 && !append_file(session, positional[2])) {
        return 1;
    }

    auto completed = session.complete();
    if (!completed) {
        std::cerr << "[Error] Completion failed: " << completed.error().message << std::endl;
        return 1;
    }

    std::cout << "Upload complete: " << completed.value().url << " ("
              << completed.value().total_parts << " parts)" << std::endl;
    return 0;
}
