#pragma once

#include "upload_result.hpp"
#include "upload_session.hpp"
#include "../core/config.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <limits>

namespace uplink::upload {

struct UploadPolicy {
    static constexpr uint64_t MiB = 1024ULL * 1024;
    static constexpr size_t MAX_FILENAME_LENGTH = 255;
    static constexpr uint64_t MAX_CHUNK_COUNT = std::numeric_limits<uint32_t>::max();
    
    uint64_t max_file_size = 100 * MiB;
    uint64_t default_chunk_size = 5 * MiB;
    uint64_t min_chunk_size = 1 * MiB;
    uint64_t max_chunk_size = 64 * MiB;
    
    uint32_t max_chunk_retries = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    
    std::chrono::seconds session_ttl{24 * 60 * 60};
    std::chrono::seconds failed_grace{2 * 60 * 60};
    std::chrono::seconds completed_retention{60 * 60};
    bool sliding_ttl = false;
    
    uint32_t max_concurrent_chunks = 4;
    uint32_t max_sessions_per_owner = 0; // 0 = unlimited
    uint32_t finalize_attempts = 1;
    size_t progress_window = 10;
    
    // Empty means the built-in catalogue.
    std::vector<std::string> allowed_types;
    
    static UploadPolicy from_config(const core::Config& config);
    
    bool validate() const;
    
    UploadResult validate_request(const std::string& filename, uint64_t total_size,
                                  const std::string& mime_type, const UploadOptions& options) const;
    
    // Picks from the size ladder unless a size was requested; both are
    // clamped to [min_chunk_size, max_chunk_size].
    uint64_t choose_chunk_size(uint64_t total_size, std::optional<uint64_t> requested = std::nullopt) const;
    
    // Saturates at MAX_CHUNK_COUNT; validate_request() rejects sizes that
    // would get there.
    static uint32_t chunk_count(uint64_t total_size, uint64_t chunk_size);
    static uint64_t chunk_size_at(uint64_t total_size, uint64_t chunk_size, uint32_t index);
    
    std::chrono::milliseconds backoff_hint(uint32_t retries) const;
    
    static std::string category_for(const std::string& mime_type);
    static std::string bucket_for(const std::string& mime_type);
    static bool is_known_type(const std::string& mime_type);
    static bool has_dangerous_extension(const std::string& filename);
    static bool is_valid_filename(const std::string& filename);
};

}
