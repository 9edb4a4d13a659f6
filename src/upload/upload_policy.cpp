#include "uplink/upload/upload_policy.hpp"
#include "uplink/core/utils.hpp"
#include "uplink/crypto/hash.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <utility>

namespace uplink::upload {

namespace {

const std::vector<std::pair<std::string, std::vector<std::string>>>& type_catalogue() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> catalogue = {
        {"images", {
            "image/jpeg", "image/jpg", "image/png", "image/gif",
            "image/webp", "image/svg+xml", "image/bmp", "image/tiff",
            "image/avif", "image/heic", "image/heif"
        }},
        {"videos", {
            "video/mp4", "video/mpeg", "video/quicktime", "video/x-msvideo",
            "video/webm", "video/3gpp", "video/x-ms-wmv", "video/mkv",
            "video/mov", "video/flv", "video/m4v"
        }},
        {"audio", {
            "audio/mpeg", "audio/mp3", "audio/wav", "audio/ogg",
            "audio/webm", "audio/aac", "audio/flac", "audio/m4a",
            "audio/wma", "audio/opus", "audio/amr"
        }},
        {"documents", {
            "application/pdf", "application/msword",
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
            "application/vnd.ms-excel",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
            "application/vnd.ms-powerpoint",
            "application/vnd.openxmlformats-officedocument.presentationml.presentation",
            "text/plain", "text/csv", "application/json", "text/markdown",
            "application/rtf"
        }},
        {"archives", {
            "application/zip", "application/x-rar-compressed",
            "application/x-7z-compressed", "application/gzip",
            "application/x-tar", "application/x-bzip2"
        }}
    };
    return catalogue;
}

constexpr std::array<const char*, 11> DANGEROUS_EXTENSIONS = {
    ".exe", ".bat", ".com", ".cmd", ".scr", ".pif",
    ".vbs", ".js", ".jar", ".msi", ".dll"
};

struct LadderStep {
    uint64_t up_to;
    uint64_t chunk_size;
};

constexpr uint64_t MB = UploadPolicy::MiB;

constexpr std::array<LadderStep, 3> SIZE_LADDER = {{
    {10 * MB, 1 * MB},
    {100 * MB, 5 * MB},
    {1024 * MB, 16 * MB},
}};
constexpr uint64_t LARGEST_STEP = 64 * MB;

// Written so total_size near the top of the range cannot overflow.
uint64_t count_chunks(uint64_t total_size, uint64_t chunk_size) {
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

}

UploadPolicy UploadPolicy::from_config(const core::Config& config) {
    UploadPolicy policy;
    
    policy.max_file_size = config.get_uint64("upload.max_file_size", policy.max_file_size);
    policy.default_chunk_size = config.get_uint64("upload.default_chunk_size", policy.default_chunk_size);
    policy.min_chunk_size = config.get_uint64("upload.min_chunk_size", policy.min_chunk_size);
    policy.max_chunk_size = config.get_uint64("upload.max_chunk_size", policy.max_chunk_size);
    policy.max_chunk_retries = static_cast<uint32_t>(
        config.get_uint64("upload.max_chunk_retries", policy.max_chunk_retries));
    policy.backoff_base = std::chrono::milliseconds(
        config.get_uint64("upload.backoff_base_ms", policy.backoff_base.count()));
    policy.backoff_cap = std::chrono::milliseconds(
        config.get_uint64("upload.backoff_cap_ms", policy.backoff_cap.count()));
    policy.session_ttl = std::chrono::seconds(
        config.get_uint64("upload.session_ttl_seconds", policy.session_ttl.count()));
    policy.failed_grace = std::chrono::seconds(
        config.get_uint64("upload.failed_grace_seconds", policy.failed_grace.count()));
    policy.completed_retention = std::chrono::seconds(
        config.get_uint64("upload.completed_retention_seconds", policy.completed_retention.count()));
    policy.sliding_ttl = config.get_bool("upload.sliding_ttl", policy.sliding_ttl);
    policy.max_concurrent_chunks = static_cast<uint32_t>(
        config.get_uint64("upload.max_concurrent_chunks", policy.max_concurrent_chunks));
    policy.max_sessions_per_owner = static_cast<uint32_t>(
        config.get_uint64("upload.max_sessions_per_owner", policy.max_sessions_per_owner));
    policy.finalize_attempts = static_cast<uint32_t>(
        config.get_uint64("upload.finalize_attempts", policy.finalize_attempts));
    policy.progress_window = static_cast<size_t>(
        config.get_uint64("upload.progress_window", policy.progress_window));
    
    auto types = core::utils::StringUtils::trim(config.get_string("upload.allowed_types"));
    if (!types.empty()) {
        for (const auto& type : core::utils::StringUtils::split(types, ',')) {
            auto trimmed = core::utils::StringUtils::trim(type);
            if (!trimmed.empty()) {
                policy.allowed_types.push_back(core::utils::StringUtils::to_lower(trimmed));
            }
        }
    }
    
    return policy;
}

bool UploadPolicy::validate() const {
    if (max_file_size == 0) {
        return false;
    }
    
    if (min_chunk_size == 0 || min_chunk_size > max_chunk_size) {
        return false;
    }
    
    // Chunk indices are 32-bit.
    if (count_chunks(max_file_size, min_chunk_size) > MAX_CHUNK_COUNT) {
        return false;
    }
    
    if (default_chunk_size < min_chunk_size || default_chunk_size > max_chunk_size) {
        return false;
    }
    
    if (backoff_base.count() <= 0 || backoff_cap < backoff_base) {
        return false;
    }
    
    if (session_ttl.count() <= 0 || max_concurrent_chunks == 0 ||
        finalize_attempts == 0 || progress_window == 0) {
        return false;
    }
    
    return true;
}

UploadResult UploadPolicy::validate_request(const std::string& filename, uint64_t total_size,
                                            const std::string& mime_type, const UploadOptions& options) const {
    ErrorDetail detail;
    detail.stage = ErrorStage::VALIDATION;
    
    if (!is_valid_filename(filename)) {
        return UploadResult(UploadError::VALIDATION_ERROR, "Invalid filename", detail);
    }
    
    if (has_dangerous_extension(filename)) {
        return UploadResult(UploadError::VALIDATION_ERROR,
                            "File type not allowed for security reasons", detail);
    }
    
    uint64_t limit = options.max_size ? std::min(*options.max_size, max_file_size) : max_file_size;
    if (total_size == 0) {
        detail.actual_size = total_size;
        return UploadResult(UploadError::VALIDATION_ERROR, "File is empty", detail);
    }
    if (total_size > limit) {
        detail.expected_size = limit;
        detail.actual_size = total_size;
        return UploadResult(UploadError::VALIDATION_ERROR,
                            "File size " + std::to_string(total_size) + " bytes exceeds maximum " +
                            std::to_string(limit) + " bytes", detail);
    }
    
    auto type = core::utils::StringUtils::to_lower(mime_type);
    const auto& allowed = !options.allowed_types.empty() ? options.allowed_types : allowed_types;
    if (!allowed.empty()) {
        bool permitted = std::any_of(allowed.begin(), allowed.end(), [&](const std::string& candidate) {
            return core::utils::StringUtils::to_lower(candidate) == type;
        });
        if (!permitted) {
            return UploadResult(UploadError::VALIDATION_ERROR, "File type " + mime_type + " is not allowed", detail);
        }
    } else if (!is_known_type(type)) {
        return UploadResult(UploadError::VALIDATION_ERROR, "File type " + mime_type + " is not supported", detail);
    }
    
    if (!options.expected_hash.empty() && !crypto::hash_utils::is_hex_digest(options.expected_hash)) {
        detail.expected_hash = options.expected_hash;
        return UploadResult(UploadError::VALIDATION_ERROR,
                            "Expected hash must be a hex encoded SHA-256 digest", detail);
    }
    
    if (options.chunk_size && *options.chunk_size == 0) {
        return UploadResult(UploadError::VALIDATION_ERROR, "Requested chunk size must be positive", detail);
    }
    
    auto chunk_size = choose_chunk_size(total_size, options.chunk_size);
    if (chunk_size == 0 || count_chunks(total_size, chunk_size) > MAX_CHUNK_COUNT) {
        detail.actual_size = total_size;
        return UploadResult(UploadError::VALIDATION_ERROR,
                            "File of " + std::to_string(total_size) + " bytes needs more than " +
                            std::to_string(MAX_CHUNK_COUNT) + " chunks", detail);
    }
    
    return UploadResult();
}

uint64_t UploadPolicy::choose_chunk_size(uint64_t total_size, std::optional<uint64_t> requested) const {
    uint64_t chosen = LARGEST_STEP;
    
    if (requested) {
        chosen = *requested;
    } else {
        for (const auto& step : SIZE_LADDER) {
            if (total_size <= step.up_to) {
                chosen = step.chunk_size;
                break;
            }
        }
    }
    
    return std::clamp(chosen, min_chunk_size, max_chunk_size);
}

uint32_t UploadPolicy::chunk_count(uint64_t total_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>(std::min(count_chunks(total_size, chunk_size), MAX_CHUNK_COUNT));
}

uint64_t UploadPolicy::chunk_size_at(uint64_t total_size, uint64_t chunk_size, uint32_t index) {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    if (offset >= total_size) {
        return 0;
    }
    return std::min(chunk_size, total_size - offset);
}

std::chrono::milliseconds UploadPolicy::backoff_hint(uint32_t retries) const {
    // Past 2^20 the cap always wins.
    if (retries >= 20) {
        return backoff_cap;
    }
    auto delay = backoff_base * (int64_t{1} << retries);
    return std::min(delay, backoff_cap);
}

std::string UploadPolicy::category_for(const std::string& mime_type) {
    auto type = core::utils::StringUtils::to_lower(mime_type);
    for (const auto& [category, types] : type_catalogue()) {
        if (std::find(types.begin(), types.end(), type) != types.end()) {
            return category;
        }
    }
    return "other";
}

std::string UploadPolicy::bucket_for(const std::string& mime_type) {
    auto category = category_for(mime_type);
    if (category == "images" || category == "videos" || category == "audio") {
        return "media";
    }
    return "uploads";
}

bool UploadPolicy::is_known_type(const std::string& mime_type) {
    return category_for(mime_type) != "other";
}

bool UploadPolicy::has_dangerous_extension(const std::string& filename) {
    auto extension = core::utils::StringUtils::to_lower(std::filesystem::path(filename).extension().string());
    return std::find(DANGEROUS_EXTENSIONS.begin(), DANGEROUS_EXTENSIONS.end(), extension) !=
           DANGEROUS_EXTENSIONS.end();
}

bool UploadPolicy::is_valid_filename(const std::string& filename) {
    if (filename.empty() || filename.size() > MAX_FILENAME_LENGTH) {
        return false;
    }
    if (filename == "." || filename == "..") {
        return false;
    }
    return filename.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

}
