#include "uplink/core/command_handler.hpp"
#include "uplink/core/logger.hpp"
#include "uplink/core/config.hpp"
#include "uplink/core/utils.hpp"
#include "uplink/crypto/hash.hpp"
#include "uplink/storage/storage_config.hpp"
#include "uplink/upload/upload_service.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace uplink::core {

namespace {

using upload::UploadResult;

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> by_extension = {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".webp", "image/webp"}, {".svg", "image/svg+xml"},
        {".mp4", "video/mp4"}, {".mov", "video/quicktime"}, {".webm", "video/webm"},
        {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"}, {".flac", "audio/flac"},
        {".pdf", "application/pdf"}, {".txt", "text/plain"}, {".csv", "text/csv"},
        {".json", "application/json"}, {".md", "text/markdown"},
        {".zip", "application/zip"}, {".gz", "application/gzip"}, {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"}
    };

    auto extension = utils::StringUtils::to_lower(path.extension().string());
    auto it = by_extension.find(extension);
    return it == by_extension.end() ? "application/octet-stream" : it->second;
}

CommandResult open_service(std::unique_ptr<upload::UploadService>& service) {
    auto& config = Config::instance();

    auto policy = upload::UploadPolicy::from_config(config);
    if (!policy.validate()) {
        return CommandResult::error("Invalid upload.* configuration");
    }

    service = std::make_unique<upload::UploadService>(storage::StorageConfig::from_config(config), policy);

    size_t recovered = 0;
    auto started = service->start(recovered);
    if (!started) {
        return CommandResult::error("Failed to open upload storage: " + started.describe());
    }

    LOG_DEBUG("Upload storage ready at {} ({} sessions)",
              service->storage_config().base_directory.string(), recovered);
    return CommandResult::ok();
}

std::string format_time(const TimePoint& time) {
    return utils::TimeUtils::to_iso_string(time);
}

}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return CommandResult::error("Cannot read " + file_path.string() + ": " + ec.message());
    }

    std::unique_ptr<upload::UploadService> service;
    auto opened = open_service(service);
    if (!opened.success) {
        return opened;
    }

    auto& registry = service->registry();
    const auto& policy = registry.policy();
    upload::UploadSession session;

    try {
        auto session_id = options.get_option("session");
        if (session_id.empty()) {
            upload::UploadOptions upload_options;
            if (options.has_option("chunk-size")) {
                upload_options.chunk_size = options.get_uint64_option("chunk-size");
            }
            upload_options.bucket = options.get_option("bucket");
            upload_options.metadata["source_path"] = std::filesystem::absolute(file_path).string();

            crypto::Sha256Hash file_hash;
            auto hashed = crypto::Sha256Hasher::hash_file(file_path, file_hash);
            if (!hashed) {
                return CommandResult::error("Failed to hash " + file_path.string() + ": " + hashed.message);
            }
            upload_options.expected_hash = crypto::hash_utils::hash_to_hex(file_hash);

            auto mime_type = options.get_option("mime", guess_mime_type(file_path));
            auto owner = options.get_option("owner", Config::instance().get_string("upload.default_owner", "local"));

            auto created = registry.create_session(owner, file_path.filename().string(), file_size,
                                                   mime_type, upload_options, session);
            if (!created) {
                return CommandResult::error(created.describe());
            }
        } else {
            auto found = registry.get_session(session_id, session);
            if (!found) {
                return CommandResult::error(found.describe());
            }
            if (session.total_size != file_size) {
                return CommandResult::error("File size " + std::to_string(file_size) +
                                            " does not match session size " + std::to_string(session.total_size));
            }
            if (session.state == upload::SessionState::PAUSED) {
                auto resumed = registry.resume(session_id);
                if (!resumed) {
                    return CommandResult::error(resumed.describe());
                }
            }
        }
    } catch (const std::runtime_error& e) {
        return CommandResult::error(std::string("Upload setup failed: ") + e.what());
    }

    const auto session_id = session.session_id;
    std::cout << "Uploading " << file_path.filename().string() << " ("
              << utils::StringUtils::format_bytes(session.total_size) << ")\n";
    std::cout << "  Session: " << session_id << "\n";
    std::cout << "  Chunks: " << session.chunk_count() << " x "
              << utils::StringUtils::format_bytes(session.chunk_size) << "\n";

    std::mutex output_mutex;
    auto listener = registry.add_listener([&](const upload::UploadEvent& event) {
        if (event.session_id != session_id || event.type != upload::UploadEventType::PROGRESS) {
            return;
        }

        const auto& snapshot = event.snapshot;
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "\r  " << std::fixed << std::setprecision(1) << std::setw(5) << snapshot.percentage << "%  "
                  << utils::StringUtils::format_bytes(static_cast<uint64_t>(snapshot.smoothed_speed_bps)) << "/s";
        if (snapshot.eta) {
            std::cout << "  ETA " << utils::StringUtils::format_duration(*snapshot.eta);
        }
        std::cout << "     " << std::flush;
    });

    std::vector<uint32_t> missing;
    auto listed = registry.missing_chunks(session_id, missing);

    std::atomic<size_t> next_slot{0};
    std::atomic<bool> aborted{false};
    std::mutex failure_mutex;
    UploadResult failure = listed;

    auto record_failure = [&](const UploadResult& result) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (failure) {
            failure = result;
        }
        aborted = true;
    };

    auto worker = [&]() {
        try {
            std::ifstream input(file_path, std::ios::binary);
            if (!input.is_open()) {
                record_failure(UploadResult(upload::UploadError::STORAGE_ERROR, "Cannot open " + file_path.string()));
                return;
            }

            std::vector<uint8_t> buffer;
            while (!aborted) {
                size_t slot = next_slot++;
                if (slot >= missing.size()) {
                    return;
                }

                uint32_t index = missing[slot];
                auto offset = static_cast<uint64_t>(index) * session.chunk_size;
                buffer.resize(static_cast<size_t>(
                    upload::UploadPolicy::chunk_size_at(session.total_size, session.chunk_size, index)));

                input.seekg(static_cast<std::streamoff>(offset));
                input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (!input) {
                    record_failure(UploadResult(upload::UploadError::STORAGE_ERROR,
                                                "Short read at chunk " + std::to_string(index)));
                    return;
                }

                auto chunk_hash = crypto::hash_utils::hex_digest(buffer);

                while (!aborted) {
                    upload::ChunkReceipt receipt;
                    auto result = registry.submit_chunk(session_id, index, buffer, chunk_hash, receipt);
                    if (result) {
                        break;
                    }
                    if (!result.retryable()) {
                        record_failure(result);
                        return;
                    }
                    LOG_DEBUG("Retrying chunk {}: {}", index, result.describe());
                    std::this_thread::sleep_for(result.detail.retry_after.value_or(policy.backoff_base));
                }
            }
        } catch (const std::exception& e) {
            record_failure(UploadResult(upload::UploadError::TERMINAL, e.what()));
        }
    };

    if (listed) {
        auto requested = options.get_int_option("parallel", static_cast<int>(policy.max_concurrent_chunks));
        auto parallel = static_cast<size_t>(std::clamp(requested, 1, static_cast<int>(policy.max_concurrent_chunks)));
        parallel = std::min(parallel, std::max<size_t>(missing.size(), 1));

        std::vector<std::thread> workers;
        for (size_t i = 0; i < parallel; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    registry.remove_listener(listener);
    std::cout << "\n";

    if (!failure) {
        return CommandResult::error("Upload failed: " + failure.describe());
    }

    auto found = registry.get_session(session_id, session);
    if (!found) {
        return CommandResult::error(found.describe());
    }

    if (session.state != upload::SessionState::COMPLETED) {
        std::string reason = session.failure_reason.empty() ? "" : ": " + session.failure_reason;
        return CommandResult::error(std::string("Upload ended in state ") + upload::to_string(session.state) + reason);
    }

    std::cout << "✓ Upload complete\n";
    std::cout << "  Location: " << session.storage_location << "\n";
    std::cout << "  SHA-256: " << session.content_hash << "\n";
    std::cout << "  Bucket: " << session.bucket << " (" << session.category << ")\n";

    return CommandResult::ok("Upload complete");
}

CommandResult SessionsCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    (void)args;

    std::unique_ptr<upload::UploadService> service;
    auto opened = open_service(service);
    if (!opened.success) {
        return opened;
    }

    auto& registry = service->registry();
    std::vector<upload::UploadSession> sessions;

    auto owner = options.get_option("owner");
    if (!owner.empty()) {
        sessions = registry.list_sessions_for_owner(owner);
    } else {
        for (const auto& session_id : registry.session_ids()) {
            upload::UploadSession session;
            if (registry.get_session(session_id, session)) {
                sessions.push_back(std::move(session));
            }
        }
    }

    if (sessions.empty()) {
        std::cout << "No upload sessions.\n";
        return CommandResult::ok();
    }

    std::cout << std::left << std::setw(34) << "SESSION" << std::setw(11) << "STATE"
              << std::setw(9) << "PROGRESS" << std::setw(12) << "SIZE" << "FILE\n";

    for (const auto& session : sessions) {
        std::ostringstream progress;
        progress << std::fixed << std::setprecision(1) << session.percentage << "%";

        std::cout << std::left << std::setw(34) << session.session_id
                  << std::setw(11) << upload::to_string(session.state)
                  << std::setw(9) << progress.str()
                  << std::setw(12) << utils::StringUtils::format_bytes(session.total_size)
                  << session.filename << "\n";

        if (session.state == upload::SessionState::ACTIVE || session.state == upload::SessionState::PAUSED) {
            std::cout << "    " << session.chunk_count() - session.uploaded_chunk_count()
                      << " chunks missing, expires " << format_time(session.expires_at) << "\n";
        } else if (session.state == upload::SessionState::COMPLETED) {
            std::cout << "    " << session.storage_location << "\n";
        } else if (session.state == upload::SessionState::FAILED) {
            std::cout << "    " << upload::to_string(session.failure_stage) << ": " << session.failure_reason << "\n";
        }
    }

    return CommandResult::ok();
}

CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    (void)options;

    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::unique_ptr<upload::UploadService> service;
    auto opened = open_service(service);
    if (!opened.success) {
        return opened;
    }

    auto cancelled = service->registry().cancel(args[1]);
    if (!cancelled) {
        return CommandResult::error(cancelled.describe());
    }

    std::cout << "Cancelled session " << args[1] << "\n";
    return CommandResult::ok();
}

CommandResult SweepCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    (void)args;
    (void)options;

    std::unique_ptr<upload::UploadService> service;
    auto opened = open_service(service);
    if (!opened.success) {
        return opened;
    }

    auto report = service->sweeper().sweep();

    std::cout << "Sessions examined:  " << report.sessions_examined << "\n";
    std::cout << "Sessions expired:   " << report.sessions_expired << "\n";
    std::cout << "Storage reclaimed:  " << report.storage_reclaimed << "\n";
    std::cout << "Sessions evicted:   " << report.sessions_evicted << "\n";
    std::cout << "Orphans removed:    " << report.orphans_removed << "\n";
    if (report.sessions_skipped > 0) {
        std::cout << "Skipped (busy):     " << report.sessions_skipped << "\n";
    }
    std::cout << "Free space:         "
              << utils::StringUtils::format_bytes(service->storage_config().get_available_space()) << "\n";

    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    (void)args;
    (void)options;

    std::unique_ptr<upload::UploadService> service;
    auto opened = open_service(service);
    if (!opened.success) {
        return opened;
    }

    upload::HealthReport report;
    auto result = service->health(report);

    auto check = [](bool ok) { return ok ? "ok" : "unavailable"; };
    std::cout << "Status:             " << (report.healthy ? "healthy" : "unhealthy") << "\n";
    std::cout << "Active sessions:    " << report.active_sessions << "\n";
    std::cout << "Paused sessions:    " << report.paused_sessions << "\n";
    std::cout << "Completed sessions: " << report.completed_sessions << "\n";
    std::cout << "Failed sessions:    " << report.failed_sessions << "\n";
    std::cout << "Expired sessions:   " << report.expired_sessions << "\n";
    std::cout << "Chunk directories:  " << report.chunk_sessions << "\n";
    std::cout << "Chunk storage:      " << check(report.chunk_storage_ok) << "\n";
    std::cout << "Object storage:     " << check(report.object_storage_ok) << "\n";
    std::cout << "Session index:      " << check(report.index_ok) << "\n";
    std::cout << "Free space:         " << utils::StringUtils::format_bytes(report.available_space) << "\n";

    if (!result) {
        return CommandResult::error(result.message);
    }
    return CommandResult::ok();
}

CommandResult ConfigCommandHandler::execute(const std::vector<std::string>& args, const CommandLineParser& options) {
    (void)args;
    (void)options;

    const auto& values = Config::instance().values();
    for (const auto& [key, value] : values) {
        std::cout << key << " = " << value << "\n";
    }

    auto policy = upload::UploadPolicy::from_config(Config::instance());
    if (!policy.validate()) {
        std::cout << "\nwarning: upload.* values are inconsistent\n";
    }

    return CommandResult::ok();
}

}
