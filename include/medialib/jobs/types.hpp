#pragma once

/**
 * @file types.hpp
 * @brief Job names and payloads exchanged through the job queue
 *
 * Payloads travel as JSON so that the queue never needs to know the
 * concrete structs; handlers decode them on the way in.
 */

#include "medialib/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace medialib::jobs {

using json = nlohmann::json;

enum class JobName {
    RefreshLibraryFile,   // Consumed: one crawled path to (re)ingest
    OfflineLibraryFile,   // Consumed: one catalog path missing from disk
    MetadataExtraction,   // Produced for downstream collaborators
    VideoConversion       // Produced for downstream collaborators
};

class JobNameUtils {
public:
    static std::string to_string(JobName name) {
        switch (name) {
            case JobName::RefreshLibraryFile: return "REFRESH_LIBRARY_FILE";
            case JobName::OfflineLibraryFile: return "OFFLINE_LIBRARY_FILE";
            case JobName::MetadataExtraction: return "METADATA_EXTRACTION";
            case JobName::VideoConversion: return "VIDEO_CONVERSION";
            default: return "UNKNOWN";
        }
    }

    static std::optional<JobName> from_string(const std::string& value) {
        if (value == "REFRESH_LIBRARY_FILE") return JobName::RefreshLibraryFile;
        if (value == "OFFLINE_LIBRARY_FILE") return JobName::OfflineLibraryFile;
        if (value == "METADATA_EXTRACTION") return JobName::MetadataExtraction;
        if (value == "VIDEO_CONVERSION") return JobName::VideoConversion;
        return std::nullopt;
    }
};

/**
 * @brief One unit of reconciliation work: a single path in a single library
 *
 * Created by the Reconciler, consumed exactly once by a worker (at-least-once
 * from the queue's point of view, so handlers must tolerate redelivery).
 */
struct LibraryJob {
    std::string asset_path;
    std::string owner_id;
    std::string library_id;
    bool force_refresh = false;
    bool empty_trash = false;
};

/**
 * @brief Follow-on payload for downstream processing of one asset
 */
struct AssetJob {
    std::string id;
    std::optional<std::string> source;   // "upload" for metadata extraction
};

/**
 * @brief Queue entry: job name, encoded payload and delivery bookkeeping
 */
struct JobItem {
    JobName name = JobName::RefreshLibraryFile;
    json payload;
    std::uint32_t attempts = 0;
};

json library_job_to_json(const LibraryJob& job);

Result<LibraryJob> library_job_from_json(const json& payload);

json asset_job_to_json(const AssetJob& job);

Result<AssetJob> asset_job_from_json(const json& payload);

/**
 * @brief Render a payload for log lines
 *
 * Paths are raw filesystem bytes and need not be valid UTF-8; invalid
 * sequences are replaced instead of throwing.
 */
std::string describe_payload(const json& payload);

} // namespace medialib::jobs
