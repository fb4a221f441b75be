#include "medialib/jobs/types.hpp"

namespace medialib::jobs {
namespace {

bool flag_or_false(const json& payload, const char* key) {
    auto it = payload.find(key);
    return it != payload.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

json library_job_to_json(const LibraryJob& job) {
    json j;
    j["asset_path"] = job.asset_path;
    j["owner_id"] = job.owner_id;
    j["library_id"] = job.library_id;
    j["force_refresh"] = job.force_refresh;
    j["empty_trash"] = job.empty_trash;
    return j;
}

Result<LibraryJob> library_job_from_json(const json& payload) {
    if (!payload.is_object()) {
        return fail<LibraryJob>(ErrorKind::InvalidRequest, "Library job payload must be an object");
    }

    for (const char* key : {"asset_path", "library_id"}) {
        auto it = payload.find(key);
        if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
            return fail<LibraryJob>(ErrorKind::InvalidRequest,
                std::string("Library job payload is missing '") + key + "'");
        }
    }

    LibraryJob job;
    job.asset_path = payload.at("asset_path").get<std::string>();
    job.library_id = payload.at("library_id").get<std::string>();
    if (auto owner = payload.find("owner_id"); owner != payload.end() && owner->is_string()) {
        job.owner_id = owner->get<std::string>();
    }
    job.force_refresh = flag_or_false(payload, "force_refresh");
    job.empty_trash = flag_or_false(payload, "empty_trash");
    return Ok(std::move(job));
}

json asset_job_to_json(const AssetJob& job) {
    json j;
    j["id"] = job.id;
    if (job.source) {
        j["source"] = *job.source;
    }
    return j;
}

Result<AssetJob> asset_job_from_json(const json& payload) {
    if (!payload.is_object() || !payload.contains("id") || !payload["id"].is_string()) {
        return fail<AssetJob>(ErrorKind::InvalidRequest, "Asset job payload is missing 'id'");
    }

    AssetJob job;
    job.id = payload["id"].get<std::string>();
    if (payload.contains("source") && payload["source"].is_string()) {
        job.source = payload["source"].get<std::string>();
    }
    return Ok(std::move(job));
}

std::string describe_payload(const json& payload) {
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace medialib::jobs
