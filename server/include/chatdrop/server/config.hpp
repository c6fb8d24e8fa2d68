#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chatdrop/server/type_catalog.hpp"

namespace chatdrop::server
{

    struct UploadLimits
    {
        std::uint64_t max_artifact_bytes{10ULL * 1024 * 1024};
        std::uint64_t max_chunk_bytes{1ULL * 1024 * 1024};
        std::uint32_t max_chunks_per_upload{65536};
        std::size_t max_frame_bytes{4U * 1024 * 1024};
        std::size_t max_inflight_frames{16};
        std::chrono::seconds idle_timeout{std::chrono::seconds{300}};
        std::chrono::seconds overall_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{30}};
        std::chrono::seconds tombstone_retention{std::chrono::seconds{3600}};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path storage_root;
        std::size_t worker_threads{0};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        UploadLimits limits{};
        TypeTable types{default_type_table()};
    };

    // Merges the JSON document at path into config. Keys that are absent keep their current value;
    // a category listed under "types" replaces that category's table entirely.
    void apply_config_file(const std::filesystem::path &path, ServerConfig &config);

    // Throws std::invalid_argument describing the first inconsistent setting.
    void validate_config(const ServerConfig &config);

} // namespace chatdrop::server
