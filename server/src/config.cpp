#include "chatdrop/server/config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chatdrop::server
{

    namespace
    {

        template <typename T>
        void read_if_present(const nlohmann::json &json, const char *key, T &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<T>();
            }
        }

        void read_seconds(const nlohmann::json &json, const char *key, std::chrono::seconds &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = std::chrono::seconds{it->get<std::int64_t>()};
            }
        }

        void apply_limits(const nlohmann::json &json, UploadLimits &limits)
        {
            read_if_present(json, "max_artifact_bytes", limits.max_artifact_bytes);
            read_if_present(json, "max_chunk_bytes", limits.max_chunk_bytes);
            read_if_present(json, "max_chunks_per_upload", limits.max_chunks_per_upload);
            read_if_present(json, "max_frame_bytes", limits.max_frame_bytes);
            read_if_present(json, "max_inflight_frames", limits.max_inflight_frames);
            read_seconds(json, "idle_timeout_seconds", limits.idle_timeout);
            read_seconds(json, "overall_timeout_seconds", limits.overall_timeout);
            read_seconds(json, "sweep_interval_seconds", limits.sweep_interval);
            read_seconds(json, "tombstone_retention_seconds", limits.tombstone_retention);
        }

        void apply_types(const nlohmann::json &json, TypeTable &table)
        {
            for (const auto &[label, entry] : json.items())
            {
                const auto category = category_from_string(label);
                if (!category)
                {
                    throw std::invalid_argument("Unknown category in types table: " + label);
                }
                CategoryTypes types;
                types.content_types = entry.value("content_types", std::vector<std::string>{});
                types.extensions = entry.value("extensions", std::map<std::string, std::string>{});
                table[*category] = std::move(types);
            }
        }

    } // namespace

    void apply_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Unable to open configuration file: " + path.string());
        }
        const auto json = nlohmann::json::parse(in);
        if (!json.is_object())
        {
            throw std::invalid_argument("Configuration root must be a JSON object");
        }

        read_if_present(json, "address", config.address);
        read_if_present(json, "port", config.port);
        read_if_present(json, "worker_threads", config.worker_threads);
        read_if_present(json, "log_level", config.log_level);
        if (auto it = json.find("storage_root"); it != json.end() && !it->is_null())
        {
            config.storage_root = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("log_file"); it != json.end() && !it->is_null())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("limits"); it != json.end())
        {
            apply_limits(*it, config.limits);
        }
        if (auto it = json.find("types"); it != json.end())
        {
            apply_types(*it, config.types);
        }
    }

    void validate_config(const ServerConfig &config)
    {
        const auto &limits = config.limits;
        if (config.storage_root.empty())
        {
            throw std::invalid_argument("storage_root is required");
        }
        if (limits.max_artifact_bytes == 0)
        {
            throw std::invalid_argument("max_artifact_bytes must be positive");
        }
        if (limits.max_chunk_bytes == 0 || limits.max_chunks_per_upload == 0)
        {
            throw std::invalid_argument("chunk limits must be positive");
        }
        // A full chunk, base64 encoded, must fit in one frame together with its envelope.
        if (limits.max_frame_bytes < (limits.max_chunk_bytes / 3 + 1) * 4 + 4096)
        {
            throw std::invalid_argument("max_frame_bytes is too small for max_chunk_bytes");
        }
        if (limits.max_inflight_frames == 0)
        {
            throw std::invalid_argument("max_inflight_frames must be positive");
        }
        if (limits.idle_timeout.count() <= 0 || limits.overall_timeout.count() <= 0 ||
            limits.sweep_interval.count() <= 0)
        {
            throw std::invalid_argument("timeouts and sweep interval must be positive");
        }
        if (limits.overall_timeout < limits.idle_timeout)
        {
            throw std::invalid_argument("overall_timeout must not be shorter than idle_timeout");
        }
        bool any_type = false;
        for (const auto &[category, types] : config.types)
        {
            any_type = any_type || !types.content_types.empty() || !types.extensions.empty();
        }
        if (!any_type)
        {
            throw std::invalid_argument("types table allows nothing");
        }
    }

} // namespace chatdrop::server
