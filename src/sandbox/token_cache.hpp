/**
 * @file token_cache.hpp
 * @brief File-backed cache of instance access tokens.
 *
 * Tokens are only handed out when an instance is created, so they have to
 * survive across invocations for `--instance` to work. The cache file is
 * TOML:
 *
 *   version = 1
 *   [tokens.sbx-0123456789ab]
 *   access_token = "..."
 *   created_at = "2024-01-15T10:30:00Z"
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sandbox_runner {

struct TokenEntry {
    std::string access_token;
    std::string created_at;
};

/**
 * @brief Thread-safe token cache. Every call reloads the file, so several
 *        cache objects over one path see each other's writes.
 */
class TokenCache {
public:
    static constexpr int64_t kVersion = 1;

    explicit TokenCache(std::filesystem::path path);

    [[nodiscard]] std::optional<std::string> get(const InstanceId& instance_id) const;
    Result<void> set(const InstanceId& instance_id, const std::string& access_token);
    Result<void> remove(const InstanceId& instance_id);
    Result<void> clear();
    [[nodiscard]] Result<std::vector<InstanceId>> list() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    using Entries = std::map<InstanceId, TokenEntry>;

    Result<Entries> load() const;
    Result<void> save(const Entries& entries) const;

    std::filesystem::path path_;
    mutable std::shared_mutex mutex_;
};

}  // namespace sandbox_runner
