/**
 * @file token_cache.cpp
 * @brief TokenCache persistence using toml++.
 */

#include "sandbox/token_cache.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

#include <toml++/toml.hpp>

namespace sandbox_runner {

namespace {

std::string utc_now_iso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

}  // namespace

TokenCache::TokenCache(std::filesystem::path path) : path_(std::move(path)) {}

Result<TokenCache::Entries> TokenCache::load() const {
    Entries entries;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return entries;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path_.string());
    } catch (const toml::parse_error&) {
        // A corrupt cache is treated as empty; the next save rewrites it.
        return entries;
    }

    if (auto* tokens = tbl["tokens"].as_table()) {
        for (auto&& [key, node] : *tokens) {
            auto* entry = node.as_table();
            if (!entry) continue;
            auto token = (*entry)["access_token"].value<std::string>();
            if (!token) continue;
            entries.emplace(std::string{key.str()},
                            TokenEntry{*token, (*entry)["created_at"].value_or(std::string{})});
        }
    }
    return entries;
}

Result<void> TokenCache::save(const Entries& entries) const {
    std::error_code ec;
    auto dir = path_.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorKind::Io, "failed to create cache directory " + dir.string()
                                            + ": " + ec.message()};
        }
        std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }

    toml::table tokens;
    for (const auto& [id, entry] : entries) {
        tokens.insert_or_assign(id, toml::table{
            {"access_token", entry.access_token},
            {"created_at", entry.created_at},
        });
    }
    toml::table root{
        {"version", kVersion},
        {"tokens", std::move(tokens)},
    };

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::Io, "failed to write cache file " + tmp.string()};
        }
        out << root << '\n';
        if (!out) {
            return Error{ErrorKind::Io, "failed to write cache file " + tmp.string()};
        }
    }
    std::filesystem::permissions(tmp,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        return Error{ErrorKind::Io, "failed to replace cache file " + path_.string()
                                        + ": " + ec.message()};
    }
    return {};
}

std::optional<std::string> TokenCache::get(const InstanceId& instance_id) const {
    std::shared_lock lock(mutex_);
    auto entries = load();
    if (!entries) return std::nullopt;
    auto it = entries->find(instance_id);
    if (it == entries->end()) return std::nullopt;
    return it->second.access_token;
}

Result<void> TokenCache::set(const InstanceId& instance_id, const std::string& access_token) {
    std::unique_lock lock(mutex_);
    auto entries = load();
    if (!entries) return entries.error();
    (*entries)[instance_id] = TokenEntry{access_token, utc_now_iso8601()};
    return save(*entries);
}

Result<void> TokenCache::remove(const InstanceId& instance_id) {
    std::unique_lock lock(mutex_);
    auto entries = load();
    if (!entries) return entries.error();
    entries->erase(instance_id);
    return save(*entries);
}

Result<void> TokenCache::clear() {
    std::unique_lock lock(mutex_);
    return save(Entries{});
}

Result<std::vector<InstanceId>> TokenCache::list() const {
    std::shared_lock lock(mutex_);
    auto entries = load();
    if (!entries) return entries.error();
    std::vector<InstanceId> ids;
    ids.reserve(entries->size());
    for (const auto& [id, entry] : *entries) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace sandbox_runner
