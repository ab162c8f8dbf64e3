// Copyright (c) 2024-2025 Grigoryev Vyacheslav Vladimirovich
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of
// this software and associated documentation files (the "Software"), to deal in
// the Software without restriction, including without limitation the rights to
// use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
// the Software, and to permit persons to whom the Software is furnished to do so,
// subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
// FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
// COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
// IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

// This file declares only types required for external users of the resolver library. Should be
// considered as the only public header of it. No internals should leak via this header.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <exception>
#include <system_error>
#include <chrono>
#include <string_view>
#include <string>
#include <vector>
#include <type_traits>

#include <sys/types.h>

namespace mnt_resolver {

typedef std::uint32_t mount_id_t;

// One kernel mount point. The mount point path is not absolute: a resolved path of the parent
// mount is stripped from it on insertion (if the parent is known at that moment).
struct mount_record {
    mount_id_t m_mount_id = 0;
    mount_id_t m_parent_mount_id = 0;   // 0 - a root mount, no parent
    std::uint32_t m_group_id = 0;       // peer group of mount propagation, 0 - none
    std::uint32_t m_device = 0;         // makedev(major, minor) truncated to 32 bits
    std::string m_mount_point;
    std::string m_root;
    std::string m_fs_type;

    bool is_overlay_fs() const noexcept { return m_fs_type == "overlay"; }
};

typedef std::shared_ptr<const mount_record> mount_record_ptr;

// One parsed line of /proc/<pid>/mountinfo as delivered by a mount info provider
struct raw_mount_info {
    int m_id = 0;
    int m_parent = 0;
    unsigned m_major = 0;
    unsigned m_minor = 0;
    std::string m_root;
    std::string m_mount_point;
    std::string m_fs_type;
    std::string m_optional;     // optional fields separated by spaces, e.g. "shared:2 master:7"
};

// Returns a peer group id out of the mountinfo optional fields - a value of the first "shared:N"
// or "master:N" field, 0 if there is no such one. Throws std::range_error on a malformed number.
std::uint32_t parse_group_id(std::string_view optional_fields);

// Throws std::range_error if the optional fields can't be parsed
mount_record make_mount_record(const raw_mount_info& mnt);

// A mount notification issued by a kernel event source. The source resolves both paths itself
// and reports its failures here instead of throwing.
struct mount_event {
    mount_record m_mount;
    std::exception_ptr m_mount_point_error;
    std::exception_ptr m_root_error;
};

enum class resolver_errc {
    mount_not_found = 1,
    mount_undefined,
    resolution_failure
};

const std::error_category& resolver_category() noexcept;

inline std::error_code make_error_code(resolver_errc e) noexcept {
    return {static_cast<int>(e), resolver_category()};
}

// Source of mount points of a namespace which a process lives in. Implementations are expected
// to throw std::system_error (ENOENT for a process that has gone, for instance) on failure.
struct mount_info_provider {
    virtual ~mount_info_provider() = default;

    virtual std::vector<raw_mount_info> get_mounts(::pid_t pid) = 0;
};

typedef std::shared_ptr<mount_info_provider> mount_info_provider_ptr;

// Destination of the resolver statistics. Any exception thrown here is propagated to a caller of
// mount_resolver::send_stats.
struct stats_sink {
    virtual ~stats_sink() = default;

    virtual void count(std::string_view name, std::int64_t value,
        const std::vector<std::string>& tags, double rate) = 0;
    virtual void gauge(std::string_view name, double value,
        const std::vector<std::string>& tags, double rate) = 0;
};

typedef std::shared_ptr<stats_sink> stats_sink_ptr;

struct resolver_params {
    // A mount removal request is applied after this delay. It gives time to events which are
    // still in flight to resolve the mount.
    std::chrono::steady_clock::duration m_delete_delay = std::chrono::seconds(5);
    std::chrono::steady_clock::duration m_sweep_period = std::chrono::seconds(2);
    std::size_t m_path_cache_size = 256;
    std::string m_metric_prefix = "datadog.runtime_security.";
    // Logs every namespace re-sync, each one is done under the exclusive lock
    bool m_log_syncs = false;
};

struct mount_path {
    std::string m_overlay_path;
    std::string m_parent_path;
    std::string m_root_path;
};

// Metric names sent by mount_resolver::send_stats (prefixed with resolver_params::m_metric_prefix)
inline constexpr std::string_view metric_mount_resolver_hits = "mount_resolver.hits";
inline constexpr std::string_view metric_mount_resolver_miss = "mount_resolver.miss";
inline constexpr std::string_view metric_mount_resolver_cache_size = "mount_resolver.cache_size";
inline constexpr std::string_view cache_tag = "type:cache";
inline constexpr std::string_view procfs_tag = "type:procfs";

// A cache of mount points of the system. All methods can be called from any thread concurrently.
// Errors are reported as std::system_error exceptions with resolver_errc codes.
struct mount_resolver {
    virtual ~mount_resolver() = default;

    // Starts a periodic processing of pending mount removals
    virtual void start() = 0;

    // Stops the periodic processing, waits for it if it's executing right now
    virtual void stop() = 0;

    // Adds a mount point replacing a previous one with the same mount id (if any)
    virtual void insert(const mount_record& mnt) = 0;

    // Rejects the event with resolution_failure if a kernel side failed to resolve any path
    virtual void insert(const mount_event& e) = 0;

    // Schedules the mount removal after resolver_params::m_delete_delay. Mounts depending on it
    // (children, overlay layers of the same device) are removed right away. Throws
    // mount_not_found for an unknown mount.
    virtual void remove(mount_id_t mount_id) = 0;

    // Throws mount_undefined for mount id 0, mount_not_found if the mount is unknown even after
    // re-reading mounts of the process 'pid' (no re-reading for pid 0), resolution_failure if
    // the re-reading failed.
    virtual mount_record_ptr get(mount_id_t mount_id, ::pid_t pid) = 0;

    // Never throws resolution errors: all fields are empty if the mount can't be resolved
    virtual mount_path get_mount_path(mount_id_t mount_id, ::pid_t pid) = 0;

    virtual std::string get_mount_point_full_path(mount_id_t mount_id) = 0;

    // Returns an empty string if the mount can't be resolved
    virtual std::string get_filesystem(mount_id_t mount_id, ::pid_t pid) = 0;

    // Adds every unknown mount point of the namespace the process 'pid' lives in
    virtual void sync_cache(::pid_t pid) = 0;

    // Applies every removal request due at 'now'
    virtual void sweep(std::chrono::steady_clock::time_point now) = 0;

    virtual void send_stats() = 0;

    virtual std::size_t size() = 0;
};

std::unique_ptr<mount_resolver> create_mount_resolver(
    const resolver_params& params, mount_info_provider_ptr provider, stats_sink_ptr sink);

} // ns mnt_resolver

namespace std {

template <>
struct is_error_code_enum<mnt_resolver::resolver_errc> : true_type {};

} // ns std
