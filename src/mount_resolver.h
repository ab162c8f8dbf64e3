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

#include "resolver_types.h"
#include "utils.h"

#include <memory>
#include <cstddef>
#include <cstdint>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <shared_mutex>

#include <sys/types.h>

namespace mnt_resolver {

// The resolver keeps the only table of mounts: a kernel event source and namespace re-reading
// both fill it, event processing threads read it. Everything mutable (both indices, path caches,
// the removal queue) is guarded by one shared mutex. Path computations read the same table which
// mutations change, so they run under an exclusive lock for their whole duration and never take
// the lock again on recursion. Pure table lookups go under a shared lock and upgrade to an
// exclusive one only on a miss which needs a namespace re-reading. Statistic counters are
// advisory and live outside of the lock.
class mount_resolver_impl final : public mount_resolver {
public:
    typedef std::chrono::steady_clock::time_point time_point_t;

    mount_resolver_impl(
        const resolver_params& params,
        mount_info_provider_ptr provider,
        stats_sink_ptr sink,
        std::shared_ptr<utils::trivial_timer> service_timer);
    ~mount_resolver_impl();

    mount_resolver_impl(const mount_resolver_impl&) = delete;
    mount_resolver_impl& operator=(const mount_resolver_impl&) = delete;

    void start() override;
    void stop() override;

    void insert(const mount_record& mnt) override;
    void insert(const mount_event& e) override;
    void remove(mount_id_t mount_id) override;

    mount_record_ptr get(mount_id_t mount_id, ::pid_t pid) override;
    mount_path get_mount_path(mount_id_t mount_id, ::pid_t pid) override;
    std::string get_mount_point_full_path(mount_id_t mount_id) override;
    std::string get_filesystem(mount_id_t mount_id, ::pid_t pid) override;

    void sync_cache(::pid_t pid) override;
    void sweep(time_point_t now) override;
    void send_stats() override;
    std::size_t size() override;

private:
    // The pointer value identifies a mount instance: a removal request is applied only if the
    // table still stores the same instance under the mount id.
    typedef std::unordered_map<mount_id_t, mount_record_ptr> mount_map_t;
    typedef std::unordered_set<mount_id_t> visited_set_t;

    struct delete_request {
        mount_record_ptr m_mount;
        time_point_t m_timeout_at;
    };

    const resolver_params m_params;
    const mount_info_provider_ptr m_provider;
    const stats_sink_ptr m_sink;
    const std::shared_ptr<utils::trivial_timer> m_service_timer;

    std::shared_mutex m_mutex;
    mount_map_t m_mounts;
    // Every live mount is present here under its device id, overlay layers share a device
    std::unordered_map<std::uint32_t, mount_map_t> m_devices;
    // Ordered by m_timeout_at since the delay is the same for every request
    std::deque<delete_request> m_delete_queue;
    utils::lru_cache<mount_id_t, std::string> m_parent_path_cache;
    utils::lru_cache<mount_id_t, std::string> m_overlay_path_cache;

    std::atomic<std::int64_t> m_cache_hits{0};
    std::atomic<std::int64_t> m_cache_misses{0};
    std::atomic<std::int64_t> m_proc_hits{0};
    std::atomic<std::int64_t> m_proc_misses{0};

    std::mutex m_sweep_task_mutex;
    int m_sweep_task_id = 0;

    // Shared lock for a hit, exclusive one with re-checking for a miss
    mount_record_ptr lookup(mount_id_t mount_id, ::pid_t pid);

    // All the methods below expect m_mutex to be locked exclusively by a caller

    mount_record_ptr resolve_mount(mount_id_t mount_id, ::pid_t pid);
    void do_sync_cache(::pid_t pid);
    void do_insert(mount_record mnt);

    // Removes the mount right away with everything depending on it
    void do_delete(const mount_record_ptr& mnt);
    void delete_children(mount_id_t parent_id);
    void delete_device(const mount_record& mnt);

    void clear_cache_for(mount_id_t mount_id);

    std::string get_parent_path(mount_id_t mount_id);
    std::string compose_parent_path(mount_id_t mount_id, visited_set_t& visited) const;
    const mount_record* get_ancestor(const mount_record& mnt) const;
    std::string get_overlay_path(const mount_record& mnt);
};

} // ns mnt_resolver
