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

#include "mount_resolver.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>

#define TRACE_MR_INFO() TRACE_INFO() << "mount_resolver(" << (void*)this << ") "
#define TRACE_MR_ERROR() TRACE_ERROR() << "mount_resolver(" << (void*)this << ") "

namespace mnt_resolver {

mount_resolver_impl::mount_resolver_impl(
        const resolver_params& params,
        mount_info_provider_ptr provider,
        stats_sink_ptr sink,
        std::shared_ptr<utils::trivial_timer> service_timer)
    : m_params(params)
    , m_provider(std::move(provider))
    , m_sink(std::move(sink))
    , m_service_timer(std::move(service_timer))
    , m_parent_path_cache(m_params.m_path_cache_size)
    , m_overlay_path_cache(m_params.m_path_cache_size) {
    if (! m_provider)
        throw std::invalid_argument("mount resolver requires a mount info provider");
    if (! m_sink)
        throw std::invalid_argument("mount resolver requires a stats sink");
    if (! m_service_timer)
        throw std::invalid_argument("mount resolver requires a service timer");

    TRACE_MR_INFO() << "created";
}

mount_resolver_impl::~mount_resolver_impl() {
    stop();

    TRACE_MR_INFO() << "destroying";
}

void mount_resolver_impl::start() {
    std::lock_guard l{m_sweep_task_mutex};
    if (m_sweep_task_id)
        return;

    m_sweep_task_id = m_service_timer->post_repeat_task(
        [this](){ sweep(std::chrono::steady_clock::now()); }, m_params.m_sweep_period);

    TRACE_MR_INFO() << "started";
}

void mount_resolver_impl::stop() {
    int sweep_task_id;
    {
        std::lock_guard l{m_sweep_task_mutex};
        sweep_task_id = m_sweep_task_id;
        m_sweep_task_id = 0;
    }

    if (sweep_task_id) {
        // Waits for the sweep to finish if it's executing currently
        m_service_timer->cancel_task(sweep_task_id);
        TRACE_MR_INFO() << "stopped";
    }
}

void mount_resolver_impl::insert(const mount_record& mnt) {
    std::unique_lock l{m_mutex};
    do_insert(mnt);
}

void mount_resolver_impl::insert(const mount_event& e) {
    if (e.m_mount_point_error || e.m_root_error) {
        // Do not insert a mount which paths are not known
        TRACE_MR_ERROR() << "rejects mount id=" << e.m_mount.m_mount_id
            << (e.m_mount_point_error ? ", mount point unresolved" : "")
            << (e.m_root_error ? ", root unresolved" : "");
        try {
            std::rethrow_exception(e.m_mount_point_error ? e.m_mount_point_error : e.m_root_error);
        } catch (...) {
            std::throw_with_nested(std::system_error(resolver_errc::resolution_failure,
                "couldn't insert mount id=" + std::to_string(e.m_mount.m_mount_id)));
        }
    }

    insert(e.m_mount);
}

void mount_resolver_impl::remove(mount_id_t mount_id) {
    std::unique_lock l{m_mutex};

    clear_cache_for(mount_id);

    auto it = m_mounts.find(mount_id);
    if (it == m_mounts.end())
        throw std::system_error(resolver_errc::mount_not_found,
            "unable to remove mount id=" + std::to_string(mount_id));

    auto mnt = it->second;
    m_delete_queue.push_back({mnt, std::chrono::steady_clock::now() + m_params.m_delete_delay});

    // The mount itself lives until the delay expires but nothing can be mounted on top of it or
    // be a layer of it anymore
    delete_children(mount_id);
    delete_device(*mnt);
}

mount_record_ptr mount_resolver_impl::get(mount_id_t mount_id, ::pid_t pid) {
    return lookup(mount_id, pid);
}

mount_path mount_resolver_impl::get_mount_path(mount_id_t mount_id, ::pid_t pid) {
    std::unique_lock l{m_mutex};

    mount_record_ptr mnt;
    try {
        mnt = resolve_mount(mount_id, pid);
    } catch (const std::system_error&) {
        // Callers treat empty paths as unresolved ones
        return {};
    }

    return {get_overlay_path(*mnt), get_parent_path(mount_id), mnt->m_root};
}

std::string mount_resolver_impl::get_mount_point_full_path(mount_id_t mount_id) {
    if (mount_id == 0)
        return {};

    std::unique_lock l{m_mutex};
    return get_parent_path(mount_id);
}

std::string mount_resolver_impl::get_filesystem(mount_id_t mount_id, ::pid_t pid) {
    try {
        return lookup(mount_id, pid)->m_fs_type;
    } catch (const std::system_error&) {
        return {};
    }
}

void mount_resolver_impl::sync_cache(::pid_t pid) {
    std::unique_lock l{m_mutex};
    do_sync_cache(pid);
}

void mount_resolver_impl::sweep(time_point_t now) {
    std::unique_lock l{m_mutex};

    std::size_t removed = 0;
    auto it = m_delete_queue.begin();
    for (; it != m_delete_queue.end() && it->m_timeout_at <= now; ++it) {
        auto mount_id = it->m_mount->m_mount_id;

        // The mount id could be reused by a newer mount while the request has been waiting
        if (auto m_it = m_mounts.find(mount_id); m_it != m_mounts.end() && m_it->second == it->m_mount) {
            do_delete(it->m_mount);
            ++removed;
        }

        clear_cache_for(mount_id);
    }

    m_delete_queue.erase(m_delete_queue.begin(), it);

    if (removed)
        TRACE_MR_INFO() << "removed " << removed << " mount(s) by delayed requests, "
            << m_delete_queue.size() << " request(s) pending";
}

void mount_resolver_impl::send_stats() {
    const std::vector<std::string> cache_tags{std::string{cache_tag}};
    const std::vector<std::string> procfs_tags{std::string{procfs_tag}};
    const std::string hits_name = m_params.m_metric_prefix + std::string{metric_mount_resolver_hits};
    const std::string miss_name = m_params.m_metric_prefix + std::string{metric_mount_resolver_miss};

    m_sink->count(hits_name, m_cache_hits.exchange(0, std::memory_order_relaxed), cache_tags, 1.0);
    m_sink->count(miss_name, m_cache_misses.exchange(0, std::memory_order_relaxed), cache_tags, 1.0);
    m_sink->count(hits_name, m_proc_hits.exchange(0, std::memory_order_relaxed), procfs_tags, 1.0);
    m_sink->count(miss_name, m_proc_misses.exchange(0, std::memory_order_relaxed), procfs_tags, 1.0);

    m_sink->gauge(m_params.m_metric_prefix + std::string{metric_mount_resolver_cache_size},
        static_cast<double>(size()), {}, 1.0);
}

std::size_t mount_resolver_impl::size() {
    std::shared_lock l{m_mutex};
    return m_mounts.size();
}

mount_record_ptr mount_resolver_impl::lookup(mount_id_t mount_id, ::pid_t pid) {
    if (mount_id == 0)
        throw std::system_error(resolver_errc::mount_undefined);

    {
        std::shared_lock l{m_mutex};
        if (auto it = m_mounts.find(mount_id); it != m_mounts.end()) {
            m_cache_hits.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    // Somebody could insert the mount between these two locks, resolve_mount checks it again
    std::unique_lock l{m_mutex};
    return resolve_mount(mount_id, pid);
}

mount_record_ptr mount_resolver_impl::resolve_mount(mount_id_t mount_id, ::pid_t pid) {
    if (mount_id == 0)
        throw std::system_error(resolver_errc::mount_undefined);

    if (auto it = m_mounts.find(mount_id); it != m_mounts.end()) {
        m_cache_hits.fetch_add(1, std::memory_order_relaxed);
        return it->second;
    }

    m_cache_misses.fetch_add(1, std::memory_order_relaxed);

    if (pid != 0) {
        do_sync_cache(pid);

        if (auto it = m_mounts.find(mount_id); it != m_mounts.end()) {
            m_proc_hits.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }

        m_proc_misses.fetch_add(1, std::memory_order_relaxed);
    }

    throw std::system_error(resolver_errc::mount_not_found,
        "mount id=" + std::to_string(mount_id));
}

void mount_resolver_impl::do_sync_cache(::pid_t pid) {
    std::vector<raw_mount_info> mounts;
    try {
        mounts = m_provider->get_mounts(pid);
    } catch (const std::exception&) {
        std::throw_with_nested(std::system_error(resolver_errc::resolution_failure,
            "unable to read mounts of pid=" + std::to_string(pid)));
    }

    std::size_t added = 0;
    for (auto& raw : mounts) {
        if (m_mounts.find(static_cast<mount_id_t>(raw.m_id)) != m_mounts.end())
            continue;

        mount_record mnt;
        try {
            mnt = make_mount_record(raw);
        } catch (const std::range_error&) {
            std::throw_with_nested(std::system_error(resolver_errc::resolution_failure,
                "invalid mount id=" + std::to_string(raw.m_id) + " of pid=" + std::to_string(pid)));
        }

        do_insert(std::move(mnt));
        ++added;
    }

    if (m_params.m_log_syncs)
        TRACE_MR_INFO() << "synchronized mounts of pid=" << pid << ": "
            << added << " added out of " << mounts.size();
}

void mount_resolver_impl::do_insert(mount_record mnt) {
    // Unmount the previous one if it exists
    if (auto it = m_mounts.find(mnt.m_mount_id); it != m_mounts.end()) {
        auto prev = it->second;
        do_delete(prev);
    }

    // A path could be cached while the mount id was unknown
    clear_cache_for(mnt.m_mount_id);

    // Strip the parent path, so the mount point is relative to the parent mount
    if (mnt.m_parent_mount_id != 0 && m_mounts.find(mnt.m_parent_mount_id) != m_mounts.end()) {
        auto prefix = get_parent_path(mnt.m_parent_mount_id);
        if (! prefix.empty() && prefix != "/" && utils::starts_with(mnt.m_mount_point, prefix))
            mnt.m_mount_point.erase(0, prefix.size());
    }

    auto device = mnt.m_device;
    auto mount_id = mnt.m_mount_id;
    auto ptr = std::make_shared<const mount_record>(std::move(mnt));

    m_devices[device][mount_id] = ptr;
    m_mounts[mount_id] = std::move(ptr);
}

void mount_resolver_impl::do_delete(const mount_record_ptr& mnt) {
    // A caller may pass a reference to a pointer held by one of the maps
    auto holder = mnt;

    clear_cache_for(holder->m_mount_id);
    m_mounts.erase(holder->m_mount_id);

    if (auto it = m_devices.find(holder->m_device); it != m_devices.end()) {
        it->second.erase(holder->m_mount_id);
        if (it->second.empty())
            m_devices.erase(it);
    }

    delete_children(holder->m_mount_id);
    delete_device(*holder);
}

void mount_resolver_impl::delete_children(mount_id_t parent_id) {
    std::vector<mount_record_ptr> children;
    for (auto& [id, mnt] : m_mounts)
        if (mnt->m_parent_mount_id == parent_id && id != parent_id)
            children.push_back(mnt);

    // Each removal can cascade further, so re-check that a child is still here
    for (auto& child : children)
        if (auto it = m_mounts.find(child->m_mount_id); it != m_mounts.end() && it->second == child)
            do_delete(child);
}

void mount_resolver_impl::delete_device(const mount_record& mnt) {
    if (! mnt.is_overlay_fs())
        return;

    auto dev_it = m_devices.find(mnt.m_device);
    if (dev_it == m_devices.end())
        return;

    std::vector<mount_record_ptr> layers;
    for (auto& [id, layer] : dev_it->second)
        if (id != mnt.m_mount_id)
            layers.push_back(layer);

    for (auto& layer : layers)
        if (auto it = m_mounts.find(layer->m_mount_id); it != m_mounts.end() && it->second == layer)
            do_delete(layer);
}

void mount_resolver_impl::clear_cache_for(mount_id_t mount_id) {
    m_parent_path_cache.remove(mount_id);
    m_overlay_path_cache.remove(mount_id);
}

std::string mount_resolver_impl::get_parent_path(mount_id_t mount_id) {
    if (auto cached = m_parent_path_cache.get(mount_id))
        return std::move(*cached);

    visited_set_t visited;
    auto path = compose_parent_path(mount_id, visited);
    m_parent_path_cache.add(mount_id, path);
    return path;
}

// Walks up to the root mount (or the first unknown / already visited one) and glues mount points
// back on the way down. A mount point already prefixed with its parent path is taken as is.
std::string mount_resolver_impl::compose_parent_path(mount_id_t mount_id, visited_set_t& visited) const {
    std::vector<const mount_record*> chain;

    for (auto id = mount_id;;) {
        auto it = m_mounts.find(id);
        if (it == m_mounts.end() || ! visited.insert(id).second)
            break;

        chain.push_back(it->second.get());
        id = it->second->m_parent_mount_id;
        if (id == 0)
            break;
    }

    std::string path;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const auto& mount_point = (*it)->m_mount_point;
        if (! path.empty() && path != "/" && ! utils::starts_with(mount_point, path))
            path += mount_point;
        else
            path = mount_point;
    }

    return path;
}

const mount_record* mount_resolver_impl::get_ancestor(const mount_record& mnt) const {
    visited_set_t visited;
    const mount_record* ancestor = nullptr;

    for (auto cur = &mnt; visited.insert(cur->m_mount_id).second && cur->m_parent_mount_id != 0;) {
        auto it = m_mounts.find(cur->m_parent_mount_id);
        if (it == m_mounts.end())
            break;
        ancestor = cur = it->second.get();
    }

    return ancestor;
}

// Overlay layers share a device with the overlay mount itself, so the overlay path of a mount is
// the path of the overlay mount found on the device of its topmost known ancestor
std::string mount_resolver_impl::get_overlay_path(const mount_record& mnt) {
    if (auto cached = m_overlay_path_cache.get(mnt.m_mount_id))
        return std::move(*cached);

    const mount_record* base = get_ancestor(mnt);
    if (! base)
        base = &mnt;

    auto dev_it = m_devices.find(base->m_device);
    if (dev_it == m_devices.end())
        return {};

    // TODO: the first overlay mount in hash order wins if the device has a few of them; pick the
    //       lowest mount id if this ever matters for nested overlays
    for (auto& [id, dev_mount] : dev_it->second) {
        if (id == mnt.m_mount_id || ! dev_mount->is_overlay_fs())
            continue;

        if (auto path = get_parent_path(id); ! path.empty()) {
            m_overlay_path_cache.add(mnt.m_mount_id, path);
            return path;
        }
    }

    return {};
}

} // ns mnt_resolver
