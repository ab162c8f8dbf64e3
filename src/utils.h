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

// Helpers shared by the resolver implementation: field splitting and number parsing for mountinfo
// data, the path cache container, logging and the timer running periodic maintenance.

#include <cstddef>
#include <cstdint>
#include <utility>
#include <stdexcept>
#include <exception>
#include <string_view>
#include <string>
#include <list>
#include <vector>
#include <unordered_map>
#include <optional>
#include <limits>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <ostream>
#include <functional>
#include <thread>
#include <iterator>
#include <algorithm>
#include <type_traits>

namespace mnt_resolver::utils {

// Iterates over non-empty fields of a string delimited by any of the given characters
class string_splitter {
public:
    class iterator {
    public:
        typedef std::string_view value_type;
        typedef const std::string_view& reference;
        typedef const std::string_view* pointer;
        typedef std::ptrdiff_t difference_type;
        typedef std::forward_iterator_tag iterator_category;

        iterator() = default;

        iterator(std::string_view rest, std::string_view delims) noexcept
            : m_rest(rest), m_delims(delims), m_at_end(false) {
            next();
        }

        reference operator*() const noexcept { return m_field; }
        pointer operator->() const noexcept { return &m_field; }

        bool operator==(const iterator& r) const noexcept {
            return m_at_end == r.m_at_end && (m_at_end || m_field.data() == r.m_field.data());
        }

        bool operator!=(const iterator& r) const noexcept { return ! (*this == r); }

        iterator& operator++() noexcept {
            next();
            return *this;
        }

    private:
        std::string_view m_rest;
        std::string_view m_delims;
        std::string_view m_field;
        bool m_at_end = true;

        void next() noexcept {
            auto b = m_rest.find_first_not_of(m_delims);
            if (b == std::string_view::npos) {
                m_at_end = true;
                return;
            }

            auto e = std::min(m_rest.find_first_of(m_delims, b), m_rest.size());
            m_field = m_rest.substr(b, e - b);
            m_rest.remove_prefix(e);
        }
    };

    string_splitter(std::string_view input, std::string_view delims) noexcept
        : m_input(input), m_delims(delims) {
    }

    iterator begin() const noexcept { return {m_input, m_delims}; }
    iterator end() const noexcept { return {}; }

private:
    std::string_view m_input;
    std::string_view m_delims;
};

inline bool starts_with(std::string_view s, std::string_view part) {
    return s.size() >= part.size() && s.substr(0, part.size()) == part;
}

enum class num_conv_result : char {
    ok, overflow, garbage
};

// Surrounding spaces are allowed, a sign is not
num_conv_result to_ullong(std::string_view str, unsigned long long& val, int base);

template <class T>
num_conv_result to_number_ref(std::string_view str, T& val, int base = 10) {
    static_assert(std::is_unsigned_v<T> && ! std::is_same_v<T, bool>, "unsigned integers only");

    unsigned long long res;
    if (auto r = to_ullong(str, res, base); r != num_conv_result::ok)
        return r;
    if (res > std::numeric_limits<T>::max())
        return num_conv_result::overflow;

    val = static_cast<T>(res);
    return num_conv_result::ok;
}

// Throws std::range_error if the string is not a number or the number doesn't fit into T
template <class T>
T to_number(std::string_view str, int base = 10) {
    T val{};
    switch (to_number_ref(str, val, base)) {
    case num_conv_result::ok:
        break;
    case num_conv_result::overflow:
        throw std::range_error("\"" + std::string{str} + "\" is out of range");
    case num_conv_result::garbage:
        throw std::range_error("\"" + std::string{str} + "\" is not a number");
    }
    return val;
}

// Bounded map with least-recently-used eviction. Not thread safe: lookups reorder the items, so
// an owner must serialize every call (including get) with an exclusive lock.
template <class K, class V, class Hash = std::hash<K>>
class lru_cache {
    // Most recently used item is at the front
    typedef std::list<std::pair<K, V>> items_t;
    typedef std::unordered_map<K, typename items_t::iterator, Hash> index_t;

public:
    typedef std::size_t size_type;

    explicit lru_cache(size_type capacity)
        : m_capacity(capacity) {
        if (m_capacity == 0)
            throw std::invalid_argument("lru cache capacity must be positive");
        m_index.reserve(m_capacity);
    }

    lru_cache(const lru_cache&) = delete;
    lru_cache& operator=(const lru_cache&) = delete;

    std::optional<V> get(const K& key) {
        auto it = m_index.find(key);
        if (it == m_index.end())
            return std::nullopt;
        m_items.splice(m_items.begin(), m_items, it->second);
        return it->second->second;
    }

    // Returns true if an old item has been evicted to make room for the new one
    bool add(const K& key, V value) {
        if (auto it = m_index.find(key); it != m_index.end()) {
            it->second->second = std::move(value);
            m_items.splice(m_items.begin(), m_items, it->second);
            return false;
        }

        if (m_items.size() < m_capacity) {
            m_items.emplace_front(key, std::move(value));
            m_index.emplace(key, m_items.begin());
            return false;
        }

        // Full - recycle the least recently used list node and its index node for the new item
        auto node = m_index.extract(m_items.back().first);
        m_items.splice(m_items.begin(), m_items, std::prev(m_items.end()));
        m_items.front().first = key;
        m_items.front().second = std::move(value);
        node.key() = key;
        node.mapped() = m_items.begin();
        m_index.insert(std::move(node));
        return true;
    }

    bool remove(const K& key) {
        auto it = m_index.find(key);
        if (it == m_index.end())
            return false;
        m_items.erase(it->second);
        m_index.erase(it);
        return true;
    }

    bool contains(const K& key) const {
        return m_index.find(key) != m_index.end();
    }

    void clear() noexcept {
        m_index.clear();
        m_items.clear();
    }

    size_type size() const noexcept { return m_index.size(); }
    size_type capacity() const noexcept { return m_capacity; }
    bool empty() const noexcept { return m_index.empty(); }

private:
    const size_type m_capacity;
    items_t m_items;
    index_t m_index;
};

// Serializes lines written by several threads into one stream. A line is prefixed with a
// monotonic timestamp and a thread id.
class sync_logger {
public:
    // Holds the logger locked until the end of a full expression which outputs the line
    class line {
    public:
        line(std::unique_lock<std::mutex> l, std::ostream& os)
            : m_l(std::move(l)), m_os(os) {
        }

        line(line&&) = default;

        ~line() {
            if (m_l.owns_lock())
                m_os << std::endl;
        }

        template <class T>
        line&& operator<<(const T& v) && {
            m_os << v;
            return std::move(*this);
        }

    private:
        std::unique_lock<std::mutex> m_l;
        std::ostream& m_os;
    };

    explicit sync_logger(std::ostream& os)
        : m_os(os) {
    }

    line operator()();

private:
    std::mutex m_mutex;
    std::ostream& m_os;
};

extern sync_logger g_sync_logger;
extern sync_logger g_sync_err_logger;

#define TRACE_INFO() ::mnt_resolver::utils::g_sync_logger()
#define TRACE_ERROR() ::mnt_resolver::utils::g_sync_err_logger()

// Outputs what() of an exception followed by ones of exceptions nested into it
struct exception_chain {
    const std::exception& m_exc;
};

std::ostream& operator<<(std::ostream& os, const exception_chain& c);

// Periodic tasks. A task runs for the first time as soon as possible and then each pause after
// its previous run has finished.
struct trivial_timer {
    virtual ~trivial_timer() = default;

    typedef std::chrono::steady_clock::time_point time_point_t;
    typedef std::function<void()> cb_t;

    // Throws std::invalid_argument if the pause is not positive
    virtual int post_repeat_task(cb_t cb, time_point_t::duration pause) = 0;

    // Waits for the task if another thread executes it at the moment
    virtual void cancel_task(int id) = 0;
    virtual void cancel_all() = 0;
};

// Runs due tasks on a thread calling execute(). Expects one such thread and a few tasks.
class polling_timer_executor : public trivial_timer {
public:
    // The callback is called when a new task becomes due before the time point returned by the
    // last execute() call
    explicit polling_timer_executor(cb_t replan_cb)
        : m_replan_cb(std::move(replan_cb)) {
    }

    int post_repeat_task(cb_t cb, time_point_t::duration pause) override;
    void cancel_task(int id) override;
    void cancel_all() override;

    // Runs tasks due at the moment of the call and returns when to call it next time,
    // time_point_t::max() if there are no tasks. Task failures are logged.
    time_point_t execute(const std::function<time_point_t()>& now_provider);

private:
    struct repeat_task {
        int m_id;
        time_point_t m_when;
        time_point_t::duration m_pause;
        cb_t m_cb;
    };

    const cb_t m_replan_cb;

    std::mutex m_mutex;
    std::condition_variable m_finished_cv;
    std::vector<repeat_task> m_tasks;
    int m_next_id = 1;
    // The executing task stays in m_tasks, cancelling only marks it
    int m_executing_id = 0;
    bool m_executing_cancelled = false;
    std::thread::id m_executing_thread;

    std::vector<repeat_task>::iterator find_task(int id);
};

class thread_timer_executor : public trivial_timer {
public:
    thread_timer_executor();
    ~thread_timer_executor() { stop(); }

    int post_repeat_task(cb_t cb, time_point_t::duration pause) override {
        return m_timer.post_repeat_task(std::move(cb), pause);
    }

    void cancel_task(int id) override {
        m_timer.cancel_task(id);
    }

    void cancel_all() override {
        m_timer.cancel_all();
    }

    void start();
    // Cancels all the tasks
    void stop();

private:
    polling_timer_executor m_timer;
    std::thread m_thread;

    std::mutex m_wake_mutex;
    std::condition_variable m_wake_cv;
    bool m_stopping = false;
    bool m_replanned = false;

    void thread_proc();
};

} // ns mnt_resolver::utils
