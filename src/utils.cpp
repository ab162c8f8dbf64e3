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

#include "utils.h"

#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include <time.h>
#include <unistd.h>

namespace mnt_resolver::utils {

namespace {

std::string_view trim(std::string_view str) {
    auto is_space = [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (! str.empty() && is_space(str.front()))
        str.remove_prefix(1);
    while (! str.empty() && is_space(str.back()))
        str.remove_suffix(1);
    return str;
}

} // ns anonymous

num_conv_result to_ullong(std::string_view str, unsigned long long& val, int base) {
    str = trim(str);

    // strtoull takes a sign and silently negates the value
    if (str.empty() || ! std::isalnum(static_cast<unsigned char>(str.front())))
        return num_conv_result::garbage;

    // Longer than any representable number even in base 2
    char buffer[72];
    if (str.size() >= sizeof(buffer))
        return num_conv_result::overflow;

    str.copy(buffer, str.size());
    buffer[str.size()] = '\0';

    char* eptr;
    errno = 0;
    auto res = ::strtoull(buffer, &eptr, base);
    if (eptr != buffer + str.size())
        return num_conv_result::garbage;
    if (errno == ERANGE)
        return num_conv_result::overflow;

    val = res;
    return num_conv_result::ok;
}

auto sync_logger::operator()() -> line {
    ::timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);

    std::unique_lock l{m_mutex};
    m_os << ts.tv_sec << '.' << std::setw(3) << std::setfill('0') << ts.tv_nsec / 1'000'000L
        << std::setfill(' ') << " [" << ::gettid() << "] ";
    return {std::move(l), m_os};
}

sync_logger g_sync_logger{std::cout};
sync_logger g_sync_err_logger{std::cerr};

std::ostream& operator<<(std::ostream& os, const exception_chain& c) {
    os << c.m_exc.what();
    try {
        std::rethrow_if_nested(c.m_exc);
    } catch (const std::exception& nested) {
        os << "; " << exception_chain{nested};
    } catch (...) {
        os << "; non-standard exception";
    }
    return os;
}

int polling_timer_executor::post_repeat_task(cb_t cb, time_point_t::duration pause) {
    if (pause <= time_point_t::duration::zero())
        throw std::invalid_argument("a repeat task requires a positive pause");

    int id;
    {
        std::lock_guard l{m_mutex};
        id = m_next_id++;
        m_tasks.push_back({id, time_point_t::min(), pause, std::move(cb)});
    }

    // Due right away
    m_replan_cb();
    return id;
}

void polling_timer_executor::cancel_task(int id) {
    std::unique_lock l{m_mutex};

    if (id != 0 && id == m_executing_id) {
        m_executing_cancelled = true;
        // A task may cancel itself
        if (m_executing_thread != std::this_thread::get_id())
            m_finished_cv.wait(l, [this, id](){ return m_executing_id != id; });
        return;
    }

    if (auto it = find_task(id); it != m_tasks.end())
        m_tasks.erase(it);
}

void polling_timer_executor::cancel_all() {
    std::lock_guard l{m_mutex};

    m_tasks.erase(
        std::remove_if(m_tasks.begin(), m_tasks.end(),
            [this](auto& t){ return t.m_id != m_executing_id; }),
        m_tasks.end());

    if (m_executing_id != 0)
        m_executing_cancelled = true;
}

auto polling_timer_executor::execute(const std::function<time_point_t()>& now_provider) -> time_point_t {
    auto by_when = [](const repeat_task& a, const repeat_task& b){ return a.m_when < b.m_when; };
    const auto now_tp = now_provider();

    std::unique_lock l{m_mutex};
    while (true) {
        auto it = std::min_element(m_tasks.begin(), m_tasks.end(), by_when);
        if (it == m_tasks.end() || it->m_when > now_tp)
            break;

        auto id = it->m_id;
        auto cb = it->m_cb;
        m_executing_id = id;
        m_executing_cancelled = false;
        m_executing_thread = std::this_thread::get_id();
        l.unlock();

        try {
            cb();
        } catch (const std::exception& e) {
            TRACE_ERROR() << "timer task id=" << id << " failed: " << exception_chain{e};
        } catch (...) {
            TRACE_ERROR() << "timer task id=" << id << " failed with a non-standard exception";
        }

        auto finished_tp = now_provider();
        l.lock();

        it = find_task(id);
        if (m_executing_cancelled)
            m_tasks.erase(it);
        else
            it->m_when = finished_tp + it->m_pause;

        m_executing_id = 0;
        m_executing_thread = {};
        m_finished_cv.notify_all();
    }

    auto next_it = std::min_element(m_tasks.begin(), m_tasks.end(), by_when);
    return next_it == m_tasks.end() ? time_point_t::max() : next_it->m_when;
}

auto polling_timer_executor::find_task(int id) -> std::vector<repeat_task>::iterator {
    return std::find_if(m_tasks.begin(), m_tasks.end(), [id](auto& t){ return t.m_id == id; });
}

thread_timer_executor::thread_timer_executor()
    : m_timer([this](){
        std::lock_guard l{m_wake_mutex};
        m_replanned = true;
        m_wake_cv.notify_all();
    }) {
}

void thread_timer_executor::start() {
    if (! m_thread.joinable())
        m_thread = std::thread{[this](){ thread_proc(); }};
}

void thread_timer_executor::stop() {
    if (! m_thread.joinable())
        return;

    {
        std::lock_guard l{m_wake_mutex};
        m_stopping = true;
    }
    m_timer.cancel_all();
    m_wake_cv.notify_all();
    m_thread.join();

    std::lock_guard l{m_wake_mutex};
    m_stopping = false;
}

void thread_timer_executor::thread_proc() {
    auto woken = [this](){ return m_stopping || m_replanned; };

    std::unique_lock l{m_wake_mutex};
    while (! m_stopping) {
        // A task posted while executing raises the flag again
        m_replanned = false;
        l.unlock();

        auto next_tp = m_timer.execute([](){ return std::chrono::steady_clock::now(); });

        l.lock();
        if (next_tp == time_point_t::max())
            m_wake_cv.wait(l, woken);
        else
            m_wake_cv.wait_until(l, next_tp, woken);
    }
}

} // ns mnt_resolver::utils
