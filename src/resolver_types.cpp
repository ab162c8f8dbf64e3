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

#include "resolver_types.h"
#include "mount_resolver.h"
#include "utils.h"

#include <sys/sysmacros.h>

namespace mnt_resolver {

namespace {

class resolver_category_impl final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "mnt_resolver";
    }

    std::string message(int ev) const override {
        switch (static_cast<resolver_errc>(ev)) {
        case resolver_errc::mount_not_found: return "unknown mount id";
        case resolver_errc::mount_undefined: return "undefined mount id";
        case resolver_errc::resolution_failure: return "mount resolution failure";
        default: return "unknown mount resolver error";
        }
    }
};

} // ns anonymous

const std::error_category& resolver_category() noexcept {
    static const resolver_category_impl category;
    return category;
}

std::uint32_t parse_group_id(std::string_view optional_fields) {
    for (std::string_view field : utils::string_splitter(optional_fields, " ")) {
        auto colon_pos = field.find(':');
        if (colon_pos == std::string_view::npos)
            continue;

        auto tag = field.substr(0, colon_pos);
        if (tag == "shared" || tag == "master")
            return utils::to_number<std::uint32_t>(field.substr(colon_pos + 1));
    }

    return 0;
}

mount_record make_mount_record(const raw_mount_info& mnt) {
    mount_record res;
    res.m_group_id = parse_group_id(mnt.m_optional);
    res.m_mount_id = static_cast<mount_id_t>(mnt.m_id);
    res.m_parent_mount_id = static_cast<mount_id_t>(mnt.m_parent);
    res.m_device = static_cast<std::uint32_t>(makedev(mnt.m_major, mnt.m_minor));
    res.m_mount_point = mnt.m_mount_point;
    res.m_root = mnt.m_root;
    res.m_fs_type = mnt.m_fs_type;
    return res;
}

std::unique_ptr<mount_resolver> create_mount_resolver(
        const resolver_params& params, mount_info_provider_ptr provider, stats_sink_ptr sink) {
    auto timer = std::make_shared<utils::thread_timer_executor>();
    timer->start();

    return std::make_unique<mount_resolver_impl>(params, std::move(provider), std::move(sink),
        std::move(timer));
}

} // ns mnt_resolver
