/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <stdexcept>

#include <seastar/core/coroutine.hh>
#include <seastar/util/file.hh>

#include "utils/config_file.hh"

namespace utils {

config_file::config_src::config_src(config_file* cf, std::string_view name, value_status status, std::string_view desc)
    : _name(name)
    , _desc(desc)
    , _status(status)
{
    cf->add(*this);
}

void config_file::add(config_src& src) {
    _cfgs.push_back(&src);
}

void config_file::add_options(bpo::options_description_easy_init& init) {
    for (auto* src : _cfgs) {
        src->add_command_line_option(init);
    }
}

config_file::config_src* config_file::find(std::string_view name) const noexcept {
    for (auto* src : _cfgs) {
        if (src->name() == name) {
            return src;
        }
    }
    return nullptr;
}

void config_file::read_from_yaml(const sstring& yaml, error_handler h) {
    read_from_yaml(yaml.c_str(), std::move(h));
}

void config_file::read_from_yaml(const char* yaml, error_handler h) {
    if (!h) {
        h = [] (const sstring& opt, const sstring& msg, std::optional<value_status> status) {
            if (status.value_or(value_status::Invalid) != value_status::Unused) {
                throw std::invalid_argument(fmt::format("{} : {}", msg, opt));
            }
        };
    }

    auto doc = YAML::Load(yaml);
    if (!doc.IsMap()) {
        if (doc.IsNull()) {
            return;
        }
        throw std::invalid_argument("configuration file is not a map of options");
    }
    for (auto node : doc) {
        auto label = sstring(node.first.as<std::string>());
        auto* src = find(label);
        if (!src) {
            h(label, "Unknown option", std::nullopt);
            continue;
        }
        if (src->status() != value_status::Used) {
            h(label, "Option is not applicable", src->status());
            continue;
        }
        if (node.second.IsNull()) {
            continue;
        }
        try {
            src->set_value(node.second);
        } catch (const YAML::Exception& e) {
            h(label, sstring(e.what()), src->status());
        }
    }
}

future<> config_file::read_from_file(const sstring& filename, error_handler h) {
    auto contents = co_await seastar::util::read_entire_file_contiguous(std::filesystem::path(filename.c_str()));
    read_from_yaml(contents, std::move(h));
}

}
