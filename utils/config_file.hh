/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"

namespace bpo = boost::program_options;

namespace utils {

// How a value travels from the command line and from YAML into a
// named_value<T>.
template <typename T>
struct config_value_traits {
    using cmdline_type = T;
    static T from_cmdline(const cmdline_type& v) { return v; }
    static T from_yaml(const YAML::Node& node) { return node.as<T>(); }
    static sstring to_string(const T& v) { return fmt::to_string(v); }
};

template <>
struct config_value_traits<sstring> {
    using cmdline_type = std::string;
    static sstring from_cmdline(const std::string& v) { return sstring(v); }
    static sstring from_yaml(const YAML::Node& node) { return sstring(node.as<std::string>()); }
    static sstring to_string(const sstring& v) { return v; }
};

class config_file {
public:
    enum class value_status {
        Used,
        Unused,
        Invalid,
    };

    enum class config_source : uint8_t {
        None,
        SettingsFile,
        CommandLine,
    };

    // (option name, message, status of the option if it is known)
    using error_handler = std::function<void(const sstring&, const sstring&, std::optional<value_status>)>;

    class config_src {
        std::string_view _name;
        std::string_view _desc;
        value_status _status;
    protected:
        config_source _source = config_source::None;
    public:
        config_src(config_file* cf, std::string_view name, value_status status, std::string_view desc);
        virtual ~config_src() = default;

        std::string_view name() const noexcept {
            return _name;
        }
        std::string_view desc() const noexcept {
            return _desc;
        }
        value_status status() const noexcept {
            return _status;
        }
        config_source source() const noexcept {
            return _source;
        }

        virtual void add_command_line_option(bpo::options_description_easy_init&) = 0;
        virtual void set_value(const YAML::Node&) = 0;
        virtual sstring value_as_string() const = 0;
    };

    template <typename T>
    class named_value : public config_src {
        T _value;
    public:
        using traits = config_value_traits<T>;
        using cmdline_type = typename traits::cmdline_type;

        named_value(config_file* file, std::string_view name, value_status vs, const T& t = T(), std::string_view desc = {})
            : config_src(file, name, vs, desc)
            , _value(t)
        {}

        const T& operator()() const noexcept {
            return _value;
        }

        void set(T v, config_source src = config_source::None) {
            _value = std::move(v);
            _source = src;
        }

        void add_command_line_option(bpo::options_description_easy_init& init) override {
            if (status() != value_status::Used) {
                return;
            }
            // names and descriptions are string literals, so data() is null terminated
            init(name().data(), bpo::value<cmdline_type>()->notifier([this] (const cmdline_type& v) {
                set(traits::from_cmdline(v), config_source::CommandLine);
            }), desc().data());
        }

        void set_value(const YAML::Node& node) override {
            // Command line options override the settings file.
            if (_source == config_source::CommandLine) {
                return;
            }
            set(traits::from_yaml(node), config_source::SettingsFile);
        }

        sstring value_as_string() const override {
            return traits::to_string(_value);
        }
    };

    config_file() = default;
    config_file(const config_file&) = delete;
    config_file& operator=(const config_file&) = delete;

    void add(config_src&);

    void add_options(bpo::options_description_easy_init&);

    void read_from_yaml(const sstring&, error_handler = {});
    void read_from_yaml(const char*, error_handler = {});
    future<> read_from_file(const sstring& filename, error_handler = {});

    const std::vector<config_src*>& values() const noexcept {
        return _cfgs;
    }
    config_src* find(std::string_view name) const noexcept;
private:
    std::vector<config_src*> _cfgs;
};

}
