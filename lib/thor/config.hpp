/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_CONFIG_HPP
#define THOR_SDK_CONFIG_HPP

#include <map>
#include <optional>
#include <thor/json.hpp>

namespace thor_sdk {
    // A flat JSON object with named settings such as the parameters of one network
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const;

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = _json_impl();
            const auto it = obj.find(name);
            return it != obj.end() ? &it->value() : nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] std::string source() const
        {
            return _source_impl();
        }
    private:
        virtual const json::object &_json_impl() const =0;
        virtual std::string _source_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::object &_json_impl() const override
        {
            return _json;
        }

        std::string _source_impl() const override
        {
            return "in-memory config";
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }

        std::string _source_impl() const override
        {
            return fmt::format("configuration file {}", _path);
        }
    };

    // A named collection of configs, one per network
    struct configs {
        virtual ~configs() =default;

        [[nodiscard]] const config &at(const std::string &name) const;
    private:
        virtual const config *_find_impl(const std::string &name) const =0;
    };

    struct configs_mock: configs {
        using map_type = std::map<std::string, config_json>;

        explicit configs_mock() =default;

        explicit configs_mock(map_type &&map): _map { std::move(map) }
        {
        }
    private:
        const map_type _map;

        const config *_find_impl(const std::string &name) const override;
    };

    // *.json files of a directory keyed by their stem: etc/networks/mainnet.json is "mainnet"
    struct configs_dir: configs {
        // the --config-dir option takes precedence over THOR_ETC, which takes precedence over ./etc/networks
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();
        explicit configs_dir(const std::string &dir);
    private:
        std::map<std::string, config_file> _configs {};

        const config *_find_impl(const std::string &name) const override;
    };
}

#endif // !THOR_SDK_CONFIG_HPP
