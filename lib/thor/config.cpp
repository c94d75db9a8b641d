/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <thor/config.hpp>
#include <thor/logger.hpp>

namespace thor_sdk {
    namespace {
        template<typename M>
        const config *find_config(const M &map, const std::string &name)
        {
            if (const auto it = map.find(name); it != map.end())
                return &it->second;
            return nullptr;
        }

        std::optional<std::string> &configs_default_path()
        {
            static std::optional<std::string> p {};
            return p;
        }
    }

    const json::value &config::at(const std::string_view &name) const
    {
        if (const auto *jv = find(name); jv)
            return *jv;
        throw error(fmt::format("{} does not have the element {}", source(), name));
    }

    config_file::config_file(const std::string &path):
        _path { path }
    {
        const auto jv = json::load(path);
        if (!jv.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object", path));
        _parsed = jv.get_object();
    }

    const config &configs::at(const std::string &name) const
    {
        if (const auto *cfg = _find_impl(name); cfg)
            return *cfg;
        throw error(fmt::format("there is no config named {}", name));
    }

    const config *configs_mock::_find_impl(const std::string &name) const
    {
        return find_config(_map, name);
    }

    void configs_dir::set_default_path(const std::optional<std::string> &p)
    {
        configs_default_path() = p;
    }

    std::string configs_dir::default_path()
    {
        std::optional<std::string> path = configs_default_path();
        if (const char *env_path = std::getenv("THOR_ETC"); !path && env_path)
            path.emplace(env_path);
        if (!path)
            path.emplace("./etc/networks");
        logger::debug("configuration directory: {}", *path);
        return *path;
    }

    configs_dir::configs_dir(const std::string &dir)
    {
        if (!std::filesystem::is_directory(dir))
            throw error(fmt::format("configuration directory {} does not exist", dir));
        for (const auto &e: std::filesystem::directory_iterator(dir)) {
            if (!e.is_regular_file() || e.path().extension() != ".json")
                continue;
            _configs.emplace(e.path().stem().string(), e.path().string());
        }
    }

    const config *configs_dir::_find_impl(const std::string &name) const
    {
        return find_config(_configs, name);
    }
}
