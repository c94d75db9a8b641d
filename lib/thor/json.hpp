/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef THOR_SDK_JSON_HPP
#define THOR_SDK_JSON_HPP

#include <ostream>
#include <sstream>
#include <boost/json.hpp>
#include <thor/common/bytes.hpp>
#include <thor/file.hpp>

namespace thor_sdk::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // Two-space indented output with one member or element per line, used for the command line output
    struct pretty_printer {
        static constexpr size_t indent_step = 2;

        explicit pretty_printer(std::ostream &os): _os { os }
        {
        }

        void print(const json::value &jv, const size_t depth=0)
        {
            switch (jv.kind()) {
                case json::kind::object: {
                    const auto &obj = jv.get_object();
                    _open('{', obj.empty());
                    for (auto it = obj.begin(); it != obj.end(); ++it) {
                        _indent(depth + 1);
                        _os << json::serialize(it->key()) << ": ";
                        print(it->value(), depth + 1);
                        _separate(std::next(it) == obj.end());
                    }
                    _close('}', obj.empty(), depth);
                    break;
                }
                case json::kind::array: {
                    const auto &arr = jv.get_array();
                    _open('[', arr.empty());
                    for (auto it = arr.begin(); it != arr.end(); ++it) {
                        _indent(depth + 1);
                        print(*it, depth + 1);
                        _separate(std::next(it) == arr.end());
                    }
                    _close(']', arr.empty(), depth);
                    break;
                }
                default:
                    _os << json::serialize(jv);
                    break;
            }
        }
    private:
        std::ostream &_os;

        void _indent(const size_t depth)
        {
            _os << std::string(depth * indent_step, ' ');
        }

        void _open(const char bracket, const bool empty)
        {
            _os << bracket;
            if (!empty)
                _os << '\n';
        }

        void _close(const char bracket, const bool empty, const size_t depth)
        {
            if (!empty)
                _indent(depth);
            _os << bracket;
        }

        void _separate(const bool last)
        {
            if (!last)
                _os << ',';
            _os << '\n';
        }
    };

    inline std::string serialize_pretty(const json::value &jv)
    {
        std::ostringstream os {};
        pretty_printer { os }.print(jv);
        return os.str();
    }
}

#endif // !THOR_SDK_JSON_HPP
