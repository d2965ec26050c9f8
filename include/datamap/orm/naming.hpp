/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <cctype>
#include <functional>
#include <string>
#include <string_view>

namespace datamap {
    using NamingConvention = std::function<std::string(std::string_view)>;

    namespace naming {
        // "NumSpots" -> "num_spots", "HTTPRequest" -> "http_request"
        inline std::string underscore(std::string_view name) {
            std::string out;
            out.reserve(name.size() + 4);
            for (size_t i = 0; i < name.size(); i++) {
                char c = name[i];
                if (c == ':' ) {
                    // namespaced names keep only the last component
                    out.clear();
                    continue;
                }
                if (std::isupper(static_cast<unsigned char>(c))) {
                    bool prev_lower = i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1]))
                            || std::isdigit(static_cast<unsigned char>(name[i - 1])));
                    bool next_lower = i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]));
                    bool prev_upper = i > 0 && std::isupper(static_cast<unsigned char>(name[i - 1]));
                    if (!out.empty() && out.back() != '_' && (prev_lower || (prev_upper && next_lower))) {
                        out.push_back('_');
                    }
                    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                } else if (c == '-' || c == ' ') {
                    out.push_back('_');
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        inline std::string pluralize(std::string_view word) {
            std::string out(word);
            if (out.empty()) return out;

            auto ends_with = [&](std::string_view suffix) {
                return out.size() >= suffix.size() &&
                    out.compare(out.size() - suffix.size(), suffix.size(), suffix) == 0;
            };

            if (ends_with("y") && out.size() > 1 &&
                    std::string_view("aeiou").find(out[out.size() - 2]) == std::string_view::npos) {
                out.pop_back();
                out += "ies";
            } else if (ends_with("s") || ends_with("x") || ends_with("z") || ends_with("ch") || ends_with("sh")) {
                out += "es";
            } else {
                out += "s";
            }
            return out;
        }

        inline std::string identity(std::string_view name) {
            return std::string(name);
        }

        inline std::string underscored(std::string_view name) {
            return underscore(name);
        }

        inline std::string underscored_and_pluralized(std::string_view name) {
            return pluralize(underscore(name));
        }
    };
};
