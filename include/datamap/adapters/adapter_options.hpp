/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include "datamap/common.hpp"
#include "datamap/logger.hpp"

namespace datamap {
    /**
     * AdapterOptions - where an adapter connects to, and how
     */
    struct AdapterOptions {
        std::string adapter = "sqlite3";
        std::string user;
        std::string password;
        std::string host;
        std::optional<int> port;
        std::string path;
        std::string fragment;
        // anything else, passed on in the query string
        std::map<std::string, std::string> query;
        // sqlite open flags, 0 is read/write and create
        int flags = 0;
        Logger logger;

        // `scheme://[user[:password]@][host[:port]]/path[?k=v&...][#fragment]`
        // or `scheme:path` for a relative path
        static AdapterOptions parse(std::string_view uri, Logger logger = nullptr) {
            AdapterOptions options;
            options.logger = logger;

            auto colon = uri.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                throw ConnectionError("Connection URI has no scheme: " + std::string(uri));
            }
            options.adapter = std::string(uri.substr(0, colon));
            auto rest = uri.substr(colon + 1);

            if (auto hash = rest.find('#'); hash != std::string_view::npos) {
                options.fragment = std::string(rest.substr(hash + 1));
                rest = rest.substr(0, hash);
            }

            if (auto question = rest.find('?'); question != std::string_view::npos) {
                auto query = rest.substr(question + 1);
                rest = rest.substr(0, question);
                while (!query.empty()) {
                    auto amp = query.find('&');
                    auto pair = query.substr(0, amp);
                    auto eq = pair.find('=');
                    if (!pair.empty()) {
                        if (eq == std::string_view::npos) {
                            options.query[std::string(pair)] = "";
                        } else {
                            options.query[std::string(pair.substr(0, eq))] = std::string(pair.substr(eq + 1));
                        }
                    }
                    if (amp == std::string_view::npos) break;
                    query = query.substr(amp + 1);
                }
            }

            if (rest.substr(0, 2) != "//") {
                options.path = std::string(rest);
                return options;
            }
            rest = rest.substr(2);

            auto slash = rest.find('/');
            auto authority = rest.substr(0, slash);
            options.path = slash == std::string_view::npos ? "" : std::string(rest.substr(slash));

            if (auto at = authority.rfind('@'); at != std::string_view::npos) {
                auto userinfo = authority.substr(0, at);
                authority = authority.substr(at + 1);
                auto sep = userinfo.find(':');
                options.user = std::string(userinfo.substr(0, sep));
                if (sep != std::string_view::npos) {
                    options.password = std::string(userinfo.substr(sep + 1));
                }
            }

            if (auto sep = authority.rfind(':'); sep != std::string_view::npos) {
                auto port = std::string(authority.substr(sep + 1));
                try {
                    options.port = std::stoi(port);
                } catch (const std::exception&) {
                    throw ConnectionError("Invalid port in connection URI: " + port);
                }
                authority = authority.substr(0, sep);
            }
            options.host = std::string(authority);

            return options;
        }
    };

    /**
     * ConnectionUri - the normalized form of `AdapterOptions`, computed once
     *                 per adapter
     */
    struct ConnectionUri {
        std::string scheme;
        std::string user;
        std::string password;
        std::string host;
        std::optional<int> port;
        std::string path;
        // empty when there are no extra options
        std::string query;
        std::string fragment;

        static ConnectionUri from(const AdapterOptions& options) {
            ConnectionUri uri;
            uri.scheme = options.adapter;
            uri.user = options.user;
            uri.password = options.password;
            uri.host = options.host;
            uri.port = options.port;
            uri.path = options.path;
            uri.fragment = options.fragment;
            uri.query = join(options.query, "&", [](const auto& kv) {
                return kv.first + "=" + kv.second;
            });
            return uri;
        }

        std::string to_string() const {
            std::ostringstream ss;
            ss << scheme << "://";
            if (!user.empty()) {
                ss << user;
                if (!password.empty()) ss << ":" << password;
                ss << "@";
            }
            ss << host;
            if (port) ss << ":" << port.value();
            ss << path;
            if (!query.empty()) ss << "?" << query;
            if (!fragment.empty()) ss << "#" << fragment;
            return ss.str();
        }
    };
};
