/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <sqlite3.h>
#include <memory>
#include <string>
#include <string_view>
#include "datamap/common.hpp"
#include "datamap/adapters/adapter_options.hpp"
#include "datamap/adapters/sql_adapter.hpp"
#include "datamap/orm/connection.hpp"

namespace datamap {
    class SqliteAdapter : public SqlAdapter {
        protected:
        std::shared_ptr<Connection> create_connection() override {
            return Connection::open(database(), options().flags, logger());
        }

        public:
        SqliteAdapter(std::string name, AdapterOptions options) : SqlAdapter(std::move(name), std::move(options))
        {
            const auto& scheme = this->options().adapter;
            if (scheme != "sqlite3" && scheme != "sqlite") {
                throw ConnectionError("The sqlite adapter cannot connect to " + scheme + " URIs");
            }
        }

        SqliteAdapter(std::string name, std::string_view uri, Logger logger = nullptr) :
            SqliteAdapter(std::move(name), AdapterOptions::parse(uri, logger)) {}

        // the file sqlite opens, an empty path is a private in-memory database
        std::string database() const {
            const auto& uri = normalized_uri();
            if (!uri.path.empty()) return uri.path;
            if (!uri.host.empty()) return uri.host;
            return ":memory:";
        }

        bool supports_returning() const override {
            return sqlite3_libversion_number() >= 3035000;
        }

        std::string regexp_operator() const override {
            return "REGEXP";
        }
    };
};
