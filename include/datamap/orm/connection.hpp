/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once

#include <sqlite3.h>
#include <functional>
#include <memory>
#include <regex>
#include <sstream>
#include <string>
#include "datamap/common.hpp"
#include "datamap/error.hpp"
#include "datamap/orm/statement.hpp"

namespace datamap {
    /**
     * Connection - one open sqlite handle, closed when the last owner lets go
     */
    class Connection {
    private:
        using db_handle_ptr = std::unique_ptr<sqlite3, std::function<void(sqlite3*)>>;

        db_handle_ptr _db_handle;
        Logger _logger;

        Connection(sqlite3* db_handle, Logger logger);

        // `x REGEXP y` calls regexp(y, x)
        static void regexp(sqlite3_context* context, int argc, sqlite3_value** argv);

    public:
        static std::shared_ptr<Connection> open(
                const std::string& file_name, int flags = 0, Logger logger = nullptr);

        Connection(const Connection&) = delete;
        Connection& operator =(const Connection&) = delete;

        sqlite3* handle() const { return _db_handle.get(); }
        const Logger& logger() const { return _logger; }

        Statement prepare(const std::string& query) {
            return Statement(_db_handle.get(), _logger, query);
        }

        int64_t last_insert_rowid() const {
            return sqlite3_last_insert_rowid(_db_handle.get());
        }

        size_t changes() const {
            return static_cast<size_t>(sqlite3_changes(_db_handle.get()));
        }
    };

    inline std::shared_ptr<Connection> Connection::open(
            const std::string& file_name,
            int flags,
            Logger logger)
    {
        if (!flags) {
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        }
        if (!logger) {
            logger = null_logger();
        }

        std::ostringstream oss;
        oss << "Opening sqlite connection to " << file_name << " with flags: " << flags;
        logger(log_level::Debug, oss.str());

        sqlite3* db_handle = nullptr;
        int result = sqlite3_open_v2(file_name.c_str(), &db_handle, flags, nullptr);
        if (result != SQLITE_OK || !db_handle) {
            auto err = ConnectionError("Unable to open sqlite connection", db_handle);
            if (db_handle) sqlite3_close_v2(db_handle);
            throw err;
        }

        // the handle is owned from here on, so a failure below still closes it
        std::shared_ptr<Connection> connection(new Connection(db_handle, logger));

        result = sqlite3_create_function_v2(db_handle, "regexp", 2, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                nullptr, &Connection::regexp, nullptr, nullptr, nullptr);
        if (result != SQLITE_OK) {
            throw ConnectionError("Unable to register the regexp function", db_handle);
        }

        return connection;
    }

    inline Connection::Connection(sqlite3* db_handle, Logger logger) : _logger{logger}
    {
        _db_handle = {db_handle, [logger](sqlite3* handle) {
            logger(log_level::Debug, "Closing sqlite connection");
            int result = sqlite3_close_v2(handle);
            if (result != SQLITE_OK) {
                auto err = ConnectionError("Unable to destroy connection", handle);
                logger(log_level::Error, err);
            }
        }};
    }

    inline void Connection::regexp(sqlite3_context* context, int argc, sqlite3_value** argv)
    {
        if (argc != 2 || sqlite3_value_type(argv[0]) == SQLITE_NULL || sqlite3_value_type(argv[1]) == SQLITE_NULL) {
            sqlite3_result_null(context);
            return;
        }

        auto pattern_text = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
        std::string pattern(pattern_text, sqlite3_value_bytes(argv[0]));
        auto subject_text = reinterpret_cast<const char*>(sqlite3_value_text(argv[1]));
        std::string subject(subject_text, sqlite3_value_bytes(argv[1]));

        try {
            std::regex re(pattern);
            sqlite3_result_int(context, std::regex_search(subject, re) ? 1 : 0);
        } catch (const std::regex_error&) {
            std::string msg = "Invalid regular expression: " + pattern;
            sqlite3_result_error(context, msg.c_str(), -1);
        }
    }
};
