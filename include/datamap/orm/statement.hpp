/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/error.hpp"
#include "datamap/value.hpp"

namespace datamap {
    class Statement {
        private:
        sqlite3* _handle;
        Logger _logger;
        std::unique_ptr<sqlite3_stmt, std::function<void(sqlite3_stmt*)>> _stmt;
        size_t _parameter_count;
        int _column_count = 0;
        size_t _step_count = 0;
        bool _done = false;

        public:
        Statement(sqlite3* handle, Logger logger, const std::string& query) : _handle{handle}, _logger{logger}
        {
            _logger(log_level::Debug, query);

            sqlite3_stmt* stmt = nullptr;
            int result = sqlite3_prepare_v2(handle, query.c_str(), query.size() + 1, &stmt, nullptr);
            if (result != SQLITE_OK || !stmt) {
                throw SQLExecutionError("Unable to initialize statement", handle);
            }

            _stmt = {stmt, [logger, handle](sqlite3_stmt* s) {
                int result = sqlite3_finalize(s);
                if (result != SQLITE_OK) {
                    auto err = InternalError("Statement error", handle);
                    logger(log_level::Error, err);
                }
            }};

            _parameter_count = sqlite3_bind_parameter_count(_stmt.get());
        }

        size_t parameter_count() const { return _parameter_count; }

        void bind(const std::vector<Value>& values)
        {
            if (values.size() != _parameter_count) {
                std::ostringstream ss;
                ss << "Statement expects " << _parameter_count
                    << " bind values, but " << values.size() << " were given";
                throw InternalError(ss.str());
            }

            for (size_t i = 0; i < values.size(); i++) {
                bind(i + 1, values[i]);
            }
        }

        void bind(size_t idx, const Value& param)
        {
            // bindings start at 1 :(
            if (idx == 0 || idx > _parameter_count) {
                throw InternalError("Bind index out of range");
            }

            int result = param.visit([&]<typename T>(const T& value) {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return sqlite3_bind_null(_stmt.get(), idx);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return sqlite3_bind_int(_stmt.get(), idx, value ? 1 : 0);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return sqlite3_bind_int64(_stmt.get(), idx, value);
                } else if constexpr (std::is_same_v<T, double>) {
                    return sqlite3_bind_double(_stmt.get(), idx, value);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return sqlite3_bind_text(_stmt.get(), idx, value.data(), value.size(), SQLITE_TRANSIENT);
                } else if constexpr (std::is_same_v<T, Blob>) {
                    if (value.empty()) return sqlite3_bind_zeroblob(_stmt.get(), idx, 0);
                    return sqlite3_bind_blob(_stmt.get(), idx, value.data(), value.size(), SQLITE_TRANSIENT);
                } else {
                    auto text = format_timestamp(value);
                    return sqlite3_bind_text(_stmt.get(), idx, text.data(), text.size(), SQLITE_TRANSIENT);
                }
            });

            if (result != SQLITE_OK) {
                throw InternalError("Unable to bind parameter to statment", _handle);
            }
        }

        void step() {
            if (_done) {
                throw InternalError("Query has run to completion");
            }

            int result = sqlite3_step(_stmt.get());
            _step_count++;
            if (result != SQLITE_OK && result != SQLITE_DONE && result != SQLITE_ROW) {
                if (is_constraint_error(result)) {
                    throw SQLConstraintError("Constraint failed", _handle);
                } else {
                    throw SQLExecutionError("Unable to execute statment", _handle);
                }
            }

            _done = result == SQLITE_DONE;

            _column_count = sqlite3_column_count(_stmt.get());
        }

        // steps until the statement is done
        void run() {
            while (!_done) step();
        }

        Value read_column(int idx) {
            int data_type = sqlite3_column_type(_stmt.get(), idx);
            switch(data_type) {
                case SQLITE_INTEGER: {
                    return static_cast<int64_t>(sqlite3_column_int64(_stmt.get(), idx));
                }
                case SQLITE_FLOAT: {
                    return sqlite3_column_double(_stmt.get(), idx);
                }
                case SQLITE_TEXT: {
                    auto data = reinterpret_cast<const char*>(sqlite3_column_text(_stmt.get(), idx));
                    size_t len = sqlite3_column_bytes(_stmt.get(), idx);
                    return std::string(data, len);
                }
                case SQLITE_BLOB: {
                    auto data = static_cast<const uint8_t*>(sqlite3_column_blob(_stmt.get(), idx));
                    size_t len = sqlite3_column_bytes(_stmt.get(), idx);
                    return Blob(data, data + len);
                }
                case SQLITE_NULL: {
                    return {};
                }
                default: {
                    throw InternalError("Unknown SQL type encountered, something isn't implemented yet");
                }
            }
        }

        std::string column_name(int idx) {
            const char* name = sqlite3_column_name(_stmt.get(), idx);
            return name ? name : "";
        }

        std::vector<Value> read_row() {
            std::vector<Value> row;
            row.reserve(_column_count);
            for (int i = 0; i < _column_count; i++) {
                row.push_back(read_column(i));
            }
            return row;
        }

        int column_count() const { return _column_count; }
        bool done() const { return _done; }
        size_t step_count() const { return _step_count; }
    };
};
