/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <vector>
#include "datamap/orm/connection.hpp"
#include "datamap/orm/statement.hpp"

namespace datamap {
    /**
     * RecordIterator - a single pass over the rows of a statement, each row
     *                  decoded as it is reached. The connection it was
     *                  prepared on stays open until the iterator is gone.
     */
    template <typename return_t>
    class RecordIterator
    {
    private:
        using row_reader_t = std::function<return_t(Statement&)>;
        // destroyed after the statement
        std::shared_ptr<Connection> _connection;
        std::shared_ptr<Statement> _stmt;
        row_reader_t _row_reader;
        Logger _logger;
        bool _started = false;

    public:
        RecordIterator(std::shared_ptr<Connection> connection, std::shared_ptr<Statement> stmt, row_reader_t row_reader) :
            _connection{std::move(connection)}, _stmt{std::move(stmt)}, _row_reader{row_reader},
            _logger{_connection ? _connection->logger() : null_logger()} { }

        class iterator
        {
        private:
            Statement* _stmt = nullptr;
            row_reader_t _row_reader;
            Logger _logger;
            return_t _current;
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = return_t;
            using difference_type = std::ptrdiff_t;

            iterator(Statement* stmt, row_reader_t row_reader, Logger logger):
                _stmt{stmt}, _row_reader{row_reader}, _logger{logger} {
                ++(*this);
            }
            iterator() = default;

            iterator& operator++() {
                if (!_stmt || _stmt->done()) {
                    return *this;
                }
                try {
                    _stmt->step();
                    if (!_stmt->done()) {
                        _current = _row_reader(*_stmt);
                    }
                } catch (const std::exception& e) {
                    _logger(log_level::Error, e.what());
                    throw;
                }
                return *this;
            }

            return_t& operator*() {
                return _current;
            }
            bool operator==(const iterator& other) const {
                // nullptr means end
                if (!_stmt && other._stmt && other._stmt->done()) return true;
                if (!other._stmt && _stmt && _stmt->done()) return true;

                return _stmt == other._stmt &&
                    (!_stmt || _stmt->step_count() == other._stmt->step_count());
            }
            bool operator!=(const iterator& other) const { return !(*this == other); }
        };

        iterator begin() {
            if (_started) {
                throw UsageError("Records can only be iterated once");
            }
            _started = true;
            return iterator(_stmt.get(), _row_reader, _logger);
        }
        iterator end() {
            return iterator();
        }

        std::vector<return_t> to_vector() {
            std::vector<return_t> records;
            for(auto& result: *this) {
                records.emplace_back(result);
            }
            return records;
        }
    };
};
