/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/adapters/abstract_adapter.hpp"
#include "datamap/adapters/sql_compiler.hpp"
#include "datamap/orm/connection.hpp"
#include "datamap/orm/naming.hpp"
#include "datamap/orm/record_iterator.hpp"
#include "datamap/orm/statement.hpp"

namespace datamap {
    struct ExecResult {
        size_t affected_rows = 0;
        // the RETURNING value when the statement had one, otherwise the last rowid
        int64_t insert_id = 0;
    };

    // one row of a multi-column raw query, field names underscored
    struct Row {
        std::vector<std::string> fields;
        std::vector<Value> values;

        const Value& operator[](std::string_view field) const {
            auto it = std::find(fields.begin(), fields.end(), field);
            if (it == fields.end()) {
                throw UsageError("Row has no field " + std::string(field));
            }
            return values[it - fields.begin()];
        }
    };

    // single column results are bare values
    using QueryRecord = std::variant<Value, Row>;

    /**
     * SqlAdapter - runs compiled statements, each operation on a connection
     *              of its own that is released however the operation ends
     */
    class SqlAdapter : public AbstractAdapter, public SqlCompiler {
        private:
        mutable std::once_flag _normalized_once;
        mutable std::optional<ConnectionUri> _normalized_uri;

        protected:
        SqlAdapter(std::string name, AdapterOptions options) :
            AbstractAdapter(std::move(name), std::move(options)) {}

        virtual std::shared_ptr<Connection> create_connection() = 0;

        // failures are logged, then rethrown as they are
        template <typename F>
        auto with_connection(F&& f) {
            try {
                std::shared_ptr<Connection> connection = create_connection();
                return f(connection);
            } catch (const std::exception& e) {
                logger()(log_level::Error, e.what());
                throw;
            }
        }

        RecordIterator<std::shared_ptr<Resource>> read_records(const Query& query,
                const std::string& sql, const std::vector<Value>& binds) {
            return with_connection([&](std::shared_ptr<Connection> connection) {
                auto stmt = std::make_shared<Statement>(connection->prepare(sql));
                stmt->bind(binds);

                return RecordIterator<std::shared_ptr<Resource>>(connection, stmt, [query](Statement& s) {
                    const auto& fields = query.fields();
                    std::vector<Value> values;
                    values.reserve(fields.size());
                    for (size_t i = 0; i < fields.size(); i++) {
                        values.push_back(fields[i]->typecast(s.read_column(i)));
                    }
                    return query.model().load(values, query);
                });
            });
        }

        public:
        const ConnectionUri& normalized_uri() const {
            std::call_once(_normalized_once, [this]() {
                _normalized_uri = ConnectionUri::from(options());
            });
            return _normalized_uri.value();
        }

        ExecResult execute(const std::string& sql, const std::vector<Value>& binds = {}) {
            return with_connection([&](std::shared_ptr<Connection> connection) {
                auto stmt = connection->prepare(sql);
                stmt.bind(binds);

                std::optional<int64_t> returned;
                for (stmt.step(); !stmt.done(); stmt.step()) {
                    if (!returned && stmt.column_count() > 0) {
                        auto v = stmt.read_column(0);
                        if (v.holds<int64_t>()) returned = v.get<int64_t>();
                    }
                }

                ExecResult result;
                result.affected_rows = connection->changes();
                result.insert_id = returned.value_or(connection->last_insert_rowid());
                return result;
            });
        }

        std::vector<QueryRecord> query(const std::string& sql, const std::vector<Value>& binds = {}) {
            return with_connection([&](std::shared_ptr<Connection> connection) {
                auto stmt = connection->prepare(sql);
                stmt.bind(binds);

                std::vector<QueryRecord> results;
                std::vector<std::string> fields;
                for (stmt.step(); !stmt.done(); stmt.step()) {
                    if (stmt.column_count() <= 1) {
                        results.emplace_back(stmt.column_count() == 1 ? stmt.read_column(0) : Value{});
                        continue;
                    }
                    if (fields.empty()) {
                        for (int i = 0; i < stmt.column_count(); i++) {
                            fields.push_back(naming::underscore(stmt.column_name(i)));
                        }
                    }
                    results.emplace_back(Row{ fields, stmt.read_row() });
                }
                return results;
            });
        }

        size_t create(const std::vector<Resource*>& resources) override {
            size_t created = 0;
            for (auto resource : resources) {
                const auto& model = resource->model();
                const auto& repository_name = resource->repository_name();
                auto identity_field = model.identity_field(repository_name);

                std::vector<const Property*> properties;
                std::vector<Value> binds;
                for (auto& [property, value] : resource->dirty_attributes()) {
                    // left for the store to assign
                    if (property == identity_field && value.is_nil()) continue;
                    properties.push_back(property);
                    binds.push_back(std::move(value));
                }

                bool assigns_identity = identity_field &&
                    std::find(properties.begin(), properties.end(), identity_field) == properties.end();

                auto statement = insert_statement(model, repository_name, properties, identity_field);
                auto result = execute(statement, binds);

                if (result.affected_rows == 1) {
                    if (assigns_identity) {
                        identity_field->set_raw(*resource, result.insert_id);
                    }
                    created++;
                }
            }
            return created;
        }

        RecordIterator<std::shared_ptr<Resource>> read(const Query& query) override {
            auto statement = select_statement(query);
            return read_records(query, statement.sql, statement.binds);
        }

        // loads `query.model()` from hand written SQL, the columns must line
        // up with `query.fields()`
        RecordIterator<std::shared_ptr<Resource>> load_by_sql(const Query& query,
                const std::string& sql, const std::vector<Value>& binds = {}) {
            return read_records(query, sql, binds);
        }

        size_t update(const Attributes& attributes, const Query& query) override {
            if (attributes.empty()) return 0;

            std::vector<const Property*> properties;
            std::vector<Value> binds;

            // make the order of the properties consistent
            for (const auto& p : query.properties()) {
                auto it = std::find_if(attributes.begin(), attributes.end(), [&](const auto& attribute) {
                    return attribute.first == p.get();
                });
                if (it == attributes.end()) continue;
                properties.push_back(p.get());
                binds.push_back(it->second);
            }

            auto statement = update_statement(properties, query);
            binds.insert(binds.end(), statement.binds.begin(), statement.binds.end());

            return execute(statement.sql, binds).affected_rows;
        }

        size_t delete_records(const Query& query) override {
            auto statement = delete_statement(query);
            return execute(statement.sql, statement.binds).affected_rows;
        }
    };
};
