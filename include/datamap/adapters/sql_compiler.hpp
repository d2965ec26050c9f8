/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/value.hpp"
#include "datamap/orm/types.hpp"
#include "datamap/orm/model.hpp"
#include "datamap/orm/condition.hpp"
#include "datamap/orm/query.hpp"

namespace datamap {
    // statement text plus its bind values, in placeholder order
    struct CompiledStatement {
        std::string sql;
        std::vector<Value> binds;
    };

    /**
     * SqlCompiler - turns queries into SQL and bind values. Dialects
     *               override the hooks describing what their store supports.
     */
    class SqlCompiler {
        public:
        virtual ~SqlCompiler() = default;

        // INSERT ... RETURNING hands back the generated identity
        virtual bool supports_returning() const { return false; }

        virtual bool supports_default_values() const { return true; }

        virtual std::string regexp_operator() const { return "~"; }

        virtual std::string quote_name(std::string_view name) const {
            std::string quoted = "\"";
            for (char c : name) {
                if (c == '"') quoted += "\"\"";
                else quoted += c;
            }
            quoted += "\"";
            return quoted;
        }

        virtual std::string quote_value(const Value& value) const {
            return value.visit([&]<typename T>(const T& v) -> std::string {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "1" : "0";
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    return format_real(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return quote_string(v);
                } else if constexpr (std::is_same_v<T, Blob>) {
                    static constexpr char hex[] = "0123456789ABCDEF";
                    std::string out = "X'";
                    for (auto byte : v) {
                        out += hex[byte >> 4];
                        out += hex[byte & 0xf];
                    }
                    return out + "'";
                } else {
                    return quote_string(format_timestamp(v));
                }
            });
        }

        std::string property_to_column_name(const Property& property, std::string_view repository_name, bool qualify) const {
            if (qualify) {
                auto table_name = property.model().storage_name(repository_name);
                return quote_name(table_name) + "." + quote_name(property.field());
            }
            return quote_name(property.field());
        }

        CompiledStatement select_statement(const Query& query) const;

        std::string insert_statement(const ModelBase& model, std::string_view repository_name,
                const std::vector<const Property*>& properties, const Property* identity_field) const;

        CompiledStatement update_statement(const std::vector<const Property*>& properties, const Query& query) const;

        CompiledStatement delete_statement(const Query& query) const;

        CompiledStatement where_statement(const std::vector<Condition>& conditions,
                std::string_view repository_name, bool qualify = false) const;

        std::string condition_statement(condition_op_t op, const Property& property, const Operand& operand,
                std::string_view repository_name, bool qualify) const;

        protected:
        static std::string quote_string(std::string_view s) {
            std::string quoted = "'";
            for (char c : s) {
                if (c == '\'') quoted += "''";
                else quoted += c;
            }
            quoted += "'";
            return quoted;
        }

        std::string columns_statement(const std::vector<const Property*>& properties,
                std::string_view repository_name, bool qualify) const {
            return join(properties, ", ", [&](const Property* p) {
                return property_to_column_name(*p, repository_name, qualify);
            });
        }

        std::string join_statement(const ModelBase& model, const std::vector<Link>& links,
                std::string_view repository_name, bool qualify) const;

        std::string order_statement(const std::vector<Direction>& order,
                std::string_view repository_name, bool qualify) const {
            return join(order, ", ", [&](const Direction& d) {
                auto statement = property_to_column_name(*d.property, repository_name, qualify);
                if (d.order == order_t::DESC) statement += " DESC";
                return statement;
            });
        }

        static std::string equality_operator(const Operand& operand) {
            if (std::holds_alternative<std::vector<Value>>(operand)) return "IN";
            if (std::holds_alternative<Range>(operand)) return "BETWEEN";
            if (auto v = std::get_if<Value>(&operand); v && v->is_nil()) return "IS";
            return "=";
        }

        static std::string inequality_operator(const Operand& operand) {
            if (std::holds_alternative<std::vector<Value>>(operand)) return "NOT IN";
            if (std::holds_alternative<Range>(operand)) return "NOT BETWEEN";
            if (auto v = std::get_if<Value>(&operand); v && v->is_nil()) return "IS NOT";
            return "<>";
        }

        std::string like_operator(const Operand& operand) const {
            return std::holds_alternative<Pattern>(operand) ? regexp_operator() : "LIKE";
        }

        // the placeholder text for `operand`, with its bind values appended to `binds`
        std::string placeholder(const Property& property, const Operand& operand, std::string_view repository_name,
                bool qualify, std::vector<Value>* binds) const;
    };

    inline CompiledStatement SqlCompiler::select_statement(const Query& query) const
    {
        const auto& model = query.model();
        const auto& repository_name = query.repository_name();
        const auto& fields = query.fields();
        const auto& conditions = query.conditions();
        auto limit = query.limit();
        auto offset = query.offset();
        const std::vector<Direction>* order = &query.order();

        bool qualify = !query.links().empty();

        std::vector<const Property*> group_by;
        if (qualify || query.unique()) {
            group_by = fields;
        }

        // at most one row can match, ordering and limiting are redundant
        bool single_row = (!limit || limit.value() == 1) && offset == 0 && !qualify
            && conditions.size() == 1 && conditions.front().is_unique_match();
        if (single_row) {
            order = nullptr;
            limit.reset();
        }

        auto where = where_statement(conditions, repository_name, qualify);

        std::ostringstream ss;
        ss << "SELECT " << columns_statement(fields, repository_name, qualify);
        ss << " FROM " << quote_name(model.storage_name(repository_name));
        if (qualify) ss << join_statement(model, query.links(), repository_name, qualify);
        if (!where.sql.empty()) ss << " WHERE " << where.sql;
        if (!group_by.empty()) ss << " GROUP BY " << columns_statement(group_by, repository_name, qualify);
        if (order && !order->empty()) ss << " ORDER BY " << order_statement(*order, repository_name, qualify);
        if (limit) ss << " LIMIT " << quote_value(static_cast<int64_t>(limit.value()));
        if (limit && offset > 0) ss << " OFFSET " << quote_value(static_cast<int64_t>(offset));

        return { ss.str(), std::move(where.binds) };
    }

    inline std::string SqlCompiler::insert_statement(const ModelBase& model, std::string_view repository_name,
            const std::vector<const Property*>& properties, const Property* identity_field) const
    {
        std::ostringstream ss;
        ss << "INSERT INTO " << quote_name(model.storage_name(repository_name)) << " ";

        if (supports_default_values() && properties.empty()) {
            ss << "DEFAULT VALUES";
        } else {
            ss << "(" << columns_statement(properties, repository_name, false) << ")";
            ss << " VALUES ";
            ss << "(" << join(properties, ", ", [](const Property*) { return "?"; }) << ")";
        }

        if (supports_returning() && identity_field) {
            ss << " RETURNING " << quote_name(identity_field->field());
        }

        return ss.str();
    }

    inline CompiledStatement SqlCompiler::update_statement(const std::vector<const Property*>& properties,
            const Query& query) const
    {
        const auto& repository_name = query.repository_name();
        auto where = where_statement(query.conditions(), repository_name);

        std::ostringstream ss;
        ss << "UPDATE " << quote_name(query.model().storage_name(repository_name));
        ss << " SET " << join(properties, ", ", [&](const Property* p) {
            return quote_name(p->field()) + " = ?";
        });
        if (!where.sql.empty()) ss << " WHERE " << where.sql;

        return { ss.str(), std::move(where.binds) };
    }

    inline CompiledStatement SqlCompiler::delete_statement(const Query& query) const
    {
        const auto& repository_name = query.repository_name();
        auto where = where_statement(query.conditions(), repository_name);

        std::ostringstream ss;
        ss << "DELETE FROM " << quote_name(query.model().storage_name(repository_name));
        if (!where.sql.empty()) ss << " WHERE " << where.sql;

        return { ss.str(), std::move(where.binds) };
    }

    inline std::string SqlCompiler::join_statement(const ModelBase& model, const std::vector<Link>& links,
            std::string_view repository_name, bool qualify) const
    {
        std::ostringstream ss;
        const ModelBase* previous_model = &model;

        for (auto link = links.rbegin(); link != links.rend(); ++link) {
            const ModelBase* joined = previous_model == link->child_model ? link->parent_model : link->child_model;

            // only INNER JOIN for now
            ss << " INNER JOIN " << quote_name(joined->storage_name(repository_name)) << " ON ";

            std::vector<std::string> on;
            for (size_t i = 0; i < link->parent_key.size(); i++) {
                on.push_back(condition_statement(condition_op_t::EQL, *link->parent_key[i],
                            link->child_key[i], repository_name, qualify));
            }
            ss << join(on, " AND ");

            previous_model = joined;
        }

        return ss.str();
    }

    inline CompiledStatement SqlCompiler::where_statement(const std::vector<Condition>& conditions,
            std::string_view repository_name, bool qualify) const
    {
        std::vector<std::string> statements;
        std::vector<Value> binds;

        for (const auto& condition : conditions) {
            if (condition.is_raw()) {
                statements.push_back(condition.sql());
                if (condition.binds()) {
                    binds.insert(binds.end(), condition.binds()->begin(), condition.binds()->end());
                }
                continue;
            }

            const auto& property = *condition.property();

            // never handed to the store as a range, rewritten as two comparisons
            if (condition.is_exclusive_range()) {
                const auto& range = std::get<Range>(condition.operand());
                switch (condition.op()) {
                    case condition_op_t::EQL:
                    case condition_op_t::IN: {
                        auto gte = condition_statement(condition_op_t::GTE, property, range.min, repository_name, qualify);
                        auto lt = condition_statement(condition_op_t::LT, property, range.max, repository_name, qualify);
                        statements.push_back("(" + gte + " AND " + lt + ")");
                        break;
                    }
                    case condition_op_t::NOT: {
                        auto lt = condition_statement(condition_op_t::LT, property, range.min, repository_name, qualify);
                        auto gte = condition_statement(condition_op_t::GTE, property, range.max, repository_name, qualify);
                        statements.push_back("(" + lt + " OR " + gte + ")");
                        break;
                    }
                    default: {
                        std::ostringstream ss;
                        ss << "An exclusive range cannot be used with " << condition_op_str(condition.op())
                            << " in " << condition;
                        throw UsageError(ss.str());
                    }
                }
                binds.push_back(property.value(range.min));
                binds.push_back(property.value(range.max));
                continue;
            }

            statements.push_back(condition_statement(condition.op(), property, condition.operand(),
                        repository_name, qualify));
            placeholder(property, condition.operand(), repository_name, qualify, &binds);
        }

        return { join(statements, " AND "), std::move(binds) };
    }

    inline std::string SqlCompiler::condition_statement(condition_op_t op, const Property& property,
            const Operand& operand, std::string_view repository_name, bool qualify) const
    {
        std::string comparison;
        switch (op) {
            case condition_op_t::EQL:
            case condition_op_t::IN: comparison = equality_operator(operand); break;
            case condition_op_t::NOT: comparison = inequality_operator(operand); break;
            case condition_op_t::LIKE: comparison = like_operator(operand); break;
            case condition_op_t::GT: comparison = ">"; break;
            case condition_op_t::GTE: comparison = ">="; break;
            case condition_op_t::LT: comparison = "<"; break;
            case condition_op_t::LTE: comparison = "<="; break;
            case condition_op_t::RAW:
                throw InternalError("Raw conditions have no comparison");
        }

        return property_to_column_name(property, repository_name, qualify)
            + " " + comparison + " "
            + placeholder(property, operand, repository_name, qualify, nullptr);
    }

    inline std::string SqlCompiler::placeholder(const Property& property, const Operand& operand,
            std::string_view repository_name, bool qualify, std::vector<Value>* binds) const
    {
        return std::visit([&]<typename T>(const T& o) -> std::string {
            if constexpr (std::is_same_v<T, Value>) {
                if (binds) binds->push_back(property.value(o));
                return "?";
            } else if constexpr (std::is_same_v<T, std::vector<Value>>) {
                if (binds) {
                    for (const auto& v : o) binds->push_back(property.value(v));
                }
                return "(" + join(o, ", ", [](const Value&) { return "?"; }) + ")";
            } else if constexpr (std::is_same_v<T, Range>) {
                if (binds) {
                    binds->push_back(property.value(o.min));
                    binds->push_back(property.value(o.max));
                }
                return "? AND ?";
            } else if constexpr (std::is_same_v<T, Pattern>) {
                if (binds) binds->push_back(o.expression);
                return "?";
            } else {
                return property_to_column_name(*o, repository_name, qualify);
            }
        }, operand);
    }
};
