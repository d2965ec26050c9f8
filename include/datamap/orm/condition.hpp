/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/value.hpp"
#include "datamap/orm/property.hpp"
#include "datamap/orm/model.hpp"

namespace datamap {
    enum class condition_op_t {
        EQL,
        IN,
        NOT,
        LIKE,
        GT,
        GTE,
        LT,
        LTE,
        RAW,
    };

    static constexpr const char* condition_op_str(condition_op_t op) {
        switch (op) {
            case condition_op_t::EQL: return "eql";
            case condition_op_t::IN: return "in";
            case condition_op_t::NOT: return "not";
            case condition_op_t::LIKE: return "like";
            case condition_op_t::GT: return "gt";
            case condition_op_t::GTE: return "gte";
            case condition_op_t::LT: return "lt";
            case condition_op_t::LTE: return "lte";
            case condition_op_t::RAW: return "raw";
        }
        return "OOPS";
    }

    /**
     * Range - `min..max`, or `min...max` when `exclude_end` is set
     */
    struct Range {
        Value min;
        Value max;
        bool exclude_end = false;

        static Range inclusive(Value min, Value max) {
            return { std::move(min), std::move(max), false };
        }

        static Range exclusive(Value min, Value max) {
            return { std::move(min), std::move(max), true };
        }
    };

    // a regular expression, matched with the store's native operator
    struct Pattern {
        std::string expression;
    };

    // a `const Property*` operand compares two columns, as join conditions do
    using Operand = std::variant<Value, std::vector<Value>, Range, Pattern, const Property*>;

    class Condition {
        private:
        condition_op_t _op;
        const Property* _property = nullptr;
        Operand _operand;

        // raw conditions only
        std::string _sql;
        std::optional<std::vector<Value>> _binds;

        Condition(std::string sql, std::optional<std::vector<Value>> binds) :
            _op{condition_op_t::RAW}, _sql{std::move(sql)}, _binds{std::move(binds)} {}

        public:
        Condition(condition_op_t op, const Property& property, Operand operand) :
            _op{op}, _property{&property}, _operand{std::move(operand)}
        {
            if (_op == condition_op_t::RAW) {
                throw UsageError("Raw conditions are built with Condition::raw");
            }
            if (_op == condition_op_t::EQL && is_pattern()) {
                _op = condition_op_t::LIKE;
            }
        }

        static Condition eql(const Property& p, Operand operand) { return { condition_op_t::EQL, p, std::move(operand) }; }
        static Condition in(const Property& p, std::vector<Value> values) { return { condition_op_t::IN, p, std::move(values) }; }
        static Condition not_(const Property& p, Operand operand) { return { condition_op_t::NOT, p, std::move(operand) }; }
        static Condition like(const Property& p, Operand operand) { return { condition_op_t::LIKE, p, std::move(operand) }; }
        static Condition gt(const Property& p, Value v) { return { condition_op_t::GT, p, std::move(v) }; }
        static Condition gte(const Property& p, Value v) { return { condition_op_t::GTE, p, std::move(v) }; }
        static Condition lt(const Property& p, Value v) { return { condition_op_t::LT, p, std::move(v) }; }
        static Condition lte(const Property& p, Value v) { return { condition_op_t::LTE, p, std::move(v) }; }

        // `sql` is inserted into the WHERE clause verbatim
        static Condition raw(std::string sql) {
            return { std::move(sql), std::nullopt };
        }
        static Condition raw(std::string sql, std::vector<Value> binds) {
            return { std::move(sql), std::move(binds) };
        }

        condition_op_t op() const { return _op; }
        // nullptr for raw conditions
        const Property* property() const { return _property; }
        const Operand& operand() const { return _operand; }
        const std::string& sql() const { return _sql; }
        const std::optional<std::vector<Value>>& binds() const { return _binds; }

        bool is_raw() const { return _op == condition_op_t::RAW; }
        bool is_array() const { return std::holds_alternative<std::vector<Value>>(_operand); }
        bool is_range() const { return std::holds_alternative<Range>(_operand); }
        bool is_exclusive_range() const { return is_range() && std::get<Range>(_operand).exclude_end; }
        bool is_pattern() const { return std::holds_alternative<Pattern>(_operand); }
        bool is_property() const { return std::holds_alternative<const Property*>(_operand); }
        bool is_nil() const {
            auto v = std::get_if<Value>(&_operand);
            return v && v->is_nil();
        }

        // an equality on a unique property can match one row at most
        bool is_unique_match() const {
            return _op == condition_op_t::EQL && _property && _property->unique()
                && std::holds_alternative<Value>(_operand) && !is_nil();
        }

        friend std::ostream & operator<< (std::ostream &out, const Condition& c) {
            if (c.is_raw()) {
                out << "raw(" << c._sql << ")";
                return out;
            }
            out << condition_op_str(c._op) << "(" << *c._property << ", ";
            std::visit([&]<typename T>(const T& operand) {
                if constexpr (std::is_same_v<T, Value>) {
                    out << operand;
                } else if constexpr (std::is_same_v<T, std::vector<Value>>) {
                    out << "[" << join(operand, ", ", [](const Value& v) { return v.to_string(); }) << "]";
                } else if constexpr (std::is_same_v<T, Range>) {
                    out << operand.min << (operand.exclude_end ? "..." : "..") << operand.max;
                } else if constexpr (std::is_same_v<T, Pattern>) {
                    out << "/" << operand.expression << "/";
                } else {
                    out << *operand;
                }
            }, c._operand);
            out << ")";
            return out;
        }
    };
};
