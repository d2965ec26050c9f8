/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <charconv>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include "datamap/common.hpp"
#include "datamap/value.hpp"
#include "datamap/orm/types.hpp"
#include "datamap/orm/property_options.hpp"

namespace datamap {
    // the whole of `text` must be the number
    template <typename N>
    N parse_number(std::string_view text) {
        N n{};
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
        if (ec != std::errc() || end != text.data() + text.size()) {
            throw InternalError("Unable to read a number from \"" + std::string(text) + "\"");
        }
        return n;
    }

    enum class field_kind {
        integer,
        text,
        boolean,
        decimal,
        floating,
        timestamp,
        blob,
        custom,
    };

    using TypeCodec = std::function<Value(const Value&, const Property&)>;

    /**
     * FieldType - the semantic kind of a property, the primitive it is
     *             stored as, and the options every property of this type
     *             starts from
     */
    struct FieldType {
        std::string name;
        field_kind kind = field_kind::text;
        // the kind of value held by the resource
        value_kind logical = value_kind::text;
        sqlite_column_type primitive = sqlite_column_type::TEXT;
        PropertyOptions default_options;
        // custom types only: logical value -> storable primitive
        TypeCodec dump;
        // custom types only: primitive read from the store -> logical value
        TypeCodec load;

        bool custom() const { return kind == field_kind::custom; }
        bool bounded() const { return kind == field_kind::text; }
        bool numeric() const { return kind == field_kind::decimal || kind == field_kind::floating; }

        // converts a primitive read from the store into this type's logical value
        Value typecast(const Value& primitive, const Property& property) const {
            if (primitive.is_nil()) return primitive;

            if (custom()) {
                return load ? load(primitive, property) : primitive;
            }

            switch (logical) {
                case value_kind::boolean: {
                    if (primitive.holds<int64_t>()) return primitive.get<int64_t>() != 0;
                    if (primitive.holds<std::string>()) {
                        const auto& s = primitive.get<std::string>();
                        return s == "t" || s == "true" || s == "1";
                    }
                    break;
                }
                case value_kind::integer: {
                    if (primitive.holds<double>()) return static_cast<int64_t>(primitive.get<double>());
                    if (primitive.holds<std::string>()) return parse_number<int64_t>(primitive.get<std::string>());
                    break;
                }
                case value_kind::real: {
                    if (primitive.holds<int64_t>()) return static_cast<double>(primitive.get<int64_t>());
                    if (primitive.holds<std::string>()) return parse_number<double>(primitive.get<std::string>());
                    break;
                }
                case value_kind::text: {
                    if (primitive.holds<Blob>()) {
                        const auto& b = primitive.get<Blob>();
                        return std::string(b.begin(), b.end());
                    }
                    if (!primitive.holds<std::string>()) {
                        auto s = primitive.to_string();
                        return s;
                    }
                    break;
                }
                case value_kind::blob: {
                    if (primitive.holds<std::string>()) {
                        const auto& s = primitive.get<std::string>();
                        return Blob(s.begin(), s.end());
                    }
                    break;
                }
                case value_kind::timestamp: {
                    if (primitive.holds<std::string>()) return parse_timestamp(primitive.get<std::string>());
                    if (primitive.holds<int64_t>()) {
                        return Timestamp(std::chrono::seconds(primitive.get<int64_t>()));
                    }
                    break;
                }
                case value_kind::nil:
                    break;
            }

            return primitive;
        }
    };

    /**
     * FieldTypeRegistry - name -> FieldType, seeded with the built-in types.
     *                     Custom types are added to a registry owned by
     *                     whoever declares the models that use them.
     */
    class FieldTypeRegistry {
        private:
        std::map<std::string, FieldType, std::less<>> _types;

        static FieldType make(std::string name, field_kind kind, value_kind logical,
                sqlite_column_type primitive, PropertyOptions defaults = {}) {
            FieldType t;
            t.name = std::move(name);
            t.kind = kind;
            t.logical = logical;
            t.primitive = primitive;
            t.default_options = std::move(defaults);
            return t;
        }

        public:
        FieldTypeRegistry() {
            add(make("Integer", field_kind::integer, value_kind::integer, sqlite_column_type::INTEGER));
            add(make("Serial", field_kind::integer, value_kind::integer, sqlite_column_type::INTEGER,
                    { .key = true, .serial = true }));
            add(make("String", field_kind::text, value_kind::text, sqlite_column_type::TEXT,
                    { .length = 50 }));
            add(make("Text", field_kind::text, value_kind::text, sqlite_column_type::TEXT,
                    { .lazy = true, .length = 65535 }));
            add(make("Boolean", field_kind::boolean, value_kind::boolean, sqlite_column_type::INTEGER));
            add(make("Float", field_kind::floating, value_kind::real, sqlite_column_type::REAL,
                    { .precision = 10 }));
            add(make("Decimal", field_kind::decimal, value_kind::real, sqlite_column_type::REAL,
                    { .precision = 10, .scale = 0 }));
            add(make("DateTime", field_kind::timestamp, value_kind::timestamp, sqlite_column_type::TEXT));
            add(make("Blob", field_kind::blob, value_kind::blob, sqlite_column_type::BLOB));
        }

        static const FieldTypeRegistry& builtin() {
            static const FieldTypeRegistry registry;
            return registry;
        }

        const FieldType& add(FieldType type) {
            if (type.name.empty()) {
                throw DefinitionError("Field type must have a name");
            }
            if (type.custom() && (!type.dump || !type.load)) {
                throw DefinitionError("Custom field type " + type.name + " must supply both dump and load");
            }
            auto [it, inserted] = _types.emplace(type.name, std::move(type));
            if (!inserted) {
                throw DefinitionError("Field type " + it->first + " is already registered");
            }
            return it->second;
        }

        // register a custom type whose logical values are stored as `primitive`
        const FieldType& add_custom(std::string name, value_kind logical, sqlite_column_type primitive,
                TypeCodec dump, TypeCodec load, PropertyOptions defaults = {}) {
            auto t = make(std::move(name), field_kind::custom, logical, primitive, std::move(defaults));
            t.dump = std::move(dump);
            t.load = std::move(load);
            return add(std::move(t));
        }

        bool contains(std::string_view name) const {
            return _types.find(name) != _types.end();
        }

        const FieldType& operator[](std::string_view name) const {
            auto it = _types.find(name);
            if (it == _types.end()) {
                throw DefinitionError("Unknown field type " + std::string(name));
            }
            return it->second;
        }

        size_t size() const { return _types.size(); }
    };
};
