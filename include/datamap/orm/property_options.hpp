/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "datamap/value.hpp"
#include "datamap/orm/types.hpp"

namespace datamap {
    class Resource;
    class Property;

    using DefaultGenerator = std::function<Value(Resource&, const Property&)>;

    /**
     * DefaultValue - either a static value, copied into each new resource,
     *                or a generator invoked with the resource and property
     *                on the first read of an unset slot
     */
    class DefaultValue {
        private:
        std::variant<Value, DefaultGenerator> _default;

        public:
        DefaultValue(Value v) : _default{std::move(v)} {}

        template <typename V>
        requires (std::is_constructible_v<Value, V> && !std::is_same_v<std::remove_cvref_t<V>, Value>)
        DefaultValue(V v) : _default{Value(std::move(v))} {}

        template <typename F>
        requires (std::is_invocable_r_v<Value, F, Resource&, const Property&>)
        DefaultValue(F generator) : _default{DefaultGenerator(std::move(generator))} {}

        bool is_computed() const {
            return std::holds_alternative<DefaultGenerator>(_default);
        }

        // nullptr for computed defaults
        const Value* static_value() const {
            return std::get_if<Value>(&_default);
        }

        Value evaluate(Resource& resource, const Property& property) const {
            if (auto generator = std::get_if<DefaultGenerator>(&_default)) {
                return (*generator)(resource, property);
            }
            return std::get<Value>(_default);
        }
    };

    /**
     * Lazy - `true` puts the property in the "default" lazy context,
     *        a name (or several) puts it in those contexts instead
     */
    class Lazy {
        private:
        std::vector<std::string> _contexts;

        public:
        static constexpr const char* default_context = "default";

        Lazy(bool lazy) {
            if (lazy) _contexts.emplace_back(default_context);
        }
        Lazy(const char* context) : _contexts{std::string(context)} {}
        Lazy(std::string context) : _contexts{std::move(context)} {}
        Lazy(std::initializer_list<std::string> contexts) : _contexts{contexts} {}

        bool enabled() const { return !_contexts.empty(); }
        const std::vector<std::string>& contexts() const { return _contexts; }
    };

    /**
     * Index - `true` is an anonymous single column index, a name is a
     *         (possibly multi column) named index, and a list joins the
     *         property to several indexes
     */
    class Index {
        private:
        // std::nullopt is the anonymous index
        std::vector<std::optional<std::string>> _entries;

        public:
        Index() = default;
        Index(bool indexed) {
            if (indexed) _entries.emplace_back(std::nullopt);
        }
        Index(const char* name) : _entries{std::string(name)} {}
        Index(std::string name) : _entries{std::move(name)} {}
        Index(std::initializer_list<Index> many) {
            for (const auto& idx : many) {
                _entries.insert(_entries.end(), idx._entries.begin(), idx._entries.end());
            }
        }

        bool empty() const { return _entries.empty(); }
        const std::vector<std::optional<std::string>>& entries() const { return _entries; }
    };

    struct Length {
        size_t min = 0;
        size_t max = 0;

        Length(size_t length) : min{length}, max{length} {}
        Length(size_t min, size_t max) : min{min}, max{max} {}
    };

    /**
     * PropertyOptions - every option a property accepts, anything else
     *                   fails to compile
     */
    struct PropertyOptions {
        std::optional<std::string> field;
        std::optional<DefaultValue> default_value;
        std::optional<bool> nullable;
        std::optional<bool> key;
        std::optional<bool> serial;
        std::optional<bool> unique;
        std::optional<Lazy> lazy;
        std::optional<Index> index;
        std::optional<Index> unique_index;
        std::optional<Length> length;
        // deprecated alias of `length`
        std::optional<Length> size;
        std::optional<int> precision;
        std::optional<int> scale;
        std::optional<access_t> reader;
        std::optional<access_t> writer;
        std::optional<access_t> accessor;
        std::optional<std::string> format;
        std::optional<bool> auto_validation;

        // options set here win, anything unset falls back to `defaults`
        PropertyOptions merged_over(const PropertyOptions& defaults) const {
            PropertyOptions merged = *this;
            auto fill = [](auto& mine, const auto& theirs) {
                if (!mine.has_value()) mine = theirs;
            };
            fill(merged.field, defaults.field);
            fill(merged.default_value, defaults.default_value);
            fill(merged.nullable, defaults.nullable);
            fill(merged.key, defaults.key);
            fill(merged.serial, defaults.serial);
            fill(merged.unique, defaults.unique);
            fill(merged.lazy, defaults.lazy);
            fill(merged.index, defaults.index);
            fill(merged.unique_index, defaults.unique_index);
            fill(merged.length, defaults.length);
            fill(merged.size, defaults.size);
            fill(merged.precision, defaults.precision);
            fill(merged.scale, defaults.scale);
            fill(merged.reader, defaults.reader);
            fill(merged.writer, defaults.writer);
            fill(merged.accessor, defaults.accessor);
            fill(merged.format, defaults.format);
            fill(merged.auto_validation, defaults.auto_validation);
            return merged;
        }
    };
};
