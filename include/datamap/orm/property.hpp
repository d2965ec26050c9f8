/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/value.hpp"
#include "datamap/orm/types.hpp"
#include "datamap/orm/slot.hpp"
#include "datamap/orm/property_options.hpp"
#include "datamap/orm/field_type.hpp"

namespace datamap {
    class ModelBase;
    class Resource;

    using SlotAccessor = std::function<SlotBase&(Resource&)>;

    /**
     * Property - one declared field of a model.
     *
     *            Owns the typing, defaulting and visibility of the field, and
     *            the get/set protocol a resource goes through to read, write
     *            and dirty-track it. Immutable once declared, apart from the
     *            memoized storage field name.
     */
    class Property {
        private:
        const ModelBase* _model;
        std::string _name;
        FieldType _type;
        PropertyOptions _options;
        std::string _repository_name;
        SlotAccessor _slot;

        mutable std::once_flag _field_once;
        mutable std::string _field;

        std::optional<DefaultValue> _default;
        bool _serial = false;
        bool _key = false;
        bool _nullable = true;
        bool _unique = false;
        bool _lazy = false;
        std::vector<std::string> _lazy_contexts;
        Index _index;
        Index _unique_index;
        std::optional<size_t> _length;
        std::optional<int> _precision;
        std::optional<int> _scale;
        access_t _reader_visibility = access_t::public_access;
        access_t _writer_visibility = access_t::public_access;

        static void assert_valid_options(const std::string& name, const PropertyOptions& options, const FieldType& type) {
            auto fail = [&](const std::string& msg) {
                throw DefinitionError("Property " + name + ": " + msg);
            };

            if (options.field && options.field->empty()) {
                fail("options[:field] must not be empty");
            }

            if (options.default_value) {
                auto v = options.default_value->static_value();
                if (v && v->is_nil()) {
                    fail("options[:default] must not be nil");
                }
            }

            if ((options.length || options.size) && !type.bounded()) {
                fail("options[:length] only applies to String and Text, not " + type.name);
            }

            if (options.length && options.length->min > options.length->max) {
                fail("options[:length] minimum must not exceed the maximum");
            }

            if ((options.precision || options.scale) && !type.numeric()) {
                fail("options[:precision] and options[:scale] only apply to Float and Decimal, not " + type.name);
            }
        }

        static std::string strip_predicate(std::string name) {
            if (!name.empty() && name.back() == '?') name.pop_back();
            return name;
        }

        public:
        Property(const ModelBase& model, std::string name, const FieldType& type,
                PropertyOptions options, SlotAccessor slot);

        Property(const Property&) = delete;
        Property& operator=(const Property&) = delete;

        const ModelBase& model() const { return *_model; }
        const std::string& name() const { return _name; }
        const FieldType& type() const { return _type; }
        const PropertyOptions& options() const { return _options; }
        const std::string& repository_name() const { return _repository_name; }

        // the storage field name, resolved through the model's naming convention once
        const std::string& field() const;
        const std::string& field(std::string_view repository_name) const;

        bool key() const { return _key; }
        bool serial() const { return _serial; }
        bool nullable() const { return _nullable; }
        bool unique() const { return _unique; }
        bool lazy() const { return _lazy; }
        bool custom() const { return _type.custom(); }
        bool is_boolean() const { return _type.kind == field_kind::boolean; }
        const std::vector<std::string>& lazy_contexts() const { return _lazy_contexts; }
        const Index& index() const { return _index; }
        const Index& unique_index() const { return _unique_index; }
        std::optional<size_t> length() const { return _length; }
        std::optional<int> precision() const { return _precision; }
        std::optional<int> scale() const { return _scale; }
        access_t reader_visibility() const { return _reader_visibility; }
        access_t writer_visibility() const { return _writer_visibility; }
        sqlite_column_type primitive() const { return _type.primitive; }

        bool has_default() const { return _default.has_value(); }
        Value default_for(Resource& resource) const {
            if (!_default) return {};
            return _default->evaluate(resource, *this);
        }

        // for custom types the storable primitive, otherwise `raw` unchanged
        Value value(const Value& raw) const {
            if (custom() && !raw.is_nil()) {
                return _type.dump(raw, *this);
            }
            return raw;
        }

        // a primitive read from the store, decoded to the logical value
        Value typecast(const Value& primitive) const {
            return _type.typecast(primitive, *this);
        }

        SlotBase& slot(Resource& resource) const { return _slot(resource); }

        bool loaded(Resource& resource) const {
            return slot(resource).loaded();
        }

        Value get(Resource& resource) const;
        Value get_raw(Resource& resource) const {
            return slot(resource).read();
        }

        Value set(Resource& resource, const Value& value) const;
        void set_raw(Resource& resource, const Value& value) const {
            slot(resource).write(value);
        }

        void set_original_value(Resource& resource, const Value& original) const;
        void lazy_load(Resource& resource) const;

        bool operator==(const Property& other) const {
            if (this == &other) return true;
            return _model == other._model && _name == other._name;
        }

        friend std::ostream & operator<< (std::ostream &out, const Property& p);
    };
};
