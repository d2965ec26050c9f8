/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include "datamap/common.hpp"
#include "datamap/orm/field_type.hpp"
#include "datamap/orm/naming.hpp"
#include "datamap/orm/property.hpp"
#include "datamap/orm/property_set.hpp"
#include "datamap/orm/slot.hpp"

namespace datamap {
    class Query;

    /**
     * ModelBase - the type-erased half of a model: its name, naming
     *             conventions, and the property sets it declares for each
     *             repository. Models are declared once and never move, since
     *             every `Property` points back at its model.
     */
    class ModelBase {
        private:
        std::string _name;
        std::string _default_repository_name = "default";
        // the repository properties are currently being declared in
        std::string _repository_name;

        NamingConvention _storage_naming = naming::underscored_and_pluralized;
        std::map<std::string, NamingConvention, std::less<>> _field_naming;
        std::map<std::string, std::string, std::less<>> _storage_names;

        // a repository other than the default starts from a copy of the default set,
        // made the first time that repository is asked for
        mutable std::map<std::string, PropertySet, std::less<>> _properties;
        mutable std::mutex _properties_mutex;

        Logger _logger = null_logger();
        const FieldTypeRegistry* _types = &FieldTypeRegistry::builtin();

        PropertySet& property_set(std::string_view repository_name) const {
            std::lock_guard<std::mutex> lock(_properties_mutex);
            auto it = _properties.find(repository_name);
            if (it != _properties.end()) return it->second;

            PropertySet set;
            if (repository_name != _default_repository_name) {
                auto def = _properties.find(_default_repository_name);
                if (def != _properties.end()) set = def->second;
            }
            return _properties.emplace(std::string(repository_name), std::move(set)).first->second;
        }

        protected:
        void add_property(std::shared_ptr<const Property> property) {
            property_set(_repository_name) << std::move(property);
        }

        void declaring_repository(std::string repository_name) {
            _repository_name = std::move(repository_name);
        }

        public:
        explicit ModelBase(std::string name) : _name{std::move(name)}, _repository_name{_default_repository_name} {}
        virtual ~ModelBase() = default;

        ModelBase(const ModelBase&) = delete;
        ModelBase& operator=(const ModelBase&) = delete;

        const std::string& name() const { return _name; }
        const std::string& default_repository_name() const { return _default_repository_name; }
        const std::string& repository_name() const { return _repository_name; }

        const Logger& logger() const { return _logger; }
        void logger(Logger logger) { _logger = logger ? std::move(logger) : null_logger(); }

        const FieldTypeRegistry& types() const { return *_types; }
        void types(const FieldTypeRegistry& registry) { _types = &registry; }

        const PropertySet& properties(std::string_view repository_name) const {
            return property_set(repository_name);
        }
        const PropertySet& properties() const {
            return property_set(_default_repository_name);
        }

        std::string storage_name(std::string_view repository_name) const {
            auto it = _storage_names.find(repository_name);
            if (it != _storage_names.end()) return it->second;
            return _storage_naming(_name);
        }
        std::string storage_name() const {
            return storage_name(_default_repository_name);
        }

        void storage_name(std::string repository_name, std::string storage_name) {
            _storage_names[std::move(repository_name)] = std::move(storage_name);
        }

        void storage_naming_convention(NamingConvention convention) {
            _storage_naming = std::move(convention);
        }

        const NamingConvention& field_naming_convention(std::string_view repository_name) const {
            static const NamingConvention underscored = naming::underscored;
            auto it = _field_naming.find(repository_name);
            if (it != _field_naming.end()) return it->second;
            it = _field_naming.find(_default_repository_name);
            if (it != _field_naming.end()) return it->second;
            return underscored;
        }

        void field_naming_convention(std::string repository_name, NamingConvention convention) {
            _field_naming[std::move(repository_name)] = std::move(convention);
        }

        // the first serial property, assigned by the store on insert
        const Property* identity_field(std::string_view repository_name) const {
            for (const auto& p : properties(repository_name)) {
                if (p->serial()) return p.get();
            }
            return nullptr;
        }
        const Property* identity_field() const {
            return identity_field(_default_repository_name);
        }

        const std::vector<const Property*>& key(std::string_view repository_name) const {
            return properties(repository_name).key();
        }
        const std::vector<const Property*>& key() const {
            return key(_default_repository_name);
        }

        virtual std::shared_ptr<Resource> instantiate() const = 0;

        // builds a saved resource from a row selected by `query`, the values
        // are aligned with `query.fields()`
        std::shared_ptr<Resource> load(const std::vector<Value>& values, const Query& query) const;
    };

    /**
     * Model<T> - declares the properties of entity type `T`, binding each one
     *            to a `Slot` member of `T`:
     *
     *            static const Model<Post> model("Post", [](auto& m) {
     *                m.template property<&Post::id>("id", "Serial");
     *                m.template property<&Post::body>("body", "Text", { .lazy = "content" });
     *            });
     */
    template <typename T>
    class Model : public ModelBase {
        private:
        template <typename M>
        struct member_slot;
        template <typename C, typename S>
        struct member_slot<S C::*> : std::type_identity<S> {};

        public:
        using definition_t = std::function<void(Model&)>;

        Model(std::string name, definition_t define) : ModelBase(std::move(name)) {
            define(*this);
        }

        template <auto Member>
        Model& property(std::string name, const FieldType& type, PropertyOptions options = {}) {
            using slot_t = typename member_slot<decltype(Member)>::type;
            static_assert(std::is_base_of_v<SlotBase, slot_t>, "A property must be bound to a Slot member");

            if (slot_t::slot_kind != type.logical) {
                throw DefinitionError("Property " + name + " of type " + type.name
                        + " holds " + value_kind_str(type.logical)
                        + " values, but is bound to a " + value_kind_str(slot_t::slot_kind) + " slot");
            }

            SlotAccessor accessor = [](Resource& resource) -> SlotBase& {
                return static_cast<T&>(resource).*Member;
            };

            add_property(std::make_shared<const Property>(
                        *this, std::move(name), type, std::move(options), std::move(accessor)));
            return *this;
        }

        template <auto Member>
        Model& property(std::string name, std::string_view type_name, PropertyOptions options = {}) {
            return property<Member>(std::move(name), types()[type_name], std::move(options));
        }

        // properties declared inside `define` belong to `repository_name` only
        Model& repository(std::string repository_name, definition_t define) {
            std::string previous = ModelBase::repository_name();
            declaring_repository(std::move(repository_name));
            define(*this);
            declaring_repository(std::move(previous));
            return *this;
        }

        std::shared_ptr<Resource> instantiate() const override {
            return std::make_shared<T>();
        }
    };

    inline Property::Property(const ModelBase& model, std::string name, const FieldType& type,
            PropertyOptions options, SlotAccessor slot) :
        _model{&model},
        _name{strip_predicate(std::move(name))},
        _type{type},
        _repository_name{model.repository_name()},
        _slot{std::move(slot)}
    {
        assert_valid_options(_name, options, type);

        if (options.size) {
            model.logger()(log_level::Warning,
                    "Property " + _name + ": +size+ is deprecated, use +length+ instead");
            if (!options.length) options.length = options.size;
            options.size.reset();
        }

        _options = options.merged_over(type.default_options);
        _default = _options.default_value;

        _serial = _options.serial.value_or(false);
        _key = _options.key.value_or(false);
        _nullable = _options.nullable.value_or(!_key);
        _unique = _options.unique.value_or(_serial || _key);
        _lazy = _options.lazy.has_value() && _options.lazy->enabled() && !_key;
        if (_lazy) _lazy_contexts = _options.lazy->contexts();

        _index = _options.index.value_or(Index{});
        _unique_index = _options.unique_index.value_or(Index{});

        if (type.bounded() && _options.length) {
            _length = _options.length->max;
        }

        if (type.numeric()) {
            _precision = _options.precision;
            _scale = _options.scale;

            if (_precision && *_precision <= 0) {
                throw DefinitionError("Property " + _name + ": precision must be greater than 0, but was "
                        + std::to_string(*_precision));
            }
            if (_scale && *_scale < 0) {
                throw DefinitionError("Property " + _name + ": scale must be equal to or greater than 0, but was "
                        + std::to_string(*_scale));
            }
            if (_precision && _scale && *_precision < *_scale) {
                throw DefinitionError("Property " + _name + ": precision must be equal to or greater than scale, but was "
                        + std::to_string(*_precision) + " and scale was " + std::to_string(*_scale));
            }
        }

        auto accessor = _options.accessor.value_or(access_t::public_access);
        _reader_visibility = _options.reader.value_or(accessor);
        _writer_visibility = _options.writer.value_or(accessor);
    }

    inline const std::string& Property::field() const {
        std::call_once(_field_once, [this]() {
            if (_options.field) {
                _field = _options.field.value();
            } else {
                _field = _model->field_naming_convention(_repository_name)(_name);
            }
        });
        return _field;
    }

    inline const std::string& Property::field(std::string_view repository_name) const {
        _model->logger()(log_level::Warning, "Passing in +repository_name+ to Property::field is deprecated");

        if (repository_name != _repository_name) {
            throw UsageError("Mismatching +repository_name+ with Property::repository_name ("
                    + std::string(repository_name) + " != " + _repository_name + ")");
        }
        return field();
    }

    inline std::ostream & operator<< (std::ostream &out, const Property& p) {
        out << p.model().name() << "#" << p.name();
        return out;
    }
};
