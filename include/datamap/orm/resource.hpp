/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/value.hpp"
#include "datamap/orm/model.hpp"
#include "datamap/orm/query.hpp"

namespace datamap {
    class Repository;

    // (property, storable value) pairs, in declaration order
    using Attributes = std::vector<std::pair<const Property*, Value>>;

    /**
     * Resource - the state every entity carries besides its slots: whether
     *            it has been persisted, which repository it belongs to, and
     *            the original values of properties changed since then
     */
    class Resource {
        friend class ModelBase;
        friend class Repository;

        private:
        const ModelBase* _model;
        Repository* _repository = nullptr;
        std::string _repository_name;
        bool _saved = false;
        // property name -> storable value before the first unsaved change
        std::map<std::string, Value, std::less<>> _original_values;

        protected:
        explicit Resource(const ModelBase& model) :
            _model{&model}, _repository_name{model.default_repository_name()} {}

        public:
        virtual ~Resource() = default;

        const ModelBase& model() const { return *_model; }
        Repository* repository() const { return _repository; }
        const std::string& repository_name() const { return _repository_name; }

        const PropertySet& properties() const {
            return _model->properties(_repository_name);
        }

        bool is_new() const { return !_saved; }
        bool saved() const { return _saved; }

        std::map<std::string, Value, std::less<>>& original_values() { return _original_values; }
        const std::map<std::string, Value, std::less<>>& original_values() const { return _original_values; }

        // nullptr when no change to `name` is being tracked
        const Value* original_value(std::string_view name) const {
            auto it = _original_values.find(name);
            if (it == _original_values.end()) return nullptr;
            return &it->second;
        }

        Value attribute_get(std::string_view name);
        Value attribute_set(std::string_view name, const Value& value);

        Attributes dirty_attributes();
        bool dirty() { return !dirty_attributes().empty(); }

        // the persisted key, original values win over unsaved changes
        std::vector<Value> key();

        // fetches the lazy context of `names` and fills the unloaded slots
        void lazy_load(const std::vector<std::string>& names);
    };

    /**
     * Entity<T> - base of every entity type. `T` declares its slots and a
     *             `static const Model<T>& model()`.
     */
    template <typename T>
    class Entity : public Resource {
        public:
        Entity() : Resource(T::model()) {}
    };

    inline Value Resource::attribute_get(std::string_view name) {
        return properties().at(name).get(*this);
    }

    inline Value Resource::attribute_set(std::string_view name, const Value& value) {
        return properties().at(name).set(*this, value);
    }

    inline Attributes Resource::dirty_attributes() {
        Attributes dirty;
        for (const auto& p : properties()) {
            auto original = _original_values.find(p->name());
            if (original == _original_values.end() || !p->loaded(*this)) continue;

            auto current = p->value(p->get_raw(*this));
            if (current != original->second) {
                dirty.emplace_back(p.get(), std::move(current));
            }
        }
        return dirty;
    }

    inline std::vector<Value> Resource::key() {
        std::vector<Value> key;
        for (const auto& p : properties().key()) {
            auto original = _saved ? original_value(p->name()) : nullptr;
            key.push_back(original ? *original : p->value(p->get_raw(*this)));
        }
        return key;
    }

    inline Value Property::get(Resource& resource) const {
        if (resource.is_new()) {
            if (loaded(resource)) return get_raw(resource);
            if (has_default()) return set(resource, default_for(resource));
            return {};
        }

        if (!loaded(resource)) lazy_load(resource);
        return get_raw(resource);
    }

    inline Value Property::set(Resource& resource, const Value& value) const {
        bool is_loaded = loaded(resource);
        Value original = is_loaded ? get_raw(resource) : Value{};

        if (is_loaded && value == original) {
            return original;
        }

        set_original_value(resource, original);
        set_raw(resource, value);
        return get_raw(resource);
    }

    inline void Property::set_original_value(Resource& resource, const Value& original) const {
        auto& originals = resource.original_values();
        auto dumped = value(original);

        auto it = originals.find(_name);
        if (it != originals.end()) {
            // stop tracking once the value is back to what was persisted
            if (dumped == it->second && resource.saved()) {
                originals.erase(it);
            }
        } else {
            originals.emplace(_name, std::move(dumped));
        }
    }

    inline void Property::lazy_load(Resource& resource) const {
        std::vector<std::string> names;
        if (_lazy) {
            names.push_back(_name);
        } else {
            // eager properties left out of the original selection
            for (const auto& p : _model->properties(resource.repository_name()).defaults()) {
                names.push_back(p->name());
            }
        }
        resource.lazy_load(names);
    }

    inline std::shared_ptr<Resource> ModelBase::load(const std::vector<Value>& values, const Query& query) const {
        auto resource = instantiate();
        const auto& fields = query.fields();
        auto n = std::min(values.size(), fields.size());
        for (size_t i = 0; i < n; i++) {
            // joined models contribute columns that are not ours
            if (&fields[i]->model() != this) continue;
            fields[i]->set_raw(*resource, values[i]);
        }

        resource->_saved = true;
        resource->_repository = query.repository();
        resource->_repository_name = query.repository_name();
        return resource;
    }
};
