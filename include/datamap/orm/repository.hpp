/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/adapters/abstract_adapter.hpp"
#include "datamap/adapters/sql_adapter.hpp"
#include "datamap/orm/query.hpp"
#include "datamap/orm/resource.hpp"

namespace datamap {
    /**
     * Repository - a named store that resources are read from and saved to
     */
    class Repository {
        private:
        std::string _name;
        std::shared_ptr<AbstractAdapter> _adapter;

        template <typename T>
        static std::vector<std::shared_ptr<T>> downcast(RecordIterator<std::shared_ptr<Resource>> records) {
            std::vector<std::shared_ptr<T>> result;
            for (auto& r : records) {
                result.push_back(std::static_pointer_cast<T>(r));
            }
            return result;
        }

        public:
        Repository(std::string name, std::shared_ptr<AbstractAdapter> adapter) :
            _name{std::move(name)}, _adapter{std::move(adapter)}
        {
            if (!_adapter) {
                throw UsageError("Repository " + _name + " needs an adapter");
            }
        }

        Repository(const Repository&) = delete;
        Repository& operator=(const Repository&) = delete;

        const std::string& name() const { return _name; }
        AbstractAdapter& adapter() const { return *_adapter; }

        Query query(const ModelBase& model) {
            return Query(model, _name, this);
        }

        template <typename T>
        Query query() {
            return query(T::model());
        }

        // matches `resource` by its persisted key
        Query key_query(Resource& resource) {
            Query query(resource.model(), _name, this);
            const auto& key = resource.properties().key();
            if (key.empty()) {
                throw UsageError("Model " + resource.model().name() + " has no key");
            }

            auto values = resource.key();
            for (size_t i = 0; i < key.size(); i++) {
                if (values[i].is_nil()) {
                    throw UsageError("Resource of " + resource.model().name()
                            + " is missing a value for key " + key[i]->name());
                }
                query.where(Condition::eql(*key[i], values[i]));
            }
            return query;
        }

        RecordIterator<std::shared_ptr<Resource>> read(const Query& query) {
            return _adapter->read(query);
        }

        template <typename T>
        std::vector<std::shared_ptr<T>> all(const Query& query) {
            return downcast<T>(read(query));
        }

        template <typename T>
        std::vector<std::shared_ptr<T>> all() {
            return all<T>(query<T>());
        }

        // nullptr when nothing matches
        template <typename T>
        std::shared_ptr<T> first(Query query) {
            query.limit(1);
            auto found = all<T>(query);
            if (found.empty()) return nullptr;
            return found.front();
        }

        template <typename T>
        std::shared_ptr<T> first() {
            return first<T>(query<T>());
        }

        // `key` lines up with the model's key properties
        template <typename T>
        std::shared_ptr<T> get(const std::vector<Value>& key) {
            auto q = query<T>();
            const auto& key_properties = q.properties().key();
            if (key.size() != key_properties.size()) {
                throw UsageError("Model " + T::model().name() + " has a key of "
                        + std::to_string(key_properties.size()) + " properties, "
                        + std::to_string(key.size()) + " values were given");
            }
            for (size_t i = 0; i < key.size(); i++) {
                q.where(Condition::eql(*key_properties[i], key[i]));
            }
            return first<T>(q);
        }

        template <typename T>
        std::shared_ptr<T> get(const Value& key) {
            return get<T>(std::vector<Value>{ key });
        }

        // the resource joins this repository if it has none yet
        bool save(Resource& resource) {
            if (!resource._repository) {
                resource._repository = this;
                resource._repository_name = _name;
            }

            if (resource.is_new()) {
                for (const auto& p : resource.properties()) {
                    if (p->has_default() && !p->loaded(resource)) {
                        p->get(resource);
                    }
                }

                if (_adapter->create({ &resource }) != 1) return false;
                resource._saved = true;
                resource._original_values.clear();
                return true;
            }

            auto attributes = resource.dirty_attributes();
            if (attributes.empty()) return true;

            // on failure the resource keeps its changes
            if (_adapter->update(attributes, key_query(resource)) != 1) return false;
            resource._original_values.clear();
            return true;
        }

        bool destroy(Resource& resource) {
            if (resource.is_new()) return false;

            if (_adapter->delete_records(key_query(resource)) != 1) return false;
            resource._saved = false;
            resource._original_values.clear();
            return true;
        }

        size_t update(const Attributes& attributes, const Query& query) {
            return _adapter->update(attributes, query);
        }

        size_t destroy(const Query& query) {
            return _adapter->delete_records(query);
        }

        template <typename T>
        std::vector<std::shared_ptr<T>> find_by_sql(const std::string& sql, const std::vector<Value>& binds = {}) {
            auto sql_adapter = dynamic_cast<SqlAdapter*>(_adapter.get());
            if (!sql_adapter) {
                throw UsageError("find_by_sql is only supported by SQL adapters, "
                        + _adapter->name() + " is not one");
            }
            return downcast<T>(sql_adapter->load_by_sql(query<T>(), sql, binds));
        }
    };

    inline void Resource::lazy_load(const std::vector<std::string>& names) {
        if (!_repository) {
            throw UsageError("Resource of " + _model->name() + " is not attached to a repository");
        }

        const auto& properties = this->properties();
        std::vector<const Property*> fields;
        for (const auto& name : properties.lazy_load_context(names)) {
            auto p = properties[name];
            if (p && !p->key() && !p->loaded(*this)) fields.push_back(p);
        }
        if (fields.empty()) return;

        auto query = _repository->key_query(*this);
        query.fields(fields);

        for (auto& loaded : _repository->read(query)) {
            for (auto p : fields) {
                p->set_raw(*this, p->get_raw(*loaded));
            }
            break;
        }
    }
};
