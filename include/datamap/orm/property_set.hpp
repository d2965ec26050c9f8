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
#include <unordered_map>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/orm/property.hpp"

namespace datamap {
    struct IndexDefinition {
        // for anonymous indexes, the field of the one property it covers
        std::string name;
        bool anonymous = false;
        std::vector<std::string> fields;
    };

    /**
     * PropertySet - the ordered properties of one model, with lookup by
     *               name and the views derived from them (key, defaults,
     *               indexes, lazy contexts)
     */
    class PropertySet {
        public:
        using property_ptr = std::shared_ptr<const Property>;
        using iterator = std::vector<property_ptr>::const_iterator;

        private:
        std::vector<property_ptr> _properties;
        std::unordered_map<std::string, property_ptr> _by_name;
        std::map<std::string, std::vector<std::string>> _lazy_contexts;

        std::vector<const Property*> _key;
        std::vector<const Property*> _defaults;

        // rebuilt on every insertion, reads never write
        void rebuild_cache() {
            _key.clear();
            _defaults.clear();
            for (const auto& p : _properties) {
                if (p->key()) _key.push_back(p.get());
                if (p->key() || !p->lazy()) _defaults.push_back(p.get());
            }
        }

        void add_lazy_contexts(const Property& property) {
            for (auto& [_, names] : _lazy_contexts) {
                std::erase(names, property.name());
            }
            if (!property.lazy()) return;
            for (const auto& context : property.lazy_contexts()) {
                auto& names = lazy_context(context);
                if (std::find(names.begin(), names.end(), property.name()) == names.end()) {
                    names.push_back(property.name());
                }
            }
        }

        static void parse_index(const Index& index, const std::string& field, std::vector<IndexDefinition>& out) {
            for (const auto& entry : index.entries()) {
                if (!entry.has_value()) {
                    out.push_back({ field, true, { field } });
                    continue;
                }
                auto it = std::find_if(out.begin(), out.end(), [&](const auto& def) {
                    return !def.anonymous && def.name == entry.value();
                });
                if (it == out.end()) {
                    out.push_back({ entry.value(), false, { field } });
                } else {
                    it->fields.push_back(field);
                }
            }
        }

        public:
        PropertySet() = default;

        iterator begin() const { return _properties.begin(); }
        iterator end() const { return _properties.end(); }
        size_t size() const { return _properties.size(); }
        bool empty() const { return _properties.empty(); }

        // nullptr when no property has this name
        const Property* operator[](std::string_view name) const {
            auto it = _by_name.find(std::string(name));
            if (it == _by_name.end()) return nullptr;
            return it->second.get();
        }

        const Property& at(std::string_view name) const {
            auto p = (*this)[name];
            if (!p) {
                throw UsageError("Unknown property " + std::string(name));
            }
            return *p;
        }

        bool named(std::string_view name) const {
            return _by_name.find(std::string(name)) != _by_name.end();
        }

        bool contains(const Property& property) const {
            return named(property.name());
        }

        std::vector<const Property*> values_at(const std::vector<std::string>& names) const {
            std::vector<const Property*> found;
            found.reserve(names.size());
            for (const auto& name : names) {
                found.push_back((*this)[name]);
            }
            return found;
        }

        // a property re-declared with an existing name replaces it in place
        PropertySet& operator<<(property_ptr property) {
            auto it = std::find_if(_properties.begin(), _properties.end(), [&](const auto& p) {
                return p->name() == property->name();
            });
            if (it == _properties.end()) {
                _properties.push_back(property);
            } else {
                *it = property;
            }
            _by_name[property->name()] = property;
            add_lazy_contexts(*property);
            rebuild_cache();
            return *this;
        }

        const std::vector<const Property*>& key() const {
            return _key;
        }

        // key properties, then every eagerly loaded one, in declaration order
        const std::vector<const Property*>& defaults() const {
            return _defaults;
        }

        std::vector<IndexDefinition> indexes() const {
            std::vector<IndexDefinition> defs;
            for (const auto& p : _properties) {
                parse_index(p->index(), p->field(), defs);
            }
            return defs;
        }

        std::vector<IndexDefinition> unique_indexes() const {
            std::vector<IndexDefinition> defs;
            for (const auto& p : _properties) {
                parse_index(p->unique_index(), p->field(), defs);
            }
            return defs;
        }

        std::vector<Value> get(Resource& resource) const {
            std::vector<Value> values;
            values.reserve(_properties.size());
            for (const auto& p : _properties) {
                values.push_back(p->get(resource));
            }
            return values;
        }

        void set(Resource& resource, const std::vector<Value>& values) const {
            auto n = std::min(values.size(), _properties.size());
            for (size_t i = 0; i < n; i++) {
                _properties[i]->set(resource, values[i]);
            }
        }

        std::vector<std::string> property_contexts(std::string_view name) const {
            std::vector<std::string> contexts;
            for (const auto& [context, names] : _lazy_contexts) {
                if (std::find(names.begin(), names.end(), name) != names.end()) {
                    contexts.push_back(context);
                }
            }
            return contexts;
        }

        std::vector<std::string>& lazy_context(const std::string& context) {
            return _lazy_contexts[context];
        }

        const std::map<std::string, std::vector<std::string>>& lazy_contexts() const {
            return _lazy_contexts;
        }

        /**
         * lazy_load_context - the names that have to be fetched together with
         *                     `names`: each name in a lazy context pulls in
         *                     every member of its contexts, others pass through
         */
        std::vector<std::string> lazy_load_context(const std::vector<std::string>& names) const {
            if (names.empty()) {
                throw UsageError("+names+ cannot be empty");
            }

            std::vector<std::string> result;
            auto append = [&](const std::string& name) {
                if (std::find(result.begin(), result.end(), name) == result.end()) {
                    result.push_back(name);
                }
            };

            for (const auto& name : names) {
                auto contexts = property_contexts(name);
                if (contexts.empty()) {
                    append(name);
                    continue;
                }
                for (const auto& context : contexts) {
                    for (const auto& member : _lazy_contexts.at(context)) {
                        append(member);
                    }
                }
            }

            return result;
        }
    };
};
