/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "datamap/common.hpp"
#include "datamap/orm/types.hpp"
#include "datamap/orm/model.hpp"
#include "datamap/orm/condition.hpp"

namespace datamap {
    class Repository;

    struct Direction {
        const Property* property;
        order_t order = order_t::ASC;
    };

    /**
     * Link - joins `parent_model` and `child_model` on equal key columns,
     *        `parent_key` and `child_key` pair up by position
     */
    struct Link {
        const ModelBase* parent_model;
        const ModelBase* child_model;
        std::vector<const Property*> parent_key;
        std::vector<const Property*> child_key;
    };

    /**
     * Query - what to read (or update, or delete): the target model, the
     *         selected fields, the AND-ed conditions, ordering, a window of
     *         limit and offset, and the links joining other models in
     */
    class Query {
        private:
        const ModelBase* _model;
        std::string _repository_name;
        Repository* _repository = nullptr;

        std::vector<const Property*> _fields;
        std::vector<Condition> _conditions;
        std::vector<Direction> _order;
        std::optional<size_t> _limit;
        size_t _offset = 0;
        std::vector<Link> _links;
        bool _unique = false;

        public:
        // an empty `repository_name` is the model's default repository
        explicit Query(const ModelBase& model, std::string_view repository_name = {}, Repository* repository = nullptr) :
            _model{&model},
            _repository_name{repository_name.empty() ? model.default_repository_name() : std::string(repository_name)},
            _repository{repository}
        {
            const auto& properties = model.properties(_repository_name);
            _fields = properties.defaults();
            for (const auto& k : properties.key()) {
                _order.push_back({ k, order_t::ASC });
            }
        }

        const ModelBase& model() const { return *_model; }
        const std::string& repository_name() const { return _repository_name; }
        Repository* repository() const { return _repository; }
        const PropertySet& properties() const { return _model->properties(_repository_name); }

        const std::vector<const Property*>& fields() const { return _fields; }
        const std::vector<Condition>& conditions() const { return _conditions; }
        const std::vector<Direction>& order() const { return _order; }
        const std::optional<size_t>& limit() const { return _limit; }
        size_t offset() const { return _offset; }
        const std::vector<Link>& links() const { return _links; }
        bool unique() const { return _unique; }

        Query& fields(std::vector<const Property*> fields) {
            _fields = std::move(fields);
            return *this;
        }

        Query& fields(std::initializer_list<std::string_view> names) {
            _fields.clear();
            for (auto name : names) {
                _fields.push_back(&properties().at(name));
            }
            return *this;
        }

        Query& where(Condition condition) {
            _conditions.push_back(std::move(condition));
            return *this;
        }

        Query& where(condition_op_t op, std::string_view name, Operand operand) {
            _conditions.emplace_back(op, properties().at(name), std::move(operand));
            return *this;
        }

        Query& order(std::vector<Direction> order) {
            _order = std::move(order);
            return *this;
        }

        // replaces the default ordering with a single direction
        Query& order(std::string_view name, order_t direction = order_t::ASC) {
            _order = { { &properties().at(name), direction } };
            return *this;
        }

        Query& limit(size_t limit) {
            _limit = limit;
            return *this;
        }

        Query& offset(size_t offset) {
            _offset = offset;
            return *this;
        }

        Query& link(Link link) {
            if (link.parent_key.size() != link.child_key.size()) {
                throw UsageError("A link must pair up the same number of parent and child key properties");
            }
            _links.push_back(std::move(link));
            return *this;
        }

        Query& unique(bool unique) {
            _unique = unique;
            return *this;
        }
    };
};
