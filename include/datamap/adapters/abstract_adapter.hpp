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
#include "datamap/adapters/adapter_options.hpp"
#include "datamap/orm/query.hpp"
#include "datamap/orm/resource.hpp"
#include "datamap/orm/record_iterator.hpp"

namespace datamap {
    /**
     * AbstractAdapter - what a repository needs from a store
     */
    class AbstractAdapter {
        private:
        std::string _name;
        AdapterOptions _options;
        Logger _logger;

        protected:
        AbstractAdapter(std::string name, AdapterOptions options) :
            _name{std::move(name)}, _options{std::move(options)}
        {
            _logger = _options.logger ? _options.logger : null_logger();
        }

        public:
        virtual ~AbstractAdapter() = default;

        AbstractAdapter(const AbstractAdapter&) = delete;
        AbstractAdapter& operator=(const AbstractAdapter&) = delete;

        const std::string& name() const { return _name; }
        const AdapterOptions& options() const { return _options; }
        const Logger& logger() const { return _logger; }

        // returns how many resources were persisted
        virtual size_t create(const std::vector<Resource*>& resources) = 0;

        virtual RecordIterator<std::shared_ptr<Resource>> read(const Query& query) = 0;

        // returns the number of affected records
        virtual size_t update(const Attributes& attributes, const Query& query) = 0;

        virtual size_t delete_records(const Query& query) = 0;
    };
};
