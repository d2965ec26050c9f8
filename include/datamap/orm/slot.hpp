/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <optional>
#include <sstream>
#include "datamap/common.hpp"
#include "datamap/value.hpp"

namespace datamap {
    // type erased view of a `Slot`, used by `Property` to read and write any field
    class SlotBase {
    public:
        virtual ~SlotBase() = default;

        virtual value_kind kind() const = 0;
        virtual bool loaded() const = 0;
        // nil when unset or holding nil
        virtual Value read() const = 0;
        virtual void write(const Value& value) = 0;
        virtual void unload() = 0;
    };

    /**
     * Slot - one field of an entity: a typed value plus whether it has been
     *        loaded (or assigned) at all. A loaded slot may still hold nil.
     */
    template <ValueType T>
    class Slot final : public SlotBase {
        private:
        std::optional<T> _value;
        bool _loaded = false;

        public:
        using value_type = T;
        static constexpr value_kind slot_kind = value_kind_of<T>::value;

        Slot() = default;

        value_kind kind() const override { return slot_kind; }

        bool loaded() const override { return _loaded; }

        Value read() const override {
            if (!_value.has_value()) return {};
            return Value(_value.value());
        }

        void write(const Value& value) override {
            _loaded = true;
            if (value.is_nil()) {
                _value.reset();
                return;
            }

            if constexpr (std::is_same_v<T, double>) {
                if (value.holds<int64_t>()) {
                    _value = static_cast<double>(value.get<int64_t>());
                    return;
                }
            }

            if (!value.holds<T>()) {
                std::ostringstream ss;
                ss << "Cannot assign " << value_kind_str(value.kind())
                    << " value " << value << " to a " << value_kind_str(slot_kind) << " field";
                throw UsageError(ss.str());
            }
            _value = value.get<T>();
        }

        void unload() override {
            _loaded = false;
            _value.reset();
        }

        // raw typed access, bypasses defaults and lazy loading
        const std::optional<T>& value() const { return _value; }
    };
};
