/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <cctype>
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "datamap/common.hpp"

namespace datamap {
    using Blob = std::vector<uint8_t>;
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

    // order matches the alternatives of `Value`
    enum class value_kind {
        nil = 0,
        boolean,
        integer,
        real,
        text,
        blob,
        timestamp,
    };

    static constexpr const char* value_kind_str(value_kind k) {
        switch (k) {
            case value_kind::nil: return "nil";
            case value_kind::boolean: return "boolean";
            case value_kind::integer: return "integer";
            case value_kind::real: return "real";
            case value_kind::text: return "text";
            case value_kind::blob: return "blob";
            case value_kind::timestamp: return "timestamp";
        }
        return "OOPS";
    }

    template <typename T>
    struct value_kind_of;
    template <> struct value_kind_of<bool> : std::integral_constant<value_kind, value_kind::boolean> {};
    template <> struct value_kind_of<int64_t> : std::integral_constant<value_kind, value_kind::integer> {};
    template <> struct value_kind_of<double> : std::integral_constant<value_kind, value_kind::real> {};
    template <> struct value_kind_of<std::string> : std::integral_constant<value_kind, value_kind::text> {};
    template <> struct value_kind_of<Blob> : std::integral_constant<value_kind, value_kind::blob> {};
    template <> struct value_kind_of<Timestamp> : std::integral_constant<value_kind, value_kind::timestamp> {};

    template <typename T>
    concept ValueType = is_one_of<T, bool, int64_t, double, std::string, Blob, Timestamp>;

    // shortest text that reads back as the same double
    inline std::string format_real(double value) {
        char buf[32];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        if (ec != std::errc()) {
            throw InternalError("Unable to format real value");
        }
        return std::string(buf, end);
    }

    /**
     * format_timestamp - renders `YYYY-MM-DD HH:MM:SS`, with a six digit
     *                    fraction appended only when there are microseconds
     */
    inline std::string format_timestamp(const Timestamp& ts) {
        using namespace std::chrono;
        auto secs = floor<seconds>(ts);
        auto usec = duration_cast<microseconds>(ts - secs).count();
        std::time_t tt = secs.time_since_epoch().count();
        std::tm tm{};
        gmtime_r(&tt, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (usec > 0) {
            ss << '.' << std::setw(6) << std::setfill('0') << usec;
        }
        return ss.str();
    }

    inline Timestamp parse_timestamp(std::string_view text) {
        using namespace std::chrono;
        std::tm tm{};
        std::istringstream ss{std::string(text)};
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (ss.fail()) {
            // plain dates are accepted too
            ss.clear();
            ss.str(std::string(text));
            tm = std::tm{};
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw InternalError("Unable to parse timestamp: " + std::string(text));
            }
        }

        long usec = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string digits;
            while (digits.size() < 6 && std::isdigit(ss.peek())) {
                digits.push_back(static_cast<char>(ss.get()));
            }
            digits.resize(6, '0');
            usec = std::stol(digits);
        }

        auto tt = timegm(&tm);
        return time_point_cast<microseconds>(system_clock::from_time_t(tt)) + microseconds(usec);
    }

    class Value {
        private:
        using variant_t = std::variant<std::monostate, bool, int64_t, double, std::string, Blob, Timestamp>;
        variant_t _value;

        public:
        Value() = default;
        Value(std::nullptr_t) {}

        template <typename B>
        requires (std::same_as<B, bool>)
        Value(B b) : _value{b} {}

        template <std::integral I>
        requires (not std::same_as<I, bool>)
        Value(I i) : _value{static_cast<int64_t>(i)} {}

        template <std::floating_point F>
        Value(F f) : _value{static_cast<double>(f)} {}

        Value(const char* s) : _value{std::string(s)} {}
        Value(std::string s) : _value{std::move(s)} {}
        Value(std::string_view s) : _value{std::string(s)} {}
        Value(Blob b) : _value{std::move(b)} {}
        Value(Timestamp t) : _value{t} {}

        value_kind kind() const {
            return static_cast<value_kind>(_value.index());
        }

        bool is_nil() const {
            return std::holds_alternative<std::monostate>(_value);
        }

        template <ValueType T>
        bool holds() const {
            return std::holds_alternative<T>(_value);
        }

        template <ValueType T>
        const T& get() const {
            if (!holds<T>()) {
                std::ostringstream ss;
                ss << "Value holds " << value_kind_str(kind())
                    << ", expected " << value_kind_str(value_kind_of<T>::value);
                throw InternalError(ss.str());
            }
            return std::get<T>(_value);
        }

        template <typename Visitor>
        decltype(auto) visit(Visitor&& v) const {
            return std::visit(std::forward<Visitor>(v), _value);
        }

        bool operator==(const Value& other) const = default;

        std::string to_string() const {
            std::ostringstream ss;
            ss << *this;
            return ss.str();
        }

        friend std::ostream & operator<< (std::ostream &out, const Value& v) {
            v.visit([&]<typename T>(const T& value) {
                if constexpr (std::is_same_v<T, std::monostate>) {
                    out << "nil";
                } else if constexpr (std::is_same_v<T, bool>) {
                    out << (value ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    out << '"' << value << '"';
                } else if constexpr (std::is_same_v<T, Blob>) {
                    out << "<blob " << value.size() << " bytes>";
                } else if constexpr (std::is_same_v<T, Timestamp>) {
                    out << format_timestamp(value);
                } else if constexpr (std::is_same_v<T, double>) {
                    out << format_real(value);
                } else {
                    out << value;
                }
            });
            return out;
        }
    };
};
