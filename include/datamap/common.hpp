/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <sqlite3.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <vector>
#include "datamap/logger.hpp"
#include "datamap/error.hpp"

namespace datamap {
    template <typename T, typename... Alternatives>
    static constexpr bool is_one_of = (std::is_same_v<T, Alternatives> || ...);

    // joins the elements of a range, rendering each one with `f`
    template <typename Range, typename F>
    std::string join(const Range& range, std::string_view delim, F&& f) {
        std::ostringstream ss;
        bool first = true;
        for (const auto& item : range) {
            if (!first) ss << delim;
            first = false;
            ss << f(item);
        }
        return ss.str();
    }

    template <typename Range>
    std::string join(const Range& range, std::string_view delim) {
        return join(range, delim, [](const auto& s) -> const auto& { return s; });
    }
};
