/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once
#include <sqlite3.h>

namespace datamap {

    enum class sqlite_column_type {
        INTEGER = SQLITE_INTEGER,
        TEXT = SQLITE_TEXT,
        BLOB = SQLITE_BLOB,
        REAL = SQLITE_FLOAT,
    };

    enum class order_t {
        ASC,
        DESC,
    };

    // read/write visibility of a generated accessor
    enum class access_t {
        public_access,
        protected_access,
        private_access,
    };

};
