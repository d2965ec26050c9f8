/*
* Copyright (c) 2023 Zach Gerstman
* https://github.com/crabmandable/zxorm
* This Source Code Form is subject to the terms of the Mozilla Public
* License, v. 2.0. If a copy of the MPL was not distributed with this
* file, You can obtain one at https://mozilla.org/MPL/2.0/.
*/
#pragma once

#include "common.hpp"
#include "value.hpp"
#include "orm/field_type.hpp"
#include "orm/model.hpp"
#include "orm/query.hpp"
#include "orm/resource.hpp"
#include "orm/repository.hpp"
#include "adapters/sql_adapter.hpp"
#include "adapters/sqlite_adapter.hpp"
