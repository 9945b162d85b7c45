/*
 * Copyright (C) 2019-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "utils/UUID.hh"

// Content based version of the whole set of schema definitions a node
// holds. Only compared for equality.
using table_schema_version = utils::UUID;
