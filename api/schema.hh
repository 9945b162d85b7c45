/*
 * Copyright (C) 2023-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "api/api_init.hh"

namespace service {
class migration_manager;
}

namespace api {

void set_schema(http_context& ctx, httpd::routes& r, service::migration_manager& mm);
void unset_schema(http_context& ctx, httpd::routes& r);

}
