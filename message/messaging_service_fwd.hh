/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

namespace gms { class inet_address; }

namespace netw {

struct msg_addr;
enum class messaging_verb;
class messaging_service;
class schema_rpc;

}
