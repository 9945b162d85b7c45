/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/sstring.hh>
#include "seastarx.hh"
#include "log.hh"

extern logger startlog;

class supervisor {
public:
    static constexpr auto systemd_ready_msg = "READY=1";
    /** A systemd status message has a format <status message prefix>=<message> */
    static constexpr auto systemd_status_msg_prefix = "STATUS";
public:
    /**
     * @brief Notify the Supervisor with the given message.
     * @param msg message to notify the Supervisor with
     * @param ready set to TRUE when the node starts serving
     */
    static void notify(sstring msg, bool ready = false);

private:
    static void try_notify_systemd(const sstring& msg, bool ready);
};
