/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "supervisor.hh"
#include <seastar/core/format.hh>
#include <systemd/sd-daemon.h>

void supervisor::notify(sstring msg, bool ready) {
    startlog.info("{}", msg);
    try_notify_systemd(msg, ready);
}

void supervisor::try_notify_systemd(const sstring& msg, bool ready) {
    int r;
    if (ready) {
        r = sd_notify(0, format("{}\n{}={}\n", systemd_ready_msg, systemd_status_msg_prefix, msg).c_str());
    } else {
        r = sd_notify(0, format("{}={}\n", systemd_status_msg_prefix, msg).c_str());
    }
    if (r < 0) {
        startlog.debug("sd_notify failed: {}", std::system_error(-r, std::system_category()).what());
    }
}
