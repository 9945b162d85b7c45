/*
 * Copyright (C) 2015-present ScyllaDB
 *
 * Modified by ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <functional>
#include <string>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include "utils/atomic_vector.hh"

#include "seastarx.hh"

namespace service {

class migration_listener {
public:
    virtual ~migration_listener()
    {}

    // The callback runs inside seastar thread
    virtual void on_create_keyspace(const sstring& ks_name) = 0;
    virtual void on_create_column_family(const sstring& ks_name, const sstring& cf_name) = 0;
    virtual void on_create_user_type(const sstring& ks_name, const sstring& type_name) = 0;

    // The callback runs inside seastar thread
    virtual void on_update_keyspace(const sstring& ks_name) = 0;
    virtual void on_update_column_family(const sstring& ks_name, const sstring& cf_name) = 0;
    virtual void on_update_user_type(const sstring& ks_name, const sstring& type_name) = 0;

    // The callback runs inside seastar thread
    virtual void on_drop_keyspace(const sstring& ks_name) = 0;
    virtual void on_drop_column_family(const sstring& ks_name, const sstring& cf_name) = 0;
    virtual void on_drop_user_type(const sstring& ks_name, const sstring& type_name) = 0;

    class empty_listener;
};

class migration_listener::empty_listener : public migration_listener {
public:
    void on_create_keyspace(const sstring& ks_name) override {}
    void on_create_column_family(const sstring& ks_name, const sstring& cf_name) override {}
    void on_create_user_type(const sstring& ks_name, const sstring& type_name) override {}

    void on_update_keyspace(const sstring& ks_name) override {}
    void on_update_column_family(const sstring& ks_name, const sstring& cf_name) override {}
    void on_update_user_type(const sstring& ks_name, const sstring& type_name) override {}

    void on_drop_keyspace(const sstring& ks_name) override {}
    void on_drop_column_family(const sstring& ks_name, const sstring& cf_name) override {}
    void on_drop_user_type(const sstring& ks_name, const sstring& type_name) override {}
};

// Listeners are notified in registration order. A listener registered
// or unregistered while a notification is being delivered does not take
// part in it.
class migration_notifier {
private:
    atomic_vector<migration_listener*> _listeners;

    future<> on_schema_change(std::function<void(migration_listener*)> notify, std::function<std::string(std::exception_ptr)> describe_error);
public:
    /// Register a migration listener.
    void register_listener(migration_listener* listener);

    /// Unregister a migration listener. Waits for notifications in progress.
    future<> unregister_listener(migration_listener* listener);

    future<> create_keyspace(const sstring& ks_name);
    future<> create_column_family(const sstring& ks_name, const sstring& cf_name);
    future<> create_user_type(const sstring& ks_name, const sstring& type_name);
    future<> update_keyspace(const sstring& ks_name);
    future<> update_column_family(const sstring& ks_name, const sstring& cf_name);
    future<> update_user_type(const sstring& ks_name, const sstring& type_name);
    future<> drop_keyspace(const sstring& ks_name);
    future<> drop_column_family(const sstring& ks_name, const sstring& cf_name);
    future<> drop_user_type(const sstring& ks_name, const sstring& type_name);
};

}
