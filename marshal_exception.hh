/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/sstring.hh>

#include "seastarx.hh"

class marshal_exception : public std::exception {
    sstring _why;
public:
    marshal_exception() = delete;
    marshal_exception(sstring why) : _why(sstring("marshaling error: ") + why) {}
    virtual const char* what() const noexcept override { return _why.c_str(); }
};

// Thrown when a serialized schema batch cannot be trusted: its declared
// record count is negative or larger than the buffer could possibly hold,
// or a record runs past the end of the buffer.
class corrupt_stream_exception : public marshal_exception {
public:
    corrupt_stream_exception(sstring why) : marshal_exception(sstring("corrupt stream: ") + why) {}
};
