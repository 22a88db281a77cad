#pragma once

/// @file lifecycle.hpp
/// Optional capabilities a service may implement to take part in
/// registry teardown.  On close a registry calls close() on every value it
/// holds that is closeable; values that are only stoppable get stop().

namespace svcreg {

class closeable {
public:
    virtual ~closeable() = default;
    virtual void close() = 0;
};

class stoppable {
public:
    virtual ~stoppable() = default;
    virtual void stop() = 0;
};

} // namespace svcreg
