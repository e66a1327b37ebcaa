#pragma once

namespace grid {

// Anything the shutdown path can ask to wind down. Implementations with
// nothing to release still provide a no-op.
class Stoppable {
public:
    virtual ~Stoppable() = default;
    virtual void stop() = 0;
};

} // namespace grid
