#pragma once

namespace keystone::di {

// Services holding external resources implement this; the owning container
// calls dispose() once when it is cleared, disposed or destroyed.
class IDisposable {
public:
    virtual ~IDisposable() = default;
    virtual void dispose() = 0;
};

} // namespace keystone::di
