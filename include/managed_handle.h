#ifndef MANAGED_HANDLE_H
#define MANAGED_HANDLE_H

/**
 * Anything the ResourceLifecycle can tear down: sockets, HTTP clients, timers.
 *
 * forceClose() is the non-graceful path (no TCP FIN handshake, no pending
 * response drain). Implementations must make it idempotent and safe to call
 * from any thread while another thread is blocked on the handle.
 */
class ManagedHandle {
public:
    virtual ~ManagedHandle() = default;
    virtual void forceClose() = 0;
};

#endif // MANAGED_HANDLE_H
