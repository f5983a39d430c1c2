// =============================================================================
// mirrorhub - Socket Stream
// =============================================================================
// ByteStream over a connected stream socket fd (TCP to an adb forward, or a
// socketpair end in tests). Timeouts are poll()-based.
// =============================================================================
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "device_transport.hpp"

namespace mirrorhub {

class SocketStream : public ByteStream {
public:
    // Takes ownership of fd
    explicit SocketStream(int fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    Result<size_t> read(uint8_t* buf, size_t len, int timeout_ms) override;
    Result<void> writeAll(const uint8_t* data, size_t len, int timeout_ms) override;
    void interrupt() override;
    void close() override;
    bool isOpen() const override { return fd_.load() >= 0; }

    int fd() const { return fd_.load(); }

private:
    std::atomic<int> fd_;
};

// Connects to host:port with a bounded timeout (non-blocking connect + poll).
// Errors: Timeout, Disconnected (refused), IoError.
Result<std::unique_ptr<SocketStream>> connectTcp(const std::string& host, int port,
                                                 int timeout_ms);

} // namespace mirrorhub
