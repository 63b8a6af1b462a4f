#pragma once

#include <cstddef>
#include <cstdint>

namespace dirpost {

/**
 * @brief Bidirectional byte stream a session runs over
 *
 * Implementations report failures by throwing TransportError.
 */
class Channel {
public:
    virtual ~Channel() = default;

    /**
     * @brief Read up to `length` bytes, blocking until at least one is available
     * @return Bytes read, 0 once the peer has closed its write side
     */
    virtual size_t read(uint8_t* buffer, size_t length) = 0;

    /**
     * @brief Write all `length` bytes
     */
    virtual void write(const uint8_t* data, size_t length) = 0;

    /**
     * @brief Signal end of stream to the peer; reading stays possible
     */
    virtual void shutdown_write() = 0;

    /**
     * @brief Release the channel. Idempotent.
     */
    virtual void close() = 0;
};

} // namespace dirpost
