#ifndef SERIAL_CHANNEL_H
#define SERIAL_CHANNEL_H

#include <stddef.h>
#include <stdint.h>

#include <etl/span.h>

namespace hexilink {

// Byte stream to the coprocessor. The reader loop is the only caller of
// readExact(); write() is serialized by LinkTransport.
class SerialChannel {
public:
    virtual ~SerialChannel() {}

    // Blocks until buffer is completely filled. Returns false on an I/O
    // error or when interrupted.
    virtual bool readExact(etl::span<uint8_t> buffer) = 0;

    // Writes all bytes. Returns false on an I/O error.
    virtual bool write(etl::span<const uint8_t> data) = 0;

    // Releases a blocked readExact(). Subsequent reads fail until resume().
    virtual void interrupt() = 0;

    // Clears a previous interrupt() so reads block again.
    virtual void resume() = 0;

    virtual bool isOpen() const = 0;
};

} // namespace hexilink

#endif // SERIAL_CHANNEL_H
