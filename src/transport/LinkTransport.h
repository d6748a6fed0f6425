#ifndef LINK_TRANSPORT_H
#define LINK_TRANSPORT_H

#include <stdint.h>

#include <atomic>
#include <mutex>
#include <thread>

#include <etl/span.h>

#include "config/hexilink_config.h"
#include "protocol/ghi_frame.h"
#include "reliability/ConfirmSignal.h"
#include "FrameQueue.h"
#include "SerialChannel.h"

namespace hexilink {

struct TransportStats {
    uint32_t frames_received;
    uint32_t framing_errors;
    uint32_t io_errors;
    uint32_t frames_written;
};

// Owns the wire: a reader thread turning bytes into frames on the inbound
// queue, and a serialized writer for outgoing frame bytes.
class LinkTransport {
public:
    using InboundQueue = FrameQueue<ghi::Frame, HEXILINK_RX_QUEUE_DEPTH>;

    LinkTransport(SerialChannel& channel,
                  bool rx_confirmation_enabled = HEXILINK_RX_CONFIRMATION_ENABLE != 0,
                  unsigned long backoff_ms = HEXILINK_LOOP_BACKOFF_MS);
    ~LinkTransport();

    LinkTransport(const LinkTransport&) = delete;
    LinkTransport& operator=(const LinkTransport&) = delete;

    void begin();
    void end();
    bool isRunning() const { return _running; }

    // Writes one frame; bytes of two frames never interleave.
    bool writeFrame(etl::span<const uint8_t> bytes);

    // Blocks until an inbound frame is available. False once the transport
    // is stopped and the queue is drained.
    bool receive(ghi::Frame& out) { return _inbound.pop(out); }

    ConfirmSignal& confirmSignal() { return _confirm; }
    TransportStats stats() const;

 private:
    void _readerLoop();
    // Reads and parses one frame. False on an I/O error.
    bool _readFrame(ghi::Frame& out);
    void _onFrame(const ghi::Frame& frame);
    void _backoff();

    SerialChannel& _channel;
    const bool _rx_confirmation_enabled;
    const unsigned long _backoff_ms;

    ghi::FrameParser _parser;
    InboundQueue _inbound;
    ConfirmSignal _confirm;
    std::mutex _write_mutex;
    std::thread _reader;
    std::atomic<bool> _running;

    std::atomic<uint32_t> _frames_received;
    std::atomic<uint32_t> _framing_errors;
    std::atomic<uint32_t> _io_errors;
    std::atomic<uint32_t> _frames_written;
};

} // namespace hexilink

#endif // LINK_TRANSPORT_H
