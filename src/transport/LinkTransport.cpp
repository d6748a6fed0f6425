#include "LinkTransport.h"

#include <chrono>

#include <etl/array.h>

#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "link";
}

LinkTransport::LinkTransport(SerialChannel& channel,
                             bool rx_confirmation_enabled,
                             unsigned long backoff_ms)
    : _channel(channel),
      _rx_confirmation_enabled(rx_confirmation_enabled),
      _backoff_ms(backoff_ms),
      _running(false),
      _frames_received(0),
      _framing_errors(0),
      _io_errors(0),
      _frames_written(0) {}

LinkTransport::~LinkTransport() {
    end();
}

void LinkTransport::begin() {
    if (_running) {
        return;
    }
    _parser.reset();
    _parser.clearError();
    _inbound.reopen();
    _channel.resume();
    _running = true;
    _reader = std::thread(&LinkTransport::_readerLoop, this);
}

void LinkTransport::end() {
    if (!_running.exchange(false)) {
        return;
    }
    _channel.interrupt();
    _inbound.close();
    if (_reader.joinable()) {
        _reader.join();
    }
}

bool LinkTransport::writeFrame(etl::span<const uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(_write_mutex);
#if HEXILINK_DEBUG_FRAMES
    log::hexdump(TAG, "tx", bytes.data(), bytes.size());
#endif
    if (!_channel.write(bytes)) {
        ++_io_errors;
        return false;
    }
    ++_frames_written;
    return true;
}

TransportStats LinkTransport::stats() const {
    TransportStats s;
    s.frames_received = _frames_received;
    s.framing_errors = _framing_errors;
    s.io_errors = _io_errors;
    s.frames_written = _frames_written;
    return s;
}

bool LinkTransport::_readFrame(ghi::Frame& out) {
    etl::array<uint8_t, ghi::MAX_FRAME_SIZE> chunk;
    for (;;) {
        // Header first, then exactly length + 1 body bytes.
        const size_t needed = _parser.bytesNeeded();
        if (!_channel.readExact(etl::span<uint8_t>(chunk.data(), needed))) {
            return false;
        }

        bool complete = false;
        for (size_t i = 0; i < needed; ++i) {
            if (_parser.consume(chunk[i], out)) {
                complete = true;
            }
            auto error = _parser.getError();
            if (error.has_value()) {
                ++_framing_errors;
                HEXILINK_LOGW(TAG, "framing error: %s", ghi::frame_error_name(*error));
                _parser.clearError();
            }
        }
        if (complete) {
            return true;
        }
    }
}

void LinkTransport::_onFrame(const ghi::Frame& frame) {
    ++_frames_received;
#if HEXILINK_DEBUG_FRAMES
    const ghi::RawFrame raw = ghi::serialize(frame);
    log::hexdump(TAG, "rx", raw.data(), raw.size());
#endif
    HEXILINK_LOGD(TAG, "rx %s len=%u flags=0x%02x",
                  ghi::packet_type_name(frame.type()),
                  static_cast<unsigned>(frame.length()),
                  static_cast<unsigned>(frame.header.start2 & ghi::FLAGS_MASK));

    if (_rx_confirmation_enabled || frame.type() == ghi::PacketType::PT_OK) {
        _confirm.set();
    }
    if (!_inbound.push(frame)) {
        HEXILINK_LOGD(TAG, "inbound queue closed, frame dropped");
    }
}

void LinkTransport::_backoff() {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_backoff_ms);
    while (_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void LinkTransport::_readerLoop() {
    HEXILINK_LOGI(TAG, "reader started");
    ghi::Frame frame;
    while (_running) {
        if (!_readFrame(frame)) {
            if (!_running) {
                break;
            }
            ++_io_errors;
            HEXILINK_LOGE(TAG, "read failed, retrying in %lu ms", _backoff_ms);
            _parser.reset();
            _backoff();
            continue;
        }
        _onFrame(frame);
    }
    HEXILINK_LOGI(TAG, "reader stopped");
}

} // namespace hexilink
