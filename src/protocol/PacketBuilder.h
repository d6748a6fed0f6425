#ifndef PACKET_BUILDER_H
#define PACKET_BUILDER_H

#include <etl/algorithm.h>
#include <etl/array.h>
#include <etl/span.h>
#include <etl/vector.h>

#include "ghi_frame.h"

namespace hexilink {
namespace ghi {

/**
 * @brief Fluent builder for GHI payloads.
 * Writes past the capacity of the target vector are dropped and flagged by
 * overflowed().
 */
class PacketBuilder {
public:
    explicit PacketBuilder(etl::ivector<uint8_t>& payload)
        : _payload(payload), _overflow(false) {
        _payload.clear();
    }

    PacketBuilder& add(uint8_t byte) {
        if (_payload.full()) {
            _overflow = true;
        } else {
            _payload.push_back(byte);
        }
        return *this;
    }

    PacketBuilder& add(const uint8_t* data, size_t len) {
        const size_t available = _payload.capacity() - _payload.size();
        const size_t to_copy = etl::min(len, available);
        if (to_copy < len) {
            _overflow = true;
        }
        if (to_copy > 0) {
            _payload.insert(_payload.end(), data, data + to_copy);
        }
        return *this;
    }

    PacketBuilder& add_u16(uint16_t value) {
        uint8_t buf[2];
        write_u16_be(buf, value);
        return add(buf, 2);
    }

    // Three 16-bit axis values, x first.
    PacketBuilder& add_axes(const etl::array<uint16_t, 3>& axes) {
        for (size_t i = 0; i < axes.size(); ++i) {
            add_u16(axes[i]);
        }
        return *this;
    }

    size_t size() const { return _payload.size(); }
    const uint8_t* data() const { return _payload.data(); }
    bool overflowed() const { return _overflow; }

    etl::span<const uint8_t> view() const {
        return etl::span<const uint8_t>(_payload.data(), _payload.size());
    }

private:
    etl::ivector<uint8_t>& _payload;
    bool _overflow;
};

using Payload = etl::vector<uint8_t, MAX_PAYLOAD_SIZE>;

} // namespace ghi
} // namespace hexilink

#endif // PACKET_BUILDER_H
