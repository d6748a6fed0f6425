/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#ifndef HEXILINK_H
#define HEXILINK_H

#include <stdint.h>

#include <atomic>
#include <thread>

#include <etl/span.h>

#include "config/hexilink_config.h"
#include "protocol/ghi_frame.h"
#include "protocol/ghi_protocol.h"
#include "reliability/ReliableSender.h"
#include "services/DeviceState.h"
#include "services/Dispatcher.h"
#include "services/FrameSink.h"
#include "services/OutboundEncoder.h"
#include "transport/FrameQueue.h"
#include "transport/LinkTransport.h"
#include "transport/SerialChannel.h"

namespace hexilink {

// Runtime link tuning. Defaults come from config/hexilink_config.h.
struct LinkConfig {
  bool rx_confirmation_enabled = HEXILINK_RX_CONFIRMATION_ENABLE != 0;
  bool tx_confirmation_enabled = HEXILINK_TX_CONFIRMATION_ENABLE != 0;
  uint8_t retransmit_count = HEXILINK_RETRANSMIT_COUNT;
  unsigned long retransmit_timeout_ms = HEXILINK_RETRANSMIT_TIMEOUT_MS;
  unsigned long loop_backoff_ms = HEXILINK_LOOP_BACKOFF_MS;
  // Ask the coprocessor for touch group, advertising and link state on begin().
  bool query_state_on_begin = true;
};

// Host side of the KW40Z link. Owns three threads once started: the reader
// (inside LinkTransport), the dispatcher and the writer.
class HexiLink : public FrameSink {
 public:
  static constexpr size_t kTxQueueDepth = HEXILINK_TX_QUEUE_DEPTH;

  explicit HexiLink(SerialChannel& channel, const LinkConfig& config = LinkConfig());
  ~HexiLink() override;

  HexiLink(const HexiLink&) = delete;
  HexiLink& operator=(const HexiLink&) = delete;

  LinkError begin();
  void end();
  bool isRunning() const { return _running; }

  // Events
  void onButtonUp(EventCallback cb) { _dispatcher.onButtonUp(cb); }
  void onButtonDown(EventCallback cb) { _dispatcher.onButtonDown(cb); }
  void onButtonLeft(EventCallback cb) { _dispatcher.onButtonLeft(cb); }
  void onButtonRight(EventCallback cb) { _dispatcher.onButtonRight(cb); }
  void onSlide(EventCallback cb) { _dispatcher.onSlide(cb); }
  void onPasskey(PasskeyCallback cb) { _dispatcher.onPasskey(cb); }
  void onAlert(PayloadCallback cb) { _dispatcher.onAlert(cb); }
  void onNotification(PayloadCallback cb) { _dispatcher.onNotification(cb); }

  // Outbound
  LinkError pushSensorValues(const SensorValues& values) { return push_sensor_values(*this, values); }
  LinkError pushAppData(const AppData& data) { return push_app_data(*this, data); }
  LinkError sendAlert(etl::span<const uint8_t> data) { return send_alert(*this, data); }
  LinkError toggleAdvertising() { return toggle_advertising(*this); }
  LinkError toggleTouchGroup() { return toggle_touch_group(*this); }
  LinkError setAppMode(ghi::AppMode mode) { return set_app_mode(*this, mode); }

  // Device state as last reported by the coprocessor.
  LinkInfo queryLinkInfo() const { return _state.snapshot(); }
  uint32_t passkey() const { return _state.passcode(); }
  const DeviceState& deviceState() const { return _state; }

  bool isAwaitingConfirmation() const { return _sender.isAwaitingConfirmation(); }
  TransportStats transportStats() const { return _transport.stats(); }

  // FrameSink: queues a transmit-tagged frame for the writer thread.
  LinkError submit(const ghi::RawFrame& raw) override;

 private:
  using OutboundQueue = FrameQueue<ghi::RawFrame, kTxQueueDepth>;

  void _dispatchLoop();
  void _writerLoop();
  void _backoff();

  const LinkConfig _config;
  LinkTransport _transport;
  ReliableSender _sender;
  DeviceState _state;
  Dispatcher _dispatcher;
  OutboundQueue _outbound;

  std::thread _dispatch_thread;
  std::thread _writer_thread;
  std::atomic<bool> _running;
};

}  // namespace hexilink

#endif  // HEXILINK_H
