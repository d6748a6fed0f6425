/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#include "HexiLink.h"

#include <chrono>

#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "hexilink";
}

HexiLink::HexiLink(SerialChannel& channel, const LinkConfig& config)
    : _config(config),
      _transport(channel, config.rx_confirmation_enabled, config.loop_backoff_ms),
      _sender(_transport, config.retransmit_count, config.retransmit_timeout_ms),
      _state(),
      _dispatcher(_state, *this, config.tx_confirmation_enabled),
      _running(false) {}

HexiLink::~HexiLink() {
  end();
}

LinkError HexiLink::begin() {
  if (_running) {
    return LinkError::NONE;
  }

  _outbound.reopen();
  _transport.begin();
  _running = true;
  _writer_thread = std::thread(&HexiLink::_writerLoop, this);
  _dispatch_thread = std::thread(&HexiLink::_dispatchLoop, this);
  HEXILINK_LOGI(TAG, "link started (retries=%u, timeout=%lu ms)",
                static_cast<unsigned>(_config.retransmit_count), _config.retransmit_timeout_ms);

  if (_config.query_state_on_begin) {
    const LinkError err = send_startup_queries(*this);
    if (err != LinkError::NONE) {
      HEXILINK_LOGE(TAG, "state queries not queued: %s", link_error_name(err));
      return err;
    }
  }
  return LinkError::NONE;
}

void HexiLink::end() {
  if (!_running.exchange(false)) {
    return;
  }
  _outbound.close();
  _transport.end();
  if (_writer_thread.joinable()) {
    _writer_thread.join();
  }
  if (_dispatch_thread.joinable()) {
    _dispatch_thread.join();
  }
  HEXILINK_LOGI(TAG, "link stopped");
}

LinkError HexiLink::submit(const ghi::RawFrame& raw) {
  if (!_running) {
    return LinkError::NOT_STARTED;
  }
  if (!_outbound.push(raw)) {
    return LinkError::QUEUE_CLOSED;
  }
  return LinkError::NONE;
}

void HexiLink::_backoff() {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(_config.loop_backoff_ms);
  while (_running && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void HexiLink::_writerLoop() {
  ghi::RawFrame raw;
  while (_running && _outbound.pop(raw)) {
    const SendResult result = _sender.send(raw);
    if (result == SendResult::WRITE_FAILED) {
      HEXILINK_LOGE(TAG, "frame write failed, backing off %lu ms", _config.loop_backoff_ms);
      _backoff();
    }
  }
}

void HexiLink::_dispatchLoop() {
  ghi::Frame frame;
  while (_transport.receive(frame)) {
    _dispatcher.dispatch(frame);
  }
}

}  // namespace hexilink
