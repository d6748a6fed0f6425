/**
 * @file link_fsm.h
 * @brief ETL state machine tracking delivery confirmation of outbound frames.
 *
 * States:
 *   - Idle (0): no confirmable frame outstanding.
 *   - AwaitingConfirm (1): a confirmable frame was written and no frame has
 *     yet been accepted as its confirmation.
 *
 * Events:
 *   - EvSendConfirmable: confirmable frame written -> AwaitingConfirm
 *   - EvConfirmed: confirmation observed -> Idle
 *   - EvRetriesExhausted: attempts used up -> Idle
 *   - EvReset: sender stopped -> Idle
 */
#ifndef LINK_FSM_H
#define LINK_FSM_H

#include "etl/fsm.h"
#include "etl/message.h"

namespace hexilink {
namespace fsm {

class LinkFsm;

enum StateId : etl::fsm_state_id_t {
  STATE_IDLE = 0,
  STATE_AWAITING_CONFIRM = 1,
  NUMBER_OF_STATES = 2
};

enum EventId : etl::message_id_t {
  EVENT_SEND_CONFIRMABLE = 0,
  EVENT_CONFIRMED = 1,
  EVENT_RETRIES_EXHAUSTED = 2,
  EVENT_RESET = 3
};

struct EvSendConfirmable : public etl::message<EVENT_SEND_CONFIRMABLE> {};
struct EvConfirmed : public etl::message<EVENT_CONFIRMED> {};
struct EvRetriesExhausted : public etl::message<EVENT_RETRIES_EXHAUSTED> {};
struct EvReset : public etl::message<EVENT_RESET> {};

class StateIdle : public etl::fsm_state<LinkFsm, StateIdle, STATE_IDLE,
                                        EvSendConfirmable, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event(const EvSendConfirmable&) {
    return STATE_AWAITING_CONFIRM;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateAwaitingConfirm : public etl::fsm_state<LinkFsm, StateAwaitingConfirm, STATE_AWAITING_CONFIRM,
                                                   EvConfirmed, EvRetriesExhausted, EvSendConfirmable, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_AWAITING_CONFIRM;
  }

  etl::fsm_state_id_t on_event(const EvConfirmed&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event(const EvRetriesExhausted&) {
    return STATE_IDLE;
  }

  // Retransmission of the same frame.
  etl::fsm_state_id_t on_event(const EvSendConfirmable&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class LinkFsm : public etl::fsm
{
public:
  LinkFsm()
    : etl::fsm(NUMBER_OF_STATES)
    , state_list_{}
  {
  }

  void begin() {
    state_list_[STATE_IDLE] = &state_idle_;
    state_list_[STATE_AWAITING_CONFIRM] = &state_awaiting_confirm_;

    set_states(state_list_, NUMBER_OF_STATES);
    start();
  }

  bool isIdle() const { return get_state_id() == STATE_IDLE; }
  bool isAwaitingConfirm() const { return get_state_id() == STATE_AWAITING_CONFIRM; }

  void sendConfirmable() { receive(EvSendConfirmable()); }
  void confirmed() { receive(EvConfirmed()); }
  void retriesExhausted() { receive(EvRetriesExhausted()); }
  void resetFsm() { receive(EvReset()); }

private:
  // set_states() binds each state to this machine, so every machine owns its own.
  StateIdle state_idle_;
  StateAwaitingConfirm state_awaiting_confirm_;
  etl::ifsm_state* state_list_[NUMBER_OF_STATES];
};

}  // namespace fsm
}  // namespace hexilink

#endif  // LINK_FSM_H
