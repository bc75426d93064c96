#ifndef SRC_PACKET_P_ALL_H_
#define SRC_PACKET_P_ALL_H_

#include "packet/p_base.h"
#include "packet/p_chat.h"
#include "packet/p_error.h"
#include "packet/p_in.h"
#include "packet/p_join.h"
#include "packet/p_state.h"

#endif  // SRC_PACKET_P_ALL_H_
