#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "cyphal/core/config.hpp"
#include "cyphal/core/constants.hpp"
#include "cyphal/core/error.hpp"
#include "cyphal/core/frame.hpp"
#include "cyphal/core/identifier.hpp"
#include "cyphal/core/transfer.hpp"
#include "cyphal/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "cyphal/util/bitfield.hpp"
#include "cyphal/util/crc.hpp"
#include "cyphal/util/data_span.hpp"
#include "cyphal/util/event.hpp"

// ─── Transport ───────────────────────────────────────────────────────────────
#include "cyphal/transport/codec.hpp"
#include "cyphal/transport/fragmentation.hpp"
#include "cyphal/transport/reassembly.hpp"
#include "cyphal/transport/session.hpp"
#include "cyphal/transport/tx_queue.hpp"

// ─── Network ─────────────────────────────────────────────────────────────────
#include "cyphal/network/link.hpp"
#include "cyphal/network/node.hpp"
