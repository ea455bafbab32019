#pragma once

#include "client.hpp"
#include "config.hpp"
#include "device_identity.hpp"
#include "dispatcher.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "handshake.hpp"
#include "log.hpp"
#include "observable.hpp"
#include "pending_table.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "supervisor.hpp"
#include "transport.hpp"
#include "worker.hpp"
