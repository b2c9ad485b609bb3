// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/admission_gate.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "core/unrecoverable_error.hpp"
#include "network/acceptor.hpp"
#include "network/blocking_tcp_transport.hpp"
#include "network/endpoint.hpp"
#include "network/endpoint_config.hpp"
#include "network/endpoint_types.hpp"
#include "network/error_backoff.hpp"
#include "network/openssl_tls_context.hpp"
#include "network/processor_pool.hpp"
#include "network/socket_processor.hpp"
#include "network/tls_config_registry.hpp"
#include "network/transport.hpp"
#include "network/unlock_accept.hpp"
#include "network/worker_dispatcher.hpp"
#include "parsers/minimal_toml.hpp"
