/// @file canvas_sync.hpp
/// @brief Umbrella header for the canvas-sync library.
///
/// Include this single header for access to all public client types:
/// Engine, EngineConfig, the event payloads, WebSocketTransport and the
/// lower-level clock, operation, document and protocol types.

#pragma once

#include <canvas-sync/clock.hpp>
#include <canvas-sync/config.hpp>
#include <canvas-sync/document_state.hpp>
#include <canvas-sync/engine.hpp>
#include <canvas-sync/error.hpp>
#include <canvas-sync/events.hpp>
#include <canvas-sync/integrator.hpp>
#include <canvas-sync/log.hpp>
#include <canvas-sync/operation.hpp>
#include <canvas-sync/presence.hpp>
#include <canvas-sync/protocol.hpp>
#include <canvas-sync/session.hpp>
#include <canvas-sync/transport.hpp>
#include <canvas-sync/url.hpp>
#include <canvas-sync/websocket_transport.hpp>
