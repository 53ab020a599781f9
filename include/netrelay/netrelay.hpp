#pragma once

// Netrelay - relay standard input/output to a single network peer
// Two transport families: Stream (TCP, byte passthrough)
//                         Datagram (UDP, one read = one datagram, peer learned in listen mode)

// Core types and utilities
#include <netrelay/common.hpp>
#include <netrelay/endpoint.hpp>
#include <netrelay/io.hpp>
#include <netrelay/progress.hpp>

// Base classes
#include <netrelay/datagram.hpp>
#include <netrelay/stream.hpp>

// Transport implementations
#include <netrelay/datagram/udp.hpp>
#include <netrelay/stream/tcp.hpp>

// Transfer engines
#include <netrelay/session.hpp>
#include <netrelay/session/datagram.hpp>
#include <netrelay/session/stream.hpp>

// Configuration and setup
#include <netrelay/options.hpp>
#include <netrelay/relay.hpp>

// All types are in the netrelay:: namespace
// Available types:
//   - netrelay::Message (dp::Vector<dp::u8>)
//   - netrelay::TcpEndpoint, UdpEndpoint
//   - netrelay::Reader, Writer, FdReader, FdWriter
//   - netrelay::Stream (base class), TcpStream
//   - netrelay::Datagram (base class), UdpDatagram
//   - netrelay::run_stream_session, run_datagram_session
//   - netrelay::Options, Config, relay
