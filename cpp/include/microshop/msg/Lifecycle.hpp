/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

namespace microshop::msg {

/**
 * Lifecycle signals.
 *
 * They travel through the same mailbox as user messages. Started is delivered
 * once, before any user message. Stopping and Stopped are delivered once each,
 * in that order, after the actor has been asked to stop.
 */
struct Started {};
struct Stopping {};
struct Stopped {};

} // namespace microshop::msg
