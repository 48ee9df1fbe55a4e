/*
 * Copyright (c) 2026 The gattlink Authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef GATTLINK_HPP_
#define GATTLINK_HPP_

#include "GattTypes.hpp"
#include "GattEnv.hpp"
#include "GattDesc.hpp"
#include "GattChar.hpp"
#include "GattService.hpp"
#include "GattStack.hpp"
#include "SessionEventNotifier.hpp"
#include "NotificationRouter.hpp"
#include "GattSession.hpp"
#include "GattSessionRegistry.hpp"

/** \defgroup GattLinkAPI gattlink API
 *  Client side GATT session management on top of an asynchronous native GATT stack.
 *
 *  - GattSessionRegistry maps device addresses to GattSession
 *  - GattSession correlates requests with native stack callbacks
 *  - SessionEventNotifier and NotificationRouter deliver events outward
 *
 *  @{
 */

/**@}*/

#endif /* GATTLINK_HPP_ */
