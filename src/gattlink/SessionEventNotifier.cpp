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

#include <cstdint>
#include <string>
#include <memory>

#include <jau/debug.hpp>

#include "SessionEventNotifier.hpp"

using namespace gattlink;

std::string gattlink::to_string(const SessionEventType v) noexcept {
    switch(v) {
        case SessionEventType::CONNECTED: return "CONNECTED";
        case SessionEventType::DISCONNECTED: return "DISCONNECTED";
    }
    return "Unknown SessionEventType";
}

std::string SessionEvent::toString() const noexcept {
    return "SessionEvent["+to_string(type)+", "+address.toString()+", ts "+std::to_string(timestamp)+"]";
}

SessionEventNotifier::SessionEventNotifier() noexcept
: env(GattEnv::get()), sink(nullptr)
{ }

void SessionEventNotifier::setSink(const SessionEventListenerRef& l) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    sink = l;
}

void SessionEventNotifier::clearSink() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    sink = nullptr;
}

bool SessionEventNotifier::hasSink() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    return nullptr != sink;
}

bool SessionEventNotifier::send(const SessionEvent& e) noexcept {
    SessionEventListenerRef l;
    {
        const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
        l = sink;
    }
    if( nullptr == l ) {
        COND_PRINT(env.DEBUG_EVENT, "SessionEventNotifier: No sink, dropped %s", e.toString().c_str());
        return false;
    }
    COND_PRINT(env.DEBUG_EVENT, "SessionEventNotifier: Sending %s to %s", e.toString().c_str(), l->toString().c_str());
    try {
        l->sessionEvent(e);
    } catch (std::exception &except) {
        ERR_PRINT("SessionEventNotifier::send: %s of %s: Caught exception %s",
                l->toString().c_str(), e.toString().c_str(), except.what());
        return false;
    }
    return true;
}
