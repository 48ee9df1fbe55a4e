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
#include <jau/basic_algos.hpp>

#include "NotificationRouter.hpp"

using namespace gattlink;

NotificationRouter::charListenerList_t::equal_comparator NotificationRouter::charListenerRefEqComparator =
        [](const CharListenerPair& a, const CharListenerPair& b) -> bool { return a.uuid_key == b.uuid_key && *a.listener == *b.listener; };

NotificationRouter::charListenerList_t::equal_comparator NotificationRouter::charListenerUUIDEqComparator =
        [](const CharListenerPair& a, const CharListenerPair& b) -> bool { return a.uuid_key == b.uuid_key; };

NotificationRouter::NotificationRouter() noexcept
: env(GattEnv::get()), sink(nullptr), charListenerList()
{ }

void NotificationRouter::setSink(const GattCharListenerRef& l) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    sink = l;
}

void NotificationRouter::clearSink() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    sink = nullptr;
}

bool NotificationRouter::hasSink() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
    return nullptr != sink;
}

bool NotificationRouter::addCharListener(const std::string& uuid_key, const GattCharListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("GattCharListener ref is null");
        return false;
    }
    return charListenerList.push_back_unique(CharListenerPair{l, uuid_key}, charListenerRefEqComparator);
}

bool NotificationRouter::removeCharListener(const std::string& uuid_key, const GattCharListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("GattCharListener ref is null");
        return false;
    }
    const size_type count = charListenerList.erase_matching(CharListenerPair{l, uuid_key},
                                                            false /* all_matching */,
                                                            charListenerRefEqComparator);
    return count > 0;
}

NotificationRouter::size_type NotificationRouter::removeAllCharListener(const std::string& uuid_key) noexcept {
    return charListenerList.erase_matching(CharListenerPair{nullptr, uuid_key},
                                           true /* all_matching */,
                                           charListenerUUIDEqComparator);
}

NotificationRouter::size_type NotificationRouter::clearCharListener() noexcept {
    const size_type count = charListenerList.size();
    charListenerList.clear();
    return count;
}

NotificationRouter::size_type NotificationRouter::dispatch(const GattCharRef& characteristic, const jau::TROOctets& value, const uint64_t timestamp) noexcept {
    if( nullptr == characteristic ) {
        ERR_PRINT("GattChar ref is null");
        return 0;
    }
    GattCharListenerRef l;
    {
        const std::lock_guard<std::mutex> lock(mtx_sink); // RAII-style acquire and relinquish via destructor
        l = sink;
    }
    COND_PRINT(env.DEBUG_EVENT, "NotificationRouter::dispatch: %s, sink %d, listener %zu",
            characteristic->toString().c_str(), nullptr != l, (size_t)charListenerList.size());
    size_type count = 0;
    if( nullptr != l ) {
        try {
            l->notificationReceived(characteristic, value, timestamp);
            ++count;
        } catch (std::exception &e) {
            ERR_PRINT("NotificationRouter::dispatch: Sink %s: Caught exception %s",
                    l->toString().c_str(), e.what());
        }
    }
    int i=0;
    jau::for_each_fidelity(charListenerList, [&](CharListenerPair &p) {
        try {
            if( p.match(*characteristic) ) {
                p.listener->notificationReceived(characteristic, value, timestamp);
                ++count;
            }
        } catch (std::exception &e) {
            ERR_PRINT("NotificationRouter::dispatch %d/%zu: GattCharListener %s: Caught exception %s",
                    i+1, (size_t)charListenerList.size(),
                    jau::to_hexstring((void*)p.listener.get()).c_str(), e.what());
        }
        i++;
    });
    return count;
}
