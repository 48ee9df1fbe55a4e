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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cinttypes>

#include <jau/debug.hpp>

#include "GattSession.hpp"

using namespace gattlink;

template<typename T>
static std::future<T> make_failed_future(const GattOpException& e) noexcept {
    std::promise<T> p;
    p.set_exception( std::make_exception_ptr(e) );
    return p.get_future();
}

template<typename T>
static void fail(const std::shared_ptr<std::promise<T>>& p, const GattOpException& e) noexcept {
    if( nullptr != p ) {
        p->set_exception( std::make_exception_ptr(e) );
    }
}

/** Removes the keyed entry if it still holds the given promise, returns true if removed. */
template<typename T>
static bool erase_pending(std::unordered_map<std::string, std::shared_ptr<std::promise<T>>>& map,
                          const std::string& key, const std::shared_ptr<std::promise<T>>& p) noexcept {
    auto it = map.find(key);
    if( map.end() != it && it->second == p ) {
        map.erase(it);
        return true;
    }
    return false;
}

/** Takes and removes the keyed entry, returns nullptr if none. */
template<typename T>
static std::shared_ptr<std::promise<T>> take_pending(std::unordered_map<std::string, std::shared_ptr<std::promise<T>>>& map,
                                                     const std::string& key) noexcept {
    std::shared_ptr<std::promise<T>> p;
    auto it = map.find(key);
    if( map.end() != it ) {
        p = std::move(it->second);
        map.erase(it);
    }
    return p;
}

class GattSession::StackCallback : public GattStackCallback {
    private:
        std::weak_ptr<GattSession> wbr_session;
        const uint64_t gen;

        GattSessionRef getSession() const noexcept {
            GattSessionRef s = wbr_session.lock();
            if( nullptr == s ) {
                DBG_PRINT("GattSession::StackCallback: Session already destructed, gen %" PRIu64, gen);
            }
            return s;
        }

    public:
        StackCallback(const GattSessionRef& session, const uint64_t gen_) noexcept
        : wbr_session(session), gen(gen_) {}

        void connectionStateChanged(const GattConnectionRef& conn, const GattStatus status, const bool connected) override {
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->connectionStateChanged(gen, conn, status, connected);
            } else if( nullptr != conn && connected ) {
                conn->disconnect();
                conn->close();
            }
        }
        void servicesDiscovered(const GattConnectionRef& conn, const GattStatus status,
                                const jau::darray<GattServiceRef>& services) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->servicesDiscovered(gen, status, services);
            }
        }
        void characteristicRead(const GattConnectionRef& conn, const uint16_t value_handle,
                                const GattStatus status, const jau::TROOctets& value) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->characteristicRead(gen, value_handle, status, value);
            }
        }
        void characteristicWritten(const GattConnectionRef& conn, const uint16_t value_handle, const GattStatus status) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->characteristicWritten(gen, value_handle, status);
            }
        }
        void descriptorWritten(const GattConnectionRef& conn, const uint16_t desc_handle, const GattStatus status) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->descriptorWritten(gen, desc_handle, status);
            }
        }
        void mtuChanged(const GattConnectionRef& conn, const uint16_t mtu, const GattStatus status) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->mtuChanged(gen, mtu, status);
            }
        }
        void characteristicChanged(const GattConnectionRef& conn, const uint16_t value_handle,
                                   const jau::TROOctets& value) override {
            (void)conn;
            GattSessionRef s = getSession();
            if( nullptr != s ) {
                s->characteristicChanged(gen, value_handle, value);
            }
        }
};

GattSession::size_type GattSession::PendingOps::size() const noexcept {
    size_type count = 0;
    if( nullptr != connect ) { ++count; }
    if( nullptr != discovery ) { ++count; }
    if( nullptr != mtu ) { ++count; }
    count += static_cast<size_type>( reads.size() + writes.size() + descOps.size() );
    return count;
}

void GattSession::PendingOps::failAll(const GattOpException& e) noexcept {
    fail(connect, e);
    connect = nullptr;
    fail(discovery, e);
    discovery = nullptr;
    fail(mtu, e);
    mtu = nullptr;
    for(auto & it : reads) {
        fail(it.second, e);
    }
    reads.clear();
    for(auto & it : writes) {
        fail(it.second, e);
    }
    writes.clear();
    for(auto & it : descOps) {
        fail(it.second.promise, e);
    }
    descOps.clear();
}

GattSession::GattSession(const GattSession::ctor_cookie& cc, const jau::EUI48& address_,
                         const GattStackRef& stack_, const SessionEventNotifierRef& notifier_) noexcept
: env(GattEnv::get()), address(address_), stack(stack_), notifier(notifier_), router(),
  state(ConnectionState::DISCONNECTED), connection_gen(0), gatt(nullptr), pendingConnection(nullptr),
  services(), charIndex(), mtu( static_cast<uint16_t>(env.DEFAULT_MTU) ), pending()
{
    (void)cc;
    DBG_PRINT("GattSession::ctor: %s", address.toString().c_str());
}

GattSession::~GattSession() noexcept {
    DBG_PRINT("GattSession::dtor: %s", toString().c_str());
    disconnectImpl(false /* sendEvent */);
}

ConnectionState GattSession::getConnectionState() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return state;
}

bool GattSession::isConnected() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return ConnectionState::CONNECTED == state && nullptr != gatt;
}

uint16_t GattSession::getMtu() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return mtu;
}

GattSession::size_type GattSession::getPendingCount() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return pending.size();
}

void GattSession::clearServices() noexcept {
    services.clear();
    charIndex.clear();
}

void GattSession::rebuildCharIndex() noexcept {
    charIndex.clear();
    for(const GattServiceRef& s : services) {
        if( nullptr == s ) {
            continue;
        }
        for(const GattCharRef& c : s->characteristicList) {
            if( nullptr == c ) {
                continue;
            }
            const std::string key = c->getUUIDKey();
            if( charIndex.end() != charIndex.find(key) ) {
                WARN_PRINT("GattSession: Duplicate characteristic uuid %s, using later %s", key.c_str(), c->toString().c_str());
            }
            charIndex[key] = c;
        }
    }
}

GattCharRef GattSession::findGattCharByValueHandle(const uint16_t value_handle) const noexcept {
    for(const GattServiceRef& s : services) {
        if( nullptr != s ) {
            GattCharRef c = s->findGattChar(value_handle);
            if( nullptr != c ) {
                return c;
            }
        }
    }
    return nullptr;
}

GattCharRef GattSession::findGattCharByDescHandle(const uint16_t desc_handle) const noexcept {
    for(const GattServiceRef& s : services) {
        if( nullptr != s ) {
            GattCharRef c = s->findGattCharByDescHandle(desc_handle);
            if( nullptr != c ) {
                return c;
            }
        }
    }
    return nullptr;
}

std::future<void> GattSession::connect() noexcept {
    PromiseRef<void> p = std::make_shared<std::promise<void>>();
    std::future<void> res = p->get_future();
    uint64_t gen;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::DISCONNECTED != state ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::ALREADY_CONNECTED, toString(), E_FILE_LINE) );
        }
        state = ConnectionState::CONNECTING;
        gen = ++connection_gen;
        pending.connect = p;
    }
    DBG_PRINT("GattSession::connect: Start %s, gen %" PRIu64, address.toString().c_str(), gen);

    GattStackCallbackRef cb = std::make_shared<StackCallback>(shared_from_this(), gen);
    GattConnectionRef conn = stack->connect(address, cb);

    PromiseRef<void> refused;
    bool teardown = false;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( gen == connection_gen ) {
            if( nullptr == conn ) {
                state = ConnectionState::DISCONNECTED;
                ++connection_gen;
                refused = std::move(pending.connect);
                pending.connect = nullptr;
            } else if( ConnectionState::CONNECTING == state ) {
                pendingConnection = conn;
            }
        } else if( nullptr != conn ) {
            // attempt superseded by disconnect() or a failed connection callback while connecting
            teardown = conn != gatt;
        }
    }
    if( teardown ) {
        DBG_PRINT("GattSession::connect: Superseded, closing %s", conn->toString().c_str());
        conn->disconnect();
        conn->close();
    }
    if( nullptr != refused ) {
        WARN_PRINT("GattSession::connect: Refused by native stack: %s", address.toString().c_str());
        notifier->sendDisconnected(address);
        fail(refused, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                      "connect refused by native stack: "+address.toString(), E_FILE_LINE));
    }
    return res;
}

void GattSession::disconnect() noexcept {
    disconnectImpl(true /* sendEvent */);
}

void GattSession::disconnectImpl(const bool sendEvent) noexcept {
    GattConnectionRef conn;
    PendingOps dropped;
    bool wasActive;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        wasActive = ConnectionState::DISCONNECTED != state;
        conn = nullptr != gatt ? gatt : pendingConnection;
        state = ConnectionState::DISCONNECTED;
        ++connection_gen;
        gatt = nullptr;
        pendingConnection = nullptr;
        mtu = static_cast<uint16_t>(env.DEFAULT_MTU);
        clearServices();
        std::swap(dropped, pending);
        router.clearCharListener();
    }
    DBG_PRINT("GattSession::disconnect: %s, wasActive %d, conn %d, pending %zu",
            address.toString().c_str(), wasActive, nullptr != conn, (size_t)dropped.size());
    if( nullptr != conn ) {
        conn->disconnect();
        conn->close();
    }
    dropped.failAll( GattOpException(GattErrorCode::DISCONNECTED, "session disconnected: "+address.toString(), E_FILE_LINE) );
    if( wasActive && sendEvent ) {
        notifier->sendDisconnected(address);
    }
}

void GattSession::connectionStateChanged(const uint64_t gen, const GattConnectionRef& conn, const GattStatus status, const bool connected) noexcept {
    if( nullptr == conn ) {
        ERR_PRINT("GattSession::connectionStateChanged: GattConnection ref is null, %s", address.toString().c_str());
        return;
    }
    if( GattStatus::SUCCESS == status && connected ) {
        PromiseRef<void> p;
        bool stale = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            if( gen != connection_gen || ConnectionState::DISCONNECTED == state ) {
                stale = true;
            } else if( ConnectionState::CONNECTED == state ) {
                DBG_PRINT("GattSession::connectionStateChanged: Already connected %s", toString().c_str());
                return;
            } else {
                state = ConnectionState::CONNECTED;
                gatt = conn;
                pendingConnection = nullptr;
                mtu = static_cast<uint16_t>(env.DEFAULT_MTU);
                p = std::move(pending.connect);
                pending.connect = nullptr;
            }
        }
        if( stale ) {
            WORDY_PRINT("GattSession::connectionStateChanged: Stale connection gen %" PRIu64 ", closing %s",
                    gen, conn->toString().c_str());
            conn->disconnect();
            conn->close();
            return;
        }
        DBG_PRINT("GattSession::connectionStateChanged: Connected %s", address.toString().c_str());
        notifier->sendConnected(address);
        if( nullptr != p ) {
            p->set_value();
        }
        return;
    }

    // failed connection or connection drop
    PromiseRef<void> p;
    PendingOps dropped;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( gen != connection_gen || ConnectionState::DISCONNECTED == state ) {
            DBG_PRINT("GattSession::connectionStateChanged: Ignoring stale disconnect gen %" PRIu64 ", status %s, %s",
                    gen, to_string(status).c_str(), address.toString().c_str());
            return;
        }
        state = ConnectionState::DISCONNECTED;
        ++connection_gen;
        gatt = nullptr;
        pendingConnection = nullptr;
        mtu = static_cast<uint16_t>(env.DEFAULT_MTU);
        clearServices();
        std::swap(dropped, pending);
        p = std::move(dropped.connect);
        dropped.connect = nullptr;
        router.clearCharListener();
    }
    DBG_PRINT("GattSession::connectionStateChanged: Disconnected %s, status %s, pending %zu",
            address.toString().c_str(), to_string(status).c_str(), (size_t)dropped.size());
    conn->close();
    notifier->sendDisconnected(address);
    if( GattStatus::SUCCESS == status ) {
        fail(p, GattOpException(GattErrorCode::DISCONNECTED, status, "connection closed: "+address.toString(), E_FILE_LINE));
    } else {
        fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "connection failed: "+address.toString(), E_FILE_LINE));
    }
    dropped.failAll( GattOpException(GattErrorCode::DISCONNECTED, status, "connection lost: "+address.toString(), E_FILE_LINE) );
}

std::future<void> GattSession::discoverServices() noexcept {
    PromiseRef<void> p = std::make_shared<std::promise<void>>();
    std::future<void> res = p->get_future();
    PromiseRef<void> old;
    GattConnectionRef conn;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::CONNECTED != state || nullptr == gatt ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "discoverServices: "+toString(), E_FILE_LINE) );
        }
        old = std::move(pending.discovery);
        pending.discovery = p;
        conn = gatt;
    }
    fail(old, GattOpException(GattErrorCode::OPERATION_OVERWRITTEN, "discoverServices: "+address.toString(), E_FILE_LINE));

    if( !conn->discoverServices() ) {
        bool removed = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            if( pending.discovery == p ) {
                pending.discovery = nullptr;
                removed = true;
            }
        }
        if( removed ) {
            fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                    "discoverServices refused by native stack: "+address.toString(), E_FILE_LINE));
        }
    }
    return res;
}

void GattSession::servicesDiscovered(const uint64_t gen, const GattStatus status, const jau::darray<GattServiceRef>& discovered) noexcept {
    PromiseRef<void> p;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::servicesDiscovered: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        if( GattStatus::SUCCESS == status ) {
            services = discovered;
            rebuildCharIndex();
        } else {
            clearServices();
        }
        p = std::move(pending.discovery);
        pending.discovery = nullptr;
        DBG_PRINT("GattSession::servicesDiscovered: %s, status %s, %zu services, %zu characteristics, pending %d",
                address.toString().c_str(), to_string(status).c_str(),
                (size_t)services.size(), charIndex.size(), nullptr != p);
    }
    if( nullptr == p ) {
        return;
    }
    if( GattStatus::SUCCESS == status ) {
        p->set_value();
    } else {
        fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "discoverServices: "+address.toString(), E_FILE_LINE));
    }
}

jau::darray<GattServiceRef> GattSession::getGattServices() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return services;
}

GattCharRef GattSession::findGattChar(const jau::uuid_t& uuid) const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    auto it = charIndex.find( to_uuid_key(uuid) );
    if( charIndex.end() == it ) {
        return nullptr;
    }
    return it->second;
}

std::future<jau::POctets> GattSession::read(const jau::uuid_t& uuid) noexcept {
    const std::string key = to_uuid_key(uuid);
    PromiseRef<jau::POctets> p = std::make_shared<std::promise<jau::POctets>>();
    std::future<jau::POctets> res = p->get_future();
    PromiseRef<jau::POctets> old;
    GattConnectionRef conn;
    uint16_t value_handle;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::CONNECTED != state || nullptr == gatt ) {
            return make_failed_future<jau::POctets>( GattOpException(GattErrorCode::NOT_CONNECTED, "read "+key+": "+toString(), E_FILE_LINE) );
        }
        auto it = charIndex.find(key);
        if( charIndex.end() == it ) {
            return make_failed_future<jau::POctets>( GattOpException(GattErrorCode::NOT_FOUND, "read "+key+": "+toString(), E_FILE_LINE) );
        }
        value_handle = it->second->value_handle;
        old = take_pending(pending.reads, key);
        pending.reads[key] = p;
        conn = gatt;
    }
    fail(old, GattOpException(GattErrorCode::OPERATION_OVERWRITTEN, "read "+key, E_FILE_LINE));

    if( !conn->readCharacteristic(value_handle) ) {
        bool removed;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            removed = erase_pending(pending.reads, key, p);
        }
        if( removed ) {
            fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                    "read "+key+" refused by native stack", E_FILE_LINE));
        }
    }
    return res;
}

void GattSession::characteristicRead(const uint64_t gen, const uint16_t value_handle, const GattStatus status, const jau::TROOctets& value) noexcept {
    PromiseRef<jau::POctets> p;
    std::string key;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::characteristicRead: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        GattCharRef c = findGattCharByValueHandle(value_handle);
        if( nullptr == c ) {
            WARN_PRINT("GattSession::characteristicRead: Unknown value handle %s, %s",
                    jau::to_hexstring(value_handle).c_str(), address.toString().c_str());
            return;
        }
        key = c->getUUIDKey();
        p = take_pending(pending.reads, key);
    }
    COND_PRINT(env.DEBUG_DATA, "GattSession::characteristicRead: %s, status %s, pending %d, value %s",
            key.c_str(), to_string(status).c_str(), nullptr != p, value.toString().c_str());
    if( nullptr == p ) {
        DBG_PRINT("GattSession::characteristicRead: No pending read for %s", key.c_str());
        return;
    }
    if( GattStatus::SUCCESS == status ) {
        p->set_value( jau::POctets(value) );
    } else {
        fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "read "+key, E_FILE_LINE));
    }
}

std::future<void> GattSession::write(const jau::uuid_t& uuid, const jau::TROOctets& value, const bool withResponse) noexcept {
    const std::string key = to_uuid_key(uuid);
    PromiseRef<void> p = std::make_shared<std::promise<void>>();
    std::future<void> res = p->get_future();
    PromiseRef<void> old;
    GattConnectionRef conn;
    uint16_t value_handle;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::CONNECTED != state || nullptr == gatt ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "write "+key+": "+toString(), E_FILE_LINE) );
        }
        auto it = charIndex.find(key);
        if( charIndex.end() == it ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "write "+key+": "+toString(), E_FILE_LINE) );
        }
        value_handle = it->second->value_handle;
        old = take_pending(pending.writes, key);
        pending.writes[key] = p;
        conn = gatt;
    }
    fail(old, GattOpException(GattErrorCode::OPERATION_OVERWRITTEN, "write "+key, E_FILE_LINE));

    COND_PRINT(env.DEBUG_DATA, "GattSession::write: %s, withResponse %d, value %s",
            key.c_str(), withResponse, value.toString().c_str());
    if( !conn->writeCharacteristic(value_handle, value, withResponse) ) {
        bool removed;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            removed = erase_pending(pending.writes, key, p);
        }
        if( removed ) {
            fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                    "write "+key+" refused by native stack", E_FILE_LINE));
        }
    }
    return res;
}

void GattSession::characteristicWritten(const uint64_t gen, const uint16_t value_handle, const GattStatus status) noexcept {
    PromiseRef<void> p;
    std::string key;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::characteristicWritten: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        GattCharRef c = findGattCharByValueHandle(value_handle);
        if( nullptr == c ) {
            WARN_PRINT("GattSession::characteristicWritten: Unknown value handle %s, %s",
                    jau::to_hexstring(value_handle).c_str(), address.toString().c_str());
            return;
        }
        key = c->getUUIDKey();
        p = take_pending(pending.writes, key);
    }
    if( nullptr == p ) {
        DBG_PRINT("GattSession::characteristicWritten: No pending write for %s", key.c_str());
        return;
    }
    if( GattStatus::SUCCESS == status ) {
        p->set_value();
    } else {
        fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "write "+key, E_FILE_LINE));
    }
}

std::future<void> GattSession::configNotification(const jau::uuid_t& uuid, const bool enable, const GattCharListenerRef& l) noexcept {
    const std::string key = to_uuid_key(uuid);
    PromiseRef<void> p = std::make_shared<std::promise<void>>();
    std::future<void> res = p->get_future();
    PromiseRef<void> old;
    GattConnectionRef conn;
    GattCharRef c;
    GattDescRef cccd;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::CONNECTED != state || nullptr == gatt ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "configNotification "+key+": "+toString(), E_FILE_LINE) );
        }
        auto it = charIndex.find(key);
        if( charIndex.end() == it ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "configNotification "+key+": "+toString(), E_FILE_LINE) );
        }
        c = it->second;
        cccd = c->getClientCharConfig();
        if( !c->canNotifyOrIndicate() || nullptr == cccd ) {
            return make_failed_future<void>( GattOpException(GattErrorCode::NOT_SUPPORTED, "configNotification: "+c->toString(), E_FILE_LINE) );
        }
        auto dit = pending.descOps.find(key);
        if( pending.descOps.end() != dit ) {
            old = std::move(dit->second.promise);
            pending.descOps.erase(dit);
        }
        pending.descOps[key] = PendingDescOp{ p, enable, l };
        conn = gatt;
    }
    fail(old, GattOpException(GattErrorCode::OPERATION_OVERWRITTEN, "configNotification "+key, E_FILE_LINE));

    const uint8_t* ccc_value = GattDesc::CCC_DISABLE;
    if( enable ) {
        ccc_value = c->hasProperties(GattChar::PropertyBitVal::Notify) ? GattDesc::CCC_ENABLE_NOTIFY : GattDesc::CCC_ENABLE_INDICATE;
    }
    const jau::POctets value(ccc_value, 2, jau::lb_endian_t::little);
    DBG_PRINT("GattSession::configNotification: %s, enable %d, cccd %s, value %s",
            key.c_str(), enable, cccd->toString().c_str(), value.toString().c_str());

    bool accepted = conn->setCharacteristicNotification(c->value_handle, enable);
    if( accepted && !conn->writeDescriptor(cccd->handle, value) ) {
        // revert the local notification toggle
        if( !conn->setCharacteristicNotification(c->value_handle, !enable) ) {
            WARN_PRINT("GattSession::configNotification: Reverting notification toggle refused: %s", c->toString().c_str());
        }
        accepted = false;
    }
    if( !accepted ) {
        bool removed = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            auto dit = pending.descOps.find(key);
            if( pending.descOps.end() != dit && dit->second.promise == p ) {
                pending.descOps.erase(dit);
                removed = true;
            }
        }
        if( removed ) {
            fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                    "configNotification "+key+" refused by native stack", E_FILE_LINE));
        }
    }
    return res;
}

void GattSession::descriptorWritten(const uint64_t gen, const uint16_t desc_handle, const GattStatus status) noexcept {
    PendingDescOp op { nullptr, false, nullptr };
    std::string key;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::descriptorWritten: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        GattCharRef c = findGattCharByDescHandle(desc_handle);
        if( nullptr == c ) {
            WARN_PRINT("GattSession::descriptorWritten: Unknown descriptor handle %s, %s",
                    jau::to_hexstring(desc_handle).c_str(), address.toString().c_str());
            return;
        }
        key = c->getUUIDKey();
        auto it = pending.descOps.find(key);
        if( pending.descOps.end() == it ) {
            DBG_PRINT("GattSession::descriptorWritten: No pending descriptor write for %s", key.c_str());
            return;
        }
        op = std::move(it->second);
        pending.descOps.erase(it);
        if( GattStatus::SUCCESS == status ) {
            if( !op.enable ) {
                const NotificationRouter::size_type count = router.removeAllCharListener(key);
                DBG_PRINT("GattSession::descriptorWritten: Disabled %s, removed %zu listener", key.c_str(), (size_t)count);
            } else if( nullptr != op.listener ) {
                router.addCharListener(key, op.listener);
            }
        }
    }
    if( GattStatus::SUCCESS == status ) {
        op.promise->set_value();
    } else {
        fail(op.promise, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "configNotification "+key, E_FILE_LINE));
    }
}

std::future<uint16_t> GattSession::requestMtu(const uint16_t value) noexcept {
    PromiseRef<uint16_t> p = std::make_shared<std::promise<uint16_t>>();
    std::future<uint16_t> res = p->get_future();
    PromiseRef<uint16_t> old;
    GattConnectionRef conn;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( ConnectionState::CONNECTED != state || nullptr == gatt ) {
            return make_failed_future<uint16_t>( GattOpException(GattErrorCode::NO_GATT_SESSION, "requestMtu: "+toString(), E_FILE_LINE) );
        }
        old = std::move(pending.mtu);
        pending.mtu = p;
        conn = gatt;
    }
    fail(old, GattOpException(GattErrorCode::OPERATION_OVERWRITTEN, "requestMtu "+std::to_string(value), E_FILE_LINE));

    if( !conn->requestMtu(value) ) {
        bool removed = false;
        {
            const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
            if( pending.mtu == p ) {
                pending.mtu = nullptr;
                removed = true;
            }
        }
        if( removed ) {
            fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, GattStatus::FAILURE,
                                    "requestMtu "+std::to_string(value)+" refused by native stack", E_FILE_LINE));
        }
    }
    return res;
}

void GattSession::mtuChanged(const uint64_t gen, const uint16_t new_mtu, const GattStatus status) noexcept {
    PromiseRef<uint16_t> p;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::mtuChanged: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        if( GattStatus::SUCCESS == status ) {
            mtu = new_mtu;
        }
        p = std::move(pending.mtu);
        pending.mtu = nullptr;
    }
    DBG_PRINT("GattSession::mtuChanged: %s, mtu %u, status %s, pending %d",
            address.toString().c_str(), (unsigned int)new_mtu, to_string(status).c_str(), nullptr != p);
    if( nullptr == p ) {
        return;
    }
    if( GattStatus::SUCCESS == status ) {
        p->set_value(new_mtu);
    } else {
        fail(p, GattOpException(GattErrorCode::PLATFORM_STATUS, status, "requestMtu: "+address.toString(), E_FILE_LINE));
    }
}

void GattSession::characteristicChanged(const uint64_t gen, const uint16_t value_handle, const jau::TROOctets& value) noexcept {
    const uint64_t timestamp = jau::getCurrentMilliseconds();
    GattCharRef c;
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
        if( !isCurrentConnection(gen) ) {
            DBG_PRINT("GattSession::characteristicChanged: Dropped, stale gen %" PRIu64 ", %s", gen, toString().c_str());
            return;
        }
        c = findGattCharByValueHandle(value_handle);
    }
    if( nullptr == c ) {
        WARN_PRINT("GattSession::characteristicChanged: Unknown value handle %s, dropped, %s",
                jau::to_hexstring(value_handle).c_str(), address.toString().c_str());
        return;
    }
    COND_PRINT(env.DEBUG_DATA, "GattSession::characteristicChanged: %s, value %s",
            c->toString().c_str(), value.toString().c_str());
    router.dispatch(c, value, timestamp);
}

std::string GattSession::toString() const noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_session); // RAII-style acquire and relinquish via destructor
    return "GattSession["+address.toString()+", "+to_string(state)+", gen "+std::to_string(connection_gen)+
           ", mtu "+std::to_string(mtu)+", services "+std::to_string(services.size())+
           ", chars "+std::to_string(charIndex.size())+", pending "+std::to_string(pending.size())+"]";
}
