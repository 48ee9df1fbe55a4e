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

#include <jau/debug.hpp>

#include "GattSessionRegistry.hpp"

using namespace gattlink;

template<typename T>
static std::future<T> make_failed_future(const GattOpException& e) noexcept {
    std::promise<T> p;
    p.set_exception( std::make_exception_ptr(e) );
    return p.get_future();
}

std::string ScanRecord::toString() const noexcept {
    std::string srv_str;
    for(const std::shared_ptr<const jau::uuid_t>& u : services) {
        if( 0 < srv_str.size() ) {
            srv_str.append(", ");
        }
        srv_str.append(u->toString());
    }
    return "ScanRecord["+address.toString()+", '"+name+"', rssi "+std::to_string(rssi)+
           ", services["+srv_str+"], msd "+std::to_string(manufacturerData.size())+"]";
}

GattSessionRegistry::GattSessionRegistry(const GattStackRef& stack_, const PermissionGateRef& permissionGate_)
: stack(stack_), permissionGate(permissionGate_),
  notifier(std::make_shared<SessionEventNotifier>()),
  knownDevices(), sessions()
{
    if( nullptr == stack ) {
        throw jau::IllegalArgumentException("GattStack ref is null", E_FILE_LINE);
    }
    if( !stack->isAdapterAvailable() ) {
        throw GattException("No Bluetooth adapter available: "+stack->toString(), E_FILE_LINE);
    }
    DBG_PRINT("GattSessionRegistry::ctor: %s", stack->toString().c_str());
}

GattSessionRegistry::~GattSessionRegistry() noexcept {
    std::unordered_map<std::string, GattSessionRef> released;
    {
        const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
        std::swap(released, sessions);
        knownDevices.clear();
    }
    DBG_PRINT("GattSessionRegistry::dtor: Releasing %zu sessions", released.size());
    for(auto & it : released) {
        it.second->disconnect();
    }
}

bool GattSessionRegistry::toAddress(const std::string& address, jau::EUI48& dest) noexcept {
    std::string errmsg;
    if( !jau::EUI48::scanEUI48(address, dest, errmsg) ) {
        DBG_PRINT("GattSessionRegistry: Invalid address '%s': %s", address.c_str(), errmsg.c_str());
        return false;
    }
    return true;
}

std::unique_ptr<const jau::uuid_t> GattSessionRegistry::toUUID(const std::string& uuid) noexcept {
    try {
        return jau::uuid_t::create(uuid);
    } catch (jau::IllegalArgumentException &e) {
        DBG_PRINT("GattSessionRegistry: Invalid uuid '%s': %s", uuid.c_str(), e.what());
    }
    return nullptr;
}

void GattSessionRegistry::deviceFound(const ScanRecord& r) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    const std::string key = r.address.toString();
    auto it = knownDevices.find(key);
    if( knownDevices.end() != it ) {
        it->second = r;
    } else {
        knownDevices.emplace(key, r);
        DBG_PRINT("GattSessionRegistry::deviceFound: %s", r.toString().c_str());
    }
}

bool GattSessionRegistry::isKnownDevice(const jau::EUI48& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    const std::string key = address.toString();
    return knownDevices.end() != knownDevices.find(key) || sessions.end() != sessions.find(key);
}

jau::darray<ScanRecord> GattSessionRegistry::getKnownDevices() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    jau::darray<ScanRecord> res;
    res.reserve(knownDevices.size());
    for(const auto & it : knownDevices) {
        res.push_back(it.second);
    }
    return res;
}

void GattSessionRegistry::clearKnownDevices() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    knownDevices.clear();
}

GattSessionRef GattSessionRegistry::getSession(const jau::EUI48& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    auto it = sessions.find( address.toString() );
    if( sessions.end() == it ) {
        return nullptr;
    }
    return it->second;
}

GattSessionRef GattSessionRegistry::getOrCreateSession(const jau::EUI48& address) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    const std::string key = address.toString();
    auto it = sessions.find(key);
    if( sessions.end() != it ) {
        return it->second;
    }
    if( knownDevices.end() == knownDevices.find(key) ) {
        return nullptr;
    }
    GattSessionRef s = GattSession::make_shared(address, stack, notifier);
    sessions.emplace(key, s);
    DBG_PRINT("GattSessionRegistry: New session %s, count %zu", key.c_str(), sessions.size());
    return s;
}

GattSessionRegistry::size_type GattSessionRegistry::getSessionCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    return static_cast<size_type>( sessions.size() );
}

bool GattSessionRegistry::removeSession(const jau::EUI48& address) noexcept {
    GattSessionRef s;
    {
        const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
        auto it = sessions.find( address.toString() );
        if( sessions.end() == it ) {
            return false;
        }
        s = std::move(it->second);
        sessions.erase(it);
    }
    s->disconnect();
    return true;
}

std::future<void> GattSessionRegistry::connect(const jau::EUI48& address) noexcept {
    if( !isKnownDevice(address) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Unknown device "+address.toString(), E_FILE_LINE) );
    }
    bool permitted = false;
    if( nullptr == permissionGate ) {
        permitted = true;
    } else {
        try {
            permitted = permissionGate->checkPermissions();
        } catch (std::exception &e) {
            ERR_PRINT("GattSessionRegistry::connect: PermissionGate: Caught exception %s", e.what());
        }
    }
    if( !permitted ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::PERMISSION_DENIED, "connect "+address.toString(), E_FILE_LINE) );
    }
    GattSessionRef s = getOrCreateSession(address);
    if( nullptr == s ) {
        // known device has been cleared meanwhile
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Unknown device "+address.toString(), E_FILE_LINE) );
    }
    return s->connect();
}

std::future<void> GattSessionRegistry::connect(const std::string& address) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    return connect(a);
}

void GattSessionRegistry::disconnect(const jau::EUI48& address) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr != s ) {
        s->disconnect();
    }
}

void GattSessionRegistry::disconnect(const std::string& address) noexcept {
    jau::EUI48 a;
    if( toAddress(address, a) ) {
        disconnect(a);
    }
}

bool GattSessionRegistry::isConnected(const jau::EUI48& address) const noexcept {
    GattSessionRef s = getSession(address);
    return nullptr != s && s->isConnected();
}

bool GattSessionRegistry::isConnected(const std::string& address) const noexcept {
    jau::EUI48 a;
    return toAddress(address, a) && isConnected(a);
}

std::future<void> GattSessionRegistry::discoverServices(const jau::EUI48& address) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "discoverServices "+address.toString(), E_FILE_LINE) );
    }
    return s->discoverServices();
}

std::future<void> GattSessionRegistry::discoverServices(const std::string& address) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    return discoverServices(a);
}

jau::darray<GattServiceRef> GattSessionRegistry::listServices(const jau::EUI48& address) const noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return jau::darray<GattServiceRef>();
    }
    return s->getGattServices();
}

jau::darray<GattServiceRef> GattSessionRegistry::listServices(const std::string& address) const noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return jau::darray<GattServiceRef>();
    }
    return listServices(a);
}

std::future<void> GattSessionRegistry::write(const jau::EUI48& address, const jau::uuid_t& uuid, const jau::TROOctets& value, const bool withResponse) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "write "+address.toString(), E_FILE_LINE) );
    }
    return s->write(uuid, value, withResponse);
}

std::future<void> GattSessionRegistry::write(const std::string& address, const std::string& uuid, const jau::TROOctets& value, const bool withResponse) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    std::unique_ptr<const jau::uuid_t> u = toUUID(uuid);
    if( nullptr == u ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Invalid uuid '"+uuid+"'", E_FILE_LINE) );
    }
    return write(a, *u, value, withResponse);
}

std::future<jau::POctets> GattSessionRegistry::read(const jau::EUI48& address, const jau::uuid_t& uuid) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<jau::POctets>( GattOpException(GattErrorCode::NOT_CONNECTED, "read "+address.toString(), E_FILE_LINE) );
    }
    return s->read(uuid);
}

std::future<jau::POctets> GattSessionRegistry::read(const std::string& address, const std::string& uuid) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<jau::POctets>( GattOpException(GattErrorCode::NOT_CONNECTED, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    std::unique_ptr<const jau::uuid_t> u = toUUID(uuid);
    if( nullptr == u ) {
        return make_failed_future<jau::POctets>( GattOpException(GattErrorCode::NOT_FOUND, "Invalid uuid '"+uuid+"'", E_FILE_LINE) );
    }
    return read(a, *u);
}

std::future<void> GattSessionRegistry::subscribe(const jau::EUI48& address, const jau::uuid_t& uuid, const GattCharListenerRef& l) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "subscribe "+address.toString(), E_FILE_LINE) );
    }
    return s->subscribe(uuid, l);
}

std::future<void> GattSessionRegistry::subscribe(const std::string& address, const std::string& uuid, const GattCharListenerRef& l) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    std::unique_ptr<const jau::uuid_t> u = toUUID(uuid);
    if( nullptr == u ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Invalid uuid '"+uuid+"'", E_FILE_LINE) );
    }
    return subscribe(a, *u, l);
}

std::future<void> GattSessionRegistry::unsubscribe(const jau::EUI48& address, const jau::uuid_t& uuid) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "unsubscribe "+address.toString(), E_FILE_LINE) );
    }
    return s->unsubscribe(uuid);
}

std::future<void> GattSessionRegistry::unsubscribe(const std::string& address, const std::string& uuid) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_CONNECTED, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    std::unique_ptr<const jau::uuid_t> u = toUUID(uuid);
    if( nullptr == u ) {
        return make_failed_future<void>( GattOpException(GattErrorCode::NOT_FOUND, "Invalid uuid '"+uuid+"'", E_FILE_LINE) );
    }
    return unsubscribe(a, *u);
}

std::future<uint16_t> GattSessionRegistry::requestMtu(const jau::EUI48& address, const uint16_t value) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return make_failed_future<uint16_t>( GattOpException(GattErrorCode::NO_GATT_SESSION, "requestMtu "+address.toString(), E_FILE_LINE) );
    }
    return s->requestMtu(value);
}

std::future<uint16_t> GattSessionRegistry::requestMtu(const std::string& address, const uint16_t value) noexcept {
    jau::EUI48 a;
    if( !toAddress(address, a) ) {
        return make_failed_future<uint16_t>( GattOpException(GattErrorCode::NO_GATT_SESSION, "Invalid address '"+address+"'", E_FILE_LINE) );
    }
    return requestMtu(a, value);
}

bool GattSessionRegistry::setNotificationSink(const jau::EUI48& address, const GattCharListenerRef& l) noexcept {
    GattSessionRef s = getOrCreateSession(address);
    if( nullptr == s ) {
        return false;
    }
    s->setNotificationSink(l);
    return true;
}

bool GattSessionRegistry::clearNotificationSink(const jau::EUI48& address) noexcept {
    GattSessionRef s = getSession(address);
    if( nullptr == s ) {
        return false;
    }
    s->clearNotificationSink();
    return true;
}

std::string GattSessionRegistry::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sessions); // RAII-style acquire and relinquish via destructor
    return "GattSessionRegistry["+stack->toString()+", known "+std::to_string(knownDevices.size())+
           ", sessions "+std::to_string(sessions.size())+", lifecycle sink "+std::to_string(notifier->hasSink())+"]";
}
