#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "gattlink_fake_stack.hpp"

using namespace gattlink;

static const std::string ADDR_STR = "AA:BB:CC:11:22:33";
static const jau::EUI48 ADDR(ADDR_STR);
static const jau::EUI48 ADDR_UNKNOWN("AA:BB:CC:11:22:44");

class ThrowingPermissionGate : public PermissionGate {
    public:
        bool checkPermissions() override {
            throw jau::RuntimeException("permission service unavailable", E_FILE_LINE);
        }
};

static ScanRecord make_record(const jau::EUI48& address) {
    return ScanRecord{ address, "dev", -50, {}, {} };
}

TEST_CASE( "GattSessionRegistry Ctor Test 01", "[registry]" ) {
    REQUIRE_THROWS_AS( GattSessionRegistry(nullptr), jau::IllegalArgumentException );

    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    stack->adapterAvailable = false;
    REQUIRE_THROWS_AS( GattSessionRegistry(stack), GattException );

    stack->adapterAvailable = true;
    GattSessionRegistry registry(stack);
    REQUIRE( 0 == registry.getSessionCount() );
    REQUIRE( 0 == registry.getKnownDevices().size() );
    INFO_STR( registry.toString() );
}

TEST_CASE( "GattSessionRegistry Known Devices Test 01", "[registry]" ) {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    GattSessionRegistry registry(stack);

    REQUIRE( !registry.isKnownDevice(ADDR) );
    registry.deviceFound( make_record(ADDR) );
    ScanRecord r2 = make_record(ADDR);
    r2.rssi = -70;
    registry.deviceFound( r2 );
    REQUIRE( registry.isKnownDevice(ADDR) );
    REQUIRE( !registry.isKnownDevice(ADDR_UNKNOWN) );

    jau::darray<ScanRecord> known = registry.getKnownDevices();
    REQUIRE( 1 == known.size() );
    REQUIRE( -70 == known[0].rssi );
    REQUIRE( 0 == registry.getSessionCount() );

    registry.clearKnownDevices();
    REQUIRE( !registry.isKnownDevice(ADDR) );
}

TEST_CASE( "GattSessionRegistry Connect Test 01", "[registry][connect]" ) {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    std::shared_ptr<AllowAllPermissionGate> gate = std::make_shared<AllowAllPermissionGate>();
    GattSessionRegistry registry(stack, gate);
    std::shared_ptr<RecordingSessionEventListener> events = std::make_shared<RecordingSessionEventListener>();
    registry.setLifecycleSink(events);

    // unknown device, without permission check
    std::future<void> c0 = registry.connect(ADDR);
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(c0) );
    std::future<void> c1 = registry.connect("not an address");
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(c1) );
    REQUIRE( 0 == gate->checks );
    REQUIRE( 0 == stack->getConnectCount() );

    registry.deviceFound( make_record(ADDR) );

    // denied
    gate->allow = false;
    std::future<void> c2 = registry.connect(ADDR);
    REQUIRE( GattErrorCode::PERMISSION_DENIED == get_error(c2) );
    REQUIRE( 1 == gate->checks );
    REQUIRE( 0 == stack->getConnectCount() );
    REQUIRE( 0 == registry.getSessionCount() );

    gate->allow = true;
    std::future<void> c3 = registry.connect(ADDR_STR);
    REQUIRE( 2 == gate->checks );
    REQUIRE( 1 == stack->getConnectCount() );
    REQUIRE( 1 == registry.getSessionCount() );
    REQUIRE( !registry.isConnected(ADDR) );

    stack->lastConnection()->fireConnected();
    REQUIRE( GattErrorCode::SUCCESS == get_error(c3) );
    REQUIRE( registry.isConnected(ADDR) );
    REQUIRE( registry.isConnected(ADDR_STR) );
    REQUIRE( 1 == events->count(SessionEventType::CONNECTED) );
    REQUIRE( ADDR == events->getEvents()[0].address );

    // session stays registered after disconnect
    registry.disconnect(ADDR_STR);
    REQUIRE( !registry.isConnected(ADDR) );
    REQUIRE( 1 == registry.getSessionCount() );
    REQUIRE( 1 == events->count(SessionEventType::DISCONNECTED) );
    GattSessionRef s = registry.getSession(ADDR);
    REQUIRE( nullptr != s );
    REQUIRE( ConnectionState::DISCONNECTED == s->getConnectionState() );

    // reconnect reuses the session
    std::future<void> c4 = registry.connect(ADDR);
    stack->lastConnection()->fireConnected();
    REQUIRE( GattErrorCode::SUCCESS == get_error(c4) );
    REQUIRE( s == registry.getSession(ADDR) );
    REQUIRE( 2 == stack->getConnectCount() );

    // removal disconnects and destroys the session
    REQUIRE( registry.removeSession(ADDR) );
    REQUIRE( !registry.removeSession(ADDR) );
    REQUIRE( 0 == registry.getSessionCount() );
    REQUIRE( 2 == events->count(SessionEventType::DISCONNECTED) );
    REQUIRE( !registry.isConnected(ADDR) );
}

TEST_CASE( "GattSessionRegistry Connect Test 02 Throwing Gate", "[registry][connect]" ) {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    GattSessionRegistry registry(stack, std::make_shared<ThrowingPermissionGate>());
    registry.deviceFound( make_record(ADDR) );

    std::future<void> c = registry.connect(ADDR);
    REQUIRE( GattErrorCode::PERMISSION_DENIED == get_error(c) );
    REQUIRE( 0 == stack->getConnectCount() );
}

TEST_CASE( "GattSessionRegistry Unknown Session Test 01", "[registry]" ) {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    GattSessionRegistry registry(stack);
    registry.deviceFound( make_record(ADDR) );
    const jau::POctets value = make_octets({0x01});

    // known device without session behaves like a disconnected session
    REQUIRE( !registry.isConnected(ADDR) );
    REQUIRE( !registry.isConnected("zz:zz") );
    REQUIRE( 0 == registry.listServices(ADDR).size() );
    REQUIRE( 0 == registry.listServices("zz:zz").size() );
    registry.disconnect(ADDR);
    registry.disconnect("zz:zz");

    std::future<void> d = registry.discoverServices(ADDR_UNKNOWN);
    std::future<void> w = registry.write(ADDR_STR, "2a37", value, true);
    std::future<jau::POctets> r = registry.read(ADDR_STR, "2a37");
    std::future<void> s = registry.subscribe(ADDR_STR, "2a37");
    std::future<void> u = registry.unsubscribe(ADDR_STR, "2a37");
    std::future<uint16_t> m = registry.requestMtu(ADDR, 247);
    std::future<uint16_t> m2 = registry.requestMtu("zz:zz", 247);
    REQUIRE( GattErrorCode::NOT_CONNECTED == get_error(d) );
    REQUIRE( GattErrorCode::NOT_CONNECTED == get_error(w) );
    REQUIRE( GattErrorCode::NOT_CONNECTED == get_error(r) );
    REQUIRE( GattErrorCode::NOT_CONNECTED == get_error(s) );
    REQUIRE( GattErrorCode::NOT_CONNECTED == get_error(u) );
    REQUIRE( GattErrorCode::NO_GATT_SESSION == get_error(m) );
    REQUIRE( GattErrorCode::NO_GATT_SESSION == get_error(m2) );
    REQUIRE( 0 == registry.getSessionCount() );

    REQUIRE( !registry.clearNotificationSink(ADDR) );
    REQUIRE( !registry.setNotificationSink(ADDR_UNKNOWN, std::make_shared<RecordingCharListener>()) );
    REQUIRE( 0 == registry.getSessionCount() );

    // sink registration creates the session of a known device
    REQUIRE( registry.setNotificationSink(ADDR, std::make_shared<RecordingCharListener>()) );
    REQUIRE( 1 == registry.getSessionCount() );
    REQUIRE( registry.clearNotificationSink(ADDR) );
    REQUIRE( !registry.isConnected(ADDR) );
}

TEST_CASE( "GattSessionRegistry Invalid UUID Test 01", "[registry]" ) {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    GattSessionRegistry registry(stack);
    registry.deviceFound( make_record(ADDR) );

    std::future<void> c = registry.connect(ADDR);
    stack->lastConnection()->fireConnected();
    REQUIRE( GattErrorCode::SUCCESS == get_error(c) );

    std::future<jau::POctets> r = registry.read(ADDR_STR, "not-a-uuid");
    std::future<void> w = registry.write(ADDR_STR, "xyz", make_octets({0x01}), false);
    std::future<void> s = registry.subscribe(ADDR_STR, "");
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(r) );
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(w) );
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(s) );
    REQUIRE( 0 == stack->lastConnection()->getOpCount() );
}
