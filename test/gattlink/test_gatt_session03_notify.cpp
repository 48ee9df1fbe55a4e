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

static const jau::EUI48 ADDR("AA:BB:CC:11:22:33");

static const std::string CHAR_NOTIFY = "2a37";
static const std::string CHAR_INDICATE = "2a05";
static const std::string CHAR_BOTH = "d0ca6bf3-3d50-4760-98e5-fc5883e93714";
static const std::string CHAR_NO_CCCD = "2a19";
static const std::string CHAR_READ = "2a38";

static std::unique_ptr<jau::uuid_t> uuid(const std::string& s) {
    return jau::uuid_t::create(s);
}

/**
 * Handles:
 * - CHAR_NOTIFY   value 0x0003, cccd 0x0004
 * - CHAR_INDICATE value 0x0006, cccd 0x0007
 * - CHAR_BOTH     value 0x0009, cccd 0x000a
 * - CHAR_NO_CCCD  value 0x000c
 * - CHAR_READ     value 0x000e
 */
struct NotifySession {
    FakeGattStackRef stack = std::make_shared<FakeGattStack>();
    GattSessionRef session;
    FakeGattConnectionRef conn;

    NotifySession() {
        session = GattSession::make_shared(ADDR, stack, std::make_shared<SessionEventNotifier>());
        std::future<void> c = session->connect();
        conn = stack->lastConnection();
        conn->fireConnected();
        REQUIRE( GattErrorCode::SUCCESS == get_error(c) );

        jau::darray<GattServiceRef> services;
        services.push_back( make_service("180d", 0x0001, 0x0010, {
                make_char(CHAR_NOTIFY, GattChar::PropertyBitVal::Notify, 0x0003, true),
                make_char(CHAR_INDICATE, GattChar::PropertyBitVal::Indicate, 0x0006, true),
                make_char(CHAR_BOTH, GattChar::PropertyBitVal::Notify | GattChar::PropertyBitVal::Indicate, 0x0009, true),
                make_char(CHAR_NO_CCCD, GattChar::PropertyBitVal::Notify, 0x000c, false),
                make_char(CHAR_READ, GattChar::PropertyBitVal::Read, 0x000e, false) }) );
        std::future<void> d = session->discoverServices();
        conn->fireServicesDiscovered(GattStatus::SUCCESS, services);
        REQUIRE( GattErrorCode::SUCCESS == get_error(d) );
    }
};

TEST_CASE( "GattSession Notify Test 01 Subscribe", "[session][notify]" ) {
    NotifySession ns;

    std::future<void> s = ns.session->subscribe(*uuid(CHAR_NOTIFY));
    REQUIRE( !is_ready(s) );

    std::vector<FakeGattConnection::Op> toggles = ns.conn->getOps(FakeGattConnection::OpType::NOTIFY_TOGGLE);
    REQUIRE( 1 == toggles.size() );
    REQUIRE( 0x0003 == toggles[0].handle );
    REQUIRE( toggles[0].flag );
    std::vector<FakeGattConnection::Op> writes = ns.conn->getOps(FakeGattConnection::OpType::WRITE_DESC);
    REQUIRE( 1 == writes.size() );
    REQUIRE( 0x0004 == writes[0].handle );
    REQUIRE( std::vector<uint8_t>{0x01, 0x00} == writes[0].value );

    FakeGattConnection::fireAsync([&]() { ns.conn->fireDescriptorWritten(0x0004, GattStatus::SUCCESS); });
    REQUIRE( GattErrorCode::SUCCESS == get_error(s) );

    std::future<void> u = ns.session->unsubscribe(*uuid(CHAR_NOTIFY));
    toggles = ns.conn->getOps(FakeGattConnection::OpType::NOTIFY_TOGGLE);
    REQUIRE( 2 == toggles.size() );
    REQUIRE( !toggles[1].flag );
    writes = ns.conn->getOps(FakeGattConnection::OpType::WRITE_DESC);
    REQUIRE( 2 == writes.size() );
    REQUIRE( std::vector<uint8_t>{0x00, 0x00} == writes[1].value );

    ns.conn->fireDescriptorWritten(0x0004, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(u) );
    REQUIRE( 0 == ns.session->getPendingCount() );
}

TEST_CASE( "GattSession Notify Test 02 Indicate", "[session][notify]" ) {
    NotifySession ns;

    std::future<void> s1 = ns.session->subscribe(*uuid(CHAR_INDICATE));
    std::future<void> s2 = ns.session->subscribe(*uuid(CHAR_BOTH));
    std::vector<FakeGattConnection::Op> writes = ns.conn->getOps(FakeGattConnection::OpType::WRITE_DESC);
    REQUIRE( 2 == writes.size() );
    REQUIRE( 0x0007 == writes[0].handle );
    REQUIRE( std::vector<uint8_t>{0x02, 0x00} == writes[0].value );
    // notification preferred
    REQUIRE( 0x000a == writes[1].handle );
    REQUIRE( std::vector<uint8_t>{0x01, 0x00} == writes[1].value );

    // pending per uuid, resolved independently and out of order
    REQUIRE( 2 == ns.session->getPendingCount() );
    ns.conn->fireDescriptorWritten(0x000a, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(s2) );
    REQUIRE( !is_ready(s1) );
    ns.conn->fireDescriptorWritten(0x0007, GattStatus::INSUFFICIENT_AUTHENTICATION);
    try {
        s1.get();
        FAIL("subscribe shall fail");
    } catch (const GattOpException& e) {
        REQUIRE( GattErrorCode::PLATFORM_STATUS == e.getErrorCode() );
        REQUIRE( GattStatus::INSUFFICIENT_AUTHENTICATION == e.getStatus() );
    }
}

TEST_CASE( "GattSession Notify Test 03 Not Supported", "[session][notify]" ) {
    NotifySession ns;

    std::future<void> s1 = ns.session->subscribe(*uuid(CHAR_READ));
    std::future<void> s2 = ns.session->subscribe(*uuid(CHAR_NO_CCCD));
    std::future<void> u1 = ns.session->unsubscribe(*uuid(CHAR_READ));
    std::future<void> s3 = ns.session->subscribe(*uuid("2a99"));
    REQUIRE( GattErrorCode::NOT_SUPPORTED == get_error(s1) );
    REQUIRE( GattErrorCode::NOT_SUPPORTED == get_error(s2) );
    REQUIRE( GattErrorCode::NOT_SUPPORTED == get_error(u1) );
    REQUIRE( GattErrorCode::NOT_FOUND == get_error(s3) );
    REQUIRE( 0 == ns.conn->getOps(FakeGattConnection::OpType::WRITE_DESC).size() );
}

TEST_CASE( "GattSession Notify Test 04 Overwrite", "[session][notify]" ) {
    NotifySession ns;

    std::future<void> s = ns.session->subscribe(*uuid(CHAR_NOTIFY));
    std::future<void> u = ns.session->unsubscribe(*uuid(CHAR_NOTIFY));
    REQUIRE( GattErrorCode::OPERATION_OVERWRITTEN == get_error(s) );
    REQUIRE( 1 == ns.session->getPendingCount() );

    ns.conn->fireDescriptorWritten(0x0004, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(u) );

    // refused descriptor write
    ns.conn->acceptRequests = false;
    std::future<void> s2 = ns.session->subscribe(*uuid(CHAR_NOTIFY));
    REQUIRE( GattErrorCode::PLATFORM_STATUS == get_error(s2) );
    REQUIRE( 0 == ns.session->getPendingCount() );
}

TEST_CASE( "GattSession Notify Test 05 Routing", "[session][notify][router]" ) {
    NotifySession ns;
    std::shared_ptr<RecordingCharListener> sink = std::make_shared<RecordingCharListener>();
    std::shared_ptr<RecordingCharListener> perChar = std::make_shared<RecordingCharListener>();
    ns.session->setNotificationSink(sink);

    std::future<void> s = ns.session->subscribe(*uuid(CHAR_NOTIFY), perChar);
    // listener is added once enabled
    REQUIRE( 0 == ns.session->getNotificationRouter().getCharListenerCount() );
    ns.conn->fireDescriptorWritten(0x0004, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(s) );
    REQUIRE( 1 == ns.session->getNotificationRouter().getCharListenerCount() );

    FakeGattConnection::fireAsync([&]() { ns.conn->fireChanged(0x0003, make_octets({0x02})); });
    REQUIRE( 1 == sink->getCount() );
    REQUIRE( 1 == perChar->getCount() );
    REQUIRE( uuid(CHAR_NOTIFY)->toUUID128String() == sink->getEvents()[0].uuid_key );
    REQUIRE( std::vector<uint8_t>{0x02} == sink->getEvents()[0].value );
    REQUIRE( std::vector<uint8_t>{0x02} == perChar->getEvents()[0].value );

    // notification of another characteristic only reaches the sink
    ns.conn->fireChanged(0x0009, make_octets({0x03, 0x04}));
    REQUIRE( 2 == sink->getCount() );
    REQUIRE( 1 == perChar->getCount() );
    REQUIRE( uuid(CHAR_BOTH)->toUUID128String() == sink->getEvents()[1].uuid_key );

    // unknown handle is dropped
    ns.conn->fireChanged(0x0050, make_octets({0x05}));
    REQUIRE( 2 == sink->getCount() );

    // unsubscribe removes the per uuid listener, sink stays
    std::future<void> u = ns.session->unsubscribe(*uuid(CHAR_NOTIFY));
    ns.conn->fireDescriptorWritten(0x0004, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(u) );
    REQUIRE( 0 == ns.session->getNotificationRouter().getCharListenerCount() );
    ns.conn->fireChanged(0x0003, make_octets({0x06}));
    REQUIRE( 3 == sink->getCount() );
    REQUIRE( 1 == perChar->getCount() );

    // no sink, notification is dropped
    ns.session->clearNotificationSink();
    ns.conn->fireChanged(0x0003, make_octets({0x07}));
    REQUIRE( 3 == sink->getCount() );

    // disconnect drops per uuid listener and later notifications
    ns.session->setNotificationSink(sink);
    std::future<void> s2 = ns.session->subscribe(*uuid(CHAR_BOTH), perChar);
    ns.conn->fireDescriptorWritten(0x000a, GattStatus::SUCCESS);
    REQUIRE( GattErrorCode::SUCCESS == get_error(s2) );
    REQUIRE( 1 == ns.session->getNotificationRouter().getCharListenerCount() );
    ns.session->disconnect();
    REQUIRE( 0 == ns.session->getNotificationRouter().getCharListenerCount() );
    ns.conn->fireChanged(0x0009, make_octets({0x08}));
    REQUIRE( 3 == sink->getCount() );
}

TEST_CASE( "GattSession MTU Test 01", "[session][mtu]" ) {
    NotifySession ns;
    REQUIRE( GattEnv::get().DEFAULT_MTU == ns.session->getMtu() );

    std::future<uint16_t> m1 = ns.session->requestMtu(517);
    std::future<uint16_t> m2 = ns.session->requestMtu(247);
    REQUIRE( GattErrorCode::OPERATION_OVERWRITTEN == get_error(m1) );
    std::vector<FakeGattConnection::Op> ops = ns.conn->getOps(FakeGattConnection::OpType::MTU);
    REQUIRE( 2 == ops.size() );
    REQUIRE( 247 == ops[1].handle );

    FakeGattConnection::fireAsync([&]() { ns.conn->fireMtuChanged(185, GattStatus::SUCCESS); });
    REQUIRE( 185 == m2.get() );
    REQUIRE( 185 == ns.session->getMtu() );

    std::future<uint16_t> m3 = ns.session->requestMtu(517);
    ns.conn->fireMtuChanged(23, GattStatus::REQUEST_NOT_SUPPORTED);
    try {
        m3.get();
        FAIL("requestMtu shall fail");
    } catch (const GattOpException& e) {
        REQUIRE( GattErrorCode::PLATFORM_STATUS == e.getErrorCode() );
        REQUIRE( GattStatus::REQUEST_NOT_SUPPORTED == e.getStatus() );
    }
    REQUIRE( 185 == ns.session->getMtu() );

    // reset on disconnect
    ns.session->disconnect();
    REQUIRE( GattEnv::get().DEFAULT_MTU == ns.session->getMtu() );
    std::future<uint16_t> m4 = ns.session->requestMtu(247);
    REQUIRE( GattErrorCode::NO_GATT_SESSION == get_error(m4) );
}

TEST_CASE( "GattSession Notify Test 06 Descriptor Write Refused", "[session][notify]" ) {
    NotifySession ns;
    ns.conn->acceptDescriptorWrites = false;

    std::future<void> s = ns.session->subscribe(*uuid(CHAR_NOTIFY));
    try {
        s.get();
        FAIL("subscribe shall fail");
    } catch (const GattOpException& e) {
        REQUIRE( GattErrorCode::PLATFORM_STATUS == e.getErrorCode() );
        REQUIRE( GattStatus::FAILURE == e.getStatus() );
    }
    REQUIRE( 0 == ns.session->getPendingCount() );

    // local notification toggle is reverted
    std::vector<FakeGattConnection::Op> toggles = ns.conn->getOps(FakeGattConnection::OpType::NOTIFY_TOGGLE);
    REQUIRE( 2 == toggles.size() );
    REQUIRE( 0x0003 == toggles[0].handle );
    REQUIRE( toggles[0].flag );
    REQUIRE( 0x0003 == toggles[1].handle );
    REQUIRE( !toggles[1].flag );

    // refused toggle issues no descriptor write and no revert
    ns.conn->acceptDescriptorWrites = true;
    ns.conn->acceptRequests = false;
    std::future<void> u = ns.session->unsubscribe(*uuid(CHAR_NOTIFY));
    REQUIRE( GattErrorCode::PLATFORM_STATUS == get_error(u) );
    REQUIRE( 3 == ns.conn->getOps(FakeGattConnection::OpType::NOTIFY_TOGGLE).size() );
    REQUIRE( 1 == ns.conn->getOps(FakeGattConnection::OpType::WRITE_DESC).size() );
}
