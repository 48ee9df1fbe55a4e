#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>
#include <jau/uuid.hpp>

#include <gattlink/GattLink.hpp>

using namespace gattlink;

TEST_CASE( "GattErrorCode Test 01", "[datatype][error]" ) {
    REQUIRE( "NOT_FOUND" == to_string(GattErrorCode::NOT_FOUND) );
    REQUIRE( "OPERATION_OVERWRITTEN" == to_string(GattErrorCode::OPERATION_OVERWRITTEN) );
    REQUIRE( "NOT_SUPPORTED" == to_string(GattErrorCode::NOT_SUPPORTED) );

    const std::error_code ec = make_error_code(GattErrorCode::PERMISSION_DENIED);
    REQUIRE( std::string("GATT") == ec.category().name() );
    REQUIRE( "GATT::PERMISSION_DENIED" == ec.message() );
    REQUIRE( number(GattErrorCode::PERMISSION_DENIED) == ec.value() );

    // implicit conversion via std::is_error_code_enum
    const std::error_code ec2 = GattErrorCode::DISCONNECTED;
    REQUIRE( ec2 == make_error_code(GattErrorCode::DISCONNECTED) );
    REQUIRE( ec2 != ec );
}

TEST_CASE( "GattStatus Test 01", "[datatype][error]" ) {
    REQUIRE( 0 == number(GattStatus::SUCCESS) );
    REQUIRE( "SUCCESS" == to_string(GattStatus::SUCCESS) );
    REQUIRE( "ERROR" == to_string(to_GattStatus(0x85)) );
    REQUIRE( "FAILURE" == to_string(GattStatus::FAILURE) );

    // unknown native values pass through
    const GattStatus unknown = to_GattStatus(0x3a);
    REQUIRE( 0x3a == number(unknown) );
    REQUIRE( std::string::npos != to_string(unknown).find("GattStatus") );
}

TEST_CASE( "GattOpException Test 01", "[datatype][error]" ) {
    const GattOpException e1(GattErrorCode::PLATFORM_STATUS, to_GattStatus(133), "read", E_FILE_LINE);
    REQUIRE( GattErrorCode::PLATFORM_STATUS == e1.getErrorCode() );
    REQUIRE( 133 == number(e1.getStatus()) );
    REQUIRE( make_error_code(GattErrorCode::PLATFORM_STATUS) == e1.error_code() );
    REQUIRE( std::string::npos != std::string(e1.what()).find("PLATFORM_STATUS") );

    const GattOpException e2(GattErrorCode::NOT_CONNECTED, "write", E_FILE_LINE);
    REQUIRE( GattStatus::SUCCESS == e2.getStatus() );

    bool caught = false;
    try {
        throw e2;
    } catch (const jau::RuntimeException& e) {
        caught = true;
        INFO_STR( std::string(e.what()) );
    }
    REQUIRE( caught );
}

TEST_CASE( "ConnectionState Test 01", "[datatype][state]" ) {
    REQUIRE( "DISCONNECTED" == to_string(ConnectionState::DISCONNECTED) );
    REQUIRE( "CONNECTING" == to_string(ConnectionState::CONNECTING) );
    REQUIRE( "CONNECTED" == to_string(ConnectionState::CONNECTED) );
}

TEST_CASE( "GattChar Properties Test 01", "[datatype][gatt]" ) {
    const GattChar::PropertyBitVal p = GattChar::PropertyBitVal::Read | GattChar::PropertyBitVal::Notify;
    REQUIRE( 0x12 == number(p) );
    REQUIRE( "[read, notify]" == to_string(p) );
    REQUIRE( "[]" == to_string(GattChar::PropertyBitVal::NONE) );
    REQUIRE( "[write-noack, write-ack, indicate]" ==
             to_string(GattChar::PropertyBitVal::WriteNoAck | GattChar::PropertyBitVal::WriteWithAck | GattChar::PropertyBitVal::Indicate) );
}

TEST_CASE( "GattChar Descriptor Test 01", "[datatype][gatt]" ) {
    GattCharRef c = std::make_shared<GattChar>(GattChar::PropertyBitVal::Read | GattChar::PropertyBitVal::Indicate,
                                               0x0010, jau::uuid_t::create("2a37"));
    REQUIRE( c->canNotifyOrIndicate() );
    REQUIRE( !c->hasProperties(GattChar::PropertyBitVal::Notify) );
    REQUIRE( nullptr == c->getClientCharConfig() );

    std::unique_ptr<const jau::uuid_t> user_desc = std::make_unique<jau::uuid16_t>(GattDesc::Type::CHARACTERISTIC_USER_DESCRIPTION);
    c->addDescriptor( std::make_shared<GattDesc>(std::move(user_desc), 0x0011) );
    REQUIRE( nullptr == c->getClientCharConfig() );

    std::unique_ptr<const jau::uuid_t> cccd = std::make_unique<jau::uuid16_t>(GattDesc::Type::CLIENT_CHARACTERISTIC_CONFIGURATION);
    c->addDescriptor( std::make_shared<GattDesc>(std::move(cccd), 0x0012) );
    REQUIRE( 2 == c->descriptorList.size() );
    REQUIRE( nullptr != c->getClientCharConfig() );
    REQUIRE( 0x0012 == c->getClientCharConfig()->handle );
    REQUIRE( c->getClientCharConfig()->isClientCharConfig() );

    REQUIRE( nullptr != c->findGattDesc(*GattDesc::TYPE_CCC_DESC) );
    REQUIRE( nullptr != c->findGattDesc(static_cast<uint16_t>(0x0011)) );
    REQUIRE( nullptr == c->findGattDesc(static_cast<uint16_t>(0x0013)) );
}

TEST_CASE( "GattService Lookup Test 01", "[datatype][gatt]" ) {
    GattServiceRef s = std::make_shared<GattService>(true, 0x0001, 0x0020, jau::uuid_t::create("180d"));
    GattCharRef c1 = std::make_shared<GattChar>(GattChar::PropertyBitVal::Read, 0x0003, jau::uuid_t::create("2a37"));
    GattCharRef c2 = std::make_shared<GattChar>(GattChar::PropertyBitVal::Notify, 0x0005, jau::uuid_t::create("d0ca6bf3-3d50-4760-98e5-fc5883e93712"));
    std::unique_ptr<const jau::uuid_t> cccd = std::make_unique<jau::uuid16_t>(GattDesc::Type::CLIENT_CHARACTERISTIC_CONFIGURATION);
    c2->addDescriptor( std::make_shared<GattDesc>(std::move(cccd), 0x0006) );
    s->characteristicList.push_back(c1);
    s->characteristicList.push_back(c2);

    // 16-bit uuid is equivalent to its 128-bit BT base form
    std::unique_ptr<jau::uuid_t> u128 = jau::uuid_t::create("00002a37-0000-1000-8000-00805f9b34fb");
    REQUIRE( c1 == s->findGattChar(*u128) );
    REQUIRE( to_uuid_key(*u128) == c1->getUUIDKey() );

    REQUIRE( c2 == s->findGattChar(static_cast<uint16_t>(0x0005)) );
    REQUIRE( nullptr == s->findGattChar(static_cast<uint16_t>(0x0004)) );
    REQUIRE( c2 == s->findGattCharByDescHandle(0x0006) );
    REQUIRE( nullptr == s->findGattCharByDescHandle(0x0003) );
    REQUIRE( s->primary );
    INFO_STR( s->toString() );
    INFO_STR( c2->toString() );
}
