#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mock_vm_provider.hpp"

using namespace xenopscli;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

const std::string WEB_ID = "5b1e8a0c-3d4f-4e2a-9b6c-7d8e9f0a1b2c";
const std::string DB_ID = "c2d3e4f5-a6b7-4c8d-9e0f-1a2b3c4d5e6f";
const std::string DB2_ID = "d3e4f5a6-b7c8-4d9e-8f1a-2b3c4d5e6f70";

} // namespace

TEST(VMReferenceTest, UuidShapedStringsSelectById) {
    auto reference = parse_vm_reference(WEB_ID);
    ASSERT_TRUE(std::holds_alternative<VMId>(reference));
    EXPECT_EQ(std::get<VMId>(reference).value, WEB_ID);

    auto upper = parse_vm_reference("5B1E8A0C-3D4F-4E2A-9B6C-7D8E9F0A1B2C");
    EXPECT_TRUE(std::holds_alternative<VMId>(upper));
}

TEST(VMReferenceTest, EverythingElseSelectsByName) {
    for (const char* name : {"web01", "5b1e8a0c", "5b1e8a0c-3d4f-4e2a-9b6c-7d8e9f0a1b2",
                             "5b1e8a0c_3d4f_4e2a_9b6c_7d8e9f0a1b2c",
                             "zb1e8a0c-3d4f-4e2a-9b6c-7d8e9f0a1b2c"}) {
        auto reference = parse_vm_reference(name);
        ASSERT_TRUE(std::holds_alternative<VMName>(reference)) << name;
        EXPECT_EQ(std::get<VMName>(reference).value, name);
    }
}

TEST(VMReferenceTest, Describe) {
    EXPECT_EQ(describe(VMName{"web01"}), "VM 'web01'");
    EXPECT_EQ(describe(VMId{WEB_ID}), "VM " + WEB_ID);
}

TEST(PowerStateTest, ParsesDaemonNamesOnly) {
    EXPECT_EQ(power_state_from_string("Halted"), PowerState::Halted);
    EXPECT_EQ(power_state_from_string("Running"), PowerState::Running);
    EXPECT_EQ(power_state_from_string("Paused"), PowerState::Paused);
    EXPECT_EQ(power_state_from_string("Suspended"), PowerState::Suspended);
    EXPECT_FALSE(power_state_from_string("running").has_value());
    EXPECT_FALSE(power_state_from_string("Crashed").has_value());
    EXPECT_EQ(power_state_to_string(PowerState::Suspended), "Suspended");
}

TEST(ResolveTest, IdsArePassedThroughWithoutListing) {
    StrictMock<MockVMProvider> provider;

    auto id = provider.resolve(VMId{WEB_ID});

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, WEB_ID);
}

TEST(ResolveTest, UniqueNameResolvesToItsId) {
    StrictMock<MockVMProvider> provider;
    std::vector<VMSummary> vms = {
        {WEB_ID, "web", PowerState::Running},
        {DB_ID, "db", PowerState::Halted},
    };
    EXPECT_CALL(provider, list_vms()).WillOnce(Return(std::make_optional(vms)));

    auto id = provider.resolve(VMName{"db"});

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, DB_ID);
}

TEST(ResolveTest, NoMatchIsNotFound) {
    StrictMock<MockVMProvider> provider;
    std::vector<VMSummary> vms = {{WEB_ID, "web", PowerState::Running}};
    EXPECT_CALL(provider, list_vms()).WillOnce(Return(std::make_optional(vms)));

    EXPECT_FALSE(provider.resolve(VMName{"Web"}).has_value());
    EXPECT_EQ(provider.get_last_error().kind, ErrorKind::NotFound);
    EXPECT_THAT(provider.get_last_error().message, HasSubstr("'Web'"));
}

TEST(ResolveTest, SeveralMatchesAreAmbiguous) {
    StrictMock<MockVMProvider> provider;
    std::vector<VMSummary> vms = {
        {WEB_ID, "web", PowerState::Running},
        {DB_ID, "db", PowerState::Halted},
        {DB2_ID, "db", PowerState::Paused},
    };
    EXPECT_CALL(provider, list_vms()).WillOnce(Return(std::make_optional(vms)));

    EXPECT_FALSE(provider.resolve(VMName{"db"}).has_value());
    EXPECT_EQ(provider.get_last_error().kind, ErrorKind::AmbiguousReference);
    EXPECT_THAT(provider.get_last_error().message, HasSubstr(DB_ID));
    EXPECT_THAT(provider.get_last_error().message, HasSubstr(DB2_ID));
}

TEST(ResolveTest, ListFailureIsKept) {
    StrictMock<MockVMProvider> provider;
    EXPECT_CALL(provider, list_vms())
        .WillOnce([&provider]() -> std::optional<std::vector<VMSummary>> {
            provider.fail(ErrorKind::DaemonUnreachable, "connection refused");
            return std::nullopt;
        });

    EXPECT_FALSE(provider.resolve(VMName{"web"}).has_value());
    EXPECT_EQ(provider.get_last_error().kind, ErrorKind::DaemonUnreachable);
    EXPECT_EQ(provider.get_last_error().message, "connection refused");
}
