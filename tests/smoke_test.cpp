#include <gtest/gtest.h>

#include "farmledger/core/errors.hpp"

using namespace farmledger::core;

TEST(Status, DefaultIsOk){
    Status s{};
    EXPECT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(s.domain, StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(is_ok(s));
    EXPECT_EQ(error_code(s), 0u);
    EXPECT_EQ(error_code_name(s), nullptr);
}

TEST(Status, RegistryCodesAreBitExact){
    EXPECT_EQ(error_code(make_error(RegistryError::NotAuthorized)), 100u);
    EXPECT_EQ(error_code(make_error(RegistryError::AlreadyRegistered)), 101u);
    EXPECT_EQ(error_code(make_error(RegistryError::InvalidInput)), 102u);
    EXPECT_EQ(error_code(make_error(RegistryError::NotRegistered)), 103u);
    EXPECT_EQ(error_code(make_error(RegistryError::NotVerified)), 104u);
    EXPECT_EQ(error_code(make_error(RegistryError::AlreadyVerified)), 105u);
    EXPECT_EQ(error_code(make_error(RegistryError::InvalidStatus)), 106u);
}

TEST(Status, ClaimLogCodesAreBitExact){
    EXPECT_EQ(error_code(make_error(ClaimLogError::NotAuthorized)), 200u);
    EXPECT_EQ(error_code(make_error(ClaimLogError::NotVerified)), 202u);
    EXPECT_EQ(error_code(make_error(ClaimLogError::InvalidInput)), 203u);
    EXPECT_EQ(error_code(make_error(ClaimLogError::LogNotFound)), 204u);
    EXPECT_EQ(error_code(make_error(ClaimLogError::AlreadyModerated)), 205u);
}

TEST(Status, ErrorCategories){
    EXPECT_EQ(make_error(RegistryError::NotAuthorized).code, StatusCode::PermissionDenied);
    EXPECT_EQ(make_error(RegistryError::NotRegistered).code, StatusCode::NotFound);
    EXPECT_EQ(make_error(RegistryError::InvalidInput).code, StatusCode::Invalid);
    EXPECT_EQ(make_error(RegistryError::AlreadyVerified).code, StatusCode::Conflict);
    EXPECT_EQ(make_error(ClaimLogError::LogNotFound).code, StatusCode::NotFound);
    EXPECT_EQ(make_error(ClaimLogError::AlreadyModerated).code, StatusCode::Conflict);
    EXPECT_EQ(make_error(TransferError::InsufficientBalance).domain, StatusDomain::Ledger);
    EXPECT_EQ(error_code(make_error(TransferError::InsufficientBalance)), 1u);
    EXPECT_EQ(error_code(make_error(TransferError::SameAccount)), 2u);
    EXPECT_EQ(error_code(make_error(TransferError::NonPositiveAmount)), 3u);
}

TEST(Status, IsErrorChecksDomain){
    const Status reg = make_error(RegistryError::NotAuthorized);
    EXPECT_TRUE(is_error(reg, RegistryError::NotAuthorized));
    EXPECT_FALSE(is_error(reg, RegistryError::InvalidInput));
    EXPECT_FALSE(is_error(reg, ClaimLogError::NotAuthorized));
    EXPECT_FALSE(is_error(ok_status(), RegistryError::NotAuthorized));
}

TEST(Status, Names){
    EXPECT_STREQ(status_code_name(StatusCode::PermissionDenied), "PermissionDenied");
    EXPECT_STREQ(status_domain_name(StatusDomain::ClaimLog), "ClaimLog");
    EXPECT_STREQ(error_code_name(make_error(RegistryError::AlreadyVerified)), "AlreadyVerified");
    EXPECT_STREQ(error_code_name(make_error(ClaimLogError::LogNotFound)), "LogNotFound");
    EXPECT_STREQ(error_code_name(make_error(TransferError::SameAccount)), "SameAccount");
    EXPECT_EQ(error_code_name(make_status(StatusDomain::Db, StatusCode::Io)), nullptr);
}
