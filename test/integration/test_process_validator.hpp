#ifndef REDACTOR_TEST_INTEGRATION_TEST_PROCESS_VALIDATOR_HPP
#define REDACTOR_TEST_INTEGRATION_TEST_PROCESS_VALIDATOR_HPP

#include <chrono>
#include <memory>
#include <gtest/gtest.h>
#include "engine/process_validator.hpp"
#include "engine/redaction_engine.hpp"
#include "test_helpers.hpp"

namespace {

using redactor::engine::ProcessValidator;
using redactor::engine::ValidatorInvocationError;
using redactor::test::TempDir;

TEST(ProcessValidatorTest, ExitStatusDecides) {
    TempDir dir;
    ProcessValidator validator(dir.writeScript("ipv4", redactor::test::IPV4_VALIDATOR_SCRIPT));

    EXPECT_TRUE(validator.validate("10.10.255.1"));
    EXPECT_FALSE(validator.validate("10.10.299.1"));
    EXPECT_FALSE(validator.validate("10.10.1"));
}

TEST(ProcessValidatorTest, CandidateIsPassedAsSingleArgument) {
    TempDir dir;
    std::string log = dir.sub("args");
    ProcessValidator validator(dir.writeScript("echo", "printf '%s|%s\\n' \"$#\" \"$1\" >> '" + log + "'\nexit 0\n"));

    EXPECT_TRUE(validator.validate("two words; $(rm -rf /)"));
    EXPECT_EQ(dir.read("args"), "1|two words; $(rm -rf /)\n");
}

TEST(ProcessValidatorTest, MissingExecutableIsALaunchFailure) {
    TempDir dir;
    ProcessValidator validator(dir.sub("does-not-exist"));
    try {
        validator.validate("x");
        FAIL() << "expected ValidatorInvocationError";
    } catch (const ValidatorInvocationError &ex) {
        EXPECT_EQ(ex.kind(), ValidatorInvocationError::Kind::LaunchFailed);
    }
}

TEST(ProcessValidatorTest, NonExecutableFileIsALaunchFailure) {
    TempDir dir;
    ProcessValidator validator(dir.write("plain", "exit 0\n"));
    try {
        validator.validate("x");
        FAIL() << "expected ValidatorInvocationError";
    } catch (const ValidatorInvocationError &ex) {
        EXPECT_EQ(ex.kind(), ValidatorInvocationError::Kind::LaunchFailed);
    }
}

TEST(ProcessValidatorTest, SignalIsACrash) {
    TempDir dir;
    ProcessValidator validator(dir.writeScript("crash", "kill -9 $$\n"));
    try {
        validator.validate("x");
        FAIL() << "expected ValidatorInvocationError";
    } catch (const ValidatorInvocationError &ex) {
        EXPECT_EQ(ex.kind(), ValidatorInvocationError::Kind::Crashed);
    }
}

TEST(ProcessValidatorTest, TimeoutIsARejection) {
    TempDir dir;
    ProcessValidator validator(dir.writeScript("slow", "exec sleep 10\n"), std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(validator.validate("x"));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessValidatorTest, EngineCallsTheScriptOncePerDistinctText) {
    TempDir dir;
    std::string log = dir.sub("calls");
    std::string script = dir.writeScript("count", "echo \"$1\" >> '" + log + "'\nexit 0\n");

    redactor::catalog::Catalog catalog;
    catalog.push_back(redactor::test::makeSecretType(
        "ipv4_address", {R"(\d+\.\d+\.\d+\.\d+)", R"(from (\S+))"}, {},
        std::make_shared<ProcessValidator>(script)));
    redactor::engine::RedactionEngine engine(std::move(catalog));

    EXPECT_EQ(engine.redact("from 10.0.0.1 to 10.0.0.2, from 10.0.0.1 again"),
              "from ipv4_address0 to ipv4_address1, from ipv4_address0 again");
    EXPECT_EQ(dir.read("calls"), "10.0.0.1\n10.0.0.2\n");
}

} // anonymous namespace

#endif // REDACTOR_TEST_INTEGRATION_TEST_PROCESS_VALIDATOR_HPP
