/*
 * test_byte_order.cpp - Unit tests for the big-endian field helpers
 * This file is part of FLVTag.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 */

#include "flvtag.h"
#include "test_framework.h"

using namespace TestFramework;
using namespace FLVTag::Core::Utility::ByteOrder;

class Get24Test : public TestCase {
public:
    Get24Test() : TestCase("get24 decodes big-endian") {}

protected:
    void runTest() override {
        const uint8_t b[] = {0x12, 0x34, 0x56, 0xFF};
        ASSERT_EQUALS(0x123456u, get24(b), "get24 must read three bytes MSB first");

        const uint8_t max[] = {0xFF, 0xFF, 0xFF};
        ASSERT_EQUALS(0xFFFFFFu, get24(max), "get24 maximum");

        uint8_t out[3] = {0, 0, 0};
        put24(out, 0xAB0102u);
        ASSERT_EQUALS(0xABu, static_cast<unsigned>(out[0]), "put24 high byte");
        ASSERT_EQUALS(0x01u, static_cast<unsigned>(out[1]), "put24 middle byte");
        ASSERT_EQUALS(0x02u, static_cast<unsigned>(out[2]), "put24 low byte");

        // Only the low 24 bits survive
        put24(out, 0xFF000009u);
        ASSERT_EQUALS(9u, get24(out), "put24 drops bits above 24");
    }
};

class Get32Test : public TestCase {
public:
    Get32Test() : TestCase("get32 decodes big-endian") {}

protected:
    void runTest() override {
        const uint8_t nine[] = {0, 0, 0, 9};
        ASSERT_EQUALS(9u, get32(nine), "header length field");

        const uint8_t b[] = {0xDE, 0xAD, 0xBE, 0xEF};
        ASSERT_EQUALS(0xDEADBEEFu, get32(b), "get32 full range");

        uint8_t out[4];
        put32(out, 0x01020304u);
        ASSERT_EQUALS(1u, static_cast<unsigned>(out[0]), "put32 byte 0");
        ASSERT_EQUALS(4u, static_cast<unsigned>(out[3]), "put32 byte 3");
    }
};

class TimestampLayoutTest : public TestCase {
public:
    TimestampLayoutTest() : TestCase("Timestamp extension byte is the high byte") {}

protected:
    void runTest() override {
        const uint8_t zero[] = {0, 0, 0, 0};
        ASSERT_EQUALS(0, getTimestamp(zero), "zero timestamp");

        const uint8_t low[] = {0x00, 0x03, 0xE8, 0x00};
        ASSERT_EQUALS(1000, getTimestamp(low), "1000 ms without extension");

        const uint8_t extended[] = {0x00, 0x00, 0x01, 0x7F};
        ASSERT_EQUALS(static_cast<int64_t>(0x7F000001), getTimestamp(extended), "extension supplies bits 24-31");

        const uint8_t all[] = {0xFF, 0xFF, 0xFF, 0xFF};
        ASSERT_EQUALS(static_cast<int64_t>(0xFFFFFFFFLL), getTimestamp(all), "largest timestamp is unsigned");

        uint8_t out[4];
        putTimestamp(out, 0x12345678);
        ASSERT_EQUALS(0x34u, static_cast<unsigned>(out[0]), "bits 16-23 first");
        ASSERT_EQUALS(0x56u, static_cast<unsigned>(out[1]), "bits 8-15 second");
        ASSERT_EQUALS(0x78u, static_cast<unsigned>(out[2]), "bits 0-7 third");
        ASSERT_EQUALS(0x12u, static_cast<unsigned>(out[3]), "bits 24-31 last");
    }
};

class TimestampBoundaryTest : public TestCase {
public:
    TimestampBoundaryTest() : TestCase("Timestamp encode/decode at boundaries") {}

protected:
    void runTest() override {
        const int64_t values[] = {0, 1, 0xFFFFFF, 0x1000000, 0x7FFFFFFF, 0x80000000LL, 0xFFFFFFFFLL};
        for (int64_t v : values) {
            uint8_t field[4];
            putTimestamp(field, v);
            ASSERT_EQUALS(v, getTimestamp(field), "timestamp boundary value");
        }
    }
};

int main() {
    if (const char* channels = std::getenv("FLVTAG_DEBUG")) {
        Debug::initFromString(channels);
    }

    TestSuite suite("ByteOrder Tests");

    suite.addTest(std::make_unique<Get24Test>());
    suite.addTest(std::make_unique<Get32Test>());
    suite.addTest(std::make_unique<TimestampLayoutTest>());
    suite.addTest(std::make_unique<TimestampBoundaryTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) + suite.getErrorCount(results);
}
