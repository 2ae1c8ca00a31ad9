/*
 * test_uri.cpp - Unit tests for URI class
 * This file is part of FLVTag.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * FLVTag is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flvtag.h"
#include "test_framework.h"

using namespace TestFramework;
using namespace FLVTag::IO;

class URI_LocalFileThreeSlashes : public TestCase {
public:
    URI_LocalFileThreeSlashes() : TestCase("URI_LocalFileThreeSlashes") {}
protected:
    void runTest() override {
        URI uri("file:///home/user/video/clip.flv");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should be file");
        ASSERT_EQUALS(std::string("/home/user/video/clip.flv"), uri.path(), "Path should match");
    }
};

class URI_LocalFileOneSlash : public TestCase {
public:
    URI_LocalFileOneSlash() : TestCase("URI_LocalFileOneSlash") {}
protected:
    void runTest() override {
        URI uri("file:/home/user/video/clip.flv");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should be file");
        ASSERT_EQUALS(std::string("/home/user/video/clip.flv"), uri.path(), "Path should match");
    }
};

class URI_NoScheme : public TestCase {
public:
    URI_NoScheme() : TestCase("URI_NoScheme") {}
protected:
    void runTest() override {
        URI uri("/home/user/video/clip.flv");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should default to file");
        ASSERT_EQUALS(std::string("/home/user/video/clip.flv"), uri.path(), "Path should match input");
        ASSERT_EQUALS(std::string("/home/user/video/clip.flv"), uri.str(), "Original string kept");
    }
};

class URI_RelativePath : public TestCase {
public:
    URI_RelativePath() : TestCase("URI_RelativePath") {}
protected:
    void runTest() override {
        URI uri("video/clip.flv");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should default to file");
        ASSERT_EQUALS(std::string("video/clip.flv"), uri.path(), "Path should match input");
    }
};

class URI_StdinDash : public TestCase {
public:
    URI_StdinDash() : TestCase("URI_StdinDash") {}
protected:
    void runTest() override {
        URI uri("-");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Dash is a local path");
        ASSERT_EQUALS(std::string("-"), uri.path(), "Dash kept as the path");
    }
};

class URI_HTTPScheme : public TestCase {
public:
    URI_HTTPScheme() : TestCase("URI_HTTPScheme") {}
protected:
    void runTest() override {
        URI uri("http://example.com/live/stream.flv");
        ASSERT_EQUALS(std::string("http"), uri.scheme(), "Scheme should be http");
        ASSERT_EQUALS(std::string("example.com/live/stream.flv"), uri.path(), "Path should exclude scheme://");
        ASSERT_EQUALS(std::string("http://example.com/live/stream.flv"), uri.str(), "Original string kept");
    }
};

class URI_HTTPSUpperCase : public TestCase {
public:
    URI_HTTPSUpperCase() : TestCase("URI_HTTPSUpperCase") {}
protected:
    void runTest() override {
        URI uri("HTTPS://example.com/stream.flv");
        ASSERT_EQUALS(std::string("https"), uri.scheme(), "Scheme should be lower-cased");
    }
};

class URI_CustomScheme : public TestCase {
public:
    URI_CustomScheme() : TestCase("URI_CustomScheme") {}
protected:
    void runTest() override {
        URI uri("rtmp://media.example.com/app");
        ASSERT_EQUALS(std::string("rtmp"), uri.scheme(), "Scheme should be rtmp");
        ASSERT_EQUALS(std::string("media.example.com/app"), uri.path(), "Path should exclude scheme://");
    }
};

class URI_EmptyString : public TestCase {
public:
    URI_EmptyString() : TestCase("URI_EmptyString") {}
protected:
    void runTest() override {
        URI uri("");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Empty string should default to file scheme");
        ASSERT_EQUALS(std::string(""), uri.path(), "Path should be empty");
    }
};

class URI_OnlySeparator : public TestCase {
public:
    URI_OnlySeparator() : TestCase("URI_OnlySeparator") {}
protected:
    void runTest() override {
        // An empty scheme is not a scheme
        URI uri("://");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should default to file");
        ASSERT_EQUALS(std::string("://"), uri.path(), "Whole string is the path");
    }
};

class URI_SpecialCharacters : public TestCase {
public:
    URI_SpecialCharacters() : TestCase("URI_SpecialCharacters") {}
protected:
    void runTest() override {
        URI uri("file:///path/with spaces/and+symbols.flv");
        ASSERT_EQUALS(std::string("file"), uri.scheme(), "Scheme should be file");
        ASSERT_EQUALS(std::string("/path/with spaces/and+symbols.flv"), uri.path(), "Path should preserve characters");
    }
};

int main() {
    TestSuite suite("URI Class Tests");

    suite.addTest(std::make_unique<URI_LocalFileThreeSlashes>());
    suite.addTest(std::make_unique<URI_LocalFileOneSlash>());
    suite.addTest(std::make_unique<URI_NoScheme>());
    suite.addTest(std::make_unique<URI_RelativePath>());
    suite.addTest(std::make_unique<URI_StdinDash>());
    suite.addTest(std::make_unique<URI_HTTPScheme>());
    suite.addTest(std::make_unique<URI_HTTPSUpperCase>());
    suite.addTest(std::make_unique<URI_CustomScheme>());
    suite.addTest(std::make_unique<URI_EmptyString>());
    suite.addTest(std::make_unique<URI_OnlySeparator>());
    suite.addTest(std::make_unique<URI_SpecialCharacters>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) + suite.getErrorCount(results);
}
