//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_resource_registry.cpp
// Purpose: Tests for resource registration, listing and reads
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "toolrpc/ResourceRegistry.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

namespace {
Resource textResource(const std::string& uri, const std::string& name) {
    Resource r;
    r.uri = uri;
    r.name = name;
    r.mimeType = "text/plain";
    r.provider = [](const std::string& u) { return ResourceContent::Text("content of " + u); };
    return r;
}
} // namespace

TEST(ResourceRegistry, ListIsOrderedByUri) {
    ResourceRegistry reg;
    reg.Register(textResource("mem://b", "B"));
    Resource a = textResource("mem://a", "A");
    a.description = "first";
    reg.Register(a);
    JSONValue list = reg.ListJSON();
    const auto& arr = std::get<JSONValue::Array>(list.value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(GetString(*arr[0], "uri").value_or(""), "mem://a");
    EXPECT_EQ(GetString(*arr[0], "description").value_or(""), "first");
    EXPECT_EQ(GetString(*arr[1], "uri").value_or(""), "mem://b");
    EXPECT_EQ(arr[1]->find("description"), nullptr);
}

TEST(ResourceRegistry, ReadShapesTextContent) {
    ResourceRegistry reg;
    reg.Register(textResource("mem://a", "A"));
    JSONValue result = reg.Read("mem://a");
    const auto& contents = std::get<JSONValue::Array>(result.find("contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetString(*contents[0], "uri").value_or(""), "mem://a");
    EXPECT_EQ(GetString(*contents[0], "mimeType").value_or(""), "text/plain");
    EXPECT_EQ(GetString(*contents[0], "text").value_or(""), "content of mem://a");
    EXPECT_EQ(contents[0]->find("blob"), nullptr);
}

TEST(ResourceRegistry, BlobContentOverridesMimeType) {
    ResourceRegistry reg;
    Resource r = textResource("mem://img", "Image");
    r.provider = [](const std::string&) { return ResourceContent::Blob("aGVsbG8=", std::string("image/png")); };
    reg.Register(r);
    JSONValue result = reg.Read("mem://img");
    const auto& item = *std::get<JSONValue::Array>(result.find("contents")->value)[0];
    EXPECT_EQ(GetString(item, "blob").value_or(""), "aGVsbG8=");
    EXPECT_EQ(GetString(item, "mimeType").value_or(""), "image/png");
    EXPECT_EQ(item.find("text"), nullptr);
}

TEST(ResourceRegistry, UnknownUriAndProviderFailure) {
    ResourceRegistry reg;
    EXPECT_THROW(reg.Read("mem://none"), errors::ResourceNotFoundError);
    Resource r = textResource("mem://bad", "Bad");
    r.provider = [](const std::string&) -> ResourceContent { throw std::runtime_error("disk gone"); };
    reg.Register(r);
    EXPECT_THROW(reg.Read("mem://bad"), std::runtime_error);
}

TEST(ResourceRegistry, InvalidRegistrations) {
    ResourceRegistry reg;
    EXPECT_THROW(reg.Register(textResource("", "x")), errors::ConfigurationError);
    EXPECT_THROW(reg.Register(textResource("mem://x", " ")), errors::ConfigurationError);
    Resource noProvider = textResource("mem://x", "X");
    noProvider.provider = nullptr;
    EXPECT_THROW(reg.Register(noProvider), errors::ConfigurationError);
    reg.Register(textResource("mem://x", "X"));
    EXPECT_THROW(reg.Register(textResource("mem://x", "Again")), errors::ConfigurationError);
    EXPECT_EQ(reg.Size(), 1u);
}

} // namespace toolrpc
