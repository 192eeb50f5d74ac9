//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_catalog_loader.cpp
// Purpose: Tests for external catalog parsing, template rendering and registration
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "toolrpc/CatalogLoader.h"
#include "toolrpc/ToolRegistry.h"
#include "toolrpc/errors/Errors.h"

namespace toolrpc {

TEST(CatalogLoader, ParsesEntriesWithDefaultSchema) {
    auto entries = ParseCatalog(R"({"tools":[
        {"name":"greet","description":"Greets","content":"Hello {{who}}"},
        {"name":"sum","description":"Sums","inputSchema":{"type":"object","properties":{"a":{"type":"number"}}}}
    ]})");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "greet");
    EXPECT_EQ(GetString(entries[0].inputSchema, "type").value_or(""), "object");
    EXPECT_EQ(entries[0].content, "Hello {{who}}");
    EXPECT_TRUE(entries[1].content.empty());
    EXPECT_NE(entries[1].inputSchema.find("properties"), nullptr);
}

TEST(CatalogLoader, MalformedCatalogsAreConfigurationErrors) {
    EXPECT_THROW(ParseCatalog("{not json"), errors::ConfigurationError);
    EXPECT_THROW(ParseCatalog(R"({"tools":{}})"), errors::ConfigurationError);
    try {
        ParseCatalog(R"({"tools":[{"name":"a","description":"A"},{"name":"b"}]})");
        FAIL();
    } catch (const errors::ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()), "tools[1] ('b'): missing required field 'description'");
    }
    EXPECT_THROW(ParseCatalog(R"({"tools":[42]})"), errors::ConfigurationError);
}

TEST(CatalogLoader, RenderTemplateSubstitutesArguments) {
    JSONValue args = ParseJSON(R"({"who":"world","n":3})");
    EXPECT_EQ(RenderTemplate("Hello {{who}} x{{n}}{{missing}}!", args), "Hello world x3!");
    EXPECT_EQ(RenderTemplate("unclosed {{who", args), "unclosed {{who");
    EXPECT_EQ(RenderTemplate("", args), "");
}

TEST(CatalogLoader, RegistersExternalToolsWithRewrittenNames) {
    ToolRegistry reg;
    auto names = LoadCatalogJson(R"({"tools":[
        {"name":"Say Hello","description":"Greets","content":"Hi {{who}}",
         "inputSchema":{"type":"object","properties":{"who":{"type":"string"}}}}
    ]})", reg);
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "say_hello");
    CancellationHandle h;
    EXPECT_EQ(reg.Execute("say_hello", ParseJSON(R"({"who":"Ada"})"), h), JSONValue("Hi Ada"));
}

TEST(CatalogLoader, DuplicateCatalogEntryFailsLoad) {
    ToolRegistry reg;
    EXPECT_THROW(LoadCatalogJson(R"({"tools":[
        {"name":"dup","description":"one"},
        {"name":"dup","description":"two"}
    ]})", reg), errors::ConfigurationError);
}

TEST(CatalogLoader, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "toolrpc_catalog_test.json";
    {
        std::ofstream out(path);
        out << R"({"tools":[{"name":"ping","description":"Ping","content":"pong"}]})";
    }
    ToolRegistry reg;
    auto names = LoadCatalogFile(path, reg);
    std::remove(path.c_str());
    ASSERT_EQ(names.size(), 1u);
    EXPECT_TRUE(reg.Has("ping"));
    EXPECT_THROW(LoadCatalogFile(path + ".missing", reg), errors::ConfigurationError);
}

} // namespace toolrpc
