/* Copyright (c) 2025 The propstore authors */

#include <sstream>
#include <propstore/common/test.hpp>
#include "builder.hpp"

namespace {
    using namespace propstore;
    using namespace propstore::settings;
    using namespace std::string_literals;

    // one "key:value" per line, lists are not supported
    struct colon_format_t: codec::format_t {
        std::string_view name() const override
        {
            return "colon";
        }

        codec::parse_result_t parse(const std::string_view text) const override
        {
            codec::parse_result_t res {};
            std::istringstream is { std::string { text } };
            for (std::string line; std::getline(is, line); ) {
                const auto pos = line.find(':');
                if (pos == std::string::npos)
                    throw codec::err_parse_t { codec::diagnostics_t { codec::diagnostic_t { 1, line } } };
                res.table.insert_or_assign(line.substr(0, pos), line.substr(pos + 1));
            }
            return res;
        }

        std::string serialize(const table_t &table) const override
        {
            std::string res {};
            for (const auto &[k, v]: table)
                res += fmt::format("{}:{}\n", k, std::get<std::string>(v));
            return res;
        }
    };
}

suite propstore_settings_builder_suite = [] {
    "propstore::settings::builder"_test = [] {
        "properties"_test = [] {
            const auto s = builder().file_type_properties().build();
            expect_equal(std::string_view { "properties" }, s.format().name());
            expect(s.empty());
        };
        "properties by default"_test = [] {
            const auto s = builder().build();
            expect_equal(std::string_view { "properties" }, s.format().name());
        };
        "stores are independent"_test = [] {
            auto b = builder().file_type_properties();
            auto s1 = b.build();
            auto s2 = b.build();
            s1.set_property("K", "1");
            expect(s2.empty());
            expect_equal(std::optional<std::string> {}, s2.property("K"));
        };
        "custom format"_test = [] {
            auto s = builder().file_type(std::make_shared<colon_format_t>()).build();
            expect_equal(std::string_view { "colon" }, s.format().name());
            s.set_property("b", "2");
            s.set_property("a", "1");
            std::ostringstream os {};
            s.store(os);
            expect_equal("a:1\nb:2\n"s, os.str());
            std::istringstream is { "x:y\n" };
            s.load(is);
            expect_equal(std::vector<std::string> { "x" }, s.property_names());
            std::istringstream bad { "no colon\n" };
            expect(throws<codec::err_parse_t>([&] { s.load(bad); }));
            expect_equal(std::optional<std::string> { "y" }, s.property("x"));
        };
        "the last selection wins"_test = [] {
            const auto s = builder().file_type(std::make_shared<colon_format_t>()).file_type_properties().build();
            expect_equal(std::string_view { "properties" }, s.format().name());
        };
        "a null format is rejected"_test = [] {
            expect(throws<error>([] { builder().file_type(nullptr); }));
        };
    };
};
