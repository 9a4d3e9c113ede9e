#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/cli/options/options.hpp"

namespace {
    cli::options::CliOptions parse_args(std::vector<const char*> args) {
        args.insert(args.begin(), "req_probe");
        return cli::options::parse(static_cast<int>(args.size()), args.data());
    }
}  // namespace

TEST(cli_options, url_only_defaults_to_get) {
    auto options = parse_args({"https://example.com"});
    ASSERT_EQ("https://example.com", options.url_);
    ASSERT_EQ("GET", *options.method_);
    ASSERT_FALSE(options.data_.has_value());
    ASSERT_FALSE(options.json_.has_value());
    ASSERT_FALSE(options.verbose_);
    ASSERT_FALSE(options.help_);
}

TEST(cli_options, short_and_long_forms) {
    auto short_form = parse_args({"-X", "post", "-d", "a=1&b=2", "https://example.com"});
    ASSERT_EQ("post", *short_form.method_);
    ASSERT_EQ("a=1&b=2", *short_form.data_);
    ASSERT_EQ("https://example.com", short_form.url_);

    auto long_form = parse_args({"https://example.com", "--method", "PUT", "--data", "k=v", "--verbose"});
    ASSERT_EQ("PUT", *long_form.method_);
    ASSERT_EQ("k=v", *long_form.data_);
    ASSERT_TRUE(long_form.verbose_);
}

TEST(cli_options, json_payload) {
    auto options = parse_args({"https://example.com", "--json", R"({"x":1})"});
    ASSERT_EQ(R"({"x":1})", *options.json_);
}

TEST(cli_options, help_without_url) {
    auto options = parse_args({"--help"});
    ASSERT_TRUE(options.help_);
    ASSERT_NE(std::string::npos, cli::options::usage("req_probe").find("--json"));
}

TEST(cli_options, usage_errors) {
    ASSERT_THROW(parse_args({}), cli::options::UsageError);
    ASSERT_THROW(parse_args({"https://example.com", "--bogus"}), cli::options::UsageError);
    ASSERT_THROW(parse_args({"https://example.com", "--json"}), cli::options::UsageError);
    ASSERT_THROW(parse_args({"https://a.example", "https://b.example"}), cli::options::UsageError);
}
