#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <enclave/config.hpp>
#include <enclave/defaults.hpp>
#include <enclave/errors.hpp>

#include "support.hpp"

namespace enclave {
namespace {

using namespace enclave::testing;

TEST(config, full) {
    sandbox_t sandbox;

    const auto path = sandbox.root() / "enclave.json";

    write(path, format(
        "{{"
        "  \"version\": 1,"
        "  \"paths\": {{\"root\": \"{}\", \"plugins\": \"/opt/enclave/plugins\"}},"
        "  \"deploy\": {{\"reload-interval\": 500, \"anchor-interval\": 250, \"applications\": [\"a\", \"b\"]}},"
        "  \"logging\": {{"
        "    \"severity\": \"warning\","
        "    \"console\": {{\"stream\": \"stderr\", \"colored\": false}},"
        "    \"loggers\": {{\"core\": []}}"
        "  }},"
        "}}",
        sandbox.root().string()
    ));

    const auto config = make_config(path.string());

    EXPECT_EQ(sandbox.root().string(), config->path().root());
    EXPECT_EQ(std::vector<std::string>{"/opt/enclave/plugins"}, config->path().plugins());
    EXPECT_EQ(std::chrono::milliseconds(500), config->deploy().reload_interval());
    EXPECT_EQ(std::chrono::milliseconds(250), config->deploy().anchor_interval());
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), config->deploy().applications());
    EXPECT_EQ(logging::warning, config->logging().severity());
    EXPECT_EQ("{\"core\":[]}", config->logging().loggers());
    EXPECT_EQ("stderr", config->logging().console());
    EXPECT_FALSE(config->logging().colored());
}

TEST(config, defaults) {
    sandbox_t sandbox;

    const auto path = sandbox.root() / "enclave.json";

    write(path, format("{{\"version\": 1, \"paths\": {{\"root\": \"{}\"}}}}", sandbox.root().string()));

    const auto config = make_config(path.string());

    EXPECT_EQ(std::vector<std::string>{defaults::plugins_path}, config->path().plugins());
    EXPECT_EQ(defaults::reload_interval, config->deploy().reload_interval());
    EXPECT_EQ(std::chrono::milliseconds(3000), config->deploy().reload_interval());
    EXPECT_EQ(defaults::anchor_interval, config->deploy().anchor_interval());
    EXPECT_TRUE(config->deploy().applications().empty());
    EXPECT_EQ(logging::info, config->logging().severity());
    EXPECT_EQ("{}", config->logging().loggers());
    EXPECT_EQ("stdout", config->logging().console());
    EXPECT_TRUE(config->logging().colored());
}

TEST(config, invalid) {
    sandbox_t sandbox;

    const auto path = sandbox.root() / "enclave.json";

    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, "{\"version\": 2}");
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, "{\"version\": 1, \"paths\": {\"root\": \"/definitely/not/here\"}}");
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, format("{{\"version\": 1, \"paths\": {{\"root\": \"{}\"}}, \"deploy\": {{\"reload-interval\": 0}}}}",
        sandbox.root().string()));
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, format("{{\"version\": 1, \"paths\": {{\"root\": \"{}\"}}, \"logging\": {{\"severity\": \"loud\"}}}}",
        sandbox.root().string()));
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, format("{{\"version\": 1, \"paths\": {{\"root\": \"{}\"}}, "
        "\"logging\": {{\"console\": {{\"stream\": \"syslog\"}}}}}}", sandbox.root().string()));
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, format("{{\"version\": 1, \"paths\": {{\"root\": \"{}\"}}, "
        "\"logging\": {{\"console\": {{\"colored\": \"yes\"}}}}}}", sandbox.root().string()));
    EXPECT_THROW(make_config(path.string()), std::system_error);

    write(path, "{\"version\": 1, ");
    EXPECT_THROW(make_config(path.string()), std::system_error);
}

}  // namespace
}  // namespace enclave
