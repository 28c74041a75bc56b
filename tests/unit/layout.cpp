#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <enclave/errors.hpp>
#include <enclave/layout.hpp>

#include "support.hpp"

namespace enclave {
namespace {

using namespace enclave::testing;

TEST(layout, paths) {
    layout_t layout("/srv/enclave");

    EXPECT_EQ("/srv/enclave/apps/demo", layout.application("demo").string());
    EXPECT_EQ("/srv/enclave/apps/demo-anchor.txt", layout.anchor("demo").string());
    EXPECT_EQ("/srv/enclave/apps/demo/enclave-deploy.json", layout.descriptor("demo").string());
    EXPECT_EQ("/srv/enclave/domains/shared", layout.domain("shared").string());
    EXPECT_EQ("/srv/enclave/lib", layout.libraries().string());
}

TEST(layout, resolve) {
    sandbox_t sandbox;

    write(sandbox.app("demo") / "a.json", "{}");
    write(sandbox.app("demo") / "conf" / "b.properties", "");

    layout_t layout(sandbox.root());

    const auto paths = layout.resolve("demo", {"a.json", "conf/b.properties"});

    ASSERT_EQ(2u, paths.size());
    EXPECT_EQ(sandbox.app("demo") / "a.json", paths[0]);
    EXPECT_EQ(sandbox.app("demo") / "conf" / "b.properties", paths[1]);
    EXPECT_TRUE(paths[0].is_absolute());
}

TEST(layout, resolve_missing_resource) {
    sandbox_t sandbox;

    write(sandbox.app("demo") / "a.json", "{}");

    layout_t layout(sandbox.root());

    try {
        layout.resolve("demo", {"a.json", "missing.json"});
        FAIL() << "missing resource must not resolve";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::installation_failed, e.code());
        EXPECT_EQ("demo", e.application());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("demo"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr((sandbox.app("demo") / "missing.json").string()));
    }
}

}  // namespace
}  // namespace enclave
