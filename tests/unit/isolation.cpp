#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <enclave/errors.hpp>
#include <enclave/isolation.hpp>

#include <enclave/detail/isolation/directory.hpp>

#include "support.hpp"

namespace enclave {
namespace {

using namespace enclave::testing;

descriptor_t
make_descriptor(const std::string& name, const std::string& domain = std::string()) {
    descriptor_t descriptor;

    descriptor.name = name;
    descriptor.domain = domain;

    return descriptor;
}

TEST(isolation, private_resources) {
    sandbox_t sandbox;

    write(sandbox.app("a") / "private.txt", "a");
    write(sandbox.app("b") / "other.txt", "b");

    auto host = sandbox.host();

    auto a = host->isolation().make(make_descriptor("a"));
    auto b = host->isolation().make(make_descriptor("b"));

    ASSERT_TRUE(a->resource("private.txt"));
    EXPECT_EQ(sandbox.app("a") / "private.txt", *a->resource("private.txt"));

    EXPECT_FALSE(b->resource("private.txt"));
    EXPECT_FALSE(a->resource("other.txt"));

    // Nothing outside of the boundary root is reachable.
    EXPECT_FALSE(b->resource("../a/private.txt"));
    EXPECT_FALSE(b->resource((sandbox.app("a") / "private.txt").string()));

    a->close();
    b->close();
}

TEST(isolation, shared_domain_resources) {
    sandbox_t sandbox;

    write(sandbox.domain("shared") / "common.txt", "common");
    write(sandbox.root() / "lib" / "host.txt", "host");

    auto host = sandbox.host();

    auto a = host->isolation().make(make_descriptor("a", "shared"));
    auto b = host->isolation().make(make_descriptor("b", "shared"));

    ASSERT_TRUE(a->resource("common.txt"));
    ASSERT_TRUE(b->resource("common.txt"));
    EXPECT_EQ(*a->resource("common.txt"), *b->resource("common.txt"));

    // Both applications share the very same domain boundary.
    EXPECT_EQ(a->parent(), b->parent());
    EXPECT_EQ("domain:shared", a->parent()->name());

    // The host tier is visible through every chain.
    ASSERT_TRUE(a->resource("host.txt"));
    EXPECT_EQ(sandbox.root() / "lib" / "host.txt", *a->resource("host.txt"));

    a->close();
    b->close();
}

TEST(isolation, domains_are_released) {
    sandbox_t sandbox;

    fs::create_directories(sandbox.domain("first"));
    fs::create_directories(sandbox.domain("second"));

    auto host = sandbox.host();

    auto a = host->isolation().make(make_descriptor("a", "first"));
    auto b = host->isolation().make(make_descriptor("b", "first"));

    EXPECT_EQ(std::vector<std::string>{"first"}, host->isolation().domains());

    a->close();
    a.reset();

    // Still referenced by the other application.
    EXPECT_EQ(std::vector<std::string>{"first"}, host->isolation().domains());

    b->close();
    b.reset();

    EXPECT_TRUE(host->isolation().domains().empty());

    auto c = host->isolation().make(make_descriptor("c", "second"));

    EXPECT_EQ(std::vector<std::string>{"second"}, host->isolation().domains());

    // A domain comes back as a fresh boundary once it is needed again.
    auto d = host->isolation().make(make_descriptor("d", "first"));

    EXPECT_EQ((std::vector<std::string>{"first", "second"}), host->isolation().domains());
    EXPECT_NE(c->parent(), d->parent());

    c->close();
    d->close();
}

TEST(isolation, application_resources_shadow_domain_ones) {
    sandbox_t sandbox;

    write(sandbox.domain("default") / "settings.txt", "domain");
    write(sandbox.app("a") / "settings.txt", "application");

    auto host = sandbox.host();

    auto a = host->isolation().make(make_descriptor("a"));
    auto b = host->isolation().make(make_descriptor("b", "default"));

    EXPECT_EQ(sandbox.app("a") / "settings.txt", *a->resource("settings.txt"));
    EXPECT_EQ(sandbox.domain("default") / "settings.txt", *b->resource("settings.txt"));

    a->close();
    b->close();
}

TEST(isolation, default_domain_is_not_checked) {
    sandbox_t sandbox;

    auto host = sandbox.host();

    ASSERT_FALSE(fs::exists(sandbox.domain("default")));

    auto loader = host->isolation().make(make_descriptor("a"));

    ASSERT_TRUE(loader->parent());
    EXPECT_EQ("domain:default", loader->parent()->name());
    EXPECT_EQ(host->isolation().root(), loader->parent()->parent());

    loader->close();
}

TEST(isolation, missing_named_domain) {
    sandbox_t sandbox;

    auto host = sandbox.host();

    try {
        host->isolation().make(make_descriptor("a", "nowhere"));
        FAIL() << "missing domain must be reported";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::domain_not_found, e.code());
        EXPECT_EQ("a", e.application());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("nowhere"));
    }
}

TEST(isolation, close_is_idempotent) {
    sandbox_t sandbox;

    auto host = sandbox.host();
    auto loader = host->isolation().make(make_descriptor("a"));

    EXPECT_FALSE(loader->closed());

    loader->close();
    loader->close();

    EXPECT_TRUE(loader->closed());

    // A closed boundary resolves nothing of its own.
    write(sandbox.app("a") / "late.txt", "");
    EXPECT_FALSE(loader->resource("late.txt"));
}

TEST(isolation, missing_symbols) {
    sandbox_t sandbox;

    auto host = sandbox.host();
    auto loader = host->isolation().make(make_descriptor("a"));

    EXPECT_EQ(nullptr, loader->symbol("enclave_definitely_missing_symbol"));
    EXPECT_EQ(nullptr, loader->function<void (*)()>("enclave_definitely_missing_symbol"));

    loader->close();
}

TEST(isolation, broken_shared_object) {
    sandbox_t sandbox;

    write(sandbox.app("a") / "lib" / "broken.so", "definitely not an ELF file");

    auto host = sandbox.host();

    try {
        host->isolation().make(make_descriptor("a"));
        FAIL() << "broken shared object must be reported";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::dlopen_error, e.code());
    }
}

}  // namespace
}  // namespace enclave
