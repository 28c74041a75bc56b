#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <enclave/anchor.hpp>
#include <enclave/api/context.hpp>
#include <enclave/application.hpp>
#include <enclave/defaults.hpp>
#include <enclave/errors.hpp>
#include <enclave/monitor.hpp>

#include <enclave/detail/context/basic.hpp>

#include <boost/filesystem/fstream.hpp>

#include "support.hpp"

namespace enclave {
namespace {

using namespace enclave::testing;

typedef application_t::state_t state_t;

std::string
read(const fs::path& path) {
    fs::ifstream stream(path);
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

std::string
property(const application_t& application, const std::string& key) {
    const auto snapshot = application.snapshot();

    if(!snapshot->context) {
        return std::string();
    }

    const auto properties = snapshot->context->properties();
    const auto it = properties.find(key);

    return it == properties.end() ? std::string() : it->second;
}

struct faults_t {
    faults_t():
        start(false),
        stop(false)
    { }

    std::atomic<bool> start;
    std::atomic<bool> stop;
};

// Basic context which fails on demand.
class faulty_context_t:
    public api::runtime_context_t
{
    const std::unique_ptr<api::runtime_context_t> m_inner;
    const faults_t& m_faults;

public:
    faulty_context_t(std::unique_ptr<api::runtime_context_t> inner, const faults_t& faults):
        m_inner(std::move(inner)),
        m_faults(faults)
    { }

    void
    start() {
        if(m_faults.start) {
            throw std::runtime_error("port 8080 is busy");
        }

        m_inner->start();
    }

    void
    stop() {
        if(m_faults.stop) {
            throw std::runtime_error("connections are still draining");
        }

        m_inner->stop();
    }

    void
    dispose() {
        m_inner->dispose();
    }

    bool
    started() const {
        return m_inner->started();
    }

    bool
    disposed() const {
        return m_inner->disposed();
    }

    subscription_t
    listen(std::shared_ptr<api::listener_t> listener) {
        return m_inner->listen(std::move(listener));
    }

    api::properties_t
    properties() const {
        return m_inner->properties();
    }
};

class faulty_factory_t:
    public api::context_factory_t
{
    context::basic_factory_t m_inner;
    const faults_t& m_faults;

public:
    faulty_factory_t(host_t& host, const faults_t& faults):
        m_inner(host),
        m_faults(faults)
    { }

    std::unique_ptr<api::runtime_context_t>
    create(api::builder_chain_t builders, const descriptor_t& descriptor, const api::loader_t& loader) {
        return std::unique_ptr<api::runtime_context_t>(
            new faulty_context_t(m_inner.create(std::move(builders), descriptor, loader), m_faults)
        );
    }
};

struct application_fixture_t: public ::testing::Test {
    sandbox_t sandbox;
    counters_t counters;
    faults_t faults;
    std::unique_ptr<host_t> host;

    void
    SetUp() {
        host = sandbox.host(std::chrono::milliseconds(50));
        host->replace(std::unique_ptr<isolation_t>(new counted_isolation_t(*host, counters)));
        host->replace(std::unique_ptr<api::context_factory_t>(new faulty_factory_t(*host, faults)));
    }

    std::shared_ptr<application_t>
    make(const std::string& name) {
        return std::make_shared<application_t>(*host, name);
    }
};

TEST_F(application_fixture_t, lifecycle) {
    sandbox.install("demo", "{\"greeting\": \"hello\"}");

    auto app = make("demo");

    EXPECT_EQ(state_t::uninstalled, app->state());

    app->install();
    EXPECT_EQ(state_t::installed, app->state());
    EXPECT_FALSE(app->snapshot()->context);
    EXPECT_TRUE(app->snapshot()->loader);
    ASSERT_EQ(1u, app->snapshot()->resources.size());
    EXPECT_EQ(sandbox.app("demo") / "enclave-config.json", app->snapshot()->resources[0]);

    app->init();
    EXPECT_EQ(state_t::initialized, app->state());
    ASSERT_TRUE(app->snapshot()->context);
    EXPECT_EQ("hello", property(*app, "greeting"));
    EXPECT_EQ("demo", property(*app, "app.name"));
    EXPECT_EQ(sandbox.app("demo").string(), property(*app, "app.home"));

    app->start();
    EXPECT_EQ(state_t::started, app->state());
    EXPECT_TRUE(app->snapshot()->context->started());

    app->stop();
    EXPECT_EQ(state_t::stopped, app->state());
    EXPECT_FALSE(app->snapshot()->context->started());

    app->dispose();
    EXPECT_EQ(state_t::disposed, app->state());
    EXPECT_FALSE(app->snapshot()->context);
    EXPECT_FALSE(app->snapshot()->loader);

    EXPECT_EQ(1, counters.constructed);
    EXPECT_EQ(1, counters.closed);
}

TEST_F(application_fixture_t, anchor_marker) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();

    const auto anchor = sandbox.root() / "apps" / "demo-anchor.txt";

    ASSERT_TRUE(fs::exists(anchor));
    EXPECT_EQ(defaults::anchor_blurb, read(anchor));

    app->dispose();

    // The marker outlives the generation.
    EXPECT_TRUE(fs::exists(anchor));
}

TEST_F(application_fixture_t, missing_resource) {
    sandbox.install("badApp", "{}", "{\"resources\": [\"enclave-config.json\", \"absent.json\"]}");

    auto app = make("badApp");

    try {
        app->install();
        FAIL() << "installation must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::installation_failed, e.code());
        EXPECT_EQ("badApp", e.application());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("badApp"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr((sandbox.app("badApp") / "absent.json").string()));
    }

    // The marker is created before the paths are validated.
    EXPECT_TRUE(fs::exists(sandbox.root() / "apps" / "badApp-anchor.txt"));

    EXPECT_EQ(state_t::uninstalled, app->state());
    EXPECT_EQ(0, counters.constructed);
}

TEST_F(application_fixture_t, malformed_descriptor) {
    sandbox.install("demo", "{}", "{\"resources\": ");

    auto app = make("demo");

    try {
        app->install();
        FAIL() << "installation must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::installation_failed, e.code());

        // The root cause is attached.
        try {
            std::rethrow_if_nested(e);
            FAIL() << "root cause must be nested";
        } catch(const std::system_error& inner) {
            EXPECT_EQ(error::descriptor_malformed, inner.code());
        }
    }
}

TEST_F(application_fixture_t, anchor_write_failure) {
    sandbox.install("demo", "{}");

    // Nothing can write a marker file where a directory stands.
    fs::create_directories(sandbox.root() / "apps" / "demo-anchor.txt");

    auto app = make("demo");

    try {
        app->install();
        FAIL() << "installation must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::installation_failed, e.code());
        EXPECT_EQ("demo", e.application());
        EXPECT_THAT(error::root_cause(e), ::testing::HasSubstr("demo-anchor.txt"));
    }

    EXPECT_EQ(state_t::uninstalled, app->state());
    EXPECT_EQ(0, counters.constructed);
}

TEST_F(application_fixture_t, install_twice) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();

    const auto previous = app->snapshot()->loader;

    app->install();

    EXPECT_EQ(state_t::installed, app->state());
    EXPECT_NE(previous, app->snapshot()->loader);

    // The previous boundary is closed before the new one is built.
    EXPECT_TRUE(previous->closed());
    EXPECT_EQ(2, counters.constructed);
    EXPECT_EQ(1, counters.closed);

    app->dispose();

    EXPECT_EQ(counters.constructed, counters.closed);
}

TEST_F(application_fixture_t, install_over_started_generation) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto context = app->snapshot()->context;

    app->install();

    EXPECT_EQ(state_t::installed, app->state());
    EXPECT_FALSE(app->snapshot()->context);
    EXPECT_FALSE(app->snapshot()->monitor);
    EXPECT_TRUE(context->disposed());
    EXPECT_EQ(1, counters.closed);

    app->init();
    app->start();

    EXPECT_EQ(state_t::started, app->state());

    app->dispose();
}

TEST_F(application_fixture_t, missing_domain) {
    sandbox.install("demo", "{}", "{\"domain\": \"nowhere\"}");

    auto app = make("demo");

    try {
        app->install();
        FAIL() << "installation must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::domain_not_found, e.code());
        EXPECT_EQ("demo", e.application());
    }
}

TEST_F(application_fixture_t, initialization_failure) {
    sandbox.install("demo", "{\"broken\": ", "{\"redeployment\": true}");

    auto app = make("demo");

    app->install();

    try {
        app->init();
        FAIL() << "initialization must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::initialization_failed, e.code());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("enclave-config.json"));
    }

    // No live context is left behind.
    EXPECT_EQ(state_t::installed, app->state());
    EXPECT_FALSE(app->snapshot()->context);
    EXPECT_FALSE(app->snapshot()->monitor);

    app->dispose();

    EXPECT_EQ(state_t::disposed, app->state());
    EXPECT_EQ(1, counters.closed);
}

TEST_F(application_fixture_t, unknown_builder) {
    sandbox.install("demo", "{}", "{\"builder\": \"groovy\"}");

    auto app = make("demo");

    app->install();

    try {
        app->init();
        FAIL() << "initialization must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::initialization_failed, e.code());
        EXPECT_THAT(error::root_cause(e), ::testing::HasSubstr("groovy"));
    }

    app->dispose();
}

TEST_F(application_fixture_t, stop_before_init) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    EXPECT_NO_THROW(app->stop());

    app->install();

    EXPECT_NO_THROW(app->stop());
    EXPECT_EQ(state_t::installed, app->state());

    app->dispose();
}

TEST_F(application_fixture_t, start_before_init) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();

    try {
        app->start();
        FAIL() << "start must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::start_failed, e.code());
    }

    app->dispose();
}

TEST_F(application_fixture_t, start_failure) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();

    faults.start = true;

    try {
        app->start();
        FAIL() << "start must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::start_failed, e.code());
        EXPECT_EQ("demo", e.application());
        EXPECT_EQ("port 8080 is busy", error::root_cause(e));
    }

    EXPECT_EQ(state_t::initialized, app->state());
    EXPECT_FALSE(app->snapshot()->context->started());

    faults.start = false;

    app->start();
    EXPECT_EQ(state_t::started, app->state());

    app->dispose();
}

TEST_F(application_fixture_t, stop_failure) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    faults.stop = true;

    try {
        app->stop();
        FAIL() << "stop must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::stop_failed, e.code());
        EXPECT_EQ("connections are still draining", error::root_cause(e));
    }

    EXPECT_EQ(state_t::started, app->state());

    faults.stop = false;

    app->dispose();
}

TEST_F(application_fixture_t, dispose_ignores_stop_failure) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto context = app->snapshot()->context;
    const auto loader = app->snapshot()->loader;

    faults.stop = true;

    EXPECT_NO_THROW(app->dispose());

    EXPECT_EQ(state_t::disposed, app->state());
    EXPECT_FALSE(app->snapshot()->context);
    EXPECT_TRUE(context->disposed());

    // The boundary is released regardless.
    EXPECT_TRUE(loader->closed());
    EXPECT_EQ(1, counters.closed);
}

TEST_F(application_fixture_t, double_dispose) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    app->dispose();
    EXPECT_NO_THROW(app->dispose());

    EXPECT_EQ(state_t::disposed, app->state());
    EXPECT_EQ(1, counters.constructed);
    EXPECT_EQ(1, counters.closed);
}

TEST_F(application_fixture_t, dispose_never_installed) {
    auto app = make("demo");

    EXPECT_NO_THROW(app->dispose());
    EXPECT_EQ(state_t::uninstalled, app->state());
}

TEST_F(application_fixture_t, double_redeploy) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    app->redeploy();
    app->redeploy();

    EXPECT_EQ(state_t::started, app->state());

    // Every generation but the current one has been closed.
    EXPECT_EQ(3, counters.constructed);
    EXPECT_EQ(counters.constructed - 1, counters.closed);

    app->dispose();

    EXPECT_EQ(counters.constructed, counters.closed);
}

TEST_F(application_fixture_t, redeploy_picks_up_changes) {
    sandbox.install("demo", "{\"greeting\": \"hello\"}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    write(sandbox.app("demo") / "enclave-config.json", "{\"greeting\": \"bye\"}");

    app->redeploy();

    EXPECT_EQ("bye", property(*app, "greeting"));

    app->dispose();
}

TEST_F(application_fixture_t, redeploy_surfaces_stage_errors) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    write(sandbox.app("demo") / "enclave-config.json", "{\"broken\": ");

    try {
        app->redeploy();
        FAIL() << "redeploy must fail";
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ(error::initialization_failed, e.code());
    }

    app->dispose();

    EXPECT_EQ(counters.constructed, counters.closed);
}

TEST_F(application_fixture_t, concurrent_redeploys_are_serialized) {
    host->replace(std::unique_ptr<isolation_t>(
        new counted_isolation_t(*host, counters, std::chrono::milliseconds(50))
    ));

    sandbox.install("demo", "{}", "{\"redeployment\": false}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    std::thread first([&] { app->redeploy(); });
    std::thread second([&] { app->redeploy(); });

    first.join();
    second.join();

    EXPECT_EQ(1, counters.peak);
    EXPECT_EQ(3, counters.constructed);
    EXPECT_EQ(2, counters.closed);
    EXPECT_EQ(state_t::started, app->state());

    app->dispose();
}

TEST_F(application_fixture_t, monitor_follows_context) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();

    const auto monitor = app->snapshot()->monitor;

    ASSERT_TRUE(monitor);

    // Registered, but the scheduler is created only once the context has started.
    EXPECT_FALSE(monitor->armed());

    app->start();

    ASSERT_TRUE(eventually([&] { return monitor->armed(); }));

    app->stop();

    ASSERT_TRUE(eventually([&] { return !monitor->armed(); }));

    app->dispose();
}

TEST_F(application_fixture_t, redeployment_disabled) {
    sandbox.install("demo", "{}", "{\"redeployment\": false}");

    auto app = make("demo");

    app->install();
    app->init();

    EXPECT_FALSE(app->snapshot()->monitor);

    app->dispose();
}

TEST_F(application_fixture_t, hot_redeploy) {
    sandbox.install("demo", "{\"greeting\": \"hello\"}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    EXPECT_EQ("hello", property(*app, "greeting"));

    const auto monitor = app->snapshot()->monitor;

    ASSERT_TRUE(eventually([&] { return monitor->armed(); }));

    const auto config = sandbox.app("demo") / "enclave-config.json";

    // Well within one second of the baseline taken at initialization.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    write(config, "{\"greeting\": \"hiya\"}");

    ASSERT_TRUE(eventually([&] {
        return app->state() == state_t::started && property(*app, "greeting") == "hiya";
    }));

    EXPECT_EQ(2, counters.constructed);
    EXPECT_EQ(1, counters.closed);

    // The previous generation's monitor is gone, the new one takes over.
    EXPECT_FALSE(monitor->armed());
    ASSERT_TRUE(eventually([&] { return app->snapshot()->monitor && app->snapshot()->monitor->armed(); }));

    app->dispose();

    // Wait for the poll which has triggered the redeploy to let go of the previous monitor.
    EXPECT_TRUE(eventually([&] { return monitor.use_count() == 1; }));
}

TEST_F(application_fixture_t, back_to_back_changes) {
    host->replace(std::unique_ptr<isolation_t>(
        new counted_isolation_t(*host, counters, std::chrono::milliseconds(30))
    ));

    sandbox.install("demo", "{\"revision\": \"0\"}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto config = sandbox.app("demo") / "enclave-config.json";

    for(int revision = 1; revision <= 2; ++revision) {
        ASSERT_TRUE(eventually([&] { return app->snapshot()->monitor && app->snapshot()->monitor->armed(); }));

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        write(config, format("{{\"revision\": \"{}\"}}", revision));

        ASSERT_TRUE(eventually([&] {
            return app->state() == state_t::started && property(*app, "revision") == std::to_string(revision);
        }));
    }

    // Give a spurious third redeploy the chance to show up.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(3, counters.constructed);
    EXPECT_EQ(2, counters.closed);
    EXPECT_EQ(1, counters.peak);

    app->dispose();
}

TEST_F(application_fixture_t, retired_monitor_after_dispose) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto monitor = app->snapshot()->monitor;
    const auto anchor = sandbox.root() / "apps" / "demo-anchor.txt";

    ASSERT_TRUE(monitor);

    // A change detected right before an undeploy must not bring the application back.
    app->dispose();
    fs::remove(anchor);

    EXPECT_FALSE(app->redeploy(*monitor));

    EXPECT_EQ(state_t::disposed, app->state());
    EXPECT_FALSE(fs::exists(anchor));
    EXPECT_EQ(1, counters.constructed);
}

TEST_F(application_fixture_t, stopped_application_ignores_changes) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto monitor = app->snapshot()->monitor;

    app->stop();

    EXPECT_FALSE(app->redeploy(*monitor));
    EXPECT_EQ(state_t::stopped, app->state());
    EXPECT_EQ(1, counters.constructed);

    app->dispose();
}

TEST_F(application_fixture_t, retired_monitor_after_redeploy) {
    sandbox.install("demo", "{}");

    auto app = make("demo");

    app->install();
    app->init();
    app->start();

    const auto retired = app->snapshot()->monitor;

    app->redeploy();

    EXPECT_FALSE(app->redeploy(*retired));
    EXPECT_EQ(2, counters.constructed);

    const auto current = app->snapshot()->monitor;

    ASSERT_TRUE(current);
    EXPECT_TRUE(app->redeploy(*current));
    EXPECT_EQ(3, counters.constructed);
    EXPECT_EQ(state_t::started, app->state());

    app->dispose();
}

TEST_F(application_fixture_t, identity) {
    auto app = make("demo");

    EXPECT_THAT(app->to_string(), ::testing::HasSubstr("[demo]@"));
    EXPECT_THAT(app->to_string(), ::testing::HasSubstr("application_t"));
}

TEST(errors, root_cause) {
    try {
        try {
            throw std::runtime_error("disk is on fire");
        } catch(const std::exception&) {
            std::throw_with_nested(error::deployment_error_t(error::start_failed, "demo", "unable to start"));
        }
    } catch(const error::deployment_error_t& e) {
        EXPECT_EQ("disk is on fire", error::root_cause(e));
        EXPECT_EQ("demo", e.application());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("application 'demo'"));
    }
}

}  // namespace
}  // namespace enclave
