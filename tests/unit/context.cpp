#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <enclave/api/context.hpp>
#include <enclave/errors.hpp>

#include <enclave/detail/context/basic.hpp>

#include <condition_variable>
#include <mutex>

#include "support.hpp"

namespace enclave {
namespace {

using namespace enclave::testing;

// Records every notification it receives.
class recorder_t:
    public api::listener_t
{
    mutable std::mutex m_mutex;
    std::vector<api::notification_t> m_received;

public:
    virtual
    void
    on_notification(api::notification_t notification) {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_received.push_back(notification);
    }

    std::vector<api::notification_t>
    received() const {
        std::lock_guard<std::mutex> guard(m_mutex);
        return m_received;
    }
};

// Unregisters itself on the first notification.
class one_shot_t:
    public recorder_t
{
public:
    subscription_t subscription;

    virtual
    void
    on_notification(api::notification_t notification) {
        recorder_t::on_notification(notification);
        subscription.cancel();
    }
};

std::unique_ptr<context::basic_t>
make_context(api::properties_t properties = api::properties_t()) {
    return std::unique_ptr<context::basic_t>(new context::basic_t(make_log(), "demo", std::move(properties)));
}

TEST(context, lifecycle) {
    auto context = make_context({{"key", "value"}});

    EXPECT_FALSE(context->started());
    EXPECT_FALSE(context->disposed());
    EXPECT_EQ("value", context->properties().at("key"));

    context->start();
    EXPECT_TRUE(context->started());

    context->stop();
    EXPECT_FALSE(context->started());

    context->dispose();
    EXPECT_TRUE(context->disposed());

    // Disposing twice is harmless, starting a disposed context is not.
    context->dispose();
    EXPECT_THROW(context->start(), std::system_error);
}

TEST(context, notifications_in_order) {
    auto context = make_context();
    auto recorder = std::make_shared<recorder_t>();

    auto subscription = context->listen(recorder);

    context->start();
    context->stop();

    ASSERT_TRUE(eventually([&] { return recorder->received().size() == 2; }));

    EXPECT_EQ(api::notification_t::started, recorder->received()[0]);
    EXPECT_EQ(api::notification_t::stopping, recorder->received()[1]);

    context->dispose();
}

TEST(context, dispose_stops_started_context) {
    auto context = make_context();
    auto recorder = std::make_shared<recorder_t>();

    auto subscription = context->listen(recorder);

    context->start();
    context->dispose();

    EXPECT_FALSE(context->started());

    // Pending notifications are delivered before the context goes away.
    context.reset();

    ASSERT_EQ(2u, recorder->received().size());
    EXPECT_EQ(api::notification_t::stopping, recorder->received()[1]);
}

TEST(context, cancelled_subscription) {
    auto context = make_context();
    auto recorder = std::make_shared<recorder_t>();

    auto subscription = context->listen(recorder);

    EXPECT_TRUE(subscription.cancel());

    context->start();
    context->dispose();
    context.reset();

    EXPECT_TRUE(recorder->received().empty());
}

TEST(context, listener_unsubscribes_itself) {
    auto context = make_context();
    auto listener = std::make_shared<one_shot_t>();

    listener->subscription = context->listen(listener);

    context->start();

    ASSERT_TRUE(eventually([&] { return listener->received().size() == 1; }));

    context->stop();
    context->dispose();
    context.reset();

    ASSERT_EQ(1u, listener->received().size());
    EXPECT_EQ(api::notification_t::started, listener->received()[0]);
}

TEST(context, subscription_outlives_context) {
    auto context = make_context();
    auto subscription = context->listen(std::make_shared<recorder_t>());

    context->dispose();
    context.reset();

    EXPECT_TRUE(subscription.cancel());
}

TEST(context, factory_runs_builders_in_order) {
    sandbox_t sandbox;

    auto host = sandbox.host();

    descriptor_t descriptor;
    descriptor.name = "demo";

    auto loader = host->isolation().make(descriptor);

    struct appender_t: public api::builder_t {
        std::string key;
        std::string value;

        appender_t(std::string key_, std::string value_): key(std::move(key_)), value(std::move(value_)) { }

        void
        configure(api::properties_t& properties, const api::loader_t&) {
            properties[key] = properties.count(key) ? properties[key] + "," + value : value;
        }
    };

    api::builder_chain_t chain;
    chain.emplace_back(new appender_t("order", "first"));
    chain.emplace_back(new appender_t("order", "second"));

    auto context = host->factory().create(std::move(chain), descriptor, *loader);

    EXPECT_EQ("first,second", context->properties().at("order"));

    context->dispose();
    loader->close();
}

}  // namespace
}  // namespace enclave
