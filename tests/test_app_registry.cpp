#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app_registry.hpp"
#include "store/dial_data_store.hpp"
#include "store/file_store.hpp"
#include "store/kv_store.hpp"
#include "test_helpers.hpp"

using testing_support::fake_app;
using testing_support::app_spy;
using testing_support::make_descriptor;
using testing_support::memory_file_store;

class AppRegistryTest : public ::testing::Test
{
protected:
    memory_file_store files;
    store::dial_data_store data_store {files};
    store::json_kv_store_provider storage {files};
    dial::app_registry registry {data_store, &storage};

    std::shared_ptr<app_spy> spy = std::make_shared<app_spy>();

    dial::app_ptr make_app(dial::app_descriptor descriptor)
    {
        return std::make_unique<fake_app>(std::move(descriptor), spy);
    }
};

TEST_F(AppRegistryTest, RegisterAndFind)
{
    EXPECT_TRUE(registry.register_app(make_app(make_descriptor("YouTube"))));
    EXPECT_EQ(registry.size(), 1u);

    auto guard = registry.lock();
    dial::application* app = registry.find(guard, "YouTube");
    ASSERT_NE(app, nullptr);
    EXPECT_EQ(app->descriptor().addon_id, "plugin.video.YouTube");
    EXPECT_EQ(app->state(), dial::dial_state::stopped);
    EXPECT_EQ(registry.find(guard, "youtube"), nullptr);
}

TEST_F(AppRegistryTest, RejectsIncompleteDescriptors)
{
    EXPECT_FALSE(registry.register_app(nullptr));

    auto no_addon = make_descriptor("YouTube");
    no_addon.addon_id.clear();
    EXPECT_FALSE(registry.register_app(make_app(no_addon)));

    EXPECT_FALSE(registry.register_app(make_app(make_descriptor(""))));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(AppRegistryTest, FirstRegistrantWins)
{
    auto first = make_descriptor("YouTube");
    first.addon_id = "plugin.first";
    auto second = make_descriptor("YouTube");
    second.addon_id = "plugin.second";

    EXPECT_TRUE(registry.register_app(make_app(first)));
    EXPECT_FALSE(registry.register_app(make_app(second)));

    auto guard = registry.lock();
    EXPECT_EQ(registry.find(guard, "YouTube")->descriptor().addon_id, "plugin.first");
    EXPECT_EQ(registry.names(), std::vector<std::string> {"YouTube"});
}

TEST_F(AppRegistryTest, FindRequiresTheRegistryLock)
{
    registry.register_app(make_app(make_descriptor("YouTube")));

    dial::app_registry::lock_type unlocked;
    EXPECT_THROW(registry.find(unlocked, "YouTube"), std::logic_error);

    memory_file_store other_files;
    store::dial_data_store other_data {other_files};
    dial::app_registry other {other_data};
    auto foreign = other.lock();
    EXPECT_THROW(registry.find(foreign, "YouTube"), std::logic_error);
}

TEST_F(AppRegistryTest, TryLockFailsWhileHeldElsewhere)
{
    auto guard = registry.try_lock();
    ASSERT_TRUE(guard.owns_lock());

    bool acquired = true;
    std::thread other([this, &acquired]() {
        acquired = registry.try_lock().owns_lock();
    });
    other.join();
    EXPECT_FALSE(acquired);

    guard.unlock();
    std::thread again([this, &acquired]() {
        acquired = registry.try_lock().owns_lock();
    });
    again.join();
    EXPECT_TRUE(acquired);
}

TEST_F(AppRegistryTest, StartOutcomeUpdatesState)
{
    registry.register_app(make_app(make_descriptor("YouTube")));
    auto guard = registry.lock();
    dial::application* app = registry.find(guard, "YouTube");

    EXPECT_EQ(app->start("v=1", {}, std::nullopt), dial::dial_state::running);
    EXPECT_EQ(app->last_payload(), "v=1");

    spy->start_result = dial::dial_state::hidden;
    EXPECT_EQ(app->start("v=2", {}, std::nullopt), dial::dial_state::error_generic);
    EXPECT_EQ(app->state(), dial::dial_state::error_generic);
    EXPECT_EQ(app->last_payload(), "v=1");
}

TEST_F(AppRegistryTest, ApplicationSeesItsPreviousPayload)
{
    registry.register_app(make_app(make_descriptor("YouTube")));
    auto guard = registry.lock();
    dial::application* app = registry.find(guard, "YouTube");

    app->start("v=1", {}, std::nullopt);
    EXPECT_EQ(spy->previous_payload, "");
    EXPECT_EQ(app->app().last_payload(), "v=1");

    app->start("v=2", {}, std::nullopt);
    EXPECT_EQ(spy->previous_payload, "v=1");

    // A failed start does not replace the snapshot
    spy->start_result = dial::dial_state::error_forbidden;
    app->start("v=3", {}, std::nullopt);
    EXPECT_EQ(spy->previous_payload, "v=2");
    EXPECT_EQ(app->app().last_payload(), "v=2");
}

TEST_F(AppRegistryTest, StopAlwaysEndsStopped)
{
    registry.register_app(make_app(make_descriptor("YouTube")));
    auto guard = registry.lock();
    dial::application* app = registry.find(guard, "YouTube");

    app->start("", {}, std::nullopt);
    spy->throw_on_stop = true;
    EXPECT_THROW(app->stop(), std::runtime_error);
    EXPECT_EQ(app->state(), dial::dial_state::stopped);
}

TEST_F(AppRegistryTest, HideKeepsStateUnlessHidden)
{
    registry.register_app(make_app(make_descriptor("YouTube")));
    auto guard = registry.lock();
    dial::application* app = registry.find(guard, "YouTube");

    app->start("", {}, std::nullopt);
    EXPECT_EQ(app->hide(), dial::dial_state::error_not_implemented);
    EXPECT_EQ(app->state(), dial::dial_state::running);

    spy->hide_result = dial::dial_state::hidden;
    EXPECT_EQ(app->hide(), dial::dial_state::hidden);
    EXPECT_EQ(app->state(), dial::dial_state::hidden);
}

TEST_F(AppRegistryTest, PersistentStorageIsAllocatedOnRequest)
{
    registry.register_app(make_app(make_descriptor("Plain")));
    registry.register_app(make_app(make_descriptor("YouTube", {}, false, true)));

    auto guard = registry.lock();
    EXPECT_EQ(registry.find(guard, "Plain")->app().storage(), nullptr);

    store::kv_store* db = registry.find(guard, "YouTube")->app().storage();
    ASSERT_NE(db, nullptr);
    db->set("last_video", "abc");
    EXPECT_EQ(db->get("last_video").value_or(""), "abc");
    EXPECT_EQ(files.files().count("app_youtube.json"), 1u);
}

TEST_F(AppRegistryTest, StorageFailureOmitsOnlyThatApplication)
{
    // Nothing is written, registration only opens the stores
    store::directory_file_store disk {std::filesystem::temp_directory_path() / "dialcast_registry_test"};
    store::dial_data_store disk_data {disk};
    store::json_kv_store_provider disk_storage {disk};
    dial::app_registry disk_registry {disk_data, &disk_storage};

    bool accepted = true;
    EXPECT_NO_THROW(accepted = disk_registry.register_app(make_app(make_descriptor("My..App", {}, false, true))));
    EXPECT_FALSE(accepted);
    EXPECT_TRUE(disk_registry.register_app(make_app(make_descriptor("YouTube", {}, false, true))));
    EXPECT_EQ(disk_registry.names(), std::vector<std::string> {"YouTube"});
}

TEST_F(AppRegistryTest, HostEventsReachApplications)
{
    auto other_spy = std::make_shared<app_spy>();
    registry.register_app(make_app(make_descriptor("YouTube")));
    registry.register_app(std::make_unique<fake_app>(make_descriptor("Netflix"), other_spy));

    dial::host_event paused {dial::host_event_type::playback_paused, {{"position", "42"}}};
    EXPECT_TRUE(registry.notify("YouTube", paused));
    EXPECT_FALSE(registry.notify("Unknown", paused));
    ASSERT_EQ(spy->events.size(), 1u);
    EXPECT_EQ(spy->events[0].data.at("position"), "42");
    EXPECT_TRUE(other_spy->events.empty());

    // One failing application does not keep the others from the event
    spy->throw_on_event = true;
    EXPECT_NO_THROW(registry.notify_all(dial::host_event {dial::host_event_type::host_closing, {}}));
    EXPECT_EQ(spy->events.size(), 2u);
    ASSERT_EQ(other_spy->events.size(), 1u);
    EXPECT_EQ(other_spy->events[0].type, dial::host_event_type::host_closing);
}

class list_provider : public dial::app_provider
{
public:
    explicit list_provider(std::shared_ptr<app_spy> spy)
        : m_spy {std::move(spy)}
    {}

    std::vector<dial::app_ptr> provide() override
    {
        std::vector<dial::app_ptr> apps;
        apps.push_back(std::make_unique<fake_app>(make_descriptor("YouTube"), m_spy));
        apps.push_back(std::make_unique<fake_app>(make_descriptor("YouTube"), m_spy));
        apps.push_back(std::make_unique<fake_app>(make_descriptor("Netflix"), m_spy));
        return apps;
    }

private:
    std::shared_ptr<app_spy> m_spy;
};

TEST_F(AppRegistryTest, RegisterFromProvider)
{
    list_provider provider {spy};
    EXPECT_EQ(registry.register_apps(provider), 2u);
    EXPECT_EQ(registry.size(), 2u);
}
