#include "StoreFixture.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>

using namespace vc;
using namespace vc::types;

namespace {

FileRecord fileRow(const int64_t size, const std::time_t mtime) {
    FileRecord r;
    r.size_bytes = size;
    r.modified_time = mtime;
    r.created_time = mtime;
    return r;
}

Event at(const Event::Type type, const std::string& path, const std::time_t ts) {
    Event e(type, path, "/vol", "vol-1");
    e.timestamp = ts;
    return e;
}

}

class CatalogStoreTest : public test::StoreFixture {};

TEST_F(CatalogStoreTest, MigrationsAreRecordedOnce) {
    const auto again = store->migrate();
    EXPECT_TRUE(again.applied.empty());
    EXPECT_EQ(again.already_applied.size(), 6u);
    EXPECT_TRUE(again.changed.empty());
}

TEST_F(CatalogStoreTest, CreateModifyDeleteLifecycle) {
    store->recordChange(at(Event::Type::CREATED, "/vol/a.txt", 1000), fileRow(10, 900));
    store->recordChange(at(Event::Type::MODIFIED, "/vol/a.txt", 1001), fileRow(20, 1001));
    store->recordChange(at(Event::Type::DELETED, "/vol/a.txt", 1002), std::nullopt);

    const auto t = store->tallyEvents("vol-1");
    EXPECT_EQ(t.total, 3);
    EXPECT_EQ(t.created, 1);
    EXPECT_EQ(t.modified, 1);
    EXPECT_EQ(t.deleted, 1);

    const auto file = store->getFile("vol-1", "/vol/a.txt");
    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file->is_deleted);
    EXPECT_EQ(file->size_bytes, 20);   // last known metadata survives the delete
    EXPECT_EQ(file->last_event_type, Event::Type::DELETED);
    EXPECT_EQ(file->last_event_timestamp, 1002);

    const auto volume = store->getVolume("vol-1");
    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(volume->event_count, 3);
    EXPECT_EQ(volume->created_count, 1);
    EXPECT_EQ(volume->modified_count, 1);
    EXPECT_EQ(volume->deleted_count, 1);
    EXPECT_EQ(volume->last_event_timestamp, 1002);
}

TEST_F(CatalogStoreTest, RecreateAfterDeleteRevivesRow) {
    store->recordChange(at(Event::Type::CREATED, "/vol/b.bin", 1000), fileRow(1, 1000));
    store->recordChange(at(Event::Type::DELETED, "/vol/b.bin", 1001), std::nullopt);
    store->recordChange(at(Event::Type::CREATED, "/vol/b.bin", 1002), fileRow(2, 1002));

    const auto file = store->getFile("vol-1", "/vol/b.bin");
    ASSERT_TRUE(file.has_value());
    EXPECT_FALSE(file->is_deleted);
    EXPECT_EQ(file->size_bytes, 2);
}

TEST_F(CatalogStoreTest, DeleteOfUnknownPathLeavesTombstone) {
    store->recordChange(at(Event::Type::DELETED, "/vol/never-seen", 1000), std::nullopt);

    const auto file = store->getFile("vol-1", "/vol/never-seen");
    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file->is_deleted);
    EXPECT_FALSE(file->size_bytes.has_value());
}

TEST_F(CatalogStoreTest, IgnoredNamesAreLoggedButNotCatalogued) {
    store->recordChange(at(Event::Type::CREATED, "/vol/.DS_Store", 1000), fileRow(4, 1000));
    store->recordChange(at(Event::Type::CREATED, "/vol/draft.swp", 1000), fileRow(4, 1000));

    EXPECT_EQ(store->tallyEvents("vol-1").total, 2);
    EXPECT_FALSE(store->getFile("vol-1", "/vol/.DS_Store").has_value());
    EXPECT_FALSE(store->getFile("vol-1", "/vol/draft.swp").has_value());
}

TEST_F(CatalogStoreTest, DiscoveredOverUnchangedRowIsNoop) {
    store->recordChange(at(Event::Type::DISCOVERED, "/vol/c.jpg", 1000), fileRow(7, 500));
    store->recordChange(at(Event::Type::DISCOVERED, "/vol/c.jpg", 2000), fileRow(7, 500));

    auto file = store->getFile("vol-1", "/vol/c.jpg");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->last_event_timestamp, 1000);

    store->recordChange(at(Event::Type::DISCOVERED, "/vol/c.jpg", 3000), fileRow(8, 2500));
    file = store->getFile("vol-1", "/vol/c.jpg");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->size_bytes, 8);
    EXPECT_EQ(file->last_event_timestamp, 3000);

    // the event log still records every sighting
    EXPECT_EQ(store->tallyEvents("vol-1").discovered, 3);
}

TEST_F(CatalogStoreTest, CountersDriftIsDetectedAndRepaired) {
    store->recordEvent(at(Event::Type::CREATED, "/vol/d", 1000));
    store->recordEvent(at(Event::Type::MODIFIED, "/vol/d", 1001));
    EXPECT_TRUE(store->countersConsistent("vol-1"));

    exec("UPDATE volumes SET event_count = 42, created_count = 0 WHERE volume_id = 'vol-1'");
    EXPECT_FALSE(store->countersConsistent("vol-1"));

    store->recomputeCounters("vol-1");
    EXPECT_TRUE(store->countersConsistent("vol-1"));
    EXPECT_EQ(store->getVolume("vol-1")->event_count, 2);

    EXPECT_THROW(store->recomputeCounters("no-such-volume"), std::runtime_error);
    EXPECT_FALSE(store->countersConsistent("no-such-volume"));
}

TEST_F(CatalogStoreTest, IdentityPersistsAndEventsKeepIt) {
    VolumeIdentity id;
    id.volume_id = "uuid=6f1c-aa";
    id.directory = "/mnt/usb";
    id.device = "/dev/sdb1";
    id.fs_uuid = "6f1c-aa";
    id.fs_label = "ARCHIVE";
    id.serial = "WX1";
    id.raw["udev.ID_FS_TYPE"] = "ext4";
    id.refreshed_at = 1000;
    store->persistIdentity(id);

    Event e(Event::Type::CREATED, "/mnt/usb/x", "/mnt/usb", id.volume_id);
    store->recordEvent(e);

    const auto volume = store->getVolume(id.volume_id);
    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(volume->directory, "/mnt/usb");
    EXPECT_EQ(volume->identity.fs_label, "ARCHIVE");
    EXPECT_EQ(volume->identity.serial, "WX1");
    EXPECT_EQ(volume->event_count, 1);

    const auto summary = store->summarizeByVolume();
    ASSERT_EQ(summary.size(), 1u);
    EXPECT_EQ(summary[0].volume_id, id.volume_id);
    EXPECT_EQ(summary[0].created, 1);
    EXPECT_EQ(summary[0].fs_label, "ARCHIVE");

    EXPECT_THROW(store->persistIdentity(VolumeIdentity{}), std::invalid_argument);
}

TEST_F(CatalogStoreTest, LabelIndexIsAssignedOnceInArrivalOrder) {
    VolumeIdentity first;
    first.volume_id = "uuid=bbbb";
    first.directory = "/mnt/b";
    store->persistIdentity(first);

    // a volume first seen through an event gets the next number too
    store->recordEvent(Event(Event::Type::CREATED, "/mnt/a/x", "/mnt/a", "uuid=aaaa"));

    EXPECT_EQ(store->getVolume("uuid=bbbb")->label_index, 1);
    EXPECT_EQ(store->getVolume("uuid=aaaa")->label_index, 2);

    // re-identifying, remounting elsewhere and more events keep the number
    first.directory = "/media/b";
    first.fs_label = "RENAMED";
    store->persistIdentity(first);
    store->recordEvent(Event(Event::Type::MODIFIED, "/media/b/y", "/media/b", "uuid=bbbb"));
    store->recordEvent(Event(Event::Type::CREATED, "/mnt/a/z", "/mnt/a", "uuid=aaaa"));

    EXPECT_EQ(store->getVolume("uuid=bbbb")->label_index, 1);
    EXPECT_EQ(store->getVolume("uuid=aaaa")->label_index, 2);
    EXPECT_EQ(store->getVolume("uuid=bbbb")->directory, "/media/b");
}

TEST_F(CatalogStoreTest, RecentEventsNewestFirstWithLimit) {
    for (int i = 0; i < 5; ++i) store->recordEvent(at(Event::Type::CREATED, "/vol/f" + std::to_string(i), 1000 + i));

    const auto recent = store->listRecentEvents(std::nullopt, 3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].path, "/vol/f4");
    EXPECT_EQ(recent[2].path, "/vol/f2");

    const auto since = store->listRecentEvents(1003, 100);
    EXPECT_EQ(since.size(), 2u);
}

TEST_F(CatalogStoreTest, UsageRefreshesForRealDirectory) {
    Event e(Event::Type::CREATED, (workDir / "u").string(), workDir.string(), "vol-usage");
    store->recordEvent(e);

    const auto volume = store->getVolume("vol-usage");
    ASSERT_TRUE(volume.has_value());
    ASSERT_TRUE(volume->usage.has_value());
    EXPECT_GT(volume->usage->total_bytes, 0);
    EXPECT_EQ(volume->events_since_refresh, 0);
    EXPECT_FALSE(store->refreshUsageIfDue("vol-usage"));
}
