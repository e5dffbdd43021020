#include "test_support.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <thread>

#include "../src/core/Errors.hpp"
#include "../src/storage/Codec.hpp"
#include "../src/storage/Storage.hpp"

class StorageTest : public FastmemTest {
protected:
    StorageOptions options() const {
        StorageOptions o;
        o.kdf = fastKdf();
        return o;
    }

    std::unique_ptr<Storage> open(const std::string& name = "s1") {
        auto s = std::make_unique<Storage>(name, dir.string(), options());
        s->init();
        return s;
    }

    std::vector<unsigned char> fileBytes(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::vector<unsigned char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(StorageTest, init_creates_directory_and_default_file) {
    auto s = open();
    EXPECT_TRUE(std::filesystem::is_directory(dir / "s1"));
    EXPECT_TRUE(std::filesystem::exists(s->defaultFile()));
    EXPECT_FALSE(s->isLocked());
    EXPECT_FALSE(s->hasPassword());
}

TEST_F(StorageTest, invalid_names_are_rejected) {
    EXPECT_THROW(Storage("../escape", dir.string(), options()), std::invalid_argument);
    EXPECT_THROW(Storage("", dir.string(), options()), std::invalid_argument);

    auto s = open();
    EXPECT_THROW(s->save("../../etc"), std::invalid_argument);
    EXPECT_THROW(s->load("a b"), std::invalid_argument);
}

TEST_F(StorageTest, set_requires_a_password) {
    auto s = open();
    EXPECT_THROW(s->set("username", "johndoe"), NoKeyError);
    EXPECT_THROW(s->get("username"), NoKeyError);
}

TEST_F(StorageTest, set_then_get_round_trips) {
    auto s = open();
    s->setPassword("hunter2");

    const std::vector<std::pair<std::string, std::string>> cases = {
        { "username", "johndoe" },
        { "empty", "" },
        { "unicode", "\xc3\xa9t\xc3\xa9" },
        { "binary", std::string("\0\x01\xff", 3) },
        { "long", std::string(100000, 'x') },
    };
    for (const auto& c : cases) s->set(c.first, c.second);
    for (const auto& c : cases) EXPECT_EQ(s->get(c.first), c.second) << c.first;
}

TEST_F(StorageTest, json_values_keep_their_type) {
    auto s = open();
    s->setPassword("pw");

    const nlohmann::json number = 42;
    const nlohmann::json real = 2.5;
    const nlohmann::json list = { 1, "two", nullptr, false };
    const nlohmann::json object = { { "user", "johndoe" }, { "roles", { "admin", "dev" } }, { "age", 31 } };

    s->setJson("number", number);
    s->setJson("real", real);
    s->setJson("list", list);
    s->setJson("object", object);
    s->save();

    Storage fresh("s1", dir.string(), options());
    fresh.init();
    fresh.unlock("pw");
    EXPECT_EQ(fresh.getJson("number"), number);
    EXPECT_EQ(fresh.getJson("real"), real);
    EXPECT_EQ(fresh.getJson("list"), list);
    EXPECT_EQ(fresh.getJson("object"), object);
    EXPECT_EQ(fresh.getJson("object")["roles"][1], "dev");
}

TEST_F(StorageTest, json_values_are_stored_as_json_text) {
    auto s = open();
    s->setPassword("pw");
    s->setJson("k", "johndoe");
    EXPECT_EQ(s->get("k"), "\"johndoe\"");

    s->set("raw", "not json");
    EXPECT_THROW(s->getJson("raw"), std::invalid_argument);
    EXPECT_THROW(s->getJson("missing"), KeyNotFound);

    s->lock();
    EXPECT_THROW(s->setJson("k", 1), LockedError);
    EXPECT_THROW(s->getJson("k"), LockedError);
}

TEST_F(StorageTest, delete_and_clear) {
    auto s = open();
    s->setPassword("pw");
    s->set("a", "1");
    s->set("b", "2");

    s->remove("a");
    EXPECT_FALSE(s->contains("a"));
    EXPECT_THROW(s->get("a"), KeyNotFound);
    EXPECT_THROW(s->remove("a"), KeyNotFound);

    s->clear();
    EXPECT_EQ(s->size(), 0u);
    EXPECT_TRUE(s->keys().empty());
}

TEST_F(StorageTest, empty_key_names_are_rejected) {
    auto s = open();
    s->setPassword("pw");
    EXPECT_THROW(s->set("", "v"), std::invalid_argument);
}

TEST_F(StorageTest, persisted_bytes_never_contain_values) {
    auto s = open();
    s->setPassword("hunter2");
    s->set("username", "johndoe-plaintext-marker");
    s->save();
    s->save("b1");

    for (const auto& file : { s->defaultFile(), s->snapshotFile("b1") }) {
        auto bytes = fileBytes(file);
        std::string blob(bytes.begin(), bytes.end());
        EXPECT_EQ(blob.find("johndoe-plaintext-marker"), std::string::npos) << file;
        EXPECT_EQ(blob.find("hunter2"), std::string::npos) << file;
    }
}

TEST_F(StorageTest, wrong_password_is_rejected) {
    auto s = open();
    s->setPassword("right");
    s->set("k", "v");
    s->lock();

    EXPECT_THROW(s->unlock("wrong"), InvalidPassword);
    EXPECT_TRUE(s->isLocked());
    EXPECT_THROW(s->get("k"), LockedError);
}

TEST_F(StorageTest, lock_blocks_every_entry_operation) {
    auto s = open();
    s->setPassword("right");
    s->set("a", "1");
    s->set("b", "2");
    s->lock();

    EXPECT_TRUE(s->isLocked());
    EXPECT_THROW(s->set("c", "3"), LockedError);
    EXPECT_THROW(s->get("a"), LockedError);
    EXPECT_THROW(s->remove("a"), LockedError);
    EXPECT_THROW(s->clear(), LockedError);
    EXPECT_THROW(s->keys(), LockedError);
    EXPECT_THROW(s->load(), LockedError);
    EXPECT_THROW(s->setPassword("other"), LockedError);

    s->unlock("right");
    EXPECT_EQ(s->keys(), (std::vector<std::string>{ "a", "b" }));
    EXPECT_EQ(s->get("a"), "1");
    EXPECT_EQ(s->get("b"), "2");
    s->set("c", "3");
    EXPECT_EQ(s->get("c"), "3");
}

TEST_F(StorageTest, passwordless_storage_can_lock_and_unlock) {
    auto s = open();
    s->lock();
    EXPECT_THROW(s->clear(), LockedError);
    s->unlock();
    EXPECT_FALSE(s->isLocked());

    s->setPassword("pw");
    s->lock();
    EXPECT_THROW(s->unlock(), InvalidPassword);
}

TEST_F(StorageTest, password_given_to_unlock_on_open_store_is_persisted) {
    {
        auto s = open();
        s->unlock("x");
        EXPECT_TRUE(s->hasPassword());
        s->clear();
        s->save();
    }

    Storage s("s1", dir.string(), options());
    s.init();
    EXPECT_TRUE(s.isLocked());
    EXPECT_TRUE(s.hasPassword());
    EXPECT_THROW(s.unlock("y"), InvalidPassword);
    s.unlock("x");
    EXPECT_EQ(s.size(), 0u);
}

TEST_F(StorageTest, overwrite_uses_a_new_nonce) {
    auto s = open();
    s->setPassword("pw");

    s->set("k", "same");
    s->save();
    auto first = Codec::deserialize(Codec::readFile(s->defaultFile()));

    s->set("k", "same");
    s->save();
    auto second = Codec::deserialize(Codec::readFile(s->defaultFile()));

    ASSERT_EQ(first.entries.size(), 1u);
    ASSERT_EQ(second.entries.size(), 1u);
    EXPECT_NE(first.entries[0].nonce, second.entries[0].nonce);
    EXPECT_NE(first.entries[0].ciphertext, second.entries[0].ciphertext);
}

TEST_F(StorageTest, snapshot_round_trips_into_fresh_instance) {
    auto s = open();
    s->setPassword("pw");
    s->set("a", "1");
    s->set("b", "2");
    s->save("b1");

    Storage fresh("s1", dir.string(), options());
    fresh.load("b1");
    EXPECT_TRUE(fresh.isLocked());
    fresh.unlock("pw");

    EXPECT_EQ(fresh.keys(), s->keys());
    for (const auto& k : s->keys()) EXPECT_EQ(fresh.get(k), s->get(k));
}

TEST_F(StorageTest, snapshots_coexist_and_are_listed) {
    auto s = open();
    s->setPassword("pw");
    s->set("k", "one");
    s->save("b1");
    s->set("k", "two");
    s->save("b2");

    EXPECT_EQ(s->snapshots(), (std::vector<std::string>{ "b1", "b2" }));

    s->load("b1");
    s->unlock("pw");
    EXPECT_EQ(s->get("k"), "one");

    s->load("b2");
    s->unlock("pw");
    EXPECT_EQ(s->get("k"), "two");
}

TEST_F(StorageTest, missing_snapshot_is_an_io_error) {
    auto s = open();
    EXPECT_THROW(s->load("nope"), IOError);
    EXPECT_TRUE(s->snapshots().empty());
}

TEST_F(StorageTest, corrupt_file_is_reported) {
    auto s = open();
    s->save();
    {
        std::ofstream out(s->defaultFile(), std::ios::binary | std::ios::trunc);
        out << "not a storage file";
    }
    Storage other("s1", dir.string(), options());
    EXPECT_THROW(other.init(), CorruptData);
}

TEST_F(StorageTest, flipped_ciphertext_or_tag_is_detected) {
    auto s = open();
    s->setPassword("pw");
    s->set("k", "value");
    s->save();

    auto pristine = Codec::deserialize(Codec::readFile(s->defaultFile()));
    const std::size_t len = pristine.entries[0].ciphertext.size();

    // first ciphertext byte, and last byte (inside the tag)
    for (std::size_t pos : { std::size_t(0), len - 1 }) {
        auto state = pristine;
        state.entries[0].ciphertext[pos] ^= 0x01;
        Codec::writeFile(s->defaultFile(), Codec::serialize(state));

        Storage reopened("s1", dir.string(), options());
        reopened.init();
        reopened.unlock("pw");
        EXPECT_THROW(reopened.get("k"), CorruptData) << "position " << pos;
    }
}

TEST_F(StorageTest, password_and_value_survive_a_new_instance) {
    {
        Storage s("s1", dir.string(), options());
        s.init();
        s.setPassword("hunter2");
        s.set("username", "johndoe");
        s.save();
    }

    Storage s("s1", dir.string(), options());
    s.init();
    EXPECT_TRUE(s.isLocked());
    EXPECT_TRUE(s.hasPassword());
    s.unlock("hunter2");
    EXPECT_EQ(s.get("username"), "johndoe");
}

TEST_F(StorageTest, nothing_is_persisted_without_save) {
    {
        auto s = open();
        s->setPassword("pw");
        s->set("k", "v");
    }
    auto s = open();
    // the default file still holds the state written by the first init
    EXPECT_FALSE(s->hasPassword());
    EXPECT_EQ(s->size(), 0u);
}

TEST_F(StorageTest, changing_password_rekeys_entries) {
    auto s = open();
    s->setPassword("old");
    s->set("a", "1");
    s->set("b", "2");
    s->save();
    auto before = Codec::deserialize(Codec::readFile(s->defaultFile()));

    s->setPassword("new");
    s->save();
    auto after = Codec::deserialize(Codec::readFile(s->defaultFile()));

    EXPECT_EQ(after.salt, before.salt);
    EXPECT_NE(after.entries[0].nonce, before.entries[0].nonce);

    s->lock();
    EXPECT_THROW(s->unlock("old"), InvalidPassword);
    s->unlock("new");
    EXPECT_EQ(s->get("a"), "1");
    EXPECT_EQ(s->get("b"), "2");
}

TEST_F(StorageTest, kdf_parameters_travel_with_the_file) {
    {
        auto s = open();
        s->setPassword("pw");
        s->set("k", "v");
        s->save();
    }

    // a reader configured with a different default still derives the same key
    StorageOptions other;
    other.kdf = fastKdf();
    other.kdf.ops_limit += 1;
    Storage s("s1", dir.string(), other);
    s.init();
    s.unlock("pw");
    EXPECT_EQ(s.get("k"), "v");
}

TEST_F(StorageTest, save_is_allowed_while_locked) {
    auto s = open();
    s->setPassword("pw");
    s->set("k", "v");
    s->lock();
    EXPECT_NO_THROW(s->save());
    EXPECT_NO_THROW(s->save("locked-backup"));

    Storage fresh("s1", dir.string(), options());
    fresh.init();
    fresh.unlock("pw");
    EXPECT_EQ(fresh.get("k"), "v");
}

TEST_F(StorageTest, concurrent_access_sees_only_clean_outcomes) {
    auto s = open();
    s->setPassword("pw");
    s->set("shared", "value");

    std::atomic<bool> stop{ false };
    std::atomic<int> unexpected{ 0 };

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t]() {
            int i = 0;
            while (!stop.load()) {
                try {
                    s->set("k" + std::to_string(t), std::to_string(i));
                    if (s->get("shared") != "value") unexpected++;
                }
                catch (const LockedError&) {
                }
                catch (...) {
                    unexpected++;
                }
                ++i;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        s->lock();
        s->unlock("pw");
    }
    stop = true;
    for (auto& w : workers) w.join();

    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_EQ(s->get("shared"), "value");
}
