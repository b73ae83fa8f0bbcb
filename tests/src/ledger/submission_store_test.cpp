#include <gtest/gtest.h>
#include <veil/ledger/submission_store.hpp>
#include <veil/oracle/local_engine.hpp>
#include <veil/testing/common.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace veil::schema;

namespace {

class submission_store_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = veil::testing::make_db_path("veil_submission_store");
    open();
  }

  void TearDown() override {
    store_.reset();
    storage_.reset();
    veil::testing::remove_path(db_path_);
  }

  void open() {
    storage_.emplace(
        veil::storage::make_storage<veil::storage::rocksdb_storage_tag>(
            db_path_));
    store_ =
        std::make_unique<veil::ledger::submission_store>(encoder_, *storage_);
  }

  void reopen() {
    store_.reset();
    storage_.reset();
    open();
  }

  operation_result<submission_id_t> create(const principal_id_t& owner,
                                           const timestamp_milliseconds_t at) {
    return store_->create(engine_.encrypt(std::string_view{"payload"}),
                          engine_.encrypt(std::string_view{"Financial"}),
                          owner, at, "quarterly figures");
  }

  std::string db_path_;
  veil::schema::encoding::scale_encoder_t encoder_{};
  veil::oracle::local_engine engine_{veil::testing::make_engine_keys(1)};
  std::optional<veil::storage::rocksdb_storage_t> storage_;
  std::unique_ptr<veil::ledger::submission_store> store_;
};

}  // namespace

TEST_F(submission_store_test, ids_start_at_one_and_increase) {
  auto owner = veil::testing::make_hash(1);
  auto first = create(owner, 10);
  auto second = create(owner, 11);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*first.value, 1u);
  EXPECT_EQ(*second.value, 2u);

  auto loaded = store_->get(2);
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(loaded.value->owner, owner);
  EXPECT_EQ(loaded.value->created_at, 11u);
  EXPECT_EQ(loaded.value->description, "quarterly figures");
  EXPECT_EQ(loaded.value->status, submission_status_t::pending);
  EXPECT_FALSE(loaded.value->revealed);
  EXPECT_FALSE(loaded.value->revealed_payload.has_value());
  EXPECT_FALSE(loaded.value->revealed_category.has_value());
}

TEST_F(submission_store_test, create_rejects_missing_ciphertexts) {
  auto owner = veil::testing::make_hash(1);
  auto no_payload = store_->create(
      ciphertext_t{}, engine_.encrypt(std::string_view{"Financial"}), owner, 1,
      {});
  EXPECT_EQ(no_payload.code, ledger_error_code::invalid_argument);

  auto numeric_category = store_->create(
      engine_.encrypt(std::string_view{"payload"}),
      engine_.encrypt(uint64_t{7}), owner, 1, {});
  EXPECT_EQ(numeric_category.code, ledger_error_code::type_mismatch);
  EXPECT_EQ(store_->statistics().total, 0u);
}

TEST_F(submission_store_test, get_unknown_is_not_found) {
  EXPECT_EQ(store_->get(99).code, ledger_error_code::not_found);
  EXPECT_FALSE(store_->contains(99));
}

TEST_F(submission_store_test, reveal_is_write_once) {
  auto id = *create(veil::testing::make_hash(1), 10).value;
  auto revealed =
      store_->apply_reveal(id, make_bytes(std::string_view{"first"}),
                           "Financial");
  ASSERT_TRUE(revealed.ok());
  EXPECT_TRUE(revealed.value->revealed);

  auto again = store_->apply_reveal(id, make_bytes(std::string_view{"second"}),
                                    "Medical");
  EXPECT_EQ(again.code, ledger_error_code::already_revealed);

  auto loaded = store_->get(id);
  ASSERT_TRUE(loaded.ok());
  EXPECT_EQ(make_string(*loaded.value->revealed_payload), "first");
  EXPECT_EQ(*loaded.value->revealed_category, "Financial");

  EXPECT_EQ(store_->apply_reveal(42, {}, "x").code,
            ledger_error_code::not_found);
}

TEST_F(submission_store_test, review_is_owner_only_and_once) {
  auto owner = veil::testing::make_hash(1);
  auto stranger = veil::testing::make_hash(2);
  auto id = *create(owner, 10).value;

  EXPECT_EQ(store_->review(id, stranger, submission_status_t::verified).code,
            ledger_error_code::unauthorized);
  EXPECT_EQ(store_->review(id, owner, submission_status_t::pending).code,
            ledger_error_code::invalid_argument);

  auto verified = store_->review(id, owner, submission_status_t::verified);
  ASSERT_TRUE(verified.ok());
  EXPECT_EQ(verified.value->status, submission_status_t::verified);

  EXPECT_EQ(store_->review(id, owner, submission_status_t::rejected).code,
            ledger_error_code::invalid_state);
  EXPECT_EQ(store_->review(77, owner, submission_status_t::rejected).code,
            ledger_error_code::not_found);
}

TEST_F(submission_store_test, list_is_newest_first_and_statistics_add_up) {
  auto owner = veil::testing::make_hash(1);
  auto a = *create(owner, 100).value;
  auto b = *create(owner, 300).value;
  auto c = *create(owner, 200).value;
  ASSERT_TRUE(store_->review(a, owner, submission_status_t::verified).ok());
  ASSERT_TRUE(store_->review(b, owner, submission_status_t::rejected).ok());
  ASSERT_TRUE(store_->apply_reveal(c, {}, "Medical").ok());

  auto listed = store_->list();
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed[0].submission_id, b);
  EXPECT_EQ(listed[1].submission_id, c);
  EXPECT_EQ(listed[2].submission_id, a);

  auto stats = store_->statistics();
  EXPECT_EQ(stats.total, 3u);
  EXPECT_EQ(stats.pending, 1u);
  EXPECT_EQ(stats.verified, 1u);
  EXPECT_EQ(stats.rejected, 1u);
  EXPECT_EQ(stats.revealed, 1u);
}

TEST_F(submission_store_test, state_and_sequence_survive_reopen) {
  auto owner = veil::testing::make_hash(1);
  auto id = *create(owner, 10).value;
  ASSERT_TRUE(store_
                  ->apply_reveal(id, make_bytes(std::string_view{"p"}),
                                 "Financial")
                  .ok());

  reopen();

  auto loaded = store_->get(id);
  ASSERT_TRUE(loaded.ok());
  EXPECT_TRUE(loaded.value->revealed);
  EXPECT_EQ(*loaded.value->revealed_category, "Financial");
  EXPECT_EQ(loaded.value->encrypted_category.type, ciphertext_type_t::ebytes);

  auto next = create(owner, 11);
  ASSERT_TRUE(next.ok());
  EXPECT_EQ(*next.value, id + 1);
}

TEST_F(submission_store_test, concurrent_creates_get_distinct_ids) {
  constexpr auto kThreads = 8;
  constexpr auto kPerThread = 25;
  auto mutex = std::mutex{};
  auto ids = std::set<submission_id_t>{};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (auto i = 0; i < kPerThread; ++i) {
        auto created = create(veil::testing::make_hash(static_cast<uint8_t>(t)),
                              static_cast<timestamp_milliseconds_t>(i));
        ASSERT_TRUE(created.ok());
        auto lock = std::scoped_lock{mutex};
        ids.insert(*created.value);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*ids.begin(), 1u);
  EXPECT_EQ(*ids.rbegin(), static_cast<submission_id_t>(kThreads * kPerThread));
}
