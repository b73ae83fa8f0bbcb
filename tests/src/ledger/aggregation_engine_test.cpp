#include <gtest/gtest.h>
#include <veil/ledger/aggregation_engine.hpp>
#include <veil/ledger/request_correlator.hpp>
#include <veil/oracle/local_engine.hpp>
#include <veil/testing/common.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace veil::schema;

namespace {

class aggregation_engine_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = veil::testing::make_db_path("veil_aggregation_engine");
    engine_.set_callback([this](const request_token_t& token,
                                const veil::oracle::cleartexts_t& cleartexts,
                                const bytes_t& proof) {
      last_reveal_ =
          aggregation_->apply_bucket_reveal(token, cleartexts, proof, 7'000);
    });
    open(aggregation_mode_t::count);
  }

  void TearDown() override {
    close();
    veil::testing::remove_path(db_path_);
  }

  void open(const aggregation_mode_t mode) {
    storage_.emplace(
        veil::storage::make_storage<veil::storage::rocksdb_storage_tag>(
            db_path_));
    correlator_ = std::make_unique<veil::ledger::request_correlator>(
        encoder_, *storage_);
    aggregation_ = std::make_unique<veil::ledger::aggregation_engine>(
        encoder_, *storage_, bound_, *correlator_, mode);
  }

  void close() {
    aggregation_.reset();
    correlator_.reset();
    storage_.reset();
  }

  void reopen(const aggregation_mode_t mode) {
    close();
    open(mode);
  }

  /// Reveal the bucket through the engine and return the decrypted count.
  std::optional<uint64_t> reveal(const std::string& category) {
    auto token = aggregation_->request_bucket_reveal(category, 6'000);
    if (!token.ok() || !engine_.deliver(*token.value) || !last_reveal_ ||
        !last_reveal_->ok()) {
      return std::nullopt;
    }
    return last_reveal_->value->count;
  }

  std::string db_path_;
  veil::schema::encoding::scale_encoder_t encoder_{};
  veil::oracle::local_engine engine_{veil::testing::make_engine_keys(4)};
  veil::oracle::encryption_engine bound_{engine_.bind()};
  std::optional<veil::storage::rocksdb_storage_t> storage_;
  std::unique_ptr<veil::ledger::request_correlator> correlator_;
  std::unique_ptr<veil::ledger::aggregation_engine> aggregation_;
  std::optional<operation_result<bucket_count>> last_reveal_;
};

}  // namespace

TEST_F(aggregation_engine_test, count_mode_counts_each_submission_once) {
  auto payload = engine_.encrypt(std::string_view{"x"});
  ASSERT_TRUE(aggregation_->fold_submission(1, "Financial", payload).ok());
  ASSERT_TRUE(aggregation_->fold_submission(2, "Financial", payload).ok());
  EXPECT_EQ(aggregation_->fold_submission(1, "Financial", payload).code,
            ledger_error_code::already_folded);
  // Refolding into another category is still a duplicate.
  EXPECT_EQ(aggregation_->fold_submission(2, "Medical", payload).code,
            ledger_error_code::already_folded);

  auto bucket = aggregation_->bucket("Financial");
  ASSERT_TRUE(bucket.has_value());
  EXPECT_EQ(bucket->folded_count, 2u);
  EXPECT_EQ(aggregation_->folded_ids("Financial"),
            (std::vector<submission_id_t>{1, 2}));
  EXPECT_TRUE(aggregation_->folded_ids("Medical").empty());
  EXPECT_FALSE(aggregation_->bucket("Medical").has_value());
  EXPECT_EQ(reveal("Financial"), 2u);
}

TEST_F(aggregation_engine_test, reveal_records_count_without_resetting) {
  auto payload = engine_.encrypt(std::string_view{"x"});
  ASSERT_TRUE(aggregation_->fold_submission(1, "Medical", payload).ok());

  auto before = aggregation_->revealed_count("Medical");
  ASSERT_TRUE(before.ok());
  EXPECT_FALSE(before.value->has_value());

  EXPECT_EQ(reveal("Medical"), 1u);
  auto after = aggregation_->revealed_count("Medical");
  ASSERT_TRUE(after.ok());
  EXPECT_EQ(*after.value, 1u);
  EXPECT_EQ(aggregation_->bucket("Medical")->last_revealed_at, 7'000u);

  ASSERT_TRUE(aggregation_->fold_submission(2, "Medical", payload).ok());
  EXPECT_EQ(reveal("Medical"), 2u);
}

TEST_F(aggregation_engine_test, unknown_bucket_is_not_found) {
  EXPECT_EQ(aggregation_->revealed_count("Nope").code,
            ledger_error_code::not_found);
  EXPECT_EQ(aggregation_->request_bucket_reveal("Nope", 1).code,
            ledger_error_code::not_found);
}

TEST_F(aggregation_engine_test, bucket_reveal_is_single_flight) {
  auto payload = engine_.encrypt(std::string_view{"x"});
  ASSERT_TRUE(aggregation_->fold_submission(1, "Financial", payload).ok());
  ASSERT_TRUE(aggregation_->request_bucket_reveal("Financial", 1).ok());
  EXPECT_EQ(aggregation_->request_bucket_reveal("Financial", 2).code,
            ledger_error_code::already_pending);
}

TEST_F(aggregation_engine_test, forged_bucket_callback_changes_nothing) {
  auto payload = engine_.encrypt(std::string_view{"x"});
  ASSERT_TRUE(aggregation_->fold_submission(1, "Financial", payload).ok());
  auto token = aggregation_->request_bucket_reveal("Financial", 1);
  ASSERT_TRUE(token.ok());

  auto forged = aggregation_->apply_bucket_reveal(
      *token.value, {encode_uint64_le(1'000)}, bytes_t(64, 0x01), 2);
  EXPECT_EQ(forged.code, ledger_error_code::proof_verification_failed);
  EXPECT_FALSE(aggregation_->bucket("Financial")->last_revealed_count);

  ASSERT_TRUE(engine_.deliver(*token.value));
  ASSERT_TRUE(last_reveal_.has_value());
  ASSERT_TRUE(last_reveal_->ok());
  EXPECT_EQ(last_reveal_->value->count, 1u);
}

TEST_F(aggregation_engine_test, sum_mode_adds_payloads) {
  reopen(aggregation_mode_t::sum);
  ASSERT_TRUE(aggregation_
                  ->fold_submission(1, "Financial",
                                    engine_.encrypt(uint64_t{250}))
                  .ok());
  ASSERT_TRUE(aggregation_
                  ->fold_submission(2, "Financial",
                                    engine_.encrypt(uint64_t{750}))
                  .ok());
  EXPECT_EQ(aggregation_
                ->fold_submission(3, "Financial",
                                  engine_.encrypt(std::string_view{"text"}))
                .code,
            ledger_error_code::type_mismatch);
  EXPECT_FALSE(aggregation_->folded(3));
  EXPECT_EQ(reveal("Financial"), 1'000u);
}

TEST_F(aggregation_engine_test, buckets_and_folded_index_survive_reopen) {
  auto payload = engine_.encrypt(std::string_view{"x"});
  ASSERT_TRUE(aggregation_->fold_submission(1, "Financial", payload).ok());
  ASSERT_TRUE(aggregation_->fold_submission(2, "Medical", payload).ok());
  EXPECT_EQ(reveal("Medical"), 1u);

  ASSERT_TRUE(aggregation_->fold_submission(3, "Financial", payload).ok());

  reopen(aggregation_mode_t::count);

  EXPECT_EQ(aggregation_->folded_ids("Financial"),
            (std::vector<submission_id_t>{1, 3}));
  EXPECT_EQ(aggregation_->bucket("Financial")->folded_count, 2u);
  EXPECT_EQ(aggregation_->categories(),
            (std::vector<std::string>{"Financial", "Medical"}));
  EXPECT_TRUE(aggregation_->folded(1));
  EXPECT_EQ(aggregation_->fold_submission(1, "Financial", payload).code,
            ledger_error_code::already_folded);
  EXPECT_EQ(*aggregation_->revealed_count("Medical").value, 1u);
  EXPECT_EQ(reveal("Financial"), 2u);
}

TEST_F(aggregation_engine_test, concurrent_folds_count_distinct_ids) {
  constexpr auto kIds = 40;
  auto payload = engine_.encrypt(std::string_view{"x"});
  auto folded = std::atomic<int>{};
  auto threads = std::vector<std::thread>{};
  // Every thread tries every id; each id must land exactly once.
  for (auto t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (auto i = 1; i <= kIds; ++i) {
        auto category = (i % 2 == 0) ? std::string{"Even"} : std::string{"Odd"};
        if (aggregation_
                ->fold_submission(static_cast<submission_id_t>(i), category,
                                  payload)
                .ok()) {
          ++folded;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(folded.load(), kIds);
  EXPECT_EQ(aggregation_->bucket("Even")->folded_count, 20u);
  EXPECT_EQ(aggregation_->bucket("Odd")->folded_count, 20u);
  EXPECT_EQ(aggregation_->folded_ids("Even").size(), 20u);
  EXPECT_EQ(aggregation_->folded_ids("Odd").size(), 20u);
  EXPECT_EQ(reveal("Even"), 20u);
  EXPECT_EQ(reveal("Odd"), 20u);
}

TEST_F(aggregation_engine_test, overlapping_reveals_keep_the_latest_count) {
  constexpr auto kRounds = 30;
  auto payload = engine_.encrypt(std::string_view{"x"});
  auto results_mutex = std::mutex{};
  auto revealed = std::vector<uint64_t>{};
  engine_.set_callback([&](const request_token_t& token,
                           const veil::oracle::cleartexts_t& cleartexts,
                           const bytes_t& proof) {
    auto result =
        aggregation_->apply_bucket_reveal(token, cleartexts, proof, 7'000);
    if (result.ok()) {
      auto lock = std::scoped_lock{results_mutex};
      revealed.push_back(result.value->count);
    }
  });

  // Each round folds one more submission and issues the next reveal as soon
  // as the previous one frees the slot, while two threads deliver.
  auto issuing = std::atomic<bool>{true};
  auto issuer = std::thread{[&] {
    for (auto i = 1; i <= kRounds; ++i) {
      EXPECT_TRUE(aggregation_
                      ->fold_submission(static_cast<submission_id_t>(i),
                                        "Financial", payload)
                      .ok());
      auto token = aggregation_->request_bucket_reveal(
          "Financial", static_cast<timestamp_milliseconds_t>(i));
      while (token.code == ledger_error_code::already_pending) {
        std::this_thread::yield();
        token = aggregation_->request_bucket_reveal(
            "Financial", static_cast<timestamp_milliseconds_t>(i));
      }
      EXPECT_TRUE(token.ok());
    }
    issuing = false;
  }};
  auto deliverers = std::vector<std::thread>{};
  for (auto t = 0; t < 2; ++t) {
    deliverers.emplace_back([&] {
      while (issuing.load() || engine_.queued() > 0) {
        if (!engine_.deliver_next()) {
          std::this_thread::yield();
        }
      }
    });
  }
  issuer.join();
  for (auto& thread : deliverers) {
    thread.join();
  }

  ASSERT_EQ(revealed.size(), static_cast<std::size_t>(kRounds));
  EXPECT_EQ(*std::max_element(std::begin(revealed), std::end(revealed)),
            static_cast<uint64_t>(kRounds));
  auto stored = aggregation_->revealed_count("Financial");
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(*stored.value, static_cast<uint64_t>(kRounds));
}
