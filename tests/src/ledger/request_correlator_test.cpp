#include <gtest/gtest.h>
#include <veil/ledger/request_correlator.hpp>
#include <veil/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace veil::schema;

namespace {

bool accept_dispatch(const request_token_t&) {
  return true;
}

operation_result<void> accept(const decryption_request_t&) {
  return make_success();
}

operation_result<void> reject(const decryption_request_t&) {
  return make_failure<void>(ledger_error_code::proof_verification_failed,
                            "bad proof");
}

class request_correlator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = veil::testing::make_db_path("veil_request_correlator");
    open();
  }

  void TearDown() override {
    correlator_.reset();
    storage_.reset();
    veil::testing::remove_path(db_path_);
  }

  void open() {
    storage_.emplace(
        veil::storage::make_storage<veil::storage::rocksdb_storage_tag>(
            db_path_));
    correlator_ = std::make_unique<veil::ledger::request_correlator>(
        encoder_, *storage_);
  }

  void reopen() {
    correlator_.reset();
    storage_.reset();
    open();
  }

  operation_result<request_token_t> issue_submission(const submission_id_t id) {
    return correlator_->issue(submission_ref{.submission_id = id},
                              request_kind_t::submission_reveal, 1'000,
                              accept_dispatch);
  }

  std::string db_path_;
  veil::schema::encoding::scale_encoder_t encoder_{};
  std::optional<veil::storage::rocksdb_storage_t> storage_;
  std::unique_ptr<veil::ledger::request_correlator> correlator_;
};

}  // namespace

TEST_F(request_correlator_test, second_issue_for_same_slot_is_already_pending) {
  auto first = issue_submission(1);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(issue_submission(1).code, ledger_error_code::already_pending);
  EXPECT_TRUE(correlator_->is_pending(submission_ref{.submission_id = 1},
                                      request_kind_t::submission_reveal));

  // A different target is an independent slot.
  EXPECT_TRUE(issue_submission(2).ok());
}

TEST_F(request_correlator_test, resolve_frees_the_slot_for_reissue) {
  auto token = *issue_submission(1).value;
  auto resolved = correlator_->resolve(token, accept);
  ASSERT_TRUE(resolved.ok());
  EXPECT_EQ(resolved.value->token, token);
  EXPECT_EQ(resolved.value->kind, request_kind_t::submission_reveal);
  EXPECT_EQ(std::get<submission_ref>(resolved.value->target).submission_id,
            1u);
  EXPECT_EQ(resolved.value->issued_at, 1'000u);

  auto reissued = issue_submission(1);
  ASSERT_TRUE(reissued.ok());
  EXPECT_NE(*reissued.value, token);
}

TEST_F(request_correlator_test, unknown_and_replayed_tokens_are_rejected) {
  EXPECT_EQ(correlator_->resolve(veil::testing::make_hash(1), accept).code,
            ledger_error_code::unknown_request);

  auto token = *issue_submission(1).value;
  ASSERT_TRUE(correlator_->resolve(token, accept).ok());
  EXPECT_EQ(correlator_->resolve(token, accept).code,
            ledger_error_code::unknown_request);
  EXPECT_FALSE(correlator_->find(token).has_value());
}

TEST_F(request_correlator_test, failed_authentication_keeps_request_pending) {
  auto token = *issue_submission(1).value;
  EXPECT_EQ(correlator_->resolve(token, reject).code,
            ledger_error_code::proof_verification_failed);
  EXPECT_TRUE(correlator_->find(token).has_value());
  EXPECT_EQ(issue_submission(1).code, ledger_error_code::already_pending);

  EXPECT_TRUE(correlator_->resolve(token, accept).ok());
}

TEST_F(request_correlator_test, commit_runs_before_the_slot_is_released) {
  auto token = *issue_submission(1).value;
  EXPECT_EQ(correlator_
                ->resolve(token, reject,
                          [](const decryption_request_t&) {
                            ADD_FAILURE() << "commit ran after a rejection";
                          })
                .code,
            ledger_error_code::proof_verification_failed);

  auto contender = std::thread{};
  auto reissued = std::atomic<bool>{};
  auto reissue_done = std::atomic<bool>{};
  auto blocked_during_commit = false;
  auto resolved = correlator_->resolve(
      token, accept, [&](const decryption_request_t& request) {
        EXPECT_EQ(request.token, token);
        EXPECT_TRUE(correlator_->find(token).has_value());
        contender = std::thread{[&] {
          reissued = issue_submission(1).ok();
          reissue_done = true;
        }};
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        blocked_during_commit = !reissue_done.load();
      });
  contender.join();

  ASSERT_TRUE(resolved.ok());
  EXPECT_TRUE(blocked_during_commit);
  EXPECT_TRUE(reissued.load());
}

TEST_F(request_correlator_test, kind_must_match_target) {
  auto mismatched = correlator_->issue(submission_ref{.submission_id = 1},
                                       request_kind_t::bucket_count_reveal,
                                       1'000, accept_dispatch);
  EXPECT_EQ(mismatched.code, ledger_error_code::invalid_argument);
  EXPECT_TRUE(correlator_->outstanding().empty());
}

TEST_F(request_correlator_test, refused_dispatch_rolls_back) {
  auto refused = correlator_->issue(
      bucket_ref{.category = "Financial"}, request_kind_t::bucket_count_reveal,
      1'000, [](const request_token_t&) { return false; });
  EXPECT_EQ(refused.code, ledger_error_code::oracle_unavailable);
  EXPECT_FALSE(correlator_->is_pending(bucket_ref{.category = "Financial"},
                                       request_kind_t::bucket_count_reveal));
  EXPECT_TRUE(correlator_->outstanding().empty());
}

TEST_F(request_correlator_test, dispatch_sees_the_recorded_token) {
  auto seen = std::optional<decryption_request_t>{};
  auto issued = correlator_->issue(
      bucket_ref{.category = "Medical"}, request_kind_t::bucket_count_reveal,
      5, [&](const request_token_t& token) {
        seen = correlator_->find(token);
        return true;
      });
  ASSERT_TRUE(issued.ok());
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(seen->token, *issued.value);
}

TEST_F(request_correlator_test, submission_and_bucket_slots_never_collide) {
  // A category spelling the same bytes as a big-endian id still gets its own
  // slot because the kind is part of the key.
  auto category = std::string(7, '\0') + std::string(1, '\x01');
  ASSERT_TRUE(issue_submission(1).ok());
  EXPECT_TRUE(correlator_
                  ->issue(bucket_ref{.category = category},
                          request_kind_t::bucket_count_reveal, 1,
                          accept_dispatch)
                  .ok());
  EXPECT_EQ(correlator_->outstanding().size(), 2u);
}

TEST_F(request_correlator_test, force_clear_unblocks_a_stale_slot) {
  auto stale = *issue_submission(1).value;
  auto cleared = correlator_->force_clear(submission_ref{.submission_id = 1},
                                          request_kind_t::submission_reveal);
  ASSERT_TRUE(cleared.ok());
  EXPECT_EQ(cleared.value->token, stale);

  auto fresh = issue_submission(1);
  ASSERT_TRUE(fresh.ok());
  EXPECT_EQ(correlator_->resolve(stale, accept).code,
            ledger_error_code::unknown_request);
  EXPECT_TRUE(correlator_->resolve(*fresh.value, accept).ok());

  EXPECT_EQ(correlator_
                ->force_clear(submission_ref{.submission_id = 1},
                              request_kind_t::submission_reveal)
                .code,
            ledger_error_code::not_found);
}

TEST_F(request_correlator_test, outstanding_requests_survive_reopen) {
  auto token = *issue_submission(3).value;
  ASSERT_TRUE(correlator_
                  ->issue(bucket_ref{.category = "Financial"},
                          request_kind_t::bucket_count_reveal, 2'000,
                          accept_dispatch)
                  .ok());

  reopen();

  auto outstanding = correlator_->outstanding();
  ASSERT_EQ(outstanding.size(), 2u);
  EXPECT_EQ(outstanding[0].token, token);
  EXPECT_EQ(issue_submission(3).code, ledger_error_code::already_pending);
  EXPECT_TRUE(correlator_->resolve(token, accept).ok());

  reopen();
  EXPECT_EQ(correlator_->outstanding().size(), 1u);
}

TEST_F(request_correlator_test, concurrent_resolves_consume_exactly_once) {
  auto token = *issue_submission(1).value;
  auto successes = std::atomic<int>{};
  auto unknown = std::atomic<int>{};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result = correlator_->resolve(token, accept);
      if (result.ok()) {
        ++successes;
      } else if (result.code == ledger_error_code::unknown_request) {
        ++unknown;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(unknown.load(), 7);
}

TEST_F(request_correlator_test, concurrent_issues_reserve_a_slot_once) {
  auto successes = std::atomic<int>{};
  auto pending = std::atomic<int>{};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result = issue_submission(5);
      if (result.ok()) {
        ++successes;
      } else if (result.code == ledger_error_code::already_pending) {
        ++pending;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(pending.load(), 7);
}

TEST_F(request_correlator_test, distinct_slots_resolve_independently) {
  constexpr auto kSlots = 64;
  auto tokens = std::vector<request_token_t>{};
  for (auto i = 1; i <= kSlots; ++i) {
    tokens.push_back(*issue_submission(static_cast<submission_id_t>(i)).value);
  }
  auto successes = std::atomic<int>{};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (auto i = t; i < kSlots; i += 4) {
        if (correlator_->resolve(tokens[static_cast<std::size_t>(i)], accept)
                .ok()) {
          ++successes;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(successes.load(), kSlots);
  EXPECT_TRUE(correlator_->outstanding().empty());
}
