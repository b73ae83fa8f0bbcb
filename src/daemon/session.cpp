#include <spdlog/spdlog.h>
#include <veil/blake3/hash.hpp>
#include <veil/daemon/session.hpp>

#include <charconv>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace veil::schema;

namespace veil::daemon {

namespace {

constexpr auto kHelp = std::string_view{
    "submit <owner> <category> <payload> [description...]\n"
    "reveal <id> <owner>\n"
    "deliver [next|all]\n"
    "get <id>\n"
    "list\n"
    "review <id> <owner> verified|rejected\n"
    "stats\n"
    "bucket-reveal <category>\n"
    "bucket-count <category>\n"
    "categories\n"
    "attest <id> <participant> <proof>\n"
    "attestations <id>\n"
    "pending\n"
    "clear submission <id> | clear bucket <category>\n"
    "help\n"
    "quit\n"};

std::vector<std::string> split(const std::string_view line) {
  auto input = std::istringstream{std::string{line}};
  return std::vector<std::string>{std::istream_iterator<std::string>{input},
                                  std::istream_iterator<std::string>{}};
}

std::optional<uint64_t> parse_uint64(const std::string_view text) {
  auto value = uint64_t{};
  auto [end, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

principal_id_t parse_principal(const std::string_view text) {
  if (text.size() == 64) {
    if (auto principal = try_make_hash32(text)) {
      return *principal;
    }
  }
  return veil::blake3::hash(text);
}

std::string join(const std::vector<std::string>& words, const std::size_t from) {
  auto out = std::string{};
  for (auto i = from; i < words.size(); ++i) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(words[i]);
  }
  return out;
}

template <typename T>
bool report_failure(std::ostream& out, const operation_result<T>& result) {
  if (result.ok()) {
    return false;
  }
  out << "error " << to_string(result.code) << ": " << result.log << '\n';
  return true;
}

void print_submission(std::ostream& out, const submission_state_t& state) {
  out << "submission " << state.submission_id << " owner "
      << to_hex(state.owner).substr(0, 16) << " status "
      << to_string(state.status) << " created " << state.created_at;
  if (!state.description.empty()) {
    out << " \"" << state.description << '"';
  }
  if (state.revealed) {
    out << " category '" << state.revealed_category.value_or("") << "'";
    auto payload = state.revealed_payload.value_or(bytes_t{});
    if (state.encrypted_payload.type == ciphertext_type_t::euint64) {
      if (auto value = try_decode_uint64_le(payload)) {
        out << " payload " << *value;
      }
    } else {
      out << " payload '" << make_string(payload) << "'";
    }
  } else {
    out << " sealed";
  }
  out << '\n';
}

}  // namespace

session::session(veil::ledger::confidential_ledger& ledger,
                 veil::oracle::local_engine& engine,
                 std::ostream& out)
    : ledger_{ledger}, engine_{engine}, out_{out} {}

bool session::execute(const std::string_view line) {
  auto words = split(line);
  if (words.empty()) {
    return true;
  }
  const auto& command = words[0];
  auto usage = [&]() { out_ << "usage error; try 'help'\n"; };

  if (command == "quit" || command == "exit") {
    return false;
  }
  if (command == "help") {
    out_ << kHelp;
    return true;
  }

  if (command == "submit") {
    if (words.size() < 4) {
      usage();
      return true;
    }
    auto payload = ciphertext_t{};
    if (ledger_.mode() == aggregation_mode_t::sum) {
      auto value = parse_uint64(words[3]);
      if (!value) {
        out_ << "error invalid_argument: sum mode needs a numeric payload\n";
        return true;
      }
      payload = engine_.encrypt(*value);
    } else {
      payload = engine_.encrypt(std::string_view{words[3]});
    }
    auto result = ledger_.submit(std::move(payload),
                                 engine_.encrypt(std::string_view{words[2]}),
                                 parse_principal(words[1]), join(words, 4));
    if (!report_failure(out_, result)) {
      out_ << "submitted " << *result.value << '\n';
    }
    return true;
  }

  if (command == "reveal") {
    auto id = words.size() == 3 ? parse_uint64(words[1]) : std::nullopt;
    if (!id) {
      usage();
      return true;
    }
    auto result =
        ledger_.request_submission_reveal(*id, parse_principal(words[2]));
    if (!report_failure(out_, result)) {
      out_ << "requested " << to_hex(*result.value) << '\n';
    }
    return true;
  }

  if (command == "deliver") {
    if (words.size() > 1 && words[1] == "all") {
      out_ << "delivered " << engine_.deliver_all() << '\n';
    } else {
      out_ << (engine_.deliver_next() ? "delivered 1\n" : "delivered 0\n");
    }
    return true;
  }

  if (command == "get") {
    auto id = words.size() == 2 ? parse_uint64(words[1]) : std::nullopt;
    if (!id) {
      usage();
      return true;
    }
    auto result = ledger_.get_submission(*id);
    if (!report_failure(out_, result)) {
      print_submission(out_, *result.value);
    }
    return true;
  }

  if (command == "list") {
    auto result = ledger_.list_submissions();
    for (const auto& state : *result.value) {
      print_submission(out_, state);
    }
    return true;
  }

  if (command == "review") {
    auto id = words.size() == 4 ? parse_uint64(words[1]) : std::nullopt;
    auto verdict = words.size() == 4
                       ? try_from_string<submission_status_t>(words[3])
                       : std::nullopt;
    if (!id || !verdict) {
      usage();
      return true;
    }
    auto result =
        ledger_.review_submission(*id, parse_principal(words[2]), *verdict);
    if (!report_failure(out_, result)) {
      print_submission(out_, *result.value);
    }
    return true;
  }

  if (command == "stats") {
    auto stats = *ledger_.statistics().value;
    out_ << "total " << stats.total << " pending " << stats.pending
         << " verified " << stats.verified << " rejected " << stats.rejected
         << " revealed " << stats.revealed << '\n';
    return true;
  }

  if (command == "bucket-reveal" || command == "bucket-count") {
    if (words.size() < 2) {
      usage();
      return true;
    }
    auto category = join(words, 1);
    if (command == "bucket-reveal") {
      auto result = ledger_.request_bucket_reveal(category);
      if (!report_failure(out_, result)) {
        out_ << "requested " << to_hex(*result.value) << '\n';
      }
    } else {
      auto result = ledger_.get_bucket_count(category);
      if (!report_failure(out_, result)) {
        if (*result.value) {
          out_ << "bucket '" << category << "' count " << **result.value
               << '\n';
        } else {
          out_ << "bucket '" << category << "' not yet revealed\n";
        }
      }
    }
    return true;
  }

  if (command == "categories") {
    for (const auto& category : ledger_.categories()) {
      out_ << category << '\n';
    }
    return true;
  }

  if (command == "attest") {
    auto id = words.size() >= 4 ? parse_uint64(words[1]) : std::nullopt;
    if (!id) {
      usage();
      return true;
    }
    auto proof = try_from_hex(words[3]).value_or(make_bytes(words[3]));
    auto result = ledger_.record_attestation(*id, parse_principal(words[2]),
                                             std::move(proof));
    if (!report_failure(out_, result)) {
      out_ << "attestation " << result.value->sequence << " recorded\n";
    }
    return true;
  }

  if (command == "attestations") {
    auto id = words.size() == 2 ? parse_uint64(words[1]) : std::nullopt;
    if (!id) {
      usage();
      return true;
    }
    for (const auto& record : *ledger_.list_attestations(*id).value) {
      out_ << record.sequence << " participant "
           << to_hex(record.participant).substr(0, 16) << " proof "
           << to_hex(record.confidential_proof) << " at "
           << record.recorded_at << '\n';
    }
    return true;
  }

  if (command == "pending") {
    for (const auto& request : ledger_.outstanding_requests()) {
      out_ << to_hex(request.token) << ' ' << to_string(request.kind) << ' '
           << describe(request.target) << '\n';
    }
    return true;
  }

  if (command == "clear") {
    if (words.size() < 3) {
      usage();
      return true;
    }
    auto target = std::optional<request_target_t>{};
    if (words[1] == "submission") {
      if (auto id = parse_uint64(words[2])) {
        target = submission_ref{.submission_id = *id};
      }
    } else if (words[1] == "bucket") {
      target = bucket_ref{.category = join(words, 2)};
    }
    if (!target) {
      usage();
      return true;
    }
    auto result = ledger_.force_clear_request(*target, expected_kind(*target));
    if (!report_failure(out_, result)) {
      out_ << "cleared " << to_hex(result.value->token) << '\n';
    }
    return true;
  }

  spdlog::debug("Unknown session command '{}'", command);
  out_ << "unknown command '" << command << "'; try 'help'\n";
  return true;
}

}  // namespace veil::daemon
