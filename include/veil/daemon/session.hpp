#pragma once

#include <veil/ledger/confidential_ledger.hpp>
#include <veil/oracle/local_engine.hpp>

#include <ostream>
#include <string_view>

namespace veil::daemon {

/// Line-oriented operator session over a ledger and its local engine.
///
/// Principals are given as 64 hex characters or as a name, which is hashed
/// with BLAKE3. Submissions are encrypted client-side with the local engine
/// before they reach the ledger.
class session final {
 public:
  session(veil::ledger::confidential_ledger& ledger,
          veil::oracle::local_engine& engine,
          std::ostream& out);

  /// Run one command line; false once the session should end.
  bool execute(std::string_view line);

 private:
  veil::ledger::confidential_ledger& ledger_;
  veil::oracle::local_engine& engine_;
  std::ostream& out_;
};

}  // namespace veil::daemon
