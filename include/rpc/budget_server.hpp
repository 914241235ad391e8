#pragma once

#include <atomic>
#include <iosfwd>
#include <string>

#include "budget/budget_source.hpp"

namespace joule_gate::rpc {

// Exposes a budget as JSON-RPC methods `sample` and `take {joules}`.
class BudgetServer {
 public:
  explicit BudgetServer(budget::BudgetSource& budget);

  // Line-delimited requests on a stream pair until EOF.
  int run(std::istream& in, std::ostream& out, std::ostream& err);

  // One request per connection on a Unix socket until `stop` is set.
  // Returns false if the socket could not be opened.
  bool serve(const std::string& socket_path, const std::atomic<bool>& stop);

  // Empty string when the request was a notification.
  std::string handle_line(const std::string& line);

 private:
  budget::BudgetSource& budget_;
};

}  // namespace joule_gate::rpc
