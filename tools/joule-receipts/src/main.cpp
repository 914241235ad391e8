#include <cstddef>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>

#include "ledger/receipt_ledger.hpp"
#include "model/receipt.hpp"

namespace {

int usage() {
  std::cerr << "usage: joule-receipts [ledger_path] [count] [--json]\n";
  return 2;
}

}  // namespace

// Prints the newest receipts of a ledger, newest first.
int main(int argc, char** argv) {
  std::string ledger_path = "./state/receipts.jsonl";
  std::size_t count = 10;
  bool as_json = false;

  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--json") {
      as_json = true;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      return usage();
    }
    if (positional == 0) {
      ledger_path = arg;
    } else if (positional == 1) {
      try {
        const long long parsed = std::stoll(arg);
        if (parsed <= 0) {
          return usage();
        }
        count = static_cast<std::size_t>(parsed);
      } catch (const std::exception&) {
        return usage();
      }
    } else {
      return usage();
    }
    ++positional;
  }

  try {
    const auto receipts = joule_gate::ledger::tail_receipts(ledger_path, count);
    for (const auto& receipt : receipts) {
      if (as_json) {
        std::cout << joule_gate::model::to_json_line(receipt) << '\n';
        continue;
      }
      std::printf("#%llu %-20s joule=%.3f sec=%.3f delta=%.6f loss=%.6f hash=%.12s\n",
                  static_cast<unsigned long long>(receipt.id), receipt.fields.task_name.c_str(),
                  receipt.fields.joules_charged, receipt.fields.duration_sec, receipt.fields.delta,
                  receipt.fields.loss, receipt.fields.content_hash.c_str());
    }
  } catch (const std::exception& ex) {
    std::cerr << "[ledger] " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
