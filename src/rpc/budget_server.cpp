#include "rpc/budget_server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <string>

#include "rpc/budget_protocol.hpp"
#include "rpc/socket_io.hpp"

namespace joule_gate::rpc {

namespace {
constexpr int kAcceptPollMs = 200;
constexpr std::chrono::milliseconds kConnectionTimeout{500};
}  // namespace

BudgetServer::BudgetServer(budget::BudgetSource& budget) : budget_(budget) {}

int BudgetServer::run(std::istream& in, std::ostream& out, std::ostream& err) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      const std::string response = handle_line(line);
      if (!response.empty()) {
        out << response << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "[rpc] failed to process request: " << ex.what() << '\n';
      out << encode_error(nullptr, kInternalError, "internal error") << '\n';
      out.flush();
    }
  }

  return 0;
}

bool BudgetServer::serve(const std::string& socket_path, const std::atomic<bool>& stop) {
  UniqueFd listener = listen_unix(socket_path);
  if (!listener.valid()) {
    std::cerr << "[rpc] unable to listen on unix://" << socket_path << '\n';
    return false;
  }
  std::cerr << "[rpc] budget listening on unix://" << socket_path << '\n';

  while (!stop.load()) {
    pollfd descriptor{};
    descriptor.fd = listener.get();
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, kAcceptPollMs);
    if (ready <= 0) {
      continue;
    }

    UniqueFd client(::accept4(listener.get(), nullptr, nullptr, SOCK_CLOEXEC));
    if (!client.valid()) {
      continue;
    }
    if (!set_io_timeout(client.get(), kConnectionTimeout)) {
      continue;
    }

    std::string line;
    if (!recv_line(client.get(), line) || line.empty()) {
      continue;
    }

    std::string response;
    try {
      response = handle_line(line);
    } catch (const std::exception& ex) {
      std::cerr << "[rpc] failed to process request: " << ex.what() << '\n';
      response = encode_error(nullptr, kInternalError, "internal error");
    }

    if (!response.empty() && !send_line(client.get(), response)) {
      std::cerr << "[rpc] failed to send response\n";
    }
  }

  listener.reset();
  ::unlink(socket_path.c_str());
  return true;
}

std::string BudgetServer::handle_line(const std::string& line) {
  BudgetRequest request{};
  try {
    request = decode_request(line);
  } catch (const ProtocolError& ex) {
    if (!ex.answerable()) {
      return {};
    }
    return encode_error(ex.id(), ex.code(), ex.what());
  }

  // Notifications are still carried out; they only go unanswered.
  const nlohmann::json result = request.method == BudgetMethod::take ? take_to_json(budget_.take(request.joules))
                                                                      : sample_to_json(budget_.sample());
  if (!request.id.has_value()) {
    return {};
  }
  return encode_result(*request.id, result);
}

}  // namespace joule_gate::rpc
