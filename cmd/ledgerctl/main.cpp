#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "streamledger/v1_grpc.hpp"

using namespace streamledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl <addr> <account> create <recipient> <amount> --end <unix_seconds>\n"
            << "  ledgerctl <addr> <account> create <recipient> <amount> --duration <seconds>\n"
            << "  ledgerctl <addr> <account> withdraw <stream_id> [amount]\n"
            << "  ledgerctl <addr> <account> get <stream_id>\n"
            << "  ledgerctl <addr> <account> info\n";
}

static const char* StateName(StreamState state) {
  switch (state) {
    case STREAM_STATE_ACTIVE:
      return "active";
    case STREAM_STATE_DRAINED:
      return "drained";
    default:
      return "unspecified";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string account = argv[2];
  std::string cmd     = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = StreamLedgerService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-ledger-account", account);

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc != 8) {
        Usage();
        return 1;
      }

      CreateStreamRequest req;
      req.set_recipient(argv[4]);
      req.set_funded_amount(std::stoull(argv[5]));

      const std::string flag = argv[6];
      if (flag == "--end") {
        req.set_end_date(std::stoull(argv[7]));
      } else if (flag == "--duration") {
        req.set_duration(std::stoull(argv[7]));
      } else {
        Usage();
        return 1;
      }

      CreateStreamResponse resp;
      auto status = stub->CreateStream(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "stream_id=" << resp.stream_id() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "withdraw") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      WithdrawRequest req;
      req.set_stream_id(std::stoull(argv[4]));
      if (argc >= 6) {
        req.set_amount(std::stoull(argv[5]));
      }

      WithdrawResponse resp;
      auto status = stub->Withdraw(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "withdrawn=" << resp.amount_withdrawn() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      GetStreamRequest req;
      req.set_stream_id(std::stoull(argv[4]));

      GetStreamResponse resp;
      auto status = stub->GetStream(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& s  = resp.stream();
      const auto& st = resp.status();
      std::cout << "stream_id=" << s.stream_id() << " payer=" << s.payer() << " recipient=" << s.recipient() << "\n"
                << "original=" << s.original_balance() << " current=" << s.current_balance() << "\n"
                << "start=" << s.start_date() << " end=" << s.end_date() << "\n"
                << "vested=" << st.vested() << " withdrawable=" << st.withdrawable() << " state=" << StateName(st.state())
                << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "info") {
      GetLedgerInfoRequest  req;
      GetLedgerInfoResponse resp;
      auto status = stub->GetLedgerInfo(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "owner=" << resp.owner() << " next_stream_id=" << resp.next_stream_id() << "\n";
      return 0;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "number out of range: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
