#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/scanhub/v1.hpp"

using namespace scanhub::api;

static void Usage() {
  std::cout << "Usage:\n"
            << "  scanhubctl <addr> watch <login> [--token <token>]\n"
            << "  scanhubctl <addr> scan <login> <platform> [product] [--token <token>]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json).ok()) {
    return "<unprintable>";
  }
  return json;
}

static std::optional<int64_t> ParseId(const std::string& s) {
  try {
    std::size_t pos   = 0;
    auto        value = std::stoll(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static ClientMessage MakeRegister(const std::string& login, const std::optional<std::string>& token, ConnectionRole role) {
  ClientMessage msg;
  auto*         reg = msg.mutable_register_();
  if (token) {
    reg->set_token(*token);
  } else {
    reg->set_login(login);
  }
  reg->set_role(role);
  return msg;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  // positional arguments after the command, with --token pulled out
  std::vector<std::string>   args;
  std::optional<std::string> token;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--token") {
      if (i + 1 >= argc) {
        Usage();
        return 1;
      }
      token = argv[++i];
      continue;
    }
    args.push_back(arg);
  }

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SessionService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (args.size() != 1) {
      Usage();
      return 1;
    }

    auto stream = stub->Connect(&ctx);
    if (!stream->Write(MakeRegister(args[0], token, CONNECTION_ROLE_READER))) {
      std::cerr << "failed to send register\n";
      return 2;
    }

    ServerEvent event;
    while (stream->Read(&event)) {
      std::cout << ToJson(event) << std::endl;
    }

    auto status = stream->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    if (args.size() < 2 || args.size() > 3) {
      Usage();
      return 1;
    }

    auto platform = ParseId(args[1]);
    if (!platform) {
      std::cerr << "invalid platform: " << args[1] << "\n";
      return 1;
    }

    ClientMessage pairing;
    pairing.mutable_new_pairing()->set_platform(*platform);
    if (args.size() == 3) {
      auto product = ParseId(args[2]);
      if (!product) {
        std::cerr << "invalid product: " << args[2] << "\n";
        return 1;
      }
      pairing.mutable_new_pairing()->set_product(*product);
    }

    auto stream = stub->Connect(&ctx);
    if (!stream->Write(MakeRegister(args[0], token, CONNECTION_ROLE_WRITER))) {
      std::cerr << "failed to send register\n";
      return 2;
    }

    ServerEvent snapshot;
    if (!stream->Read(&snapshot)) {
      auto status = stream->Finish();
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << ToJson(snapshot) << std::endl;

    if (!stream->Write(pairing)) {
      std::cerr << "failed to send pairing\n";
    }
    stream->WritesDone();

    ServerEvent event;
    while (stream->Read(&event)) {
      std::cout << ToJson(event) << std::endl;
    }

    auto status = stream->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "sent\n";
    return 0;
  }

  Usage();
  return 1;
}
