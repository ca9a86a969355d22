#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "supervisor/services/v1/supervisor_query_service.grpc.pb.h"
#include "supervisor/services/v1/supervisor_registry_service.grpc.pb.h"
#include "supervisor/services/v1/supervisor_telemetry_service.grpc.pb.h"
#include "supervisor/v1.hpp"

using namespace supervisor::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  supervisorctl <addr> create <task_id> [task_list_id] [pid] [hostname]\n"
            << "  supervisorctl <addr> attach <instance_id> <pid> [hostname]\n"
            << "  supervisorctl <addr> terminal <instance_id> <completed|failed|terminated> [reason]\n"
            << "  supervisorctl <addr> heartbeat <instance_id> [progress_percent] [current_step]\n"
            << "  supervisorctl <addr> emit <execution_id> <instance_id> <lifecycle|tool_use|error|heartbeat|assertion> <category> <summary> [payload_json]\n"
            << "  supervisorctl <addr> status <instance_id>\n"
            << "  supervisorctl <addr> list [task_id] [--stale] [--all]\n"
            << "  supervisorctl <addr> execution <instance_id>\n"
            << "  supervisorctl <addr> transcript <execution_id> [from_sequence] [max_entries]\n"
            << "  supervisorctl <addr> tools <execution_id> [--errors]\n"
            << "  supervisorctl <addr> assertions <execution_id>\n"
            << "  supervisorctl <addr> follow <execution_id|*> [from_sequence]\n";
}

static void Print(const google::protobuf::Message& message) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return;
  }
  std::cout << json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static std::optional<InstanceStatus> ParseStatus(const std::string& value) {
  if (value == "completed") return INSTANCE_STATUS_COMPLETED;
  if (value == "failed") return INSTANCE_STATUS_FAILED;
  if (value == "terminated") return INSTANCE_STATUS_TERMINATED;
  return std::nullopt;
}

static std::optional<EntryType> ParseEntryType(const std::string& value) {
  if (value == "lifecycle") return ENTRY_TYPE_LIFECYCLE;
  if (value == "tool_use") return ENTRY_TYPE_TOOL_USE;
  if (value == "error") return ENTRY_TYPE_ERROR;
  if (value == "heartbeat") return ENTRY_TYPE_HEARTBEAT;
  if (value == "assertion") return ENTRY_TYPE_ASSERTION;
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto registry_stub  = SupervisorRegistryService::NewStub(channel);
  auto telemetry_stub = SupervisorTelemetryService::NewStub(channel);
  auto query_stub     = SupervisorQueryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateInstanceRequest req;
    req.set_task_id(argv[3]);
    if (argc >= 5) req.set_task_list_id(argv[4]);
    if (argc >= 6) req.set_pid(argv[5]);
    if (argc >= 7) req.set_hostname(argv[6]);

    CreateInstanceResponse resp;
    auto                   status = registry_stub->CreateInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "attach") {
    if (argc < 5) return 1;

    AttachProcessRequest req;
    req.set_instance_id(argv[3]);
    req.set_pid(argv[4]);
    if (argc >= 6) req.set_hostname(argv[5]);

    google::protobuf::Empty resp;
    auto                    status = registry_stub->AttachProcess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "attached\n";
    return 0;
  }

  if (cmd == "terminal") {
    if (argc < 5) return 1;

    const auto parsed = ParseStatus(argv[4]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported terminal status: " << argv[4] << "\n";
      return 1;
    }

    MarkTerminalRequest req;
    req.set_instance_id(argv[3]);
    req.set_status(*parsed);
    if (argc >= 6) req.set_reason(argv[5]);

    MarkTerminalResponse resp;
    auto                 status = registry_stub->MarkTerminal(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "heartbeat") {
    if (argc < 4) return 1;

    HeartbeatRequest req;
    req.set_instance_id(argv[3]);
    if (argc >= 5) req.mutable_detail()->set_progress_percent(std::stod(argv[4]));
    if (argc >= 6) req.mutable_detail()->set_current_step(argv[5]);

    HeartbeatResponse resp;
    auto              status = registry_stub->Heartbeat(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "emit") {
    if (argc < 8) return 1;

    const auto entry_type = ParseEntryType(argv[5]);
    if (!entry_type.has_value()) {
      std::cerr << "unsupported entry type: " << argv[5] << "\n";
      return 1;
    }

    EmitRequest req;
    req.set_execution_id(argv[3]);
    req.set_instance_id(argv[4]);
    req.set_entry_type(*entry_type);
    req.set_category(argv[6]);
    req.set_summary(argv[7]);
    if (argc >= 9 && !google::protobuf::util::JsonStringToMessage(argv[8], req.mutable_payload()).ok()) {
      std::cerr << "payload must be a JSON object\n";
      return 1;
    }

    EmitResponse resp;
    auto         status = telemetry_stub->Emit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "status") {
    if (argc < 4) return 1;

    EffectiveStatusRequest req;
    req.set_instance_id(argv[3]);

    EffectiveStatus resp;
    auto            status = query_stub->EffectiveStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "list") {
    ListInstancesRequest req;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--stale") {
        req.set_stale_only(true);
      } else if (arg == "--all") {
        req.set_include_terminal(true);
      } else {
        req.set_task_id(arg);
      }
    }

    ListInstancesResponse resp;
    auto                  status = query_stub->ListInstances(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "execution") {
    if (argc < 4) return 1;

    GetExecutionRequest req;
    req.set_instance_id(argv[3]);

    Execution resp;
    auto      status = query_stub->GetExecution(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "transcript") {
    if (argc < 4) return 1;

    GetTranscriptRequest req;
    req.set_execution_id(argv[3]);
    if (argc >= 5) req.set_from_sequence(std::stoull(argv[4]));
    if (argc >= 6) req.set_max_entries(std::stoull(argv[5]));

    GetTranscriptResponse resp;
    auto                  status = query_stub->GetTranscript(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "tools") {
    if (argc < 4) return 1;

    ListToolUsesRequest req;
    req.set_execution_id(argv[3]);
    req.set_errors_only(argc >= 5 && std::string(argv[4]) == "--errors");

    ListToolUsesResponse resp;
    auto                 status = query_stub->ListToolUses(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "assertions") {
    if (argc < 4) return 1;

    GetAssertionSummaryRequest req;
    req.set_execution_id(argv[3]);

    AssertionSummary resp;
    auto             status = query_stub->GetAssertionSummary(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "follow") {
    if (argc < 4) return 1;

    SubscribeRequest req;
    req.set_execution_id(argv[3]);
    if (argc >= 5) req.set_from_sequence(std::stoull(argv[4]));

    auto              reader = query_stub->Subscribe(&ctx, req);
    SubscribeResponse event;
    while (reader->Read(&event)) {
      Print(event);
      std::cout << std::flush;
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
