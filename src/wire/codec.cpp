#include "codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "protocol.pb.h"

namespace wire {

using google::protobuf::Struct;
namespace pb = relay_adapter::protocol::v1;

namespace {

Action convert_action(const pb::Request &msg) {
  Action action;
  if (!msg.has_action()) {
    return action;
  }
  action.href = msg.action().href();
  for (const auto &kv : msg.action().header()) {
    action.header.emplace(kv.first, kv.second);
  }
  action.expires_at = msg.action().expires_at();
  return action;
}

bool validate_transfer_fields(const pb::Request &msg, std::string &err) {
  if (msg.oid().empty()) {
    err = msg.id() + " request is missing 'oid'";
    return false;
  }
  if (msg.size() < 0) {
    err = msg.id() + " request for " + msg.oid() +
          " has negative size: " + std::to_string(msg.size());
    return false;
  }
  return true;
}

void set_error(Struct &msg, const TransferError &error) {
  auto &fields = *msg.mutable_fields();
  auto &err_fields = *fields["error"].mutable_struct_value()->mutable_fields();
  err_fields["code"].set_number_value(static_cast<double>(error.code));
  err_fields["message"].set_string_value(error.message);
}

// Numbers go through google.protobuf.Value so they are printed as bare JSON
// numbers (int64 message fields would be quoted strings).
Struct to_struct(const InitResponse &resp) {
  Struct msg;
  if (resp.error) {
    set_error(msg, *resp.error);
  }
  return msg;
}

Struct to_struct(const ProgressResponse &resp) {
  Struct msg;
  auto &fields = *msg.mutable_fields();
  fields["id"].set_string_value("progress");
  fields["oid"].set_string_value(resp.oid);
  fields["bytesSoFar"].set_number_value(static_cast<double>(resp.bytes_so_far));
  fields["bytesSinceLast"].set_number_value(
      static_cast<double>(resp.bytes_since_last));
  return msg;
}

Struct to_struct(const TransferResponse &resp) {
  Struct msg;
  auto &fields = *msg.mutable_fields();
  fields["id"].set_string_value("complete");
  fields["oid"].set_string_value(resp.oid);
  if (!resp.path.empty()) {
    fields["path"].set_string_value(resp.path);
  }
  if (resp.error) {
    set_error(msg, *resp.error);
  }
  return msg;
}

} // namespace

const char *command_name(const Request &req) {
  switch (req.index()) {
  case 0:
    return "init";
  case 1:
    return "download";
  case 2:
    return "upload";
  case 3:
    return "terminate";
  }
  return "unknown";
}

const char *decode_status_name(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::Ok:
    return "ok";
  case DecodeStatus::InvalidJson:
    return "invalid json";
  case DecodeStatus::UnknownCommand:
    return "unknown command";
  case DecodeStatus::InvalidField:
    return "invalid field";
  }
  return "unknown";
}

DecodeStatus decode_request(const std::string &line, Request &out,
                            std::string &err) {
  err.clear();

  pb::Request msg;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status =
      google::protobuf::util::JsonStringToMessage(line, &msg, options);
  if (!status.ok()) {
    err = status.ToString();
    return DecodeStatus::InvalidJson;
  }

  const std::string &id = msg.id();

  if (id == "init") {
    if (msg.concurrenttransfers() < 0) {
      err = "init request has negative concurrenttransfers: " +
            std::to_string(msg.concurrenttransfers());
      return DecodeStatus::InvalidField;
    }
    InitRequest init;
    init.operation = msg.operation();
    init.concurrent = msg.concurrent();
    init.concurrent_transfers = msg.concurrenttransfers();
    out = init;
    return DecodeStatus::Ok;
  }

  if (id == "download") {
    if (!validate_transfer_fields(msg, err)) {
      return DecodeStatus::InvalidField;
    }
    DownloadRequest download;
    download.oid = msg.oid();
    download.size = msg.size();
    download.action = convert_action(msg);
    out = download;
    return DecodeStatus::Ok;
  }

  if (id == "upload") {
    if (!validate_transfer_fields(msg, err)) {
      return DecodeStatus::InvalidField;
    }
    UploadRequest upload;
    upload.oid = msg.oid();
    upload.size = msg.size();
    upload.path = msg.path();
    upload.action = convert_action(msg);
    out = upload;
    return DecodeStatus::Ok;
  }

  if (id == "terminate") {
    out = TerminateRequest{};
    return DecodeStatus::Ok;
  }

  err = id.empty() ? "request has no 'id'" : "unknown request id '" + id + "'";
  return DecodeStatus::UnknownCommand;
}

bool encode_response(const Response &resp, std::string &line,
                     std::string &err) {
  err.clear();
  line.clear();

  const Struct msg =
      std::visit([](const auto &r) { return to_struct(r); }, resp);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;

  const auto status =
      google::protobuf::util::MessageToJsonString(msg, &line, options);
  if (!status.ok()) {
    err = "failed to serialize response: " + status.ToString();
    line.clear();
    return false;
  }
  return true;
}

} // namespace wire
