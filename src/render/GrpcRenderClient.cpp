// Repository: Clipper
// Component: gRPC render client implementation
// Copyright (c) 2026 Clipper

#include "clipper/render/GrpcRenderClient.hpp"

#include <sstream>

#include "clipper/render/PlanProto.hpp"
#include "clipper/util/Logger.hpp"

namespace clipper::render {

GrpcRenderClient::GrpcRenderClient(const std::string& target_address,
                                   std::chrono::milliseconds deadline)
    : target_address_(target_address),
      deadline_(deadline),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(pb::RenderService::NewStub(grpc_channel_)) {}

GrpcRenderClient::GrpcRenderClient(std::shared_ptr<grpc::Channel> channel,
                                   std::chrono::milliseconds deadline)
    : target_address_("in-process"),
      deadline_(deadline),
      grpc_channel_(std::move(channel)),
      stub_(pb::RenderService::NewStub(grpc_channel_)) {}

RenderReceipt GrpcRenderClient::Submit(const RenderSubmission& submission) {
  pb::RenderRequest request = BuildRenderRequest(submission);
  pb::RenderReceipt response;

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  grpc::Status status = stub_->SubmitPlan(&ctx, request, &response);
  if (!status.ok()) {
    RenderReceipt failed;
    std::ostringstream detail;
    detail << "SubmitPlan to " << target_address_ << " failed: code="
           << static_cast<int>(status.error_code()) << " " << status.error_message();
    failed.detail = detail.str();
    util::Logger::Warn("[GrpcRenderClient] job=" + submission.job_id + " " + failed.detail);
    return failed;
  }

  RenderReceipt receipt = FromProto(response);
  std::ostringstream oss;
  oss << "[GrpcRenderClient] job=" << submission.job_id
      << " accepted=" << (receipt.accepted ? "true" : "false")
      << " render_id=" << receipt.render_id
      << " outputs=" << receipt.outputs.size();
  util::Logger::Info(oss.str());
  return receipt;
}

}  // namespace clipper::render
