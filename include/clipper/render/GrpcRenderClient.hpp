// Repository: Clipper
// Component: gRPC render client
// Purpose: Submits CompositionPlans to the external RenderService.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_RENDER_GRPC_RENDER_CLIENT_HPP_
#define CLIPPER_RENDER_GRPC_RENDER_CLIENT_HPP_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "clipper/render/IRenderSink.hpp"
#include "clipper/render/v1/composition_plan.grpc.pb.h"

namespace clipper::render {

// One unary SubmitPlan call per job, bounded by a deadline. Transport errors
// and refusals both come back as a non-accepted receipt; nothing throws.
// Stubs are thread-safe, so batch workers share one client.
class GrpcRenderClient : public IRenderSink {
 public:
  GrpcRenderClient(const std::string& target_address,
                   std::chrono::milliseconds deadline);

  // For tests: an existing channel (e.g. in-process server).
  GrpcRenderClient(std::shared_ptr<grpc::Channel> channel,
                   std::chrono::milliseconds deadline);

  GrpcRenderClient(const GrpcRenderClient&) = delete;
  GrpcRenderClient& operator=(const GrpcRenderClient&) = delete;

  RenderReceipt Submit(const RenderSubmission& submission) override;

  const char* Name() const override { return "grpc"; }

  const std::string& target() const { return target_address_; }

 private:
  std::string target_address_;
  std::chrono::milliseconds deadline_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<clipper::render::v1::RenderService::Stub> stub_;
};

}  // namespace clipper::render

#endif  // CLIPPER_RENDER_GRPC_RENDER_CLIENT_HPP_
