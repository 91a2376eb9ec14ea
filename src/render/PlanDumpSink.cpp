// Repository: Clipper
// Component: Plan Dump Sink Implementation
// Copyright (c) 2026 Clipper

#include "clipper/render/PlanDumpSink.hpp"

#include <filesystem>

#include "clipper/captions/SrtWriter.hpp"
#include "clipper/render/PlanProto.hpp"
#include "clipper/util/AtomicFile.hpp"
#include "clipper/util/Logger.hpp"

namespace clipper::render {

PlanDumpSink::PlanDumpSink(std::string dump_dir) : dump_dir_(std::move(dump_dir)) {}

std::string PlanDumpSink::PlanPath(const std::string& job_id) const {
  return (std::filesystem::path(dump_dir_) / (job_id + ".plan.json")).string();
}

std::string PlanDumpSink::SrtPath(const std::string& job_id) const {
  return (std::filesystem::path(dump_dir_) / (job_id + ".srt")).string();
}

RenderReceipt PlanDumpSink::Submit(const RenderSubmission& submission) {
  RenderReceipt receipt;
  if (submission.plan == nullptr) {
    receipt.detail = "no plan supplied";
    return receipt;
  }

  std::string err;
  if (!util::EnsureDirectory(dump_dir_, &err)) {
    receipt.detail = err;
    return receipt;
  }

  std::string json;
  if (!PlanToJson(*submission.plan, json, &err)) {
    receipt.detail = "plan serialization failed: " + err;
    return receipt;
  }
  const std::string plan_path = PlanPath(submission.job_id);
  if (!util::WriteFileAtomically(plan_path, json, &err)) {
    receipt.detail = err;
    return receipt;
  }

  const std::string srt_path = SrtPath(submission.job_id);
  if (!captions::WriteSrtFile(submission.plan->captions, srt_path, &err)) {
    receipt.detail = err;
    return receipt;
  }

  util::Logger::Info("[PlanDumpSink] job=" + submission.job_id + " plan=" + plan_path);
  receipt.accepted = true;
  receipt.render_id = "dump:" + submission.job_id;
  receipt.outputs.push_back({"plan", plan_path});
  receipt.outputs.push_back({"srt", srt_path});
  return receipt;
}

}  // namespace clipper::render
