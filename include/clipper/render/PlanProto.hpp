// Repository: Clipper
// Component: Plan Proto Conversion
// Purpose: Converts engine structs to clipper.render.v1 messages and back.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_RENDER_PLAN_PROTO_HPP_
#define CLIPPER_RENDER_PLAN_PROTO_HPP_

#include <string>

#include "clipper/render/IRenderSink.hpp"
#include "clipper/render/v1/composition_plan.pb.h"

namespace clipper::render {

namespace pb = clipper::render::v1;

pb::CompositionPlan ToProto(const timeline::CompositionPlan& plan);

pb::PlatformProfile ToProto(const config::PlatformProfile& profile);

pb::RenderRequest BuildRenderRequest(const RenderSubmission& submission);

RenderReceipt FromProto(const pb::RenderReceipt& receipt);

// Pretty-printed JSON of the plan message (debug dump). Returns false with
// *error set if serialization fails.
bool PlanToJson(const timeline::CompositionPlan& plan, std::string& out,
                std::string* error);

}  // namespace clipper::render

#endif  // CLIPPER_RENDER_PLAN_PROTO_HPP_
