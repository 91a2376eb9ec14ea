// Repository: Clipper
// Component: Plan Proto Conversion Implementation
// Copyright (c) 2026 Clipper

#include "clipper/render/PlanProto.hpp"

#include <google/protobuf/util/json_util.h>

namespace clipper::render {

namespace {

pb::SegmentKind ToProto(timeline::SegmentKind kind) {
  switch (kind) {
    case timeline::SegmentKind::kAvatar:  return pb::SEGMENT_KIND_AVATAR;
    case timeline::SegmentKind::kCutaway: return pb::SEGMENT_KIND_CUTAWAY;
  }
  return pb::SEGMENT_KIND_AVATAR;
}

pb::DisplayMode ToProto(timeline::DisplayMode mode) {
  switch (mode) {
    case timeline::DisplayMode::kFullFrame:        return pb::DISPLAY_MODE_FULLFRAME;
    case timeline::DisplayMode::kPictureInPicture: return pb::DISPLAY_MODE_PIP;
  }
  return pb::DISPLAY_MODE_FULLFRAME;
}

pb::ClipFill ToProto(timeline::ClipFill fill) {
  switch (fill) {
    case timeline::ClipFill::kNone:            return pb::CLIP_FILL_NONE;
    case timeline::ClipFill::kLoop:            return pb::CLIP_FILL_LOOP;
    case timeline::ClipFill::kFreezeLastFrame: return pb::CLIP_FILL_FREEZE_LAST_FRAME;
  }
  return pb::CLIP_FILL_NONE;
}

void FillSegment(const timeline::Segment& s, pb::Segment* p) {
  p->set_segment_index(s.segment_index);
  p->set_kind(ToProto(s.kind));
  p->set_start_ms(s.start_ms);
  p->set_end_ms(s.end_ms);
  p->set_source_path(s.source_path);
  p->set_source_in_ms(s.source_offset_ms);
  p->set_source_out_ms(s.source_offset_ms + s.duration_ms());
  p->set_display_mode(ToProto(s.display_mode));
  p->set_fade_in_ms(s.fade_in_ms);
  p->set_fade_out_ms(s.fade_out_ms);
  p->set_fill(ToProto(s.fill));
  p->set_query(s.query);
  p->set_source_duration_ms(s.source_duration_ms);
}

void FillCue(const timeline::CaptionCue& c, pb::CaptionCue* p) {
  p->set_cue_index(c.cue_index);
  p->set_start_ms(c.start_ms());
  p->set_end_ms(c.end_ms());
  for (const auto& w : c.words) {
    auto* pw = p->add_words();
    pw->set_text(w.text);
    pw->set_start_ms(timeline::SecondsToMs(w.interval.start));
    pw->set_end_ms(timeline::SecondsToMs(w.interval.end));
  }
  p->set_has_highlight(c.highlight_index.has_value());
  p->set_highlight_index(c.highlight_index.value_or(0));
  for (const auto& step : c.highlight_steps) {
    auto* ps = p->add_highlight_steps();
    ps->set_word_index(step.word_index);
    ps->set_at_ms(step.at_ms());
  }
}

}  // namespace

pb::CompositionPlan ToProto(const timeline::CompositionPlan& plan) {
  pb::CompositionPlan p;
  p.set_job_id(plan.job_id);
  p.set_avatar_path(plan.avatar_path);
  p.set_total_duration_ms(plan.total_duration_ms);
  for (const auto& s : plan.segments) FillSegment(s, p.add_segments());
  for (const auto& t : plan.transitions) {
    auto* pt = p.add_transitions();
    pt->set_boundary_index(t.boundary_index);
    pt->set_at_ms(t.at_ms);
    pt->set_style(timeline::TransitionStyleName(t.style));
    pt->set_duration_ms(t.duration_ms);
    pt->set_left_segment_index(t.left_segment_index);
    pt->set_right_segment_index(t.right_segment_index);
  }
  for (const auto& a : plan.audio_crossfades) {
    auto* pa = p.add_audio_crossfades();
    pa->set_boundary_index(a.boundary_index);
    pa->set_at_ms(a.at_ms);
    pa->set_duration_ms(a.duration_ms);
  }
  for (const auto& c : plan.captions) FillCue(c, p.add_captions());
  return p;
}

pb::PlatformProfile ToProto(const config::PlatformProfile& profile) {
  pb::PlatformProfile p;
  p.set_name(profile.name);
  p.set_width(profile.width);
  p.set_height(profile.height);
  p.set_fps(profile.fps);
  p.set_video_bitrate(profile.video_bitrate);
  p.set_audio_bitrate(profile.audio_bitrate);
  p.set_max_duration_s(profile.max_duration_seconds);
  return p;
}

pb::RenderRequest BuildRenderRequest(const RenderSubmission& submission) {
  pb::RenderRequest req;
  req.set_job_id(submission.job_id);
  req.set_output_dir(submission.output_dir);
  if (submission.plan) {
    *req.mutable_plan() = ToProto(*submission.plan);
  }
  for (const auto& profile : submission.platforms) {
    *req.add_platforms() = ToProto(profile);
  }
  return req;
}

RenderReceipt FromProto(const pb::RenderReceipt& receipt) {
  RenderReceipt r;
  r.accepted = receipt.accepted();
  r.render_id = receipt.render_id();
  r.detail = receipt.detail();
  for (const auto& out : receipt.outputs()) {
    r.outputs.push_back({out.platform(), out.path()});
  }
  return r;
}

bool PlanToJson(const timeline::CompositionPlan& plan, std::string& out,
                std::string* error) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(ToProto(plan), &json, options);
  if (!status.ok()) {
    if (error) *error = status.ToString();
    return false;
  }
  out = std::move(json);
  return true;
}

}  // namespace clipper::render
