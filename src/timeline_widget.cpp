#include "timeline_widget.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "surface.hpp"

namespace {

ImU32 segment_color(const ZoomSegment& seg, int alpha) {
    Color c;
    if (!parse_hex_color(seg.color, &c)) c = {108, 92, 231, 255};
    return IM_COL32(c.r, c.g, c.b, alpha);
}

void format_time(double t, char* buf, size_t size) {
    int m = (int)(t / 60.0);
    double s = std::fmod(t, 60.0);
    if (m > 0) std::snprintf(buf, size, "%d:%04.1f", m, s);
    else std::snprintf(buf, size, "%.1fs", s);
}

} // anonymous namespace

bool ZoomTimeline(const char* label, Timeline& timeline, std::vector<ZoomSegment>& segments, const ImVec2& size,
                  ZoomTimelineState& state) {
    ImVec2 pos = ImGui::GetCursorScreenPos();
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    state.segments_changed = false;

    ImVec2 bb_min = pos;
    ImVec2 bb_max = ImVec2(pos.x + size.x, pos.y + size.y);
    double duration = std::max(timeline.duration(), 0.001);

    TimelineScale scale;
    scale.origin_x = bb_min.x;
    scale.px_per_second = size.x / duration;

    float ruler_h = 18.0f;
    float clip_top = bb_min.y + ruler_h;
    float clip_h = (size.y - ruler_h) * 0.45f;
    float seg_top = clip_top + clip_h + 6.0f;
    float seg_h = bb_max.y - seg_top - 4.0f;

    draw_list->AddRectFilled(bb_min, bb_max, IM_COL32(30, 34, 43, 255), 4.0f);

    // Time labels
    int num_labels = std::clamp((int)(size.x / 80.0f), 1, 20);
    for (int i = 0; i <= num_labels; i++) {
        double t = duration * i / num_labels;
        float x = (float)scale.time_to_x(t);
        draw_list->AddLine(ImVec2(x, bb_min.y), ImVec2(x, bb_min.y + 4), IM_COL32(96, 106, 120, 255));
        if (i % 2 == 0 && i < num_labels) {
            char buf[32];
            format_time(t, buf, sizeof(buf));
            draw_list->AddText(ImVec2(x + 2, bb_min.y + 2), IM_COL32(96, 106, 120, 255), buf);
        }
    }

    // Clips; deleted ones stay in place, dimmed
    for (const auto& clip : timeline.clips()) {
        float x1 = (float)scale.time_to_x(clip.start);
        float x2 = (float)scale.time_to_x(clip.end);
        ImU32 fill = clip.deleted ? IM_COL32(60, 40, 45, 255) : IM_COL32(70, 130, 180, 200);
        draw_list->AddRectFilled(ImVec2(x1 + 1, clip_top), ImVec2(x2 - 1, clip_top + clip_h), fill, 3.0f);
        if (clip.deleted) {
            draw_list->AddLine(ImVec2(x1 + 1, clip_top), ImVec2(x2 - 1, clip_top + clip_h), IM_COL32(200, 80, 80, 160));
        }
    }

    // Zoom segments with their ease tails
    for (size_t i = 0; i < segments.size(); i++) {
        const ZoomSegment& seg = segments[i];
        float x1 = (float)scale.time_to_x(seg.t_start);
        float x2 = (float)scale.time_to_x(seg.t_end);
        if (seg.ease_in > 0.0) {
            float ex = (float)scale.time_to_x(seg.t_start - seg.ease_in);
            draw_list->AddRectFilledMultiColor(ImVec2(ex, seg_top), ImVec2(x1, seg_top + seg_h),
                segment_color(seg, 0), segment_color(seg, 68), segment_color(seg, 68), segment_color(seg, 0));
        }
        if (seg.ease_out > 0.0) {
            float ex = (float)scale.time_to_x(seg.t_end + seg.ease_out);
            draw_list->AddRectFilledMultiColor(ImVec2(x2, seg_top), ImVec2(ex, seg_top + seg_h),
                segment_color(seg, 68), segment_color(seg, 0), segment_color(seg, 0), segment_color(seg, 68));
        }
        bool selected = state.selected && *state.selected == i;
        draw_list->AddRectFilled(ImVec2(x1, seg_top), ImVec2(x2, seg_top + seg_h),
                                 segment_color(seg, selected ? 255 : 204), 4.0f);
        if (selected) {
            draw_list->AddRect(ImVec2(x1, seg_top), ImVec2(x2, seg_top + seg_h), IM_COL32(255, 255, 255, 255), 4.0f, 0, 2.0f);
        }
        // Resize handles
        draw_list->AddRectFilled(ImVec2(x1, seg_top + 2), ImVec2(x1 + 3, seg_top + seg_h - 2), IM_COL32(255, 255, 255, 178));
        draw_list->AddRectFilled(ImVec2(x2 - 3, seg_top + 2), ImVec2(x2, seg_top + seg_h - 2), IM_COL32(255, 255, 255, 178));
        if (x2 - x1 > 30) {
            char text[64];
            if (seg.label.empty()) std::snprintf(text, sizeof(text), "x%.1f", seg.factor);
            else std::snprintf(text, sizeof(text), "%s", seg.label.c_str());
            ImVec2 ts = ImGui::CalcTextSize(text);
            draw_list->AddText(ImVec2((x1 + x2 - ts.x) / 2, seg_top + (seg_h - ts.y) / 2), IM_COL32(255, 255, 255, 255), text);
        }
    }

    // Playhead
    float px = (float)scale.time_to_x(timeline.playhead());
    draw_list->AddLine(ImVec2(px, bb_min.y - 2), ImVec2(px, bb_max.y + 2), IM_COL32(255, 255, 255, 255), 2.0f);
    draw_list->AddTriangleFilled(ImVec2(px - 6, bb_min.y), ImVec2(px + 6, bb_min.y), ImVec2(px, bb_min.y + 8),
                                 IM_COL32(255, 255, 255, 255));

    ImGui::InvisibleButton(label, size);
    bool is_hovered = ImGui::IsItemHovered();
    bool is_active = ImGui::IsItemActive();
    ImVec2 mouse = ImGui::GetIO().MousePos;
    bool playhead_moved = false;

    state.trim_started = false;
    state.clips_changed = false;
    bool in_clip_lane = mouse.y >= clip_top && mouse.y <= clip_top + clip_h;

    if (ImGui::IsItemClicked(0)) {
        SegmentHitResult hit = hit_test_segments(segments, scale, mouse.x, mouse.y, seg_top, seg_h);
        state.drag = begin_segment_drag(segments, hit, scale.x_to_time(mouse.x));
        if (!state.drag && in_clip_lane) {
            state.trim_clip = hit_test_clip_boundary(timeline.clips(), scale, mouse.x);
            state.trim_started = state.trim_clip.has_value();
        }
        if (state.drag) {
            state.selected = hit.index;
        } else if (!state.trim_clip) {
            state.selected.reset();
            state.scrubbing = true;
        }
    }

    if (!is_active) {
        state.drag.reset();
        state.trim_clip.reset();
        state.scrubbing = false;
    }

    if (is_active && state.trim_clip && !state.trim_started && *state.trim_clip + 1 < timeline.clips().size()) {
        double t = scale.x_to_time(mouse.x);
        if (t != timeline.clips()[*state.trim_clip].end) {
            state.clips_changed = timeline.trim_edge(*state.trim_clip, ClipEdge::End, t);
        }
    } else if (is_active && state.drag) {
        SnapContext snap;
        snap.playhead = timeline.playhead();
        snap.px_per_second = scale.px_per_second;
        snap.segments = &segments;
        snap.exclude = state.drag->index;
        state.segments_changed = update_segment_drag(segments, *state.drag, scale.x_to_time(mouse.x),
                                                     timeline.duration(), snap);
    } else if (is_active && state.scrubbing) {
        double t = std::clamp(scale.x_to_time(mouse.x), 0.0, timeline.duration());
        if (t != timeline.playhead()) {
            timeline.seek(t);
            playhead_moved = true;
        }
    }

    // Change cursor when hovering handles
    if (state.trim_clip) {
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeEW);
    } else if (is_hovered && !state.drag) {
        SegmentHitResult hover = hit_test_segments(segments, scale, mouse.x, mouse.y, seg_top, seg_h);
        bool on_boundary = in_clip_lane && hit_test_clip_boundary(timeline.clips(), scale, mouse.x);
        if (hover.zone == SegmentHit::LeftHandle || hover.zone == SegmentHit::RightHandle || on_boundary) {
            ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeEW);
        }
    }

    return playhead_moved;
}
