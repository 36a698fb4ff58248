#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "compositor.hpp"
#include "exporter.hpp"
#include "session.hpp"
#include "timeline.hpp"
#include "timeline_widget.hpp"
#include "tracker_io.hpp"
#include "video_source.hpp"
#include "zoom.hpp"

static int input_text_resize_callback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* str = static_cast<std::string*>(data->UserData);
        str->resize(static_cast<size_t>(data->BufTextLen));
        data->Buf = str->data();
    }
    return 0;
}

static bool input_text_string(const char* label, std::string& value, ImGuiInputTextFlags flags = 0) {
    if (!(flags & ImGuiInputTextFlags_CallbackResize)) {
        flags |= ImGuiInputTextFlags_CallbackResize;
    }
    if (value.capacity() < 256) {
        value.reserve(256);
    }
    return ImGui::InputText(label, value.data(), value.capacity() + 1, flags,
                            input_text_resize_callback, &value);
}

static bool slider_double(const char* label, double& value, float min, float max, const char* fmt = "%.2f") {
    float v = (float)value;
    if (!ImGui::SliderFloat(label, &v, min, max, fmt)) return false;
    value = v;
    return true;
}

// Preview pipeline and editing state for one open recording
struct Editor {
    Session session;
    std::string session_path;
    Timeline timeline;
    VideoSource preview;
    CameraSmoother smoother;  // preview only; export jobs carry their own
    Surface source_frame;
    Surface preview_frame;
    Surface background;
    std::string background_path;
    CameraState camera;
    ZoomTimelineState timeline_state;
    std::vector<std::vector<Clip>> undo_stack;

    GLuint texture_id = 0;
    bool loaded = false;
    bool playing = false;
    bool frame_dirty = true;
    double play_start_time = 0.0;
    double play_start_t = 0.0;
    double last_render_t = 0.0;

    bool open_video(const std::string& path) {
        if (!preview.open(path)) return false;
        session = Session{};
        session.video_path = path;
        session.duration = preview.duration();
        session.fps = preview.fps() > 0.0 ? preview.fps() : 30.0;
        session_path.clear();
        timeline.reset(session.duration);
        after_load();
        return true;
    }

    bool open_session(const std::string& path) {
        Session loaded_session;
        if (!load_session(path, loaded_session)) return false;
        if (!preview.open(loaded_session.video_path)) return false;
        if (loaded_session.duration <= 0.0) loaded_session.duration = preview.duration();
        session = std::move(loaded_session);
        session_path = path;
        if (session.clips.empty() || !timeline.assign(session.clips, session.duration)) {
            if (!session.clips.empty()) std::fprintf(stderr, "[WARN] Ignoring invalid clip list in %s\n", path.c_str());
            timeline.reset(session.duration);
        }
        timeline.seek(session.playhead);
        after_load();
        return true;
    }

    bool save(const std::string& path) {
        session.clips = timeline.snapshot();
        session.playhead = timeline.playhead();
        if (!save_session(path, session)) return false;
        session_path = path;
        std::printf("Saved session: %s\n", path.c_str());
        return true;
    }

    void after_load() {
        loaded = true;
        playing = false;
        undo_stack.clear();
        timeline_state = ZoomTimelineState{};
        smoother.reset();
        last_render_t = 0.0;
        frame_dirty = true;
    }

    void push_undo() {
        undo_stack.push_back(timeline.snapshot());
        if (undo_stack.size() > 100) undo_stack.erase(undo_stack.begin());
    }

    void undo() {
        if (undo_stack.empty()) return;
        if (timeline.restore_snapshot(undo_stack.back())) frame_dirty = true;
        undo_stack.pop_back();
    }

    void split_at_playhead() {
        push_undo();
        if (!timeline.split_at(timeline.playhead())) undo_stack.pop_back();
    }

    void delete_clip_at_playhead() {
        auto index = timeline.clip_at(timeline.playhead());
        if (!index || timeline.clips()[*index].deleted) return;
        push_undo();
        timeline.delete_clip(*index);
        frame_dirty = true;
    }

    void play() {
        if (timeline.playhead() >= timeline.duration()) timeline.seek(0.0);
        playing = true;
        play_start_time = glfwGetTime();
        play_start_t = timeline.playhead();
    }

    void update() {
        if (!loaded) return;
        if (playing) {
            double t = play_start_t + (glfwGetTime() - play_start_time);
            // Playback jumps over cut material
            for (const auto& cut : timeline.cuts()) {
                if (t >= cut.t_start && t < cut.t_end) {
                    t = cut.t_end;
                    play_start_time = glfwGetTime();
                    play_start_t = t;
                }
            }
            if (t >= timeline.duration()) {
                t = timeline.duration();
                playing = false;
            }
            timeline.seek(t);
            frame_dirty = true;
        }
        if (frame_dirty) {
            render_preview();
            frame_dirty = false;
        }
    }

    void render_preview() {
        // Scrubbing backwards must not drag a stale trail
        if (timeline.playhead() < last_render_t) smoother.reset();
        last_render_t = timeline.playhead();
        preview.seek(timeline.playhead(), DEFAULT_SEEK_TIMEOUT);
        preview.draw(source_frame);

        int out_w = std::min(session.output_width, 1280);
        int out_h = (int)std::lround((double)session.output_height * out_w / session.output_width);
        if (preview_frame.width != out_w || preview_frame.height != out_h) preview_frame.resize(out_w, out_h);

        // Pixel sizes in the style are in output pixels
        double k = (double)out_w / session.output_width;
        StyleConfig style = session.style;
        style.padding *= k;
        style.corner_radius *= k;
        style.cursor_scale *= k;

        const Surface* bg = nullptr;
        if (style.bg_type == BackgroundType::Image && !style.bg_image.empty()) {
            if (background_path != style.bg_image) {
                background_path = style.bg_image;
                if (!load_still_image(background_path, background)) background = Surface{};
            }
            if (!background.empty()) bg = &background;
        }

        camera = render_frame(preview_frame, source_frame, timeline.playhead(), session.segments, style,
                              session.track, smoother, bg);

        if (!texture_id) {
            glGenTextures(1, &texture_id);
            glBindTexture(GL_TEXTURE_2D, texture_id);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        }
        glBindTexture(GL_TEXTURE_2D, texture_id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, preview_frame.width, preview_frame.height, 0, GL_RGBA,
                     GL_UNSIGNED_BYTE, preview_frame.pixels.data());
    }

    void close() {
        preview.close();
        if (texture_id) { glDeleteTextures(1, &texture_id); texture_id = 0; }
        loaded = false;
    }
};

struct WindowData {
    GLFWwindow* window = nullptr;
    ImGuiContext* imgui_ctx = nullptr;
    float scale = 1.0f;
};

WindowData create_window(const char* title, int width, int height) {
    WindowData data;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 6);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    data.window = glfwCreateWindow(width, height, title, nullptr, nullptr);
    if (!data.window) return data;

    glfwMakeContextCurrent(data.window);
    glfwSwapInterval(1);

    float x_scale, y_scale;
    glfwGetWindowContentScale(data.window, &x_scale, &y_scale);
    data.scale = x_scale > y_scale ? x_scale : y_scale;

    data.imgui_ctx = ImGui::CreateContext();
    ImGui::SetCurrentContext(data.imgui_ctx);

    ImGuiIO& io = ImGui::GetIO();
    ImFontConfig font_cfg;
    font_cfg.SizePixels = 13.0f * data.scale;
    io.Fonts->AddFontDefault(&font_cfg);

    ImGui::StyleColorsDark();

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 4.0f;
    style.FramePadding = ImVec2(8.0f, 4.0f);
    style.ItemSpacing = ImVec2(8.0f, 6.0f);
    style.WindowRounding = 6.0f;
    style.GrabRounding = 4.0f;
    style.WindowPadding = ImVec2(12.0f, 12.0f);

    ImVec4 bg_dark = ImVec4(0.075f, 0.086f, 0.110f, 1.0f);   // #13161c
    ImVec4 bg_mid = ImVec4(0.118f, 0.133f, 0.169f, 1.0f);    // #1e222b
    ImVec4 bg_light = ImVec4(0.20f, 0.22f, 0.27f, 1.0f);
    ImVec4 accent = ImVec4(0.424f, 0.361f, 0.906f, 1.0f);    // #6c5ce7

    style.Colors[ImGuiCol_WindowBg] = bg_dark;
    style.Colors[ImGuiCol_ChildBg] = bg_dark;
    style.Colors[ImGuiCol_PopupBg] = bg_mid;
    style.Colors[ImGuiCol_FrameBg] = bg_mid;
    style.Colors[ImGuiCol_FrameBgHovered] = bg_light;
    style.Colors[ImGuiCol_FrameBgActive] = bg_light;
    style.Colors[ImGuiCol_Button] = bg_mid;
    style.Colors[ImGuiCol_ButtonHovered] = bg_light;
    style.Colors[ImGuiCol_ButtonActive] = accent;
    style.Colors[ImGuiCol_Header] = bg_mid;
    style.Colors[ImGuiCol_HeaderHovered] = bg_light;
    style.Colors[ImGuiCol_HeaderActive] = accent;
    style.Colors[ImGuiCol_SliderGrab] = accent;
    style.Colors[ImGuiCol_SliderGrabActive] = accent;
    style.Colors[ImGuiCol_CheckMark] = accent;
    style.Colors[ImGuiCol_PlotHistogram] = accent;

    style.ScaleAllSizes(data.scale);

    ImGui_ImplGlfw_InitForOpenGL(data.window, true);
    ImGui_ImplOpenGL3_Init("#version 460");

    return data;
}

void destroy_window(WindowData& data) {
    if (data.imgui_ctx) {
        ImGui::SetCurrentContext(data.imgui_ctx);
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext(data.imgui_ctx);
        data.imgui_ctx = nullptr;
    }
    if (data.window) {
        glfwDestroyWindow(data.window);
        data.window = nullptr;
    }
}

void render_window(WindowData& data, auto ui_func) {
    if (!data.window || glfwWindowShouldClose(data.window)) return;

    glfwMakeContextCurrent(data.window);
    ImGui::SetCurrentContext(data.imgui_ctx);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ui_func();

    ImGui::Render();
    int display_w, display_h;
    glfwGetFramebufferSize(data.window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(0.075f, 0.086f, 0.110f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(data.window);
}

// Style controls; returns true when anything changed
static bool style_panel(StyleConfig& s) {
    bool changed = false;
    if (ImGui::CollapsingHeader("Frame", ImGuiTreeNodeFlags_DefaultOpen)) {
        changed |= slider_double("Padding", s.padding, 0.0f, 200.0f, "%.0f px");
        changed |= slider_double("Corners", s.corner_radius, 0.0f, 64.0f, "%.0f px");
        changed |= ImGui::Checkbox("Shadow", &s.shadow);
        changed |= slider_double("Shadow intensity", s.shadow_intensity, 0.0f, 100.0f, "%.0f%%");
    }
    if (ImGui::CollapsingHeader("Background")) {
        int bg = (int)s.bg_type;
        if (ImGui::Combo("Type", &bg, "Solid\0Gradient\0Radial\0Image\0")) {
            s.bg_type = (BackgroundType)bg;
            changed = true;
        }
        changed |= input_text_string("Color", s.bg_color, ImGuiInputTextFlags_EnterReturnsTrue);
        changed |= input_text_string("Color 2", s.bg_color2, ImGuiInputTextFlags_EnterReturnsTrue);
        changed |= input_text_string("Image", s.bg_image, ImGuiInputTextFlags_EnterReturnsTrue);
    }
    if (ImGui::CollapsingHeader("Cursor", ImGuiTreeNodeFlags_DefaultOpen)) {
        changed |= ImGui::Checkbox("Show cursor", &s.show_cursor);
        int glyph = (int)s.cursor_style;
        if (ImGui::Combo("Style", &glyph, "macOS\0Windows\0Minimal\0Neon\0Outlined\0")) {
            s.cursor_style = (CursorGlyph)glyph;
            changed = true;
        }
        changed |= slider_double("Size", s.cursor_scale, 0.5f, 3.0f);
        changed |= ImGui::Checkbox("Smoothed position", &s.smooth_cursor_glyph);
        changed |= ImGui::Checkbox("Click effects", &s.click_effects);
        changed |= ImGui::Checkbox("Cursor motion blur", &s.cursor_motion_blur);
        int speed = (int)s.cursor_speed;
        if (ImGui::Combo("Cursor speed", &speed, "Slow\0Medium\0Fast\0Rapid\0")) {
            s.cursor_speed = (CursorSpeed)speed;
            changed = true;
        }
    }
    if (ImGui::CollapsingHeader("Camera", ImGuiTreeNodeFlags_DefaultOpen)) {
        changed |= ImGui::Checkbox("Follow cursor", &s.follow_cursor);
        changed |= ImGui::Checkbox("Auto zoom on cursor", &s.auto_zoom_on_cursor);
        changed |= slider_double("Follow zoom", s.follow_zoom_factor, 1.0f, 4.0f, "x%.1f");
        changed |= ImGui::Checkbox("Screen motion blur", &s.screen_motion_blur);
        int pan = (int)s.pan_speed;
        if (ImGui::Combo("Pan speed", &pan, "Per segment\0Slow\0Medium\0Fast\0Rapid\0")) {
            s.pan_speed = (PanSpeed)pan;
            changed = true;
        }
    }
    return changed;
}

int main(int argc, char** argv) {
    if (!glfwInit()) {
        std::fprintf(stderr, "Failed to initialize GLFW\n");
        return 1;
    }

    WindowData main_window = create_window("ZoomCut", 1600, 1000);
    if (!main_window.window) {
        std::fprintf(stderr, "Failed to create main window\n");
        glfwTerminate();
        return 1;
    }

    Editor editor;
    std::string open_path = load_last_path().string();
    std::string tracker_path;
    double tracker_start = 0.0;
    DisplayBounds tracker_bounds;
    std::string status;

    if (argc > 1) {
        std::string arg = argv[1];
        bool ok = fs::path(arg).extension() == ".json" ? editor.open_session(arg) : editor.open_video(arg);
        if (ok) open_path = arg;
        else std::fprintf(stderr, "Could not open %s\n", arg.c_str());
    }

    std::atomic<bool> exporting{false};
    std::atomic<bool> export_cancel{false};
    std::atomic<float> export_progress{0.0f};
    std::atomic<int> export_outcome{0};  // 0 none, 1 ok, 2 failed, 3 cancelled
    std::thread export_thread;
    std::string export_path;

    while (!glfwWindowShouldClose(main_window.window)) {
        glfwPollEvents();
        glfwMakeContextCurrent(main_window.window);
        editor.update();

        render_window(main_window, [&]() {
            ImGuiViewport* viewport = ImGui::GetMainViewport();
            ImGui::SetNextWindowPos(ImVec2(0, 0));
            ImGui::SetNextWindowSize(viewport->Size);
            ImGui::Begin("##Editor", nullptr,
                ImGuiWindowFlags_NoTitleBar |
                ImGuiWindowFlags_NoResize |
                ImGuiWindowFlags_NoMove |
                ImGuiWindowFlags_NoScrollbar |
                ImGuiWindowFlags_NoScrollWithMouse);

            float ui_scale = main_window.scale;
            float panel_w = 320 * ui_scale;
            float timeline_h = 150 * ui_scale;
            float pad = 10 * ui_scale;

            ImGui::BeginChild("##Panel", ImVec2(panel_w, viewport->Size.y - 2 * pad), true);
            float full_w = ImGui::GetContentRegionAvail().x;

            ImGui::Text("Recording or session");
            ImGui::SetNextItemWidth(full_w);
            input_text_string("##path", open_path);
            if (ImGui::Button("Open", ImVec2(full_w * 0.5f - 4, 0))) {
                bool is_session = fs::path(open_path).extension() == ".json";
                bool ok = is_session ? editor.open_session(open_path) : editor.open_video(open_path);
                if (ok) save_last_path(fs::path(open_path));
                status = ok ? "Opened " + open_path : "Could not open " + open_path;
            }
            ImGui::SameLine();
            if (!editor.loaded) ImGui::BeginDisabled();
            if (ImGui::Button("Save", ImVec2(full_w * 0.5f - 4, 0))) {
                std::string target = editor.session_path;
                if (target.empty()) target = fs::path(editor.session.video_path).replace_extension(".json").string();
                status = editor.save(target) ? "Saved " + target : "Could not save " + target;
            }
            if (!editor.loaded) ImGui::EndDisabled();

            if (editor.loaded) {
                ImGui::Separator();
                if (ImGui::CollapsingHeader("Tracker")) {
                    input_text_string("Log", tracker_path);
                    ImGui::InputDouble("Start (epoch)", &tracker_start, 0.0, 0.0, "%.3f");
                    float bounds[4] = {(float)tracker_bounds.x, (float)tracker_bounds.y,
                                       (float)tracker_bounds.width, (float)tracker_bounds.height};
                    if (ImGui::InputFloat4("Display", bounds, "%.0f")) {
                        tracker_bounds = {bounds[0], bounds[1], bounds[2], bounds[3]};
                    }
                    if (ImGui::Button("Import", ImVec2(full_w, 0))) {
                        TrackData track;
                        if (load_tracker_file(tracker_path, tracker_bounds, tracker_start, track)) {
                            editor.session.track = std::move(track);
                            editor.frame_dirty = true;
                            status = "Imported " + std::to_string(editor.session.track.clicks.size()) + " clicks";
                        } else {
                            status = "Could not read " + tracker_path;
                        }
                    }
                }

                if (ImGui::CollapsingHeader("Zoom", ImGuiTreeNodeFlags_DefaultOpen)) {
                    auto& segments = editor.session.segments;
                    if (ImGui::Button("Auto from clicks", ImVec2(full_w, 0))) {
                        segments = auto_generate_zooms(editor.session.track.clicks, editor.session.duration);
                        editor.timeline_state.selected.reset();
                        editor.frame_dirty = true;
                    }
                    if (ImGui::Button("Add at playhead", ImVec2(full_w, 0))) {
                        if (add_zoom_at(segments, editor.timeline.playhead(), editor.session.duration,
                                        editor.session.track.cursor)) {
                            editor.timeline_state.selected = segments.size() - 1;
                            editor.frame_dirty = true;
                        }
                    }
                    auto& selected = editor.timeline_state.selected;
                    if (selected && *selected < segments.size()) {
                        ZoomSegment& seg = segments[*selected];
                        bool seg_changed = false;
                        seg_changed |= slider_double("Factor", seg.factor, 1.0f, 5.0f, "x%.2f");
                        seg_changed |= slider_double("Center X", seg.cx, 0.0f, 1.0f);
                        seg_changed |= slider_double("Center Y", seg.cy, 0.0f, 1.0f);
                        seg_changed |= slider_double("Ease in", seg.ease_in, 0.0f, 2.0f, "%.2f s");
                        seg_changed |= slider_double("Ease out", seg.ease_out, 0.0f, 2.0f, "%.2f s");
                        seg_changed |= input_text_string("Label", seg.label);
                        if (seg_changed) editor.frame_dirty = true;
                        if (ImGui::Button("Duplicate", ImVec2(full_w * 0.5f - 4, 0))) {
                            if (duplicate_zoom(segments, *selected, editor.session.duration)) {
                                selected = segments.size() - 1;
                                editor.frame_dirty = true;
                            }
                        }
                        ImGui::SameLine();
                        if (ImGui::Button("Delete", ImVec2(full_w * 0.5f - 4, 0))) {
                            delete_zoom(segments, *selected);
                            selected.reset();
                            editor.frame_dirty = true;
                        }
                    }
                }

                if (style_panel(editor.session.style)) editor.frame_dirty = true;

                ImGui::Separator();
                if (exporting) {
                    ImGui::ProgressBar(export_progress, ImVec2(full_w, 0), "Exporting...");
                    if (ImGui::Button("Cancel export", ImVec2(full_w, 0))) export_cancel = true;
                } else {
                    if (ImGui::Button("Export MP4", ImVec2(full_w, 0))) {
                        if (export_thread.joinable()) export_thread.join();

                        fs::path base(editor.session.video_path);
                        export_path = (base.parent_path() / (base.stem().string() + "_zoomcut.mp4")).string();

                        ExportJob job;
                        job.duration = editor.session.duration;
                        job.fps = editor.session.fps;
                        job.width = editor.session.output_width;
                        job.height = editor.session.output_height;
                        job.segments = editor.session.segments;
                        job.cuts = editor.timeline.cuts();
                        job.style = editor.session.style;
                        job.track = editor.session.track;
                        std::string video = editor.session.video_path;

                        exporting = true;
                        export_cancel = false;
                        export_progress = 0.0f;
                        export_outcome = 0;
                        export_thread = std::thread([&exporting, &export_cancel, &export_progress, &export_outcome,
                                                     job, video, out = export_path]() mutable {
                            // Own decoder; the preview one belongs to the UI thread
                            VideoSource source;
                            Surface bg;
                            if (job.style.bg_type == BackgroundType::Image && load_still_image(job.style.bg_image, bg)) {
                                job.background_image = &bg;
                            }
                            if (!source.open(video)) {
                                export_outcome = 2;
                                exporting = false;
                                return;
                            }
                            FfmpegPipeSink sink(out);
                            ExportResult result = export_video(source, sink, job, export_cancel,
                                [&export_progress](const ExportProgress& p) { export_progress = p.fraction(); });
                            export_outcome = result.ok ? 1 : (result.cancelled ? 3 : 2);
                            exporting = false;
                        });
                    }
                    int outcome = export_outcome;
                    if (outcome == 1) ImGui::TextWrapped("Exported %s", export_path.c_str());
                    else if (outcome == 2) ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.45f, 1.0f), "Export failed, see log");
                    else if (outcome == 3) ImGui::Text("Export cancelled");
                }
            }
            if (!status.empty()) ImGui::TextWrapped("%s", status.c_str());
            ImGui::EndChild();

            ImGui::SameLine();
            ImGui::BeginGroup();
            float view_w = viewport->Size.x - panel_w - 3 * pad;
            float view_h = viewport->Size.y - timeline_h - 4 * pad - ImGui::GetFrameHeightWithSpacing();

            if (editor.loaded && editor.texture_id && !editor.preview_frame.empty()) {
                float aspect = (float)editor.preview_frame.width / editor.preview_frame.height;
                float img_w = view_w;
                float img_h = img_w / aspect;
                if (img_h > view_h) {
                    img_h = view_h;
                    img_w = img_h * aspect;
                }
                ImVec2 cursor = ImGui::GetCursorPos();
                ImGui::SetCursorPos(ImVec2(cursor.x + (view_w - img_w) / 2, cursor.y));
                ImGui::Image((ImTextureID)(intptr_t)editor.texture_id, ImVec2(img_w, img_h));
                ImGui::SetCursorPos(ImVec2(cursor.x, cursor.y + view_h));
            } else {
                ImGui::Dummy(ImVec2(view_w, view_h));
            }

            if (editor.loaded) {
                if (ImGui::Button(editor.playing ? "Pause" : "Play")) {
                    if (editor.playing) editor.playing = false;
                    else editor.play();
                }
                ImGui::SameLine();
                if (ImGui::Button("Split")) editor.split_at_playhead();
                ImGui::SameLine();
                if (ImGui::Button("Delete clip")) editor.delete_clip_at_playhead();
                ImGui::SameLine();
                if (ImGui::Button("Undo")) editor.undo();
                ImGui::SameLine();
                ImGui::Text("%.2f / %.2f s  (%.2f s kept)  zoom x%.2f", editor.timeline.playhead(),
                            editor.timeline.duration(), editor.timeline.active_duration(), editor.camera.factor);

                if (ZoomTimeline("##timeline", editor.timeline, editor.session.segments,
                                 ImVec2(view_w, timeline_h), editor.timeline_state)) {
                    editor.playing = false;
                    editor.frame_dirty = true;
                }
                if (editor.timeline_state.trim_started) editor.push_undo();
                if (editor.timeline_state.segments_changed || editor.timeline_state.clips_changed) {
                    editor.frame_dirty = true;
                }

                if (!ImGui::GetIO().WantTextInput) {
                    if (ImGui::IsKeyPressed(ImGuiKey_Space)) {
                        if (editor.playing) editor.playing = false;
                        else editor.play();
                    }
                    if (ImGui::IsKeyPressed(ImGuiKey_S)) editor.split_at_playhead();
                    if (ImGui::IsKeyPressed(ImGuiKey_Delete) || ImGui::IsKeyPressed(ImGuiKey_Backspace)) {
                        editor.delete_clip_at_playhead();
                    }
                    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Z)) editor.undo();
                }
            }
            ImGui::EndGroup();
            ImGui::End();
        });
    }

    export_cancel = true;
    if (export_thread.joinable()) export_thread.join();

    glfwMakeContextCurrent(main_window.window);
    editor.close();
    destroy_window(main_window);
    glfwTerminate();
    return 0;
}
