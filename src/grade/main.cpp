// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include "kestrel/core/common.h"
#include "kestrel/core/config.h"
#include "kestrel/core/error.h"
#include "kestrel/core/log.h"
#include "kestrel/io/json_capsule.h"
#include "kestrel/material/material_registry.h"
#include "kestrel/post/contrast_adjustment_filter.h"
#include "kestrel/post/filter_post_processor.h"
#include "kestrel/post/image_io.h"
#include "kestrel/vr/vr_backend.h"

namespace {

void print_usage(const char* program) {
    std::fprintf(stderr, "usage: %s <output.png> [input image] [config.json]\n", program);
}

void report_vr(const std::string& requested) {
    using namespace kestrel::vr;

    const VrBackendType type = ParseVrBackendType(requested);
    if (type == VrBackendType::None) {
        return;
    }
    if (!IsVrBackendAvailable(type)) {
        KESTREL_LOG_WARN("VR backend '{}' requested but not part of this build", ToString(type));
        return;
    }

    auto backend = CreateVrBackend(type);
    if (backend->Initialize()) {
        const auto size = backend->GetRecommendedRenderTargetSize();
        KESTREL_LOG_INFO("{} headset found, eye target {}x{}", backend->GetName(), size.x, size.y);
        backend->Shutdown();
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::filesystem::path output = argv[1];
    const std::filesystem::path config_path = argc > 3 ? argv[3] : "data/config/grade.json";
    const auto config = kestrel::config::load_from_file(config_path);

    kestrel::log::init(config.log_level);

    try {
        report_vr(config.vr_backend);

        kestrel::post::FrameImage frame;
        if (argc > 2) {
            frame = kestrel::post::LoadFrameImage(argv[2]).Expect("Cannot grade input");
        } else {
            KESTREL_LOG_INFO("No input given, grading a {}x{} gradient", config.frame_width, config.frame_height);
            frame = kestrel::post::FrameImage::Gradient(
                static_cast<kestrel::u32>(config.frame_width),
                static_cast<kestrel::u32>(config.frame_height));
        }

        const auto& c = config.contrast;
        auto contrast = std::make_shared<kestrel::post::ContrastAdjustmentFilter>(c.exponents, c.brightness, c.scales);
        contrast->SetEnabled(c.enabled);

        const auto registry = kestrel::material::MaterialRegistry::WithBuiltins();
        kestrel::post::FilterPostProcessor processor;
        processor.AddFilter(contrast);
        processor.Initialize(registry, {frame.GetWidth(), frame.GetHeight()});
        processor.Render(frame);
        processor.Cleanup();

        kestrel::post::SaveFrameImagePng(frame, output).Expect("Cannot write output");

        auto state_path = output;
        state_path.replace_extension(".filters.json");
        kestrel::io::JsonExporter::SaveToFile(processor, state_path).Expect("Cannot write filter state");

        KESTREL_LOG_INFO("Wrote {} and {}", output.string(), state_path.string());
    } catch (const std::exception& e) {
        KESTREL_LOG_CRITICAL("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
