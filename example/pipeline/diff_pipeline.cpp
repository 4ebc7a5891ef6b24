#include "diffline/config/config.hpp"
#include "diffline/log/logging.hpp"
#include "diffline/pipeline/diff_pipeline.hpp"

#include <iostream>

using namespace diffline;

int main(int argc, char* argv[]) {
    // Optional JSON config as the first argument
    config::DiffLineConfig settings;
    try {
        if (argc > 1) {
            settings = config::loadConfig(argv[1]);
        }
        log::configureLogging(settings.logging);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // A white page, then the same page with two lines of "text" added
    auto before = image::RasterBuffer::filled(320, 120, image::colors::WHITE);
    auto after = before;
    after.fillRect({20, 20, 60, 12}, image::colors::BLACK);
    after.fillRect({95, 22, 40, 10}, image::colors::BLACK);
    after.fillRect({20, 70, 120, 12}, image::Rgba{200, 30, 30, 255});

    pipeline::DiffPipeline diffPipeline(settings.pipeline);
    const auto result = diffPipeline.run(before, after);

    std::cout << "Changed pixels: " << result.totalDiffPixels << std::endl;
    std::cout << "Regions: " << result.regions.size() << std::endl;
    for (const auto& region : result.regions) {
        const auto& box = region.boundingBox;
        std::cout << "  #" << region.id << " at (" << box.x << ", " << box.y
                  << ") " << box.width << "x" << box.height << ", "
                  << region.pixelCount << " px" << std::endl;
    }

    std::cout << "Lines: " << result.lines.size() << std::endl;
    for (size_t i = 0; i < result.lines.size(); ++i) {
        const auto& line = result.lines[i];
        const auto& preview = result.previews[i];
        std::cout << "  line " << line.lineIndex + 1 << ": "
                  << line.regions.size() << " regions, preview "
                  << preview.image.width() << "x" << preview.image.height()
                  << ", color (" << int(preview.contentColor.r) << ", "
                  << int(preview.contentColor.g) << ", "
                  << int(preview.contentColor.b) << ")" << std::endl;
    }
    return 0;
}
