#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mxwsort {

/**
 * @brief Data and labels of one scatter plot
 *
 * sizes, when non-empty, gives a per-point marker area and must match x.
 */
struct ScatterPlot {
    std::string title;
    std::string x_label;
    std::string y_label;
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> sizes;
    double marker_size = 1.0;
};

/**
 * @brief Rendering backend for QC figures
 */
class PlotRenderer {
public:
    virtual ~PlotRenderer() = default;

    /**
     * @brief Render a scatter plot to path_stem plus the backend's extension
     * @return The file written
     * @throws IoError if the file cannot be written
     */
    virtual std::filesystem::path render_scatter(const ScatterPlot& plot,
                                                 const std::filesystem::path& path_stem) = 0;
};

/**
 * @brief Writes standalone SVG documents, no external dependencies
 */
class SvgPlotRenderer : public PlotRenderer {
public:
    struct Config {
        int width_px = 800;
        int height_px = 600;
        int margin_left_px = 70;
        int margin_right_px = 20;
        int margin_top_px = 40;
        int margin_bottom_px = 50;
        int num_ticks = 5;
    };

    SvgPlotRenderer();
    explicit SvgPlotRenderer(const Config& config);

    std::filesystem::path render_scatter(const ScatterPlot& plot,
                                         const std::filesystem::path& path_stem) override;

private:
    Config config_;
};

}  // namespace mxwsort
