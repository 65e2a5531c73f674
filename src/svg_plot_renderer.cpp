#include "mxwsort/plot_renderer.hpp"
#include "mxwsort/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace mxwsort {

namespace {

std::string svg_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

struct Range {
    double lo = 0.0;
    double hi = 1.0;

    double span() const { return hi - lo; }
};

Range data_range(const std::vector<double>& values) {
    if (values.empty()) return {};
    auto [mn, mx] = std::minmax_element(values.begin(), values.end());
    Range r{*mn, *mx};
    if (!(r.span() > 0.0)) {
        r.lo -= 0.5;
        r.hi += 0.5;
    }
    return r;
}

std::string format_tick(double v) {
    std::ostringstream ss;
    ss.precision(4);
    ss << v;
    return ss.str();
}

}  // namespace

SvgPlotRenderer::SvgPlotRenderer()
    : SvgPlotRenderer(Config{}) {}

SvgPlotRenderer::SvgPlotRenderer(const Config& config)
    : config_(config) {}

std::filesystem::path SvgPlotRenderer::render_scatter(const ScatterPlot& plot,
                                                      const std::filesystem::path& path_stem) {
    std::filesystem::path out_path = path_stem;
    out_path += ".svg";

    std::ofstream f(out_path, std::ios::trunc);
    if (!f) {
        throw IoError("Cannot create plot: " + out_path.string());
    }

    const Config& c = config_;
    const double plot_w = c.width_px - c.margin_left_px - c.margin_right_px;
    const double plot_h = c.height_px - c.margin_top_px - c.margin_bottom_px;
    const Range xr = data_range(plot.x);
    const Range yr = data_range(plot.y);

    auto px = [&](double v) { return c.margin_left_px + (v - xr.lo) / xr.span() * plot_w; };
    auto py = [&](double v) { return c.margin_top_px + plot_h - (v - yr.lo) / yr.span() * plot_h; };

    f << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
      << "width=\"" << c.width_px << "\" height=\"" << c.height_px << "\" "
      << "font-family=\"sans-serif\" font-size=\"11\">\n";
    f << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    f << "<rect x=\"" << c.margin_left_px << "\" y=\"" << c.margin_top_px
      << "\" width=\"" << plot_w << "\" height=\"" << plot_h
      << "\" fill=\"none\" stroke=\"#333\"/>\n";

    // Ticks
    for (int i = 0; i <= c.num_ticks; ++i) {
        const double t = static_cast<double>(i) / c.num_ticks;
        const double xv = xr.lo + t * xr.span();
        const double yv = yr.lo + t * yr.span();
        f << "<text x=\"" << px(xv) << "\" y=\"" << (c.margin_top_px + plot_h + 16)
          << "\" text-anchor=\"middle\">" << format_tick(xv) << "</text>\n";
        f << "<text x=\"" << (c.margin_left_px - 6) << "\" y=\"" << (py(yv) + 4)
          << "\" text-anchor=\"end\">" << format_tick(yv) << "</text>\n";
    }

    // Points
    const size_t n = std::min(plot.x.size(), plot.y.size());
    const bool sized = plot.sizes.size() == n && n > 0;
    f << "<g fill=\"#1f77b4\">\n";
    for (size_t i = 0; i < n; ++i) {
        // Marker sizes are areas, as in matplotlib's scatter
        const double area = sized ? plot.sizes[i] : plot.marker_size;
        const double r = std::max(0.5, std::sqrt(std::max(area, 0.0)) / 2.0);
        f << "<circle cx=\"" << px(plot.x[i]) << "\" cy=\"" << py(plot.y[i])
          << "\" r=\"" << r << "\"/>\n";
    }
    f << "</g>\n";

    // Labels
    f << "<text x=\"" << (c.margin_left_px + plot_w / 2) << "\" y=\"" << (c.height_px - 10)
      << "\" text-anchor=\"middle\">" << svg_escape(plot.x_label) << "</text>\n";
    f << "<text x=\"14\" y=\"" << (c.margin_top_px + plot_h / 2)
      << "\" text-anchor=\"middle\" transform=\"rotate(-90 14 " << (c.margin_top_px + plot_h / 2)
      << ")\">" << svg_escape(plot.y_label) << "</text>\n";
    f << "<text x=\"" << (c.width_px / 2) << "\" y=\"" << (c.margin_top_px - 14)
      << "\" text-anchor=\"middle\" font-size=\"14\">" << svg_escape(plot.title) << "</text>\n";
    f << "</svg>\n";
    f.close();

    if (!f) {
        throw IoError("Failed writing plot: " + out_path.string());
    }
    return out_path;
}

}  // namespace mxwsort
