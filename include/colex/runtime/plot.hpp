#pragma once

#include <colex/core/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace colex::runtime {

/// One series of a figure.
struct Trace {
    std::string type = "scatter";  // "scatter" or "histogram"
    std::string mode;              // "lines" or "markers" for scatter traces
    std::string color;
    std::string histnorm;  // "" (counts) or "percent" for histograms
    std::vector<double> x;
    std::vector<double> y;
};

struct Figure {
    std::vector<Trace> traces;
};

struct Layout {
    std::string title;
    std::string x_title;
    std::string y_title;
    std::string file_name;
    double width = 0.0;
    double height = 0.0;
};

/// Plotting backend.  colex only builds figures; drawing them is the sink's job.
class RenderSink {
   public:
    virtual ~RenderSink() = default;
    [[nodiscard]] virtual auto render(const Figure& figure, const Layout& layout)
        -> Result<void> = 0;
};

/// Figure under construction, shared by the plot functions of one session.
struct PlotState {
    static constexpr double kDefaultWidth = 800.0;
    static constexpr double kDefaultHeight = 600.0;

    Figure figure;
    double width = kDefaultWidth;
    double height = kDefaultHeight;

    /// Start a new, empty figure; the dimensions are kept.
    void reset() { figure.traces.clear(); }
};

/// Map the plot-type argument ("line", "lines", "markers") to a scatter mode.
[[nodiscard]] auto scatter_mode(std::string_view type) -> Result<std::string>;

}  // namespace colex::runtime
