// The guest's graphics surface. Lua code draws on it through the `plot` module; SvgBackend renders it.
#pragma once
#include <string>
#include <vector>
#include <engine/interpreter.hpp>


struct PlotSeries {
    enum Kind {
        Line,
        Points,
        Bars
    } kind;
    std::vector<double> xs;
    std::vector<double> ys;
    std::string label;
};


struct PlotSurface {
    std::string title;
    std::string xlabel;
    std::string ylabel;
    std::vector<PlotSeries> series;

    bool empty();

    void clear();

    bool bounds(double& xmin, double& xmax, double& ymin, double& ymax); // false if there's nothing to bound
};


struct SvgBackend : GraphicsBackend {
    PlotSurface& surface;

    SvgBackend(PlotSurface& s);

    std::string render(const std::string& path, FigureSize size);

    void clearSurface();

    std::string toSvg(FigureSize size); // the whole document, in memory
};
