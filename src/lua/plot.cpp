// PlotSurface and its SVG renderer. This is not a plotting library; it draws lines, points and bars on one set of axes, which is
// what figures in a document mostly are.
#include <lua/plot.hpp>
#include <fileman.hpp>
#include <weavewriter.hpp>
#include <cstdio>
#include <cmath>
#include <algorithm>


static const char* palette[] = { "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd", "#8c564b" };
static const int paletteSize = 6;
static const double margin = 48; // px around the axes box


bool PlotSurface::empty() {
    return series.size() == 0 && title.size() == 0;
}

void PlotSurface::clear() {
    title.clear();
    xlabel.clear();
    ylabel.clear();
    series.clear();
}

bool PlotSurface::bounds(double& xmin, double& xmax, double& ymin, double& ymax) {
    bool any = false;
    for (PlotSeries& s : series) {
        for (size_t i = 0; i < s.xs.size() && i < s.ys.size(); i ++) {
            if (!any) {
                xmin = xmax = s.xs[i];
                ymin = ymax = s.ys[i];
                any = true;
                continue;
            }
            xmin = std::fmin(xmin, s.xs[i]);
            xmax = std::fmax(xmax, s.xs[i]);
            ymin = std::fmin(ymin, s.ys[i]);
            ymax = std::fmax(ymax, s.ys[i]);
        }
        if (s.kind == PlotSeries::Bars && any) { // bars grow from zero
            ymin = std::fmin(ymin, 0);
            ymax = std::fmax(ymax, 0);
        }
    }
    if (!any) {
        return false;
    }
    if (xmax == xmin) { // a single x would divide by zero
        xmin -= 0.5;
        xmax += 0.5;
    }
    if (ymax == ymin) {
        ymin -= 0.5;
        ymax += 0.5;
    }
    return true;
}


static std::string escapeXml(const std::string& text) {
    std::string ret;
    for (char c : text) {
        if (c == '<') ret += "&lt;";
        else if (c == '>') ret += "&gt;";
        else if (c == '&') ret += "&amp;";
        else if (c == '"') ret += "&quot;";
        else ret += c;
    }
    return ret;
}

static std::string num(double n) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", n);
    return buf;
}


SvgBackend::SvgBackend(PlotSurface& s) : surface(s) {}

std::string SvgBackend::toSvg(FigureSize size) {
    double width = size.width * size.dpi;
    double height = size.height * size.dpi;
    std::string svg = "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" + num(width) + "\" height=\"" + num(height) + "\" viewBox=\"0 0 "
        + num(width) + " " + num(height) + "\">\n";
    svg += "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    double left = margin;
    double top = margin;
    double right = width - margin;
    double bottom = height - margin;
    svg += "<rect x=\"" + num(left) + "\" y=\"" + num(top) + "\" width=\"" + num(right - left) + "\" height=\"" + num(bottom - top)
        + "\" fill=\"none\" stroke=\"black\"/>\n";
    if (surface.title.size() > 0) {
        svg += "<text x=\"" + num(width / 2) + "\" y=\"" + num(top / 2) + "\" text-anchor=\"middle\" font-size=\"16\">" + escapeXml(surface.title) + "</text>\n";
    }
    if (surface.xlabel.size() > 0) {
        svg += "<text x=\"" + num(width / 2) + "\" y=\"" + num(height - margin / 4) + "\" text-anchor=\"middle\" font-size=\"12\">" + escapeXml(surface.xlabel) + "</text>\n";
    }
    if (surface.ylabel.size() > 0) {
        svg += "<text x=\"" + num(margin / 3) + "\" y=\"" + num(height / 2) + "\" text-anchor=\"middle\" font-size=\"12\" transform=\"rotate(-90 "
            + num(margin / 3) + " " + num(height / 2) + ")\">" + escapeXml(surface.ylabel) + "</text>\n";
    }
    double xmin, xmax, ymin, ymax;
    if (!surface.bounds(xmin, xmax, ymin, ymax)) {
        return svg + "</svg>\n";
    }
    svg += "<text x=\"" + num(left) + "\" y=\"" + num(bottom + 16) + "\" font-size=\"10\">" + num(xmin) + "</text>\n";
    svg += "<text x=\"" + num(right) + "\" y=\"" + num(bottom + 16) + "\" font-size=\"10\" text-anchor=\"end\">" + num(xmax) + "</text>\n";
    svg += "<text x=\"" + num(left - 4) + "\" y=\"" + num(bottom) + "\" font-size=\"10\" text-anchor=\"end\">" + num(ymin) + "</text>\n";
    svg += "<text x=\"" + num(left - 4) + "\" y=\"" + num(top + 10) + "\" font-size=\"10\" text-anchor=\"end\">" + num(ymax) + "</text>\n";
    auto sx = [&](double x) { return left + (x - xmin) / (xmax - xmin) * (right - left); };
    auto sy = [&](double y) { return bottom - (y - ymin) / (ymax - ymin) * (bottom - top); };
    int legendLine = 0;
    for (size_t n = 0; n < surface.series.size(); n ++) {
        PlotSeries& s = surface.series[n];
        std::string color = palette[n % paletteSize];
        size_t count = std::min(s.xs.size(), s.ys.size());
        if (s.kind == PlotSeries::Line) {
            svg += "<polyline fill=\"none\" stroke=\"" + color + "\" stroke-width=\"2\" points=\"";
            for (size_t i = 0; i < count; i ++) {
                svg += num(sx(s.xs[i])) + "," + num(sy(s.ys[i])) + " ";
            }
            svg += "\"/>\n";
        }
        else if (s.kind == PlotSeries::Points) {
            for (size_t i = 0; i < count; i ++) {
                svg += "<circle cx=\"" + num(sx(s.xs[i])) + "\" cy=\"" + num(sy(s.ys[i])) + "\" r=\"3\" fill=\"" + color + "\"/>\n";
            }
        }
        else {
            double barWidth = (right - left) / (count + 1) * 0.8;
            for (size_t i = 0; i < count; i ++) {
                double y0 = sy(0);
                double y1 = sy(s.ys[i]);
                svg += "<rect x=\"" + num(sx(s.xs[i]) - barWidth / 2) + "\" y=\"" + num(std::fmin(y0, y1)) + "\" width=\"" + num(barWidth)
                    + "\" height=\"" + num(std::fabs(y1 - y0)) + "\" fill=\"" + color + "\"/>\n";
            }
        }
        if (s.label.size() > 0) {
            legendLine ++;
            svg += "<text x=\"" + num(right - 4) + "\" y=\"" + num(top + 14 * legendLine) + "\" font-size=\"11\" text-anchor=\"end\" fill=\"" + color + "\">"
                + escapeXml(s.label) + "</text>\n";
        }
    }
    return svg + "</svg>\n";
}

std::string SvgBackend::render(const std::string& path, FigureSize size) {
    FileWriteOutput out = createFile(path);
    if (!out.isValid()) {
        return "";
    }
    std::string svg = toSvg(size);
    out.write(svg.c_str(), svg.size());
    return path;
}

void SvgBackend::clearSurface() {
    surface.clear();
}
