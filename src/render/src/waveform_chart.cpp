#include "render/waveform_chart.hpp"
#include "core/log.hpp"
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#include <QFileInfo>
#include <QPen>
#include <QPixmap>
#include <QWidget>
#include <algorithm>
#include <sstream>

namespace wv::render {

QList<QPointF> make_plot_points(const audio::AudioBuffer& buffer, std::size_t max_points) {
    QList<QPointF> points;
    const std::size_t n = buffer.size();
    if(n == 0) return points;

    if(max_points == 0 || n <= max_points) {
        points.reserve(static_cast<qsizetype>(n));
        for(std::size_t i = 0; i < n; ++i) {
            points.append(QPointF(buffer.time_axis[i], buffer.samples[i]));
        }
        return points;
    }

    // Two points (min and max) per bucket; a budget of 1 still gets one bucket.
    const std::size_t budget = std::max<std::size_t>(2, max_points);
    const std::size_t buckets = budget / 2;
    const std::size_t bucket_size = (n + buckets - 1) / buckets;
    points.reserve(static_cast<qsizetype>(buckets * 2));

    for(std::size_t start = 0; start < n; start += bucket_size) {
        const std::size_t end = std::min(n, start + bucket_size);
        std::size_t lo = start, hi = start;
        for(std::size_t i = start + 1; i < end; ++i) {
            if(buffer.samples[i] < buffer.samples[lo]) lo = i;
            if(buffer.samples[i] > buffer.samples[hi]) hi = i;
        }
        const std::size_t first = std::min(lo, hi);
        const std::size_t second = std::max(lo, hi);
        points.append(QPointF(buffer.time_axis[first], buffer.samples[first]));
        if(second != first) {
            points.append(QPointF(buffer.time_axis[second], buffer.samples[second]));
        }
    }
    return points;
}

std::unique_ptr<QChart> build_waveform_chart(const audio::AudioBuffer& buffer, const ChartStyle& style) {
    auto* series = new QLineSeries();
    const QList<QPointF> points = make_plot_points(buffer, style.max_points);
    series->replace(points);

    QPen pen(style.line_color);
    pen.setWidthF(1.0);
    series->setPen(pen);

    auto chart = std::make_unique<QChart>();
    chart->addSeries(series);
    chart->setTitle(style.title);
    chart->legend()->hide();

    auto* axis_x = new QValueAxis();
    axis_x->setTitleText(style.x_label);
    axis_x->setRange(0.0, buffer.duration_seconds() > 0.0 ? buffer.duration_seconds() : 1.0);
    axis_x->setGridLineVisible(style.grid_visible);
    chart->addAxis(axis_x, Qt::AlignBottom);
    series->attachAxis(axis_x);

    const double y_limit = 1.0 + style.y_margin;
    auto* axis_y = new QValueAxis();
    axis_y->setTitleText(style.y_label);
    axis_y->setRange(-y_limit, y_limit);
    axis_y->setLabelFormat("%.2f");
    axis_y->setGridLineVisible(style.grid_visible);
    chart->addAxis(axis_y, Qt::AlignLeft);
    series->attachAxis(axis_y);

    std::ostringstream oss;
    oss << "Waveform chart built: " << points.size() << " points for "
        << buffer.size() << " samples";
    wv::log::debug(oss.str());
    return chart;
}

QString ensure_png_suffix(const QString& path) {
    if(QFileInfo(path).suffix().isEmpty()) {
        return path + QStringLiteral(".png");
    }
    return path;
}

ExportResult export_widget_png(QWidget& widget, const QString& path) {
    ExportResult result;
    if(path.isEmpty()) {
        result.error = "empty export path";
        return result;
    }
    const QString target = ensure_png_suffix(path);
    result.path = target.toStdString();

    const QPixmap image = widget.grab();
    if(image.isNull()) {
        result.error = "could not render the plot";
        return result;
    }
    if(!image.save(target, "PNG")) {
        result.error = "could not write " + result.path;
        return result;
    }
    result.status = ExportStatus::Written;
    return result;
}

} // namespace wv::render
