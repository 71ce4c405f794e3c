/**
 * @file waveform_chart.hpp
 * @brief Amplitude-over-time line chart for an AudioBuffer, and PNG export
 */

#pragma once

#include "audio/audio_buffer.hpp"
#include <QtCharts/QChart>
#include <QColor>
#include <QList>
#include <QPointF>
#include <QString>
#include <cstddef>
#include <memory>
#include <string>

class QWidget;

namespace wv::render {

struct ChartStyle {
    QString title = QStringLiteral("Sound Wave");
    QString x_label = QStringLiteral("Time [s]");
    QString y_label = QStringLiteral("Amplitude");
    QColor line_color = QColor(Qt::blue);
    bool grid_visible = true;
    double y_margin = 0.05;          ///< Headroom above +-1.0 on the amplitude axis
    std::size_t max_points = 0;      ///< Decimation budget; 0 plots every sample
};

/**
 * @brief (time, amplitude) pairs to plot
 *
 * With a budget smaller than the buffer, consecutive samples are bucketed and each
 * bucket contributes its minimum and maximum in time order, so the drawn envelope
 * (and the global extremes) match the full signal. Budgets below 2 are raised to 2,
 * the smallest that can hold both extremes.
 */
QList<QPointF> make_plot_points(const audio::AudioBuffer& buffer, std::size_t max_points);

// Builds the chart; the caller owns it until it is handed to a QChartView.
std::unique_ptr<QChart> build_waveform_chart(const audio::AudioBuffer& buffer,
                                             const ChartStyle& style = ChartStyle{});

enum class ExportStatus { Written, Cancelled, Failed };

struct ExportResult {
    ExportStatus status = ExportStatus::Failed;
    std::string path;
    std::string error;
    bool success() const noexcept { return status == ExportStatus::Written; }
};

// Appends ".png" when the file name has no suffix.
QString ensure_png_suffix(const QString& path);

/**
 * @brief Grab the widget as currently rendered and save it as PNG
 * @param widget Usually the QChartView hosting the chart
 * @param path Destination; ".png" is appended when there is no suffix
 */
ExportResult export_widget_png(QWidget& widget, const QString& path);

} // namespace wv::render
