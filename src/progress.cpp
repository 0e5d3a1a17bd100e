#include "progress.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

ProgressPrinter::ProgressPrinter(std::ostream& out)
    : out_(out) {}

void ProgressPrinter::update(std::size_t done_files, std::size_t total_files) {
    if (total_files == 0) {
        return;
    }

    const double fraction = static_cast<double>(done_files) / static_cast<double>(total_files);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "files " << done_files << "/" << total_files;

    out_ << line.str();
    line_open_ = done_files < total_files;
    if (!line_open_) {
        out_ << "\n";
    }
    out_.flush();
}

void ProgressPrinter::finish() {
    if (line_open_) {
        out_ << "\n";
        out_.flush();
        line_open_ = false;
    }
}
